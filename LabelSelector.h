#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace wpa {

using Labels = std::map<std::string, std::string>;

struct LabelSelectorRequirement {
    enum class Operator {
        In,
        NotIn,
        Exists,
        DoesNotExist
    };

    std::string key;
    Operator op = Operator::In;
    std::vector<std::string> values;
};

// Unresolved selector as it appears in a metric definition. Empty selector selects everything.
struct LabelSelector {
    Labels match_labels;
    std::vector<LabelSelectorRequirement> match_expressions;

    bool empty() const { return match_labels.empty() && match_expressions.empty(); }
};

// Validated selector, requirements sorted by key. Produced by ISelectorResolver only.
class SelectorFilter {
public:
    SelectorFilter() = default;
    explicit SelectorFilter(std::vector<LabelSelectorRequirement> requirements);

    bool matches(const Labels & labels) const;

    // Canonical text form, e.g. "app=web,tier in (back,front),!canary"
    std::string to_string() const;

private:
    std::vector<LabelSelectorRequirement> m_requirements;
};

std::string_view to_string(LabelSelectorRequirement::Operator op);

// Text form of an unresolved selector, used in diagnostics.
std::string to_string(const LabelSelector & selector);

// Parses "k=v,k!=v,k in (a,b),k notin (a,b),k,!k". Throws SelectorError.
LabelSelector parse_label_selector(std::string_view text);

} // namespace wpa
