#include "LabelSelector.h"

#include "Errors.h"

#include "fmt/core.h"
#include "fmt/format.h"

#include <algorithm>

namespace wpa {

namespace {

std::string_view trim(std::string_view s)
{
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

// Splits on commas that are not inside parentheses
std::vector<std::string_view> split_terms(std::string_view text)
{
    std::vector<std::string_view> terms;
    int depth = 0;
    size_t start = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '(') {
            ++depth;
        } else if (text[i] == ')') {
            if (--depth < 0) {
                throw SelectorError(fmt::format("unbalanced ')' in selector \"{}\"", text));
            }
        } else if (text[i] == ',' && depth == 0) {
            terms.push_back(trim(text.substr(start, i - start)));
            start = i + 1;
        }
    }
    if (depth != 0) {
        throw SelectorError(fmt::format("unbalanced '(' in selector \"{}\"", text));
    }
    terms.push_back(trim(text.substr(start)));
    return terms;
}

std::vector<std::string> parse_value_set(std::string_view set, std::string_view term)
{
    if (set.size() < 2 || set.front() != '(' || set.back() != ')') {
        throw SelectorError(fmt::format("expected parenthesized value set in \"{}\"", term));
    }
    std::vector<std::string> values;
    std::string_view inner = set.substr(1, set.size() - 2);
    size_t start = 0;
    while (true) {
        auto comma = inner.find(',', start);
        auto value = trim(inner.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start));
        values.emplace_back(value);
        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }
    return values;
}

LabelSelectorRequirement parse_set_term(std::string_view term)
{
    auto key_end = term.find_first_of(" \t(");
    if (key_end == std::string_view::npos) {
        return LabelSelectorRequirement{ std::string(term), LabelSelectorRequirement::Operator::Exists, {} };
    }

    LabelSelectorRequirement req;
    req.key = std::string(term.substr(0, key_end));
    auto rest = trim(term.substr(key_end));
    if (rest.substr(0, 5) == "notin") {
        req.op = LabelSelectorRequirement::Operator::NotIn;
        rest = trim(rest.substr(5));
    } else if (rest.substr(0, 2) == "in") {
        req.op = LabelSelectorRequirement::Operator::In;
        rest = trim(rest.substr(2));
    } else {
        throw SelectorError(fmt::format("unknown operator in selector term \"{}\"", term));
    }
    req.values = parse_value_set(rest, term);
    return req;
}

bool contains(const std::vector<std::string> & values, const std::string & value)
{
    return std::find(values.begin(), values.end(), value) != values.end();
}

} // unnamed namespace

SelectorFilter::SelectorFilter(std::vector<LabelSelectorRequirement> requirements) :
    m_requirements(std::move(requirements))
{
    for (auto & req : m_requirements) {
        std::sort(req.values.begin(), req.values.end());
    }
    std::stable_sort(m_requirements.begin(), m_requirements.end(),
            [] (const auto & lhs, const auto & rhs) { return lhs.key < rhs.key; });
}

bool SelectorFilter::matches(const Labels & labels) const
{
    for (const auto & req : m_requirements) {
        auto it = labels.find(req.key);
        bool present = it != labels.end();
        bool ok = false;
        switch (req.op) {
            case LabelSelectorRequirement::Operator::In:
                ok = present && contains(req.values, it->second);
                break;
            case LabelSelectorRequirement::Operator::NotIn:
                ok = !present || !contains(req.values, it->second);
                break;
            case LabelSelectorRequirement::Operator::Exists:
                ok = present;
                break;
            case LabelSelectorRequirement::Operator::DoesNotExist:
                ok = !present;
                break;
        }
        if (!ok) {
            return false;
        }
    }
    return true;
}

std::string SelectorFilter::to_string() const
{
    std::vector<std::string> parts;
    parts.reserve(m_requirements.size());
    for (const auto & req : m_requirements) {
        switch (req.op) {
            case LabelSelectorRequirement::Operator::In:
                if (req.values.size() == 1) {
                    parts.push_back(fmt::format("{}={}", req.key, req.values.front()));
                } else {
                    parts.push_back(fmt::format("{} in ({})", req.key, fmt::join(req.values, ",")));
                }
                break;
            case LabelSelectorRequirement::Operator::NotIn:
                if (req.values.size() == 1) {
                    parts.push_back(fmt::format("{}!={}", req.key, req.values.front()));
                } else {
                    parts.push_back(fmt::format("{} notin ({})", req.key, fmt::join(req.values, ",")));
                }
                break;
            case LabelSelectorRequirement::Operator::Exists:
                parts.push_back(req.key);
                break;
            case LabelSelectorRequirement::Operator::DoesNotExist:
                parts.push_back("!" + req.key);
                break;
        }
    }
    return fmt::format("{}", fmt::join(parts, ","));
}

std::string_view to_string(LabelSelectorRequirement::Operator op)
{
    switch (op) {
        case LabelSelectorRequirement::Operator::In:
            return "In";
        case LabelSelectorRequirement::Operator::NotIn:
            return "NotIn";
        case LabelSelectorRequirement::Operator::Exists:
            return "Exists";
        case LabelSelectorRequirement::Operator::DoesNotExist:
            return "DoesNotExist";
    }
    return "Unknown";
}

std::string to_string(const LabelSelector & selector)
{
    std::vector<std::string> labels;
    for (const auto & [key, value] : selector.match_labels) {
        labels.push_back(fmt::format("{}={}", key, value));
    }
    std::vector<std::string> expressions;
    for (const auto & req : selector.match_expressions) {
        expressions.push_back(fmt::format("{} {} [{}]", req.key, to_string(req.op), fmt::join(req.values, ",")));
    }
    return fmt::format("{{matchLabels: {{{}}}, matchExpressions: [{}]}}",
            fmt::join(labels, ", "), fmt::join(expressions, "; "));
}

LabelSelector parse_label_selector(std::string_view text)
{
    LabelSelector selector;
    if (trim(text).empty()) {
        return selector;
    }

    for (auto term : split_terms(text)) {
        if (term.empty()) {
            throw SelectorError(fmt::format("empty term in selector \"{}\"", text));
        }

        if (term.front() == '!') {
            selector.match_expressions.push_back(LabelSelectorRequirement{
                    std::string(trim(term.substr(1))), LabelSelectorRequirement::Operator::DoesNotExist, {} });
        } else if (auto ne_pos = term.find("!="); ne_pos != std::string_view::npos) {
            selector.match_expressions.push_back(LabelSelectorRequirement{
                    std::string(trim(term.substr(0, ne_pos))), LabelSelectorRequirement::Operator::NotIn,
                    { std::string(trim(term.substr(ne_pos + 2))) } });
        } else if (auto eq_pos = term.find('='); eq_pos != std::string_view::npos) {
            auto key = std::string(trim(term.substr(0, eq_pos)));
            auto value_pos = eq_pos + 1;
            if (value_pos < term.size() && term[value_pos] == '=') {
                ++value_pos;
            }
            auto value = std::string(trim(term.substr(value_pos)));
            auto [it, inserted] = selector.match_labels.emplace(key, value);
            if (!inserted && it->second != value) {
                throw SelectorError(fmt::format("conflicting values for label \"{}\" in selector \"{}\"", key, text));
            }
        } else {
            selector.match_expressions.push_back(parse_set_term(term));
        }
    }
    return selector;
}

} // namespace wpa
