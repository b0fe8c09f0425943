#include "LabelSelectorResolver.h"

#include "Errors.h"

#include "fmt/core.h"

#include <cctype>

namespace wpa {

namespace {

constexpr size_t MaxNameLength = 63;
constexpr size_t MaxPrefixLength = 253;

bool is_alnum(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

// [A-Za-z0-9]([-_.A-Za-z0-9]*[A-Za-z0-9])?, at most 63 chars
bool is_qualified_name_part(std::string_view name)
{
    if (name.empty() || name.size() > MaxNameLength) {
        return false;
    }
    if (!is_alnum(name.front()) || !is_alnum(name.back())) {
        return false;
    }
    for (char c : name) {
        if (!is_alnum(c) && c != '-' && c != '_' && c != '.') {
            return false;
        }
    }
    return true;
}

// Lowercase RFC 1123 subdomain
bool is_dns_subdomain(std::string_view prefix)
{
    if (prefix.empty() || prefix.size() > MaxPrefixLength) {
        return false;
    }
    size_t start = 0;
    while (start <= prefix.size()) {
        auto dot = prefix.find('.', start);
        auto label = prefix.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
        if (label.empty() || label.size() > MaxNameLength || label.front() == '-' || label.back() == '-') {
            return false;
        }
        for (char c : label) {
            if (!(std::islower(static_cast<unsigned char>(c)) || std::isdigit(static_cast<unsigned char>(c)) || c == '-')) {
                return false;
            }
        }
        if (dot == std::string_view::npos) {
            break;
        }
        start = dot + 1;
    }
    return true;
}

void validate_key(const std::string & key)
{
    std::string_view name = key;
    if (auto slash = name.find('/'); slash != std::string_view::npos) {
        if (!is_dns_subdomain(name.substr(0, slash))) {
            throw SelectorError(fmt::format("invalid label key \"{}\": prefix must be a DNS subdomain", key));
        }
        name = name.substr(slash + 1);
    }
    if (!is_qualified_name_part(name)) {
        throw SelectorError(fmt::format("invalid label key \"{}\"", key));
    }
}

void validate_value(const std::string & key, const std::string & value)
{
    if (!value.empty() && !is_qualified_name_part(value)) {
        throw SelectorError(fmt::format("invalid label value \"{}\" for key \"{}\"", value, key));
    }
}

} // unnamed namespace

SelectorFilter LabelSelectorResolver::resolve(const LabelSelector & selector) const
{
    std::vector<LabelSelectorRequirement> requirements;
    requirements.reserve(selector.match_labels.size() + selector.match_expressions.size());

    for (const auto & [key, value] : selector.match_labels) {
        validate_key(key);
        validate_value(key, value);
        requirements.push_back(LabelSelectorRequirement{ key, LabelSelectorRequirement::Operator::In, { value } });
    }

    for (const auto & expr : selector.match_expressions) {
        validate_key(expr.key);
        switch (expr.op) {
            case LabelSelectorRequirement::Operator::In:
            case LabelSelectorRequirement::Operator::NotIn:
                if (expr.values.empty()) {
                    throw SelectorError(fmt::format(
                            "operator {} on key \"{}\" requires at least one value", to_string(expr.op), expr.key));
                }
                break;
            case LabelSelectorRequirement::Operator::Exists:
            case LabelSelectorRequirement::Operator::DoesNotExist:
                if (!expr.values.empty()) {
                    throw SelectorError(fmt::format(
                            "operator {} on key \"{}\" takes no values", to_string(expr.op), expr.key));
                }
                break;
            default:
                throw SelectorError(fmt::format("unknown selector operator on key \"{}\"", expr.key));
        }
        for (const auto & value : expr.values) {
            validate_value(expr.key, value);
        }
        requirements.push_back(expr);
    }

    return SelectorFilter(std::move(requirements));
}

} // namespace wpa
