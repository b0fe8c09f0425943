#include "Quantity.h"

#include "Errors.h"

#include "fmt/core.h"

#include <cctype>
#include <limits>

namespace wpa {

namespace {

struct Suffix {
    std::string_view text;
    int decimal_exponent;
    int binary_exponent;
};

constexpr Suffix Suffixes[] = {
    { "Ki", 0, 10 }, { "Mi", 0, 20 }, { "Gi", 0, 30 }, { "Ti", 0, 40 }, { "Pi", 0, 50 }, { "Ei", 0, 60 },
    { "m", -3, 0 }, { "", 0, 0 }, { "k", 3, 0 }, { "M", 6, 0 }, { "G", 9, 0 }, { "T", 12, 0 },
    { "P", 15, 0 }, { "E", 18, 0 },
};

constexpr int MaxMantissaDigits = 18;

// Both operands are non-negative here
int64_t checked_mul(int64_t lhs, int64_t rhs, std::string_view text)
{
    if (lhs != 0 && rhs > std::numeric_limits<int64_t>::max() / lhs) {
        throw QuantityError(fmt::format("quantity \"{}\" is too large", text));
    }
    return lhs * rhs;
}

int64_t pow10(int exponent)
{
    int64_t result = 1;
    for (int i = 0; i < exponent; ++i) {
        result *= 10;
    }
    return result;
}

} // unnamed namespace

int64_t parse_quantity_milli(std::string_view text)
{
    size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        negative = text[pos] == '-';
        ++pos;
    }

    int64_t mantissa = 0;
    int digits = 0;
    int fraction_digits = 0;
    bool seen_point = false;
    bool seen_digit = false;
    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c == '.' && !seen_point) {
            seen_point = true;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            break;
        }
        seen_digit = true;
        if (mantissa == 0 && c == '0') {
            // leading zeroes do not count towards precision
        } else if (++digits > MaxMantissaDigits) {
            throw QuantityError(fmt::format("quantity \"{}\" has too many digits", text));
        }
        mantissa = mantissa * 10 + (c - '0');
        if (seen_point) {
            ++fraction_digits;
        }
    }
    if (!seen_digit) {
        throw QuantityError(fmt::format("quantity \"{}\" has no numeric part", text));
    }

    std::string_view suffix_text = text.substr(pos);
    int decimal_exponent = 0;
    int binary_exponent = 0;
    if (!suffix_text.empty() && (suffix_text[0] == 'e' || suffix_text[0] == 'E') && suffix_text.size() > 1) {
        std::string_view exp_text = suffix_text.substr(1);
        bool exp_negative = false;
        if (exp_text[0] == '+' || exp_text[0] == '-') {
            exp_negative = exp_text[0] == '-';
            exp_text = exp_text.substr(1);
        }
        if (exp_text.empty() || exp_text.size() > 3) {
            throw QuantityError(fmt::format("invalid exponent in quantity \"{}\"", text));
        }
        for (char c : exp_text) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                throw QuantityError(fmt::format("invalid exponent in quantity \"{}\"", text));
            }
            decimal_exponent = decimal_exponent * 10 + (c - '0');
        }
        if (exp_negative) {
            decimal_exponent = -decimal_exponent;
        }
    } else {
        bool known = false;
        for (const auto & suffix : Suffixes) {
            if (suffix.text == suffix_text) {
                decimal_exponent = suffix.decimal_exponent;
                binary_exponent = suffix.binary_exponent;
                known = true;
                break;
            }
        }
        if (!known) {
            throw QuantityError(fmt::format("unknown suffix \"{}\" in quantity \"{}\"", suffix_text, text));
        }
    }

    int64_t value = checked_mul(mantissa, int64_t(1) << binary_exponent, text);
    int scale = 3 + decimal_exponent - fraction_digits;
    if (scale >= 0) {
        if (scale > MaxMantissaDigits && value != 0) {
            throw QuantityError(fmt::format("quantity \"{}\" is too large", text));
        }
        for (int i = 0; i < scale && value != 0; ++i) {
            value = checked_mul(value, 10, text);
        }
    } else if (-scale > MaxMantissaDigits) {
        value = value != 0 ? 1 : 0;
        return negative ? 0 : value;
    } else {
        int64_t divisor = pow10(-scale);
        int64_t quotient = value / divisor;
        // positive values round up, negative ones towards zero
        if (value % divisor != 0 && !negative) {
            ++quotient;
        }
        value = quotient;
    }
    return negative ? -value : value;
}

std::string format_quantity_milli(int64_t milli)
{
    if (milli % 1000 == 0) {
        return fmt::format("{}", milli / 1000);
    }
    return fmt::format("{}m", milli);
}

} // namespace wpa
