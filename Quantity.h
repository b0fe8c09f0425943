#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace wpa {

// Parses a resource quantity ("2", "500m", "1.5k", "1Gi", "3e2") into its value
// times 1000. Fractional milli-values are rounded up. Throws QuantityError.
int64_t parse_quantity_milli(std::string_view text);

// Renders a milli-value in the shortest exact form, "1500m" -> "1500m", 2000 -> "2".
std::string format_quantity_milli(int64_t milli);

} // namespace wpa
