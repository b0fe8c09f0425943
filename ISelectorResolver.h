#pragma once

#include "LabelSelector.h"

namespace wpa {

class ISelectorResolver {
public:
    // Throws SelectorError when the selector cannot be turned into a filter
    virtual SelectorFilter resolve(const LabelSelector & selector) const = 0;

    virtual ~ISelectorResolver() = default;
};

} // namespace wpa
