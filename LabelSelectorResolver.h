#pragma once

#include "ISelectorResolver.h"

namespace wpa {

// Validates label keys, values and operators with Kubernetes label rules.
class LabelSelectorResolver : public ISelectorResolver {
public:
    SelectorFilter resolve(const LabelSelector & selector) const override;
};

} // namespace wpa
