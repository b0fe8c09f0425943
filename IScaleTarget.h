#pragma once

#include <cstdint>

namespace wpa {

class IScaleTarget {
public:
    virtual int32_t get_replicas() const = 0;
    virtual void set_replicas(int32_t replicas) = 0;

    virtual ~IScaleTarget() = default;
};

} // namespace wpa
