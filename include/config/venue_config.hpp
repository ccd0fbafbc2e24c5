#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <string>

namespace perpx {

constexpr uint32_t kMaxVenueLeverage = 100;

// Registry metadata for one venue. Zero-valued for unknown handles.
struct VenueInfo {
    bool         active       = false;
    uint32_t     max_leverage = 0;
    uint32_t     fee_rate_bps = 0;     // 10000 = 100%
    std::string  name;
};

} // namespace perpx
