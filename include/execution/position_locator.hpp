#pragma once

#include "registry/venue_registry.hpp"

#include <vector>

namespace perpx {

// Resolves the venue holding a trader's position for close/increase/reduce.
class IPositionLocator {
public:
    virtual ~IPositionLocator() = default;
    virtual ActiveVenue locate(const Principal& trader, const MarketId& market,
                               const std::vector<ActiveVenue>& active) const = 0;
};

// Always the first active venue, regardless of where the position lives.
class FirstActiveLocator : public IPositionLocator {
public:
    ActiveVenue locate(const Principal& trader, const MarketId& market,
                       const std::vector<ActiveVenue>& active) const override;
};

} // namespace perpx
