#pragma once

#include "core/fixed_point.hpp"
#include "core/types.hpp"

#include <cstdint>

namespace perpx {

struct VenueQuote {
    Amount execution_price = 0;
    Amount fee             = 0;   // price units, always against the trader
};

// Execution surface of one venue. Every call may throw; state-changing
// calls are fail-stop with no partial effect on the venue.
class IVenueGateway {
public:
    virtual ~IVenueGateway() = default;

    virtual VenueQuote get_quote(const MarketId& market, bool is_long,
                                 Amount margin, uint32_t leverage) = 0;

    // Each returns the realized amount: size for open/increase, payout for close/reduce.
    virtual Amount open_position(const Principal& trader, const MarketId& market,
                                 bool is_long, Amount margin, uint32_t leverage) = 0;
    virtual Amount close_position(const Principal& trader, const MarketId& market,
                                  Amount position_size) = 0;
    virtual Amount increase_position(const Principal& trader, const MarketId& market,
                                     Amount additional_margin, uint32_t leverage) = 0;
    virtual Amount reduce_position(const Principal& trader, const MarketId& market,
                                   Amount size_to_reduce) = 0;
};

} // namespace perpx
