#pragma once

#include "registry/venue_registry.hpp"

#include <functional>
#include <optional>
#include <vector>

namespace perpx {

struct QuoteRequest {
    MarketId market;
    bool     is_long  = true;
    Amount   margin   = 0;
    uint32_t leverage = 0;
};

struct VenueSelection {
    ActiveVenue venue;
    VenueQuote  quote;
    Amount      effective_price = 0;

    std::vector<VenueId> ineligible;     // leverage above the venue's max
    std::vector<VenueId> quote_failures; // excluded after a failed quote
};

// Invoked before each venue call; throws to stop the fan-out.
using VenueCallCheck = std::function<void()>;

// Fee-adjusted price from the trader's side: price + fee for longs
// (saturating at kMaxAmount), price - fee (floored at zero) for shorts.
Amount effective_price(const VenueQuote& quote, bool is_long);

// Picks the execution venue among active venues by best effective price.
class VenueRouter {
public:
    // Longs take the lowest effective price, shorts the highest; ties keep
    // the earliest venue. A failed quote only excludes that venue.
    // Throws NoActiveVenues if `venues` is empty or no venue produced a quote.
    VenueSelection select_best_venue(const std::vector<ActiveVenue>& venues,
                                     const QuoteRequest& request,
                                     const VenueCallCheck& before_call = {}) const;

    // Empty when the venue's quote call failed.
    std::optional<VenueQuote> try_quote(const ActiveVenue& venue,
                                        const QuoteRequest& request) const;
};

} // namespace perpx
