#include "execution/venue_router.hpp"
#include "core/errors.hpp"

#include <iostream>

namespace perpx {

Amount effective_price(const VenueQuote& quote, bool is_long) {
    if (is_long) {
        if (quote.fee > kMaxAmount - quote.execution_price) {
            return kMaxAmount;
        }
        return quote.execution_price + quote.fee;
    }
    return quote.fee >= quote.execution_price ? 0 : quote.execution_price - quote.fee;
}

std::optional<VenueQuote> VenueRouter::try_quote(const ActiveVenue& venue,
                                                 const QuoteRequest& request) const {
    try {
        return venue.gateway->get_quote(request.market, request.is_long,
                                        request.margin, request.leverage);
    } catch (const std::exception& e) {
        std::cerr << "[venue_router] quote from " << venue.id << " failed: " << e.what() << "\n";
        return std::nullopt;
    }
}

VenueSelection VenueRouter::select_best_venue(const std::vector<ActiveVenue>& venues,
                                              const QuoteRequest& request,
                                              const VenueCallCheck& before_call) const {
    if (venues.empty()) {
        throw RouterError(ErrorCode::NoActiveVenues, "no active venues");
    }

    VenueSelection best;
    bool found = false;

    for (const auto& venue : venues) {
        if (request.leverage > venue.info.max_leverage) {
            best.ineligible.push_back(venue.id);
            continue;
        }

        if (before_call) before_call();

        auto quote = try_quote(venue, request);
        if (!quote) {
            best.quote_failures.push_back(venue.id);
            continue;
        }

        Amount price = effective_price(*quote, request.is_long);
        bool better = request.is_long ? price < best.effective_price
                                      : price > best.effective_price;

        if (!found || better) {
            best.venue = venue;
            best.quote = *quote;
            best.effective_price = price;
            found = true;
        }
    }

    if (!found) {
        throw RouterError(ErrorCode::NoActiveVenues,
                          "no eligible venue quoted " + request.market);
    }
    return best;
}

} // namespace perpx
