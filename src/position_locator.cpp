#include "execution/position_locator.hpp"
#include "core/errors.hpp"

namespace perpx {

ActiveVenue FirstActiveLocator::locate(const Principal& /*trader*/, const MarketId& /*market*/,
                                       const std::vector<ActiveVenue>& active) const {
    if (active.empty()) {
        throw RouterError(ErrorCode::NoActiveVenues, "no active venues");
    }
    return active.front();
}

} // namespace perpx
