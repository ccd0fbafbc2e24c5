#pragma once

#include "core/fixed_point.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <string>
#include <variant>

namespace perpx {

// --- Position lifecycle ---

struct PositionOpened {
    Principal user;
    MarketId  market;
    VenueId   venue;
    bool      is_long         = true;
    Amount    margin          = 0;
    uint32_t  leverage        = 0;
    Amount    executed_size   = 0;
    Amount    execution_price = 0;
};

struct PositionClosed {
    Principal user;
    MarketId  market;
    VenueId   venue;
    Amount    position_size = 0;
    Amount    payout        = 0;
};

struct PositionIncreased {
    Principal user;
    MarketId  market;
    VenueId   venue;
    Amount    additional_margin = 0;
    uint32_t  leverage          = 0;
    Amount    additional_size   = 0;
};

struct PositionReduced {
    Principal user;
    MarketId  market;
    VenueId   venue;
    Amount    size_reduced = 0;
    Amount    payout       = 0;
};

// --- Administration ---

struct VenueRegistered {
    VenueId     venue;
    std::string name;
    uint32_t    max_leverage = 0;
    uint32_t    fee_rate_bps = 0;
};

struct VenueRemoved {
    VenueId venue;
};

struct VenueStatusChanged {
    VenueId venue;
    bool    active = false;
};

struct OracleSet {
    MarketId    market;
    std::string feed;
};

struct MaxPriceDeviationUpdated {
    uint32_t old_bps = 0;
    uint32_t new_bps = 0;
};

struct OwnershipTransferred {
    Principal previous_owner;
    Principal new_owner;
};

struct RouterPaused {
    Principal by;
};

struct RouterUnpaused {
    Principal by;
};

using Event = std::variant<PositionOpened,
                           PositionClosed,
                           PositionIncreased,
                           PositionReduced,
                           VenueRegistered,
                           VenueRemoved,
                           VenueStatusChanged,
                           OracleSet,
                           MaxPriceDeviationUpdated,
                           OwnershipTransferred,
                           RouterPaused,
                           RouterUnpaused>;

// Event type name, e.g. "PositionOpened".
const char* event_name(const Event& event);

// One-line human readable rendering.
std::string describe(const Event& event);

} // namespace perpx
