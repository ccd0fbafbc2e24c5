#pragma once

#include "core/access_control.hpp"
#include "core/clock.hpp"
#include "execution/position_locator.hpp"
#include "execution/venue_router.hpp"
#include "oracle/oracle_registry.hpp"
#include "registry/venue_registry.hpp"
#include "router/event_log.hpp"
#include "router/reentrancy_guard.hpp"

#include <atomic>
#include <functional>
#include <memory>

namespace perpx {

struct OpenPositionRequest {
    MarketId  market;
    bool      is_long  = true;
    Amount    margin   = 0;
    uint32_t  leverage = 0;
    Amount    min_out  = 0;    // minimum executed size
    Timestamp deadline = 0;
};

struct ClosePositionRequest {
    MarketId  market;
    Amount    position_size = 0;
    Amount    min_out       = 0;    // minimum payout
    Timestamp deadline      = 0;
};

struct IncreasePositionRequest {
    MarketId  market;
    Amount    additional_margin = 0;
    uint32_t  leverage          = 0;
    Amount    min_out           = 0;    // minimum additional size
    Timestamp deadline          = 0;
};

struct ReducePositionRequest {
    MarketId  market;
    Amount    size_to_reduce = 0;
    Amount    min_out        = 0;    // minimum payout
    Timestamp deadline       = 0;
};

struct RouterOptions {
    // Unwind an open/increase on the same venue when its realized size
    // misses min_out, before raising SlippageError.
    bool compensate_on_slippage = true;
};

// Routes perpetual-futures trades to the venue with the best effective price.
//
// open_position: select venue -> oracle check -> execute -> slippage check.
// All registry reads and venue selection happen before the single
// state-changing venue call, so any failure up to that point leaves no trace.
// close/increase/reduce resolve their venue through the position locator.
class PerpRouter {
public:
    PerpRouter(Principal owner,
               VenueRegistry& venues,
               OracleRegistry& oracles,
               const IClock& clock,
               EventLog& events,
               std::shared_ptr<IPositionLocator> locator = std::make_shared<FirstActiveLocator>(),
               RouterOptions options = {});

    Amount open_position(const Principal& caller, const OpenPositionRequest& req);
    Amount close_position(const Principal& caller, const ClosePositionRequest& req);
    Amount increase_position(const Principal& caller, const IncreasePositionRequest& req);
    Amount reduce_position(const Principal& caller, const ReducePositionRequest& req);

    // Read-only: the venue open_position would pick right now.
    VenueSelection best_venue(const QuoteRequest& request) const;

    // --- Administration (owner only) ---
    void pause(const Principal& caller);
    void unpause(const Principal& caller);
    void transfer_ownership(const Principal& caller, const Principal& new_owner);

    bool      paused() const { return paused_.load(); }
    Principal owner() const { return access_.owner(); }

private:
    void check_live(Timestamp deadline, const MarketId& market) const;
    void check_deadline(Timestamp deadline) const;
    Amount execute(const ActiveVenue& venue, const std::function<Amount(IVenueGateway&)>& call) const;
    bool compensate(const ActiveVenue& venue, const Principal& caller,
                    const MarketId& market, Amount size) const;

    AccessControl                     access_;
    VenueRegistry&                    venues_;
    OracleRegistry&                   oracles_;
    const IClock&                     clock_;
    EventLog&                         events_;
    std::shared_ptr<IPositionLocator> locator_;
    RouterOptions                     options_;
    VenueRouter                       selector_;
    SessionLocks                      sessions_;
    std::atomic<bool>                 paused_{false};
};

} // namespace perpx
