#include "router/perp_router.hpp"
#include "core/errors.hpp"

#include <iostream>

namespace perpx {

PerpRouter::PerpRouter(Principal owner,
                       VenueRegistry& venues,
                       OracleRegistry& oracles,
                       const IClock& clock,
                       EventLog& events,
                       std::shared_ptr<IPositionLocator> locator,
                       RouterOptions options)
    : access_(std::move(owner), events)
    , venues_(venues)
    , oracles_(oracles)
    , clock_(clock)
    , events_(events)
    , locator_(std::move(locator))
    , options_(options) {
    if (!locator_) {
        locator_ = std::make_shared<FirstActiveLocator>();
    }
}

Amount PerpRouter::open_position(const Principal& caller, const OpenPositionRequest& req) {
    ReentrancyGuard guard(sessions_, caller);

    check_live(req.deadline, req.market);
    if (req.margin == 0) {
        throw RouterError(ErrorCode::InvalidMargin, "margin must be positive");
    }
    if (req.leverage == 0) {
        throw RouterError(ErrorCode::InvalidLeverage, "leverage must be positive");
    }

    QuoteRequest quote_req{.market = req.market, .is_long = req.is_long,
                           .margin = req.margin, .leverage = req.leverage};
    VenueSelection selection = selector_.select_best_venue(
        venues_.active_snapshot(), quote_req, [&] { check_deadline(req.deadline); });

    // Validate the raw execution price, not the fee-adjusted one.
    oracles_.snapshot(req.market).validate_execution_price(
        selection.quote.execution_price, req.is_long, clock_.now());

    check_deadline(req.deadline);
    const ActiveVenue& venue = selection.venue;
    Amount executed = execute(venue, [&](IVenueGateway& gw) {
        return gw.open_position(caller, req.market, req.is_long, req.margin, req.leverage);
    });

    if (executed < req.min_out) {
        bool compensated = options_.compensate_on_slippage
                        && compensate(venue, caller, req.market, executed);
        throw SlippageError(executed, req.min_out, compensated);
    }

    events_.emit(PositionOpened{
        .user            = caller,
        .market          = req.market,
        .venue           = venue.id,
        .is_long         = req.is_long,
        .margin          = req.margin,
        .leverage        = req.leverage,
        .executed_size   = executed,
        .execution_price = selection.quote.execution_price,
    });
    return executed;
}

Amount PerpRouter::close_position(const Principal& caller, const ClosePositionRequest& req) {
    ReentrancyGuard guard(sessions_, caller);

    check_live(req.deadline, req.market);
    if (req.position_size == 0) {
        throw RouterError(ErrorCode::InvalidPositionSize, "position size must be positive");
    }

    ActiveVenue venue = locator_->locate(caller, req.market, venues_.active_snapshot());

    check_deadline(req.deadline);
    Amount payout = execute(venue, [&](IVenueGateway& gw) {
        return gw.close_position(caller, req.market, req.position_size);
    });

    if (payout < req.min_out) {
        throw SlippageError(payout, req.min_out, false);
    }

    events_.emit(PositionClosed{
        .user          = caller,
        .market        = req.market,
        .venue         = venue.id,
        .position_size = req.position_size,
        .payout        = payout,
    });
    return payout;
}

Amount PerpRouter::increase_position(const Principal& caller, const IncreasePositionRequest& req) {
    ReentrancyGuard guard(sessions_, caller);

    check_live(req.deadline, req.market);
    if (req.additional_margin == 0) {
        throw RouterError(ErrorCode::InvalidMargin, "additional margin must be positive");
    }
    if (req.leverage == 0) {
        throw RouterError(ErrorCode::InvalidLeverage, "leverage must be positive");
    }

    ActiveVenue venue = locator_->locate(caller, req.market, venues_.active_snapshot());

    check_deadline(req.deadline);
    Amount added = execute(venue, [&](IVenueGateway& gw) {
        return gw.increase_position(caller, req.market, req.additional_margin, req.leverage);
    });

    if (added < req.min_out) {
        bool compensated = options_.compensate_on_slippage
                        && compensate(venue, caller, req.market, added);
        throw SlippageError(added, req.min_out, compensated);
    }

    events_.emit(PositionIncreased{
        .user              = caller,
        .market            = req.market,
        .venue             = venue.id,
        .additional_margin = req.additional_margin,
        .leverage          = req.leverage,
        .additional_size   = added,
    });
    return added;
}

Amount PerpRouter::reduce_position(const Principal& caller, const ReducePositionRequest& req) {
    ReentrancyGuard guard(sessions_, caller);

    check_live(req.deadline, req.market);
    if (req.size_to_reduce == 0) {
        throw RouterError(ErrorCode::InvalidPositionSize, "size to reduce must be positive");
    }

    ActiveVenue venue = locator_->locate(caller, req.market, venues_.active_snapshot());

    check_deadline(req.deadline);
    Amount payout = execute(venue, [&](IVenueGateway& gw) {
        return gw.reduce_position(caller, req.market, req.size_to_reduce);
    });

    if (payout < req.min_out) {
        throw SlippageError(payout, req.min_out, false);
    }

    events_.emit(PositionReduced{
        .user         = caller,
        .market       = req.market,
        .venue        = venue.id,
        .size_reduced = req.size_to_reduce,
        .payout       = payout,
    });
    return payout;
}

VenueSelection PerpRouter::best_venue(const QuoteRequest& request) const {
    if (request.market.empty()) {
        throw RouterError(ErrorCode::InvalidMarket, "market must not be empty");
    }
    return selector_.select_best_venue(venues_.active_snapshot(), request);
}

void PerpRouter::pause(const Principal& caller) {
    access_.require_owner(caller);
    if (!paused_.exchange(true)) {
        events_.emit(RouterPaused{.by = caller});
    }
}

void PerpRouter::unpause(const Principal& caller) {
    access_.require_owner(caller);
    if (paused_.exchange(false)) {
        events_.emit(RouterUnpaused{.by = caller});
    }
}

void PerpRouter::transfer_ownership(const Principal& caller, const Principal& new_owner) {
    access_.transfer_ownership(caller, new_owner);
}

void PerpRouter::check_live(Timestamp deadline, const MarketId& market) const {
    if (paused_.load()) {
        throw RouterError(ErrorCode::Paused, "router is paused");
    }
    check_deadline(deadline);
    if (market.empty()) {
        throw RouterError(ErrorCode::InvalidMarket, "market must not be empty");
    }
}

void PerpRouter::check_deadline(Timestamp deadline) const {
    Timestamp now = clock_.now();
    if (now > deadline) {
        throw RouterError(ErrorCode::DeadlineExpired,
                          "now " + std::to_string(now) + " > deadline " + std::to_string(deadline));
    }
}

Amount PerpRouter::execute(const ActiveVenue& venue,
                           const std::function<Amount(IVenueGateway&)>& call) const {
    try {
        return call(*venue.gateway);
    } catch (const RouterError&) {
        throw;
    } catch (const std::exception& e) {
        throw RouterError(ErrorCode::VenueCallFailed, venue.id + ": " + e.what());
    }
}

bool PerpRouter::compensate(const ActiveVenue& venue, const Principal& caller,
                            const MarketId& market, Amount size) const {
    if (size == 0) return true;
    try {
        venue.gateway->reduce_position(caller, market, size);
        std::cerr << "[perp_router] slippage on " << venue.id << ": unwound "
                  << format_amount(size) << " " << market << " for " << caller << "\n";
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[perp_router] slippage on " << venue.id << ": unwind of "
                  << format_amount(size) << " " << market << " for " << caller
                  << " failed: " << e.what() << "\n";
        return false;
    }
}

} // namespace perpx
