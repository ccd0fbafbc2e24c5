#include "oracle/oracle_registry.hpp"
#include "core/errors.hpp"
#include "router/event_log.hpp"

#include <mutex>
#include <stdexcept>

namespace perpx {

Amount price_deviation_bps(Amount execution_price, Amount oracle_price) {
    Amount diff = execution_price > oracle_price ? execution_price - oracle_price
                                                 : oracle_price - execution_price;
    // Scale before dividing to keep bps resolution; saturate when even the
    // quotient no longer fits.
    try {
        return mul_div(diff, kBpsDenominator, oracle_price);
    } catch (const std::overflow_error&) {
        return kMaxAmount;
    }
}

Amount checked_price(const PriceObservation& obs, Timestamp now) {
    if (obs.observed_at > now) {
        throw RouterError(ErrorCode::InvalidPrice, "observation timestamped in the future");
    }
    if (now - obs.observed_at > kMaxPriceAge) {
        throw RouterError(ErrorCode::StalePrice,
                          "observation age " + std::to_string(now - obs.observed_at) + "s");
    }
    if (obs.price == 0) {
        throw RouterError(ErrorCode::InvalidPrice, "oracle price is zero");
    }
    return obs.price;
}

Amount OracleSnapshot::validated_price(Timestamp now) const {
    if (!feed) {
        throw RouterError(ErrorCode::OracleNotSet, "market " + market);
    }

    PriceObservation obs;
    try {
        obs = feed->latest_price();
    } catch (const std::exception& e) {
        throw RouterError(ErrorCode::OracleUnavailable, market + ": " + e.what());
    }
    return checked_price(obs, now);
}

void OracleSnapshot::validate_execution_price(Amount execution_price, bool /*is_long*/,
                                              Timestamp now) const {
    Amount oracle_price = validated_price(now);
    Amount deviation = price_deviation_bps(execution_price, oracle_price);
    if (deviation > max_deviation_bps) {
        throw RouterError(ErrorCode::PriceDeviationTooHigh,
                          market + " execution " + format_amount(execution_price)
                          + " vs oracle " + format_amount(oracle_price)
                          + " deviates " + to_string(deviation) + " bps (max "
                          + std::to_string(max_deviation_bps) + ")");
    }
}

OracleRegistry::OracleRegistry(Principal owner, const IClock& clock, EventLog& events)
    : access_(std::move(owner), events), clock_(clock), events_(events) {}

void OracleRegistry::bind(const Principal& caller, const MarketId& market,
                          std::shared_ptr<IPriceFeed> feed) {
    access_.require_owner(caller);
    if (market.empty() || !feed) {
        throw RouterError(ErrorCode::InvalidOracle, "market and feed are required");
    }

    std::string description = feed->description();
    {
        std::unique_lock lock(mutex_);
        feeds_[market] = std::move(feed);
    }
    events_.emit(OracleSet{.market = market, .feed = std::move(description)});
}

void OracleRegistry::set_deviation_tolerance(const Principal& caller, uint32_t bps) {
    access_.require_owner(caller);
    uint32_t old_bps;
    {
        std::unique_lock lock(mutex_);
        old_bps = max_deviation_bps_;
        max_deviation_bps_ = bps;
    }
    events_.emit(MaxPriceDeviationUpdated{.old_bps = old_bps, .new_bps = bps});
}

uint32_t OracleRegistry::deviation_tolerance() const {
    std::shared_lock lock(mutex_);
    return max_deviation_bps_;
}

bool OracleRegistry::has_oracle(const MarketId& market) const {
    std::shared_lock lock(mutex_);
    return feeds_.count(market) > 0;
}

Amount OracleRegistry::get_validated_price(const MarketId& market) const {
    return snapshot(market).validated_price(clock_.now());
}

void OracleRegistry::validate_execution_price(const MarketId& market, Amount execution_price,
                                              bool is_long) const {
    snapshot(market).validate_execution_price(execution_price, is_long, clock_.now());
}

OracleSnapshot OracleRegistry::snapshot(const MarketId& market) const {
    std::shared_lock lock(mutex_);
    auto it = feeds_.find(market);
    if (it == feeds_.end()) {
        throw RouterError(ErrorCode::OracleNotSet, "market " + market);
    }
    return OracleSnapshot{.market = market, .feed = it->second,
                          .max_deviation_bps = max_deviation_bps_};
}

} // namespace perpx
