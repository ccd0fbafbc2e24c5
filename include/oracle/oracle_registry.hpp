#pragma once

#include "core/access_control.hpp"
#include "core/clock.hpp"
#include "oracle/price_feed.hpp"

#include <memory>
#include <shared_mutex>
#include <unordered_map>

namespace perpx {

class EventLog;

constexpr Timestamp kMaxPriceAge                = 15 * 60;  // seconds
constexpr uint32_t  kDefaultMaxPriceDeviationBps = 500;      // 5%

// |execution - oracle| * 10000 / oracle, truncating, saturating at kMaxAmount.
// oracle_price must be > 0.
Amount price_deviation_bps(Amount execution_price, Amount oracle_price);

// Returns the observed price if it is usable at `now`.
// Throws StalePrice if older than kMaxPriceAge, InvalidPrice if zero or
// timestamped in the future.
Amount checked_price(const PriceObservation& obs, Timestamp now);

// A market's binding and the tolerance, captured together for one router call.
struct OracleSnapshot {
    MarketId                    market;
    std::shared_ptr<IPriceFeed> feed;
    uint32_t                    max_deviation_bps = kDefaultMaxPriceDeviationBps;

    // Same checks as OracleRegistry, against this snapshot.
    Amount validated_price(Timestamp now) const;
    void   validate_execution_price(Amount execution_price, bool is_long, Timestamp now) const;
};

class OracleRegistry {
public:
    OracleRegistry(Principal owner, const IClock& clock, EventLog& events);

    // Owner only. Latest bind wins.
    void bind(const Principal& caller, const MarketId& market, std::shared_ptr<IPriceFeed> feed);

    // Owner only. No upper bound.
    void set_deviation_tolerance(const Principal& caller, uint32_t bps);
    uint32_t deviation_tolerance() const;

    bool has_oracle(const MarketId& market) const;

    Amount get_validated_price(const MarketId& market) const;

    // Throws PriceDeviationTooHigh if the execution price is outside tolerance.
    // is_long does not change the formula.
    void validate_execution_price(const MarketId& market, Amount execution_price, bool is_long) const;

    // Throws OracleNotSet if the market is unbound.
    OracleSnapshot snapshot(const MarketId& market) const;

    AccessControl& access() { return access_; }

private:
    AccessControl access_;
    const IClock& clock_;
    EventLog&     events_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<MarketId, std::shared_ptr<IPriceFeed>> feeds_;
    uint32_t max_deviation_bps_ = kDefaultMaxPriceDeviationBps;
};

} // namespace perpx
