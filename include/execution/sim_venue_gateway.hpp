#pragma once

#include "execution/venue_gateway.hpp"

#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

namespace perpx {

// Failure raised by a venue.
class VenueError : public std::runtime_error {
public:
    explicit VenueError(const std::string& msg) : std::runtime_error(msg) {}
};

struct SimPosition {
    bool   is_long = true;
    Amount size    = 0;
    Amount margin  = 0;
};

// In-process venue. Fills at its mark price; size = margin * leverage / price,
// payout = size * price.
class SimVenueGateway : public IVenueGateway {
public:
    SimVenueGateway(std::string name, uint32_t fee_rate_bps);

    VenueQuote get_quote(const MarketId& market, bool is_long,
                         Amount margin, uint32_t leverage) override;

    Amount open_position(const Principal& trader, const MarketId& market,
                         bool is_long, Amount margin, uint32_t leverage) override;
    Amount close_position(const Principal& trader, const MarketId& market,
                          Amount position_size) override;
    Amount increase_position(const Principal& trader, const MarketId& market,
                             Amount additional_margin, uint32_t leverage) override;
    Amount reduce_position(const Principal& trader, const MarketId& market,
                           Amount size_to_reduce) override;

    // --- Simulation controls ---

    void set_mark_price(const MarketId& market, Amount price);
    // Quote this price instead of the mark (execution still fills at mark).
    void set_quote_price_override(const MarketId& market, Amount price);
    void clear_quote_price_override(const MarketId& market);
    void set_fail_quotes(bool fail) { std::lock_guard lock(mutex_); fail_quotes_ = fail; }
    void set_fail_execution(bool fail) { std::lock_guard lock(mutex_); fail_execution_ = fail; }
    // Fraction of the theoretical amount actually delivered, in bps (10000 = full fill).
    void set_fill_ratio_bps(uint32_t bps) { std::lock_guard lock(mutex_); fill_ratio_bps_ = bps; }

    // --- Inspection ---

    const std::string& name() const { return name_; }
    uint32_t fee_rate_bps() const { return fee_rate_bps_; }
    SimPosition position(const Principal& trader, const MarketId& market) const;
    size_t quote_calls() const { std::lock_guard lock(mutex_); return quote_calls_; }
    size_t execution_calls() const { std::lock_guard lock(mutex_); return execution_calls_; }

private:
    using PositionKey = std::pair<Principal, MarketId>;

    Amount mark_price_locked(const MarketId& market) const;
    void   begin_execution_locked();
    Amount size_for(Amount margin, uint32_t leverage, Amount price) const;
    Amount payout_for(Amount size, Amount price) const;

    std::string name_;
    uint32_t    fee_rate_bps_;

    mutable std::mutex mutex_;
    std::unordered_map<MarketId, Amount> mark_prices_;
    std::unordered_map<MarketId, Amount> quote_overrides_;
    std::map<PositionKey, SimPosition>   positions_;
    bool     fail_quotes_     = false;
    bool     fail_execution_  = false;
    uint32_t fill_ratio_bps_  = kBpsDenominator;
    size_t   quote_calls_     = 0;
    size_t   execution_calls_ = 0;
};

} // namespace perpx
