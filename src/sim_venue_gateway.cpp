#include "execution/sim_venue_gateway.hpp"

#include <algorithm>

namespace perpx {

SimVenueGateway::SimVenueGateway(std::string name, uint32_t fee_rate_bps)
    : name_(std::move(name)), fee_rate_bps_(fee_rate_bps) {}

VenueQuote SimVenueGateway::get_quote(const MarketId& market, bool /*is_long*/,
                                      Amount /*margin*/, uint32_t /*leverage*/) {
    std::lock_guard lock(mutex_);
    ++quote_calls_;
    if (fail_quotes_) {
        throw VenueError(name_ + ": quote unavailable");
    }

    Amount price = mark_price_locked(market);
    auto it = quote_overrides_.find(market);
    if (it != quote_overrides_.end()) {
        price = it->second;
    }

    return VenueQuote{.execution_price = price, .fee = apply_bps(price, fee_rate_bps_)};
}

Amount SimVenueGateway::open_position(const Principal& trader, const MarketId& market,
                                      bool is_long, Amount margin, uint32_t leverage) {
    std::lock_guard lock(mutex_);
    begin_execution_locked();

    Amount size = size_for(margin, leverage, mark_price_locked(market));

    auto& pos = positions_[{trader, market}];
    pos.is_long = is_long;
    pos.size += size;
    pos.margin += margin;
    return size;
}

Amount SimVenueGateway::close_position(const Principal& trader, const MarketId& market,
                                       Amount position_size) {
    std::lock_guard lock(mutex_);
    begin_execution_locked();

    auto it = positions_.find({trader, market});
    if (it == positions_.end() || it->second.size == 0) {
        throw VenueError(name_ + ": no open position for " + trader + " on " + market);
    }

    Amount closed = std::min(position_size, it->second.size);
    Amount payout = payout_for(closed, mark_price_locked(market));
    it->second.size -= closed;
    if (it->second.size == 0) {
        positions_.erase(it);
    }
    return payout;
}

Amount SimVenueGateway::increase_position(const Principal& trader, const MarketId& market,
                                          Amount additional_margin, uint32_t leverage) {
    std::lock_guard lock(mutex_);
    begin_execution_locked();

    auto it = positions_.find({trader, market});
    if (it == positions_.end()) {
        throw VenueError(name_ + ": no open position for " + trader + " on " + market);
    }

    Amount size = size_for(additional_margin, leverage, mark_price_locked(market));
    it->second.size += size;
    it->second.margin += additional_margin;
    return size;
}

Amount SimVenueGateway::reduce_position(const Principal& trader, const MarketId& market,
                                        Amount size_to_reduce) {
    std::lock_guard lock(mutex_);
    begin_execution_locked();

    auto it = positions_.find({trader, market});
    if (it == positions_.end() || it->second.size < size_to_reduce) {
        throw VenueError(name_ + ": reduce exceeds position for " + trader + " on " + market);
    }

    Amount payout = payout_for(size_to_reduce, mark_price_locked(market));
    it->second.size -= size_to_reduce;
    if (it->second.size == 0) {
        positions_.erase(it);
    }
    return payout;
}

void SimVenueGateway::set_mark_price(const MarketId& market, Amount price) {
    std::lock_guard lock(mutex_);
    mark_prices_[market] = price;
}

void SimVenueGateway::set_quote_price_override(const MarketId& market, Amount price) {
    std::lock_guard lock(mutex_);
    quote_overrides_[market] = price;
}

void SimVenueGateway::clear_quote_price_override(const MarketId& market) {
    std::lock_guard lock(mutex_);
    quote_overrides_.erase(market);
}

SimPosition SimVenueGateway::position(const Principal& trader, const MarketId& market) const {
    std::lock_guard lock(mutex_);
    auto it = positions_.find({trader, market});
    return it != positions_.end() ? it->second : SimPosition{};
}

Amount SimVenueGateway::mark_price_locked(const MarketId& market) const {
    auto it = mark_prices_.find(market);
    if (it == mark_prices_.end() || it->second == 0) {
        throw VenueError(name_ + ": market " + market + " not listed");
    }
    return it->second;
}

void SimVenueGateway::begin_execution_locked() {
    ++execution_calls_;
    if (fail_execution_) {
        throw VenueError(name_ + ": execution rejected");
    }
}

Amount SimVenueGateway::size_for(Amount margin, uint32_t leverage, Amount price) const {
    Amount size = mul_div(margin * leverage, kPriceScale, price);
    return apply_bps(size, fill_ratio_bps_);
}

Amount SimVenueGateway::payout_for(Amount size, Amount price) const {
    Amount payout = mul_div(size, price, kPriceScale);
    return apply_bps(payout, fill_ratio_bps_);
}

} // namespace perpx
