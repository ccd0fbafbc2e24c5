#include "sim/route_simulator.hpp"

#include <fstream>
#include <iostream>

namespace perpx {

RouteSimulator::RouteSimulator(const SimulationConfig& config)
    : config_(config)
    , clock_(config.start_time)
    , venues_(config.owner, events_)
    , oracles_(config.owner, clock_, events_)
    , router_(config.owner, venues_, oracles_, clock_, events_,
              std::make_shared<FirstActiveLocator>(),
              RouterOptions{.compensate_on_slippage = config.compensate_on_slippage}) {
    events_.subscribe([this](const EventRecord& r) {
        metrics_.record_event(r.sequence, r.event);
    });
    setup();
}

void RouteSimulator::setup() {
    const Principal& admin = config_.owner;

    for (const auto& vc : config_.venues) {
        auto gw = std::make_shared<SimVenueGateway>(vc.name, vc.fee_rate_bps);
        for (const auto& [market, price] : vc.mark_prices) {
            gw->set_mark_price(market, price);
        }
        for (const auto& [market, price] : vc.quote_overrides) {
            gw->set_quote_price_override(market, price);
        }
        gw->set_fail_quotes(vc.fail_quotes);
        gw->set_fail_execution(vc.fail_execution);
        gw->set_fill_ratio_bps(vc.fill_ratio_bps);

        venues_.register_venue(admin, vc.id, gw, vc.name, vc.max_leverage, vc.fee_rate_bps);
        if (!vc.active) {
            venues_.deactivate(admin, vc.id);
        }
        gateways_[vc.id] = std::move(gw);
    }

    for (const auto& mc : config_.markets) {
        Timestamp observed_at = config_.start_time >= mc.oracle_age_s
                                    ? config_.start_time - mc.oracle_age_s : 0;
        auto feed = std::make_shared<StaticPriceFeed>(
            mc.id + "/oracle", PriceObservation{.price = mc.oracle_price, .observed_at = observed_at});
        if (mc.bound) {
            oracles_.bind(admin, mc.id, feed);
        }
        feeds_[mc.id] = std::move(feed);
    }

    oracles_.set_deviation_tolerance(admin, config_.max_price_deviation_bps);
}

void RouteSimulator::run() {
    for (size_t i = 0; i < config_.requests.size(); ++i) {
        const auto& req = config_.requests[i];
        clock_.advance(req.advance_s);
        metrics_.record_request();
        outcomes_.push_back(execute(i, req));
    }
}

RequestOutcome RouteSimulator::execute(size_t index, const SimRequest& req) {
    RequestOutcome out;
    out.index = index;
    out.type = req.type;

    Timestamp deadline = deadline_for(req);

    try {
        switch (req.type) {
            case RequestType::Open:
                out.realized = router_.open_position(req.trader, OpenPositionRequest{
                    .market = req.market, .is_long = req.is_long, .margin = req.amount,
                    .leverage = req.leverage, .min_out = req.min_out, .deadline = deadline});
                break;
            case RequestType::Close:
                out.realized = router_.close_position(req.trader, ClosePositionRequest{
                    .market = req.market, .position_size = req.amount,
                    .min_out = req.min_out, .deadline = deadline});
                break;
            case RequestType::Increase:
                out.realized = router_.increase_position(req.trader, IncreasePositionRequest{
                    .market = req.market, .additional_margin = req.amount,
                    .leverage = req.leverage, .min_out = req.min_out, .deadline = deadline});
                break;
            case RequestType::Reduce:
                out.realized = router_.reduce_position(req.trader, ReducePositionRequest{
                    .market = req.market, .size_to_reduce = req.amount,
                    .min_out = req.min_out, .deadline = deadline});
                break;
        }
        out.ok = true;
    } catch (const RouterError& e) {
        out.ok = false;
        out.error = e.code();
        out.message = e.what();
        metrics_.record_rejection(e);
        std::cerr << "[simulator] request " << index << " (" << to_string(req.type)
                  << ") rejected: " << e.what() << "\n";
    }

    return out;
}

Timestamp RouteSimulator::deadline_for(const SimRequest& req) const {
    int64_t deadline = static_cast<int64_t>(clock_.now()) + req.deadline_s;
    return deadline > 0 ? static_cast<Timestamp>(deadline) : 0;
}

std::shared_ptr<SimVenueGateway> RouteSimulator::venue(const VenueId& id) const {
    auto it = gateways_.find(id);
    return it != gateways_.end() ? it->second : nullptr;
}

bool RouteSimulator::write_report(const std::string& report_path) const {
    std::ofstream f(report_path);
    if (!f.is_open()) {
        std::cerr << "[simulator] cannot open report file: " << report_path << "\n";
        return false;
    }
    f << metrics_.generate_report();
    return f.good();
}

bool RouteSimulator::write_csv(const std::string& csv_path) const {
    return metrics_.write_csv(csv_path);
}

} // namespace perpx
