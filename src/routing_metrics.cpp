#include "sim/routing_metrics.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace perpx {

void RoutingMetrics::record_request() {
    requests_++;
}

void RoutingMetrics::record_event(uint64_t sequence, const Event& event) {
    ExecutionMetric m;
    m.sequence = sequence;

    if (const auto* e = std::get_if<PositionOpened>(&event)) {
        m.type = RequestType::Open;
        m.trader = e->user; m.market = e->market; m.venue = e->venue;
        m.amount = e->margin; m.realized = e->executed_size; m.price = e->execution_price;
        auto& vm = venues_[e->venue];
        vm.venue = e->venue;
        vm.opens++;
        vm.notional += to_double(e->margin) * e->leverage;
    } else if (const auto* e = std::get_if<PositionClosed>(&event)) {
        m.type = RequestType::Close;
        m.trader = e->user; m.market = e->market; m.venue = e->venue;
        m.amount = e->position_size; m.realized = e->payout;
        auto& vm = venues_[e->venue];
        vm.venue = e->venue;
        vm.closes++;
    } else if (const auto* e = std::get_if<PositionIncreased>(&event)) {
        m.type = RequestType::Increase;
        m.trader = e->user; m.market = e->market; m.venue = e->venue;
        m.amount = e->additional_margin; m.realized = e->additional_size;
        auto& vm = venues_[e->venue];
        vm.venue = e->venue;
        vm.increases++;
        vm.notional += to_double(e->additional_margin) * e->leverage;
    } else if (const auto* e = std::get_if<PositionReduced>(&event)) {
        m.type = RequestType::Reduce;
        m.trader = e->user; m.market = e->market; m.venue = e->venue;
        m.amount = e->size_reduced; m.realized = e->payout;
        auto& vm = venues_[e->venue];
        vm.venue = e->venue;
        vm.reduces++;
    } else {
        return; // administrative events are not executions
    }

    executions_.push_back(std::move(m));
}

void RoutingMetrics::record_rejection(const RouterError& error) {
    rejections_[error.code()]++;
}

VenueMetrics RoutingMetrics::venue_metrics(const VenueId& venue) const {
    auto it = venues_.find(venue);
    if (it != venues_.end()) return it->second;
    VenueMetrics empty;
    empty.venue = venue;
    return empty;
}

GlobalRoutingMetrics RoutingMetrics::global_metrics() const {
    GlobalRoutingMetrics g;
    g.requests = requests_;
    g.executions = executions_.size();
    for (const auto& [code, n] : rejections_) g.rejections += n;
    for (const auto& [id, vm] : venues_) g.notional += vm.notional;
    return g;
}

uint64_t RoutingMetrics::rejections(ErrorCode code) const {
    auto it = rejections_.find(code);
    return it != rejections_.end() ? it->second : 0;
}

bool RoutingMetrics::write_csv(const std::string& filename) const {
    std::ofstream f(filename);
    if (!f.is_open()) {
        std::cerr << "[metrics] cannot open csv file: " << filename << "\n";
        return false;
    }
    f << "sequence,type,trader,market,venue,amount,realized,price\n";

    for (const auto& m : executions_) {
        f << m.sequence << ","
          << to_string(m.type) << ","
          << m.trader << ","
          << m.market << ","
          << m.venue << ","
          << format_amount(m.amount) << ","
          << format_amount(m.realized) << ","
          << format_amount(m.price) << "\n";
    }
    return f.good();
}

std::string RoutingMetrics::generate_report() const {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(4);

    ss << "# Perp Routing Report\n\n";

    auto g = global_metrics();
    ss << "## Global Metrics\n\n";
    ss << "| Metric | Value |\n";
    ss << "|--------|-------|\n";
    ss << "| Requests | " << g.requests << " |\n";
    ss << "| Executions | " << g.executions << " |\n";
    ss << "| Rejections | " << g.rejections << " |\n";
    ss << "| Notional Routed | " << g.notional << " |\n";
    ss << "\n";

    ss << "## Per-Venue Metrics\n\n";
    ss << "| Venue | Opens | Increases | Closes | Reduces | Notional |\n";
    ss << "|-------|-------|-----------|--------|---------|----------|\n";
    for (const auto& [id, vm] : venues_) {
        ss << "| " << id
           << " | " << vm.opens
           << " | " << vm.increases
           << " | " << vm.closes
           << " | " << vm.reduces
           << " | " << vm.notional
           << " |\n";
    }
    ss << "\n";

    ss << "## Rejections\n\n";
    ss << "| Error | Kind | Count |\n";
    ss << "|-------|------|-------|\n";
    for (const auto& [code, n] : rejections_) {
        ss << "| " << to_string(code) << " | " << to_string(kind_of(code)) << " | " << n << " |\n";
    }

    return ss.str();
}

} // namespace perpx
