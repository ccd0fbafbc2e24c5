#pragma once

#include "config/simulation_config.hpp"
#include "core/errors.hpp"
#include "router/events.hpp"

#include <map>
#include <string>
#include <vector>

namespace perpx {

struct ExecutionMetric {
    uint64_t    sequence = 0;
    RequestType type     = RequestType::Open;
    Principal   trader;
    MarketId    market;
    VenueId     venue;
    Amount      amount   = 0;   // margin or size submitted
    Amount      realized = 0;   // executed size or payout
    Amount      price    = 0;   // execution price for opens, 0 otherwise
};

struct VenueMetrics {
    VenueId  venue;
    uint64_t opens      = 0;
    uint64_t closes     = 0;
    uint64_t increases  = 0;
    uint64_t reduces    = 0;
    double   notional   = 0.0;  // margin * leverage routed through opens/increases
};

struct GlobalRoutingMetrics {
    uint64_t requests    = 0;
    uint64_t executions  = 0;
    uint64_t rejections  = 0;
    double   notional    = 0.0;
};

class RoutingMetrics {
public:
    void record_request();
    void record_event(uint64_t sequence, const Event& event);
    void record_rejection(const RouterError& error);

    VenueMetrics venue_metrics(const VenueId& venue) const;
    GlobalRoutingMetrics global_metrics() const;
    uint64_t rejections(ErrorCode code) const;
    const std::vector<ExecutionMetric>& executions() const { return executions_; }

    bool write_csv(const std::string& filename) const;
    std::string generate_report() const;

private:
    std::vector<ExecutionMetric>  executions_;
    std::map<VenueId, VenueMetrics> venues_;
    std::map<ErrorCode, uint64_t> rejections_;
    uint64_t requests_ = 0;
};

} // namespace perpx
