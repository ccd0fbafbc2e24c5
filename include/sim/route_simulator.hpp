#pragma once

#include "config/simulation_config.hpp"
#include "execution/sim_venue_gateway.hpp"
#include "router/perp_router.hpp"
#include "sim/routing_metrics.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace perpx {

struct RequestOutcome {
    size_t      index    = 0;
    RequestType type     = RequestType::Open;
    bool        ok       = false;
    Amount      realized = 0;
    ErrorCode   error    = ErrorCode::VenueCallFailed;  // valid when !ok
    std::string message;
};

// Wires registries, simulated venues, static feeds and the router from a
// SimulationConfig and replays its requests in order.
class RouteSimulator {
public:
    explicit RouteSimulator(const SimulationConfig& config);

    void run();

    const RoutingMetrics& metrics() const { return metrics_; }
    const std::vector<RequestOutcome>& outcomes() const { return outcomes_; }
    const EventLog& events() const { return events_; }
    std::shared_ptr<SimVenueGateway> venue(const VenueId& id) const;

    // Return false (and log) when the file cannot be written.
    bool write_report(const std::string& report_path) const;
    bool write_csv(const std::string& csv_path) const;

private:
    void setup();
    RequestOutcome execute(size_t index, const SimRequest& req);
    Timestamp deadline_for(const SimRequest& req) const;

    SimulationConfig config_;
    ManualClock      clock_;
    EventLog         events_;
    VenueRegistry    venues_;
    OracleRegistry   oracles_;
    PerpRouter       router_;
    RoutingMetrics   metrics_;

    std::unordered_map<VenueId, std::shared_ptr<SimVenueGateway>>   gateways_;
    std::unordered_map<MarketId, std::shared_ptr<StaticPriceFeed>>  feeds_;
    std::vector<RequestOutcome> outcomes_;
};

} // namespace perpx
