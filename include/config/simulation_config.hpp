#pragma once

#include "config/venue_config.hpp"
#include "core/fixed_point.hpp"

#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace perpx {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

struct SimVenueConfig {
    VenueId      id;
    std::string  name;
    uint32_t     max_leverage   = 0;
    uint32_t     fee_rate_bps   = 0;
    bool         active         = true;
    bool         fail_quotes    = false;
    bool         fail_execution = false;
    uint32_t     fill_ratio_bps = 10000;
    std::unordered_map<MarketId, Amount> mark_prices;
    std::unordered_map<MarketId, Amount> quote_overrides;
};

struct SimMarketConfig {
    MarketId  id;
    Amount    oracle_price = 0;
    Timestamp oracle_age_s = 0;   // observation age at simulation start
    bool      bound        = true;
};

enum class RequestType { Open, Close, Increase, Reduce };

struct SimRequest {
    RequestType type       = RequestType::Open;
    Principal   trader;
    MarketId    market;
    bool        is_long    = true;
    Amount      amount     = 0;    // margin for open/increase, size for close/reduce
    uint32_t    leverage   = 0;
    Amount      min_out    = 0;
    int64_t     deadline_s = 300;  // relative to the request time, may be negative
    Timestamp   advance_s  = 0;    // clock advance before the request
};

struct SimulationConfig {
    Principal owner                   = "admin";
    uint32_t  max_price_deviation_bps = 500;
    Timestamp start_time              = 1700000000;
    bool      compensate_on_slippage  = true;
    std::vector<SimVenueConfig>  venues;
    std::vector<SimMarketConfig> markets;
    std::vector<SimRequest>      requests;
};

const char* to_string(RequestType type);

// Throws ConfigError on unreadable or malformed input.
SimulationConfig load_simulation_config(const std::string& path);
SimulationConfig parse_simulation_config(const std::string& json_text);

} // namespace perpx
