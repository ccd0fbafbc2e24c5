#include <gtest/gtest.h>
#include "config/simulation_config.hpp"

#include <cstdio>
#include <fstream>

using namespace perpx;

TEST(ConfigLoaderTest, ParsesFullConfig) {
    auto config = parse_simulation_config(R"({
        "owner": "ops",
        "max_price_deviation_bps": 250,
        "start_time": 1000,
        "compensate_on_slippage": false,
        "venues": [
            { "id": "a", "name": "Alpha", "max_leverage": 20, "fee_rate_bps": 15,
              "fail_quotes": true, "fill_ratio_bps": 9500,
              "prices": { "ETH-USD": "2000.5" }, "quote_overrides": { "ETH-USD": 3000 } }
        ],
        "markets": [ { "id": "ETH-USD", "oracle_price": "2000", "oracle_age_s": 30, "bound": false } ],
        "requests": [
            { "type": "reduce", "trader": "alice", "market": "ETH-USD", "amount": "1.5",
              "min_out": "100", "deadline_s": -5, "advance_s": 7 }
        ]
    })");

    EXPECT_EQ(config.owner, "ops");
    EXPECT_EQ(config.max_price_deviation_bps, 250u);
    EXPECT_EQ(config.start_time, 1000u);
    EXPECT_FALSE(config.compensate_on_slippage);

    ASSERT_EQ(config.venues.size(), 1u);
    const auto& v = config.venues[0];
    EXPECT_EQ(v.id, "a");
    EXPECT_EQ(v.name, "Alpha");
    EXPECT_EQ(v.max_leverage, 20u);
    EXPECT_EQ(v.fee_rate_bps, 15u);
    EXPECT_TRUE(v.fail_quotes);
    EXPECT_FALSE(v.fail_execution);
    EXPECT_EQ(v.fill_ratio_bps, 9500u);
    EXPECT_EQ(format_amount(v.mark_prices.at("ETH-USD")), "2000.5");
    EXPECT_EQ(format_amount(v.quote_overrides.at("ETH-USD")), "3000");

    ASSERT_EQ(config.markets.size(), 1u);
    EXPECT_EQ(format_amount(config.markets[0].oracle_price), "2000");
    EXPECT_EQ(config.markets[0].oracle_age_s, 30u);
    EXPECT_FALSE(config.markets[0].bound);

    ASSERT_EQ(config.requests.size(), 1u);
    const auto& r = config.requests[0];
    EXPECT_EQ(r.type, RequestType::Reduce);
    EXPECT_EQ(r.trader, "alice");
    EXPECT_EQ(format_amount(r.amount), "1.5");
    EXPECT_EQ(format_amount(r.min_out), "100");
    EXPECT_EQ(r.deadline_s, -5);
    EXPECT_EQ(r.advance_s, 7u);
}

TEST(ConfigLoaderTest, DefaultsApply) {
    auto config = parse_simulation_config(R"({ "venues": [ { "id": "a" } ],
                                               "requests": [ { "market": "ETH-USD" } ] })");
    EXPECT_EQ(config.owner, "admin");
    EXPECT_EQ(config.max_price_deviation_bps, 500u);
    EXPECT_TRUE(config.compensate_on_slippage);
    EXPECT_EQ(config.venues[0].name, "a");
    EXPECT_TRUE(config.venues[0].active);
    EXPECT_EQ(config.requests[0].type, RequestType::Open);
    EXPECT_TRUE(config.requests[0].is_long);
    EXPECT_EQ(config.requests[0].deadline_s, 300);
}

TEST(ConfigLoaderTest, RejectsMalformedInput) {
    EXPECT_THROW(parse_simulation_config("{ \"venues\": [ }"), ConfigError);
    EXPECT_THROW(parse_simulation_config("[]"), ConfigError);
    EXPECT_THROW(parse_simulation_config("{} trailing"), ConfigError);
    EXPECT_THROW(parse_simulation_config(R"({ "venues": [ { "name": "no id" } ] })"), ConfigError);
    EXPECT_THROW(parse_simulation_config(R"({ "requests": [ { "type": "swap" } ] })"), ConfigError);
    EXPECT_THROW(parse_simulation_config(R"({ "markets": [ { "id": "m", "oracle_price": "abc" } ] })"),
                 ConfigError);
}

TEST(ConfigLoaderTest, RejectsOutOfRangeNumbers) {
    const char* bad[] = {
        R"({ "venues": [ { "id": "v", "max_leverage": -1 } ] })",
        R"({ "venues": [ { "id": "v", "fee_rate_bps": 1e12 } ] })",
        R"({ "venues": [ { "id": "v", "fee_rate_bps": 10001 } ] })",
        R"({ "venues": [ { "id": "v", "fill_ratio_bps": 2.5 } ] })",
        R"({ "requests": [ { "market": "m", "leverage": -5 } ] })",
        R"({ "requests": [ { "market": "m", "leverage": 4294967296 } ] })",
        R"({ "requests": [ { "market": "m", "advance_s": -1 } ] })",
        R"({ "requests": [ { "market": "m", "deadline_s": 1e300 } ] })",
        R"({ "markets": [ { "id": "m", "oracle_age_s": -30 } ] })",
        R"({ "start_time": -1 })",
        R"({ "max_price_deviation_bps": "500" })",
    };
    for (const char* text : bad) {
        EXPECT_THROW(parse_simulation_config(text), ConfigError) << text;
    }
}

TEST(ConfigLoaderTest, ErrorNamesOffendingField) {
    try {
        parse_simulation_config(R"({ "requests": [ { "market": "m", "leverage": -5 } ] })");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("requests[0].leverage"), std::string::npos);
    }
}

TEST(ConfigLoaderTest, AcceptsBoundaryValues) {
    auto config = parse_simulation_config(R"({
        "venues": [ { "id": "v", "max_leverage": 4294967295, "fee_rate_bps": 10000,
                      "fill_ratio_bps": 0 } ],
        "requests": [ { "market": "m", "leverage": 0, "deadline_s": -300 } ]
    })");
    EXPECT_EQ(config.venues[0].max_leverage, 4294967295u);
    EXPECT_EQ(config.venues[0].fee_rate_bps, 10000u);
    EXPECT_EQ(config.venues[0].fill_ratio_bps, 0u);
    EXPECT_EQ(config.requests[0].deadline_s, -300);
}

TEST(ConfigLoaderTest, LoadsFromFile) {
    std::string path = ::testing::TempDir() + "perpx_config_test.json";
    {
        std::ofstream f(path);
        f << R"({ "owner": "file-owner", "markets": [ { "id": "BTC-USD", "oracle_price": "40000" } ] })";
    }
    auto config = load_simulation_config(path);
    EXPECT_EQ(config.owner, "file-owner");
    ASSERT_EQ(config.markets.size(), 1u);
    EXPECT_EQ(config.markets[0].id, "BTC-USD");
    std::remove(path.c_str());
}

TEST(ConfigLoaderTest, MissingFileThrows) {
    EXPECT_THROW(load_simulation_config("/nonexistent/perpx.json"), ConfigError);
}
