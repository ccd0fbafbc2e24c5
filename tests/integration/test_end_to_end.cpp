#include <gtest/gtest.h>
#include "execution/sim_venue_gateway.hpp"
#include "oracle/oracle_registry.hpp"
#include "registry/venue_registry.hpp"
#include "router/perp_router.hpp"
#include "test_support.hpp"

#include <atomic>
#include <thread>

using namespace perpx;
using perpx::test::error_of;

class EndToEndTest : public ::testing::Test {
protected:
    static constexpr Timestamp kNow = 1700000000;

    void SetUp() override {
        cheap = std::make_shared<SimVenueGateway>("Cheap", 10);
        pricey = std::make_shared<SimVenueGateway>("Pricey", 20);
        cheap->set_mark_price("ETH-USD", units(2000));
        pricey->set_mark_price("ETH-USD", units(2000));

        venues.register_venue("admin", "cheap", cheap, "Cheap", 50, 10);
        venues.register_venue("admin", "pricey", pricey, "Pricey", 50, 20);

        feed = std::make_shared<StaticPriceFeed>("ETH/USD",
            PriceObservation{.price = units(2000), .observed_at = kNow});
        oracles.bind("admin", "ETH-USD", feed);
    }

    OpenPositionRequest open_long(Amount margin = units(1000), uint32_t leverage = 10) const {
        return OpenPositionRequest{.market = "ETH-USD", .is_long = true, .margin = margin,
                                   .leverage = leverage, .min_out = 0, .deadline = kNow + 60};
    }

    ManualClock clock{kNow};
    EventLog events;
    VenueRegistry venues{"admin", events};
    OracleRegistry oracles{"admin", clock, events};
    PerpRouter router{"admin", venues, oracles, clock, events};

    std::shared_ptr<SimVenueGateway> cheap;
    std::shared_ptr<SimVenueGateway> pricey;
    std::shared_ptr<StaticPriceFeed> feed;
};

// --- open_position ---

TEST_F(EndToEndTest, OpenLongPicksLowerFeeVenue) {
    Amount size = router.open_position("alice", open_long());

    EXPECT_EQ(format_amount(size), "5");  // 1000 * 10 / 2000
    EXPECT_EQ(format_amount(cheap->position("alice", "ETH-USD").size), "5");
    EXPECT_TRUE(pricey->position("alice", "ETH-USD").size == 0);

    ASSERT_EQ(events.count<PositionOpened>(), 1u);
    const auto* e = std::get_if<PositionOpened>(&events.records().back().event);
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->user, "alice");
    EXPECT_EQ(e->venue, "cheap");
    EXPECT_TRUE(e->is_long);
    EXPECT_EQ(e->leverage, 10u);
    EXPECT_EQ(format_amount(e->margin), "1000");
    EXPECT_EQ(format_amount(e->executed_size), "5");
    EXPECT_EQ(format_amount(e->execution_price), "2000");
}

TEST_F(EndToEndTest, OpenShortPicksHighestEffectivePrice) {
    pricey->set_mark_price("ETH-USD", units(2010));  // 2010 - 4.02 beats 2000 - 2

    OpenPositionRequest req = open_long();
    req.is_long = false;
    router.open_position("bob", req);

    auto* e = std::get_if<PositionOpened>(&events.records().back().event);
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->venue, "pricey");
    EXPECT_FALSE(e->is_long);
}

TEST_F(EndToEndTest, ManipulatedQuoteFailsDeviationCheck) {
    cheap->set_mark_price("ETH-USD", units(3000));
    cheap->set_quote_price_override("ETH-USD", units(3000));
    pricey->set_mark_price("ETH-USD", units(3000));

    size_t before = events.size();
    EXPECT_EQ(error_of([&] { router.open_position("alice", open_long()); }),
              ErrorCode::PriceDeviationTooHigh);
    EXPECT_EQ(events.size(), before);
    EXPECT_EQ(cheap->execution_calls(), 0u);
    EXPECT_EQ(pricey->execution_calls(), 0u);
}

TEST_F(EndToEndTest, QuoteBeyondBpsScaleFailsDeviationCheck) {
    auto rogue = std::make_shared<SimVenueGateway>("Rogue", 0);
    rogue->set_mark_price("ETH-USD", units(2000));
    // Smallest diff whose product with 10000 no longer fits in 128 bits.
    rogue->set_quote_price_override("ETH-USD", units(2000) + kMaxAmount / kBpsDenominator + 1);
    venues.deactivate("admin", "cheap");
    venues.deactivate("admin", "pricey");
    venues.register_venue("admin", "rogue", rogue, "Rogue", 50, 0);

    EXPECT_EQ(error_of([&] { router.open_position("alice", open_long()); }),
              ErrorCode::PriceDeviationTooHigh);
    EXPECT_EQ(rogue->execution_calls(), 0u);
    EXPECT_EQ(events.count<PositionOpened>(), 0u);
}

TEST_F(EndToEndTest, OracleValidatesRawPriceNotFeeAdjusted) {
    // 4.9% fee pushes the effective price past 5%, the raw price is on the oracle.
    auto feeful = std::make_shared<SimVenueGateway>("Feeful", 490);
    feeful->set_mark_price("ETH-USD", units(2000));
    venues.deactivate("admin", "cheap");
    venues.deactivate("admin", "pricey");
    venues.register_venue("admin", "feeful", feeful, "Feeful", 50, 490);

    EXPECT_FALSE(error_of([&] { router.open_position("alice", open_long()); }).has_value());
}

TEST_F(EndToEndTest, ExpiredDeadlineFailsBeforeAnyVenueCall) {
    size_t before = events.size();

    OpenPositionRequest open = open_long();
    open.deadline = kNow - 1;
    EXPECT_EQ(error_of([&] { router.open_position("alice", open); }), ErrorCode::DeadlineExpired);

    EXPECT_EQ(error_of([&] {
        router.close_position("alice", {.market = "ETH-USD", .position_size = units(1),
                                        .min_out = 0, .deadline = kNow - 1});
    }), ErrorCode::DeadlineExpired);
    EXPECT_EQ(error_of([&] {
        router.increase_position("alice", {.market = "ETH-USD", .additional_margin = units(1),
                                           .leverage = 2, .min_out = 0, .deadline = kNow - 1});
    }), ErrorCode::DeadlineExpired);
    EXPECT_EQ(error_of([&] {
        router.reduce_position("alice", {.market = "ETH-USD", .size_to_reduce = units(1),
                                         .min_out = 0, .deadline = kNow - 1});
    }), ErrorCode::DeadlineExpired);

    EXPECT_EQ(events.size(), before);
    EXPECT_EQ(cheap->quote_calls() + pricey->quote_calls(), 0u);
    EXPECT_EQ(cheap->execution_calls() + pricey->execution_calls(), 0u);
}

TEST_F(EndToEndTest, DeadlineEqualToNowIsAccepted) {
    OpenPositionRequest req = open_long();
    req.deadline = kNow;
    EXPECT_FALSE(error_of([&] { router.open_position("alice", req); }).has_value());
}

TEST_F(EndToEndTest, AllVenuesDeactivated) {
    venues.deactivate("admin", "cheap");
    venues.deactivate("admin", "pricey");
    EXPECT_EQ(error_of([&] { router.open_position("alice", open_long()); }),
              ErrorCode::NoActiveVenues);
}

TEST_F(EndToEndTest, LeverageFilterSkipsIneligibleVenue) {
    auto capped = std::make_shared<SimVenueGateway>("Capped", 0);
    capped->set_mark_price("ETH-USD", units(1990));
    venues.deactivate("admin", "cheap");
    venues.register_venue("admin", "capped", capped, "Capped", 5, 0);

    Amount size = router.open_position("alice", open_long(units(1000), 20));
    EXPECT_TRUE(size > 0);

    auto* e = std::get_if<PositionOpened>(&events.records().back().event);
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->venue, "pricey");
    EXPECT_EQ(capped->quote_calls(), 0u);
}

TEST_F(EndToEndTest, QuoteFailureFallsBackToNextVenue) {
    cheap->set_fail_quotes(true);
    router.open_position("alice", open_long());
    auto* e = std::get_if<PositionOpened>(&events.records().back().event);
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->venue, "pricey");
}

TEST_F(EndToEndTest, AllQuotesFailing) {
    cheap->set_fail_quotes(true);
    pricey->set_fail_quotes(true);
    EXPECT_EQ(error_of([&] { router.open_position("alice", open_long()); }),
              ErrorCode::NoActiveVenues);
}

TEST_F(EndToEndTest, InputValidation) {
    OpenPositionRequest req = open_long();

    req.market = "";
    EXPECT_EQ(error_of([&] { router.open_position("alice", req); }), ErrorCode::InvalidMarket);

    req = open_long(0, 10);
    EXPECT_EQ(error_of([&] { router.open_position("alice", req); }), ErrorCode::InvalidMargin);

    req = open_long(units(1), 0);
    EXPECT_EQ(error_of([&] { router.open_position("alice", req); }), ErrorCode::InvalidLeverage);

    EXPECT_EQ(error_of([&] {
        router.close_position("alice", {.market = "ETH-USD", .position_size = 0,
                                        .min_out = 0, .deadline = kNow});
    }), ErrorCode::InvalidPositionSize);
    EXPECT_EQ(error_of([&] {
        router.reduce_position("alice", {.market = "ETH-USD", .size_to_reduce = 0,
                                         .min_out = 0, .deadline = kNow});
    }), ErrorCode::InvalidPositionSize);
    EXPECT_EQ(error_of([&] {
        router.increase_position("alice", {.market = "ETH-USD", .additional_margin = 0,
                                           .leverage = 2, .min_out = 0, .deadline = kNow});
    }), ErrorCode::InvalidMargin);
    EXPECT_EQ(error_of([&] {
        router.increase_position("alice", {.market = "ETH-USD", .additional_margin = units(1),
                                           .leverage = 0, .min_out = 0, .deadline = kNow});
    }), ErrorCode::InvalidLeverage);
}

TEST_F(EndToEndTest, StaleOracleBlocksOpen) {
    clock.set(kNow + kMaxPriceAge + 1);
    OpenPositionRequest req = open_long();
    req.deadline = clock.now() + 60;
    EXPECT_EQ(error_of([&] { router.open_position("alice", req); }), ErrorCode::StalePrice);
    EXPECT_EQ(cheap->execution_calls(), 0u);
}

TEST_F(EndToEndTest, UnboundMarketBlocksOpen) {
    cheap->set_mark_price("BTC-USD", units(40000));
    OpenPositionRequest req = open_long();
    req.market = "BTC-USD";
    EXPECT_EQ(error_of([&] { router.open_position("alice", req); }), ErrorCode::OracleNotSet);
    EXPECT_EQ(cheap->execution_calls(), 0u);
}

TEST_F(EndToEndTest, ExecutionFailureIsWrapped) {
    cheap->set_fail_execution(true);
    EXPECT_EQ(error_of([&] { router.open_position("alice", open_long()); }),
              ErrorCode::VenueCallFailed);
    EXPECT_EQ(events.count<PositionOpened>(), 0u);
}

// --- slippage ---

TEST_F(EndToEndTest, OpenSlippageUnwindsAndRaises) {
    cheap->set_fill_ratio_bps(9000);  // delivers 4.5 instead of 5

    OpenPositionRequest req = open_long();
    req.min_out = units(5);

    try {
        router.open_position("alice", req);
        FAIL() << "expected SlippageError";
    } catch (const SlippageError& e) {
        EXPECT_EQ(e.code(), ErrorCode::SlippageExceeded);
        EXPECT_EQ(e.kind(), ErrorKind::Economic);
        EXPECT_EQ(format_amount(e.realized()), "4.5");
        EXPECT_TRUE(e.compensated());
    }

    EXPECT_TRUE(cheap->position("alice", "ETH-USD").size == 0);
    EXPECT_EQ(events.count<PositionOpened>(), 0u);
}

TEST_F(EndToEndTest, OpenSlippageWithoutCompensation) {
    PerpRouter plain("admin", venues, oracles, clock, events,
                     std::make_shared<FirstActiveLocator>(),
                     RouterOptions{.compensate_on_slippage = false});
    cheap->set_fill_ratio_bps(9000);

    OpenPositionRequest req = open_long();
    req.min_out = units(5);

    try {
        plain.open_position("alice", req);
        FAIL() << "expected SlippageError";
    } catch (const SlippageError& e) {
        EXPECT_FALSE(e.compensated());
    }
    EXPECT_EQ(format_amount(cheap->position("alice", "ETH-USD").size), "4.5");
}

TEST_F(EndToEndTest, MinOutEqualToRealizedPasses) {
    OpenPositionRequest req = open_long();
    req.min_out = units(5);
    EXPECT_EQ(format_amount(router.open_position("alice", req)), "5");
}

// --- close / increase / reduce ---

TEST_F(EndToEndTest, PositionLifecycleOnFirstActiveVenue) {
    router.open_position("alice", open_long());

    Amount added = router.increase_position("alice", {.market = "ETH-USD",
        .additional_margin = units(200), .leverage = 10, .min_out = units(1), .deadline = kNow + 60});
    EXPECT_EQ(format_amount(added), "1");

    Amount reduced = router.reduce_position("alice", {.market = "ETH-USD",
        .size_to_reduce = units(2), .min_out = units(4000), .deadline = kNow + 60});
    EXPECT_EQ(format_amount(reduced), "4000");

    Amount payout = router.close_position("alice", {.market = "ETH-USD",
        .position_size = units(4), .min_out = 0, .deadline = kNow + 60});
    EXPECT_EQ(format_amount(payout), "8000");

    EXPECT_EQ(events.count<PositionIncreased>(), 1u);
    EXPECT_EQ(events.count<PositionReduced>(), 1u);
    EXPECT_EQ(events.count<PositionClosed>(), 1u);

    auto* closed = std::get_if<PositionClosed>(&events.records().back().event);
    ASSERT_NE(closed, nullptr);
    EXPECT_EQ(closed->venue, "cheap");
    EXPECT_EQ(format_amount(closed->position_size), "4");
}

TEST_F(EndToEndTest, CloseTargetsFirstActiveEvenIfPositionIsElsewhere) {
    cheap->set_fail_quotes(true);
    router.open_position("alice", open_long());  // lands on "pricey"
    cheap->set_fail_quotes(false);

    // First active venue is "cheap", which holds nothing for alice.
    EXPECT_EQ(error_of([&] {
        router.close_position("alice", {.market = "ETH-USD", .position_size = units(1),
                                        .min_out = 0, .deadline = kNow + 60});
    }), ErrorCode::VenueCallFailed);
    EXPECT_EQ(cheap->execution_calls(), 1u);
}

TEST_F(EndToEndTest, CloseSlippageIsNotCompensated) {
    router.open_position("alice", open_long());
    try {
        router.close_position("alice", {.market = "ETH-USD", .position_size = units(5),
                                        .min_out = units(20000), .deadline = kNow + 60});
        FAIL() << "expected SlippageError";
    } catch (const SlippageError& e) {
        EXPECT_FALSE(e.compensated());
        EXPECT_EQ(format_amount(e.realized()), "10000");
    }
    EXPECT_EQ(events.count<PositionClosed>(), 0u);
}

TEST_F(EndToEndTest, CustomLocatorIsUsed) {
    struct LastActiveLocator : IPositionLocator {
        ActiveVenue locate(const Principal&, const MarketId&,
                           const std::vector<ActiveVenue>& active) const override {
            if (active.empty()) throw RouterError(ErrorCode::NoActiveVenues, "none");
            return active.back();
        }
    };

    PerpRouter custom("admin", venues, oracles, clock, events, std::make_shared<LastActiveLocator>());
    cheap->set_fail_quotes(true);
    custom.open_position("alice", open_long());  // on "pricey"

    Amount payout = custom.close_position("alice", {.market = "ETH-USD",
        .position_size = units(5), .min_out = 0, .deadline = kNow + 60});
    EXPECT_EQ(format_amount(payout), "10000");
}

TEST_F(EndToEndTest, ModifyWithNoActiveVenues) {
    venues.deactivate("admin", "cheap");
    venues.deactivate("admin", "pricey");
    EXPECT_EQ(error_of([&] {
        router.reduce_position("alice", {.market = "ETH-USD", .size_to_reduce = units(1),
                                         .min_out = 0, .deadline = kNow + 60});
    }), ErrorCode::NoActiveVenues);
}

// --- administration ---

TEST_F(EndToEndTest, PauseGatesEveryEntryPoint) {
    EXPECT_EQ(error_of([&] { router.pause("mallory"); }), ErrorCode::Unauthorized);

    router.pause("admin");
    EXPECT_TRUE(router.paused());
    EXPECT_EQ(error_of([&] { router.open_position("alice", open_long()); }), ErrorCode::Paused);
    EXPECT_EQ(error_of([&] {
        router.close_position("alice", {.market = "ETH-USD", .position_size = units(1),
                                        .min_out = 0, .deadline = kNow + 60});
    }), ErrorCode::Paused);
    EXPECT_EQ(error_of([&] {
        router.increase_position("alice", {.market = "ETH-USD", .additional_margin = units(1),
                                           .leverage = 2, .min_out = 0, .deadline = kNow + 60});
    }), ErrorCode::Paused);
    EXPECT_EQ(error_of([&] {
        router.reduce_position("alice", {.market = "ETH-USD", .size_to_reduce = units(1),
                                         .min_out = 0, .deadline = kNow + 60});
    }), ErrorCode::Paused);

    router.unpause("admin");
    EXPECT_FALSE(router.paused());
    EXPECT_FALSE(error_of([&] { router.open_position("alice", open_long()); }).has_value());
    EXPECT_EQ(events.count<RouterPaused>(), 1u);
    EXPECT_EQ(events.count<RouterUnpaused>(), 1u);
}

TEST_F(EndToEndTest, OwnershipTransfer) {
    EXPECT_EQ(error_of([&] { router.transfer_ownership("admin", ""); }), ErrorCode::InvalidOwner);
    EXPECT_EQ(error_of([&] { router.transfer_ownership("mallory", "mallory"); }),
              ErrorCode::Unauthorized);

    router.transfer_ownership("admin", "ops");
    EXPECT_EQ(router.owner(), "ops");
    EXPECT_EQ(error_of([&] { router.pause("admin"); }), ErrorCode::Unauthorized);
    router.pause("ops");
    EXPECT_TRUE(router.paused());
    EXPECT_EQ(events.count<OwnershipTransferred>(), 1u);
}

TEST_F(EndToEndTest, BestVenuePreviewHasNoSideEffects) {
    auto sel = router.best_venue({.market = "ETH-USD", .is_long = true,
                                  .margin = units(1000), .leverage = 10});
    EXPECT_EQ(sel.venue.id, "cheap");
    EXPECT_EQ(format_amount(sel.effective_price), "2002");
    EXPECT_EQ(cheap->execution_calls(), 0u);
    EXPECT_EQ(events.count<PositionOpened>(), 0u);
}

namespace {

// Venue whose quote takes long enough for the deadline to pass.
class SlowQuoteGateway : public SimVenueGateway {
public:
    SlowQuoteGateway(ManualClock& clock, Timestamp delay)
        : SimVenueGateway("Slow", 0), clock_(clock), delay_(delay) {}

    VenueQuote get_quote(const MarketId& market, bool is_long,
                         Amount margin, uint32_t leverage) override {
        clock_.advance(delay_);
        return SimVenueGateway::get_quote(market, is_long, margin, leverage);
    }

private:
    ManualClock& clock_;
    Timestamp    delay_;
};

} // namespace

TEST_F(EndToEndTest, DeadlinePassingDuringQuoteFanOut) {
    VenueRegistry ordered("admin", events);
    auto slow = std::make_shared<SlowQuoteGateway>(clock, 120);
    slow->set_mark_price("ETH-USD", units(2000));
    ordered.register_venue("admin", "slow", slow, "Slow", 50, 0);
    ordered.register_venue("admin", "pricey", pricey, "Pricey", 50, 20);
    PerpRouter slow_router("admin", ordered, oracles, clock, events);

    EXPECT_EQ(error_of([&] { slow_router.open_position("alice", open_long()); }),
              ErrorCode::DeadlineExpired);
    EXPECT_EQ(slow->quote_calls(), 1u);
    EXPECT_EQ(pricey->quote_calls(), 0u);
    EXPECT_EQ(slow->execution_calls() + pricey->execution_calls(), 0u);
}

// --- reentrancy and concurrency ---

namespace {

// Venue that calls back into the router from inside open_position.
class ReentrantGateway : public SimVenueGateway {
public:
    ReentrantGateway() : SimVenueGateway("Reentrant", 0) {}

    Amount open_position(const Principal& trader, const MarketId& market,
                         bool is_long, Amount margin, uint32_t leverage) override {
        if (router && !reentered) {
            reentered = true;
            try {
                router->open_position(reenter_as, OpenPositionRequest{
                    .market = market, .is_long = is_long, .margin = margin,
                    .leverage = leverage, .min_out = 0, .deadline = deadline});
                inner_error.reset();
            } catch (const RouterError& e) {
                inner_error = e.code();
            }
        }
        return SimVenueGateway::open_position(trader, market, is_long, margin, leverage);
    }

    PerpRouter* router = nullptr;
    Principal reenter_as;
    Timestamp deadline = 0;
    bool reentered = false;
    std::optional<ErrorCode> inner_error;
};

} // namespace

TEST_F(EndToEndTest, SameCallerReentryIsRejected) {
    auto evil = std::make_shared<ReentrantGateway>();
    evil->set_mark_price("ETH-USD", units(2000));
    venues.deactivate("admin", "cheap");
    venues.deactivate("admin", "pricey");
    venues.register_venue("admin", "evil", evil, "Evil", 50, 0);

    evil->router = &router;
    evil->reenter_as = "alice";
    evil->deadline = kNow + 60;

    EXPECT_FALSE(error_of([&] { router.open_position("alice", open_long()); }).has_value());
    ASSERT_TRUE(evil->inner_error.has_value());
    EXPECT_EQ(*evil->inner_error, ErrorCode::ReentrantCall);
    EXPECT_EQ(events.count<PositionOpened>(), 1u);

    // Guard released after the outer call.
    evil->reentered = true;
    EXPECT_FALSE(error_of([&] { router.open_position("alice", open_long()); }).has_value());
}

TEST_F(EndToEndTest, OtherCallerMayEnterDuringCall) {
    auto relay = std::make_shared<ReentrantGateway>();
    relay->set_mark_price("ETH-USD", units(2000));
    venues.deactivate("admin", "cheap");
    venues.deactivate("admin", "pricey");
    venues.register_venue("admin", "relay", relay, "Relay", 50, 0);

    relay->router = &router;
    relay->reenter_as = "bob";
    relay->deadline = kNow + 60;

    router.open_position("alice", open_long());
    EXPECT_FALSE(relay->inner_error.has_value());
    EXPECT_EQ(events.count<PositionOpened>(), 2u);
}

TEST_F(EndToEndTest, GuardReleasedAfterFailure) {
    cheap->set_fail_execution(true);
    EXPECT_EQ(error_of([&] { router.open_position("alice", open_long()); }),
              ErrorCode::VenueCallFailed);
    cheap->set_fail_execution(false);
    EXPECT_FALSE(error_of([&] { router.open_position("alice", open_long()); }).has_value());
}

TEST_F(EndToEndTest, ConcurrentTradersAndAdministration) {
    constexpr int kTraders = 8;
    constexpr int kTradesEach = 20;

    std::vector<std::thread> threads;
    std::atomic<int> failures{0};

    for (int t = 0; t < kTraders; ++t) {
        threads.emplace_back([&, t] {
            Principal trader = "trader" + std::to_string(t);
            for (int i = 0; i < kTradesEach; ++i) {
                try {
                    router.open_position(trader, open_long(units(10), 5));
                } catch (const RouterError& e) {
                    if (e.code() != ErrorCode::NoActiveVenues) failures++;
                }
            }
        });
    }

    // Toggle one venue while trades are in flight.
    threads.emplace_back([&] {
        for (int i = 0; i < 50; ++i) {
            venues.set_status("admin", "cheap", i % 2 != 0);
        }
        venues.set_status("admin", "cheap", true);
    });

    for (auto& th : threads) th.join();

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(events.count<PositionOpened>(), static_cast<size_t>(kTraders * kTradesEach));
}
