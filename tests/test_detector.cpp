// Sniper Taker Engine - Opportunity Detector Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sniper/detector.hpp>
#include "fakes.hpp"
#include <set>

using namespace sniper;
using namespace sniper::testing;
using Catch::Approx;

namespace {

DetectorConfig detector_config() {
    DetectorConfig config;
    config.min_edge_threshold = 0.05;
    config.min_size_threshold = 100.0;
    config.position_size = 50.0;
    return config;
}

}  // namespace

TEST_CASE("Detector emits underpriced quotes", "[detector]") {
    ManualClock clock(42'000);
    Detector detector(detector_config(), clock);

    auto opp = detector.detect(make_quote("m1", OutcomeSide::Yes, 0.50, 1000.0, 41'000),
                               make_estimate("m1", 0.60));

    REQUIRE(opp.has_value());
    REQUIRE(opp->market_id == "m1");
    REQUIRE(opp->side == OutcomeSide::Yes);
    REQUIRE(opp->action == TradeAction::Buy);
    REQUIRE(opp->edge == Approx(0.10));
    REQUIRE(opp->signed_edge == Approx(-0.10));
    REQUIRE(opp->fair_value == Approx(0.60));
    REQUIRE(opp->available_size == Approx(1000.0));
    REQUIRE(opp->size == Approx(100.0));   // 50 capital / 0.50
    REQUIRE(opp->quote_timestamp == 41'000);
    REQUIRE(opp->detected_at == 42'000);
    REQUIRE(opp->expected_value() == Approx(10.0));
    REQUIRE(detector.emitted() == 1);
}

TEST_CASE("Detector requires the edge to cover gas", "[detector]") {
    ManualClock clock;
    ExecutionConfig execution;
    execution.gas_limit = 300000;
    execution.priority_fee_gwei = 30.0;
    execution.native_token_usd = 0.5;
    FakeFeeOracle oracle({50.0});
    GasPricer gas(execution, &oracle);

    // 300k gas at 80 gwei, native token at $0.50
    REQUIRE(gas.estimated_cost_usd() == Approx(0.012));

    // Quote 0.50 against fair 0.60: 100 shares, expected value 10
    auto quote = make_quote("m1", OutcomeSide::Yes, 0.50, 1000.0, 0);
    auto estimate = make_estimate("m1", 0.60);

    SECTION("Edge clears gas") {
        Detector detector(detector_config(), clock, &gas);
        REQUIRE(detector.detect(quote, estimate));
        REQUIRE(detector.unprofitable() == 0);
    }

    SECTION("Expensive gas rejects") {
        execution.native_token_usd = 1000.0;   // $24 per transaction
        GasPricer costly(execution, &oracle);
        Detector detector(detector_config(), clock, &costly);

        REQUIRE_FALSE(detector.detect(quote, estimate));
        REQUIRE(detector.unprofitable() == 1);
        REQUIRE(detector.emitted() == 0);
    }

    SECTION("Minimum profit on top of gas") {
        DetectorConfig config = detector_config();
        config.min_expected_profit = 10.0;
        Detector detector(config, clock, &gas);
        REQUIRE_FALSE(detector.detect(quote, estimate));

        config.min_expected_profit = 9.0;
        Detector lenient(config, clock, &gas);
        REQUIRE(lenient.detect(quote, estimate));
    }

    SECTION("Pair falls back to the side that pays") {
        execution.native_token_usd = 400.0;   // $9.60 per transaction
        GasPricer costly(execution, &oracle);
        Detector detector(detector_config(), clock, &costly);

        // YES: 100 x 0.10 = 10 clears; NO 0.47 vs 0.40: 106 x 0.07 = 7.4 does not
        auto no = make_quote("m1", OutcomeSide::No, 0.47, 1000.0, 0);
        auto opp = detector.detect_pair(quote, no, estimate);
        REQUIRE(opp.has_value());
        REQUIRE(opp->side == OutcomeSide::Yes);
        REQUIRE(detector.unprofitable() == 1);
    }
}

TEST_CASE("Detector thresholds", "[detector]") {
    ManualClock clock;
    Detector detector(detector_config(), clock);

    SECTION("Edge below threshold") {
        REQUIRE_FALSE(detector.detect(make_quote("m1", OutcomeSide::Yes, 0.57, 1000.0, 0),
                                      make_estimate("m1", 0.60)));
    }

    SECTION("Edge exactly at threshold") {
        REQUIRE(detector.detect(make_quote("m1", OutcomeSide::Yes, 0.50, 1000.0, 0),
                                make_estimate("m1", 0.55)));
    }

    SECTION("Size below minimum") {
        REQUIRE_FALSE(detector.detect(make_quote("m1", OutcomeSide::Yes, 0.50, 99.0, 0),
                                      make_estimate("m1", 0.60)));
    }

    SECTION("Nothing emitted") {
        (void)detector.detect(make_quote("m1", OutcomeSide::Yes, 0.59, 1000.0, 0),
                              make_estimate("m1", 0.60));
        REQUIRE(detector.emitted() == 0);
    }
}

TEST_CASE("Detector sides and actions", "[detector]") {
    ManualClock clock;
    Detector detector(detector_config(), clock);

    SECTION("NO side compares against one minus fair value") {
        auto opp = detector.detect(make_quote("m1", OutcomeSide::No, 0.25, 1000.0, 0),
                                   make_estimate("m1", 0.60));
        REQUIRE(opp.has_value());
        REQUIRE(opp->side == OutcomeSide::No);
        REQUIRE(opp->fair_value == Approx(0.40));
        REQUIRE(opp->edge == Approx(0.15));
        REQUIRE(opp->action == TradeAction::Buy);
    }

    SECTION("Overpriced quote is a sell") {
        auto opp = detector.detect(make_quote("m1", OutcomeSide::Yes, 0.80, 1000.0, 0),
                                   make_estimate("m1", 0.60));
        REQUIRE(opp.has_value());
        REQUIRE(opp->action == TradeAction::Sell);
        REQUIRE(opp->signed_edge == Approx(0.20));
    }

    SECTION("Available size caps the implied size") {
        auto opp = detector.detect(make_quote("m1", OutcomeSide::Yes, 0.10, 150.0, 0),
                                   make_estimate("m1", 0.60));
        REQUIRE(opp.has_value());
        REQUIRE(opp->size == Approx(150.0));
    }

    SECTION("Market mismatch") {
        REQUIRE_THROWS_AS(detector.detect(make_quote("m1", OutcomeSide::Yes, 0.5, 1000.0, 0),
                                          make_estimate("m2", 0.6)),
                          std::invalid_argument);
    }
}

TEST_CASE("Detector ids are unique", "[detector]") {
    ManualClock clock;
    Detector detector(detector_config(), clock);

    std::set<std::string> ids;
    for (int i = 0; i < 20; ++i) {
        auto opp = detector.detect(make_quote("m1", OutcomeSide::Yes, 0.50, 1000.0, i),
                                   make_estimate("m1", 0.60));
        REQUIRE(opp.has_value());
        ids.insert(opp->id);
    }
    REQUIRE(ids.size() == 20);
    REQUIRE(ids.count("m1-yes-1") == 1);
}

TEST_CASE("Detector picks one side per market", "[detector]") {
    ManualClock clock;
    Detector detector(detector_config(), clock);
    auto estimate = make_estimate("m1", 0.60);

    SECTION("Larger edge wins") {
        // YES edge 0.10, NO edge 0.05
        auto opp = detector.detect_pair(make_quote("m1", OutcomeSide::Yes, 0.50, 1000.0, 0),
                                        make_quote("m1", OutcomeSide::No, 0.45, 1000.0, 0),
                                        estimate);
        REQUIRE(opp.has_value());
        REQUIRE(opp->side == OutcomeSide::Yes);
    }

    SECTION("Equal edges fall back to size") {
        // YES edge 0.10, NO edge 0.10
        auto opp = detector.detect_pair(make_quote("m1", OutcomeSide::Yes, 0.50, 500.0, 0),
                                        make_quote("m1", OutcomeSide::No, 0.50, 800.0, 0),
                                        estimate);
        REQUIRE(opp.has_value());
        REQUIRE(opp->side == OutcomeSide::No);
    }

    SECTION("Exact tie emits nothing") {
        auto opp = detector.detect_pair(make_quote("m1", OutcomeSide::Yes, 0.50, 500.0, 0),
                                        make_quote("m1", OutcomeSide::No, 0.50, 500.0, 0),
                                        estimate);
        REQUIRE_FALSE(opp.has_value());
        REQUIRE(detector.emitted() == 0);
    }

    SECTION("Only one side qualifies") {
        auto opp = detector.detect_pair(make_quote("m1", OutcomeSide::Yes, 0.59, 1000.0, 0),
                                        make_quote("m1", OutcomeSide::No, 0.30, 1000.0, 0),
                                        estimate);
        REQUIRE(opp.has_value());
        REQUIRE(opp->side == OutcomeSide::No);
    }
}
