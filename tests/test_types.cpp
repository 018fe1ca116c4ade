// Sniper Taker Engine - Types Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sniper/types.hpp>

using namespace sniper;
using Catch::Approx;

TEST_CASE("Decimal arithmetic", "[types]") {
    SECTION("Basic operations") {
        Decimal a = Decimal::from_double(100.5);
        Decimal b = Decimal::from_double(50.25);

        REQUIRE((a + b).to_double() == Approx(150.75));
        REQUIRE((a - b).to_double() == Approx(50.25));
        REQUIRE((a * Decimal::from_double(2.0)).to_double() == Approx(201.0));
        REQUIRE((a / Decimal::from_double(2.0)).to_double() == Approx(50.25));
    }

    SECTION("Compound assignment") {
        Decimal total;
        total += Decimal::from_double(50.0);
        total += Decimal::from_double(25.0);
        total -= Decimal::from_double(10.0);
        REQUIRE(total == Decimal::from_double(65.0));
    }

    SECTION("String conversion") {
        auto d = Decimal::from_string("123.456");
        REQUIRE(d.to_double() == Approx(123.456));

        auto d2 = Decimal::from_string("-99.99");
        REQUIRE(d2.to_double() == Approx(-99.99));
        REQUIRE(d2.is_negative());

        REQUIRE(Decimal::from_double(500.0).to_string() == "500");
        REQUIRE(Decimal::from_double(0.5).to_string() == "0.5");
        REQUIRE(Decimal::zero().to_string() == "0");
    }

    SECTION("Invalid strings throw") {
        REQUIRE_THROWS_AS(Decimal::from_string("12a"), std::invalid_argument);
        REQUIRE_THROWS_AS(Decimal::from_string("1.x"), std::invalid_argument);
    }

    SECTION("Comparison") {
        Decimal a = Decimal::from_double(10.0);
        Decimal b = Decimal::from_double(20.0);

        REQUIRE(a < b);
        REQUIRE(b > a);
        REQUIRE(a <= a);
        REQUIRE(a == a);
        REQUIRE(a != b);
    }

    SECTION("Sums of doubles stay exact") {
        Decimal sum;
        for (int i = 0; i < 10; ++i) {
            sum += Decimal::from_double(0.1);
        }
        REQUIRE(sum == Decimal::one());
    }
}

TEST_CASE("Enum parsing and names", "[types]") {
    SECTION("Outcome side") {
        REQUIRE(parse_side("yes") == OutcomeSide::Yes);
        REQUIRE(parse_side("NO") == OutcomeSide::No);
        REQUIRE(parse_side("0") == OutcomeSide::Yes);
        REQUIRE_FALSE(parse_side("maybe").has_value());
        REQUIRE(std::string(to_string(OutcomeSide::No)) == "no");
        REQUIRE(opposite(OutcomeSide::Yes) == OutcomeSide::No);
    }

    SECTION("Execution mode") {
        REQUIRE(parse_mode("dry_run") == ExecutionMode::DryRun);
        REQUIRE(parse_mode("dry-run") == ExecutionMode::DryRun);
        REQUIRE(parse_mode("live") == ExecutionMode::Live);
        REQUIRE_FALSE(parse_mode("paper").has_value());
    }

    SECTION("Outcome names") {
        REQUIRE(std::string(to_string(ExecutionOutcome::Confirmed)) == "confirmed");
        REQUIRE(std::string(to_string(ExecutionOutcome::Dropped)) == "dropped");
        REQUIRE(std::string(to_string(TradeAction::Sell)) == "sell");
    }
}

TEST_CASE("Opportunity derived values", "[types]") {
    Opportunity opp;
    opp.price = 0.5;
    opp.size = 100.0;
    opp.edge = 0.1;
    opp.quote_timestamp = 1000;

    REQUIRE(opp.notional() == Decimal::from_double(50.0));
    REQUIRE(opp.expected_value() == Approx(10.0));

    SECTION("Staleness is strictly older than the window") {
        REQUIRE_FALSE(opp.is_stale(6000, 5000));
        REQUIRE(opp.is_stale(6001, 5000));
    }
}

TEST_CASE("Fair value per side", "[types]") {
    ValuationEstimate est;
    est.value = 0.65;

    REQUIRE(est.fair_value(OutcomeSide::Yes) == Approx(0.65));
    REQUIRE(est.fair_value(OutcomeSide::No) == Approx(0.35));
}
