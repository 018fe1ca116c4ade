// Sniper Taker Engine - Quote Normalizer Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sniper/errors.hpp>
#include <sniper/normalizer.hpp>
#include "fakes.hpp"

using namespace sniper;
using namespace sniper::testing;
using Catch::Approx;

namespace {

RawTick replay_tick(const std::string& side, nlohmann::json fields) {
    RawTick tick;
    tick.format = TickFormat::Replay;
    tick.market_id = "m1";
    tick.side = side;
    tick.fields = std::move(fields);
    return tick;
}

}  // namespace

TEST_CASE("Live ticks", "[normalizer]") {
    SECTION("YES takes the ask") {
        auto quote = QuoteNormalizer::normalize(live_tick("m1", "yes", 0.48, 0.52, 1200.0, 5000));
        REQUIRE(quote.market_id == "m1");
        REQUIRE(quote.side == OutcomeSide::Yes);
        REQUIRE(quote.price == Approx(0.52));
        REQUIRE(quote.size == Approx(1200.0));
        REQUIRE(quote.timestamp == 5000);
    }

    SECTION("NO takes one minus the bid") {
        auto quote = QuoteNormalizer::normalize(live_tick("m1", "no", 0.48, 0.52, 1200.0, 5000));
        REQUIRE(quote.side == OutcomeSide::No);
        REQUIRE(quote.price == Approx(0.52));
    }

    SECTION("Numbers sent as strings") {
        RawTick tick = live_tick("m1", "yes", 0.0, 0.0, 0.0, 10);
        tick.fields = {{"bestBid", "0.30"}, {"bestAsk", "0.35"}, {"liquidity", "800.5"}};
        auto quote = QuoteNormalizer::normalize(tick);
        REQUIRE(quote.price == Approx(0.35));
        REQUIRE(quote.size == Approx(800.5));
    }

    SECTION("Falls back to outcomePrices around the mid") {
        RawTick tick = live_tick("m1", "yes", 0.0, 0.0, 100.0, 10);
        tick.fields = {{"outcomePrices", "[\"0.40\", \"0.60\"]"}, {"liquidityNum", 100.0}};

        auto yes = QuoteNormalizer::normalize(tick);
        REQUIRE(yes.price == Approx(0.40 * 1.02));

        tick.side = "no";
        auto no = QuoteNormalizer::normalize(tick);
        REQUIRE(no.price == Approx(1.0 - 0.40 * 0.98));
    }

    SECTION("No book at all") {
        RawTick tick = live_tick("m1", "yes", 0.0, 0.0, 100.0, 10);
        tick.fields = {{"liquidityNum", 100.0}};
        REQUIRE_THROWS_AS(QuoteNormalizer::normalize(tick), MalformedFeedData);
    }
}

TEST_CASE("Malformed ticks", "[normalizer]") {
    SECTION("Price out of range") {
        REQUIRE_THROWS_AS(
            QuoteNormalizer::normalize(live_tick("m1", "yes", 0.5, 1.2, 100.0, 10)),
            MalformedFeedData);
    }

    SECTION("Negative liquidity") {
        REQUIRE_THROWS_AS(
            QuoteNormalizer::normalize(live_tick("m1", "yes", 0.5, 0.6, -1.0, 10)),
            MalformedFeedData);
    }

    SECTION("Unknown side") {
        REQUIRE_THROWS_AS(
            QuoteNormalizer::normalize(live_tick("m1", "maybe", 0.5, 0.6, 100.0, 10)),
            MalformedFeedData);
    }

    SECTION("Missing market id") {
        REQUIRE_THROWS_AS(
            QuoteNormalizer::normalize(live_tick("", "yes", 0.5, 0.6, 100.0, 10)),
            MalformedFeedData);
    }

    SECTION("Non-numeric string") {
        RawTick tick = live_tick("m1", "yes", 0.5, 0.6, 100.0, 10);
        tick.fields["bestAsk"] = "cheap";
        REQUIRE_THROWS_AS(QuoteNormalizer::normalize(tick), MalformedFeedData);
    }

    SECTION("Malformed is a feed error") {
        REQUIRE_THROWS_AS(
            QuoteNormalizer::normalize(live_tick("m1", "yes", 0.5, 0.6, -1.0, 10)),
            FeedError);
    }
}

TEST_CASE("Replay ticks", "[normalizer]") {
    SECTION("Size column preferred over liquidity") {
        auto quote = QuoteNormalizer::normalize(replay_tick("yes", {
            {"timestamp", "2024-01-01 00:00:01"},
            {"best_bid", "0.44"}, {"best_ask", "0.46"},
            {"liquidity", "5000"}, {"size", "250"}}));
        REQUIRE(quote.price == Approx(0.46));
        REQUIRE(quote.size == Approx(250.0));
        REQUIRE(quote.timestamp == 1704067201000);
    }

    SECTION("Liquidity when size is absent") {
        auto quote = QuoteNormalizer::normalize(replay_tick("no", {
            {"timestamp", "1704067200000"},
            {"best_bid", "0.44"}, {"best_ask", "0.46"},
            {"liquidity", "5000"}}));
        REQUIRE(quote.price == Approx(0.56));
        REQUIRE(quote.size == Approx(5000.0));
        REQUIRE(quote.timestamp == 1704067200000);
    }

    SECTION("Missing book columns") {
        REQUIRE_THROWS_AS(QuoteNormalizer::normalize(replay_tick("yes", {
            {"timestamp", "1704067200000"}, {"best_bid", "0.44"}, {"size", "1"}})),
            MalformedFeedData);
    }

    SECTION("Bad timestamp") {
        REQUIRE_THROWS_AS(QuoteNormalizer::normalize(replay_tick("yes", {
            {"timestamp", "yesterday"},
            {"best_bid", "0.44"}, {"best_ask", "0.46"}, {"size", "1"}})),
            MalformedFeedData);
    }
}

TEST_CASE("Timestamp parsing", "[normalizer]") {
    REQUIRE(QuoteNormalizer::parse_timestamp("2024-01-01 00:00:00") == 1704067200000);
    REQUIRE(QuoteNormalizer::parse_timestamp("2024-01-01 00:00:00.250") == 1704067200250);
    REQUIRE(QuoteNormalizer::parse_timestamp("1704067200123") == 1704067200123);
    REQUIRE_THROWS_AS(QuoteNormalizer::parse_timestamp(""), std::invalid_argument);

    SECTION("Sub-millisecond digits truncate") {
        REQUIRE(QuoteNormalizer::parse_timestamp("2024-01-01 00:00:00.250123") == 1704067200250);
    }

    SECTION("Trailing text is rejected") {
        REQUIRE_THROWS_AS(QuoteNormalizer::parse_timestamp("2024-01-01 00:00:00xyz"),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(QuoteNormalizer::parse_timestamp("2024-01-01 00:00:00.250Z"),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(QuoteNormalizer::parse_timestamp("2024-01-01 00:00:00."),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(QuoteNormalizer::parse_timestamp("1704067200123ms"),
                          std::invalid_argument);
    }

    SECTION("Tick with trailing text in its timestamp is malformed") {
        REQUIRE_THROWS_AS(QuoteNormalizer::normalize(replay_tick("yes", {
            {"timestamp", "2024-01-01 00:00:00xyz"},
            {"best_bid", "0.44"}, {"best_ask", "0.46"}, {"size", "1"}})),
            MalformedFeedData);
    }
}
