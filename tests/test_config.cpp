// Sniper Taker Engine - Configuration Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sniper/config.hpp>
#include <sniper/errors.hpp>

using namespace sniper;
using Catch::Approx;

TEST_CASE("Config defaults", "[config]") {
    Config config;

    REQUIRE(config.general.mode == ExecutionMode::DryRun);
    REQUIRE(config.valuation.model == ValuationModelKind::OrnsteinUhlenbeck);
    REQUIRE(config.scheduler.queue_depth == 8);
    REQUIRE(config.risk.global_cap.to_double() == Approx(2000.0));
    REQUIRE(config.execution.max_slippage == Approx(0.05));
    REQUIRE(config.detector.min_expected_profit == Approx(0.0));
    REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("Config from TOML", "[config]") {
    const char* toml = R"(
# comment line
[general]
mode = "live"
identity = "0xabc"   # trailing comment

[detector]
min_edge_threshold = 0.05
min_size_threshold = 100
position_size = 10
min_expected_profit = 0.25

[valuation]
model = "constant"
fair_value = 0.62
min_history = 5
window = 50

[risk]
cooldown_ms = 1000
per_market_cap = 250.5
global_cap = 1000
staleness_window_ms = 750

[scheduler]
queue_depth = 3
reconcile_interval_ms = 100

[execution]
gas_limit = 200000
priority_fee_gwei = 40
gas_priority_bound_gwei = 80
retry_fee_multiplier = 2
max_slippage = 0.02

[feed]
markets = ["m1", "m2"]

[signer]
url = "http://localhost:8645"
)";

    Config config = Config::from_toml(toml);

    REQUIRE(config.general.mode == ExecutionMode::Live);
    REQUIRE(config.general.identity == "0xabc");
    REQUIRE(config.detector.min_edge_threshold == Approx(0.05));
    REQUIRE(config.detector.min_size_threshold == Approx(100.0));
    REQUIRE(config.valuation.model == ValuationModelKind::Constant);
    REQUIRE(config.valuation.fair_value == Approx(0.62));
    REQUIRE(config.valuation.min_history == 5);
    REQUIRE(config.risk.cooldown_ms == 1000);
    REQUIRE(config.risk.per_market_cap == Decimal::from_double(250.5));
    REQUIRE(config.risk.staleness_window_ms == 750);
    REQUIRE(config.scheduler.queue_depth == 3);
    REQUIRE(config.scheduler.reconcile_interval_ms == 100);
    REQUIRE(config.execution.gas_limit == 200000);
    REQUIRE(config.execution.retry_fee_multiplier == Approx(2.0));
    REQUIRE(config.execution.max_slippage == Approx(0.02));
    REQUIRE(config.detector.min_expected_profit == Approx(0.25));
    REQUIRE(config.feed.markets == std::vector<std::string>{"m1", "m2"});
    REQUIRE(config.signer.url == "http://localhost:8645");

    // Untouched sections keep their defaults
    REQUIRE(config.feed.poll_interval_ms == 3000);

    REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("Config market list forms", "[config]") {
    auto config = Config::from_toml("[feed]\nmarkets = \"a, b,c\"\n");
    REQUIRE(config.feed.markets == std::vector<std::string>{"a", "b", "c"});
}

TEST_CASE("Config parse errors", "[config]") {
    SECTION("Unknown mode") {
        REQUIRE_THROWS_AS(Config::from_toml("[general]\nmode = \"paper\"\n"), ConfigError);
    }

    SECTION("Unknown model") {
        REQUIRE_THROWS_AS(Config::from_toml("[valuation]\nmodel = \"lstm\"\n"), ConfigError);
    }

    SECTION("Bad number") {
        REQUIRE_THROWS_AS(Config::from_toml("[risk]\ncooldown_ms = soon\n"), ConfigError);
        REQUIRE_THROWS_AS(Config::from_toml("[detector]\nposition_size = 10x\n"), ConfigError);
    }

    SECTION("Bad amount") {
        REQUIRE_THROWS_AS(Config::from_toml("[risk]\nglobal_cap = lots\n"), ConfigError);
    }

    SECTION("Unterminated header") {
        REQUIRE_THROWS_AS(Config::from_toml("[risk\ncooldown_ms = 1\n"), ConfigError);
    }

    SECTION("Missing equals") {
        REQUIRE_THROWS_AS(Config::from_toml("[risk]\ncooldown_ms 1\n"), ConfigError);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(Config::from_file("/nonexistent/sniper.toml"), ConfigError);
    }
}

TEST_CASE("Config validation", "[config]") {
    Config config;

    SECTION("Edge threshold range") {
        config.set_min_edge(1.5);
        REQUIRE_THROWS_AS(config.validate(), ConfigError);
    }

    SECTION("History window shorter than minimum") {
        config.valuation.window = 10;
        config.valuation.min_history = 20;
        REQUIRE_THROWS_AS(config.validate(), ConfigError);
    }

    SECTION("Caps must be positive") {
        config.set_global_cap(Decimal::zero());
        REQUIRE_THROWS_AS(config.validate(), ConfigError);
    }

    SECTION("Queue depth") {
        config.set_queue_depth(0);
        REQUIRE_THROWS_AS(config.validate(), ConfigError);
    }

    SECTION("Priority fee above bound") {
        config.set_gas_priority_bound(10.0);
        REQUIRE_THROWS_AS(config.validate(), ConfigError);
    }

    SECTION("Slippage range") {
        config.set_max_slippage(1.0);
        REQUIRE_THROWS_AS(config.validate(), ConfigError);
        config.set_max_slippage(-0.01);
        REQUIRE_THROWS_AS(config.validate(), ConfigError);
        config.set_max_slippage(0.0);
        REQUIRE_NOTHROW(config.validate());
    }

    SECTION("Negative profit floor") {
        config.set_min_expected_profit(-1.0);
        REQUIRE_THROWS_AS(config.validate(), ConfigError);
    }

    SECTION("Live requires signer and identity") {
        config.set_mode(ExecutionMode::Live);
        REQUIRE_THROWS_AS(config.validate(), ConfigError);

        config.signer.url = "http://localhost:8645";
        REQUIRE_THROWS_AS(config.validate(), ConfigError);

        config.set_identity("0xabc");
        REQUIRE_NOTHROW(config.validate());
    }
}

TEST_CASE("Config builder", "[config]") {
    Config config;
    config.set_min_edge(0.1)
          .set_min_size(25.0)
          .set_cooldown_ms(500)
          .set_per_market_cap(Decimal::from_double(100.0))
          .set_staleness_window_ms(200)
          .add_market("m1")
          .add_market("m2");

    REQUIRE(config.detector.min_edge_threshold == Approx(0.1));
    REQUIRE(config.detector.min_size_threshold == Approx(25.0));
    REQUIRE(config.risk.cooldown_ms == 500);
    REQUIRE(config.risk.per_market_cap.to_double() == Approx(100.0));
    REQUIRE(config.risk.staleness_window_ms == 200);
    REQUIRE(config.feed.markets.size() == 2);
}
