// Sniper Taker Engine - Pipeline Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sniper/pipeline.hpp>
#include "fakes.hpp"
#include <chrono>
#include <thread>

using namespace sniper;
using namespace sniper::testing;
using Catch::Approx;

namespace {

// Constant fair value of 0.60 for YES
Config dry_run_config() {
    Config config;
    config.set_mode(ExecutionMode::DryRun)
          .set_min_edge(0.05)
          .set_min_size(100.0)
          .set_cooldown_ms(30'000)
          .set_staleness_window_ms(5'000)
          .add_market("m1");
    config.valuation.model = ValuationModelKind::Constant;
    config.valuation.fair_value = 0.60;
    config.detector.position_size = 50.0;
    return config;
}

struct EventLog {
    explicit EventLog(EventBus& bus) {
        bus.subscribe([this](const Event& e) {
            std::lock_guard<std::mutex> lock(mutex);
            events.push_back(e);
        });
    }

    std::vector<Event> of(EventKind kind) {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<Event> out;
        for (const auto& e : events) {
            if (e.kind == kind) out.push_back(e);
        }
        return out;
    }

    std::mutex mutex;
    std::vector<Event> events;
};

}  // namespace

TEST_CASE("Dry-run pipeline executes an underpriced quote", "[pipeline]") {
    ManualClock clock(1'000);
    Pipeline pipeline(dry_run_config(), clock, nullptr, nullptr, Pipeline::Options{true});
    EventLog log(pipeline.events());

    // YES ask 0.50 against fair 0.60
    pipeline.process_tick(live_tick("m1", "yes", 0.48, 0.50, 1'000.0, 1'000));
    pipeline.flush();

    auto report = pipeline.report();
    REQUIRE(report.ticks == 1);
    REQUIRE(report.opportunities == 1);
    REQUIRE(report.confirmed == 1);
    REQUIRE(report.realized_edge == Approx(100.0 * 0.10));
    REQUIRE(report.risk.approvals == 1);
    REQUIRE(report.risk.committed.to_double() == Approx(50.0));
    REQUIRE(report.risk.reserved.is_zero());
    REQUIRE(report.engine.broadcasts == 0);

    auto confirmed = log.of(EventKind::ExecutionConfirmed);
    REQUIRE(confirmed.size() == 1);
    REQUIRE(confirmed[0].market_id == "m1");
    REQUIRE(confirmed[0].payload["outcome"] == "confirmed");
    REQUIRE(confirmed[0].payload["mode"] == "dry_run");
    REQUIRE(confirmed[0].payload["filled_size"].get<double>() == Approx(100.0));

    SECTION("Cooling market is skipped") {
        clock.set(1'500);
        pipeline.process_tick(live_tick("m1", "yes", 0.48, 0.50, 1'000.0, 1'500));
        pipeline.flush();

        auto again = pipeline.report();
        REQUIRE(again.opportunities == 2);
        REQUIRE(again.cooling_skips == 1);
        REQUIRE(again.confirmed == 1);
        REQUIRE(log.of(EventKind::RiskRejected).empty());
    }

    SECTION("Cooldown expires") {
        clock.set(31'000);
        pipeline.process_tick(live_tick("m1", "yes", 0.48, 0.50, 1'000.0, 31'000));
        pipeline.flush();

        REQUIRE(pipeline.report().confirmed == 2);
        REQUIRE(pipeline.report().risk.committed.to_double() == Approx(100.0));
    }
}

TEST_CASE("Pipeline evaluates both sides of a cycle together", "[pipeline]") {
    ManualClock clock(1'000);
    Pipeline pipeline(dry_run_config(), clock, nullptr, nullptr, Pipeline::Options{true});

    // YES 0.50 (edge 0.10), NO 1 - 0.49 = 0.51 against 0.40 (edge 0.11)
    pipeline.process_tick(live_tick("m1", "yes", 0.49, 0.50, 1'000.0, 1'000));
    pipeline.process_tick(live_tick("m1", "no", 0.49, 0.50, 1'000.0, 1'000));
    pipeline.flush();

    auto report = pipeline.report();
    REQUIRE(report.ticks == 2);
    REQUIRE(report.opportunities == 1);
    REQUIRE(report.confirmed == 1);
    REQUIRE(pipeline.markets().latest("m1", OutcomeSide::No)->price == Approx(0.51));
}

TEST_CASE("Pipeline skips what it cannot use", "[pipeline]") {
    ManualClock clock(1'000);

    SECTION("Malformed tick") {
        Pipeline pipeline(dry_run_config(), clock, nullptr, nullptr, Pipeline::Options{true});
        pipeline.process_tick(live_tick("m1", "yes", 0.48, 1.50, 1'000.0, 1'000));
        pipeline.flush();

        auto report = pipeline.report();
        REQUIRE(report.ticks == 1);
        REQUIRE(report.malformed == 1);
        REQUIRE(report.opportunities == 0);
    }

    SECTION("Edge that does not pay for gas") {
        Config config = dry_run_config();
        config.execution.native_token_usd = 1000.0;   // $24 per transaction
        Pipeline pipeline(config, clock, nullptr, nullptr, Pipeline::Options{true});

        pipeline.process_tick(live_tick("m1", "yes", 0.48, 0.50, 1'000.0, 1'000));
        pipeline.flush();

        auto report = pipeline.report();
        REQUIRE(report.opportunities == 0);
        REQUIRE(report.unprofitable == 1);
        REQUIRE(report.risk.approvals == 0);
    }

    SECTION("Model still warming up") {
        Config config = dry_run_config();
        config.valuation.model = ValuationModelKind::OrnsteinUhlenbeck;
        Pipeline pipeline(config, clock, nullptr, nullptr, Pipeline::Options{true});

        pipeline.process_tick(live_tick("m1", "yes", 0.48, 0.50, 1'000.0, 1'000));
        pipeline.flush();

        auto report = pipeline.report();
        REQUIRE(report.insufficient_history == 1);
        REQUIRE(report.opportunities == 0);
        REQUIRE(pipeline.history().size("m1") == 1);
    }
}

TEST_CASE("Pipeline rejections become events", "[pipeline]") {
    ManualClock clock(1'000);

    SECTION("Risk rejection") {
        Config config = dry_run_config();
        config.set_per_market_cap(Decimal::from_double(10.0));
        Pipeline pipeline(config, clock, nullptr, nullptr, Pipeline::Options{true});
        EventLog log(pipeline.events());

        pipeline.process_tick(live_tick("m1", "yes", 0.48, 0.50, 1'000.0, 1'000));
        pipeline.flush();

        auto rejected = log.of(EventKind::RiskRejected);
        REQUIRE(rejected.size() == 1);
        REQUIRE(rejected[0].payload["reason"] == "market_exposure_exceeded");
        REQUIRE(rejected[0].payload["opportunity"]["side"] == "yes");
        REQUIRE(pipeline.report().confirmed == 0);
    }

    SECTION("Scheduler refusal releases the reservation") {
        Pipeline pipeline(dry_run_config(), clock, nullptr, nullptr, Pipeline::Options{true});
        EventLog log(pipeline.events());
        pipeline.scheduler().stop();

        pipeline.process_tick(live_tick("m1", "yes", 0.48, 0.50, 1'000.0, 1'000));
        pipeline.flush();

        auto rejected = log.of(EventKind::SchedulingRejected);
        REQUIRE(rejected.size() == 1);
        REQUIRE(rejected[0].payload["reason"] == "scheduler_stopped");

        auto report = pipeline.report();
        REQUIRE(report.scheduling_rejections == 1);
        REQUIRE(report.risk.reserved.is_zero());
        REQUIRE(report.risk.open_reservations == 0);
    }
}

TEST_CASE("Live pipeline releases exposure after broadcast failures", "[pipeline]") {
    ManualClock clock(1'000);
    FakeSigner signer;
    signer.failing_broadcasts = 2;
    FakeFeeOracle oracle({30.0});

    Config config = dry_run_config();
    config.set_mode(ExecutionMode::Live).set_identity("0xabc");
    config.signer.url = "http://127.0.0.1:8645";

    Pipeline pipeline(config, clock, &signer, &oracle, Pipeline::Options{true});
    EventLog log(pipeline.events());

    pipeline.process_tick(live_tick("m1", "yes", 0.48, 0.50, 1'000.0, 1'000));
    pipeline.flush();

    auto failed = log.of(EventKind::ExecutionFailed);
    REQUIRE(failed.size() == 1);
    REQUIRE(failed[0].payload["attempts"] == 2);
    REQUIRE(failed[0].payload["sequence"] == 0);

    auto report = pipeline.report();
    REQUIRE(report.failed == 1);
    REQUIRE(report.engine.broadcasts == 2);
    REQUIRE(report.risk.reserved.is_zero());
    REQUIRE(report.risk.committed.is_zero());
    REQUIRE(report.realized_edge == 0.0);

    // The nonce was never used; the ledger is asked before it is issued again
    REQUIRE(signer.broadcasted.empty());
    REQUIRE_FALSE(pipeline.scheduler().next_sequence("0xabc").has_value());
    REQUIRE(pipeline.scheduler().recover("0xabc"));
    REQUIRE(pipeline.scheduler().next_sequence("0xabc") == 0u);
    REQUIRE_FALSE(pipeline.risk().is_eligible("m1"));
}

TEST_CASE("Replay through the pipeline", "[pipeline]") {
    ManualClock clock(1704067200000);
    Pipeline pipeline(dry_run_config(), clock, nullptr, nullptr, Pipeline::Options{true});
    CsvReplayFeed feed(std::string(SNIPER_TEST_DATA_DIR) + "/replay.csv", "m1");

    pipeline.run(feed);

    auto report = pipeline.report();
    REQUIRE(report.ticks == 10);
    REQUIRE(report.malformed == 0);
    REQUIRE(report.opportunities == 5);
    REQUIRE(report.confirmed == 1);
    REQUIRE(report.cooling_skips == 4);
    REQUIRE(pipeline.history().size("m1") == 5);
}

TEST_CASE("Asynchronous pipeline", "[pipeline]") {
    ManualClock clock(1'000);
    Pipeline pipeline(dry_run_config(), clock, nullptr, nullptr);
    EventLog log(pipeline.events());

    VectorFeed feed({
        live_tick("m1", "yes", 0.48, 0.50, 1'000.0, 1'000),
        live_tick("m1", "yes", 0.48, 0.50, 1'000.0, 1'001),
    });
    pipeline.run(feed);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (log.of(EventKind::ExecutionConfirmed).empty() &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    pipeline.stop();

    REQUIRE(log.of(EventKind::ExecutionConfirmed).size() == 1);
    REQUIRE_FALSE(pipeline.scheduler().is_running());
}

TEST_CASE("EventBus delivery", "[events]") {
    EventBus bus;
    std::vector<int> order;

    bus.subscribe([&](const Event&) { order.push_back(1); });
    bus.subscribe([&](const Event&) { throw std::runtime_error("subscriber bug"); });
    bus.subscribe([&](const Event&) { order.push_back(3); });

    ExecutionResult result;
    result.market_id = "m1";
    result.outcome = ExecutionOutcome::Dropped;
    result.error = "stale at dequeue";
    auto event = make_result_event(result);
    REQUIRE(event.kind == EventKind::ExecutionDropped);
    REQUIRE(event.payload["error"] == "stale at dequeue");
    REQUIRE(event.payload["sequence"].is_null());

    REQUIRE_NOTHROW(bus.emit(event));
    REQUIRE(order == std::vector<int>{1, 3});
    REQUIRE(bus.emitted() == 1);
}
