// Sniper Taker Engine - Pipeline
// Feed -> Normalizer -> Valuation -> Detector -> Risk Gate -> Scheduler -> Engine,
// with execution results fed back to the Risk Gate and the Event Bus.

#pragma once

#include <sniper/clock.hpp>
#include <sniper/config.hpp>
#include <sniper/detector.hpp>
#include <sniper/engine.hpp>
#include <sniper/events.hpp>
#include <sniper/feed.hpp>
#include <sniper/gas.hpp>
#include <sniper/market.hpp>
#include <sniper/risk.hpp>
#include <sniper/scheduler.hpp>
#include <sniper/signer.hpp>
#include <sniper/valuation.hpp>
#include <array>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

namespace spdlog { class logger; }

namespace sniper {

struct PipelineReport {
    uint64_t ticks = 0;
    uint64_t malformed = 0;
    uint64_t feed_errors = 0;
    uint64_t insufficient_history = 0;
    uint64_t opportunities = 0;
    uint64_t unprofitable = 0;      // edge did not cover gas plus min profit
    uint64_t cooling_skips = 0;
    uint64_t scheduling_rejections = 0;
    uint64_t confirmed = 0;
    uint64_t failed = 0;
    uint64_t dropped = 0;
    double realized_edge = 0.0;     // sum of size * edge over confirmed executions
    RiskSnapshot risk;
    EngineStats engine;
};

void log_report(const PipelineReport& report, spdlog::logger& logger);

class Pipeline {
public:
    // Synchronous pipelines run every stage, execution included, on the
    // thread that delivers the tick (backtests and tests).
    struct Options {
        bool synchronous = false;
    };

    Pipeline(const Config& config,
             Clock& clock,
             Signer* signer,
             FeeOracle* fee_oracle,
             Options options);
    Pipeline(const Config& config, Clock& clock, Signer* signer, FeeOracle* fee_oracle)
        : Pipeline(config, clock, signer, fee_oracle, Options{}) {}
    ~Pipeline();

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    // Pulls from the feed until it is exhausted or stop() is called.
    // Asynchronous pipelines hand each market to its own worker thread.
    void run(Feed& feed);
    void stop();

    // Runs one tick through every stage on the calling thread
    void process_tick(const RawTick& raw);

    // Evaluates quotes still waiting for their opposite side.
    // Synchronous pipelines only; workers own their held quote while running.
    void flush();

    [[nodiscard]] PipelineReport report();

    [[nodiscard]] EventBus& events() noexcept { return bus_; }
    [[nodiscard]] MarketState& markets() noexcept { return markets_; }
    [[nodiscard]] HistoryStore& history() noexcept { return history_; }
    [[nodiscard]] RiskGate& risk() noexcept { return risk_; }
    [[nodiscard]] Scheduler& scheduler() noexcept { return scheduler_; }
    [[nodiscard]] ExecutionEngine& engine() noexcept { return engine_; }
    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    struct Worker {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<RawTick> ticks;
        std::optional<Quote> held;   // first side of a poll cycle
        std::thread thread;
    };

    Worker& worker_for(const std::string& market_id);
    void worker_loop(Worker& worker);
    void handle_tick(Worker& worker, const RawTick& raw);
    void record_history(const Quote& quote);
    void evaluate(const Quote& quote, const std::optional<Quote>& partner);
    void on_result(const ExecutionResult& result);
    void drain_scheduler();

    Config config_;
    Clock& clock_;
    Options options_;
    std::shared_ptr<spdlog::logger> logger_;

    EventBus bus_;
    LoggingEventSink sink_;
    MarketState markets_;
    HistoryStore history_;
    std::unique_ptr<ValuationModel> model_;
    GasPricer gas_;
    Detector detector_;
    RiskGate risk_;
    ExecutionEngine engine_;
    Scheduler scheduler_;

    std::mutex workers_mutex_;
    std::unordered_map<std::string, std::unique_ptr<Worker>> workers_;
    std::atomic<bool> running_{false};
    Feed* feed_ = nullptr;

    std::atomic<uint64_t> ticks_{0};
    std::atomic<uint64_t> malformed_{0};
    std::atomic<uint64_t> feed_errors_{0};
    std::atomic<uint64_t> insufficient_history_{0};
    std::atomic<uint64_t> opportunities_{0};
    std::atomic<uint64_t> cooling_skips_{0};
    std::atomic<uint64_t> scheduling_rejections_{0};
    std::atomic<uint64_t> confirmed_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> dropped_{0};
    std::mutex edge_mutex_;
    double realized_edge_ = 0.0;
    std::unordered_map<std::string, double> pending_edge_;   // opportunity id -> edge
};

}  // namespace sniper
