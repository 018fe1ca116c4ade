// Sniper Taker Engine - Execution Engine
// Simulates or submits one request and tracks it to a terminal result

#pragma once

#include <sniper/clock.hpp>
#include <sniper/config.hpp>
#include <sniper/gas.hpp>
#include <sniper/market.hpp>
#include <sniper/signer.hpp>
#include <sniper/types.hpp>
#include <atomic>
#include <memory>
#include <mutex>

namespace spdlog { class logger; }

namespace sniper {

// Shared between the scheduler and an in-flight execution
class CancelToken {
public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
    [[nodiscard]] bool cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> cancelled_{false};
};

struct EngineStats {
    uint64_t attempted = 0;
    uint64_t confirmed = 0;
    uint64_t failed = 0;
    uint64_t dropped = 0;
    uint64_t broadcasts = 0;
    double gas_spent_usd = 0.0;
};

class ExecutionEngine {
public:
    // signer and fee_oracle may be null; live requests then fail without a broadcast
    ExecutionEngine(ExecutionConfig config,
                    const QuoteSource& quotes,
                    Signer* signer,
                    FeeOracle* fee_oracle,
                    Clock& clock);

    ExecutionEngine(const ExecutionEngine&) = delete;
    ExecutionEngine& operator=(const ExecutionEngine&) = delete;

    // Never throws for execution problems; they end up in the result
    [[nodiscard]] ExecutionResult execute(const ExecutionRequest& request,
                                          const CancelToken* cancel = nullptr);

    [[nodiscard]] GasParams quote_gas() const { return pricer_.price(); }

    [[nodiscard]] EngineStats stats() const;
    [[nodiscard]] const ExecutionConfig& config() const noexcept { return config_; }

private:
    ExecutionResult dry_run(const ExecutionRequest& request, const CancelToken* cancel);
    ExecutionResult live(const ExecutionRequest& request, const CancelToken* cancel);
    void await_confirmation(const TxHandle& handle, ExecutionResult& result,
                            const GasParams& gas, const Opportunity& opp,
                            const CancelToken* cancel);
    ExecutionResult finish(ExecutionResult result);
    bool within_slippage(const Opportunity& opp, double price) const noexcept;

    ExecutionConfig config_;
    const QuoteSource& quotes_;
    Signer* signer_;
    Clock& clock_;
    GasPricer pricer_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex stats_mutex_;
    EngineStats stats_;
};

}  // namespace sniper
