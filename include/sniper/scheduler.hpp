// Sniper Taker Engine - Execution Scheduler
// One ordered queue per signing identity; at most one request in flight
// per identity, sequence numbers assigned at dequeue.

#pragma once

#include <sniper/clock.hpp>
#include <sniper/config.hpp>
#include <sniper/engine.hpp>
#include <sniper/signer.hpp>
#include <sniper/types.hpp>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace spdlog { class logger; }

namespace sniper {

enum class ScheduleReject : uint8_t {
    SchedulerSaturated = 0,
    SchedulerStopped = 1
};

inline constexpr const char* to_string(ScheduleReject r) noexcept {
    return r == ScheduleReject::SchedulerSaturated ? "scheduler_saturated" : "scheduler_stopped";
}

struct SubmitResult {
    std::optional<ExecutionRequest> request;
    std::optional<ScheduleReject> reason;

    explicit operator bool() const noexcept { return request.has_value(); }
};

using ResultCallback = std::function<void(const ExecutionResult&)>;

class Scheduler {
public:
    // signer is consulted for sequence state in live mode and may be null in dry-run
    Scheduler(SchedulerConfig config,
              RiskConfig risk,
              ExecutionEngine& engine,
              Signer* signer,
              Clock& clock,
              ExecutionMode mode,
              std::string default_identity);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Terminal results, including requests dropped in the queue
    void on_result(ResultCallback callback);

    [[nodiscard]] SubmitResult submit(const Opportunity& opp);
    [[nodiscard]] SubmitResult submit(const Opportunity& opp, const std::string& identity);

    // Dequeue and execute one request for the identity on the calling thread.
    // nullopt when nothing is queued, a request is in flight, or the identity
    // is blocked waiting for the ledger to settle.
    std::optional<ExecutionResult> process_next(const std::string& identity);

    // Re-reads sequence state from the signer (live) for every known identity
    // or for the given one. Returns false if any identity stays blocked.
    bool recover();
    bool recover(const std::string& identity);

    // Queued -> Dropped; in flight -> cancel token set
    bool cancel(const std::string& request_id);

    // One dispatcher thread per identity
    void start();
    // Joins dispatchers, cancels in-flight work and drops what is still queued
    void stop();
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    [[nodiscard]] size_t pending(const std::string& identity) const;
    [[nodiscard]] bool in_flight(const std::string& identity) const;
    [[nodiscard]] bool blocked(const std::string& identity) const;
    [[nodiscard]] std::optional<uint64_t> next_sequence(const std::string& identity) const;

    [[nodiscard]] ExecutionMode mode() const noexcept { return mode_; }
    [[nodiscard]] const std::string& default_identity() const noexcept { return default_identity_; }

    // Terminal result for an opportunity that never became a request
    [[nodiscard]] static ExecutionResult dropped(const Opportunity& opp,
                                                 const std::string& identity,
                                                 const std::string& reason,
                                                 int64_t now);

private:
    struct Queued {
        ExecutionRequest request;
        std::shared_ptr<CancelToken> token;
    };

    struct Lane {
        std::deque<Queued> queue;
        std::optional<uint64_t> next_sequence;   // unset until synced
        bool blocked = false;                     // awaiting reconciliation
        std::optional<uint64_t> unverified;       // nonce of a failed broadcast
        bool busy = false;                        // executing or syncing
        std::optional<Queued> in_flight;
        std::condition_variable cv;
        std::thread dispatcher;
    };

    Lane& lane_for(const std::string& identity);
    const Lane* find_lane(const std::string& identity) const;
    bool sync_sequence(const std::string& identity, Lane& lane, std::unique_lock<std::mutex>& lock);
    void settle(Lane& lane, const ExecutionResult& result);
    void deliver(const ExecutionResult& result);
    void dispatch_loop(const std::string& identity);
    void spawn_dispatcher(const std::string& identity, Lane& lane);

    SchedulerConfig config_;
    RiskConfig risk_;
    ExecutionEngine& engine_;
    Signer* signer_;
    Clock& clock_;
    ExecutionMode mode_;
    std::string default_identity_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<Lane>> lanes_;
    std::atomic<uint64_t> next_request_{1};
    std::atomic<bool> running_{false};
    bool stopped_ = false;

    std::mutex callbacks_mutex_;
    std::vector<ResultCallback> callbacks_;
};

}  // namespace sniper
