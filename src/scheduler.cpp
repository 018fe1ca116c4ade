// Sniper Taker Engine - Execution Scheduler Implementation

#include <sniper/scheduler.hpp>
#include <sniper/errors.hpp>
#include <sniper/log.hpp>
#include <stdexcept>

namespace sniper {

Scheduler::Scheduler(SchedulerConfig config,
                     RiskConfig risk,
                     ExecutionEngine& engine,
                     Signer* signer,
                     Clock& clock,
                     ExecutionMode mode,
                     std::string default_identity)
    : config_(config),
      risk_(risk),
      engine_(engine),
      signer_(signer),
      clock_(clock),
      mode_(mode),
      default_identity_(std::move(default_identity)),
      logger_(log::get("scheduler")) {}

Scheduler::~Scheduler() {
    stop();
}

void Scheduler::on_result(ResultCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    callbacks_.push_back(std::move(callback));
}

ExecutionResult Scheduler::dropped(const Opportunity& opp,
                                   const std::string& identity,
                                   const std::string& reason,
                                   int64_t now) {
    ExecutionResult result;
    result.opportunity_id = opp.id;
    result.market_id = opp.market_id;
    result.identity = identity;
    result.outcome = ExecutionOutcome::Dropped;
    result.completed_at = now;
    result.error = reason;
    return result;
}

Scheduler::Lane& Scheduler::lane_for(const std::string& identity) {
    auto it = lanes_.find(identity);
    if (it == lanes_.end()) {
        it = lanes_.emplace(identity, std::make_unique<Lane>()).first;
        if (running_.load()) {
            spawn_dispatcher(identity, *it->second);
        }
    }
    return *it->second;
}

const Scheduler::Lane* Scheduler::find_lane(const std::string& identity) const {
    auto it = lanes_.find(identity);
    return it != lanes_.end() ? it->second.get() : nullptr;
}

// =============================================================================
// Submission
// =============================================================================

SubmitResult Scheduler::submit(const Opportunity& opp) {
    return submit(opp, default_identity_);
}

SubmitResult Scheduler::submit(const Opportunity& opp, const std::string& identity) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (stopped_) {
        return SubmitResult{std::nullopt, ScheduleReject::SchedulerStopped};
    }

    Lane& lane = lane_for(identity);
    if (lane.queue.size() >= config_.queue_depth) {
        logger_->warn("Queue for {} saturated ({} pending), rejecting {}",
                      identity, lane.queue.size(), opp.id);
        return SubmitResult{std::nullopt, ScheduleReject::SchedulerSaturated};
    }

    Queued item;
    item.request.request_id = "req-" + std::to_string(next_request_.fetch_add(1));
    item.request.opportunity = opp;
    item.request.identity = identity;
    item.request.mode = mode_;
    item.request.enqueued_at = clock_.now();
    item.token = std::make_shared<CancelToken>();

    ExecutionRequest request = item.request;
    lane.queue.push_back(std::move(item));
    lock.unlock();

    lane.cv.notify_all();
    logger_->debug("Queued {} for {} as {}", opp.id, identity, request.request_id);
    return SubmitResult{std::move(request), std::nullopt};
}

// =============================================================================
// Sequence bookkeeping
// =============================================================================

bool Scheduler::sync_sequence(const std::string& identity, Lane& lane,
                              std::unique_lock<std::mutex>& lock) {
    if (mode_ == ExecutionMode::DryRun) {
        if (!lane.next_sequence) lane.next_sequence = 0;
        lane.blocked = false;
        return true;
    }

    if (lane.next_sequence && !lane.blocked) return true;

    if (!signer_) {
        logger_->error("No signer to read sequence state for {}", identity);
        return false;
    }

    lane.busy = true;
    lock.unlock();

    std::optional<SequenceState> state;
    try {
        state = signer_->sequence_state(identity);
    } catch (const ExecutionFailure& e) {
        logger_->warn("Sequence state for {} unavailable: {}", identity, e.what());
    }

    lock.lock();
    lane.busy = false;

    if (!state) {
        lane.blocked = true;
        lane.next_sequence.reset();
        return false;
    }

    if (state->has_pending()) {
        lane.blocked = true;
        lane.next_sequence.reset();
        logger_->warn("{} blocked: ledger shows pending nonces {}..{}",
                      identity, state->confirmed_next, state->pending_next - 1);
        return false;
    }

    if (lane.unverified && state->confirmed_next > *lane.unverified) {
        logger_->warn("{} nonce {} reached the ledger although its broadcast failed",
                      identity, *lane.unverified);
    }
    lane.unverified.reset();

    if (lane.blocked) {
        logger_->info("{} reconciled, resuming at nonce {}", identity, state->confirmed_next);
    }
    lane.blocked = false;
    lane.next_sequence = state->confirmed_next;
    return true;
}

void Scheduler::settle(Lane& lane, const ExecutionResult& result) {
    if (!result.sequence) return;
    const uint64_t seq = *result.sequence;

    if (result.outcome == ExecutionOutcome::Confirmed || result.sequence_consumed) {
        lane.next_sequence = seq + 1;
    } else if (result.needs_reconciliation) {
        // The nonce may or may not be on-chain; only the ledger can say
        lane.blocked = true;
        lane.next_sequence.reset();
    } else if (mode_ == ExecutionMode::Live) {
        // A broadcast error does not prove the node never took the
        // transaction; the ledger is read again before n is reissued
        lane.unverified = seq;
        lane.next_sequence.reset();
    }
}

void Scheduler::deliver(const ExecutionResult& result) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    for (const auto& callback : callbacks_) {
        try {
            callback(result);
        } catch (const std::exception& e) {
            logger_->error("Result callback failed for {}: {}", result.request_id, e.what());
        }
    }
}

bool Scheduler::recover() {
    std::vector<std::string> identities;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        identities.push_back(default_identity_);
        for (const auto& [identity, _] : lanes_) {
            if (identity != default_identity_) identities.push_back(identity);
        }
    }

    bool all = true;
    for (const auto& identity : identities) {
        all = recover(identity) && all;
    }
    return all;
}

bool Scheduler::recover(const std::string& identity) {
    std::unique_lock<std::mutex> lock(mutex_);
    Lane& lane = lane_for(identity);
    if (lane.busy) return !lane.blocked;

    if (mode_ == ExecutionMode::Live) {
        lane.next_sequence.reset();
    }
    bool ok = sync_sequence(identity, lane, lock);
    if (ok) {
        logger_->info("{} next nonce {}", identity, *lane.next_sequence);
    }
    lock.unlock();
    lane.cv.notify_all();
    return ok;
}

// =============================================================================
// Dispatch
// =============================================================================

std::optional<ExecutionResult> Scheduler::process_next(const std::string& identity) {
    std::unique_lock<std::mutex> lock(mutex_);

    auto it = lanes_.find(identity);
    if (it == lanes_.end()) return std::nullopt;
    Lane& lane = *it->second;

    if (lane.busy || lane.queue.empty()) return std::nullopt;
    if (!sync_sequence(identity, lane, lock)) return std::nullopt;
    if (lane.busy || lane.queue.empty()) return std::nullopt;

    Queued item = std::move(lane.queue.front());
    lane.queue.pop_front();

    const int64_t now = clock_.now();
    if (item.request.opportunity.is_stale(now, risk_.staleness_window_ms)) {
        lock.unlock();
        ExecutionResult result = dropped(item.request.opportunity, identity,
                                         "stale at dequeue", now);
        result.request_id = item.request.request_id;
        result.mode = item.request.mode;
        logger_->info("Dropped {} ({}): quote age {}ms", item.request.request_id,
                      item.request.opportunity.id, now - item.request.opportunity.quote_timestamp);
        deliver(result);
        return result;
    }

    item.request.sequence = lane.next_sequence;
    lane.busy = true;
    lane.in_flight = item;
    lock.unlock();

    ExecutionRequest request = std::move(item.request);
    ExecutionResult result;
    try {
        request.gas = engine_.quote_gas();
        result = engine_.execute(request, item.token.get());
    } catch (const std::exception& e) {
        logger_->error("Execution of {} aborted: {}", request.request_id, e.what());
        result = dropped(request.opportunity, identity, e.what(), clock_.now());
        result.request_id = request.request_id;
        result.sequence = request.sequence;
        result.mode = request.mode;
        result.outcome = ExecutionOutcome::Failed;
        result.needs_reconciliation = request.mode == ExecutionMode::Live;
    }

    lock.lock();
    settle(lane, result);
    lane.busy = false;
    lane.in_flight.reset();
    lock.unlock();
    lane.cv.notify_all();

    deliver(result);
    return result;
}

void Scheduler::spawn_dispatcher(const std::string& identity, Lane& lane) {
    lane.dispatcher = std::thread(&Scheduler::dispatch_loop, this, identity);
}

void Scheduler::dispatch_loop(const std::string& identity) {
    std::unique_lock<std::mutex> lock(mutex_);
    Lane& lane = *lanes_.at(identity);

    while (running_.load()) {
        lane.cv.wait(lock, [&] {
            return !running_.load() || (!lane.queue.empty() && !lane.busy);
        });
        if (!running_.load()) break;

        lock.unlock();
        auto result = process_next(identity);
        lock.lock();

        // Blocked identity: give the ledger time to settle before asking again
        if (!result && (lane.blocked || !lane.next_sequence)) {
            lane.cv.wait_for(lock, std::chrono::milliseconds(config_.reconcile_interval_ms),
                             [this] { return !running_.load(); });
        }
    }
}

void Scheduler::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) {
        throw std::runtime_error("Scheduler cannot be restarted after stop()");
    }
    if (running_.exchange(true)) {
        return;  // Already running
    }
    for (auto& [identity, lane] : lanes_) {
        spawn_dispatcher(identity, *lane);
    }
    logger_->info("Started {} dispatcher(s) in {} mode", lanes_.size(), to_string(mode_));
}

void Scheduler::stop() {
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) return;
        stopped_ = true;
        running_.store(false);
        for (auto& [identity, lane] : lanes_) {
            if (lane->in_flight) lane->in_flight->token->cancel();
            if (lane->dispatcher.joinable()) threads.push_back(std::move(lane->dispatcher));
            lane->cv.notify_all();
        }
    }

    for (auto& t : threads) {
        t.join();
    }

    std::vector<ExecutionResult> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const int64_t now = clock_.now();
        for (auto& [identity, lane] : lanes_) {
            for (auto& item : lane->queue) {
                auto result = dropped(item.request.opportunity, identity, "scheduler stopped", now);
                result.request_id = item.request.request_id;
                result.mode = item.request.mode;
                drained.push_back(std::move(result));
            }
            lane->queue.clear();
        }
    }

    for (const auto& result : drained) {
        deliver(result);
    }
}

// =============================================================================
// Cancellation and queries
// =============================================================================

bool Scheduler::cancel(const std::string& request_id) {
    std::unique_lock<std::mutex> lock(mutex_);

    for (auto& [identity, lane] : lanes_) {
        for (auto it = lane->queue.begin(); it != lane->queue.end(); ++it) {
            if (it->request.request_id != request_id) continue;

            auto result = dropped(it->request.opportunity, identity, "cancelled", clock_.now());
            result.request_id = request_id;
            result.mode = it->request.mode;
            lane->queue.erase(it);
            lock.unlock();

            logger_->info("Cancelled queued {}", request_id);
            deliver(result);
            return true;
        }

        if (lane->in_flight && lane->in_flight->request.request_id == request_id) {
            lane->in_flight->token->cancel();
            logger_->info("Cancelling in-flight {}", request_id);
            return true;
        }
    }
    return false;
}

size_t Scheduler::pending(const std::string& identity) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Lane* lane = find_lane(identity);
    return lane ? lane->queue.size() : 0;
}

bool Scheduler::in_flight(const std::string& identity) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Lane* lane = find_lane(identity);
    return lane && lane->in_flight.has_value();
}

bool Scheduler::blocked(const std::string& identity) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Lane* lane = find_lane(identity);
    return lane && lane->blocked;
}

std::optional<uint64_t> Scheduler::next_sequence(const std::string& identity) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Lane* lane = find_lane(identity);
    return lane ? lane->next_sequence : std::nullopt;
}

}  // namespace sniper
