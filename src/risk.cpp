// Sniper Taker Engine - Risk Gate Implementation

#include <sniper/risk.hpp>
#include <sniper/log.hpp>
#include <algorithm>
#include <stdexcept>

namespace sniper {

namespace {

double ratio(Decimal num, Decimal den) noexcept {
    if (!den.is_positive()) return 0.0;
    return num.to_double() / den.to_double();
}

}  // namespace

RiskGate::RiskGate(RiskConfig config, const Clock& clock)
    : config_(config), clock_(clock), logger_(log::get("risk")) {
    worker_ = std::thread(&RiskGate::run, this);
}

RiskGate::~RiskGate() {
    stop();
}

void RiskGate::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
    }
    queue_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void RiskGate::post(Command command) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_) {
            throw std::runtime_error("Risk gate is stopped");
        }
        queue_.push_back(std::move(command));
    }
    queue_cv_.notify_one();
}

void RiskGate::run() {
    for (;;) {
        Command command;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) return;
            command = std::move(queue_.front());
            queue_.pop_front();
        }
        command();
    }
}

// =============================================================================
// Public API (messages to the worker)
// =============================================================================

std::future<RiskDecision> RiskGate::evaluate_async(Opportunity opp) {
    auto promise = std::make_shared<std::promise<RiskDecision>>();
    auto future = promise->get_future();
    post([this, promise, opp = std::move(opp)]() {
        try {
            promise->set_value(do_evaluate(opp));
        } catch (const std::exception&) {
            promise->set_exception(std::current_exception());
        }
    });
    return future;
}

RiskDecision RiskGate::evaluate(const Opportunity& opp) {
    return evaluate_async(opp).get();
}

void RiskGate::post_result(const ExecutionResult& result) {
    post([this, result]() { do_result(result); });
}

bool RiskGate::is_eligible(const std::string& market_id) {
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    post([this, promise, market_id]() {
        auto it = markets_.find(market_id);
        bool eligible = it == markets_.end() ||
                        cooldown_remaining(it->second, clock_.now()) == 0;
        promise->set_value(eligible);
    });
    return future.get();
}

RiskSnapshot RiskGate::snapshot() {
    auto promise = std::make_shared<std::promise<RiskSnapshot>>();
    auto future = promise->get_future();
    post([this, promise]() { promise->set_value(do_snapshot()); });
    return future.get();
}

// =============================================================================
// Worker-side state transitions
// =============================================================================

int64_t RiskGate::cooldown_remaining(const MarketExposure& market, int64_t now) const {
    if (!market.last_execution) return 0;
    int64_t elapsed = now - *market.last_execution;
    return elapsed >= config_.cooldown_ms ? 0 : config_.cooldown_ms - elapsed;
}

RiskDecision RiskGate::do_evaluate(const Opportunity& opp) {
    const int64_t now = clock_.now();
    const Decimal notional = opp.notional();
    auto& market = markets_[opp.market_id];

    auto reject = [&](RejectReason reason, std::string detail) {
        ++rejections_[static_cast<size_t>(reason)];
        logger_->debug("Rejected {} ({}): {}", opp.id, to_string(reason), detail);
        return RiskDecision::reject(reason, std::move(detail));
    };

    if (int64_t remaining = cooldown_remaining(market, now); remaining > 0) {
        return reject(RejectReason::CooldownActive,
                      "cooldown " + std::to_string(remaining) + "ms remaining");
    }

    Decimal market_after = market.committed + market.reserved + notional;
    if (market_after > config_.per_market_cap) {
        return reject(RejectReason::MarketExposureExceeded,
                      market_after.to_string() + " > " + config_.per_market_cap.to_string());
    }

    Decimal global_after = committed_ + reserved_ + notional;
    if (global_after > config_.global_cap) {
        return reject(RejectReason::GlobalExposureExceeded,
                      global_after.to_string() + " > " + config_.global_cap.to_string());
    }

    if (opp.is_stale(now, config_.staleness_window_ms)) {
        return reject(RejectReason::StaleOpportunity,
                      "quote age " + std::to_string(now - opp.quote_timestamp) + "ms");
    }

    market.reserved += notional;
    market.last_execution = now;
    reserved_ += notional;
    reservations_[opp.id] = Reservation{opp.market_id, notional};
    ++approvals_;

    logger_->info("Approved {} {} {} @ {:.4f} size {:.2f} edge {:.4f} notional {}",
                  opp.id, to_string(opp.action), to_string(opp.side),
                  opp.price, opp.size, opp.edge, notional.to_string());
    return RiskDecision::approve();
}

void RiskGate::do_result(const ExecutionResult& result) {
    auto it = reservations_.find(result.opportunity_id);
    if (it == reservations_.end()) {
        logger_->warn("Result for unknown reservation {} ({})",
                      result.opportunity_id, to_string(result.outcome));
        return;
    }

    Reservation reservation = std::move(it->second);
    reservations_.erase(it);

    auto& market = markets_[reservation.market_id];
    market.reserved -= reservation.notional;
    reserved_ -= reservation.notional;

    if (result.outcome != ExecutionOutcome::Confirmed) {
        logger_->info("Released {} for {} ({})", reservation.notional.to_string(),
                      result.opportunity_id, to_string(result.outcome));
        return;
    }

    Decimal filled = reservation.notional;
    if (result.realized_price) {
        filled = Decimal::from_double(result.filled_size * *result.realized_price);
    }
    // Exposure never grows past what was approved
    if (filled > reservation.notional) {
        logger_->warn("Fill of {} for {} exceeds its reservation {}, committing the reservation",
                      filled.to_string(), result.opportunity_id, reservation.notional.to_string());
        filled = reservation.notional;
    }
    market.committed += filled;
    committed_ += filled;
    logger_->info("Committed {} for {}", filled.to_string(), result.opportunity_id);
}

MarketRiskSnapshot RiskGate::market_snapshot(
    const std::string& id, const MarketExposure& m, int64_t now) const {
    MarketRiskSnapshot snap;
    snap.market_id = id;
    snap.committed = m.committed;
    snap.reserved = m.reserved;
    snap.last_execution = m.last_execution;
    snap.cooldown_remaining_ms = cooldown_remaining(m, now);
    snap.utilisation = ratio(m.committed + m.reserved, config_.per_market_cap);
    return snap;
}

RiskSnapshot RiskGate::do_snapshot() const {
    const int64_t now = clock_.now();

    RiskSnapshot snap;
    snap.taken_at = now;
    for (const auto& [id, market] : markets_) {
        snap.markets.push_back(market_snapshot(id, market, now));
    }
    std::sort(snap.markets.begin(), snap.markets.end(),
              [](const auto& a, const auto& b) { return a.market_id < b.market_id; });

    snap.committed = committed_;
    snap.reserved = reserved_;
    snap.global_cap = config_.global_cap;
    snap.utilisation = ratio(committed_ + reserved_, config_.global_cap);
    snap.open_reservations = reservations_.size();
    snap.approvals = approvals_;
    snap.rejections = rejections_;
    return snap;
}

}  // namespace sniper
