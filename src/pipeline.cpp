// Sniper Taker Engine - Pipeline Implementation

#include <sniper/pipeline.hpp>
#include <sniper/errors.hpp>
#include <sniper/log.hpp>
#include <sniper/normalizer.hpp>

namespace sniper {

using json = nlohmann::json;

Pipeline::Pipeline(const Config& config,
                   Clock& clock,
                   Signer* signer,
                   FeeOracle* fee_oracle,
                   Options options)
    : config_(config),
      clock_(clock),
      options_(options),
      logger_(log::get("pipeline")),
      sink_(bus_),
      history_(config.valuation.window),
      model_(make_valuation_model(config.valuation)),
      gas_(config.execution, fee_oracle),
      detector_(config.detector, clock, &gas_),
      risk_(config.risk, clock),
      engine_(config.execution, markets_, signer, fee_oracle, clock),
      scheduler_(config.scheduler, config.risk, engine_, signer, clock,
                 config.general.mode, config.general.identity) {
    for (const auto& market_id : config_.feed.markets) {
        markets_.register_market(market_id);
    }
    scheduler_.on_result([this](const ExecutionResult& result) { on_result(result); });

    logger_->info("Pipeline ready: mode={} model={} min_edge={} markets={}",
                  to_string(config_.general.mode), model_->name(),
                  config_.detector.min_edge_threshold, config_.feed.markets.size());
}

Pipeline::~Pipeline() {
    stop();
}

// =============================================================================
// Feed loop and workers
// =============================================================================

void Pipeline::run(Feed& feed) {
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        feed_ = &feed;
    }
    running_.store(true);

    if (!options_.synchronous) {
        if (config_.general.mode == ExecutionMode::Live && !scheduler_.recover()) {
            logger_->warn("Some identities are blocked until their pending transactions settle");
        }
        scheduler_.start();
    }

    while (running_.load()) {
        std::optional<RawTick> tick;
        try {
            tick = feed.next();
        } catch (const FeedError& e) {
            feed_errors_.fetch_add(1);
            logger_->warn("Feed error, skipping cycle: {}", e.what());
            continue;
        }
        if (!tick) break;

        if (options_.synchronous) {
            process_tick(*tick);
            continue;
        }

        Worker& worker = worker_for(tick->market_id);
        {
            std::lock_guard<std::mutex> lock(worker.mutex);
            worker.ticks.push_back(std::move(*tick));
        }
        worker.cv.notify_one();
    }

    if (options_.synchronous) {
        flush();
    }
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        feed_ = nullptr;
    }
}

void Pipeline::stop() {
    running_.store(false);

    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        if (feed_) feed_->stop();
        for (auto& [market_id, worker] : workers_) {
            worker->cv.notify_all();
            if (worker->thread.joinable()) threads.push_back(std::move(worker->thread));
        }
    }
    for (auto& t : threads) {
        t.join();
    }

    scheduler_.stop();
}

Pipeline::Worker& Pipeline::worker_for(const std::string& market_id) {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    auto it = workers_.find(market_id);
    if (it == workers_.end()) {
        it = workers_.emplace(market_id, std::make_unique<Worker>()).first;
        if (!options_.synchronous && running_.load()) {
            Worker& worker = *it->second;
            worker.thread = std::thread(&Pipeline::worker_loop, this, std::ref(worker));
            logger_->debug("Started worker for {}", market_id);
        }
    }
    return *it->second;
}

void Pipeline::worker_loop(Worker& worker) {
    for (;;) {
        RawTick tick;
        {
            std::unique_lock<std::mutex> lock(worker.mutex);
            worker.cv.wait(lock, [&] { return !running_.load() || !worker.ticks.empty(); });
            if (!running_.load()) return;
            tick = std::move(worker.ticks.front());
            worker.ticks.pop_front();
        }
        try {
            handle_tick(worker, tick);
        } catch (const std::exception& e) {
            logger_->error("Tick for {} failed: {}", tick.market_id, e.what());
        }
    }
}

void Pipeline::process_tick(const RawTick& raw) {
    Worker& worker = worker_for(raw.market_id);
    handle_tick(worker, raw);
    if (options_.synchronous) {
        drain_scheduler();
    }
}

void Pipeline::flush() {
    std::vector<Quote> held;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto& [market_id, worker] : workers_) {
            if (worker->held) {
                held.push_back(*worker->held);
                worker->held.reset();
            }
        }
    }
    for (const auto& quote : held) {
        evaluate(quote, std::nullopt);
    }
    if (options_.synchronous) {
        drain_scheduler();
    }
}

void Pipeline::drain_scheduler() {
    while (scheduler_.process_next(scheduler_.default_identity())) {
    }
}

// =============================================================================
// Per-tick stages
// =============================================================================

void Pipeline::handle_tick(Worker& worker, const RawTick& raw) {
    ticks_.fetch_add(1);

    Quote quote;
    try {
        quote = QuoteNormalizer::normalize(raw);
    } catch (const MalformedFeedData& e) {
        malformed_.fetch_add(1);
        logger_->warn("Skipping tick: {}", e.what());
        return;
    }

    markets_.apply(quote);
    record_history(quote);

    // Both sides of one poll cycle share a timestamp and are evaluated together
    if (worker.held && worker.held->timestamp == quote.timestamp &&
        worker.held->side != quote.side) {
        Quote first = *worker.held;
        worker.held.reset();
        evaluate(quote, first);
        return;
    }

    if (worker.held) {
        Quote previous = *worker.held;
        worker.held.reset();
        evaluate(previous, std::nullopt);
    }
    worker.held = quote;
}

void Pipeline::record_history(const Quote& quote) {
    if (quote.side != OutcomeSide::Yes) return;

    // YES mid when the NO side is known: NO taker = 1 - YES bid
    double price = quote.price;
    if (auto no = markets_.latest(quote.market_id, OutcomeSide::No)) {
        price = (quote.price + (1.0 - no->price)) / 2.0;
    }
    history_.record(quote.market_id, quote.timestamp, price);
}

void Pipeline::evaluate(const Quote& quote, const std::optional<Quote>& partner) {
    const std::string& market_id = quote.market_id;

    ValuationEstimate estimate;
    try {
        estimate = model_->estimate(market_id, history_.snapshot(market_id));
    } catch (const InsufficientHistory& e) {
        insufficient_history_.fetch_add(1);
        logger_->debug("{}", e.what());
        return;
    } catch (const ValuationError& e) {
        logger_->warn("Valuation of {} failed: {}", market_id, e.what());
        return;
    }

    std::optional<Opportunity> opp;
    if (partner) {
        const Quote& yes = quote.side == OutcomeSide::Yes ? quote : *partner;
        const Quote& no = quote.side == OutcomeSide::Yes ? *partner : quote;
        opp = detector_.detect_pair(yes, no, estimate);
    } else {
        opp = detector_.detect(quote, estimate);
    }
    if (!opp) return;
    opportunities_.fetch_add(1);

    logger_->debug("Opportunity {} {} {} @ {:.4f} fair {:.4f} edge {:.4f}",
                   opp->id, to_string(opp->action), to_string(opp->side),
                   opp->price, opp->fair_value, opp->edge);

    if (!risk_.is_eligible(market_id)) {
        cooling_skips_.fetch_add(1);
        return;
    }

    RiskDecision decision = risk_.evaluate(*opp);
    if (!decision) {
        Event event;
        event.timestamp = clock_.now();
        event.market_id = market_id;
        event.kind = EventKind::RiskRejected;
        event.payload = json{{"opportunity", *opp},
                             {"reason", to_string(*decision.reason)},
                             {"detail", decision.detail}};
        bus_.emit(event);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(edge_mutex_);
        pending_edge_[opp->id] = opp->edge;
    }

    SubmitResult submitted = scheduler_.submit(*opp);
    if (!submitted) {
        scheduling_rejections_.fetch_add(1);
        const std::string reason = to_string(*submitted.reason);
        risk_.post_result(Scheduler::dropped(*opp, scheduler_.default_identity(),
                                             reason, clock_.now()));
        {
            std::lock_guard<std::mutex> lock(edge_mutex_);
            pending_edge_.erase(opp->id);
        }

        Event event;
        event.timestamp = clock_.now();
        event.market_id = market_id;
        event.kind = EventKind::SchedulingRejected;
        event.payload = json{{"opportunity", *opp}, {"reason", reason}};
        bus_.emit(event);
    }
}

void Pipeline::on_result(const ExecutionResult& result) {
    risk_.post_result(result);

    switch (result.outcome) {
        case ExecutionOutcome::Confirmed: confirmed_.fetch_add(1); break;
        case ExecutionOutcome::Failed: failed_.fetch_add(1); break;
        case ExecutionOutcome::Dropped: dropped_.fetch_add(1); break;
    }

    {
        std::lock_guard<std::mutex> lock(edge_mutex_);
        auto it = pending_edge_.find(result.opportunity_id);
        if (it != pending_edge_.end()) {
            if (result.is_confirmed()) realized_edge_ += result.filled_size * it->second;
            pending_edge_.erase(it);
        }
    }

    bus_.emit(make_result_event(result));
}

// =============================================================================
// Reporting
// =============================================================================

PipelineReport Pipeline::report() {
    PipelineReport r;
    r.ticks = ticks_.load();
    r.malformed = malformed_.load();
    r.feed_errors = feed_errors_.load();
    r.insufficient_history = insufficient_history_.load();
    r.opportunities = opportunities_.load();
    r.unprofitable = detector_.unprofitable();
    r.cooling_skips = cooling_skips_.load();
    r.scheduling_rejections = scheduling_rejections_.load();
    r.confirmed = confirmed_.load();
    r.failed = failed_.load();
    r.dropped = dropped_.load();
    {
        std::lock_guard<std::mutex> lock(edge_mutex_);
        r.realized_edge = realized_edge_;
    }
    r.risk = risk_.snapshot();
    r.engine = engine_.stats();
    return r;
}

void log_report(const PipelineReport& report, spdlog::logger& logger) {
    logger.info("==================== REPORT ====================");
    logger.info("Ticks: {} (malformed {}, feed errors {})",
                report.ticks, report.malformed, report.feed_errors);
    logger.info("Opportunities: {} (warming up {}, below gas {}, cooling {})",
                report.opportunities, report.insufficient_history, report.unprofitable,
                report.cooling_skips);
    logger.info("Approvals: {}", report.risk.approvals);
    for (size_t i = 0; i < REJECT_REASON_COUNT; ++i) {
        auto reason = static_cast<RejectReason>(i);
        logger.info("  rejected {}: {}", to_string(reason), report.risk.rejected(reason));
    }
    logger.info("  rejected by scheduler: {}", report.scheduling_rejections);
    logger.info("Executions: {} confirmed, {} failed, {} dropped",
                report.confirmed, report.failed, report.dropped);
    logger.info("Broadcasts: {}, gas spent ${:.4f}",
                report.engine.broadcasts, report.engine.gas_spent_usd);
    logger.info("Expected edge captured: {:.4f}", report.realized_edge);
    logger.info("Exposure: {} committed, {} reserved of {} ({:.1f}%)",
                report.risk.committed.to_string(), report.risk.reserved.to_string(),
                report.risk.global_cap.to_string(), report.risk.utilisation * 100.0);
    for (const auto& m : report.risk.markets) {
        logger.info("  {}: {} ({:.1f}%), cooldown {}ms",
                    m.market_id, m.exposure().to_string(), m.utilisation * 100.0,
                    m.cooldown_remaining_ms);
    }
}

}  // namespace sniper
