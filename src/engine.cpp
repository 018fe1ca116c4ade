// Sniper Taker Engine - Execution Engine Implementation

#include <sniper/engine.hpp>
#include <sniper/errors.hpp>
#include <sniper/log.hpp>
#include <algorithm>

namespace sniper {

namespace {

bool is_cancelled(const CancelToken* cancel) noexcept {
    return cancel && cancel->cancelled();
}

ExecutionResult start_result(const ExecutionRequest& request) {
    ExecutionResult result;
    result.request_id = request.request_id;
    result.opportunity_id = request.opportunity.id;
    result.market_id = request.opportunity.market_id;
    result.identity = request.identity;
    result.sequence = request.sequence;
    result.mode = request.mode;
    return result;
}

}  // namespace

ExecutionEngine::ExecutionEngine(ExecutionConfig config,
                                 const QuoteSource& quotes,
                                 Signer* signer,
                                 FeeOracle* fee_oracle,
                                 Clock& clock)
    : config_(config),
      quotes_(quotes),
      signer_(signer),
      clock_(clock),
      pricer_(config, fee_oracle),
      logger_(log::get("engine")) {}

ExecutionResult ExecutionEngine::execute(const ExecutionRequest& request,
                                         const CancelToken* cancel) {
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.attempted;
    }

    if (request.mode == ExecutionMode::DryRun) {
        return finish(dry_run(request, cancel));
    }
    return finish(live(request, cancel));
}

bool ExecutionEngine::within_slippage(const Opportunity& opp, double price) const noexcept {
    if (opp.action == TradeAction::Buy) {
        return price <= opp.price * (1.0 + config_.max_slippage);
    }
    return price >= opp.price * (1.0 - config_.max_slippage);
}

ExecutionResult ExecutionEngine::finish(ExecutionResult result) {
    result.completed_at = clock_.now();

    std::lock_guard<std::mutex> lock(stats_mutex_);
    switch (result.outcome) {
        case ExecutionOutcome::Confirmed: ++stats_.confirmed; break;
        case ExecutionOutcome::Failed: ++stats_.failed; break;
        case ExecutionOutcome::Dropped: ++stats_.dropped; break;
    }
    stats_.gas_spent_usd += result.gas_cost_usd;
    return result;
}

EngineStats ExecutionEngine::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

// =============================================================================
// Dry-Run
// =============================================================================

ExecutionResult ExecutionEngine::dry_run(const ExecutionRequest& request,
                                         const CancelToken* cancel) {
    ExecutionResult result = start_result(request);
    const auto& opp = request.opportunity;

    if (is_cancelled(cancel)) {
        result.outcome = ExecutionOutcome::Dropped;
        result.error = "cancelled";
        return result;
    }

    auto quote = quotes_.latest(opp.market_id, opp.side);
    if (!quote) {
        result.outcome = ExecutionOutcome::Failed;
        result.error = "no quote for " + opp.market_id + "/" + to_string(opp.side);
        return result;
    }

    if (!within_slippage(opp, quote->price)) {
        result.outcome = ExecutionOutcome::Failed;
        result.error = "price moved from " + std::to_string(opp.price) + " to " +
                       std::to_string(quote->price) + ", beyond max slippage";
        logger_->warn("[dry-run] {}: {}", opp.id, result.error);
        return result;
    }

    // Spend no more than the approved notional at the price actually paid
    double filled = std::min(opp.size, quote->size);
    if (quote->price > 0.0) {
        filled = std::min(filled, opp.notional().to_double() / quote->price);
    }
    if (filled <= 0.0) {
        result.outcome = ExecutionOutcome::Failed;
        result.error = "no liquidity at " + std::to_string(quote->price);
        return result;
    }

    GasParams gas = request.gas.max_fee_gwei > 0.0 ? request.gas : pricer_.price();
    result.outcome = ExecutionOutcome::Confirmed;
    result.realized_price = quote->price;
    result.filled_size = filled;
    result.gas_used = gas.gas_limit;
    result.effective_gas_price_gwei = gas.base_fee_gwei + gas.priority_fee_gwei;
    result.gas_cost_usd = GasPricer::cost_usd(
        result.gas_used, result.effective_gas_price_gwei, config_.native_token_usd);
    result.tx_hash = "dryrun-" + request.request_id;
    result.attempts = 1;
    result.sequence_consumed = true;

    logger_->info("[dry-run] {} {} {} {:.2f} @ {:.4f} (quoted {:.4f}), gas ${:.4f}",
                  opp.id, to_string(opp.action), to_string(opp.side),
                  filled, quote->price, opp.price, result.gas_cost_usd);
    return result;
}

// =============================================================================
// Live
// =============================================================================

ExecutionResult ExecutionEngine::live(const ExecutionRequest& request,
                                      const CancelToken* cancel) {
    ExecutionResult result = start_result(request);
    const auto& opp = request.opportunity;
    result.outcome = ExecutionOutcome::Failed;

    if (!signer_) {
        result.error = "live execution without a signer";
        logger_->error("{}: {}", request.request_id, result.error);
        return result;
    }
    if (!request.sequence) {
        result.error = "no sequence number assigned";
        logger_->error("{}: {}", request.request_id, result.error);
        return result;
    }
    if (is_cancelled(cancel)) {
        result.outcome = ExecutionOutcome::Dropped;
        result.error = "cancelled before broadcast";
        return result;
    }

    UnsignedTx tx;
    tx.identity = request.identity;
    tx.nonce = *request.sequence;
    tx.market_id = opp.market_id;
    tx.side = opp.side;
    tx.action = opp.action;
    tx.price = opp.price;
    tx.size = opp.size;
    tx.notional = opp.notional().to_double();
    tx.min_size = opp.size * (1.0 - config_.max_slippage);

    std::optional<TxHandle> handle;
    GasParams gas;
    for (int attempt = 1; attempt <= 2 && !handle; ++attempt) {
        if (attempt == 1 && request.gas.max_fee_gwei > 0.0) {
            gas = request.gas;
        } else {
            gas = pricer_.price(attempt == 1 ? 1.0 : config_.retry_fee_multiplier);
        }
        tx.gas = gas;
        result.attempts = attempt;
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            ++stats_.broadcasts;
        }
        try {
            handle = signer_->sign_and_broadcast(tx);
        } catch (const ExecutionFailure& e) {
            result.error = e.what();
            logger_->warn("{} nonce {} attempt {} failed (priority {:.2f} gwei): {}",
                          request.request_id, tx.nonce, attempt, gas.priority_fee_gwei, e.what());
        }
    }

    if (!handle) {
        logger_->error("{} nonce {} not broadcast: {}", request.request_id, tx.nonce, result.error);
        return result;
    }

    result.error.clear();
    result.tx_hash = handle->tx_hash;
    logger_->info("{} broadcast nonce {} tx {} (max fee {:.2f} gwei)",
                  request.request_id, tx.nonce, handle->tx_hash, gas.max_fee_gwei);

    await_confirmation(*handle, result, gas, opp, cancel);
    return result;
}

void ExecutionEngine::await_confirmation(const TxHandle& handle, ExecutionResult& result,
                                         const GasParams& gas, const Opportunity& opp,
                                         const CancelToken* cancel) {
    const int64_t deadline = clock_.now() + config_.confirmation_timeout_ms;

    for (;;) {
        if (is_cancelled(cancel)) {
            result.outcome = ExecutionOutcome::Failed;
            result.needs_reconciliation = true;
            result.error = "confirmation wait abandoned";
            logger_->warn("{} tx {}: {}", result.request_id, handle.tx_hash, result.error);
            return;
        }

        TxStatus status;
        try {
            status = signer_->poll_status(handle);
        } catch (const ExecutionFailure& e) {
            logger_->warn("{} status poll failed: {}", result.request_id, e.what());
        }

        if (status.state == TxState::Confirmed) {
            const TxReceipt receipt = status.receipt.value_or(TxReceipt{});
            result.outcome = ExecutionOutcome::Confirmed;
            result.sequence_consumed = true;
            result.gas_used = receipt.gas_used;
            result.effective_gas_price_gwei = receipt.effective_gas_price_gwei > 0.0
                ? receipt.effective_gas_price_gwei
                : gas.base_fee_gwei + gas.priority_fee_gwei;
            result.gas_cost_usd = GasPricer::cost_usd(
                result.gas_used, result.effective_gas_price_gwei, config_.native_token_usd);
            result.realized_price = receipt.fill_price.value_or(opp.price);
            result.filled_size = receipt.filled_size.value_or(opp.size);
            logger_->info("{} confirmed tx {} gas {} (${:.4f})",
                          result.request_id, handle.tx_hash, result.gas_used, result.gas_cost_usd);
            return;
        }

        if (status.state == TxState::Rejected) {
            result.outcome = ExecutionOutcome::Failed;
            result.needs_reconciliation = true;
            result.error = "rejected on-chain: " + status.reason;
            logger_->error("{} tx {} {}", result.request_id, handle.tx_hash, result.error);
            return;
        }

        if (clock_.now() >= deadline) {
            result.outcome = ExecutionOutcome::Failed;
            result.needs_reconciliation = true;
            result.error = "confirmation timeout after " +
                           std::to_string(config_.confirmation_timeout_ms) + "ms";
            logger_->error("{} tx {} {}", result.request_id, handle.tx_hash, result.error);
            return;
        }

        clock_.sleep_for(std::chrono::milliseconds(config_.poll_interval_ms));
    }
}

}  // namespace sniper
