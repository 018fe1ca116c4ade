// Sniper Taker Engine - Event Bus Implementation

#include <sniper/events.hpp>
#include <sniper/log.hpp>

namespace sniper {

using json = nlohmann::json;

void to_json(json& j, const Opportunity& opp) {
    j = json{
        {"id", opp.id},
        {"market_id", opp.market_id},
        {"side", to_string(opp.side)},
        {"action", to_string(opp.action)},
        {"price", opp.price},
        {"fair_value", opp.fair_value},
        {"edge", opp.edge},
        {"signed_edge", opp.signed_edge},
        {"size", opp.size},
        {"notional", opp.notional().to_double()},
        {"expected_value", opp.expected_value()},
        {"quote_timestamp", opp.quote_timestamp},
        {"detected_at", opp.detected_at}
    };
}

void to_json(json& j, const ExecutionResult& result) {
    j = json{
        {"request_id", result.request_id},
        {"opportunity_id", result.opportunity_id},
        {"identity", result.identity},
        {"outcome", to_string(result.outcome)},
        {"mode", to_string(result.mode)},
        {"filled_size", result.filled_size},
        {"gas_used", result.gas_used},
        {"gas_price_gwei", result.effective_gas_price_gwei},
        {"gas_cost_usd", result.gas_cost_usd},
        {"attempts", result.attempts},
        {"completed_at", result.completed_at}
    };
    j["sequence"] = result.sequence ? json(*result.sequence) : json(nullptr);
    j["realized_price"] = result.realized_price ? json(*result.realized_price) : json(nullptr);
    if (!result.tx_hash.empty()) j["tx_hash"] = result.tx_hash;
    if (result.needs_reconciliation) j["needs_reconciliation"] = true;
    if (!result.error.empty()) j["error"] = result.error;
}

Event make_result_event(const ExecutionResult& result) {
    Event event;
    event.timestamp = result.completed_at;
    event.market_id = result.market_id;
    switch (result.outcome) {
        case ExecutionOutcome::Confirmed: event.kind = EventKind::ExecutionConfirmed; break;
        case ExecutionOutcome::Failed: event.kind = EventKind::ExecutionFailed; break;
        case ExecutionOutcome::Dropped: event.kind = EventKind::ExecutionDropped; break;
    }
    event.payload = result;
    return event;
}

// =============================================================================
// EventBus
// =============================================================================

void EventBus::subscribe(EventCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.push_back(std::move(callback));
}

void EventBus::emit(const Event& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++emitted_;
    for (const auto& callback : callbacks_) {
        try {
            callback(event);
        } catch (const std::exception& e) {
            log::get("events")->error("Subscriber failed on {}: {}", to_string(event.kind), e.what());
        }
    }
}

// =============================================================================
// LoggingEventSink
// =============================================================================

LoggingEventSink::LoggingEventSink(EventBus& bus) : logger_(log::get("events")) {
    bus.subscribe([this](const Event& event) { on_event(event); });
}

void LoggingEventSink::on_event(const Event& event) const {
    switch (event.kind) {
        case EventKind::ExecutionConfirmed:
            logger_->info("[{}] {} {}", event.market_id, to_string(event.kind), event.payload.dump());
            break;
        case EventKind::ExecutionFailed:
            logger_->error("[{}] {} {}", event.market_id, to_string(event.kind), event.payload.dump());
            break;
        default:
            logger_->warn("[{}] {} {}", event.market_id, to_string(event.kind), event.payload.dump());
            break;
    }
}

}  // namespace sniper
