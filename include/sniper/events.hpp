// Sniper Taker Engine - Event Bus
// Structured observation events for terminal results and rejections

#pragma once

#include <sniper/types.hpp>
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace spdlog { class logger; }

namespace sniper {

enum class EventKind : uint8_t {
    ExecutionConfirmed = 0,
    ExecutionFailed = 1,
    ExecutionDropped = 2,
    RiskRejected = 3,
    SchedulingRejected = 4
};

inline constexpr const char* to_string(EventKind k) noexcept {
    switch (k) {
        case EventKind::ExecutionConfirmed: return "execution_confirmed";
        case EventKind::ExecutionFailed: return "execution_failed";
        case EventKind::ExecutionDropped: return "execution_dropped";
        case EventKind::RiskRejected: return "risk_rejected";
        case EventKind::SchedulingRejected: return "scheduling_rejected";
    }
    return "unknown";
}

struct Event {
    int64_t timestamp = 0;
    std::string market_id;
    EventKind kind = EventKind::ExecutionConfirmed;
    nlohmann::json payload = nlohmann::json::object();
};

using EventCallback = std::function<void(const Event&)>;

// JSON payloads
void to_json(nlohmann::json& j, const Opportunity& opp);
void to_json(nlohmann::json& j, const ExecutionResult& result);

// Event for a terminal execution result; kind follows the outcome
Event make_result_event(const ExecutionResult& result);

class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    void subscribe(EventCallback callback);

    // Delivers synchronously to every subscriber in subscription order
    void emit(const Event& event);

    [[nodiscard]] uint64_t emitted() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return emitted_;
    }

private:
    std::vector<EventCallback> callbacks_;
    uint64_t emitted_ = 0;
    mutable std::mutex mutex_;
};

// Logs every event with its payload
class LoggingEventSink {
public:
    explicit LoggingEventSink(EventBus& bus);

private:
    void on_event(const Event& event) const;

    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace sniper
