// Sniper Taker Engine - Risk Gate
// Single-writer actor owning cooldowns and exposure reservations

#pragma once

#include <sniper/clock.hpp>
#include <sniper/config.hpp>
#include <sniper/types.hpp>
#include <array>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace spdlog { class logger; }

namespace sniper {

// Checked in declaration order; the first failing check is reported
enum class RejectReason : uint8_t {
    CooldownActive = 0,
    MarketExposureExceeded = 1,
    GlobalExposureExceeded = 2,
    StaleOpportunity = 3
};

inline constexpr size_t REJECT_REASON_COUNT = 4;

inline constexpr const char* to_string(RejectReason r) noexcept {
    switch (r) {
        case RejectReason::CooldownActive: return "cooldown_active";
        case RejectReason::MarketExposureExceeded: return "market_exposure_exceeded";
        case RejectReason::GlobalExposureExceeded: return "global_exposure_exceeded";
        case RejectReason::StaleOpportunity: return "stale_opportunity";
    }
    return "unknown";
}

struct RiskDecision {
    bool approved = false;
    std::optional<RejectReason> reason;
    std::string detail;

    static RiskDecision approve() { return RiskDecision{true, std::nullopt, {}}; }
    static RiskDecision reject(RejectReason r, std::string detail) {
        return RiskDecision{false, r, std::move(detail)};
    }

    explicit operator bool() const noexcept { return approved; }
};

struct MarketRiskSnapshot {
    std::string market_id;
    Decimal committed;
    Decimal reserved;
    std::optional<int64_t> last_execution;
    int64_t cooldown_remaining_ms = 0;
    double utilisation = 0.0;   // (committed + reserved) / per-market cap

    [[nodiscard]] Decimal exposure() const noexcept { return committed + reserved; }
    [[nodiscard]] bool eligible() const noexcept { return cooldown_remaining_ms == 0; }
};

struct RiskSnapshot {
    int64_t taken_at = 0;
    std::vector<MarketRiskSnapshot> markets;
    Decimal committed;
    Decimal reserved;
    Decimal global_cap;
    double utilisation = 0.0;
    size_t open_reservations = 0;
    uint64_t approvals = 0;
    std::array<uint64_t, REJECT_REASON_COUNT> rejections{};

    [[nodiscard]] Decimal exposure() const noexcept { return committed + reserved; }
    [[nodiscard]] uint64_t rejected(RejectReason r) const noexcept {
        return rejections[static_cast<size_t>(r)];
    }
};

// All state mutation happens on one worker thread draining a command queue.
// evaluate() and the queries block for their reply; post_result() does not.
class RiskGate {
public:
    RiskGate(RiskConfig config, const Clock& clock);
    ~RiskGate();

    RiskGate(const RiskGate&) = delete;
    RiskGate& operator=(const RiskGate&) = delete;

    // Approval reserves the opportunity's notional under its id
    [[nodiscard]] RiskDecision evaluate(const Opportunity& opp);
    [[nodiscard]] std::future<RiskDecision> evaluate_async(Opportunity opp);

    // Confirmed commits the reservation, Failed and Dropped release it
    void post_result(const ExecutionResult& result);

    [[nodiscard]] bool is_eligible(const std::string& market_id);
    [[nodiscard]] RiskSnapshot snapshot();

    // Drains queued commands, then joins the worker; later calls throw
    void stop();

    [[nodiscard]] const RiskConfig& config() const noexcept { return config_; }

private:
    struct MarketExposure {
        Decimal committed;
        Decimal reserved;
        std::optional<int64_t> last_execution;
    };

    struct Reservation {
        std::string market_id;
        Decimal notional;
    };

    using Command = std::function<void()>;

    void post(Command command);
    void run();

    // Worker-thread only
    RiskDecision do_evaluate(const Opportunity& opp);
    void do_result(const ExecutionResult& result);
    int64_t cooldown_remaining(const MarketExposure& market, int64_t now) const;
    MarketRiskSnapshot market_snapshot(const std::string& id, const MarketExposure& m, int64_t now) const;
    RiskSnapshot do_snapshot() const;

    RiskConfig config_;
    const Clock& clock_;
    std::shared_ptr<spdlog::logger> logger_;

    std::unordered_map<std::string, MarketExposure> markets_;
    std::unordered_map<std::string, Reservation> reservations_;
    Decimal committed_;
    Decimal reserved_;
    uint64_t approvals_ = 0;
    std::array<uint64_t, REJECT_REASON_COUNT> rejections_{};

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<Command> queue_;
    bool stopping_ = false;
    std::thread worker_;
};

}  // namespace sniper
