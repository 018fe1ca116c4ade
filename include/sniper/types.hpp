// Sniper Taker Engine - Core Types
// Quotes, valuations, opportunities and execution records

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sniper {

// Fixed-point decimal for capital amounts (exposure, caps, notionals)
// Stores value as integer * 10^(-precision)
class Decimal {
public:
    static constexpr int PRECISION = 8;
    static constexpr int64_t SCALE = 100000000LL;

    constexpr Decimal() noexcept : value_(0) {}
    constexpr explicit Decimal(int64_t scaled) noexcept : value_(scaled) {}

    static Decimal from_double(double d) noexcept;
    static Decimal from_string(std::string_view s);

    [[nodiscard]] double to_double() const noexcept {
        return static_cast<double>(value_) / SCALE;
    }

    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] int64_t scaled_value() const noexcept { return value_; }

    constexpr Decimal operator+(Decimal rhs) const noexcept {
        return Decimal(value_ + rhs.value_);
    }
    constexpr Decimal operator-(Decimal rhs) const noexcept {
        return Decimal(value_ - rhs.value_);
    }
    constexpr Decimal operator*(Decimal rhs) const noexcept {
        return Decimal(static_cast<int64_t>(
            (static_cast<__int128>(value_) * rhs.value_) / SCALE));
    }
    constexpr Decimal operator/(Decimal rhs) const noexcept {
        return Decimal(static_cast<int64_t>(
            (static_cast<__int128>(value_) * SCALE) / rhs.value_));
    }

    Decimal& operator+=(Decimal rhs) noexcept {
        value_ += rhs.value_;
        return *this;
    }
    Decimal& operator-=(Decimal rhs) noexcept {
        value_ -= rhs.value_;
        return *this;
    }

    constexpr bool operator==(Decimal rhs) const noexcept { return value_ == rhs.value_; }
    constexpr bool operator!=(Decimal rhs) const noexcept { return value_ != rhs.value_; }
    constexpr bool operator<(Decimal rhs) const noexcept { return value_ < rhs.value_; }
    constexpr bool operator<=(Decimal rhs) const noexcept { return value_ <= rhs.value_; }
    constexpr bool operator>(Decimal rhs) const noexcept { return value_ > rhs.value_; }
    constexpr bool operator>=(Decimal rhs) const noexcept { return value_ >= rhs.value_; }

    constexpr Decimal abs() const noexcept { return Decimal(value_ < 0 ? -value_ : value_); }
    constexpr bool is_zero() const noexcept { return value_ == 0; }
    constexpr bool is_positive() const noexcept { return value_ > 0; }
    constexpr bool is_negative() const noexcept { return value_ < 0; }

    static constexpr Decimal zero() noexcept { return Decimal(0); }
    static constexpr Decimal one() noexcept { return Decimal(SCALE); }

private:
    int64_t value_;
};

// Outcome token of a binary market
enum class OutcomeSide : uint8_t {
    Yes = 0,
    No = 1
};

inline constexpr const char* to_string(OutcomeSide s) noexcept {
    return s == OutcomeSide::Yes ? "yes" : "no";
}

inline constexpr OutcomeSide opposite(OutcomeSide s) noexcept {
    return s == OutcomeSide::Yes ? OutcomeSide::No : OutcomeSide::Yes;
}

std::optional<OutcomeSide> parse_side(std::string_view s) noexcept;

// Direction of a taker trade against the book
enum class TradeAction : uint8_t {
    Buy = 0,
    Sell = 1
};

inline constexpr const char* to_string(TradeAction a) noexcept {
    return a == TradeAction::Buy ? "buy" : "sell";
}

enum class ExecutionMode : uint8_t {
    DryRun = 0,
    Live = 1
};

inline constexpr const char* to_string(ExecutionMode m) noexcept {
    return m == ExecutionMode::DryRun ? "dry_run" : "live";
}

std::optional<ExecutionMode> parse_mode(std::string_view s) noexcept;

// Market - identity is fixed, prices refreshed each observation cycle
struct Market {
    std::string market_id;
    std::string yes_token;
    std::string no_token;
    std::optional<double> yes_taker_price;
    std::optional<double> no_taker_price;
    std::optional<double> yes_maker_price;
    std::optional<double> no_maker_price;
    double liquidity = 0.0;
    int64_t updated_at = 0;
};

// Immutable top-of-book snapshot for one outcome side
struct Quote {
    std::string market_id;
    OutcomeSide side = OutcomeSide::Yes;
    double price = 0.0;       // best taker price, probability units
    double size = 0.0;        // available size at that price
    int64_t timestamp = 0;    // observation time, unix ms

    [[nodiscard]] int64_t age_ms(int64_t now) const noexcept { return now - timestamp; }
};

// Fair value of the YES outcome
struct ValuationEstimate {
    std::string market_id;
    double value = 0.0;        // in [0, 1]
    double variance = 0.0;
    double confidence = 1.0;   // in (0, 1]
    int64_t timestamp = 0;
    size_t observations = 0;

    [[nodiscard]] double fair_value(OutcomeSide side) const noexcept {
        return side == OutcomeSide::Yes ? value : 1.0 - value;
    }
};

// Detected mispricing
struct Opportunity {
    std::string id;
    std::string market_id;
    OutcomeSide side = OutcomeSide::Yes;
    TradeAction action = TradeAction::Buy;
    double price = 0.0;
    double fair_value = 0.0;
    double signed_edge = 0.0;   // price - fair_value
    double edge = 0.0;          // |signed_edge|
    double available_size = 0.0;
    double size = 0.0;          // implied size
    int64_t quote_timestamp = 0;
    int64_t detected_at = 0;

    [[nodiscard]] Decimal notional() const noexcept {
        return Decimal::from_double(size * price);
    }

    [[nodiscard]] double expected_value() const noexcept { return size * edge; }

    [[nodiscard]] bool is_stale(int64_t now, int64_t staleness_window_ms) const noexcept {
        return now - quote_timestamp > staleness_window_ms;
    }
};

// EIP-1559 style fee parameters, all fees in gwei
struct GasParams {
    uint64_t gas_limit = 300000;
    double base_fee_gwei = 0.0;
    double priority_fee_gwei = 0.0;
    double max_fee_gwei = 0.0;
};

// Request handed from scheduler to engine
struct ExecutionRequest {
    std::string request_id;
    Opportunity opportunity;
    std::string identity;
    std::optional<uint64_t> sequence;   // assigned at dequeue, then immutable
    GasParams gas;
    ExecutionMode mode = ExecutionMode::DryRun;
    int64_t enqueued_at = 0;
};

enum class ExecutionOutcome : uint8_t {
    Confirmed = 0,
    Failed = 1,
    Dropped = 2
};

inline constexpr const char* to_string(ExecutionOutcome o) noexcept {
    switch (o) {
        case ExecutionOutcome::Confirmed: return "confirmed";
        case ExecutionOutcome::Failed: return "failed";
        case ExecutionOutcome::Dropped: return "dropped";
    }
    return "unknown";
}

// Terminal result of a request
struct ExecutionResult {
    std::string request_id;
    std::string opportunity_id;
    std::string market_id;
    std::string identity;
    std::optional<uint64_t> sequence;
    ExecutionOutcome outcome = ExecutionOutcome::Failed;
    ExecutionMode mode = ExecutionMode::DryRun;
    std::optional<double> realized_price;
    double filled_size = 0.0;
    uint64_t gas_used = 0;
    double effective_gas_price_gwei = 0.0;
    double gas_cost_usd = 0.0;
    std::string tx_hash;
    int64_t completed_at = 0;
    int attempts = 0;
    bool sequence_consumed = false;      // the nonce was used on-chain
    bool needs_reconciliation = false;   // on-chain state unknown
    std::string error;

    [[nodiscard]] bool is_confirmed() const noexcept {
        return outcome == ExecutionOutcome::Confirmed;
    }
};

// Timestamp utilities
inline int64_t now_ms() noexcept {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

}  // namespace sniper
