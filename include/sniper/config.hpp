// Sniper Taker Engine - Configuration
// Loaded once at startup; builder methods for programmatic setup

#pragma once

#include <sniper/types.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace sniper {

struct GeneralConfig {
    std::string log_level = "info";
    ExecutionMode mode = ExecutionMode::DryRun;
    std::string identity = "default";   // signing identity (wallet address)
};

struct DetectorConfig {
    double min_edge_threshold = 0.02;
    double min_size_threshold = 0.0;
    double position_size = 50.0;   // capital per trade
    double min_expected_profit = 0.0;   // USD over the estimated gas cost
};

enum class ValuationModelKind : uint8_t {
    OrnsteinUhlenbeck = 0,
    Constant = 1,
    Empirical = 2
};

inline constexpr const char* to_string(ValuationModelKind k) noexcept {
    switch (k) {
        case ValuationModelKind::OrnsteinUhlenbeck: return "ou";
        case ValuationModelKind::Constant: return "constant";
        case ValuationModelKind::Empirical: return "empirical";
    }
    return "unknown";
}

struct ValuationConfig {
    ValuationModelKind model = ValuationModelKind::OrnsteinUhlenbeck;
    size_t min_history = 20;
    size_t window = 200;
    int64_t horizon_ms = 60000;
    double fair_value = 0.5;   // constant model only
};

struct RiskConfig {
    int64_t cooldown_ms = 30000;
    Decimal per_market_cap = Decimal::from_double(500.0);
    Decimal global_cap = Decimal::from_double(2000.0);
    int64_t staleness_window_ms = 5000;
};

struct SchedulerConfig {
    size_t queue_depth = 8;
    int64_t reconcile_interval_ms = 2000;   // retry period while an identity is blocked
};

struct ExecutionConfig {
    uint64_t gas_limit = 300000;
    double priority_fee_gwei = 30.0;
    double gas_priority_bound_gwei = 100.0;
    double retry_fee_multiplier = 1.5;
    int fee_history_blocks = 5;
    double default_base_fee_gwei = 50.0;
    int64_t confirmation_timeout_ms = 120000;
    int64_t poll_interval_ms = 2000;
    double native_token_usd = 0.50;
    double max_slippage = 0.05;   // tolerated adverse move from the quoted price
};

struct FeedConfig {
    std::string api_url = "https://gamma-api.polymarket.com";
    int64_t poll_interval_ms = 3000;
    int timeout_ms = 15000;
    std::vector<std::string> markets;
};

struct SignerConfig {
    std::string url;        // signing service
    std::string node_url;   // chain RPC for fee history
};

class Config {
public:
    GeneralConfig general;
    DetectorConfig detector;
    ValuationConfig valuation;
    RiskConfig risk;
    SchedulerConfig scheduler;
    ExecutionConfig execution;
    FeedConfig feed;
    SignerConfig signer;

    Config() = default;

    // Load from TOML file
    static Config from_file(std::string_view path);

    // Load from TOML string
    static Config from_toml(std::string_view content);

    // Throws ConfigError on the first invalid setting
    void validate() const;

    // Builder methods
    Config& set_mode(ExecutionMode mode) {
        general.mode = mode;
        return *this;
    }

    Config& set_identity(std::string_view identity) {
        general.identity = std::string(identity);
        return *this;
    }

    Config& set_min_edge(double edge) {
        detector.min_edge_threshold = edge;
        return *this;
    }

    Config& set_min_size(double size) {
        detector.min_size_threshold = size;
        return *this;
    }

    Config& set_cooldown_ms(int64_t ms) {
        risk.cooldown_ms = ms;
        return *this;
    }

    Config& set_per_market_cap(Decimal cap) {
        risk.per_market_cap = cap;
        return *this;
    }

    Config& set_global_cap(Decimal cap) {
        risk.global_cap = cap;
        return *this;
    }

    Config& set_staleness_window_ms(int64_t ms) {
        risk.staleness_window_ms = ms;
        return *this;
    }

    Config& set_queue_depth(size_t depth) {
        scheduler.queue_depth = depth;
        return *this;
    }

    Config& set_min_expected_profit(double usd) {
        detector.min_expected_profit = usd;
        return *this;
    }

    Config& set_max_slippage(double fraction) {
        execution.max_slippage = fraction;
        return *this;
    }

    Config& set_gas_priority_bound(double gwei) {
        execution.gas_priority_bound_gwei = gwei;
        return *this;
    }

    Config& add_market(std::string_view market_id) {
        feed.markets.emplace_back(market_id);
        return *this;
    }
};

}  // namespace sniper
