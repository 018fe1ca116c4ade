// Sniper Taker Engine - Gas Pricing
// EIP-1559 fee parameters from recent base fees

#pragma once

#include <sniper/config.hpp>
#include <sniper/signer.hpp>
#include <sniper/types.hpp>
#include <memory>

namespace spdlog { class logger; }

namespace sniper {

class GasPricer {
public:
    // oracle may be null: the configured default base fee is used
    GasPricer(ExecutionConfig config, FeeOracle* oracle);

    // max_fee = 2 * base + priority, priority = configured fee * multiplier
    // capped at the configured bound
    [[nodiscard]] GasParams price(double priority_multiplier = 1.0) const;

    // Highest base fee over the configured history; default on oracle failure
    [[nodiscard]] double base_fee() const;

    // USD cost of one transaction at the current first-attempt price
    [[nodiscard]] double estimated_cost_usd() const;

    [[nodiscard]] static double cost_usd(uint64_t gas_used, double gas_price_gwei,
                                         double native_token_usd) noexcept {
        return static_cast<double>(gas_used) * gas_price_gwei * 1e-9 * native_token_usd;
    }

private:
    ExecutionConfig config_;
    FeeOracle* oracle_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace sniper
