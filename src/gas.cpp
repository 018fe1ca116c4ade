// Sniper Taker Engine - Gas Pricing Implementation

#include <sniper/gas.hpp>
#include <sniper/errors.hpp>
#include <sniper/log.hpp>
#include <algorithm>
#include <cmath>

namespace sniper {

GasPricer::GasPricer(ExecutionConfig config, FeeOracle* oracle)
    : config_(config), oracle_(oracle), logger_(log::get("gas")) {}

double GasPricer::base_fee() const {
    if (!oracle_) return config_.default_base_fee_gwei;

    std::vector<double> fees;
    try {
        fees = oracle_->base_fees(config_.fee_history_blocks);
    } catch (const Error& e) {
        logger_->warn("Fee history unavailable ({}), using {} gwei",
                      e.what(), config_.default_base_fee_gwei);
        return config_.default_base_fee_gwei;
    }

    double base = 0.0;
    for (double fee : fees) {
        if (std::isfinite(fee)) base = std::max(base, fee);
    }
    return base > 0.0 ? base : config_.default_base_fee_gwei;
}

GasParams GasPricer::price(double priority_multiplier) const {
    GasParams gas;
    gas.gas_limit = config_.gas_limit;
    gas.base_fee_gwei = base_fee();
    gas.priority_fee_gwei = std::min(config_.priority_fee_gwei * priority_multiplier,
                                     config_.gas_priority_bound_gwei);
    gas.max_fee_gwei = 2.0 * gas.base_fee_gwei + gas.priority_fee_gwei;
    return gas;
}

double GasPricer::estimated_cost_usd() const {
    GasParams gas = price();
    return cost_usd(gas.gas_limit, gas.base_fee_gwei + gas.priority_fee_gwei,
                    config_.native_token_usd);
}

}  // namespace sniper
