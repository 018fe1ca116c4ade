// Sniper Taker Engine - Valuation Models Implementation

#include <sniper/valuation.hpp>
#include <sniper/errors.hpp>
#include <sniper/math.hpp>
#include <cmath>

namespace sniper {

namespace {

double confidence_from_variance(double variance) noexcept {
    if (!(variance > 0.0)) return 1.0;
    return 1.0 / (1.0 + 10.0 * std::sqrt(variance));
}

void require_history(const std::string& market_id, const PriceHistory& history, size_t need) {
    if (history.size() < need) {
        throw InsufficientHistory(market_id, history.size(), need);
    }
}

}  // namespace

// =============================================================================
// Price History
// =============================================================================

void PriceHistory::add(int64_t timestamp, double price) {
    observations_.push_back({timestamp, price});
    while (observations_.size() > capacity_) {
        observations_.pop_front();
    }
}

std::vector<double> PriceHistory::prices() const {
    std::vector<double> out;
    out.reserve(observations_.size());
    for (const auto& o : observations_) {
        out.push_back(o.price);
    }
    return out;
}

int64_t PriceHistory::median_interval_ms() const {
    if (observations_.size() < 2) return 0;
    std::vector<double> gaps;
    gaps.reserve(observations_.size() - 1);
    for (size_t i = 1; i < observations_.size(); ++i) {
        gaps.push_back(static_cast<double>(
            observations_[i].timestamp - observations_[i - 1].timestamp));
    }
    return static_cast<int64_t>(math::median(std::move(gaps)));
}

void HistoryStore::record(const std::string& market_id, int64_t timestamp, double price) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = histories_.find(market_id);
    if (it == histories_.end()) {
        it = histories_.emplace(market_id, PriceHistory(window_)).first;
    }
    it->second.add(timestamp, price);
}

PriceHistory HistoryStore::snapshot(const std::string& market_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = histories_.find(market_id);
    return it != histories_.end() ? it->second : PriceHistory(window_);
}

size_t HistoryStore::size(const std::string& market_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = histories_.find(market_id);
    return it != histories_.end() ? it->second.size() : 0;
}

// =============================================================================
// Ornstein-Uhlenbeck
// =============================================================================

OuValuationModel::OuValuationModel(size_t min_history, int64_t horizon_ms)
    : min_history_(min_history < 3 ? 3 : min_history), horizon_ms_(horizon_ms) {}

ValuationEstimate OuValuationModel::estimate(
    const std::string& market_id,
    const PriceHistory& history) const {

    require_history(market_id, history, min_history_);

    std::vector<double> prices = history.prices();
    const double last = prices.back();
    const auto fit = math::fit_ar1(prices);

    double dt = static_cast<double>(history.median_interval_ms()) / 1000.0;
    if (dt <= 0.0) dt = 1.0;
    const double horizon = static_cast<double>(horizon_ms_) / 1000.0;

    double value;
    double var;
    const double b = fit.slope;

    if (!std::isfinite(b) || b >= 1.0) {
        // No reversion observed: random walk, best guess is the last print
        value = last;
        var = fit.residual_variance * (horizon / dt);
    } else if (b <= 0.0) {
        // Reverts within one step
        value = math::mean(prices);
        var = math::variance(prices);
    } else {
        const double theta = -std::log(b) / dt;
        const double mu = fit.intercept / (1.0 - b);
        const double decay = std::exp(-theta * horizon);
        value = mu + (last - mu) * decay;
        var = fit.residual_variance / (1.0 - b * b) * (1.0 - decay * decay);
    }

    ValuationEstimate est;
    est.market_id = market_id;
    est.value = math::clamp_probability(value);
    est.variance = var > 0.0 ? var : 0.0;
    est.confidence = confidence_from_variance(est.variance);
    est.timestamp = history.last().timestamp;
    est.observations = history.size();
    return est;
}

// =============================================================================
// Constant
// =============================================================================

ConstantValuationModel::ConstantValuationModel(double fair_value, size_t min_history)
    : fair_value_(math::clamp_probability(fair_value)), min_history_(min_history) {}

ValuationEstimate ConstantValuationModel::estimate(
    const std::string& market_id,
    const PriceHistory& history) const {

    require_history(market_id, history, min_history_);

    ValuationEstimate est;
    est.market_id = market_id;
    est.value = fair_value_;
    est.timestamp = history.empty() ? 0 : history.last().timestamp;
    est.observations = history.size();
    return est;
}

// =============================================================================
// Empirical frequency
// =============================================================================

EmpiricalValuationModel::EmpiricalValuationModel(size_t min_history)
    : min_history_(min_history < 1 ? 1 : min_history) {}

ValuationEstimate EmpiricalValuationModel::estimate(
    const std::string& market_id,
    const PriceHistory& history) const {

    require_history(market_id, history, min_history_);

    std::vector<double> prices = history.prices();

    ValuationEstimate est;
    est.market_id = market_id;
    est.value = math::clamp_probability(math::mean(prices));
    est.variance = math::variance(prices) / static_cast<double>(prices.size());
    est.confidence = confidence_from_variance(est.variance);
    est.timestamp = history.last().timestamp;
    est.observations = history.size();
    return est;
}

std::unique_ptr<ValuationModel> make_valuation_model(const ValuationConfig& config) {
    switch (config.model) {
        case ValuationModelKind::OrnsteinUhlenbeck:
            return std::make_unique<OuValuationModel>(config.min_history, config.horizon_ms);
        case ValuationModelKind::Constant:
            return std::make_unique<ConstantValuationModel>(config.fair_value, 1);
        case ValuationModelKind::Empirical:
            return std::make_unique<EmpiricalValuationModel>(config.min_history);
    }
    throw ConfigError("Unsupported valuation model");
}

}  // namespace sniper
