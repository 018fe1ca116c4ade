// Sniper Taker Engine - Valuation Models
// Fair-value estimation for the YES outcome from observed prices.
//
// Every model is a pure function of (market_id, history): the same history
// always produces the same estimate, and no model performs I/O. Models are
// swapped through the ValuationModel interface without touching the detector.

#pragma once

#include <sniper/config.hpp>
#include <sniper/types.hpp>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sniper {

struct PriceObservation {
    int64_t timestamp = 0;
    double price = 0.0;
};

// Bounded rolling window of YES prices for one market
class PriceHistory {
public:
    explicit PriceHistory(size_t capacity = 200) : capacity_(capacity) {}

    void add(int64_t timestamp, double price);

    [[nodiscard]] size_t size() const noexcept { return observations_.size(); }
    [[nodiscard]] bool empty() const noexcept { return observations_.empty(); }
    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }

    [[nodiscard]] const PriceObservation& last() const { return observations_.back(); }
    [[nodiscard]] const std::deque<PriceObservation>& observations() const noexcept {
        return observations_;
    }

    [[nodiscard]] std::vector<double> prices() const;

    // Median spacing between consecutive observations, in milliseconds
    [[nodiscard]] int64_t median_interval_ms() const;

private:
    size_t capacity_;
    std::deque<PriceObservation> observations_;
};

// Thread-safe per-market histories; hands out snapshots
class HistoryStore {
public:
    explicit HistoryStore(size_t window) : window_(window) {}

    void record(const std::string& market_id, int64_t timestamp, double price);
    [[nodiscard]] PriceHistory snapshot(const std::string& market_id) const;
    [[nodiscard]] size_t size(const std::string& market_id) const;

private:
    size_t window_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, PriceHistory> histories_;
};

class ValuationModel {
public:
    virtual ~ValuationModel() = default;

    [[nodiscard]] virtual const char* name() const noexcept = 0;

    // Throws InsufficientHistory when the window is too short
    [[nodiscard]] virtual ValuationEstimate estimate(
        const std::string& market_id,
        const PriceHistory& history) const = 0;
};

// Discretized Ornstein-Uhlenbeck fit:
//   estimate = mu + (last - mu) * exp(-theta * horizon)
// with theta and mu taken from an AR(1) regression over the window.
class OuValuationModel : public ValuationModel {
public:
    OuValuationModel(size_t min_history, int64_t horizon_ms);

    [[nodiscard]] const char* name() const noexcept override { return "ou"; }
    [[nodiscard]] ValuationEstimate estimate(
        const std::string& market_id,
        const PriceHistory& history) const override;

private:
    size_t min_history_;
    int64_t horizon_ms_;
};

// Fixed fair value, the operator's own view of the market
class ConstantValuationModel : public ValuationModel {
public:
    explicit ConstantValuationModel(double fair_value, size_t min_history = 0);

    [[nodiscard]] const char* name() const noexcept override { return "constant"; }
    [[nodiscard]] ValuationEstimate estimate(
        const std::string& market_id,
        const PriceHistory& history) const override;

private:
    double fair_value_;
    size_t min_history_;
};

// Window average of observed prices
class EmpiricalValuationModel : public ValuationModel {
public:
    explicit EmpiricalValuationModel(size_t min_history);

    [[nodiscard]] const char* name() const noexcept override { return "empirical"; }
    [[nodiscard]] ValuationEstimate estimate(
        const std::string& market_id,
        const PriceHistory& history) const override;

private:
    size_t min_history_;
};

std::unique_ptr<ValuationModel> make_valuation_model(const ValuationConfig& config);

}  // namespace sniper
