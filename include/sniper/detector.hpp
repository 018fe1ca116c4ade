// Sniper Taker Engine - Opportunity Detector
// Compares quotes against fair value and emits taker opportunities

#pragma once

#include <sniper/clock.hpp>
#include <sniper/config.hpp>
#include <sniper/gas.hpp>
#include <sniper/types.hpp>
#include <atomic>
#include <optional>

namespace sniper {

class Detector {
public:
    // Edges and sizes closer than this are treated as equal by detect_pair
    static constexpr double TIE_TOLERANCE = 1e-12;

    // With a gas pricer, opportunities must also clear the transaction cost
    Detector(DetectorConfig config, const Clock& clock, const GasPricer* gas = nullptr);

    // Opportunity when |price - fair| >= min edge, size >= min size and the
    // expected value exceeds gas cost plus min_expected_profit
    [[nodiscard]] std::optional<Opportunity> detect(
        const Quote& quote,
        const ValuationEstimate& estimate);

    // Both sides of one market: the larger edge wins, then the larger size;
    // an exact tie rejects both
    [[nodiscard]] std::optional<Opportunity> detect_pair(
        const Quote& yes_quote,
        const Quote& no_quote,
        const ValuationEstimate& estimate);

    [[nodiscard]] const DetectorConfig& config() const noexcept { return config_; }
    [[nodiscard]] uint64_t emitted() const noexcept {
        return emitted_.load(std::memory_order_acquire);
    }
    [[nodiscard]] uint64_t unprofitable() const noexcept {
        return unprofitable_.load(std::memory_order_acquire);
    }

private:
    std::optional<Opportunity> candidate(const Quote& quote,
                                         const ValuationEstimate& estimate,
                                         double hurdle);
    double profit_hurdle() const;
    Opportunity stamp(Opportunity opp);

    DetectorConfig config_;
    const Clock& clock_;
    const GasPricer* gas_;
    std::atomic<uint64_t> unprofitable_{0};
    std::atomic<uint64_t> next_id_{1};
    std::atomic<uint64_t> emitted_{0};
};

}  // namespace sniper
