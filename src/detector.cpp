// Sniper Taker Engine - Opportunity Detector Implementation

#include <sniper/detector.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace sniper {

Detector::Detector(DetectorConfig config, const Clock& clock, const GasPricer* gas)
    : config_(config), clock_(clock), gas_(gas) {}

double Detector::profit_hurdle() const {
    double hurdle = config_.min_expected_profit;
    if (gas_) hurdle += gas_->estimated_cost_usd();
    return hurdle;
}

std::optional<Opportunity> Detector::candidate(
    const Quote& quote,
    const ValuationEstimate& estimate,
    double hurdle) {

    if (quote.market_id != estimate.market_id) {
        throw std::invalid_argument(
            "Estimate for " + estimate.market_id + " applied to quote of " + quote.market_id);
    }

    const double fair = estimate.fair_value(quote.side);
    const double signed_edge = quote.price - fair;
    const double edge = std::abs(signed_edge);

    if (edge < config_.min_edge_threshold) return std::nullopt;
    if (quote.size < config_.min_size_threshold) return std::nullopt;

    double size = quote.size;
    if (quote.price > 0.0) {
        size = std::min(size, config_.position_size / quote.price);
    }
    if (size <= 0.0) return std::nullopt;

    Opportunity opp;
    opp.market_id = quote.market_id;
    opp.side = quote.side;
    opp.action = signed_edge < 0.0 ? TradeAction::Buy : TradeAction::Sell;
    opp.price = quote.price;
    opp.fair_value = fair;
    opp.signed_edge = signed_edge;
    opp.edge = edge;
    opp.available_size = quote.size;
    opp.size = size;
    opp.quote_timestamp = quote.timestamp;

    if (hurdle > 0.0 && opp.expected_value() <= hurdle) {
        unprofitable_.fetch_add(1, std::memory_order_acq_rel);
        return std::nullopt;
    }
    return opp;
}

Opportunity Detector::stamp(Opportunity opp) {
    uint64_t seq = next_id_.fetch_add(1, std::memory_order_acq_rel);
    opp.id = opp.market_id + "-" + to_string(opp.side) + "-" + std::to_string(seq);
    opp.detected_at = clock_.now();
    emitted_.fetch_add(1, std::memory_order_acq_rel);
    return opp;
}

std::optional<Opportunity> Detector::detect(
    const Quote& quote,
    const ValuationEstimate& estimate) {

    auto opp = candidate(quote, estimate, profit_hurdle());
    if (!opp) return std::nullopt;
    return stamp(std::move(*opp));
}

std::optional<Opportunity> Detector::detect_pair(
    const Quote& yes_quote,
    const Quote& no_quote,
    const ValuationEstimate& estimate) {

    const double hurdle = profit_hurdle();
    auto yes = candidate(yes_quote, estimate, hurdle);
    auto no = candidate(no_quote, estimate, hurdle);

    if (!yes && !no) return std::nullopt;
    if (!no) return stamp(std::move(*yes));
    if (!yes) return stamp(std::move(*no));

    if (std::abs(yes->edge - no->edge) > TIE_TOLERANCE) {
        return stamp(std::move(yes->edge > no->edge ? *yes : *no));
    }
    if (std::abs(yes->available_size - no->available_size) > TIE_TOLERANCE) {
        return stamp(std::move(yes->available_size > no->available_size ? *yes : *no));
    }
    return std::nullopt;
}

}  // namespace sniper
