// Sniper Taker Engine - Market State
// Registry of markets and the latest quote per (market, side)

#pragma once

#include <sniper/types.hpp>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sniper {

// Read access to the most recent quote, used by the dry-run engine
class QuoteSource {
public:
    virtual ~QuoteSource() = default;
    [[nodiscard]] virtual std::optional<Quote> latest(
        const std::string& market_id, OutcomeSide side) const = 0;
};

// Thread-safe; written by the market workers, read by everyone else
class MarketState : public QuoteSource {
public:
    MarketState() = default;

    // Registers identity (token ids); prices are left untouched
    void register_market(const std::string& market_id,
                         const std::string& yes_token = {},
                         const std::string& no_token = {});

    // Supersedes the previous quote for the same side and refreshes the market
    void apply(const Quote& quote);

    [[nodiscard]] std::optional<Quote> latest(
        const std::string& market_id, OutcomeSide side) const override;

    [[nodiscard]] std::optional<Market> market(const std::string& market_id) const;
    [[nodiscard]] std::vector<std::string> market_ids() const;
    [[nodiscard]] size_t size() const;

private:
    struct Entry {
        Market market;
        std::optional<Quote> yes;
        std::optional<Quote> no;
    };

    Entry& entry_for(const std::string& market_id);

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

}  // namespace sniper
