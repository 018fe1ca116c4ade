// Sniper Taker Engine - Market State Implementation

#include <sniper/market.hpp>
#include <algorithm>
#include <mutex>

namespace sniper {

MarketState::Entry& MarketState::entry_for(const std::string& market_id) {
    auto it = entries_.find(market_id);
    if (it == entries_.end()) {
        Entry entry;
        entry.market.market_id = market_id;
        it = entries_.emplace(market_id, std::move(entry)).first;
    }
    return it->second;
}

void MarketState::register_market(const std::string& market_id,
                                  const std::string& yes_token,
                                  const std::string& no_token) {
    std::unique_lock lock(mutex_);
    auto& market = entry_for(market_id).market;
    if (!yes_token.empty()) market.yes_token = yes_token;
    if (!no_token.empty()) market.no_token = no_token;
}

void MarketState::apply(const Quote& quote) {
    std::unique_lock lock(mutex_);
    auto& entry = entry_for(quote.market_id);

    // Out-of-order ticks never replace a newer quote
    auto& slot = quote.side == OutcomeSide::Yes ? entry.yes : entry.no;
    if (slot && slot->timestamp > quote.timestamp) return;
    slot = quote;

    // The maker price of one side is the complement of the other side's taker price
    auto& market = entry.market;
    if (quote.side == OutcomeSide::Yes) {
        market.yes_taker_price = quote.price;
        market.no_maker_price = 1.0 - quote.price;
    } else {
        market.no_taker_price = quote.price;
        market.yes_maker_price = 1.0 - quote.price;
    }
    market.liquidity = quote.size;
    market.updated_at = std::max(market.updated_at, quote.timestamp);
}

std::optional<Quote> MarketState::latest(const std::string& market_id,
                                         OutcomeSide side) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(market_id);
    if (it == entries_.end()) return std::nullopt;
    return side == OutcomeSide::Yes ? it->second.yes : it->second.no;
}

std::optional<Market> MarketState::market(const std::string& market_id) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(market_id);
    if (it == entries_.end()) return std::nullopt;
    return it->second.market;
}

std::vector<std::string> MarketState::market_ids() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(entries_.size());
    for (const auto& [id, _] : entries_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

size_t MarketState::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

}  // namespace sniper
