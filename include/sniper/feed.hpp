// Sniper Taker Engine - Market Data Feeds
// Lazy sources of raw per-market tick records

#pragma once

#include <sniper/clock.hpp>
#include <sniper/config.hpp>
#include <sniper/types.hpp>
#include <nlohmann/json.hpp>
#include <atomic>
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace sniper {

// Which raw layout a tick's fields follow
enum class TickFormat : uint8_t {
    Live = 0,     // Gamma markets JSON object
    Replay = 1    // recorded CSV row, values as strings
};

inline constexpr const char* to_string(TickFormat f) noexcept {
    return f == TickFormat::Live ? "live" : "replay";
}

struct RawTick {
    TickFormat format = TickFormat::Live;
    std::string market_id;
    std::string side;             // "yes" / "no"
    int64_t received_at = 0;      // unix ms
    nlohmann::json fields = nlohmann::json::object();
};

class Feed {
public:
    virtual ~Feed() = default;

    // Next tick; nullopt once a finite feed is exhausted or the feed is stopped.
    // Throws FeedError for an unreachable source; the caller may call again.
    virtual std::optional<RawTick> next() = 0;

    // Restart from the beginning (replay feeds only)
    virtual void reset() = 0;

    [[nodiscard]] virtual bool finite() const noexcept = 0;

    virtual void stop() {}
};

// Polls GET {api_url}/markets/{id} for every configured market
class GammaPollingFeed : public Feed {
public:
    GammaPollingFeed(FeedConfig config, Clock& clock);

    std::optional<RawTick> next() override;
    void reset() override {}
    [[nodiscard]] bool finite() const noexcept override { return false; }
    void stop() override { stopped_.store(true, std::memory_order_release); }

    [[nodiscard]] uint64_t errors() const noexcept {
        return errors_.load(std::memory_order_acquire);
    }

private:
    void poll_cycle();
    nlohmann::json fetch_market(const std::string& market_id) const;

    FeedConfig config_;
    Clock& clock_;
    std::deque<RawTick> pending_;
    std::deque<std::string> failures_;
    int64_t last_cycle_ = 0;
    bool polled_ = false;
    std::atomic<bool> stopped_{false};
    std::atomic<uint64_t> errors_{0};
};

// Replays a CSV recording of one market:
//   timestamp,best_bid,best_ask[,spread,last_trade_price,volume,liquidity,size]
class CsvReplayFeed : public Feed {
public:
    CsvReplayFeed(const std::string& path, std::string market_id);

    std::optional<RawTick> next() override;
    void reset() override;
    [[nodiscard]] bool finite() const noexcept override { return true; }

    [[nodiscard]] size_t rows() const noexcept { return rows_.size(); }
    [[nodiscard]] size_t position() const noexcept { return index_; }

private:
    std::string market_id_;
    std::vector<std::string> header_;
    std::vector<std::vector<std::string>> rows_;
    size_t index_ = 0;
    bool no_side_pending_ = false;
};

}  // namespace sniper
