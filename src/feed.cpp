// Sniper Taker Engine - Feeds Implementation

#include <sniper/feed.hpp>
#include <sniper/errors.hpp>
#include <sniper/log.hpp>
#include <cpr/cpr.h>
#include <fstream>
#include <sstream>

namespace sniper {

using json = nlohmann::json;

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> split_csv(const std::string& line) {
    std::vector<std::string> cells;
    std::string cell;
    bool quoted = false;
    for (char c : line) {
        if (c == '"') {
            quoted = !quoted;
        } else if (c == ',' && !quoted) {
            cells.push_back(trim(cell));
            cell.clear();
        } else {
            cell += c;
        }
    }
    cells.push_back(trim(cell));
    return cells;
}

}  // namespace

// =============================================================================
// Gamma polling feed
// =============================================================================

GammaPollingFeed::GammaPollingFeed(FeedConfig config, Clock& clock)
    : config_(std::move(config)), clock_(clock) {
    if (config_.markets.empty()) {
        throw ConfigError("feed.markets is empty");
    }
}

std::optional<RawTick> GammaPollingFeed::next() {
    while (!stopped_.load(std::memory_order_acquire)) {
        if (!pending_.empty()) {
            RawTick tick = std::move(pending_.front());
            pending_.pop_front();
            return tick;
        }

        if (!failures_.empty()) {
            std::string msg = std::move(failures_.front());
            failures_.pop_front();
            throw FeedError(msg);
        }

        int64_t now = clock_.now();
        int64_t due = last_cycle_ + config_.poll_interval_ms;
        if (polled_ && now < due) {
            clock_.sleep_for(std::chrono::milliseconds(due - now));
            continue;
        }

        poll_cycle();
    }
    return std::nullopt;
}

void GammaPollingFeed::poll_cycle() {
    last_cycle_ = clock_.now();
    polled_ = true;

    for (const auto& market_id : config_.markets) {
        try {
            json data = fetch_market(market_id);
            int64_t received = clock_.now();
            for (const char* side : {"yes", "no"}) {
                RawTick tick;
                tick.format = TickFormat::Live;
                tick.market_id = market_id;
                tick.side = side;
                tick.received_at = received;
                tick.fields = data;
                pending_.push_back(std::move(tick));
            }
        } catch (const FeedError& e) {
            errors_.fetch_add(1, std::memory_order_acq_rel);
            failures_.push_back(e.what());
        }
    }
}

json GammaPollingFeed::fetch_market(const std::string& market_id) const {
    auto response = cpr::Get(
        cpr::Url{config_.api_url + "/markets/" + market_id},
        cpr::Header{{"Accept", "application/json"}, {"User-Agent", "sniper/1.0"}},
        cpr::Timeout{config_.timeout_ms});

    if (response.error) {
        throw FeedError("Market " + market_id + " unreachable: " + response.error.message);
    }
    if (response.status_code != 200) {
        throw FeedError("Market " + market_id + ": HTTP " +
                        std::to_string(response.status_code));
    }

    try {
        json data = json::parse(response.text);
        if (!data.is_object()) {
            throw FeedError("Market " + market_id + ": expected JSON object");
        }
        return data;
    } catch (const json::exception& e) {
        throw FeedError("Market " + market_id + ": " + e.what());
    }
}

// =============================================================================
// CSV replay feed
// =============================================================================

CsvReplayFeed::CsvReplayFeed(const std::string& path, std::string market_id)
    : market_id_(std::move(market_id)) {
    std::ifstream file{path};
    if (!file.is_open()) {
        throw FeedError("Cannot open replay file: " + path);
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty()) continue;
        if (header_.empty()) {
            header_ = split_csv(line);
            continue;
        }
        rows_.push_back(split_csv(line));
    }

    if (header_.empty()) {
        throw FeedError("Replay file has no header: " + path);
    }

    log::get("feed")->info("Loaded {} rows from {}", rows_.size(), path);
}

std::optional<RawTick> CsvReplayFeed::next() {
    if (index_ >= rows_.size()) return std::nullopt;

    const auto& row = rows_[index_];

    RawTick tick;
    tick.format = TickFormat::Replay;
    tick.market_id = market_id_;
    for (size_t i = 0; i < header_.size() && i < row.size(); ++i) {
        if (!row[i].empty()) tick.fields[header_[i]] = row[i];
    }

    if (tick.fields.contains("market_id")) {
        tick.market_id = tick.fields["market_id"].get<std::string>();
    }

    // Rows with an explicit side describe one outcome only
    if (tick.fields.contains("side")) {
        tick.side = tick.fields["side"].get<std::string>();
        ++index_;
        return tick;
    }

    if (!no_side_pending_) {
        tick.side = "yes";
        no_side_pending_ = true;
    } else {
        tick.side = "no";
        no_side_pending_ = false;
        ++index_;
    }
    return tick;
}

void CsvReplayFeed::reset() {
    index_ = 0;
    no_side_pending_ = false;
}

}  // namespace sniper
