// Sniper Taker Engine - Quote Normalizer
// Live and replay ticks normalize to the same Quote shape

#pragma once

#include <sniper/feed.hpp>
#include <sniper/types.hpp>

namespace sniper {

class QuoteNormalizer {
public:
    // Synthetic spread applied around outcomePrices when no book is present
    static constexpr double FALLBACK_SPREAD = 0.02;

    // Throws MalformedFeedData on missing or out-of-range fields
    [[nodiscard]] static Quote normalize(const RawTick& raw);

    // "YYYY-MM-DD HH:MM:SS[.fff]" (UTC) or integer unix milliseconds;
    // throws std::invalid_argument unless the whole string is consumed
    [[nodiscard]] static int64_t parse_timestamp(const std::string& text);

private:
    struct Book {
        double bid = 0.0;
        double ask = 0.0;
        double size = 0.0;
        int64_t timestamp = 0;
    };

    static Book read_live(const RawTick& raw);
    static Book read_replay(const RawTick& raw);
};

}  // namespace sniper
