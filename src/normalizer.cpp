// Sniper Taker Engine - Quote Normalizer Implementation

#include <sniper/normalizer.hpp>
#include <sniper/errors.hpp>
#include <cctype>
#include <charconv>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace sniper {

using json = nlohmann::json;

namespace {

[[noreturn]] void malformed(const RawTick& raw, const std::string& what) {
    throw MalformedFeedData(std::string(to_string(raw.format)) + " tick for " +
                            (raw.market_id.empty() ? "<unknown>" : raw.market_id) +
                            ": " + what);
}

// Gamma sends numbers either as JSON numbers or as decimal strings
std::optional<double> number_field(const RawTick& raw, const char* key) {
    auto it = raw.fields.find(key);
    if (it == raw.fields.end() || it->is_null()) return std::nullopt;

    if (it->is_number()) return it->get<double>();

    if (it->is_string()) {
        const auto& s = it->get_ref<const std::string&>();
        if (s.empty()) return std::nullopt;
        try {
            size_t used = 0;
            double d = std::stod(s, &used);
            if (used == s.size()) return d;
        } catch (const std::exception&) {
        }
        malformed(raw, std::string("field ") + key + " is not numeric: " + s);
    }

    malformed(raw, std::string("field ") + key + " has unexpected type");
}

std::optional<double> first_outcome_price(const RawTick& raw) {
    auto it = raw.fields.find("outcomePrices");
    if (it == raw.fields.end() || it->is_null()) return std::nullopt;

    json prices = *it;
    if (prices.is_string()) {
        try {
            prices = json::parse(prices.get<std::string>());
        } catch (const json::exception&) {
            malformed(raw, "outcomePrices is not a JSON array");
        }
    }
    if (!prices.is_array() || prices.empty()) return std::nullopt;

    const auto& first = prices.front();
    if (first.is_number()) return first.get<double>();
    if (first.is_string()) {
        try {
            return std::stod(first.get<std::string>());
        } catch (const std::exception&) {
            malformed(raw, "outcomePrices[0] is not numeric");
        }
    }
    malformed(raw, "outcomePrices[0] has unexpected type");
}

void check_probability(const RawTick& raw, const char* name, double v) {
    if (!std::isfinite(v) || v < 0.0 || v > 1.0) {
        malformed(raw, std::string(name) + " out of range [0, 1]: " + std::to_string(v));
    }
}

}  // namespace

Quote QuoteNormalizer::normalize(const RawTick& raw) {
    if (raw.market_id.empty()) {
        malformed(raw, "missing market id");
    }

    auto side = parse_side(raw.side);
    if (!side) {
        malformed(raw, "unknown outcome side '" + raw.side + "'");
    }

    Book book = raw.format == TickFormat::Live ? read_live(raw) : read_replay(raw);

    double price;
    if (*side == OutcomeSide::Yes) {
        if (book.ask <= 0.0) malformed(raw, "no ask for YES");
        price = book.ask;
    } else {
        // Buying NO is selling YES into the bid
        if (book.bid <= 0.0) malformed(raw, "no bid for NO");
        price = 1.0 - book.bid;
    }
    check_probability(raw, "price", price);

    if (!std::isfinite(book.size) || book.size < 0.0) {
        malformed(raw, "negative size");
    }

    Quote quote;
    quote.market_id = raw.market_id;
    quote.side = *side;
    quote.price = price;
    quote.size = book.size;
    quote.timestamp = book.timestamp;
    return quote;
}

QuoteNormalizer::Book QuoteNormalizer::read_live(const RawTick& raw) {
    Book book;
    book.bid = number_field(raw, "bestBid").value_or(0.0);
    book.ask = number_field(raw, "bestAsk").value_or(0.0);
    check_probability(raw, "bestBid", book.bid);
    check_probability(raw, "bestAsk", book.ask);

    if (book.bid == 0.0 && book.ask == 0.0) {
        auto mid = first_outcome_price(raw);
        if (!mid) malformed(raw, "no bestBid/bestAsk/outcomePrices");
        check_probability(raw, "outcomePrices[0]", *mid);
        book.bid = *mid * (1.0 - FALLBACK_SPREAD);
        book.ask = std::min(1.0, *mid * (1.0 + FALLBACK_SPREAD));
    }

    auto size = number_field(raw, "liquidityNum");
    if (!size) size = number_field(raw, "liquidity");
    if (!size) malformed(raw, "missing liquidity");
    book.size = *size;

    book.timestamp = raw.received_at;
    return book;
}

QuoteNormalizer::Book QuoteNormalizer::read_replay(const RawTick& raw) {
    Book book;
    auto bid = number_field(raw, "best_bid");
    auto ask = number_field(raw, "best_ask");
    if (!bid || !ask) malformed(raw, "missing best_bid/best_ask");
    check_probability(raw, "best_bid", *bid);
    check_probability(raw, "best_ask", *ask);
    book.bid = *bid;
    book.ask = *ask;

    auto size = number_field(raw, "size");
    if (!size) size = number_field(raw, "liquidity");
    if (!size) malformed(raw, "missing size/liquidity");
    book.size = *size;

    auto it = raw.fields.find("timestamp");
    if (it == raw.fields.end() || !it->is_string()) {
        malformed(raw, "missing timestamp");
    }
    try {
        book.timestamp = parse_timestamp(it->get<std::string>());
    } catch (const std::invalid_argument& e) {
        malformed(raw, e.what());
    }
    return book;
}

int64_t QuoteNormalizer::parse_timestamp(const std::string& text) {
    int64_t ms = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), ms);
    if (ec == std::errc{} && ptr == text.data() + text.size()) {
        return ms;
    }

    std::tm tm{};
    std::istringstream in{text};
    in >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (in.fail()) {
        throw std::invalid_argument("unparseable timestamp '" + text + "'");
    }

    int64_t millis = 0;
    if (in.peek() == '.') {
        in.get();
        std::string frac;
        while (frac.size() < 3 && std::isdigit(in.peek())) {
            frac += static_cast<char>(in.get());
        }
        if (frac.empty()) {
            throw std::invalid_argument("empty fraction in timestamp '" + text + "'");
        }
        frac.append(3 - frac.size(), '0');
        millis = std::stoll(frac);
        // Sub-millisecond digits are truncated
        while (std::isdigit(in.peek())) in.get();
    }

    if (in.peek() != std::char_traits<char>::eof()) {
        throw std::invalid_argument("trailing characters in timestamp '" + text + "'");
    }

    return static_cast<int64_t>(timegm(&tm)) * 1000 + millis;
}

}  // namespace sniper
