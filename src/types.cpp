// Sniper Taker Engine - Types Implementation

#include <sniper/types.hpp>
#include <charconv>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace sniper {

Decimal Decimal::from_double(double d) noexcept {
    return Decimal(static_cast<int64_t>(std::llround(d * SCALE)));
}

Decimal Decimal::from_string(std::string_view s) {
    bool negative = !s.empty() && s[0] == '-';
    if (negative || (!s.empty() && s[0] == '+')) {
        s.remove_prefix(1);
    }

    auto dot = s.find('.');
    std::string_view int_part = s.substr(0, dot);
    std::string_view frac_part =
        dot == std::string_view::npos ? std::string_view{} : s.substr(dot + 1);

    int64_t int_val = 0;
    if (!int_part.empty()) {
        auto [ptr, ec] = std::from_chars(int_part.data(), int_part.data() + int_part.size(), int_val);
        if (ec != std::errc{} || ptr != int_part.data() + int_part.size()) {
            throw std::invalid_argument("Invalid decimal: " + std::string(s));
        }
    }

    int64_t frac_val = 0;
    if (!frac_part.empty()) {
        // Pad or truncate to PRECISION digits
        std::string frac_str(frac_part);
        if (frac_str.size() < PRECISION) {
            frac_str.append(PRECISION - frac_str.size(), '0');
        } else if (frac_str.size() > PRECISION) {
            frac_str = frac_str.substr(0, PRECISION);
        }
        auto [ptr, ec] = std::from_chars(frac_str.data(), frac_str.data() + frac_str.size(), frac_val);
        if (ec != std::errc{} || ptr != frac_str.data() + frac_str.size()) {
            throw std::invalid_argument("Invalid decimal: " + std::string(s));
        }
    }

    int64_t result = int_val * SCALE + frac_val;
    return Decimal(negative ? -result : result);
}

std::string Decimal::to_string() const {
    int64_t abs_val = value_ < 0 ? -value_ : value_;
    int64_t int_part = abs_val / SCALE;
    int64_t frac_part = abs_val % SCALE;

    std::ostringstream oss;
    if (value_ < 0) oss << '-';
    oss << int_part << '.';

    // Format fractional part with leading zeros
    std::string frac_str = std::to_string(frac_part);
    oss << std::string(PRECISION - frac_str.size(), '0') << frac_str;

    std::string result = oss.str();

    // Trim trailing zeros after decimal point
    size_t last_non_zero = result.find_last_not_of('0');
    if (last_non_zero != std::string::npos && result[last_non_zero] == '.') {
        last_non_zero--;
    }
    return result.substr(0, last_non_zero + 1);
}

std::optional<OutcomeSide> parse_side(std::string_view s) noexcept {
    if (s == "yes" || s == "YES" || s == "Yes" || s == "0") return OutcomeSide::Yes;
    if (s == "no" || s == "NO" || s == "No" || s == "1") return OutcomeSide::No;
    return std::nullopt;
}

std::optional<ExecutionMode> parse_mode(std::string_view s) noexcept {
    if (s == "dry_run" || s == "dry-run" || s == "dryrun") return ExecutionMode::DryRun;
    if (s == "live") return ExecutionMode::Live;
    return std::nullopt;
}

}  // namespace sniper
