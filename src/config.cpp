// Sniper Taker Engine - Configuration Implementation

#include <sniper/config.hpp>
#include <sniper/errors.hpp>
#include <fstream>
#include <sstream>

namespace sniper {

// Simple TOML parser (handles basic cases)
namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s[0] == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

// Strips a trailing comment that is not inside a quoted string
std::string strip_comment(const std::string& s) {
    bool quoted = false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '"') quoted = !quoted;
        if (s[i] == '#' && !quoted) return s.substr(0, i);
    }
    return s;
}

// ["a", "b"] or "a,b"
std::vector<std::string> parse_list(const std::string& value) {
    std::string body = value;
    if (body.size() >= 2 && body.front() == '[' && body.back() == ']') {
        body = body.substr(1, body.size() - 2);
    }

    std::vector<std::string> items;
    std::istringstream stream{body};
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = unquote(trim(item));
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

double to_double(const std::string& key, const std::string& value) {
    try {
        size_t used = 0;
        double d = std::stod(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return d;
    } catch (const std::exception&) {
        throw ConfigError("Invalid number for " + key + ": " + value);
    }
}

int64_t to_int(const std::string& key, const std::string& value) {
    try {
        size_t used = 0;
        long long i = std::stoll(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return i;
    } catch (const std::exception&) {
        throw ConfigError("Invalid integer for " + key + ": " + value);
    }
}

Decimal to_decimal(const std::string& key, const std::string& value) {
    try {
        return Decimal::from_string(value);
    } catch (const std::exception&) {
        throw ConfigError("Invalid amount for " + key + ": " + value);
    }
}

}  // namespace

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_toml(buffer.str());
}

Config Config::from_toml(std::string_view content) {
    Config config;
    std::string section;

    std::string content_str{content};
    std::istringstream stream{content_str};
    std::string line;

    while (std::getline(stream, line)) {
        line = trim(strip_comment(line));

        if (line.empty()) continue;

        // Section header
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                throw ConfigError("Unterminated section header: " + line);
            }
            section = trim(line.substr(1, end - 1));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw ConfigError("Expected key = value: " + line);
        }

        std::string key = trim(line.substr(0, eq));
        std::string raw = trim(line.substr(eq + 1));
        std::string value = unquote(raw);
        std::string name = section + "." + key;

        if (section == "general") {
            if (key == "log_level") config.general.log_level = value;
            else if (key == "identity") config.general.identity = value;
            else if (key == "mode") {
                auto mode = parse_mode(value);
                if (!mode) throw ConfigError("Unknown mode: " + value);
                config.general.mode = *mode;
            }
        }
        else if (section == "detector") {
            if (key == "min_edge_threshold") config.detector.min_edge_threshold = to_double(name, value);
            else if (key == "min_size_threshold") config.detector.min_size_threshold = to_double(name, value);
            else if (key == "position_size") config.detector.position_size = to_double(name, value);
            else if (key == "min_expected_profit") config.detector.min_expected_profit = to_double(name, value);
        }
        else if (section == "valuation") {
            if (key == "model") {
                if (value == "ou") config.valuation.model = ValuationModelKind::OrnsteinUhlenbeck;
                else if (value == "constant") config.valuation.model = ValuationModelKind::Constant;
                else if (value == "empirical") config.valuation.model = ValuationModelKind::Empirical;
                else throw ConfigError("Unknown valuation model: " + value);
            }
            else if (key == "min_history") config.valuation.min_history = static_cast<size_t>(to_int(name, value));
            else if (key == "window") config.valuation.window = static_cast<size_t>(to_int(name, value));
            else if (key == "horizon_ms") config.valuation.horizon_ms = to_int(name, value);
            else if (key == "fair_value") config.valuation.fair_value = to_double(name, value);
        }
        else if (section == "risk") {
            if (key == "cooldown_ms") config.risk.cooldown_ms = to_int(name, value);
            else if (key == "per_market_cap") config.risk.per_market_cap = to_decimal(name, value);
            else if (key == "global_cap") config.risk.global_cap = to_decimal(name, value);
            else if (key == "staleness_window_ms") config.risk.staleness_window_ms = to_int(name, value);
        }
        else if (section == "scheduler") {
            if (key == "queue_depth") {
                auto depth = to_int(name, value);
                if (depth < 0) throw ConfigError("Negative queue depth: " + value);
                config.scheduler.queue_depth = static_cast<size_t>(depth);
            }
            else if (key == "reconcile_interval_ms") {
                config.scheduler.reconcile_interval_ms = to_int(name, value);
            }
        }
        else if (section == "execution") {
            auto& ex = config.execution;
            if (key == "gas_limit") ex.gas_limit = static_cast<uint64_t>(to_int(name, value));
            else if (key == "priority_fee_gwei") ex.priority_fee_gwei = to_double(name, value);
            else if (key == "gas_priority_bound_gwei") ex.gas_priority_bound_gwei = to_double(name, value);
            else if (key == "retry_fee_multiplier") ex.retry_fee_multiplier = to_double(name, value);
            else if (key == "fee_history_blocks") ex.fee_history_blocks = static_cast<int>(to_int(name, value));
            else if (key == "default_base_fee_gwei") ex.default_base_fee_gwei = to_double(name, value);
            else if (key == "confirmation_timeout_ms") ex.confirmation_timeout_ms = to_int(name, value);
            else if (key == "poll_interval_ms") ex.poll_interval_ms = to_int(name, value);
            else if (key == "native_token_usd") ex.native_token_usd = to_double(name, value);
            else if (key == "max_slippage") ex.max_slippage = to_double(name, value);
        }
        else if (section == "feed") {
            if (key == "api_url") config.feed.api_url = value;
            else if (key == "poll_interval_ms") config.feed.poll_interval_ms = to_int(name, value);
            else if (key == "timeout_ms") config.feed.timeout_ms = static_cast<int>(to_int(name, value));
            else if (key == "markets") config.feed.markets = parse_list(value);
        }
        else if (section == "signer") {
            if (key == "url") config.signer.url = value;
            else if (key == "node_url") config.signer.node_url = value;
        }
    }

    return config;
}

void Config::validate() const {
    if (detector.min_edge_threshold < 0.0 || detector.min_edge_threshold > 1.0) {
        throw ConfigError("detector.min_edge_threshold must be in [0, 1]");
    }
    if (detector.min_size_threshold < 0.0) {
        throw ConfigError("detector.min_size_threshold must be >= 0");
    }
    if (detector.position_size <= 0.0) {
        throw ConfigError("detector.position_size must be > 0");
    }
    if (detector.min_expected_profit < 0.0) {
        throw ConfigError("detector.min_expected_profit must be >= 0");
    }
    if (valuation.min_history < 3) {
        throw ConfigError("valuation.min_history must be >= 3");
    }
    if (valuation.window < valuation.min_history) {
        throw ConfigError("valuation.window must be >= valuation.min_history");
    }
    if (valuation.fair_value < 0.0 || valuation.fair_value > 1.0) {
        throw ConfigError("valuation.fair_value must be in [0, 1]");
    }
    if (risk.cooldown_ms < 0 || risk.staleness_window_ms < 0) {
        throw ConfigError("risk durations must be >= 0");
    }
    if (!risk.per_market_cap.is_positive() || !risk.global_cap.is_positive()) {
        throw ConfigError("risk caps must be > 0");
    }
    if (scheduler.queue_depth < 1) {
        throw ConfigError("scheduler.queue_depth must be >= 1");
    }
    if (scheduler.reconcile_interval_ms <= 0) {
        throw ConfigError("scheduler.reconcile_interval_ms must be > 0");
    }
    if (execution.priority_fee_gwei < 0.0 ||
        execution.gas_priority_bound_gwei < execution.priority_fee_gwei) {
        throw ConfigError("execution.priority_fee_gwei must be in [0, gas_priority_bound_gwei]");
    }
    if (execution.retry_fee_multiplier < 1.0) {
        throw ConfigError("execution.retry_fee_multiplier must be >= 1");
    }
    if (execution.max_slippage < 0.0 || execution.max_slippage >= 1.0) {
        throw ConfigError("execution.max_slippage must be in [0, 1)");
    }
    if (execution.confirmation_timeout_ms <= 0 || execution.poll_interval_ms <= 0) {
        throw ConfigError("execution timeouts must be > 0");
    }
    if (general.mode == ExecutionMode::Live) {
        if (signer.url.empty()) {
            throw ConfigError("live mode requires signer.url");
        }
        if (general.identity.empty() || general.identity == "default") {
            throw ConfigError("live mode requires general.identity");
        }
    }
}

}  // namespace sniper
