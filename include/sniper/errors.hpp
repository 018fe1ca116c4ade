// Sniper Taker Engine - Error Taxonomy
// Exceptions for genuine failures; risk and scheduling rejections are values

#pragma once

#include <stdexcept>
#include <string>

namespace sniper {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

// Unreadable or invalid configuration, fatal at startup
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& msg) : Error(msg) {}
};

// Feed unreachable or returned garbage; the cycle is skipped
class FeedError : public Error {
public:
    explicit FeedError(const std::string& msg) : Error(msg) {}
};

// Raw tick with missing or out-of-range fields
class MalformedFeedData : public FeedError {
public:
    explicit MalformedFeedData(const std::string& msg) : FeedError(msg) {}
};

class ValuationError : public Error {
public:
    explicit ValuationError(const std::string& msg) : Error(msg) {}
};

// Not enough observations to fit the model for a market
class InsufficientHistory : public ValuationError {
public:
    InsufficientHistory(const std::string& market_id, size_t have, size_t need)
        : ValuationError("Insufficient history for " + market_id + ": " +
                         std::to_string(have) + " < " + std::to_string(need)),
          have_(have), need_(need) {}

    [[nodiscard]] size_t have() const noexcept { return have_; }
    [[nodiscard]] size_t need() const noexcept { return need_; }

private:
    size_t have_;
    size_t need_;
};

class ExecutionFailure : public Error {
public:
    explicit ExecutionFailure(const std::string& msg) : Error(msg) {}
};

// Signer refused to sign (bad key, unknown identity)
class SigningError : public ExecutionFailure {
public:
    explicit SigningError(const std::string& msg) : ExecutionFailure(msg) {}
};

// Node rejected the signed transaction (fee too low, nonce, ...)
class BroadcastError : public ExecutionFailure {
public:
    explicit BroadcastError(const std::string& msg) : ExecutionFailure(msg) {}
};

}  // namespace sniper
