// Sniper Taker Engine - Signer and Fee Oracle Interfaces
// Black-box collaborators for live execution

#pragma once

#include <sniper/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace sniper {

// Transaction handed to the signer; the signer owns keys and encoding
struct UnsignedTx {
    std::string identity;
    uint64_t nonce = 0;
    std::string market_id;
    OutcomeSide side = OutcomeSide::Yes;
    TradeAction action = TradeAction::Buy;
    double price = 0.0;
    double size = 0.0;
    double notional = 0.0;   // most the trade may spend, the approved reservation
    double min_size = 0.0;   // the fill reverts below this
    GasParams gas;
};

struct TxHandle {
    std::string tx_hash;
    std::string identity;
    uint64_t nonce = 0;
};

enum class TxState : uint8_t {
    Pending = 0,
    Confirmed = 1,
    Rejected = 2
};

inline constexpr const char* to_string(TxState s) noexcept {
    switch (s) {
        case TxState::Pending: return "pending";
        case TxState::Confirmed: return "confirmed";
        case TxState::Rejected: return "rejected";
    }
    return "unknown";
}

struct TxReceipt {
    uint64_t gas_used = 0;
    double effective_gas_price_gwei = 0.0;
    std::optional<double> fill_price;
    std::optional<double> filled_size;
};

struct TxStatus {
    TxState state = TxState::Pending;
    std::optional<TxReceipt> receipt;   // Confirmed only
    std::string reason;                 // Rejected only

    static TxStatus pending() { return TxStatus{}; }
    static TxStatus confirmed(TxReceipt receipt) {
        return TxStatus{TxState::Confirmed, receipt, {}};
    }
    static TxStatus rejected(std::string reason) {
        return TxStatus{TxState::Rejected, std::nullopt, std::move(reason)};
    }
};

// Account nonces as seen by the ledger
struct SequenceState {
    uint64_t confirmed_next = 0;   // next nonce after the last mined transaction
    uint64_t pending_next = 0;     // includes transactions still in the mempool

    [[nodiscard]] bool has_pending() const noexcept { return pending_next > confirmed_next; }
};

class Signer {
public:
    virtual ~Signer() = default;

    // Throws SigningError or BroadcastError; nothing was broadcast in that case
    virtual TxHandle sign_and_broadcast(const UnsignedTx& tx) = 0;

    virtual TxStatus poll_status(const TxHandle& handle) = 0;

    virtual SequenceState sequence_state(const std::string& identity) = 0;
};

class FeeOracle {
public:
    virtual ~FeeOracle() = default;

    // Base fees (gwei) of the most recent blocks
    virtual std::vector<double> base_fees(int blocks) = 0;
};

class StaticFeeOracle : public FeeOracle {
public:
    explicit StaticFeeOracle(double base_fee_gwei) : base_fee_gwei_(base_fee_gwei) {}

    std::vector<double> base_fees(int blocks) override {
        return std::vector<double>(blocks > 0 ? static_cast<size_t>(blocks) : 1, base_fee_gwei_);
    }

private:
    double base_fee_gwei_;
};

}  // namespace sniper
