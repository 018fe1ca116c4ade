// Sniper Taker Engine - JSON-RPC Adapters Implementation

#include <sniper/rpc.hpp>
#include <cpr/cpr.h>
#include <cstdio>

namespace sniper {

using json = nlohmann::json;

namespace {

constexpr double WEI_PER_GWEI = 1e9;

double wei_to_gwei(const json& value) {
    return static_cast<double>(parse_hex_quantity(value)) / WEI_PER_GWEI;
}

uint64_t gwei_to_wei(double gwei) {
    return static_cast<uint64_t>(gwei * WEI_PER_GWEI);
}

}  // namespace

uint64_t parse_hex_quantity(const json& value) {
    if (value.is_number_unsigned()) return value.get<uint64_t>();
    if (!value.is_string()) {
        throw RpcError("Expected hex quantity, got " + value.dump());
    }

    const auto& s = value.get_ref<const std::string&>();
    if (s.size() < 3 || s[0] != '0' || (s[1] != 'x' && s[1] != 'X')) {
        throw RpcError("Malformed hex quantity: " + s);
    }
    try {
        size_t used = 0;
        uint64_t v = std::stoull(s.substr(2), &used, 16);
        if (used != s.size() - 2) throw RpcError("Malformed hex quantity: " + s);
        return v;
    } catch (const std::logic_error&) {
        throw RpcError("Malformed hex quantity: " + s);
    }
}

std::string to_hex_quantity(uint64_t value) {
    char buf[24];
    std::snprintf(buf, sizeof(buf), "0x%llx", static_cast<unsigned long long>(value));
    return buf;
}

// =============================================================================
// JsonRpcClient
// =============================================================================

JsonRpcClient::JsonRpcClient(std::string url, int timeout_ms)
    : url_(std::move(url)), timeout_ms_(timeout_ms) {}

json JsonRpcClient::call(const std::string& method, const json& params) {
    json body = {
        {"jsonrpc", "2.0"},
        {"id", next_id_.fetch_add(1, std::memory_order_relaxed)},
        {"method", method},
        {"params", params}
    };

    auto response = cpr::Post(
        cpr::Url{url_},
        cpr::Header{{"Content-Type", "application/json"}},
        cpr::Body{body.dump()},
        cpr::Timeout{timeout_ms_});

    if (response.error) {
        throw RpcError(method + ": " + response.error.message);
    }
    if (response.status_code != 200) {
        throw RpcError(method + ": HTTP " + std::to_string(response.status_code) +
                       ": " + response.text);
    }

    json reply;
    try {
        reply = json::parse(response.text);
    } catch (const json::exception& e) {
        throw RpcError(method + ": " + e.what());
    }

    if (reply.contains("error") && !reply["error"].is_null()) {
        const auto& err = reply["error"];
        if (!err.is_object()) throw RpcError(method + ": " + err.dump());
        throw RpcError(method + ": " + err.value("message", err.dump()), err.value("code", 0));
    }
    if (!reply.contains("result")) {
        throw RpcError(method + ": response without result");
    }
    return reply["result"];
}

// =============================================================================
// RpcSigner
// =============================================================================

RpcSigner::RpcSigner(const SignerConfig& config)
    : rpc_(std::make_unique<JsonRpcClient>(config.url)) {}

TxHandle RpcSigner::sign_and_broadcast(const UnsignedTx& tx) {
    json request = {
        {"from", tx.identity},
        {"nonce", to_hex_quantity(tx.nonce)},
        {"market", tx.market_id},
        {"outcome", to_string(tx.side)},
        {"action", to_string(tx.action)},
        {"price", tx.price},
        {"size", tx.size},
        {"amount", tx.notional},
        {"minSize", tx.min_size},
        {"gas", to_hex_quantity(tx.gas.gas_limit)},
        {"maxFeePerGas", to_hex_quantity(gwei_to_wei(tx.gas.max_fee_gwei))},
        {"maxPriorityFeePerGas", to_hex_quantity(gwei_to_wei(tx.gas.priority_fee_gwei))}
    };

    json result;
    try {
        result = rpc_->call("signer_signAndBroadcast", json::array({request}));
    } catch (const RpcError& e) {
        if (e.code() == SIGNING_ERROR_CODE) throw SigningError(e.what());
        throw BroadcastError(e.what());
    }

    if (!result.is_string() || result.get<std::string>().empty()) {
        throw BroadcastError("signer_signAndBroadcast: no transaction hash");
    }
    return TxHandle{result.get<std::string>(), tx.identity, tx.nonce};
}

TxStatus RpcSigner::poll_status(const TxHandle& handle) {
    json receipt = rpc_->call("eth_getTransactionReceipt", json::array({handle.tx_hash}));
    if (receipt.is_null()) {
        return TxStatus::pending();
    }

    if (parse_hex_quantity(receipt.value("status", json("0x0"))) != 1) {
        return TxStatus::rejected("transaction reverted in block " +
                                  receipt.value("blockNumber", std::string("?")));
    }

    TxReceipt details;
    details.gas_used = parse_hex_quantity(receipt.value("gasUsed", json("0x0")));
    if (receipt.contains("effectiveGasPrice")) {
        details.effective_gas_price_gwei = wei_to_gwei(receipt["effectiveGasPrice"]);
    }
    return TxStatus::confirmed(details);
}

SequenceState RpcSigner::sequence_state(const std::string& identity) {
    SequenceState state;
    state.confirmed_next = parse_hex_quantity(
        rpc_->call("eth_getTransactionCount", json::array({identity, "latest"})));
    state.pending_next = parse_hex_quantity(
        rpc_->call("eth_getTransactionCount", json::array({identity, "pending"})));
    return state;
}

// =============================================================================
// RpcFeeOracle
// =============================================================================

RpcFeeOracle::RpcFeeOracle(const std::string& node_url)
    : rpc_(std::make_unique<JsonRpcClient>(node_url)) {}

std::vector<double> RpcFeeOracle::base_fees(int blocks) {
    json result = rpc_->call("eth_feeHistory",
                             json::array({to_hex_quantity(blocks > 0 ? blocks : 1),
                                          "latest", json::array()}));

    std::vector<double> fees;
    for (const auto& fee : result.value("baseFeePerGas", json::array())) {
        fees.push_back(wei_to_gwei(fee));
    }
    return fees;
}

}  // namespace sniper
