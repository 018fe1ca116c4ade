// Sniper Taker Engine - JSON-RPC Adapters
// Signing service and node fee history over HTTP

#pragma once

#include <sniper/config.hpp>
#include <sniper/errors.hpp>
#include <sniper/signer.hpp>
#include <nlohmann/json.hpp>
#include <atomic>
#include <memory>
#include <string>

namespace sniper {

// Transport failure or JSON-RPC error object
class RpcError : public ExecutionFailure {
public:
    RpcError(const std::string& msg, int code = 0) : ExecutionFailure(msg), code_(code) {}

    [[nodiscard]] int code() const noexcept { return code_; }

private:
    int code_;
};

// "0x1a" -> 26; throws RpcError on anything else
uint64_t parse_hex_quantity(const nlohmann::json& value);
std::string to_hex_quantity(uint64_t value);

class JsonRpcClient {
public:
    JsonRpcClient(std::string url, int timeout_ms = 15000);

    // Returns the "result" member; throws RpcError
    nlohmann::json call(const std::string& method, const nlohmann::json& params);

    [[nodiscard]] const std::string& url() const noexcept { return url_; }

private:
    std::string url_;
    int timeout_ms_;
    std::atomic<uint64_t> next_id_{1};
};

// signer_signAndBroadcast for submission, standard eth_* calls for status
// and account nonces
class RpcSigner : public Signer {
public:
    // JSON-RPC error code the signing service uses for key/identity problems
    static constexpr int SIGNING_ERROR_CODE = -32010;

    explicit RpcSigner(const SignerConfig& config);

    TxHandle sign_and_broadcast(const UnsignedTx& tx) override;
    TxStatus poll_status(const TxHandle& handle) override;
    SequenceState sequence_state(const std::string& identity) override;

private:
    std::unique_ptr<JsonRpcClient> rpc_;
};

// eth_feeHistory on the node RPC
class RpcFeeOracle : public FeeOracle {
public:
    explicit RpcFeeOracle(const std::string& node_url);

    std::vector<double> base_fees(int blocks) override;

private:
    std::unique_ptr<JsonRpcClient> rpc_;
};

}  // namespace sniper
