#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "coin.hpp"
#include "sequence_tracker.hpp"

namespace cosmkit {

// Subset of cosmos.base.abci.v1beta1.TxResponse the library acts on
struct TxResponse {
    int64_t height = 0;
    std::string txhash;
    uint32_t code = 0;
    std::string codespace;
    std::string raw_log;
    uint64_t gas_wanted = 0;
    uint64_t gas_used = 0;
    nlohmann::json events = nlohmann::json::array();
};

struct ChainStatus {
    enum class Kind {
        Moving,         // producing blocks; block_height is the latest height
        Syncing,        // node is catching up and its view is not current
        WaitingToStart  // chain has no blocks yet
    };

    Kind kind = Kind::WaitingToStart;
    uint64_t block_height = 0;
};

struct SimulateResult {
    uint64_t gas_wanted = 0;
    uint64_t gas_used = 0;
};

// Node access used by the broadcaster and the sequence tracker.
//
// Implementations throw BroadcastError::NodeUnavailable when the node cannot
// be reached or answers with a server error, and EncodingError::MalformedPayload
// when a reply cannot be understood.
class NodeClient {
public:
    virtual ~NodeClient() = default;

    virtual AccountInfo get_account(const std::string& address) = 0;

    // Submits encoded TxRaw bytes in sync mode and returns the mempool verdict
    virtual TxResponse broadcast_tx(const std::vector<uint8_t>& tx_bytes) = 0;

    // std::nullopt while the node does not know the hash
    virtual std::optional<TxResponse> get_tx(const std::string& hash) = 0;

    virtual ChainStatus get_chain_status() = 0;

    virtual SimulateResult simulate(const std::vector<uint8_t>& tx_bytes) = 0;

    virtual std::vector<Coin> get_balances(const std::string& address) = 0;
};

} // namespace cosmkit
