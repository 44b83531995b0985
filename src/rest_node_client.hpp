#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "node_client.hpp"

namespace httplib {
class Client;
}

namespace cosmkit {

// NodeClient over the Cosmos SDK REST gateway (default port 1317).
//
// Keeps a pool of keep-alive connections to the node. A call borrows an idle
// connection, or opens a new one when all are busy, and returns it when the
// reply is in; the pool lock is never held during a request. One instance can
// be shared by any number of threads and a slow request never blocks another.
class RestNodeClient : public NodeClient {
public:
    explicit RestNodeClient(const ClientConfig& config);
    RestNodeClient(const std::string& node_url, std::chrono::milliseconds timeout);
    ~RestNodeClient() override;

    RestNodeClient(const RestNodeClient&) = delete;
    RestNodeClient& operator=(const RestNodeClient&) = delete;

    AccountInfo get_account(const std::string& address) override;
    TxResponse broadcast_tx(const std::vector<uint8_t>& tx_bytes) override;
    std::optional<TxResponse> get_tx(const std::string& hash) override;
    ChainStatus get_chain_status() override;
    SimulateResult simulate(const std::vector<uint8_t>& tx_bytes) override;
    std::vector<Coin> get_balances(const std::string& address) override;

    std::string node_url() const { return origin_ + prefix_; }

    // Connections currently parked in the pool
    size_t idle_connections() const;

private:
    struct HttpReply {
        int status = 0;
        nlohmann::json body;  // null when the body was not JSON
    };

    HttpReply get(const std::string& path) const;
    HttpReply post(const std::string& path, const nlohmann::json& payload) const;

    std::unique_ptr<httplib::Client> acquire() const;
    void release(std::unique_ptr<httplib::Client> client) const;

    std::string origin_;  // scheme://host[:port]
    std::string prefix_;  // optional path the gateway is mounted under
    std::chrono::milliseconds timeout_;

    mutable std::mutex pool_mutex_;
    mutable std::vector<std::unique_ptr<httplib::Client>> idle_;
};

// Parses the tx_response object shared by broadcast and query replies
TxResponse parse_tx_response(const nlohmann::json& j);

// Reads account_number and sequence from an auth account, unwrapping
// vesting and module accounts down to their BaseAccount
AccountInfo parse_account(const nlohmann::json& account);

} // namespace cosmkit
