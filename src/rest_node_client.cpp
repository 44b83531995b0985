#include "rest_node_client.hpp"
#include "base64.hpp"
#include "error.hpp"
#include "logging.hpp"
#include <httplib.h>
#include <cctype>
#include <charconv>
#include <cstdio>

using json = nlohmann::json;

namespace cosmkit {

namespace {

constexpr const char* ACCOUNTS_PATH = "/cosmos/auth/v1beta1/accounts/";
constexpr const char* BALANCES_PATH = "/cosmos/bank/v1beta1/balances/";
constexpr const char* TXS_PATH = "/cosmos/tx/v1beta1/txs";
constexpr const char* SIMULATE_PATH = "/cosmos/tx/v1beta1/simulate";
constexpr const char* SYNCING_PATH = "/cosmos/base/tendermint/v1beta1/syncing";
constexpr const char* LATEST_BLOCK_PATH = "/cosmos/base/tendermint/v1beta1/blocks/latest";

// Idle connections kept for reuse; extras opened under load are closed
constexpr size_t MAX_IDLE_CONNECTIONS = 8;

constexpr const char* BROADCAST_MODE_SYNC = "BROADCAST_MODE_SYNC";

// gRPC status codes the gateway copies into error bodies
constexpr int GRPC_NOT_FOUND = 5;
constexpr int GRPC_UNAVAILABLE = 14;

logging::Logger& logger() {
    return logging::get_logger("rest");
}

[[noreturn]] void malformed(const std::string& what) {
    throw EncodingError(EncodingError::ErrorType::MalformedPayload, "Unexpected node reply: " + what);
}

// The gateway renders 64-bit integers as strings; older nodes send numbers
uint64_t json_u64(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return 0;
    }
    if (it->is_number_unsigned()) {
        return it->get<uint64_t>();
    }
    if (it->is_number_integer()) {
        auto value = it->get<int64_t>();
        if (value < 0) {
            malformed(std::string(key) + " is negative");
        }
        return static_cast<uint64_t>(value);
    }
    if (it->is_string()) {
        const auto& text = it->get_ref<const std::string&>();
        if (text.empty()) {
            return 0;
        }
        uint64_t value = 0;
        auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc() || end != text.data() + text.size()) {
            malformed(std::string(key) + " is not an unsigned integer: " + text);
        }
        return value;
    }
    malformed(std::string(key) + " has unexpected type " + it->type_name());
}

std::string json_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return "";
    }
    if (!it->is_string()) {
        malformed(std::string(key) + " is not a string");
    }
    return it->get<std::string>();
}

int grpc_code(const json& body) {
    if (body.is_object() && body.contains("code") && body["code"].is_number_integer()) {
        return body["code"].get<int>();
    }
    return -1;
}

std::string grpc_message(const json& body) {
    if (body.is_object() && body.contains("message") && body["message"].is_string()) {
        return body["message"].get<std::string>();
    }
    return "";
}

std::string url_encode(const std::string& text) {
    std::string out;
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

} // namespace

/*
 * Splits the node URL into origin and mount prefix.
 *
 * httplib::Client takes "scheme://host:port" only, so a gateway mounted
 * under a path (http://host/rest) keeps that path and prepends it to every
 * request.
 */
RestNodeClient::RestNodeClient(const std::string& node_url, std::chrono::milliseconds timeout)
    : timeout_(timeout)
{
    auto scheme_end = node_url.find("://");
    if (scheme_end == std::string::npos) {
        throw std::invalid_argument("Node URL needs a scheme: " + node_url);
    }
    auto path_start = node_url.find('/', scheme_end + 3);
    origin_ = node_url.substr(0, path_start);
    if (path_start != std::string::npos) {
        prefix_ = node_url.substr(path_start);
        while (!prefix_.empty() && prefix_.back() == '/') {
            prefix_.pop_back();
        }
    }
}

RestNodeClient::RestNodeClient(const ClientConfig& config)
    : RestNodeClient(config.node_url, config.request_timeout())
{}

RestNodeClient::~RestNodeClient() = default;

std::unique_ptr<httplib::Client> RestNodeClient::acquire() const {
    {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        if (!idle_.empty()) {
            auto client = std::move(idle_.back());
            idle_.pop_back();
            return client;
        }
    }
    auto client = std::make_unique<httplib::Client>(origin_);
    client->set_keep_alive(true);
    client->set_connection_timeout(timeout_);
    client->set_read_timeout(timeout_);
    client->set_write_timeout(timeout_);
    return client;
}

// A connection that failed mid-request is dropped instead of returned
void RestNodeClient::release(std::unique_ptr<httplib::Client> client) const {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    if (idle_.size() < MAX_IDLE_CONNECTIONS) {
        idle_.push_back(std::move(client));
    }
}

size_t RestNodeClient::idle_connections() const {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    return idle_.size();
}

RestNodeClient::HttpReply RestNodeClient::get(const std::string& path) const {
    logger().debug << "GET " << path;
    auto client = acquire();
    auto res = client->Get(prefix_ + path);
    if (!res) {
        throw BroadcastError(BroadcastError::ErrorType::NodeUnavailable,
                             "GET " + path + " failed: " + httplib::to_string(res.error()));
    }
    HttpReply reply;
    reply.status = res->status;
    reply.body = json::parse(res->body, nullptr, false);
    if (reply.body.is_discarded()) {
        reply.body = nullptr;
    }
    release(std::move(client));
    return reply;
}

RestNodeClient::HttpReply RestNodeClient::post(const std::string& path, const json& payload) const {
    logger().debug << "POST " << path;
    auto client = acquire();
    auto res = client->Post(prefix_ + path, payload.dump(), "application/json");
    if (!res) {
        throw BroadcastError(BroadcastError::ErrorType::NodeUnavailable,
                             "POST " + path + " failed: " + httplib::to_string(res.error()));
    }
    HttpReply reply;
    reply.status = res->status;
    reply.body = json::parse(res->body, nullptr, false);
    if (reply.body.is_discarded()) {
        reply.body = nullptr;
    }
    release(std::move(client));
    return reply;
}

namespace {

bool is_success(int status) {
    return status >= 200 && status < 300;
}

bool is_not_found(int status, const json& body) {
    return status == 404 || grpc_code(body) == GRPC_NOT_FOUND;
}

// Gateway and proxy outages are transient; anything else the node said on
// purpose
[[noreturn]] void fail(const std::string& what, int status, const json& body) {
    int code = grpc_code(body);
    std::string message = grpc_message(body);
    if (status == 502 || status == 503 || status == 504 || code == GRPC_UNAVAILABLE || body.is_null()) {
        throw BroadcastError(BroadcastError::ErrorType::NodeUnavailable,
                             what + " failed with HTTP " + std::to_string(status) +
                             (message.empty() ? "" : ": " + message));
    }
    throw BroadcastError(BroadcastError::ErrorType::Rejected,
                         what + " rejected with HTTP " + std::to_string(status) + ": " + message,
                         code < 0 ? 0 : static_cast<uint32_t>(code), "", message);
}

} // namespace

AccountInfo parse_account(const json& account) {
    if (!account.is_object()) {
        malformed("account is not an object");
    }
    if (account.contains("account_number") || account.contains("sequence")) {
        return AccountInfo{json_u64(account, "account_number"), json_u64(account, "sequence")};
    }
    // Vesting accounts nest base_vesting_account.base_account, module
    // accounts nest base_account
    for (const char* key : {"base_vesting_account", "base_account"}) {
        if (account.contains(key)) {
            return parse_account(account.at(key));
        }
    }
    malformed("account has no sequence: " + account.dump());
}

TxResponse parse_tx_response(const json& j) {
    if (!j.is_object()) {
        malformed("tx_response is not an object");
    }
    TxResponse response;
    response.height = static_cast<int64_t>(json_u64(j, "height"));
    response.txhash = json_string(j, "txhash");
    response.code = static_cast<uint32_t>(json_u64(j, "code"));
    response.codespace = json_string(j, "codespace");
    response.raw_log = json_string(j, "raw_log");
    response.gas_wanted = json_u64(j, "gas_wanted");
    response.gas_used = json_u64(j, "gas_used");
    if (j.contains("events") && j["events"].is_array()) {
        response.events = j["events"];
    }
    return response;
}

AccountInfo RestNodeClient::get_account(const std::string& address) {
    auto reply = get(ACCOUNTS_PATH + address);
    if (is_not_found(reply.status, reply.body)) {
        throw SequenceError(SequenceError::ErrorType::Unknown,
                            "Account " + address + " does not exist on chain");
    }
    if (!is_success(reply.status)) {
        fail("Account query", reply.status, reply.body);
    }
    if (!reply.body.is_object() || !reply.body.contains("account")) {
        malformed("account query reply has no account");
    }
    return parse_account(reply.body.at("account"));
}

TxResponse RestNodeClient::broadcast_tx(const std::vector<uint8_t>& tx_bytes) {
    json payload = {
        {"tx_bytes", Base64::encode(tx_bytes)},
        {"mode", BROADCAST_MODE_SYNC}
    };
    auto reply = post(TXS_PATH, payload);
    if (!is_success(reply.status)) {
        fail("Broadcast", reply.status, reply.body);
    }
    if (!reply.body.is_object() || !reply.body.contains("tx_response")) {
        malformed("broadcast reply has no tx_response");
    }
    return parse_tx_response(reply.body.at("tx_response"));
}

std::optional<TxResponse> RestNodeClient::get_tx(const std::string& hash) {
    auto reply = get(std::string(TXS_PATH) + "/" + hash);
    if (is_not_found(reply.status, reply.body)) {
        return std::nullopt;
    }
    if (!is_success(reply.status)) {
        fail("Transaction query", reply.status, reply.body);
    }
    if (!reply.body.is_object() || !reply.body.contains("tx_response")) {
        malformed("transaction query reply has no tx_response");
    }
    return parse_tx_response(reply.body.at("tx_response"));
}

/*
 * Chain status from two queries.
 *
 * 1. A syncing node is reported as Syncing without looking at blocks
 * 2. A node without a first block answers the latest block query with a
 *    "nil Block" error or a null block; both mean WaitingToStart
 * 3. Otherwise the latest header height is the chain height
 */
ChainStatus RestNodeClient::get_chain_status() {
    auto syncing = get(SYNCING_PATH);
    if (!is_success(syncing.status)) {
        fail("Syncing query", syncing.status, syncing.body);
    }
    if (syncing.body.is_object() && syncing.body.value("syncing", false)) {
        return ChainStatus{ChainStatus::Kind::Syncing, 0};
    }

    auto latest = get(LATEST_BLOCK_PATH);
    if (!is_success(latest.status)) {
        if (grpc_message(latest.body).find("nil Block") != std::string::npos) {
            return ChainStatus{ChainStatus::Kind::WaitingToStart, 0};
        }
        fail("Latest block query", latest.status, latest.body);
    }
    if (!latest.body.is_object()) {
        malformed("latest block reply is not an object");
    }

    auto block = latest.body.find("block");
    if (block == latest.body.end() || block->is_null()) {
        return ChainStatus{ChainStatus::Kind::WaitingToStart, 0};
    }
    if (!block->contains("header") || !(*block)["header"].is_object()) {
        malformed("latest block has no header");
    }
    return ChainStatus{ChainStatus::Kind::Moving, json_u64((*block)["header"], "height")};
}

SimulateResult RestNodeClient::simulate(const std::vector<uint8_t>& tx_bytes) {
    json payload = {{"tx_bytes", Base64::encode(tx_bytes)}};
    auto reply = post(SIMULATE_PATH, payload);
    if (!is_success(reply.status)) {
        fail("Simulation", reply.status, reply.body);
    }
    if (!reply.body.is_object() || !reply.body.contains("gas_info")) {
        malformed("simulation reply has no gas_info");
    }
    const auto& gas = reply.body.at("gas_info");
    return SimulateResult{json_u64(gas, "gas_wanted"), json_u64(gas, "gas_used")};
}

std::vector<Coin> RestNodeClient::get_balances(const std::string& address) {
    std::vector<Coin> balances;
    std::string next_key;
    do {
        std::string path = BALANCES_PATH + address;
        if (!next_key.empty()) {
            path += "?pagination.key=" + url_encode(next_key);
        }
        auto reply = get(path);
        if (!is_success(reply.status)) {
            fail("Balance query", reply.status, reply.body);
        }
        if (!reply.body.is_object() || !reply.body.contains("balances") || !reply.body["balances"].is_array()) {
            malformed("balance reply has no balances");
        }
        for (const auto& entry : reply.body["balances"]) {
            balances.push_back(Coin{Amount::parse(json_string(entry, "amount")), json_string(entry, "denom")});
        }

        next_key.clear();
        auto pagination = reply.body.find("pagination");
        if (pagination != reply.body.end() && pagination->is_object()) {
            next_key = json_string(*pagination, "next_key");
        }
    } while (!next_key.empty());
    return balances;
}

} // namespace cosmkit
