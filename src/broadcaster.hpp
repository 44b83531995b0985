#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "coin.hpp"
#include "config.hpp"
#include "error.hpp"
#include "keys.hpp"
#include "msg.hpp"
#include "node_client.hpp"
#include "sequence_tracker.hpp"
#include "transaction.hpp"

namespace cosmkit {

// Terminal refusal, either at submission or on chain
struct Rejected {
    BroadcastError::ErrorType reason = BroadcastError::ErrorType::Rejected;
    std::string tx_hash;
    uint32_t code = 0;
    std::string codespace;
    std::string raw_log;
};

// Accepted into the mempool, not yet seen in a block
struct Pending {
    std::string tx_hash;
};

struct Included {
    std::string tx_hash;
    int64_t height = 0;
    uint64_t gas_used = 0;
    nlohmann::json events = nlohmann::json::array();
};

// Stopped waiting; the transaction may still be included later
struct TimedOut {
    std::string tx_hash;
};

using SubmissionResult = std::variant<Rejected, Pending, Included, TimedOut>;

struct SendOptions {
    std::optional<std::string> memo;                  // config default_memo when unset
    std::optional<uint64_t> timeout_blocks;           // timeout_height = latest height + n
    std::optional<std::chrono::milliseconds> wait;    // await inclusion this long
};

// Maps a sync-mode broadcast reply to Pending or Rejected
SubmissionResult classify_response(const TxResponse& response, const std::string& tx_hash);

/**
 * Turns messages into submitted transactions for one chain.
 *
 * Sequences come from the injected SequenceTracker; every method may be
 * called from several threads at once. Transient failures (full mempool,
 * unreachable node) are retried according to config.retry and surface as
 * BroadcastError once attempts run out.
 */
class Broadcaster {
public:
    Broadcaster(NodeClient& node, SequenceTracker& tracker, ClientConfig config);

    // One sync-mode submission. Throws BroadcastError::NodeUnavailable when
    // the node cannot be reached.
    SubmissionResult submit(const SignedTx& tx);

    // Reserve, sign, submit. A stale sequence is resynced and retried once.
    SubmissionResult send(const std::vector<Msg>& messages, const Fee& fee, const PrivateKey& key,
                          const SendOptions& options = {});

    // send() on another thread. The key is cloned, so the caller's copy may go away.
    std::future<SubmissionResult> send_async(std::vector<Msg> messages, Fee fee, const PrivateKey& key,
                                             SendOptions options = {});

    SubmissionResult send_coins(const Coin& amount, const std::string& destination, const Fee& fee,
                                const PrivateKey& key, const SendOptions& options = {});

    // Polls until the transaction shows up or `timeout` passes
    SubmissionResult await_confirmation(const std::string& tx_hash, std::chrono::milliseconds poll_interval,
                                        std::chrono::milliseconds timeout);

    // Like await_confirmation, but throws ConfirmationTimeout on timeout and
    // BroadcastError for an on-chain failure
    Included wait_for_tx(const std::string& tx_hash, std::chrono::milliseconds timeout);

    // Simulates the transaction and returns a fee with twice the gas used.
    // With no fee coins given, the amount is priced from config gas_price.
    Fee estimate_fee(const std::vector<Msg>& messages, const std::vector<Coin>& fee_coins,
                     const PrivateKey& key, const std::optional<std::string>& memo = std::nullopt);

    // Height of the next block, or std::nullopt if none appeared in time
    std::optional<uint64_t> wait_for_next_block(std::chrono::milliseconds timeout);

    const ClientConfig& config() const { return config_; }

private:
    SubmissionResult submit_with_retry(const SignedTx& tx);
    SignedTx sign_next(const std::vector<Msg>& messages, const Fee& fee, const std::string& memo,
                       uint64_t timeout_height, const PrivateKey& key, const std::string& address);
    uint64_t timeout_height(const SendOptions& options);

    NodeClient& node_;
    SequenceTracker& tracker_;
    ClientConfig config_;
};

} // namespace cosmkit
