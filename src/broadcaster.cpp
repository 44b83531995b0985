#include "broadcaster.hpp"
#include "consts.hpp"
#include "logging.hpp"
#include <algorithm>
#include <stdexcept>
#include <thread>

namespace cosmkit {

namespace {

logging::Logger& logger() {
    return logging::get_logger("broadcast");
}

BroadcastError::ErrorType reason_for(uint32_t code, const std::string& codespace) {
    if (codespace != SDK_CODESPACE) {
        return BroadcastError::ErrorType::Rejected;
    }
    switch (code) {
    case SDK_CODE_TX_DECODE:
        return BroadcastError::ErrorType::MalformedPayload;
    case SDK_CODE_UNAUTHORIZED:
        return BroadcastError::ErrorType::InvalidSignature;
    case SDK_CODE_INSUFFICIENT_FEE:
        return BroadcastError::ErrorType::InsufficientFee;
    case SDK_CODE_MEMPOOL_IS_FULL:
        return BroadcastError::ErrorType::MempoolFull;
    case SDK_CODE_WRONG_SEQUENCE:
        return BroadcastError::ErrorType::SequenceMismatch;
    default:
        return BroadcastError::ErrorType::Rejected;
    }
}

bool is_rejected_for(const SubmissionResult& result, BroadcastError::ErrorType reason) {
    const auto* rejected = std::get_if<Rejected>(&result);
    return rejected && rejected->reason == reason;
}

} // namespace

SubmissionResult classify_response(const TxResponse& response, const std::string& tx_hash) {
    std::string hash = response.txhash.empty() ? tx_hash : response.txhash;
    if (response.code == SDK_CODE_OK) {
        return Pending{hash};
    }
    // The node already holds this exact transaction
    if (response.codespace == SDK_CODESPACE && response.code == SDK_CODE_TX_IN_MEMPOOL_CACHE) {
        return Pending{hash};
    }
    return Rejected{reason_for(response.code, response.codespace), hash,
                    response.code, response.codespace, response.raw_log};
}

Broadcaster::Broadcaster(NodeClient& node, SequenceTracker& tracker, ClientConfig config)
    : node_(node)
    , tracker_(tracker)
    , config_(std::move(config))
{
    if (config_.chain_id.empty()) {
        throw std::invalid_argument("Broadcaster needs a chain_id");
    }
    if (config_.retry.max_attempts == 0) {
        throw std::invalid_argument("retry.max_attempts must be at least 1");
    }
}

SubmissionResult Broadcaster::submit(const SignedTx& tx) {
    std::string hash = tx.hash();
    auto response = node_.broadcast_tx(tx.encode());
    auto result = classify_response(response, hash);

    if (auto* rejected = std::get_if<Rejected>(&result)) {
        logger().warning << "Transaction " << hash << " rejected with " << rejected->codespace
                         << " code " << rejected->code << ": " << rejected->raw_log;
    } else {
        logger().info << "Transaction " << hash << " accepted into the mempool";
    }
    return result;
}

/*
 * Submits the same signed bytes until the node takes them.
 *
 * Resubmitting identical bytes is safe: a node that already has them
 * answers with the mempool cache code, which counts as Pending. A full
 * mempool and an unreachable node are retried with backoff; when attempts
 * run out the last failure is thrown with the node's diagnostic.
 */
SubmissionResult Broadcaster::submit_with_retry(const SignedTx& tx) {
    const auto& retry = config_.retry;
    for (uint32_t attempt = 1;; ++attempt) {
        std::string failure;
        try {
            auto result = submit(tx);
            if (!is_rejected_for(result, BroadcastError::ErrorType::MempoolFull)) {
                return result;
            }
            const auto& rejected = std::get<Rejected>(result);
            if (attempt >= retry.max_attempts) {
                throw BroadcastError(BroadcastError::ErrorType::MempoolFull,
                                     "Mempool still full after " + std::to_string(attempt) + " attempts",
                                     rejected.code, rejected.codespace, rejected.raw_log);
            }
            failure = "mempool full";
        } catch (const BroadcastError& e) {
            if (e.type() != BroadcastError::ErrorType::NodeUnavailable || attempt >= retry.max_attempts) {
                throw;
            }
            failure = e.what();
        }

        auto delay = retry.backoff(attempt);
        logger().warning << "Submission attempt " << attempt << " of " << retry.max_attempts
                         << " failed (" << failure << "), retrying in " << delay.count() << " ms";
        std::this_thread::sleep_for(delay);
    }
}

SignedTx Broadcaster::sign_next(const std::vector<Msg>& messages, const Fee& fee, const std::string& memo,
                                uint64_t timeout_height, const PrivateKey& key, const std::string& address) {
    auto reservation = tracker_.next_sequence(address, config_.chain_id);
    logger().debug << "Signing for " << address << " with sequence " << reservation.sequence;

    UnsignedTx tx;
    tx.messages = messages;
    tx.fee = fee;
    tx.memo = memo;
    tx.timeout_height = timeout_height;
    tx.signers.push_back(SignerInfo{key.public_key(), reservation.sequence, reservation.account_number});
    return sign_transaction(tx, config_.chain_id, key);
}

uint64_t Broadcaster::timeout_height(const SendOptions& options) {
    if (!options.timeout_blocks) {
        return 0;
    }
    auto status = node_.get_chain_status();
    if (status.kind != ChainStatus::Kind::Moving) {
        throw BroadcastError(BroadcastError::ErrorType::NodeUnavailable,
                             "Cannot compute a timeout height: chain is not producing blocks");
    }
    return status.block_height + *options.timeout_blocks;
}

/*
 * Reserve, sign, submit.
 *
 * 1. Reserve the next sequence and sign
 * 2. Submit, retrying transient failures
 * 3. On a sequence mismatch, resync from the node, sign again with the
 *    fresh sequence and submit once more; a second mismatch throws
 *    SequenceError::Stale
 * 4. Any rejection or failure after a reservation marks the sequence stale,
 *    since the node never consumed it
 * 5. Optionally wait for inclusion
 */
SubmissionResult Broadcaster::send(const std::vector<Msg>& messages, const Fee& fee, const PrivateKey& key,
                                   const SendOptions& options) {
    const std::string address = key.to_bech32_address(config_.address_prefix);
    const std::string memo = options.memo.value_or(config_.default_memo);
    const uint64_t timeout = timeout_height(options);

    SubmissionResult result;
    try {
        result = submit_with_retry(sign_next(messages, fee, memo, timeout, key, address));

        if (is_rejected_for(result, BroadcastError::ErrorType::SequenceMismatch)) {
            logger().info << "Sequence mismatch for " << address << ", resyncing and retrying once";
            tracker_.resync(address, config_.chain_id);
            result = submit_with_retry(sign_next(messages, fee, memo, timeout, key, address));
            if (is_rejected_for(result, BroadcastError::ErrorType::SequenceMismatch)) {
                const auto& rejected = std::get<Rejected>(result);
                throw SequenceError(SequenceError::ErrorType::Stale,
                                    "Sequence for " + address + " still stale after resync (code " +
                                    std::to_string(rejected.code) + "): " + rejected.raw_log);
            }
        }
    } catch (const Error&) {
        tracker_.mark_stale(address, config_.chain_id);
        throw;
    }

    if (std::holds_alternative<Rejected>(result)) {
        tracker_.mark_stale(address, config_.chain_id);
        return result;
    }

    if (options.wait) {
        return await_confirmation(std::get<Pending>(result).tx_hash, config_.poll_interval(), *options.wait);
    }
    return result;
}

std::future<SubmissionResult> Broadcaster::send_async(std::vector<Msg> messages, Fee fee, const PrivateKey& key,
                                                      SendOptions options) {
    return std::async(std::launch::async,
                      [this, messages = std::move(messages), fee = std::move(fee), key = key.clone(),
                       options = std::move(options)]() {
                          return send(messages, fee, key, options);
                      });
}

SubmissionResult Broadcaster::send_coins(const Coin& amount, const std::string& destination, const Fee& fee,
                                         const PrivateKey& key, const SendOptions& options) {
    Address::from_bech32(destination, config_.address_prefix);
    auto msg = encode_msg_send(key.to_bech32_address(config_.address_prefix), destination, {amount});
    return send({msg}, fee, key, options);
}

/*
 * Polls the node for a transaction until it appears or time runs out.
 *
 * The node is asked at least once, even with a zero timeout. Polling
 * failures back off and count toward config.retry.max_attempts; a
 * successful poll resets the count.
 */
SubmissionResult Broadcaster::await_confirmation(const std::string& tx_hash, std::chrono::milliseconds poll_interval,
                                                 std::chrono::milliseconds timeout) {
    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + timeout;
    uint32_t failures = 0;

    while (true) {
        try {
            auto response = node_.get_tx(tx_hash);
            failures = 0;
            if (response) {
                if (response->code != SDK_CODE_OK) {
                    logger().warning << "Transaction " << tx_hash << " failed in block " << response->height
                                     << ": " << response->raw_log;
                    return Rejected{reason_for(response->code, response->codespace), tx_hash,
                                    response->code, response->codespace, response->raw_log};
                }
                logger().info << "Transaction " << tx_hash << " included at height " << response->height;
                return Included{tx_hash, response->height, response->gas_used, response->events};
            }
        } catch (const BroadcastError& e) {
            if (e.type() != BroadcastError::ErrorType::NodeUnavailable) {
                throw;
            }
            if (++failures >= config_.retry.max_attempts) {
                throw BroadcastError(BroadcastError::ErrorType::NodeUnavailable,
                                     "Gave up polling for " + tx_hash + " after " + std::to_string(failures) +
                                     " failures: " + e.what());
            }
            logger().warning << "Polling for " << tx_hash << " failed: " << e.what();
        }

        auto now = Clock::now();
        if (now >= deadline) {
            logger().info << "Stopped waiting for " << tx_hash;
            return TimedOut{tx_hash};
        }
        auto delay = failures ? config_.retry.backoff(failures) : poll_interval;
        std::this_thread::sleep_for(std::min<Clock::duration>(delay, deadline - now));
    }
}

Included Broadcaster::wait_for_tx(const std::string& tx_hash, std::chrono::milliseconds timeout) {
    auto result = await_confirmation(tx_hash, config_.poll_interval(), timeout);
    if (auto* included = std::get_if<Included>(&result)) {
        return std::move(*included);
    }
    if (auto* rejected = std::get_if<Rejected>(&result)) {
        throw BroadcastError(rejected->reason, "Transaction " + tx_hash + " failed: " + rejected->raw_log,
                             rejected->code, rejected->codespace, rejected->raw_log);
    }
    throw ConfirmationTimeout(tx_hash);
}

/*
 * Fee from a simulated run.
 *
 * The simulation is signed at the account's current on-chain sequence with
 * the maximum gas limit, so it reserves nothing locally. The returned limit
 * is twice the simulated gas to leave room for state changing between
 * simulation and inclusion.
 */
Fee Broadcaster::estimate_fee(const std::vector<Msg>& messages, const std::vector<Coin>& fee_coins,
                              const PrivateKey& key, const std::optional<std::string>& memo) {
    const std::string address = key.to_bech32_address(config_.address_prefix);
    auto account = node_.get_account(address);

    UnsignedTx tx;
    tx.messages = messages;
    tx.fee = Fee{fee_coins, SIMULATION_GAS_LIMIT, std::nullopt, std::nullopt};
    tx.memo = memo.value_or(config_.default_memo);
    tx.signers.push_back(SignerInfo{key.public_key(), account.sequence, account.account_number});

    auto simulated = node_.simulate(sign_transaction(tx, config_.chain_id, key).encode());
    logger().debug << "Simulation used " << simulated.gas_used << " gas";

    Fee fee;
    fee.gas_limit = simulated.gas_used * 2;
    if (!fee_coins.empty()) {
        fee.amount = fee_coins;
    } else if (!config_.gas_price.empty()) {
        fee.amount.push_back(GasPrice::parse(config_.gas_price).fee_for(fee.gas_limit));
    }
    return fee;
}

std::optional<uint64_t> Broadcaster::wait_for_next_block(std::chrono::milliseconds timeout) {
    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + timeout;
    std::optional<uint64_t> last_height;

    while (true) {
        try {
            auto status = node_.get_chain_status();
            switch (status.kind) {
            case ChainStatus::Kind::Syncing:
                throw BroadcastError(BroadcastError::ErrorType::NodeUnavailable, "Node is still syncing");
            case ChainStatus::Kind::WaitingToStart:
                throw BroadcastError(BroadcastError::ErrorType::NodeUnavailable, "Chain has not started");
            case ChainStatus::Kind::Moving:
                if (last_height && status.block_height > *last_height) {
                    return status.block_height;
                }
                if (!last_height) {
                    last_height = status.block_height;
                }
                break;
            }
        } catch (const BroadcastError& e) {
            if (e.type() != BroadcastError::ErrorType::NodeUnavailable || !last_height.has_value()) {
                throw;
            }
            logger().debug << "Chain status poll failed: " << e.what();
        }

        auto now = Clock::now();
        if (now >= deadline) {
            return std::nullopt;
        }
        std::this_thread::sleep_for(std::min<Clock::duration>(config_.poll_interval(), deadline - now));
    }
}

} // namespace cosmkit
