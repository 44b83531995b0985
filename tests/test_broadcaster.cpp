#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <future>
#include <thread>
#include "broadcaster.hpp"
#include "consts.hpp"
#include "fake_node_client.hpp"

namespace cosmkit {
namespace {

using fakes::FakeNodeClient;
using fakes::sdk_failure;
using fakes::unreachable;

constexpr const char* kChain = "test-chain";
constexpr const char* kDestination = "cosmos1pr2n6tfymnn2tk6rkxlu9q5q2zq5ka3wtu7sdj";

ClientConfig test_config() {
    ClientConfig config;
    config.chain_id = kChain;
    config.retry.max_attempts = 3;
    config.retry.initial_backoff_ms = 1;
    config.retry.max_backoff_ms = 4;
    config.poll_interval_ms = 5;
    config.gas_price = "0.025stake";
    return config;
}

class BroadcasterTest : public ::testing::Test {
protected:
    void SetUp() override {
        address_ = key_.to_bech32_address("cosmos");
        node_.set_account(address_, AccountInfo{7, 3});
        msg_ = encode_msg_send(address_, kDestination, {Coin{100, "stake"}});
        fee_.amount.push_back(Coin{5000, "stake"});
        fee_.gas_limit = 200000;
    }

    // Bytes the broadcaster should produce for a given reservation
    std::vector<uint8_t> expected_tx(uint64_t sequence, uint64_t timeout_height = 0) const {
        UnsignedTx tx;
        tx.messages = {msg_};
        tx.fee = fee_;
        tx.memo = DEFAULT_MEMO;
        tx.timeout_height = timeout_height;
        tx.signers.push_back(SignerInfo{key_.public_key(), sequence, 7});
        return sign_transaction(tx, kChain, key_).encode();
    }

    SubmissionResult send(const SendOptions& options = {}) {
        return broadcaster_.send({msg_}, fee_, key_, options);
    }

    PrivateKey key_ = PrivateKey::from_secret(std::string_view("mySecret"));
    std::string address_;
    Msg msg_;
    Fee fee_;
    FakeNodeClient node_;
    SequenceTracker tracker_{[this](const std::string& address) { return node_.get_account(address); }};
    Broadcaster broadcaster_{node_, tracker_, test_config()};
};

// ============================================================================
// Submission
// ============================================================================

TEST_F(BroadcasterTest, AcceptedSubmissionIsPending) {
    auto result = send();

    ASSERT_TRUE(std::holds_alternative<Pending>(result));
    auto broadcasts = node_.broadcasts();
    ASSERT_EQ(broadcasts.size(), 1u);
    EXPECT_EQ(broadcasts[0], expected_tx(3));
    EXPECT_EQ(std::get<Pending>(result).tx_hash, HexUtils::encode_upper(HashUtils::sha256(broadcasts[0])));
    EXPECT_EQ(tracker_.peek(address_, kChain)->sequence, 4u);
}

TEST_F(BroadcasterTest, ConsecutiveSendsUseConsecutiveSequences) {
    send();
    send();
    auto broadcasts = node_.broadcasts();
    ASSERT_EQ(broadcasts.size(), 2u);
    EXPECT_EQ(broadcasts[0], expected_tx(3));
    EXPECT_EQ(broadcasts[1], expected_tx(4));
    EXPECT_EQ(node_.account_queries(), 1u);
}

TEST_F(BroadcasterTest, CustomMemoIsSigned) {
    SendOptions options;
    options.memo = "rent";
    send(options);

    UnsignedTx tx;
    tx.messages = {msg_};
    tx.fee = fee_;
    tx.memo = "rent";
    tx.signers.push_back(SignerInfo{key_.public_key(), 3, 7});
    EXPECT_EQ(node_.broadcasts().at(0), sign_transaction(tx, kChain, key_).encode());
}

TEST_F(BroadcasterTest, StaleSequenceResyncsAndRetriesOnce) {
    // Local counter runs ahead of the node: 3 is spent locally, node moved to 10
    tracker_.next_sequence(address_, kChain);
    node_.set_account(address_, AccountInfo{7, 10});
    node_.script_broadcast(sdk_failure(SDK_CODE_WRONG_SEQUENCE, "account sequence mismatch, expected 10, got 4"));

    auto result = send();

    ASSERT_TRUE(std::holds_alternative<Pending>(result));
    auto broadcasts = node_.broadcasts();
    ASSERT_EQ(broadcasts.size(), 2u);
    EXPECT_EQ(broadcasts[0], expected_tx(4));
    EXPECT_EQ(broadcasts[1], expected_tx(10));
    EXPECT_EQ(tracker_.peek(address_, kChain)->sequence, 11u);
}

TEST_F(BroadcasterTest, SecondStaleSequenceIsTerminal) {
    node_.script_broadcast(sdk_failure(SDK_CODE_WRONG_SEQUENCE, "account sequence mismatch"));
    node_.script_broadcast(sdk_failure(SDK_CODE_WRONG_SEQUENCE, "account sequence mismatch, expected 9"));

    try {
        send();
        FAIL() << "Expected SequenceError";
    } catch (const SequenceError& e) {
        EXPECT_EQ(e.type(), SequenceError::ErrorType::Stale);
        EXPECT_NE(std::string(e.what()).find("expected 9"), std::string::npos);
    }
    EXPECT_EQ(node_.broadcasts().size(), 2u);
    EXPECT_EQ(tracker_.state(address_, kChain), SequenceState::Stale);
}

TEST_F(BroadcasterTest, PermanentRejectionIsNotRetried) {
    node_.script_broadcast(sdk_failure(SDK_CODE_INSUFFICIENT_FEE, "insufficient fees; got: 1stake"));

    auto result = send();

    ASSERT_TRUE(std::holds_alternative<Rejected>(result));
    EXPECT_EQ(std::get<Rejected>(result).reason, BroadcastError::ErrorType::InsufficientFee);
    EXPECT_EQ(node_.broadcasts().size(), 1u);
    EXPECT_EQ(tracker_.state(address_, kChain), SequenceState::Stale);

    // The unused sequence is fetched again instead of skipped
    send();
    EXPECT_EQ(node_.broadcasts().back(), expected_tx(3));
}

TEST_F(BroadcasterTest, AlreadyInMempoolCountsAsPending) {
    node_.script_broadcast(sdk_failure(SDK_CODE_TX_IN_MEMPOOL_CACHE, "tx already exists in cache"));
    auto result = send();
    EXPECT_TRUE(std::holds_alternative<Pending>(result));
}

TEST_F(BroadcasterTest, FullMempoolIsRetriedWithSameBytes) {
    node_.script_broadcast(sdk_failure(SDK_CODE_MEMPOOL_IS_FULL, "mempool is full"));
    node_.script_broadcast(sdk_failure(SDK_CODE_MEMPOOL_IS_FULL, "mempool is full"));

    auto result = send();

    EXPECT_TRUE(std::holds_alternative<Pending>(result));
    auto broadcasts = node_.broadcasts();
    ASSERT_EQ(broadcasts.size(), 3u);
    EXPECT_EQ(broadcasts[0], broadcasts[2]);
}

TEST_F(BroadcasterTest, FullMempoolExhaustionThrows) {
    for (int i = 0; i < 3; ++i) {
        node_.script_broadcast(sdk_failure(SDK_CODE_MEMPOOL_IS_FULL, "mempool is full"));
    }

    try {
        send();
        FAIL() << "Expected BroadcastError";
    } catch (const BroadcastError& e) {
        EXPECT_EQ(e.type(), BroadcastError::ErrorType::MempoolFull);
        EXPECT_EQ(e.code(), SDK_CODE_MEMPOOL_IS_FULL);
        EXPECT_EQ(e.raw_log(), "mempool is full");
    }
    EXPECT_EQ(node_.broadcasts().size(), 3u);
    EXPECT_EQ(tracker_.state(address_, kChain), SequenceState::Stale);
}

TEST_F(BroadcasterTest, UnreachableNodeIsRetried) {
    node_.script_broadcast(unreachable());
    auto result = send();
    EXPECT_TRUE(std::holds_alternative<Pending>(result));
    EXPECT_EQ(node_.broadcasts().size(), 2u);
}

TEST_F(BroadcasterTest, UnreachableNodeExhaustionThrows) {
    for (int i = 0; i < 3; ++i) {
        node_.script_broadcast(unreachable());
    }
    try {
        send();
        FAIL() << "Expected BroadcastError";
    } catch (const BroadcastError& e) {
        EXPECT_EQ(e.type(), BroadcastError::ErrorType::NodeUnavailable);
    }
}

TEST(ClassifyResponseTest, MapsSdkCodes) {
    struct Case {
        uint32_t code;
        const char* codespace;
        BroadcastError::ErrorType reason;
    };
    const Case cases[] = {
        {2, "sdk", BroadcastError::ErrorType::MalformedPayload},
        {4, "sdk", BroadcastError::ErrorType::InvalidSignature},
        {13, "sdk", BroadcastError::ErrorType::InsufficientFee},
        {20, "sdk", BroadcastError::ErrorType::MempoolFull},
        {32, "sdk", BroadcastError::ErrorType::SequenceMismatch},
        {11, "sdk", BroadcastError::ErrorType::Rejected},
        {4, "wasm", BroadcastError::ErrorType::Rejected},
    };
    for (const auto& c : cases) {
        SCOPED_TRACE(c.code);
        TxResponse response;
        response.code = c.code;
        response.codespace = c.codespace;
        auto result = classify_response(response, "ABCD");
        ASSERT_TRUE(std::holds_alternative<Rejected>(result));
        EXPECT_EQ(std::get<Rejected>(result).reason, c.reason);
        EXPECT_EQ(std::get<Rejected>(result).tx_hash, "ABCD");
    }

    TxResponse ok;
    EXPECT_TRUE(std::holds_alternative<Pending>(classify_response(ok, "ABCD")));
}

// ============================================================================
// Confirmation
// ============================================================================

TEST_F(BroadcasterTest, AwaitReturnsTimedOutAtDeadline) {
    auto start = std::chrono::steady_clock::now();
    auto result = broadcaster_.await_confirmation("FEED", std::chrono::milliseconds(5), std::chrono::milliseconds(40));
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(std::holds_alternative<TimedOut>(result));
    EXPECT_EQ(std::get<TimedOut>(result).tx_hash, "FEED");
    EXPECT_GE(elapsed, std::chrono::milliseconds(40));
    EXPECT_LT(elapsed, std::chrono::seconds(2));
    EXPECT_GE(node_.tx_queries(), 2u);
}

TEST_F(BroadcasterTest, AwaitReturnsIncludedOnFirstPoll) {
    node_.include("FEED", 50);
    auto start = std::chrono::steady_clock::now();
    auto result = broadcaster_.await_confirmation("FEED", std::chrono::seconds(10), std::chrono::seconds(30));

    ASSERT_TRUE(std::holds_alternative<Included>(result));
    const auto& included = std::get<Included>(result);
    EXPECT_EQ(included.height, 50);
    EXPECT_EQ(included.gas_used, 61000u);
    EXPECT_EQ(included.events.size(), 1u);
    EXPECT_EQ(node_.tx_queries(), 1u);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(1));
}

TEST_F(BroadcasterTest, AwaitPollsUntilIncluded) {
    node_.script_tx(std::nullopt);
    node_.script_tx(std::nullopt);
    node_.include("FEED", 51);

    auto result = broadcaster_.await_confirmation("FEED", std::chrono::milliseconds(5), std::chrono::seconds(5));

    ASSERT_TRUE(std::holds_alternative<Included>(result));
    EXPECT_EQ(node_.tx_queries(), 3u);
}

TEST_F(BroadcasterTest, AwaitRetriesPollingFailures) {
    node_.script_tx(unreachable());
    node_.script_tx(unreachable());
    node_.include("FEED", 52);

    auto result = broadcaster_.await_confirmation("FEED", std::chrono::milliseconds(5), std::chrono::seconds(5));
    EXPECT_TRUE(std::holds_alternative<Included>(result));
}

TEST_F(BroadcasterTest, AwaitGivesUpAfterRepeatedFailures) {
    for (int i = 0; i < 3; ++i) {
        node_.script_tx(unreachable());
    }
    try {
        broadcaster_.await_confirmation("FEED", std::chrono::milliseconds(5), std::chrono::seconds(5));
        FAIL() << "Expected BroadcastError";
    } catch (const BroadcastError& e) {
        EXPECT_EQ(e.type(), BroadcastError::ErrorType::NodeUnavailable);
    }
}

TEST_F(BroadcasterTest, AwaitReportsOnChainFailure) {
    node_.include("FEED", 53, 11, "out of gas in location: WritePerByte");

    auto result = broadcaster_.await_confirmation("FEED", std::chrono::milliseconds(5), std::chrono::seconds(5));

    ASSERT_TRUE(std::holds_alternative<Rejected>(result));
    EXPECT_EQ(std::get<Rejected>(result).code, 11u);
    EXPECT_EQ(std::get<Rejected>(result).raw_log, "out of gas in location: WritePerByte");
}

TEST_F(BroadcasterTest, WaitForTxThrowsOnTimeout) {
    try {
        broadcaster_.wait_for_tx("FEED", std::chrono::milliseconds(10));
        FAIL() << "Expected ConfirmationTimeout";
    } catch (const ConfirmationTimeout& e) {
        EXPECT_EQ(e.tx_hash(), "FEED");
    }

    node_.include("FEED", 60);
    EXPECT_EQ(broadcaster_.wait_for_tx("FEED", std::chrono::milliseconds(10)).height, 60);
}

TEST_F(BroadcasterTest, SendCanWaitForInclusion) {
    node_.set_auto_include(77);
    SendOptions options;
    options.wait = std::chrono::seconds(5);

    auto result = send(options);

    ASSERT_TRUE(std::holds_alternative<Included>(result));
    EXPECT_EQ(std::get<Included>(result).height, 77);
}

TEST_F(BroadcasterTest, SendAsyncRunsOffThread) {
    node_.set_auto_include(78);
    SendOptions options;
    options.wait = std::chrono::seconds(5);

    auto future = broadcaster_.send_async({msg_}, fee_, key_, options);
    auto result = future.get();

    ASSERT_TRUE(std::holds_alternative<Included>(result));
    EXPECT_EQ(node_.broadcasts().at(0), expected_tx(3));
}

TEST_F(BroadcasterTest, ConcurrentSendsGetDistinctSequences) {
    constexpr int kSenders = 8;
    std::vector<std::future<SubmissionResult>> futures;
    for (int i = 0; i < kSenders; ++i) {
        futures.push_back(broadcaster_.send_async({msg_}, fee_, key_));
    }
    for (auto& future : futures) {
        EXPECT_TRUE(std::holds_alternative<Pending>(future.get()));
    }

    auto broadcasts = node_.broadcasts();
    ASSERT_EQ(broadcasts.size(), static_cast<size_t>(kSenders));
    for (uint64_t sequence = 3; sequence < 3 + kSenders; ++sequence) {
        EXPECT_NE(std::find(broadcasts.begin(), broadcasts.end(), expected_tx(sequence)), broadcasts.end())
            << "sequence " << sequence;
    }
}

// ============================================================================
// Helpers
// ============================================================================

TEST_F(BroadcasterTest, TimeoutBlocksSetsTimeoutHeight) {
    node_.script_status(ChainStatus{ChainStatus::Kind::Moving, 500});
    SendOptions options;
    options.timeout_blocks = 100;

    send(options);
    EXPECT_EQ(node_.broadcasts().at(0), expected_tx(3, 600));
}

TEST_F(BroadcasterTest, TimeoutBlocksNeedsMovingChain) {
    node_.script_status(ChainStatus{ChainStatus::Kind::Syncing, 0});
    SendOptions options;
    options.timeout_blocks = 100;

    EXPECT_THROW(send(options), BroadcastError);
    EXPECT_TRUE(node_.broadcasts().empty());
    EXPECT_EQ(tracker_.state(address_, kChain), SequenceState::Unknown);
}

TEST_F(BroadcasterTest, SendCoinsBuildsBankSend) {
    auto result = broadcaster_.send_coins(Coin{100, "stake"}, kDestination, fee_, key_);
    ASSERT_TRUE(std::holds_alternative<Pending>(result));
    EXPECT_EQ(node_.broadcasts().at(0), expected_tx(3));

    EXPECT_THROW(broadcaster_.send_coins(Coin{1, "stake"}, "osmo1qqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqmcn030", fee_, key_),
                 EncodingError);
}

TEST_F(BroadcasterTest, EstimateFeeDoublesSimulatedGas) {
    node_.set_simulated_gas(80000);

    auto fee = broadcaster_.estimate_fee({msg_}, {Coin{1, "stake"}}, key_);
    EXPECT_EQ(fee.gas_limit, 160000u);
    ASSERT_EQ(fee.amount.size(), 1u);
    EXPECT_EQ(fee.amount[0].to_string(), "1stake");

    // Simulation reads the on-chain sequence without reserving one
    EXPECT_EQ(node_.simulations().size(), 1u);
    EXPECT_EQ(tracker_.state(address_, kChain), SequenceState::Unknown);
}

TEST_F(BroadcasterTest, EstimateFeePricesGasWhenNoCoinsGiven) {
    node_.set_simulated_gas(80000);
    auto fee = broadcaster_.estimate_fee({msg_}, {}, key_);
    ASSERT_EQ(fee.amount.size(), 1u);
    EXPECT_EQ(fee.amount[0].to_string(), "4000stake");
}

TEST_F(BroadcasterTest, WaitForNextBlock) {
    node_.script_status(ChainStatus{ChainStatus::Kind::Moving, 10});
    node_.script_status(ChainStatus{ChainStatus::Kind::Moving, 10});
    node_.script_status(ChainStatus{ChainStatus::Kind::Moving, 11});

    auto height = broadcaster_.wait_for_next_block(std::chrono::seconds(5));
    ASSERT_TRUE(height.has_value());
    EXPECT_EQ(*height, 11u);
}

TEST_F(BroadcasterTest, WaitForNextBlockTimesOutOnStalledChain) {
    node_.script_status(ChainStatus{ChainStatus::Kind::Moving, 10});
    EXPECT_FALSE(broadcaster_.wait_for_next_block(std::chrono::milliseconds(30)).has_value());
}

TEST_F(BroadcasterTest, WaitForNextBlockRejectsSyncingNode) {
    node_.script_status(ChainStatus{ChainStatus::Kind::Syncing, 0});
    EXPECT_THROW(broadcaster_.wait_for_next_block(std::chrono::seconds(1)), BroadcastError);
}

TEST(BroadcasterConfigTest, RequiresChainId) {
    FakeNodeClient node;
    SequenceTracker tracker([&node](const std::string& address) { return node.get_account(address); });
    ClientConfig config;
    EXPECT_THROW({ Broadcaster broadcaster(node, tracker, config); }, std::invalid_argument);
}

} // namespace
} // namespace cosmkit
