#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <set>
#include <thread>
#include <vector>
#include "error.hpp"
#include "sequence_tracker.hpp"

namespace cosmkit {
namespace {

constexpr const char* kAddress = "cosmos1nx7vqq8hsy8chwe27mcr4cmazdwus7zjl2ds0p";
constexpr const char* kOther = "cosmos1pr2n6tfymnn2tk6rkxlu9q5q2zq5ka3wtu7sdj";
constexpr const char* kChain = "test-chain";

class SequenceTrackerTest : public ::testing::Test {
protected:
    AccountInfo fetch(const std::string&) {
        ++fetches_;
        return AccountInfo{12, node_sequence_.load()};
    }

    std::atomic<uint64_t> node_sequence_{40};
    std::atomic<int> fetches_{0};
    SequenceTracker tracker_{[this](const std::string& address) { return fetch(address); }};
};

TEST_F(SequenceTrackerTest, FetchesOnFirstUseThenCountsLocally) {
    EXPECT_EQ(tracker_.state(kAddress, kChain), SequenceState::Unknown);
    EXPECT_FALSE(tracker_.peek(kAddress, kChain).has_value());

    auto first = tracker_.next_sequence(kAddress, kChain);
    auto second = tracker_.next_sequence(kAddress, kChain);

    EXPECT_EQ(first.account_number, 12u);
    EXPECT_EQ(first.sequence, 40u);
    EXPECT_EQ(second.sequence, 41u);
    EXPECT_EQ(fetches_.load(), 1);
    EXPECT_EQ(tracker_.state(kAddress, kChain), SequenceState::Synced);
    EXPECT_EQ(tracker_.peek(kAddress, kChain)->sequence, 42u);
}

TEST_F(SequenceTrackerTest, ChainsAreTrackedSeparately) {
    tracker_.next_sequence(kAddress, kChain);
    tracker_.next_sequence(kAddress, kChain);
    auto other_chain = tracker_.next_sequence(kAddress, "other-chain");
    EXPECT_EQ(other_chain.sequence, 40u);
    EXPECT_EQ(fetches_.load(), 2);
}

TEST_F(SequenceTrackerTest, ResyncOverwritesLocalCounter) {
    tracker_.next_sequence(kAddress, kChain);
    tracker_.next_sequence(kAddress, kChain);

    node_sequence_ = 55;
    auto info = tracker_.resync(kAddress, kChain);
    EXPECT_EQ(info.sequence, 55u);
    EXPECT_EQ(tracker_.next_sequence(kAddress, kChain).sequence, 55u);
}

TEST_F(SequenceTrackerTest, StaleEntryRefetchesOnNextReservation) {
    tracker_.next_sequence(kAddress, kChain);
    tracker_.mark_stale(kAddress, kChain);
    EXPECT_EQ(tracker_.state(kAddress, kChain), SequenceState::Stale);

    node_sequence_ = 41;
    EXPECT_EQ(tracker_.next_sequence(kAddress, kChain).sequence, 41u);
    EXPECT_EQ(tracker_.state(kAddress, kChain), SequenceState::Synced);
    EXPECT_EQ(fetches_.load(), 2);
}

TEST_F(SequenceTrackerTest, MarkStaleOnUnknownEntryIsNoOp) {
    tracker_.mark_stale(kAddress, kChain);
    EXPECT_EQ(tracker_.state(kAddress, kChain), SequenceState::Unknown);
}

TEST_F(SequenceTrackerTest, ConcurrentReservationsAreGapFree) {
    constexpr int kThreads = 16;
    constexpr int kPerThread = 50;

    std::vector<std::thread> threads;
    std::vector<std::vector<uint64_t>> seen(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this, &seen, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                seen[t].push_back(tracker_.next_sequence(kAddress, kChain).sequence);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::set<uint64_t> all;
    for (const auto& values : seen) {
        // Each caller's own reservations increase
        EXPECT_TRUE(std::is_sorted(values.begin(), values.end()));
        all.insert(values.begin(), values.end());
    }
    ASSERT_EQ(all.size(), static_cast<size_t>(kThreads * kPerThread));
    EXPECT_EQ(*all.begin(), 40u);
    EXPECT_EQ(*all.rbegin(), 40u + kThreads * kPerThread - 1);
    EXPECT_EQ(fetches_.load(), 1);
}

TEST(SequenceTrackerIsolationTest, SlowFetchDoesNotBlockOtherAccounts) {
    std::atomic<bool> release{false};
    SequenceTracker tracker([&release](const std::string& address) {
        if (address == kAddress) {
            while (!release.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        }
        return AccountInfo{1, 5};
    });

    std::thread slow([&tracker]() { tracker.next_sequence(kAddress, kChain); });

    // Completes while the first account's fetch is still parked
    auto reservation = tracker.next_sequence(kOther, kChain);
    EXPECT_EQ(reservation.sequence, 5u);

    release = true;
    slow.join();
    EXPECT_EQ(tracker.peek(kAddress, kChain)->sequence, 6u);
}

// Fetcher that parks every call until released
class ParkedFetcher {
public:
    AccountInfo operator()(const std::string&) {
        ++calls_;
        started_ = true;
        while (!released_.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return AccountInfo{4, sequence_.load()};
    }

    void wait_until_started() const {
        while (!started_.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    std::atomic<int> calls_{0};
    std::atomic<bool> started_{false};
    std::atomic<bool> released_{false};
    std::atomic<uint64_t> sequence_{20};
};

TEST(SequenceTrackerInFlightTest, QueriesAnswerWhileFetchRuns) {
    ParkedFetcher fetcher;
    fetcher.released_ = true;
    SequenceTracker tracker([&fetcher](const std::string& address) { return fetcher(address); });
    tracker.next_sequence(kAddress, kChain);
    fetcher.started_ = false;
    fetcher.released_ = false;

    std::thread resyncing([&tracker]() { tracker.resync(kAddress, kChain); });
    fetcher.wait_until_started();

    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(tracker.state(kAddress, kChain), SequenceState::Stale);
    EXPECT_TRUE(tracker.peek(kAddress, kChain).has_value());
    tracker.mark_stale(kAddress, kChain);
    auto waited = std::chrono::steady_clock::now() - start;
    EXPECT_LT(waited, std::chrono::milliseconds(100));

    fetcher.sequence_ = 30;
    fetcher.released_ = true;
    resyncing.join();
    EXPECT_EQ(tracker.state(kAddress, kChain), SequenceState::Synced);
    EXPECT_EQ(tracker.next_sequence(kAddress, kChain).sequence, 30u);
}

TEST(SequenceTrackerInFlightTest, ReservationsShareOneFetch) {
    ParkedFetcher fetcher;
    SequenceTracker tracker([&fetcher](const std::string& address) { return fetcher(address); });

    constexpr int kThreads = 6;
    std::vector<std::thread> threads;
    std::vector<uint64_t> seen(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&tracker, &seen, t]() { seen[t] = tracker.next_sequence(kAddress, kChain).sequence; });
    }
    fetcher.wait_until_started();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    fetcher.released_ = true;
    for (auto& thread : threads) {
        thread.join();
    }

    std::sort(seen.begin(), seen.end());
    for (int t = 0; t < kThreads; ++t) {
        EXPECT_EQ(seen[t], 20u + t);
    }
    EXPECT_EQ(fetcher.calls_.load(), 1);
}

TEST(SequenceTrackerInFlightTest, ReservationDuringResyncGetsFreshSequence) {
    ParkedFetcher fetcher;
    fetcher.released_ = true;
    SequenceTracker tracker([&fetcher](const std::string& address) { return fetcher(address); });
    tracker.next_sequence(kAddress, kChain);

    fetcher.released_ = false;
    fetcher.started_ = false;
    fetcher.sequence_ = 50;
    std::thread resyncing([&tracker]() { tracker.resync(kAddress, kChain); });
    fetcher.wait_until_started();

    uint64_t reserved = 0;
    std::thread reserving([&tracker, &reserved]() { reserved = tracker.next_sequence(kAddress, kChain).sequence; });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    fetcher.released_ = true;
    resyncing.join();
    reserving.join();

    EXPECT_EQ(reserved, 50u);
    EXPECT_EQ(fetcher.calls_.load(), 2);
}

TEST(SequenceTrackerFailureTest, FailedFetchLeavesEntryUnknown) {
    int calls = 0;
    SequenceTracker tracker([&calls](const std::string&) -> AccountInfo {
        if (++calls == 1) {
            throw BroadcastError(BroadcastError::ErrorType::NodeUnavailable, "connection refused");
        }
        return AccountInfo{3, 9};
    });

    EXPECT_THROW(tracker.next_sequence(kAddress, kChain), BroadcastError);
    EXPECT_EQ(tracker.state(kAddress, kChain), SequenceState::Unknown);
    EXPECT_EQ(tracker.next_sequence(kAddress, kChain).sequence, 9u);
}

TEST(SequenceTrackerFailureTest, RequiresFetcher) {
    EXPECT_THROW({ SequenceTracker tracker{AccountFetcher{}}; }, SequenceError);
}

} // namespace
} // namespace cosmkit
