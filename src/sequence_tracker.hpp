#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace cosmkit {

// Account number and next expected sequence as reported by a node
struct AccountInfo {
    uint64_t account_number = 0;
    uint64_t sequence = 0;

    bool operator==(const AccountInfo&) const = default;
};

using AccountFetcher = std::function<AccountInfo(const std::string& address)>;

struct SequenceReservation {
    uint64_t account_number = 0;
    uint64_t sequence = 0;
};

enum class SequenceState {
    Unknown,  // never fetched
    Synced,   // local counter follows the node
    Stale     // node rejected a sequence; refetch before the next reservation
};

/**
 * Hands out account sequences for (address, chain id) pairs.
 *
 * Each pair has its own entry with its own mutex. The table mutex only
 * covers looking up or inserting an entry. Reservations on one entry are
 * serialized, which makes concurrent callers receive consecutive, distinct
 * sequences.
 *
 * No lock is held while the fetcher runs. One fetch per entry is in flight
 * at a time; reservations that need it wait on its result, while state(),
 * peek() and mark_stale() answer immediately.
 */
class SequenceTracker {
public:
    explicit SequenceTracker(AccountFetcher fetcher);

    SequenceTracker(const SequenceTracker&) = delete;
    SequenceTracker& operator=(const SequenceTracker&) = delete;

    // Fetches first if the entry is Unknown or Stale, then returns the
    // current sequence and advances the counter
    SequenceReservation next_sequence(const std::string& address, const std::string& chain_id);

    // Refetches from the node and overwrites the local counter. Reservations
    // made while the refetch runs wait for its result.
    AccountInfo resync(const std::string& address, const std::string& chain_id);

    void mark_stale(const std::string& address, const std::string& chain_id);

    SequenceState state(const std::string& address, const std::string& chain_id) const;

    // Next sequence that would be handed out, if the entry has been fetched
    std::optional<AccountInfo> peek(const std::string& address, const std::string& chain_id) const;

private:
    struct Entry {
        std::mutex mutex;
        SequenceState state = SequenceState::Unknown;
        AccountInfo info;
        std::shared_future<AccountInfo> pending;  // valid while a fetch runs
        uint64_t generation = 0;                  // bumped by every fetch
    };

    using Key = std::pair<std::string, std::string>;

    std::shared_ptr<Entry> entry(const std::string& address, const std::string& chain_id);
    std::shared_ptr<Entry> find(const std::string& address, const std::string& chain_id) const;

    AccountInfo fetch(Entry& entry, std::unique_lock<std::mutex>& lock, const std::string& address,
                      const std::string& chain_id);

    AccountFetcher fetcher_;
    mutable std::mutex table_mutex_;
    std::map<Key, std::shared_ptr<Entry>> entries_;
};

} // namespace cosmkit
