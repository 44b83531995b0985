#include "sequence_tracker.hpp"
#include "logging.hpp"
#include "error.hpp"
#include <exception>

namespace cosmkit {

namespace {

logging::Logger& logger() {
    return logging::get_logger("sequence");
}

} // namespace

SequenceTracker::SequenceTracker(AccountFetcher fetcher)
    : fetcher_(std::move(fetcher))
{
    if (!fetcher_) {
        throw SequenceError(SequenceError::ErrorType::Unknown, "Sequence tracker needs an account fetcher");
    }
}

std::shared_ptr<SequenceTracker::Entry> SequenceTracker::entry(const std::string& address,
                                                               const std::string& chain_id) {
    std::lock_guard<std::mutex> lock(table_mutex_);
    auto& slot = entries_[Key(address, chain_id)];
    if (!slot) {
        slot = std::make_shared<Entry>();
    }
    return slot;
}

std::shared_ptr<SequenceTracker::Entry> SequenceTracker::find(const std::string& address,
                                                              const std::string& chain_id) const {
    std::lock_guard<std::mutex> lock(table_mutex_);
    auto it = entries_.find(Key(address, chain_id));
    if (it == entries_.end()) {
        return nullptr;
    }
    return it->second;
}

/*
 * Runs the fetcher for one entry without holding its lock.
 *
 * Called and returns with `lock` held on entry.mutex. The fetch is published
 * as entry.pending so reservations arriving meanwhile wait for it instead of
 * starting their own. Only the newest fetch installs its result; an older
 * one that finishes late leaves the entry alone. A failed fetch leaves the
 * entry's state untouched so the next reservation tries again.
 */
AccountInfo SequenceTracker::fetch(Entry& entry, std::unique_lock<std::mutex>& lock, const std::string& address,
                                   const std::string& chain_id) {
    auto promise = std::make_shared<std::promise<AccountInfo>>();
    entry.pending = promise->get_future().share();
    const uint64_t ticket = ++entry.generation;
    lock.unlock();

    AccountInfo info;
    try {
        info = fetcher_(address);
    } catch (...) {
        lock.lock();
        if (ticket == entry.generation) {
            entry.pending = {};
        }
        promise->set_exception(std::current_exception());
        throw;
    }

    lock.lock();
    logger().debug << "Fetched " << address << " on " << chain_id
                << ": account " << info.account_number << ", sequence " << info.sequence;
    if (ticket == entry.generation) {
        entry.info = info;
        entry.state = SequenceState::Synced;
        entry.pending = {};
    }
    promise->set_value(info);
    return info;
}

SequenceReservation SequenceTracker::next_sequence(const std::string& address, const std::string& chain_id) {
    auto e = entry(address, chain_id);
    std::unique_lock<std::mutex> lock(e->mutex);

    while (e->state != SequenceState::Synced) {
        if (e->pending.valid()) {
            auto pending = e->pending;
            lock.unlock();
            pending.get();
            lock.lock();
        } else {
            fetch(*e, lock, address, chain_id);
        }
    }

    SequenceReservation reservation{e->info.account_number, e->info.sequence};
    ++e->info.sequence;
    return reservation;
}

AccountInfo SequenceTracker::resync(const std::string& address, const std::string& chain_id) {
    auto e = entry(address, chain_id);
    std::unique_lock<std::mutex> lock(e->mutex);

    // The local counter is no longer trusted; hold reservations until the
    // refetch lands
    if (e->state == SequenceState::Synced) {
        e->state = SequenceState::Stale;
    }
    uint64_t previous = e->info.sequence;
    AccountInfo info = fetch(*e, lock, address, chain_id);
    if (previous != info.sequence) {
        logger().info << "Resynced " << address << " on " << chain_id << ": local sequence "
                   << previous << " replaced by " << info.sequence;
    }
    return info;
}

void SequenceTracker::mark_stale(const std::string& address, const std::string& chain_id) {
    auto e = entry(address, chain_id);
    std::lock_guard<std::mutex> lock(e->mutex);
    if (e->state == SequenceState::Synced) {
        e->state = SequenceState::Stale;
        logger().warning << "Sequence for " << address << " on " << chain_id << " marked stale";
    }
}

SequenceState SequenceTracker::state(const std::string& address, const std::string& chain_id) const {
    auto e = find(address, chain_id);
    if (!e) {
        return SequenceState::Unknown;
    }
    std::lock_guard<std::mutex> lock(e->mutex);
    return e->state;
}

std::optional<AccountInfo> SequenceTracker::peek(const std::string& address, const std::string& chain_id) const {
    auto e = find(address, chain_id);
    if (!e) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(e->mutex);
    if (e->state == SequenceState::Unknown) {
        return std::nullopt;
    }
    return e->info;
}

} // namespace cosmkit
