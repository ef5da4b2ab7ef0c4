/**
 * @file version_store.cpp
 * @brief Version chain and version store implementation
 */

#include "storage/version_store.hpp"

#include <string>

#include "common/logger.hpp"
#include "common/macros.hpp"

namespace tessera {

// ─────────────────────────────────────────────────────────────────────────────
// VersionChain
// ─────────────────────────────────────────────────────────────────────────────

VersionRead VersionChain::read(txn_idx_t as_of, bool skip_estimates) const {
    std::lock_guard<std::mutex> lock(mutex_);

    VersionRead result;
    auto it = entries_.lower_bound(as_of);  // First entry at or above as_of
    while (it != entries_.begin()) {
        --it;
        const Entry& entry = it->second;
        if (entry.estimate) {
            if (skip_estimates) {
                continue;
            }
            result.status = VersionReadStatus::kEstimate;
            result.version = TxnVersion(it->first, entry.incarnation);
            return result;
        }
        result.status = VersionReadStatus::kVersion;
        result.version = TxnVersion(it->first, entry.incarnation);
        result.value = entry.value;
        return result;
    }
    return result;
}

WriteOutcome VersionChain::write(TxnVersion version, StateValue value,
                                 CommitRacePolicy policy) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(version.txn_idx);
    if (it == entries_.end()) {
        entries_.emplace(version.txn_idx,
                         Entry{version.incarnation, false, std::move(value)});
        return WriteOutcome::kInstalled;
    }

    Entry& entry = it->second;
    if (entry.incarnation > version.incarnation) {
        return WriteOutcome::kStaleIncarnation;
    }

    // An older incarnation's real value is still resident: under first-wins
    // its abort has to turn it into an ESTIMATE before anyone replaces it.
    if (policy == CommitRacePolicy::kFirstWins &&
        entry.incarnation < version.incarnation && !entry.estimate) {
        return WriteOutcome::kRaceLost;
    }

    entry.incarnation = version.incarnation;
    entry.estimate = false;
    entry.value = std::move(value);
    return WriteOutcome::kInstalled;
}

bool VersionChain::mark_estimate(TxnVersion version) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(version.txn_idx);
    if (it == entries_.end()) {
        entries_.emplace(version.txn_idx, Entry{version.incarnation, true, StateValue()});
        return true;
    }

    Entry& entry = it->second;
    if (entry.incarnation > version.incarnation) {
        return false;
    }
    entry.incarnation = version.incarnation;
    entry.estimate = true;
    entry.value.clear();
    return true;
}

bool VersionChain::remove(TxnVersion version) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(version.txn_idx);
    if (it == entries_.end() || it->second.incarnation > version.incarnation) {
        return false;
    }
    entries_.erase(it);
    return true;
}

bool VersionChain::latest(TxnVersion* version, bool* is_estimate, StateValue* value) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (entries_.empty()) {
        return false;
    }
    const auto& [idx, entry] = *entries_.rbegin();
    *version = TxnVersion(idx, entry.incarnation);
    *is_estimate = entry.estimate;
    *value = entry.value;
    return true;
}

size_t VersionChain::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

// ─────────────────────────────────────────────────────────────────────────────
// VersionStore
// ─────────────────────────────────────────────────────────────────────────────

VersionStore::VersionStore(size_t shard_count)
    : shard_count_(shard_count), shards_(std::make_unique<Shard[]>(shard_count)) {
    TESSERA_ASSERT(shard_count > 0 && (shard_count & (shard_count - 1)) == 0,
                   "shard count must be a power of two");
}

VersionStore::Shard& VersionStore::shard_for(const StateKey& key) const {
    return shards_[shard_of(key, shard_count_)];
}

VersionChain* VersionStore::find_chain(const StateKey& key) const {
    Shard& shard = shard_for(key);
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.chains.find(key);
    return it == shard.chains.end() ? nullptr : it->second.get();
}

VersionChain& VersionStore::get_or_create_chain(const StateKey& key) {
    Shard& shard = shard_for(key);
    {
        std::shared_lock<std::shared_mutex> lock(shard.mutex);
        auto it = shard.chains.find(key);
        if (it != shard.chains.end()) {
            return *it->second;
        }
    }

    std::unique_lock<std::shared_mutex> lock(shard.mutex);
    auto& slot = shard.chains[key];
    if (slot == nullptr) {
        slot = std::make_unique<VersionChain>();
    }
    return *slot;
}

VersionRead VersionStore::read(const StateKey& key, txn_idx_t as_of,
                               bool skip_estimates) const {
    VersionChain* chain = find_chain(key);
    if (chain == nullptr) {
        return VersionRead{};
    }
    return chain->read(as_of, skip_estimates);
}

bool VersionStore::validate_read(const ReadDescriptor& read, txn_idx_t reader) const {
    VersionRead current = this->read(read.key, reader);

    switch (read.origin) {
        case ReadOrigin::kStorage:
            return current.status == VersionReadStatus::kAbsent;
        case ReadOrigin::kVersion:
            return current.status == VersionReadStatus::kVersion &&
                   current.version == read.version;
    }
    return false;
}

WriteOutcome VersionStore::write(const StateKey& key, TxnVersion version,
                                 StateValue value, CommitRacePolicy policy) {
    return get_or_create_chain(key).write(version, std::move(value), policy);
}

bool VersionStore::mark_estimate(const StateKey& key, TxnVersion version) {
    return get_or_create_chain(key).mark_estimate(version);
}

bool VersionStore::remove(const StateKey& key, TxnVersion version) {
    VersionChain* chain = find_chain(key);
    if (chain == nullptr) {
        return false;
    }
    return chain->remove(version);
}

Status VersionStore::snapshot(StateDelta* delta) const {
    delta->clear();

    for (size_t i = 0; i < shard_count_; ++i) {
        const Shard& shard = shards_[i];
        std::shared_lock<std::shared_mutex> lock(shard.mutex);

        for (const auto& [key, chain] : shard.chains) {
            TxnVersion version;
            bool is_estimate = false;
            StateValue value;
            if (!chain->latest(&version, &is_estimate, &value)) {
                continue;  // Every write to the key was retracted
            }
            if (is_estimate) {
                LOG_CRITICAL("Key '{}' ends the block with an ESTIMATE from txn {}",
                             key, version.txn_idx);
                return Status::Internal("unresolved ESTIMATE for key " + key +
                                        " written by txn " +
                                        std::to_string(version.txn_idx));
            }
            delta->emplace(key, std::move(value));
        }
    }

    return Status::Ok();
}

size_t VersionStore::key_count() const {
    size_t count = 0;
    for (size_t i = 0; i < shard_count_; ++i) {
        std::shared_lock<std::shared_mutex> lock(shards_[i].mutex);
        count += shards_[i].chains.size();
    }
    return count;
}

}  // namespace tessera
