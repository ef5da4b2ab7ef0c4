/**
 * @file dependency_tracker.cpp
 * @brief Dependency tracker implementation
 */

#include "transaction/dependency_tracker.hpp"

#include <algorithm>

#include "common/macros.hpp"

namespace tessera {

DependencyTracker::DependencyTracker(size_t num_txns, size_t shard_count)
    : num_txns_(num_txns),
      shard_count_(shard_count),
      key_shards_(std::make_unique<KeyShard[]>(shard_count)),
      readers_(std::make_unique<ReaderEntry[]>(num_txns)) {
    TESSERA_ASSERT(shard_count > 0 && (shard_count & (shard_count - 1)) == 0,
                   "shard count must be a power of two");
}

void DependencyTracker::record(txn_idx_t reader, const std::vector<ReadDescriptor>& reads) {
    std::vector<StateKey> new_keys;
    std::vector<txn_idx_t> new_read_from;
    new_keys.reserve(reads.size());
    for (const auto& read : reads) {
        new_keys.push_back(read.key);
        if (read.origin == ReadOrigin::kVersion) {
            new_read_from.push_back(read.version.txn_idx);
        }
    }
    std::sort(new_keys.begin(), new_keys.end());
    new_keys.erase(std::unique(new_keys.begin(), new_keys.end()), new_keys.end());
    std::sort(new_read_from.begin(), new_read_from.end());
    new_read_from.erase(std::unique(new_read_from.begin(), new_read_from.end()),
                        new_read_from.end());

    ReaderEntry& entry = readers_[reader];
    std::vector<StateKey> old_keys;
    {
        std::lock_guard<std::mutex> lock(entry.mutex);
        old_keys = std::move(entry.keys);
        entry.keys = new_keys;
        entry.read_from = std::move(new_read_from);
    }

    // Both key lists are sorted: walk them together
    auto old_it = old_keys.begin();
    auto new_it = new_keys.begin();
    while (old_it != old_keys.end() || new_it != new_keys.end()) {
        if (new_it == new_keys.end() || (old_it != old_keys.end() && *old_it < *new_it)) {
            KeyShard& shard = shard_for(*old_it);
            std::lock_guard<std::mutex> lock(shard.mutex);
            auto found = shard.readers.find(*old_it);
            if (found != shard.readers.end()) {
                found->second.erase(reader);
                if (found->second.empty()) {
                    shard.readers.erase(found);
                }
            }
            ++old_it;
        } else if (old_it == old_keys.end() || *new_it < *old_it) {
            KeyShard& shard = shard_for(*new_it);
            std::lock_guard<std::mutex> lock(shard.mutex);
            shard.readers[*new_it].insert(reader);
            ++new_it;
        } else {
            ++old_it;  // Still read, still registered
            ++new_it;
        }
    }
}

std::vector<txn_idx_t> DependencyTracker::read_from(txn_idx_t reader) const {
    const ReaderEntry& entry = readers_[reader];
    std::lock_guard<std::mutex> lock(entry.mutex);
    return entry.read_from;
}

std::set<txn_idx_t> DependencyTracker::readers_after(txn_idx_t writer,
                                                     const std::vector<StateKey>& keys) const {
    std::set<txn_idx_t> result;
    for (const auto& key : keys) {
        KeyShard& shard = shard_for(key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto found = shard.readers.find(key);
        if (found == shard.readers.end()) {
            continue;
        }
        result.insert(found->second.upper_bound(writer), found->second.end());
    }
    return result;
}

}  // namespace tessera
