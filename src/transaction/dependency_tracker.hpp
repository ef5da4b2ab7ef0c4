#pragma once

/**
 * @file dependency_tracker.hpp
 * @brief Read-from relation between the transactions of a block
 *
 * For every transaction the tracker remembers which keys its last completed
 * attempt read and which lower indices it read them from. The reverse index
 * (key -> readers) lets the scheduler find the higher transactions to
 * re-validate when a key changes, without scanning the whole block.
 */

#include <memory>
#include <mutex>
#include <set>
#include <unordered_map>
#include <vector>

#include "common/config.hpp"
#include "common/macros.hpp"
#include "common/types.hpp"
#include "storage/version_store.hpp"

namespace tessera {

/**
 * @brief Key -> reader index and reader -> writer index relations
 *
 * Thread safety: all methods are thread-safe. record() for one reader must
 * not run concurrently with another record() for the same reader; the
 * scheduler serializes them under the reader's status lock.
 */
class DependencyTracker {
public:
    /**
     * @brief Create a tracker for a block
     * @param num_txns Number of transactions in the block
     * @param shard_count Shards of the key index, must be a power of two
     */
    explicit DependencyTracker(size_t num_txns,
                               size_t shard_count = config::kDependencyTrackerShards);

    ~DependencyTracker() = default;

    TESSERA_DISALLOW_COPY_AND_MOVE(DependencyTracker);

    /**
     * @brief Replace the reads registered for a transaction
     *
     * Keys the previous attempt read but this one did not are unregistered.
     */
    void record(txn_idx_t reader, const std::vector<ReadDescriptor>& reads);

    /**
     * @brief Distinct lower indices the last attempt of reader read from
     * @return Sorted ascending
     */
    [[nodiscard]] std::vector<txn_idx_t> read_from(txn_idx_t reader) const;

    /**
     * @brief Registered readers of any of the keys with index > writer
     */
    [[nodiscard]] std::set<txn_idx_t> readers_after(txn_idx_t writer,
                                                    const std::vector<StateKey>& keys) const;

    [[nodiscard]] size_t size() const noexcept { return num_txns_; }

private:
    struct KeyShard {
        mutable std::mutex mutex;
        std::unordered_map<StateKey, std::set<txn_idx_t>> readers;
    };

    struct ReaderEntry {
        mutable std::mutex mutex;
        std::vector<StateKey> keys;
        std::vector<txn_idx_t> read_from;
    };

    [[nodiscard]] KeyShard& shard_for(const StateKey& key) const {
        return key_shards_[shard_of(key, shard_count_)];
    }

    size_t num_txns_;
    size_t shard_count_;
    std::unique_ptr<KeyShard[]> key_shards_;
    std::unique_ptr<ReaderEntry[]> readers_;
};

}  // namespace tessera
