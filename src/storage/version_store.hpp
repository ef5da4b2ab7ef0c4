#pragma once

/**
 * @file version_store.hpp
 * @brief Multi-version key-value store for one block
 *
 * Every key owns a VersionChain: the values written to it by transactions of
 * the block, ordered by transaction index, at most one entry per index.
 *
 *   key "A":  [T1 inc0 = 5] [T4 inc2 = ESTIMATE] [T7 inc0 = 9]
 *
 * A read by transaction i sees the highest entry with index < i and never
 * anything at or above i. An ESTIMATE marks a write that is expected but not
 * produced yet (its writer was aborted or has not run); readers report a
 * dependency on the writer instead of waiting for it.
 *
 * Concurrency: each chain has its own mutex. The key -> chain directory is
 * split into shards guarded by shared mutexes; chains are created on first
 * write and never destroyed while the store lives, so a chain pointer stays
 * valid after the shard lock is released.
 */

#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "common/config.hpp"
#include "common/types.hpp"
#include "tessera/engine.hpp"
#include "tessera/status.hpp"

namespace tessera {

// ─────────────────────────────────────────────────────────────────────────────
// Read Results
// ─────────────────────────────────────────────────────────────────────────────

enum class VersionReadStatus : uint8_t {
    kVersion = 0,   // A real value written by a lower transaction
    kEstimate = 1,  // A lower transaction is expected to write the key
    kAbsent = 2     // No lower transaction wrote the key
};

/**
 * @brief What the store returns for read(key, as_of)
 */
struct VersionRead {
    VersionReadStatus status = VersionReadStatus::kAbsent;
    TxnVersion version;  // Writer; valid unless kAbsent
    StateValue value;    // Valid for kVersion
};

// ─────────────────────────────────────────────────────────────────────────────
// Read Descriptor
// ─────────────────────────────────────────────────────────────────────────────

enum class ReadOrigin : uint8_t {
    kVersion = 0,  // Observed a version in the store
    kStorage = 1   // Observed the prior state (no lower write)
};

/**
 * @brief One key read by an execution attempt and what it observed
 */
struct ReadDescriptor {
    StateKey key;
    ReadOrigin origin = ReadOrigin::kStorage;
    TxnVersion version;  // Valid for kVersion

    [[nodiscard]] static ReadDescriptor from_storage(StateKey key) {
        return ReadDescriptor{std::move(key), ReadOrigin::kStorage, TxnVersion()};
    }

    [[nodiscard]] static ReadDescriptor from_version(StateKey key, TxnVersion version) {
        return ReadDescriptor{std::move(key), ReadOrigin::kVersion, version};
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Write Outcomes
// ─────────────────────────────────────────────────────────────────────────────

enum class WriteOutcome : uint8_t {
    kInstalled = 0,         // The entry now holds the value
    kStaleIncarnation = 1,  // A newer incarnation of the index is resident
    kRaceLost = 2           // First-wins: an older incarnation was not retracted
};

/**
 * @brief Convert write outcome to string for debugging
 */
[[nodiscard]] inline const char* write_outcome_to_string(WriteOutcome outcome) {
    switch (outcome) {
        case WriteOutcome::kInstalled:
            return "INSTALLED";
        case WriteOutcome::kStaleIncarnation:
            return "STALE_INCARNATION";
        case WriteOutcome::kRaceLost:
            return "RACE_LOST";
        default:
            return "UNKNOWN";
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Version Chain
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Versions of a single key, ordered by transaction index
 *
 * Thread safety: all methods are thread-safe.
 */
class VersionChain {
public:
    VersionChain() = default;
    ~VersionChain() = default;

    VersionChain(const VersionChain&) = delete;
    VersionChain& operator=(const VersionChain&) = delete;

    /**
     * @brief Latest entry with index < as_of
     * @param skip_estimates Read through ESTIMATEs to the next real value
     */
    [[nodiscard]] VersionRead read(txn_idx_t as_of, bool skip_estimates) const;

    /**
     * @brief Install the value written by one attempt
     */
    [[nodiscard]] WriteOutcome write(TxnVersion version, StateValue value,
                                     CommitRacePolicy policy);

    /**
     * @brief Turn the entry of version.txn_idx into an ESTIMATE
     *
     * Inserts a placeholder when the index has no entry yet. Refuses (returns
     * false) when a newer incarnation is resident.
     */
    bool mark_estimate(TxnVersion version);

    /**
     * @brief Drop the entry of version.txn_idx unless a newer incarnation owns it
     * @return true if an entry was removed
     */
    bool remove(TxnVersion version);

    /**
     * @brief Highest-index entry, used for the final state
     * @return false if the chain is empty
     */
    bool latest(TxnVersion* version, bool* is_estimate, StateValue* value) const;

    [[nodiscard]] size_t size() const;

private:
    struct Entry {
        incarnation_t incarnation = INITIAL_INCARNATION;
        bool estimate = false;
        StateValue value;
    };

    mutable std::mutex mutex_;
    std::map<txn_idx_t, Entry> entries_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Version Store
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief All version chains of a block
 *
 * Thread safety: all methods are thread-safe. Operations on different keys
 * only meet on a shard's shared mutex, and only when a chain is created.
 */
class VersionStore {
public:
    /**
     * @brief Create an empty store
     * @param shard_count Directory shards, must be a power of two
     */
    explicit VersionStore(size_t shard_count = config::kVersionStoreShards);

    ~VersionStore() = default;

    // Non-copyable, non-movable
    VersionStore(const VersionStore&) = delete;
    VersionStore& operator=(const VersionStore&) = delete;
    VersionStore(VersionStore&&) = delete;
    VersionStore& operator=(VersionStore&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Reads
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Read key as of a transaction index
     *
     * Returns the latest entry written by a transaction with index < as_of.
     * kAbsent means the caller should consult the prior state.
     */
    [[nodiscard]] VersionRead read(const StateKey& key, txn_idx_t as_of,
                                   bool skip_estimates = false) const;

    /**
     * @brief Check that a recorded read would observe the same thing now
     *
     * An ESTIMATE never validates.
     */
    [[nodiscard]] bool validate_read(const ReadDescriptor& read, txn_idx_t reader) const;

    // ─────────────────────────────────────────────────────────────────────────
    // Writes
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Install the value one attempt wrote to key
     */
    [[nodiscard]] WriteOutcome write(const StateKey& key, TxnVersion version,
                                     StateValue value, CommitRacePolicy policy);

    /**
     * @brief Install or convert to an ESTIMATE placeholder
     */
    bool mark_estimate(const StateKey& key, TxnVersion version);

    /**
     * @brief Remove the entry an index holds for key
     */
    bool remove(const StateKey& key, TxnVersion version);

    // ─────────────────────────────────────────────────────────────────────────
    // Final State
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Collect the highest-index value of every key
     * @param delta Output, cleared first
     * @return Internal if an ESTIMATE is still the latest entry of some key
     */
    [[nodiscard]] Status snapshot(StateDelta* delta) const;

    /**
     * @brief Number of keys written during the block
     */
    [[nodiscard]] size_t key_count() const;

private:
    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<StateKey, std::unique_ptr<VersionChain>> chains;
    };

    [[nodiscard]] Shard& shard_for(const StateKey& key) const;

    /// Chain for key, or nullptr if nothing was ever written to it
    [[nodiscard]] VersionChain* find_chain(const StateKey& key) const;

    [[nodiscard]] VersionChain& get_or_create_chain(const StateKey& key);

    size_t shard_count_;
    std::unique_ptr<Shard[]> shards_;
};

}  // namespace tessera
