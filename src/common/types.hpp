#pragma once

/**
 * @file types.hpp
 * @brief Common type definitions for Tessera
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <string>

#include "tessera/block.hpp"

namespace tessera {

// ─────────────────────────────────────────────────────────────────────────────
// Invalid/Sentinel Values
// ─────────────────────────────────────────────────────────────────────────────

/// Invalid transaction index
constexpr txn_idx_t INVALID_TXN_IDX = std::numeric_limits<txn_idx_t>::max();

/// First incarnation of every transaction
constexpr incarnation_t INITIAL_INCARNATION = 0;

// ─────────────────────────────────────────────────────────────────────────────
// Transaction Version - uniquely identifies an execution attempt
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief (index, incarnation) pair naming one execution attempt
 */
struct TxnVersion {
    txn_idx_t txn_idx = INVALID_TXN_IDX;
    incarnation_t incarnation = INITIAL_INCARNATION;

    TxnVersion() = default;
    TxnVersion(txn_idx_t idx, incarnation_t inc) : txn_idx(idx), incarnation(inc) {}

    [[nodiscard]] bool is_valid() const noexcept { return txn_idx != INVALID_TXN_IDX; }

    bool operator==(const TxnVersion& other) const noexcept {
        return txn_idx == other.txn_idx && incarnation == other.incarnation;
    }

    bool operator!=(const TxnVersion& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const TxnVersion& other) const noexcept {
        if (txn_idx != other.txn_idx) return txn_idx < other.txn_idx;
        return incarnation < other.incarnation;
    }
};

/**
 * @brief Pick the shard of a key for a power-of-two shard count
 */
inline size_t shard_of(const StateKey& key, size_t shard_count) noexcept {
    return std::hash<StateKey>{}(key) & (shard_count - 1);
}

}  // namespace tessera

// Hash support for TxnVersion
namespace std {
template <>
struct hash<tessera::TxnVersion> {
    size_t operator()(const tessera::TxnVersion& version) const noexcept {
        return hash<uint64_t>{}(
            (static_cast<uint64_t>(version.txn_idx) << 32) | version.incarnation
        );
    }
};
}  // namespace std
