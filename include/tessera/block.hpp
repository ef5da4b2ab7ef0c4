#pragma once

/**
 * @file block.hpp
 * @brief Block, transaction and outcome types for Tessera
 */

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tessera {

// ─────────────────────────────────────────────────────────────────────────────
// Basic Type Aliases
// ─────────────────────────────────────────────────────────────────────────────

/// Position of a transaction in the consensus-ordered block (0-based)
using txn_idx_t = uint32_t;

/// Re-execution attempt counter of one transaction index
using incarnation_t = uint32_t;

/// Opaque state key (account balance, contract storage slot, ...)
using StateKey = std::string;

/// Opaque state value
using StateValue = std::string;

/// Values produced by one execution attempt
using WriteSet = std::unordered_map<StateKey, StateValue>;

/// Block-level state change handed to the storage layer, ordered by key
using StateDelta = std::map<StateKey, StateValue>;

// ─────────────────────────────────────────────────────────────────────────────
// Transaction
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief A transaction as seen by the engine
 *
 * The engine never looks inside a transaction; only the ExecutionBackend
 * does. Backends downcast to their own concrete type.
 */
class Transaction {
public:
    virtual ~Transaction() = default;

    /**
     * @brief Short description for logs
     */
    [[nodiscard]] virtual std::string describe() const = 0;
};

/**
 * @brief Consensus-supplied locality hint for one transaction
 *
 * The keys a transaction is expected to touch. Hints only steer scheduling;
 * a wrong hint costs performance, never correctness.
 */
struct TxnHint {
    std::vector<StateKey> read_keys;
    std::vector<StateKey> write_keys;
};

/// One hint per transaction, or empty when consensus supplies none
using LocalityHints = std::vector<TxnHint>;

/**
 * @brief A consensus-ordered batch of transactions
 */
struct Block {
    std::vector<std::shared_ptr<const Transaction>> transactions;
    LocalityHints hints;

    [[nodiscard]] size_t size() const noexcept { return transactions.size(); }
    [[nodiscard]] bool empty() const noexcept { return transactions.empty(); }
    [[nodiscard]] bool has_hints() const noexcept { return !hints.empty(); }
};

// ─────────────────────────────────────────────────────────────────────────────
// Outcome
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Committed result of one transaction
 *
 * A failed transaction (e.g. insufficient balance) is a normal outcome: it
 * commits with success == false and whatever writes the backend produced.
 */
struct Outcome {
    bool success = true;
    std::string payload;

    [[nodiscard]] static Outcome Success(std::string payload = "") {
        return Outcome{true, std::move(payload)};
    }
    [[nodiscard]] static Outcome Failure(std::string payload) {
        return Outcome{false, std::move(payload)};
    }

    bool operator==(const Outcome& other) const noexcept {
        return success == other.success && payload == other.payload;
    }
    bool operator!=(const Outcome& other) const noexcept { return !(*this == other); }
};

}  // namespace tessera
