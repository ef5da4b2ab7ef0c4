#pragma once

/**
 * @file backend.hpp
 * @brief Contracts between the engine and its external collaborators
 *
 * - StateReader:      the state as of the start of the block
 * - ReadView:         what a backend reads through while executing
 * - ExecutionBackend: the interpreter that executes one transaction
 */

#include <optional>
#include <utility>

#include "tessera/block.hpp"

namespace tessera {

// ─────────────────────────────────────────────────────────────────────────────
// Prior State
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Read-only access to the state before the block
 *
 * Must be safe to call from many threads at once while a block executes.
 */
class StateReader {
public:
    virtual ~StateReader() = default;

    /**
     * @brief Look up a key
     * @return The value, or std::nullopt if the key does not exist
     */
    [[nodiscard]] virtual std::optional<StateValue> get(const StateKey& key) const = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// Read View
// ─────────────────────────────────────────────────────────────────────────────

enum class ReadStatus : uint8_t {
    kValue = 0,   // A value is visible
    kAbsent = 1,  // The key does not exist
    kBlocked = 2  // A lower transaction is about to write the key
};

/**
 * @brief Result of ReadView::get
 */
struct ReadResult {
    ReadStatus status = ReadStatus::kAbsent;
    StateValue value;
    txn_idx_t blocking_txn = 0;  // Valid when status == kBlocked

    [[nodiscard]] bool has_value() const noexcept { return status == ReadStatus::kValue; }
    [[nodiscard]] bool is_blocked() const noexcept { return status == ReadStatus::kBlocked; }
};

/**
 * @brief Read access bound to one transaction index
 *
 * A view is used by a single execution attempt on a single thread.
 */
class ReadView {
public:
    virtual ~ReadView() = default;

    /**
     * @brief Read a key as of the bound transaction index
     *
     * On kBlocked the backend should stop and return
     * ExecutionResult::Blocked(result.blocking_txn).
     */
    [[nodiscard]] virtual ReadResult get(const StateKey& key) = 0;

    /**
     * @brief Index of the transaction this view reads for
     */
    [[nodiscard]] virtual txn_idx_t txn_index() const noexcept = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// Execution Backend
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief What a backend returns for one execution attempt
 *
 * Either the attempt completed (write-set and outcome), or it hit a value
 * that a lower transaction has not produced yet.
 */
struct ExecutionResult {
    bool blocked = false;
    txn_idx_t blocking_txn = 0;
    WriteSet writes;
    Outcome outcome;

    [[nodiscard]] static ExecutionResult Completed(WriteSet writes, Outcome outcome) {
        ExecutionResult result;
        result.writes = std::move(writes);
        result.outcome = std::move(outcome);
        return result;
    }

    [[nodiscard]] static ExecutionResult Blocked(txn_idx_t blocking_txn) {
        ExecutionResult result;
        result.blocked = true;
        result.blocking_txn = blocking_txn;
        return result;
    }
};

/**
 * @brief Interpreter executing one transaction against a read view
 *
 * Called concurrently from every worker thread. Implementations must be
 * deterministic: the same reads must produce the same writes and outcome.
 * Reads of the transaction's own writes are the backend's business; the view
 * only serves state written by lower transactions or the prior state.
 */
class ExecutionBackend {
public:
    virtual ~ExecutionBackend() = default;

    [[nodiscard]] virtual ExecutionResult execute(const Transaction& txn,
                                                  ReadView& view) = 0;
};

}  // namespace tessera
