#pragma once

/**
 * @file txn_status_table.hpp
 * @brief Per-transaction state machine and incarnation counters
 *
 * Transactions follow this state machine:
 *
 *   PENDING -> EXECUTING -> EXECUTED -> VALIDATING -> EXECUTED -> COMMITTED
 *      ^           |           |            |
 *      |           | blocked   | commit     | failed
 *      |           v           v  check     v
 *      +-------- (abort: incarnation + 1) <-- ABORTING
 *
 * A PENDING transaction is either ready (queued for execution) or blocked on
 * a lower index that has not finished executing. COMMITTED is terminal.
 *
 * The table only stores the state. Multi-step transitions (finishing an
 * execution, aborting, waiting on a dependency) are driven by the Scheduler,
 * which is the only component that writes to the table.
 */

#include <memory>
#include <mutex>
#include <vector>

#include "common/macros.hpp"
#include "common/types.hpp"
#include "transaction/execution_record.hpp"

namespace tessera {

// ─────────────────────────────────────────────────────────────────────────────
// Transaction State Machine
// ─────────────────────────────────────────────────────────────────────────────

enum class TransactionState : uint8_t {
    PENDING = 0,     // Waiting to be (re-)executed
    EXECUTING = 1,   // An attempt is running on a worker
    EXECUTED = 2,    // Writes installed, awaiting validation or commit
    ABORTING = 3,    // Retracting the writes of a failed attempt
    VALIDATING = 4,  // A worker is re-checking the read-set
    COMMITTED = 5    // Final
};

/**
 * @brief Convert transaction state to string for debugging
 */
[[nodiscard]] inline const char* transaction_state_to_string(TransactionState state) {
    switch (state) {
        case TransactionState::PENDING:
            return "PENDING";
        case TransactionState::EXECUTING:
            return "EXECUTING";
        case TransactionState::EXECUTED:
            return "EXECUTED";
        case TransactionState::ABORTING:
            return "ABORTING";
        case TransactionState::VALIDATING:
            return "VALIDATING";
        case TransactionState::COMMITTED:
            return "COMMITTED";
        default:
            return "UNKNOWN";
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Transaction Slot
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Status of one transaction index
 *
 * Every field is guarded by mutex. When two slots are locked together, the
 * lower index is locked first.
 */
struct TxnSlot {
    std::mutex mutex;

    TransactionState state = TransactionState::PENDING;
    incarnation_t incarnation = INITIAL_INCARNATION;

    /// Lower index this transaction waits for, INVALID_TXN_IDX when ready
    txn_idx_t blocked_on = INVALID_TXN_IDX;

    /// Higher indices waiting for this transaction to finish executing
    std::vector<txn_idx_t> dependents;

    /// Last completed attempt (nullptr before the first one)
    ExecutionRecordPtr record;

    /// Keys where this index currently owns an entry in the version store
    std::vector<StateKey> owned_keys;

    /// An abort-storm warning was already logged for this index
    bool storm_reported = false;
};

// ─────────────────────────────────────────────────────────────────────────────
// Transaction Status Table
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Status of every transaction of a block
 *
 * Thread safety: the query and try_* methods lock the slot themselves.
 * Callers of slot() must hold slot(idx).mutex while touching fields.
 */
class TransactionStatusTable {
public:
    /**
     * @brief Create a table with every transaction PENDING, incarnation 0
     */
    explicit TransactionStatusTable(size_t num_txns);

    ~TransactionStatusTable() = default;

    TESSERA_DISALLOW_COPY(TransactionStatusTable);

    [[nodiscard]] size_t size() const noexcept { return slots_.size(); }

    /**
     * @brief Raw slot access for the scheduler
     */
    [[nodiscard]] TxnSlot& slot(txn_idx_t idx) { return *slots_[idx]; }

    // ─────────────────────────────────────────────────────────────────────────
    // Simple Transitions
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief PENDING (ready) -> EXECUTING
     * @param version Output: the attempt that may now run
     * @return false if the transaction is not ready to execute
     */
    bool try_begin_execution(txn_idx_t idx, TxnVersion* version);

    /**
     * @brief EXECUTED -> VALIDATING
     * @param record Output: the attempt to validate
     * @return false if there is nothing to validate
     */
    bool try_begin_validation(txn_idx_t idx, ExecutionRecordPtr* record);

    // ─────────────────────────────────────────────────────────────────────────
    // Queries
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] TransactionState state(txn_idx_t idx) const;
    [[nodiscard]] incarnation_t incarnation(txn_idx_t idx) const;
    [[nodiscard]] txn_idx_t blocked_on(txn_idx_t idx) const;
    [[nodiscard]] ExecutionRecordPtr record(txn_idx_t idx) const;

    /**
     * @brief Has the current incarnation finished executing?
     *
     * True for EXECUTED, VALIDATING and COMMITTED.
     */
    [[nodiscard]] bool has_executed(txn_idx_t idx) const;

    /**
     * @brief Is the state one where the writes of the current attempt are installed?
     */
    [[nodiscard]] static bool is_executed_state(TransactionState state) noexcept {
        return state == TransactionState::EXECUTED ||
               state == TransactionState::VALIDATING ||
               state == TransactionState::COMMITTED;
    }

private:
    std::vector<std::unique_ptr<TxnSlot>> slots_;
};

}  // namespace tessera
