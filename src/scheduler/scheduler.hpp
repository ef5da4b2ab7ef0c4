#pragma once

/**
 * @file scheduler.hpp
 * @brief Task selection, abort handling and the commit frontier
 *
 * The scheduler owns every state transition of the block. Workers ask it for
 * a task, run it, and report back; they never touch the status table.
 *
 * Task priority:
 *   1. aborted transactions that are ready again (lowest index first)
 *   2. the next transaction that never executed (execution cursor)
 *   3. the lowest transaction flagged for validation
 *
 * Commits happen strictly in index order. The commit pass walks commit_idx
 * forward while the transaction there is EXECUTED and its read-set still
 * validates. Because every lower index is committed at that point, that
 * validation is final.
 *
 * Lock order: commit mutex, then status locks (lower index first), then
 * version chains. Queue mutexes are leaves.
 */

#include <atomic>
#include <functional>
#include <mutex>
#include <queue>
#include <set>
#include <string>
#include <vector>

#include "common/types.hpp"
#include "scheduler/conflict_policy.hpp"
#include "scheduler/rescheduler.hpp"
#include "storage/version_store.hpp"
#include "transaction/dependency_tracker.hpp"
#include "transaction/execution_record.hpp"
#include "transaction/txn_status_table.hpp"
#include "tessera/engine.hpp"
#include "tessera/status.hpp"

namespace tessera {

// ─────────────────────────────────────────────────────────────────────────────
// Tasks
// ─────────────────────────────────────────────────────────────────────────────

enum class TaskKind : uint8_t {
    kNone = 0,      // Nothing ready right now
    kExecute = 1,   // Run an attempt of version
    kValidate = 2,  // Re-check the read-set of record
    kDone = 3       // Block finished or halted
};

struct Task {
    TaskKind kind = TaskKind::kNone;
    TxnVersion version;
    ExecutionRecordPtr record;  // kValidate only

    [[nodiscard]] static Task None() { return Task{}; }
    [[nodiscard]] static Task Done() { return Task{TaskKind::kDone, TxnVersion(), nullptr}; }
    [[nodiscard]] static Task Execute(TxnVersion version) {
        return Task{TaskKind::kExecute, version, nullptr};
    }
    [[nodiscard]] static Task Validate(ExecutionRecordPtr record) {
        TxnVersion version = record->version;
        return Task{TaskKind::kValidate, version, std::move(record)};
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Scheduler
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Block-scoped scheduler shared by all workers
 *
 * Thread safety: all public methods are thread-safe.
 */
class Scheduler {
public:
    /**
     * @param num_txns Transactions in the block
     * @param store Version store of the block
     * @param tracker Dependency tracker of the block
     * @param policy Conflict policy (must outlive the scheduler)
     * @param rescheduler Placement of aborted transactions
     * @param abort_storm_threshold Incarnation that triggers the warning
     */
    Scheduler(size_t num_txns, VersionStore& store, DependencyTracker& tracker,
              const ConflictPolicy& policy, const Rescheduler& rescheduler,
              uint32_t abort_storm_threshold);

    ~Scheduler() = default;

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Pre-mark the keys the rescheduler expects each transaction to write
     *
     * Must run before any worker starts. No-op without early detection.
     */
    void prepare();

    // ─────────────────────────────────────────────────────────────────────────
    // Worker Interface
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Pick the next task for a worker
     */
    [[nodiscard]] Task next_task();

    /**
     * @brief Report a completed attempt
     *
     * Installs the writes, records the reads, marks the transaction EXECUTED
     * and flags readers of the changed keys for validation.
     *
     * @return Internal if version is not the executing incarnation
     */
    [[nodiscard]] Status finish_execution(TxnVersion version, std::vector<ReadDescriptor> reads,
                                          WriteSet writes, Outcome outcome);

    /**
     * @brief Report an attempt abandoned on an ESTIMATE of blocking_txn
     *
     * The transaction goes back to PENDING with the next incarnation and
     * becomes ready when blocking_txn finishes executing.
     */
    [[nodiscard]] Status on_blocked(TxnVersion version, txn_idx_t blocking_txn);

    /**
     * @brief Run a validation task
     */
    [[nodiscard]] Status validate(const ExecutionRecordPtr& record);

    /**
     * @brief Advance the commit frontier as far as possible
     *
     * Only one thread runs the pass at a time; a request arriving while the
     * pass runs makes the running thread go around once more.
     */
    [[nodiscard]] Status try_commit();

    /**
     * @brief Stop the block with an error; every worker exits
     */
    void halt(const Status& status);

    // ─────────────────────────────────────────────────────────────────────────
    // Queries
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Every transaction committed, or halted
     */
    [[nodiscard]] bool done() const noexcept;

    [[nodiscard]] bool halted() const noexcept { return halted_.load(std::memory_order_acquire); }

    /**
     * @brief Status the block was halted with (Ok if not halted)
     */
    [[nodiscard]] Status halt_status() const;

    [[nodiscard]] txn_idx_t commit_index() const noexcept {
        return commit_idx_.load(std::memory_order_acquire);
    }

    [[nodiscard]] const TransactionStatusTable& status_table() const noexcept { return table_; }

    /**
     * @brief Counters so far (elapsed_ms is left to the caller)
     */
    [[nodiscard]] ExecutionMetrics metrics() const;

    /**
     * @brief Count one execution attempt started by a worker
     */
    void count_execution() noexcept { executions_.fetch_add(1, std::memory_order_relaxed); }

private:
    // Transitions; the caller holds the slot's mutex
    void abort_locked(txn_idx_t idx, TxnSlot& slot, std::vector<txn_idx_t>* to_validate);
    void bump_incarnation_locked(txn_idx_t idx, TxnSlot& slot);

    /// Place an aborted transaction (no status lock held)
    void schedule_retry(txn_idx_t idx, incarnation_t incarnation);

    /// Make idx wait for lower; false if lower already executed
    bool add_dependency(txn_idx_t idx, incarnation_t incarnation, txn_idx_t lower);

    /// Wake transactions that waited for an index that just executed
    void resume_dependents(txn_idx_t idx, const std::vector<txn_idx_t>& dependents);

    void push_ready(txn_idx_t idx);
    void push_validations(const std::vector<txn_idx_t>& indices);

    [[nodiscard]] bool validate_reads(const ExecutionRecord& record) const;

    [[nodiscard]] Status commit_pass();

    [[nodiscard]] Status invariant_violation(const std::string& message);

    const size_t num_txns_;
    VersionStore& store_;
    DependencyTracker& tracker_;
    const ConflictPolicy& policy_;
    const Rescheduler& rescheduler_;
    const uint32_t abort_storm_threshold_;

    TransactionStatusTable table_;

    // Aborted transactions ready to run again, lowest index first
    std::mutex ready_mutex_;
    std::priority_queue<txn_idx_t, std::vector<txn_idx_t>, std::greater<txn_idx_t>> ready_queue_;

    // Next never-executed index
    std::atomic<txn_idx_t> execution_idx_{0};

    // Transactions flagged for validation
    std::mutex validation_mutex_;
    std::set<txn_idx_t> validation_set_;

    // Commit frontier
    std::mutex commit_mutex_;
    std::atomic<bool> commit_requested_{false};
    std::atomic<txn_idx_t> commit_idx_{0};

    // Halt state
    std::atomic<bool> halted_{false};
    mutable std::mutex halt_mutex_;
    Status halt_status_;

    // Metrics
    std::atomic<uint64_t> executions_{0};
    std::atomic<uint64_t> validations_{0};
    std::atomic<uint64_t> validation_aborts_{0};
    std::atomic<uint64_t> dependency_waits_{0};
    std::atomic<uint64_t> deferred_retries_{0};
    std::atomic<uint64_t> race_losses_{0};
    std::atomic<uint32_t> max_incarnation_{0};
    std::atomic<bool> abort_storm_{false};
};

}  // namespace tessera
