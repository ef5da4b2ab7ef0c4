/**
 * @file scheduler.cpp
 * @brief Scheduler implementation
 */

#include "scheduler/scheduler.hpp"

#include <algorithm>
#include <string>

#include "common/logger.hpp"
#include "common/status.hpp"

namespace tessera {

Scheduler::Scheduler(size_t num_txns, VersionStore& store, DependencyTracker& tracker,
                     const ConflictPolicy& policy, const Rescheduler& rescheduler,
                     uint32_t abort_storm_threshold)
    : num_txns_(num_txns),
      store_(store),
      tracker_(tracker),
      policy_(policy),
      rescheduler_(rescheduler),
      abort_storm_threshold_(abort_storm_threshold),
      table_(num_txns) {}

void Scheduler::prepare() {
    if (!policy_.early_detection()) {
        return;
    }

    size_t marked = 0;
    for (txn_idx_t idx = 0; idx < num_txns_; ++idx) {
        std::vector<StateKey> keys = rescheduler_.premarked_keys(idx);
        if (keys.empty()) {
            continue;
        }
        TxnSlot& slot = table_.slot(idx);
        std::lock_guard<std::mutex> lock(slot.mutex);
        for (const auto& key : keys) {
            store_.mark_estimate(key, TxnVersion(idx, slot.incarnation));
        }
        marked += keys.size();
        slot.owned_keys = std::move(keys);
    }

    if (marked > 0) {
        LOG_DEBUG("Pre-marked {} declared writes as ESTIMATE", marked);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Task Selection
// ─────────────────────────────────────────────────────────────────────────────

Task Scheduler::next_task() {
    if (done()) {
        return Task::Done();
    }

    // 1. Re-executions
    while (true) {
        txn_idx_t idx;
        {
            std::lock_guard<std::mutex> lock(ready_mutex_);
            if (ready_queue_.empty()) {
                break;
            }
            idx = ready_queue_.top();
            ready_queue_.pop();
        }
        TxnVersion version;
        if (table_.try_begin_execution(idx, &version)) {
            return Task::Execute(version);
        }
    }

    // 2. First executions
    txn_idx_t idx = execution_idx_.load(std::memory_order_acquire);
    while (idx < num_txns_) {
        if (execution_idx_.compare_exchange_weak(idx, idx + 1, std::memory_order_acq_rel)) {
            TxnVersion version;
            if (table_.try_begin_execution(idx, &version)) {
                return Task::Execute(version);
            }
            idx = execution_idx_.load(std::memory_order_acquire);
        }
    }

    // 3. Validations
    while (true) {
        txn_idx_t candidate;
        {
            std::lock_guard<std::mutex> lock(validation_mutex_);
            if (validation_set_.empty()) {
                break;
            }
            candidate = *validation_set_.begin();
            validation_set_.erase(validation_set_.begin());
        }
        ExecutionRecordPtr record;
        if (table_.try_begin_validation(candidate, &record)) {
            return Task::Validate(std::move(record));
        }
    }

    return Task::None();
}

// ─────────────────────────────────────────────────────────────────────────────
// Execution Results
// ─────────────────────────────────────────────────────────────────────────────

Status Scheduler::finish_execution(TxnVersion version, std::vector<ReadDescriptor> reads,
                                   WriteSet writes, Outcome outcome) {
    const txn_idx_t idx = version.txn_idx;
    if (idx >= num_txns_) {
        return invariant_violation("finished attempt of unknown txn " + std::to_string(idx));
    }

    TxnSlot& slot = table_.slot(idx);
    std::vector<txn_idx_t> to_validate;
    std::vector<txn_idx_t> dependents;
    bool race_lost = false;
    incarnation_t retry_incarnation = 0;

    {
        std::lock_guard<std::mutex> lock(slot.mutex);
        if (slot.state != TransactionState::EXECUTING || slot.incarnation != version.incarnation) {
            return invariant_violation(
                "txn " + std::to_string(idx) + " finished incarnation " +
                std::to_string(version.incarnation) + " while " +
                transaction_state_to_string(slot.state) + " at incarnation " +
                std::to_string(slot.incarnation));
        }

        std::vector<StateKey> installed;
        installed.reserve(writes.size());
        for (const auto& [key, value] : writes) {
            WriteOutcome result = policy_.install(store_, key, version, value);
            if (result == WriteOutcome::kInstalled) {
                installed.push_back(key);
                continue;
            }
            if (result == WriteOutcome::kStaleIncarnation) {
                return invariant_violation("txn " + std::to_string(idx) + " incarnation " +
                                           std::to_string(version.incarnation) +
                                           " found a newer incarnation on key " + key);
            }

            // Lost the race: roll back everything this attempt installed and
            // retract the older value that won.
            race_losses_.fetch_add(1, std::memory_order_relaxed);
            LOG_DEBUG("Txn {} incarnation {} lost the install race on '{}'", idx,
                      version.incarnation, key);
            installed.push_back(key);
            for (const auto& k : installed) {
                store_.mark_estimate(k, version);
            }
            for (auto& k : installed) {
                if (std::find(slot.owned_keys.begin(), slot.owned_keys.end(), k) ==
                    slot.owned_keys.end()) {
                    slot.owned_keys.push_back(std::move(k));
                }
            }
            race_lost = true;
            break;
        }

        if (race_lost) {
            abort_locked(idx, slot, &to_validate);
            retry_incarnation = slot.incarnation;
        } else {
            std::sort(installed.begin(), installed.end());

            // Keys an earlier incarnation (or the pre-marking) left behind
            std::vector<StateKey> changed = installed;
            for (const auto& key : slot.owned_keys) {
                if (!std::binary_search(installed.begin(), installed.end(), key)) {
                    store_.remove(key, version);
                    changed.push_back(key);
                }
            }
            slot.owned_keys = std::move(installed);

            tracker_.record(idx, reads);

            auto record = std::make_shared<ExecutionRecord>();
            record->version = version;
            record->reads = std::move(reads);
            record->writes = std::move(writes);
            record->outcome = std::move(outcome);
            slot.record = std::move(record);
            slot.state = TransactionState::EXECUTED;
            dependents.swap(slot.dependents);

            std::set<txn_idx_t> readers = tracker_.readers_after(idx, changed);
            to_validate.assign(readers.begin(), readers.end());
            to_validate.push_back(idx);
        }
    }

    push_validations(to_validate);
    if (race_lost) {
        schedule_retry(idx, retry_incarnation);
        return Status::Ok();
    }

    LOG_TRACE("Txn {} incarnation {} executed, waking {} dependents", idx,
              version.incarnation, dependents.size());
    resume_dependents(idx, dependents);
    return Status::Ok();
}

Status Scheduler::on_blocked(TxnVersion version, txn_idx_t blocking_txn) {
    const txn_idx_t idx = version.txn_idx;
    if (idx >= num_txns_ || blocking_txn >= idx) {
        return invariant_violation("txn " + std::to_string(idx) +
                                   " reported a dependency on txn " +
                                   std::to_string(blocking_txn));
    }

    TxnSlot& lower = table_.slot(blocking_txn);
    TxnSlot& slot = table_.slot(idx);
    bool ready = false;

    {
        std::lock_guard<std::mutex> lower_lock(lower.mutex);
        std::lock_guard<std::mutex> lock(slot.mutex);

        if (slot.state != TransactionState::EXECUTING || slot.incarnation != version.incarnation) {
            return invariant_violation("txn " + std::to_string(idx) + " blocked at incarnation " +
                                       std::to_string(version.incarnation) + " while " +
                                       transaction_state_to_string(slot.state));
        }

        dependency_waits_.fetch_add(1, std::memory_order_relaxed);
        bump_incarnation_locked(idx, slot);
        slot.state = TransactionState::PENDING;

        if (TransactionStatusTable::is_executed_state(lower.state)) {
            ready = true;  // The writer finished while we were reading
        } else {
            slot.blocked_on = blocking_txn;
            lower.dependents.push_back(idx);
        }
    }

    LOG_TRACE("Txn {} blocked on txn {} ({})", idx, blocking_txn,
              ready ? "already executed" : "waiting");
    if (ready) {
        push_ready(idx);
    }
    return Status::Ok();
}

// ─────────────────────────────────────────────────────────────────────────────
// Validation
// ─────────────────────────────────────────────────────────────────────────────

bool Scheduler::validate_reads(const ExecutionRecord& record) const {
    for (const auto& read : record.reads) {
        if (!store_.validate_read(read, record.version.txn_idx)) {
            return false;
        }
    }
    return true;
}

Status Scheduler::validate(const ExecutionRecordPtr& record) {
    const txn_idx_t idx = record->version.txn_idx;
    validations_.fetch_add(1, std::memory_order_relaxed);
    const bool valid = validate_reads(*record);

    TxnSlot& slot = table_.slot(idx);
    std::vector<txn_idx_t> to_validate;
    incarnation_t retry_incarnation = 0;

    {
        std::lock_guard<std::mutex> lock(slot.mutex);
        if (slot.state != TransactionState::VALIDATING ||
            slot.incarnation != record->version.incarnation) {
            return invariant_violation("txn " + std::to_string(idx) +
                                       " finished validation while " +
                                       transaction_state_to_string(slot.state));
        }
        if (valid) {
            slot.state = TransactionState::EXECUTED;
            return Status::Ok();
        }

        validation_aborts_.fetch_add(1, std::memory_order_relaxed);
        abort_locked(idx, slot, &to_validate);
        retry_incarnation = slot.incarnation;
    }

    LOG_TRACE("Txn {} failed validation, retrying as incarnation {}", idx, retry_incarnation);
    push_validations(to_validate);
    schedule_retry(idx, retry_incarnation);
    return Status::Ok();
}

// ─────────────────────────────────────────────────────────────────────────────
// Commit Frontier
// ─────────────────────────────────────────────────────────────────────────────

Status Scheduler::try_commit() {
    commit_requested_.store(true, std::memory_order_release);

    while (commit_requested_.load(std::memory_order_acquire)) {
        std::unique_lock<std::mutex> lock(commit_mutex_, std::try_to_lock);
        if (!lock.owns_lock()) {
            return Status::Ok();  // The holder will go around again
        }
        commit_requested_.store(false, std::memory_order_release);
        TESSERA_RETURN_IF_ERROR(commit_pass());
    }
    return Status::Ok();
}

Status Scheduler::commit_pass() {
    while (!halted()) {
        const txn_idx_t idx = commit_idx_.load(std::memory_order_acquire);
        if (idx >= num_txns_) {
            return Status::Ok();
        }

        TxnSlot& slot = table_.slot(idx);
        std::vector<txn_idx_t> to_validate;
        bool aborted = false;
        incarnation_t retry_incarnation = 0;

        {
            std::lock_guard<std::mutex> lock(slot.mutex);
            if (slot.state != TransactionState::EXECUTED) {
                return Status::Ok();
            }
            if (slot.record == nullptr) {
                return invariant_violation("txn " + std::to_string(idx) +
                                           " is EXECUTED without a read-set");
            }

            validations_.fetch_add(1, std::memory_order_relaxed);
            if (validate_reads(*slot.record)) {
                slot.state = TransactionState::COMMITTED;
                std::set<txn_idx_t> readers = tracker_.readers_after(idx, slot.owned_keys);
                to_validate.assign(readers.begin(), readers.end());
                commit_idx_.store(idx + 1, std::memory_order_release);
            } else {
                validation_aborts_.fetch_add(1, std::memory_order_relaxed);
                abort_locked(idx, slot, &to_validate);
                retry_incarnation = slot.incarnation;
                aborted = true;
            }
        }

        push_validations(to_validate);
        if (aborted) {
            LOG_TRACE("Txn {} failed validation at the commit frontier", idx);
            schedule_retry(idx, retry_incarnation);
            return Status::Ok();
        }
        LOG_TRACE("Committed txn {}", idx);
    }
    return Status::Ok();
}

// ─────────────────────────────────────────────────────────────────────────────
// Aborts and Retries
// ─────────────────────────────────────────────────────────────────────────────

void Scheduler::abort_locked(txn_idx_t idx, TxnSlot& slot, std::vector<txn_idx_t>* to_validate) {
    slot.state = TransactionState::ABORTING;

    policy_.on_abort(store_, TxnVersion(idx, slot.incarnation), slot.owned_keys);
    std::set<txn_idx_t> readers = tracker_.readers_after(idx, slot.owned_keys);
    to_validate->insert(to_validate->end(), readers.begin(), readers.end());

    slot.record.reset();
    bump_incarnation_locked(idx, slot);
    slot.blocked_on = INVALID_TXN_IDX;
    slot.state = TransactionState::PENDING;
}

void Scheduler::bump_incarnation_locked(txn_idx_t idx, TxnSlot& slot) {
    ++slot.incarnation;

    uint32_t seen = max_incarnation_.load(std::memory_order_relaxed);
    while (seen < slot.incarnation &&
           !max_incarnation_.compare_exchange_weak(seen, slot.incarnation,
                                                   std::memory_order_relaxed)) {
    }

    if (slot.incarnation > abort_storm_threshold_ && !slot.storm_reported) {
        slot.storm_reported = true;
        abort_storm_.store(true, std::memory_order_relaxed);
        LOG_WARN("Abort storm: txn {} reached incarnation {} (threshold {})", idx,
                 slot.incarnation, abort_storm_threshold_);
    }
}

void Scheduler::schedule_retry(txn_idx_t idx, incarnation_t incarnation) {
    txn_idx_t wait_for = rescheduler_.place(idx, table_, tracker_);
    if (wait_for != INVALID_TXN_IDX && wait_for < idx &&
        add_dependency(idx, incarnation, wait_for)) {
        deferred_retries_.fetch_add(1, std::memory_order_relaxed);
        LOG_TRACE("Txn {} retry deferred behind txn {}", idx, wait_for);
        return;
    }
    push_ready(idx);
}

bool Scheduler::add_dependency(txn_idx_t idx, incarnation_t incarnation, txn_idx_t lower) {
    TxnSlot& lower_slot = table_.slot(lower);
    TxnSlot& slot = table_.slot(idx);

    std::lock_guard<std::mutex> lower_lock(lower_slot.mutex);
    std::lock_guard<std::mutex> lock(slot.mutex);

    if (TransactionStatusTable::is_executed_state(lower_slot.state)) {
        return false;
    }
    if (slot.state != TransactionState::PENDING || slot.incarnation != incarnation ||
        slot.blocked_on != INVALID_TXN_IDX) {
        return false;
    }
    slot.blocked_on = lower;
    lower_slot.dependents.push_back(idx);
    return true;
}

void Scheduler::resume_dependents(txn_idx_t idx, const std::vector<txn_idx_t>& dependents) {
    for (txn_idx_t dependent : dependents) {
        TxnSlot& slot = table_.slot(dependent);
        bool ready = false;
        {
            std::lock_guard<std::mutex> lock(slot.mutex);
            if (slot.state == TransactionState::PENDING && slot.blocked_on == idx) {
                slot.blocked_on = INVALID_TXN_IDX;
                ready = true;
            }
        }
        if (ready) {
            push_ready(dependent);
        }
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Queues
// ─────────────────────────────────────────────────────────────────────────────

void Scheduler::push_ready(txn_idx_t idx) {
    std::lock_guard<std::mutex> lock(ready_mutex_);
    ready_queue_.push(idx);
}

void Scheduler::push_validations(const std::vector<txn_idx_t>& indices) {
    if (indices.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(validation_mutex_);
    validation_set_.insert(indices.begin(), indices.end());
}

// ─────────────────────────────────────────────────────────────────────────────
// Halting and Queries
// ─────────────────────────────────────────────────────────────────────────────

Status Scheduler::invariant_violation(const std::string& message) {
    LOG_CRITICAL("Scheduler invariant violated: {}", message);
    Status status = Status::Internal(message);
    halt(status);
    return status;
}

void Scheduler::halt(const Status& status) {
    std::lock_guard<std::mutex> lock(halt_mutex_);
    if (halted_.load(std::memory_order_acquire)) {
        return;
    }
    halt_status_ = status;
    halted_.store(true, std::memory_order_release);
}

Status Scheduler::halt_status() const {
    std::lock_guard<std::mutex> lock(halt_mutex_);
    return halt_status_;
}

bool Scheduler::done() const noexcept {
    return halted() || commit_idx_.load(std::memory_order_acquire) >= num_txns_;
}

ExecutionMetrics Scheduler::metrics() const {
    ExecutionMetrics metrics;
    metrics.executions = executions_.load(std::memory_order_relaxed);
    metrics.validations = validations_.load(std::memory_order_relaxed);
    metrics.validation_aborts = validation_aborts_.load(std::memory_order_relaxed);
    metrics.dependency_waits = dependency_waits_.load(std::memory_order_relaxed);
    metrics.deferred_retries = deferred_retries_.load(std::memory_order_relaxed);
    metrics.race_losses = race_losses_.load(std::memory_order_relaxed);
    metrics.max_incarnation = max_incarnation_.load(std::memory_order_relaxed);
    metrics.abort_storm = abort_storm_.load(std::memory_order_relaxed);
    return metrics;
}

}  // namespace tessera
