/**
 * @file parallel_executor.cpp
 * @brief ParallelExecutor implementation
 */

#include "execution/parallel_executor.hpp"

#include <chrono>
#include <exception>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "common/logger.hpp"
#include "common/status.hpp"
#include "execution/parallelism.hpp"
#include "execution/read_view.hpp"
#include "scheduler/rescheduler.hpp"
#include "transaction/dependency_tracker.hpp"

namespace tessera {

ParallelExecutor::ParallelExecutor(ExecutionBackend& backend, const StateReader& state,
                                   const EngineOptions& options)
    : backend_(backend), state_(state), options_(options) {}

Status ParallelExecutor::execute(const Block& block, BlockOutput* output) {
    *output = BlockOutput{};
    if (block.empty()) {
        return Status::Ok();
    }

    const auto start = std::chrono::steady_clock::now();

    VersionStore store;
    DependencyTracker tracker(block.size());
    auto policy = make_conflict_policy(options_);
    auto rescheduler = make_rescheduler(options_, block.hints);
    Scheduler scheduler(block.size(), store, tracker, *policy, *rescheduler,
                        options_.abort_storm_threshold);
    scheduler.prepare();

    LOG_INFO("Executing block of {} txns on {} workers ({}, {} rescheduling)", block.size(),
             options_.worker_count, policy->name(), rescheduler->name());

    BlockContext ctx{block, store, *policy, scheduler};

    std::vector<std::thread> workers;
    workers.reserve(options_.worker_count);
    try {
        for (size_t i = 0; i < options_.worker_count; ++i) {
            workers.emplace_back([this, &ctx] { worker_loop(ctx); });
        }
    } catch (const std::system_error& e) {
        LOG_ERROR("Failed to start worker {}: {}", workers.size(), e.what());
        scheduler.halt(Status::ResourceExhausted(std::string("cannot start worker: ") + e.what()));
    }
    for (auto& worker : workers) {
        worker.join();
    }

    if (scheduler.halted()) {
        Status status = scheduler.halt_status();
        LOG_ERROR("Block halted after committing {} of {} txns: {}", scheduler.commit_index(),
                  block.size(), status.to_string());
        return status;
    }

    TESSERA_RETURN_IF_ERROR(collect(ctx, output));

    output->parallelism = compute_parallelism(tracker);
    if (block.has_hints()) {
        output->parallelism.conflict_epochs = plan_conflict_epochs(block.hints, nullptr);
    }

    output->metrics = scheduler.metrics();
    output->metrics.elapsed_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start)
            .count();

    LOG_INFO("Block committed: {} executions, {} validation aborts, {} dependency waits, "
             "{:.2f} ms",
             output->metrics.executions, output->metrics.validation_aborts,
             output->metrics.dependency_waits, output->metrics.elapsed_ms);
    return Status::Ok();
}

void ParallelExecutor::worker_loop(BlockContext& ctx) {
    while (true) {
        Task task = ctx.scheduler.next_task();
        Status status;

        switch (task.kind) {
            case TaskKind::kDone:
                return;
            case TaskKind::kExecute:
                status = run_attempt(ctx, task.version);
                break;
            case TaskKind::kValidate:
                status = ctx.scheduler.validate(task.record);
                break;
            case TaskKind::kNone:
                break;
        }

        if (status.ok()) {
            status = ctx.scheduler.try_commit();
        }
        if (!status.ok()) {
            ctx.scheduler.halt(status);
            return;
        }
        if (task.kind == TaskKind::kNone) {
            std::this_thread::yield();
        }
    }
}

Status ParallelExecutor::run_attempt(BlockContext& ctx, TxnVersion version) {
    ctx.scheduler.count_execution();

    const Transaction& txn = *ctx.block.transactions[version.txn_idx];
    VersionedReadView view(ctx.store, state_, version.txn_idx, ctx.policy.early_detection());

    ExecutionResult result;
    try {
        result = backend_.execute(txn, view);
    } catch (const std::exception& e) {
        LOG_CRITICAL("Backend threw while executing txn {} ({}): {}", version.txn_idx,
                     txn.describe(), e.what());
        return Status::Internal("backend failure in txn " + std::to_string(version.txn_idx) +
                                ": " + e.what());
    }

    // The view knows better than a backend that ignored kBlocked
    if (view.blocked()) {
        return ctx.scheduler.on_blocked(version, view.blocking_txn());
    }
    if (result.blocked) {
        return ctx.scheduler.on_blocked(version, result.blocking_txn);
    }
    return ctx.scheduler.finish_execution(version, view.take_reads(), std::move(result.writes),
                                          std::move(result.outcome));
}

Status ParallelExecutor::collect(const BlockContext& ctx, BlockOutput* output) const {
    const TransactionStatusTable& table = ctx.scheduler.status_table();

    output->outcomes.reserve(ctx.block.size());
    for (txn_idx_t idx = 0; idx < ctx.block.size(); ++idx) {
        ExecutionRecordPtr record = table.record(idx);
        if (table.state(idx) != TransactionState::COMMITTED || record == nullptr) {
            LOG_CRITICAL("Txn {} finished the block as {}", idx,
                         transaction_state_to_string(table.state(idx)));
            return Status::Internal("txn " + std::to_string(idx) + " did not commit");
        }
        output->outcomes.push_back(record->outcome);
    }

    return ctx.store.snapshot(&output->state_delta);
}

}  // namespace tessera
