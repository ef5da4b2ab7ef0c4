#pragma once

/**
 * @file parallel_executor.hpp
 * @brief Worker pool running a block through the scheduler
 */

#include "scheduler/conflict_policy.hpp"
#include "scheduler/scheduler.hpp"
#include "storage/version_store.hpp"
#include "tessera/backend.hpp"
#include "tessera/engine.hpp"
#include "tessera/status.hpp"

namespace tessera {

/**
 * @brief Optimistic parallel executor
 *
 * Each call to execute() builds a fresh version store, dependency tracker
 * and scheduler for the block, starts worker_count threads and joins them
 * once every transaction committed (or the block halted).
 *
 * Input is expected to be validated by the caller (see Engine).
 */
class ParallelExecutor {
public:
    ParallelExecutor(ExecutionBackend& backend, const StateReader& state,
                     const EngineOptions& options);

    ParallelExecutor(const ParallelExecutor&) = delete;
    ParallelExecutor& operator=(const ParallelExecutor&) = delete;

    /**
     * @brief Execute a block
     * @param output Outcomes, state delta, metrics and parallelism report
     */
    [[nodiscard]] Status execute(const Block& block, BlockOutput* output);

private:
    struct BlockContext {
        const Block& block;
        VersionStore& store;
        const ConflictPolicy& policy;
        Scheduler& scheduler;
    };

    void worker_loop(BlockContext& ctx);

    /**
     * @brief Run one attempt and report it to the scheduler
     */
    [[nodiscard]] Status run_attempt(BlockContext& ctx, TxnVersion version);

    /**
     * @brief Gather outcomes and final state after the workers stopped
     */
    [[nodiscard]] Status collect(const BlockContext& ctx, BlockOutput* output) const;

    ExecutionBackend& backend_;
    const StateReader& state_;
    EngineOptions options_;
};

}  // namespace tessera
