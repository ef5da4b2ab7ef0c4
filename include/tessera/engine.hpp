#pragma once

/**
 * @file engine.hpp
 * @brief Engine class - main entry point for Tessera
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "tessera/backend.hpp"
#include "tessera/block.hpp"
#include "tessera/status.hpp"

namespace tessera {

// Forward declarations
class EngineImpl;

/**
 * @brief Rule for two incarnations of one index racing to install a write
 */
enum class CommitRacePolicy : uint8_t {
    kFirstWins = 0,  // Previous incarnation must be retracted first
    kLastWins = 1    // A later incarnation always overwrites
};

/**
 * @brief Configuration options for the engine
 */
struct EngineOptions {
    /// Number of worker threads (default: 4)
    size_t worker_count = 4;

    /// Abort an attempt as soon as it reads an ESTIMATE (default: true)
    bool early_detection = true;

    /// Write-write race rule between incarnations (default: first wins)
    CommitRacePolicy commit_race = CommitRacePolicy::kFirstWins;

    /// Defer retries behind in-flight upstream writers (default: false)
    bool enable_rescheduling = false;

    /// Incarnation count that flags an abort storm (default: 64)
    uint32_t abort_storm_threshold = 64;

    /// spdlog level name used when the engine initializes logging
    std::string log_level = "info";
};

/**
 * @brief Validate engine options
 * @return InvalidArgument describing the first bad field, or Ok
 */
[[nodiscard]] Status validate_options(const EngineOptions& options);

/**
 * @brief Counters collected while executing one block
 */
struct ExecutionMetrics {
    uint64_t executions = 0;            // Execution attempts started
    uint64_t validations = 0;           // Speculative and commit validations
    uint64_t validation_aborts = 0;     // Aborts from a failed validation
    uint64_t dependency_waits = 0;      // Attempts abandoned on an ESTIMATE
    uint64_t deferred_retries = 0;      // Retries parked by the rescheduler
    uint64_t race_losses = 0;           // Installs rejected by the race rule
    uint32_t max_incarnation = 0;       // Highest incarnation reached
    bool abort_storm = false;           // Some index crossed the threshold
    double elapsed_ms = 0.0;
};

/**
 * @brief Shape of the committed dependency graph of a block
 *
 * Each transaction sits one level above the highest level it read from.
 * Width is the number of transactions on a level; depth the number of levels.
 */
struct ParallelismReport {
    size_t total_txns = 0;
    double average_width = 0.0;
    double width_std_dev = 0.0;
    size_t max_width = 0;
    size_t depth = 0;
    size_t conflict_epochs = 0;  // Epochs needed by the key-disjoint plan
};

/**
 * @brief Result of executing a block
 */
struct BlockOutput {
    /// Committed outcome per transaction index
    std::vector<Outcome> outcomes;

    /// Final value of every key the block wrote
    StateDelta state_delta;

    ExecutionMetrics metrics;
    ParallelismReport parallelism;
};

/**
 * @brief Main engine class
 *
 * Executes consensus-ordered blocks in parallel with results identical to
 * executing them one by one in index order.
 *
 * Example usage:
 * @code
 * tessera::Engine engine(backend, state, {.worker_count = 8});
 * tessera::BlockOutput output;
 * auto status = engine.execute_block(block, &output);
 * @endcode
 */
class Engine {
public:
    /**
     * @brief Create an engine
     * @param backend Interpreter for transactions (must outlive the engine)
     * @param state State before the next block (must outlive the engine)
     * @param options Configuration options
     */
    Engine(ExecutionBackend& backend, const StateReader& state,
           const EngineOptions& options = {});

    ~Engine();

    // Non-copyable
    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Movable
    Engine(Engine&&) noexcept;
    Engine& operator=(Engine&&) noexcept;

    /**
     * @brief Execute a block with the worker pool
     * @param block The block to execute
     * @param output Receives outcomes, state delta and metrics
     * @return Ok, InvalidArgument for bad input, Internal on an invariant
     *         violation
     */
    [[nodiscard]] Status execute_block(const Block& block, BlockOutput* output);

    /**
     * @brief Execute a block one transaction at a time, in index order
     */
    [[nodiscard]] Status execute_sequential(const Block& block, BlockOutput* output);

    /**
     * @brief Get the options the engine runs with
     */
    [[nodiscard]] const EngineOptions& options() const noexcept;

    /**
     * @brief Check whether the options passed validation
     */
    [[nodiscard]] bool is_valid() const noexcept;

private:
    std::unique_ptr<EngineImpl> impl_;
};

}  // namespace tessera
