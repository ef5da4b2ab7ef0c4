#pragma once

/**
 * @file sequential_executor.hpp
 * @brief Reference executor: one transaction at a time, in index order
 */

#include "tessera/backend.hpp"
#include "tessera/engine.hpp"
#include "tessera/status.hpp"

namespace tessera {

/**
 * @brief Executes a block on the calling thread
 *
 * The result is the definition of correct: the parallel executor must
 * produce the same outcomes and state delta for every block.
 */
class SequentialExecutor {
public:
    SequentialExecutor(ExecutionBackend& backend, const StateReader& state);

    SequentialExecutor(const SequentialExecutor&) = delete;
    SequentialExecutor& operator=(const SequentialExecutor&) = delete;

    [[nodiscard]] Status execute(const Block& block, BlockOutput* output);

private:
    ExecutionBackend& backend_;
    const StateReader& state_;
};

}  // namespace tessera
