#pragma once

/**
 * @file parallelism.hpp
 * @brief Width and depth of the committed dependency graph
 */

#include <vector>

#include "transaction/dependency_tracker.hpp"
#include "tessera/engine.hpp"

namespace tessera {

/**
 * @brief Level each transaction sits on
 *
 * A transaction that read nothing written inside the block is on level 0;
 * otherwise it is one above the highest level among the transactions it
 * read from.
 */
[[nodiscard]] std::vector<size_t> dependency_levels(const DependencyTracker& tracker);

/**
 * @brief Summarize the committed dependency graph of a block
 */
[[nodiscard]] ParallelismReport compute_parallelism(const DependencyTracker& tracker);

}  // namespace tessera
