#pragma once

/**
 * @file config.hpp
 * @brief Configuration constants for Tessera
 */

#include <cstddef>
#include <cstdint>

namespace tessera {
namespace config {

// ─────────────────────────────────────────────────────────────────────────────
// Worker Pool Configuration
// ─────────────────────────────────────────────────────────────────────────────

/// Default number of worker threads
constexpr size_t kDefaultWorkerCount = 4;

/// Maximum number of worker threads
constexpr size_t kMaxWorkers = 256;

// ─────────────────────────────────────────────────────────────────────────────
// Version Store Configuration
// ─────────────────────────────────────────────────────────────────────────────

/// Number of shards in the key -> chain directory (power of two)
constexpr size_t kVersionStoreShards = 64;

/// Number of shards in the key -> readers index (power of two)
constexpr size_t kDependencyTrackerShards = 64;

static_assert((kVersionStoreShards & (kVersionStoreShards - 1)) == 0,
              "shard count must be a power of two");
static_assert((kDependencyTrackerShards & (kDependencyTrackerShards - 1)) == 0,
              "shard count must be a power of two");

// ─────────────────────────────────────────────────────────────────────────────
// Scheduler Configuration
// ─────────────────────────────────────────────────────────────────────────────

/// Incarnation count after which a transaction is reported as an abort storm
constexpr uint32_t kDefaultAbortStormThreshold = 64;

/// Maximum transactions in one block
constexpr size_t kMaxBlockSize = 1u << 24;

}  // namespace config
}  // namespace tessera
