#pragma once

/**
 * @file memory_state.hpp
 * @brief In-memory prior state
 */

#include <initializer_list>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <utility>

#include "tessera/backend.hpp"

namespace tessera {

/**
 * @brief Hash-map backed StateReader
 *
 * Stands in for the persistent storage layer: it serves the state a block
 * starts from and absorbs the block's StateDelta afterwards.
 *
 * Thread safety: all public methods are thread-safe.
 */
class MemoryState : public StateReader {
public:
    MemoryState() = default;
    MemoryState(std::initializer_list<std::pair<const StateKey, StateValue>> init);

    [[nodiscard]] std::optional<StateValue> get(const StateKey& key) const override;

    /**
     * @brief Set a single key
     */
    void put(const StateKey& key, StateValue value);

    /**
     * @brief Apply the state delta of a committed block
     */
    void apply(const StateDelta& delta);

    /**
     * @brief Number of keys stored
     */
    [[nodiscard]] size_t size() const;

private:
    std::unordered_map<StateKey, StateValue> data_;
    mutable std::shared_mutex mutex_;
};

}  // namespace tessera
