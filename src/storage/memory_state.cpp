/**
 * @file memory_state.cpp
 * @brief In-memory prior state implementation
 */

#include "storage/memory_state.hpp"

#include <mutex>

namespace tessera {

MemoryState::MemoryState(std::initializer_list<std::pair<const StateKey, StateValue>> init)
    : data_(init) {}

std::optional<StateValue> MemoryState::get(const StateKey& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = data_.find(key);
    if (it == data_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryState::put(const StateKey& key, StateValue value) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    data_[key] = std::move(value);
}

void MemoryState::apply(const StateDelta& delta) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (const auto& [key, value] : delta) {
        data_[key] = value;
    }
}

size_t MemoryState::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return data_.size();
}

}  // namespace tessera
