#pragma once

/**
 * @file execution_record.hpp
 * @brief Read-set, write-set and outcome of one execution attempt
 */

#include <memory>
#include <vector>

#include "common/types.hpp"
#include "storage/version_store.hpp"

namespace tessera {

/**
 * @brief Everything one completed execution attempt produced
 *
 * Immutable once handed to the scheduler; shared between the status table
 * and concurrent validators through shared_ptr<const ExecutionRecord>.
 */
struct ExecutionRecord {
    TxnVersion version;
    std::vector<ReadDescriptor> reads;
    WriteSet writes;
    Outcome outcome;

    /**
     * @brief Keys in the write-set
     */
    [[nodiscard]] std::vector<StateKey> write_keys() const {
        std::vector<StateKey> keys;
        keys.reserve(writes.size());
        for (const auto& [key, value] : writes) {
            keys.push_back(key);
        }
        return keys;
    }
};

using ExecutionRecordPtr = std::shared_ptr<const ExecutionRecord>;

}  // namespace tessera
