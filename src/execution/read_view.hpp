#pragma once

/**
 * @file read_view.hpp
 * @brief ReadView over the version store of a block
 */

#include <unordered_map>
#include <vector>

#include "common/types.hpp"
#include "storage/version_store.hpp"
#include "tessera/backend.hpp"

namespace tessera {

/**
 * @brief Read view of one execution attempt
 *
 * Resolves each key against the version store as of the attempt's index and
 * falls back to the prior state when no lower transaction wrote it. Every
 * distinct key read is captured as a ReadDescriptor; repeated reads of a key
 * return the first result so an attempt never sees two different values.
 *
 * Once a read hits an ESTIMATE (with early detection) the view is blocked:
 * every later read reports the same blocking index and nothing more is
 * recorded.
 */
class VersionedReadView : public ReadView {
public:
    VersionedReadView(const VersionStore& store, const StateReader& base, txn_idx_t txn_idx,
                      bool early_detection);

    [[nodiscard]] ReadResult get(const StateKey& key) override;

    [[nodiscard]] txn_idx_t txn_index() const noexcept override { return txn_idx_; }

    [[nodiscard]] bool blocked() const noexcept { return blocked_; }
    [[nodiscard]] txn_idx_t blocking_txn() const noexcept { return blocking_txn_; }

    /**
     * @brief Hand over the captured read-set
     */
    [[nodiscard]] std::vector<ReadDescriptor> take_reads() { return std::move(reads_); }

private:
    const VersionStore& store_;
    const StateReader& base_;
    txn_idx_t txn_idx_;
    bool early_detection_;

    bool blocked_ = false;
    txn_idx_t blocking_txn_ = INVALID_TXN_IDX;

    std::vector<ReadDescriptor> reads_;
    std::unordered_map<StateKey, ReadResult> cache_;
};

}  // namespace tessera
