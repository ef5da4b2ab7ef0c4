/**
 * @file read_view.cpp
 * @brief VersionedReadView implementation
 */

#include "execution/read_view.hpp"

#include "common/logger.hpp"

namespace tessera {

VersionedReadView::VersionedReadView(const VersionStore& store, const StateReader& base,
                                     txn_idx_t txn_idx, bool early_detection)
    : store_(store), base_(base), txn_idx_(txn_idx), early_detection_(early_detection) {}

ReadResult VersionedReadView::get(const StateKey& key) {
    ReadResult result;
    if (blocked_) {
        result.status = ReadStatus::kBlocked;
        result.blocking_txn = blocking_txn_;
        return result;
    }

    auto cached = cache_.find(key);
    if (cached != cache_.end()) {
        return cached->second;
    }

    VersionRead read = store_.read(key, txn_idx_, !early_detection_);
    switch (read.status) {
        case VersionReadStatus::kEstimate:
            blocked_ = true;
            blocking_txn_ = read.version.txn_idx;
            LOG_TRACE("Txn {} read ESTIMATE of '{}' from txn {}", txn_idx_, key,
                      blocking_txn_);
            result.status = ReadStatus::kBlocked;
            result.blocking_txn = blocking_txn_;
            return result;

        case VersionReadStatus::kVersion:
            reads_.push_back(ReadDescriptor::from_version(key, read.version));
            result.status = ReadStatus::kValue;
            result.value = std::move(read.value);
            break;

        case VersionReadStatus::kAbsent: {
            reads_.push_back(ReadDescriptor::from_storage(key));
            auto value = base_.get(key);
            if (value.has_value()) {
                result.status = ReadStatus::kValue;
                result.value = std::move(*value);
            } else {
                result.status = ReadStatus::kAbsent;
            }
            break;
        }
    }

    cache_.emplace(key, result);
    return result;
}

}  // namespace tessera
