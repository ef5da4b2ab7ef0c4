/**
 * @file rescheduler.cpp
 * @brief Rescheduler implementations and conflict epoch planning
 */

#include "scheduler/rescheduler.hpp"

#include <algorithm>
#include <unordered_set>

namespace tessera {

namespace {

std::vector<StateKey> sorted_unique(std::vector<StateKey> keys) {
    std::sort(keys.begin(), keys.end());
    keys.erase(std::unique(keys.begin(), keys.end()), keys.end());
    return keys;
}

bool intersects(const std::vector<StateKey>& a, const std::vector<StateKey>& b) {
    auto ia = a.begin();
    auto ib = b.begin();
    while (ia != a.end() && ib != b.end()) {
        if (*ia < *ib) {
            ++ia;
        } else if (*ib < *ia) {
            ++ib;
        } else {
            return true;
        }
    }
    return false;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// DeferredRescheduler
// ─────────────────────────────────────────────────────────────────────────────

DeferredRescheduler::DeferredRescheduler(const LocalityHints& hints) {
    declared_.reserve(hints.size());
    for (const auto& hint : hints) {
        DeclaredKeys keys;
        keys.writes = sorted_unique(hint.write_keys);
        std::vector<StateKey> all = hint.read_keys;
        all.insert(all.end(), hint.write_keys.begin(), hint.write_keys.end());
        keys.reads_and_writes = sorted_unique(std::move(all));
        declared_.push_back(std::move(keys));
    }
}

txn_idx_t DeferredRescheduler::place(txn_idx_t idx, const TransactionStatusTable& table,
                                     const DependencyTracker& tracker) const {
    if (idx < declared_.size() && !declared_[idx].reads_and_writes.empty()) {
        const auto& mine = declared_[idx].reads_and_writes;
        for (txn_idx_t j = idx; j-- > 0;) {
            if (intersects(declared_[j].writes, mine) && !table.has_executed(j)) {
                return j;
            }
        }
        return INVALID_TXN_IDX;
    }

    auto sources = tracker.read_from(idx);
    for (auto it = sources.rbegin(); it != sources.rend(); ++it) {
        if (*it < idx && !table.has_executed(*it)) {
            return *it;
        }
    }
    return INVALID_TXN_IDX;
}

std::vector<StateKey> DeferredRescheduler::premarked_keys(txn_idx_t idx) const {
    if (idx >= declared_.size()) {
        return {};
    }
    return declared_[idx].writes;
}

// ─────────────────────────────────────────────────────────────────────────────
// Factory
// ─────────────────────────────────────────────────────────────────────────────

std::unique_ptr<Rescheduler> make_rescheduler(const EngineOptions& options,
                                              const LocalityHints& hints) {
    if (options.enable_rescheduling) {
        return std::make_unique<DeferredRescheduler>(hints);
    }
    return std::make_unique<ImmediateRescheduler>();
}

// ─────────────────────────────────────────────────────────────────────────────
// Conflict Epochs
// ─────────────────────────────────────────────────────────────────────────────

size_t plan_conflict_epochs(const LocalityHints& hints, std::vector<size_t>* epochs) {
    std::vector<std::unordered_set<StateKey>> epoch_writes;
    if (epochs != nullptr) {
        epochs->assign(hints.size(), 0);
    }

    for (size_t i = 0; i < hints.size(); ++i) {
        const TxnHint& hint = hints[i];

        auto conflicts = [&hint](const std::unordered_set<StateKey>& written) {
            for (const auto& key : hint.read_keys) {
                if (written.count(key) != 0) return true;
            }
            for (const auto& key : hint.write_keys) {
                if (written.count(key) != 0) return true;
            }
            return false;
        };

        size_t epoch = 0;
        while (epoch < epoch_writes.size() && conflicts(epoch_writes[epoch])) {
            ++epoch;
        }
        if (epoch == epoch_writes.size()) {
            epoch_writes.emplace_back();
        }
        epoch_writes[epoch].insert(hint.write_keys.begin(), hint.write_keys.end());

        if (epochs != nullptr) {
            (*epochs)[i] = epoch;
        }
    }

    return epoch_writes.size();
}

}  // namespace tessera
