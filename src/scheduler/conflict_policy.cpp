/**
 * @file conflict_policy.cpp
 * @brief Conflict policy implementations
 */

#include "scheduler/conflict_policy.hpp"

namespace tessera {

std::string ConflictPolicy::name() const {
    std::string result =
        race_rule() == CommitRacePolicy::kFirstWins ? "first-wins" : "last-wins";
    result += early_detection_ ? "/early" : "/late";
    return result;
}

size_t FirstWinsPolicy::on_abort(VersionStore& store, TxnVersion version,
                                 const std::vector<StateKey>& keys) const {
    size_t marked = 0;
    for (const auto& key : keys) {
        if (store.mark_estimate(key, version)) {
            ++marked;
        }
    }
    return marked;
}

std::unique_ptr<ConflictPolicy> make_conflict_policy(const EngineOptions& options) {
    if (options.commit_race == CommitRacePolicy::kLastWins) {
        return std::make_unique<LastWinsPolicy>(options.early_detection);
    }
    return std::make_unique<FirstWinsPolicy>(options.early_detection);
}

}  // namespace tessera
