#pragma once

/**
 * @file conflict_policy.hpp
 * @brief How reads react to ESTIMATEs and how incarnations race on writes
 *
 * Two independent toggles, fixed for the lifetime of an engine:
 *
 * - early detection: a read that hits an ESTIMATE abandons the attempt
 *   (blocked on the writer). Without it the read goes through to the next
 *   real version and validation catches the conflict later.
 *
 * - commit race rule:
 *     first-wins  an older incarnation's real value has to be retracted
 *                 (turned into an ESTIMATE) before a newer one installs;
 *                 aborts always retract.
 *     last-wins   a newer incarnation overwrites whatever its index holds;
 *                 aborts leave values in place.
 */

#include <memory>
#include <string>
#include <vector>

#include "common/types.hpp"
#include "storage/version_store.hpp"
#include "tessera/engine.hpp"

namespace tessera {

/**
 * @brief Abstract commit race strategy
 */
class ConflictPolicy {
public:
    explicit ConflictPolicy(bool early_detection) : early_detection_(early_detection) {}
    virtual ~ConflictPolicy() = default;

    ConflictPolicy(const ConflictPolicy&) = delete;
    ConflictPolicy& operator=(const ConflictPolicy&) = delete;

    /**
     * @brief Should a read of an ESTIMATE abandon the attempt?
     */
    [[nodiscard]] bool early_detection() const noexcept { return early_detection_; }

    [[nodiscard]] virtual CommitRacePolicy race_rule() const noexcept = 0;

    /**
     * @brief Install one value of a completed attempt
     */
    [[nodiscard]] WriteOutcome install(VersionStore& store, const StateKey& key,
                                       TxnVersion version, StateValue value) const {
        return store.write(key, version, std::move(value), race_rule());
    }

    /**
     * @brief Retract the writes of an aborted attempt
     * @param keys Keys where the attempt owns entries
     * @return Number of entries turned into ESTIMATEs
     */
    virtual size_t on_abort(VersionStore& store, TxnVersion version,
                            const std::vector<StateKey>& keys) const = 0;

    /**
     * @brief Short name for logs, e.g. "first-wins/early"
     */
    [[nodiscard]] std::string name() const;

private:
    bool early_detection_;
};

/**
 * @brief Aborted writes become ESTIMATEs; no overwrite of a live older value
 */
class FirstWinsPolicy : public ConflictPolicy {
public:
    using ConflictPolicy::ConflictPolicy;

    [[nodiscard]] CommitRacePolicy race_rule() const noexcept override {
        return CommitRacePolicy::kFirstWins;
    }

    size_t on_abort(VersionStore& store, TxnVersion version,
                    const std::vector<StateKey>& keys) const override;
};

/**
 * @brief Aborted writes stay until the next incarnation overwrites them
 */
class LastWinsPolicy : public ConflictPolicy {
public:
    using ConflictPolicy::ConflictPolicy;

    [[nodiscard]] CommitRacePolicy race_rule() const noexcept override {
        return CommitRacePolicy::kLastWins;
    }

    size_t on_abort(VersionStore& /*store*/, TxnVersion /*version*/,
                    const std::vector<StateKey>& /*keys*/) const override {
        return 0;
    }
};

/**
 * @brief Build the policy selected by the options
 */
[[nodiscard]] std::unique_ptr<ConflictPolicy> make_conflict_policy(const EngineOptions& options);

}  // namespace tessera
