#pragma once

/**
 * @file rescheduler.hpp
 * @brief Placement of aborted transactions
 *
 * When a transaction aborts, the rescheduler decides whether it retries right
 * away or waits behind a lower transaction that is still expected to write
 * something it needs. Waiting is cheaper than re-executing against a value
 * that is about to change again.
 */

#include <memory>
#include <string>
#include <vector>

#include "common/types.hpp"
#include "transaction/dependency_tracker.hpp"
#include "transaction/txn_status_table.hpp"
#include "tessera/engine.hpp"

namespace tessera {

/**
 * @brief Abstract placement strategy
 */
class Rescheduler {
public:
    Rescheduler() = default;
    virtual ~Rescheduler() = default;

    Rescheduler(const Rescheduler&) = delete;
    Rescheduler& operator=(const Rescheduler&) = delete;

    [[nodiscard]] virtual const char* name() const noexcept = 0;

    /**
     * @brief Lower index an aborted transaction should wait for
     *
     * Called without any status lock held.
     *
     * @return INVALID_TXN_IDX to retry immediately
     */
    [[nodiscard]] virtual txn_idx_t place(txn_idx_t idx, const TransactionStatusTable& table,
                                          const DependencyTracker& tracker) const = 0;

    /**
     * @brief Keys to mark as ESTIMATEs for idx before the block starts
     */
    [[nodiscard]] virtual std::vector<StateKey> premarked_keys(txn_idx_t /*idx*/) const {
        return {};
    }
};

/**
 * @brief Always retry right away (rescheduling disabled)
 */
class ImmediateRescheduler : public Rescheduler {
public:
    [[nodiscard]] const char* name() const noexcept override { return "immediate"; }

    [[nodiscard]] txn_idx_t place(txn_idx_t /*idx*/, const TransactionStatusTable& /*table*/,
                                  const DependencyTracker& /*tracker*/) const override {
        return INVALID_TXN_IDX;
    }
};

/**
 * @brief Wait behind the closest in-flight lower writer
 *
 * With locality hints, a lower transaction is a writer of interest if its
 * declared writes meet the declared reads or writes of the aborted one.
 * Without hints, the lower transactions the aborted attempt read from are
 * used instead.
 */
class DeferredRescheduler : public Rescheduler {
public:
    /**
     * @param hints One hint per transaction, or empty
     */
    explicit DeferredRescheduler(const LocalityHints& hints);

    [[nodiscard]] const char* name() const noexcept override { return "deferred"; }

    [[nodiscard]] txn_idx_t place(txn_idx_t idx, const TransactionStatusTable& table,
                                  const DependencyTracker& tracker) const override;

    [[nodiscard]] std::vector<StateKey> premarked_keys(txn_idx_t idx) const override;

private:
    /// Sorted, deduplicated declared keys
    struct DeclaredKeys {
        std::vector<StateKey> reads_and_writes;
        std::vector<StateKey> writes;
    };

    std::vector<DeclaredKeys> declared_;
};

/**
 * @brief Build the rescheduler selected by the options
 */
[[nodiscard]] std::unique_ptr<Rescheduler> make_rescheduler(const EngineOptions& options,
                                                            const LocalityHints& hints);

/**
 * @brief Group transactions into key-disjoint epochs
 *
 * Each transaction goes to the lowest epoch whose accumulated write keys do
 * not meet its declared read or write keys; its write keys then join that
 * epoch.
 *
 * @param epochs Output: epoch of each transaction (may be nullptr)
 * @return Number of epochs
 */
size_t plan_conflict_epochs(const LocalityHints& hints, std::vector<size_t>* epochs);

}  // namespace tessera
