#pragma once

/**
 * @file smallbank.hpp
 * @brief SmallBank workload generator
 *
 * Every account has a checking and a savings balance. Blocks mix the six
 * SmallBank procedures over accounts picked with a zipfian skew:
 *
 *   balance            read checking + savings
 *   deposit_checking   checking += amount
 *   transact_savings   savings += amount
 *   amalgamate         move all of a's money into b's checking
 *   write_check        checking -= amount (may go negative)
 *   send_payment       checking a -> checking b, fails on insufficient funds
 */

#include <cstdint>
#include <memory>
#include <random>
#include <string>

#include "execution/script_backend.hpp"
#include "storage/memory_state.hpp"
#include "tessera/block.hpp"
#include "workload/zipf.hpp"

namespace tessera {

struct SmallBankOptions {
    /// Number of accounts
    uint64_t account_count = 1000;

    /// Zipfian skew of account selection, 0 is uniform
    double skew = 0.0;

    /// Percentage of read-only balance queries
    uint32_t balance_ratio = 15;

    /// Starting checking and savings balance of every account
    int64_t initial_balance = 10000;

    /// Attach locality hints to generated blocks
    bool with_hints = true;

    uint64_t seed = 42;
};

/**
 * @brief Deterministic SmallBank block generator
 */
class SmallBankWorkload {
public:
    explicit SmallBankWorkload(const SmallBankOptions& options = {});

    /**
     * @brief State every account starts with
     */
    [[nodiscard]] std::unique_ptr<MemoryState> initial_state() const;

    /**
     * @brief Generate the next block
     */
    [[nodiscard]] Block next_block(size_t txn_count);

    [[nodiscard]] static StateKey checking_key(uint64_t account);
    [[nodiscard]] static StateKey savings_key(uint64_t account);

    [[nodiscard]] const SmallBankOptions& options() const noexcept { return options_; }

private:
    [[nodiscard]] std::shared_ptr<ScriptTransaction> next_transaction();

    /// Second account, distinct from first when there is more than one
    [[nodiscard]] uint64_t other_account(uint64_t first);

    SmallBankOptions options_;
    std::mt19937_64 rng_;
    ZipfGenerator accounts_;
    uint64_t generated_ = 0;
};

}  // namespace tessera
