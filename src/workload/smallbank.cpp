/**
 * @file smallbank.cpp
 * @brief SmallBankWorkload implementation
 */

#include "workload/smallbank.hpp"

namespace tessera {

SmallBankWorkload::SmallBankWorkload(const SmallBankOptions& options)
    : options_(options), rng_(options.seed), accounts_(options.account_count, options.skew) {}

StateKey SmallBankWorkload::checking_key(uint64_t account) {
    return "checking:" + std::to_string(account);
}

StateKey SmallBankWorkload::savings_key(uint64_t account) {
    return "savings:" + std::to_string(account);
}

std::unique_ptr<MemoryState> SmallBankWorkload::initial_state() const {
    auto state = std::make_unique<MemoryState>();
    const StateValue balance = ScriptBackend::encode(options_.initial_balance);
    for (uint64_t account = 0; account < accounts_.n(); ++account) {
        state->put(checking_key(account), balance);
        state->put(savings_key(account), balance);
    }
    return state;
}

Block SmallBankWorkload::next_block(size_t txn_count) {
    Block block;
    block.transactions.reserve(txn_count);
    if (options_.with_hints) {
        block.hints.reserve(txn_count);
    }

    for (size_t i = 0; i < txn_count; ++i) {
        auto txn = next_transaction();
        if (options_.with_hints) {
            block.hints.push_back(txn->declared_keys());
        }
        block.transactions.push_back(std::move(txn));
    }
    return block;
}

uint64_t SmallBankWorkload::other_account(uint64_t first) {
    if (accounts_.n() < 2) {
        return first;
    }
    uint64_t second = accounts_.next(rng_);
    while (second == first) {
        second = std::uniform_int_distribution<uint64_t>(0, accounts_.n() - 1)(rng_);
    }
    return second;
}

std::shared_ptr<ScriptTransaction> SmallBankWorkload::next_transaction() {
    const uint64_t id = generated_++;
    const uint64_t a = accounts_.next(rng_);
    const uint32_t roll = std::uniform_int_distribution<uint32_t>(0, 99)(rng_);
    const int64_t amount = std::uniform_int_distribution<int64_t>(1, 100)(rng_);

    const std::string suffix = "#" + std::to_string(id);

    if (roll < options_.balance_ratio) {
        auto txn = std::make_shared<ScriptTransaction>("balance" + suffix);
        txn->load(0, checking_key(a)).load(1, savings_key(a)).add_reg(0, 1).emit(0);
        return txn;
    }

    // Split the remaining share evenly among the five updating procedures
    const uint32_t slot = (roll - options_.balance_ratio) * 5 / (100 - options_.balance_ratio);
    switch (slot) {
        case 0: {
            auto txn = std::make_shared<ScriptTransaction>("deposit_checking" + suffix);
            txn->load(0, checking_key(a)).add(0, amount).store(checking_key(a), 0);
            return txn;
        }
        case 1: {
            auto txn = std::make_shared<ScriptTransaction>("transact_savings" + suffix);
            txn->load(0, savings_key(a)).add(0, amount).store(savings_key(a), 0);
            return txn;
        }
        case 2: {
            const uint64_t b = other_account(a);
            auto txn = std::make_shared<ScriptTransaction>("amalgamate" + suffix);
            txn->load(0, savings_key(a))
                .load(1, checking_key(a))
                .add_reg(0, 1)
                .load(2, checking_key(b))
                .add_reg(2, 0)
                .set(3, 0)
                .store(savings_key(a), 3)
                .store(checking_key(a), 3)
                .store(checking_key(b), 2);
            return txn;
        }
        case 3: {
            auto txn = std::make_shared<ScriptTransaction>("write_check" + suffix);
            txn->load(0, checking_key(a)).add(0, -amount).store(checking_key(a), 0);
            return txn;
        }
        default: {
            const uint64_t b = other_account(a);
            auto txn = std::make_shared<ScriptTransaction>("send_payment" + suffix);
            txn->transfer(checking_key(a), checking_key(b), amount * 50);
            return txn;
        }
    }
}

}  // namespace tessera
