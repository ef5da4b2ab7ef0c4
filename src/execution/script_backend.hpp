#pragma once

/**
 * @file script_backend.hpp
 * @brief Tiny op-list interpreter over integer balances
 *
 * A ScriptTransaction is a list of ops on a few int64 registers. Values in
 * the state are int64 in decimal text; a missing key reads as 0.
 *
 *   auto txn = std::make_shared<ScriptTransaction>("deposit");
 *   txn->load(0, "alice").add(0, 50).store("alice", 0);
 */

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "tessera/backend.hpp"

namespace tessera {

// ─────────────────────────────────────────────────────────────────────────────
// Ops
// ─────────────────────────────────────────────────────────────────────────────

enum class ScriptOpType : uint8_t {
    kLoad = 0,            // reg = state[key]
    kSet = 1,             // reg = amount
    kAddConst = 2,        // reg += amount
    kAddReg = 3,          // reg += regs[src]
    kStore = 4,           // state[key] = reg
    kTransfer = 5,        // state[key] -= amount, state[key2] += amount
    kRequireAtLeast = 6,  // fail unless state[key] >= amount
    kEmit = 7             // append reg to the outcome payload
};

[[nodiscard]] inline const char* script_op_to_string(ScriptOpType type) {
    switch (type) {
        case ScriptOpType::kLoad:
            return "LOAD";
        case ScriptOpType::kSet:
            return "SET";
        case ScriptOpType::kAddConst:
            return "ADD";
        case ScriptOpType::kAddReg:
            return "ADD_REG";
        case ScriptOpType::kStore:
            return "STORE";
        case ScriptOpType::kTransfer:
            return "TRANSFER";
        case ScriptOpType::kRequireAtLeast:
            return "REQUIRE";
        case ScriptOpType::kEmit:
            return "EMIT";
        default:
            return "UNKNOWN";
    }
}

struct ScriptOp {
    ScriptOpType type = ScriptOpType::kLoad;
    uint8_t reg = 0;
    uint8_t src = 0;
    StateKey key;
    StateKey key2;
    int64_t amount = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// ScriptTransaction
// ─────────────────────────────────────────────────────────────────────────────

class ScriptTransaction : public Transaction {
public:
    static constexpr size_t kRegisterCount = 4;

    explicit ScriptTransaction(std::string name) : name_(std::move(name)) {}

    [[nodiscard]] std::string describe() const override;

    ScriptTransaction& load(uint8_t reg, StateKey key);
    ScriptTransaction& set(uint8_t reg, int64_t value);
    ScriptTransaction& add(uint8_t reg, int64_t amount);
    ScriptTransaction& add_reg(uint8_t reg, uint8_t src);
    ScriptTransaction& store(StateKey key, uint8_t reg);
    ScriptTransaction& transfer(StateKey from, StateKey to, int64_t amount);
    ScriptTransaction& require_at_least(StateKey key, int64_t amount);
    ScriptTransaction& emit(uint8_t reg);

    [[nodiscard]] const std::vector<ScriptOp>& ops() const noexcept { return ops_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    /**
     * @brief Keys the script may read and may write, for locality hints
     */
    [[nodiscard]] TxnHint declared_keys() const;

private:
    std::string name_;
    std::vector<ScriptOp> ops_;
};

// ─────────────────────────────────────────────────────────────────────────────
// ScriptBackend
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief ExecutionBackend for ScriptTransaction
 *
 * A failed transfer or requirement, or an addition that would overflow,
 * ends the script with a failed outcome and no writes. Stateless, so one instance serves every worker.
 */
class ScriptBackend : public ExecutionBackend {
public:
    [[nodiscard]] ExecutionResult execute(const Transaction& txn, ReadView& view) override;

    /**
     * @brief Encode an integer as a state value
     */
    [[nodiscard]] static StateValue encode(int64_t value) { return std::to_string(value); }

    /**
     * @brief Decode a state value
     * @return std::nullopt if the value is not an integer
     */
    [[nodiscard]] static std::optional<int64_t> decode(const StateValue& value);
};

}  // namespace tessera
