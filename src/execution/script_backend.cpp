/**
 * @file script_backend.cpp
 * @brief ScriptTransaction and ScriptBackend implementation
 */

#include "execution/script_backend.hpp"

#include <charconv>
#include <limits>
#include <stdexcept>

#include "common/macros.hpp"

namespace tessera {

// ─────────────────────────────────────────────────────────────────────────────
// ScriptTransaction
// ─────────────────────────────────────────────────────────────────────────────

std::string ScriptTransaction::describe() const {
    std::string result = name_ + " [";
    for (size_t i = 0; i < ops_.size(); ++i) {
        if (i > 0) {
            result += ' ';
        }
        result += script_op_to_string(ops_[i].type);
    }
    result += ']';
    return result;
}

ScriptTransaction& ScriptTransaction::load(uint8_t reg, StateKey key) {
    TESSERA_ASSERT(reg < kRegisterCount, "register out of range");
    ScriptOp op;
    op.type = ScriptOpType::kLoad;
    op.reg = reg;
    op.key = std::move(key);
    ops_.push_back(std::move(op));
    return *this;
}

ScriptTransaction& ScriptTransaction::set(uint8_t reg, int64_t value) {
    TESSERA_ASSERT(reg < kRegisterCount, "register out of range");
    ScriptOp op;
    op.type = ScriptOpType::kSet;
    op.reg = reg;
    op.amount = value;
    ops_.push_back(std::move(op));
    return *this;
}

ScriptTransaction& ScriptTransaction::add(uint8_t reg, int64_t amount) {
    TESSERA_ASSERT(reg < kRegisterCount, "register out of range");
    ScriptOp op;
    op.type = ScriptOpType::kAddConst;
    op.reg = reg;
    op.amount = amount;
    ops_.push_back(std::move(op));
    return *this;
}

ScriptTransaction& ScriptTransaction::add_reg(uint8_t reg, uint8_t src) {
    TESSERA_ASSERT(reg < kRegisterCount && src < kRegisterCount, "register out of range");
    ScriptOp op;
    op.type = ScriptOpType::kAddReg;
    op.reg = reg;
    op.src = src;
    ops_.push_back(std::move(op));
    return *this;
}

ScriptTransaction& ScriptTransaction::store(StateKey key, uint8_t reg) {
    TESSERA_ASSERT(reg < kRegisterCount, "register out of range");
    ScriptOp op;
    op.type = ScriptOpType::kStore;
    op.reg = reg;
    op.key = std::move(key);
    ops_.push_back(std::move(op));
    return *this;
}

ScriptTransaction& ScriptTransaction::transfer(StateKey from, StateKey to, int64_t amount) {
    ScriptOp op;
    op.type = ScriptOpType::kTransfer;
    op.key = std::move(from);
    op.key2 = std::move(to);
    op.amount = amount;
    ops_.push_back(std::move(op));
    return *this;
}

ScriptTransaction& ScriptTransaction::require_at_least(StateKey key, int64_t amount) {
    ScriptOp op;
    op.type = ScriptOpType::kRequireAtLeast;
    op.key = std::move(key);
    op.amount = amount;
    ops_.push_back(std::move(op));
    return *this;
}

ScriptTransaction& ScriptTransaction::emit(uint8_t reg) {
    TESSERA_ASSERT(reg < kRegisterCount, "register out of range");
    ScriptOp op;
    op.type = ScriptOpType::kEmit;
    op.reg = reg;
    ops_.push_back(std::move(op));
    return *this;
}

TxnHint ScriptTransaction::declared_keys() const {
    TxnHint hint;
    for (const auto& op : ops_) {
        switch (op.type) {
            case ScriptOpType::kLoad:
            case ScriptOpType::kRequireAtLeast:
                hint.read_keys.push_back(op.key);
                break;
            case ScriptOpType::kStore:
                hint.write_keys.push_back(op.key);
                break;
            case ScriptOpType::kTransfer:
                hint.read_keys.push_back(op.key);
                hint.read_keys.push_back(op.key2);
                hint.write_keys.push_back(op.key);
                hint.write_keys.push_back(op.key2);
                break;
            default:
                break;
        }
    }
    return hint;
}

// ─────────────────────────────────────────────────────────────────────────────
// ScriptBackend
// ─────────────────────────────────────────────────────────────────────────────

std::optional<int64_t> ScriptBackend::decode(const StateValue& value) {
    int64_t result = 0;
    const char* begin = value.data();
    const char* end = begin + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, result);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return result;
}

namespace {

/// false instead of overflowing
bool checked_add(int64_t a, int64_t b, int64_t* out) {
    if ((b > 0 && a > std::numeric_limits<int64_t>::max() - b) ||
        (b < 0 && a < std::numeric_limits<int64_t>::min() - b)) {
        return false;
    }
    *out = a + b;
    return true;
}

/**
 * @brief State access of one script run: own writes first, then the view
 */
class ScriptContext {
public:
    explicit ScriptContext(ReadView& view) : view_(view) {}

    /// false when the read is blocked or the value is malformed
    bool read(const StateKey& key, int64_t* out) {
        auto own = writes_.find(key);
        if (own != writes_.end()) {
            *out = *ScriptBackend::decode(own->second);
            return true;
        }

        ReadResult result = view_.get(key);
        if (result.is_blocked()) {
            blocked_ = true;
            blocking_txn_ = result.blocking_txn;
            return false;
        }
        if (!result.has_value()) {
            *out = 0;
            return true;
        }
        auto decoded = ScriptBackend::decode(result.value);
        if (!decoded.has_value()) {
            malformed_key_ = key;
            return false;
        }
        *out = *decoded;
        return true;
    }

    void write(const StateKey& key, int64_t value) {
        writes_[key] = ScriptBackend::encode(value);
    }

    ExecutionResult fail(std::string reason) const {
        if (blocked_) {
            return ExecutionResult::Blocked(blocking_txn_);
        }
        if (!malformed_key_.empty()) {
            reason = "malformed value at " + malformed_key_;
        }
        return ExecutionResult::Completed(WriteSet(), Outcome::Failure(std::move(reason)));
    }

    WriteSet take_writes() { return std::move(writes_); }

private:
    ReadView& view_;
    WriteSet writes_;
    bool blocked_ = false;
    txn_idx_t blocking_txn_ = 0;
    StateKey malformed_key_;
};

}  // namespace

ExecutionResult ScriptBackend::execute(const Transaction& txn, ReadView& view) {
    const auto* script = dynamic_cast<const ScriptTransaction*>(&txn);
    if (script == nullptr) {
        throw std::invalid_argument("ScriptBackend cannot run " + txn.describe());
    }

    ScriptContext ctx(view);
    std::array<int64_t, ScriptTransaction::kRegisterCount> regs{};
    std::string payload;

    for (const auto& op : script->ops()) {
        if (op.reg >= regs.size() || op.src >= regs.size()) {
            return ctx.fail("register out of range");
        }
        switch (op.type) {
            case ScriptOpType::kLoad:
                if (!ctx.read(op.key, &regs[op.reg])) {
                    return ctx.fail("read failed");
                }
                break;

            case ScriptOpType::kSet:
                regs[op.reg] = op.amount;
                break;

            case ScriptOpType::kAddConst:
                if (!checked_add(regs[op.reg], op.amount, &regs[op.reg])) {
                    return ctx.fail("arithmetic overflow");
                }
                break;

            case ScriptOpType::kAddReg:
                if (!checked_add(regs[op.reg], regs[op.src], &regs[op.reg])) {
                    return ctx.fail("arithmetic overflow");
                }
                break;

            case ScriptOpType::kStore:
                ctx.write(op.key, regs[op.reg]);
                break;

            case ScriptOpType::kTransfer: {
                if (op.amount < 0) {
                    return ctx.fail("negative transfer amount");
                }
                int64_t from = 0;
                int64_t to = 0;
                if (!ctx.read(op.key, &from) || !ctx.read(op.key2, &to)) {
                    return ctx.fail("read failed");
                }
                if (from < op.amount) {
                    return ctx.fail("insufficient balance in " + op.key);
                }
                if (op.key == op.key2) {
                    break;
                }
                // from >= amount >= 0, so only the credit can overflow
                int64_t credited = 0;
                if (!checked_add(to, op.amount, &credited)) {
                    return ctx.fail("arithmetic overflow");
                }
                ctx.write(op.key, from - op.amount);
                ctx.write(op.key2, credited);
                break;
            }

            case ScriptOpType::kRequireAtLeast: {
                int64_t value = 0;
                if (!ctx.read(op.key, &value)) {
                    return ctx.fail("read failed");
                }
                if (value < op.amount) {
                    return ctx.fail("requirement failed on " + op.key);
                }
                break;
            }

            case ScriptOpType::kEmit:
                if (!payload.empty()) {
                    payload += ',';
                }
                payload += std::to_string(regs[op.reg]);
                break;
        }
    }

    return ExecutionResult::Completed(ctx.take_writes(), Outcome::Success(std::move(payload)));
}

}  // namespace tessera
