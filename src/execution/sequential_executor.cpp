/**
 * @file sequential_executor.cpp
 * @brief SequentialExecutor implementation
 */

#include "execution/sequential_executor.hpp"

#include <chrono>
#include <exception>
#include <string>

#include "common/logger.hpp"

namespace tessera {

namespace {

/**
 * @brief View over the prior state plus everything committed so far
 */
class OverlayReadView : public ReadView {
public:
    OverlayReadView(const StateDelta& overlay, const StateReader& base, txn_idx_t txn_idx)
        : overlay_(overlay), base_(base), txn_idx_(txn_idx) {}

    ReadResult get(const StateKey& key) override {
        ReadResult result;
        auto it = overlay_.find(key);
        if (it != overlay_.end()) {
            result.status = ReadStatus::kValue;
            result.value = it->second;
            return result;
        }
        auto value = base_.get(key);
        if (value.has_value()) {
            result.status = ReadStatus::kValue;
            result.value = std::move(*value);
        }
        return result;
    }

    txn_idx_t txn_index() const noexcept override { return txn_idx_; }

private:
    const StateDelta& overlay_;
    const StateReader& base_;
    txn_idx_t txn_idx_;
};

}  // namespace

SequentialExecutor::SequentialExecutor(ExecutionBackend& backend, const StateReader& state)
    : backend_(backend), state_(state) {}

Status SequentialExecutor::execute(const Block& block, BlockOutput* output) {
    *output = BlockOutput{};
    const auto start = std::chrono::steady_clock::now();

    output->outcomes.reserve(block.size());
    for (txn_idx_t idx = 0; idx < block.size(); ++idx) {
        const Transaction& txn = *block.transactions[idx];
        OverlayReadView view(output->state_delta, state_, idx);

        ExecutionResult result;
        try {
            result = backend_.execute(txn, view);
        } catch (const std::exception& e) {
            LOG_CRITICAL("Backend threw while executing txn {} ({}): {}", idx, txn.describe(),
                         e.what());
            return Status::Internal("backend failure in txn " + std::to_string(idx) + ": " +
                                    e.what());
        }
        if (result.blocked) {
            return Status::Internal("txn " + std::to_string(idx) +
                                    " reported a dependency during sequential execution");
        }

        for (auto& [key, value] : result.writes) {
            output->state_delta[key] = std::move(value);
        }
        output->outcomes.push_back(std::move(result.outcome));
        ++output->metrics.executions;
    }

    output->parallelism.total_txns = block.size();
    output->parallelism.depth = block.size();
    output->parallelism.max_width = block.empty() ? 0 : 1;
    output->parallelism.average_width = block.empty() ? 0.0 : 1.0;

    output->metrics.elapsed_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start)
            .count();
    LOG_DEBUG("Sequential block of {} txns in {:.2f} ms", block.size(),
              output->metrics.elapsed_ms);
    return Status::Ok();
}

}  // namespace tessera
