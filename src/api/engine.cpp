/**
 * @file engine.cpp
 * @brief Engine class implementation
 */

#include "tessera/engine.hpp"

#include <string>
#include <utility>

#include "common/config.hpp"
#include "common/logger.hpp"
#include "common/status.hpp"
#include "execution/parallel_executor.hpp"
#include "execution/sequential_executor.hpp"

namespace tessera {

class EngineImpl {
public:
  EngineImpl(ExecutionBackend &backend, const StateReader &state,
             const EngineOptions &options)
      : options_(options), options_status_(validate_options(options)),
        parallel_(backend, state, options), sequential_(backend, state) {
    Logger::init();
    Logger::set_level(Logger::parse_level(options.log_level));
    if (!options_status_.ok()) {
      LOG_ERROR("Invalid engine options: {}", options_status_.to_string());
    } else {
      LOG_DEBUG("Engine ready: {} workers, early detection {}, {} commit race, "
                "rescheduling {}",
                options.worker_count, options.early_detection ? "on" : "off",
                options.commit_race == CommitRacePolicy::kFirstWins
                    ? "first-wins"
                    : "last-wins",
                options.enable_rescheduling ? "on" : "off");
    }
  }

  Status execute_block(const Block &block, BlockOutput *output) {
    TESSERA_RETURN_IF_ERROR(check_input(block, output));
    return parallel_.execute(block, output);
  }

  Status execute_sequential(const Block &block, BlockOutput *output) {
    TESSERA_RETURN_IF_ERROR(check_input(block, output));
    return sequential_.execute(block, output);
  }

  const EngineOptions &options() const noexcept { return options_; }

  bool is_valid() const noexcept { return options_status_.ok(); }

private:
  Status check_input(const Block &block, BlockOutput *output) const {
    if (!options_status_.ok()) {
      return options_status_;
    }
    if (output == nullptr) {
      return Status::InvalidArgument("output must not be null");
    }
    if (block.size() > config::kMaxBlockSize) {
      return Status::InvalidArgument("block of " + std::to_string(block.size()) +
                                     " txns exceeds the limit of " +
                                     std::to_string(config::kMaxBlockSize));
    }
    if (block.has_hints() && block.hints.size() != block.size()) {
      return Status::InvalidArgument(
          "got " + std::to_string(block.hints.size()) + " hints for " +
          std::to_string(block.size()) + " txns");
    }
    for (size_t i = 0; i < block.size(); ++i) {
      if (block.transactions[i] == nullptr) {
        return Status::InvalidArgument("txn " + std::to_string(i) +
                                       " is null");
      }
    }
    return Status::Ok();
  }

  EngineOptions options_;
  Status options_status_;
  ParallelExecutor parallel_;
  SequentialExecutor sequential_;
};

// Engine public interface

Engine::Engine(ExecutionBackend &backend, const StateReader &state,
               const EngineOptions &options)
    : impl_(std::make_unique<EngineImpl>(backend, state, options)) {}

Engine::~Engine() = default;

Engine::Engine(Engine &&) noexcept = default;
Engine &Engine::operator=(Engine &&) noexcept = default;

Status Engine::execute_block(const Block &block, BlockOutput *output) {
  return impl_->execute_block(block, output);
}

Status Engine::execute_sequential(const Block &block, BlockOutput *output) {
  return impl_->execute_sequential(block, output);
}

const EngineOptions &Engine::options() const noexcept {
  return impl_->options();
}

bool Engine::is_valid() const noexcept { return impl_->is_valid(); }

}  // namespace tessera
