/**
 * @file config.cpp
 * @brief Engine option validation
 */

#include "common/config.hpp"

#include <string>

#include "tessera/engine.hpp"

namespace tessera {

Status validate_options(const EngineOptions& options) {
    if (options.worker_count == 0) {
        return Status::InvalidArgument("worker_count must be at least 1");
    }
    if (options.worker_count > config::kMaxWorkers) {
        return Status::InvalidArgument("worker_count exceeds " +
                                       std::to_string(config::kMaxWorkers));
    }
    if (options.abort_storm_threshold == 0) {
        return Status::InvalidArgument("abort_storm_threshold must be positive");
    }
    return Status::Ok();
}

}  // namespace tessera
