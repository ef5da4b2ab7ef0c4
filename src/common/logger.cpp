/**
 * @file logger.cpp
 * @brief Logger implementation
 */

#include "common/logger.hpp"

#include <mutex>
#include <shared_mutex>

namespace tessera {

std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;

namespace {
// Guards logger_; workers read it while another engine may init or shut down
std::shared_mutex g_logger_mutex;
}  // namespace

void Logger::init(const std::string& name, spdlog::level::level_enum level) {
    std::unique_lock<std::shared_mutex> lock(g_logger_mutex);
    if (logger_ == nullptr) {
        logger_ = spdlog::get(name);
        if (logger_ == nullptr) {
            logger_ = spdlog::stdout_color_mt(name);
        }
        logger_->set_level(level);
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v");
    }
}

std::shared_ptr<spdlog::logger> Logger::get() {
    while (true) {
        {
            std::shared_lock<std::shared_mutex> lock(g_logger_mutex);
            if (logger_ != nullptr) {
                return logger_;
            }
        }
        init();
    }
}

void Logger::set_level(spdlog::level::level_enum level) {
    std::shared_lock<std::shared_mutex> lock(g_logger_mutex);
    if (logger_ != nullptr) {
        logger_->set_level(level);
    }
}

spdlog::level::level_enum Logger::parse_level(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to "off"
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}

void Logger::shutdown() {
    std::unique_lock<std::shared_mutex> lock(g_logger_mutex);
    if (logger_ != nullptr) {
        spdlog::drop(logger_->name());
        logger_.reset();
    }
}

}  // namespace tessera
