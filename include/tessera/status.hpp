#pragma once

/**
 * @file status.hpp
 * @brief Public status and error codes for the Tessera execution engine
 */

#include <string>
#include <string_view>
#include <utility>

namespace tessera {

/**
 * @brief Status codes for engine operations
 */
enum class StatusCode {
    kOk = 0,
    kInvalidArgument,
    kResourceExhausted,
    kInternal,
};

/**
 * @brief Status class for operation results
 *
 * Status encapsulates the result of an operation. It can indicate success
 * or failure, and in case of failure, provides an error code and message.
 */
class Status {
public:
    /**
     * @brief Create a success status
     */
    Status() noexcept : code_(StatusCode::kOk) {}

    /**
     * @brief Create a status with the given code
     */
    explicit Status(StatusCode code) noexcept : code_(code) {}

    /**
     * @brief Create a status with code and message
     */
    Status(StatusCode code, std::string message) noexcept
        : code_(code), message_(std::move(message)) {}

    // Factory methods for common statuses
    [[nodiscard]] static Status Ok() noexcept { return Status(); }
    [[nodiscard]] static Status InvalidArgument(std::string msg = "") { return Status(StatusCode::kInvalidArgument, std::move(msg)); }
    [[nodiscard]] static Status ResourceExhausted(std::string msg = "") { return Status(StatusCode::kResourceExhausted, std::move(msg)); }
    [[nodiscard]] static Status Internal(std::string msg = "") { return Status(StatusCode::kInternal, std::move(msg)); }

    // Query methods
    [[nodiscard]] bool ok() const noexcept { return code_ == StatusCode::kOk; }
    [[nodiscard]] bool is_error() const noexcept { return code_ != StatusCode::kOk; }
    [[nodiscard]] bool is_internal() const noexcept { return code_ == StatusCode::kInternal; }

    [[nodiscard]] StatusCode code() const noexcept { return code_; }
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /**
     * @brief Get a human-readable string representation
     */
    [[nodiscard]] std::string to_string() const;

    // Explicit conversion to bool for convenience
    explicit operator bool() const noexcept { return ok(); }

private:
    StatusCode code_;
    std::string message_;
};

}  // namespace tessera
