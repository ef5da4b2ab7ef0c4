/**
 * @file status.cpp
 * @brief Status class implementation
 */

#include "tessera/status.hpp"

namespace tessera {

std::string Status::to_string() const {
    std::string result;

    switch (code_) {
        case StatusCode::kOk:                result = "OK"; break;
        case StatusCode::kInvalidArgument:   result = "InvalidArgument"; break;
        case StatusCode::kResourceExhausted: result = "ResourceExhausted"; break;
        case StatusCode::kInternal:          result = "Internal"; break;
    }

    if (!message_.empty()) {
        result += ": ";
        result += message_;
    }

    return result;
}

}  // namespace tessera
