#pragma once

/**
 * @file tessera.hpp
 * @brief Main include header for the Tessera execution engine
 *
 * Include this single header to access the public API of Tessera.
 */

#include "tessera/backend.hpp"
#include "tessera/block.hpp"
#include "tessera/engine.hpp"
#include "tessera/status.hpp"

namespace tessera {

/**
 * @brief Get the version string of Tessera
 * @return Version string in format "major.minor.patch"
 */
constexpr const char* version() noexcept {
    return "0.1.0";
}

/**
 * @brief Get the major version number
 */
constexpr int version_major() noexcept {
    return 0;
}

/**
 * @brief Get the minor version number
 */
constexpr int version_minor() noexcept {
    return 1;
}

/**
 * @brief Get the patch version number
 */
constexpr int version_patch() noexcept {
    return 0;
}

}  // namespace tessera
