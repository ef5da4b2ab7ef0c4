#pragma once

/**
 * @file macros.hpp
 * @brief Utility macros for Tessera
 */

#include <cassert>
#include <cstdlib>
#include <iostream>

namespace tessera {

// ─────────────────────────────────────────────────────────────────────────────
// Assertion Macros
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Assert that a condition is true (debug builds only)
 *
 * Only for local invariants. Scheduler invariant violations that must stop a
 * block are reported through Status::Internal instead.
 */
#ifdef NDEBUG
#define TESSERA_ASSERT(condition, message) ((void)0)
#else
#define TESSERA_ASSERT(condition, message)                                    \
    do {                                                                      \
        if (!(condition)) {                                                   \
            std::cerr << "Assertion failed: " << #condition << "\n"           \
                      << "Message: " << (message) << "\n"                     \
                      << "File: " << __FILE__ << "\n"                         \
                      << "Line: " << __LINE__ << std::endl;                   \
            std::abort();                                                     \
        }                                                                     \
    } while (false)
#endif

// ─────────────────────────────────────────────────────────────────────────────
// Utility Macros
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Disable copy constructor and assignment
 */
#define TESSERA_DISALLOW_COPY(ClassName)           \
    ClassName(const ClassName&) = delete;          \
    ClassName& operator=(const ClassName&) = delete

/**
 * @brief Disable move constructor and assignment
 */
#define TESSERA_DISALLOW_MOVE(ClassName)           \
    ClassName(ClassName&&) = delete;               \
    ClassName& operator=(ClassName&&) = delete

/**
 * @brief Disable copy and move
 */
#define TESSERA_DISALLOW_COPY_AND_MOVE(ClassName)  \
    TESSERA_DISALLOW_COPY(ClassName);              \
    TESSERA_DISALLOW_MOVE(ClassName)

}  // namespace tessera
