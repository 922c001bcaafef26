/**
 * @file shared.hxx
 * @brief Common includes, macros, and shared namespace for the cxxcookie.
 */

#ifndef CXXCOOKIE_SHARED_HXX
#define CXXCOOKIE_SHARED_HXX

#include <algorithm>
#include <array>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/chrono.h>
#include <fmt/color.h>
#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ostream.h>

#include <boost/algorithm/string.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

#ifdef __MSVC_COMPILER__
/** @brief Forces function inlining. */
#define CXXCOOKIE_INLINE __forceinline

/** @brief Prevents function inlining. */
#define CXXCOOKIE_NOINLINE __declspec(noinline)
#elif __CLANG_COMPILER__ || __GCC_COMPILER__ || __INTEL_COMPILER__
/** @brief Forces function inlining. */
#define CXXCOOKIE_INLINE __attribute__((always_inline)) inline

/** @brief Prevents function inlining. */
#define CXXCOOKIE_NOINLINE __attribute__((noinline))
#else
/** @brief Forces function inlining. */
#define CXXCOOKIE_INLINE inline

/** @brief Prevents function inlining. */
#define CXXCOOKIE_NOINLINE
#endif // ...

#include "logging/logging.hxx"

/**
 * @namespace shared
 * @brief Contains shared types, utilities, and configuration used across the cxxcookie.
 *
 * This namespace is intended for common components that are reused by multiple modules,
 * such as logging and platform-specific macros.
 */
namespace shared {
    // ...
}

#endif // CXXCOOKIE_SHARED_HXX
