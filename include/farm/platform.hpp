/**
 * @file platform.hpp
 * @brief Platform detection, compiler hints, clock helpers and assertion macros.
 */

#ifndef FARM_PLATFORM_HPP_
#define FARM_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

#include <chrono>

namespace farm {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define FARM_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define FARM_PLATFORM_MACOS 1
#endif

#if defined(FARM_PLATFORM_LINUX) || defined(FARM_PLATFORM_MACOS)
#define FARM_PLATFORM_POSIX 1
#endif

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define FARM_LIKELY(x) __builtin_expect(!!(x), 1)
#define FARM_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define FARM_LIKELY(x) (x)
#define FARM_UNLIKELY(x) (x)
#endif

// ============================================================================
// Monotonic Clock
// ============================================================================

inline uint64_t SteadyNowNs() noexcept {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                   std::chrono::steady_clock::now().time_since_epoch())
                                   .count());
}

inline uint64_t SteadyNowUs() noexcept { return SteadyNowNs() / 1000U; }

inline uint64_t SteadyNowMs() noexcept { return SteadyNowNs() / 1000000U; }

// ============================================================================
// Assert Macro
// ============================================================================

namespace detail {

/**
 * @brief Called when an assertion fails in debug mode.
 *
 * Prints the failed condition, file, and line to stderr, then aborts.
 */
inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "FARM_ASSERT failed: %s at %s:%d\n", cond, file, line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define FARM_ASSERT(cond) ((void)0)
#else
#define FARM_ASSERT(cond) \
  ((cond) ? ((void)0) : ::farm::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

// ============================================================================
// Macro Helpers
// ============================================================================

#define FARM_CONCAT_IMPL(a, b) a##b
#define FARM_CONCAT(a, b) FARM_CONCAT_IMPL(a, b)

}  // namespace farm

#endif  // FARM_PLATFORM_HPP_
