/**
 * @file platform.hpp
 * @brief Platform switches, monotonic time and the debug assertion.
 */

#ifndef HOOKQ_PLATFORM_HPP_
#define HOOKQ_PLATFORM_HPP_

#include <cstdint>
#include <cstdio>
#include <cstdlib>

#include <chrono>

#if defined(__linux__)
#define HOOKQ_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define HOOKQ_PLATFORM_MACOS 1
#endif

// BSD sockets are needed by socket.hpp / http.hpp.
#if defined(HOOKQ_PLATFORM_LINUX) || defined(HOOKQ_PLATFORM_MACOS)
#define HOOKQ_HAS_NETWORK 1
#else
#define HOOKQ_HAS_NETWORK 0
#endif

namespace hookq {

// ============================================================================
// Monotonic time
// ============================================================================

/// Nanoseconds on std::chrono::steady_clock. Used for queue wait and
/// processing durations; never for wall-clock timestamps.
inline uint64_t SteadyNowNs() noexcept {
  const auto since = std::chrono::steady_clock::now().time_since_epoch();
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(since).count());
}

/// Fractional milliseconds since @p start_ns; 0 if the clock reads earlier.
inline double ElapsedMs(uint64_t start_ns) noexcept {
  const uint64_t now = SteadyNowNs();
  if (now <= start_ns) return 0.0;
  return static_cast<double>(now - start_ns) / 1.0e6;
}

// ============================================================================
// HOOKQ_ASSERT
// ============================================================================

namespace detail {

[[noreturn]] inline void AssertFailed(const char* expr, const char* file, int line) noexcept {
  (void)std::fprintf(stderr, "hookq: assertion '%s' failed (%s:%d)\n", expr, file, line);
  std::abort();
}

}  // namespace detail

}  // namespace hookq

/// Programming-error check, compiled out with NDEBUG.
#ifdef NDEBUG
#define HOOKQ_ASSERT(cond) ((void)0)
#else
#define HOOKQ_ASSERT(cond) \
  ((cond) ? static_cast<void>(0) : ::hookq::detail::AssertFailed(#cond, __FILE__, __LINE__))
#endif

#endif  // HOOKQ_PLATFORM_HPP_
