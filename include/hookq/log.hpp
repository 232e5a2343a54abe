/**
 * @file log.hpp
 * @brief Leveled printf-style logging to stderr.
 *
 * One line per call, formatted on the caller's stack and written with a
 * single fwrite so concurrent lines do not interleave:
 *
 *   [2024-01-01 12:00:00.123] [INFO] [queue] enqueued (queue.hpp:120)
 *
 * The "(file:line)" suffix is only emitted in debug builds.
 *
 * Two filters apply:
 *   - HOOKQ_LOG_MIN_LEVEL (compile time, 0=DEBUG .. 4=FATAL) removes calls
 *     below the floor entirely.
 *   - SetLevel() (runtime) drops lines below the current threshold.
 *
 * FATAL writes the line, flushes and calls std::abort().
 */

#ifndef HOOKQ_LOG_HPP_
#define HOOKQ_LOG_HPP_

#include "hookq/platform.hpp"
#include "hookq/vocabulary.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

#if defined(HOOKQ_PLATFORM_LINUX) || defined(HOOKQ_PLATFORM_MACOS)
#include <time.h>
#endif

#ifndef HOOKQ_LOG_MIN_LEVEL
#ifdef NDEBUG
#define HOOKQ_LOG_MIN_LEVEL 1
#else
#define HOOKQ_LOG_MIN_LEVEL 0
#endif
#endif

namespace hookq {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

namespace detail {

inline std::atomic<Level>& LogLevelRef() noexcept {
#ifdef NDEBUG
  static std::atomic<Level> level{Level::kInfo};
#else
  static std::atomic<Level> level{Level::kDebug};
#endif
  return level;
}

inline std::atomic<bool>& InitializedRef() noexcept {
  static std::atomic<bool> initialized{false};
  return initialized;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
    case Level::kFatal:
      return "FATAL";
    default:
      return "OFF";
  }
}

inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) return "?";
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

/// @brief Format the current wall-clock time as "YYYY-MM-DD HH:MM:SS.mmm".
inline void FormatTimestamp(char* buf, size_t bufsz) noexcept {
#if defined(HOOKQ_PLATFORM_LINUX) || defined(HOOKQ_PLATFORM_MACOS)
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  struct tm tm_local;
  localtime_r(&ts.tv_sec, &tm_local);
  (void)std::snprintf(buf, bufsz, "%04d-%02d-%02d %02d:%02d:%02d.%03ld",
                      tm_local.tm_year + 1900, tm_local.tm_mon + 1, tm_local.tm_mday,
                      tm_local.tm_hour, tm_local.tm_min, tm_local.tm_sec,
                      static_cast<long>(ts.tv_nsec / 1000000L));
#else
  std::time_t t = std::time(nullptr);
  struct std::tm* tm_local = std::localtime(&t);
  if (tm_local != nullptr) {
    (void)std::snprintf(buf, bufsz, "%04d-%02d-%02d %02d:%02d:%02d.000",
                        tm_local->tm_year + 1900, tm_local->tm_mon + 1, tm_local->tm_mday,
                        tm_local->tm_hour, tm_local->tm_min, tm_local->tm_sec);
  } else {
    (void)std::snprintf(buf, bufsz, "0000-00-00 00:00:00.000");
  }
#endif
}

}  // namespace detail

// ============================================================================
// Public API
// ============================================================================

inline Level GetLevel() noexcept { return detail::LogLevelRef().load(std::memory_order_relaxed); }

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(level, std::memory_order_relaxed);
}

/**
 * @brief Parse "debug", "info", "warn"/"warning", "error", "fatal", "off".
 * @return Parsed level, or empty optional on unknown text.
 */
inline optional<Level> ParseLevel(const char* text) noexcept {
  if (text == nullptr) return {};
  struct Name {
    const char* name;
    Level level;
  };
  static constexpr Name kNames[] = {
      {"debug", Level::kDebug}, {"info", Level::kInfo},   {"warn", Level::kWarn},
      {"warning", Level::kWarn}, {"error", Level::kError}, {"fatal", Level::kFatal},
      {"off", Level::kOff},
  };
  for (const auto& n : kNames) {
    const char* a = text;
    const char* b = n.name;
    while (*a != '\0' && *b != '\0') {
      char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
      if (la != *b) break;
      ++a;
      ++b;
    }
    if (*a == '\0' && *b == '\0') return optional<Level>(n.level);
  }
  return {};
}

/// @brief Mark the logger as initialized. Idempotent.
inline void Init() noexcept { detail::InitializedRef().store(true, std::memory_order_release); }

/// @brief Flush stderr and mark the logger as shut down.
inline void Shutdown() noexcept {
  (void)std::fflush(stderr);
  detail::InitializedRef().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitializedRef().load(std::memory_order_acquire);
}

inline void LogWriteVa(Level level, const char* category, const char* file, int line,
                       const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(GetLevel())) {
    return;
  }

  char ts[32];
  detail::FormatTimestamp(ts, sizeof(ts));

  char msg[512];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);

  char out[640];
#ifdef NDEBUG
  (void)file;
  (void)line;
  int n = std::snprintf(out, sizeof(out), "[%s] [%s] [%s] %s\n", ts, detail::LevelTag(level),
                        category != nullptr ? category : "", msg);
#else
  int n = std::snprintf(out, sizeof(out), "[%s] [%s] [%s] %s (%s:%d)\n", ts,
                        detail::LevelTag(level), category != nullptr ? category : "", msg,
                        detail::Basename(file), line);
#endif
  if (n < 0) return;
  size_t len = (static_cast<size_t>(n) < sizeof(out)) ? static_cast<size_t>(n) : sizeof(out) - 1U;
  if (len > 0 && out[len - 1U] != '\n') {
    out[len - 1U] = '\n';
  }
  (void)std::fwrite(out, 1, len, stderr);

  if (level == Level::kFatal) {
    (void)std::fflush(stderr);
    std::abort();
  }
}

inline void LogWrite(Level level, const char* category, const char* file, int line,
                     const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace hookq

// ============================================================================
// Macros
// ============================================================================

#define HOOKQ_LOG_DEBUG(cat, fmt, ...)                                                      \
  do {                                                                                      \
    if (HOOKQ_LOG_MIN_LEVEL <= 0) {                                                         \
      ::hookq::log::LogWrite(::hookq::log::Level::kDebug, cat, __FILE__, __LINE__, fmt,     \
                             ##__VA_ARGS__);                                                \
    }                                                                                       \
  } while (0)

#define HOOKQ_LOG_INFO(cat, fmt, ...)                                                       \
  do {                                                                                      \
    if (HOOKQ_LOG_MIN_LEVEL <= 1) {                                                         \
      ::hookq::log::LogWrite(::hookq::log::Level::kInfo, cat, __FILE__, __LINE__, fmt,      \
                             ##__VA_ARGS__);                                                \
    }                                                                                       \
  } while (0)

#define HOOKQ_LOG_WARN(cat, fmt, ...)                                                       \
  do {                                                                                      \
    if (HOOKQ_LOG_MIN_LEVEL <= 2) {                                                         \
      ::hookq::log::LogWrite(::hookq::log::Level::kWarn, cat, __FILE__, __LINE__, fmt,      \
                             ##__VA_ARGS__);                                                \
    }                                                                                       \
  } while (0)

#define HOOKQ_LOG_ERROR(cat, fmt, ...)                                                      \
  do {                                                                                      \
    if (HOOKQ_LOG_MIN_LEVEL <= 3) {                                                         \
      ::hookq::log::LogWrite(::hookq::log::Level::kError, cat, __FILE__, __LINE__, fmt,     \
                             ##__VA_ARGS__);                                                \
    }                                                                                       \
  } while (0)

#define HOOKQ_LOG_FATAL(cat, fmt, ...)                                                      \
  do {                                                                                      \
    ::hookq::log::LogWrite(::hookq::log::Level::kFatal, cat, __FILE__, __LINE__, fmt,       \
                           ##__VA_ARGS__);                                                  \
  } while (0)

#endif  // HOOKQ_LOG_HPP_
