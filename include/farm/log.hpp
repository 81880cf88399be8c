/**
 * @file log.hpp
 * @brief Leveled, printf-style synchronous logging to stderr.
 *
 * Each line carries a wall-clock timestamp, the level tag, a category, the
 * process id (forked workers log through the same stderr) and, in debug
 * builds, the source location:
 *
 *   [2026-10-18 12:00:00.123] [INFO ] [DISPATCH] 1234 | Worker 2 sent 10000 values
 *
 * Two filters apply:
 *   - FARM_LOG_MIN_LEVEL (compile time): macros below it compile to nothing.
 *   - log::SetLevel()      (runtime):     LogWrite() returns early.
 *
 * Usage:
 * @code
 *   farm::log::Init();
 *   farm::log::SetLevel(farm::log::Level::kInfo);
 *   FARM_LOG_INFO("CLI", "Picking %llu numbers", n);
 * @endcode
 */

#ifndef FARM_LOG_HPP_
#define FARM_LOG_HPP_

#include "farm/platform.hpp"

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <atomic>
#include <mutex>

#if defined(FARM_PLATFORM_POSIX)
#include <sys/time.h>
#include <time.h>
#include <unistd.h>
#endif

/// Compile-time floor: 0=DEBUG, 1=INFO, 2=WARN, 3=ERROR, 4=FATAL, 5=OFF.
#ifndef FARM_LOG_MIN_LEVEL
#ifdef NDEBUG
#define FARM_LOG_MIN_LEVEL 1
#else
#define FARM_LOG_MIN_LEVEL 0
#endif
#endif

namespace farm {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5
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

/// Serializes whole lines between threads of one process.
inline std::mutex& WriteMutex() noexcept {
  static std::mutex mtx;
  return mtx;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO ";
    case Level::kWarn:
      return "WARN ";
    case Level::kError:
      return "ERROR";
    case Level::kFatal:
      return "FATAL";
    case Level::kOff:
      return "OFF  ";
  }
  return "?????";
}

inline const char* Basename(const char* path) noexcept {
  const char* base = path;
  for (const char* p = path; *p != '\0'; ++p) {
    if (*p == '/') {
      base = p + 1;
    }
  }
  return base;
}

inline void FormatTimestamp(char* buf, size_t size) noexcept {
#if defined(FARM_PLATFORM_POSIX)
  struct timeval tv;
  (void)gettimeofday(&tv, nullptr);
  struct tm tm_buf;
  time_t secs = tv.tv_sec;
  (void)localtime_r(&secs, &tm_buf);
  (void)std::snprintf(buf, size, "%04d-%02d-%02d %02d:%02d:%02d.%03d", tm_buf.tm_year + 1900,
                      tm_buf.tm_mon + 1, tm_buf.tm_mday, tm_buf.tm_hour, tm_buf.tm_min,
                      tm_buf.tm_sec, static_cast<int>(tv.tv_usec / 1000));
#else
  (void)std::snprintf(buf, size, "%llu", static_cast<unsigned long long>(SteadyNowMs()));
#endif
}

inline int ProcessId() noexcept {
#if defined(FARM_PLATFORM_POSIX)
  return static_cast<int>(::getpid());
#else
  return 0;
#endif
}

}  // namespace detail

// ============================================================================
// Runtime control
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept { return detail::LogLevelRef().load(std::memory_order_relaxed); }

/**
 * @brief Parse a level name ("debug", "info", "warn", "error", "fatal", "off").
 * @return true on success; @p out is untouched otherwise.
 */
inline bool ParseLevel(const char* name, Level& out) noexcept {
  struct NamedLevel {
    const char* name;
    Level level;
  };
  static const NamedLevel kLevels[] = {
      {"debug", Level::kDebug}, {"info", Level::kInfo},   {"warn", Level::kWarn},
      {"error", Level::kError}, {"fatal", Level::kFatal}, {"off", Level::kOff},
  };
  if (name == nullptr) return false;
  for (const auto& n : kLevels) {
    if (std::strcmp(name, n.name) == 0) {
      out = n.level;
      return true;
    }
  }
  return false;
}

/// @brief Mark the logger ready. Output works without it; Init() makes stderr unbuffered.
inline void Init() noexcept {
  (void)std::setvbuf(stderr, nullptr, _IONBF, 0);
  detail::InitializedRef().store(true, std::memory_order_release);
}

inline void Shutdown() noexcept {
  (void)std::fflush(stderr);
  detail::InitializedRef().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitializedRef().load(std::memory_order_acquire);
}

// ============================================================================
// Write path
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file, int line,
                       const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(GetLevel())) {
    if (level == Level::kFatal) {
      std::abort();
    }
    return;
  }

  char msg[512];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);
  char ts[40];
  detail::FormatTimestamp(ts, sizeof(ts));

  {
    std::lock_guard<std::mutex> lk(detail::WriteMutex());
#ifdef NDEBUG
    (void)file;
    (void)line;
    (void)std::fprintf(stderr, "[%s] [%s] [%s] %d | %s\n", ts, detail::LevelTag(level), category,
                       detail::ProcessId(), msg);
#else
    (void)std::fprintf(stderr, "[%s] [%s] [%s] %d | %s (%s:%d)\n", ts, detail::LevelTag(level),
                       category, detail::ProcessId(), msg, detail::Basename(file), line);
#endif
  }

  if (level == Level::kFatal) {
    (void)std::fflush(stderr);
    std::abort();
  }
}

#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 5, 6)))
#endif
inline void LogWrite(Level level, const char* category, const char* file, int line,
                     const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace farm

// ============================================================================
// Macros
// ============================================================================

#define FARM_LOG_DEBUG(cat, fmt, ...)                                                    \
  do {                                                                                   \
    if (FARM_LOG_MIN_LEVEL <= 0) {                                                       \
      ::farm::log::LogWrite(::farm::log::Level::kDebug, cat, __FILE__, __LINE__, fmt,   \
                            ##__VA_ARGS__);                                              \
    }                                                                                    \
  } while (0)

#define FARM_LOG_INFO(cat, fmt, ...)                                                     \
  do {                                                                                   \
    if (FARM_LOG_MIN_LEVEL <= 1) {                                                       \
      ::farm::log::LogWrite(::farm::log::Level::kInfo, cat, __FILE__, __LINE__, fmt,    \
                            ##__VA_ARGS__);                                              \
    }                                                                                    \
  } while (0)

#define FARM_LOG_WARN(cat, fmt, ...)                                                     \
  do {                                                                                   \
    if (FARM_LOG_MIN_LEVEL <= 2) {                                                       \
      ::farm::log::LogWrite(::farm::log::Level::kWarn, cat, __FILE__, __LINE__, fmt,    \
                            ##__VA_ARGS__);                                              \
    }                                                                                    \
  } while (0)

#define FARM_LOG_ERROR(cat, fmt, ...)                                                    \
  do {                                                                                   \
    if (FARM_LOG_MIN_LEVEL <= 3) {                                                       \
      ::farm::log::LogWrite(::farm::log::Level::kError, cat, __FILE__, __LINE__, fmt,   \
                            ##__VA_ARGS__);                                              \
    }                                                                                    \
  } while (0)

#define FARM_LOG_FATAL(cat, fmt, ...)                                                    \
  do {                                                                                   \
    ::farm::log::LogWrite(::farm::log::Level::kFatal, cat, __FILE__, __LINE__, fmt,     \
                          ##__VA_ARGS__);                                                \
  } while (0)

#endif  // FARM_LOG_HPP_
