#ifndef WARDEN_HELPERS_LOG_HPP
#define WARDEN_HELPERS_LOG_HPP
/**
 * @file Log.hpp
 * @brief Leveled diagnostic logging to stderr via fmt.
 *
 * One line per message:
 *   2024-05-01T12:00:00.123Z WARN  [cycle] device query failed: timeout
 *
 * Diagnostics go to stderr so that stdout carries only the per-cycle summary
 * the polling driver captures. The audit trail is separate (see audit/AuditLog).
 *
 * @note Single-threaded use; the threshold is a plain process-wide variable.
 */

#include "src/helpers/inc/Clock.hpp"

#include <cstdint>
#include <cstdio>
#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace warden {
namespace helpers {
namespace log {

/* ----------------------------- Types ----------------------------- */

/// Message severity, lowest first.
enum class Level : std::uint8_t {
  DEBUG = 0,
  INFO,
  WARN,
  ERROR,
  CRITICAL,
};

/**
 * @brief Fixed-width level name.
 * @param level Severity.
 * @return Static string.
 */
[[nodiscard]] constexpr const char* levelName(Level level) noexcept {
  switch (level) {
  case Level::DEBUG:
    return "DEBUG";
  case Level::INFO:
    return "INFO ";
  case Level::WARN:
    return "WARN ";
  case Level::ERROR:
    return "ERROR";
  case Level::CRITICAL:
    return "CRIT ";
  }
  return "?????";
}

/* ----------------------------- Threshold ----------------------------- */

namespace detail {
inline Level& threshold() noexcept {
  static Level level = Level::INFO;
  return level;
}
} // namespace detail

/// Set the minimum level that is emitted.
inline void setLevel(Level level) noexcept { detail::threshold() = level; }

/// Current minimum level.
[[nodiscard]] inline Level level() noexcept { return detail::threshold(); }

/// True if a message at this level would be emitted.
[[nodiscard]] inline bool enabled(Level lvl) noexcept { return lvl >= detail::threshold(); }

/* ----------------------------- API ----------------------------- */

/**
 * @brief Emit a formatted message.
 * @param lvl Severity.
 * @param component Short subsystem tag ("gpu", "cycle", ...).
 * @param fmtStr fmt format string.
 * @param args Format arguments.
 */
template <typename... Args>
inline void write(Level lvl, std::string_view component, fmt::format_string<Args...> fmtStr,
                  Args&&... args) {
  if (!enabled(lvl)) {
    return;
  }
  fmt::print(stderr, "{} {} [{}] {}\n", clock::formatIso8601Ms(clock::getRealtimeMs()),
             levelName(lvl), component, fmt::format(fmtStr, std::forward<Args>(args)...));
  std::fflush(stderr);
}

template <typename... Args>
inline void debug(std::string_view component, fmt::format_string<Args...> fmtStr,
                  Args&&... args) {
  write(Level::DEBUG, component, fmtStr, std::forward<Args>(args)...);
}

template <typename... Args>
inline void info(std::string_view component, fmt::format_string<Args...> fmtStr,
                 Args&&... args) {
  write(Level::INFO, component, fmtStr, std::forward<Args>(args)...);
}

template <typename... Args>
inline void warn(std::string_view component, fmt::format_string<Args...> fmtStr,
                 Args&&... args) {
  write(Level::WARN, component, fmtStr, std::forward<Args>(args)...);
}

template <typename... Args>
inline void error(std::string_view component, fmt::format_string<Args...> fmtStr,
                  Args&&... args) {
  write(Level::ERROR, component, fmtStr, std::forward<Args>(args)...);
}

template <typename... Args>
inline void critical(std::string_view component, fmt::format_string<Args...> fmtStr,
                     Args&&... args) {
  write(Level::CRITICAL, component, fmtStr, std::forward<Args>(args)...);
}

} // namespace log
} // namespace helpers
} // namespace warden

#endif // WARDEN_HELPERS_LOG_HPP
