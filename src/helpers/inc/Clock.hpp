#ifndef WARDEN_HELPERS_CLOCK_HPP
#define WARDEN_HELPERS_CLOCK_HPP
/**
 * @file Clock.hpp
 * @brief Monotonic and wall-clock timestamps.
 *
 * Monotonic time measures waits and timeouts; wall-clock time stamps audit
 * records and inventory observations.
 */

#include <cstdint>
#include <ctime> // clock_gettime, gmtime_r, strftime
#include <string>

#include <fmt/core.h>

namespace warden {
namespace helpers {
namespace clock {

/* ----------------------------- API ----------------------------- */

/**
 * @brief Get monotonic timestamp in nanoseconds.
 *
 * Uses CLOCK_MONOTONIC for consistent, non-decreasing time measurements
 * unaffected by system clock adjustments.
 *
 * @return Current monotonic time in nanoseconds.
 */
[[nodiscard]] inline std::uint64_t getMonotonicNs() noexcept {
  struct timespec ts{};
  ::clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<std::uint64_t>(ts.tv_sec) * 1'000'000'000ULL +
         static_cast<std::uint64_t>(ts.tv_nsec);
}

/**
 * @brief Get wall-clock time in milliseconds since the Unix epoch.
 * @return Current CLOCK_REALTIME in milliseconds.
 */
[[nodiscard]] inline std::uint64_t getRealtimeMs() noexcept {
  struct timespec ts{};
  ::clock_gettime(CLOCK_REALTIME, &ts);
  return static_cast<std::uint64_t>(ts.tv_sec) * 1000ULL +
         static_cast<std::uint64_t>(ts.tv_nsec) / 1'000'000ULL;
}

/**
 * @brief Format epoch milliseconds as UTC ISO-8601 ("2024-05-01T12:00:00.123Z").
 * @param epochMs Milliseconds since the Unix epoch.
 * @return Formatted timestamp.
 */
[[nodiscard]] inline std::string formatIso8601Ms(std::uint64_t epochMs) {
  const std::time_t SECS = static_cast<std::time_t>(epochMs / 1000ULL);
  std::tm tm{};
  ::gmtime_r(&SECS, &tm);
  char buf[32];
  const std::size_t LEN = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  return fmt::format("{}.{:03}Z", std::string(buf, LEN), epochMs % 1000ULL);
}

} // namespace clock
} // namespace helpers
} // namespace warden

#endif // WARDEN_HELPERS_CLOCK_HPP
