#ifndef WARDEN_HELPERS_QUERY_STATUS_HPP
#define WARDEN_HELPERS_QUERY_STATUS_HPP
/**
 * @file QueryStatus.hpp
 * @brief Result status shared by the external data-source queries.
 *
 * A query either succeeds (possibly with zero rows) or fails with a reason.
 * Emptiness is never used to signal failure.
 */

#include "src/helpers/inc/Exec.hpp"

#include <cstdint>

namespace warden {
namespace helpers {

/// Outcome of a device or scheduler query.
enum class QueryStatus : std::uint8_t {
  OK = 0,      ///< Rows are complete and trustworthy (may be empty)
  UNAVAILABLE, ///< Source unreachable, not installed, or exited non-zero
  TIMEOUT,     ///< Source did not answer within the deadline
  MALFORMED,   ///< Source answered but output could not be parsed
};

/**
 * @brief Convert QueryStatus to a stable lowercase string.
 * @param status Status value.
 * @return Static string.
 */
[[nodiscard]] constexpr const char* toString(QueryStatus status) noexcept {
  switch (status) {
  case QueryStatus::OK:
    return "ok";
  case QueryStatus::UNAVAILABLE:
    return "unavailable";
  case QueryStatus::TIMEOUT:
    return "timeout";
  case QueryStatus::MALFORMED:
    return "malformed";
  }
  return "unknown";
}

/**
 * @brief Map a failed command run to a query status.
 * @param result Command result that did not succeed.
 * @return TIMEOUT for timeouts, otherwise UNAVAILABLE.
 */
[[nodiscard]] inline QueryStatus statusFromExec(const exec::ExecResult& result) noexcept {
  if (result.status == exec::ExecStatus::TIMED_OUT) {
    return QueryStatus::TIMEOUT;
  }
  return result.succeeded() ? QueryStatus::OK : QueryStatus::UNAVAILABLE;
}

} // namespace helpers
} // namespace warden

#endif // WARDEN_HELPERS_QUERY_STATUS_HPP
