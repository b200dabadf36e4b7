#ifndef WARDEN_ENFORCE_ENFORCER_HPP
#define WARDEN_ENFORCE_ENFORCER_HPP
/**
 * @file Enforcer.hpp
 * @brief Graceful-then-forceful termination of one unauthorized GPU process.
 * @note Linux-only.
 *
 * Escalation per PID:
 *   1. SIGTERM
 *   2. Poll until the PID no longer holds any GPU, up to termWait
 *   3. SIGKILL if it still does
 *
 * The hold check re-queries the device inventory; when that query fails the
 * check falls back to process liveness. A FAILED outcome is never retried
 * within the same cycle.
 */

#include "src/enforce/inc/SignalSender.hpp"
#include "src/gpu/inc/DeviceInventory.hpp"

#include <chrono>  // std::chrono::milliseconds
#include <cstdint> // std::int32_t, std::uint64_t, std::uint8_t
#include <string>

namespace warden {

namespace enforce {

/* ----------------------------- Constants ----------------------------- */

/// Default SIGTERM -> SIGKILL grace window.
inline constexpr std::chrono::milliseconds DEFAULT_TERM_WAIT{5000};

/// Default interval between hold checks during the window.
inline constexpr std::chrono::milliseconds DEFAULT_POLL_INTERVAL{250};

/* ----------------------------- Types ----------------------------- */

/// Final status of one enforcement.
enum class OutcomeStatus : std::uint8_t {
  SUCCEEDED = 0,        ///< Process released its GPU (or was killed)
  FAILED,               ///< Signal could not be delivered
  PROCESS_ALREADY_GONE, ///< Process exited before the first signal
};

/**
 * @brief Convert OutcomeStatus to string.
 * @param status Status value.
 * @return Static string.
 */
[[nodiscard]] const char* toString(OutcomeStatus status) noexcept;

/**
 * @brief Result of acting on one confirmed UNAUTHORIZED decision.
 */
struct EnforcementOutcome {
  std::int32_t pid{0};
  int deviceId{-1};
  int signalSent{0}; ///< Last signal attempted (0 if none)
  OutcomeStatus status{OutcomeStatus::FAILED};
  std::uint64_t timestampMs{0}; ///< Wall clock when the action finished
  bool escalated{false};        ///< SIGKILL was attempted
  bool dryRun{false};           ///< No signal actually left the process
  std::string detail;

  /// FAILED is the only status counted as an enforcement failure.
  [[nodiscard]] bool failed() const noexcept { return status == OutcomeStatus::FAILED; }

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/// Escalation timing.
struct EnforcerConfig {
  std::chrono::milliseconds termWait{DEFAULT_TERM_WAIT};
  std::chrono::milliseconds pollInterval{DEFAULT_POLL_INTERVAL};
};

/* ----------------------------- Enforcer ----------------------------- */

/**
 * @brief Applies the escalation sequence through a SignalSender.
 *
 * Holds references; sender and device query must outlive the Enforcer.
 */
class Enforcer {
public:
  Enforcer(SignalSender& sender, gpu::DeviceQuery& devices, EnforcerConfig config = {}) noexcept;

  /**
   * @brief Terminate pid, escalating to SIGKILL if it keeps a GPU.
   * @param pid Host PID of a confirmed UNAUTHORIZED process.
   * @param deviceId Device recorded on the outcome.
   * @return Outcome; blocks for at most termWait plus two signal deliveries.
   */
  [[nodiscard]] EnforcementOutcome enforce(std::int32_t pid, int deviceId);

  [[nodiscard]] const EnforcerConfig& config() const noexcept { return config_; }

private:
  /// True if pid still appears on any GPU (or is alive, when the query fails).
  [[nodiscard]] bool stillHoldsDevice(std::int32_t pid);

  SignalSender& sender_;
  gpu::DeviceQuery& devices_;
  EnforcerConfig config_;
};

} // namespace enforce

} // namespace warden

#endif // WARDEN_ENFORCE_ENFORCER_HPP
