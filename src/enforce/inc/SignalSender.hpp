#ifndef WARDEN_ENFORCE_SIGNAL_SENDER_HPP
#define WARDEN_ENFORCE_SIGNAL_SENDER_HPP
/**
 * @file SignalSender.hpp
 * @brief Process control: the privilege boundary for sending signals.
 * @note Linux-only.
 *
 * Senders never retry. Mapping a result onto an enforcement outcome is the
 * Enforcer's job.
 */

#include <chrono>  // std::chrono::milliseconds
#include <cstdint> // std::int32_t, std::uint8_t
#include <string>
#include <string_view>
#include <utility> // std::pair
#include <vector>

namespace warden {

namespace enforce {

/* ----------------------------- Types ----------------------------- */

/// Result of one signal delivery attempt.
enum class SignalResult : std::uint8_t {
  SUCCESS = 0,       ///< Signal delivered
  NO_SUCH_PROCESS,   ///< Target does not exist (ESRCH)
  PERMISSION_DENIED, ///< Caller lacks privilege (EPERM, sudo refused)
  FAILED,            ///< Any other failure
};

/**
 * @brief Convert SignalResult to string.
 * @param result Result value.
 * @return Static string.
 */
[[nodiscard]] const char* toString(SignalResult result) noexcept;

/**
 * @brief Short signal name ("SIGTERM", "SIGKILL", or "SIG<n>").
 * @param sig Signal number.
 * @return Name string.
 */
[[nodiscard]] std::string signalName(int sig);

/* ----------------------------- SignalSender ----------------------------- */

/**
 * @brief Sends signals to host PIDs.
 */
class SignalSender {
public:
  virtual ~SignalSender() = default;

  /// Deliver sig to pid.
  [[nodiscard]] virtual SignalResult send(std::int32_t pid, int sig) = 0;

  /// True if pid currently exists (signal 0 semantics).
  [[nodiscard]] virtual bool isAlive(std::int32_t pid) = 0;

  /// True if no signal ever reaches a process.
  [[nodiscard]] virtual bool isDryRun() const noexcept { return false; }

  /// Backend name for diagnostics.
  [[nodiscard]] virtual const char* name() const noexcept = 0;
};

/**
 * @brief Signals via kill(2). Requires CAP_KILL or matching credentials.
 */
class DirectSignalSender final : public SignalSender {
public:
  [[nodiscard]] SignalResult send(std::int32_t pid, int sig) override;
  [[nodiscard]] bool isAlive(std::int32_t pid) override;
  [[nodiscard]] const char* name() const noexcept override { return "direct"; }
};

/**
 * @brief Signals via `sudo -n kill -<SIG> <pid>`.
 *
 * Non-interactive: a password prompt is reported as PERMISSION_DENIED.
 */
class SudoSignalSender final : public SignalSender {
public:
  explicit SudoSignalSender(std::chrono::milliseconds timeout, std::string sudoPath = "sudo",
                            std::string killPath = "kill");

  [[nodiscard]] SignalResult send(std::int32_t pid, int sig) override;
  [[nodiscard]] bool isAlive(std::int32_t pid) override;
  [[nodiscard]] const char* name() const noexcept override { return "sudo"; }

private:
  std::chrono::milliseconds timeout_;
  std::string sudoPath_;
  std::string killPath_;
};

/**
 * @brief Records requests and sends nothing.
 *
 * send() reports SUCCESS; isAlive() answers through kill(pid, 0), which needs
 * no privilege to detect existence.
 */
class DryRunSignalSender final : public SignalSender {
public:
  [[nodiscard]] SignalResult send(std::int32_t pid, int sig) override;
  [[nodiscard]] bool isAlive(std::int32_t pid) override;
  [[nodiscard]] bool isDryRun() const noexcept override { return true; }
  [[nodiscard]] const char* name() const noexcept override { return "dry-run"; }

  /// (pid, signal) pairs requested so far.
  [[nodiscard]] const std::vector<std::pair<std::int32_t, int>>& requests() const noexcept {
    return requests_;
  }

private:
  std::vector<std::pair<std::int32_t, int>> requests_;
};

/* ----------------------------- Helpers ----------------------------- */

/**
 * @brief Classify the stderr of a failed `kill` / `sudo kill` run.
 * @param err Captured stderr.
 * @return NO_SUCH_PROCESS, PERMISSION_DENIED, or FAILED.
 */
[[nodiscard]] SignalResult classifyKillError(std::string_view err) noexcept;

} // namespace enforce

} // namespace warden

#endif // WARDEN_ENFORCE_SIGNAL_SENDER_HPP
