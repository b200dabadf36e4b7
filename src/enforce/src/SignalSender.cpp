/**
 * @file SignalSender.cpp
 * @brief kill(2), sudo and dry-run signal senders.
 */

#include "src/enforce/inc/SignalSender.hpp"
#include "src/helpers/inc/Exec.hpp"
#include "src/helpers/inc/Log.hpp"

#include <signal.h> // kill

#include <cerrno>
#include <utility> // std::move

#include <fmt/core.h>

namespace warden {

namespace enforce {

namespace {

namespace exec = helpers::exec;

/// Map kill(2) return + errno onto a SignalResult.
SignalResult fromKillErrno(int rc, int err) noexcept {
  if (rc == 0) {
    return SignalResult::SUCCESS;
  }
  switch (err) {
  case ESRCH:
    return SignalResult::NO_SUCH_PROCESS;
  case EPERM:
    return SignalResult::PERMISSION_DENIED;
  default:
    return SignalResult::FAILED;
  }
}

bool contains(std::string_view haystack, std::string_view needle) noexcept {
  return haystack.find(needle) != std::string_view::npos;
}

} // namespace

/* ----------------------------- Names ----------------------------- */

const char* toString(SignalResult result) noexcept {
  switch (result) {
  case SignalResult::SUCCESS:
    return "success";
  case SignalResult::NO_SUCH_PROCESS:
    return "no-such-process";
  case SignalResult::PERMISSION_DENIED:
    return "permission-denied";
  case SignalResult::FAILED:
    return "failed";
  default:
    return "unknown";
  }
}

std::string signalName(int sig) {
  switch (sig) {
  case SIGTERM:
    return "SIGTERM";
  case SIGKILL:
    return "SIGKILL";
  case SIGINT:
    return "SIGINT";
  case 0:
    return "none";
  default:
    return fmt::format("SIG{}", sig);
  }
}

SignalResult classifyKillError(std::string_view err) noexcept {
  if (contains(err, "No such process")) {
    return SignalResult::NO_SUCH_PROCESS;
  }
  if (contains(err, "not permitted") || contains(err, "password is required") ||
      contains(err, "not in the sudoers") || contains(err, "not allowed to execute")) {
    return SignalResult::PERMISSION_DENIED;
  }
  return SignalResult::FAILED;
}

/* ----------------------------- DirectSignalSender ----------------------------- */

SignalResult DirectSignalSender::send(std::int32_t pid, int sig) {
  if (pid <= 1) {
    return SignalResult::FAILED;
  }
  const int RC = ::kill(static_cast<pid_t>(pid), sig);
  return fromKillErrno(RC, errno);
}

bool DirectSignalSender::isAlive(std::int32_t pid) {
  if (pid <= 0) {
    return false;
  }
  // EPERM still proves existence.
  return ::kill(static_cast<pid_t>(pid), 0) == 0 || errno == EPERM;
}

/* ----------------------------- SudoSignalSender ----------------------------- */

SudoSignalSender::SudoSignalSender(std::chrono::milliseconds timeout, std::string sudoPath,
                                   std::string killPath)
    : timeout_(timeout), sudoPath_(std::move(sudoPath)), killPath_(std::move(killPath)) {}

SignalResult SudoSignalSender::send(std::int32_t pid, int sig) {
  if (pid <= 1) {
    return SignalResult::FAILED;
  }
  const exec::ExecResult RES = exec::runCommand(
      {sudoPath_, "-n", killPath_, fmt::format("-{}", sig), fmt::format("{}", pid)}, timeout_);
  if (RES.succeeded()) {
    return SignalResult::SUCCESS;
  }
  if (RES.status == exec::ExecStatus::EXITED) {
    const SignalResult CLASSIFIED = classifyKillError(RES.err);
    if (CLASSIFIED == SignalResult::FAILED) {
      helpers::log::debug("enforce", "sudo kill -{} {} exited {}: {}", sig, pid, RES.exitCode,
                          RES.err);
    }
    return CLASSIFIED;
  }
  return SignalResult::FAILED;
}

bool SudoSignalSender::isAlive(std::int32_t pid) {
  if (pid <= 0) {
    return false;
  }
  return ::kill(static_cast<pid_t>(pid), 0) == 0 || errno == EPERM;
}

/* ----------------------------- DryRunSignalSender ----------------------------- */

SignalResult DryRunSignalSender::send(std::int32_t pid, int sig) {
  requests_.emplace_back(pid, sig);
  return SignalResult::SUCCESS;
}

bool DryRunSignalSender::isAlive(std::int32_t pid) {
  if (pid <= 0) {
    return false;
  }
  return ::kill(static_cast<pid_t>(pid), 0) == 0 || errno == EPERM;
}

} // namespace enforce

} // namespace warden
