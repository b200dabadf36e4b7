#ifndef WARDEN_HELPERS_EXEC_HPP
#define WARDEN_HELPERS_EXEC_HPP
/**
 * @file Exec.hpp
 * @brief Run an external command with a deadline and capture its output.
 *
 * fork/execvp with stdout and stderr on pipes, drained with poll(2) until the
 * child closes both, then reaped without blocking until the same deadline.
 * On timeout the child is sent SIGKILL and reaped, so no zombie outlives the call.
 *
 * @note Blocking. Used only for the device and scheduler queries and the
 *       privileged signal sender, each bounded by a configured timeout.
 */

#include "src/helpers/inc/Clock.hpp"

#include <fcntl.h>    // pipe2, O_CLOEXEC
#include <poll.h>     // poll
#include <signal.h>   // kill, SIGKILL
#include <sys/wait.h> // waitpid
#include <unistd.h>   // fork, execvp, dup2, _exit

#include <array>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring> // strerror
#include <string>
#include <vector>

namespace warden {
namespace helpers {
namespace exec {

/* ----------------------------- Types ----------------------------- */

/// How the child run ended.
enum class ExecStatus : std::uint8_t {
  EXITED = 0,   ///< Child exited on its own; see exitCode
  SIGNALED,     ///< Child was killed by a signal it did not receive from us
  TIMED_OUT,    ///< Deadline passed; child was killed
  START_FAILED, ///< pipe/fork/exec failed (exitCode 127 means exec failure)
};

/// Captured result of a command run.
struct ExecResult {
  ExecStatus status{ExecStatus::START_FAILED};
  int exitCode{-1}; ///< Exit status when EXITED, else -1
  std::string out;  ///< Captured stdout
  std::string err;  ///< Captured stderr

  /// True if the child exited with status 0.
  [[nodiscard]] bool succeeded() const noexcept {
    return status == ExecStatus::EXITED && exitCode == 0;
  }
};

/// Upper bound on captured output per stream.
inline constexpr std::size_t EXEC_MAX_CAPTURE_BYTES = 8U << 20;

/// Interval between reap attempts once the child's output has closed.
inline constexpr std::uint64_t EXEC_REAP_POLL_MS = 10;

/// Exit code the child uses when execvp fails.
inline constexpr int EXEC_FAILED_EXIT_CODE = 127;

/* ----------------------------- Internals ----------------------------- */

namespace detail {

inline void closeFd(int& fd) noexcept {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

/// Read what is available on fd into sink; closes fd on EOF/error.
inline void drain(int& fd, std::string& sink) {
  std::array<char, 4096> buf{};
  const ssize_t N = ::read(fd, buf.data(), buf.size());
  if (N > 0) {
    if (sink.size() < EXEC_MAX_CAPTURE_BYTES) {
      sink.append(buf.data(), static_cast<std::size_t>(N));
    }
    return;
  }
  if (N < 0 && (errno == EINTR || errno == EAGAIN)) {
    return;
  }
  closeFd(fd);
}

} // namespace detail

/* ----------------------------- API ----------------------------- */

/**
 * @brief Run argv[0] (PATH lookup) with a deadline.
 * @param argv Program and arguments; must be non-empty.
 * @param timeout Wall-time budget for the whole run.
 * @return Captured result; never throws on process failures.
 */
[[nodiscard]] inline ExecResult runCommand(const std::vector<std::string>& argv,
                                           std::chrono::milliseconds timeout) {
  ExecResult result{};
  if (argv.empty()) {
    result.err = "empty command";
    return result;
  }

  int outPipe[2] = {-1, -1};
  int errPipe[2] = {-1, -1};
  if (::pipe2(outPipe, O_CLOEXEC) != 0) {
    result.err = std::strerror(errno);
    return result;
  }
  if (::pipe2(errPipe, O_CLOEXEC) != 0) {
    result.err = std::strerror(errno);
    detail::closeFd(outPipe[0]);
    detail::closeFd(outPipe[1]);
    return result;
  }

  // Build argv before fork; only async-signal-safe calls run in the child.
  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const std::string& ARG : argv) {
    cargv.push_back(const_cast<char*>(ARG.c_str()));
  }
  cargv.push_back(nullptr);

  const pid_t CHILD = ::fork();
  if (CHILD < 0) {
    result.err = std::strerror(errno);
    detail::closeFd(outPipe[0]);
    detail::closeFd(outPipe[1]);
    detail::closeFd(errPipe[0]);
    detail::closeFd(errPipe[1]);
    return result;
  }

  if (CHILD == 0) {
    ::dup2(outPipe[1], STDOUT_FILENO);
    ::dup2(errPipe[1], STDERR_FILENO);
    const int DEV_NULL = ::open("/dev/null", O_RDONLY);
    if (DEV_NULL >= 0) {
      ::dup2(DEV_NULL, STDIN_FILENO);
    }
    ::execvp(cargv[0], cargv.data());
    _exit(EXEC_FAILED_EXIT_CODE);
  }

  detail::closeFd(outPipe[1]);
  detail::closeFd(errPipe[1]);

  const std::uint64_t DEADLINE_NS =
      clock::getMonotonicNs() +
      static_cast<std::uint64_t>(timeout.count() < 0 ? 0 : timeout.count()) * 1'000'000ULL;

  bool timedOut = false;
  while (outPipe[0] >= 0 || errPipe[0] >= 0) {
    const std::uint64_t NOW = clock::getMonotonicNs();
    if (NOW >= DEADLINE_NS) {
      timedOut = true;
      break;
    }
    const int WAIT_MS = static_cast<int>((DEADLINE_NS - NOW + 999'999ULL) / 1'000'000ULL);

    std::array<pollfd, 2> fds{};
    nfds_t n = 0;
    if (outPipe[0] >= 0) {
      fds[n++] = pollfd{outPipe[0], POLLIN, 0};
    }
    if (errPipe[0] >= 0) {
      fds[n++] = pollfd{errPipe[0], POLLIN, 0};
    }

    const int READY = ::poll(fds.data(), n, WAIT_MS);
    if (READY < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    for (nfds_t i = 0; i < n; ++i) {
      if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
        continue;
      }
      if (fds[i].fd == outPipe[0]) {
        detail::drain(outPipe[0], result.out);
      } else if (fds[i].fd == errPipe[0]) {
        detail::drain(errPipe[0], result.err);
      }
    }
  }

  detail::closeFd(outPipe[0]);
  detail::closeFd(errPipe[0]);

  // Output may close long before the child exits; the deadline still binds.
  int wstatus = 0;
  pid_t waited = 0;
  while (!timedOut) {
    waited = ::waitpid(CHILD, &wstatus, WNOHANG);
    if (waited < 0 && errno == EINTR) {
      continue;
    }
    if (waited != 0) {
      break;
    }
    const std::uint64_t NOW = clock::getMonotonicNs();
    if (NOW >= DEADLINE_NS) {
      timedOut = true;
      break;
    }
    const std::uint64_t LEFT_MS = (DEADLINE_NS - NOW + 999'999ULL) / 1'000'000ULL;
    ::poll(nullptr, 0, static_cast<int>(LEFT_MS < EXEC_REAP_POLL_MS ? LEFT_MS : EXEC_REAP_POLL_MS));
  }

  if (timedOut) {
    ::kill(CHILD, SIGKILL);
    do {
      waited = ::waitpid(CHILD, &wstatus, 0);
    } while (waited < 0 && errno == EINTR);
  }

  if (timedOut) {
    result.status = ExecStatus::TIMED_OUT;
    return result;
  }
  if (waited < 0) {
    result.status = ExecStatus::START_FAILED;
    return result;
  }
  if (WIFEXITED(wstatus)) {
    result.exitCode = WEXITSTATUS(wstatus);
    result.status = (result.exitCode == EXEC_FAILED_EXIT_CODE) ? ExecStatus::START_FAILED
                                                               : ExecStatus::EXITED;
    return result;
  }
  result.status = ExecStatus::SIGNALED;
  return result;
}

} // namespace exec
} // namespace helpers
} // namespace warden

#endif // WARDEN_HELPERS_EXEC_HPP
