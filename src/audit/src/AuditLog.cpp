/**
 * @file AuditLog.cpp
 * @brief JSON Lines audit trail with per-record fsync.
 */

#include "src/audit/inc/AuditLog.hpp"
#include "src/helpers/inc/Format.hpp"

#include <fcntl.h>  // open, O_*
#include <unistd.h> // write, fsync, close, lseek, pread

#include <algorithm> // std::max
#include <cerrno>
#include <cstring> // std::strerror
#include <utility> // std::move

#include <fmt/core.h>

namespace warden {

namespace audit {

namespace {

constexpr std::string_view CYCLE_KEY = "\"cycle\":";

const char* boolText(bool value) noexcept { return value ? "true" : "false"; }

/// Read up to maxBytes from the end of path.
std::string readTail(const std::string& path, std::size_t maxBytes) {
  std::string out;
  const int FD = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    return out;
  }
  const off_t SIZE = ::lseek(FD, 0, SEEK_END);
  if (SIZE > 0) {
    const off_t START = SIZE > static_cast<off_t>(maxBytes) ? SIZE - static_cast<off_t>(maxBytes) : 0;
    out.resize(static_cast<std::size_t>(SIZE - START));
    std::size_t got = 0;
    while (got < out.size()) {
      const ssize_t N = ::pread(FD, out.data() + got, out.size() - got,
                                START + static_cast<off_t>(got));
      if (N < 0 && errno == EINTR) {
        continue;
      }
      if (N <= 0) {
        break;
      }
      got += static_cast<std::size_t>(N);
    }
    out.resize(got);
  }
  ::close(FD);
  return out;
}

} // namespace

/* ----------------------------- Records ----------------------------- */

std::string formatDecisionRecord(std::uint64_t cycleId, std::uint64_t timestampMs,
                                 const policy::Decision& decision) {
  namespace fmtx = helpers::format;
  std::string out;
  out.reserve(256 + decision.command.size());
  out += fmt::format("{{\"kind\":\"decision\",\"cycle\":{},\"ts_ms\":{},\"pid\":{},\"device\":{},"
                     "\"memory_bytes\":{},\"verdict\":\"{}\",\"job\":",
                     cycleId, timestampMs, decision.pid, decision.deviceId, decision.memoryBytes,
                     policy::toString(decision.verdict));
  if (decision.jobId) {
    fmtx::appendJsonString(out, *decision.jobId);
  } else {
    out += "null";
  }
  out += ",\"reason\":";
  fmtx::appendJsonString(out, decision.reason);
  out += fmt::format(",\"confirmed\":{},\"command\":", boolText(decision.confirmed));
  fmtx::appendJsonString(out, decision.command);
  out += ",\"owner\":";
  if (decision.owner.empty()) {
    out += "null";
  } else {
    fmtx::appendJsonString(out, decision.owner);
  }
  out += '}';
  return out;
}

std::string formatOutcomeRecord(std::uint64_t cycleId,
                                const enforce::EnforcementOutcome& outcome) {
  std::string out = fmt::format(
      "{{\"kind\":\"outcome\",\"cycle\":{},\"ts_ms\":{},\"pid\":{},\"device\":{},"
      "\"signal\":\"{}\",\"status\":\"{}\",\"escalated\":{},\"dry_run\":{},\"detail\":",
      cycleId, outcome.timestampMs, outcome.pid, outcome.deviceId,
      enforce::signalName(outcome.signalSent), enforce::toString(outcome.status),
      boolText(outcome.escalated), boolText(outcome.dryRun));
  helpers::format::appendJsonString(out, outcome.detail);
  out += '}';
  return out;
}

std::uint64_t recoverLastCycleId(std::string_view text) noexcept {
  std::uint64_t best = 0;
  std::size_t pos = text.find(CYCLE_KEY);
  while (pos != std::string_view::npos) {
    std::size_t i = pos + CYCLE_KEY.size();
    std::uint64_t value = 0;
    bool any = false;
    while (i < text.size() && text[i] >= '0' && text[i] <= '9') {
      value = value * 10 + static_cast<std::uint64_t>(text[i] - '0');
      any = true;
      ++i;
    }
    // A number cut off by the end of the chunk is ignored.
    if (any && i < text.size()) {
      best = std::max(best, value);
    }
    pos = text.find(CYCLE_KEY, i);
  }
  return best;
}

/* ----------------------------- FileAuditLog ----------------------------- */

FileAuditLog::FileAuditLog(std::string path) : path_(std::move(path)) {}

FileAuditLog::~FileAuditLog() {
  if (fd_ >= 0) {
    ::fsync(fd_);
    ::close(fd_);
  }
}

bool FileAuditLog::open() {
  if (fd_ >= 0) {
    return true;
  }
  fd_ = ::open(path_.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0640);
  if (fd_ < 0) {
    lastError_ = fmt::format("open {}: {}", path_, std::strerror(errno));
    return false;
  }
  lastCycleId_ = recoverLastCycleId(readTail(path_, CYCLE_RECOVERY_TAIL_BYTES));
  return true;
}

bool FileAuditLog::append(std::string_view record) {
  if (fd_ < 0) {
    lastError_ = fmt::format("{} is not open", path_);
    return false;
  }

  std::string line;
  line.reserve(record.size() + 1);
  line.append(record);
  line += '\n';

  // O_APPEND positions each write at end-of-file; one write per record.
  std::size_t done = 0;
  while (done < line.size()) {
    const ssize_t N = ::write(fd_, line.data() + done, line.size() - done);
    if (N < 0) {
      if (errno == EINTR) {
        continue;
      }
      lastError_ = fmt::format("write {}: {}", path_, std::strerror(errno));
      return false;
    }
    done += static_cast<std::size_t>(N);
  }

  if (::fsync(fd_) != 0) {
    lastError_ = fmt::format("fsync {}: {}", path_, std::strerror(errno));
    return false;
  }
  return true;
}

bool FileAuditLog::flush() {
  if (fd_ < 0) {
    lastError_ = fmt::format("{} is not open", path_);
    return false;
  }
  if (::fsync(fd_) != 0) {
    lastError_ = fmt::format("fsync {}: {}", path_, std::strerror(errno));
    return false;
  }
  return true;
}

} // namespace audit

} // namespace warden
