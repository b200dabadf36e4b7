/**
 * @file ProcessTree.cpp
 * @brief procfs-backed process tree lookups.
 */

#include "src/process/inc/ProcessTree.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <pwd.h>    // getpwuid_r
#include <unistd.h> // sysconf

#include <cstdint>
#include <utility> // std::move

#include <fmt/core.h>

namespace warden {

namespace process {

namespace {

namespace strings = helpers::strings;

/// Buffer for getpwuid_r when sysconf gives no hint.
constexpr std::size_t PASSWD_BUFFER_SIZE = 16384;

} // namespace

/* ----------------------------- LookupStatus ----------------------------- */

const char* toString(LookupStatus status) noexcept {
  switch (status) {
  case LookupStatus::OK:
    return "ok";
  case LookupStatus::NO_SUCH_PROCESS:
    return "no-such-process";
  case LookupStatus::NOT_APPLICABLE:
    return "not-applicable";
  default:
    return "unknown";
  }
}

/* ----------------------------- Parsing ----------------------------- */

bool parseStatParent(std::string_view stat, std::int32_t& ppid) noexcept {
  const std::size_t CLOSE = stat.rfind(')');
  if (CLOSE == std::string_view::npos) {
    return false;
  }

  // After "(comm)": " <state> <ppid> ..."
  std::string_view rest = stat.substr(CLOSE + 1);
  rest = strings::trim(rest);
  const std::size_t STATE_END = rest.find(' ');
  if (STATE_END == std::string_view::npos) {
    return false;
  }
  rest = strings::trim(rest.substr(STATE_END + 1));
  const std::size_t PPID_END = rest.find(' ');
  const std::string_view FIELD = rest.substr(0, PPID_END);

  std::int64_t value = 0;
  if (!strings::parseInt64(FIELD, value) || value < 0 || value > INT32_MAX) {
    return false;
  }
  ppid = static_cast<std::int32_t>(value);
  return true;
}

bool parseStatusNsPids(std::string_view status, std::vector<std::int32_t>& nsPids) {
  nsPids.clear();
  std::string_view line;
  while (strings::nextLine(status, line)) {
    if (!strings::startsWith(line, "NSpid:")) {
      continue;
    }
    std::string_view rest = line.substr(6);
    while (true) {
      rest = strings::trim(rest);
      if (rest.empty()) {
        break;
      }
      std::size_t end = 0;
      while (end < rest.size() && !strings::isSpace(rest[end])) {
        ++end;
      }
      std::int32_t pid = 0;
      if (!strings::parsePid(rest.substr(0, end), pid)) {
        nsPids.clear();
        return false;
      }
      nsPids.push_back(pid);
      rest.remove_prefix(end);
    }
    return !nsPids.empty();
  }
  return false;
}

bool parseStatusUids(std::string_view status, std::array<std::uint32_t, 4>& uids) {
  std::string_view line;
  while (strings::nextLine(status, line)) {
    if (!strings::startsWith(line, "Uid:")) {
      continue;
    }
    std::string_view rest = line.substr(4);
    for (std::uint32_t& uid : uids) {
      rest = strings::trim(rest);
      std::size_t end = 0;
      while (end < rest.size() && !strings::isSpace(rest[end])) {
        ++end;
      }
      std::int64_t value = 0;
      if (end == 0 || !strings::parseInt64(rest.substr(0, end), value) || value < 0 ||
          value > UINT32_MAX) {
        return false;
      }
      uid = static_cast<std::uint32_t>(value);
      rest.remove_prefix(end);
    }
    return true;
  }
  return false;
}

std::string formatCmdline(std::string_view raw) {
  std::string out(raw);
  for (char& c : out) {
    if (c == '\0') {
      c = ' ';
    }
  }
  while (!out.empty() && out.back() == ' ') {
    out.pop_back();
  }
  return out;
}

/* ----------------------------- ProcfsProcessTree ----------------------------- */

ProcfsProcessTree::ProcfsProcessTree(std::string procRoot) : procRoot_(std::move(procRoot)) {
  while (procRoot_.size() > 1 && procRoot_.back() == '/') {
    procRoot_.pop_back();
  }
}

std::string ProcfsProcessTree::pidPath(std::int32_t pid, const char* leaf) const {
  return fmt::format("{}/{}/{}", procRoot_, pid, leaf);
}

ParentLookup ProcfsProcessTree::getParent(std::int32_t pid) {
  ParentLookup out{};
  if (pid <= 0) {
    return out;
  }

  std::string content;
  if (!helpers::files::readFileToString(pidPath(pid, "stat"), content) || content.empty()) {
    return out;
  }

  std::int32_t ppid = -1;
  if (!parseStatParent(content, ppid)) {
    return out;
  }
  out.status = LookupStatus::OK;
  out.parentPid = ppid;
  return out;
}

NamespaceMapping ProcfsProcessTree::getNamespaceMapping(std::int32_t pid) {
  NamespaceMapping out{};
  if (pid <= 0) {
    return out;
  }

  std::string content;
  if (!helpers::files::readFileToString(pidPath(pid, "status"), content) || content.empty()) {
    return out;
  }

  std::vector<std::int32_t> nsPids;
  if (!parseStatusNsPids(content, nsPids) || nsPids.size() == 1) {
    out.status = LookupStatus::NOT_APPLICABLE;
    out.hostPid = pid;
    out.localPid = pid;
    out.depth = 0;
    return out;
  }

  out.status = LookupStatus::OK;
  out.hostPid = nsPids.front();
  out.localPid = nsPids.back();
  out.depth = static_cast<int>(nsPids.size()) - 1;
  return out;
}

std::string ProcfsProcessTree::getCommand(std::int32_t pid) {
  std::string raw;
  if (pid <= 0 || !helpers::files::readFileToString(pidPath(pid, "cmdline"), raw)) {
    return {};
  }
  std::string cmd = formatCmdline(raw);
  if (cmd.empty()) {
    // Kernel threads and zombies have an empty cmdline; fall back to comm.
    std::string comm;
    if (helpers::files::readFileToString(pidPath(pid, "comm"), comm)) {
      const std::string_view TRIMMED = strings::trim(comm);
      if (!TRIMMED.empty()) {
        cmd = fmt::format("[{}]", TRIMMED);
      }
    }
  }
  return cmd;
}

OwnerLookup ProcfsProcessTree::getOwner(std::int32_t pid) {
  OwnerLookup out{};
  if (pid <= 0) {
    return out;
  }

  std::string content;
  if (!helpers::files::readFileToString(pidPath(pid, "status"), content) || content.empty()) {
    return out;
  }

  std::array<std::uint32_t, 4> uids{};
  if (!parseStatusUids(content, uids)) {
    return out;
  }
  out.status = LookupStatus::OK;
  out.uid = uids[0];
  out.allRoot = uids[0] == 0 && uids[1] == 0 && uids[2] == 0 && uids[3] == 0;
  out.user = userName(out.uid);
  return out;
}

std::string ProcfsProcessTree::getExecutable(std::int32_t pid) {
  std::string target;
  if (pid <= 0 || !helpers::files::readLink(pidPath(pid, "exe"), target)) {
    return {};
  }
  return target;
}

const std::string& ProcfsProcessTree::userName(std::uint32_t uid) {
  const auto IT = userNames_.find(uid);
  if (IT != userNames_.end()) {
    return IT->second;
  }

  const long HINT = ::sysconf(_SC_GETPW_R_SIZE_MAX);
  std::vector<char> buf(HINT > 0 ? static_cast<std::size_t>(HINT) : PASSWD_BUFFER_SIZE);
  passwd pw{};
  passwd* found = nullptr;
  std::string name;
  if (::getpwuid_r(static_cast<uid_t>(uid), &pw, buf.data(), buf.size(), &found) == 0 &&
      found != nullptr && found->pw_name != nullptr) {
    name = found->pw_name;
  } else {
    name = fmt::format("{}", uid);
  }
  return userNames_.emplace(uid, std::move(name)).first->second;
}

std::vector<std::int32_t> ProcfsProcessTree::listPids() {
  std::vector<std::int32_t> out;
  for (const std::string& NAME : helpers::files::listDirectory(procRoot_.c_str())) {
    std::int32_t pid = 0;
    if (strings::isAllDigits(NAME) && strings::parsePid(NAME, pid)) {
      out.push_back(pid);
    }
  }
  return out;
}

} // namespace process

} // namespace warden
