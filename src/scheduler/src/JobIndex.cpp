/**
 * @file JobIndex.cpp
 * @brief Slurm job snapshot: squeue, scontrol and slurmstepd process titles.
 */

#include "src/scheduler/inc/JobIndex.hpp"
#include "src/helpers/inc/Exec.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <unistd.h> // gethostname

#include <algorithm> // std::sort, std::unique, std::find
#include <array>
#include <unordered_map>
#include <utility> // std::move

#include <fmt/core.h>

namespace warden {

namespace scheduler {

namespace {

namespace strings = helpers::strings;
namespace exec = helpers::exec;

/// Largest range accepted in an IDX list ("0-4095").
constexpr int MAX_INDEX_RANGE = 4096;

constexpr std::string_view IDX_TAG = "IDX:";
constexpr std::string_view NODES_TAG = "Nodes=";
constexpr std::string_view STEPD_TAG = "slurmstepd:";
constexpr std::string_view STEPD_BINARY = "slurmstepd";
constexpr std::string_view DELETED_SUFFIX = " (deleted)";

/// Parse a non-negative index.
bool parseIndex(std::string_view sv, int& out) noexcept {
  std::int64_t value = 0;
  if (!strings::parseInt64(strings::trim(sv), value) || value < 0 || value >= MAX_INDEX_RANGE) {
    return false;
  }
  out = static_cast<int>(value);
  return true;
}

/// Append every "IDX:<list>)" occurrence in line.
bool collectLineIndices(std::string_view line, std::vector<int>& out) {
  std::size_t pos = line.find(IDX_TAG);
  while (pos != std::string_view::npos) {
    const std::size_t BEGIN = pos + IDX_TAG.size();
    const std::size_t END = line.find(')', BEGIN);
    if (END == std::string_view::npos || !parseIndexList(line.substr(BEGIN, END - BEGIN), out)) {
      return false;
    }
    pos = line.find(IDX_TAG, END);
  }
  return true;
}

/// Value of a leading "Nodes=<name>" field, or empty.
std::string_view lineNodes(std::string_view line) noexcept {
  const std::string_view TRIMMED = strings::trim(line);
  if (!strings::startsWith(TRIMMED, NODES_TAG)) {
    return {};
  }
  const std::string_view REST = TRIMMED.substr(NODES_TAG.size());
  std::size_t end = 0;
  while (end < REST.size() && !strings::isSpace(REST[end])) {
    ++end;
  }
  return REST.substr(0, end);
}

bool isStepName(std::string_view step) noexcept {
  return step == "batch" || step == "extern" || step == "interactive" ||
         strings::isAllDigits(step);
}

/// Failed command -> snapshot with status and detail.
JobSnapshot commandFailure(const exec::ExecResult& result, std::string_view what) {
  JobSnapshot snap{};
  snap.status = helpers::statusFromExec(result);
  snap.detail = fmt::format("{} failed (exit {}): {}", what, result.exitCode,
                            strings::trim(result.err.empty() ? result.out : result.err));
  return snap;
}

} // namespace

/* ----------------------------- JobRecord ----------------------------- */

bool JobRecord::allowsDevice(int deviceId) const noexcept {
  if (gpuIndices.empty()) {
    return true;
  }
  return std::find(gpuIndices.begin(), gpuIndices.end(), deviceId) != gpuIndices.end();
}

/* ----------------------------- JobSnapshot ----------------------------- */

const JobRecord* JobSnapshot::find(std::string_view jobId) const noexcept {
  for (const JobRecord& JOB : jobs) {
    if (JOB.jobId == jobId) {
      return &JOB;
    }
  }
  return nullptr;
}

const JobRecord* JobSnapshot::findByRoot(std::int32_t rootPid) const noexcept {
  for (const JobRecord& JOB : jobs) {
    if (JOB.launchRoots.count(rootPid) != 0) {
      return &JOB;
    }
  }
  return nullptr;
}

process::PidSet JobSnapshot::allLaunchRoots() const {
  process::PidSet out;
  for (const JobRecord& JOB : jobs) {
    out.insert(JOB.launchRoots.begin(), JOB.launchRoots.end());
  }
  return out;
}

/* ----------------------------- Parsing ----------------------------- */

bool parseSqueueJobs(std::string_view text, std::vector<JobRecord>& out, std::string& error) {
  out.clear();
  std::size_t row = 0;
  std::string_view line;
  while (strings::nextLine(text, line)) {
    ++row;
    const std::string_view TRIMMED = strings::trim(line);
    if (TRIMMED.empty()) {
      continue;
    }

    const std::vector<std::string_view> FIELDS = strings::splitFields(TRIMMED, '|');
    if (FIELDS.size() != 2) {
      error = fmt::format("row {}: expected 2 fields, got {}", row, FIELDS.size());
      out.clear();
      return false;
    }
    const std::string_view ID = strings::trim(FIELDS[0]);
    const std::string_view USER = strings::trim(FIELDS[1]);
    if (ID.empty() || !strings::isAllDigits(ID) || USER.empty()) {
      error = fmt::format("row {}: bad job id or user in '{}'", row, TRIMMED);
      out.clear();
      return false;
    }

    bool duplicate = false;
    for (const JobRecord& EXISTING : out) {
      duplicate = duplicate || EXISTING.jobId == ID;
    }
    if (duplicate) {
      continue;
    }

    JobRecord job{};
    job.jobId.assign(ID);
    job.ownerUser.assign(USER);
    out.push_back(std::move(job));
  }
  return true;
}

bool parseIndexList(std::string_view list, std::vector<int>& out) {
  const std::vector<std::string_view> PARTS = strings::splitFields(list, ',');
  if (PARTS.empty()) {
    return false;
  }
  for (const std::string_view PART : PARTS) {
    const std::size_t DASH = PART.find('-');
    int first = 0;
    int last = 0;
    if (DASH == std::string_view::npos) {
      if (!parseIndex(PART, first)) {
        return false;
      }
      last = first;
    } else if (!parseIndex(PART.substr(0, DASH), first) ||
               !parseIndex(PART.substr(DASH + 1), last) || last < first) {
      return false;
    }
    for (int i = first; i <= last; ++i) {
      out.push_back(i);
    }
  }
  return true;
}

bool parseGresIndices(std::string_view text, std::string_view node, std::vector<int>& out) {
  out.clear();
  std::vector<int> all;
  std::vector<int> onNode;
  bool nodeMatched = false;

  std::string_view line;
  while (strings::nextLine(text, line)) {
    std::vector<int> lineIdx;
    if (!collectLineIndices(line, lineIdx)) {
      out.clear();
      return false;
    }
    if (lineIdx.empty()) {
      continue;
    }
    all.insert(all.end(), lineIdx.begin(), lineIdx.end());
    if (!node.empty() && lineNodes(line) == node) {
      nodeMatched = true;
      onNode.insert(onNode.end(), lineIdx.begin(), lineIdx.end());
    }
  }

  out = nodeMatched ? std::move(onNode) : std::move(all);
  std::sort(out.begin(), out.end());
  out.erase(std::unique(out.begin(), out.end()), out.end());
  return true;
}

bool parseStepdJobId(std::string_view command, std::string& jobId) {
  const std::string_view TRIMMED = strings::trim(command);
  if (!strings::startsWith(TRIMMED, STEPD_TAG)) {
    return false;
  }
  const std::size_t OPEN = TRIMMED.find('[', STEPD_TAG.size());
  const std::size_t CLOSE = TRIMMED.find(']', OPEN == std::string_view::npos ? 0 : OPEN);
  if (OPEN == std::string_view::npos || CLOSE == std::string_view::npos) {
    return false;
  }

  const std::string_view INNER = TRIMMED.substr(OPEN + 1, CLOSE - OPEN - 1);
  const std::size_t DOT = INNER.find('.');
  if (DOT == std::string_view::npos) {
    return false;
  }
  const std::string_view ID = INNER.substr(0, DOT);
  const std::string_view STEP = INNER.substr(DOT + 1);
  if (ID.empty() || !strings::isAllDigits(ID) || !isStepName(STEP)) {
    return false;
  }
  jobId.assign(ID);
  return true;
}

bool isStepdExecutable(std::string_view exe) noexcept {
  if (exe.size() > DELETED_SUFFIX.size() &&
      exe.substr(exe.size() - DELETED_SUFFIX.size()) == DELETED_SUFFIX) {
    exe.remove_suffix(DELETED_SUFFIX.size());
  }
  const std::size_t SLASH = exe.rfind('/');
  const std::string_view BASE = SLASH == std::string_view::npos ? exe : exe.substr(SLASH + 1);
  return BASE == STEPD_BINARY;
}

std::string localNodeName() {
  std::array<char, 256> buf{};
  if (::gethostname(buf.data(), buf.size() - 1) != 0) {
    return {};
  }
  std::string name(buf.data());
  const std::size_t DOT = name.find('.');
  if (DOT != std::string::npos) {
    name.resize(DOT);
  }
  return name;
}

/* ----------------------------- SlurmSchedulerQuery ----------------------------- */

SlurmSchedulerQuery::SlurmSchedulerQuery(SlurmConfig config, process::ProcessTree& tree)
    : config_(std::move(config)), tree_(tree) {
  if (config_.node.empty()) {
    config_.node = localNodeName();
  }
}

JobSnapshot SlurmSchedulerQuery::query() {
  JobSnapshot snap{};
  if (config_.node.empty()) {
    snap.status = QueryStatus::UNAVAILABLE;
    snap.detail = "cannot determine node name";
    return snap;
  }

  const exec::ExecResult SQUEUE = exec::runCommand(
      {config_.squeuePath, "-h", "-t", "RUNNING", "-w", config_.node, "-o", "%A|%u"},
      config_.timeout);
  if (!SQUEUE.succeeded()) {
    return commandFailure(SQUEUE, "squeue");
  }

  std::string error;
  if (!parseSqueueJobs(SQUEUE.out, snap.jobs, error)) {
    snap.status = QueryStatus::MALFORMED;
    snap.detail = fmt::format("squeue: {}", error);
    return snap;
  }

  if (config_.fetchGpuIndices) {
    for (JobRecord& job : snap.jobs) {
      const exec::ExecResult SHOW = exec::runCommand(
          {config_.scontrolPath, "show", "job", "-dd", job.jobId}, config_.timeout);
      if (!SHOW.succeeded()) {
        return commandFailure(SHOW, fmt::format("scontrol show job {}", job.jobId));
      }
      if (!parseGresIndices(SHOW.out, config_.node, job.gpuIndices)) {
        JobSnapshot bad{};
        bad.status = QueryStatus::MALFORMED;
        bad.detail = fmt::format("scontrol show job {}: bad GRES index list", job.jobId);
        return bad;
      }
    }
  }

  const std::vector<std::int32_t> PIDS = tree_.listPids();
  if (PIDS.empty()) {
    // Our own process is always visible; an empty table means the proc root is unreadable.
    snap.jobs.clear();
    snap.status = QueryStatus::UNAVAILABLE;
    snap.detail = "process table is empty or unreadable";
    return snap;
  }

  std::unordered_map<std::string, JobRecord*> byId;
  for (JobRecord& job : snap.jobs) {
    byId.emplace(job.jobId, &job);
  }

  std::string jobId;
  for (const std::int32_t PID : PIDS) {
    if (!parseStepdJobId(tree_.getCommand(PID), jobId)) {
      continue;
    }
    const auto IT = byId.find(jobId);
    if (IT == byId.end()) {
      helpers::log::debug("scheduler", "slurmstepd {} belongs to job {} not running here", PID,
                          jobId);
      continue;
    }

    const process::OwnerLookup OWNER = tree_.getOwner(PID);
    if (!OWNER.ok()) {
      continue; // exited since listing
    }
    if (!OWNER.allRoot) {
      helpers::log::warn("scheduler", "PID {} titled as job {} stepd but owned by {}, ignored",
                         PID, jobId, OWNER.user);
      continue;
    }
    const std::string EXE = tree_.getExecutable(PID);
    if (!EXE.empty() && !isStepdExecutable(EXE)) {
      helpers::log::warn("scheduler", "PID {} titled as job {} stepd but runs {}, ignored", PID,
                         jobId, EXE);
      continue;
    }
    IT->second->launchRoots.insert(PID);
  }

  snap.status = QueryStatus::OK;
  return snap;
}

} // namespace scheduler

} // namespace warden
