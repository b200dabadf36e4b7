#ifndef WARDEN_SCHEDULER_JOB_INDEX_HPP
#define WARDEN_SCHEDULER_JOB_INDEX_HPP
/**
 * @file JobIndex.hpp
 * @brief Scheduler Job Index: jobs running on this node and their launch roots.
 * @note Linux-only. Backend: Slurm (squeue, scontrol, slurmstepd process titles).
 *
 * A snapshot is rebuilt on every call and never cached across cycles. An empty
 * OK snapshot means "no jobs"; failures are always reported through status.
 */

#include "src/helpers/inc/QueryStatus.hpp"
#include "src/process/inc/AncestryResolver.hpp"
#include "src/process/inc/ProcessTree.hpp"

#include <chrono>  // std::chrono::milliseconds
#include <cstdint> // std::int32_t
#include <string>
#include <string_view>
#include <vector>

namespace warden {

namespace scheduler {

using helpers::QueryStatus;

/* ----------------------------- JobRecord ----------------------------- */

/**
 * @brief One running job as seen from this node.
 */
struct JobRecord {
  std::string jobId;                ///< Scheduler job id (array elements use the raw id)
  std::string ownerUser;            ///< Submitting user
  process::PidSet launchRoots;      ///< Host PIDs of the job's step daemons on this node
  std::vector<int> gpuIndices;      ///< GPU ordinals allocated on this node (may be empty)

  /// True if deviceId is allocated to the job, or the job reports no allocation.
  [[nodiscard]] bool allowsDevice(int deviceId) const noexcept;
};

/* ----------------------------- JobSnapshot ----------------------------- */

/**
 * @brief Result of one scheduler query.
 */
struct JobSnapshot {
  QueryStatus status{QueryStatus::UNAVAILABLE};
  std::vector<JobRecord> jobs; ///< Valid only when status == OK
  std::string detail;          ///< Failure description (empty on success)

  [[nodiscard]] bool ok() const noexcept { return status == QueryStatus::OK; }

  /// Job by id, or nullptr.
  [[nodiscard]] const JobRecord* find(std::string_view jobId) const noexcept;

  /// Job owning a launch root, or nullptr.
  [[nodiscard]] const JobRecord* findByRoot(std::int32_t rootPid) const noexcept;

  /// Union of every job's launch roots.
  [[nodiscard]] process::PidSet allLaunchRoots() const;
};

/* ----------------------------- SchedulerQuery ----------------------------- */

/**
 * @brief Source of job snapshots.
 */
class SchedulerQuery {
public:
  virtual ~SchedulerQuery() = default;

  /// Take a fresh snapshot of running jobs on this node.
  [[nodiscard]] virtual JobSnapshot query() = 0;

  /// Human-friendly backend name for diagnostics.
  [[nodiscard]] virtual const char* name() const noexcept = 0;
};

/// Slurm backend settings.
struct SlurmConfig {
  std::chrono::milliseconds timeout{10000}; ///< Budget per external command
  std::string node;                         ///< Node name; empty means this host
  std::string squeuePath{"squeue"};
  std::string scontrolPath{"scontrol"};
  bool fetchGpuIndices{true}; ///< Run scontrol per job for GRES indices
};

/**
 * @brief Job snapshot from Slurm.
 *
 * 1. `squeue -h -t RUNNING -w <node> -o "%A|%u"` lists running jobs.
 * 2. `scontrol show job -dd <id>` yields the GPU indices (when enabled).
 * 3. The process table is scanned for `slurmstepd: [<jobid>.<step>]` titles.
 *    A titled process is a launch root only if it runs with all UIDs 0 and,
 *    when its exe link is readable, the binary is slurmstepd. Any user can
 *    retitle a process; neither check can be faked without root.
 *
 * Any command failure or malformed row fails the whole snapshot.
 */
class SlurmSchedulerQuery final : public SchedulerQuery {
public:
  SlurmSchedulerQuery(SlurmConfig config, process::ProcessTree& tree);

  [[nodiscard]] JobSnapshot query() override;
  [[nodiscard]] const char* name() const noexcept override { return "slurm"; }

  /// Node name used for squeue filtering.
  [[nodiscard]] const std::string& node() const noexcept { return config_.node; }

private:
  SlurmConfig config_;
  process::ProcessTree& tree_;
};

/* ----------------------------- Parsing API ----------------------------- */

/**
 * @brief Parse `squeue -h -o "%A|%u"` output.
 * @param text Command stdout.
 * @param out Jobs with id and owner set; cleared first.
 * @param error Set to a description of the first bad row.
 * @return false on a malformed row.
 */
[[nodiscard]] bool parseSqueueJobs(std::string_view text, std::vector<JobRecord>& out,
                                   std::string& error);

/**
 * @brief Parse a GRES index list such as "0-1,3".
 * @param list Text after "IDX:" up to the closing ')'.
 * @param out Indices appended in order.
 * @return false if any element is not an index or ascending range.
 */
[[nodiscard]] bool parseIndexList(std::string_view list, std::vector<int>& out);

/**
 * @brief Extract allocated GPU indices from `scontrol show job -dd` output.
 * @param text Command stdout.
 * @param node Node of interest; per-node lines naming it exactly win.
 * @param out Sorted unique indices; empty when the job has no GPU GRES.
 * @return false if an IDX list is malformed.
 *
 * Example per-node line:
 *   Nodes=gpu01 CPU_IDs=0-7 Mem=64000 GRES=gpu:a100:2(IDX:0-1)
 */
[[nodiscard]] bool parseGresIndices(std::string_view text, std::string_view node,
                                    std::vector<int>& out);

/**
 * @brief Extract the job id from a slurmstepd process title.
 * @param command Process command line, e.g. "slurmstepd: [1234.batch]".
 * @param jobId Output job id ("1234").
 * @return false if the command is not a job step daemon.
 */
[[nodiscard]] bool parseStepdJobId(std::string_view command, std::string& jobId);

/**
 * @brief Whether an exe link target names the slurmstepd binary.
 * @param exe Link target, e.g. "/usr/sbin/slurmstepd" or
 *            "/usr/sbin/slurmstepd (deleted)" after a package upgrade.
 * @return true if the basename is slurmstepd.
 */
[[nodiscard]] bool isStepdExecutable(std::string_view exe) noexcept;

/**
 * @brief Short host name of this machine (domain stripped).
 * @return Host name, or empty on failure.
 */
[[nodiscard]] std::string localNodeName();

} // namespace scheduler

} // namespace warden

#endif // WARDEN_SCHEDULER_JOB_INDEX_HPP
