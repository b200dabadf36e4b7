#ifndef WARDEN_CYCLE_RECONCILER_HPP
#define WARDEN_CYCLE_RECONCILER_HPP
/**
 * @file Reconciler.hpp
 * @brief One reconciliation cycle: observe, classify, log, enforce.
 *
 * Order within a cycle:
 *   1. Device inventory query (abort on failure)
 *   2. Scheduler snapshot query (abort on failure)
 *   3. Classifier::evaluate
 *   4. Consistency check of the decisions (abort on violation)
 *   5. Append every decision to the audit sink (abort on failure)
 *   6. Classifier::commit
 *   7. Enforce confirmed decisions, one outcome record per action
 *   8. Flush the audit sink
 *
 * An abort before step 6 changes neither grace state nor process state.
 */

#include "src/audit/inc/AuditLog.hpp"
#include "src/enforce/inc/Enforcer.hpp"
#include "src/gpu/inc/DeviceInventory.hpp"
#include "src/policy/inc/Classifier.hpp"
#include "src/scheduler/inc/JobIndex.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace warden {

namespace cycle {

/* ----------------------------- CycleStatus ----------------------------- */

enum class CycleStatus : std::uint8_t {
  COMPLETED = 0,        ///< Decisions logged and acted upon
  ABORTED_QUERY,        ///< A data source failed; nothing changed
  ABORTED_INCONSISTENT, ///< Decisions failed validation; nothing changed
  ABORTED_AUDIT,        ///< Decisions could not be logged; nothing enforced
};

/**
 * @brief Convert CycleStatus to string.
 * @param status Status value.
 * @return Static string.
 */
[[nodiscard]] const char* toString(CycleStatus status) noexcept;

/* ----------------------------- CycleSummary ----------------------------- */

/**
 * @brief What one cycle saw and did.
 */
struct CycleSummary {
  std::uint64_t cycleId{0}; ///< 0 if the cycle wrote no audit record
  CycleStatus status{CycleStatus::COMPLETED};
  std::size_t pidsSeen{0};                 ///< Distinct PIDs in the inventory
  std::size_t authorized{0};               ///< Decisions AUTHORIZED
  std::size_t unauthorizedPendingGrace{0}; ///< UNAUTHORIZED, not yet confirmed
  std::size_t enforced{0};                 ///< PIDs acted upon
  std::size_t failures{0};                 ///< FAILED outcomes plus post-enforcement audit errors
  std::uint64_t durationMs{0};
  std::string detail; ///< Abort reason

  [[nodiscard]] bool completed() const noexcept { return status == CycleStatus::COMPLETED; }

  /// @brief Human-readable one-liner.
  [[nodiscard]] std::string toString() const;

  /// @brief Single-line JSON object.
  [[nodiscard]] std::string toJson() const;
};

/* ----------------------------- Validation ----------------------------- */

/**
 * @brief Check the invariants a classification round must satisfy.
 * @param inventory Inventory that was classified.
 * @param snapshot Snapshot used for classification.
 * @param decisions Classifier output.
 * @param error Description of the first violation.
 * @return false on any violation.
 *
 * Checks: one decision per entry in order, no duplicated (pid, device), every
 * jobId present in the snapshot, confirmed only on UNAUTHORIZED.
 */
[[nodiscard]] bool validateDecisions(const gpu::DeviceInventory& inventory,
                                     const scheduler::JobSnapshot& snapshot,
                                     const std::vector<policy::Decision>& decisions,
                                     std::string& error);

/* ----------------------------- Reconciler ----------------------------- */

/**
 * @brief Drives cycles over injected data sources, classifier, enforcer and sink.
 *
 * Holds references; every collaborator must outlive the Reconciler.
 * Single-threaded: runCycle() must not be called concurrently.
 *
 * A cycle takes the next id only when it starts writing decision records, so
 * an id seen in stdout is never reused after a restart. Cycles that abort
 * before that point, or have no decisions, report id 0.
 */
class Reconciler {
public:
  Reconciler(gpu::DeviceQuery& devices, scheduler::SchedulerQuery& scheduler,
             policy::Classifier& classifier, enforce::Enforcer& enforcer,
             audit::AuditSink& sink) noexcept;

  /// Run one full cycle.
  [[nodiscard]] CycleSummary runCycle();

  /// Id the next cycle to reach the audit trail will use.
  [[nodiscard]] std::uint64_t nextCycleId() const noexcept { return nextCycleId_; }

private:
  gpu::DeviceQuery& devices_;
  scheduler::SchedulerQuery& scheduler_;
  policy::Classifier& classifier_;
  enforce::Enforcer& enforcer_;
  audit::AuditSink& sink_;
  std::uint64_t nextCycleId_;
};

} // namespace cycle

} // namespace warden

#endif // WARDEN_CYCLE_RECONCILER_HPP
