/**
 * @file Reconciler.cpp
 * @brief Cycle pipeline with log-before-act ordering.
 */

#include "src/cycle/inc/Reconciler.hpp"
#include "src/helpers/inc/Clock.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/helpers/inc/Log.hpp"

#include <set>
#include <unordered_set>
#include <utility> // std::move, std::pair

#include <fmt/core.h>

namespace warden {

namespace cycle {

namespace {

constexpr const char* COMPONENT = "cycle";

} // namespace

/* ----------------------------- CycleStatus ----------------------------- */

const char* toString(CycleStatus status) noexcept {
  switch (status) {
  case CycleStatus::COMPLETED:
    return "COMPLETED";
  case CycleStatus::ABORTED_QUERY:
    return "ABORTED_QUERY";
  case CycleStatus::ABORTED_INCONSISTENT:
    return "ABORTED_INCONSISTENT";
  case CycleStatus::ABORTED_AUDIT:
    return "ABORTED_AUDIT";
  default:
    return "UNKNOWN";
  }
}

/* ----------------------------- CycleSummary ----------------------------- */

std::string CycleSummary::toString() const {
  std::string out = fmt::format("cycle {} {}: {} pids, {} authorized, {} pending grace, "
                                "{} enforced, {} failures ({} ms)",
                                cycleId == 0 ? std::string("-") : fmt::format("{}", cycleId),
                                cycle::toString(status), pidsSeen, authorized,
                                unauthorizedPendingGrace, enforced, failures, durationMs);
  if (!detail.empty()) {
    out += fmt::format(" - {}", detail);
  }
  return out;
}

std::string CycleSummary::toJson() const {
  std::string out = fmt::format(
      "{{\"cycle\":{},\"status\":\"{}\",\"pids_seen\":{},\"authorized\":{},"
      "\"pending_grace\":{},\"enforced\":{},\"failures\":{},\"duration_ms\":{},\"detail\":",
      cycleId == 0 ? std::string("null") : fmt::format("{}", cycleId), cycle::toString(status),
      pidsSeen, authorized, unauthorizedPendingGrace, enforced, failures, durationMs);
  helpers::format::appendJsonString(out, detail);
  out += '}';
  return out;
}

/* ----------------------------- Validation ----------------------------- */

bool validateDecisions(const gpu::DeviceInventory& inventory,
                       const scheduler::JobSnapshot& snapshot,
                       const std::vector<policy::Decision>& decisions, std::string& error) {
  if (decisions.size() != inventory.entries.size()) {
    error = fmt::format("{} decisions for {} inventory entries", decisions.size(),
                        inventory.entries.size());
    return false;
  }

  std::set<std::pair<std::int32_t, int>> seen;
  for (std::size_t i = 0; i < decisions.size(); ++i) {
    const policy::Decision& D = decisions[i];
    const gpu::GpuProcessEntry& E = inventory.entries[i];
    if (D.pid != E.pid || D.deviceId != E.deviceId) {
      error = fmt::format("decision {} is for PID {} GPU {}, entry is PID {} GPU {}", i, D.pid,
                          D.deviceId, E.pid, E.deviceId);
      return false;
    }
    if (!seen.emplace(D.pid, D.deviceId).second) {
      error = fmt::format("duplicate decision for PID {} on GPU {}", D.pid, D.deviceId);
      return false;
    }
    if (D.jobId && snapshot.find(*D.jobId) == nullptr) {
      error = fmt::format("PID {} attributed to job {} absent from snapshot", D.pid, *D.jobId);
      return false;
    }
    if (D.confirmed && D.authorized()) {
      error = fmt::format("PID {} confirmed for enforcement while AUTHORIZED", D.pid);
      return false;
    }
  }
  return true;
}

/* ----------------------------- Reconciler ----------------------------- */

Reconciler::Reconciler(gpu::DeviceQuery& devices, scheduler::SchedulerQuery& scheduler,
                       policy::Classifier& classifier, enforce::Enforcer& enforcer,
                       audit::AuditSink& sink) noexcept
    : devices_(devices), scheduler_(scheduler), classifier_(classifier), enforcer_(enforcer),
      sink_(sink), nextCycleId_(sink.lastCycleId() + 1) {}

CycleSummary Reconciler::runCycle() {
  const std::uint64_t START_NS = helpers::clock::getMonotonicNs();
  CycleSummary summary{};

  const auto FINISH = [&summary, START_NS]() -> CycleSummary {
    summary.durationMs = (helpers::clock::getMonotonicNs() - START_NS) / 1'000'000ULL;
    return summary;
  };

  /* ---- Observe ---- */
  const gpu::DeviceInventory INVENTORY = devices_.query();
  if (!INVENTORY.ok()) {
    summary.status = CycleStatus::ABORTED_QUERY;
    summary.detail = fmt::format("{} query {}: {}", devices_.name(),
                                 helpers::toString(INVENTORY.status), INVENTORY.detail);
    helpers::log::warn(COMPONENT, "cycle aborted, {}", summary.detail);
    return FINISH();
  }

  const scheduler::JobSnapshot SNAPSHOT = scheduler_.query();
  if (!SNAPSHOT.ok()) {
    summary.status = CycleStatus::ABORTED_QUERY;
    summary.detail = fmt::format("{} query {}: {}", scheduler_.name(),
                                 helpers::toString(SNAPSHOT.status), SNAPSHOT.detail);
    helpers::log::warn(COMPONENT, "cycle aborted, {}", summary.detail);
    return FINISH();
  }

  std::unordered_set<std::int32_t> pids;
  for (const gpu::GpuProcessEntry& ENTRY : INVENTORY.entries) {
    pids.insert(ENTRY.pid);
  }
  summary.pidsSeen = pids.size();

  /* ---- Classify ---- */
  policy::ClassificationRound round = classifier_.evaluate(INVENTORY, SNAPSHOT);

  std::string error;
  if (!validateDecisions(INVENTORY, SNAPSHOT, round.decisions, error)) {
    summary.status = CycleStatus::ABORTED_INCONSISTENT;
    summary.detail = error;
    helpers::log::critical(COMPONENT, "cycle aborted, data inconsistency: {}", error);
    return FINISH();
  }

  /* ---- Log before acting ---- */
  // Ids name audit records; a cycle with nothing to record takes none.
  if (!round.decisions.empty()) {
    summary.cycleId = nextCycleId_++;
  }
  const std::uint64_t DECIDED_AT = helpers::clock::getRealtimeMs();
  for (const policy::Decision& D : round.decisions) {
    if (!sink_.append(audit::formatDecisionRecord(summary.cycleId, DECIDED_AT, D))) {
      summary.status = CycleStatus::ABORTED_AUDIT;
      summary.detail = fmt::format("audit append failed: {}", sink_.lastError());
      helpers::log::critical(COMPONENT, "cycle {} cannot log decisions, not enforcing: {}",
                             summary.cycleId, sink_.lastError());
      return FINISH();
    }
  }

  for (const policy::Decision& D : round.decisions) {
    if (D.authorized()) {
      ++summary.authorized;
    } else if (!D.confirmed) {
      ++summary.unauthorizedPendingGrace;
      helpers::log::info(COMPONENT, "{} (pending grace)", D.toString());
    } else {
      helpers::log::warn(COMPONENT, "{} `{}`", D.toString(), D.command);
    }
  }

  std::vector<policy::Decision> decisions = std::move(round.decisions);
  classifier_.commit(std::move(round));

  /* ---- Enforce ---- */
  std::unordered_set<std::int32_t> acted;
  for (const policy::Decision& D : decisions) {
    if (!D.actionable() || !acted.insert(D.pid).second) {
      continue;
    }

    const enforce::EnforcementOutcome OUTCOME = enforcer_.enforce(D.pid, D.deviceId);
    ++summary.enforced;
    if (OUTCOME.failed()) {
      ++summary.failures;
    } else {
      helpers::log::warn(COMPONENT, "{}", OUTCOME.toString());
    }

    if (!sink_.append(audit::formatOutcomeRecord(summary.cycleId, OUTCOME))) {
      ++summary.failures;
      helpers::log::critical(COMPONENT, "cycle {} cannot log outcome for PID {}: {}",
                             summary.cycleId, D.pid, sink_.lastError());
    }
  }

  if (!sink_.flush()) {
    ++summary.failures;
    helpers::log::critical(COMPONENT, "cycle {} audit flush failed: {}", summary.cycleId,
                           sink_.lastError());
  }

  summary.status = CycleStatus::COMPLETED;
  return FINISH();
}

} // namespace cycle

} // namespace warden
