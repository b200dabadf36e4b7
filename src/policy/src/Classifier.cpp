/**
 * @file Classifier.cpp
 * @brief Authorization verdicts and grace-period confirmation.
 */

#include "src/policy/inc/Classifier.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/helpers/inc/Log.hpp"

#include <unordered_map>
#include <utility> // std::move

#include <fmt/core.h>

namespace warden {

namespace policy {

namespace {

constexpr const char* COMPONENT = "policy";

/// Verdict for one entry once the PID's ancestry is known.
struct Judgement {
  Verdict verdict{Verdict::UNAUTHORIZED};
  std::optional<std::string> jobId;
  std::string reason;
};

Judgement judge(const process::AncestryResult& ancestry, const process::OwnerLookup& owner,
                const scheduler::JobSnapshot& snapshot, int deviceId, bool enforceAllocation) {
  Judgement j{};
  switch (ancestry.outcome) {
  case process::AncestryOutcome::MATCHED_ROOT:
    break;
  case process::AncestryOutcome::UNRESOLVED:
    j.reason = REASON_ANCESTRY_UNRESOLVED;
    return j;
  default:
    j.reason = REASON_NO_LAUNCH_ROOT;
    return j;
  }

  const scheduler::JobRecord* job = snapshot.findByRoot(ancestry.matchedRoot);
  if (job == nullptr) {
    j.reason = REASON_JOB_INACTIVE;
    return j;
  }
  j.jobId = job->jobId;
  if (!owner.ok() || owner.user.empty()) {
    j.reason = REASON_OWNER_UNKNOWN;
    return j;
  }
  if (owner.user != job->ownerUser) {
    j.reason = REASON_OWNER_MISMATCH;
    return j;
  }
  if (enforceAllocation && !job->allowsDevice(deviceId)) {
    j.reason = REASON_DEVICE_NOT_ALLOCATED;
    return j;
  }

  j.verdict = Verdict::AUTHORIZED;
  j.reason = fmt::format("launched by job {} (root {})", job->jobId, ancestry.matchedRoot);
  return j;
}

} // namespace

/* ----------------------------- Verdict ----------------------------- */

const char* toString(Verdict verdict) noexcept {
  switch (verdict) {
  case Verdict::AUTHORIZED:
    return "AUTHORIZED";
  case Verdict::UNAUTHORIZED:
    return "UNAUTHORIZED";
  default:
    return "UNKNOWN";
  }
}

std::string Decision::toString() const {
  return fmt::format("PID {} on GPU {} ({}): {}{} [{}]{}", pid, deviceId,
                     helpers::format::bytesBinary(memoryBytes), policy::toString(verdict),
                     jobId ? fmt::format(" job {}", *jobId) : std::string{}, reason,
                     confirmed ? " confirmed" : "");
}

/* ----------------------------- Classifier ----------------------------- */

Classifier::Classifier(process::ProcessTree& tree, ClassifierConfig config)
    : tree_(tree), config_(config) {
  if (config_.graceCycles < 1) {
    config_.graceCycles = 1;
  }
}

ClassificationRound Classifier::evaluate(const gpu::DeviceInventory& inventory,
                                         const scheduler::JobSnapshot& snapshot) const {
  ClassificationRound out{};
  out.round = rounds_ + 1;
  out.decisions.reserve(inventory.entries.size());

  const process::PidSet ROOTS = snapshot.allLaunchRoots();
  const process::AncestryResolver RESOLVER(tree_, config_.maxAncestryDepth);

  // One walk and one command and owner lookup per PID, however many devices it uses.
  struct PidView {
    process::AncestryResult ancestry;
    std::string command;
    process::OwnerLookup owner;
  };
  std::unordered_map<std::int32_t, PidView> views;

  for (const gpu::GpuProcessEntry& ENTRY : inventory.entries) {
    auto it = views.find(ENTRY.pid);
    if (it == views.end()) {
      PidView view{RESOLVER.resolve(ENTRY.pid, ROOTS), tree_.getCommand(ENTRY.pid),
                   tree_.getOwner(ENTRY.pid)};
      if (view.ancestry.outcome == process::AncestryOutcome::UNRESOLVED) {
        helpers::log::debug(COMPONENT, "PID {}: {}", ENTRY.pid, view.ancestry.detail);
      } else {
        helpers::log::debug(COMPONENT, "PID {}: {} via {}", ENTRY.pid,
                            process::toString(view.ancestry.outcome),
                            view.ancestry.pathString());
      }
      it = views.emplace(ENTRY.pid, std::move(view)).first;
    }

    const Judgement J = judge(it->second.ancestry, it->second.owner, snapshot, ENTRY.deviceId,
                              config_.enforceAllocation);
    Decision d{};
    d.pid = ENTRY.pid;
    d.deviceId = ENTRY.deviceId;
    d.memoryBytes = ENTRY.memoryBytes;
    d.verdict = J.verdict;
    d.jobId = J.jobId;
    d.reason = J.reason;
    d.command = it->second.command;
    d.owner = it->second.owner.user;
    out.decisions.push_back(std::move(d));

    if (J.verdict == Verdict::AUTHORIZED || out.nextGrace.count(ENTRY.pid) != 0) {
      continue;
    }

    // First unauthorized entry of this PID in the round.
    GraceEntry next{};
    const auto PREV = grace_.find(ENTRY.pid);
    if (PREV != grace_.end() && PREV->second.lastRound + 1 == out.round) {
      next = PREV->second;
      next.consecutiveRounds += 1;
    } else {
      next.firstSeenUnauthorizedMs = ENTRY.observedAtMs;
      next.deviceId = ENTRY.deviceId;
      next.consecutiveRounds = 1;
    }
    next.lastRound = out.round;
    out.nextGrace.emplace(ENTRY.pid, next);
  }

  // Confirmation is per PID: every unauthorized entry of a confirmed PID is actionable.
  for (Decision& d : out.decisions) {
    if (d.verdict != Verdict::UNAUTHORIZED) {
      continue;
    }
    const auto IT = out.nextGrace.find(d.pid);
    d.confirmed = IT != out.nextGrace.end() && IT->second.consecutiveRounds >= config_.graceCycles;
  }

  return out;
}

void Classifier::commit(ClassificationRound round) {
  grace_ = std::move(round.nextGrace);
  rounds_ = round.round;
}

} // namespace policy

} // namespace warden
