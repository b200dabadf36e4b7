/**
 * @file AncestryResolver.cpp
 * @brief Ancestry walk from a GPU process to its nearest launch root.
 */

#include "src/process/inc/AncestryResolver.hpp"

#include <fmt/core.h>

namespace warden {

namespace process {

/* ----------------------------- AncestryOutcome ----------------------------- */

const char* toString(AncestryOutcome outcome) noexcept {
  switch (outcome) {
  case AncestryOutcome::MATCHED_ROOT:
    return "matched-root";
  case AncestryOutcome::REACHED_INIT:
    return "reached-init";
  case AncestryOutcome::REACHED_BOUNDARY:
    return "reached-boundary";
  case AncestryOutcome::UNRESOLVED:
    return "unresolved";
  default:
    return "unknown";
  }
}

/* ----------------------------- AncestryResult ----------------------------- */

int AncestryResult::boundariesCrossed() const noexcept {
  int crossed = 0;
  for (std::size_t i = 1; i < path.size(); ++i) {
    if (path[i].namespaceDepth < path[i - 1].namespaceDepth) {
      ++crossed;
    }
  }
  return crossed;
}

std::string AncestryResult::pathString() const {
  std::string out;
  for (std::size_t i = 0; i < path.size(); ++i) {
    const AncestryStep& STEP = path[i];
    if (i > 0) {
      out += " <- ";
    }
    out += fmt::format("{}", STEP.hostPid);
    if (STEP.namespaceDepth > 0 && STEP.pid == 1) {
      out += "[ns]";
    }
  }
  return out;
}

/* ----------------------------- AncestryResolver ----------------------------- */

AncestryResolver::AncestryResolver(ProcessTree& tree, std::size_t maxDepth) noexcept
    : tree_(tree), maxDepth_(maxDepth == 0 ? DEFAULT_MAX_ANCESTRY_DEPTH : maxDepth) {}

AncestryResult AncestryResolver::resolve(std::int32_t pid, const PidSet& launchRoots) const {
  AncestryResult result{};
  PidSet visited;
  std::int32_t current = pid;

  while (true) {
    if (current <= 0) {
      result.outcome = AncestryOutcome::UNRESOLVED;
      result.detail = fmt::format("invalid pid {}", current);
      return result;
    }
    if (result.path.size() >= maxDepth_) {
      result.outcome = AncestryOutcome::UNRESOLVED;
      result.detail = fmt::format("ancestry deeper than {}", maxDepth_);
      return result;
    }
    if (!visited.insert(current).second) {
      result.outcome = AncestryOutcome::UNRESOLVED;
      result.detail = fmt::format("parent loop at pid {}", current);
      return result;
    }

    const NamespaceMapping NS = tree_.getNamespaceMapping(current);
    if (NS.status == LookupStatus::NO_SUCH_PROCESS) {
      result.outcome = AncestryOutcome::UNRESOLVED;
      result.detail = fmt::format("pid {} vanished", current);
      return result;
    }

    const ParentLookup PARENT = tree_.getParent(current);
    if (PARENT.status != LookupStatus::OK) {
      result.outcome = AncestryOutcome::UNRESOLVED;
      result.detail = fmt::format("pid {} vanished", current);
      return result;
    }

    AncestryStep step{};
    if (NS.status == LookupStatus::OK) {
      step.pid = NS.localPid;
      step.hostPid = NS.hostPid;
      step.namespaceDepth = NS.depth;
    } else {
      step.pid = current;
      step.hostPid = current;
      step.namespaceDepth = 0;
    }
    step.parentPid = PARENT.parentPid;
    result.path.push_back(step);

    if (launchRoots.count(step.hostPid) != 0) {
      result.outcome = AncestryOutcome::MATCHED_ROOT;
      result.matchedRoot = step.hostPid;
      return result;
    }
    if (step.hostPid == 1) {
      result.outcome = AncestryOutcome::REACHED_INIT;
      return result;
    }
    if (step.parentPid <= 0) {
      result.outcome = AncestryOutcome::REACHED_BOUNDARY;
      return result;
    }

    current = step.parentPid;
  }
}

} // namespace process

} // namespace warden
