#ifndef WARDEN_PROCESS_ANCESTRY_RESOLVER_HPP
#define WARDEN_PROCESS_ANCESTRY_RESOLVER_HPP
/**
 * @file AncestryResolver.hpp
 * @brief Walk a process's ancestry up to the nearest scheduler launch root.
 *
 * The walk follows parent links on the host side. A process inside a nested
 * PID namespace is walked through its container-local ancestors first; the
 * namespace init (local PID 1) marks the boundary, after which the walk
 * continues with the init's host-side parent.
 *
 * Launch roots are matched by host PID only. A container root is therefore
 * matched by the host PID of the container's init process.
 *
 * Any gap in the chain (a process exiting mid-walk, a parent loop from PID
 * reuse, an over-deep chain) yields UNRESOLVED. Callers must treat UNRESOLVED
 * as not authorized.
 */

#include "src/process/inc/ProcessTree.hpp"

#include <cstddef> // std::size_t
#include <cstdint> // std::int32_t
#include <string>
#include <unordered_set>
#include <vector>

namespace warden {

namespace process {

/* ----------------------------- Constants ----------------------------- */

/// Default cap on ancestry length (pid_max chains are far shorter in practice).
inline constexpr std::size_t DEFAULT_MAX_ANCESTRY_DEPTH = 512;

/* ----------------------------- Types ----------------------------- */

/// Set of host PIDs.
using PidSet = std::unordered_set<std::int32_t>;

/**
 * @brief One hop of an ancestry walk.
 */
struct AncestryStep {
  std::int32_t pid{-1};       ///< PID in the process's innermost namespace
  std::int32_t hostPid{-1};   ///< PID as seen by the host
  std::int32_t parentPid{-1}; ///< Host-side parent PID
  int namespaceDepth{0};      ///< 0 on the host, >0 inside containers
};

/// Ordered from the queried process upward.
using AncestryPath = std::vector<AncestryStep>;

/// How a walk ended.
enum class AncestryOutcome : std::uint8_t {
  MATCHED_ROOT = 0, ///< Reached a launch root
  REACHED_INIT,     ///< Reached PID 1 without a match
  REACHED_BOUNDARY, ///< Reached the top of the visible tree (parent 0) without a match
  UNRESOLVED,       ///< Chain broken: vanished process, loop, or depth cap
};

/**
 * @brief Convert AncestryOutcome to string.
 * @param outcome Outcome value.
 * @return Static string.
 */
[[nodiscard]] const char* toString(AncestryOutcome outcome) noexcept;

/**
 * @brief Result of resolving one PID.
 */
struct AncestryResult {
  AncestryOutcome outcome{AncestryOutcome::UNRESOLVED};
  std::int32_t matchedRoot{-1}; ///< Host PID of the matched root (MATCHED_ROOT only)
  AncestryPath path;            ///< Steps visited, queried process first
  std::string detail;           ///< Why the walk stopped (UNRESOLVED only)

  [[nodiscard]] bool matched() const noexcept {
    return outcome == AncestryOutcome::MATCHED_ROOT;
  }

  /// Number of namespace boundaries crossed.
  [[nodiscard]] int boundariesCrossed() const noexcept;

  /// Compact "9001 <- 8000 <- 500" rendering (host PIDs, "[ns]" marks namespace inits).
  [[nodiscard]] std::string pathString() const;
};

/* ----------------------------- AncestryResolver ----------------------------- */

/**
 * @brief Stateless ancestry walker over a ProcessTree.
 *
 * Holds a reference to the tree; the tree must outlive the resolver.
 */
class AncestryResolver {
public:
  explicit AncestryResolver(ProcessTree& tree,
                            std::size_t maxDepth = DEFAULT_MAX_ANCESTRY_DEPTH) noexcept;

  /**
   * @brief Walk upward from pid until a launch root, PID 1, or a gap.
   * @param pid Host PID to resolve.
   * @param launchRoots Union of every active job's launch roots.
   * @return Walk result; never retries a failed lookup.
   */
  [[nodiscard]] AncestryResult resolve(std::int32_t pid, const PidSet& launchRoots) const;

private:
  ProcessTree& tree_;
  std::size_t maxDepth_;
};

} // namespace process

} // namespace warden

#endif // WARDEN_PROCESS_ANCESTRY_RESOLVER_HPP
