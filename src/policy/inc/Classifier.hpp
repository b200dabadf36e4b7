#ifndef WARDEN_POLICY_CLASSIFIER_HPP
#define WARDEN_POLICY_CLASSIFIER_HPP
/**
 * @file Classifier.hpp
 * @brief Verdicts for GPU processes and cross-cycle grace tracking.
 *
 * Classification is total: every inventory entry yields exactly one Decision.
 * A process is AUTHORIZED only when its ancestry reaches a launch root that
 * belongs to a job in the same cycle's snapshot and the process runs as the
 * job's owner. Everything else, including a broken ancestry walk, is
 * UNAUTHORIZED.
 *
 * Grace state is updated in two phases. evaluate() is const and returns the
 * proposed next state with the decisions; commit() installs it. A cycle that
 * aborts after evaluate() leaves the state untouched.
 */

#include "src/gpu/inc/DeviceInventory.hpp"
#include "src/process/inc/AncestryResolver.hpp"
#include "src/process/inc/ProcessTree.hpp"
#include "src/scheduler/inc/JobIndex.hpp"

#include <cstddef> // std::size_t
#include <cstdint> // std::int32_t, std::uint64_t, std::uint8_t
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace warden {

namespace policy {

/* ----------------------------- Constants ----------------------------- */

/// Default number of consecutive UNAUTHORIZED rounds before enforcement.
inline constexpr int DEFAULT_GRACE_CYCLES = 2;

inline constexpr const char* REASON_NO_LAUNCH_ROOT = "no launch root in ancestry";
inline constexpr const char* REASON_ANCESTRY_UNRESOLVED = "ancestry unresolved";
inline constexpr const char* REASON_JOB_INACTIVE = "job no longer active";
inline constexpr const char* REASON_DEVICE_NOT_ALLOCATED = "device not allocated to job";
inline constexpr const char* REASON_OWNER_MISMATCH = "process owner differs from job owner";
inline constexpr const char* REASON_OWNER_UNKNOWN = "process owner unknown";

/* ----------------------------- Types ----------------------------- */

enum class Verdict : std::uint8_t {
  AUTHORIZED = 0,
  UNAUTHORIZED,
};

/**
 * @brief Convert Verdict to string.
 * @param verdict Verdict value.
 * @return "AUTHORIZED" or "UNAUTHORIZED".
 */
[[nodiscard]] const char* toString(Verdict verdict) noexcept;

/**
 * @brief Classification of one GpuProcessEntry in one cycle. Immutable once produced.
 */
struct Decision {
  std::int32_t pid{0};
  int deviceId{-1};
  std::uint64_t memoryBytes{0};
  Verdict verdict{Verdict::UNAUTHORIZED};
  std::optional<std::string> jobId; ///< Always a job of the same cycle's snapshot
  std::string reason;
  bool confirmed{false}; ///< UNAUTHORIZED and past the grace period
  std::string command;   ///< Process command line; empty if unknown
  std::string owner;     ///< User the process runs as; empty if unknown

  [[nodiscard]] bool authorized() const noexcept { return verdict == Verdict::AUTHORIZED; }

  /// True if the Enforcer must act on this decision.
  [[nodiscard]] bool actionable() const noexcept {
    return verdict == Verdict::UNAUTHORIZED && confirmed;
  }

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/// Per-PID grace bookkeeping.
struct GraceEntry {
  std::uint64_t firstSeenUnauthorizedMs{0};
  int deviceId{-1};
  int consecutiveRounds{0};
  std::uint64_t lastRound{0}; ///< Classification round that last saw the PID unauthorized
};

/// Grace state keyed by host PID.
using GraceState = std::map<std::int32_t, GraceEntry>;

/**
 * @brief Output of evaluate(): decisions and the grace state to commit.
 */
struct ClassificationRound {
  std::uint64_t round{0}; ///< Round number this evaluation would commit as
  std::vector<Decision> decisions;
  GraceState nextGrace;
};

/// Classifier settings.
struct ClassifierConfig {
  int graceCycles{DEFAULT_GRACE_CYCLES}; ///< >= 1
  bool enforceAllocation{false};         ///< Restrict jobs to their allocated GPU indices
  std::size_t maxAncestryDepth{process::DEFAULT_MAX_ANCESTRY_DEPTH};
};

/* ----------------------------- Classifier ----------------------------- */

/**
 * @brief Owns the grace map; stateless apart from it.
 *
 * A PID seen on several devices is judged once; if any of its entries is
 * UNAUTHORIZED the PID counts as unauthorized for grace purposes.
 */
class Classifier {
public:
  Classifier(process::ProcessTree& tree, ClassifierConfig config);

  /**
   * @brief Classify every entry of an OK inventory against an OK snapshot.
   * @param inventory Device inventory of this cycle.
   * @param snapshot Job snapshot of this cycle.
   * @return Decisions (one per entry, in inventory order) and proposed grace state.
   * @note Reads the process tree; does not modify classifier state.
   */
  [[nodiscard]] ClassificationRound evaluate(const gpu::DeviceInventory& inventory,
                                             const scheduler::JobSnapshot& snapshot) const;

  /// Install the grace state of an evaluated round.
  void commit(ClassificationRound round);

  [[nodiscard]] const GraceState& graceState() const noexcept { return grace_; }
  [[nodiscard]] std::uint64_t roundsCommitted() const noexcept { return rounds_; }
  [[nodiscard]] const ClassifierConfig& config() const noexcept { return config_; }

private:
  process::ProcessTree& tree_;
  ClassifierConfig config_;
  GraceState grace_;
  std::uint64_t rounds_{0};
};

} // namespace policy

} // namespace warden

#endif // WARDEN_POLICY_CLASSIFIER_HPP
