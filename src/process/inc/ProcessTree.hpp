#ifndef WARDEN_PROCESS_PROCESS_TREE_HPP
#define WARDEN_PROCESS_PROCESS_TREE_HPP
/**
 * @file ProcessTree.hpp
 * @brief Host process tree view: parents, PID-namespace mapping, command lines.
 * @note Linux-only. Reads /proc/<pid>/stat, /proc/<pid>/status, /proc/<pid>/cmdline
 *       and the /proc/<pid>/exe link.
 *
 * The tree is live and mutates under the reader: any lookup may report
 * NO_SUCH_PROCESS because the process exited between two reads.
 */

#include <array>   // std::array
#include <cstdint> // std::int32_t, std::uint8_t, std::uint32_t
#include <string>  // std::string
#include <string_view>
#include <unordered_map>
#include <vector> // std::vector

namespace warden {

namespace process {

/* ----------------------------- Types ----------------------------- */

/// Result of a single process-tree lookup.
enum class LookupStatus : std::uint8_t {
  OK = 0,          ///< Lookup succeeded
  NO_SUCH_PROCESS, ///< Process does not exist (or exited mid-read)
  NOT_APPLICABLE,  ///< Process exists but the question does not apply (e.g. not namespaced)
};

/**
 * @brief Convert LookupStatus to string.
 * @param status Status value.
 * @return Static string.
 */
[[nodiscard]] const char* toString(LookupStatus status) noexcept;

/// Parent lookup result.
struct ParentLookup {
  LookupStatus status{LookupStatus::NO_SUCH_PROCESS};
  std::int32_t parentPid{-1}; ///< 0 at the top of the visible tree
};

/**
 * @brief PID-namespace view of one process.
 *
 * With status OK the process lives in a nested PID namespace: hostPid is its
 * PID in the observer's namespace and localPid its PID in the innermost one.
 * With NOT_APPLICABLE both equal the queried PID and depth is 0.
 */
struct NamespaceMapping {
  LookupStatus status{LookupStatus::NO_SUCH_PROCESS};
  std::int32_t hostPid{-1};
  std::int32_t localPid{-1};
  int depth{0}; ///< Number of PID namespaces nested below the observer's

  /// True when the process is the init (local PID 1) of a nested namespace.
  [[nodiscard]] bool isNamespaceInit() const noexcept {
    return status == LookupStatus::OK && depth > 0 && localPid == 1;
  }
};

/// Owner of one process, from the Uid line of /proc/<pid>/status.
struct OwnerLookup {
  LookupStatus status{LookupStatus::NO_SUCH_PROCESS};
  std::uint32_t uid{0};  ///< Real UID
  bool allRoot{false};   ///< Real, effective, saved and filesystem UIDs are all 0
  std::string user;      ///< Account name of uid; the decimal UID when it has none

  [[nodiscard]] bool ok() const noexcept { return status == LookupStatus::OK; }
};

/* ----------------------------- ProcessTree ----------------------------- */

/**
 * @brief Read-only access to the host process tree.
 */
class ProcessTree {
public:
  virtual ~ProcessTree() = default;

  /// Parent PID of pid, as seen from the observer's namespace.
  [[nodiscard]] virtual ParentLookup getParent(std::int32_t pid) = 0;

  /// Namespace mapping of pid.
  [[nodiscard]] virtual NamespaceMapping getNamespaceMapping(std::int32_t pid) = 0;

  /// Command line with arguments space-separated; empty if unknown or gone.
  [[nodiscard]] virtual std::string getCommand(std::int32_t pid) = 0;

  /// Owning user of pid.
  [[nodiscard]] virtual OwnerLookup getOwner(std::int32_t pid) = 0;

  /**
   * @brief Path of the executable pid runs.
   * @return Empty if gone or unreadable (reading another user's exe link needs
   *         CAP_SYS_PTRACE). A replaced binary carries a " (deleted)" suffix.
   */
  [[nodiscard]] virtual std::string getExecutable(std::int32_t pid) = 0;

  /// All PIDs currently visible.
  [[nodiscard]] virtual std::vector<std::int32_t> listPids() = 0;
};

/**
 * @brief ProcessTree backed by procfs.
 *
 * The proc root defaults to "/proc" and may point at a copied or synthetic
 * tree (tests, chroots).
 */
class ProcfsProcessTree final : public ProcessTree {
public:
  explicit ProcfsProcessTree(std::string procRoot = "/proc");

  [[nodiscard]] ParentLookup getParent(std::int32_t pid) override;
  [[nodiscard]] NamespaceMapping getNamespaceMapping(std::int32_t pid) override;
  [[nodiscard]] std::string getCommand(std::int32_t pid) override;
  [[nodiscard]] OwnerLookup getOwner(std::int32_t pid) override;
  [[nodiscard]] std::string getExecutable(std::int32_t pid) override;
  [[nodiscard]] std::vector<std::int32_t> listPids() override;

  [[nodiscard]] const std::string& procRoot() const noexcept { return procRoot_; }

private:
  [[nodiscard]] std::string pidPath(std::int32_t pid, const char* leaf) const;
  [[nodiscard]] const std::string& userName(std::uint32_t uid);

  std::string procRoot_;
  std::unordered_map<std::uint32_t, std::string> userNames_;
};

/* ----------------------------- Parsing API ----------------------------- */

/**
 * @brief Extract the parent PID (field 4) from /proc/<pid>/stat content.
 * @param stat File content: "pid (comm) state ppid ...".
 * @param ppid Output parent PID.
 * @return false if the line is malformed.
 *
 * comm may contain spaces and parentheses; parsing starts after the last ')'.
 */
[[nodiscard]] bool parseStatParent(std::string_view stat, std::int32_t& ppid) noexcept;

/**
 * @brief Extract the NSpid list from /proc/<pid>/status content.
 * @param status File content.
 * @param nsPids Output: outermost first, innermost last.
 * @return false if there is no NSpid line (kernels before 4.1) or it is malformed.
 */
[[nodiscard]] bool parseStatusNsPids(std::string_view status, std::vector<std::int32_t>& nsPids);

/**
 * @brief Extract the Uid line from /proc/<pid>/status content.
 * @param status File content.
 * @param uids Output: real, effective, saved set and filesystem UIDs.
 * @return false if there is no Uid line or it is malformed.
 */
[[nodiscard]] bool parseStatusUids(std::string_view status, std::array<std::uint32_t, 4>& uids);

/**
 * @brief Render raw /proc/<pid>/cmdline (NUL-separated) as a single line.
 * @param raw File content.
 * @return Arguments joined by spaces, trailing separators removed.
 */
[[nodiscard]] std::string formatCmdline(std::string_view raw);

} // namespace process

} // namespace warden

#endif // WARDEN_PROCESS_PROCESS_TREE_HPP
