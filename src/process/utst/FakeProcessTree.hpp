#ifndef WARDEN_PROCESS_FAKE_PROCESS_TREE_HPP
#define WARDEN_PROCESS_FAKE_PROCESS_TREE_HPP
/**
 * @file FakeProcessTree.hpp
 * @brief In-memory ProcessTree for unit tests.
 */

#include "src/process/inc/ProcessTree.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace warden {
namespace process {
namespace test {

/**
 * @brief Deterministic process table.
 *
 * Host PID 1 is always present with parent 0. nsPids lists namespace-local
 * PIDs innermost last (excluding the host PID) for containerized processes.
 * Processes belong to alice (UID 1000) with no readable exe link unless
 * setOwner/setExecutable say otherwise; addStepd adds a root-owned slurmstepd.
 */
class FakeProcessTree final : public ProcessTree {
public:
  struct Proc {
    std::int32_t ppid{0};
    std::string command;
    std::vector<std::int32_t> nsPids;
    std::uint32_t uid{1000};
    std::string user{"alice"};
    std::string exe;
  };

  FakeProcessTree() {
    add(1, 0, "/sbin/init");
    setOwner(1, 0, "root");
    setExecutable(1, "/usr/lib/systemd/systemd");
  }

  FakeProcessTree& add(std::int32_t pid, std::int32_t ppid, std::string command = {},
                       std::vector<std::int32_t> nsPids = {}) {
    Proc proc{};
    proc.ppid = ppid;
    proc.command = std::move(command);
    proc.nsPids = std::move(nsPids);
    procs_[pid] = std::move(proc);
    return *this;
  }

  /// Add a root-owned process running /usr/sbin/slurmstepd.
  FakeProcessTree& addStepd(std::int32_t pid, std::int32_t ppid, std::string command) {
    add(pid, ppid, std::move(command));
    setOwner(pid, 0, "root");
    return setExecutable(pid, "/usr/sbin/slurmstepd");
  }

  FakeProcessTree& setOwner(std::int32_t pid, std::uint32_t uid, std::string user) {
    Proc& proc = procs_[pid];
    proc.uid = uid;
    proc.user = std::move(user);
    return *this;
  }

  FakeProcessTree& setExecutable(std::int32_t pid, std::string exe) {
    procs_[pid].exe = std::move(exe);
    return *this;
  }

  void remove(std::int32_t pid) { procs_.erase(pid); }

  /// Make getParent(pid) fail while the process still "exists" for namespace lookups.
  void vanishOnParentLookup(std::int32_t pid) { vanishing_.push_back(pid); }

  /// Make getOwner(pid) fail while the process is otherwise visible.
  void hideOwner(std::int32_t pid) { hiddenOwners_.push_back(pid); }

  [[nodiscard]] ParentLookup getParent(std::int32_t pid) override {
    ++parentLookups;
    for (const std::int32_t V : vanishing_) {
      if (V == pid) {
        return {};
      }
    }
    const auto IT = procs_.find(pid);
    if (IT == procs_.end()) {
      return {};
    }
    return ParentLookup{LookupStatus::OK, IT->second.ppid};
  }

  [[nodiscard]] NamespaceMapping getNamespaceMapping(std::int32_t pid) override {
    const auto IT = procs_.find(pid);
    if (IT == procs_.end()) {
      return {};
    }
    NamespaceMapping out{};
    out.hostPid = pid;
    if (IT->second.nsPids.empty()) {
      out.status = LookupStatus::NOT_APPLICABLE;
      out.localPid = pid;
      out.depth = 0;
    } else {
      out.status = LookupStatus::OK;
      out.localPid = IT->second.nsPids.back();
      out.depth = static_cast<int>(IT->second.nsPids.size());
    }
    return out;
  }

  [[nodiscard]] std::string getCommand(std::int32_t pid) override {
    const auto IT = procs_.find(pid);
    return IT == procs_.end() ? std::string{} : IT->second.command;
  }

  [[nodiscard]] OwnerLookup getOwner(std::int32_t pid) override {
    for (const std::int32_t H : hiddenOwners_) {
      if (H == pid) {
        return {};
      }
    }
    const auto IT = procs_.find(pid);
    if (IT == procs_.end()) {
      return {};
    }
    OwnerLookup out{};
    out.status = LookupStatus::OK;
    out.uid = IT->second.uid;
    out.allRoot = IT->second.uid == 0;
    out.user = IT->second.user;
    return out;
  }

  [[nodiscard]] std::string getExecutable(std::int32_t pid) override {
    const auto IT = procs_.find(pid);
    return IT == procs_.end() ? std::string{} : IT->second.exe;
  }

  [[nodiscard]] std::vector<std::int32_t> listPids() override {
    std::vector<std::int32_t> out;
    for (const auto& KV : procs_) {
      out.push_back(KV.first);
    }
    return out;
  }

  int parentLookups{0};

private:
  std::map<std::int32_t, Proc> procs_;
  std::vector<std::int32_t> vanishing_;
  std::vector<std::int32_t> hiddenOwners_;
};

} // namespace test
} // namespace process
} // namespace warden

#endif // WARDEN_PROCESS_FAKE_PROCESS_TREE_HPP
