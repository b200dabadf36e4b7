#ifndef WARDEN_CYCLE_FAKES_HPP
#define WARDEN_CYCLE_FAKES_HPP
/**
 * @file Fakes.hpp
 * @brief Scripted collaborators for Reconciler tests.
 */

#include "src/audit/inc/AuditLog.hpp"
#include "src/enforce/utst/RecordingSignalSender.hpp"
#include "src/gpu/utst/FakeDeviceQuery.hpp"
#include "src/process/utst/FakeProcessTree.hpp"
#include "src/scheduler/inc/JobIndex.hpp"

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace warden {
namespace cycle {
namespace test {

/**
 * @brief Returns queued snapshots in order, then the steady-state one.
 */
class FakeSchedulerQuery final : public scheduler::SchedulerQuery {
public:
  static scheduler::JobSnapshot ok(std::vector<scheduler::JobRecord> jobs) {
    scheduler::JobSnapshot snap{};
    snap.status = scheduler::QueryStatus::OK;
    snap.jobs = std::move(jobs);
    return snap;
  }

  static scheduler::JobSnapshot failed(scheduler::QueryStatus status,
                                       std::string detail = "scripted failure") {
    scheduler::JobSnapshot snap{};
    snap.status = status;
    snap.detail = std::move(detail);
    return snap;
  }

  static scheduler::JobRecord job(std::string id, process::PidSet roots,
                                  std::string owner = "alice") {
    scheduler::JobRecord rec{};
    rec.jobId = std::move(id);
    rec.ownerUser = std::move(owner);
    rec.launchRoots = std::move(roots);
    return rec;
  }

  void push(scheduler::JobSnapshot snap) { queue_.push_back(std::move(snap)); }
  void setSteady(scheduler::JobSnapshot snap) { steady_ = std::move(snap); }

  [[nodiscard]] scheduler::JobSnapshot query() override {
    ++calls;
    if (!queue_.empty()) {
      scheduler::JobSnapshot next = std::move(queue_.front());
      queue_.pop_front();
      return next;
    }
    return steady_;
  }

  [[nodiscard]] const char* name() const noexcept override { return "fake-scheduler"; }

  int calls{0};

private:
  std::deque<scheduler::JobSnapshot> queue_;
  scheduler::JobSnapshot steady_{ok({})};
};

/**
 * @brief AuditSink keeping records in memory, with scripted failures.
 */
class MemoryAuditSink final : public audit::AuditSink {
public:
  [[nodiscard]] bool append(std::string_view record) override {
    if (failAppendAfter >= 0 && static_cast<int>(lines.size()) >= failAppendAfter) {
      error_ = "scripted append failure";
      return false;
    }
    lines.emplace_back(record);
    return true;
  }

  [[nodiscard]] bool flush() override {
    ++flushes;
    if (failFlush) {
      error_ = "scripted flush failure";
      return false;
    }
    return true;
  }

  [[nodiscard]] std::uint64_t lastCycleId() const noexcept override { return lastCycle; }
  [[nodiscard]] const std::string& lastError() const noexcept override { return error_; }

  /// Records whose text contains needle.
  [[nodiscard]] std::size_t count(std::string_view needle) const {
    std::size_t n = 0;
    for (const std::string& L : lines) {
      if (L.find(needle) != std::string::npos) {
        ++n;
      }
    }
    return n;
  }

  std::vector<std::string> lines;
  int failAppendAfter{-1}; ///< Fail once this many lines are stored; -1 never
  bool failFlush{false};
  int flushes{0};
  std::uint64_t lastCycle{0};

private:
  std::string error_;
};

} // namespace test
} // namespace cycle
} // namespace warden

#endif // WARDEN_CYCLE_FAKES_HPP
