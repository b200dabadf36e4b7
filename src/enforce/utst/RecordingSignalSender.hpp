#ifndef WARDEN_ENFORCE_RECORDING_SIGNAL_SENDER_HPP
#define WARDEN_ENFORCE_RECORDING_SIGNAL_SENDER_HPP
/**
 * @file RecordingSignalSender.hpp
 * @brief SignalSender that records requests and returns scripted results.
 */

#include "src/enforce/inc/SignalSender.hpp"

#include <csignal>
#include <cstdint>
#include <functional>
#include <map>
#include <set>
#include <utility>
#include <vector>

namespace warden {
namespace enforce {
namespace test {

/**
 * @brief Records every (pid, signal); SUCCESS unless scripted otherwise.
 *
 * PIDs in alive() are "running". A successful SIGKILL removes the PID.
 */
class RecordingSignalSender final : public SignalSender {
public:
  using Hook = std::function<void(std::int32_t pid, int sig)>;

  void setResult(std::int32_t pid, int sig, SignalResult result) {
    results_[{pid, sig}] = result;
  }
  void setAlive(std::int32_t pid) { alive_.insert(pid); }
  void onSend(Hook hook) { hook_ = std::move(hook); }

  [[nodiscard]] SignalResult send(std::int32_t pid, int sig) override {
    sent.emplace_back(pid, sig);
    if (hook_) {
      hook_(pid, sig);
    }
    const auto IT = results_.find({pid, sig});
    const SignalResult RES = IT == results_.end() ? SignalResult::SUCCESS : IT->second;
    if (RES == SignalResult::SUCCESS && sig == SIGKILL) {
      alive_.erase(pid);
    }
    return RES;
  }

  [[nodiscard]] bool isAlive(std::int32_t pid) override { return alive_.count(pid) != 0; }
  [[nodiscard]] const char* name() const noexcept override { return "recording"; }

  /// Signals sent to pid, in order.
  [[nodiscard]] std::vector<int> signalsFor(std::int32_t pid) const {
    std::vector<int> out;
    for (const auto& P : sent) {
      if (P.first == pid) {
        out.push_back(P.second);
      }
    }
    return out;
  }

  std::vector<std::pair<std::int32_t, int>> sent;

private:
  std::map<std::pair<std::int32_t, int>, SignalResult> results_;
  std::set<std::int32_t> alive_;
  Hook hook_;
};

} // namespace test
} // namespace enforce
} // namespace warden

#endif // WARDEN_ENFORCE_RECORDING_SIGNAL_SENDER_HPP
