/**
 * @file Enforcer.cpp
 * @brief SIGTERM, wait for GPU release, SIGKILL.
 */

#include "src/enforce/inc/Enforcer.hpp"
#include "src/helpers/inc/Clock.hpp"
#include "src/helpers/inc/Log.hpp"

#include <signal.h> // SIGTERM, SIGKILL

#include <algorithm> // std::min
#include <thread>    // std::this_thread::sleep_for

#include <fmt/core.h>

namespace warden {

namespace enforce {

namespace {

constexpr const char* COMPONENT = "enforce";

} // namespace

/* ----------------------------- OutcomeStatus ----------------------------- */

const char* toString(OutcomeStatus status) noexcept {
  switch (status) {
  case OutcomeStatus::SUCCEEDED:
    return "SUCCEEDED";
  case OutcomeStatus::FAILED:
    return "FAILED";
  case OutcomeStatus::PROCESS_ALREADY_GONE:
    return "PROCESS_ALREADY_GONE";
  default:
    return "UNKNOWN";
  }
}

std::string EnforcementOutcome::toString() const {
  return fmt::format("PID {} on GPU {}: {} via {}{}{} ({})", pid, deviceId,
                     enforce::toString(status), signalName(signalSent),
                     escalated ? ", escalated" : "", dryRun ? ", dry run" : "", detail);
}

/* ----------------------------- Enforcer ----------------------------- */

Enforcer::Enforcer(SignalSender& sender, gpu::DeviceQuery& devices, EnforcerConfig config) noexcept
    : sender_(sender), devices_(devices), config_(config) {}

bool Enforcer::stillHoldsDevice(std::int32_t pid) {
  const gpu::DeviceInventory INV = devices_.query();
  if (!INV.ok()) {
    helpers::log::debug(COMPONENT, "device re-query failed ({}), checking liveness of {}",
                        helpers::toString(INV.status), pid);
    return sender_.isAlive(pid);
  }
  for (const gpu::GpuProcessEntry& ENTRY : INV.entries) {
    if (ENTRY.pid == pid) {
      return true;
    }
  }
  return false;
}

EnforcementOutcome Enforcer::enforce(std::int32_t pid, int deviceId) {
  EnforcementOutcome out{};
  out.pid = pid;
  out.deviceId = deviceId;
  out.dryRun = sender_.isDryRun();

  /* ---- SIGTERM ---- */
  out.signalSent = SIGTERM;
  const SignalResult TERM = sender_.send(pid, SIGTERM);
  if (TERM == SignalResult::NO_SUCH_PROCESS) {
    out.status = OutcomeStatus::PROCESS_ALREADY_GONE;
    out.detail = "process exited before SIGTERM";
    out.timestampMs = helpers::clock::getRealtimeMs();
    return out;
  }
  if (TERM != SignalResult::SUCCESS) {
    out.status = OutcomeStatus::FAILED;
    out.detail = fmt::format("SIGTERM via {}: {}", sender_.name(), toString(TERM));
    out.timestampMs = helpers::clock::getRealtimeMs();
    helpers::log::error(COMPONENT, "cannot signal PID {}: {}", pid, out.detail);
    return out;
  }

  if (out.dryRun) {
    out.status = OutcomeStatus::SUCCEEDED;
    out.detail = "dry run, no signal sent";
    out.timestampMs = helpers::clock::getRealtimeMs();
    return out;
  }

  /* ---- Wait for release ---- */
  const std::uint64_t DEADLINE_NS =
      helpers::clock::getMonotonicNs() +
      static_cast<std::uint64_t>(config_.termWait.count()) * 1'000'000ULL;
  bool holding = true;
  while (true) {
    const std::uint64_t NOW = helpers::clock::getMonotonicNs();
    if (NOW >= DEADLINE_NS) {
      break;
    }
    const auto REMAINING = std::chrono::milliseconds((DEADLINE_NS - NOW) / 1'000'000ULL);
    std::this_thread::sleep_for(std::min(config_.pollInterval, REMAINING));
    if (!stillHoldsDevice(pid)) {
      holding = false;
      break;
    }
  }
  if (holding && config_.termWait.count() <= 0) {
    holding = stillHoldsDevice(pid);
  }

  if (!holding) {
    out.status = OutcomeStatus::SUCCEEDED;
    out.detail = "released after SIGTERM";
    out.timestampMs = helpers::clock::getRealtimeMs();
    return out;
  }

  /* ---- SIGKILL ---- */
  out.escalated = true;
  out.signalSent = SIGKILL;
  const SignalResult KILL = sender_.send(pid, SIGKILL);
  out.timestampMs = helpers::clock::getRealtimeMs();
  if (KILL == SignalResult::SUCCESS) {
    out.status = OutcomeStatus::SUCCEEDED;
    out.detail = fmt::format("still holding GPU after {} ms, killed", config_.termWait.count());
  } else if (KILL == SignalResult::NO_SUCH_PROCESS) {
    out.status = OutcomeStatus::SUCCEEDED;
    out.detail = "exited before SIGKILL";
  } else {
    out.status = OutcomeStatus::FAILED;
    out.detail = fmt::format("SIGKILL via {}: {}", sender_.name(), toString(KILL));
    helpers::log::error(COMPONENT, "cannot kill PID {}: {}", pid, out.detail);
  }
  return out;
}

} // namespace enforce

} // namespace warden
