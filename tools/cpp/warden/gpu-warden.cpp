/**
 * @file gpu-warden.cpp
 * @brief Terminates GPU processes that no running Slurm job launched.
 *
 * Each cycle compares the GPU compute processes on this node with the jobs
 * Slurm runs here, logs every decision to the audit trail, and signals
 * processes that stayed unauthorized through the grace period.
 * Cycle summaries go to stdout; diagnostics go to stderr.
 */

#include "src/audit/inc/AuditLog.hpp"
#include "src/cycle/inc/Config.hpp"
#include "src/cycle/inc/Reconciler.hpp"
#include "src/enforce/inc/Enforcer.hpp"
#include "src/enforce/inc/SignalSender.hpp"
#include "src/gpu/inc/DeviceInventory.hpp"
#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/policy/inc/Classifier.hpp"
#include "src/process/inc/ProcessTree.hpp"
#include "src/scheduler/inc/JobIndex.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <fmt/core.h>

namespace cyc = warden::cycle;
namespace wlog = warden::helpers::log;

namespace {

constexpr const char* COMPONENT = "gpu-warden";

/// Granularity of the interruptible sleep between cycles.
constexpr auto SLEEP_SLICE = std::chrono::milliseconds(100);

/* ----------------------------- Signal Handling ----------------------------- */

volatile std::sig_atomic_t g_running = 1;

void signalHandler(int /*signum*/) { g_running = 0; }

/* ----------------------------- Wiring ----------------------------- */

std::unique_ptr<warden::gpu::DeviceQuery> makeDeviceQuery(const cyc::WardenConfig& cfg) {
  if (cfg.deviceSource == cyc::DeviceSource::NVML) {
    return std::make_unique<warden::gpu::NvmlDeviceQuery>();
  }
  return std::make_unique<warden::gpu::SmiDeviceQuery>(cfg.queryTimeout, cfg.smiPath);
}

std::unique_ptr<warden::enforce::SignalSender> makeSender(const cyc::WardenConfig& cfg) {
  if (cfg.dryRun) {
    return std::make_unique<warden::enforce::DryRunSignalSender>();
  }
  if (cfg.privilege == cyc::Privilege::SUDO) {
    return std::make_unique<warden::enforce::SudoSignalSender>(cfg.queryTimeout);
  }
  return std::make_unique<warden::enforce::DirectSignalSender>();
}

/// Sleep up to total, returning early on SIGINT/SIGTERM.
void interruptibleSleep(std::chrono::milliseconds total) {
  const auto DEADLINE = std::chrono::steady_clock::now() + total;
  while (g_running != 0) {
    const auto NOW = std::chrono::steady_clock::now();
    if (NOW >= DEADLINE) {
      return;
    }
    const auto LEFT = std::chrono::duration_cast<std::chrono::milliseconds>(DEADLINE - NOW);
    std::this_thread::sleep_for(LEFT < SLEEP_SLICE ? LEFT : SLEEP_SLICE);
  }
}

/* ----------------------------- Main Loop ----------------------------- */

int run(const cyc::WardenConfig& cfg) {
  warden::audit::FileAuditLog audit(cfg.auditLogPath);
  if (!audit.open()) {
    wlog::critical(COMPONENT, "cannot open audit log: {}", audit.lastError());
    return 1;
  }

  warden::process::ProcfsProcessTree tree(cfg.procRoot);
  const std::unique_ptr<warden::gpu::DeviceQuery> DEVICES = makeDeviceQuery(cfg);

  warden::scheduler::SlurmConfig slurm{};
  slurm.timeout = cfg.queryTimeout;
  slurm.node = cfg.node;
  slurm.fetchGpuIndices = cfg.enforceAllocation;
  warden::scheduler::SlurmSchedulerQuery scheduler(slurm, tree);

  warden::policy::ClassifierConfig policy{};
  policy.graceCycles = cfg.graceCycles;
  policy.enforceAllocation = cfg.enforceAllocation;
  policy.maxAncestryDepth = cfg.maxDepth;
  warden::policy::Classifier classifier(tree, policy);

  const std::unique_ptr<warden::enforce::SignalSender> SENDER = makeSender(cfg);
  warden::enforce::EnforcerConfig enforcement{};
  enforcement.termWait = cfg.termWait;
  warden::enforce::Enforcer enforcer(*SENDER, *DEVICES, enforcement);

  cyc::Reconciler reconciler(*DEVICES, scheduler, classifier, enforcer, audit);

  wlog::info(COMPONENT, "starting on node {}: {}", scheduler.node(), cfg.toString());
  if (cfg.once && cfg.graceCycles > 1) {
    wlog::warn(COMPONENT, "--once with --grace-cycles {} can never enforce", cfg.graceCycles);
  }

  int exitCode = 0;
  while (g_running != 0) {
    const cyc::CycleSummary SUMMARY = reconciler.runCycle();
    fmt::print("{}\n", cfg.json ? SUMMARY.toJson() : SUMMARY.toString());
    std::fflush(stdout);

    if (cfg.once) {
      exitCode = SUMMARY.completed() && SUMMARY.failures == 0 ? 0 : 2;
      break;
    }
    interruptibleSleep(std::chrono::duration_cast<std::chrono::milliseconds>(cfg.interval));
  }

  if (!cfg.once) {
    wlog::info(COMPONENT, "stopping after cycle {}", reconciler.nextCycleId() - 1);
  }
  return exitCode;
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  std::vector<std::string_view> args;
  args.reserve(static_cast<std::size_t>(argc > 1 ? argc - 1 : 0));
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }

  cyc::WardenConfig cfg{};
  std::string error;
  if (!cyc::parseConfig(args, cfg, error)) {
    fmt::print(stderr, "Error: {}\n\n", error);
    warden::helpers::args::printUsage(argv[0], cyc::DESCRIPTION, cyc::buildArgMap());
    return 1;
  }

  if (cfg.help) {
    warden::helpers::args::printUsage(argv[0], cyc::DESCRIPTION, cyc::buildArgMap());
    return 0;
  }

  wlog::setLevel(cfg.logLevel);
  return run(cfg);
}
