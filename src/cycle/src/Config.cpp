/**
 * @file Config.cpp
 * @brief Command-line parsing and validation for gpu-warden.
 */

#include "src/cycle/inc/Config.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <fmt/core.h>

namespace warden {

namespace cycle {

namespace {

namespace args = helpers::args;

/// Parse a bounded integer flag value.
bool parseBounded(const args::ParsedArgs& pargs, std::uint8_t key, std::string_view flag,
                  std::int64_t lo, std::int64_t hi, std::int64_t& out, std::string& error) {
  const std::optional<std::string_view> VALUE = args::firstValue(pargs, key);
  if (!VALUE) {
    return true;
  }
  std::int64_t parsed = 0;
  if (!helpers::strings::parseInt64(*VALUE, parsed) || parsed < lo || parsed > hi) {
    error = fmt::format("{} must be an integer in [{}, {}], got '{}'", flag, lo, hi, *VALUE);
    return false;
  }
  out = parsed;
  return true;
}

/// Non-empty string flag value.
bool parseString(const args::ParsedArgs& pargs, std::uint8_t key, std::string_view flag,
                 std::string& out, std::string& error) {
  const std::optional<std::string_view> VALUE = args::firstValue(pargs, key);
  if (!VALUE) {
    return true;
  }
  if (VALUE->empty()) {
    error = fmt::format("{} must not be empty", flag);
    return false;
  }
  out.assign(*VALUE);
  return true;
}

} // namespace

/* ----------------------------- Enums ----------------------------- */

const char* toString(DeviceSource source) noexcept {
  switch (source) {
  case DeviceSource::SMI:
    return "smi";
  case DeviceSource::NVML:
    return "nvml";
  default:
    return "unknown";
  }
}

const char* toString(Privilege privilege) noexcept {
  switch (privilege) {
  case Privilege::DIRECT:
    return "direct";
  case Privilege::SUDO:
    return "sudo";
  default:
    return "unknown";
  }
}

std::string WardenConfig::toString() const {
  return fmt::format("interval={}s grace={} term-wait={}ms query-timeout={}ms max-depth={} "
                     "devices={} privilege={} node={} proc-root={} audit={}{}{}{}",
                     interval.count(), graceCycles, termWait.count(), queryTimeout.count(),
                     maxDepth, cycle::toString(deviceSource), cycle::toString(privilege),
                     node.empty() ? "<host>" : node, procRoot, auditLogPath,
                     dryRun ? " dry-run" : "", enforceAllocation ? " enforce-allocation" : "",
                     once ? " once" : "");
}

/* ----------------------------- Parsing ----------------------------- */

args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_ONCE] = {"--once", 0, false, "Run one cycle and exit"};
  map[ARG_INTERVAL] = {"--interval", 1, false, "Seconds between cycles (default: 60)"};
  map[ARG_GRACE_CYCLES] = {"--grace-cycles", 1, false,
                           "Consecutive unauthorized cycles before enforcing (default: 2)"};
  map[ARG_TERM_WAIT] = {"--term-wait", 1, false, "SIGTERM to SIGKILL wait in ms (default: 5000)"};
  map[ARG_QUERY_TIMEOUT] = {"--query-timeout", 1, false,
                            "Timeout per external command in ms (default: 10000)"};
  map[ARG_MAX_DEPTH] = {"--max-depth", 1, false, "Ancestry walk depth cap (default: 512)"};
  map[ARG_AUDIT_LOG] = {"--audit-log", 1, false,
                        "Audit log path (default: gpu_warden_audit.jsonl)"};
  map[ARG_DEVICE_SOURCE] = {"--device-source", 1, false, "smi or nvml (default: smi)"};
  map[ARG_SMI_PATH] = {"--smi-path", 1, false, "nvidia-smi executable (default: nvidia-smi)"};
  map[ARG_NODE] = {"--node", 1, false, "Scheduler node name (default: short host name)"};
  map[ARG_PROC_ROOT] = {"--proc-root", 1, false, "procfs mount (default: /proc)"};
  map[ARG_PRIVILEGE] = {"--privilege", 1, false, "direct or sudo (default: direct)"};
  map[ARG_DRY_RUN] = {"--dry-run", 0, false, "Decide and log, but send no signals"};
  map[ARG_ENFORCE_ALLOCATION] = {"--enforce-allocation", 0, false,
                                 "Treat use of GPUs outside a job's allocation as unauthorized"};
  map[ARG_JSON] = {"--json", 0, false, "Print cycle summaries as JSON"};
  map[ARG_VERBOSE] = {"--verbose", 0, false, "Debug logging"};
  map[ARG_QUIET] = {"--quiet", 0, false, "Warnings and errors only"};
  return map;
}

bool parseConfig(std::span<const std::string_view> tokens, WardenConfig& cfg, std::string& error) {
  const args::ArgMap MAP = buildArgMap();
  args::ParsedArgs pargs;
  if (!args::parseArgs(tokens, MAP, pargs, error)) {
    return false;
  }

  cfg.help = args::hasFlag(pargs, ARG_HELP);
  cfg.once = args::hasFlag(pargs, ARG_ONCE);
  cfg.dryRun = args::hasFlag(pargs, ARG_DRY_RUN);
  cfg.enforceAllocation = args::hasFlag(pargs, ARG_ENFORCE_ALLOCATION);
  cfg.json = args::hasFlag(pargs, ARG_JSON);

  if (args::hasFlag(pargs, ARG_VERBOSE) && args::hasFlag(pargs, ARG_QUIET)) {
    error = "--verbose and --quiet are mutually exclusive";
    return false;
  }
  if (args::hasFlag(pargs, ARG_VERBOSE)) {
    cfg.logLevel = helpers::log::Level::DEBUG;
  } else if (args::hasFlag(pargs, ARG_QUIET)) {
    cfg.logLevel = helpers::log::Level::WARN;
  }

  std::int64_t value = cfg.interval.count();
  if (!parseBounded(pargs, ARG_INTERVAL, "--interval", 1, 86400, value, error)) {
    return false;
  }
  cfg.interval = std::chrono::seconds(value);

  value = cfg.graceCycles;
  if (!parseBounded(pargs, ARG_GRACE_CYCLES, "--grace-cycles", 1, 1000, value, error)) {
    return false;
  }
  cfg.graceCycles = static_cast<int>(value);

  value = cfg.termWait.count();
  if (!parseBounded(pargs, ARG_TERM_WAIT, "--term-wait", 0, 600000, value, error)) {
    return false;
  }
  cfg.termWait = std::chrono::milliseconds(value);

  value = cfg.queryTimeout.count();
  if (!parseBounded(pargs, ARG_QUERY_TIMEOUT, "--query-timeout", 100, 600000, value, error)) {
    return false;
  }
  cfg.queryTimeout = std::chrono::milliseconds(value);

  value = static_cast<std::int64_t>(cfg.maxDepth);
  if (!parseBounded(pargs, ARG_MAX_DEPTH, "--max-depth", 1, 1 << 22, value, error)) {
    return false;
  }
  cfg.maxDepth = static_cast<std::size_t>(value);

  if (!parseString(pargs, ARG_AUDIT_LOG, "--audit-log", cfg.auditLogPath, error) ||
      !parseString(pargs, ARG_SMI_PATH, "--smi-path", cfg.smiPath, error) ||
      !parseString(pargs, ARG_NODE, "--node", cfg.node, error) ||
      !parseString(pargs, ARG_PROC_ROOT, "--proc-root", cfg.procRoot, error)) {
    return false;
  }

  if (const std::optional<std::string_view> SRC = args::firstValue(pargs, ARG_DEVICE_SOURCE)) {
    if (*SRC == "smi") {
      cfg.deviceSource = DeviceSource::SMI;
    } else if (*SRC == "nvml") {
      cfg.deviceSource = DeviceSource::NVML;
    } else {
      error = fmt::format("--device-source must be 'smi' or 'nvml', got '{}'", *SRC);
      return false;
    }
  }

  if (const std::optional<std::string_view> PRIV = args::firstValue(pargs, ARG_PRIVILEGE)) {
    if (*PRIV == "direct") {
      cfg.privilege = Privilege::DIRECT;
    } else if (*PRIV == "sudo") {
      cfg.privilege = Privilege::SUDO;
    } else {
      error = fmt::format("--privilege must be 'direct' or 'sudo', got '{}'", *PRIV);
      return false;
    }
  }

  return true;
}

} // namespace cycle

} // namespace warden
