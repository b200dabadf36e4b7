#ifndef WARDEN_CYCLE_CONFIG_HPP
#define WARDEN_CYCLE_CONFIG_HPP
/**
 * @file Config.hpp
 * @brief gpu-warden runtime configuration from the command line.
 */

#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Log.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace warden {

namespace cycle {

/* ----------------------------- Enums ----------------------------- */

/// Device inventory backend.
enum class DeviceSource : std::uint8_t {
  SMI = 0, ///< nvidia-smi CLI
  NVML,    ///< libnvidia-ml
};

/// How signals are delivered.
enum class Privilege : std::uint8_t {
  DIRECT = 0, ///< kill(2) from this process
  SUDO,       ///< sudo -n kill
};

[[nodiscard]] const char* toString(DeviceSource source) noexcept;
[[nodiscard]] const char* toString(Privilege privilege) noexcept;

/* ----------------------------- WardenConfig ----------------------------- */

/**
 * @brief Everything a gpu-warden run needs. Defaults match a 60 s polling daemon.
 */
struct WardenConfig {
  bool once{false};                          ///< Run a single cycle and exit
  std::chrono::seconds interval{60};         ///< Sleep between cycles
  int graceCycles{2};                        ///< Consecutive UNAUTHORIZED rounds before enforcing
  std::chrono::milliseconds termWait{5000};  ///< SIGTERM -> SIGKILL window
  std::chrono::milliseconds queryTimeout{10000}; ///< Budget per external command
  std::size_t maxDepth{512};                 ///< Ancestry walk cap
  std::string auditLogPath{"gpu_warden_audit.jsonl"};
  DeviceSource deviceSource{DeviceSource::SMI};
  std::string smiPath{"nvidia-smi"};
  std::string node; ///< Empty: this host's short name
  std::string procRoot{"/proc"};
  Privilege privilege{Privilege::DIRECT};
  bool dryRun{false};
  bool enforceAllocation{false};
  bool json{false};
  helpers::log::Level logLevel{helpers::log::Level::INFO};
  bool help{false};

  /// One-line description for the startup log.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- Parsing ----------------------------- */

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_ONCE,
  ARG_INTERVAL,
  ARG_GRACE_CYCLES,
  ARG_TERM_WAIT,
  ARG_QUERY_TIMEOUT,
  ARG_MAX_DEPTH,
  ARG_AUDIT_LOG,
  ARG_DEVICE_SOURCE,
  ARG_SMI_PATH,
  ARG_NODE,
  ARG_PROC_ROOT,
  ARG_PRIVILEGE,
  ARG_DRY_RUN,
  ARG_ENFORCE_ALLOCATION,
  ARG_JSON,
  ARG_VERBOSE,
  ARG_QUIET,
};

/// Tool description for --help.
inline constexpr std::string_view DESCRIPTION =
    "Terminate GPU processes that no running scheduler job launched.";

/// Flag definitions for gpu-warden.
[[nodiscard]] helpers::args::ArgMap buildArgMap();

/**
 * @brief Populate a config from command-line tokens (program name excluded).
 * @param args Tokens.
 * @param cfg Output; fields not named on the command line keep their defaults.
 * @param error One-line message on failure.
 * @return false on unknown flags, missing values, or out-of-range values.
 */
[[nodiscard]] bool parseConfig(std::span<const std::string_view> args, WardenConfig& cfg,
                               std::string& error);

} // namespace cycle

} // namespace warden

#endif // WARDEN_CYCLE_CONFIG_HPP
