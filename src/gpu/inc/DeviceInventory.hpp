#ifndef WARDEN_GPU_DEVICE_INVENTORY_HPP
#define WARDEN_GPU_DEVICE_INVENTORY_HPP
/**
 * @file DeviceInventory.hpp
 * @brief Device Inventory Reader: which processes hold GPU memory right now.
 * @note Linux-only. Backends: nvidia-smi (default) and NVML.
 *
 * Each call produces a fresh snapshot. Nothing is cached between calls. A
 * snapshot that is not OK must not be acted upon; the caller aborts the cycle.
 */

#include "src/helpers/inc/QueryStatus.hpp"

#include <chrono>  // std::chrono::milliseconds
#include <cstdint> // std::int32_t, std::uint64_t
#include <string>  // std::string
#include <string_view>
#include <unordered_map>
#include <vector> // std::vector

namespace warden {

namespace gpu {

using helpers::QueryStatus;

/* ----------------------------- GpuProcessEntry ----------------------------- */

/**
 * @brief One process observed holding memory on one GPU.
 *
 * A process using two GPUs yields two entries.
 */
struct GpuProcessEntry {
  std::int32_t pid{0};           ///< Host PID as reported by the driver
  int deviceId{-1};              ///< GPU ordinal (0-based)
  std::uint64_t memoryBytes{0};  ///< GPU memory used; 0 if the driver reports N/A
  std::uint64_t observedAtMs{0}; ///< Wall-clock observation time (epoch ms)

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- DeviceInventory ----------------------------- */

/**
 * @brief Result of one device query.
 */
struct DeviceInventory {
  QueryStatus status{QueryStatus::UNAVAILABLE};
  std::vector<GpuProcessEntry> entries; ///< Valid only when status == OK
  std::string detail;                   ///< Failure description (empty on success)

  [[nodiscard]] bool ok() const noexcept { return status == QueryStatus::OK; }
};

/* ----------------------------- DeviceQuery ----------------------------- */

/**
 * @brief Source of GPU process inventories.
 *
 * Also used by the Enforcer to re-check whether a signalled process still
 * holds a device.
 */
class DeviceQuery {
public:
  virtual ~DeviceQuery() = default;

  /// Take a fresh inventory of compute processes on every GPU.
  [[nodiscard]] virtual DeviceInventory query() = 0;

  /// Human-friendly backend name for diagnostics.
  [[nodiscard]] virtual const char* name() const noexcept = 0;
};

/**
 * @brief Inventory via the nvidia-smi CLI.
 *
 * Runs `nvidia-smi -L` for the UUID->index map and
 * `nvidia-smi --query-compute-apps=gpu_uuid,pid,used_memory --format=csv,noheader,nounits`
 * for the process rows, each bounded by the timeout.
 */
class SmiDeviceQuery final : public DeviceQuery {
public:
  explicit SmiDeviceQuery(std::chrono::milliseconds timeout, std::string smiPath = "nvidia-smi");

  [[nodiscard]] DeviceInventory query() override;
  [[nodiscard]] const char* name() const noexcept override { return "nvidia-smi"; }

private:
  std::chrono::milliseconds timeout_;
  std::string smiPath_;
};

/**
 * @brief Inventory via NVML (nvmlDeviceGetComputeRunningProcesses).
 *
 * Reports UNAVAILABLE when the build has no NVML or the library fails to
 * initialize. Runs in-process, so no timeout is applied.
 */
class NvmlDeviceQuery final : public DeviceQuery {
public:
  [[nodiscard]] DeviceInventory query() override;
  [[nodiscard]] const char* name() const noexcept override { return "nvml"; }

  /// True if this build was compiled against NVML.
  [[nodiscard]] static bool compiledIn() noexcept;
};

/* ----------------------------- Parsing API ----------------------------- */

/// GPU/MIG UUID -> GPU ordinal.
using UuidIndexMap = std::unordered_map<std::string, int>;

/**
 * @brief Parse `nvidia-smi -L` output.
 * @param text Command stdout.
 * @param out UUID map; MIG UUIDs map to their parent GPU's ordinal.
 * @return false if any non-blank line is not a GPU or MIG line.
 *
 * Example input:
 *   GPU 0: NVIDIA A100-SXM4-40GB (UUID: GPU-5d5ba8f6-...)
 *     MIG 1g.5gb      Device  0: (UUID: MIG-11c2...)
 */
[[nodiscard]] bool parseSmiDeviceList(std::string_view text, UuidIndexMap& out);

/**
 * @brief Parse `--query-compute-apps=gpu_uuid,pid,used_memory` CSV rows.
 * @param text Command stdout (noheader, nounits; memory in MiB).
 * @param uuids Map from parseSmiDeviceList().
 * @param observedAtMs Timestamp stamped on every entry.
 * @return OK with entries, or MALFORMED with detail naming the bad row.
 */
[[nodiscard]] DeviceInventory parseSmiComputeApps(std::string_view text, const UuidIndexMap& uuids,
                                                  std::uint64_t observedAtMs);

/**
 * @brief Collapse entries sharing (pid, deviceId), summing their memory.
 * @param entries Entries in driver order; first occurrence keeps its position.
 *
 * A process on two MIG instances of one GPU is reported twice for that GPU.
 */
void mergeDuplicateEntries(std::vector<GpuProcessEntry>& entries);

} // namespace gpu

} // namespace warden

#endif // WARDEN_GPU_DEVICE_INVENTORY_HPP
