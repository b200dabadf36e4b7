/**
 * @file DeviceInventory.cpp
 * @brief GPU compute-process inventory via nvidia-smi or NVML.
 */

#include "src/gpu/inc/DeviceInventory.hpp"
#include "src/helpers/inc/Clock.hpp"
#include "src/helpers/inc/Exec.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <utility> // std::move
#include <vector>

#include <fmt/core.h>

#include "src/gpu/inc/compat_nvml_detect.hpp"

namespace warden {

namespace gpu {

namespace {

namespace strings = helpers::strings;

/// MiB -> bytes (nvidia-smi nounits reports MiB).
constexpr std::uint64_t BYTES_PER_MIB = 1024ULL * 1024ULL;

/// Extract "<uuid>" from "... (UUID: <uuid>)".
bool extractUuid(std::string_view line, std::string& uuid) {
  static constexpr std::string_view TAG = "(UUID: ";
  const std::size_t START = line.find(TAG);
  if (START == std::string_view::npos) {
    return false;
  }
  const std::size_t BEGIN = START + TAG.size();
  const std::size_t END = line.find(')', BEGIN);
  if (END == std::string_view::npos || END == BEGIN) {
    return false;
  }
  uuid.assign(strings::trim(line.substr(BEGIN, END - BEGIN)));
  return !uuid.empty();
}

/// Memory column: MiB integer, or a bracketed "[N/A]"-style placeholder meaning unknown.
bool parseMemoryMiB(std::string_view field, std::uint64_t& bytes) {
  field = strings::trim(field);
  if (!field.empty() && field.front() == '[') {
    bytes = 0;
    return true;
  }
  std::int64_t mib = 0;
  if (!strings::parseInt64(field, mib) || mib < 0) {
    return false;
  }
  bytes = static_cast<std::uint64_t>(mib) * BYTES_PER_MIB;
  return true;
}

#if COMPAT_NVML_AVAILABLE

/// RAII wrapper for NVML initialization.
class NvmlSession {
public:
  NvmlSession() noexcept : result_(nvmlInit_v2()) {}
  ~NvmlSession() {
    if (result_ == NVML_SUCCESS)
      nvmlShutdown();
  }

  [[nodiscard]] bool valid() const noexcept { return result_ == NVML_SUCCESS; }
  [[nodiscard]] nvmlReturn_t result() const noexcept { return result_; }

  NvmlSession(const NvmlSession&) = delete;
  NvmlSession& operator=(const NvmlSession&) = delete;

private:
  nvmlReturn_t result_;
};

/// Append compute processes of one device handle, growing the buffer as NVML asks.
nvmlReturn_t appendComputeProcesses(nvmlDevice_t device, int deviceIndex,
                                    std::uint64_t observedAtMs,
                                    std::vector<GpuProcessEntry>& out) {
  std::vector<nvmlProcessInfo_t> infos(64);
  unsigned int count = static_cast<unsigned int>(infos.size());
  nvmlReturn_t rc = nvmlDeviceGetComputeRunningProcesses(device, &count, infos.data());
  for (int attempt = 0; rc == NVML_ERROR_INSUFFICIENT_SIZE && attempt < 3; ++attempt) {
    infos.resize(static_cast<std::size_t>(count) + 16);
    count = static_cast<unsigned int>(infos.size());
    rc = nvmlDeviceGetComputeRunningProcesses(device, &count, infos.data());
  }
  if (rc != NVML_SUCCESS) {
    return rc;
  }

  for (unsigned int i = 0; i < count && i < infos.size(); ++i) {
    GpuProcessEntry entry{};
    entry.pid = static_cast<std::int32_t>(infos[i].pid);
    entry.deviceId = deviceIndex;
    entry.memoryBytes =
        (infos[i].usedGpuMemory == NVML_VALUE_NOT_AVAILABLE) ? 0 : infos[i].usedGpuMemory;
    entry.observedAtMs = observedAtMs;
    out.push_back(entry);
  }
  return NVML_SUCCESS;
}

/// Query one physical GPU, descending into MIG instances when MIG is enabled.
nvmlReturn_t queryDevice(nvmlDevice_t device, int deviceIndex, std::uint64_t observedAtMs,
                         std::vector<GpuProcessEntry>& out) {
  unsigned int currentMig = 0, pendingMig = 0;
  if (nvmlDeviceGetMigMode(device, &currentMig, &pendingMig) != NVML_SUCCESS ||
      currentMig != NVML_DEVICE_MIG_ENABLE) {
    return appendComputeProcesses(device, deviceIndex, observedAtMs, out);
  }

  unsigned int migCount = 0;
  const nvmlReturn_t RC = nvmlDeviceGetMaxMigDeviceCount(device, &migCount);
  if (RC != NVML_SUCCESS) {
    return RC;
  }
  for (unsigned int i = 0; i < migCount; ++i) {
    nvmlDevice_t migDevice{};
    if (nvmlDeviceGetMigDeviceHandleByIndex(device, i, &migDevice) != NVML_SUCCESS) {
      continue; // slot not populated
    }
    const nvmlReturn_t MIG_RC = appendComputeProcesses(migDevice, deviceIndex, observedAtMs, out);
    if (MIG_RC != NVML_SUCCESS) {
      return MIG_RC;
    }
  }
  return NVML_SUCCESS;
}

#endif // COMPAT_NVML_AVAILABLE

} // namespace

/* ----------------------------- GpuProcessEntry ----------------------------- */

std::string GpuProcessEntry::toString() const {
  return fmt::format("PID {} on GPU {}: {}", pid, deviceId,
                     helpers::format::bytesBinary(memoryBytes));
}

/* ----------------------------- Parsing ----------------------------- */

bool parseSmiDeviceList(std::string_view text, UuidIndexMap& out) {
  out.clear();
  int currentGpu = -1;
  std::string_view line;
  while (strings::nextLine(text, line)) {
    const std::string_view TRIMMED = strings::trim(line);
    if (TRIMMED.empty()) {
      continue;
    }

    std::string uuid;
    if (strings::startsWith(TRIMMED, "GPU ")) {
      const std::size_t COLON = TRIMMED.find(':');
      std::int64_t index = 0;
      if (COLON == std::string_view::npos ||
          !strings::parseInt64(TRIMMED.substr(4, COLON - 4), index) || index < 0 ||
          !extractUuid(TRIMMED, uuid)) {
        return false;
      }
      currentGpu = static_cast<int>(index);
      out[uuid] = currentGpu;
      continue;
    }

    if (strings::startsWith(TRIMMED, "MIG ")) {
      if (currentGpu < 0 || !extractUuid(TRIMMED, uuid)) {
        return false;
      }
      out[uuid] = currentGpu;
      continue;
    }

    return false;
  }
  return true;
}

DeviceInventory parseSmiComputeApps(std::string_view text, const UuidIndexMap& uuids,
                                    std::uint64_t observedAtMs) {
  DeviceInventory inv{};
  inv.status = QueryStatus::OK;

  std::size_t row = 0;
  std::string_view line;
  while (strings::nextLine(text, line)) {
    ++row;
    if (strings::trim(line).empty()) {
      continue;
    }

    const std::vector<std::string_view> FIELDS = strings::splitFields(line, ',');
    GpuProcessEntry entry{};
    entry.observedAtMs = observedAtMs;

    if (FIELDS.size() != 3) {
      inv.status = QueryStatus::MALFORMED;
      inv.detail = fmt::format("row {}: expected 3 fields, got {}", row, FIELDS.size());
      inv.entries.clear();
      return inv;
    }

    const auto IT = uuids.find(std::string(strings::trim(FIELDS[0])));
    if (IT == uuids.end()) {
      inv.status = QueryStatus::MALFORMED;
      inv.detail = fmt::format("row {}: unknown GPU UUID '{}'", row, strings::trim(FIELDS[0]));
      inv.entries.clear();
      return inv;
    }
    entry.deviceId = IT->second;

    if (!strings::parsePid(FIELDS[1], entry.pid) || !parseMemoryMiB(FIELDS[2], entry.memoryBytes)) {
      inv.status = QueryStatus::MALFORMED;
      inv.detail = fmt::format("row {}: bad pid or memory in '{}'", row, line);
      inv.entries.clear();
      return inv;
    }

    inv.entries.push_back(entry);
  }

  mergeDuplicateEntries(inv.entries);
  return inv;
}

void mergeDuplicateEntries(std::vector<GpuProcessEntry>& entries) {
  std::vector<GpuProcessEntry> merged;
  merged.reserve(entries.size());
  for (const GpuProcessEntry& ENTRY : entries) {
    bool found = false;
    for (GpuProcessEntry& existing : merged) {
      if (existing.pid == ENTRY.pid && existing.deviceId == ENTRY.deviceId) {
        existing.memoryBytes += ENTRY.memoryBytes;
        found = true;
        break;
      }
    }
    if (!found) {
      merged.push_back(ENTRY);
    }
  }
  entries.swap(merged);
}

/* ----------------------------- SmiDeviceQuery ----------------------------- */

SmiDeviceQuery::SmiDeviceQuery(std::chrono::milliseconds timeout, std::string smiPath)
    : timeout_(timeout), smiPath_(std::move(smiPath)) {}

DeviceInventory SmiDeviceQuery::query() {
  DeviceInventory inv{};

  const helpers::exec::ExecResult LIST = helpers::exec::runCommand({smiPath_, "-L"}, timeout_);
  if (!LIST.succeeded()) {
    inv.status = helpers::statusFromExec(LIST);
    inv.detail = fmt::format("'{} -L' failed (exit {}): {}", smiPath_, LIST.exitCode,
                             strings::trim(LIST.err.empty() ? LIST.out : LIST.err));
    return inv;
  }

  UuidIndexMap uuids;
  if (!parseSmiDeviceList(LIST.out, uuids) || uuids.empty()) {
    inv.status = QueryStatus::MALFORMED;
    inv.detail = "unparseable or empty device list";
    return inv;
  }

  const std::uint64_t OBSERVED_AT = helpers::clock::getRealtimeMs();
  const helpers::exec::ExecResult APPS = helpers::exec::runCommand(
      {smiPath_, "--query-compute-apps=gpu_uuid,pid,used_memory", "--format=csv,noheader,nounits"},
      timeout_);
  if (!APPS.succeeded()) {
    inv.status = helpers::statusFromExec(APPS);
    inv.detail = fmt::format("compute-apps query failed (exit {}): {}", APPS.exitCode,
                             strings::trim(APPS.err.empty() ? APPS.out : APPS.err));
    return inv;
  }

  return parseSmiComputeApps(APPS.out, uuids, OBSERVED_AT);
}

/* ----------------------------- NvmlDeviceQuery ----------------------------- */

bool NvmlDeviceQuery::compiledIn() noexcept { return COMPAT_NVML_AVAILABLE != 0; }

DeviceInventory NvmlDeviceQuery::query() {
  DeviceInventory inv{};

#if COMPAT_NVML_AVAILABLE
  NvmlSession session;
  if (!session.valid()) {
    inv.status = QueryStatus::UNAVAILABLE;
    inv.detail = fmt::format("nvmlInit failed: {}", nvmlErrorString(session.result()));
    return inv;
  }

  unsigned int count = 0;
  nvmlReturn_t rc = nvmlDeviceGetCount_v2(&count);
  if (rc != NVML_SUCCESS) {
    inv.status = QueryStatus::UNAVAILABLE;
    inv.detail = fmt::format("nvmlDeviceGetCount failed: {}", nvmlErrorString(rc));
    return inv;
  }

  const std::uint64_t OBSERVED_AT = helpers::clock::getRealtimeMs();
  for (unsigned int i = 0; i < count; ++i) {
    nvmlDevice_t device{};
    rc = nvmlDeviceGetHandleByIndex_v2(i, &device);
    if (rc == NVML_SUCCESS) {
      rc = queryDevice(device, static_cast<int>(i), OBSERVED_AT, inv.entries);
    }
    if (rc != NVML_SUCCESS) {
      // A partial inventory is never acted upon.
      inv.entries.clear();
      inv.status = QueryStatus::UNAVAILABLE;
      inv.detail = fmt::format("GPU {}: {}", i, nvmlErrorString(rc));
      return inv;
    }
  }

  mergeDuplicateEntries(inv.entries);
  inv.status = QueryStatus::OK;
#else
  inv.status = QueryStatus::UNAVAILABLE;
  inv.detail = "built without NVML";
#endif

  return inv;
}

} // namespace gpu

} // namespace warden
