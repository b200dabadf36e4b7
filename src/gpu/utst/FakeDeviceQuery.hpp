#ifndef WARDEN_GPU_FAKE_DEVICE_QUERY_HPP
#define WARDEN_GPU_FAKE_DEVICE_QUERY_HPP
/**
 * @file FakeDeviceQuery.hpp
 * @brief Scripted DeviceQuery for unit tests.
 */

#include "src/gpu/inc/DeviceInventory.hpp"

#include <cstdint>
#include <deque>
#include <string>
#include <utility>
#include <vector>

namespace warden {
namespace gpu {
namespace test {

/**
 * @brief Returns queued inventories in order, then the steady-state one.
 */
class FakeDeviceQuery final : public DeviceQuery {
public:
  /// OK inventory holding entries.
  static DeviceInventory ok(std::vector<GpuProcessEntry> entries) {
    DeviceInventory inv{};
    inv.status = QueryStatus::OK;
    inv.entries = std::move(entries);
    return inv;
  }

  static DeviceInventory failed(QueryStatus status, std::string detail = "scripted failure") {
    DeviceInventory inv{};
    inv.status = status;
    inv.detail = std::move(detail);
    return inv;
  }

  static GpuProcessEntry entry(std::int32_t pid, int device, std::uint64_t mib = 1024) {
    GpuProcessEntry e{};
    e.pid = pid;
    e.deviceId = device;
    e.memoryBytes = mib * 1024ULL * 1024ULL;
    e.observedAtMs = 1'700'000'000'000ULL;
    return e;
  }

  void push(DeviceInventory inv) { queue_.push_back(std::move(inv)); }
  void setSteady(DeviceInventory inv) { steady_ = std::move(inv); }

  [[nodiscard]] DeviceInventory query() override {
    ++calls;
    if (!queue_.empty()) {
      DeviceInventory next = std::move(queue_.front());
      queue_.pop_front();
      return next;
    }
    return steady_;
  }

  [[nodiscard]] const char* name() const noexcept override { return "fake"; }

  int calls{0};

private:
  std::deque<DeviceInventory> queue_;
  DeviceInventory steady_{ok({})};
};

} // namespace test
} // namespace gpu
} // namespace warden

#endif // WARDEN_GPU_FAKE_DEVICE_QUERY_HPP
