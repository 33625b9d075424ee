#pragma once

#include "taskhive/config/system_config.hpp"
#include "taskhive/core/error.hpp"
#include "taskhive/task/task.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace taskhive {

struct SystemSample {
  TimePoint timestamp{};
  double cpu_percent{0.0};
  double memory_percent{0.0};
  std::uint64_t memory_available_bytes{0};
  double disk_percent{0.0};
  std::uint64_t disk_free_bytes{0};
  std::array<double, 3> load_avg{};
  int process_count{0};
};

struct CpuTimes {
  std::uint64_t idle{0};
  std::uint64_t total{0};
};

struct MemoryInfo {
  std::uint64_t total_bytes{0};
  std::uint64_t available_bytes{0};
};

struct DiskInfo {
  std::uint64_t total_bytes{0};
  std::uint64_t free_bytes{0};
};

// OS reads behind the monitor; replaced by a fake in tests.
class ISystemProbe {
public:
  virtual ~ISystemProbe() = default;

  [[nodiscard]] virtual auto cpu_times() -> Result<CpuTimes> = 0;
  [[nodiscard]] virtual auto memory() -> Result<MemoryInfo> = 0;
  [[nodiscard]] virtual auto disk(std::string_view path) -> Result<DiskInfo> = 0;
  [[nodiscard]] virtual auto load_average() -> std::array<double, 3> = 0;
  [[nodiscard]] virtual auto process_count() -> int = 0;
  [[nodiscard]] virtual auto cpu_count() -> int = 0;
};

[[nodiscard]] auto create_procfs_probe() -> std::unique_ptr<ISystemProbe>;

class ResourceMonitor {
public:
  explicit ResourceMonitor(MonitorConfig config,
                           std::unique_ptr<ISystemProbe> probe =
                               create_procfs_probe());

  ResourceMonitor(const ResourceMonitor&) = delete;
  ResourceMonitor& operator=(const ResourceMonitor&) = delete;

  // Cached for sample_interval_ms.
  [[nodiscard]] auto sample() -> SystemSample;
  [[nodiscard]] auto should_throttle() -> bool;
  // Always in [1, max_recommended_workers].
  [[nodiscard]] auto recommended_worker_count() -> int;

  auto record_sample() -> SystemSample;
  [[nodiscard]] auto history() const -> std::vector<SystemSample>;

  [[nodiscard]] auto cpu_count() const noexcept -> int {
    return cpu_count_;
  }
  [[nodiscard]] auto config() const noexcept -> const MonitorConfig& {
    return config_;
  }

private:
  [[nodiscard]] auto take_sample() -> SystemSample;
  [[nodiscard]] auto cpu_percent() -> double;

  MonitorConfig config_;
  std::unique_ptr<ISystemProbe> probe_;
  int cpu_count_;

  mutable std::mutex mu_;
  std::optional<CpuTimes> last_cpu_;
  std::optional<SystemSample> cached_;
  std::chrono::steady_clock::time_point cached_at_{};
  std::deque<SystemSample> history_;
};

}  // namespace taskhive
