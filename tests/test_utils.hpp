#pragma once

#include "taskhive/config/system_config.hpp"
#include "taskhive/monitor/resource_monitor.hpp"
#include "taskhive/task/task.hpp"
#include "taskhive/util/id.hpp"

#include <unistd.h>

#include <atomic>
#include <array>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <thread>

namespace taskhive::test {

[[nodiscard]] inline auto task_id(std::string s) -> TaskId {
  return TaskId{std::move(s)};
}

[[nodiscard]] inline auto worker_id(std::string s) -> WorkerId {
  return WorkerId{std::move(s)};
}

// Scratch directory removed with everything in it on destruction.
class TempDir {
public:
  TempDir() {
    std::string pattern = "/tmp/taskhive_test_XXXXXX";
    if (::mkdtemp(pattern.data()) != nullptr) {
      path_ = pattern;
    }
  }

  ~TempDir() {
    if (!path_.empty()) {
      std::error_code ec;
      std::filesystem::remove_all(path_, ec);
    }
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  [[nodiscard]] auto valid() const -> bool { return !path_.empty(); }
  [[nodiscard]] auto file(std::string_view name) const -> std::string {
    return (path_ / name).string();
  }

private:
  std::filesystem::path path_;
};

[[nodiscard]] inline auto make_task(std::string name, std::string function,
                                    Priority priority = Priority::Medium)
    -> Task {
  Task t;
  t.id = generate_task_id();
  t.name = std::move(name);
  t.function = std::move(function);
  t.priority = priority;
  t.created_at = Clock::now();
  t.status = TaskStatus::Queued;
  return t;
}

// Host readings controlled by the test. Shared so the test keeps a handle
// after the probe moves into a ResourceMonitor.
struct FakeHost {
  std::atomic<double> cpu_percent{10.0};
  std::atomic<double> memory_percent{20.0};
  std::atomic<int> cpus{4};
};

class FakeProbe final : public ISystemProbe {
public:
  explicit FakeProbe(std::shared_ptr<FakeHost> host) : host_(std::move(host)) {}

  auto cpu_times() -> Result<CpuTimes> override {
    // Each read advances 1000 jiffies, busy in proportion to cpu_percent.
    total_ += 1000;
    idle_ += static_cast<std::uint64_t>(10.0 * (100.0 - host_->cpu_percent.load()));
    return CpuTimes{idle_, total_};
  }

  auto memory() -> Result<MemoryInfo> override {
    constexpr std::uint64_t kTotal = 16ULL << 30;
    auto used = static_cast<std::uint64_t>(
        static_cast<double>(kTotal) * host_->memory_percent.load() / 100.0);
    return MemoryInfo{kTotal, kTotal - used};
  }

  auto disk(std::string_view) -> Result<DiskInfo> override {
    return DiskInfo{100ULL << 30, 40ULL << 30};
  }

  auto load_average() -> std::array<double, 3> override {
    return {0.5, 0.4, 0.3};
  }

  auto process_count() -> int override { return 42; }

  auto cpu_count() -> int override { return host_->cpus.load(); }

private:
  std::shared_ptr<FakeHost> host_;
  std::uint64_t idle_{0};
  std::uint64_t total_{0};
};

// Monitor config that re-samples on every call.
[[nodiscard]] inline auto fresh_monitor_config() -> MonitorConfig {
  MonitorConfig cfg;
  cfg.sample_interval_ms = 0;
  return cfg;
}

[[nodiscard]] inline auto make_fake_monitor(std::shared_ptr<FakeHost> host,
                                            MonitorConfig cfg =
                                                fresh_monitor_config())
    -> std::unique_ptr<ResourceMonitor> {
  return std::make_unique<ResourceMonitor>(
      std::move(cfg), std::make_unique<FakeProbe>(std::move(host)));
}

inline auto wait_until(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout) -> bool {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return pred();
}

inline void sleep_ms(std::chrono::milliseconds ms) {
  std::this_thread::sleep_for(ms);
}

}  // namespace taskhive::test
