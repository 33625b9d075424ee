#include "taskhive/monitor/resource_monitor.hpp"

#include "taskhive/core/constants.hpp"
#include "taskhive/util/log.hpp"

#include <algorithm>
#include <thread>

namespace taskhive {

namespace {

auto busy_percent(const CpuTimes& prev, const CpuTimes& cur) -> double {
  if (cur.total <= prev.total) {
    return 0.0;
  }
  auto total = static_cast<double>(cur.total - prev.total);
  auto idle = static_cast<double>(cur.idle >= prev.idle ? cur.idle - prev.idle
                                                        : 0);
  return std::clamp(100.0 * (total - idle) / total, 0.0, 100.0);
}

}  // namespace

ResourceMonitor::ResourceMonitor(MonitorConfig config,
                                 std::unique_ptr<ISystemProbe> probe)
    : config_(std::move(config)),
      probe_(std::move(probe)),
      cpu_count_(std::max(1, probe_->cpu_count())) {
}

auto ResourceMonitor::cpu_percent() -> double {
  auto cur = probe_->cpu_times();
  if (!cur) {
    log::warn("CPU sample failed: {}", cur.error().message());
    return 0.0;
  }
  if (!last_cpu_) {
    // First reading has nothing to diff against; take a short second one.
    last_cpu_ = *cur;
    std::this_thread::sleep_for(timing::kCpuPrimeInterval);
    cur = probe_->cpu_times();
    if (!cur) {
      return 0.0;
    }
  }
  auto pct = busy_percent(*last_cpu_, *cur);
  last_cpu_ = *cur;
  return pct;
}

auto ResourceMonitor::take_sample() -> SystemSample {
  SystemSample s;
  s.timestamp = Clock::now();
  s.cpu_percent = cpu_percent();

  if (auto mem = probe_->memory(); mem && mem->total_bytes > 0) {
    s.memory_available_bytes = mem->available_bytes;
    s.memory_percent =
        100.0 *
        static_cast<double>(mem->total_bytes -
                            std::min(mem->available_bytes, mem->total_bytes)) /
        static_cast<double>(mem->total_bytes);
  } else if (!mem) {
    log::warn("Memory sample failed: {}", mem.error().message());
  }

  if (auto disk = probe_->disk(config_.disk_path);
      disk && disk->total_bytes > 0) {
    s.disk_free_bytes = disk->free_bytes;
    s.disk_percent =
        100.0 *
        static_cast<double>(disk->total_bytes -
                            std::min(disk->free_bytes, disk->total_bytes)) /
        static_cast<double>(disk->total_bytes);
  }

  s.load_avg = probe_->load_average();
  s.process_count = probe_->process_count();
  return s;
}

auto ResourceMonitor::sample() -> SystemSample {
  std::lock_guard lock(mu_);
  auto now = std::chrono::steady_clock::now();
  if (cached_ &&
      now - cached_at_ < std::chrono::milliseconds(config_.sample_interval_ms)) {
    return *cached_;
  }
  cached_ = take_sample();
  cached_at_ = now;
  return *cached_;
}

auto ResourceMonitor::should_throttle() -> bool {
  auto s = sample();
  return s.cpu_percent > config_.cpu_throttle_percent ||
         s.memory_percent > config_.memory_throttle_percent;
}

auto ResourceMonitor::recommended_worker_count() -> int {
  auto s = sample();
  int count;
  if (s.cpu_percent > config_.cpu_scale_down_percent) {
    count = std::max(1, cpu_count_ / 2);
  } else if (s.memory_percent > config_.memory_scale_down_percent) {
    count = std::max(1, cpu_count_ / 3);
  } else {
    count = std::min(cpu_count_ - 1, config_.max_recommended_workers);
  }
  return std::clamp(count, 1, std::max(1, config_.max_recommended_workers));
}

auto ResourceMonitor::record_sample() -> SystemSample {
  auto s = sample();
  std::lock_guard lock(mu_);
  history_.push_back(s);
  while (history_.size() > config_.history_size) {
    history_.pop_front();
  }
  return s;
}

auto ResourceMonitor::history() const -> std::vector<SystemSample> {
  std::lock_guard lock(mu_);
  return {history_.begin(), history_.end()};
}

}  // namespace taskhive
