#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace taskhive {

struct StorageConfig {
  std::string db_file{"taskhive.db"};
};

enum class QueueBackendKind { Sqlite, Memory };

[[nodiscard]] constexpr auto queue_backend_name(QueueBackendKind kind) noexcept
    -> std::string_view {
  switch (kind) {
    case QueueBackendKind::Sqlite: return "sqlite";
    case QueueBackendKind::Memory: return "memory";
  }
  return "sqlite";
}

[[nodiscard]] inline auto parse_queue_backend(std::string_view str) noexcept
    -> QueueBackendKind {
  if (str == "memory") return QueueBackendKind::Memory;
  return QueueBackendKind::Sqlite;
}

struct QueueConfig {
  QueueBackendKind backend{QueueBackendKind::Sqlite};
  std::string path{"taskhive_queue.db"};
  int result_ttl_sec{3600};
  int busy_timeout_ms{5000};
};

struct MonitorConfig {
  double cpu_throttle_percent{90.0};
  double memory_throttle_percent{85.0};
  double cpu_scale_down_percent{80.0};
  double memory_scale_down_percent{75.0};
  int max_recommended_workers{8};
  std::size_t history_size{1000};
  int sample_interval_ms{1000};
  std::string disk_path{"/"};
};

enum class WorkerMode { Process, Thread };

[[nodiscard]] constexpr auto worker_mode_name(WorkerMode mode) noexcept
    -> std::string_view {
  switch (mode) {
    case WorkerMode::Process: return "process";
    case WorkerMode::Thread: return "thread";
  }
  return "process";
}

[[nodiscard]] inline auto parse_worker_mode(std::string_view str) noexcept
    -> WorkerMode {
  if (str == "thread") return WorkerMode::Thread;
  return WorkerMode::Process;
}

struct WorkersConfig {
  WorkerMode mode{WorkerMode::Process};
  int max_workers{12};
  int poll_timeout_ms{1000};
  int throttle_sleep_ms{5000};
  int idle_pause_ms{100};
  int retry_backoff_sec{30};
  int stop_grace_ms{5000};
  bool renice_background{true};
  // Binary started for process workers as `<exe> worker`. Empty means the
  // running executable.
  std::string worker_executable;
};

struct SupervisorConfig {
  int autoscale_interval_sec{30};
  int metrics_interval_sec{60};
  int throughput_window_sec{300};
  int dashboard_interval_sec{60};
  std::string log_level{"info"};
  std::string log_file;
  std::string pid_file;
};

struct SystemConfig {
  StorageConfig storage;
  QueueConfig queue;
  MonitorConfig monitor;
  WorkersConfig workers;
  SupervisorConfig supervisor;
};

}  // namespace taskhive
