#pragma once

#include "taskhive/config/system_config.hpp"
#include "taskhive/storage/persistence.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <string>

namespace taskhive {

struct DashboardStats {
  struct System {
    double uptime_minutes{0.0};
    double cpu_percent{0.0};
    double memory_percent{0.0};
    double memory_available_gb{0.0};
    std::array<double, 3> load_average{};
    double disk_free_gb{0.0};
  };

  struct Workers {
    int active{0};
    int dead{0};
    int total{0};
  };

  struct Tasks {
    std::int64_t queue_size{0};
    std::int64_t total_queued{0};
    std::int64_t total_completed{0};
    std::int64_t total_failed{0};
    double tasks_per_minute{0.0};
    double avg_execution_time{0.0};
    StatusCounts recent_by_status;
  };

  struct Performance {
    double success_rate{0.0};
    bool is_throttling{false};
    int recommended_workers{1};
  };

  System system;
  Workers workers;
  Tasks tasks;
  Performance performance;
  std::string queue_backend;
  bool queue_degraded{false};
  WorkerMode worker_mode{WorkerMode::Process};
};

[[nodiscard]] auto to_json(const DashboardStats& stats) -> nlohmann::json;
[[nodiscard]] auto render_dashboard(const DashboardStats& stats) -> std::string;

}  // namespace taskhive
