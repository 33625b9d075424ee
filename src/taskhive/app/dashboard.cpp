#include "taskhive/app/dashboard.hpp"

#include <format>
#include <iterator>

namespace taskhive {

auto to_json(const DashboardStats& s) -> nlohmann::json {
  nlohmann::json recent = nlohmann::json::object();
  for (const auto& [status, count] : s.tasks.recent_by_status) {
    recent[std::string(task_status_name(status))] = count;
  }

  return {
      {"system",
       {
           {"uptime_minutes", s.system.uptime_minutes},
           {"cpu_percent", s.system.cpu_percent},
           {"memory_percent", s.system.memory_percent},
           {"memory_available_gb", s.system.memory_available_gb},
           {"load_average", s.system.load_average},
           {"disk_free_gb", s.system.disk_free_gb},
       }},
      {"workers",
       {
           {"active", s.workers.active},
           {"dead", s.workers.dead},
           {"total", s.workers.total},
           {"mode", worker_mode_name(s.worker_mode)},
       }},
      {"tasks",
       {
           {"queue_size", s.tasks.queue_size},
           {"total_queued", s.tasks.total_queued},
           {"total_completed", s.tasks.total_completed},
           {"total_failed", s.tasks.total_failed},
           {"tasks_per_minute", s.tasks.tasks_per_minute},
           {"avg_execution_time", s.tasks.avg_execution_time},
           {"recent_by_status", recent},
       }},
      {"performance",
       {
           {"success_rate", s.performance.success_rate},
           {"is_throttling", s.performance.is_throttling},
           {"recommended_workers", s.performance.recommended_workers},
       }},
      {"queue",
       {
           {"backend", s.queue_backend},
           {"degraded", s.queue_degraded},
       }},
  };
}

auto render_dashboard(const DashboardStats& s) -> std::string {
  std::string out;
  auto it = std::back_inserter(out);
  auto rule = std::string(60, '=');

  std::format_to(it, "{}\n  TASKHIVE DASHBOARD\n{}\n", rule, rule);
  std::format_to(it,
                 "System\n"
                 "  uptime        {:.1f} min\n"
                 "  cpu           {:.1f}%\n"
                 "  memory        {:.1f}% ({:.2f} GB available)\n"
                 "  load average  {:.2f} {:.2f} {:.2f}\n"
                 "  disk free     {:.1f} GB\n",
                 s.system.uptime_minutes, s.system.cpu_percent,
                 s.system.memory_percent, s.system.memory_available_gb,
                 s.system.load_average[0], s.system.load_average[1],
                 s.system.load_average[2], s.system.disk_free_gb);
  std::format_to(it,
                 "Workers ({})\n"
                 "  active {}  dead {}  total {}\n",
                 worker_mode_name(s.worker_mode), s.workers.active,
                 s.workers.dead, s.workers.total);
  std::format_to(it,
                 "Tasks\n"
                 "  queue size    {}\n"
                 "  queued        {}\n"
                 "  completed     {}\n"
                 "  failed        {}\n"
                 "  throughput    {:.2f} tasks/min\n"
                 "  avg exec time {:.2f}s\n",
                 s.tasks.queue_size, s.tasks.total_queued,
                 s.tasks.total_completed, s.tasks.total_failed,
                 s.tasks.tasks_per_minute, s.tasks.avg_execution_time);
  if (!s.tasks.recent_by_status.empty()) {
    std::format_to(it, "  last hour    ");
    for (const auto& [status, count] : s.tasks.recent_by_status) {
      std::format_to(it, " {}={}", task_status_name(status), count);
    }
    std::format_to(it, "\n");
  }
  std::format_to(it,
                 "Performance\n"
                 "  success rate  {:.1f}%\n"
                 "  throttling    {}\n"
                 "  recommended   {} workers\n"
                 "Queue: {}{}\n{}\n",
                 s.performance.success_rate,
                 s.performance.is_throttling ? "YES" : "no",
                 s.performance.recommended_workers, s.queue_backend,
                 s.queue_degraded ? " (degraded, single process)" : "", rule);
  return out;
}

}  // namespace taskhive
