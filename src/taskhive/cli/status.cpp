#include "taskhive/app/supervisor.hpp"
#include "taskhive/cli/commands.hpp"
#include "taskhive/util/log.hpp"

#include <chrono>
#include <format>
#include <print>

namespace taskhive::cli {

namespace {

auto format_time(TimePoint tp) -> std::string {
  return std::format("{:%Y-%m-%d %H:%M:%S}",
                     std::chrono::floor<std::chrono::seconds>(tp));
}

}  // namespace

auto cmd_status(const StatusOptions& opts) -> int {
  auto result = load_system_config(opts.common);
  if (!result) {
    std::println(stderr, "Error: {}", result.error().message());
    return 1;
  }
  auto config = std::move(*result);
  log::set_level(opts.common.log_level.empty() ? "warn"
                                               : config.supervisor.log_level);
  log::start();

  HandlerRegistry registry;
  Supervisor supervisor(std::move(config), registry);
  if (auto r = supervisor.init(); !r) {
    std::println(stderr, "Error: {}", r.error().message());
    log::stop();
    return 1;
  }

  TaskId id{opts.task_id};
  auto record = supervisor.get_task_status(id);
  if (!record) {
    std::println(stderr, "Error: Task not found: {}", opts.task_id);
    log::stop();
    return 1;
  }

  const auto& r = *record;
  std::println("Task:       {}", r.id);
  std::println("Name:       {}", r.name);
  std::println("Function:   {}", r.function);
  std::println("Priority:   {}", priority_name(r.priority));
  std::println("Status:     {}", task_status_name(r.status));
  std::println("Created:    {}", format_time(r.created_at));
  if (r.completed_at) {
    std::println("Completed:  {}", format_time(*r.completed_at));
  }
  if (!r.worker_id.empty()) {
    std::println("Worker:     {}", r.worker_id);
  }
  std::println("Duration:   {:.2f}s", r.execution_time);
  std::println("Retries:    {}/{}", r.retry_count, r.max_retries);
  if (!r.error.empty()) {
    std::println("Error:      {}", r.error);
  }
  if (auto value = supervisor.get_task_result(id)) {
    std::println("Result:     {}", value->dump());
  }

  log::stop();
  return 0;
}

}  // namespace taskhive::cli
