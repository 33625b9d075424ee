#include "taskhive/app/supervisor.hpp"
#include "taskhive/cli/commands.hpp"
#include "taskhive/util/log.hpp"

#include <print>

namespace taskhive::cli {

auto cmd_cancel(const CancelOptions& opts) -> int {
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

  bool cancelled = supervisor.cancel_task(TaskId{opts.task_id});
  if (cancelled) {
    std::println("Task {} cancelled", opts.task_id);
  } else {
    std::println(stderr, "Task {} is not waiting in the queue", opts.task_id);
  }
  log::stop();
  return cancelled ? 0 : 1;
}

}  // namespace taskhive::cli
