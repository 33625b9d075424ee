#include "taskhive/app/supervisor.hpp"
#include "taskhive/cli/commands.hpp"
#include "taskhive/util/log.hpp"

#include <print>

namespace taskhive::cli {

auto cmd_submit(const SubmitTaskOptions& opts) -> int {
  auto priority = parse_priority(opts.priority);
  if (!priority) {
    std::println(stderr, "Error: Unknown priority: {}", opts.priority);
    return 1;
  }

  auto args = nlohmann::json::parse(opts.args_json, nullptr, false);
  if (args.is_discarded() || !args.is_array()) {
    std::println(stderr, "Error: --args must be a JSON array");
    return 1;
  }
  auto kwargs = nlohmann::json::parse(opts.kwargs_json, nullptr, false);
  if (kwargs.is_discarded() || !kwargs.is_object()) {
    std::println(stderr, "Error: --kwargs must be a JSON object");
    return 1;
  }

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
  // Only a shared queue reaches the workers of a running `start`.
  if (!supervisor.queue_shared()) {
    std::println(stderr, "Error: Shared queue unavailable, task would be lost");
    log::stop();
    return 1;
  }

  auto id = supervisor.submit_task(
      opts.name, opts.function, std::move(args), std::move(kwargs), *priority,
      SubmitOptions{.max_retries = opts.max_retries,
                    .timeout = std::chrono::seconds(opts.timeout_sec)});
  if (!id) {
    std::println(stderr, "Error: Task rejected");
    log::stop();
    return 1;
  }

  std::println("{}", *id);
  log::stop();
  return 0;
}

}  // namespace taskhive::cli
