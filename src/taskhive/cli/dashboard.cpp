#include "taskhive/app/supervisor.hpp"
#include "taskhive/cli/commands.hpp"
#include "taskhive/util/log.hpp"

#include <print>

namespace taskhive::cli {

auto cmd_dashboard(const DashboardOptions& opts) -> int {
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

  auto stats = supervisor.get_dashboard_stats();
  if (opts.json) {
    std::println("{}", to_json(stats).dump(2));
  } else {
    std::print("{}", render_dashboard(stats));
  }

  log::stop();
  return 0;
}

}  // namespace taskhive::cli
