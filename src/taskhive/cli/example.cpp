#include "taskhive/app/supervisor.hpp"
#include "taskhive/cli/commands.hpp"
#include "taskhive/handlers/demo_handlers.hpp"
#include "taskhive/util/daemon.hpp"
#include "taskhive/util/log.hpp"

#include <print>

namespace taskhive::cli {

namespace {

using nlohmann::json;

auto submit_demo_mix(Supervisor& supervisor) -> int {
  int submitted = 0;
  auto submit = [&](std::string name, std::string function, json kwargs,
                    Priority priority, SubmitOptions options = {}) {
    if (supervisor.submit_task(std::move(name), std::move(function),
                               json::array(), std::move(kwargs), priority,
                               options)) {
      ++submitted;
    }
  };

  submit("System Health Check", "system_health_check", json::object(),
         Priority::Critical);
  submit("Fetch NIFTY Data", "market_data_fetch", {{"symbol", "NIFTY"}},
         Priority::High);
  for (const char* topic :
       {"market_analysis", "stock_tips", "portfolio_advice"}) {
    submit(std::format("Generate {} content", topic), "content_generation",
           {{"topic", topic}}, Priority::Medium);
  }
  for (const char* channel : {"@AIFinanceNews2024", "@StockMarketIndia"}) {
    submit(std::format("Post to {}", channel), "telegram_post",
           {{"channel", channel}}, Priority::Low, SubmitOptions{.max_retries = 2});
  }
  submit("Update Analytics", "analytics_update", json::object(),
         Priority::Batch);
  return submitted;
}

}  // namespace

auto cmd_example(const ExampleOptions& opts) -> int {
  auto result = load_system_config(opts.common);
  if (!result) {
    std::println(stderr, "Error: {}", result.error().message());
    return 1;
  }
  auto config = std::move(*result);
  log::set_level(config.supervisor.log_level);
  log::start();

  HandlerRegistry registry;
  if (auto r = register_demo_handlers(registry, config.monitor); !r) {
    log::error("Failed to register handlers: {}", r.error().message());
    log::stop();
    return 1;
  }

  Supervisor supervisor(std::move(config), registry);
  setup_signal_handlers();

  if (auto r = supervisor.start(2); !r) {
    log::error("Failed to start: {}", r.error().message());
    log::stop();
    return 1;
  }
  std::println("Task manager started with {} workers",
               supervisor.active_workers());

  int submitted = submit_demo_mix(supervisor);
  std::println("Submitted {} demo tasks", submitted);

  const auto interval = std::chrono::seconds(opts.cycle_interval_sec);
  for (int cycle = 0; cycle < opts.cycles; ++cycle) {
    if (wait_for_shutdown_for(interval)) {
      std::println("\nShutting down task manager...");
      break;
    }
    std::print("{}", render_dashboard(supervisor.get_dashboard_stats()));
    std::fflush(stdout);

    if (cycle % 3 == 0) {
      (void)supervisor.submit_task("Periodic Market Update",
                                   "market_data_fetch", json::array(),
                                   {{"symbol", "SENSEX"}}, Priority::High);
    }
  }

  supervisor.stop();
  log::stop();
  return 0;
}

}  // namespace taskhive::cli
