#include "taskhive/app/supervisor.hpp"
#include "taskhive/cli/commands.hpp"
#include "taskhive/handlers/demo_handlers.hpp"
#include "taskhive/util/daemon.hpp"
#include "taskhive/util/log.hpp"

#include <print>

namespace taskhive::cli {

auto cmd_start(const StartOptions& opts) -> int {
  auto result = load_system_config(opts.common);
  if (!result) {
    std::println(stderr, "Error: {}", result.error().message());
    return 1;
  }
  auto config = std::move(*result);

  const auto& log_file = config.supervisor.log_file;
  if (opts.daemon && log_file.empty()) {
    std::println(stderr,
                 "Error: --daemon requires supervisor.log_file in the config");
    return 1;
  }
  if (!log_file.empty() && !log::set_output_file(log_file)) {
    std::println(stderr, "Error: Failed to open log file: {}", log_file);
    return 1;
  }

  if (opts.daemon && !daemonize()) {
    std::println(stderr, "Error: Failed to daemonize");
    return 1;
  }

  log::set_level(config.supervisor.log_level);
  log::start();

  HandlerRegistry registry;
  if (auto r = register_demo_handlers(registry, config.monitor); !r) {
    log::error("Failed to register handlers: {}", r.error().message());
    log::stop();
    return 1;
  }

  const auto pid_file = config.supervisor.pid_file;
  const auto interval =
      std::chrono::seconds(config.supervisor.dashboard_interval_sec);

  Supervisor supervisor(std::move(config), registry);
  setup_signal_handlers();

  if (!pid_file.empty()) {
    if (auto r = write_pid_file(pid_file); !r) {
      log::error("Failed to write pid file {}: {}", pid_file,
                 r.error().message());
      log::stop();
      return 1;
    }
  }

  log::info("taskhive starting...");
  if (auto r = supervisor.start(opts.workers); !r) {
    log::error("Failed to start: {}", r.error().message());
    if (!pid_file.empty()) {
      remove_pid_file(pid_file);
    }
    log::stop();
    return 1;
  }

  do {
    auto text = render_dashboard(supervisor.get_dashboard_stats());
    if (opts.daemon) {
      log::info("\n{}", text);
    } else {
      std::print("{}", text);
      std::fflush(stdout);
    }
  } while (!wait_for_shutdown_for(interval));

  log::info("Received shutdown signal, stopping...");
  supervisor.stop();
  if (!pid_file.empty()) {
    remove_pid_file(pid_file);
  }

  log::info("taskhive stopped.");
  log::stop();
  return 0;
}

}  // namespace taskhive::cli
