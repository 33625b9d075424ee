#include "taskhive/app/services/persistence_service.hpp"
#include "taskhive/cli/commands.hpp"
#include "taskhive/config/config.hpp"
#include "taskhive/handlers/demo_handlers.hpp"
#include "taskhive/monitor/resource_monitor.hpp"
#include "taskhive/queue/priority_queue.hpp"
#include "taskhive/util/daemon.hpp"
#include "taskhive/util/log.hpp"
#include "taskhive/worker/worker.hpp"

#include <csignal>
#include <print>

namespace taskhive::cli {

namespace {

// Exit codes the supervisor reports as a crash.
constexpr int kExitConfig = 1;
constexpr int kExitQueue = 2;

}  // namespace

auto cmd_worker(const WorkerProcessOptions& opts) -> int {
  auto result = opts.config_yaml.empty()
                    ? load_system_config(opts.common)
                    : ConfigLoader::load_from_string(opts.config_yaml);
  if (!result) {
    std::println(stderr, "Error: {}", result.error().message());
    return kExitConfig;
  }
  auto config = std::move(*result);

  const auto& log_file = config.supervisor.log_file;
  if (!log_file.empty() && !log::set_output_file(log_file)) {
    std::println(stderr, "Error: Failed to open log file: {}", log_file);
    return kExitConfig;
  }
  log::set_level(config.supervisor.log_level);
  log::start();

  // SIGTERM is the supervisor's stop request. Ctrl-C reaches the whole
  // process group; the supervisor decides when its workers stop.
  setup_signal_handlers();
  std::signal(SIGINT, SIG_IGN);

  WorkerId id{opts.worker_id};

  HandlerRegistry registry;
  if (auto r = register_demo_handlers(registry, config.monitor); !r) {
    log::error("Worker {} failed to register handlers: {}", id,
               r.error().message());
    log::stop();
    return kExitConfig;
  }
  registry.freeze();

  auto queue = PriorityTaskQueue::open(config.queue);
  if (!queue->is_shared()) {
    log::error("Worker {} could not open the shared queue", id);
    log::stop();
    return kExitQueue;
  }

  PersistenceService persistence(config.storage.db_file,
                                 config.queue.busy_timeout_ms);
  PersistenceService* reporting = &persistence;
  if (auto r = persistence.open(); !r) {
    log::warn("Worker {} running without persistence: {}", id,
              r.error().message());
    reporting = nullptr;
  }

  ResourceMonitor monitor(config.monitor);
  Worker worker(id, *queue, monitor, registry, reporting,
                WorkerOptions::from_config(config.workers, config.queue));
  worker.run(&g_shutdown_requested);

  log::stop();
  return 0;
}

}  // namespace taskhive::cli
