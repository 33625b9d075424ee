#include "taskhive/handlers/demo_handlers.hpp"

#include "taskhive/monitor/resource_monitor.hpp"
#include "taskhive/util/log.hpp"

#include <chrono>
#include <format>
#include <random>
#include <thread>

namespace taskhive {

namespace {

using json = nlohmann::json;

auto rng() -> std::mt19937_64& {
  thread_local std::mt19937_64 gen{std::random_device{}()};
  return gen;
}

auto uniform(double lo, double hi) -> double {
  return std::uniform_real_distribution<double>(lo, hi)(rng());
}

auto uniform_int(int lo, int hi) -> int {
  return std::uniform_int_distribution<int>(lo, hi)(rng());
}

auto iso_now() -> std::string {
  return std::format("{:%FT%T}", std::chrono::floor<std::chrono::seconds>(
                                     std::chrono::system_clock::now()));
}

// Sleeps `lo..hi` seconds (scaled) in short steps. Fails when the context
// asks the handler to stop.
auto simulate_work(const TaskContext& ctx, const json& kwargs, double lo,
                   double hi) -> std::expected<void, HandlerError> {
  auto scale = kwargs.value("delay_scale", 1.0);
  auto total = std::chrono::duration<double>(uniform(lo, hi) * scale);
  auto until = std::chrono::steady_clock::now() +
               std::chrono::duration_cast<std::chrono::milliseconds>(total);
  constexpr auto kStep = std::chrono::milliseconds(50);

  while (std::chrono::steady_clock::now() < until) {
    if (ctx.cancelled()) {
      return std::unexpected{HandlerError{
          std::format("cancelled: {}", cancel_reason_name(ctx.cancel_reason())),
          true}};
    }
    if (ctx.expired()) {
      return std::unexpected{HandlerError{"deadline reached during work", true}};
    }
    std::this_thread::sleep_for(kStep);
  }
  return {};
}

auto content_generation(const TaskContext& ctx, const json&,
                        const json& kwargs) -> HandlerResult {
  log::info("Generating content for task {}", ctx.task_id);
  if (auto w = simulate_work(ctx, kwargs, 1.0, 3.0); !w) {
    return std::unexpected{w.error()};
  }
  return json{
      {"content", std::format("Generated content for {}",
                              kwargs.value("topic", "finance"))},
      {"word_count", uniform_int(100, 500)},
      {"timestamp", iso_now()},
  };
}

auto market_data_fetch(const TaskContext& ctx, const json&,
                       const json& kwargs) -> HandlerResult {
  log::info("Fetching market data for task {}", ctx.task_id);
  if (auto w = simulate_work(ctx, kwargs, 0.5, 2.0); !w) {
    return std::unexpected{w.error()};
  }
  return json{
      {"symbol", kwargs.value("symbol", "NIFTY")},
      {"price", uniform(18000.0, 19000.0)},
      {"change", uniform(-100.0, 100.0)},
      {"timestamp", iso_now()},
  };
}

auto telegram_post(const TaskContext& ctx, const json&, const json& kwargs)
    -> HandlerResult {
  log::info("Posting to Telegram for task {}", ctx.task_id);
  if (auto w = simulate_work(ctx, kwargs, 1.0, 4.0); !w) {
    return std::unexpected{w.error()};
  }
  return json{
      {"channel", kwargs.value("channel", "@AIFinanceNews2024")},
      {"message_id", uniform_int(1000, 9999)},
      {"status", "posted"},
      {"timestamp", iso_now()},
  };
}

auto analytics_update(const TaskContext& ctx, const json&, const json& kwargs)
    -> HandlerResult {
  log::info("Updating analytics for task {}", ctx.task_id);
  if (auto w = simulate_work(ctx, kwargs, 0.5, 1.5); !w) {
    return std::unexpected{w.error()};
  }
  return json{
      {"metrics_updated", {"views", "subscribers", "engagement"}},
      {"timestamp", iso_now()},
  };
}

auto database_cleanup(const TaskContext& ctx, const json&,
                      const json& kwargs) -> HandlerResult {
  log::info("Running database cleanup for task {}", ctx.task_id);
  if (auto w = simulate_work(ctx, kwargs, 2.0, 5.0); !w) {
    return std::unexpected{w.error()};
  }
  return json{
      {"tables_cleaned", {"old_sessions", "temp_data"}},
      {"records_deleted", uniform_int(10, 100)},
      {"timestamp", iso_now()},
  };
}

// Samples the host with a private monitor so the handler never shares
// monitor state with the worker that runs it.
class HealthCheckHandler final : public TaskHandler {
public:
  explicit HealthCheckHandler(MonitorConfig config)
      : config_(std::move(config)) {
  }

  auto execute(const TaskContext& ctx, const json&, const json&)
      -> HandlerResult override {
    log::info("Running health check for task {}", ctx.task_id);
    ResourceMonitor monitor(config_);
    auto s = monitor.sample();
    return json{
        {"system_healthy", s.cpu_percent < config_.cpu_throttle_percent &&
                               s.memory_percent <
                                   config_.memory_throttle_percent},
        {"stats",
         {
             {"cpu_percent", s.cpu_percent},
             {"memory_percent", s.memory_percent},
             {"memory_available_gb",
              static_cast<double>(s.memory_available_bytes) / (1 << 30)},
             {"disk_percent", s.disk_percent},
             {"disk_free_gb",
              static_cast<double>(s.disk_free_bytes) / (1 << 30)},
             {"load_avg", s.load_avg},
             {"process_count", s.process_count},
         }},
        {"timestamp", iso_now()},
    };
  }

private:
  MonitorConfig config_;
};

}  // namespace

auto register_demo_handlers(HandlerRegistry& registry,
                            const MonitorConfig& monitor_config)
    -> Result<void> {
  const std::pair<const char*, HandlerFn> fns[] = {
      {"content_generation", content_generation},
      {"market_data_fetch", market_data_fetch},
      {"telegram_post", telegram_post},
      {"analytics_update", analytics_update},
      {"database_cleanup", database_cleanup},
      {"noop_success",
       [](const TaskContext&, const json& args, const json&) -> HandlerResult {
         return json{{"ok", true}, {"args", args}};
       }},
      {"always_fail",
       [](const TaskContext&, const json&, const json& kwargs) -> HandlerResult {
         return handler_error(kwargs.value("message", "intentional failure"));
       }},
  };

  for (const auto& [name, fn] : fns) {
    if (auto r = registry.add(name, fn); !r) {
      return r;
    }
  }
  return registry.add("system_health_check",
                      std::make_unique<HealthCheckHandler>(monitor_config));
}

}  // namespace taskhive
