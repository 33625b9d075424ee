#pragma once

#include "taskhive/config/system_config.hpp"
#include "taskhive/core/error.hpp"
#include "taskhive/task/handler.hpp"

namespace taskhive {

// Registers the sample automation handlers used by the `example` command:
// content_generation, market_data_fetch, telegram_post, analytics_update,
// system_health_check, database_cleanup, plus noop_success and always_fail.
//
// Simulated work honours kwargs.delay_scale (default 1.0) and stops early
// when the task deadline passes or the worker cancels it.
[[nodiscard]] auto register_demo_handlers(HandlerRegistry& registry,
                                          const MonitorConfig& monitor_config)
    -> Result<void>;

}  // namespace taskhive
