#pragma once

#include "taskhive/config/system_config.hpp"
#include "taskhive/core/error.hpp"

#include <optional>
#include <string>

namespace taskhive::cli {

// Options accepted by every command. Empty strings leave the config value.
struct CommonOptions {
  std::string config_file;
  std::string db_file;
  std::string queue_db;
  std::string log_level;
};

struct StartOptions {
  CommonOptions common;
  bool daemon{false};
  std::optional<int> workers;
};

struct DashboardOptions {
  CommonOptions common;
  bool json{false};
};

struct ExampleOptions {
  CommonOptions common;
  int cycles{10};
  int cycle_interval_sec{30};
};

struct StatusOptions {
  CommonOptions common;
  std::string task_id;
};

struct SubmitTaskOptions {
  CommonOptions common;
  std::string name;
  std::string function;
  std::string priority{"medium"};
  std::string args_json{"[]"};
  std::string kwargs_json{"{}"};
  int max_retries{3};
  int timeout_sec{300};
};

struct CancelOptions {
  CommonOptions common;
  std::string task_id;
};

// Started by the supervisor for each process worker.
struct WorkerProcessOptions {
  CommonOptions common;
  std::string worker_id;
  // Full config as YAML; takes precedence over the config file.
  std::string config_yaml;
};

// Loads the config file (or defaults) and applies command-line overrides.
[[nodiscard]] auto load_system_config(const CommonOptions& opts)
    -> Result<SystemConfig>;

[[nodiscard]] auto cmd_start(const StartOptions& opts) -> int;
[[nodiscard]] auto cmd_dashboard(const DashboardOptions& opts) -> int;
[[nodiscard]] auto cmd_example(const ExampleOptions& opts) -> int;
[[nodiscard]] auto cmd_status(const StatusOptions& opts) -> int;
[[nodiscard]] auto cmd_submit(const SubmitTaskOptions& opts) -> int;
[[nodiscard]] auto cmd_cancel(const CancelOptions& opts) -> int;
[[nodiscard]] auto cmd_worker(const WorkerProcessOptions& opts) -> int;

}  // namespace taskhive::cli
