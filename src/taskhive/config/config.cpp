#include "taskhive/config/config.hpp"

#include "taskhive/config/yaml_utils.hpp"
#include "taskhive/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<taskhive::StorageConfig> {
  static bool decode(const Node& node, taskhive::StorageConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.db_file = taskhive::yaml_get_or<std::string>(node, "db_file", "taskhive.db");
    return true;
  }
};

template <>
struct convert<taskhive::QueueConfig> {
  static bool decode(const Node& node, taskhive::QueueConfig& q) {
    if (!node.IsMap()) {
      return false;
    }
    auto backend = taskhive::yaml_get_or<std::string>(node, "backend", "sqlite");
    q.backend = taskhive::parse_queue_backend(backend);
    q.path = taskhive::yaml_get_or<std::string>(node, "path", "taskhive_queue.db");
    q.result_ttl_sec = taskhive::yaml_get_or(node, "result_ttl_sec", 3600);
    q.busy_timeout_ms = taskhive::yaml_get_or(node, "busy_timeout_ms", 5000);
    return true;
  }
};

template <>
struct convert<taskhive::MonitorConfig> {
  static bool decode(const Node& node, taskhive::MonitorConfig& m) {
    if (!node.IsMap()) {
      return false;
    }
    m.cpu_throttle_percent = taskhive::yaml_get_or(node, "cpu_throttle_percent", 90.0);
    m.memory_throttle_percent =
        taskhive::yaml_get_or(node, "memory_throttle_percent", 85.0);
    m.cpu_scale_down_percent =
        taskhive::yaml_get_or(node, "cpu_scale_down_percent", 80.0);
    m.memory_scale_down_percent =
        taskhive::yaml_get_or(node, "memory_scale_down_percent", 75.0);
    m.max_recommended_workers =
        taskhive::yaml_get_or(node, "max_recommended_workers", 8);
    m.history_size = taskhive::yaml_get_or<std::size_t>(node, "history_size", 1000);
    m.sample_interval_ms = taskhive::yaml_get_or(node, "sample_interval_ms", 1000);
    m.disk_path = taskhive::yaml_get_or<std::string>(node, "disk_path", "/");
    return true;
  }
};

template <>
struct convert<taskhive::WorkersConfig> {
  static bool decode(const Node& node, taskhive::WorkersConfig& w) {
    if (!node.IsMap()) {
      return false;
    }
    auto mode = taskhive::yaml_get_or<std::string>(node, "mode", "process");
    w.mode = taskhive::parse_worker_mode(mode);
    w.max_workers = taskhive::yaml_get_or(node, "max_workers", 12);
    w.poll_timeout_ms = taskhive::yaml_get_or(node, "poll_timeout_ms", 1000);
    w.throttle_sleep_ms = taskhive::yaml_get_or(node, "throttle_sleep_ms", 5000);
    w.idle_pause_ms = taskhive::yaml_get_or(node, "idle_pause_ms", 100);
    w.retry_backoff_sec = taskhive::yaml_get_or(node, "retry_backoff_sec", 30);
    w.stop_grace_ms = taskhive::yaml_get_or(node, "stop_grace_ms", 5000);
    w.renice_background = taskhive::yaml_get_or(node, "renice_background", true);
    w.worker_executable =
        taskhive::yaml_get_or<std::string>(node, "worker_executable", "");
    return true;
  }
};

template <>
struct convert<taskhive::SupervisorConfig> {
  static bool decode(const Node& node, taskhive::SupervisorConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.autoscale_interval_sec = taskhive::yaml_get_or(node, "autoscale_interval_sec", 30);
    s.metrics_interval_sec = taskhive::yaml_get_or(node, "metrics_interval_sec", 60);
    s.throughput_window_sec = taskhive::yaml_get_or(node, "throughput_window_sec", 300);
    s.dashboard_interval_sec = taskhive::yaml_get_or(node, "dashboard_interval_sec", 60);
    s.log_level = taskhive::yaml_get_or<std::string>(node, "log_level", "info");
    s.log_file = taskhive::yaml_get_or<std::string>(node, "log_file", "");
    s.pid_file = taskhive::yaml_get_or<std::string>(node, "pid_file", "");
    return true;
  }
};

template <>
struct convert<taskhive::SystemConfig> {
  static bool decode(const Node& node, taskhive::SystemConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto storage = node["storage"]) {
      c.storage = storage.as<taskhive::StorageConfig>();
    }
    if (auto queue = node["queue"]) {
      c.queue = queue.as<taskhive::QueueConfig>();
    }
    if (auto monitor = node["monitor"]) {
      c.monitor = monitor.as<taskhive::MonitorConfig>();
    }
    if (auto workers = node["workers"]) {
      c.workers = workers.as<taskhive::WorkersConfig>();
    }
    if (auto supervisor = node["supervisor"]) {
      c.supervisor = supervisor.as<taskhive::SupervisorConfig>();
    }
    return true;
  }
};

}  // namespace YAML

namespace taskhive {

namespace {

// Cross-field checks yaml-cpp cannot express.
auto validate(const SystemConfig& c) -> Result<void> {
  if (c.workers.max_workers < 1 || c.monitor.max_recommended_workers < 1) {
    log::error("Config: worker limits must be at least 1");
    return fail(Error::InvalidArgument);
  }
  if (c.workers.poll_timeout_ms < 0 || c.workers.retry_backoff_sec < 0 ||
      c.workers.stop_grace_ms < 0 || c.queue.result_ttl_sec <= 0) {
    log::error("Config: timing values must not be negative");
    return fail(Error::InvalidArgument);
  }
  if (c.supervisor.autoscale_interval_sec <= 0 ||
      c.supervisor.metrics_interval_sec <= 0 ||
      c.supervisor.throughput_window_sec <= 0) {
    log::error("Config: supervisor intervals must be positive");
    return fail(Error::InvalidArgument);
  }
  return ok();
}

void to_yaml(YAML::Emitter& out, const StorageConfig& s) {
  const StorageConfig d;
  out << YAML::BeginMap;
  yaml_emit_if_changed(out, "db_file", s.db_file, d.db_file);
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const QueueConfig& q) {
  const QueueConfig d;
  out << YAML::BeginMap;
  if (q.backend != d.backend) {
    yaml_emit(out, "backend", std::string(queue_backend_name(q.backend)));
  }
  yaml_emit_if_changed(out, "path", q.path, d.path);
  yaml_emit_if_changed(out, "result_ttl_sec", q.result_ttl_sec, d.result_ttl_sec);
  yaml_emit_if_changed(out, "busy_timeout_ms", q.busy_timeout_ms, d.busy_timeout_ms);
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const MonitorConfig& m) {
  const MonitorConfig d;
  out << YAML::BeginMap;
  yaml_emit_if_changed(out, "cpu_throttle_percent", m.cpu_throttle_percent,
                       d.cpu_throttle_percent);
  yaml_emit_if_changed(out, "memory_throttle_percent", m.memory_throttle_percent,
                       d.memory_throttle_percent);
  yaml_emit_if_changed(out, "cpu_scale_down_percent", m.cpu_scale_down_percent,
                       d.cpu_scale_down_percent);
  yaml_emit_if_changed(out, "memory_scale_down_percent",
                       m.memory_scale_down_percent, d.memory_scale_down_percent);
  yaml_emit_if_changed(out, "max_recommended_workers", m.max_recommended_workers,
                       d.max_recommended_workers);
  yaml_emit_if_changed(out, "history_size", m.history_size, d.history_size);
  yaml_emit_if_changed(out, "sample_interval_ms", m.sample_interval_ms,
                       d.sample_interval_ms);
  yaml_emit_if_changed(out, "disk_path", m.disk_path, d.disk_path);
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const WorkersConfig& w) {
  const WorkersConfig d;
  out << YAML::BeginMap;
  yaml_emit(out, "mode", std::string(worker_mode_name(w.mode)));
  yaml_emit_if_changed(out, "max_workers", w.max_workers, d.max_workers);
  yaml_emit_if_changed(out, "poll_timeout_ms", w.poll_timeout_ms, d.poll_timeout_ms);
  yaml_emit_if_changed(out, "throttle_sleep_ms", w.throttle_sleep_ms,
                       d.throttle_sleep_ms);
  yaml_emit_if_changed(out, "idle_pause_ms", w.idle_pause_ms, d.idle_pause_ms);
  yaml_emit_if_changed(out, "retry_backoff_sec", w.retry_backoff_sec,
                       d.retry_backoff_sec);
  yaml_emit_if_changed(out, "stop_grace_ms", w.stop_grace_ms, d.stop_grace_ms);
  yaml_emit_if_changed(out, "renice_background", w.renice_background,
                       d.renice_background);
  yaml_emit_if_not_empty(out, "worker_executable", w.worker_executable);
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const SupervisorConfig& s) {
  const SupervisorConfig d;
  out << YAML::BeginMap;
  yaml_emit(out, "log_level", s.log_level);
  yaml_emit_if_not_empty(out, "log_file", s.log_file);
  yaml_emit_if_not_empty(out, "pid_file", s.pid_file);
  yaml_emit_if_changed(out, "autoscale_interval_sec", s.autoscale_interval_sec,
                       d.autoscale_interval_sec);
  yaml_emit_if_changed(out, "metrics_interval_sec", s.metrics_interval_sec,
                       d.metrics_interval_sec);
  yaml_emit_if_changed(out, "throughput_window_sec", s.throughput_window_sec,
                       d.throughput_window_sec);
  yaml_emit_if_changed(out, "dashboard_interval_sec", s.dashboard_interval_sec,
                       d.dashboard_interval_sec);
  out << YAML::EndMap;
}

}  // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<SystemConfig> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    SystemConfig config = root.as<SystemConfig>();
    if (auto r = validate(config); !r) {
      return fail(r.error());
    }
    return ok(std::move(config));
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::to_string(const SystemConfig& config) -> std::string {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "storage" << YAML::Value;
  to_yaml(out, config.storage);
  out << YAML::Key << "queue" << YAML::Value;
  to_yaml(out, config.queue);
  out << YAML::Key << "monitor" << YAML::Value;
  to_yaml(out, config.monitor);
  out << YAML::Key << "workers" << YAML::Value;
  to_yaml(out, config.workers);
  out << YAML::Key << "supervisor" << YAML::Value;
  to_yaml(out, config.supervisor);
  out << YAML::EndMap;
  return out.c_str();
}

}  // namespace taskhive
