#pragma once

#include "taskhive/core/error.hpp"
#include "taskhive/storage/sqlite_db.hpp"
#include "taskhive/task/task.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace taskhive {

// Durable view of a task as stored in the `tasks` table.
struct TaskRecord {
  TaskId id;
  std::string name;
  std::string function;
  Priority priority{Priority::Medium};
  TaskStatus status{TaskStatus::Pending};
  TimePoint created_at{};
  TimePoint updated_at{};
  std::optional<TimePoint> completed_at;
  WorkerId worker_id;
  double execution_time{0.0};
  int retry_count{0};
  int max_retries{0};
  std::string error;
  nlohmann::json result;
};

struct MetricsSnapshot {
  TimePoint timestamp{};
  double cpu_percent{0.0};
  double memory_percent{0.0};
  int active_workers{0};
  std::int64_t queue_size{0};
  double tasks_per_minute{0.0};
  bool throttled{false};
};

using StatusCounts = std::map<TaskStatus, std::int64_t>;

class Persistence {
public:
  explicit Persistence(std::string_view db_path, int busy_timeout_ms = 5000);
  ~Persistence();

  Persistence(const Persistence&) = delete;
  Persistence& operator=(const Persistence&) = delete;

  [[nodiscard]] auto open() -> Result<void>;
  auto close() -> void;
  [[nodiscard]] auto is_open() const noexcept -> bool {
    return db_.is_open();
  }

  // Upsert by id. completed_at is stamped when the status is terminal.
  [[nodiscard]] auto save_task(const Task& task) -> Result<void>;
  [[nodiscard]] auto update_status(const TaskId& id, TaskStatus status,
                                   std::string_view error = {})
      -> Result<void>;

  [[nodiscard]] auto get_task(const TaskId& id) -> Result<TaskRecord>;
  // Rebuilds the Task from the stored envelope, overlaid with the durable
  // status, retry count and worker.
  [[nodiscard]] auto load_task(const TaskId& id) -> Result<Task>;

  [[nodiscard]] auto list_running_tasks(
      const std::optional<WorkerId>& worker = std::nullopt)
      -> Result<std::vector<Task>>;

  [[nodiscard]] auto counts_by_status(TimePoint since) -> Result<StatusCounts>;
  [[nodiscard]] auto count_in_status_since(TaskStatus status, TimePoint since)
      -> Result<std::int64_t>;
  [[nodiscard]] auto avg_execution_time(TimePoint since) -> Result<double>;

  [[nodiscard]] auto save_metrics(const MetricsSnapshot& snapshot)
      -> Result<void>;
  [[nodiscard]] auto list_metrics(std::size_t limit = 100)
      -> Result<std::vector<MetricsSnapshot>>;

private:
  [[nodiscard]] auto create_tables() -> Result<void>;
  [[nodiscard]] auto task_from_row(const sqlite::Statement& stmt)
      -> Result<Task>;

  sqlite::Database db_;
  int busy_timeout_ms_;
};

}  // namespace taskhive
