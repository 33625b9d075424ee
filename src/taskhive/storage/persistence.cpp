#include "taskhive/storage/persistence.hpp"

#include "taskhive/util/log.hpp"

#include <sqlite3.h>

#include <format>
#include <utility>

namespace taskhive {

namespace {

constexpr auto kTaskColumns =
    "payload, status, retry_count, worker_id, error, execution_time";

auto now_millis() -> std::int64_t {
  return to_millis(Clock::now());
}

auto status_or(std::string_view name, TaskStatus fallback) -> TaskStatus {
  return parse_task_status(name).value_or(fallback);
}

}  // namespace

Persistence::Persistence(std::string_view db_path, int busy_timeout_ms)
    : db_(db_path), busy_timeout_ms_(busy_timeout_ms) {
}

Persistence::~Persistence() {
  close();
}

auto Persistence::open() -> Result<void> {
  if (db_.is_open()) {
    return ok();
  }
  if (auto r = db_.open(busy_timeout_ms_); !r) {
    return r;
  }
  if (auto r = create_tables(); !r) {
    close();
    return r;
  }
  log::info("Database opened: {}", db_.path());
  return ok();
}

auto Persistence::close() -> void {
  db_.close();
}

auto Persistence::create_tables() -> Result<void> {
  const char* sql = R"(
    CREATE TABLE IF NOT EXISTS tasks (
      id TEXT PRIMARY KEY,
      name TEXT NOT NULL,
      function TEXT NOT NULL,
      priority INTEGER NOT NULL,
      status TEXT NOT NULL,
      created_at INTEGER NOT NULL,
      updated_at INTEGER NOT NULL,
      completed_at INTEGER,
      worker_id TEXT DEFAULT '',
      execution_time REAL DEFAULT 0,
      retry_count INTEGER DEFAULT 0,
      max_retries INTEGER DEFAULT 3,
      error TEXT DEFAULT '',
      result TEXT,
      payload TEXT NOT NULL
    );

    CREATE INDEX IF NOT EXISTS idx_tasks_status ON tasks(status);
    CREATE INDEX IF NOT EXISTS idx_tasks_created ON tasks(created_at);
    CREATE INDEX IF NOT EXISTS idx_tasks_worker ON tasks(worker_id, status);

    CREATE TABLE IF NOT EXISTS system_metrics (
      id INTEGER PRIMARY KEY AUTOINCREMENT,
      timestamp INTEGER NOT NULL,
      cpu_percent REAL,
      memory_percent REAL,
      active_workers INTEGER,
      queue_size INTEGER,
      tasks_per_minute REAL,
      throttled INTEGER DEFAULT 0
    );

    CREATE INDEX IF NOT EXISTS idx_metrics_timestamp
      ON system_metrics(timestamp);
  )";

  return db_.execute(sql);
}

auto Persistence::save_task(const Task& task) -> Result<void> {
  constexpr auto sql = R"(
    INSERT INTO tasks
      (id, name, function, priority, status, created_at, updated_at,
       completed_at, worker_id, execution_time, retry_count, max_retries,
       error, result, payload)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(id) DO UPDATE SET
      status = excluded.status,
      updated_at = excluded.updated_at,
      completed_at = excluded.completed_at,
      worker_id = excluded.worker_id,
      execution_time = excluded.execution_time,
      retry_count = excluded.retry_count,
      max_retries = excluded.max_retries,
      error = excluded.error,
      result = excluded.result,
      payload = excluded.payload;
  )";

  auto stmt = db_.prepare(sql);
  if (!stmt)
    return std::unexpected(stmt.error());

  auto now = now_millis();
  stmt->bind(1, task.id.value());
  stmt->bind(2, task.name);
  stmt->bind(3, task.function);
  stmt->bind(4, static_cast<int>(std::to_underlying(task.priority)));
  stmt->bind(5, task_status_name(task.status));
  stmt->bind(6, to_millis(task.created_at));
  stmt->bind(7, now);
  if (is_terminal(task.status)) {
    stmt->bind(8, now);
  } else {
    stmt->bind_null(8);
  }
  stmt->bind(9, task.worker_id.value());
  stmt->bind(10, task.execution_time);
  stmt->bind(11, task.retry_count);
  stmt->bind(12, task.max_retries);
  stmt->bind(13, task.error);
  if (task.result.is_null()) {
    stmt->bind_null(14);
  } else {
    stmt->bind(14, task.result.dump());
  }
  stmt->bind(15, encode_envelope(task));

  if (stmt->step() != SQLITE_DONE) {
    log::error("Failed to save task {}: {}", task.id, db_.errmsg());
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto Persistence::update_status(const TaskId& id, TaskStatus status,
                                std::string_view error) -> Result<void> {
  constexpr auto sql = R"(
    UPDATE tasks SET
      status = ?1,
      updated_at = ?2,
      completed_at = CASE WHEN ?3 THEN ?2 ELSE completed_at END,
      error = CASE WHEN ?4 = '' THEN error ELSE ?4 END
    WHERE id = ?5;
  )";

  auto stmt = db_.prepare(sql);
  if (!stmt)
    return std::unexpected(stmt.error());

  stmt->bind(1, task_status_name(status));
  stmt->bind(2, now_millis());
  stmt->bind(3, is_terminal(status) ? 1 : 0);
  stmt->bind(4, error);
  stmt->bind(5, id.value());

  if (stmt->step() != SQLITE_DONE) {
    return fail(Error::DatabaseQueryFailed);
  }
  if (db_.changes() == 0) {
    return fail(Error::NotFound);
  }
  return ok();
}

auto Persistence::get_task(const TaskId& id) -> Result<TaskRecord> {
  constexpr auto sql = R"(
    SELECT id, name, function, priority, status, created_at, updated_at,
           completed_at, worker_id, execution_time, retry_count, max_retries,
           error, result
    FROM tasks WHERE id = ?;
  )";

  auto stmt = db_.prepare(sql);
  if (!stmt)
    return std::unexpected(stmt.error());
  stmt->bind(1, id.value());

  if (stmt->step() != SQLITE_ROW)
    return fail(Error::NotFound);

  TaskRecord rec;
  rec.id = TaskId{stmt->col_text(0)};
  rec.name = stmt->col_text(1);
  rec.function = stmt->col_text(2);
  rec.priority =
      priority_from_value(stmt->col_int(3)).value_or(Priority::Medium);
  rec.status = status_or(stmt->col_text(4), TaskStatus::Pending);
  rec.created_at = from_millis(stmt->col_int64(5));
  rec.updated_at = from_millis(stmt->col_int64(6));
  if (!stmt->col_is_null(7)) {
    rec.completed_at = from_millis(stmt->col_int64(7));
  }
  rec.worker_id = WorkerId{stmt->col_text(8)};
  rec.execution_time = stmt->col_double(9);
  rec.retry_count = stmt->col_int(10);
  rec.max_retries = stmt->col_int(11);
  rec.error = stmt->col_text(12);
  if (!stmt->col_is_null(13)) {
    rec.result = nlohmann::json::parse(stmt->col_text(13), nullptr, false);
    if (rec.result.is_discarded()) {
      log::warn("Stored result for task {} is not valid JSON", id);
      rec.result = nullptr;
    }
  }
  return rec;
}

auto Persistence::task_from_row(const sqlite::Statement& stmt)
    -> Result<Task> {
  auto task = decode_envelope(stmt.col_text(0));
  if (!task)
    return std::unexpected(task.error());
  task->status = status_or(stmt.col_text(1), task->status);
  task->retry_count = stmt.col_int(2);
  task->worker_id = WorkerId{stmt.col_text(3)};
  task->error = stmt.col_text(4);
  task->execution_time = stmt.col_double(5);
  return task;
}

auto Persistence::load_task(const TaskId& id) -> Result<Task> {
  auto sql = std::format("SELECT {} FROM tasks WHERE id = ?;", kTaskColumns);
  auto stmt = db_.prepare(sql.c_str());
  if (!stmt)
    return std::unexpected(stmt.error());
  stmt->bind(1, id.value());

  if (stmt->step() != SQLITE_ROW)
    return fail(Error::NotFound);
  return task_from_row(*stmt);
}

auto Persistence::list_running_tasks(const std::optional<WorkerId>& worker)
    -> Result<std::vector<Task>> {
  auto sql = worker ? std::format("SELECT {} FROM tasks WHERE status = "
                                  "'running' AND worker_id = ?;",
                                  kTaskColumns)
                    : std::format("SELECT {} FROM tasks WHERE status = "
                                  "'running';",
                                  kTaskColumns);
  auto stmt = db_.prepare(sql.c_str());
  if (!stmt)
    return std::unexpected(stmt.error());
  if (worker) {
    stmt->bind(1, worker->value());
  }

  std::vector<Task> tasks;
  int rc;
  while ((rc = stmt->step()) == SQLITE_ROW) {
    auto task = task_from_row(*stmt);
    if (!task) {
      log::warn("Skipping running task with unreadable payload: {}",
                task.error().message());
      continue;
    }
    tasks.push_back(std::move(*task));
  }
  if (rc != SQLITE_DONE) {
    return fail(Error::DatabaseQueryFailed);
  }
  return tasks;
}

auto Persistence::counts_by_status(TimePoint since) -> Result<StatusCounts> {
  constexpr auto sql = R"(
    SELECT status, COUNT(*) FROM tasks
    WHERE created_at >= ? GROUP BY status;
  )";

  auto stmt = db_.prepare(sql);
  if (!stmt)
    return std::unexpected(stmt.error());
  stmt->bind(1, to_millis(since));

  StatusCounts counts;
  while (stmt->step() == SQLITE_ROW) {
    if (auto status = parse_task_status(stmt->col_text(0))) {
      counts[*status] = stmt->col_int64(1);
    }
  }
  return counts;
}

auto Persistence::count_in_status_since(TaskStatus status, TimePoint since)
    -> Result<std::int64_t> {
  constexpr auto sql = R"(
    SELECT COUNT(*) FROM tasks
    WHERE status = ? AND COALESCE(completed_at, updated_at) >= ?;
  )";

  auto stmt = db_.prepare(sql);
  if (!stmt)
    return std::unexpected(stmt.error());
  stmt->bind(1, task_status_name(status));
  stmt->bind(2, to_millis(since));

  if (stmt->step() != SQLITE_ROW)
    return fail(Error::DatabaseQueryFailed);
  return stmt->col_int64(0);
}

auto Persistence::avg_execution_time(TimePoint since) -> Result<double> {
  constexpr auto sql = R"(
    SELECT AVG(execution_time) FROM tasks
    WHERE status = 'completed' AND completed_at >= ?;
  )";

  auto stmt = db_.prepare(sql);
  if (!stmt)
    return std::unexpected(stmt.error());
  stmt->bind(1, to_millis(since));

  if (stmt->step() != SQLITE_ROW)
    return fail(Error::DatabaseQueryFailed);
  return stmt->col_is_null(0) ? 0.0 : stmt->col_double(0);
}

auto Persistence::save_metrics(const MetricsSnapshot& snapshot)
    -> Result<void> {
  constexpr auto sql = R"(
    INSERT INTO system_metrics
      (timestamp, cpu_percent, memory_percent, active_workers, queue_size,
       tasks_per_minute, throttled)
    VALUES (?, ?, ?, ?, ?, ?, ?);
  )";

  auto stmt = db_.prepare(sql);
  if (!stmt)
    return std::unexpected(stmt.error());

  stmt->bind(1, to_millis(snapshot.timestamp));
  stmt->bind(2, snapshot.cpu_percent);
  stmt->bind(3, snapshot.memory_percent);
  stmt->bind(4, snapshot.active_workers);
  stmt->bind(5, snapshot.queue_size);
  stmt->bind(6, snapshot.tasks_per_minute);
  stmt->bind(7, snapshot.throttled ? 1 : 0);

  return stmt->step() == SQLITE_DONE ? ok() : fail(Error::DatabaseQueryFailed);
}

auto Persistence::list_metrics(std::size_t limit)
    -> Result<std::vector<MetricsSnapshot>> {
  constexpr auto sql = R"(
    SELECT timestamp, cpu_percent, memory_percent, active_workers, queue_size,
           tasks_per_minute, throttled
    FROM system_metrics ORDER BY id DESC LIMIT ?;
  )";

  auto stmt = db_.prepare(sql);
  if (!stmt)
    return std::unexpected(stmt.error());
  stmt->bind(1, static_cast<std::int64_t>(limit));

  std::vector<MetricsSnapshot> out;
  while (stmt->step() == SQLITE_ROW) {
    MetricsSnapshot m;
    m.timestamp = from_millis(stmt->col_int64(0));
    m.cpu_percent = stmt->col_double(1);
    m.memory_percent = stmt->col_double(2);
    m.active_workers = stmt->col_int(3);
    m.queue_size = stmt->col_int64(4);
    m.tasks_per_minute = stmt->col_double(5);
    m.throttled = stmt->col_int(6) != 0;
    out.push_back(m);
  }
  return out;
}

}  // namespace taskhive
