#include "taskhive/queue/priority_queue.hpp"

#include "taskhive/core/constants.hpp"
#include "taskhive/storage/sqlite_db.hpp"
#include "taskhive/util/log.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <mutex>
#include <thread>

namespace taskhive {

namespace {

// Queue shared by every process that opens the same file. Dequeue is a
// single DELETE ... RETURNING inside BEGIN IMMEDIATE, so two consumers can
// never both receive an entry.
class SqliteQueueBackend final : public IQueueBackend {
public:
  explicit SqliteQueueBackend(const QueueConfig& config)
      : db_(config.path), busy_timeout_ms_(config.busy_timeout_ms) {
  }

  [[nodiscard]] auto open() -> Result<void> {
    if (auto r = db_.open(busy_timeout_ms_); !r) {
      return r;
    }
    return db_.execute(R"(
      CREATE TABLE IF NOT EXISTS task_queue (
        seq INTEGER PRIMARY KEY AUTOINCREMENT,
        task_id TEXT NOT NULL UNIQUE,
        score REAL NOT NULL,
        eligible_at INTEGER NOT NULL DEFAULT 0,
        payload TEXT NOT NULL
      );

      CREATE INDEX IF NOT EXISTS idx_task_queue_score
        ON task_queue(score, seq);

      CREATE TABLE IF NOT EXISTS task_results (
        task_id TEXT PRIMARY KEY,
        result TEXT NOT NULL,
        expires_at INTEGER NOT NULL
      );
    )");
  }

  auto push(const Task& task, double score, TimePoint eligible_at)
      -> Result<void> override {
    constexpr auto sql = R"(
      INSERT INTO task_queue (task_id, score, eligible_at, payload)
      VALUES (?, ?, ?, ?);
    )";

    std::lock_guard lock(mu_);
    auto stmt = db_.prepare(sql);
    if (!stmt)
      return std::unexpected(stmt.error());
    stmt->bind(1, task.id.value());
    stmt->bind(2, score);
    stmt->bind(3, to_millis(eligible_at));
    stmt->bind(4, encode_envelope(task));

    int rc = stmt->step();
    if (rc == SQLITE_CONSTRAINT) {
      return fail(Error::AlreadyExists);
    }
    if (rc != SQLITE_DONE) {
      log::error("Queue insert failed: {}", db_.errmsg());
      return fail(Error::DatabaseQueryFailed);
    }
    return ok();
  }

  auto pop(std::chrono::milliseconds timeout)
      -> Result<std::optional<Task>> override {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
      auto popped = try_pop();
      if (!popped) {
        return std::unexpected(popped.error());
      }
      if (*popped) {
        auto task = decode_envelope(**popped);
        if (task) {
          return std::optional<Task>{std::move(*task)};
        }
        // Undecodable entries are dropped rather than redelivered forever.
        log::error("Dropping undecodable queue entry: {}",
                   task.error().message());
        continue;
      }
      auto now = std::chrono::steady_clock::now();
      if (now >= deadline) {
        return std::optional<Task>{};
      }
      std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
          timing::kSqlitePopPollInterval, deadline - now));
    }
  }

  auto size() -> Result<std::int64_t> override {
    std::lock_guard lock(mu_);
    auto stmt = db_.prepare("SELECT COUNT(*) FROM task_queue;");
    if (!stmt)
      return std::unexpected(stmt.error());
    if (stmt->step() != SQLITE_ROW)
      return fail(Error::DatabaseQueryFailed);
    return stmt->col_int64(0);
  }

  auto remove(const TaskId& id) -> Result<bool> override {
    std::lock_guard lock(mu_);
    auto stmt = db_.prepare("DELETE FROM task_queue WHERE task_id = ?;");
    if (!stmt)
      return std::unexpected(stmt.error());
    stmt->bind(1, id.value());
    if (stmt->step() != SQLITE_DONE)
      return fail(Error::DatabaseQueryFailed);
    return db_.changes() > 0;
  }

  auto set_result(const TaskId& id, const nlohmann::json& result,
                  std::chrono::seconds ttl) -> Result<void> override {
    constexpr auto sql = R"(
      INSERT INTO task_results (task_id, result, expires_at)
      VALUES (?, ?, ?)
      ON CONFLICT(task_id) DO UPDATE SET
        result = excluded.result,
        expires_at = excluded.expires_at;
    )";

    std::lock_guard lock(mu_);
    auto now = to_millis(Clock::now());
    if (auto purge = db_.prepare(
            "DELETE FROM task_results WHERE expires_at <= ?;")) {
      purge->bind(1, now);
      if (purge->step() != SQLITE_DONE) {
        log::debug("Result cache purge failed: {}", db_.errmsg());
      }
    }

    auto stmt = db_.prepare(sql);
    if (!stmt)
      return std::unexpected(stmt.error());
    stmt->bind(1, id.value());
    stmt->bind(2, result.dump());
    stmt->bind(3, now + std::chrono::duration_cast<std::chrono::milliseconds>(
                            ttl)
                            .count());
    return stmt->step() == SQLITE_DONE ? ok()
                                       : fail(Error::DatabaseQueryFailed);
  }

  auto get_result(const TaskId& id)
      -> Result<std::optional<nlohmann::json>> override {
    constexpr auto sql = R"(
      SELECT result FROM task_results WHERE task_id = ? AND expires_at > ?;
    )";

    std::lock_guard lock(mu_);
    auto stmt = db_.prepare(sql);
    if (!stmt)
      return std::unexpected(stmt.error());
    stmt->bind(1, id.value());
    stmt->bind(2, to_millis(Clock::now()));
    if (stmt->step() != SQLITE_ROW) {
      return std::optional<nlohmann::json>{};
    }
    auto value = nlohmann::json::parse(stmt->col_text(0), nullptr, false);
    if (value.is_discarded()) {
      return fail(Error::ParseError);
    }
    return std::optional<nlohmann::json>{std::move(value)};
  }

  auto is_shared() const noexcept -> bool override {
    return true;
  }

  auto name() const noexcept -> std::string_view override {
    return "sqlite";
  }

private:
  // One attempt; returns the raw payload of the removed entry, if any.
  auto try_pop() -> Result<std::optional<std::string>> {
    constexpr auto sql = R"(
      DELETE FROM task_queue WHERE task_id = (
        SELECT task_id FROM task_queue
        WHERE eligible_at <= ?
        ORDER BY score, seq LIMIT 1
      ) RETURNING payload;
    )";

    std::lock_guard lock(mu_);
    if (auto r = db_.execute("BEGIN IMMEDIATE;"); !r) {
      // Lock contention beyond busy_timeout; the caller polls again.
      log::debug("Queue busy, retrying dequeue");
      return std::optional<std::string>{};
    }

    std::optional<std::string> payload;
    {
      auto stmt = db_.prepare(sql);
      if (!stmt) {
        rollback();
        return std::unexpected(stmt.error());
      }
      stmt->bind(1, to_millis(Clock::now()));
      int rc = stmt->step();
      if (rc == SQLITE_ROW) {
        payload = stmt->col_text(0);
        rc = stmt->step();
      }
      if (rc != SQLITE_DONE) {
        log::error("Queue dequeue failed: {}", db_.errmsg());
        stmt->reset();
        rollback();
        return fail(Error::DatabaseQueryFailed);
      }
    }

    if (auto r = db_.execute("COMMIT;"); !r) {
      rollback();
      return std::unexpected(r.error());
    }
    return payload;
  }

  auto rollback() -> void {
    if (auto r = db_.execute("ROLLBACK;"); !r) {
      log::warn("Queue rollback failed: {}", r.error().message());
    }
  }

  std::mutex mu_;
  sqlite::Database db_;
  int busy_timeout_ms_;
};

}  // namespace

auto create_sqlite_queue_backend(const QueueConfig& config)
    -> Result<std::unique_ptr<IQueueBackend>> {
  auto backend = std::make_unique<SqliteQueueBackend>(config);
  if (auto r = backend->open(); !r) {
    return fail(Error::QueueUnavailable);
  }
  log::info("Task queue opened: {}", config.path);
  return std::unique_ptr<IQueueBackend>{std::move(backend)};
}

}  // namespace taskhive
