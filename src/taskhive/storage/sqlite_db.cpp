#include "taskhive/storage/sqlite_db.hpp"

#include "taskhive/util/log.hpp"

#include <sqlite3.h>

namespace taskhive::sqlite {

Statement::~Statement() {
  reset();
}

auto Statement::reset() -> void {
  if (stmt_) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

auto Statement::bind(int idx, std::string_view value) -> void {
  sqlite3_bind_text(stmt_, idx, value.data(), static_cast<int>(value.size()),
                    SQLITE_TRANSIENT);
}

auto Statement::bind(int idx, std::int64_t value) -> void {
  sqlite3_bind_int64(stmt_, idx, value);
}

auto Statement::bind(int idx, int value) -> void {
  sqlite3_bind_int(stmt_, idx, value);
}

auto Statement::bind(int idx, double value) -> void {
  sqlite3_bind_double(stmt_, idx, value);
}

auto Statement::bind_null(int idx) -> void {
  sqlite3_bind_null(stmt_, idx);
}

auto Statement::step() -> int {
  return sqlite3_step(stmt_);
}

auto Statement::col_text(int col) const -> std::string {
  auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
  return p ? p : "";
}

auto Statement::col_int64(int col) const -> std::int64_t {
  return sqlite3_column_int64(stmt_, col);
}

auto Statement::col_int(int col) const -> int {
  return sqlite3_column_int(stmt_, col);
}

auto Statement::col_double(int col) const -> double {
  return sqlite3_column_double(stmt_, col);
}

auto Statement::col_is_null(int col) const -> bool {
  return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

auto Database::DbDeleter::operator()(sqlite3* db) const -> void {
  if (db)
    sqlite3_close(db);
}

Database::Database(std::string_view path) : path_(path) {
}

Database::~Database() {
  close();
}

auto Database::open(int busy_timeout_ms) -> Result<void> {
  if (db_) {
    return ok();
  }

  sqlite3* raw_db = nullptr;
  int rc = sqlite3_open_v2(path_.c_str(), &raw_db,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                               SQLITE_OPEN_NOMUTEX,
                           nullptr);
  if (rc != SQLITE_OK) {
    log::error("Failed to open database {}: {}", path_,
               raw_db ? sqlite3_errmsg(raw_db) : "out of memory");
    if (raw_db) {
      sqlite3_close(raw_db);
    }
    return fail(Error::DatabaseOpenFailed);
  }
  db_.reset(raw_db);
  sqlite3_busy_timeout(db_.get(), busy_timeout_ms);

  // Not every filesystem supports WAL; the rollback journal still works.
  if (auto r = execute("PRAGMA journal_mode=WAL;"); !r) {
    log::warn("Failed to set WAL mode on {}: {}", path_, r.error().message());
  }
  if (auto r = execute("PRAGMA synchronous=NORMAL;"); !r) {
    log::warn("Failed to set synchronous mode: {}", r.error().message());
  }
  return ok();
}

auto Database::close() -> void {
  db_.reset();
}

auto Database::execute(std::string_view sql) -> Result<void> {
  if (!db_) {
    return fail(Error::DatabaseError);
  }
  char* err_msg = nullptr;
  std::string sql_str{sql};
  int rc = sqlite3_exec(db_.get(), sql_str.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    log::error("SQL error: {}", err_msg ? err_msg : sqlite3_errstr(rc));
    sqlite3_free(err_msg);
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto Database::prepare(const char* sql) -> Result<Statement> {
  if (!db_) {
    return fail(Error::DatabaseError);
  }
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_.get(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
    log::error("Failed to prepare statement: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return Statement{stmt};
}

auto Database::changes() const -> int {
  return db_ ? sqlite3_changes(db_.get()) : 0;
}

auto Database::errmsg() const -> const char* {
  return db_ ? sqlite3_errmsg(db_.get()) : "database not open";
}

}  // namespace taskhive::sqlite
