#pragma once

#include "taskhive/core/error.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

struct sqlite3;
struct sqlite3_stmt;

namespace taskhive::sqlite {

// Owns a prepared statement; finalized on destruction.
class Statement {
public:
  explicit Statement(sqlite3_stmt* stmt = nullptr) noexcept : stmt_(stmt) {
  }
  ~Statement();
  Statement(Statement&& other) noexcept
      : stmt_(std::exchange(other.stmt_, nullptr)) {
  }
  Statement& operator=(Statement&& other) noexcept {
    if (this != &other) {
      reset();
      stmt_ = std::exchange(other.stmt_, nullptr);
    }
    return *this;
  }
  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  [[nodiscard]] auto get() const noexcept -> sqlite3_stmt* {
    return stmt_;
  }
  [[nodiscard]] explicit operator bool() const noexcept {
    return stmt_ != nullptr;
  }
  auto reset() -> void;

  auto bind(int idx, std::string_view value) -> void;
  auto bind(int idx, std::int64_t value) -> void;
  auto bind(int idx, int value) -> void;
  auto bind(int idx, double value) -> void;
  auto bind_null(int idx) -> void;

  // Returns the raw sqlite3_step code.
  [[nodiscard]] auto step() -> int;

  [[nodiscard]] auto col_text(int col) const -> std::string;
  [[nodiscard]] auto col_int64(int col) const -> std::int64_t;
  [[nodiscard]] auto col_int(int col) const -> int;
  [[nodiscard]] auto col_double(int col) const -> double;
  [[nodiscard]] auto col_is_null(int col) const -> bool;

private:
  sqlite3_stmt* stmt_ = nullptr;
};

// One connection per owner; connections are never shared across threads
// without external locking, and never across fork().
class Database {
public:
  explicit Database(std::string_view path);
  ~Database();

  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;

  [[nodiscard]] auto open(int busy_timeout_ms) -> Result<void>;
  auto close() -> void;
  [[nodiscard]] auto is_open() const noexcept -> bool {
    return db_ != nullptr;
  }

  [[nodiscard]] auto execute(std::string_view sql) -> Result<void>;
  [[nodiscard]] auto prepare(const char* sql) -> Result<Statement>;

  [[nodiscard]] auto changes() const -> int;
  [[nodiscard]] auto errmsg() const -> const char*;
  [[nodiscard]] auto path() const noexcept -> const std::string& {
    return path_;
  }

private:
  struct DbDeleter {
    void operator()(sqlite3* db) const;
  };

  std::string path_;
  std::unique_ptr<sqlite3, DbDeleter> db_{nullptr};
};

}  // namespace taskhive::sqlite
