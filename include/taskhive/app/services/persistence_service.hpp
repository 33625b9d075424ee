#pragma once

#include "taskhive/core/error.hpp"
#include "taskhive/storage/persistence.hpp"

#include <memory>
#include <mutex>
#include <string_view>
#include <type_traits>

namespace taskhive {

// Wraps Persistence with fire-and-forget semantics for status reporting.
// All access is serialized, so one instance may be shared by the supervisor
// loops and thread-mode workers.
class PersistenceService {
public:
  explicit PersistenceService(std::string_view db_path,
                              int busy_timeout_ms = 5000);
  ~PersistenceService();

  PersistenceService(const PersistenceService&) = delete;
  auto operator=(const PersistenceService&) -> PersistenceService& = delete;

  [[nodiscard]] auto open() -> Result<void>;
  auto close() -> void;
  [[nodiscard]] auto is_open() const -> bool;

  // Runs fn(Persistence&) under the service lock. Used for queries.
  template <typename Fn>
  auto locked(Fn&& fn) -> std::invoke_result_t<Fn, Persistence&> {
    std::lock_guard lock(mu_);
    return std::forward<Fn>(fn)(*db_);
  }

  // Fire-and-forget operations (log errors but don't fail)
  auto save_task(const Task& task) -> void;
  auto update_status(const TaskId& id, TaskStatus status,
                     std::string_view error = {}) -> void;
  auto save_metrics(const MetricsSnapshot& snapshot) -> void;

private:
  mutable std::mutex mu_;
  std::unique_ptr<Persistence> db_;
};

}  // namespace taskhive
