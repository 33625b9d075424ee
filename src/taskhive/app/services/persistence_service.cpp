#include "taskhive/app/services/persistence_service.hpp"

#include "taskhive/util/log.hpp"

namespace taskhive {

PersistenceService::PersistenceService(std::string_view db_path,
                                       int busy_timeout_ms)
    : db_(std::make_unique<Persistence>(db_path, busy_timeout_ms)) {}

PersistenceService::~PersistenceService() {
  close();
}

auto PersistenceService::open() -> Result<void> {
  std::lock_guard lock(mu_);
  return db_->open();
}

auto PersistenceService::close() -> void {
  std::lock_guard lock(mu_);
  if (db_) {
    db_->close();
  }
}

auto PersistenceService::is_open() const -> bool {
  std::lock_guard lock(mu_);
  return db_ && db_->is_open();
}

auto PersistenceService::save_task(const Task& task) -> void {
  std::lock_guard lock(mu_);
  if (!db_->is_open())
    return;
  if (auto r = db_->save_task(task); !r) {
    log::warn("Failed to persist task {}: {}", task.id, r.error().message());
  }
}

auto PersistenceService::update_status(const TaskId& id, TaskStatus status,
                                       std::string_view error) -> void {
  std::lock_guard lock(mu_);
  if (!db_->is_open())
    return;
  if (auto r = db_->update_status(id, status, error); !r) {
    log::warn("Failed to update task {} to {}: {}", id,
              task_status_name(status), r.error().message());
  }
}

auto PersistenceService::save_metrics(const MetricsSnapshot& snapshot)
    -> void {
  std::lock_guard lock(mu_);
  if (!db_->is_open())
    return;
  if (auto r = db_->save_metrics(snapshot); !r) {
    log::debug("Failed to save metrics: {}", r.error().message());
  }
}

}  // namespace taskhive
