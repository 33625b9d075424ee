#include "taskhive/storage/recovery.hpp"

#include "taskhive/util/log.hpp"

#include <format>
#include <string>

namespace taskhive {

Recovery::Recovery(Persistence& persistence) : persistence_(persistence) {
}

auto Recovery::recover(const std::optional<WorkerId>& worker,
                       std::move_only_function<bool(const Task&)> requeue)
    -> Result<RecoveryResult> {
  RecoveryResult result;

  auto running = persistence_.list_running_tasks(worker);
  if (!running) {
    log::error("Failed to list running tasks for recovery");
    return fail(running.error());
  }
  if (running->empty()) {
    return result;
  }
  log::info("Found {} orphaned running tasks{}", running->size(),
            worker ? std::format(" on {}", *worker) : std::string{});

  for (auto& task : *running) {
    task.error = std::string(kCrashError);
    task.execution_time = 0.0;

    bool requeued = false;
    if (task.retry_count < task.max_retries) {
      ++task.retry_count;
      task.status = TaskStatus::Retry;
      task.scheduled_time.reset();
      // RETRY is stored before the put so a worker that dequeues at once
      // records RUNNING after it, never before.
      if (auto r = persistence_.save_task(task); !r) {
        log::warn("Failed to persist recovered task {}: {}", task.id,
                  r.error().message());
      }
      requeued = requeue(task);
      if (!requeued) {
        log::warn("Could not requeue recovered task {}", task.id);
      }
    }

    if (requeued) {
      log::info("Task {} was running on {}, requeued (retry {}/{})", task.id,
                task.worker_id, task.retry_count, task.max_retries);
      result.requeued.push_back(task.id);
      continue;
    }

    task.status = TaskStatus::Failed;
    log::warn("Task {} was running on {}, marked failed", task.id,
              task.worker_id);
    result.failed.push_back(task.id);
    if (auto r = persistence_.save_task(task); !r) {
      log::warn("Failed to persist recovered task {}: {}", task.id,
                r.error().message());
    }
  }

  log::info("Recovery complete: {} requeued, {} failed", result.requeued.size(),
            result.failed.size());
  return result;
}

}  // namespace taskhive
