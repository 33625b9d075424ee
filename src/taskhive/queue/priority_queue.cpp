#include "taskhive/queue/priority_queue.hpp"

#include "taskhive/util/log.hpp"

namespace taskhive {

PriorityTaskQueue::PriorityTaskQueue(std::unique_ptr<IQueueBackend> backend,
                                     bool degraded)
    : backend_(std::move(backend)), degraded_(degraded) {
}

auto PriorityTaskQueue::open(const QueueConfig& config)
    -> std::unique_ptr<PriorityTaskQueue> {
  if (config.backend == QueueBackendKind::Memory) {
    return std::make_unique<PriorityTaskQueue>(create_memory_queue_backend());
  }

  auto backend = create_sqlite_queue_backend(config);
  if (!backend) {
    log::warn("Queue store {} unavailable ({}), falling back to in-process "
              "queue",
              config.path, backend.error().message());
    return std::make_unique<PriorityTaskQueue>(create_memory_queue_backend(),
                                               true);
  }
  return std::make_unique<PriorityTaskQueue>(std::move(*backend));
}

auto PriorityTaskQueue::put(const Task& task) -> bool {
  auto score = compute_score(task.priority, task.created_at);
  auto eligible_at = task.scheduled_time.value_or(TimePoint{});
  if (auto r = backend_->push(task, score, eligible_at); !r) {
    if (r.error() == Error::AlreadyExists) {
      log::warn("Task {} is already queued", task.id);
    } else {
      log::error("Failed to enqueue task {}: {}", task.id,
                 r.error().message());
    }
    return false;
  }
  log::debug("Queued task {} ({}, priority {}, score {:.13f})", task.id,
             task.function, priority_name(task.priority), score);
  return true;
}

auto PriorityTaskQueue::get(std::chrono::milliseconds timeout)
    -> std::optional<Task> {
  auto r = backend_->pop(timeout);
  if (!r) {
    log::error("Failed to dequeue task: {}", r.error().message());
    return std::nullopt;
  }
  return std::move(*r);
}

auto PriorityTaskQueue::size() -> std::int64_t {
  auto r = backend_->size();
  if (!r) {
    log::warn("Failed to read queue size: {}", r.error().message());
    return 0;
  }
  return *r;
}

auto PriorityTaskQueue::cancel(const TaskId& id) -> bool {
  auto r = backend_->remove(id);
  if (!r) {
    log::error("Failed to remove task {} from queue: {}", id,
               r.error().message());
    return false;
  }
  return *r;
}

auto PriorityTaskQueue::set_result(const TaskId& id,
                                   const nlohmann::json& result,
                                   std::chrono::seconds ttl) -> bool {
  if (auto r = backend_->set_result(id, result, ttl); !r) {
    log::warn("Failed to cache result for task {}: {}", id,
              r.error().message());
    return false;
  }
  return true;
}

auto PriorityTaskQueue::get_result(const TaskId& id)
    -> std::optional<nlohmann::json> {
  auto r = backend_->get_result(id);
  if (!r) {
    log::warn("Failed to read cached result for task {}: {}", id,
              r.error().message());
    return std::nullopt;
  }
  return std::move(*r);
}

}  // namespace taskhive
