#pragma once

#include "taskhive/config/system_config.hpp"
#include "taskhive/core/error.hpp"
#include "taskhive/task/task.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

namespace taskhive {

// Storage behind PriorityTaskQueue. Entries are ordered by (score, insertion
// sequence) and only handed out once their eligibility time has passed.
class IQueueBackend {
public:
  virtual ~IQueueBackend() = default;

  // Error::AlreadyExists when the id is already queued.
  [[nodiscard]] virtual auto push(const Task& task, double score,
                                  TimePoint eligible_at) -> Result<void> = 0;
  // Removes and returns the best eligible entry, waiting up to `timeout`.
  [[nodiscard]] virtual auto pop(std::chrono::milliseconds timeout)
      -> Result<std::optional<Task>> = 0;
  [[nodiscard]] virtual auto size() -> Result<std::int64_t> = 0;
  [[nodiscard]] virtual auto remove(const TaskId& id) -> Result<bool> = 0;

  [[nodiscard]] virtual auto set_result(const TaskId& id,
                                        const nlohmann::json& result,
                                        std::chrono::seconds ttl)
      -> Result<void> = 0;
  [[nodiscard]] virtual auto get_result(const TaskId& id)
      -> Result<std::optional<nlohmann::json>> = 0;

  // True when other processes opening the same backend see the same queue.
  [[nodiscard]] virtual auto is_shared() const noexcept -> bool = 0;
  [[nodiscard]] virtual auto name() const noexcept -> std::string_view = 0;
};

[[nodiscard]] auto create_sqlite_queue_backend(const QueueConfig& config)
    -> Result<std::unique_ptr<IQueueBackend>>;
[[nodiscard]] auto create_memory_queue_backend()
    -> std::unique_ptr<IQueueBackend>;

class PriorityTaskQueue {
public:
  explicit PriorityTaskQueue(std::unique_ptr<IQueueBackend> backend,
                             bool degraded = false);

  // Opens the configured backend. A sqlite queue that cannot be opened
  // degrades to the in-process backend instead of failing.
  [[nodiscard]] static auto open(const QueueConfig& config)
      -> std::unique_ptr<PriorityTaskQueue>;

  [[nodiscard]] auto put(const Task& task) -> bool;
  [[nodiscard]] auto get(std::chrono::milliseconds timeout)
      -> std::optional<Task>;
  [[nodiscard]] auto size() -> std::int64_t;
  [[nodiscard]] auto cancel(const TaskId& id) -> bool;

  auto set_result(const TaskId& id, const nlohmann::json& result,
                  std::chrono::seconds ttl) -> bool;
  [[nodiscard]] auto get_result(const TaskId& id)
      -> std::optional<nlohmann::json>;

  [[nodiscard]] auto is_shared() const noexcept -> bool {
    return backend_->is_shared();
  }
  [[nodiscard]] auto is_degraded() const noexcept -> bool {
    return degraded_;
  }
  [[nodiscard]] auto backend_name() const noexcept -> std::string_view {
    return backend_->name();
  }

private:
  std::unique_ptr<IQueueBackend> backend_;
  bool degraded_;
};

}  // namespace taskhive
