#pragma once

#include "taskhive/config/system_config.hpp"
#include "taskhive/task/cancellation.hpp"
#include "taskhive/task/handler.hpp"
#include "taskhive/task/task.hpp"
#include "taskhive/util/log.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace taskhive {

class PriorityTaskQueue;
class ResourceMonitor;
class PersistenceService;
class BackgroundLane;

struct WorkerOptions {
  std::chrono::milliseconds poll_timeout{1000};
  std::chrono::milliseconds throttle_sleep{5000};
  std::chrono::milliseconds idle_pause{100};
  std::chrono::seconds retry_backoff{30};
  std::chrono::seconds result_ttl{3600};
  bool renice_background{true};

  [[nodiscard]] static auto from_config(const WorkersConfig& workers,
                                        const QueueConfig& queue)
      -> WorkerOptions;
};

enum class WorkerStep : std::uint8_t {
  Throttled,
  Idle,
  Executed,
};

// Pulls tasks from the shared queue and runs them one at a time. Handler
// failures and exceptions never leave execute(); stop is cooperative and
// takes effect between tasks. With renice_background, LOW and BATCH handlers
// run on a helper thread whose nice value is raised once, so the calling
// thread never needs the privilege to lower its own.
class Worker {
public:
  using ReportFn = std::function<void(const Task&)>;

  Worker(WorkerId id, PriorityTaskQueue& queue, ResourceMonitor& monitor,
         const HandlerRegistry& registry, PersistenceService* persistence,
         WorkerOptions options, log::Logger& logger = log::logger());
  ~Worker();

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;

  // Loops until request_stop() or *external_stop becomes true.
  auto run(const std::atomic<bool>* external_stop = nullptr) -> void;
  auto request_stop() noexcept -> void;
  // Cancels the token handed to the running handler, if any.
  auto cancel_current(CancelReason reason = CancelReason::Requested) -> void;

  auto run_once() -> WorkerStep;
  auto execute(Task& task) -> void;

  // Invoked after every persisted state change, RUNNING included.
  auto set_on_report(ReportFn fn) -> void {
    on_report_ = std::move(fn);
  }

  [[nodiscard]] auto id() const noexcept -> const WorkerId& {
    return id_;
  }
  [[nodiscard]] auto completed() const noexcept -> std::uint64_t {
    return completed_.load(std::memory_order_relaxed);
  }
  [[nodiscard]] auto failed() const noexcept -> std::uint64_t {
    return failed_.load(std::memory_order_relaxed);
  }
  [[nodiscard]] auto retried() const noexcept -> std::uint64_t {
    return retried_.load(std::memory_order_relaxed);
  }

private:
  [[nodiscard]] auto stopping() const noexcept -> bool;
  auto pause(std::chrono::milliseconds duration) -> void;
  auto report(const Task& task) -> void;
  auto finish_failure(Task& task, std::string error, bool retryable) -> void;
  [[nodiscard]] auto invoke(TaskHandler& handler, const Task& task,
                            const TaskContext& ctx) -> HandlerResult;

  WorkerId id_;
  PriorityTaskQueue& queue_;
  ResourceMonitor& monitor_;
  const HandlerRegistry& registry_;
  PersistenceService* persistence_;
  WorkerOptions options_;
  log::Logger& logger_;
  ReportFn on_report_;

  std::atomic<bool> stop_{false};
  const std::atomic<bool>* external_stop_{nullptr};

  std::mutex cancel_mu_;
  std::optional<CancellationSource> current_cancel_;

  std::unique_ptr<BackgroundLane> background_;

  std::atomic<std::uint64_t> completed_{0};
  std::atomic<std::uint64_t> failed_{0};
  std::atomic<std::uint64_t> retried_{0};
};

}  // namespace taskhive
