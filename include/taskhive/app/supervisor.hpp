#pragma once

#include "taskhive/app/dashboard.hpp"
#include "taskhive/app/services/persistence_service.hpp"
#include "taskhive/config/system_config.hpp"
#include "taskhive/core/error.hpp"
#include "taskhive/monitor/resource_monitor.hpp"
#include "taskhive/queue/priority_queue.hpp"
#include "taskhive/storage/recovery.hpp"
#include "taskhive/task/handler.hpp"
#include "taskhive/util/log.hpp"
#include "taskhive/worker/worker.hpp"

#include <nlohmann/json.hpp>

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace taskhive {

struct SubmitOptions {
  int max_retries{3};
  std::chrono::seconds timeout{300};
};

struct WorkerInfo {
  WorkerId id;
  // -1 for thread workers.
  pid_t pid{-1};
  bool stopping{false};
};

// Owns the queue, persistence and monitor, runs the worker pool and the
// autoscale and metrics loops. Process workers are separate executions of
// `workers.worker_executable worker`, which bring their own handlers; thread
// workers share `registry`. The public API reports failure through
// optional/bool and does not throw.
class Supervisor {
public:
  Supervisor(SystemConfig config, HandlerRegistry& registry,
             log::Logger& logger = log::logger());
  // `probe` feeds the autoscale and throttle decisions of this process.
  Supervisor(SystemConfig config, HandlerRegistry& registry,
             std::unique_ptr<ISystemProbe> probe,
             log::Logger& logger = log::logger());
  ~Supervisor();

  Supervisor(const Supervisor&) = delete;
  Supervisor& operator=(const Supervisor&) = delete;

  // Opens persistence and the queue. Called by start() if needed.
  [[nodiscard]] auto init() -> Result<void>;
  [[nodiscard]] auto start(std::optional<int> num_workers = std::nullopt)
      -> Result<void>;
  auto stop() -> void;

  [[nodiscard]] auto submit_task(
      std::string name, std::string function,
      nlohmann::json args = nlohmann::json::array(),
      nlohmann::json kwargs = nlohmann::json::object(),
      Priority priority = Priority::Medium, SubmitOptions options = {})
      -> std::optional<TaskId>;

  [[nodiscard]] auto get_task_status(const TaskId& id)
      -> std::optional<TaskRecord>;
  [[nodiscard]] auto get_task_result(const TaskId& id)
      -> std::optional<nlohmann::json>;
  [[nodiscard]] auto cancel_task(const TaskId& id) -> bool;
  [[nodiscard]] auto get_dashboard_stats() -> DashboardStats;

  // Requeues or fails every task left RUNNING by a previous run.
  [[nodiscard]] auto recover_from_crash() -> Result<RecoveryResult>;

  // One autoscale pass: record a sample, reap dead workers and recover their
  // tasks, then converge the pool on the recommended size.
  auto rebalance_workers() -> void;
  auto collect_metrics_once() -> MetricsSnapshot;

  // True once nothing is queued, waiting for retry, or running.
  [[nodiscard]] auto wait_until_idle(std::chrono::milliseconds timeout)
      -> bool;

  [[nodiscard]] auto active_workers() const -> int;
  // In start order, including workers asked to stop but not yet reaped.
  [[nodiscard]] auto list_workers() const -> std::vector<WorkerInfo>;
  [[nodiscard]] auto worker_mode() const noexcept -> WorkerMode {
    return mode_;
  }
  // False for the in-process queue, configured or fallen back to.
  [[nodiscard]] auto queue_shared() const noexcept -> bool {
    return queue_ && queue_->is_shared();
  }
  [[nodiscard]] auto running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto config() const noexcept -> const SystemConfig& {
    return config_;
  }

private:
  struct WorkerSlot {
    WorkerId id;
    pid_t pid{-1};
    std::unique_ptr<Worker> worker;
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> finished;
    bool stopping{false};
  };

  [[nodiscard]] auto spawn_worker() -> Result<void>;
  [[nodiscard]] auto spawn_process_worker(WorkerSlot& slot) -> Result<void>;
  [[nodiscard]] auto spawn_thread_worker(WorkerSlot& slot) -> Result<void>;

  auto stop_worker(WorkerSlot& slot) -> void;
  // Removes exited workers. Returns the ids of workers that exited without
  // being asked to.
  auto reap_workers(bool blocking = false) -> std::vector<WorkerId>;
  auto recover_worker_tasks(const WorkerId& id) -> void;
  auto requeue(const Task& task) -> bool;

  auto autoscale_loop() -> void;
  auto metrics_loop() -> void;
  // Sleeps up to `interval`; false when stop was requested.
  [[nodiscard]] auto wait_for_tick(std::chrono::seconds interval) -> bool;

  [[nodiscard]] auto throughput_per_minute() -> double;
  [[nodiscard]] auto live_worker_count() const -> int;

  SystemConfig config_;
  HandlerRegistry& registry_;
  log::Logger& logger_;
  WorkerMode mode_;

  std::unique_ptr<PersistenceService> persistence_;
  std::unique_ptr<PriorityTaskQueue> queue_;
  std::unique_ptr<ResourceMonitor> monitor_;
  bool initialized_{false};

  std::string worker_exe_;
  std::string worker_config_yaml_;

  std::atomic<bool> running_{false};
  std::chrono::steady_clock::time_point started_at_{};
  TimePoint init_wall_{};

  mutable std::mutex workers_mu_;
  std::vector<WorkerSlot> workers_;
  std::uint64_t next_worker_ordinal_{1};
  int dead_workers_{0};
  int spawned_workers_{0};

  std::atomic<std::int64_t> total_queued_{0};

  std::mutex tick_mu_;
  std::condition_variable tick_cv_;
  bool stop_loops_{false};
  std::thread autoscale_thread_;
  std::thread metrics_thread_;
};

}  // namespace taskhive
