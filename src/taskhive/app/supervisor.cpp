#include "taskhive/app/supervisor.hpp"

#include "taskhive/config/config.hpp"
#include "taskhive/core/constants.hpp"

#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <numeric>
#include <string>
#include <string_view>
#include <vector>

namespace taskhive {

namespace {

constexpr auto kRecentWindow = std::chrono::hours(1);
constexpr std::string_view kSelfExe = "/proc/self/exe";

auto describe_exit(int status) -> std::string {
  if (WIFEXITED(status)) {
    return std::format("exit code {}", WEXITSTATUS(status));
  }
  if (WIFSIGNALED(status)) {
    return std::format("signal {}", WTERMSIG(status));
  }
  return "unknown status";
}

auto clean_exit(int status) -> bool {
  return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

}  // namespace

Supervisor::Supervisor(SystemConfig config, HandlerRegistry& registry,
                       log::Logger& logger)
    : Supervisor(std::move(config), registry, create_procfs_probe(), logger) {
}

Supervisor::Supervisor(SystemConfig config, HandlerRegistry& registry,
                       std::unique_ptr<ISystemProbe> probe,
                       log::Logger& logger)
    : config_(std::move(config)),
      registry_(registry),
      logger_(logger),
      mode_(config_.workers.mode),
      monitor_(
          std::make_unique<ResourceMonitor>(config_.monitor, std::move(probe))) {
}

Supervisor::~Supervisor() {
  stop();
}

auto Supervisor::init() -> Result<void> {
  if (initialized_) {
    return ok();
  }

  persistence_ = std::make_unique<PersistenceService>(
      config_.storage.db_file, config_.queue.busy_timeout_ms);
  if (auto r = persistence_->open(); !r) {
    logger_.error("Failed to open task database {}: {}",
                  config_.storage.db_file, r.error().message());
    return r;
  }

  queue_ = PriorityTaskQueue::open(config_.queue);
  if (queue_->is_degraded()) {
    logger_.warn("Task queue is running in-process only; submissions from "
                 "other processes will not be seen");
  }

  init_wall_ = Clock::now();
  initialized_ = true;
  return ok();
}

auto Supervisor::start(std::optional<int> num_workers) -> Result<void> {
  if (running()) {
    return ok();
  }
  if (auto r = init(); !r) {
    return r;
  }

  if (mode_ == WorkerMode::Process && !queue_->is_shared()) {
    logger_.warn("Queue backend '{}' is not shared between processes, "
                 "running workers as threads",
                 queue_->backend_name());
    mode_ = WorkerMode::Thread;
  }
  if (mode_ == WorkerMode::Process) {
    worker_exe_ = config_.workers.worker_executable.empty()
                      ? std::string(kSelfExe)
                      : config_.workers.worker_executable;
    if (access(worker_exe_.c_str(), X_OK) != 0) {
      logger_.error("Worker executable {} is not runnable: {}", worker_exe_,
                    std::strerror(errno));
      return fail(Error::SpawnFailed);
    }
    worker_config_yaml_ = ConfigLoader::to_string(config_);
  }

  registry_.freeze();

  if (auto r = recover_from_crash(); !r) {
    logger_.warn("Crash recovery failed: {}", r.error().message());
  }

  int count = num_workers.value_or(monitor_->recommended_worker_count());
  count = std::clamp(count, 1, std::max(1, config_.workers.max_workers));

  {
    std::lock_guard lock(tick_mu_);
    stop_loops_ = false;
  }
  started_at_ = std::chrono::steady_clock::now();
  running_.store(true, std::memory_order_release);

  for (int i = 0; i < count; ++i) {
    if (auto r = spawn_worker(); !r) {
      logger_.error("Failed to start worker: {}", r.error().message());
      if (live_worker_count() == 0) {
        stop();
        return r;
      }
      break;
    }
  }

  autoscale_thread_ = std::thread([this] { autoscale_loop(); });
  metrics_thread_ = std::thread([this] { metrics_loop(); });

  logger_.info("Supervisor started: {} {} workers, queue backend '{}'",
               live_worker_count(), worker_mode_name(mode_),
               queue_->backend_name());
  return ok();
}

auto Supervisor::stop() -> void {
  if (!running_.exchange(false)) {
    return;
  }
  logger_.info("Stopping supervisor");

  {
    std::lock_guard lock(tick_mu_);
    stop_loops_ = true;
  }
  tick_cv_.notify_all();
  if (autoscale_thread_.joinable()) {
    autoscale_thread_.join();
  }
  if (metrics_thread_.joinable()) {
    metrics_thread_.join();
  }

  {
    std::lock_guard lock(workers_mu_);
    for (auto& slot : workers_) {
      stop_worker(slot);
    }
  }

  std::vector<WorkerId> crashed;
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(config_.workers.stop_grace_ms);
  while (true) {
    auto dead = reap_workers();
    crashed.insert(crashed.end(), dead.begin(), dead.end());
    {
      std::lock_guard lock(workers_mu_);
      if (workers_.empty()) {
        break;
      }
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      break;
    }
    std::this_thread::sleep_for(timing::kReapPollInterval);
  }

  auto forced = reap_workers(true);
  crashed.insert(crashed.end(), forced.begin(), forced.end());
  for (const auto& id : crashed) {
    recover_worker_tasks(id);
  }

  logger_.info("Supervisor stopped");
}

auto Supervisor::spawn_worker() -> Result<void> {
  std::lock_guard lock(workers_mu_);
  WorkerSlot slot;
  slot.id = make_worker_id(next_worker_ordinal_++);

  auto r = mode_ == WorkerMode::Process ? spawn_process_worker(slot)
                                        : spawn_thread_worker(slot);
  if (!r) {
    return r;
  }

  logger_.info("Started worker {}{}", slot.id,
               slot.pid > 0 ? std::format(" (pid {})", slot.pid)
                            : std::string{});
  workers_.push_back(std::move(slot));
  ++spawned_workers_;
  return ok();
}

// The child execs immediately: a fork of this multithreaded process may hold
// locks owned by threads that do not exist in the copy.
auto Supervisor::spawn_process_worker(WorkerSlot& slot) -> Result<void> {
  std::vector<std::string> args{worker_exe_, "worker", "--id", slot.id.str(),
                                "--config-yaml", worker_config_yaml_};
  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (auto& a : args) {
    argv.push_back(a.data());
  }
  argv.push_back(nullptr);

  pid_t pid = fork();
  if (pid < 0) {
    logger_.error("fork failed: {}", std::strerror(errno));
    return fail(Error::SpawnFailed);
  }
  if (pid == 0) {
    execv(argv[0], argv.data());
    _exit(127);
  }
  slot.pid = pid;
  return ok();
}

auto Supervisor::spawn_thread_worker(WorkerSlot& slot) -> Result<void> {
  slot.worker = std::make_unique<Worker>(
      slot.id, *queue_, *monitor_, registry_, persistence_.get(),
      WorkerOptions::from_config(config_.workers, config_.queue), logger_);
  slot.finished = std::make_shared<std::atomic<bool>>(false);
  try {
    slot.thread = std::thread([worker = slot.worker.get(),
                               finished = slot.finished] {
      worker->run();
      finished->store(true, std::memory_order_release);
    });
  } catch (const std::system_error& e) {
    logger_.error("Failed to start worker thread: {}", e.what());
    return fail(Error::SpawnFailed);
  }
  return ok();
}

auto Supervisor::stop_worker(WorkerSlot& slot) -> void {
  if (slot.stopping) {
    return;
  }
  slot.stopping = true;
  if (slot.pid > 0) {
    if (kill(slot.pid, SIGTERM) != 0 && errno != ESRCH) {
      logger_.warn("Failed to signal worker {}: {}", slot.id,
                   std::strerror(errno));
    }
  } else if (slot.worker) {
    slot.worker->request_stop();
  }
  logger_.debug("Stopping worker {}", slot.id);
}

auto Supervisor::reap_workers(bool blocking) -> std::vector<WorkerId> {
  std::vector<WorkerId> crashed;
  std::lock_guard lock(workers_mu_);

  std::erase_if(workers_, [&](WorkerSlot& slot) {
    if (slot.pid > 0) {
      int status = 0;
      if (blocking) {
        // Grace period is over.
        kill(slot.pid, SIGKILL);
      }
      pid_t r = waitpid(slot.pid, &status, blocking ? 0 : WNOHANG);
      if (r == 0) {
        return false;
      }
      if (r < 0) {
        logger_.warn("waitpid failed for worker {}: {}", slot.id,
                     std::strerror(errno));
        crashed.push_back(slot.id);
        ++dead_workers_;
        return true;
      }
      if (!slot.stopping || !clean_exit(status)) {
        logger_.warn("Worker {} (pid {}) exited unexpectedly: {}", slot.id,
                     slot.pid, describe_exit(status));
        crashed.push_back(slot.id);
        ++dead_workers_;
      } else {
        logger_.debug("Worker {} exited", slot.id);
      }
      return true;
    }

    bool done = slot.finished && slot.finished->load(std::memory_order_acquire);
    if (!done && !blocking) {
      return false;
    }
    if (!done) {
      // Threads cannot be killed; ask the running handler to give up.
      slot.worker->request_stop();
      slot.worker->cancel_current(CancelReason::Shutdown);
    }
    if (slot.thread.joinable()) {
      slot.thread.join();
    }
    if (!slot.stopping) {
      crashed.push_back(slot.id);
      ++dead_workers_;
    }
    return true;
  });
  return crashed;
}

auto Supervisor::requeue(const Task& task) -> bool {
  return queue_->put(task);
}

auto Supervisor::recover_worker_tasks(const WorkerId& id) -> void {
  if (!initialized_) {
    return;
  }
  auto r = persistence_->locked([&](Persistence& p) {
    return Recovery(p).recover(id,
                               [this](const Task& t) { return requeue(t); });
  });
  if (!r) {
    logger_.error("Failed to recover tasks of worker {}: {}", id,
                  r.error().message());
  }
}

auto Supervisor::recover_from_crash() -> Result<RecoveryResult> {
  if (auto r = init(); !r) {
    return fail(r.error());
  }
  return persistence_->locked([&](Persistence& p) {
    return Recovery(p).recover(std::nullopt,
                               [this](const Task& t) { return requeue(t); });
  });
}

auto Supervisor::live_worker_count() const -> int {
  std::lock_guard lock(workers_mu_);
  return static_cast<int>(std::ranges::count_if(
      workers_, [](const WorkerSlot& s) { return !s.stopping; }));
}

auto Supervisor::active_workers() const -> int {
  return live_worker_count();
}

auto Supervisor::list_workers() const -> std::vector<WorkerInfo> {
  std::lock_guard lock(workers_mu_);
  std::vector<WorkerInfo> out;
  out.reserve(workers_.size());
  for (const auto& slot : workers_) {
    out.push_back(WorkerInfo{.id = slot.id,
                             .pid = slot.pid,
                             .stopping = slot.stopping});
  }
  return out;
}

auto Supervisor::rebalance_workers() -> void {
  monitor_->record_sample();

  for (const auto& id : reap_workers()) {
    recover_worker_tasks(id);
  }
  if (!running()) {
    return;
  }

  int target = std::clamp(monitor_->recommended_worker_count(), 1,
                          std::max(1, config_.workers.max_workers));
  int live = live_worker_count();

  if (live < target) {
    logger_.info("Scaling up: {} -> {} workers", live, target);
    for (int i = live; i < target; ++i) {
      if (auto r = spawn_worker(); !r) {
        logger_.error("Scale up stopped: {}", r.error().message());
        break;
      }
    }
  } else if (live > target) {
    logger_.info("Scaling down: {} -> {} workers", live, target);
    std::lock_guard lock(workers_mu_);
    int excess = live - target;
    // Most recently started first.
    for (auto it = workers_.rbegin(); it != workers_.rend() && excess > 0;
         ++it) {
      if (!it->stopping) {
        stop_worker(*it);
        --excess;
      }
    }
  }
}

auto Supervisor::wait_for_tick(std::chrono::seconds interval) -> bool {
  std::unique_lock lock(tick_mu_);
  return !tick_cv_.wait_for(lock, interval, [this] { return stop_loops_; });
}

auto Supervisor::autoscale_loop() -> void {
  auto interval = std::chrono::seconds(config_.supervisor.autoscale_interval_sec);
  while (wait_for_tick(interval)) {
    try {
      rebalance_workers();
    } catch (const std::exception& e) {
      logger_.error("Autoscale pass failed: {}", e.what());
    }
  }
}

auto Supervisor::metrics_loop() -> void {
  auto interval = std::chrono::seconds(config_.supervisor.metrics_interval_sec);
  while (wait_for_tick(interval)) {
    try {
      (void)collect_metrics_once();
    } catch (const std::exception& e) {
      logger_.error("Metrics collection failed: {}", e.what());
    }
  }
}

auto Supervisor::throughput_per_minute() -> double {
  if (!initialized_) {
    return 0.0;
  }
  auto window = std::chrono::seconds(config_.supervisor.throughput_window_sec);
  auto completed = persistence_->locked([&](Persistence& p) {
    return p.count_in_status_since(TaskStatus::Completed,
                                   Clock::now() - window);
  });
  if (!completed) {
    return 0.0;
  }
  return static_cast<double>(*completed) /
         (static_cast<double>(window.count()) / 60.0);
}

auto Supervisor::collect_metrics_once() -> MetricsSnapshot {
  auto sample = monitor_->sample();
  MetricsSnapshot m;
  m.timestamp = Clock::now();
  m.cpu_percent = sample.cpu_percent;
  m.memory_percent = sample.memory_percent;
  m.active_workers = live_worker_count();
  m.queue_size = initialized_ ? queue_->size() : 0;
  m.tasks_per_minute = throughput_per_minute();
  m.throttled = monitor_->should_throttle();

  if (initialized_) {
    persistence_->save_metrics(m);
  }
  if (m.throttled) {
    logger_.warn("Host under pressure (cpu {:.1f}%, memory {:.1f}%): workers "
                 "throttled, {} tasks waiting",
                 m.cpu_percent, m.memory_percent, m.queue_size);
  } else {
    logger_.debug("Metrics: cpu {:.1f}%, memory {:.1f}%, {} workers, {} "
                  "queued, {:.2f} tasks/min",
                  m.cpu_percent, m.memory_percent, m.active_workers,
                  m.queue_size, m.tasks_per_minute);
  }
  return m;
}

auto Supervisor::submit_task(std::string name, std::string function,
                             nlohmann::json args, nlohmann::json kwargs,
                             Priority priority, SubmitOptions options)
    -> std::optional<TaskId> {
  if (auto r = init(); !r) {
    return std::nullopt;
  }
  if (name.empty() || function.empty() || options.max_retries < 0 ||
      options.timeout.count() <= 0 || !args.is_array() ||
      !kwargs.is_object()) {
    logger_.warn("Rejecting task '{}' ({}): invalid arguments", name,
                 function);
    return std::nullopt;
  }

  Task task;
  task.id = generate_task_id();
  task.name = std::move(name);
  task.function = std::move(function);
  task.args = std::move(args);
  task.kwargs = std::move(kwargs);
  task.priority = priority;
  task.max_retries = options.max_retries;
  task.timeout = options.timeout;
  task.created_at = Clock::now();
  task.status = TaskStatus::Queued;

  persistence_->save_task(task);
  if (!queue_->put(task)) {
    persistence_->update_status(task.id, TaskStatus::Failed, "enqueue failed");
    return std::nullopt;
  }
  total_queued_.fetch_add(1, std::memory_order_relaxed);

  logger_.info("Submitted task {} '{}' ({}, {})", task.id, task.name,
               task.function, priority_name(task.priority));
  return task.id;
}

auto Supervisor::get_task_status(const TaskId& id)
    -> std::optional<TaskRecord> {
  if (auto r = init(); !r) {
    return std::nullopt;
  }
  auto rec = persistence_->locked([&](Persistence& p) { return p.get_task(id); });
  if (!rec) {
    if (rec.error() != Error::NotFound) {
      logger_.warn("Status lookup for {} failed: {}", id,
                   rec.error().message());
    }
    return std::nullopt;
  }
  return std::move(*rec);
}

auto Supervisor::get_task_result(const TaskId& id)
    -> std::optional<nlohmann::json> {
  if (auto r = init(); !r) {
    return std::nullopt;
  }
  if (auto cached = queue_->get_result(id)) {
    return cached;
  }
  auto rec = get_task_status(id);
  if (!rec || rec->status != TaskStatus::Completed || rec->result.is_null()) {
    return std::nullopt;
  }
  return std::move(rec->result);
}

auto Supervisor::cancel_task(const TaskId& id) -> bool {
  if (auto r = init(); !r) {
    return false;
  }
  if (!queue_->cancel(id)) {
    logger_.info("Task {} is not queued, cannot cancel", id);
    return false;
  }
  persistence_->update_status(id, TaskStatus::Cancelled);
  logger_.info("Cancelled task {}", id);
  return true;
}

auto Supervisor::get_dashboard_stats() -> DashboardStats {
  DashboardStats s;
  auto sample = monitor_->sample();
  constexpr double kGiB = 1024.0 * 1024.0 * 1024.0;

  if (running()) {
    s.system.uptime_minutes =
        std::chrono::duration<double, std::ratio<60>>(
            std::chrono::steady_clock::now() - started_at_)
            .count();
  }
  s.system.cpu_percent = sample.cpu_percent;
  s.system.memory_percent = sample.memory_percent;
  s.system.memory_available_gb =
      static_cast<double>(sample.memory_available_bytes) / kGiB;
  s.system.load_average = sample.load_avg;
  s.system.disk_free_gb = static_cast<double>(sample.disk_free_bytes) / kGiB;

  // A supervisor that never started reports everything in the database.
  bool started = false;
  {
    std::lock_guard lock(workers_mu_);
    s.workers.active = static_cast<int>(std::ranges::count_if(
        workers_, [](const WorkerSlot& w) { return !w.stopping; }));
    s.workers.dead = dead_workers_;
    s.workers.total = spawned_workers_;
    started = spawned_workers_ > 0;
  }
  s.worker_mode = mode_;

  s.performance.is_throttling = monitor_->should_throttle();
  s.performance.recommended_workers = monitor_->recommended_worker_count();

  if (!initialized_) {
    return s;
  }

  s.queue_backend = std::string(queue_->backend_name());
  s.queue_degraded = queue_->is_degraded();
  s.tasks.queue_size = queue_->size();
  s.tasks.tasks_per_minute = throughput_per_minute();

  auto since = started ? init_wall_ : TimePoint{};
  auto recent_since = Clock::now() - kRecentWindow;

  persistence_->locked([&](Persistence& p) {
    if (auto c = p.count_in_status_since(TaskStatus::Completed, since)) {
      s.tasks.total_completed = *c;
    }
    if (auto f = p.count_in_status_since(TaskStatus::Failed, since)) {
      s.tasks.total_failed = *f;
    }
    if (auto avg = p.avg_execution_time(recent_since)) {
      s.tasks.avg_execution_time = *avg;
    }
    if (auto recent = p.counts_by_status(recent_since)) {
      s.tasks.recent_by_status = std::move(*recent);
    }
    if (!started) {
      if (auto all = p.counts_by_status(TimePoint{})) {
        s.tasks.total_queued = std::accumulate(
            all->begin(), all->end(), std::int64_t{0},
            [](std::int64_t acc, const auto& kv) { return acc + kv.second; });
      }
    }
  });
  if (started) {
    s.tasks.total_queued = total_queued_.load(std::memory_order_relaxed);
  }

  s.performance.success_rate =
      100.0 * static_cast<double>(s.tasks.total_completed) /
      static_cast<double>(std::max<std::int64_t>(s.tasks.total_queued, 1));
  return s;
}

auto Supervisor::wait_until_idle(std::chrono::milliseconds timeout) -> bool {
  if (!initialized_) {
    return true;
  }
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    if (queue_->size() == 0) {
      auto counts = persistence_->locked(
          [&](Persistence& p) { return p.counts_by_status(init_wall_); });
      if (counts) {
        std::int64_t in_flight = 0;
        for (auto status : {TaskStatus::Pending, TaskStatus::Queued,
                            TaskStatus::Running, TaskStatus::Retry}) {
          if (auto it = counts->find(status); it != counts->end()) {
            in_flight += it->second;
          }
        }
        if (in_flight == 0) {
          return true;
        }
      }
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(timing::kShutdownPollInterval);
  }
}

}  // namespace taskhive
