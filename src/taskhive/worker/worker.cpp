#include "taskhive/worker/worker.hpp"

#include "taskhive/app/services/persistence_service.hpp"
#include "taskhive/core/constants.hpp"
#include "taskhive/monitor/resource_monitor.hpp"
#include "taskhive/queue/priority_queue.hpp"

#include <sys/resource.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <exception>
#include <format>
#include <thread>

namespace taskhive {

namespace {

auto elapsed_seconds(std::chrono::steady_clock::time_point start) -> double {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                       start)
      .count();
}

}  // namespace

// Single helper thread for background-priority handlers. On Linux the nice
// value is per thread; this one raises its own by kBackgroundNice at start
// and never lowers it again.
class BackgroundLane {
public:
  using Job = std::function<HandlerResult()>;

  explicit BackgroundLane(log::Logger& logger) : logger_(logger) {
    thread_ = std::thread([this] { loop(); });
  }

  ~BackgroundLane() {
    {
      std::lock_guard lock(mu_);
      stop_ = true;
    }
    cv_.notify_all();
    thread_.join();
  }

  BackgroundLane(const BackgroundLane&) = delete;
  BackgroundLane& operator=(const BackgroundLane&) = delete;

  // Blocks until `job` has run on the lane thread.
  auto run(Job job) -> HandlerResult {
    std::unique_lock lock(mu_);
    job_ = std::move(job);
    result_.reset();
    cv_.notify_all();
    cv_.wait(lock, [this] { return result_.has_value(); });
    auto r = std::move(*result_);
    result_.reset();
    return r;
  }

private:
  auto renice() -> void {
    auto tid = static_cast<id_t>(gettid());
    errno = 0;
    int base = getpriority(PRIO_PROCESS, tid);
    if (base == -1 && errno != 0) {
      logger_.warn("getpriority failed: {}", std::strerror(errno));
      return;
    }
    if (setpriority(PRIO_PROCESS, tid, base + limits::kBackgroundNice) != 0) {
      logger_.warn("Background tasks keep nice {}: {}", base,
                   std::strerror(errno));
    }
  }

  auto loop() -> void {
    renice();
    std::unique_lock lock(mu_);
    while (true) {
      cv_.wait(lock, [this] { return stop_ || job_ != nullptr; });
      if (stop_) {
        return;
      }
      auto job = std::move(job_);
      job_ = nullptr;
      lock.unlock();
      HandlerResult r;
      try {
        r = job();
      } catch (const std::exception& e) {
        r = handler_error(std::format("handler threw: {}", e.what()));
      }
      lock.lock();
      result_ = std::move(r);
      cv_.notify_all();
    }
  }

  log::Logger& logger_;
  std::mutex mu_;
  std::condition_variable cv_;
  Job job_;
  std::optional<HandlerResult> result_;
  bool stop_{false};
  std::thread thread_;
};

auto WorkerOptions::from_config(const WorkersConfig& workers,
                                const QueueConfig& queue) -> WorkerOptions {
  WorkerOptions o;
  o.poll_timeout = std::chrono::milliseconds(workers.poll_timeout_ms);
  o.throttle_sleep = std::chrono::milliseconds(workers.throttle_sleep_ms);
  o.idle_pause = std::chrono::milliseconds(workers.idle_pause_ms);
  o.retry_backoff = std::chrono::seconds(workers.retry_backoff_sec);
  o.result_ttl = std::chrono::seconds(queue.result_ttl_sec);
  o.renice_background = workers.renice_background;
  return o;
}

Worker::Worker(WorkerId id, PriorityTaskQueue& queue, ResourceMonitor& monitor,
               const HandlerRegistry& registry,
               PersistenceService* persistence, WorkerOptions options,
               log::Logger& logger)
    : id_(std::move(id)),
      queue_(queue),
      monitor_(monitor),
      registry_(registry),
      persistence_(persistence),
      options_(options),
      logger_(logger) {
}

Worker::~Worker() = default;

auto Worker::stopping() const noexcept -> bool {
  return stop_.load(std::memory_order_acquire) ||
         (external_stop_ && external_stop_->load(std::memory_order_acquire));
}

auto Worker::request_stop() noexcept -> void {
  stop_.store(true, std::memory_order_release);
}

auto Worker::cancel_current(CancelReason reason) -> void {
  std::lock_guard lock(cancel_mu_);
  if (current_cancel_ && current_cancel_->cancel(reason)) {
    logger_.debug("Worker {} cancelled its running task: {}", id_,
                  cancel_reason_name(reason));
  }
}

auto Worker::pause(std::chrono::milliseconds duration) -> void {
  auto deadline = std::chrono::steady_clock::now() + duration;
  while (!stopping()) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return;
    }
    std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
        timing::kShutdownPollInterval, deadline - now));
  }
}

auto Worker::run(const std::atomic<bool>* external_stop) -> void {
  external_stop_ = external_stop;
  logger_.info("Worker {} started", id_);

  while (!stopping()) {
    try {
      (void)run_once();
    } catch (const std::exception& e) {
      logger_.error("Worker {} loop error: {}", id_, e.what());
      pause(options_.idle_pause);
    }
  }

  logger_.info("Worker {} stopped (completed={}, failed={}, retried={})", id_,
               completed(), failed(), retried());
}

auto Worker::run_once() -> WorkerStep {
  if (monitor_.should_throttle()) {
    logger_.debug("Worker {} throttled by host load", id_);
    pause(options_.throttle_sleep);
    return WorkerStep::Throttled;
  }

  auto task = queue_.get(options_.poll_timeout);
  if (!task) {
    return WorkerStep::Idle;
  }
  execute(*task);
  return WorkerStep::Executed;
}

auto Worker::report(const Task& task) -> void {
  if (persistence_) {
    persistence_->save_task(task);
  }
  if (on_report_) {
    on_report_(task);
  }
}

auto Worker::execute(Task& task) -> void {
  task.status = TaskStatus::Running;
  task.worker_id = id_;
  task.error.clear();
  task.result = nullptr;
  report(task);

  auto handler = registry_.find(task.function);
  if (!handler) {
    task.status = TaskStatus::Failed;
    task.error = std::format("unknown task function '{}'", task.function);
    logger_.error("Task {} failed: {}", task.id, task.error);
    failed_.fetch_add(1, std::memory_order_relaxed);
    report(task);
    return;
  }

  CancellationToken token;
  {
    std::lock_guard lock(cancel_mu_);
    current_cancel_.emplace();
    token = current_cancel_->token();
  }

  logger_.info("Worker {} executing {} ({}, attempt {})", id_, task.id,
               task.function, task.retry_count + 1);

  auto start = std::chrono::steady_clock::now();
  TaskContext ctx{task.id, id_, start + task.timeout, token};
  auto result = invoke(**handler, task, ctx);
  task.execution_time = elapsed_seconds(start);

  {
    std::lock_guard lock(cancel_mu_);
    current_cancel_.reset();
  }

  if (result && task.execution_time > static_cast<double>(task.timeout.count())) {
    result = handler_error(std::format("exceeded timeout of {}s ({:.2f}s)",
                                       task.timeout.count(),
                                       task.execution_time));
  }

  if (!result) {
    finish_failure(task, std::move(result.error().message),
                   result.error().retryable);
    return;
  }

  task.status = TaskStatus::Completed;
  task.result = std::move(*result);
  task.scheduled_time.reset();
  (void)queue_.set_result(task.id, task.result, options_.result_ttl);
  completed_.fetch_add(1, std::memory_order_relaxed);
  logger_.info("Task {} completed in {:.3f}s", task.id, task.execution_time);
  report(task);
}

auto Worker::invoke(TaskHandler& handler, const Task& task,
                    const TaskContext& ctx) -> HandlerResult {
  auto call = [&]() -> HandlerResult {
    try {
      return handler.execute(ctx, task.args, task.kwargs);
    } catch (const std::exception& e) {
      return handler_error(std::format("handler threw: {}", e.what()));
    } catch (...) {
      return handler_error("handler threw a non-standard exception");
    }
  };

  if (!options_.renice_background || !is_background(task.priority)) {
    return call();
  }
  if (!background_) {
    background_ = std::make_unique<BackgroundLane>(logger_);
  }
  return background_->run(call);
}

auto Worker::finish_failure(Task& task, std::string error, bool retryable)
    -> void {
  task.error = std::move(error);

  if (retryable && task.retry_count < task.max_retries) {
    ++task.retry_count;
    task.status = TaskStatus::Retry;
    task.scheduled_time =
        Clock::now() + options_.retry_backoff * task.retry_count;
    // Persisted before the put: once queued, another worker may pick the
    // task up and record RUNNING, which this write must not overwrite.
    report(task);
    if (queue_.put(task)) {
      retried_.fetch_add(1, std::memory_order_relaxed);
      logger_.warn("Task {} failed ({}), retry {}/{} in {}s", task.id,
                   task.error, task.retry_count, task.max_retries,
                   (options_.retry_backoff * task.retry_count).count());
      return;
    }
    task.error += "; requeue failed";
  }

  task.status = TaskStatus::Failed;
  failed_.fetch_add(1, std::memory_order_relaxed);
  logger_.error("Task {} failed permanently after {} retries: {}", task.id,
                task.retry_count, task.error);
  report(task);
}

}  // namespace taskhive
