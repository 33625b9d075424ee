#include "taskhive/worker/worker.hpp"

#include "taskhive/app/services/persistence_service.hpp"
#include "taskhive/queue/priority_queue.hpp"

#include "test_utils.hpp"

#include <sys/resource.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

using namespace taskhive;
using namespace std::chrono_literals;

class WorkerTest : public ::testing::Test {
protected:
  void SetUp() override {
    host_ = std::make_shared<test::FakeHost>();
    monitor_ = test::make_fake_monitor(host_);
    queue_ = std::make_unique<PriorityTaskQueue>(create_memory_queue_backend());

    options_.poll_timeout = 50ms;
    options_.throttle_sleep = 10ms;
    options_.idle_pause = 10ms;
    options_.retry_backoff = 0s;
    options_.result_ttl = 60s;
    options_.renice_background = false;

    ASSERT_TRUE(registry_
                    .add("echo",
                         [](const TaskContext&, const nlohmann::json& args,
                            const nlohmann::json&) -> HandlerResult {
                           return nlohmann::json{{"echo", args}};
                         })
                    .has_value());
    ASSERT_TRUE(registry_
                    .add("flaky",
                         [this](const TaskContext&, const nlohmann::json&,
                                const nlohmann::json&) -> HandlerResult {
                           flaky_calls_.fetch_add(1);
                           return handler_error("upstream unavailable");
                         })
                    .has_value());
    ASSERT_TRUE(registry_
                    .add("fatal",
                         [](const TaskContext&, const nlohmann::json&,
                            const nlohmann::json&) -> HandlerResult {
                           return handler_error("bad input", false);
                         })
                    .has_value());
    ASSERT_TRUE(registry_
                    .add("throws",
                         [](const TaskContext&, const nlohmann::json&,
                            const nlohmann::json&) -> HandlerResult {
                           throw std::runtime_error("boom");
                         })
                    .has_value());
  }

  auto make_worker(PersistenceService* persistence = nullptr)
      -> std::unique_ptr<Worker> {
    auto w = std::make_unique<Worker>(test::worker_id("worker-test"), *queue_,
                                      *monitor_, registry_, persistence,
                                      options_);
    w->set_on_report([this](const Task& t) {
      std::lock_guard lock(reports_mu_);
      reports_.push_back(t.status);
    });
    return w;
  }

  auto reported() -> std::vector<TaskStatus> {
    std::lock_guard lock(reports_mu_);
    return reports_;
  }

  std::shared_ptr<test::FakeHost> host_;
  std::unique_ptr<ResourceMonitor> monitor_;
  std::unique_ptr<PriorityTaskQueue> queue_;
  HandlerRegistry registry_;
  WorkerOptions options_;
  std::atomic<int> flaky_calls_{0};

  std::mutex reports_mu_;
  std::vector<TaskStatus> reports_;
};

TEST_F(WorkerTest, Execute_Success_CompletesAndCachesResult) {
  auto worker = make_worker();
  auto task = test::make_task("echo", "echo");
  task.args = nlohmann::json::array({1, 2});

  worker->execute(task);

  EXPECT_EQ(task.status, TaskStatus::Completed);
  EXPECT_EQ(task.worker_id, worker->id());
  EXPECT_TRUE(task.error.empty());
  EXPECT_GE(task.execution_time, 0.0);
  EXPECT_EQ(task.result["echo"], task.args);
  EXPECT_EQ(worker->completed(), 1u);

  auto cached = queue_->get_result(task.id);
  ASSERT_TRUE(cached.has_value());
  EXPECT_EQ(*cached, task.result);

  EXPECT_EQ(reported(),
            (std::vector{TaskStatus::Running, TaskStatus::Completed}));
}

TEST_F(WorkerTest, Execute_UnknownFunction_FailsWithoutRetry) {
  auto worker = make_worker();
  auto task = test::make_task("mystery", "does_not_exist");

  worker->execute(task);

  EXPECT_EQ(task.status, TaskStatus::Failed);
  EXPECT_NE(task.error.find("does_not_exist"), std::string::npos);
  EXPECT_EQ(task.retry_count, 0);
  EXPECT_EQ(queue_->size(), 0);
  EXPECT_EQ(worker->failed(), 1u);
}

TEST_F(WorkerTest, FailingTask_RetriesUpToMaxThenFails) {
  auto worker = make_worker();
  auto task = test::make_task("flaky", "flaky", Priority::Low);
  task.max_retries = 2;
  ASSERT_TRUE(queue_->put(task));

  int executed = 0;
  while (worker->run_once() == WorkerStep::Executed) {
    ++executed;
  }

  EXPECT_EQ(executed, 3);
  EXPECT_EQ(flaky_calls_.load(), 3);
  EXPECT_EQ(worker->retried(), 2u);
  EXPECT_EQ(worker->failed(), 1u);
  EXPECT_EQ(queue_->size(), 0);
  EXPECT_EQ(reported().back(), TaskStatus::Failed);
}

TEST_F(WorkerTest, FailingTask_FinalStateCarriesRetryCount) {
  auto worker = make_worker();
  auto task = test::make_task("flaky", "flaky");
  task.max_retries = 1;

  worker->execute(task);
  EXPECT_EQ(task.status, TaskStatus::Retry);
  EXPECT_EQ(task.retry_count, 1);
  EXPECT_EQ(task.error, "upstream unavailable");

  auto requeued = queue_->get(100ms);
  ASSERT_TRUE(requeued.has_value());
  EXPECT_EQ(requeued->retry_count, 1);

  worker->execute(*requeued);
  EXPECT_EQ(requeued->status, TaskStatus::Failed);
  EXPECT_EQ(requeued->retry_count, 1);
}

TEST_F(WorkerTest, Retry_IsDelayedByBackoff) {
  options_.retry_backoff = 30s;
  auto worker = make_worker();
  auto task = test::make_task("flaky", "flaky");

  auto before = Clock::now();
  worker->execute(task);

  ASSERT_TRUE(task.scheduled_time.has_value());
  EXPECT_GE(*task.scheduled_time, before + 29s);
  EXPECT_EQ(queue_->size(), 1);
  EXPECT_FALSE(queue_->get(50ms).has_value());
}

TEST_F(WorkerTest, NonRetryableError_FailsImmediately) {
  auto worker = make_worker();
  auto task = test::make_task("fatal", "fatal");
  task.max_retries = 5;

  worker->execute(task);

  EXPECT_EQ(task.status, TaskStatus::Failed);
  EXPECT_EQ(task.retry_count, 0);
  EXPECT_EQ(task.error, "bad input");
  EXPECT_EQ(queue_->size(), 0);
}

TEST_F(WorkerTest, ThrowingHandler_IsIsolated) {
  auto worker = make_worker();
  auto bad = test::make_task("throws", "throws");
  bad.max_retries = 0;
  auto good = test::make_task("echo", "echo");

  worker->execute(bad);
  worker->execute(good);

  EXPECT_EQ(bad.status, TaskStatus::Failed);
  EXPECT_NE(bad.error.find("boom"), std::string::npos);
  EXPECT_EQ(good.status, TaskStatus::Completed);
}

TEST_F(WorkerTest, ResultAfterDeadline_CountsAsTimeout) {
  ASSERT_TRUE(registry_
                  .add("slow",
                       [](const TaskContext&, const nlohmann::json&,
                          const nlohmann::json&) -> HandlerResult {
                         std::this_thread::sleep_for(20ms);
                         return nlohmann::json{{"late", true}};
                       })
                  .has_value());
  auto worker = make_worker();
  auto task = test::make_task("slow", "slow");
  task.timeout = 0s;
  task.max_retries = 0;

  worker->execute(task);

  EXPECT_EQ(task.status, TaskStatus::Failed);
  EXPECT_NE(task.error.find("timeout"), std::string::npos);
  EXPECT_FALSE(queue_->get_result(task.id).has_value());
}

TEST_F(WorkerTest, CancelCurrent_SignalsRunningHandler) {
  std::atomic<bool> started{false};
  ASSERT_TRUE(registry_
                  .add("wait_for_cancel",
                       [&started](const TaskContext& ctx, const nlohmann::json&,
                                  const nlohmann::json&) -> HandlerResult {
                         started = true;
                         while (!ctx.should_stop()) {
                           std::this_thread::sleep_for(5ms);
                         }
                         if (ctx.cancelled()) {
                           return handler_error(
                               std::string(
                                   cancel_reason_name(ctx.cancel_reason())),
                               false);
                         }
                         return nlohmann::json{};
                       })
                  .has_value());
  auto worker = make_worker();
  auto task = test::make_task("cancel me", "wait_for_cancel");

  std::thread runner([&] { worker->execute(task); });
  ASSERT_TRUE(test::wait_until([&] { return started.load(); }, 2s));
  worker->cancel_current(CancelReason::Shutdown);
  runner.join();

  EXPECT_EQ(task.status, TaskStatus::Failed);
  EXPECT_EQ(task.error, "worker shutdown");
}

TEST_F(WorkerTest, RunOnce_EmptyQueue_IsIdle) {
  auto worker = make_worker();

  EXPECT_EQ(worker->run_once(), WorkerStep::Idle);
}

TEST_F(WorkerTest, RunOnce_HostUnderPressure_LeavesQueueAlone) {
  host_->cpu_percent = 99.0;
  auto worker = make_worker();
  ASSERT_TRUE(queue_->put(test::make_task("echo", "echo")));

  EXPECT_EQ(worker->run_once(), WorkerStep::Throttled);
  EXPECT_EQ(queue_->size(), 1);

  host_->cpu_percent = 10.0;
  EXPECT_EQ(worker->run_once(), WorkerStep::Executed);
  EXPECT_EQ(queue_->size(), 0);
}

TEST_F(WorkerTest, Run_DrainsQueueUntilStopped) {
  auto worker = make_worker();
  for (int i = 0; i < 5; ++i) {
    ASSERT_TRUE(queue_->put(test::make_task("echo", "echo")));
  }

  std::thread runner([&] { worker->run(); });
  EXPECT_TRUE(test::wait_until([&] { return worker->completed() == 5; }, 5s));
  worker->request_stop();
  runner.join();

  EXPECT_EQ(queue_->size(), 0);
}

TEST_F(WorkerTest, Run_StopsOnExternalFlag) {
  auto worker = make_worker();
  std::atomic<bool> stop{false};

  std::thread runner([&] { worker->run(&stop); });
  test::sleep_ms(50ms);
  stop = true;
  runner.join();

  EXPECT_EQ(worker->completed(), 0u);
}

TEST_F(WorkerTest, Execute_PersistsEachTransition) {
  test::TempDir dir;
  ASSERT_TRUE(dir.valid());
  PersistenceService persistence(dir.file("tasks.db"));
  ASSERT_TRUE(persistence.open().has_value());
  auto worker = make_worker(&persistence);
  auto task = test::make_task("echo", "echo", Priority::High);

  worker->execute(task);

  auto record =
      persistence.locked([&](Persistence& p) { return p.get_task(task.id); });
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->status, TaskStatus::Completed);
  EXPECT_EQ(record->worker_id, worker->id());
  EXPECT_EQ(record->priority, Priority::High);
  EXPECT_TRUE(record->completed_at.has_value());
  EXPECT_EQ(record->result, task.result);
}

TEST_F(WorkerTest, Run_ThrottledWhileHostBusy_ResumesWhenLoadDrops) {
  host_->cpu_percent = 99.0;
  auto worker = make_worker();
  ASSERT_TRUE(queue_->put(test::make_task("echo", "echo")));

  std::thread runner([&] { worker->run(); });
  test::sleep_ms(300ms);
  EXPECT_EQ(worker->completed(), 0u);
  EXPECT_EQ(queue_->size(), 1);

  host_->cpu_percent = 10.0;
  EXPECT_TRUE(test::wait_until([&] { return worker->completed() == 1; }, 5s));
  worker->request_stop();
  runner.join();

  EXPECT_EQ(queue_->size(), 0);
}

TEST_F(WorkerTest, Retry_IsPersistedBeforeRequeue) {
  auto worker = make_worker();
  std::vector<std::int64_t> queued_at_report;
  worker->set_on_report([&](const Task& t) {
    if (t.status == TaskStatus::Retry) {
      queued_at_report.push_back(queue_->size());
    }
  });
  auto task = test::make_task("flaky", "flaky");
  task.max_retries = 1;

  worker->execute(task);

  ASSERT_EQ(queued_at_report.size(), 1u);
  EXPECT_EQ(queued_at_report[0], 0);
  EXPECT_EQ(queue_->size(), 1);
}

TEST_F(WorkerTest, BackgroundTasks_NeverLowerTheWorkerThreadPriority) {
  struct Observation {
    Priority priority;
    int nice;
    pid_t tid;
  };
  std::mutex mu;
  std::vector<Observation> seen;
  ASSERT_TRUE(registry_
                  .add("observe_nice",
                       [&](const TaskContext&, const nlohmann::json& args,
                           const nlohmann::json&) -> HandlerResult {
                         auto tid = gettid();
                         int nice = getpriority(PRIO_PROCESS,
                                                static_cast<id_t>(tid));
                         std::lock_guard lock(mu);
                         seen.push_back({static_cast<Priority>(
                                             args.at(0).get<int>()),
                                         nice, tid});
                         return nlohmann::json::object();
                       })
                  .has_value());
  options_.renice_background = true;
  auto worker = make_worker();
  const auto worker_tid = gettid();
  const int base = getpriority(PRIO_PROCESS, static_cast<id_t>(worker_tid));

  for (auto priority : {Priority::Low, Priority::Critical, Priority::Batch,
                        Priority::Critical, Priority::Low}) {
    auto task = test::make_task("observe", "observe_nice", priority);
    task.args = nlohmann::json::array({static_cast<int>(priority)});
    worker->execute(task);
    ASSERT_EQ(task.status, TaskStatus::Completed);
  }

  ASSERT_EQ(seen.size(), 5u);
  for (const auto& o : seen) {
    if (is_background(o.priority)) {
      EXPECT_NE(o.tid, worker_tid);
      EXPECT_EQ(o.nice, std::min(base + 10, 19));
    } else {
      EXPECT_EQ(o.tid, worker_tid);
      EXPECT_EQ(o.nice, base);
    }
  }
  EXPECT_EQ(getpriority(PRIO_PROCESS, static_cast<id_t>(worker_tid)), base);
}
