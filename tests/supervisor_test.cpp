#include "taskhive/app/supervisor.hpp"
#include "taskhive/handlers/demo_handlers.hpp"
#include "taskhive/storage/persistence.hpp"

#include "test_utils.hpp"

#include <signal.h>

#include <algorithm>
#include <atomic>
#include <format>
#include <fstream>
#include <iterator>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

using namespace taskhive;
using namespace std::chrono_literals;

class SupervisorTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(dir_.valid());
    config_.storage.db_file = dir_.file("tasks.db");
    config_.queue.backend = QueueBackendKind::Sqlite;
    config_.queue.path = dir_.file("queue.db");
    config_.queue.result_ttl_sec = 60;
    // Never throttle on a busy CI host.
    config_.monitor.cpu_throttle_percent = 101.0;
    config_.monitor.memory_throttle_percent = 101.0;
    config_.monitor.cpu_scale_down_percent = 101.0;
    config_.monitor.memory_scale_down_percent = 101.0;
    config_.workers.mode = WorkerMode::Thread;
    config_.workers.max_workers = 4;
    config_.workers.poll_timeout_ms = 50;
    config_.workers.idle_pause_ms = 10;
    config_.workers.throttle_sleep_ms = 10;
    config_.workers.retry_backoff_sec = 0;
    config_.workers.stop_grace_ms = 2000;
    config_.workers.renice_background = false;
    config_.workers.worker_executable = TASKHIVE_WORKER_EXE;
    config_.supervisor.autoscale_interval_sec = 3600;
    config_.supervisor.metrics_interval_sec = 3600;

    ASSERT_TRUE(register_demo_handlers(registry_, config_.monitor).has_value());
  }

  auto make_supervisor() -> std::unique_ptr<Supervisor> {
    return std::make_unique<Supervisor>(config_, registry_);
  }

  // Autoscaling reads this host instead of /proc.
  auto make_supervisor(std::shared_ptr<test::FakeHost> host)
      -> std::unique_ptr<Supervisor> {
    config_.monitor.sample_interval_ms = 0;
    return std::make_unique<Supervisor>(
        config_, registry_, std::make_unique<test::FakeProbe>(std::move(host)));
  }

  static auto live_ids(const Supervisor& sup) -> std::vector<std::string> {
    std::vector<std::string> ids;
    for (const auto& w : sup.list_workers()) {
      if (!w.stopping) {
        ids.push_back(w.id.str());
      }
    }
    return ids;
  }

  static auto cmdline(pid_t pid) -> std::string {
    std::ifstream in(std::format("/proc/{}/cmdline", pid), std::ios::binary);
    std::string raw((std::istreambuf_iterator<char>(in)),
                    std::istreambuf_iterator<char>());
    std::ranges::replace(raw, '\0', ' ');
    return raw;
  }

  auto wait_for_status(Supervisor& sup, const TaskId& id, TaskStatus status,
                       std::chrono::milliseconds timeout = 10s) -> bool {
    return test::wait_until(
        [&] {
          auto rec = sup.get_task_status(id);
          return rec && rec->status == status;
        },
        timeout);
  }

  test::TempDir dir_;
  SystemConfig config_;
  HandlerRegistry registry_;
};

TEST_F(SupervisorTest, CriticalTask_CompletesWithResult) {
  auto sup = make_supervisor();
  ASSERT_TRUE(sup->start(1).has_value());

  auto id = sup->submit_task("Urgent noop", "noop_success",
                             nlohmann::json::array({"x"}),
                             nlohmann::json::object(), Priority::Critical);
  ASSERT_TRUE(id.has_value());

  ASSERT_TRUE(wait_for_status(*sup, *id, TaskStatus::Completed));
  auto rec = sup->get_task_status(*id);
  ASSERT_TRUE(rec.has_value());
  EXPECT_EQ(rec->priority, Priority::Critical);
  EXPECT_EQ(rec->retry_count, 0);
  EXPECT_TRUE(rec->completed_at.has_value());
  EXPECT_FALSE(rec->worker_id.empty());

  auto result = sup->get_task_result(*id);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ((*result)["ok"], true);
  EXPECT_EQ((*result)["args"], nlohmann::json::array({"x"}));
}

TEST_F(SupervisorTest, FailingTask_IsRetriedThenFailed) {
  auto sup = make_supervisor();
  ASSERT_TRUE(sup->start(1).has_value());

  auto id = sup->submit_task("Doomed", "always_fail", nlohmann::json::array(),
                             {{"message", "still broken"}}, Priority::Low,
                             SubmitOptions{.max_retries = 2});
  ASSERT_TRUE(id.has_value());

  ASSERT_TRUE(wait_for_status(*sup, *id, TaskStatus::Failed));
  auto rec = sup->get_task_status(*id);
  ASSERT_TRUE(rec.has_value());
  EXPECT_EQ(rec->retry_count, 2);
  EXPECT_EQ(rec->error, "still broken");
  EXPECT_FALSE(sup->get_task_result(*id).has_value());
}

TEST_F(SupervisorTest, WaitUntilIdle_AfterBatch) {
  auto sup = make_supervisor();
  ASSERT_TRUE(sup->start(2).has_value());

  for (int i = 0; i < 5; ++i) {
    ASSERT_TRUE(sup->submit_task(std::format("noop {}", i), "noop_success")
                    .has_value());
  }

  ASSERT_TRUE(sup->wait_until_idle(15s));
  auto stats = sup->get_dashboard_stats();
  EXPECT_EQ(stats.tasks.queue_size, 0);
  EXPECT_EQ(stats.tasks.total_queued, 5);
  EXPECT_EQ(stats.tasks.total_completed, 5);
  EXPECT_EQ(stats.tasks.total_failed, 0);
  EXPECT_DOUBLE_EQ(stats.performance.success_rate, 100.0);
  EXPECT_GT(stats.tasks.tasks_per_minute, 0.0);
  EXPECT_EQ(stats.workers.active, 2);
  EXPECT_EQ(stats.workers.dead, 0);
  EXPECT_EQ(stats.queue_backend, "sqlite");
  EXPECT_FALSE(stats.performance.is_throttling);
}

TEST_F(SupervisorTest, WaitUntilIdle_TimesOutWithoutWorkers) {
  auto sup = make_supervisor();
  ASSERT_TRUE(sup->init().has_value());
  ASSERT_TRUE(sup->submit_task("stuck", "noop_success").has_value());

  EXPECT_FALSE(sup->wait_until_idle(200ms));
}

TEST_F(SupervisorTest, CancelQueuedTask) {
  auto sup = make_supervisor();
  ASSERT_TRUE(sup->init().has_value());
  auto id = sup->submit_task("cancel me", "noop_success");
  ASSERT_TRUE(id.has_value());

  EXPECT_TRUE(sup->cancel_task(*id));
  EXPECT_FALSE(sup->cancel_task(*id));

  auto rec = sup->get_task_status(*id);
  ASSERT_TRUE(rec.has_value());
  EXPECT_EQ(rec->status, TaskStatus::Cancelled);
  EXPECT_EQ(sup->get_dashboard_stats().tasks.queue_size, 0);
}

TEST_F(SupervisorTest, CancelUnknownTask_ReturnsFalse) {
  auto sup = make_supervisor();

  EXPECT_FALSE(sup->cancel_task(test::task_id("no-such-task")));
}

TEST_F(SupervisorTest, SubmitTask_RejectsInvalidArguments) {
  auto sup = make_supervisor();

  EXPECT_FALSE(sup->submit_task("", "noop_success").has_value());
  EXPECT_FALSE(sup->submit_task("no function", "").has_value());
  EXPECT_FALSE(sup->submit_task("bad args", "noop_success",
                                nlohmann::json::object())
                   .has_value());
  EXPECT_FALSE(sup->submit_task("bad kwargs", "noop_success",
                                nlohmann::json::array(),
                                nlohmann::json::array())
                   .has_value());
  EXPECT_FALSE(sup->submit_task("bad retries", "noop_success",
                                nlohmann::json::array(),
                                nlohmann::json::object(), Priority::Medium,
                                SubmitOptions{.max_retries = -1})
                   .has_value());
  EXPECT_FALSE(sup->submit_task("bad timeout", "noop_success",
                                nlohmann::json::array(),
                                nlohmann::json::object(), Priority::Medium,
                                SubmitOptions{.timeout = 0s})
                   .has_value());
}

TEST_F(SupervisorTest, UnknownTask_HasNoStatusOrResult) {
  auto sup = make_supervisor();

  EXPECT_FALSE(sup->get_task_status(test::task_id("missing")).has_value());
  EXPECT_FALSE(sup->get_task_result(test::task_id("missing")).has_value());
}

TEST_F(SupervisorTest, PendingTask_HasNoResult) {
  auto sup = make_supervisor();
  auto id = sup->submit_task("waiting", "noop_success");
  ASSERT_TRUE(id.has_value());

  auto rec = sup->get_task_status(*id);
  ASSERT_TRUE(rec.has_value());
  EXPECT_EQ(rec->status, TaskStatus::Queued);
  EXPECT_FALSE(sup->get_task_result(*id).has_value());
}

TEST_F(SupervisorTest, Dashboard_NeverStartedReportsWholeDatabase) {
  auto sup = make_supervisor();
  ASSERT_TRUE(sup->submit_task("a", "noop_success").has_value());
  ASSERT_TRUE(sup->submit_task("b", "noop_success").has_value());

  auto stats = sup->get_dashboard_stats();

  EXPECT_EQ(stats.tasks.queue_size, 2);
  EXPECT_EQ(stats.tasks.total_queued, 2);
  EXPECT_EQ(stats.tasks.total_completed, 0);
  EXPECT_EQ(stats.workers.active, 0);
  EXPECT_EQ(stats.workers.total, 0);
  EXPECT_DOUBLE_EQ(stats.system.uptime_minutes, 0.0);
  EXPECT_EQ(stats.tasks.recent_by_status[TaskStatus::Queued], 2);

  auto j = to_json(stats);
  EXPECT_TRUE(j.contains("system"));
  EXPECT_TRUE(j.contains("workers"));
  EXPECT_TRUE(j.contains("tasks"));
  EXPECT_TRUE(j.contains("performance"));
  EXPECT_FALSE(render_dashboard(stats).empty());
}

TEST_F(SupervisorTest, RecoverFromCrash_RequeuesOrphanedTask) {
  auto orphan = test::make_task("orphan", "noop_success", Priority::High);
  {
    Persistence db(config_.storage.db_file);
    ASSERT_TRUE(db.open().has_value());
    orphan.status = TaskStatus::Running;
    orphan.worker_id = test::worker_id("worker-9");
    ASSERT_TRUE(db.save_task(orphan).has_value());
  }

  auto sup = make_supervisor();
  auto recovered = sup->recover_from_crash();

  ASSERT_TRUE(recovered.has_value());
  ASSERT_EQ(recovered->requeued.size(), 1u);
  EXPECT_EQ(recovered->requeued.front(), orphan.id);
  EXPECT_EQ(sup->get_task_status(orphan.id)->status, TaskStatus::Retry);

  ASSERT_TRUE(sup->start(1).has_value());
  ASSERT_TRUE(wait_for_status(*sup, orphan.id, TaskStatus::Completed));
  EXPECT_EQ(sup->get_task_status(orphan.id)->retry_count, 1);
}

TEST_F(SupervisorTest, CollectMetrics_IsPersisted) {
  auto sup = make_supervisor();
  ASSERT_TRUE(sup->init().has_value());
  ASSERT_TRUE(sup->submit_task("queued", "noop_success").has_value());

  auto m = sup->collect_metrics_once();

  EXPECT_EQ(m.queue_size, 1);
  EXPECT_FALSE(m.throttled);
  Persistence db(config_.storage.db_file);
  ASSERT_TRUE(db.open().has_value());
  auto rows = db.list_metrics(10);
  ASSERT_TRUE(rows.has_value());
  ASSERT_EQ(rows->size(), 1u);
  EXPECT_EQ(rows->front().queue_size, 1);
}

TEST_F(SupervisorTest, Stop_JoinsAllWorkers) {
  auto sup = make_supervisor();
  ASSERT_TRUE(sup->start(3).has_value());
  EXPECT_TRUE(sup->running());
  EXPECT_EQ(sup->active_workers(), 3);

  sup->stop();

  EXPECT_FALSE(sup->running());
  EXPECT_EQ(sup->active_workers(), 0);
  EXPECT_EQ(sup->get_dashboard_stats().workers.dead, 0);
}

TEST_F(SupervisorTest, Start_ClampsToMaxWorkers) {
  config_.workers.max_workers = 2;
  auto sup = make_supervisor();

  ASSERT_TRUE(sup->start(10).has_value());

  EXPECT_EQ(sup->active_workers(), 2);
}

TEST_F(SupervisorTest, Start_FreezesRegistry) {
  auto sup = make_supervisor();
  ASSERT_TRUE(sup->start(1).has_value());

  EXPECT_TRUE(registry_.frozen());
}

TEST_F(SupervisorTest, MemoryQueue_ForcesThreadWorkers) {
  config_.queue.backend = QueueBackendKind::Memory;
  config_.workers.mode = WorkerMode::Process;
  auto sup = make_supervisor();

  ASSERT_TRUE(sup->start(1).has_value());

  EXPECT_EQ(sup->worker_mode(), WorkerMode::Thread);
  EXPECT_FALSE(sup->queue_shared());

  auto id = sup->submit_task("in-process", "noop_success");
  ASSERT_TRUE(id.has_value());
  EXPECT_TRUE(wait_for_status(*sup, *id, TaskStatus::Completed));
}

TEST_F(SupervisorTest, ProcessWorkers_CompleteTasksAndExitCleanly) {
  config_.workers.mode = WorkerMode::Process;
  auto sup = make_supervisor();
  ASSERT_TRUE(sup->start(2).has_value());
  ASSERT_EQ(sup->worker_mode(), WorkerMode::Process);

  auto fast = sup->submit_task("fast", "noop_success", nlohmann::json::array(),
                               nlohmann::json::object(), Priority::High);
  auto failing = sup->submit_task("failing", "always_fail",
                                  nlohmann::json::array(),
                                  nlohmann::json::object(), Priority::Medium,
                                  SubmitOptions{.max_retries = 1});
  ASSERT_TRUE(fast.has_value());
  ASSERT_TRUE(failing.has_value());

  EXPECT_TRUE(wait_for_status(*sup, *fast, TaskStatus::Completed, 15s));
  EXPECT_TRUE(wait_for_status(*sup, *failing, TaskStatus::Failed, 15s));
  EXPECT_TRUE(sup->get_task_result(*fast).has_value());

  sup->stop();
  EXPECT_EQ(sup->get_dashboard_stats().workers.dead, 0);
}

TEST_F(SupervisorTest, Rebalance_FollowsHostLoadAndStopsNewestFirst) {
  config_.monitor.cpu_scale_down_percent = 80.0;
  auto host = std::make_shared<test::FakeHost>();
  host->cpus = 4;
  auto sup = make_supervisor(host);
  ASSERT_TRUE(sup->start(1).has_value());
  EXPECT_EQ(live_ids(*sup), (std::vector<std::string>{"worker-1"}));

  // Idle 4-core host: cores - 1.
  sup->rebalance_workers();
  EXPECT_EQ(sup->active_workers(), 3);
  EXPECT_EQ(live_ids(*sup),
            (std::vector<std::string>{"worker-1", "worker-2", "worker-3"}));

  // Busy host: half the cores, newest worker goes first.
  host->cpu_percent = 85.0;
  sup->rebalance_workers();
  EXPECT_EQ(sup->active_workers(), 2);
  EXPECT_EQ(live_ids(*sup),
            (std::vector<std::string>{"worker-1", "worker-2"}));

  host->cpu_percent = 10.0;
  sup->rebalance_workers();
  EXPECT_EQ(sup->active_workers(), 3);
  EXPECT_EQ(live_ids(*sup).back(), "worker-4");

  sup->stop();
  EXPECT_EQ(sup->get_dashboard_stats().workers.dead, 0);
}

TEST_F(SupervisorTest, Rebalance_NeverExceedsMaxWorkers) {
  config_.workers.max_workers = 4;
  auto host = std::make_shared<test::FakeHost>();
  host->cpus = 16;
  auto sup = make_supervisor(host);
  ASSERT_TRUE(sup->start(1).has_value());

  sup->rebalance_workers();
  sup->rebalance_workers();

  EXPECT_EQ(sup->active_workers(), 4);
  EXPECT_EQ(sup->get_dashboard_stats().performance.recommended_workers, 8);
}

TEST_F(SupervisorTest, ProcessWorkers_ScaleUpWhileOtherThreadsAreBusy) {
  config_.workers.mode = WorkerMode::Process;
  auto host = std::make_shared<test::FakeHost>();
  host->cpus = 4;
  auto sup = make_supervisor(host);
  ASSERT_TRUE(sup->start(1).has_value());

  std::atomic<bool> done{false};
  std::thread busy([&] {
    int submitted = 0;
    while (!done.load()) {
      if (submitted < 100) {
        if (auto id = sup->submit_task("busy", "noop_success")) {
          ++submitted;
          (void)sup->get_task_status(*id);
        }
      }
      (void)sup->get_dashboard_stats();
      std::this_thread::sleep_for(1ms);
    }
  });

  for (int i = 0; i < 3; ++i) {
    sup->rebalance_workers();
  }
  auto workers = sup->list_workers();
  ASSERT_EQ(workers.size(), 3u);
  for (const auto& w : workers) {
    ASSERT_GT(w.pid, 0);
    EXPECT_TRUE(test::wait_until(
        [&] {
          return cmdline(w.pid).find(std::format(" worker --id {} ", w.id)) !=
                 std::string::npos;
        },
        5s))
        << cmdline(w.pid);
  }

  done = true;
  busy.join();
  EXPECT_TRUE(sup->wait_until_idle(20s));

  sup->stop();
  EXPECT_EQ(sup->get_dashboard_stats().workers.dead, 0);
}

TEST_F(SupervisorTest, ProcessWorker_KilledMidTask_TaskIsRetried) {
  config_.workers.mode = WorkerMode::Process;
  auto host = std::make_shared<test::FakeHost>();
  host->cpus = 2;
  auto sup = make_supervisor(host);
  ASSERT_TRUE(sup->start(1).has_value());

  auto id = sup->submit_task("long cleanup", "database_cleanup",
                             nlohmann::json::array(), {{"delay_scale", 20.0}});
  ASSERT_TRUE(id.has_value());
  ASSERT_TRUE(wait_for_status(*sup, *id, TaskStatus::Running, 15s));
  auto running = sup->get_task_status(*id);
  ASSERT_TRUE(running.has_value());
  EXPECT_EQ(running->retry_count, 0);

  auto workers = sup->list_workers();
  auto victim = std::ranges::find_if(
      workers, [&](const WorkerInfo& w) { return w.id == running->worker_id; });
  ASSERT_NE(victim, workers.end());
  ASSERT_EQ(kill(victim->pid, SIGKILL), 0);

  EXPECT_TRUE(test::wait_until(
      [&] {
        sup->rebalance_workers();
        return sup->get_dashboard_stats().workers.dead == 1;
      },
      5s));

  auto rec = sup->get_task_status(*id);
  ASSERT_TRUE(rec.has_value());
  EXPECT_EQ(rec->retry_count, 1);
  // The replacement worker may already have picked it up again.
  if (rec->status == TaskStatus::Retry) {
    EXPECT_EQ(rec->error, Recovery::kCrashError);
  } else {
    EXPECT_EQ(rec->status, TaskStatus::Running) << task_status_name(rec->status);
    EXPECT_NE(rec->worker_id, running->worker_id);
  }
  // Replaced by a fresh worker.
  EXPECT_EQ(sup->active_workers(), 1);
  EXPECT_NE(live_ids(*sup).front(), victim->id.str());
}

TEST_F(SupervisorTest, ProcessWorkers_MissingExecutable_FailsStart) {
  config_.workers.mode = WorkerMode::Process;
  config_.workers.worker_executable = dir_.file("no-such-binary");
  auto sup = make_supervisor();

  auto r = sup->start(1);

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::SpawnFailed));
  EXPECT_FALSE(sup->running());
  EXPECT_EQ(sup->active_workers(), 0);
}

TEST_F(SupervisorTest, Dashboard_ConsistentWhileWorkersScale) {
  config_.monitor.cpu_scale_down_percent = 80.0;
  auto host = std::make_shared<test::FakeHost>();
  host->cpus = 4;
  auto sup = make_supervisor(host);
  ASSERT_TRUE(sup->start(1).has_value());

  std::atomic<bool> done{false};
  std::atomic<int> regressions{0};
  std::thread reader([&] {
    int last_total = 0;
    while (!done.load()) {
      auto stats = sup->get_dashboard_stats();
      if (stats.workers.total < last_total ||
          stats.workers.active > stats.workers.total) {
        ++regressions;
      }
      last_total = stats.workers.total;
    }
  });

  for (int i = 0; i < 10; ++i) {
    host->cpu_percent = (i % 2 == 0) ? 10.0 : 85.0;
    sup->rebalance_workers();
  }
  done = true;
  reader.join();

  EXPECT_EQ(regressions.load(), 0);
  auto stats = sup->get_dashboard_stats();
  EXPECT_GE(stats.workers.total, 3);
  EXPECT_EQ(stats.workers.dead, 0);
}
