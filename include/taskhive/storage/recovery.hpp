#pragma once

#include "taskhive/core/error.hpp"
#include "taskhive/storage/persistence.hpp"
#include "taskhive/task/task.hpp"

#include <functional>
#include <optional>
#include <string_view>
#include <vector>

namespace taskhive {

struct RecoveryResult {
  std::vector<TaskId> requeued;
  std::vector<TaskId> failed;
};

// Handles tasks left RUNNING by a worker that is gone. Each one is requeued
// as RETRY while its retry budget lasts, otherwise it becomes FAILED.
class Recovery {
public:
  static constexpr std::string_view kCrashError = "worker crashed";

  explicit Recovery(Persistence& persistence);

  // `worker` limits recovery to one worker's tasks; nullopt takes every
  // RUNNING task (startup after a crash). `requeue` returns false when the
  // task could not be put back on the queue.
  [[nodiscard]] auto recover(const std::optional<WorkerId>& worker,
                             std::move_only_function<bool(const Task&)> requeue)
      -> Result<RecoveryResult>;

private:
  Persistence& persistence_;
};

}  // namespace taskhive
