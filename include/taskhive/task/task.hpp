#pragma once

#include "taskhive/core/error.hpp"
#include "taskhive/util/id.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace taskhive {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Lower value is dequeued first.
enum class Priority : std::uint8_t {
  Critical = 1,
  High = 2,
  Medium = 3,
  Low = 4,
  Batch = 5,
};

enum class TaskStatus : std::uint8_t {
  Pending,
  Queued,
  Running,
  Completed,
  Failed,
  Retry,
  Cancelled,
};

[[nodiscard]] auto priority_name(Priority p) noexcept -> std::string_view;
[[nodiscard]] auto parse_priority(std::string_view name)
    -> std::optional<Priority>;
[[nodiscard]] auto priority_from_value(int value) -> std::optional<Priority>;

[[nodiscard]] auto task_status_name(TaskStatus s) noexcept -> std::string_view;
[[nodiscard]] auto parse_task_status(std::string_view name)
    -> std::optional<TaskStatus>;

[[nodiscard]] constexpr auto is_terminal(TaskStatus s) noexcept -> bool {
  return s == TaskStatus::Completed || s == TaskStatus::Failed ||
         s == TaskStatus::Cancelled;
}

[[nodiscard]] constexpr auto is_background(Priority p) noexcept -> bool {
  return p == Priority::Low || p == Priority::Batch;
}

struct Task {
  TaskId id;
  std::string name;
  std::string function;
  nlohmann::json args = nlohmann::json::array();
  nlohmann::json kwargs = nlohmann::json::object();
  Priority priority{Priority::Medium};
  int max_retries{3};
  int retry_count{0};
  std::chrono::seconds timeout{300};
  std::optional<TimePoint> scheduled_time;
  TimePoint created_at{};
  TaskStatus status{TaskStatus::Pending};

  // Written by the owning worker.
  WorkerId worker_id;
  double execution_time{0.0};
  nlohmann::json result;
  std::string error;
};

// Queue ordering key: priority value plus submission time normalized into
// [0, 1), so earlier submissions win inside a tier and tiers never overlap.
[[nodiscard]] auto compute_score(Priority priority, TimePoint submitted_at)
    -> double;

[[nodiscard]] auto to_millis(TimePoint tp) -> std::int64_t;
[[nodiscard]] auto from_millis(std::int64_t ms) -> TimePoint;

// Versioned JSON envelope used as the queue payload. Only explicit fields are
// carried; decoding rejects unknown versions and malformed documents.
[[nodiscard]] auto encode_envelope(const Task& task) -> std::string;
[[nodiscard]] auto decode_envelope(std::string_view payload) -> Result<Task>;

}  // namespace taskhive
