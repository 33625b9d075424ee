#include "taskhive/task/task.hpp"

#include "taskhive/core/constants.hpp"
#include "taskhive/util/log.hpp"

#include <algorithm>
#include <array>
#include <ranges>
#include <utility>

namespace taskhive {

namespace {

constexpr std::array<std::string_view, 5> kPriorityNames = {
    "critical", "high", "medium", "low", "batch",
};

constexpr std::array<std::string_view, 7> kStatusNames = {
    "pending", "queued", "running", "completed",
    "failed",  "retry",  "cancelled",
};

template <typename T>
auto required(const nlohmann::json& j, const char* key) -> T {
  return j.at(key).get<T>();
}

}  // namespace

auto priority_name(Priority p) noexcept -> std::string_view {
  auto idx = static_cast<std::size_t>(std::to_underlying(p)) - 1;
  return idx < kPriorityNames.size() ? kPriorityNames[idx] : "unknown";
}

auto parse_priority(std::string_view name) -> std::optional<Priority> {
  std::string lowered(name);
  std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  auto it = std::ranges::find(kPriorityNames, lowered);
  if (it == kPriorityNames.end()) {
    return std::nullopt;
  }
  return static_cast<Priority>(
      std::ranges::distance(kPriorityNames.begin(), it) + 1);
}

auto priority_from_value(int value) -> std::optional<Priority> {
  if (value < 1 || value > static_cast<int>(kPriorityNames.size())) {
    return std::nullopt;
  }
  return static_cast<Priority>(value);
}

auto task_status_name(TaskStatus s) noexcept -> std::string_view {
  auto idx = static_cast<std::size_t>(std::to_underlying(s));
  return idx < kStatusNames.size() ? kStatusNames[idx] : "unknown";
}

auto parse_task_status(std::string_view name) -> std::optional<TaskStatus> {
  auto it = std::ranges::find(kStatusNames, name);
  if (it == kStatusNames.end()) {
    return std::nullopt;
  }
  return static_cast<TaskStatus>(
      std::ranges::distance(kStatusNames.begin(), it));
}

auto compute_score(Priority priority, TimePoint submitted_at) -> double {
  auto ms = std::max<std::int64_t>(0, to_millis(submitted_at));
  return static_cast<double>(std::to_underlying(priority)) +
         static_cast<double>(ms) / limits::kScoreTimeDivisor;
}

auto to_millis(TimePoint tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

auto from_millis(std::int64_t ms) -> TimePoint {
  return TimePoint{std::chrono::milliseconds(ms)};
}

auto encode_envelope(const Task& task) -> std::string {
  nlohmann::json j = {
      {"version", limits::kEnvelopeVersion},
      {"id", task.id.str()},
      {"name", task.name},
      {"function", task.function},
      {"args", task.args},
      {"kwargs", task.kwargs},
      {"priority", std::to_underlying(task.priority)},
      {"max_retries", task.max_retries},
      {"retry_count", task.retry_count},
      {"timeout", task.timeout.count()},
      {"created_at", to_millis(task.created_at)},
      {"status", task_status_name(task.status)},
  };
  if (task.scheduled_time) {
    j["scheduled_time"] = to_millis(*task.scheduled_time);
  }
  if (!task.error.empty()) {
    j["error"] = task.error;
  }
  return j.dump();
}

auto decode_envelope(std::string_view payload) -> Result<Task> {
  auto j = nlohmann::json::parse(payload, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    log::warn("Rejecting malformed task envelope");
    return fail(Error::ParseError);
  }

  auto version = j.value("version", 0);
  if (version != limits::kEnvelopeVersion) {
    log::warn("Rejecting task envelope with version {}", version);
    return fail(Error::UnsupportedVersion);
  }

  try {
    Task task;
    task.id = TaskId{required<std::string>(j, "id")};
    task.name = required<std::string>(j, "name");
    task.function = required<std::string>(j, "function");
    task.args = j.value("args", nlohmann::json::array());
    task.kwargs = j.value("kwargs", nlohmann::json::object());
    if (!task.args.is_array() || !task.kwargs.is_object()) {
      return fail(Error::ParseError);
    }

    auto priority = priority_from_value(required<int>(j, "priority"));
    if (!priority) {
      return fail(Error::ParseError);
    }
    task.priority = *priority;
    task.max_retries = j.value("max_retries", 3);
    task.retry_count = j.value("retry_count", 0);
    task.timeout = std::chrono::seconds(j.value("timeout", 300));
    task.created_at = from_millis(j.value<std::int64_t>("created_at", 0));
    if (auto it = j.find("scheduled_time"); it != j.end()) {
      task.scheduled_time = from_millis(it->get<std::int64_t>());
    }
    task.status = parse_task_status(j.value("status", "queued"))
                      .value_or(TaskStatus::Queued);
    task.error = j.value("error", "");
    if (task.id.empty() || task.function.empty()) {
      return fail(Error::ParseError);
    }
    return task;
  } catch (const nlohmann::json::exception& e) {
    log::warn("Task envelope field error: {}", e.what());
    return fail(Error::ParseError);
  }
}

}  // namespace taskhive
