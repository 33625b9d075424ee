#pragma once

#include "taskhive/core/error.hpp"
#include "taskhive/task/cancellation.hpp"
#include "taskhive/task/task.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace taskhive {

struct TaskContext {
  TaskId task_id;
  WorkerId worker_id;
  std::chrono::steady_clock::time_point deadline;
  CancellationToken cancel;

  [[nodiscard]] auto expired() const -> bool {
    return std::chrono::steady_clock::now() >= deadline;
  }

  [[nodiscard]] auto cancelled() const -> bool {
    return cancel.is_cancelled();
  }

  [[nodiscard]] auto cancel_reason() const -> CancelReason {
    return cancel.reason();
  }

  // Long-running handlers poll this between steps.
  [[nodiscard]] auto should_stop() const -> bool {
    return expired() || cancelled();
  }
};

struct HandlerError {
  std::string message;
  bool retryable{true};
};

using HandlerResult = std::expected<nlohmann::json, HandlerError>;

[[nodiscard]] inline auto handler_error(std::string message,
                                        bool retryable = true)
    -> std::unexpected<HandlerError> {
  return std::unexpected{HandlerError{std::move(message), retryable}};
}

class TaskHandler {
public:
  virtual ~TaskHandler() = default;

  [[nodiscard]] virtual auto execute(const TaskContext& ctx,
                                     const nlohmann::json& args,
                                     const nlohmann::json& kwargs)
      -> HandlerResult = 0;
};

using HandlerFn = std::function<HandlerResult(
    const TaskContext&, const nlohmann::json&, const nlohmann::json&)>;

// Adapts a plain callable to the TaskHandler interface.
class FunctionHandler final : public TaskHandler {
public:
  explicit FunctionHandler(HandlerFn fn) : fn_(std::move(fn)) {
  }

  [[nodiscard]] auto execute(const TaskContext& ctx,
                             const nlohmann::json& args,
                             const nlohmann::json& kwargs)
      -> HandlerResult override {
    return fn_(ctx, args, kwargs);
  }

private:
  HandlerFn fn_;
};

// Name -> handler map. Populated before the supervisor starts; freeze()
// turns it read-only so that thread workers see a stable set.
class HandlerRegistry {
public:
  [[nodiscard]] auto add(std::string_view name,
                         std::unique_ptr<TaskHandler> handler) -> Result<void>;
  [[nodiscard]] auto add(std::string_view name, HandlerFn fn) -> Result<void>;

  [[nodiscard]] auto find(std::string_view name) const -> Result<TaskHandler*>;
  [[nodiscard]] auto contains(std::string_view name) const -> bool;
  [[nodiscard]] auto names() const -> std::vector<std::string>;
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return handlers_.size();
  }

  auto freeze() noexcept -> void {
    frozen_ = true;
  }
  [[nodiscard]] auto frozen() const noexcept -> bool {
    return frozen_;
  }

private:
  std::unordered_map<std::string, std::unique_ptr<TaskHandler>, StringHash,
                     StringEqual>
      handlers_;
  bool frozen_{false};
};

}  // namespace taskhive
