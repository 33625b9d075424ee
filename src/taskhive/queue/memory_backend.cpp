#include "taskhive/queue/priority_queue.hpp"

#include "taskhive/util/log.hpp"

#include <algorithm>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace taskhive {

namespace {

// In-process backend: a ready map ordered by (score, seq) and a delayed map
// ordered by eligibility time. Delayed entries are promoted on pop.
class MemoryQueueBackend final : public IQueueBackend {
public:
  auto push(const Task& task, double score, TimePoint eligible_at)
      -> Result<void> override {
    {
      std::lock_guard lock(mu_);
      if (!ids_.insert(task.id.str()).second) {
        return fail(Error::AlreadyExists);
      }
      Key key{score, next_seq_++};
      if (eligible_at > Clock::now()) {
        delayed_.emplace(eligible_at, Entry{key, task});
      } else {
        ready_.emplace(key, task);
      }
    }
    cv_.notify_one();
    return ok();
  }

  auto pop(std::chrono::milliseconds timeout)
      -> Result<std::optional<Task>> override {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock lock(mu_);
    while (true) {
      promote_due();
      if (!ready_.empty()) {
        auto node = ready_.extract(ready_.begin());
        ids_.erase(node.mapped().id.str());
        return std::optional<Task>{std::move(node.mapped())};
      }

      auto now = std::chrono::steady_clock::now();
      if (now >= deadline) {
        return std::optional<Task>{};
      }
      auto wake = deadline;
      if (!delayed_.empty()) {
        auto until_due = delayed_.begin()->first - Clock::now();
        wake = std::min(
            wake, now + std::chrono::duration_cast<std::chrono::milliseconds>(
                            until_due) +
                      std::chrono::milliseconds(1));
      }
      cv_.wait_until(lock, wake);
    }
  }

  auto size() -> Result<std::int64_t> override {
    std::lock_guard lock(mu_);
    return static_cast<std::int64_t>(ready_.size() + delayed_.size());
  }

  auto remove(const TaskId& id) -> Result<bool> override {
    std::lock_guard lock(mu_);
    if (ids_.erase(id.str()) == 0) {
      return false;
    }
    auto ready_it = std::ranges::find_if(
        ready_, [&](const auto& kv) { return kv.second.id == id; });
    if (ready_it != ready_.end()) {
      ready_.erase(ready_it);
      return true;
    }
    auto delayed_it = std::ranges::find_if(
        delayed_, [&](const auto& kv) { return kv.second.task.id == id; });
    if (delayed_it != delayed_.end()) {
      delayed_.erase(delayed_it);
    }
    return true;
  }

  auto set_result(const TaskId& id, const nlohmann::json& result,
                  std::chrono::seconds ttl) -> Result<void> override {
    std::lock_guard lock(mu_);
    auto now = std::chrono::steady_clock::now();
    std::erase_if(results_,
                  [now](const auto& kv) { return kv.second.expires_at <= now; });
    results_[id.str()] = CachedResult{result, now + ttl};
    return ok();
  }

  auto get_result(const TaskId& id)
      -> Result<std::optional<nlohmann::json>> override {
    std::lock_guard lock(mu_);
    auto it = results_.find(id.str());
    if (it == results_.end()) {
      return std::optional<nlohmann::json>{};
    }
    if (it->second.expires_at <= std::chrono::steady_clock::now()) {
      results_.erase(it);
      return std::optional<nlohmann::json>{};
    }
    return std::optional<nlohmann::json>{it->second.value};
  }

  auto is_shared() const noexcept -> bool override {
    return false;
  }

  auto name() const noexcept -> std::string_view override {
    return "memory";
  }

private:
  using Key = std::pair<double, std::uint64_t>;

  struct Entry {
    Key key;
    Task task;
  };

  struct CachedResult {
    nlohmann::json value;
    std::chrono::steady_clock::time_point expires_at;
  };

  // Caller holds mu_.
  auto promote_due() -> void {
    auto now = Clock::now();
    while (!delayed_.empty() && delayed_.begin()->first <= now) {
      auto node = delayed_.extract(delayed_.begin());
      ready_.emplace(node.mapped().key, std::move(node.mapped().task));
    }
  }

  std::mutex mu_;
  std::condition_variable cv_;
  std::map<Key, Task> ready_;
  std::multimap<TimePoint, Entry> delayed_;
  std::unordered_set<std::string> ids_;
  std::unordered_map<std::string, CachedResult> results_;
  std::uint64_t next_seq_{0};
};

}  // namespace

auto create_memory_queue_backend() -> std::unique_ptr<IQueueBackend> {
  return std::make_unique<MemoryQueueBackend>();
}

}  // namespace taskhive
