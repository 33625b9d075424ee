#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string_view>

namespace taskhive {

enum class CancelReason : std::uint8_t {
  None,
  // Worker is going away (stop grace period expired).
  Shutdown,
  // Explicit request through Worker::cancel_current().
  Requested,
};

[[nodiscard]] constexpr auto cancel_reason_name(CancelReason r) noexcept
    -> std::string_view {
  switch (r) {
    case CancelReason::None: return "none";
    case CancelReason::Shutdown: return "worker shutdown";
    case CancelReason::Requested: return "cancel requested";
  }
  return "none";
}

namespace detail {

struct CancelState {
  std::atomic<CancelReason> reason{CancelReason::None};
};

}  // namespace detail

// Read side handed to a handler through TaskContext. A default token is never
// cancelled.
class CancellationToken {
public:
  CancellationToken() = default;

  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    return reason() != CancelReason::None;
  }

  [[nodiscard]] auto reason() const noexcept -> CancelReason {
    return state_ ? state_->reason.load(std::memory_order_acquire)
                  : CancelReason::None;
  }

  [[nodiscard]] static auto none() noexcept -> CancellationToken {
    return {};
  }

private:
  friend class CancellationSource;

  explicit CancellationToken(std::shared_ptr<detail::CancelState> state)
      : state_(std::move(state)) {
  }

  std::shared_ptr<detail::CancelState> state_;
};

// Write side, owned by the worker for the task it is running. The first
// cancel() wins; later reasons are ignored.
class CancellationSource {
public:
  CancellationSource() : state_(std::make_shared<detail::CancelState>()) {
  }

  [[nodiscard]] auto token() const noexcept -> CancellationToken {
    return CancellationToken{state_};
  }

  auto cancel(CancelReason reason = CancelReason::Requested) noexcept -> bool {
    if (reason == CancelReason::None) {
      return false;
    }
    auto expected = CancelReason::None;
    return state_->reason.compare_exchange_strong(
        expected, reason, std::memory_order_acq_rel);
  }

  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    return token().is_cancelled();
  }

private:
  std::shared_ptr<detail::CancelState> state_;
};

}  // namespace taskhive
