#pragma once

#include <atomic>
#include <bit>
#include <concepts>
#include <cstddef>
#include <memory>
#include <new>
#include <optional>

namespace taskhive {

inline constexpr std::size_t kCacheLineSize =
#ifdef __cpp_lib_hardware_interference_size
    std::hardware_destructive_interference_size;
#else
    64;
#endif

template <typename T>
concept QueueElement = std::movable<T> && std::destructible<T>;

// Bounded multi-producer / single-consumer ring. Each slot carries a sequence
// number: seq == pos means writable for ticket pos, seq == pos + 1 means
// readable. Capacity is rounded up to a power of two.
template <QueueElement T>
class BoundedMPSCQueue {
public:
  explicit BoundedMPSCQueue(std::size_t capacity)
      : capacity_(std::bit_ceil(capacity < 2 ? std::size_t{2} : capacity)),
        mask_(capacity_ - 1),
        slots_(std::make_unique<Slot[]>(capacity_)) {
    for (std::size_t i = 0; i < capacity_; ++i) {
      slots_[i].seq.store(i, std::memory_order_relaxed);
    }
  }

  ~BoundedMPSCQueue() {
    while (try_pop()) {
    }
  }

  BoundedMPSCQueue(const BoundedMPSCQueue&) = delete;
  BoundedMPSCQueue& operator=(const BoundedMPSCQueue&) = delete;

  // Returns false when the ring is full; the value is left untouched then.
  [[nodiscard]] auto push(T&& value) noexcept -> bool {
    auto ticket = head_.load(std::memory_order_relaxed);
    while (true) {
      auto& slot = slots_[ticket & mask_];
      auto seq = slot.seq.load(std::memory_order_acquire);
      auto lag = static_cast<std::ptrdiff_t>(seq) -
                 static_cast<std::ptrdiff_t>(ticket);
      if (lag < 0) {
        return false;
      }
      if (lag > 0) {
        ticket = head_.load(std::memory_order_relaxed);
        continue;
      }
      if (head_.compare_exchange_weak(ticket, ticket + 1,
                                      std::memory_order_acq_rel,
                                      std::memory_order_relaxed)) {
        std::construct_at(slot.ptr(), std::move(value));
        slot.seq.store(ticket + 1, std::memory_order_release);
        return true;
      }
    }
  }

  [[nodiscard]] auto try_pop() noexcept -> std::optional<T> {
    auto ticket = tail_.load(std::memory_order_relaxed);
    auto& slot = slots_[ticket & mask_];
    if (slot.seq.load(std::memory_order_acquire) != ticket + 1) {
      return std::nullopt;
    }
    std::optional<T> out{std::move(*slot.ptr())};
    std::destroy_at(slot.ptr());
    slot.seq.store(ticket + capacity_, std::memory_order_release);
    tail_.store(ticket + 1, std::memory_order_relaxed);
    return out;
  }

  [[nodiscard]] auto empty() const noexcept -> bool {
    return head_.load(std::memory_order_acquire) ==
           tail_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto capacity() const noexcept -> std::size_t {
    return capacity_;
  }

private:
  struct Slot {
    std::atomic<std::size_t> seq;
    alignas(T) std::byte storage[sizeof(T)];

    auto ptr() noexcept -> T* {
      return std::launder(reinterpret_cast<T*>(storage));
    }
  };

  std::size_t capacity_;
  std::size_t mask_;
  std::unique_ptr<Slot[]> slots_;
  alignas(kCacheLineSize) std::atomic<std::size_t> head_{0};
  alignas(kCacheLineSize) std::atomic<std::size_t> tail_{0};
};

}  // namespace taskhive
