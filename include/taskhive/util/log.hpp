#pragma once

#include "taskhive/core/constants.hpp"
#include "taskhive/core/lockfree_queue.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace taskhive::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error,
  Off
};

[[nodiscard]] constexpr auto level_name(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view names[] = {"trace", "debug", "info",
                                        "warn",  "error", "off"};
  return names[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto level_color(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view colors[] = {
      "\033[90m",  // trace: gray
      "\033[36m",  // debug: cyan
      "\033[32m",  // info: green
      "\033[33m",  // warn: yellow
      "\033[31m",  // error: red
      "",
  };
  return colors[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] inline auto parse_level(std::string_view name) noexcept
    -> Level {
  if (name == "trace") return Level::Trace;
  if (name == "debug") return Level::Debug;
  if (name == "warn") return Level::Warn;
  if (name == "error") return Level::Error;
  if (name == "off") return Level::Off;
  return Level::Info;
}

// Async logger. Formatting happens on the caller thread; a writer thread
// drains the MPSC ring in batches. When the writer is not running (before
// start() or after stop()) messages are written synchronously.
class Logger {
  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<bool> accepting_{false};
  BoundedMPSCQueue<std::string> queue_{limits::kLogQueueCapacity};
  std::thread writer_;
  std::mutex out_mutex_;
  std::FILE* out_{stdout};
  bool owns_out_{false};
  bool color_{true};

  auto write(std::string_view msg) -> void {
    std::lock_guard lock(out_mutex_);
    std::fwrite(msg.data(), 1, msg.size(), out_);
  }

  auto flush() -> void {
    std::lock_guard lock(out_mutex_);
    std::fflush(out_);
  }

  auto writer_loop() -> void {
    std::vector<std::string> batch;
    batch.reserve(limits::kLogBatchSize);

    while (running_.load(std::memory_order_acquire)) {
      while (batch.size() < limits::kLogBatchSize) {
        auto msg = queue_.try_pop();
        if (!msg) break;
        batch.push_back(std::move(*msg));
      }
      for (const auto& msg : batch) {
        write(msg);
      }
      if (batch.empty()) {
        std::this_thread::sleep_for(std::chrono::microseconds(200));
      } else {
        flush();
        batch.clear();
      }
    }

    while (auto msg = queue_.try_pop()) {
      write(*msg);
    }
    flush();
  }

  template <typename... Args>
  auto format_line(Level level, std::format_string<Args...> fmt,
                   Args&&... args) -> std::string {
    auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    auto body = std::format(fmt, std::forward<Args>(args)...);
    if (color_) {
      return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}\033[0m] [{}] {}\n", now,
                         level_color(level), level_name(level), tid, body);
    }
    return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}] [{}] {}\n", now,
                       level_name(level), tid, body);
  }

public:
  Logger() = default;
  explicit Logger(Level level) : level_(level) {}

  ~Logger() {
    stop();
    if (owns_out_) {
      std::fclose(out_);
    }
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto start() -> void {
    if (running_.exchange(true)) return;
    accepting_.store(true, std::memory_order_release);
    writer_ = std::thread([this] { writer_loop(); });
  }

  auto stop() -> void {
    accepting_.store(false, std::memory_order_release);
    std::atomic_thread_fence(std::memory_order_seq_cst);
    if (!running_.exchange(false)) return;
    if (writer_.joinable()) {
      writer_.join();
    }
  }

  [[nodiscard]] auto set_output_file(const std::string& path) -> bool {
    auto* f = std::fopen(path.c_str(), "a");
    if (!f) return false;
    std::lock_guard lock(out_mutex_);
    if (owns_out_) {
      std::fclose(out_);
    }
    out_ = f;
    owns_out_ = true;
    color_ = false;
    return true;
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto enabled(Level level) const noexcept -> bool {
    return level >= level_.load(std::memory_order_acquire) &&
           level != Level::Off;
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    if (!enabled(level)) return;

    auto line = format_line(level, fmt, std::forward<Args>(args)...);
    if (!accepting_.load(std::memory_order_acquire)) {
      write(line);
      flush();
      return;
    }
    if (!queue_.push(std::move(line))) {
      write(line);
    }
  }

  template <typename... Args>
  auto trace(std::format_string<Args...> fmt, Args&&... args) -> void {
    log(Level::Trace, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  auto debug(std::format_string<Args...> fmt, Args&&... args) -> void {
    log(Level::Debug, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  auto info(std::format_string<Args...> fmt, Args&&... args) -> void {
    log(Level::Info, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  auto warn(std::format_string<Args...> fmt, Args&&... args) -> void {
    log(Level::Warn, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  auto error(std::format_string<Args...> fmt, Args&&... args) -> void {
    log(Level::Error, fmt, std::forward<Args>(args)...);
  }
};

// Default process-wide logger, used where no logger is injected.
inline Logger& logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name));
}

[[nodiscard]] inline auto set_output_file(const std::string& path) -> bool {
  return logger().set_output_file(path);
}

inline auto start() -> void {
  logger().start();
}
inline auto stop() -> void {
  logger().stop();
}

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

}  // namespace taskhive::log
