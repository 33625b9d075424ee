#include "taskhive/util/daemon.hpp"

#include "taskhive/core/constants.hpp"
#include "taskhive/util/log.hpp"

#include <algorithm>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <thread>
#include <unistd.h>

namespace taskhive {

std::atomic<bool> g_shutdown_requested{false};

namespace {
void signal_handler(int) {
  g_shutdown_requested.store(true, std::memory_order_release);
  g_shutdown_requested.notify_one();
}
}  // namespace

auto daemonize() -> bool {
  pid_t pid = fork();
  if (pid < 0) return false;
  if (pid > 0) std::exit(0);

  if (setsid() < 0) return false;

  pid = fork();
  if (pid < 0) return false;
  if (pid > 0) std::exit(0);

  close(STDIN_FILENO);
  close(STDOUT_FILENO);
  close(STDERR_FILENO);
  return true;
}

void setup_signal_handlers() {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);
  // Worker children that exit must not kill a supervisor writing to a pipe.
  std::signal(SIGPIPE, SIG_IGN);
}

void wait_for_shutdown() {
  g_shutdown_requested.wait(false, std::memory_order_acquire);
}

auto wait_for_shutdown_for(std::chrono::milliseconds timeout) -> bool {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!g_shutdown_requested.load(std::memory_order_acquire)) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(
        std::min<std::chrono::steady_clock::duration>(
            timing::kShutdownPollInterval, deadline - now));
  }
  return true;
}

auto write_pid_file(const std::string& path) -> Result<void> {
  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    log::error("Failed to write pid file: {}", path);
    return fail(Error::FileNotFound);
  }
  out << getpid() << '\n';
  return ok();
}

void remove_pid_file(const std::string& path) {
  if (path.empty()) return;
  if (std::remove(path.c_str()) != 0) {
    log::warn("Failed to remove pid file: {}", path);
  }
}

}  // namespace taskhive
