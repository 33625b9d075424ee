#pragma once

#include "taskhive/core/error.hpp"

#include <atomic>
#include <chrono>
#include <string>

namespace taskhive {

extern std::atomic<bool> g_shutdown_requested;

[[nodiscard]] auto daemonize() -> bool;
void setup_signal_handlers();
void wait_for_shutdown();

// Returns true when shutdown was requested before the timeout elapsed.
[[nodiscard]] auto wait_for_shutdown_for(std::chrono::milliseconds timeout)
    -> bool;

[[nodiscard]] auto write_pid_file(const std::string& path) -> Result<void>;
void remove_pid_file(const std::string& path);

}  // namespace taskhive
