#include "taskhive/cli/commands.hpp"

#include <cstdlib>
#include <exception>
#include <format>
#include <print>
#include <string>
#include <string_view>
#include <vector>

namespace {

using namespace taskhive::cli;

void print_usage(const char* prog) {
  std::println("taskhive - Resource-aware task manager");
  std::println("Usage: {} <command> [OPTIONS]", prog);
  std::println("");
  std::println("Commands:");
  std::println("  start                 Run the supervisor and worker pool");
  std::println("  dashboard             Print a one-shot dashboard");
  std::println("  example               Run the demo automation mix");
  std::println("  status <task-id>      Show the stored state of a task");
  std::println("  submit <name> <fn>    Queue a task for a running supervisor");
  std::println("  cancel <task-id>      Remove a task that has not started");
  std::println("");
  std::println("Common options:");
  std::println("  -c, --config <file>   YAML config file");
  std::println("  --db <file>           Task database (default: taskhive.db)");
  std::println(
      "  --queue-db <file>     Queue database (default: taskhive_queue.db)");
  std::println("  --log-level <level>   trace, debug, info, warn, error");
  std::println("");
  std::println("start:      -d, --daemon   -w, --workers <n>");
  std::println("dashboard:  --json");
  std::println("example:    --cycles <n>   --interval <sec>");
  std::println("submit:     -p, --priority <critical|high|medium|low|batch>");
  std::println("            --args <json-array>   --kwargs <json-object>");
  std::println("            --max-retries <n>     --timeout <sec>");
  std::println("  -v, --version         Show version and exit");
  std::println("  -h, --help            Show this help message");
}

void print_version() {
  std::println("taskhive v0.1.0");
}

[[noreturn]] void usage_error(const char* prog, std::string_view message) {
  std::println(stderr, "Error: {}", message);
  print_usage(prog);
  std::exit(1);
}

auto parse_int(const char* prog, std::string_view flag, const char* value)
    -> int {
  try {
    std::size_t used = 0;
    int n = std::stoi(value, &used);
    if (used == std::string_view(value).size()) {
      return n;
    }
  } catch (const std::exception&) {
  }
  usage_error(prog, std::format("{} expects an integer, got '{}'", flag, value));
}

// Walks argv after the command name. Options every command accepts are
// consumed here; the rest go to `extra`, which returns false for unknown ones.
template <typename Extra>
void parse_options(int argc, char* argv[], int first, CommonOptions& common,
                   std::vector<std::string>& positional, Extra&& extra) {
  for (int i = first; i < argc; ++i) {
    std::string_view arg = argv[i];
    auto next = [&]() -> const char* {
      if (++i >= argc) {
        usage_error(argv[0], std::format("{} requires an argument", arg));
      }
      return argv[i];
    };

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      common.config_file = next();
    } else if (arg == "--db") {
      common.db_file = next();
    } else if (arg == "--queue-db") {
      common.queue_db = next();
    } else if (arg == "--log-level") {
      common.log_level = next();
    } else if (extra(arg, next)) {
      continue;
    } else if (!arg.starts_with("-")) {
      positional.emplace_back(arg);
    } else {
      usage_error(argv[0], std::format("Unknown option: {}", arg));
    }
  }
}

auto run_start(int argc, char* argv[]) -> int {
  StartOptions opts;
  std::vector<std::string> positional;
  parse_options(argc, argv, 2, opts.common, positional,
                [&](std::string_view arg, auto& next) {
                  if (arg == "-d" || arg == "--daemon") {
                    opts.daemon = true;
                  } else if (arg == "-w" || arg == "--workers") {
                    opts.workers = parse_int(argv[0], arg, next());
                  } else {
                    return false;
                  }
                  return true;
                });
  if (!positional.empty()) {
    usage_error(argv[0], "start takes no positional arguments");
  }
  return cmd_start(opts);
}

auto run_dashboard(int argc, char* argv[]) -> int {
  DashboardOptions opts;
  std::vector<std::string> positional;
  parse_options(argc, argv, 2, opts.common, positional,
                [&](std::string_view arg, auto&) {
                  if (arg == "--json") {
                    opts.json = true;
                    return true;
                  }
                  return false;
                });
  return cmd_dashboard(opts);
}

auto run_example(int argc, char* argv[]) -> int {
  ExampleOptions opts;
  std::vector<std::string> positional;
  parse_options(argc, argv, 2, opts.common, positional,
                [&](std::string_view arg, auto& next) {
                  if (arg == "--cycles") {
                    opts.cycles = parse_int(argv[0], arg, next());
                  } else if (arg == "--interval") {
                    opts.cycle_interval_sec = parse_int(argv[0], arg, next());
                  } else {
                    return false;
                  }
                  return true;
                });
  return cmd_example(opts);
}

auto run_status(int argc, char* argv[]) -> int {
  StatusOptions opts;
  std::vector<std::string> positional;
  parse_options(argc, argv, 2, opts.common, positional,
                [](std::string_view, auto&) { return false; });
  if (positional.size() != 1) {
    usage_error(argv[0], "status requires exactly one task id");
  }
  opts.task_id = positional[0];
  return cmd_status(opts);
}

auto run_submit(int argc, char* argv[]) -> int {
  SubmitTaskOptions opts;
  std::vector<std::string> positional;
  parse_options(argc, argv, 2, opts.common, positional,
                [&](std::string_view arg, auto& next) {
                  if (arg == "-p" || arg == "--priority") {
                    opts.priority = next();
                  } else if (arg == "--args") {
                    opts.args_json = next();
                  } else if (arg == "--kwargs") {
                    opts.kwargs_json = next();
                  } else if (arg == "--max-retries") {
                    opts.max_retries = parse_int(argv[0], arg, next());
                  } else if (arg == "--timeout") {
                    opts.timeout_sec = parse_int(argv[0], arg, next());
                  } else {
                    return false;
                  }
                  return true;
                });
  if (positional.size() != 2) {
    usage_error(argv[0], "submit requires <name> <function>");
  }
  opts.name = positional[0];
  opts.function = positional[1];
  return cmd_submit(opts);
}

auto run_cancel(int argc, char* argv[]) -> int {
  CancelOptions opts;
  std::vector<std::string> positional;
  parse_options(argc, argv, 2, opts.common, positional,
                [](std::string_view, auto&) { return false; });
  if (positional.size() != 1) {
    usage_error(argv[0], "cancel requires exactly one task id");
  }
  opts.task_id = positional[0];
  return cmd_cancel(opts);
}

// Not listed in the usage text; the supervisor runs it for process workers.
auto run_worker(int argc, char* argv[]) -> int {
  WorkerProcessOptions opts;
  std::vector<std::string> positional;
  parse_options(argc, argv, 2, opts.common, positional,
                [&](std::string_view arg, auto& next) {
                  if (arg == "--id") {
                    opts.worker_id = next();
                  } else if (arg == "--config-yaml") {
                    opts.config_yaml = next();
                  } else {
                    return false;
                  }
                  return true;
                });
  if (opts.worker_id.empty() || !positional.empty()) {
    usage_error(argv[0], "worker requires --id <worker-id>");
  }
  return cmd_worker(opts);
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage(argv[0]);
    return 1;
  }

  std::string_view command = argv[1];
  if (command == "-h" || command == "--help") {
    print_usage(argv[0]);
    return 0;
  }
  if (command == "-v" || command == "--version") {
    print_version();
    return 0;
  }

  if (command == "start") {
    return run_start(argc, argv);
  }
  if (command == "dashboard") {
    return run_dashboard(argc, argv);
  }
  if (command == "example") {
    return run_example(argc, argv);
  }
  if (command == "status") {
    return run_status(argc, argv);
  }
  if (command == "submit") {
    return run_submit(argc, argv);
  }
  if (command == "cancel") {
    return run_cancel(argc, argv);
  }
  if (command == "worker") {
    return run_worker(argc, argv);
  }

  usage_error(argv[0], std::format("Unknown command: {}", command));
}
