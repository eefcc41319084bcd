#include "storyloop/cli/commands.hpp"

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <vector>

namespace {

void print_usage(const char* prog) {
  std::println("storyloop - parallel story orchestration over git worktrees");
  std::println("Usage: {} <command> [OPTIONS]", prog);
  std::println("");
  std::println("Planning:");
  std::println("  plan               Show the batch plan");
  std::println("  check-cycles       Report dependency cycles");
  std::println("  batches            List parallel batches");
  std::println("  check-conflicts    Report file-scope conflicts per batch");
  std::println("");
  std::println("Execution:");
  std::println("  run                Execute the plan");
  std::println("  heartbeat          Publish a worker heartbeat");
  std::println("");
  std::println("State:");
  std::println("  health             Classify reporting workers");
  std::println("  retry-stats        Summarize retry decisions");
  std::println("  runs               List recorded runs");
  std::println("  branches           List worker branches and merge locks");
  std::println("  cleanup            Remove stale worker branches and worktrees");
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <file>   YAML config (default: storyloop.yaml)");
  std::println("  -p, --prd <file>      Requirements document (default: prd.json)");
  std::println("  -a, --all             Include stories already passing");
  std::println("  --json                Machine-readable output");
  std::println("  --resume              run: skip stories merged by earlier runs");
  std::println("  -j, --workers <n>     run: override executor.max_workers");
  std::println("  --worker <id>         heartbeat: worker id");
  std::println("  --story <id>          heartbeat: story id");
  std::println("  --iteration <n>       heartbeat: iteration number");
  std::println("  --api-calls <n>       heartbeat: API calls so far");
  std::println("  --pid <pid>           heartbeat: agent pid (default: parent)");
  std::println("  --max-age <hours>     cleanup: idle threshold");
  std::println("  --merged              cleanup: remove branches merged into base");
  std::println("  --dry-run             cleanup: only report");
  std::println("  -v, --version         Show version and exit");
  std::println("  -h, --help            Show this help message");
}

void print_version() {
  std::println("storyloop v0.1.0");
}

struct Options {
  std::string command;
  std::string config_file;
  std::string prd_file{"prd.json"};
  bool all{false};
  bool json{false};
  bool resume{false};
  bool merged{false};
  bool dry_run{false};
  std::optional<int> workers;
  std::string worker_id;
  std::string story_id;
  int iteration{0};
  std::uint64_t api_calls{0};
  std::optional<int> pid;
  std::optional<int> max_age_hours;
};

template <typename T>
auto parse_number(std::string_view flag, std::string_view text) -> T {
  T value{};
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    std::println(stderr, "Error: {} expects a number, got '{}'", flag, text);
    std::exit(1);
  }
  return value;
}

auto parse_args(int argc, char* argv[]) -> Options {
  Options opts;

  auto value_of = [&](int& i, std::string_view flag) -> std::string_view {
    if (++i >= argc) {
      std::println(stderr, "Error: {} requires an argument", flag);
      std::exit(1);
    }
    return argv[i];
  };

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      opts.config_file = value_of(i, arg);
    } else if (arg == "-p" || arg == "--prd") {
      opts.prd_file = value_of(i, arg);
    } else if (arg == "-a" || arg == "--all") {
      opts.all = true;
    } else if (arg == "--json") {
      opts.json = true;
    } else if (arg == "--resume") {
      opts.resume = true;
    } else if (arg == "--merged") {
      opts.merged = true;
    } else if (arg == "--dry-run") {
      opts.dry_run = true;
    } else if (arg == "-j" || arg == "--workers") {
      opts.workers = parse_number<int>(arg, value_of(i, arg));
    } else if (arg == "--worker") {
      opts.worker_id = value_of(i, arg);
    } else if (arg == "--story") {
      opts.story_id = value_of(i, arg);
    } else if (arg == "--iteration") {
      opts.iteration = parse_number<int>(arg, value_of(i, arg));
    } else if (arg == "--api-calls") {
      opts.api_calls = parse_number<std::uint64_t>(arg, value_of(i, arg));
    } else if (arg == "--pid") {
      opts.pid = parse_number<int>(arg, value_of(i, arg));
    } else if (arg == "--max-age") {
      opts.max_age_hours = parse_number<int>(arg, value_of(i, arg));
    } else if (!arg.starts_with('-') && opts.command.empty()) {
      opts.command = arg;
    } else {
      std::println(stderr, "Unknown option: {}", arg);
      print_usage(argv[0]);
      std::exit(1);
    }
  }

  return opts;
}

auto dispatch(const Options& opts, const char* prog) -> int {
  namespace cli = storyloop::cli;

  cli::GraphOptions graph{
      .config_file = opts.config_file,
      .prd_file = opts.prd_file,
      .include_completed = opts.all,
      .json = opts.json,
  };
  cli::StateOptions state{.config_file = opts.config_file, .json = opts.json};

  const auto& cmd = opts.command;
  if (cmd == "plan") {
    return cli::cmd_plan(graph);
  }
  if (cmd == "check-cycles") {
    return cli::cmd_check_cycles(graph);
  }
  if (cmd == "batches") {
    return cli::cmd_batches(graph);
  }
  if (cmd == "check-conflicts") {
    return cli::cmd_check_conflicts(graph);
  }
  if (cmd == "run") {
    return cli::cmd_run(cli::RunOptions{
        .config_file = opts.config_file,
        .prd_file = opts.prd_file,
        .include_completed = opts.all,
        .resume = opts.resume,
        .max_workers = opts.workers,
        .json = opts.json,
    });
  }
  if (cmd == "heartbeat") {
    return cli::cmd_heartbeat(cli::HeartbeatOptions{
        .config_file = opts.config_file,
        .worker_id = opts.worker_id,
        .task_id = opts.story_id,
        .iteration = opts.iteration,
        .api_calls = opts.api_calls,
        .pid = opts.pid,
    });
  }
  if (cmd == "health") {
    return cli::cmd_health(state);
  }
  if (cmd == "retry-stats") {
    return cli::cmd_retry_stats(state);
  }
  if (cmd == "runs") {
    return cli::cmd_runs(state);
  }
  if (cmd == "branches") {
    return cli::cmd_branches(state);
  }
  if (cmd == "cleanup") {
    return cli::cmd_cleanup(cli::CleanupOptions{
        .config_file = opts.config_file,
        .max_age_hours = opts.max_age_hours,
        .dry_run = opts.dry_run,
        .merged = opts.merged,
    });
  }

  if (cmd.empty()) {
    std::println(stderr, "Error: no command given");
  } else {
    std::println(stderr, "Error: unknown command '{}'", cmd);
  }
  print_usage(prog);
  return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);
  return dispatch(opts, argv[0]);
}
