#include "looprunner/cli/commands.hpp"
#include "looprunner/config/config.hpp"
#include "looprunner/util/log.hpp"

#include <atomic>
#include <charconv>
#include <csignal>
#include <cstdlib>
#include <format>
#include <optional>
#include <print>
#include <string>
#include <string_view>

namespace {

std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int) {
  g_shutdown_requested.store(true, std::memory_order_release);
}

void print_usage(const char* prog) {
  std::println("looprunner - run an agent over many files with verification "
               "and resume");
  std::println("Usage: {} [OPTIONS]", prog);
  std::println("");
  std::println("Task:");
  std::println("  -i, --input <file>          JSON object of path -> metadata");
  std::println("  -p, --prompt <text>         Prompt sent for each file");
  std::println("  -f, --fixup <text>          Prompt sent after a failed "
               "verification");
  std::println("  -v, --verify <cmd>          Verification command "
               "(placeholders allowed)");
  std::println("  -a, --allowlist <pattern>   Paths a file may touch "
               "(default: {{file_stem}}*)");
  std::println("  -c, --concurrency <n>       Parallel workers (default: 5)");
  std::println("  -n, --max-files <n>         Process at most n files this run");
  std::println("  -r, --max-retries <n>       Fixup attempts per file "
               "(default: 3)");
  std::println("      --working-dir <dir>     Directory the agent runs in");
  std::println("");
  std::println("Modes:");
  std::println("      --resume [task_id]      Resume a task (default: first "
               "incomplete)");
  std::println("      --dry-run               Create the task without running it");
  std::println("      --list                  List tasks");
  std::println("      --status <task_id>      Show per-file status");
  std::println("      --json                  With --status: print JSON");
  std::println("");
  std::println("Settings:");
  std::println("      --config <file>         YAML configuration file");
  std::println("      --tasks-dir <dir>       Task storage "
               "(default: ./looprunner-tasks)");
  std::println("      --log-level <level>     trace|debug|info|warn|error");
  std::println("      --git                   Track changes with git");
  std::println("      --git-branch            Create a branch per task");
  std::println("      --git-commit            Commit each completed file");
  std::println("      --git-commit-message <text>");
  std::println("      --print-config          Print the effective configuration");
  std::println("  -h, --help                  Show this help message");
  std::println("      --version               Show version and exit");
}

void print_version() {
  std::println("looprunner v0.1.0");
}

struct Options {
  std::string config_file;
  std::optional<std::string> tasks_dir;
  std::optional<std::string> working_dir;
  std::optional<std::string> log_level;
  std::optional<std::string> git_commit_message;
  bool git{false};
  bool git_branch{false};
  bool git_commit{false};

  std::string input_file;
  looprunner::TaskOverrides overrides;
  bool resume{false};
  std::optional<std::string> resume_id;
  bool dry_run{false};

  bool list{false};
  std::string status_id;
  bool json{false};
  bool print_config{false};
};

[[noreturn]] void usage_error(std::string_view message) {
  std::println(stderr, "Error: {}", message);
  std::exit(1);
}

auto require_value(int& i, int argc, char* argv[], std::string_view flag)
    -> std::string {
  if (++i >= argc) {
    usage_error(std::format("{} requires an argument", flag));
  }
  return argv[i];
}

auto require_int(int& i, int argc, char* argv[], std::string_view flag)
    -> int {
  auto text = require_value(i, argc, argv, flag);
  int value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(),
                                   value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    usage_error(std::format("{} expects an integer, got '{}'", flag, text));
  }
  return value;
}

auto parse_args(int argc, char* argv[]) -> Options {
  Options opts;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-i" || arg == "--input") {
      opts.input_file = require_value(i, argc, argv, arg);
    } else if (arg == "-p" || arg == "--prompt") {
      opts.overrides.prompt = require_value(i, argc, argv, arg);
    } else if (arg == "-f" || arg == "--fixup") {
      opts.overrides.fixup_prompt = require_value(i, argc, argv, arg);
    } else if (arg == "-v" || arg == "--verify") {
      opts.overrides.verify_command = require_value(i, argc, argv, arg);
    } else if (arg == "-a" || arg == "--allowlist") {
      opts.overrides.allowlist = require_value(i, argc, argv, arg);
    } else if (arg == "-c" || arg == "--concurrency") {
      opts.overrides.concurrency = require_int(i, argc, argv, arg);
    } else if (arg == "-n" || arg == "--max-files") {
      opts.overrides.max_files = require_int(i, argc, argv, arg);
    } else if (arg == "-r" || arg == "--max-retries") {
      opts.overrides.max_retries = require_int(i, argc, argv, arg);
    } else if (arg == "--working-dir") {
      opts.working_dir = require_value(i, argc, argv, arg);
    } else if (arg == "--resume") {
      opts.resume = true;
      if (i + 1 < argc && argv[i + 1][0] != '-') {
        opts.resume_id = argv[++i];
      }
    } else if (arg == "--dry-run") {
      opts.dry_run = true;
    } else if (arg == "--list") {
      opts.list = true;
    } else if (arg == "--status") {
      opts.status_id = require_value(i, argc, argv, arg);
    } else if (arg == "--json") {
      opts.json = true;
    } else if (arg == "--config") {
      opts.config_file = require_value(i, argc, argv, arg);
    } else if (arg == "--tasks-dir") {
      opts.tasks_dir = require_value(i, argc, argv, arg);
    } else if (arg == "--log-level") {
      opts.log_level = require_value(i, argc, argv, arg);
    } else if (arg == "--git") {
      opts.git = true;
    } else if (arg == "--git-branch") {
      opts.git_branch = true;
    } else if (arg == "--git-commit") {
      opts.git_commit = true;
    } else if (arg == "--git-commit-message") {
      opts.git_commit_message = require_value(i, argc, argv, arg);
    } else if (arg == "--print-config") {
      opts.print_config = true;
    } else {
      std::println(stderr, "Unknown option: {}", arg);
      print_usage(argv[0]);
      std::exit(1);
    }
  }

  return opts;
}

auto build_config(const Options& opts)
    -> looprunner::Result<looprunner::SystemConfig> {
  looprunner::SystemConfig config;
  if (!opts.config_file.empty()) {
    auto loaded = looprunner::ConfigLoader::load_from_file(opts.config_file);
    if (!loaded) {
      return loaded;
    }
    config = std::move(*loaded);
  }

  if (opts.tasks_dir) {
    config.storage.tasks_dir = *opts.tasks_dir;
  }
  if (opts.working_dir) {
    config.working_dir = *opts.working_dir;
  }
  if (opts.log_level) {
    config.logging.level = *opts.log_level;
  }
  if (opts.git) {
    config.git.enabled = true;
  }
  if (opts.git_branch) {
    config.git.auto_branch = true;
  }
  if (opts.git_commit) {
    config.git.auto_commit = true;
  }
  if (opts.git_commit_message) {
    config.git.commit_message = *opts.git_commit_message;
  }
  return config;
}

void setup_logging(const looprunner::LoggingConfig& logging) {
  looprunner::log::set_level(logging.level);
  if (!logging.file.empty() && !looprunner::log::set_file(logging.file)) {
    std::println(stderr, "Warning: cannot open log file {}", logging.file);
  }
  looprunner::log::start();
}

auto run(const Options& opts, const looprunner::SystemConfig& config) -> int {
  namespace cli = looprunner::cli;

  if (opts.list) {
    return cli::cmd_list(cli::ListOptions{.tasks_dir = config.storage.tasks_dir});
  }
  if (!opts.status_id.empty()) {
    return cli::cmd_status(cli::StatusOptions{
        .tasks_dir = config.storage.tasks_dir,
        .task_id = opts.status_id,
        .json = opts.json,
    });
  }

  if (!opts.resume && (opts.input_file.empty() || !opts.overrides.prompt)) {
    std::println(stderr, "Error: --input and --prompt are required for a new "
                         "task (or use --resume)");
    return 1;
  }

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto code = cli::cmd_run(
      cli::RunOptions{
          .config = config,
          .input_file = opts.input_file,
          .overrides = opts.overrides,
          .resume = opts.resume,
          .resume_id = opts.resume_id,
          .dry_run = opts.dry_run,
      },
      g_shutdown_requested);

  if (g_shutdown_requested.load(std::memory_order_acquire)) {
    looprunner::log::info("Stopped on signal; state saved");
  }
  return code;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);

  auto config = build_config(opts);
  if (!config) {
    std::println(stderr, "Error: Failed to load config: {}",
                 config.error().message());
    return 1;
  }

  if (opts.print_config) {
    std::print("{}", looprunner::ConfigLoader::to_string(*config));
    return 0;
  }

  setup_logging(config->logging);
  auto code = run(opts, *config);
  looprunner::log::stop();
  return code;
}
