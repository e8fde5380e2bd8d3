#include "looprunner/app/application.hpp"

#include "looprunner/core/constants.hpp"
#include "looprunner/executor/agent_executor.hpp"
#include "looprunner/storage/failure_log.hpp"
#include "looprunner/util/log.hpp"
#include "looprunner/util/util.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <unordered_set>

namespace looprunner {

auto TaskOverrides::apply_to(TaskConfig& config) const -> bool {
  auto before = config;
  if (prompt) {
    config.prompt = *prompt;
  }
  if (fixup_prompt) {
    config.fixup_prompt = *fixup_prompt;
  }
  if (verify_command) {
    config.verify_command = *verify_command;
  }
  if (allowlist) {
    config.allowlist_pattern = *allowlist;
  }
  if (concurrency) {
    config.concurrency = *concurrency;
  }
  if (max_files) {
    config.max_files = *max_files;
  }
  if (max_retries) {
    config.max_retries = *max_retries;
  }
  return config != before;
}

auto parse_input_mapping(std::string_view json) -> Result<InputMapping> {
  std::unordered_set<std::string> seen;
  std::optional<std::string> duplicate;

  // Top-level keys arrive at depth 1; a duplicate would silently replace the
  // earlier value in the DOM.
  auto on_event = [&](int depth, nlohmann::ordered_json::parse_event_t event,
                      nlohmann::ordered_json& parsed) {
    if (event == nlohmann::ordered_json::parse_event_t::key && depth == 1) {
      auto key = parsed.get<std::string>();
      if (!seen.insert(key).second && !duplicate) {
        duplicate = std::move(key);
      }
    }
    return true;
  };

  nlohmann::ordered_json doc;
  try {
    doc = nlohmann::ordered_json::parse(json.begin(), json.end(), on_event);
  } catch (const nlohmann::json::exception& e) {
    log::error("Invalid input mapping: {}", e.what());
    return fail(Error::ParseError);
  }

  if (!doc.is_object()) {
    log::error("Input mapping must be a JSON object of path -> metadata");
    return fail(Error::InvalidArgument);
  }
  if (duplicate) {
    log::error("Duplicate path in input mapping: {}", *duplicate);
    return fail(Error::InvalidArgument);
  }

  InputMapping mapping;
  mapping.reserve(doc.size());
  for (const auto& [path, metadata] : doc.items()) {
    if (path.empty()) {
      log::error("Input mapping contains an empty path");
      return fail(Error::InvalidArgument);
    }
    mapping.emplace_back(path, metadata.dump());
  }
  return mapping;
}

auto load_input_mapping(const std::filesystem::path& path)
    -> Result<InputMapping> {
  std::ifstream file(path);
  if (!file) {
    log::error("Input file not found: {}", path.string());
    return fail(Error::FileNotFound);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse_input_mapping(buffer.str());
}

Application::Application(SystemConfig config)
    : config_(std::move(config)), registry_(config_.storage.tasks_dir) {
}

Application::~Application() = default;

auto Application::open() -> Result<void> {
  if (auto r = registry_.open(); !r) {
    log::error("Cannot open task registry in {}: {}",
               config_.storage.tasks_dir, r.error().message());
    return r;
  }
  return ok();
}

auto Application::set_collaborators(std::unique_ptr<IExecutor> executor,
                                    std::unique_ptr<IChangeTracker> tracker)
    -> void {
  executor_override_ = std::move(executor);
  tracker_override_ = std::move(tracker);
}

auto Application::make_task_config(const std::string& input_file,
                                   const TaskOverrides& overrides) const
    -> Result<TaskConfig> {
  TaskConfig config;
  config.allowlist_pattern = config_.defaults.allowlist;
  config.concurrency = config_.defaults.concurrency;
  config.max_retries = config_.defaults.max_retries;
  overrides.apply_to(config);

  config.input_file = input_file;
  std::error_code ec;
  auto dir = std::filesystem::absolute(config_.working_dir, ec);
  config.working_dir =
      ec ? config_.working_dir : dir.lexically_normal().string();
  config.description = shorten(config.prompt, limits::kDescriptionChars);

  if (config.prompt.empty()) {
    log::error("A prompt is required to create a task");
    return fail(Error::InvalidArgument);
  }
  if (auto r = config.validate(); !r) {
    log::error("Invalid task settings: concurrency and max files must be at "
               "least 1, max retries at least 0");
    return std::unexpected(r.error());
  }
  return config;
}

auto Application::create_task(const std::string& input_file,
                              const TaskOverrides& overrides)
    -> Result<LoadedTask> {
  if (input_file.empty()) {
    log::error("An input file is required to create a task");
    return fail(Error::InvalidArgument);
  }
  auto config = make_task_config(input_file, overrides);
  if (!config) {
    return std::unexpected(config.error());
  }
  auto mapping = load_input_mapping(input_file);
  if (!mapping) {
    return std::unexpected(mapping.error());
  }

  auto seq = registry_.next_sequence();
  if (!seq) {
    return std::unexpected(seq.error());
  }

  Task task(make_task_id(*seq), std::move(*config));
  for (auto& [path, metadata] : *mapping) {
    if (auto r = task.add_file(std::move(path), std::move(metadata)); !r) {
      return std::unexpected(r.error());
    }
  }

  RegistryEntry entry{
      .seq = *seq,
      .task_id = task.id(),
      .state_file = TaskRegistry::state_file_name(*seq),
      .status = RegistryStatus::Incomplete,
      .description = task.config().description,
      .working_dir = task.config().working_dir,
      .created_at = task.created_at(),
      .updated_at = task.updated_at(),
  };

  auto store = std::make_unique<TaskStore>(registry_.state_path(entry));
  if (auto r = store->create(task); !r) {
    log::error("Failed to write state file for {}: {}", task.id(),
               r.error().message());
    return std::unexpected(r.error());
  }
  if (auto r = registry_.append(entry); !r) {
    log::error("Failed to register {}: {}", task.id(), r.error().message());
    return std::unexpected(r.error());
  }

  log::info("Created {} with {} file(s) from {} ({})", task.id(), task.size(),
            input_file, entry.state_file);
  return LoadedTask{
      .entry = std::move(entry),
      .task = std::move(task),
      .store = std::move(store),
  };
}

auto Application::load_task(const std::optional<TaskId>& id,
                            const TaskOverrides& overrides)
    -> Result<LoadedTask> {
  ResumeLoader loader(registry_);
  auto loaded = loader.load(id);
  if (!loaded) {
    return loaded;
  }

  auto config = loaded->task.config();
  if (!overrides.apply_to(config)) {
    return loaded;
  }
  if (auto r = config.validate(); !r) {
    log::error("Invalid settings for resumed task {}", loaded->task.id());
    return std::unexpected(r.error());
  }
  for (const auto& f : loaded->task.files()) {
    if (f.retry_count > config.max_retries) {
      log::error("{} already used {} retries; max retries cannot drop to {}",
                 f.path, f.retry_count, config.max_retries);
      return fail(Error::InvalidArgument);
    }
  }

  auto now = now_ms();
  if (auto r = loaded->store->save_config(config, now); !r) {
    log::error("Failed to persist new settings for {}: {}", loaded->task.id(),
               r.error().message());
    return fail(Error::PersistenceFailed);
  }
  loaded->task.set_config(std::move(config));
  loaded->task.set_updated_at(now);
  log::info("Applied new settings to {}", loaded->task.id());
  return loaded;
}

auto Application::select_tracker(const TaskConfig& config)
    -> std::unique_ptr<IChangeTracker> {
  const auto& git = config_.git;
  if (!git.enabled && !git.auto_branch && !git.auto_commit) {
    return create_null_tracker();
  }
  if (!is_git_repository(config.working_dir)) {
    log::warn("{} is not a git repository; change tracking disabled",
              config.working_dir);
    return create_null_tracker();
  }
  return create_git_tracker(GitTrackerConfig{.working_dir = config.working_dir});
}

auto Application::ensure_branch(LoadedTask& loaded, IChangeTracker& tracker)
    -> void {
  if (!config_.git.auto_branch || loaded.task.config().branch) {
    return;
  }
  auto branch = tracker.create_branch(loaded.task.id().value());
  if (!branch) {
    log::warn("Could not create a branch for {}: {}; continuing on the "
              "current branch",
              loaded.task.id(), branch.error().message());
    return;
  }

  auto config = loaded.task.config();
  config.branch = *branch;
  auto now = now_ms();
  if (auto r = loaded.store->save_config(config, now); !r) {
    log::warn("Branch {} created but not recorded: {}", *branch,
              r.error().message());
    return;
  }
  loaded.task.set_config(std::move(config));
  loaded.task.set_updated_at(now);
  log::info("Working on branch {}", *branch);
}

auto Application::execute(LoadedTask& loaded,
                          const std::atomic<bool>& shutdown)
    -> Result<RunReport> {
  const auto& config = loaded.task.config();

  std::unique_ptr<IChangeTracker> own_tracker;
  IChangeTracker* tracker = tracker_override_.get();
  if (tracker == nullptr) {
    own_tracker = select_tracker(config);
    tracker = own_tracker.get();
  }

  std::unique_ptr<IExecutor> own_executor;
  IExecutor* executor = executor_override_.get();
  if (executor == nullptr) {
    own_executor = create_agent_executor(
        make_agent_executor_config(config_.agent, config.working_dir));
    executor = own_executor.get();
  }

  ensure_branch(loaded, *tracker);

  FailureLog failures(registry_.tasks_dir() / "failures" /
                      loaded.task.id().str());

  TaskOrchestrator orchestrator(
      loaded.task, *loaded.store, &registry_, *executor, *tracker, &failures,
      OrchestratorOptions{
          .auto_commit = config_.git.auto_commit,
          .commit_message = config_.git.commit_message,
      });
  return orchestrator.run(shutdown);
}

}  // namespace looprunner
