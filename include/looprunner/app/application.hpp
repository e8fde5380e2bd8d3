#pragma once

#include "looprunner/config/system_config.hpp"
#include "looprunner/core/error.hpp"
#include "looprunner/executor/executor.hpp"
#include "looprunner/git/change_tracker.hpp"
#include "looprunner/pipeline/orchestrator.hpp"
#include "looprunner/storage/registry.hpp"
#include "looprunner/storage/resume_loader.hpp"
#include "looprunner/task/task.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace looprunner {

// Task settings given on the command line. Unset fields keep the configured
// default (new task) or the persisted value (resume).
struct TaskOverrides {
  std::optional<std::string> prompt;
  std::optional<std::string> fixup_prompt;
  std::optional<std::string> verify_command;
  std::optional<std::string> allowlist;
  std::optional<int> concurrency;
  std::optional<int> max_files;
  std::optional<int> max_retries;

  // Applies every set field to `config`; true if anything changed.
  auto apply_to(TaskConfig& config) const -> bool;
};

// (path, metadata JSON) in input order.
using InputMapping = std::vector<std::pair<std::string, std::string>>;

// Parses `{ "<path>": <metadata>, ... }`. Duplicate paths are InvalidArgument.
[[nodiscard]] auto parse_input_mapping(std::string_view json)
    -> Result<InputMapping>;
[[nodiscard]] auto load_input_mapping(const std::filesystem::path& path)
    -> Result<InputMapping>;

// Application facade: owns the registry and the external collaborators and
// wires them into an orchestrator for one task at a time.
class Application {
public:
  explicit Application(SystemConfig config);
  ~Application();

  Application(const Application&) = delete;
  auto operator=(const Application&) -> Application& = delete;

  [[nodiscard]] auto config() const noexcept -> const SystemConfig& {
    return config_;
  }

  // Opens (creating if needed) the tasks directory and its registry.
  [[nodiscard]] auto open() -> Result<void>;
  [[nodiscard]] auto registry() noexcept -> TaskRegistry& { return registry_; }

  // Writes the state file with every file Pending, then appends the registry
  // entry. Nothing runs.
  [[nodiscard]] auto create_task(const std::string& input_file,
                                 const TaskOverrides& overrides)
      -> Result<LoadedTask>;

  // Loads a task for resume. Overrides are persisted before returning.
  [[nodiscard]] auto load_task(const std::optional<TaskId>& id,
                               const TaskOverrides& overrides)
      -> Result<LoadedTask>;

  [[nodiscard]] auto execute(LoadedTask& loaded,
                             const std::atomic<bool>& shutdown)
      -> Result<RunReport>;

  // Replaces the agent executor and the change tracker. Either may be null to
  // keep the default for that role.
  auto set_collaborators(std::unique_ptr<IExecutor> executor,
                         std::unique_ptr<IChangeTracker> tracker) -> void;

private:
  [[nodiscard]] auto make_task_config(const std::string& input_file,
                                      const TaskOverrides& overrides) const
      -> Result<TaskConfig>;
  [[nodiscard]] auto select_tracker(const TaskConfig& config)
      -> std::unique_ptr<IChangeTracker>;
  auto ensure_branch(LoadedTask& loaded, IChangeTracker& tracker) -> void;

  SystemConfig config_;
  TaskRegistry registry_;
  std::unique_ptr<IExecutor> executor_override_;
  std::unique_ptr<IChangeTracker> tracker_override_;
};

}  // namespace looprunner
