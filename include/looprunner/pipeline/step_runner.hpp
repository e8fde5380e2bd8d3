#pragma once

#include "looprunner/executor/executor.hpp"
#include "looprunner/git/change_tracker.hpp"
#include "looprunner/pipeline/state_machine.hpp"
#include "looprunner/storage/failure_log.hpp"
#include "looprunner/task/task.hpp"

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace looprunner {

inline constexpr std::string_view kDefaultFixupPrompt =
    "Fix the problems reported by the verification command.";

// Read-only inputs shared by all steps of one run.
struct StepContext {
  const TaskConfig& config;
  const TaskId& task_id;
  const std::vector<std::string>& global_allowlist;
  const std::unordered_set<std::string>& baseline;
};

struct StepReport {
  Event event{Event::ExecutorError};
  // Text for last_error when the step leads to Failed or a fixup.
  std::string detail;
  std::optional<std::string> result;
  // Modified paths outside every allowlist and the baseline.
  std::vector<std::string> unauthorized;
};

// Performs one external step for one file: builds the command, runs it
// through the executor, and diffs the working tree around it.
class StepRunner {
public:
  StepRunner(IExecutor& executor, IChangeTracker& tracker,
             FailureLog* failures);

  [[nodiscard]] auto run(StepKind kind, const FileState& file,
                         const StepContext& ctx) -> StepReport;

private:
  auto run_prompt(const FileState& file, const StepContext& ctx,
                  StepReport& report) -> void;
  auto run_verify(const FileState& file, const StepContext& ctx,
                  StepReport& report) -> void;
  auto run_fixup(const FileState& file, const StepContext& ctx,
                 StepReport& report) -> void;
  auto record(std::string_view file_path, std::string_view message) -> void;

  IExecutor& executor_;
  IChangeTracker& tracker_;
  FailureLog* failures_;
};

// Short failure text for an executor result that did not succeed.
[[nodiscard]] auto describe_failure(const ExecutorResult& r) -> std::string;

}  // namespace looprunner
