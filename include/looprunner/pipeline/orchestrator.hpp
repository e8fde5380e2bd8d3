#pragma once

#include "looprunner/core/error.hpp"
#include "looprunner/executor/executor.hpp"
#include "looprunner/git/change_tracker.hpp"
#include "looprunner/pipeline/step_runner.hpp"
#include "looprunner/pipeline/worker_pool.hpp"
#include "looprunner/storage/failure_log.hpp"
#include "looprunner/storage/registry.hpp"
#include "looprunner/storage/task_store.hpp"
#include "looprunner/task/task.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace looprunner {

struct OrchestratorOptions {
  bool auto_commit{false};
  std::string commit_message{"looprunner: {file_name}"};
  // Called after each persisted state change, under the apply lock.
  std::function<void(const FileState&)> on_transition;
};

struct RunReport {
  TaskId task_id;
  TaskSummary summary;
  std::vector<FileState> files;
  // Files this run moved to Completed or Failed.
  std::size_t finished_this_run{0};
  bool done{false};
  bool interrupted{false};
  std::size_t max_concurrency_observed{0};
  std::vector<std::string> commits;
};

// Drives one task to completion (or until shutdown) with a bounded worker
// pool. The orchestrator is the only writer of the task: every state change
// goes through apply(), which persists and then updates memory.
class TaskOrchestrator {
public:
  TaskOrchestrator(Task& task, TaskStore& store, TaskRegistry* registry,
                   IExecutor& executor, IChangeTracker& tracker,
                   FailureLog* failures, OrchestratorOptions options = {});

  TaskOrchestrator(const TaskOrchestrator&) = delete;
  TaskOrchestrator& operator=(const TaskOrchestrator&) = delete;

  // Returns PersistenceFailed if any write failed; the task is then flushed
  // best-effort and left resumable.
  [[nodiscard]] auto run(const std::atomic<bool>& shutdown)
      -> Result<RunReport>;

private:
  [[nodiscard]] auto drive(std::size_t worker_id, std::size_t index)
      -> Disposition;
  [[nodiscard]] auto apply(std::size_t worker_id, const FileState& next,
                           bool claim = false) -> bool;
  [[nodiscard]] auto snapshot(std::size_t index) -> FileState;
  [[nodiscard]] auto stopping() const -> bool;

  [[nodiscard]] auto schedule() const -> std::vector<std::size_t>;
  auto build_global_allowlist(const std::vector<std::size_t>& scheduled)
      -> void;
  auto commit_completed(RunReport& report) -> void;

  Task& task_;
  TaskStore& store_;
  TaskRegistry* registry_;
  IChangeTracker& tracker_;
  FailureLog* failures_;
  OrchestratorOptions options_;
  StepRunner runner_;

  std::mutex mu_;
  std::atomic<bool> halted_{false};
  WorkerPool* pool_{nullptr};

  std::unordered_set<std::string> baseline_;
  std::vector<std::string> global_allowlist_;
  std::vector<std::string> completed_this_run_;
  std::size_t finished_this_run_{0};
};

}  // namespace looprunner
