#pragma once

#include "looprunner/app/application.hpp"
#include "looprunner/config/system_config.hpp"
#include "looprunner/pipeline/orchestrator.hpp"
#include "looprunner/storage/registry.hpp"
#include "looprunner/task/task.hpp"

#include <atomic>
#include <optional>
#include <string>

namespace looprunner::cli {

struct RunOptions {
  SystemConfig config;
  std::string input_file;
  TaskOverrides overrides;
  bool resume{false};
  // With `resume`: empty means the first incomplete task.
  std::optional<std::string> resume_id;
  bool dry_run{false};
};

struct ListOptions {
  std::string tasks_dir;
};

struct StatusOptions {
  std::string tasks_dir;
  std::string task_id;
  bool json{false};
};

[[nodiscard]] auto cmd_run(const RunOptions& opts,
                           const std::atomic<bool>& shutdown) -> int;
[[nodiscard]] auto cmd_list(const ListOptions& opts) -> int;
[[nodiscard]] auto cmd_status(const StatusOptions& opts) -> int;

// Per-file report of a task as a JSON document.
[[nodiscard]] auto status_json(const RegistryEntry& entry, const Task& task)
    -> std::string;

auto print_report(const RunReport& report) -> void;

}  // namespace looprunner::cli
