#pragma once

#include "looprunner/core/error.hpp"
#include "looprunner/storage/registry.hpp"
#include "looprunner/storage/task_store.hpp"
#include "looprunner/task/task.hpp"

#include <memory>
#include <optional>

namespace looprunner {

struct LoadedTask {
  RegistryEntry entry;
  Task task;
  std::unique_ptr<TaskStore> store;
};

// Rebuilds a task from its registry entry and state file, before any worker
// starts. Nothing is modified on disk.
class ResumeLoader {
public:
  explicit ResumeLoader(TaskRegistry& registry);

  // `id` empty: the first incomplete entry in registry order.
  [[nodiscard]] auto load(const std::optional<TaskId>& id)
      -> Result<LoadedTask>;

private:
  TaskRegistry& registry_;
};

}  // namespace looprunner
