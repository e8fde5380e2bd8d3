#include "looprunner/storage/resume_loader.hpp"

#include "looprunner/task/state_strings.hpp"
#include "looprunner/util/log.hpp"

namespace looprunner {

ResumeLoader::ResumeLoader(TaskRegistry& registry) : registry_(registry) {
}

auto ResumeLoader::load(const std::optional<TaskId>& id)
    -> Result<LoadedTask> {
  auto entry = id ? registry_.find(*id) : registry_.first_incomplete();
  if (!entry) {
    if (id) {
      log::error("Task {} not found in {}", *id,
                 registry_.tasks_dir().string());
    } else {
      log::error("No incomplete tasks in {}", registry_.tasks_dir().string());
    }
    return std::unexpected(entry.error());
  }

  auto store = std::make_unique<TaskStore>(registry_.state_path(*entry));
  if (auto r = store->open_existing(); !r) {
    log::error("State file for {} is missing or damaged", entry->task_id);
    return fail(Error::ResumeInconsistency);
  }

  auto task = store->load();
  if (!task) {
    log::error("Failed to read state of {}: {}", entry->task_id,
               task.error().message());
    return fail(Error::ResumeInconsistency);
  }
  if (task->id() != entry->task_id) {
    log::error("State file {} belongs to {}, registry says {}",
               entry->state_file, task->id(), entry->task_id);
    return fail(Error::ResumeInconsistency);
  }

  auto summary = task->summary();
  log::info("Loaded {}: {} file(s), {} completed, {} failed, {} in flight, "
            "{} pending, {} awaiting verification",
            entry->task_id, summary.total, summary.completed, summary.failed,
            summary.in_progress, summary.pending,
            summary.awaiting_verification);
  if (summary.in_progress > 0) {
    log::info("{} file(s) were interrupted mid-step and will be restarted",
              summary.in_progress);
  }

  return LoadedTask{
      .entry = std::move(*entry),
      .task = std::move(*task),
      .store = std::move(store),
  };
}

}  // namespace looprunner
