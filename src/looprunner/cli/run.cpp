#include "looprunner/app/application.hpp"
#include "looprunner/cli/commands.hpp"
#include "looprunner/task/state_strings.hpp"
#include "looprunner/util/log.hpp"

#include <print>

namespace looprunner::cli {

auto print_report(const RunReport& report) -> void {
  const auto& s = report.summary;
  std::println("");
  std::println("Task {}: {}", report.task_id,
               report.done ? "finished"
                           : (report.interrupted ? "interrupted" : "stopped"));
  std::println("  total {}  completed {}  failed {}  pending {}  "
               "awaiting verification {}  in progress {}",
               s.total, s.completed, s.failed, s.pending,
               s.awaiting_verification, s.in_progress);
  for (const auto& f : report.files) {
    if (f.status != FileStatus::Failed) {
      continue;
    }
    std::println("  FAILED {}: {}", f.path, f.last_error.value_or("-"));
  }
  for (const auto& c : report.commits) {
    std::println("  commit {}", c);
  }
  if (!report.done) {
    std::println("Resume with: looprunner --resume {}", report.task_id);
  }
}

auto cmd_run(const RunOptions& opts, const std::atomic<bool>& shutdown)
    -> int {
  Application app(opts.config);
  if (auto r = app.open(); !r) {
    std::println(stderr, "Error: {}", r.error().message());
    return 1;
  }

  auto loaded = [&]() -> Result<LoadedTask> {
    if (opts.resume) {
      std::optional<TaskId> id;
      if (opts.resume_id && !opts.resume_id->empty()) {
        id = TaskId{*opts.resume_id};
      }
      return app.load_task(id, opts.overrides);
    }
    return app.create_task(opts.input_file, opts.overrides);
  }();
  if (!loaded) {
    std::println(stderr, "Error: {}", loaded.error().message());
    return 1;
  }

  if (opts.dry_run) {
    auto s = loaded->task.summary();
    log::info("Dry run: {} written to {} ({} file(s), {} pending, concurrency "
              "{}); not executed",
              loaded->task.id(), loaded->entry.state_file, s.total, s.pending,
              loaded->task.config().concurrency);
    std::println("To run this task: looprunner --resume {}",
                 loaded->task.id());
    return 0;
  }

  auto report = app.execute(*loaded, shutdown);
  if (!report) {
    std::println(stderr, "Error: {} ({} is resumable)",
                 report.error().message(), loaded->task.id());
    return 1;
  }
  print_report(*report);
  return 0;
}

}  // namespace looprunner::cli
