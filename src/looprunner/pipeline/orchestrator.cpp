#include "looprunner/pipeline/orchestrator.hpp"

#include "looprunner/core/constants.hpp"
#include "looprunner/pipeline/change_guard.hpp"
#include "looprunner/pipeline/state_machine.hpp"
#include "looprunner/task/state_strings.hpp"
#include "looprunner/util/log.hpp"
#include "looprunner/util/pattern.hpp"
#include "looprunner/util/util.hpp"

#include <algorithm>
#include <format>

namespace looprunner {

TaskOrchestrator::TaskOrchestrator(Task& task, TaskStore& store,
                                   TaskRegistry* registry, IExecutor& executor,
                                   IChangeTracker& tracker,
                                   FailureLog* failures,
                                   OrchestratorOptions options)
    : task_(task),
      store_(store),
      registry_(registry),
      tracker_(tracker),
      failures_(failures),
      options_(std::move(options)),
      runner_(executor, tracker, failures) {
}

auto TaskOrchestrator::snapshot(std::size_t index) -> FileState {
  std::lock_guard lock(mu_);
  return task_.files()[index];
}

auto TaskOrchestrator::stopping() const -> bool {
  return halted_.load(std::memory_order_acquire) ||
         (pool_ != nullptr && pool_->stop_requested());
}

auto TaskOrchestrator::apply(std::size_t worker_id, const FileState& next,
                             bool claim) -> bool {
  std::lock_guard lock(mu_);
  if (halted_.load(std::memory_order_acquire)) {
    return false;
  }
  // A claim starts new work: refuse it once a stop is requested, even if the
  // worker checked before the request arrived.
  if (claim && stopping()) {
    return false;
  }

  const auto* prev = task_.find(next.path);
  if (prev == nullptr) {
    log::error("[worker {}] {} is not part of {}", worker_id, next.path,
               task_.id());
    return false;
  }
  auto prev_status = prev->status;

  // Durable first: memory never holds a state the disk does not.
  auto now = now_ms();
  if (auto r = store_.save_file(next, now); !r) {
    log::error("[worker {}] Failed to persist {} ({}): {}; stopping", worker_id,
               next.path, file_status_name(next.status), r.error().message());
    halted_.store(true, std::memory_order_release);
    if (pool_ != nullptr) {
      pool_->request_stop();
    }
    return false;
  }
  if (auto r = task_.update_file(next); !r) {
    return false;
  }
  task_.set_updated_at(now);
  if (options_.on_transition) {
    options_.on_transition(next);
  }

  if (next.status != prev_status) {
    if (is_terminal(next.status)) {
      ++finished_this_run_;
      if (next.status == FileStatus::Completed) {
        completed_this_run_.push_back(next.path);
      }
    }
    if (next.status == FileStatus::Failed) {
      log::warn("[worker {}] {} {} -> failed: {}", worker_id, next.path,
                file_status_name(prev_status), next.last_error.value_or(""));
    } else {
      log::info("[worker {}] {} {} -> {} (retry {}/{})", worker_id, next.path,
                file_status_name(prev_status), file_status_name(next.status),
                next.retry_count, task_.config().max_retries);
    }
  }
  return true;
}

auto TaskOrchestrator::drive(std::size_t worker_id, std::size_t index)
    -> Disposition {
  auto file = snapshot(index);
  if (is_terminal(file.status)) {
    return Disposition::Done;
  }
  if (stopping()) {
    return Disposition::Requeue;
  }

  const auto& config = task_.config();
  auto claim = next_transition(MachineInput{
      .status = file.status,
      .retry_count = file.retry_count,
      .max_retries = config.max_retries,
      .has_verify = config.has_verify(),
      .event = Event::Claim,
  });
  if (!claim) {
    log::error("[worker {}] Cannot claim {} in status {}", worker_id,
               file.path, file_status_name(file.status));
    return Disposition::Done;
  }
  if (claim->next == file.status) {
    log::info("[worker {}] Restarting interrupted {} step of {}", worker_id,
              file_status_name(file.status), file.path);
  } else {
    file.status = claim->next;
    if (!apply(worker_id, file, true)) {
      return Disposition::Requeue;
    }
  }

  StepContext ctx{
      .config = config,
      .task_id = task_.id(),
      .global_allowlist = global_allowlist_,
      .baseline = baseline_,
  };

  while (is_in_flight(file.status) && !stopping()) {
    auto kind = *step_for(file.status);
    log::debug("[worker {}] Running {} for {}", worker_id, step_name(kind),
               file.path);
    auto report = runner_.run(kind, file, ctx);

    FileState next = file;
    auto transition = next_transition(MachineInput{
        .status = file.status,
        .retry_count = file.retry_count,
        .max_retries = config.max_retries,
        .has_verify = config.has_verify(),
        .event = report.event,
    });
    if (!transition) {
      log::error("[worker {}] No transition from {} on {} for {}", worker_id,
                 file_status_name(file.status), event_name(report.event),
                 file.path);
      next.status = FileStatus::Failed;
      next.last_error = std::format("invalid transition from {} on {}",
                                    file_status_name(file.status),
                                    event_name(report.event));
    } else {
      next.status = transition->next;
      if (transition->consumes_retry) {
        ++next.retry_count;
      }
      bool guarded = is_mutating(kind) || transition->needs_guard;
      if (guarded && !report.unauthorized.empty()) {
        next.status = FileStatus::Failed;
        next.last_error =
            GuardDecision{.unauthorized = report.unauthorized}.detail();
      } else if (next.status == FileStatus::Failed ||
                 next.status == FileStatus::FixupInProgress) {
        next.last_error = report.detail;
      } else if (next.status == FileStatus::Completed) {
        next.last_error.reset();
      }
    }
    if (report.result) {
      next.result = std::move(report.result);
    }

    if (!apply(worker_id, next)) {
      return Disposition::Requeue;
    }
    file = std::move(next);
  }

  return is_terminal(file.status) ? Disposition::Done : Disposition::Requeue;
}

auto TaskOrchestrator::schedule() const -> std::vector<std::size_t> {
  std::vector<std::size_t> items;
  const auto& files = task_.files();
  auto cap = task_.config().max_files;
  for (std::size_t i = 0; i < files.size(); ++i) {
    if (files[i].is_done()) {
      continue;
    }
    if (cap && items.size() >= static_cast<std::size_t>(*cap)) {
      break;
    }
    items.push_back(i);
  }
  return items;
}

auto TaskOrchestrator::build_global_allowlist(
    const std::vector<std::size_t>& scheduled) -> void {
  global_allowlist_.clear();
  for (auto idx : scheduled) {
    auto pattern = instantiate_allowlist(task_.config().allowlist_pattern,
                                         task_.files()[idx].path);
    if (std::ranges::find(global_allowlist_, pattern) ==
        global_allowlist_.end()) {
      global_allowlist_.push_back(std::move(pattern));
    }
  }
}

auto TaskOrchestrator::commit_completed(RunReport& report) -> void {
  if (!options_.auto_commit || completed_this_run_.empty()) {
    return;
  }
  for (const auto& path : completed_this_run_) {
    auto cp = tracker_.checkpoint();
    if (!cp) {
      log::warn("Skipping commit for {}: {}", path, cp.error().message());
      continue;
    }
    auto pattern =
        instantiate_allowlist(task_.config().allowlist_pattern, path);
    std::vector<std::string> paths;
    for (const auto& [dirty, fp] : cp->dirty) {
      if (baseline_.contains(dirty)) {
        continue;
      }
      if (dirty == path || matches_allowlist(dirty, pattern)) {
        paths.push_back(dirty);
      }
    }
    std::ranges::sort(paths);
    if (paths.empty()) {
      log::debug("No changes to commit for {}", path);
      continue;
    }

    auto message = expand_pattern(
        options_.commit_message,
        PatternContext{.file_path = path,
                       .task_id = task_.id().value(),
                       .allowlist = task_.config().allowlist_pattern,
                       .root = task_.config().working_dir.empty()
                                   ? "."
                                   : task_.config().working_dir});
    auto committed = tracker_.commit(paths, message);
    if (!committed) {
      log::warn("Auto-commit failed for {}: {}", path,
                committed.error().message());
      continue;
    }
    if (*committed) {
      log::info("Committed {} as {}", path, **committed);
      report.commits.push_back(**committed);
    }
  }
}

auto TaskOrchestrator::run(const std::atomic<bool>& shutdown)
    -> Result<RunReport> {
  RunReport report;
  report.task_id = task_.id();

  auto baseline = tracker_.capture_baseline();
  if (!baseline) {
    log::error("Failed to capture working tree baseline: {}",
               baseline.error().message());
    return std::unexpected(baseline.error());
  }
  baseline_ = std::move(*baseline);

  auto scheduled = schedule();
  build_global_allowlist(scheduled);
  completed_this_run_.clear();
  finished_this_run_ = 0;

  auto before = task_.summary();
  log::info("Running {}: {} of {} file(s) scheduled, concurrency {}",
            task_.id(), scheduled.size(), before.total,
            task_.config().concurrency);

  if (shutdown.load(std::memory_order_acquire)) {
    report.interrupted = true;
  } else if (!scheduled.empty()) {
    WorkerPool pool(static_cast<std::size_t>(task_.config().concurrency),
                    [this](std::size_t worker_id, std::size_t index) {
                      return drive(worker_id, index);
                    });
    {
      std::lock_guard lock(mu_);
      pool_ = &pool;
    }
    pool.start(scheduled);

    bool signalled = false;
    while (!pool.wait_for(timing::kShutdownPollInterval)) {
      if (!signalled && shutdown.load(std::memory_order_acquire)) {
        signalled = true;
        log::info("Shutdown requested; waiting for running steps to finish");
        pool.request_stop();
      }
    }
    pool.join();
    report.interrupted = signalled;
    report.max_concurrency_observed = pool.max_concurrency_observed();
    {
      std::lock_guard lock(mu_);
      pool_ = nullptr;
    }
  }

  std::lock_guard lock(mu_);
  if (halted_.load(std::memory_order_acquire)) {
    if (auto r = store_.save_all(task_); !r) {
      log::error("Final flush of {} failed: {}", task_.id(),
                 r.error().message());
    }
    return fail(Error::PersistenceFailed);
  }

  report.done = task_.is_done();
  report.summary = task_.summary();
  report.files = task_.files();
  report.finished_this_run = finished_this_run_;

  if (registry_ != nullptr) {
    auto r = report.done ? registry_->set_status(task_.id(),
                                                 RegistryStatus::Completed,
                                                 task_.updated_at())
                         : registry_->touch(task_.id(), task_.updated_at());
    if (!r) {
      log::error("Failed to update registry entry for {}: {}", task_.id(),
                 r.error().message());
      return fail(Error::PersistenceFailed);
    }
  }

  commit_completed(report);

  log::info("{} {}: {} completed, {} failed, {} remaining", task_.id(),
            report.done ? "finished" : "stopped", report.summary.completed,
            report.summary.failed,
            report.summary.total - report.summary.completed -
                report.summary.failed);
  return report;
}

}  // namespace looprunner
