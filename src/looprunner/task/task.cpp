#include "looprunner/task/task.hpp"

#include "looprunner/util/util.hpp"

#include <algorithm>

namespace looprunner {

auto TaskConfig::validate() const -> Result<void> {
  if (prompt.empty()) {
    return fail(Error::InvalidArgument);
  }
  if (allowlist_pattern.empty()) {
    return fail(Error::InvalidArgument);
  }
  if (max_retries < 0 || concurrency < 1) {
    return fail(Error::InvalidArgument);
  }
  if (max_files.has_value() && *max_files < 1) {
    return fail(Error::InvalidArgument);
  }
  return ok();
}

Task::Task(TaskId id, TaskConfig config)
    : id_(std::move(id)), config_(std::move(config)) {
  created_at_ = now_ms();
  updated_at_ = created_at_;
}

auto Task::add_file(std::string path, std::string metadata) -> Result<void> {
  return restore_file(FileState{.path = std::move(path),
                                .metadata = std::move(metadata)});
}

auto Task::restore_file(FileState state) -> Result<void> {
  if (state.path.empty()) {
    return fail(Error::InvalidArgument);
  }
  if (index_.contains(state.path)) {
    return fail(Error::AlreadyExists);
  }
  index_.emplace(state.path, files_.size());
  files_.push_back(std::move(state));
  return ok();
}

auto Task::find(std::string_view path) const -> const FileState* {
  auto idx = index_of(path);
  return idx ? &files_[*idx] : nullptr;
}

auto Task::index_of(std::string_view path) const
    -> std::optional<std::size_t> {
  if (auto it = index_.find(path); it != index_.end()) {
    return it->second;
  }
  return std::nullopt;
}

auto Task::update_file(const FileState& state) -> Result<void> {
  auto idx = index_of(state.path);
  if (!idx) {
    return fail(Error::NotFound);
  }
  files_[*idx] = state;
  return ok();
}

auto Task::is_done() const noexcept -> bool {
  return std::ranges::all_of(files_,
                             [](const FileState& f) { return f.is_done(); });
}

auto Task::summary() const noexcept -> TaskSummary {
  TaskSummary s;
  s.total = files_.size();
  for (const auto& f : files_) {
    switch (f.status) {
      case FileStatus::Pending:
        ++s.pending;
        break;
      case FileStatus::PromptInProgress:
      case FileStatus::VerifyInProgress:
      case FileStatus::FixupInProgress:
        ++s.in_progress;
        break;
      case FileStatus::AwaitingVerification:
        ++s.awaiting_verification;
        break;
      case FileStatus::Completed:
        ++s.completed;
        break;
      case FileStatus::Failed:
        ++s.failed;
        break;
    }
  }
  return s;
}

}  // namespace looprunner
