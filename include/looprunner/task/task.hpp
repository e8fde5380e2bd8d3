#pragma once

#include "looprunner/core/error.hpp"
#include "looprunner/task/file_state.hpp"
#include "looprunner/util/id.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace looprunner {

struct TaskConfig {
  std::string prompt;
  std::optional<std::string> fixup_prompt;
  std::optional<std::string> verify_command;
  std::string allowlist_pattern{"{file_stem}*"};
  int max_retries{3};
  int concurrency{5};
  std::optional<int> max_files;
  std::string input_file;
  std::string working_dir;
  std::string description;
  std::optional<std::string> branch;

  [[nodiscard]] auto has_verify() const noexcept -> bool {
    return verify_command.has_value() && !verify_command->empty();
  }

  [[nodiscard]] auto validate() const -> Result<void>;

  [[nodiscard]] friend auto operator==(const TaskConfig&, const TaskConfig&)
      -> bool = default;
};

struct TaskSummary {
  std::size_t total{0};
  std::size_t pending{0};
  std::size_t in_progress{0};
  std::size_t awaiting_verification{0};
  std::size_t completed{0};
  std::size_t failed{0};
};

// A batch of files sharing one pipeline configuration. Files keep their
// insertion order, which is also the scheduling order.
class Task {
public:
  Task(TaskId id, TaskConfig config);

  [[nodiscard]] auto id() const noexcept -> const TaskId& { return id_; }
  [[nodiscard]] auto config() const noexcept -> const TaskConfig& {
    return config_;
  }
  auto set_config(TaskConfig config) -> void { config_ = std::move(config); }

  [[nodiscard]] auto created_at() const noexcept -> std::int64_t {
    return created_at_;
  }
  [[nodiscard]] auto updated_at() const noexcept -> std::int64_t {
    return updated_at_;
  }
  auto set_created_at(std::int64_t ms) noexcept -> void { created_at_ = ms; }
  auto set_updated_at(std::int64_t ms) noexcept -> void { updated_at_ = ms; }

  [[nodiscard]] auto add_file(std::string path, std::string metadata)
      -> Result<void>;
  // Restores a file exactly as persisted.
  [[nodiscard]] auto restore_file(FileState state) -> Result<void>;

  [[nodiscard]] auto files() const noexcept -> const std::vector<FileState>& {
    return files_;
  }
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return files_.size();
  }
  [[nodiscard]] auto find(std::string_view path) const -> const FileState*;
  [[nodiscard]] auto index_of(std::string_view path) const
      -> std::optional<std::size_t>;

  // Replaces the stored state of `state.path`.
  [[nodiscard]] auto update_file(const FileState& state) -> Result<void>;

  [[nodiscard]] auto is_done() const noexcept -> bool;
  [[nodiscard]] auto summary() const noexcept -> TaskSummary;

private:
  TaskId id_;
  TaskConfig config_;
  std::int64_t created_at_{0};
  std::int64_t updated_at_{0};
  std::vector<FileState> files_;
  std::unordered_map<std::string, std::size_t, StringHash, StringEqual> index_;
};

}  // namespace looprunner
