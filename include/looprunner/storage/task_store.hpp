#pragma once

#include "looprunner/core/error.hpp"
#include "looprunner/storage/database.hpp"
#include "looprunner/task/task.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>

namespace looprunner {

// Durable record of one task: a single-row `task` table and one row per file
// in `file_states`. Each write is one transaction. Writes are serialized.
class TaskStore {
public:
  explicit TaskStore(std::filesystem::path path);

  TaskStore(const TaskStore&) = delete;
  TaskStore& operator=(const TaskStore&) = delete;

  // Writes the full task to a new file. AlreadyExists if the file exists.
  [[nodiscard]] auto create(const Task& task) -> Result<void>;

  // Opens an existing file and checks its integrity.
  [[nodiscard]] auto open_existing() -> Result<void>;

  // Reconstructs the task verbatim. Unknown statuses or malformed rows yield
  // ResumeInconsistency.
  [[nodiscard]] auto load() -> Result<Task>;

  [[nodiscard]] auto save_file(const FileState& state, std::int64_t updated_at)
      -> Result<void>;
  [[nodiscard]] auto save_config(const TaskConfig& config,
                                 std::int64_t updated_at) -> Result<void>;
  // Rewrites every row from `task`.
  [[nodiscard]] auto save_all(const Task& task) -> Result<void>;

  [[nodiscard]] auto path() const noexcept -> const std::filesystem::path& {
    return path_;
  }

private:
  [[nodiscard]] auto create_tables() -> Result<void>;
  [[nodiscard]] auto write_task_row(const Task& task) -> Result<void>;
  [[nodiscard]] auto write_config(const TaskConfig& config,
                                  std::int64_t updated_at) -> Result<void>;
  [[nodiscard]] auto upsert_file(const FileState& state, std::int64_t ordinal)
      -> Result<void>;
  [[nodiscard]] auto update_file(const FileState& state) -> Result<void>;
  [[nodiscard]] auto write_updated_at(std::int64_t updated_at) -> Result<void>;

  std::filesystem::path path_;
  std::mutex mu_;
  Database db_;
};

}  // namespace looprunner
