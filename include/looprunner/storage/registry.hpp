#pragma once

#include "looprunner/core/error.hpp"
#include "looprunner/storage/database.hpp"
#include "looprunner/task/state_strings.hpp"
#include "looprunner/util/id.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace looprunner {

struct RegistryEntry {
  std::int64_t seq{0};
  TaskId task_id;
  // Relative to the tasks directory.
  std::string state_file;
  RegistryStatus status{RegistryStatus::Incomplete};
  std::string description;
  std::string working_dir;
  std::int64_t created_at{0};
  std::int64_t updated_at{0};
};

// Index of all tasks in a tasks directory, stored in registry.db. Entries are
// appended once and only their status/updated_at change afterwards.
class TaskRegistry {
public:
  static constexpr const char* kFileName = "registry.db";

  explicit TaskRegistry(std::filesystem::path tasks_dir);

  // Creates the directory and schema when missing.
  [[nodiscard]] auto open() -> Result<void>;

  [[nodiscard]] auto tasks_dir() const noexcept
      -> const std::filesystem::path& {
    return tasks_dir_;
  }

  // Next free sequence number. Skips numbers whose state file already exists
  // without a registry row (a creation interrupted before the append).
  [[nodiscard]] auto next_sequence() -> Result<std::int64_t>;

  [[nodiscard]] auto append(const RegistryEntry& entry) -> Result<void>;
  [[nodiscard]] auto set_status(const TaskId& id, RegistryStatus status,
                                std::int64_t updated_at) -> Result<void>;
  [[nodiscard]] auto touch(const TaskId& id, std::int64_t updated_at)
      -> Result<void>;

  [[nodiscard]] auto find(const TaskId& id) -> Result<RegistryEntry>;
  [[nodiscard]] auto list() -> Result<std::vector<RegistryEntry>>;
  // Oldest entry whose status is incomplete; NoIncompleteTasks otherwise.
  [[nodiscard]] auto first_incomplete() -> Result<RegistryEntry>;

  [[nodiscard]] static auto state_file_name(std::int64_t seq) -> std::string;
  [[nodiscard]] auto state_path(const RegistryEntry& entry) const
      -> std::filesystem::path;

private:
  [[nodiscard]] auto create_tables() -> Result<void>;
  [[nodiscard]] auto read_entries(const char* sql, const std::string* key)
      -> Result<std::vector<RegistryEntry>>;

  std::filesystem::path tasks_dir_;
  Database db_;
};

}  // namespace looprunner
