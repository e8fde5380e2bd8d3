#pragma once

#include "looprunner/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace looprunner {

struct PathFingerprint {
  bool exists{false};
  std::int64_t size{0};
  std::int64_t mtime_ns{0};

  [[nodiscard]] friend auto operator==(const PathFingerprint&,
                                       const PathFingerprint&) -> bool = default;
};

// Dirty paths of the working tree at one instant.
struct Checkpoint {
  std::unordered_map<std::string, PathFingerprint> dirty;
};

// Paths that appear, disappear or change fingerprint between `before` and
// `after`, sorted.
[[nodiscard]] auto changed_paths(const Checkpoint& before,
                                 const Checkpoint& after)
    -> std::vector<std::string>;

class IChangeTracker {
public:
  virtual ~IChangeTracker() = default;

  // Paths already dirty before the run started.
  [[nodiscard]] virtual auto capture_baseline()
      -> Result<std::unordered_set<std::string>> = 0;

  [[nodiscard]] virtual auto checkpoint() -> Result<Checkpoint> = 0;

  [[nodiscard]] virtual auto diff_since(const Checkpoint& before)
      -> Result<std::vector<std::string>> = 0;

  // Stages `paths` and commits them. nullopt when there was nothing to commit.
  [[nodiscard]] virtual auto commit(const std::vector<std::string>& paths,
                                    std::string_view message)
      -> Result<std::optional<std::string>> = 0;

  // Creates and checks out a branch for the task; returns its name.
  [[nodiscard]] virtual auto create_branch(std::string_view task_id)
      -> Result<std::string> = 0;
};

struct GitTrackerConfig {
  std::string working_dir{"."};
  std::chrono::seconds timeout{std::chrono::seconds(60)};
};

// Parses `git status --porcelain` output. Renames yield the new path.
[[nodiscard]] auto parse_porcelain(std::string_view output)
    -> std::vector<std::string>;

[[nodiscard]] auto is_git_repository(const std::string& working_dir) -> bool;

[[nodiscard]] auto create_git_tracker(GitTrackerConfig config)
    -> std::unique_ptr<IChangeTracker>;

// Tracking disabled: no baseline, no changes, commits are no-ops.
[[nodiscard]] auto create_null_tracker() -> std::unique_ptr<IChangeTracker>;

}  // namespace looprunner
