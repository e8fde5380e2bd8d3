#include "looprunner/git/change_tracker.hpp"

#include "looprunner/executor/process.hpp"
#include "looprunner/util/log.hpp"
#include "looprunner/util/util.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <mutex>
#include <ranges>
#include <set>

namespace looprunner {

namespace {

auto trim(std::string_view s) -> std::string_view {
  constexpr std::string_view ws = " \t\r\n";
  auto first = s.find_first_not_of(ws);
  if (first == std::string_view::npos) {
    return {};
  }
  return s.substr(first, s.find_last_not_of(ws) - first + 1);
}

auto unquote(std::string_view s) -> std::string {
  if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
    s = s.substr(1, s.size() - 2);
  }
  return std::string(s);
}

auto fingerprint(const std::filesystem::path& path) -> PathFingerprint {
  std::error_code ec;
  auto status = std::filesystem::status(path, ec);
  if (ec || !std::filesystem::exists(status)) {
    return {};
  }
  PathFingerprint fp{.exists = true};
  if (std::filesystem::is_regular_file(status)) {
    auto size = std::filesystem::file_size(path, ec);
    if (!ec) {
      fp.size = static_cast<std::int64_t>(size);
    }
  }
  auto mtime = std::filesystem::last_write_time(path, ec);
  if (!ec) {
    fp.mtime_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                      mtime.time_since_epoch())
                      .count();
  }
  return fp;
}

class GitChangeTracker : public IChangeTracker {
public:
  explicit GitChangeTracker(GitTrackerConfig config)
      : config_(std::move(config)) {
  }

  auto capture_baseline() -> Result<std::unordered_set<std::string>> override {
    std::lock_guard lock(mu_);
    auto dirty = dirty_files();
    if (!dirty) {
      return std::unexpected(dirty.error());
    }
    if (!dirty->empty()) {
      log::info("Captured {} pre-existing dirty file(s)", dirty->size());
    }
    return std::unordered_set<std::string>(dirty->begin(), dirty->end());
  }

  auto checkpoint() -> Result<Checkpoint> override {
    std::lock_guard lock(mu_);
    return snapshot();
  }

  auto diff_since(const Checkpoint& before)
      -> Result<std::vector<std::string>> override {
    std::lock_guard lock(mu_);
    auto after = snapshot();
    if (!after) {
      return std::unexpected(after.error());
    }
    return changed_paths(before, *after);
  }

  auto commit(const std::vector<std::string>& paths, std::string_view message)
      -> Result<std::optional<std::string>> override {
    if (paths.empty()) {
      return std::optional<std::string>{};
    }
    std::lock_guard lock(mu_);

    std::vector<std::string> add = {"git", "add", "-A", "--"};
    add.insert(add.end(), paths.begin(), paths.end());
    auto staged = git(std::move(add));
    if (!staged.succeeded()) {
      log::warn("git add failed: {}", trim(staged.stderr_output));
      return fail(Error::GitCommandFailed);
    }

    auto committed = git({"git", "commit", "-m", std::string(message)});
    if (!committed.succeeded()) {
      if (committed.stdout_output.contains("nothing to commit") ||
          committed.stderr_output.contains("nothing to commit")) {
        return std::optional<std::string>{};
      }
      log::warn("git commit failed: {}", trim(committed.stderr_output));
      return fail(Error::GitCommandFailed);
    }

    auto head = git({"git", "rev-parse", "--short", "HEAD"});
    if (!head.succeeded()) {
      return fail(Error::GitCommandFailed);
    }
    return std::optional<std::string>{std::string(trim(head.stdout_output))};
  }

  auto create_branch(std::string_view task_id) -> Result<std::string> override {
    std::lock_guard lock(mu_);
    auto stamp = format_timestamp();
    std::ranges::replace(stamp, ':', '-');
    auto name = std::format("looprunner/{}-{}", task_id, stamp);
    auto r = git({"git", "checkout", "-b", name});
    if (!r.succeeded()) {
      log::error("Failed to create branch '{}': {}", name,
                 trim(r.stderr_output));
      return fail(Error::GitCommandFailed);
    }
    log::info("Created and checked out branch {}", name);
    return name;
  }

private:
  auto git(std::vector<std::string> argv) -> ExecutorResult {
    return run_process(ProcessSpec{
        .argv = std::move(argv),
        .working_dir = config_.working_dir,
        .timeout = config_.timeout,
    });
  }

  auto dirty_files() -> Result<std::vector<std::string>> {
    auto r = git({"git", "status", "--porcelain", "--untracked-files=all"});
    if (!r.succeeded()) {
      log::error("git status failed: {}",
                 r.error.empty() ? trim(r.stderr_output) : r.error);
      return fail(Error::GitCommandFailed);
    }
    return parse_porcelain(r.stdout_output);
  }

  auto snapshot() -> Result<Checkpoint> {
    auto dirty = dirty_files();
    if (!dirty) {
      return std::unexpected(dirty.error());
    }
    Checkpoint cp;
    std::filesystem::path root(config_.working_dir);
    for (auto& path : *dirty) {
      auto fp = fingerprint(root / path);
      cp.dirty.emplace(std::move(path), fp);
    }
    return cp;
  }

  GitTrackerConfig config_;
  std::mutex mu_;
};

class NullChangeTracker : public IChangeTracker {
public:
  auto capture_baseline() -> Result<std::unordered_set<std::string>> override {
    return std::unordered_set<std::string>{};
  }
  auto checkpoint() -> Result<Checkpoint> override {
    return Checkpoint{};
  }
  auto diff_since(const Checkpoint&)
      -> Result<std::vector<std::string>> override {
    return std::vector<std::string>{};
  }
  auto commit(const std::vector<std::string>&, std::string_view)
      -> Result<std::optional<std::string>> override {
    return std::optional<std::string>{};
  }
  auto create_branch(std::string_view) -> Result<std::string> override {
    return fail(Error::GitCommandFailed);
  }
};

}  // namespace

auto changed_paths(const Checkpoint& before, const Checkpoint& after)
    -> std::vector<std::string> {
  std::set<std::string> out;
  for (const auto& [path, fp] : after.dirty) {
    auto it = before.dirty.find(path);
    if (it == before.dirty.end() || it->second != fp) {
      out.insert(path);
    }
  }
  for (const auto& [path, fp] : before.dirty) {
    if (!after.dirty.contains(path)) {
      out.insert(path);
    }
  }
  return {out.begin(), out.end()};
}

auto parse_porcelain(std::string_view output) -> std::vector<std::string> {
  std::vector<std::string> files;
  for (auto part : output | std::views::split('\n')) {
    std::string_view line(part.begin(), part.end());
    if (line.ends_with('\r')) {
      line.remove_suffix(1);
    }
    // "XY path" or "XY old -> new"
    if (line.size() < 4) {
      continue;
    }
    auto path = line.substr(3);
    if (auto arrow = path.find(" -> "); arrow != std::string_view::npos) {
      path = path.substr(arrow + 4);
    }
    path = trim(path);
    if (!path.empty()) {
      files.push_back(unquote(path));
    }
  }
  return files;
}

auto is_git_repository(const std::string& working_dir) -> bool {
  auto r = run_process(ProcessSpec{
      .argv = {"git", "rev-parse", "--git-dir"},
      .working_dir = working_dir,
      .timeout = std::chrono::seconds(30),
  });
  return r.succeeded();
}

auto create_git_tracker(GitTrackerConfig config)
    -> std::unique_ptr<IChangeTracker> {
  return std::make_unique<GitChangeTracker>(std::move(config));
}

auto create_null_tracker() -> std::unique_ptr<IChangeTracker> {
  return std::make_unique<NullChangeTracker>();
}

}  // namespace looprunner
