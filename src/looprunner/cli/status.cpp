#include "looprunner/cli/commands.hpp"
#include "looprunner/storage/registry.hpp"
#include "looprunner/storage/resume_loader.hpp"
#include "looprunner/task/state_strings.hpp"
#include "looprunner/util/util.hpp"

#include <nlohmann/json.hpp>

#include <print>

namespace looprunner::cli {

namespace {

// Metadata and results are stored as JSON text.
auto embed(const std::string& text) -> nlohmann::ordered_json {
  auto parsed = nlohmann::ordered_json::parse(text, nullptr, false);
  if (parsed.is_discarded()) {
    return text;
  }
  return parsed;
}

}  // namespace

auto status_json(const RegistryEntry& entry, const Task& task) -> std::string {
  const auto& config = task.config();
  auto s = task.summary();

  nlohmann::ordered_json doc;
  doc["task_id"] = task.id().str();
  doc["status"] = registry_status_name(entry.status);
  doc["description"] = config.description;
  doc["working_dir"] = config.working_dir;
  doc["state_file"] = entry.state_file;
  doc["created_at"] = format_timestamp(task.created_at());
  doc["updated_at"] = format_timestamp(task.updated_at());
  doc["config"] = {
      {"prompt", config.prompt},
      {"fixup_prompt", config.fixup_prompt
                           ? nlohmann::ordered_json(*config.fixup_prompt)
                           : nlohmann::ordered_json(nullptr)},
      {"verify_command", config.verify_command
                             ? nlohmann::ordered_json(*config.verify_command)
                             : nlohmann::ordered_json(nullptr)},
      {"allowlist", config.allowlist_pattern},
      {"max_retries", config.max_retries},
      {"concurrency", config.concurrency},
      {"max_files", config.max_files ? nlohmann::ordered_json(*config.max_files)
                                     : nlohmann::ordered_json(nullptr)},
  };
  doc["summary"] = {
      {"total", s.total},
      {"pending", s.pending},
      {"in_progress", s.in_progress},
      {"awaiting_verification", s.awaiting_verification},
      {"completed", s.completed},
      {"failed", s.failed},
  };

  auto files = nlohmann::ordered_json::array();
  for (const auto& f : task.files()) {
    nlohmann::ordered_json item;
    item["path"] = f.path;
    item["status"] = file_status_name(f.status);
    item["retry_count"] = f.retry_count;
    item["last_error"] = f.last_error ? nlohmann::ordered_json(*f.last_error)
                                      : nlohmann::ordered_json(nullptr);
    item["metadata"] = embed(f.metadata);
    item["result"] = f.result ? embed(*f.result)
                              : nlohmann::ordered_json(nullptr);
    files.push_back(std::move(item));
  }
  doc["files"] = std::move(files);
  // Stored errors and results carry raw tool output.
  return doc.dump(2, ' ', false,
                  nlohmann::ordered_json::error_handler_t::replace);
}

auto cmd_status(const StatusOptions& opts) -> int {
  TaskRegistry registry(opts.tasks_dir);
  if (auto r = registry.open(); !r) {
    std::println(stderr, "Error: Failed to open registry: {}",
                 r.error().message());
    return 1;
  }

  ResumeLoader loader(registry);
  auto loaded = loader.load(TaskId{opts.task_id});
  if (!loaded) {
    std::println(stderr, "Error: {}: {}", opts.task_id,
                 loaded.error().message());
    return 1;
  }

  const auto& task = loaded->task;
  if (opts.json) {
    std::println("{}", status_json(loaded->entry, task));
    return 0;
  }

  auto s = task.summary();
  std::println("Task:     {}", task.id());
  std::println("Status:   {}", registry_status_name(loaded->entry.status));
  std::println("Prompt:   {}", task.config().description);
  std::println("Dir:      {}", task.config().working_dir);
  std::println("Updated:  {}", format_timestamp(task.updated_at()));
  std::println("Files:    {} total, {} completed, {} failed, {} pending, {} "
               "awaiting verification, {} in progress",
               s.total, s.completed, s.failed, s.pending,
               s.awaiting_verification, s.in_progress);
  std::println("");
  std::println("{:<50} {:<22} {:<7} {}", "FILE", "STATUS", "RETRIES",
               "LAST_ERROR");
  for (const auto& f : task.files()) {
    std::println("{:<50} {:<22} {:<7} {}", f.path, file_status_name(f.status),
                 f.retry_count,
                 f.last_error ? shorten(*f.last_error, 80) : "-");
  }
  return 0;
}

}  // namespace looprunner::cli
