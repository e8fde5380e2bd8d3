#include "looprunner/cli/commands.hpp"
#include "looprunner/storage/registry.hpp"
#include "looprunner/util/util.hpp"

#include <print>

namespace looprunner::cli {

auto cmd_list(const ListOptions& opts) -> int {
  TaskRegistry registry(opts.tasks_dir);

  if (auto r = registry.open(); !r) {
    std::println(stderr, "Error: Failed to open registry: {}",
                 r.error().message());
    return 1;
  }

  auto result = registry.list();
  if (!result) {
    std::println(stderr, "Error: {}", result.error().message());
    return 1;
  }

  const auto& entries = *result;
  if (entries.empty()) {
    std::println("No tasks found in {}.", opts.tasks_dir);
    return 0;
  }

  std::println("{:<12} {:<12} {:<22} {:<50}", "TASK_ID", "STATUS", "UPDATED",
               "DESCRIPTION");
  for (const auto& e : entries) {
    std::println("{:<12} {:<12} {:<22} {:<50}", e.task_id,
                 registry_status_name(e.status),
                 format_timestamp(e.updated_at),
                 e.description.empty() ? "-" : e.description);
  }
  return 0;
}

}  // namespace looprunner::cli
