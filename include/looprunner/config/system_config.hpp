#pragma once

#include <string>
#include <vector>

namespace looprunner {

struct LoggingConfig {
  std::string level{"info"};
  std::string file;
};

struct StorageConfig {
  std::string tasks_dir{"./looprunner-tasks"};
};

struct AgentConfig {
  // argv of the agent; "{prompt}" is replaced by the built prompt.
  std::vector<std::string> command{"claude", "-p", "{prompt}",
                                   "--dangerously-skip-permissions"};
  int timeout_sec{3600};
  int verify_timeout_sec{1800};
};

struct GitConfig {
  bool enabled{false};
  bool auto_branch{false};
  bool auto_commit{false};
  std::string commit_message{"looprunner: {file_name}"};
};

struct DefaultsConfig {
  int concurrency{5};
  int max_retries{3};
  std::string allowlist{"{file_stem}*"};
};

struct SystemConfig {
  LoggingConfig logging;
  StorageConfig storage;
  AgentConfig agent;
  GitConfig git;
  DefaultsConfig defaults;
  std::string working_dir{"."};
};

}  // namespace looprunner
