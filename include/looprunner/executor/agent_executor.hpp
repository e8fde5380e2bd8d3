#pragma once

#include "looprunner/config/system_config.hpp"
#include "looprunner/executor/executor.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace looprunner {

struct AgentExecutorConfig {
  std::vector<std::string> command;
  std::string working_dir;
  std::chrono::seconds timeout{std::chrono::seconds(3600)};
  std::chrono::seconds verify_timeout{std::chrono::seconds(1800)};
};

[[nodiscard]] auto make_agent_executor_config(const AgentConfig& agent,
                                              std::string working_dir)
    -> AgentExecutorConfig;

// Builds the agent argv with "{prompt}" substituted in every argument that
// contains it. The prompt is appended when no argument does.
[[nodiscard]] auto agent_argv(const std::vector<std::string>& command,
                              std::string_view prompt)
    -> std::vector<std::string>;

[[nodiscard]] auto create_agent_executor(AgentExecutorConfig config)
    -> std::unique_ptr<IExecutor>;

}  // namespace looprunner
