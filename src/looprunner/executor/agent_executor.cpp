#include "looprunner/executor/agent_executor.hpp"

#include "looprunner/executor/process.hpp"
#include "looprunner/util/log.hpp"
#include "looprunner/util/pattern.hpp"

#include <algorithm>

namespace looprunner {

namespace {

constexpr std::string_view kPromptPlaceholder = "{prompt}";

class AgentExecutor : public IExecutor {
public:
  explicit AgentExecutor(AgentExecutorConfig config)
      : config_(std::move(config)) {
  }

  auto run(std::string_view prompt, std::string_view file_path,
           std::string_view /*metadata*/) -> ExecutorResult override {
    log::debug("Starting agent for {}", file_path);
    auto result = run_process(ProcessSpec{
        .argv = agent_argv(config_.command, prompt),
        .working_dir = config_.working_dir,
        .timeout = config_.timeout,
    });
    if (!result.ran()) {
      log::warn("Agent could not run for {}: {}", file_path, result.error);
    }
    return result;
  }

  auto verify(std::string_view command) -> ExecutorResult override {
    log::debug("Running verification: {}", command);
    return run_process(shell_spec(std::string(command), config_.working_dir,
                                  config_.verify_timeout));
  }

private:
  AgentExecutorConfig config_;
};

}  // namespace

auto make_agent_executor_config(const AgentConfig& agent,
                                std::string working_dir)
    -> AgentExecutorConfig {
  return AgentExecutorConfig{
      .command = agent.command,
      .working_dir = std::move(working_dir),
      .timeout = std::chrono::seconds(agent.timeout_sec),
      .verify_timeout = std::chrono::seconds(agent.verify_timeout_sec),
  };
}

auto agent_argv(const std::vector<std::string>& command,
                std::string_view prompt) -> std::vector<std::string> {
  std::vector<std::string> argv;
  argv.reserve(command.size() + 1);
  bool substituted = false;
  for (const auto& arg : command) {
    std::string out = arg;
    if (out.contains(kPromptPlaceholder)) {
      replace_all(out, kPromptPlaceholder, prompt);
      substituted = true;
    }
    argv.push_back(std::move(out));
  }
  if (!substituted) {
    argv.emplace_back(prompt);
  }
  return argv;
}

auto create_agent_executor(AgentExecutorConfig config)
    -> std::unique_ptr<IExecutor> {
  return std::make_unique<AgentExecutor>(std::move(config));
}

}  // namespace looprunner
