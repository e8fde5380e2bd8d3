#pragma once

#include "looprunner/executor/executor.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace looprunner {

struct ProcessSpec {
  std::vector<std::string> argv;
  std::string working_dir;
  std::chrono::seconds timeout{std::chrono::seconds(300)};
};

// Spawns argv[0] (PATH lookup) in its own process group and blocks until it
// exits or the timeout expires, in which case the whole group is killed.
// Output of each stream is capped at io::kMaxOutputSize.
[[nodiscard]] auto run_process(const ProcessSpec& spec) -> ExecutorResult;

[[nodiscard]] inline auto shell_spec(std::string command,
                                     std::string working_dir,
                                     std::chrono::seconds timeout)
    -> ProcessSpec {
  return ProcessSpec{
      .argv = {"/bin/sh", "-c", std::move(command)},
      .working_dir = std::move(working_dir),
      .timeout = timeout,
  };
}

}  // namespace looprunner
