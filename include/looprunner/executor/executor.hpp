#pragma once

#include <string>
#include <string_view>

namespace looprunner {

struct ExecutorResult {
  int exit_code{0};
  std::string stdout_output;
  std::string stderr_output;
  std::string error;
  bool timed_out{false};

  // False when the step could not be run to completion (spawn failure,
  // timeout, killed by a signal).
  [[nodiscard]] auto ran() const noexcept -> bool {
    return error.empty() && !timed_out;
  }
  [[nodiscard]] auto succeeded() const noexcept -> bool {
    return ran() && exit_code == 0;
  }
};

// Runs the code-modification agent and the verification command. Calls are
// synchronous and may be made from several worker threads at once.
class IExecutor {
public:
  virtual ~IExecutor() = default;

  // Prompt and fixup steps. `metadata` is the file's opaque JSON blob.
  [[nodiscard]] virtual auto run(std::string_view prompt,
                                 std::string_view file_path,
                                 std::string_view metadata)
      -> ExecutorResult = 0;

  [[nodiscard]] virtual auto verify(std::string_view command)
      -> ExecutorResult = 0;
};

}  // namespace looprunner
