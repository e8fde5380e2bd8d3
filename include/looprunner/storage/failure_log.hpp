#pragma once

#include "looprunner/core/error.hpp"

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>

namespace looprunner {

// Append-only, human-readable history of failed steps, one file per input
// file under <tasks_dir>/failures/<task_id>/.
class FailureLog {
public:
  explicit FailureLog(std::filesystem::path dir);

  [[nodiscard]] auto append(std::string_view file_path,
                            std::string_view message) -> Result<void>;

  // "src/a/b.ts" -> <dir>/src__a__b.ts.log
  [[nodiscard]] auto log_path(std::string_view file_path) const
      -> std::filesystem::path;

  [[nodiscard]] auto dir() const noexcept -> const std::filesystem::path& {
    return dir_;
  }

private:
  std::filesystem::path dir_;
  std::mutex mu_;
};

}  // namespace looprunner
