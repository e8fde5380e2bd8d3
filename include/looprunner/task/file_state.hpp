#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace looprunner {

enum class FileStatus : std::uint8_t {
  Pending,
  PromptInProgress,
  AwaitingVerification,
  VerifyInProgress,
  FixupInProgress,
  Completed,
  Failed,
};

[[nodiscard]] constexpr auto is_terminal(FileStatus status) noexcept -> bool {
  return status == FileStatus::Completed || status == FileStatus::Failed;
}

[[nodiscard]] constexpr auto is_in_flight(FileStatus status) noexcept -> bool {
  return status == FileStatus::PromptInProgress ||
         status == FileStatus::VerifyInProgress ||
         status == FileStatus::FixupInProgress;
}

// Per-file progress record. `metadata` and `result` are opaque JSON text,
// stored and handed on without interpretation.
struct FileState {
  std::string path;
  FileStatus status{FileStatus::Pending};
  int retry_count{0};
  std::optional<std::string> last_error;
  std::string metadata{"null"};
  std::optional<std::string> result;

  [[nodiscard]] auto is_done() const noexcept -> bool {
    return is_terminal(status);
  }

  [[nodiscard]] friend auto operator==(const FileState&, const FileState&)
      -> bool = default;
};

}  // namespace looprunner
