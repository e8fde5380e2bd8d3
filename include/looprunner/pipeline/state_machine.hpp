#pragma once

#include "looprunner/core/error.hpp"
#include "looprunner/task/file_state.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace looprunner {

enum class Event : std::uint8_t {
  Claim,
  StepSucceeded,
  StepFailed,
  ExecutorError,
};

enum class StepKind : std::uint8_t {
  Prompt,
  Verify,
  Fixup,
};

struct MachineInput {
  FileStatus status{FileStatus::Pending};
  int retry_count{0};
  int max_retries{0};
  bool has_verify{false};
  Event event{Event::Claim};
};

struct Transition {
  FileStatus next{FileStatus::Pending};
  bool consumes_retry{false};
  // Set when the move lands on Completed; the caller must run the change
  // guard before committing it.
  bool needs_guard{false};
};

// Pure transition function over (status, retry_count, max_retries,
// has_verify, event). Terminal statuses reject every event.
[[nodiscard]] auto next_transition(const MachineInput& in) -> Result<Transition>;

// The external step an in-flight status calls for.
[[nodiscard]] auto step_for(FileStatus status) noexcept
    -> std::optional<StepKind>;

// Prompt and fixup may write to the working tree; verify may not.
[[nodiscard]] constexpr auto is_mutating(StepKind kind) noexcept -> bool {
  return kind != StepKind::Verify;
}

[[nodiscard]] auto event_name(Event event) noexcept -> std::string_view;
[[nodiscard]] auto step_name(StepKind kind) noexcept -> std::string_view;

}  // namespace looprunner
