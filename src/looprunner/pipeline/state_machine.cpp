#include "looprunner/pipeline/state_machine.hpp"

namespace looprunner {

namespace {

auto on_claim(FileStatus status, bool has_verify) -> Result<Transition> {
  if (!has_verify && status != FileStatus::Pending &&
      status != FileStatus::PromptInProgress) {
    return fail(Error::InvalidTransition);
  }
  switch (status) {
    case FileStatus::Pending:
      return Transition{.next = FileStatus::PromptInProgress};
    case FileStatus::AwaitingVerification:
      return Transition{.next = FileStatus::VerifyInProgress};
    case FileStatus::PromptInProgress:
    case FileStatus::VerifyInProgress:
    case FileStatus::FixupInProgress:
      // Left in flight by an interrupted run: restart the step.
      return Transition{.next = status};
    case FileStatus::Completed:
    case FileStatus::Failed:
      break;
  }
  return fail(Error::InvalidTransition);
}

auto after_prompt(const MachineInput& in) -> Result<Transition> {
  if (in.event != Event::StepSucceeded) {
    return Transition{.next = FileStatus::Failed};
  }
  if (in.has_verify) {
    return Transition{.next = FileStatus::AwaitingVerification};
  }
  return Transition{.next = FileStatus::Completed, .needs_guard = true};
}

auto after_verify(const MachineInput& in) -> Result<Transition> {
  switch (in.event) {
    case Event::StepSucceeded:
      return Transition{.next = FileStatus::Completed, .needs_guard = true};
    case Event::StepFailed:
      if (in.retry_count < in.max_retries) {
        return Transition{.next = FileStatus::FixupInProgress,
                          .consumes_retry = true};
      }
      return Transition{.next = FileStatus::Failed};
    case Event::ExecutorError:
      return Transition{.next = FileStatus::Failed};
    case Event::Claim:
      break;
  }
  return fail(Error::InvalidTransition);
}

auto after_fixup(const MachineInput& in) -> Result<Transition> {
  if (in.event == Event::ExecutorError) {
    return Transition{.next = FileStatus::Failed};
  }
  // Success or a non-zero exit alike go back to verification.
  return Transition{.next = FileStatus::AwaitingVerification};
}

}  // namespace

auto next_transition(const MachineInput& in) -> Result<Transition> {
  if (is_terminal(in.status)) {
    return fail(Error::InvalidTransition);
  }
  if (in.event == Event::Claim) {
    return on_claim(in.status, in.has_verify);
  }

  switch (in.status) {
    case FileStatus::PromptInProgress:
      return after_prompt(in);
    case FileStatus::VerifyInProgress:
      if (!in.has_verify) {
        return fail(Error::InvalidTransition);
      }
      return after_verify(in);
    case FileStatus::FixupInProgress:
      if (!in.has_verify) {
        return fail(Error::InvalidTransition);
      }
      return after_fixup(in);
    default:
      // Step results only apply to in-flight statuses.
      return fail(Error::InvalidTransition);
  }
}

auto step_for(FileStatus status) noexcept -> std::optional<StepKind> {
  switch (status) {
    case FileStatus::PromptInProgress:
      return StepKind::Prompt;
    case FileStatus::VerifyInProgress:
      return StepKind::Verify;
    case FileStatus::FixupInProgress:
      return StepKind::Fixup;
    default:
      return std::nullopt;
  }
}

auto event_name(Event event) noexcept -> std::string_view {
  switch (event) {
    case Event::Claim:
      return "claim";
    case Event::StepSucceeded:
      return "step_succeeded";
    case Event::StepFailed:
      return "step_failed";
    case Event::ExecutorError:
      return "executor_error";
  }
  return "unknown";
}

auto step_name(StepKind kind) noexcept -> std::string_view {
  switch (kind) {
    case StepKind::Prompt:
      return "prompt";
    case StepKind::Verify:
      return "verify";
    case StepKind::Fixup:
      return "fixup";
  }
  return "unknown";
}

}  // namespace looprunner
