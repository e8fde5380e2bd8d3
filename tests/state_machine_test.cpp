#include "looprunner/pipeline/state_machine.hpp"
#include "looprunner/task/state_strings.hpp"

#include "gtest/gtest.h"

using namespace looprunner;

namespace {

auto step(FileStatus status, Event event, int retry = 0, int max_retries = 3,
          bool has_verify = true) -> Result<Transition> {
  return next_transition(MachineInput{
      .status = status,
      .retry_count = retry,
      .max_retries = max_retries,
      .has_verify = has_verify,
      .event = event,
  });
}

}  // namespace

TEST(StateMachineTest, Claim_Pending_StartsPrompt) {
  auto t = step(FileStatus::Pending, Event::Claim);

  ASSERT_TRUE(t.has_value());
  EXPECT_EQ(t->next, FileStatus::PromptInProgress);
  EXPECT_FALSE(t->consumes_retry);
}

TEST(StateMachineTest, Claim_AwaitingVerification_StartsVerify) {
  auto t = step(FileStatus::AwaitingVerification, Event::Claim);

  ASSERT_TRUE(t.has_value());
  EXPECT_EQ(t->next, FileStatus::VerifyInProgress);
}

TEST(StateMachineTest, Claim_InFlight_RestartsSameStep) {
  for (auto status : {FileStatus::PromptInProgress, FileStatus::VerifyInProgress,
                      FileStatus::FixupInProgress}) {
    auto t = step(status, Event::Claim, 1);
    ASSERT_TRUE(t.has_value()) << file_status_name(status);
    EXPECT_EQ(t->next, status);
    EXPECT_FALSE(t->consumes_retry);
  }
}

TEST(StateMachineTest, PromptSuccess_WithVerify_AwaitsVerification) {
  auto t = step(FileStatus::PromptInProgress, Event::StepSucceeded);

  ASSERT_TRUE(t.has_value());
  EXPECT_EQ(t->next, FileStatus::AwaitingVerification);
  EXPECT_FALSE(t->needs_guard);
}

TEST(StateMachineTest, PromptSuccess_WithoutVerify_CompletesUnderGuard) {
  auto t = step(FileStatus::PromptInProgress, Event::StepSucceeded, 0, 3,
                false);

  ASSERT_TRUE(t.has_value());
  EXPECT_EQ(t->next, FileStatus::Completed);
  EXPECT_TRUE(t->needs_guard);
}

TEST(StateMachineTest, PromptFailure_Fails) {
  auto failed = step(FileStatus::PromptInProgress, Event::StepFailed);
  auto errored = step(FileStatus::PromptInProgress, Event::ExecutorError);

  ASSERT_TRUE(failed.has_value());
  ASSERT_TRUE(errored.has_value());
  EXPECT_EQ(failed->next, FileStatus::Failed);
  EXPECT_EQ(errored->next, FileStatus::Failed);
  EXPECT_FALSE(errored->consumes_retry);
}

TEST(StateMachineTest, VerifyPass_CompletesUnderGuard) {
  auto t = step(FileStatus::VerifyInProgress, Event::StepSucceeded, 2);

  ASSERT_TRUE(t.has_value());
  EXPECT_EQ(t->next, FileStatus::Completed);
  EXPECT_TRUE(t->needs_guard);
}

TEST(StateMachineTest, VerifyFail_WithRetriesLeft_EntersFixup) {
  auto t = step(FileStatus::VerifyInProgress, Event::StepFailed, 1, 3);

  ASSERT_TRUE(t.has_value());
  EXPECT_EQ(t->next, FileStatus::FixupInProgress);
  EXPECT_TRUE(t->consumes_retry);
}

TEST(StateMachineTest, VerifyFail_RetriesExhausted_Fails) {
  auto t = step(FileStatus::VerifyInProgress, Event::StepFailed, 3, 3);

  ASSERT_TRUE(t.has_value());
  EXPECT_EQ(t->next, FileStatus::Failed);
  EXPECT_FALSE(t->consumes_retry);
}

TEST(StateMachineTest, VerifyFail_ZeroMaxRetries_FailsImmediately) {
  auto t = step(FileStatus::VerifyInProgress, Event::StepFailed, 0, 0);

  ASSERT_TRUE(t.has_value());
  EXPECT_EQ(t->next, FileStatus::Failed);
}

TEST(StateMachineTest, VerifyExecutorError_FailsWithoutRetry) {
  auto t = step(FileStatus::VerifyInProgress, Event::ExecutorError, 0, 3);

  ASSERT_TRUE(t.has_value());
  EXPECT_EQ(t->next, FileStatus::Failed);
  EXPECT_FALSE(t->consumes_retry);
}

TEST(StateMachineTest, FixupCompletes_RegardlessOfExitStatus) {
  auto ok = step(FileStatus::FixupInProgress, Event::StepSucceeded, 1);
  auto nonzero = step(FileStatus::FixupInProgress, Event::StepFailed, 1);

  ASSERT_TRUE(ok.has_value());
  ASSERT_TRUE(nonzero.has_value());
  EXPECT_EQ(ok->next, FileStatus::AwaitingVerification);
  EXPECT_EQ(nonzero->next, FileStatus::AwaitingVerification);
}

TEST(StateMachineTest, FixupExecutorError_Fails) {
  auto t = step(FileStatus::FixupInProgress, Event::ExecutorError, 1);

  ASSERT_TRUE(t.has_value());
  EXPECT_EQ(t->next, FileStatus::Failed);
}

TEST(StateMachineTest, TerminalStatuses_RejectEveryEvent) {
  for (auto status : {FileStatus::Completed, FileStatus::Failed}) {
    for (auto event : {Event::Claim, Event::StepSucceeded, Event::StepFailed,
                       Event::ExecutorError}) {
      auto t = step(status, event);
      ASSERT_FALSE(t.has_value());
      EXPECT_EQ(t.error(), make_error_code(Error::InvalidTransition));
    }
  }
}

TEST(StateMachineTest, StepEvent_OnIdleStatus_IsRejected) {
  EXPECT_FALSE(step(FileStatus::Pending, Event::StepSucceeded).has_value());
  EXPECT_FALSE(
      step(FileStatus::AwaitingVerification, Event::StepFailed).has_value());
}

TEST(StateMachineTest, VerifyStatuses_WithoutVerifyCommand_AreUnreachable) {
  EXPECT_FALSE(step(FileStatus::AwaitingVerification, Event::Claim, 0, 3, false)
                   .has_value());
  EXPECT_FALSE(step(FileStatus::FixupInProgress, Event::StepSucceeded, 0, 3,
                    false)
                   .has_value());
}

TEST(StateMachineTest, RetryLoop_VisitsFixupAtMostMaxRetriesTimes) {
  for (int max_retries = 0; max_retries <= 4; ++max_retries) {
    FileStatus status = FileStatus::Pending;
    int retry = 0;
    int fixups = 0;
    int guard = 0;
    while (!is_terminal(status) && guard++ < 100) {
      Event event = Event::Claim;
      if (is_in_flight(status)) {
        // Verification never passes; prompt and fixup always succeed.
        event = status == FileStatus::VerifyInProgress ? Event::StepFailed
                                                       : Event::StepSucceeded;
      }
      auto t = step(status, event, retry, max_retries);
      ASSERT_TRUE(t.has_value());
      if (t->consumes_retry) {
        ++retry;
      }
      if (t->next == FileStatus::FixupInProgress && status != t->next) {
        ++fixups;
      }
      status = t->next;
      ASSERT_LE(retry, max_retries);
    }
    EXPECT_EQ(status, FileStatus::Failed);
    EXPECT_EQ(fixups, max_retries);
  }
}

TEST(StateMachineTest, StepFor_MapsInFlightStatuses) {
  EXPECT_EQ(step_for(FileStatus::PromptInProgress), StepKind::Prompt);
  EXPECT_EQ(step_for(FileStatus::VerifyInProgress), StepKind::Verify);
  EXPECT_EQ(step_for(FileStatus::FixupInProgress), StepKind::Fixup);
  EXPECT_FALSE(step_for(FileStatus::Pending).has_value());
  EXPECT_FALSE(step_for(FileStatus::Completed).has_value());
  EXPECT_TRUE(is_mutating(StepKind::Prompt));
  EXPECT_TRUE(is_mutating(StepKind::Fixup));
  EXPECT_FALSE(is_mutating(StepKind::Verify));
}

TEST(StateStringsTest, FileStatusNames_RoundTrip) {
  for (auto status :
       {FileStatus::Pending, FileStatus::PromptInProgress,
        FileStatus::AwaitingVerification, FileStatus::VerifyInProgress,
        FileStatus::FixupInProgress, FileStatus::Completed,
        FileStatus::Failed}) {
    EXPECT_EQ(parse_file_status(file_status_name(status)), status);
  }
  EXPECT_EQ(std::string_view(file_status_name(FileStatus::AwaitingVerification)),
            "awaiting_verification");
  EXPECT_FALSE(parse_file_status("verifying").has_value());
}
