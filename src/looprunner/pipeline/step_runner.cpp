#include "looprunner/pipeline/step_runner.hpp"

#include "looprunner/core/constants.hpp"
#include "looprunner/executor/prompt_builder.hpp"
#include "looprunner/pipeline/change_guard.hpp"
#include "looprunner/util/log.hpp"
#include "looprunner/util/pattern.hpp"
#include "looprunner/util/util.hpp"

#include <format>

namespace looprunner {

namespace {

auto pattern_context(const FileState& file, const StepContext& ctx)
    -> PatternContext {
  return PatternContext{
      .file_path = file.path,
      .task_id = ctx.task_id.value(),
      .allowlist = ctx.config.allowlist_pattern,
      .root = ctx.config.working_dir.empty() ? "." : ctx.config.working_dir,
  };
}

auto output_of(const ExecutorResult& r) -> std::string_view {
  return r.stderr_output.empty() ? r.stdout_output : r.stderr_output;
}

}  // namespace

auto describe_failure(const ExecutorResult& r) -> std::string {
  if (!r.error.empty()) {
    return r.error;
  }
  if (r.timed_out) {
    return "timed out";
  }
  auto out = output_of(r);
  if (out.empty()) {
    return std::format("exit code {}", r.exit_code);
  }
  return std::format("exit code {}: {}", r.exit_code,
                     tail(out, limits::kErrorSummaryBytes));
}

StepRunner::StepRunner(IExecutor& executor, IChangeTracker& tracker,
                       FailureLog* failures)
    : executor_(executor), tracker_(tracker), failures_(failures) {
}

auto StepRunner::record(std::string_view file_path, std::string_view message)
    -> void {
  if (failures_ == nullptr) {
    return;
  }
  if (auto r = failures_->append(file_path, message); !r) {
    log::warn("Could not write failure log for {}", file_path);
  }
}

auto StepRunner::run(StepKind kind, const FileState& file,
                     const StepContext& ctx) -> StepReport {
  StepReport report;

  auto before = tracker_.checkpoint();
  if (!before) {
    report.event = Event::ExecutorError;
    report.detail = std::format("change tracking failed: {}",
                                before.error().message());
    return report;
  }

  switch (kind) {
    case StepKind::Prompt:
      run_prompt(file, ctx, report);
      break;
    case StepKind::Verify:
      run_verify(file, ctx, report);
      break;
    case StepKind::Fixup:
      run_fixup(file, ctx, report);
      break;
  }

  auto modified = tracker_.diff_since(*before);
  if (!modified) {
    report.event = Event::ExecutorError;
    report.detail = std::format("change tracking failed: {}",
                                modified.error().message());
    return report;
  }

  std::vector<std::string> patterns;
  patterns.reserve(ctx.global_allowlist.size() + 1);
  patterns.push_back(
      instantiate_allowlist(ctx.config.allowlist_pattern, file.path));
  patterns.insert(patterns.end(), ctx.global_allowlist.begin(),
                  ctx.global_allowlist.end());

  auto decision = authorize(patterns, *modified, ctx.baseline);
  if (!decision.authorized()) {
    log::warn("{}: {} changed {} path(s) outside its allowlist", file.path,
              step_name(kind), decision.unauthorized.size());
    record(file.path, std::format("UNAUTHORIZED CHANGES after {} step:\n{}",
                                  step_name(kind), decision.detail()));
    report.unauthorized = std::move(decision.unauthorized);
  }
  return report;
}

auto StepRunner::run_prompt(const FileState& file, const StepContext& ctx,
                            StepReport& report) -> void {
  auto pctx = pattern_context(file, ctx);
  auto allowlist = instantiate_allowlist(ctx.config.allowlist_pattern, file.path);
  auto prompt = build_prompt(PromptInput{
      .base_prompt = expand_pattern(ctx.config.prompt, pctx),
      .file_path = file.path,
      .allowlist = allowlist,
      .metadata = file.metadata,
  });

  auto r = executor_.run(prompt, file.path, file.metadata);
  report.result = parse_result(r.stdout_output);
  if (r.succeeded()) {
    report.event = Event::StepSucceeded;
    return;
  }
  report.event = r.ran() ? Event::StepFailed : Event::ExecutorError;
  report.detail = std::format("prompt failed: {}", describe_failure(r));
  record(file.path, std::format("PROMPT FAILED\n{}\n\nSTDOUT:\n{}\n\nSTDERR:\n{}",
                                report.detail, r.stdout_output,
                                r.stderr_output));
}

auto StepRunner::run_verify(const FileState& file, const StepContext& ctx,
                            StepReport& report) -> void {
  auto command = expand_pattern(ctx.config.verify_command.value_or(""),
                                pattern_context(file, ctx));
  auto r = executor_.verify(command);
  if (r.succeeded()) {
    report.event = Event::StepSucceeded;
    return;
  }

  if (!r.ran()) {
    report.event = Event::ExecutorError;
    report.detail = std::format("verification could not run: {}",
                                describe_failure(r));
  } else {
    report.event = Event::StepFailed;
    report.detail = tail(output_of(r), limits::kErrorSummaryBytes);
    if (report.detail.empty()) {
      report.detail = std::format("verification exited with code {}",
                                  r.exit_code);
    }
  }
  record(file.path,
         std::format("VERIFICATION FAILED (attempt {}/{})\nCommand: {}\n"
                     "Exit code: {}\n\nOutput:\n{}",
                     file.retry_count + 1, ctx.config.max_retries + 1, command,
                     r.exit_code, r.error.empty() ? output_of(r) : r.error));
}

auto StepRunner::run_fixup(const FileState& file, const StepContext& ctx,
                           StepReport& report) -> void {
  auto pctx = pattern_context(file, ctx);
  auto allowlist = instantiate_allowlist(ctx.config.allowlist_pattern, file.path);
  auto base = ctx.config.fixup_prompt.has_value()
                  ? expand_pattern(*ctx.config.fixup_prompt, pctx)
                  : std::string(kDefaultFixupPrompt);
  auto prompt = build_fixup_prompt(
      PromptInput{
          .base_prompt = base,
          .file_path = file.path,
          .allowlist = allowlist,
          .metadata = file.metadata,
      },
      file.last_error.value_or(""));
  record(file.path, std::format("FIXUP PROMPT SENT:\n{}", prompt));

  auto r = executor_.run(prompt, file.path, file.metadata);
  record(file.path, std::format("FIXUP RESPONSE (exit {}):\n\nSTDOUT:\n{}\n\n"
                                "STDERR:\n{}",
                                r.exit_code, r.stdout_output, r.stderr_output));
  if (auto parsed = parse_result(r.stdout_output)) {
    report.result = std::move(parsed);
  }
  if (!r.ran()) {
    report.event = Event::ExecutorError;
    report.detail = std::format("fixup could not run: {}", describe_failure(r));
    return;
  }
  report.event = r.exit_code == 0 ? Event::StepSucceeded : Event::StepFailed;
}

}  // namespace looprunner
