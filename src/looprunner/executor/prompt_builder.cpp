#include "looprunner/executor/prompt_builder.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <ranges>
#include <vector>

namespace looprunner {

namespace {

constexpr std::string_view kResultInstruction =
    "When you are done, print exactly one line of the form\n"
    "RESULT: <json>\n"
    "carrying any structured data about the outcome, for example\n"
    "RESULT: {\"tests_added\": 4}\n"
    "If there is nothing to report, print RESULT: \"done\".\n";

auto scope_notice(std::string_view allowlist) -> std::string {
  return std::format(
      "Only files matching `{}` may be read or changed. Leave every other "
      "file untouched.\n",
      allowlist);
}

auto trim(std::string_view s) -> std::string_view {
  constexpr std::string_view ws = " \t\r\n";
  auto first = s.find_first_not_of(ws);
  if (first == std::string_view::npos) {
    return {};
  }
  auto last = s.find_last_not_of(ws);
  return s.substr(first, last - first + 1);
}

}  // namespace

auto build_prompt(const PromptInput& in) -> std::string {
  return std::format("{}\n\n{}\nTarget file: {}\nFile metadata: {}\n\n{}",
                     in.base_prompt, scope_notice(in.allowlist), in.file_path,
                     in.metadata, kResultInstruction);
}

auto build_fixup_prompt(const PromptInput& in, std::string_view verify_output)
    -> std::string {
  return std::format(
      "{}\n\n{}\nTarget file: {}\n\n"
      "The verification command failed with this output:\n```\n{}\n```\n\n"
      "Fix the problems it reports.\n\n{}",
      in.base_prompt, scope_notice(in.allowlist), in.file_path, verify_output,
      kResultInstruction);
}

auto parse_result(std::string_view stdout_output)
    -> std::optional<std::string> {
  std::vector<std::string_view> lines;
  for (auto part : stdout_output | std::views::split('\n')) {
    lines.emplace_back(part.begin(), part.end());
  }

  for (auto line : lines | std::views::reverse) {
    auto trimmed = trim(line);
    if (!trimmed.starts_with(kResultMarker)) {
      continue;
    }
    auto payload = trim(trimmed.substr(kResultMarker.size()));
    if (payload.empty()) {
      continue;
    }
    auto parsed = nlohmann::json::parse(payload.begin(), payload.end(),
                                         nullptr, false);
    // Agent output is not guaranteed to be UTF-8.
    constexpr auto kReplace = nlohmann::json::error_handler_t::replace;
    if (parsed.is_discarded()) {
      return nlohmann::json(std::string(payload)).dump(-1, ' ', false, kReplace);
    }
    return parsed.dump(-1, ' ', false, kReplace);
  }
  return std::nullopt;
}

}  // namespace looprunner
