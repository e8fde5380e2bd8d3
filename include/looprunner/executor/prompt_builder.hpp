#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace looprunner {

inline constexpr std::string_view kResultMarker = "RESULT:";

struct PromptInput {
  std::string_view base_prompt;
  std::string_view file_path;
  // Allowlist already instantiated for this file.
  std::string_view allowlist;
  std::string_view metadata;
};

[[nodiscard]] auto build_prompt(const PromptInput& in) -> std::string;

// `verify_output` is the captured output of the failed verification.
[[nodiscard]] auto build_fixup_prompt(const PromptInput& in,
                                      std::string_view verify_output)
    -> std::string;

// Value of the last non-empty "RESULT:" line as JSON text. Text that is not
// valid JSON is stored as a JSON string. nullopt when no such line exists.
[[nodiscard]] auto parse_result(std::string_view stdout_output)
    -> std::optional<std::string>;

}  // namespace looprunner
