#pragma once

#include "looprunner/task/file_state.hpp"

#include <array>
#include <optional>
#include <ranges>
#include <string_view>
#include <utility>

namespace looprunner {

namespace detail {

constexpr std::array<std::string_view, 7> kFileStatusNames = {
    "pending",
    "prompt_in_progress",
    "awaiting_verification",
    "verify_in_progress",
    "fixup_in_progress",
    "completed",
    "failed",
};

constexpr std::array<std::string_view, 2> kRegistryStatusNames = {
    "incomplete",
    "completed",
};

}  // namespace detail

enum class RegistryStatus : std::uint8_t {
  Incomplete,
  Completed,
};

[[nodiscard]] inline auto file_status_name(FileStatus status) noexcept
    -> const char* {
  auto idx = std::to_underlying(status);
  return idx < detail::kFileStatusNames.size()
             ? detail::kFileStatusNames[idx].data()
             : "unknown";
}

// Unknown names yield nullopt; the resume loader treats them as corruption.
[[nodiscard]] inline auto parse_file_status(std::string_view name) noexcept
    -> std::optional<FileStatus> {
  auto it = std::ranges::find(detail::kFileStatusNames, name);
  if (it != detail::kFileStatusNames.end()) {
    return static_cast<FileStatus>(
        std::ranges::distance(detail::kFileStatusNames.begin(), it));
  }
  return std::nullopt;
}

[[nodiscard]] inline auto registry_status_name(RegistryStatus status) noexcept
    -> const char* {
  auto idx = std::to_underlying(status);
  return idx < detail::kRegistryStatusNames.size()
             ? detail::kRegistryStatusNames[idx].data()
             : "incomplete";
}

[[nodiscard]] inline auto parse_registry_status(std::string_view name) noexcept
    -> std::optional<RegistryStatus> {
  auto it = std::ranges::find(detail::kRegistryStatusNames, name);
  if (it != detail::kRegistryStatusNames.end()) {
    return static_cast<RegistryStatus>(
        std::ranges::distance(detail::kRegistryStatusNames.begin(), it));
  }
  return std::nullopt;
}

}  // namespace looprunner
