#include "looprunner/pipeline/change_guard.hpp"

#include <fnmatch.h>

#include <algorithm>
#include <ranges>

namespace looprunner {

auto GuardDecision::detail() const -> std::string {
  if (unauthorized.empty()) {
    return {};
  }
  std::string out = "unauthorized changes: ";
  for (std::size_t i = 0; i < unauthorized.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += unauthorized[i];
  }
  return out;
}

auto matches_allowlist(std::string_view path, std::string_view pattern)
    -> bool {
  if (pattern.empty() || path.empty()) {
    return false;
  }
  std::string pat(pattern);

  if (pattern.contains('/')) {
    std::string whole(path);
    return ::fnmatch(pat.c_str(), whole.c_str(), 0) == 0;
  }

  for (auto part : path | std::views::split('/')) {
    std::string component(part.begin(), part.end());
    if (component.empty()) {
      continue;
    }
    if (::fnmatch(pat.c_str(), component.c_str(), 0) == 0) {
      return true;
    }
  }
  return false;
}

auto matches_any(std::string_view path,
                 const std::vector<std::string>& patterns) -> bool {
  return std::ranges::any_of(patterns, [&](const std::string& p) {
    return matches_allowlist(path, p);
  });
}

auto authorize(const std::vector<std::string>& patterns,
               const std::vector<std::string>& modified,
               const std::unordered_set<std::string>& baseline)
    -> GuardDecision {
  GuardDecision decision;
  for (const auto& path : modified) {
    if (baseline.contains(path) || matches_any(path, patterns)) {
      continue;
    }
    if (std::ranges::find(decision.unauthorized, path) ==
        decision.unauthorized.end()) {
      decision.unauthorized.push_back(path);
    }
  }
  return decision;
}

}  // namespace looprunner
