#pragma once

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace looprunner {

struct GuardDecision {
  std::vector<std::string> unauthorized;

  [[nodiscard]] auto authorized() const noexcept -> bool {
    return unauthorized.empty();
  }
  // "unauthorized changes: a, b"; empty when authorized.
  [[nodiscard]] auto detail() const -> std::string;
};

// A pattern without '/' matches when it glob-matches any path component; a
// pattern with '/' is matched against the whole path and '*' crosses
// directory separators.
[[nodiscard]] auto matches_allowlist(std::string_view path,
                                     std::string_view pattern) -> bool;

[[nodiscard]] auto matches_any(std::string_view path,
                               const std::vector<std::string>& patterns)
    -> bool;

// A modified path is unauthorized when it matches none of `patterns` and was
// not already dirty in `baseline`. Order of `modified` is preserved.
[[nodiscard]] auto authorize(const std::vector<std::string>& patterns,
                             const std::vector<std::string>& modified,
                             const std::unordered_set<std::string>& baseline)
    -> GuardDecision;

}  // namespace looprunner
