#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace looprunner {

struct PatternContext {
  std::string_view file_path;
  std::string_view task_id;
  std::string_view allowlist{"{file_stem}*"};
  // Directory the file paths are relative to; globbing runs there.
  std::filesystem::path root{"."};
};

// "src/parser.test.ts" -> "parser": extension, then a ".test"/".spec" suffix.
[[nodiscard]] auto extract_file_stem(std::string_view path) -> std::string;

// Substitutes {file}, {file_stem}, {file_dir} and {file_name} only.
[[nodiscard]] auto instantiate_allowlist(std::string_view allowlist,
                                         std::string_view file_path)
    -> std::string;

// Full placeholder set. {all_files}, {test_files} and {created_files} glob
// the filesystem and are only evaluated when present in `pattern`.
[[nodiscard]] auto expand_pattern(std::string_view pattern,
                                  const PatternContext& ctx) -> std::string;

[[nodiscard]] auto find_all_files(const PatternContext& ctx)
    -> std::vector<std::string>;
[[nodiscard]] auto find_test_files(const PatternContext& ctx)
    -> std::vector<std::string>;
[[nodiscard]] auto find_created_files(const PatternContext& ctx)
    -> std::vector<std::string>;

auto replace_all(std::string& text, std::string_view from, std::string_view to)
    -> void;

}  // namespace looprunner
