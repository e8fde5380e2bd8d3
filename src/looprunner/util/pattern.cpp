#include "looprunner/util/pattern.hpp"

#include <glob.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <ranges>
#include <system_error>

namespace looprunner {

namespace {

auto file_dir_of(std::string_view path) -> std::string {
  return std::filesystem::path(path).parent_path().string();
}

auto join(const std::vector<std::string>& items) -> std::string {
  std::string out;
  for (const auto& item : items) {
    if (!out.empty()) {
      out += ' ';
    }
    out += item;
  }
  return out;
}

// Bare patterns are searched next to the file.
auto allowlist_glob(const PatternContext& ctx) -> std::string {
  auto expanded = instantiate_allowlist(ctx.allowlist, ctx.file_path);
  if (expanded.contains('/')) {
    return expanded;
  }
  auto dir = file_dir_of(ctx.file_path);
  if (dir.empty() || dir == ".") {
    return expanded;
  }
  return dir + "/" + expanded;
}

auto collect_glob_matches(const std::filesystem::path& root,
                          const std::string& pattern)
    -> std::vector<std::string> {
  std::vector<std::string> out;
  auto absolute = (root / pattern).string();
  auto prefix = root.string();
  if (!prefix.empty() && !prefix.ends_with('/')) {
    prefix += '/';
  }

  glob_t matches{};
  if (::glob(absolute.c_str(), 0, nullptr, &matches) == 0) {
    for (std::size_t i = 0; i < matches.gl_pathc; ++i) {
      std::string match = matches.gl_pathv[i];
      std::error_code ec;
      if (!std::filesystem::is_regular_file(match, ec)) {
        continue;
      }
      if (match.starts_with(prefix)) {
        match.erase(0, prefix.size());
      }
      out.push_back(std::move(match));
    }
  }
  ::globfree(&matches);
  return out;
}

auto looks_like_test(std::string_view path) -> bool {
  std::string lower(path);
  std::ranges::transform(lower, lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  constexpr std::array<std::string_view, 7> markers = {
      ".test.", ".spec.", "_test.", "_spec.", "/test/", "/tests/",
      "/__tests__/"};
  return std::ranges::any_of(
      markers, [&](std::string_view m) { return lower.contains(m); });
}

}  // namespace

auto replace_all(std::string& text, std::string_view from, std::string_view to)
    -> void {
  if (from.empty()) {
    return;
  }
  std::size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
}

auto extract_file_stem(std::string_view path) -> std::string {
  auto stem = std::filesystem::path(path).stem().string();
  for (std::string_view suffix : {".test", ".spec"}) {
    if (stem.ends_with(suffix)) {
      stem.resize(stem.size() - suffix.size());
      break;
    }
  }
  return stem;
}

auto instantiate_allowlist(std::string_view allowlist,
                           std::string_view file_path) -> std::string {
  std::string out(allowlist);
  replace_all(out, "{file}", file_path);
  replace_all(out, "{file_stem}", extract_file_stem(file_path));
  replace_all(out, "{file_dir}", file_dir_of(file_path));
  replace_all(out, "{file_name}",
              std::filesystem::path(file_path).filename().string());
  return out;
}

auto expand_pattern(std::string_view pattern, const PatternContext& ctx)
    -> std::string {
  std::string out(pattern);

  // Filesystem-backed placeholders first: their values are plain paths.
  if (out.contains("{all_files}")) {
    replace_all(out, "{all_files}", join(find_all_files(ctx)));
  }
  if (out.contains("{test_files}")) {
    replace_all(out, "{test_files}", join(find_test_files(ctx)));
  }
  if (out.contains("{created_files}")) {
    replace_all(out, "{created_files}", join(find_created_files(ctx)));
  }

  replace_all(out, "{task_id}", ctx.task_id);
  return instantiate_allowlist(out, ctx.file_path);
}

auto find_all_files(const PatternContext& ctx) -> std::vector<std::string> {
  auto files = collect_glob_matches(ctx.root, allowlist_glob(ctx));
  std::string self(ctx.file_path);
  if (std::ranges::find(files, self) == files.end()) {
    files.insert(files.begin(), std::move(self));
  }
  return files;
}

auto find_test_files(const PatternContext& ctx) -> std::vector<std::string> {
  std::vector<std::string> out;
  for (auto& f : find_all_files(ctx)) {
    if (f != ctx.file_path && looks_like_test(f)) {
      out.push_back(std::move(f));
    }
  }
  return out;
}

auto find_created_files(const PatternContext& ctx)
    -> std::vector<std::string> {
  auto files = collect_glob_matches(ctx.root, allowlist_glob(ctx));
  std::erase(files, std::string(ctx.file_path));
  return files;
}

}  // namespace looprunner
