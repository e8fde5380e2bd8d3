#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <format>
#include <string>
#include <string_view>

namespace looprunner {

inline auto now_ms() -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

inline auto format_timestamp(std::int64_t epoch_ms) -> std::string {
  auto time = static_cast<std::time_t>(epoch_ms / 1000);
  std::tm tm{};
  gmtime_r(&time, &tm);
  return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}Z",
                     tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                     tm.tm_min, tm.tm_sec);
}

inline auto format_timestamp() -> std::string {
  return format_timestamp(now_ms());
}

// UTF-8 continuation bytes look like 10xxxxxx.
inline auto is_continuation_byte(char c) -> bool {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Keeps the tail of `text`, where verification tools print their summary.
// The cut never splits a UTF-8 sequence.
inline auto tail(std::string_view text, std::size_t max_bytes) -> std::string {
  if (text.size() <= max_bytes) {
    return std::string{text};
  }
  auto start = text.size() - max_bytes;
  while (start < text.size() && is_continuation_byte(text[start])) {
    ++start;
  }
  return std::format("...{}", text.substr(start));
}

inline auto shorten(std::string_view text, std::size_t max_chars)
    -> std::string {
  if (text.size() <= max_chars) {
    return std::string{text};
  }
  auto end = max_chars > 3 ? max_chars - 3 : 0;
  while (end > 0 && is_continuation_byte(text[end])) {
    --end;
  }
  return std::format("{}...", text.substr(0, end));
}

}  // namespace looprunner
