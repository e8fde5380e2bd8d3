#pragma once

#include <concepts>
#include <cstdint>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace looprunner {

struct TaskTag {};

// Type-safe ID wrapper using phantom type pattern
template <typename Tag>
class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}

  TypedId() = default;

  [[nodiscard]] auto value() const -> std::string_view { return value_; }
  [[nodiscard]] auto str() const -> const std::string& { return value_; }

  [[nodiscard]] explicit operator std::string() const { return value_; }

  [[nodiscard]] auto empty() const -> bool { return value_.empty(); }

  [[nodiscard]] friend auto operator<=>(const TypedId& lhs, const TypedId& rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId& lhs, const TypedId& rhs) -> bool = default;

private:
  std::string value_;
};

using TaskId = TypedId<TaskTag>;

inline constexpr std::string_view kTaskIdPrefix = "task_";

// Task ids are "task_<seq>"; the sequence number also names the state file.
inline auto make_task_id(std::int64_t seq) -> TaskId {
  return TaskId{std::format("{}{}", kTaskIdPrefix, seq)};
}

template <typename Tag>
inline auto operator<<(std::ostream& os, const TypedId<Tag>& id) -> std::ostream& {
  return os << id.value();
}

}  // namespace looprunner

template <typename Tag>
struct std::hash<looprunner::TypedId<Tag>> {
  auto operator()(const looprunner::TypedId<Tag>& id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<looprunner::TypedId<Tag>> : std::formatter<std::string> {
  auto format(const looprunner::TypedId<Tag>& id, auto& ctx) const {
    return std::formatter<std::string>::format(std::string(id.value()), ctx);
  }
};
