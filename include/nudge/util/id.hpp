#pragma once

#include <compare>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace nudge {

struct UserTag {};
struct TaskTag {};
struct NotificationTag {};

// Phantom-typed string id; UserId and TaskId cannot be swapped by accident.
template <typename Tag>
class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}

  TypedId() = default;

  [[nodiscard]] auto value() const -> std::string_view { return value_; }
  [[nodiscard]] auto str() const -> const std::string& { return value_; }
  [[nodiscard]] auto empty() const -> bool { return value_.empty(); }

  [[nodiscard]] friend auto operator<=>(const TypedId& lhs,
                                        const TypedId& rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId& lhs, const TypedId& rhs)
      -> bool = default;

private:
  std::string value_;
};

using UserId = TypedId<UserTag>;
using TaskId = TypedId<TaskTag>;
using NotificationId = TypedId<NotificationTag>;

// Lets gtest print ids in assertion failures.
template <typename Tag>
inline auto operator<<(std::ostream& os, const TypedId<Tag>& id)
    -> std::ostream& {
  return os << id.value();
}

}  // namespace nudge

template <typename Tag>
struct std::hash<nudge::TypedId<Tag>> {
  auto operator()(const nudge::TypedId<Tag>& id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<nudge::TypedId<Tag>> : std::formatter<std::string_view> {
  auto format(const nudge::TypedId<Tag>& id, auto& ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
