#pragma once

#include "nudge/util/id.hpp"
#include "nudge/util/util.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace nudge {

enum class Priority : std::uint8_t {
  Low,
  Medium,
  High,
};

enum class TaskStatus : std::uint8_t {
  Pending,
  Completed,
  Overdue,
};

struct Task {
  TaskId id;
  UserId owner;
  std::string title;
  std::string description;
  TimePoint due_at{};
  Priority priority{Priority::Medium};
  TaskStatus status{TaskStatus::Pending};
  TimePoint created_at{};
  TimePoint updated_at{};
  std::optional<TimePoint> completed_at;
};

}  // namespace nudge
