#pragma once

#include "nudge/core/constants.hpp"
#include "nudge/core/error.hpp"
#include "nudge/model/task.hpp"
#include "nudge/util/id.hpp"

#include <bitset>
#include <initializer_list>
#include <string>
#include <utility>

namespace nudge {

class PrioritySet {
public:
  PrioritySet() = default;
  PrioritySet(std::initializer_list<Priority> priorities) {
    for (auto p : priorities) {
      insert(p);
    }
  }

  auto insert(Priority p) -> void { bits_.set(std::to_underlying(p)); }
  auto erase(Priority p) -> void { bits_.reset(std::to_underlying(p)); }

  [[nodiscard]] auto contains(Priority p) const -> bool {
    return bits_.test(std::to_underlying(p));
  }
  [[nodiscard]] auto empty() const -> bool { return bits_.none(); }

  friend auto operator==(const PrioritySet&, const PrioritySet&)
      -> bool = default;

private:
  std::bitset<3> bits_;
};

struct NotificationSettings {
  bool enabled{true};
  PrioritySet priorities{Priority::Medium, Priority::High};
  int reminder_lead_hours{limits::kDefaultLeadHours};
  bool overdue_alerts{true};
  bool daily_digest{true};

  [[nodiscard]] auto validate() const -> Result<void> {
    if (reminder_lead_hours < limits::kMinLeadHours ||
        reminder_lead_hours > limits::kMaxLeadHours) {
      return fail(Error::InvalidArgument);
    }
    return ok();
  }

  friend auto operator==(const NotificationSettings&,
                         const NotificationSettings&) -> bool = default;
};

struct User {
  UserId id;
  std::string email;
  NotificationSettings settings;
  TimePoint created_at{};
  TimePoint updated_at{};
};

}  // namespace nudge
