#pragma once

#include "nudge/core/error.hpp"
#include "nudge/util/util.hpp"

#include <bitset>
#include <chrono>
#include <string>
#include <string_view>

namespace nudge {

// Five-field cron expression (minute hour day-of-month month day-of-week)
// plus the @hourly/@daily/@weekly/@monthly/@yearly macros.
class CronExpr {
public:
  CronExpr() = default;

  [[nodiscard]] static auto parse(std::string_view expr) -> Result<CronExpr>;

  // First matching minute strictly after `after`. Fields are matched against
  // wall-clock time at UTC + `utc_offset`. Returns TimePoint::max() when
  // nothing matches within five years.
  [[nodiscard]] auto next_after(TimePoint after,
                                std::chrono::minutes utc_offset = {}) const
      -> TimePoint;

  [[nodiscard]] auto raw() const noexcept -> std::string_view {
    return raw_;
  }

private:
  struct Fields {
    std::bitset<60> minute;
    std::bitset<24> hour;
    std::bitset<32> dom;
    std::bitset<13> month;
    std::bitset<7> dow;
    bool dom_any{true};
    bool dow_any{true};
  };

  CronExpr(std::string raw, Fields fields);

  [[nodiscard]] auto day_matches(std::chrono::sys_days day) const -> bool;

  std::string raw_;
  Fields fields_;
};

}  // namespace nudge
