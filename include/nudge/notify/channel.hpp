#pragma once

#include "nudge/core/error.hpp"
#include "nudge/util/id.hpp"

#include <string>
#include <string_view>

namespace nudge {

// Real-time push to a user's connected clients. Fire-and-forget: success
// means the event was handed off, not that anyone received it.
class Channel {
public:
  virtual ~Channel() = default;

  [[nodiscard]] virtual auto publish(const UserId& user, std::string_view event,
                                     std::string payload) -> Result<void> = 0;
};

}  // namespace nudge
