#pragma once

#include <chrono>
#include <cstddef>
#include <string_view>

namespace nudge {

namespace jobs {
// Registry keys of the two recurring sweeps
inline constexpr std::string_view kOverdueCheck = "overdueCheck";
inline constexpr std::string_view kDigest = "digest";
}  // namespace jobs

namespace limits {
inline constexpr int kMinLeadHours = 1;
inline constexpr int kMaxLeadHours = 24;
inline constexpr int kDefaultLeadHours = 2;
inline constexpr std::size_t kOverduePreview = 5;
inline constexpr std::size_t kNotificationListLimit = 50;
}  // namespace limits

namespace timing {
inline constexpr auto kIdleWait = std::chrono::seconds(60);
inline constexpr auto kLogIdleWait = std::chrono::milliseconds(100);
}  // namespace timing

}  // namespace nudge
