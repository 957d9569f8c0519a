#pragma once

#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace nudge {

// Value 0 is reserved: a std::error_code holding it reads as "no error".
enum class Error : int {
  Success,
  // Configuration
  FileNotFound,
  ParseError,
  InvalidArgument,
  // Storage
  DatabaseError,
  DatabaseOpenFailed,
  DatabaseQueryFailed,
  NotFound,
  AlreadyExists,
  // Delivery
  ChannelClosed,
};

[[nodiscard]] constexpr auto error_message(Error e) noexcept
    -> std::string_view {
  switch (e) {
    case Error::Success: return "success";
    case Error::FileNotFound: return "file not found";
    case Error::ParseError: return "parse error";
    case Error::InvalidArgument: return "invalid argument";
    case Error::DatabaseError: return "database is not open";
    case Error::DatabaseOpenFailed: return "failed to open database";
    case Error::DatabaseQueryFailed: return "database query failed";
    case Error::NotFound: return "not found";
    case Error::AlreadyExists: return "already exists";
    case Error::ChannelClosed: return "real-time channel is closed";
  }
  return "unknown error";
}

class ErrorCategory : public std::error_category {
public:
  [[nodiscard]] auto name() const noexcept -> const char* override {
    return "nudge";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    return std::string{error_message(static_cast<Error>(ev))};
  }
};

inline auto error_category() -> const ErrorCategory& {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

template <typename T>
using Result = std::expected<T, std::error_code>;

template <typename T>
[[nodiscard]] constexpr auto ok(T&& value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> {
  return {};
}

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

[[nodiscard]] inline auto is_error(const std::error_code& ec, Error e) -> bool {
  return ec == make_error_code(e);
}

}  // namespace nudge

template <>
struct std::is_error_code_enum<nudge::Error> : std::true_type {};

namespace nudge {

// Heterogeneous lookup for the registry's string keys
struct StringHash {
  using is_transparent = void;

  [[nodiscard]] auto operator()(std::string_view sv) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(sv);
  }
};

using StringEqual = std::equal_to<>;

}  // namespace nudge
