#pragma once

#include <array>
#include <concepts>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace jobforge {

enum class Error : std::uint8_t {
  Success,
  ExecutionFailed,
  ParseFailed,
  Cancelled,
  JobAborted,
  AggregationFailed,
  InvalidArgument,
  FileNotFound,
  ConfigInvalid,
  Timeout,
  ProcessSpawnFailed,
  NotFound,
  Unknown,
};

class ErrorCategory : public std::error_category {
  static constexpr std::array<std::string_view, 13> messages = {
      "success",
      "execution failed",
      "malformed response",
      "cancelled",
      "job aborted",
      "aggregation failed",
      "invalid argument",
      "file not found",
      "invalid configuration",
      "timeout",
      "failed to spawn process",
      "not found",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "jobforge";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      return "unrecognized error";
    }
    return std::string{messages.at(idx)};
  }

  using std::error_category::equivalent;

  [[nodiscard]] auto equivalent(int code,
                                const std::error_condition &cond) const noexcept
      -> bool override {
    if (cond.category() != std::generic_category()) {
      return false;
    }
    switch (static_cast<Error>(code)) {
    case Error::Cancelled:
      return cond.value() == static_cast<int>(std::errc::operation_canceled);
    case Error::Timeout:
      return cond.value() == static_cast<int>(std::errc::timed_out);
    case Error::InvalidArgument:
      return cond.value() == static_cast<int>(std::errc::invalid_argument);
    default:
      return false;
    }
  }
};

inline auto error_category() -> const ErrorCategory & {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

template <typename T>
concept ResultValue = std::destructible<T> || std::is_void_v<T>;

template <typename T> using Result = std::expected<T, std::error_code>;

template <typename T>
  requires ResultValue<std::decay_t<T>>
[[nodiscard]] constexpr auto ok(T &&value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> { return {}; }

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

} // namespace jobforge

template <> struct std::is_error_code_enum<jobforge::Error> : std::true_type {};
