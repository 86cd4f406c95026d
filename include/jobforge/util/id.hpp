#pragma once

#include <algorithm>
#include <cctype>
#include <compare>
#include <concepts>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace jobforge {

[[nodiscard]] inline auto is_valid_id_text(std::string_view value) noexcept
    -> bool {
  return !value.empty() &&
         std::none_of(value.begin(), value.end(), [](unsigned char ch) {
           return std::iscntrl(ch) != 0;
         });
}

struct JobTag {};
struct SubTaskTag {};
struct OwnerTag {};
struct WorkspaceTag {};

// String identifier tagged with a phantom type so job, sub-task and owner ids
// cannot be swapped by accident.
template <typename Tag> class TypedId {
public:
  TypedId() = default;
  explicit TypedId(std::string value) : value_(std::move(value)) {}
  explicit TypedId(std::string_view value) : value_(value) {}
  explicit TypedId(const char *value) : value_(value ? value : "") {}

  [[nodiscard]] auto value() const noexcept -> std::string_view {
    return value_;
  }
  [[nodiscard]] auto str() const noexcept -> const std::string & {
    return value_;
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return value_.empty(); }

  [[nodiscard]] friend auto operator<=>(const TypedId &lhs,
                                        const TypedId &rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId &lhs, const TypedId &rhs)
      -> bool = default;
  [[nodiscard]] friend auto operator==(const TypedId &lhs,
                                       std::string_view rhs) noexcept -> bool {
    return lhs.value_ == rhs;
  }

private:
  std::string value_;
};

using JobId = TypedId<JobTag>;
using SubTaskId = TypedId<SubTaskTag>;
using OwnerId = TypedId<OwnerTag>;
using WorkspaceId = TypedId<WorkspaceTag>;

template <typename Tag>
inline auto operator<<(std::ostream &os, const TypedId<Tag> &id)
    -> std::ostream & {
  return os << id.value();
}

namespace detail {
[[nodiscard]] auto generate_time_ordered_hex() -> std::string;
} // namespace detail

/// Time-ordered job identifier of the form `job-<28 hex digits>`.
[[nodiscard]] inline auto generate_job_id() -> JobId {
  return JobId{"job-" + detail::generate_time_ordered_hex()};
}

} // namespace jobforge

template <typename Tag> struct std::hash<jobforge::TypedId<Tag>> {
  auto operator()(const jobforge::TypedId<Tag> &id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<jobforge::TypedId<Tag>>
    : std::formatter<std::string_view> {
  auto format(const jobforge::TypedId<Tag> &id, auto &ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
