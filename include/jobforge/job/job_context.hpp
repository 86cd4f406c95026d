#pragma once

#include "jobforge/util/id.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace jobforge {

using ExtensionValue = std::variant<bool, std::int64_t, double, std::string>;

/// Caller-specific data attached to a job. Values are typed; a lookup with
/// the wrong type behaves like a missing key.
class ContextExtensions {
public:
  auto set(std::string key, ExtensionValue value) -> void {
    values_.insert_or_assign(std::move(key), std::move(value));
  }

  [[nodiscard]] auto contains(std::string_view key) const -> bool {
    return values_.find(key) != values_.end();
  }

  template <typename T>
  [[nodiscard]] auto get(std::string_view key) const -> const T * {
    auto it = values_.find(key);
    if (it == values_.end()) {
      return nullptr;
    }
    return std::get_if<T>(&it->second);
  }

  template <typename T>
  [[nodiscard]] auto get_or(std::string_view key, T fallback) const -> T {
    if (const auto *v = get<T>(key)) {
      return *v;
    }
    return fallback;
  }

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return values_.size();
  }

private:
  std::map<std::string, ExtensionValue, std::less<>> values_;
};

struct JobContext {
  OwnerId owner_id;
  std::optional<WorkspaceId> workspace_id;
  // Polled before each wave and before each sub-task attempt.
  std::stop_token cancel_token;
  ContextExtensions extensions;

  [[nodiscard]] auto cancel_requested() const noexcept -> bool {
    return cancel_token.stop_requested();
  }
};

} // namespace jobforge
