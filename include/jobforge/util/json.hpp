#pragma once

#include "jobforge/core/error.hpp"

#include <glaze/json.hpp>

#include <string_view>
#include <utility>

namespace jobforge {

/// Decode `input` into T, ignoring keys T does not describe. Any syntax or
/// type mismatch is Error::ParseFailed.
template <typename T>
[[nodiscard]] auto read_json(std::string_view input) -> Result<T> {
  T value{};
  constexpr auto kOpts =
      glz::opts{.null_terminated = false, .error_on_unknown_keys = false};
  if (auto ec = glz::read<kOpts>(value, input); ec) {
    return fail(Error::ParseFailed);
  }
  return ok(std::move(value));
}

} // namespace jobforge
