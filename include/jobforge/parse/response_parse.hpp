#pragma once

#include "jobforge/core/error.hpp"
#include "jobforge/util/json.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jobforge::parse {

[[nodiscard]] auto trim(std::string_view text) -> std::string_view;

/// Body of the first `<tag>...</tag>` block, trimmed.
[[nodiscard]] auto extract_tagged(std::string_view text, std::string_view tag)
    -> std::optional<std::string_view>;

/// Items of a numbered list ("1. first", "2) second"), in order. Lines that
/// are not list items are ignored.
[[nodiscard]] auto parse_numbered_list(std::string_view text)
    -> std::vector<std::string>;

/// Trimmed text, or Error::ParseFailed when nothing is left.
[[nodiscard]] auto require_non_empty(std::string_view text)
    -> Result<std::string>;

/// Decode the JSON inside `<tag>...</tag>`.
template <typename T>
[[nodiscard]] auto parse_tagged_json(std::string_view text,
                                     std::string_view tag) -> Result<T> {
  auto body = extract_tagged(text, tag);
  if (!body) {
    return fail(Error::ParseFailed);
  }
  return read_json<T>(*body);
}

} // namespace jobforge::parse
