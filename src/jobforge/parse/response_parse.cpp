#include "jobforge/parse/response_parse.hpp"

#include <cctype>
#include <format>

namespace jobforge::parse {

auto trim(std::string_view text) -> std::string_view {
  constexpr std::string_view kSpace = " \t\r\n\f\v";
  const auto first = text.find_first_not_of(kSpace);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(kSpace);
  return text.substr(first, last - first + 1);
}

auto extract_tagged(std::string_view text, std::string_view tag)
    -> std::optional<std::string_view> {
  const auto open = std::format("<{}>", tag);
  const auto close = std::format("</{}>", tag);
  const auto begin = text.find(open);
  if (begin == std::string_view::npos) {
    return std::nullopt;
  }
  const auto body_begin = begin + open.size();
  const auto end = text.find(close, body_begin);
  if (end == std::string_view::npos) {
    return std::nullopt;
  }
  return trim(text.substr(body_begin, end - body_begin));
}

auto parse_numbered_list(std::string_view text) -> std::vector<std::string> {
  std::vector<std::string> items;
  while (!text.empty()) {
    const auto nl = text.find('\n');
    auto line = trim(text.substr(0, nl));
    text = nl == std::string_view::npos ? std::string_view{}
                                        : text.substr(nl + 1);

    std::size_t digits = 0;
    while (digits < line.size() &&
           std::isdigit(static_cast<unsigned char>(line[digits])) != 0) {
      ++digits;
    }
    if (digits == 0 || digits >= line.size() ||
        (line[digits] != '.' && line[digits] != ')')) {
      continue;
    }
    auto item = trim(line.substr(digits + 1));
    if (!item.empty()) {
      items.emplace_back(item);
    }
  }
  return items;
}

auto require_non_empty(std::string_view text) -> Result<std::string> {
  auto trimmed = trim(text);
  if (trimmed.empty()) {
    return fail(Error::ParseFailed);
  }
  return ok(std::string(trimmed));
}

} // namespace jobforge::parse
