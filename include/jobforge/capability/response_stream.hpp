#pragma once

#include "jobforge/core/error.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace jobforge {

/// Rebuilds response text from a line-delimited JSON message stream.
///
/// Text blocks of `assistant` messages are concatenated in arrival order. A
/// successful `result` message supplies the text only when no assistant text
/// arrived. Blank lines are skipped; a line that is not a JSON object fails
/// the whole stream with Error::ParseFailed.
class ResponseAssembler {
public:
  auto feed_line(std::string_view line) -> Result<void>;

  // Consumes complete lines; a trailing partial line is buffered until the
  // next feed() or finish().
  auto feed(std::string_view chunk) -> Result<void>;

  /// Flush any buffered partial line and return the assembled text.
  /// Error::ExecutionFailed when the stream reported an error result and no
  /// text arrived.
  [[nodiscard]] auto finish() -> Result<std::string>;

  [[nodiscard]] auto messages_seen() const noexcept -> std::size_t {
    return messages_;
  }

  /// Assemble a complete stream in one call.
  [[nodiscard]] static auto assemble(std::string_view stream)
      -> Result<std::string>;

private:
  std::string pending_;
  std::string text_;
  std::string result_;
  bool saw_error_result_{false};
  std::size_t messages_{0};
};

} // namespace jobforge
