#include "jobforge/capability/response_stream.hpp"

#include "jobforge/util/json.hpp"
#include "jobforge/util/log.hpp"

#include <glaze/json.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace jobforge::detail {

struct StreamContentBlock {
  std::string type;
  std::string text;
};

struct StreamMessageBody {
  // Either a plain string or an array of typed blocks.
  std::variant<std::string, std::vector<StreamContentBlock>> content;
};

struct StreamMessage {
  std::string type;
  std::string subtype;
  std::optional<StreamMessageBody> message;
  std::optional<std::string> result;
};

} // namespace jobforge::detail

namespace glz {
template <> struct meta<jobforge::detail::StreamContentBlock> {
  using T = jobforge::detail::StreamContentBlock;
  static constexpr auto value = object("type", &T::type, "text", &T::text);
};

template <> struct meta<jobforge::detail::StreamMessageBody> {
  using T = jobforge::detail::StreamMessageBody;
  static constexpr auto value = object("content", &T::content);
};

template <> struct meta<jobforge::detail::StreamMessage> {
  using T = jobforge::detail::StreamMessage;
  static constexpr auto value =
      object("type", &T::type, "subtype", &T::subtype, "message", &T::message,
             "result", &T::result);
};
} // namespace glz

namespace jobforge {

namespace {

[[nodiscard]] auto is_blank(std::string_view line) -> bool {
  return line.find_first_not_of(" \t\r") == std::string_view::npos;
}

} // namespace

auto ResponseAssembler::feed_line(std::string_view line) -> Result<void> {
  if (is_blank(line)) {
    return ok();
  }
  auto msg = read_json<detail::StreamMessage>(line);
  if (!msg) {
    log::debug("unparseable stream line: {}", line.substr(0, 120));
    return fail(msg.error());
  }
  ++messages_;

  if (msg->type == "assistant" && msg->message) {
    const auto &content = msg->message->content;
    if (const auto *text = std::get_if<std::string>(&content)) {
      text_ += *text;
    } else {
      for (const auto &block : std::get<std::vector<detail::StreamContentBlock>>(
               content)) {
        if (block.type == "text") {
          text_ += block.text;
        }
      }
    }
  } else if (msg->type == "result") {
    if (msg->subtype == "success" && msg->result) {
      result_ = *msg->result;
    } else if (msg->subtype != "success") {
      saw_error_result_ = true;
    }
  }
  return ok();
}

auto ResponseAssembler::feed(std::string_view chunk) -> Result<void> {
  pending_.append(chunk);
  std::size_t start = 0;
  for (auto nl = pending_.find('\n', start); nl != std::string::npos;
       nl = pending_.find('\n', start)) {
    auto line = std::string_view(pending_).substr(start, nl - start);
    if (auto r = feed_line(line); !r) {
      pending_.clear();
      return r;
    }
    start = nl + 1;
  }
  pending_.erase(0, start);
  return ok();
}

auto ResponseAssembler::finish() -> Result<std::string> {
  if (!pending_.empty()) {
    auto line = std::move(pending_);
    pending_.clear();
    if (auto r = feed_line(line); !r) {
      return fail(r.error());
    }
  }
  if (!text_.empty()) {
    return ok(std::move(text_));
  }
  if (!result_.empty()) {
    return ok(std::move(result_));
  }
  if (saw_error_result_) {
    return fail(Error::ExecutionFailed);
  }
  return ok(std::string{});
}

auto ResponseAssembler::assemble(std::string_view stream)
    -> Result<std::string> {
  ResponseAssembler assembler;
  if (auto r = assembler.feed(stream); !r) {
    return fail(r.error());
  }
  return assembler.finish();
}

} // namespace jobforge
