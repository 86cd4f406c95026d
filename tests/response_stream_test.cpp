#include "jobforge/capability/response_stream.hpp"

#include "gtest/gtest.h"

#include <string>

using namespace jobforge;

TEST(ResponseStreamTest, ConcatenatesAssistantTextBlocks) {
  const std::string stream =
      R"({"type":"system","subtype":"init"})"
      "\n"
      R"({"type":"assistant","message":{"content":[{"type":"text","text":"Hello, "},{"type":"tool_use","id":"t1"}]}})"
      "\n"
      R"({"type":"assistant","message":{"content":[{"type":"text","text":"world"}]}})"
      "\n"
      R"({"type":"result","subtype":"success","result":"ignored"})"
      "\n";

  auto text = ResponseAssembler::assemble(stream);
  ASSERT_TRUE(text.has_value()) << text.error().message();
  EXPECT_EQ(*text, "Hello, world");
}

TEST(ResponseStreamTest, PlainStringContentIsAccepted) {
  auto text = ResponseAssembler::assemble(
      R"({"type":"assistant","message":{"content":"plain"}})");
  ASSERT_TRUE(text.has_value());
  EXPECT_EQ(*text, "plain");
}

TEST(ResponseStreamTest, ResultUsedWhenNoAssistantText) {
  auto text = ResponseAssembler::assemble(
      R"({"type":"result","subtype":"success","result":"final answer"})"
      "\n\n");
  ASSERT_TRUE(text.has_value());
  EXPECT_EQ(*text, "final answer");
}

TEST(ResponseStreamTest, ErrorResultWithoutTextFails) {
  auto text = ResponseAssembler::assemble(
      R"({"type":"result","subtype":"error_max_turns"})");
  ASSERT_FALSE(text.has_value());
  EXPECT_EQ(text.error(), make_error_code(Error::ExecutionFailed));
}

TEST(ResponseStreamTest, MalformedLineFails) {
  auto text = ResponseAssembler::assemble("{\"type\":\"assistant\"\nnot json\n");
  ASSERT_FALSE(text.has_value());
  EXPECT_EQ(text.error(), make_error_code(Error::ParseFailed));
}

TEST(ResponseStreamTest, PartialLinesAreBufferedAcrossFeeds) {
  ResponseAssembler assembler;
  ASSERT_TRUE(assembler.feed(R"({"type":"assistant","mess)").has_value());
  EXPECT_EQ(assembler.messages_seen(), 0U);
  ASSERT_TRUE(
      assembler.feed(R"(age":{"content":[{"type":"text","text":"ab"}]}})"
                     "\n{\"type\":\"assistant\",")
          .has_value());
  EXPECT_EQ(assembler.messages_seen(), 1U);
  ASSERT_TRUE(assembler.feed(R"("message":{"content":"cd"}})").has_value());

  auto text = assembler.finish();
  ASSERT_TRUE(text.has_value());
  EXPECT_EQ(*text, "abcd");
  EXPECT_EQ(assembler.messages_seen(), 2U);
}

TEST(ResponseStreamTest, EmptyStreamYieldsEmptyText) {
  auto text = ResponseAssembler::assemble("");
  ASSERT_TRUE(text.has_value());
  EXPECT_TRUE(text->empty());
}
