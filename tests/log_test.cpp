#include "jobforge/util/log.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

using namespace jobforge;

namespace {

auto slurp(const std::string &path) -> std::string {
  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

} // namespace

TEST(LogTest, ParseLevelFallsBackToInfo) {
  EXPECT_EQ(log::parse_level("debug"), log::Level::Debug);
  EXPECT_EQ(log::parse_level("error"), log::Level::Error);
  EXPECT_EQ(log::parse_level("loud"), log::Level::Info);
}

TEST(LogTest, SynchronousWritesHonourLevel) {
  auto path = test::make_temp_path("jobforge_log_");
  ASSERT_FALSE(path.empty());
  ASSERT_TRUE(log::set_output_file(path));
  log::set_level(log::Level::Warn);

  log::info("hidden {}", 1);
  log::warn("visible {}", 2);

  ASSERT_TRUE(log::set_output_file(""));
  auto text = slurp(path);
  EXPECT_EQ(text.find("hidden 1"), std::string::npos);
  EXPECT_NE(text.find("visible 2"), std::string::npos);
  std::remove(path.c_str());
}

TEST(LogTest, AsyncWriterFlushesOnStop) {
  auto path = test::make_temp_path("jobforge_log_");
  ASSERT_FALSE(path.empty());
  log::set_level(log::Level::Info);
  log::start();
  ASSERT_TRUE(log::set_output_file(path));
  for (int i = 0; i < 100; ++i) {
    log::info("line {}", i);
  }
  log::stop();
  EXPECT_EQ(log::logger().dropped(), 0U);
  ASSERT_TRUE(log::set_output_file(""));
  log::set_level(log::Level::Warn);

  auto text = slurp(path);
  EXPECT_NE(text.find("line 0"), std::string::npos);
  EXPECT_NE(text.find("line 99"), std::string::npos);
  std::remove(path.c_str());
}

TEST(LogTest, WriterRestartsAfterStop) {
  auto path = test::make_temp_path("jobforge_log_");
  ASSERT_FALSE(path.empty());
  log::set_level(log::Level::Info);
  for (int round = 0; round < 20; ++round) {
    log::start();
    log::stop();
  }
  log::start();
  ASSERT_TRUE(log::set_output_file(path));
  log::info("after restart");
  log::stop();
  ASSERT_TRUE(log::set_output_file(""));
  log::set_level(log::Level::Warn);

  EXPECT_NE(slurp(path).find("after restart"), std::string::npos);
  std::remove(path.c_str());
}

TEST(LogTest, StderrOutputReceivesLines) {
  ::testing::internal::CaptureStderr();
  log::set_output_stderr();
  log::warn("to stderr {}", 7);
  ASSERT_TRUE(log::set_output_file(""));
  auto captured = ::testing::internal::GetCapturedStderr();
  EXPECT_NE(captured.find("to stderr 7"), std::string::npos);
}
