#include "jobforge/config/config.hpp"
#include "jobforge/config/job_config.hpp"
#include "jobforge/config/toml_util.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <string>

using namespace jobforge;

namespace {

// Sets an environment variable for the lifetime of the guard.
class ScopedEnv {
public:
  ScopedEnv(const char *name, const char *value) : name_(name) {
    ::setenv(name, value, 1);
  }
  ~ScopedEnv() { ::unsetenv(name_); }
  ScopedEnv(const ScopedEnv &) = delete;
  ScopedEnv &operator=(const ScopedEnv &) = delete;

private:
  const char *name_;
};

} // namespace

TEST(JobConfigTest, Defaults) {
  JobConfig cfg;
  EXPECT_EQ(cfg.concurrency_limit, 3U);
  EXPECT_EQ(cfg.retry_budget, 1U);
  EXPECT_EQ(cfg.max_attempts(), 2U);
  EXPECT_TRUE(cfg.continue_on_error);
  EXPECT_EQ(cfg.execution_profile, "standard");
}

TEST(JobConfigTest, MergeOverlaysOnlySetFields) {
  JobConfig defaults{.concurrency_limit = 5, .execution_profile = "fast"};
  auto merged = merge(defaults, JobConfigOverrides{.retry_budget = 4,
                                                   .continue_on_error = false});
  EXPECT_EQ(merged.concurrency_limit, 5U);
  EXPECT_EQ(merged.retry_budget, 4U);
  EXPECT_FALSE(merged.continue_on_error);
  EXPECT_EQ(merged.execution_profile, "fast");

  EXPECT_EQ(merge(defaults, {}), defaults);
}

TEST(JobConfigTest, MergeClampsZeroConcurrency) {
  EXPECT_EQ(merge(JobConfig{}, JobConfigOverrides{.concurrency_limit = 0})
                .concurrency_limit,
            1U);
  EXPECT_EQ(merge(JobConfig{.concurrency_limit = 0}, {}).concurrency_limit, 1U);
}

TEST(JobConfigTest, MaxAttemptsSaturatesAtUnboundedBudget) {
  constexpr auto kMax = std::numeric_limits<std::size_t>::max();
  JobConfig cfg{.retry_budget = kMax};
  EXPECT_EQ(cfg.max_attempts(), kMax);
  cfg.retry_budget = kMax - 1;
  EXPECT_EQ(cfg.max_attempts(), kMax);
  cfg.retry_budget = 0;
  EXPECT_EQ(cfg.max_attempts(), 1U);
}

TEST(ConfigTest, EngineDefaults) {
  EngineConfig cfg;
  EXPECT_EQ(cfg.defaults, JobConfig{});
  EXPECT_EQ(cfg.logging.level, "info");
  EXPECT_TRUE(cfg.logging.file.empty());
  EXPECT_EQ(cfg.command.program, "claude");
  EXPECT_EQ(cfg.command.timeout, std::chrono::seconds(600));
  EXPECT_FALSE(cfg.command.stream_json);
}

TEST(ConfigTest, MissingSectionsYieldDefaults) {
  auto result = ConfigLoader::load_from_string("[logging]\nlevel = \"info\"\n");
  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_EQ(*result, EngineConfig{});
}

TEST(ConfigTest, LoadFromTomlString) {
  std::string toml = R"(
[orchestrator]
concurrency = 6
retries = 2
continue_on_error = false
profile = "deep"

[logging]
level = "debug"
file = "/tmp/jobforge.log"

[command]
program = "/usr/local/bin/agent"
args = ["--profile", "{profile}"]
working_dir = "/srv/work"
timeout_sec = 90
stream_json = true
env = ["API_MODE=batch", "TRACE=1"]
)";

  auto result = ConfigLoader::load_from_string(toml);
  ASSERT_TRUE(result.has_value()) << result.error().message();

  EXPECT_EQ(result->defaults.concurrency_limit, 6U);
  EXPECT_EQ(result->defaults.retry_budget, 2U);
  EXPECT_FALSE(result->defaults.continue_on_error);
  EXPECT_EQ(result->defaults.execution_profile, "deep");
  EXPECT_EQ(result->logging.level, "debug");
  EXPECT_EQ(result->logging.file, "/tmp/jobforge.log");
  EXPECT_EQ(result->command.program, "/usr/local/bin/agent");
  EXPECT_EQ(result->command.args,
            (std::vector<std::string>{"--profile", "{profile}"}));
  EXPECT_EQ(result->command.working_dir, "/srv/work");
  EXPECT_EQ(result->command.timeout, std::chrono::seconds(90));
  EXPECT_TRUE(result->command.stream_json);
  ASSERT_EQ(result->command.env.size(), 2U);
  EXPECT_EQ(result->command.env.at("API_MODE"), "batch");
  EXPECT_EQ(result->command.env.at("TRACE"), "1");
}

TEST(ConfigTest, RejectsInvalidValues) {
  for (const char *toml : {"[orchestrator]\nconcurrency = 0\n",
                           "[orchestrator]\nretries = -1\n",
                           "[command]\ntimeout_sec = 0\n",
                           "[command]\nprogram = \"\"\n",
                           "[command]\nenv = [\"NOEQUALS\"]\n",
                           "[orchestrator\nconcurrency = 2\n"}) {
    auto result = ConfigLoader::load_from_string(toml);
    ASSERT_FALSE(result.has_value()) << toml;
    EXPECT_EQ(result.error(), make_error_code(Error::ConfigInvalid)) << toml;
  }
}

TEST(ConfigTest, EnvironmentOverridesFileValues) {
  ScopedEnv concurrency("JOBFORGE_CONCURRENCY", "9");
  ScopedEnv profile("JOBFORGE_PROFILE", "env-profile");
  ScopedEnv continue_on_error("JOBFORGE_CONTINUE_ON_ERROR", "false");
  ScopedEnv timeout("JOBFORGE_COMMAND_TIMEOUT_SEC", "15");

  auto result = ConfigLoader::load_from_string(
      "[orchestrator]\nconcurrency = 2\nprofile = \"file\"\n");
  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_EQ(result->defaults.concurrency_limit, 9U);
  EXPECT_EQ(result->defaults.execution_profile, "env-profile");
  EXPECT_FALSE(result->defaults.continue_on_error);
  EXPECT_EQ(result->command.timeout, std::chrono::seconds(15));
}

TEST(ConfigTest, NonNumericEnvironmentOverrideIsInvalid) {
  ScopedEnv retries("JOBFORGE_RETRIES", "many");
  auto result =
      ConfigLoader::load_from_string("[logging]\nlevel = \"info\"\n");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ConfigInvalid));
}

TEST(ConfigTest, LoadFromFile) {
  auto path = test::make_temp_path("jobforge_cfg_");
  ASSERT_FALSE(path.empty());
  {
    std::ofstream out(path);
    out << "[orchestrator]\nconcurrency = 4\n";
  }
  auto result = ConfigLoader::load_from_file(path);
  std::remove(path.c_str());

  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_EQ(result->defaults.concurrency_limit, 4U);
}

TEST(ConfigTest, MissingFileIsFileNotFound) {
  auto result = ConfigLoader::load_from_file("/nonexistent/jobforge.toml");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::FileNotFound));
}

TEST(ConfigTest, ApplyLoggingRejectsUnwritableFile) {
  LoggingConfig cfg{.level = "warn", .file = "/nonexistent-dir/jobforge.log"};
  auto applied = apply_logging(cfg);
  ASSERT_FALSE(applied.has_value());
  EXPECT_EQ(applied.error(), make_error_code(Error::FileNotFound));
}
