#pragma once

#include "jobforge/config/job_config.hpp"

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace jobforge {

struct LoggingConfig {
  std::string level{"info"};
  std::string file; // empty = stdout

  auto operator==(const LoggingConfig &) const -> bool = default;
};

struct CommandCapabilityConfig {
  std::string program{"claude"};
  // "{profile}" in any argument is replaced by the execution profile.
  std::vector<std::string> args{"-p", "--model", "{profile}", "--max-turns",
                                "1"};
  std::string working_dir;
  std::chrono::seconds timeout{std::chrono::seconds(600)};
  // Decode stdout as line-delimited JSON messages instead of plain text.
  bool stream_json{false};
  std::map<std::string, std::string> env;

  auto operator==(const CommandCapabilityConfig &) const -> bool = default;
};

struct EngineConfig {
  JobConfig defaults;
  LoggingConfig logging;
  CommandCapabilityConfig command;

  auto operator==(const EngineConfig &) const -> bool = default;
};

} // namespace jobforge
