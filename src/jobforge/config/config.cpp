#include "jobforge/config/config.hpp"
#include "jobforge/config/toml_util.hpp"

#include "jobforge/core/error.hpp"
#include "jobforge/util/log.hpp"

#include <boost/lexical_cast.hpp>

#include <cstdlib>
#include <string>
#include <string_view>
#include <vector>

namespace jobforge {
namespace detail {

struct OrchestratorToml {
  int concurrency{static_cast<int>(kDefaultConcurrencyLimit)};
  int retries{static_cast<int>(kDefaultRetryBudget)};
  bool continue_on_error{true};
  std::string profile{kDefaultExecutionProfile};
};

struct LoggingToml {
  std::string level{"info"};
  std::string file;
};

struct CommandToml {
  std::string program{"claude"};
  std::vector<std::string> args{"-p", "--model", "{profile}", "--max-turns",
                                "1"};
  std::string working_dir;
  int timeout_sec{600};
  bool stream_json{false};
  // KEY=VALUE entries
  std::vector<std::string> env;
};

struct EngineToml {
  OrchestratorToml orchestrator{};
  LoggingToml logging{};
  CommandToml command{};
};

} // namespace detail
} // namespace jobforge

namespace glz {
template <> struct meta<jobforge::detail::OrchestratorToml> {
  using T = jobforge::detail::OrchestratorToml;
  static constexpr auto value =
      object("concurrency", &T::concurrency, "retries", &T::retries,
             "continue_on_error", &T::continue_on_error, "profile",
             &T::profile);
};

template <> struct meta<jobforge::detail::LoggingToml> {
  using T = jobforge::detail::LoggingToml;
  static constexpr auto value = object("level", &T::level, "file", &T::file);
};

template <> struct meta<jobforge::detail::CommandToml> {
  using T = jobforge::detail::CommandToml;
  static constexpr auto value =
      object("program", &T::program, "args", &T::args, "working_dir",
             &T::working_dir, "timeout_sec", &T::timeout_sec, "stream_json",
             &T::stream_json, "env", &T::env);
};

template <> struct meta<jobforge::detail::EngineToml> {
  using T = jobforge::detail::EngineToml;
  static constexpr auto value =
      object("orchestrator", &T::orchestrator, "logging", &T::logging,
             "command", &T::command);
};
} // namespace glz

namespace jobforge {
namespace {

[[nodiscard]] auto env_flag(std::string_view v) -> bool {
  return v == "1" || v == "true" || v == "yes";
}

auto apply_env_overrides(detail::EngineToml &raw) -> void {
  if (const char *v = std::getenv("JOBFORGE_CONCURRENCY"); v != nullptr) {
    raw.orchestrator.concurrency = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("JOBFORGE_RETRIES"); v != nullptr) {
    raw.orchestrator.retries = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("JOBFORGE_CONTINUE_ON_ERROR");
      v != nullptr) {
    raw.orchestrator.continue_on_error = env_flag(v);
  }
  if (const char *v = std::getenv("JOBFORGE_PROFILE"); v != nullptr) {
    raw.orchestrator.profile = v;
  }
  if (const char *v = std::getenv("JOBFORGE_LOG_LEVEL"); v != nullptr) {
    raw.logging.level = v;
  }
  if (const char *v = std::getenv("JOBFORGE_LOG_FILE"); v != nullptr) {
    raw.logging.file = v;
  }
  if (const char *v = std::getenv("JOBFORGE_COMMAND"); v != nullptr) {
    raw.command.program = v;
  }
  if (const char *v = std::getenv("JOBFORGE_COMMAND_TIMEOUT_SEC");
      v != nullptr) {
    raw.command.timeout_sec = boost::lexical_cast<int>(v);
  }
}

[[nodiscard]] auto convert_toml(std::string_view toml_text)
    -> Result<EngineConfig> {
  auto raw_result = toml_util::parse_toml<detail::EngineToml>(toml_text);
  if (!raw_result) {
    return fail(raw_result.error());
  }
  auto &raw = *raw_result;
  apply_env_overrides(raw);

  if (raw.orchestrator.concurrency < 1 || raw.orchestrator.retries < 0 ||
      raw.command.timeout_sec <= 0 || raw.command.program.empty()) {
    log::error("invalid engine config: concurrency={} retries={} "
               "timeout_sec={} program='{}'",
               raw.orchestrator.concurrency, raw.orchestrator.retries,
               raw.command.timeout_sec, raw.command.program);
    return fail(Error::ConfigInvalid);
  }

  EngineConfig cfg{};
  cfg.defaults.concurrency_limit =
      static_cast<std::size_t>(raw.orchestrator.concurrency);
  cfg.defaults.retry_budget =
      static_cast<std::size_t>(raw.orchestrator.retries);
  cfg.defaults.continue_on_error = raw.orchestrator.continue_on_error;
  cfg.defaults.execution_profile = std::move(raw.orchestrator.profile);

  cfg.logging.level = std::move(raw.logging.level);
  cfg.logging.file = std::move(raw.logging.file);

  cfg.command.program = std::move(raw.command.program);
  cfg.command.args = std::move(raw.command.args);
  cfg.command.working_dir = std::move(raw.command.working_dir);
  cfg.command.timeout = std::chrono::seconds(raw.command.timeout_sec);
  cfg.command.stream_json = raw.command.stream_json;
  for (const auto &entry : raw.command.env) {
    auto eq = entry.find('=');
    if (eq == std::string::npos || eq == 0) {
      log::error("invalid command env entry '{}', expected KEY=VALUE", entry);
      return fail(Error::ConfigInvalid);
    }
    cfg.command.env.insert_or_assign(entry.substr(0, eq), entry.substr(eq + 1));
  }
  return ok(std::move(cfg));
}

} // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<EngineConfig> {
  auto text = toml_util::read_file(path);
  if (!text) {
    log::error("cannot read config file '{}'", path);
    return fail(text.error());
  }
  return load_from_string(*text);
}

auto ConfigLoader::load_from_string(std::string_view toml_str)
    -> Result<EngineConfig> {
  try {
    return convert_toml(toml_str);
  } catch (const boost::bad_lexical_cast &e) {
    log::error("invalid numeric JOBFORGE_* override: {}", e.what());
    return fail(Error::ConfigInvalid);
  }
}

auto apply_logging(const LoggingConfig &cfg) -> Result<void> {
  log::set_level(cfg.level);
  if (!log::set_output_file(cfg.file)) {
    log::error("cannot open log file '{}'", cfg.file);
    return fail(Error::FileNotFound);
  }
  return ok();
}

} // namespace jobforge
