#pragma once

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace jobforge::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error };

inline constexpr std::array<std::string_view, 5> level_names = {
    "trace", "debug", "info", "warn", "error"};

inline constexpr std::array<std::string_view, 5> level_colors = {
    "\o{33}[90m", "\o{33}[36m", "\o{33}[32m", "\o{33}[33m", "\o{33}[31m"};

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return level_names.at(std::to_underlying(level));
}

[[nodiscard]] inline auto level_color(Level level) -> std::string_view {
  return level_colors.at(std::to_underlying(level));
}

/// Parse a level name; unknown names yield `fallback`.
[[nodiscard]] inline auto parse_level(std::string_view name,
                                      Level fallback = Level::Info) -> Level {
  const auto *it = std::ranges::find(level_names, name);
  if (it == level_names.end()) {
    return fallback;
  }
  return static_cast<Level>(std::distance(level_names.begin(), it));
}

// A formatted line, or a request to switch the output target when `reopen`
// is set (empty path means stdout).
struct Record {
  std::string text;
  std::optional<std::string> reopen;
};

/// Asynchronous line logger. Producers format on their own thread and hand
/// the line to a writer thread through a bounded channel; before start() (or
/// after stop()) lines are written synchronously.
class Logger {
public:
  Logger() = default;
  ~Logger();

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  auto start() -> void;
  auto stop() -> void;

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }
  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto enabled(Level level) const noexcept -> bool {
    return level >= this->level();
  }

  auto set_output_stderr() noexcept -> void;
  auto set_output_file(std::string_view path) -> bool;

  [[nodiscard]] auto dropped() const noexcept -> std::uint64_t {
    return dropped_.load(std::memory_order_relaxed);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (!enabled(level)) {
      return;
    }
    auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    std::string line;
    line.reserve(128);
    std::format_to(std::back_inserter(line), "[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] ",
                   now, level_color(level), level_name(level), "\o{33}[0m",
                   tid);
    std::format_to(std::back_inserter(line), fmt, std::forward<Args>(args)...);
    line.push_back('\n');
    submit(std::move(line));
  }

private:
  static constexpr std::size_t kQueueCapacity = 8192;
  static constexpr std::size_t kBatchSize = 64;

  using Channel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, Record)>;

  auto submit(std::string line) -> void;
  auto write_now(std::string_view line) -> void;
  auto reopen(const std::string &path) -> bool;
  auto writer_loop(std::shared_ptr<Channel> channel) -> void;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<FILE *> output_{stdout};
  std::atomic<std::uint64_t> dropped_{0};
  FILE *file_{nullptr};
  boost::asio::io_context channel_ctx_{1};
  std::atomic<std::shared_ptr<Channel>> channel_;
  std::jthread writer_;
};

[[nodiscard]] auto logger() -> Logger &;

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name));
}

inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}

inline auto set_output_stderr() noexcept -> void {
  logger().set_output_stderr();
}

inline auto start() -> void { logger().start(); }
inline auto stop() -> void { logger().stop(); }

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

} // namespace jobforge::log
