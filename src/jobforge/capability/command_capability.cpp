#include "jobforge/capability/command_capability.hpp"

#include "jobforge/capability/response_stream.hpp"
#include "jobforge/core/coroutine.hpp"
#include "jobforge/util/log.hpp"

#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/cancel_after.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/writable_pipe.hpp>
#include <boost/asio/write.hpp>
#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/process.hpp>
#include <boost/process/v2/start_dir.hpp>
#include <boost/process/v2/stdio.hpp>

#include <algorithm>
#include <array>
#include <csignal>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace jobforge {

namespace {

namespace bp = boost::process::v2;

inline constexpr std::size_t kMaxOutputSize = 16UZ * 1024 * 1024;
inline constexpr std::size_t kReadBufferSize = 4096;
inline constexpr std::size_t kStderrPreview = 512;
inline constexpr std::string_view kProfilePlaceholder = "{profile}";

struct WaitOutcome {
  int exit_code{-1};
  bool timed_out{false};
};

[[nodiscard]] auto is_valid_env_key(std::string_view key) -> bool {
  return !key.empty() && key.find('=') == std::string_view::npos &&
         key.find('\0') == std::string_view::npos;
}

[[nodiscard]] auto
build_process_env(const std::map<std::string, std::string> &custom)
    -> bp::process_environment {
  std::vector<bp::environment::key_value_pair> env_vec;
  env_vec.reserve(64);
  for (const auto &entry : bp::environment::current()) {
    auto key = entry.key();
    if (custom.contains(std::string(key.data(), key.size()))) {
      continue;
    }
    env_vec.emplace_back(entry);
  }
  for (const auto &[k, v] : custom) {
    env_vec.emplace_back(bp::environment::key{k}, bp::environment::value{v});
  }
  return bp::process_environment(std::move(env_vec));
}

[[nodiscard]] auto resolve_program(const std::string &program)
    -> std::optional<bp::filesystem::path> {
  if (program.find('/') != std::string::npos) {
    return bp::filesystem::path(program);
  }
  auto found = bp::environment::find_executable(program);
  if (found.empty()) {
    return std::nullopt;
  }
  return found;
}

[[nodiscard]] auto write_all(boost::asio::writable_pipe &pipe,
                             std::string data,
                             boost::asio::cancellation_signal &cancel_sig)
    -> task<void> {
  auto [ec, written] = co_await boost::asio::async_write(
      pipe, boost::asio::buffer(data),
      boost::asio::bind_cancellation_slot(cancel_sig.slot(), use_nothrow));
  if (ec) {
    // The child may exit without reading its input; its status decides.
    log::debug("command stdin write stopped after {} bytes: {}", written,
               ec.message());
  }
  boost::system::error_code ignored;
  pipe.close(ignored);
}

[[nodiscard]] auto read_all(boost::asio::readable_pipe &pipe, std::string &out,
                            boost::asio::cancellation_signal &cancel_sig)
    -> task<void> {
  std::array<char, kReadBufferSize> buffer{};
  for (;;) {
    auto [ec, bytes] = co_await pipe.async_read_some(
        boost::asio::buffer(buffer),
        boost::asio::bind_cancellation_slot(cancel_sig.slot(), use_nothrow));
    if (ec) {
      co_return;
    }
    if (out.size() < kMaxOutputSize) {
      out.append(buffer.data(),
                 std::min<std::size_t>(bytes, kMaxOutputSize - out.size()));
    }
  }
}

[[nodiscard]] auto
wait_with_timeout(bp::process &proc, std::chrono::seconds timeout,
                  std::array<boost::asio::cancellation_signal, 3> &io_signals)
    -> task<WaitOutcome> {
  auto [ec, exit_code] =
      co_await proc.async_wait(boost::asio::cancel_after(timeout, use_nothrow));
  if (!ec) {
    co_return WaitOutcome{.exit_code = exit_code, .timed_out = false};
  }
  if (ec != boost::asio::error::operation_aborted) {
    log::warn("waiting for command pid={} failed: {}", proc.id(),
              ec.message());
    co_return WaitOutcome{};
  }

  for (auto &sig : io_signals) {
    sig.emit(boost::asio::cancellation_type::total);
  }
  boost::system::error_code ignored;
  proc.terminate(ignored);
  auto [reap_ec, reaped_status] = co_await proc.async_wait(use_nothrow);
  (void)reap_ec;
  (void)reaped_status;
  co_return WaitOutcome{.exit_code = -1, .timed_out = true};
}

} // namespace

auto expand_arguments(const std::vector<std::string> &args,
                      std::string_view profile) -> std::vector<std::string> {
  std::vector<std::string> out;
  out.reserve(args.size());
  for (const auto &arg : args) {
    std::string expanded = arg;
    for (auto pos = expanded.find(kProfilePlaceholder);
         pos != std::string::npos;
         pos = expanded.find(kProfilePlaceholder, pos + profile.size())) {
      expanded.replace(pos, kProfilePlaceholder.size(), profile);
    }
    out.push_back(std::move(expanded));
  }
  return out;
}

CommandCapability::CommandCapability(CommandCapabilityConfig cfg)
    : cfg_(std::move(cfg)) {
  // A child that exits before draining stdin must not kill this process.
  std::signal(SIGPIPE, SIG_IGN);
}

auto CommandCapability::execute(std::string instruction, std::string profile,
                                std::stop_token cancel)
    -> task<Result<std::string>> {
  if (cancel.stop_requested()) {
    co_return fail(Error::Cancelled);
  }

  for (const auto &[key, value] : cfg_.env) {
    if (!is_valid_env_key(key)) {
      log::error("invalid environment variable key for command: '{}'", key);
      co_return fail(Error::InvalidArgument);
    }
  }

  auto exe = resolve_program(cfg_.program);
  if (!exe) {
    log::error("command '{}' not found in PATH", cfg_.program);
    co_return fail(Error::ProcessSpawnFailed);
  }

  auto executor = co_await boost::asio::this_coro::executor;
  boost::asio::writable_pipe stdin_pipe(executor);
  boost::asio::readable_pipe stdout_pipe(executor);
  boost::asio::readable_pipe stderr_pipe(executor);
  auto args = expand_arguments(cfg_.args, profile);

  std::optional<bp::process> proc;
  try {
    auto stdio = bp::process_stdio{
        .in = stdin_pipe, .out = stdout_pipe, .err = stderr_pipe};
    const bool has_env = !cfg_.env.empty();
    const bool has_dir = !cfg_.working_dir.empty();
    if (has_env && has_dir) {
      proc.emplace(executor, *exe, args, std::move(stdio),
                   bp::process_start_dir{cfg_.working_dir},
                   build_process_env(cfg_.env));
    } else if (has_env) {
      proc.emplace(executor, *exe, args, std::move(stdio),
                   build_process_env(cfg_.env));
    } else if (has_dir) {
      proc.emplace(executor, *exe, args, std::move(stdio),
                   bp::process_start_dir{cfg_.working_dir});
    } else {
      proc.emplace(executor, *exe, args, std::move(stdio));
    }
  } catch (const std::exception &ex) {
    log::error("failed to launch '{}': {}", cfg_.program, ex.what());
    co_return fail(Error::ProcessSpawnFailed);
  }

  log::debug("command started pid={} program='{}' profile='{}' "
             "instruction_bytes={}",
             proc->id(), cfg_.program, profile, instruction.size());

  std::string out;
  std::string err;
  std::array<boost::asio::cancellation_signal, 3> io_signals;
  using namespace boost::asio::experimental::awaitable_operators;
  auto outcome =
      co_await (write_all(stdin_pipe, std::move(instruction), io_signals[0]) &&
                read_all(stdout_pipe, out, io_signals[1]) &&
                read_all(stderr_pipe, err, io_signals[2]) &&
                wait_with_timeout(*proc, cfg_.timeout, io_signals));

  if (outcome.timed_out) {
    log::warn("command '{}' timed out after {}s", cfg_.program,
              cfg_.timeout.count());
    co_return fail(Error::Timeout);
  }
  if (outcome.exit_code != 0) {
    log::warn("command '{}' exited with {}: {}", cfg_.program,
              outcome.exit_code, std::string_view(err).substr(0, kStderrPreview));
    co_return fail(Error::ExecutionFailed);
  }

  if (cfg_.stream_json) {
    co_return ResponseAssembler::assemble(out);
  }
  co_return ok(std::move(out));
}

} // namespace jobforge
