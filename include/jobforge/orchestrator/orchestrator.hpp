#pragma once

#include "jobforge/capability/capability.hpp"
#include "jobforge/config/job_config.hpp"
#include "jobforge/core/coroutine.hpp"
#include "jobforge/core/error.hpp"
#include "jobforge/job/job.hpp"
#include "jobforge/job/subtask.hpp"
#include "jobforge/orchestrator/job_error.hpp"
#include "jobforge/orchestrator/progress.hpp"
#include "jobforge/util/log.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string_view>
#include <utility>
#include <vector>

namespace jobforge {

/// Drives a Job through direct execution or decomposition into sub-tasks run
/// in concurrency-bounded waves with per-sub-task retry.
///
/// Holds no per-run state: one instance may run any number of jobs, and
/// instances are independent of each other.
class Orchestrator {
public:
  explicit Orchestrator(IExecutionCapability &capability,
                        JobConfig defaults = {})
      : capability_(&capability), defaults_(std::move(defaults)) {}

  /// Workers are spawned on `worker_executor` (e.g. a thread_pool) instead of
  /// the executor of the coroutine calling run().
  Orchestrator(IExecutionCapability &capability,
               boost::asio::any_io_executor worker_executor,
               JobConfig defaults = {})
      : capability_(&capability), worker_executor_(std::move(worker_executor)),
        defaults_(std::move(defaults)) {}

  [[nodiscard]] auto defaults() const noexcept -> const JobConfig & {
    return defaults_;
  }

  /// Run `job` to completion. `job` must outlive the returned awaitable.
  ///
  /// Fails only when execute_direct() fails, when a sub-task exhausts its
  /// attempts with continue_on_error off, or when aggregate() fails.
  template <typename TInput, typename TOutput, typename TResult>
  [[nodiscard]] auto run(const Job<TInput, TOutput, TResult> &job,
                         JobCallbacks<TOutput> callbacks = {},
                         JobConfigOverrides overrides = {}) const
      -> task<JobResult<TResult>>;

  /// Blocking wrapper around run() for callers outside a coroutine.
  template <typename TInput, typename TOutput, typename TResult>
  [[nodiscard]] auto run_sync(const Job<TInput, TOutput, TResult> &job,
                              JobCallbacks<TOutput> callbacks = {},
                              JobConfigOverrides overrides = {}) const
      -> JobResult<TResult>;

private:
  template <typename TOutput>
  using ResultSlots = std::vector<std::optional<SubTaskResult<TOutput>>>;

  template <typename TOutput>
  [[nodiscard]] auto execute_waves(const std::vector<SubTask<TOutput>> &tasks,
                                   const JobConfig &cfg,
                                   std::stop_token cancel,
                                   const JobCallbacks<TOutput> &callbacks) const
      -> task<ResultSlots<TOutput>>;

  template <typename TOutput>
  [[nodiscard]] auto run_worker(const SubTask<TOutput> &subtask,
                                std::size_t index, std::size_t total,
                                const JobConfig &cfg, std::stop_token cancel,
                                const JobCallbacks<TOutput> &callbacks,
                                std::optional<SubTaskResult<TOutput>> &slot)
      const -> task<void>;

  template <typename TOutput>
  [[nodiscard]] auto attempt_subtask(const SubTask<TOutput> &subtask,
                                     std::size_t index, const JobConfig &cfg,
                                     std::stop_token cancel) const
      -> task<SubTaskResult<TOutput>>;

  [[nodiscard]] auto invoke_capability(std::string_view subtask_name,
                                       std::string instruction,
                                       std::string profile,
                                       std::stop_token cancel) const
      -> task<Result<std::string>>;

  template <typename TOutput>
  [[nodiscard]] static auto parse_output(const SubTask<TOutput> &subtask,
                                         std::string_view response)
      -> Result<TOutput>;

  IExecutionCapability *capability_;
  std::optional<boost::asio::any_io_executor> worker_executor_;
  JobConfig defaults_;
};

/// Process-wide orchestrator backed by a CommandCapability with default
/// settings. Convenience only; prefer constructing an Orchestrator.
[[nodiscard]] auto default_orchestrator() -> Orchestrator &;

// ---------------------------------------------------------------------------

template <typename TInput, typename TOutput, typename TResult>
auto Orchestrator::run(const Job<TInput, TOutput, TResult> &job,
                       JobCallbacks<TOutput> callbacks,
                       JobConfigOverrides overrides) const
    -> task<JobResult<TResult>> {
  const JobConfig cfg = merge(defaults_, overrides);

  if (!job.should_decompose()) {
    log::info("job {} ({}) running as a single task", job.id(), job.type());
    auto direct = co_await job.execute_direct();
    if (!direct) {
      log::warn("job {} direct execution failed: {}", job.id(),
                direct.error().message());
      co_return std::unexpected(
          JobError{.stage = JobErrorStage::Direct, .code = direct.error()});
    }
    co_return std::move(*direct);
  }

  const auto subtasks = job.decompose();
  log::info("job {} ({}) decomposed into {} sub-tasks (concurrency={}, "
            "attempts={})",
            job.id(), job.type(), subtasks.size(), cfg.concurrency_limit,
            cfg.max_attempts());
  if (callbacks.on_job_start) {
    callbacks.on_job_start(subtasks.size());
  }

  auto slots = co_await execute_waves(subtasks, cfg,
                                      job.context().cancel_token, callbacks);

  std::vector<TOutput> outputs;
  outputs.reserve(subtasks.size());
  for (auto &slot : slots) {
    if (!slot) {
      continue; // never dispatched
    }
    if (slot->success()) {
      outputs.push_back(std::move(*slot).output());
      continue;
    }
    if (!cfg.continue_on_error) {
      const auto &failed = slot->subtask();
      log::error("job {} aborted: sub-task #{} '{}' failed: {}", job.id(),
                 slot->index(), failed.name, slot->error().message());
      co_return std::unexpected(JobError{
          .stage = JobErrorStage::SubTask,
          .code = make_error_code(Error::JobAborted),
          .cause = SubTaskFailure{.index = slot->index(),
                                  .id = failed.id,
                                  .name = failed.name,
                                  .error = slot->error(),
                                  .attempts = slot->attempts(),
                                  .cancelled = slot->cancelled()}});
    }
  }

  log::info("job {} finished sub-tasks: {}/{} succeeded", job.id(),
            outputs.size(), subtasks.size());
  if (callbacks.on_job_complete) {
    callbacks.on_job_complete(outputs);
  }

  auto aggregated = job.aggregate(std::move(outputs));
  if (!aggregated) {
    log::warn("job {} aggregation failed: {}", job.id(),
              aggregated.error().message());
    co_return std::unexpected(JobError{.stage = JobErrorStage::Aggregate,
                                       .code = aggregated.error()});
  }
  co_return std::move(*aggregated);
}

template <typename TInput, typename TOutput, typename TResult>
auto Orchestrator::run_sync(const Job<TInput, TOutput, TResult> &job,
                            JobCallbacks<TOutput> callbacks,
                            JobConfigOverrides overrides) const
    -> JobResult<TResult> {
  boost::asio::io_context io;
  // Workers may live on another executor; keep run() alive until the job
  // coroutine itself completes.
  auto guard = boost::asio::make_work_guard(io);
  std::optional<JobResult<TResult>> result;
  std::exception_ptr error;

  co_spawn(
      io,
      [&]() -> task<void> {
        result.emplace(
            co_await run(job, std::move(callbacks), std::move(overrides)));
      },
      [&](std::exception_ptr ep) {
        error = ep;
        guard.reset();
      });
  io.run();

  if (error) {
    std::rethrow_exception(error);
  }
  return std::move(*result);
}

template <typename TOutput>
auto Orchestrator::execute_waves(const std::vector<SubTask<TOutput>> &tasks,
                                 const JobConfig &cfg, std::stop_token cancel,
                                 const JobCallbacks<TOutput> &callbacks) const
    -> task<ResultSlots<TOutput>> {
  using Channel = boost::asio::experimental::concurrent_channel<void(
      boost::system::error_code, std::size_t)>;

  const std::size_t total = tasks.size();
  const std::size_t wave_size = cfg.concurrency_limit;
  ResultSlots<TOutput> slots(total);

  auto executor = co_await boost::asio::this_coro::executor;
  auto worker_executor = worker_executor_.value_or(executor);
  // Sized to a full wave so a finishing worker never waits on the receiver.
  // Shared with the completion handlers: on a thread pool the last try_send
  // may still be inside the channel when this coroutine resumes.
  auto settled = std::make_shared<Channel>(executor, wave_size);
  std::mutex exception_mutex;
  std::exception_ptr worker_exception;

  for (std::size_t begin = 0; begin < total; begin += wave_size) {
    if (cancel.stop_requested()) {
      log::info("cancellation requested; {} sub-task(s) not dispatched",
                total - begin);
      break;
    }

    const std::size_t end = std::min(total, begin + wave_size);
    log::debug("dispatching wave [{}, {}) of {}", begin, end, total);
    for (std::size_t i = begin; i < end; ++i) {
      co_spawn(worker_executor,
               run_worker(tasks[i], i, total, cfg, cancel, callbacks, slots[i]),
               [settled, &exception_mutex, &worker_exception, &slots, &tasks,
                i, attempts = cfg.max_attempts()](std::exception_ptr ep) {
                 if (ep) {
                   // Only observer hooks can throw past the retry boundary.
                   {
                     std::scoped_lock lock(exception_mutex);
                     if (!worker_exception) {
                       worker_exception = ep;
                     }
                   }
                   if (!slots[i]) {
                     slots[i].emplace(SubTaskResult<TOutput>::failed(
                         tasks[i], i, attempts, make_error_code(Error::Unknown),
                         false));
                   }
                 }
                 (void)settled->try_send(boost::system::error_code{}, i);
               });
    }

    for (std::size_t pending = end - begin; pending > 0; --pending) {
      (void)co_await settled->async_receive(use_awaitable);
    }

    if (worker_exception) {
      std::rethrow_exception(worker_exception);
    }

    if (!cfg.continue_on_error) {
      const auto failed = std::ranges::find_if(
          slots.begin() + static_cast<std::ptrdiff_t>(begin),
          slots.begin() + static_cast<std::ptrdiff_t>(end),
          [](const auto &slot) { return slot && !slot->success(); });
      if (failed != slots.begin() + static_cast<std::ptrdiff_t>(end)) {
        log::debug("wave [{}, {}) had a failure; {} sub-task(s) not "
                   "dispatched",
                   begin, end, total - end);
        break;
      }
    }
  }

  co_return slots;
}

template <typename TOutput>
auto Orchestrator::run_worker(const SubTask<TOutput> &subtask,
                              std::size_t index, std::size_t total,
                              const JobConfig &cfg, std::stop_token cancel,
                              const JobCallbacks<TOutput> &callbacks,
                              std::optional<SubTaskResult<TOutput>> &slot) const
    -> task<void> {
  if (callbacks.on_subtask_start) {
    callbacks.on_subtask_start(subtask, index, total);
  }

  auto result = co_await attempt_subtask(subtask, index, cfg, cancel);
  if (result.success()) {
    if (callbacks.on_subtask_complete) {
      callbacks.on_subtask_complete(subtask, result.output(), index);
    }
  } else {
    log::warn("sub-task #{} '{}' failed after {} attempt(s): {}{}", index,
              subtask.name, result.attempts(), result.error().message(),
              result.cancelled() ? " (cancelled)" : "");
    if (callbacks.on_subtask_error) {
      callbacks.on_subtask_error(subtask, result.error(), index);
    }
  }
  slot.emplace(std::move(result));
}

template <typename TOutput>
auto Orchestrator::attempt_subtask(const SubTask<TOutput> &subtask,
                                   std::size_t index, const JobConfig &cfg,
                                   std::stop_token cancel) const
    -> task<SubTaskResult<TOutput>> {
  using R = SubTaskResult<TOutput>;
  const std::size_t max_attempts = cfg.max_attempts();
  std::optional<std::error_code> last_error;
  std::size_t attempts = 0;

  while (attempts < max_attempts) {
    if (cancel.stop_requested()) {
      co_return R::failed(subtask, index, attempts,
                          last_error.value_or(make_error_code(Error::Cancelled)),
                          true);
    }
    if (attempts > 0) {
      log::info("retrying sub-task \"{}\" (attempt {}/{})", subtask.name,
                attempts + 1, max_attempts);
    }
    ++attempts;

    auto response = co_await invoke_capability(
        subtask.name, subtask.instruction, cfg.execution_profile, cancel);
    if (!response) {
      last_error = response.error();
      continue;
    }

    auto parsed = parse_output(subtask, *response);
    if (!parsed) {
      log::debug("sub-task \"{}\" response rejected by parser: {}",
                 subtask.name, parsed.error().message());
      last_error = parsed.error();
      continue;
    }
    co_return R::succeeded(subtask, index, attempts, std::move(*parsed));
  }

  co_return R::failed(subtask, index, attempts,
                      last_error.value_or(make_error_code(Error::Unknown)),
                      false);
}

template <typename TOutput>
auto Orchestrator::parse_output(const SubTask<TOutput> &subtask,
                                std::string_view response) -> Result<TOutput> {
  if (!subtask.parse_response) {
    return fail(Error::ParseFailed);
  }
  try {
    return subtask.parse_response(response);
  } catch (const std::exception &e) {
    log::debug("parser for sub-task \"{}\" threw: {}", subtask.name, e.what());
    return fail(Error::ParseFailed);
  }
}

} // namespace jobforge
