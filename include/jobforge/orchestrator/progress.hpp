#pragma once

#include "jobforge/job/subtask.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

namespace jobforge {

// Progress events. Pointers refer to data owned by the running job and are
// valid only for the duration of the observer call.

struct JobStarted {
  std::size_t total{0};
};

template <typename TOutput> struct SubTaskStarted {
  const SubTask<TOutput> *task{nullptr};
  std::size_t index{0};
  std::size_t total{0};
};

template <typename TOutput> struct SubTaskCompleted {
  const SubTask<TOutput> *task{nullptr};
  const TOutput *output{nullptr};
  std::size_t index{0};
};

template <typename TOutput> struct SubTaskFailed {
  const SubTask<TOutput> *task{nullptr};
  std::error_code error;
  std::size_t index{0};
};

template <typename TOutput> struct JobCompleted {
  const std::vector<TOutput> *outputs{nullptr};
};

template <typename TOutput>
using ProgressEvent =
    std::variant<JobStarted, SubTaskStarted<TOutput>, SubTaskCompleted<TOutput>,
                 SubTaskFailed<TOutput>, JobCompleted<TOutput>>;

/// Observer hooks for one run. Every hook is optional.
///
/// Sub-task hooks run on the executor that runs the workers; with a
/// multi-threaded executor they may be called concurrently.
template <typename TOutput> struct JobCallbacks {
  std::function<void(std::size_t total)> on_job_start;
  std::function<void(const SubTask<TOutput> &task, std::size_t index,
                     std::size_t total)>
      on_subtask_start;
  std::function<void(const SubTask<TOutput> &task, const TOutput &output,
                     std::size_t index)>
      on_subtask_complete;
  std::function<void(const SubTask<TOutput> &task, std::error_code error,
                     std::size_t index)>
      on_subtask_error;
  std::function<void(const std::vector<TOutput> &outputs)> on_job_complete;

  /// Route all five hooks into a single observer of ProgressEvent.
  [[nodiscard]] static auto
  from_observer(std::function<void(const ProgressEvent<TOutput> &)> observer)
      -> JobCallbacks {
    auto sink = std::make_shared<
        std::function<void(const ProgressEvent<TOutput> &)>>(
        std::move(observer));
    JobCallbacks cb;
    cb.on_job_start = [sink](std::size_t total) {
      (*sink)(JobStarted{.total = total});
    };
    cb.on_subtask_start = [sink](const SubTask<TOutput> &task,
                                 std::size_t index, std::size_t total) {
      (*sink)(SubTaskStarted<TOutput>{
          .task = &task, .index = index, .total = total});
    };
    cb.on_subtask_complete = [sink](const SubTask<TOutput> &task,
                                    const TOutput &output, std::size_t index) {
      (*sink)(SubTaskCompleted<TOutput>{
          .task = &task, .output = &output, .index = index});
    };
    cb.on_subtask_error = [sink](const SubTask<TOutput> &task,
                                 std::error_code error, std::size_t index) {
      (*sink)(SubTaskFailed<TOutput>{
          .task = &task, .error = error, .index = index});
    };
    cb.on_job_complete = [sink](const std::vector<TOutput> &outputs) {
      (*sink)(JobCompleted<TOutput>{.outputs = &outputs});
    };
    return cb;
  }
};

} // namespace jobforge
