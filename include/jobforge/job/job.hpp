#pragma once

#include "jobforge/core/coroutine.hpp"
#include "jobforge/core/error.hpp"
#include "jobforge/job/job_context.hpp"
#include "jobforge/job/subtask.hpp"
#include "jobforge/util/id.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jobforge {

/// A unit of work the Orchestrator can either run directly or split into
/// sub-tasks. Built by the caller for one run and not modified by the engine.
template <typename TInput, typename TOutput, typename TResult> class Job {
public:
  using input_type = TInput;
  using output_type = TOutput;
  using result_type = TResult;

  Job(JobId id, std::string type, TInput input, JobContext context = {})
      : id_(std::move(id)), type_(std::move(type)), input_(std::move(input)),
        context_(std::move(context)) {}
  virtual ~Job() = default;

  Job(const Job &) = delete;
  Job &operator=(const Job &) = delete;

  [[nodiscard]] auto id() const noexcept -> const JobId & { return id_; }
  [[nodiscard]] auto type() const noexcept -> std::string_view {
    return type_;
  }
  [[nodiscard]] auto input() const noexcept -> const TInput & {
    return input_;
  }
  [[nodiscard]] auto context() const noexcept -> const JobContext & {
    return context_;
  }

  [[nodiscard]] virtual auto should_decompose() const -> bool = 0;

  // Called at most once per run. The order of the returned sub-tasks is the
  // order of the outputs handed to aggregate().
  [[nodiscard]] virtual auto decompose() const
      -> std::vector<SubTask<TOutput>> = 0;

  // `outputs` holds only successful sub-tasks and may be shorter than the
  // decomposition, or empty.
  [[nodiscard]] virtual auto aggregate(std::vector<TOutput> outputs) const
      -> Result<TResult> = 0;

  // Fallback for jobs too small to be worth decomposing. Not retried.
  [[nodiscard]] virtual auto execute_direct() const -> task<Result<TResult>> = 0;

private:
  JobId id_;
  std::string type_;
  TInput input_;
  JobContext context_;
};

} // namespace jobforge
