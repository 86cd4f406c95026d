#pragma once

#include "jobforge/core/error.hpp"
#include "jobforge/util/id.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace jobforge {

/// One independently executable piece of a decomposed job.
template <typename TOutput> struct SubTask {
  using output_type = TOutput;
  // Must be pure: the same text always parses to the same result. Malformed
  // text is reported as Error::ParseFailed.
  using Parser = std::function<Result<TOutput>(std::string_view)>;

  SubTaskId id;
  std::string name;
  std::string instruction;
  Parser parse_response;
};

/// Final outcome of all attempts at one sub-task.
template <typename TOutput> class SubTaskResult {
public:
  [[nodiscard]] static auto succeeded(const SubTask<TOutput> &task,
                                      std::size_t index, std::size_t attempts,
                                      TOutput output) -> SubTaskResult {
    return SubTaskResult{task, index, attempts, std::move(output), false};
  }

  [[nodiscard]] static auto failed(const SubTask<TOutput> &task,
                                   std::size_t index, std::size_t attempts,
                                   std::error_code error, bool cancelled)
      -> SubTaskResult {
    return SubTaskResult{task, index, attempts, std::unexpected{error},
                         cancelled};
  }

  [[nodiscard]] auto subtask() const noexcept -> const SubTask<TOutput> & {
    return *task_;
  }
  [[nodiscard]] auto index() const noexcept -> std::size_t { return index_; }
  [[nodiscard]] auto attempts() const noexcept -> std::size_t {
    return attempts_;
  }
  [[nodiscard]] auto success() const noexcept -> bool {
    return outcome_.has_value();
  }
  // Stopped by a cancellation request rather than by running out of attempts.
  [[nodiscard]] auto cancelled() const noexcept -> bool { return cancelled_; }

  [[nodiscard]] auto output() const & -> const TOutput & { return *outcome_; }
  [[nodiscard]] auto output() && -> TOutput { return std::move(*outcome_); }
  [[nodiscard]] auto error() const -> std::error_code {
    return outcome_.error();
  }

private:
  SubTaskResult(const SubTask<TOutput> &task, std::size_t index,
                std::size_t attempts, Result<TOutput> outcome, bool cancelled)
      : task_(&task), index_(index), attempts_(attempts),
        outcome_(std::move(outcome)), cancelled_(cancelled) {}

  const SubTask<TOutput> *task_;
  std::size_t index_;
  std::size_t attempts_;
  Result<TOutput> outcome_;
  bool cancelled_;
};

} // namespace jobforge
