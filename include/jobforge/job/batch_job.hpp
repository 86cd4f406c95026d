#pragma once

#include "jobforge/capability/capability.hpp"
#include "jobforge/core/coroutine.hpp"
#include "jobforge/core/error.hpp"
#include "jobforge/job/job.hpp"
#include "jobforge/job/subtask.hpp"
#include "jobforge/util/id.hpp"

#include <algorithm>
#include <cstddef>
#include <format>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jobforge {

/// Everything a BatchJob needs besides its items.
template <typename TItem, typename TOutput, typename TResult>
struct BatchJobOptions {
  using InstructionBuilder =
      std::function<std::string(std::span<const TItem> chunk)>;
  using Parser = typename SubTask<TOutput>::Parser;
  using Reducer = std::function<Result<TResult>(std::vector<TOutput>)>;

  std::size_t chunk_size{1};
  InstructionBuilder build_instruction;
  Parser parse_response;
  Reducer reduce;
  // Profile for the direct (single-chunk) path only. execute_direct() has no
  // run configuration, so JobConfig::execution_profile and per-run overrides
  // apply to decomposed chunks but never to the direct call.
  std::string execution_profile{"standard"};
};

/// Splits a list of items into chunks of `chunk_size`, one sub-task per chunk.
/// A list that fits in one chunk runs directly through the capability as a
/// single instruction.
template <typename TItem, typename TOutput, typename TResult>
class BatchJob final : public Job<std::vector<TItem>, TOutput, TResult> {
  using Base = Job<std::vector<TItem>, TOutput, TResult>;

public:
  using Options = BatchJobOptions<TItem, TOutput, TResult>;

  BatchJob(JobId id, std::string type, std::vector<TItem> items, Options options,
           IExecutionCapability &capability, JobContext context = {})
      : Base(std::move(id), std::move(type), std::move(items),
             std::move(context)),
        options_(std::move(options)), capability_(&capability) {
    options_.chunk_size = std::max<std::size_t>(options_.chunk_size, 1);
  }

  [[nodiscard]] auto chunk_count() const noexcept -> std::size_t {
    const auto n = this->input().size();
    return (n + options_.chunk_size - 1) / options_.chunk_size;
  }

  [[nodiscard]] auto should_decompose() const -> bool override {
    return chunk_count() > 1;
  }

  [[nodiscard]] auto decompose() const
      -> std::vector<SubTask<TOutput>> override {
    const std::span<const TItem> items(this->input());
    std::vector<SubTask<TOutput>> tasks;
    tasks.reserve(chunk_count());
    for (std::size_t begin = 0, n = 0; begin < items.size();
         begin += options_.chunk_size, ++n) {
      const auto len = std::min(options_.chunk_size, items.size() - begin);
      tasks.push_back(SubTask<TOutput>{
          .id = SubTaskId{std::format("{}-{}", this->id(), n)},
          .name = std::format("{} chunk {}", this->type(), n + 1),
          .instruction = options_.build_instruction(items.subspan(begin, len)),
          .parse_response = options_.parse_response,
      });
    }
    return tasks;
  }

  [[nodiscard]] auto aggregate(std::vector<TOutput> outputs) const
      -> Result<TResult> override {
    return options_.reduce(std::move(outputs));
  }

  [[nodiscard]] auto execute_direct() const -> task<Result<TResult>> override {
    auto response = co_await capability_->execute(
        options_.build_instruction(std::span<const TItem>(this->input())),
        options_.execution_profile, this->context().cancel_token);
    if (!response) {
      co_return fail(response.error());
    }
    auto parsed = options_.parse_response(*response);
    if (!parsed) {
      co_return fail(parsed.error());
    }
    std::vector<TOutput> outputs;
    outputs.push_back(std::move(*parsed));
    co_return options_.reduce(std::move(outputs));
  }

private:
  Options options_;
  IExecutionCapability *capability_;
};

} // namespace jobforge
