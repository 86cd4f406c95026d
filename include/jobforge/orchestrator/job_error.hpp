#pragma once

#include "jobforge/core/error.hpp"
#include "jobforge/util/enum.hpp"
#include "jobforge/util/id.hpp"

#include <boost/describe/enum.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <system_error>

namespace jobforge {

enum class JobErrorStage : std::uint8_t {
  Direct,
  SubTask,
  Aggregate,
};
BOOST_DESCRIBE_ENUM(JobErrorStage, Direct, SubTask, Aggregate)
JOBFORGE_DEFINE_ENUM_SERDE(JobErrorStage, JobErrorStage::Direct)

// The sub-task whose failure aborted a job.
struct SubTaskFailure {
  std::size_t index{0};
  SubTaskId id;
  std::string name;
  std::error_code error;
  std::size_t attempts{0};
  bool cancelled{false};
};

/// Why Orchestrator::run produced no result.
///
/// Direct: execute_direct() failed; `code` is its error unchanged.
/// SubTask: a sub-task failed with continue_on_error off; `code` is
///   Error::JobAborted and `cause` describes the sub-task.
/// Aggregate: aggregate() failed; `code` is its error unchanged.
struct JobError {
  JobErrorStage stage{JobErrorStage::Direct};
  std::error_code code;
  std::optional<SubTaskFailure> cause;

  [[nodiscard]] auto aborted() const noexcept -> bool {
    return code == make_error_code(Error::JobAborted);
  }

  [[nodiscard]] auto message() const -> std::string;
};

template <typename T> using JobResult = std::expected<T, JobError>;

} // namespace jobforge
