#pragma once

#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace jobforge {

inline constexpr std::size_t kDefaultConcurrencyLimit = 3;
inline constexpr std::size_t kDefaultRetryBudget = 1;
inline constexpr std::string_view kDefaultExecutionProfile = "standard";

/// Effective settings for one Orchestrator::run. Read-only while the job
/// executes.
struct JobConfig {
  // Upper bound on sub-tasks in flight; also the wave size.
  std::size_t concurrency_limit{kDefaultConcurrencyLimit};
  // Extra attempts per sub-task after the first one.
  std::size_t retry_budget{kDefaultRetryBudget};
  bool continue_on_error{true};
  // Passed through to the execution capability untouched.
  std::string execution_profile{kDefaultExecutionProfile};

  // Saturates rather than wrapping for an unbounded retry budget.
  [[nodiscard]] auto max_attempts() const noexcept -> std::size_t {
    return retry_budget == std::numeric_limits<std::size_t>::max()
               ? retry_budget
               : retry_budget + 1;
  }

  auto operator==(const JobConfig &) const -> bool = default;
};

/// Per-call overrides; unset fields fall back to the orchestrator defaults.
struct JobConfigOverrides {
  std::optional<std::size_t> concurrency_limit;
  std::optional<std::size_t> retry_budget;
  std::optional<bool> continue_on_error;
  std::optional<std::string> execution_profile;
};

/// Overlay `overrides` on `defaults`. A concurrency limit of 0 from either
/// side is clamped to 1.
[[nodiscard]] auto merge(const JobConfig &defaults,
                         const JobConfigOverrides &overrides) -> JobConfig;

} // namespace jobforge
