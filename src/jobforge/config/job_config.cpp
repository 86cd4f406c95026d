#include "jobforge/config/job_config.hpp"
#include "jobforge/util/log.hpp"

namespace jobforge {

auto merge(const JobConfig &defaults, const JobConfigOverrides &overrides)
    -> JobConfig {
  JobConfig cfg = defaults;
  if (overrides.concurrency_limit) {
    cfg.concurrency_limit = *overrides.concurrency_limit;
  }
  if (overrides.retry_budget) {
    cfg.retry_budget = *overrides.retry_budget;
  }
  if (overrides.continue_on_error) {
    cfg.continue_on_error = *overrides.continue_on_error;
  }
  if (overrides.execution_profile) {
    cfg.execution_profile = *overrides.execution_profile;
  }
  if (cfg.concurrency_limit == 0) {
    log::warn("concurrency_limit 0 clamped to 1");
    cfg.concurrency_limit = 1;
  }
  return cfg;
}

} // namespace jobforge
