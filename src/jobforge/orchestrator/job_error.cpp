#include "jobforge/orchestrator/job_error.hpp"

#include <format>

namespace jobforge {

auto JobError::message() const -> std::string {
  auto text = std::format("{}: {}", to_string_view(stage), code.message());
  if (cause) {
    text += std::format(" (sub-task #{} {} '{}' after {} attempt(s): {}{})",
                        cause->index, cause->id, cause->name, cause->attempts,
                        cause->error.message(),
                        cause->cancelled ? ", cancelled" : "");
  }
  return text;
}

} // namespace jobforge
