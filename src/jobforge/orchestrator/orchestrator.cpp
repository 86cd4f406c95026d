#include "jobforge/orchestrator/orchestrator.hpp"

#include "jobforge/capability/command_capability.hpp"
#include "jobforge/util/log.hpp"

#include <exception>

namespace jobforge {

auto Orchestrator::invoke_capability(std::string_view subtask_name,
                                     std::string instruction,
                                     std::string profile,
                                     std::stop_token cancel) const
    -> task<Result<std::string>> {
  // Copied before the first suspension; the caller's view may not survive it.
  std::string name(subtask_name);
  try {
    auto response = co_await capability_->execute(
        std::move(instruction), std::move(profile), std::move(cancel));
    if (!response) {
      log::debug("sub-task \"{}\" execution failed: {}", name,
                 response.error().message());
    }
    co_return response;
  } catch (const std::exception &e) {
    log::warn("sub-task \"{}\" execution threw: {}", name, e.what());
    co_return fail(Error::ExecutionFailed);
  }
}

auto default_orchestrator() -> Orchestrator & {
  static CommandCapability capability;
  static Orchestrator instance{capability};
  return instance;
}

} // namespace jobforge
