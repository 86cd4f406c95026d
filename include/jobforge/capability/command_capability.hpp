#pragma once

#include "jobforge/capability/capability.hpp"
#include "jobforge/config/engine_config.hpp"

#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace jobforge {

/// Runs a configured program once per instruction: the instruction goes to
/// the child's stdin, stdout is the response.
///
/// Exit status 0 is success; anything else is Error::ExecutionFailed. A call
/// exceeding the configured timeout is killed and reported as Error::Timeout.
/// A stop request is honoured only before the process is launched.
class CommandCapability final : public IExecutionCapability {
public:
  explicit CommandCapability(CommandCapabilityConfig cfg = {});

  [[nodiscard]] auto execute(std::string instruction, std::string profile,
                             std::stop_token cancel)
      -> task<Result<std::string>> override;

  [[nodiscard]] auto config() const noexcept
      -> const CommandCapabilityConfig & {
    return cfg_;
  }

private:
  CommandCapabilityConfig cfg_;
};

/// Replace every "{profile}" in `args` with `profile`.
[[nodiscard]] auto expand_arguments(const std::vector<std::string> &args,
                                    std::string_view profile)
    -> std::vector<std::string>;

} // namespace jobforge
