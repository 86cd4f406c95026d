#pragma once

#include "jobforge/core/coroutine.hpp"
#include "jobforge/core/error.hpp"

#include <stop_token>
#include <string>

namespace jobforge {

/// Turns one instruction into response text. Single-shot: implementations do
/// not retry; the orchestrator owns retry policy.
///
/// Failures are reported as Error::ExecutionFailed (or Timeout, Cancelled,
/// ProcessSpawnFailed); the orchestrator retries all of them alike.
class IExecutionCapability {
public:
  virtual ~IExecutionCapability() = default;

  [[nodiscard]] virtual auto execute(std::string instruction,
                                     std::string profile,
                                     std::stop_token cancel)
      -> task<Result<std::string>> = 0;
};

} // namespace jobforge
