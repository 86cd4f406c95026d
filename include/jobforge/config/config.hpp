#pragma once

#include "jobforge/config/engine_config.hpp"
#include "jobforge/core/error.hpp"

#include <string_view>

namespace jobforge {

/// Loads EngineConfig from TOML. JOBFORGE_* environment variables override
/// file values.
class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<EngineConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str)
      -> Result<EngineConfig>;
};

/// Apply the logging section to the process-wide logger.
auto apply_logging(const LoggingConfig &cfg) -> Result<void>;

} // namespace jobforge
