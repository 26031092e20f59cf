#pragma once

/// @file service_runner.hpp
/// @brief Config-file resolution and loading for engine entry points.

#include <filesystem>
#include <optional>

#include "dcc/foundation/engine_result.hpp"
#include "dcc/service/engine_config.hpp"

namespace dcc::service {

/// Configuration file for this process, if any.
///
/// Resolved in order:
///   1. DCC_CONFIG_PATH environment variable (if set and non-empty)
///   2. `--config <path>` on the command line
///
/// @return nullopt when neither is given (built-in defaults apply).
[[nodiscard]] std::optional<std::filesystem::path> resolveConfigPath(int argc, char* argv[]);

/// Load @p path and build the EngineConfig from it.
///
/// @return The config, ConfigLoadFailed for an unreadable file or invalid
///         values, or ConfigTypeMismatch.
[[nodiscard]] foundation::EngineResult<EngineConfig> loadEngineConfig(
    const std::filesystem::path& path);

}  // namespace dcc::service
