#pragma once

/// @file engine_config.hpp
/// @brief EngineConfig: typed engine settings built from ConfigManager.

#include <cstdint>
#include <utility>
#include <vector>

#include "dcc/foundation/config_manager.hpp"
#include "dcc/foundation/engine_logger.hpp"
#include "dcc/foundation/engine_result.hpp"

namespace dcc::service {

// -- Configuration -----------------------------------------------------------

/// Settings shared by every encounter of an EncounterManager.
///
/// YAML layout:
/// @code
///   engine:
///     max_encounters: 1000
///     strict_turn_order: false
///     auto_roll_initiative: false
///     dice_seed: 0
///   events:
///     async: true
///     worker_threads: 2
///   logging:
///     level: info
///     categories:        # optional per-category overrides
///       damage: debug
/// @endcode
///
/// Unknown keys under these sections are logged and ignored.
struct EngineConfig {
    /// Upper bound on encounters held by one manager.
    uint32_t maxEncounters = 1000;

    bool strictTurnOrder = false;
    bool autoRollInitiative = false;

    /// Base seed for generated rolls. 0 seeds from std::random_device.
    uint64_t diceSeed = 0;

    bool asyncEvents = true;
    uint32_t eventWorkerThreads = 2;

    foundation::LogLevel logLevel = foundation::LogLevel::Info;

    /// Applied after logLevel, in order.
    std::vector<std::pair<foundation::LogCategory, foundation::LogLevel>> categoryLevels;
};

/// Read EngineConfig from @p config. Missing keys keep their defaults.
///
/// Errors: ConfigTypeMismatch for a value of the wrong type, ConfigLoadFailed
/// for out-of-range values or an unknown log level or category.
[[nodiscard]] foundation::EngineResult<EngineConfig> buildEngineConfig(
    const foundation::ConfigManager& config);

/// Apply the configured log level to every logger category, then the
/// per-category overrides.
void applyLogging(const EngineConfig& config);

/// Re-apply the global log level whenever `logging.level` is changed
/// through ConfigManager::set(). Invalid values are logged and ignored.
void watchLogLevel(foundation::ConfigManager& config);

}  // namespace dcc::service
