/// @file engine_config.cpp
/// @brief EngineConfig construction and validation.

#include "dcc/service/engine_config.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

using dcc::foundation::ConfigManager;
using dcc::foundation::EngineResult;
using dcc::foundation::ErrorCode;
using dcc::foundation::LogCategory;

namespace dcc::service {

namespace {

constexpr std::string_view kCategoryPrefix = "logging.categories.";

constexpr std::array<std::string_view, 7> kKnownKeys = {
    "engine.max_encounters", "engine.strict_turn_order", "engine.auto_roll_initiative",
    "engine.dice_seed",      "events.async",             "events.worker_threads",
    "logging.level",
};

/// Read an optional key into @p out. A missing key is not an error.
template <typename T>
EngineResult<void> readOptional(const ConfigManager& config, std::string_view key, T& out) {
    if (!config.hasKey(key)) {
        return EngineResult<void>::ok();
    }
    auto value = config.get<T>(key);
    if (!value) {
        return EngineResult<void>::err(value.error());
    }
    out = value.value();
    return EngineResult<void>::ok();
}

void warnUnknownKeys(const ConfigManager& config) {
    for (const char* section : {"engine", "events", "logging"}) {
        for (const auto& key : config.keys(section)) {
            bool known = std::find(kKnownKeys.begin(), kKnownKeys.end(), key) != kKnownKeys.end() ||
                         key.compare(0, kCategoryPrefix.size(), kCategoryPrefix) == 0;
            if (!known) {
                DCC_LOG_WARN(LogCategory::Config, "ignoring unknown config key '" + key + "'");
            }
        }
    }
}

EngineResult<void> readCategoryLevels(const ConfigManager& config, EngineConfig& out) {
    for (const auto& key : config.keys("logging.categories")) {
        auto name = std::string_view(key).substr(kCategoryPrefix.size());
        auto category = foundation::parseLogCategory(name);
        if (!category) {
            return foundation::fail<void>(ErrorCode::ConfigLoadFailed,
                                          "unknown log category '" + std::string(name) + "'");
        }
        auto text = config.get<std::string>(key);
        if (!text) {
            return EngineResult<void>::err(text.error());
        }
        auto level = foundation::parseLogLevel(text.value());
        if (!level) {
            return foundation::fail<void>(ErrorCode::ConfigLoadFailed,
                                          "unknown level '" + text.value() + "' for " + key);
        }
        out.categoryLevels.emplace_back(*category, *level);
    }
    return EngineResult<void>::ok();
}

}  // namespace

EngineResult<EngineConfig> buildEngineConfig(const ConfigManager& config) {
    EngineConfig out;

    int64_t maxEncounters = out.maxEncounters;
    int64_t workerThreads = out.eventWorkerThreads;
    std::string level(foundation::logLevelName(out.logLevel));

    for (auto r : {readOptional(config, "engine.max_encounters", maxEncounters),
                   readOptional(config, "engine.strict_turn_order", out.strictTurnOrder),
                   readOptional(config, "engine.auto_roll_initiative", out.autoRollInitiative),
                   readOptional(config, "engine.dice_seed", out.diceSeed),
                   readOptional(config, "events.async", out.asyncEvents),
                   readOptional(config, "events.worker_threads", workerThreads),
                   readOptional(config, "logging.level", level)}) {
        if (!r) {
            return EngineResult<EngineConfig>::err(r.error());
        }
    }

    if (maxEncounters <= 0 || maxEncounters > UINT32_MAX) {
        return foundation::fail<EngineConfig>(ErrorCode::ConfigLoadFailed,
                                              "engine.max_encounters must be a positive integer");
    }
    if (workerThreads <= 0 || workerThreads > 64) {
        return foundation::fail<EngineConfig>(ErrorCode::ConfigLoadFailed,
                                              "events.worker_threads must be between 1 and 64");
    }
    auto parsedLevel = foundation::parseLogLevel(level);
    if (!parsedLevel) {
        return foundation::fail<EngineConfig>(ErrorCode::ConfigLoadFailed,
                                              "unknown logging.level '" + level + "'");
    }
    if (auto categories = readCategoryLevels(config, out); !categories) {
        return EngineResult<EngineConfig>::err(categories.error());
    }
    warnUnknownKeys(config);

    out.maxEncounters = static_cast<uint32_t>(maxEncounters);
    out.eventWorkerThreads = static_cast<uint32_t>(workerThreads);
    out.logLevel = *parsedLevel;
    return EngineResult<EngineConfig>::ok(out);
}

void applyLogging(const EngineConfig& config) {
    auto& logger = foundation::EngineLogger::instance();
    logger.setAllLevels(config.logLevel);
    for (const auto& [category, level] : config.categoryLevels) {
        logger.setCategoryLevel(category, level);
    }
    DCC_LOG_INFO(LogCategory::Config,
                 "log level set to " + std::string(foundation::logLevelName(config.logLevel)));
}

void watchLogLevel(ConfigManager& config) {
    config.watch("logging.level", [&config](std::string_view key) {
        auto text = config.get<std::string>(key);
        auto level = text ? foundation::parseLogLevel(text.value()) : std::nullopt;
        if (!level) {
            DCC_LOG_WARN(LogCategory::Config, "ignoring invalid logging.level update");
            return;
        }
        foundation::EngineLogger::instance().setAllLevels(*level);
        DCC_LOG_INFO(LogCategory::Config,
                     "log level changed to " + std::string(foundation::logLevelName(*level)));
    });
}

}  // namespace dcc::service
