/// @file service_runner.cpp
/// @brief Config-file resolution and loading.

#include "dcc/service/service_runner.hpp"

#include <cstdlib>
#include <string_view>

#include "dcc/foundation/config_manager.hpp"
#include "dcc/foundation/engine_logger.hpp"

namespace dcc::service {

std::optional<std::filesystem::path> resolveConfigPath(int argc, char* argv[]) {
    const char* envPath = std::getenv("DCC_CONFIG_PATH");
    if (envPath != nullptr && *envPath != '\0') {
        return std::filesystem::path(envPath);
    }
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return std::filesystem::path(argv[i + 1]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return std::nullopt;
}

foundation::EngineResult<EngineConfig> loadEngineConfig(const std::filesystem::path& path) {
    foundation::ConfigManager config;
    if (auto loaded = config.load(path); !loaded) {
        return foundation::EngineResult<EngineConfig>::err(loaded.error());
    }
    auto built = buildEngineConfig(config);
    if (built) {
        DCC_LOG_INFO(foundation::LogCategory::Config, "loaded " + path.string());
    }
    return built;
}

}  // namespace dcc::service
