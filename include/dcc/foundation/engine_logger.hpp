#pragma once

/// @file engine_logger.hpp
/// @brief EngineLogger wrapping kcenon common_system logging for the
///        combat engine.
///
/// Category-based filtering, structured context (encounter, participant,
/// session ids) and runtime level control per category.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "dcc/foundation/engine_result.hpp"
#include "dcc/foundation/types.hpp"

namespace dcc::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Engine subsystems that can be filtered independently.
enum class LogCategory : uint8_t {
    Core       = 0, ///< Startup, shutdown, registry
    Encounter  = 1, ///< State machine transitions
    Initiative = 2, ///< Rolls and turn order
    Damage     = 3, ///< Damage, healing, death saves
    Attack     = 4, ///< To-hit resolution
    Condition  = 5, ///< Condition lifecycle
    Event      = 6, ///< Event delivery
    Config     = 7  ///< Configuration loading
};

inline constexpr std::size_t kLogCategoryCount = 8;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Encounter", "Initiative", "Damage",
        "Attack", "Condition", "Event", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name ("debug", "INFO", ...). Returns nullopt if unknown.
std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Parse a category name, case-insensitive ("damage", "Initiative").
std::optional<LogCategory> parseLogCategory(std::string_view name);

/// Structured context attached to a log entry.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.encounterId = encounterId;
///   ctx.participantId = target;
///   ctx.extra["effective"] = "5";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Damage,
///                         "damage applied", ctx);
/// @endcode
struct LogContext {
    std::optional<EncounterId> encounterId;
    std::optional<ParticipantId> participantId;
    std::optional<SessionId> sessionId;
    std::optional<uint32_t> round;
    std::unordered_map<std::string, std::string> extra;
};

/// Engine logger wrapping kcenon's logger registry.
///
/// Default levels:
/// | Category   | Default Level |
/// |------------|---------------|
/// | Core       | Info          |
/// | Encounter  | Info          |
/// | Initiative | Debug         |
/// | Damage     | Debug         |
/// | Attack     | Debug         |
/// | Condition  | Debug         |
/// | Event      | Info          |
/// | Config     | Info          |
class EngineLogger {
public:
    EngineLogger();
    ~EngineLogger();

    EngineLogger(const EngineLogger&) = delete;
    EngineLogger& operator=(const EngineLogger&) = delete;
    EngineLogger(EngineLogger&&) noexcept;
    EngineLogger& operator=(EngineLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as key=value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Apply one minimum level to every category.
    void setAllLevels(LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default kcenon logger.
    EngineResult<void> flush();

    /// Process-wide logger instance.
    static EngineLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace dcc::foundation

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------

/// DCC_MIN_LOG_LEVEL removes calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
#ifndef DCC_MIN_LOG_LEVEL
    #define DCC_MIN_LOG_LEVEL 0
#endif

#define DCC_LOG(level, cat, msg)                                                  \
    do {                                                                          \
        _Pragma("GCC diagnostic push")                                            \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                       \
        if (static_cast<int>(level) >= DCC_MIN_LOG_LEVEL &&                       \
            ::dcc::foundation::EngineLogger::instance().isEnabled((level), (cat))) \
        {                                                                         \
            ::dcc::foundation::EngineLogger::instance().log((level), (cat), (msg)); \
        }                                                                         \
        _Pragma("GCC diagnostic pop")                                             \
    } while (0)

#define DCC_LOG_CTX(level, cat, msg, ctx)                                         \
    do {                                                                          \
        if (static_cast<int>(level) >= DCC_MIN_LOG_LEVEL &&                       \
            ::dcc::foundation::EngineLogger::instance().isEnabled((level), (cat))) \
        {                                                                         \
            ::dcc::foundation::EngineLogger::instance().logWithContext(           \
                (level), (cat), (msg), (ctx));                                    \
        }                                                                         \
    } while (0)

#define DCC_LOG_DEBUG(cat, msg) \
    DCC_LOG(::dcc::foundation::LogLevel::Debug, (cat), (msg))

#define DCC_LOG_INFO(cat, msg) \
    DCC_LOG(::dcc::foundation::LogLevel::Info, (cat), (msg))

#define DCC_LOG_WARN(cat, msg) \
    DCC_LOG(::dcc::foundation::LogLevel::Warning, (cat), (msg))

#define DCC_LOG_ERROR(cat, msg) \
    DCC_LOG(::dcc::foundation::LogLevel::Error, (cat), (msg))

#define DCC_LOG_CRITICAL(cat, msg) \
    DCC_LOG(::dcc::foundation::LogLevel::Critical, (cat), (msg))
