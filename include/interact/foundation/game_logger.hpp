#pragma once

/// @file game_logger.hpp
/// @brief GameLogger wrapping kcenon common_system's logger registry.
///
/// Category-based filtering, structured context, and per-category
/// runtime level control for the addon.  The actual sink (console,
/// rotating file, the host's own chat frame) is whatever ILogger the
/// embedding code registers with kcenon's GlobalLoggerRegistry.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <map>

#include "interact/foundation/game_result.hpp"
#include "interact/foundation/types.hpp"

namespace interact::foundation {

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

/// Addon log categories, each with its own minimum level.
enum class LogCategory : uint8_t {
    Core      = 0, ///< Bootstrap, versioning, configuration
    Hook      = 1, ///< Detour installation
    Script    = 2, ///< Script host binding and command dispatch
    Selection = 3, ///< Candidate selection pass
    World     = 4  ///< World accessor implementations
};

inline constexpr std::size_t kLogCategoryCount = 5;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Hook", "Script", "Selection", "World"
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

/// Parse a level name as written in the configuration file.
///
/// Case-insensitive; accepts "warn" as an alias of "warning".
/// Returns std::nullopt for anything else.
[[nodiscard]] std::optional<LogLevel> logLevelFromName(std::string_view name);

/// Parse a category name ("core", "selection", ...), case-insensitive.
[[nodiscard]] std::optional<LogCategory> logCategoryFromName(std::string_view name);

/// Structured context attached to a log entry.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.objectGuid = candidate.guid;
///   ctx.distance = candidate.distance;
///   ctx.extra["class"] = "WorldObject";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Selection,
///                         "Selected candidate", ctx);
/// @endcode
struct LogContext {
    std::optional<ObjectGuid> objectGuid;
    std::optional<float> distance;  ///< Printed with two decimals.
    std::map<std::string, std::string> extra;
};

/// Addon logger facade over kcenon's logging registry.
///
/// Default log levels per category:
/// | Category  | Default Level |
/// |-----------|---------------|
/// | Core      | Info          |
/// | Hook      | Info          |
/// | Script    | Info          |
/// | Selection | Debug         |
/// | World     | Info          |
///
/// Each category first looks up a named logger "interact.<Category>" in
/// the registry and falls back to the registry's default logger.
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;
    GameLogger(GameLogger&&) noexcept;
    GameLogger& operator=(GameLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as key=value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Apply one minimum level to every category.
    void setAllCategoryLevels(LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Restore the default level of every category.
    void resetCategoryLevels();

    /// Flush the default logger.
    GameResult<void> flush();

    /// Process-wide instance used by the INTERACT_LOG macros.
    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace interact::foundation

// ---------------------------------------------------------------------------
// Convenience macros (global, outside the namespace)
// ---------------------------------------------------------------------------

/// @name INTERACT_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// Define INTERACT_MIN_LOG_LEVEL before including this header to drop
/// calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef INTERACT_MIN_LOG_LEVEL
    #define INTERACT_MIN_LOG_LEVEL 0
#endif

#define INTERACT_LOG(level, cat, msg)                                                 \
    do {                                                                              \
        _Pragma("GCC diagnostic push")                                                \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                           \
        if (static_cast<int>(level) >= INTERACT_MIN_LOG_LEVEL &&                      \
            ::interact::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                             \
            ::interact::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                             \
        _Pragma("GCC diagnostic pop")                                                 \
    } while (0)

#define INTERACT_LOG_TRACE(cat, msg) \
    INTERACT_LOG(::interact::foundation::LogLevel::Trace, (cat), (msg))

#define INTERACT_LOG_DEBUG(cat, msg) \
    INTERACT_LOG(::interact::foundation::LogLevel::Debug, (cat), (msg))

#define INTERACT_LOG_INFO(cat, msg) \
    INTERACT_LOG(::interact::foundation::LogLevel::Info, (cat), (msg))

#define INTERACT_LOG_WARN(cat, msg) \
    INTERACT_LOG(::interact::foundation::LogLevel::Warning, (cat), (msg))

#define INTERACT_LOG_ERROR(cat, msg) \
    INTERACT_LOG(::interact::foundation::LogLevel::Error, (cat), (msg))

/// @}
