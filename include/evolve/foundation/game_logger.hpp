#pragma once

/// @file game_logger.hpp
/// @brief GameLogger routing engine diagnostics through the kcenon logger
///        registry, with one runtime level per subsystem category.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "evolve/foundation/game_result.hpp"
#include "evolve/foundation/types.hpp"

namespace evolve::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level one-to-one.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Engine subsystems, each with its own minimum level.
enum class LogCategory : uint8_t {
    Core        = 0, ///< Simulation lifecycle, configuration
    Stats       = 1, ///< Derived stat computation and caching
    Effect      = 2, ///< Effect application, ticks, expiry
    Trigger     = 3, ///< Proc evaluation
    Skill       = 4, ///< Skill validation and execution
    Combat      = 5, ///< Damage resolution, stagger, death
    AI          = 6, ///< Decision loop and learning
    Persistence = 7  ///< AI memory snapshots
};

inline constexpr std::size_t kLogCategoryCount = 8;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Stats", "Effect", "Trigger", "Skill", "Combat", "AI", "Persistence"
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

/// Parse a level name as written in configuration ("debug", "WARNING").
std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Level at which a returned failure is reported: precondition failures
/// at Debug, I/O failures at Warning, everything else at Error.
inline LogLevel failureLogLevel(const GameError& error) {
    switch (error.errorClass()) {
        case ErrorClass::None:
        case ErrorClass::Precondition: return LogLevel::Debug;
        case ErrorClass::External:     return LogLevel::Warning;
        case ErrorClass::Validation:
        case ErrorClass::Internal:     return LogLevel::Error;
    }
    return LogLevel::Error;
}

/// Structured fields appended to a log line as key=value pairs.
///
/// @code
///   LogContext ctx;
///   ctx.entity = caster.id();
///   ctx.skillId = SkillId(3);
///   ctx.extra["damage"] = "42.5";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Skill, "skill used", ctx);
/// @endcode
struct LogContext {
    std::optional<uint32_t> entity;
    std::optional<uint32_t> target;
    std::optional<SkillId> skillId;
    std::optional<EffectId> effectId;
    std::unordered_map<std::string, std::string> extra;
};

/// Category-filtered logger over kcenon's GlobalLoggerRegistry.
///
/// Each category resolves a named logger "evolve.<Category>" from the
/// registry and falls back to the registry's default logger. With nothing
/// registered, output goes to the registry's null logger.
///
/// Default levels: Core, Persistence and Stats at Info; everything else at
/// Debug.
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

    /// Log a message followed by " {key=val, ...}" built from @p ctx.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Set every category to the same minimum level.
    void setAllLevels(LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the registry's default logger.
    GameResult<void> flush();

    /// Process-wide instance used by the EVOLVE_LOG macros.
    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace evolve::foundation

// ── Convenience macros ──────────────────────────────────────────────────────

/// @name EVOLVE_LOG Macros
/// Define EVOLVE_MIN_LOG_LEVEL (0=Trace .. 6=Off) before including this
/// header to compile out calls below the threshold.
/// @{

#ifndef EVOLVE_MIN_LOG_LEVEL
    #define EVOLVE_MIN_LOG_LEVEL 0
#endif

#define EVOLVE_LOG(level, cat, msg)                                                  \
    do {                                                                             \
        _Pragma("GCC diagnostic push")                                               \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                          \
        if (static_cast<int>(level) >= EVOLVE_MIN_LOG_LEVEL &&                       \
            ::evolve::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                            \
            ::evolve::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                            \
        _Pragma("GCC diagnostic pop")                                                \
    } while (0)

#define EVOLVE_LOG_TRACE(cat, msg) \
    EVOLVE_LOG(::evolve::foundation::LogLevel::Trace, (cat), (msg))

#define EVOLVE_LOG_DEBUG(cat, msg) \
    EVOLVE_LOG(::evolve::foundation::LogLevel::Debug, (cat), (msg))

#define EVOLVE_LOG_INFO(cat, msg) \
    EVOLVE_LOG(::evolve::foundation::LogLevel::Info, (cat), (msg))

#define EVOLVE_LOG_WARN(cat, msg) \
    EVOLVE_LOG(::evolve::foundation::LogLevel::Warning, (cat), (msg))

#define EVOLVE_LOG_ERROR(cat, msg) \
    EVOLVE_LOG(::evolve::foundation::LogLevel::Error, (cat), (msg))

/// Log a GameError's message at failureLogLevel(). A prefix names the
/// operation that failed.
#define EVOLVE_LOG_FAILURE(cat, prefix, error)                                    \
    EVOLVE_LOG(::evolve::foundation::failureLogLevel(error), (cat),               \
               std::string(prefix) + ": " + std::string((error).message()))

/// @}
