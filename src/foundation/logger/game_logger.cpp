/// @file game_logger.cpp
/// @brief GameLogger implementation over kcenon's GlobalLoggerRegistry.

#include "evolve/foundation/game_logger.hpp"

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <sstream>
#include <string>

namespace evolve::foundation {

namespace kci = kcenon::common::interfaces;

// ── Level mapping ───────────────────────────────────────────────────────────

static kci::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

static constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,   // Core
    LogLevel::Info,   // Stats
    LogLevel::Debug,  // Effect
    LogLevel::Debug,  // Trigger
    LogLevel::Debug,  // Skill
    LogLevel::Debug,  // Combat
    LogLevel::Debug,  // AI
    LogLevel::Info    // Persistence
};

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "WARN") {
        return LogLevel::Warning;
    }
    for (uint8_t i = 0; i <= static_cast<uint8_t>(LogLevel::Off); ++i) {
        auto level = static_cast<LogLevel>(i);
        if (logLevelName(level) == upper) {
            return level;
        }
    }
    return std::nullopt;
}

// ── Context serialization ───────────────────────────────────────────────────

static std::string formatContext(const LogContext& ctx) {
    std::ostringstream oss;
    bool first = true;

    auto append = [&](std::string_view key, std::string_view val) {
        if (!first) {
            oss << ", ";
        }
        oss << key << '=' << val;
        first = false;
    };

    if (ctx.entity) {
        append("entity", std::to_string(*ctx.entity));
    }
    if (ctx.target) {
        append("target", std::to_string(*ctx.target));
    }
    if (ctx.skillId && ctx.skillId->isValid()) {
        append("skill_id", std::to_string(ctx.skillId->value()));
    }
    if (ctx.effectId && ctx.effectId->isValid()) {
        append("effect_id", std::to_string(ctx.effectId->value()));
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, val);
    }
    return oss.str();
}

// ── Impl ────────────────────────────────────────────────────────────────────

struct GameLogger::Impl {
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;
    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(kDefaultCategoryLevels[i], std::memory_order_relaxed);
            loggerNames[i] = std::string("evolve.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    std::shared_ptr<kci::ILogger> getLogger(LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        auto& registry = kci::GlobalLoggerRegistry::instance();
        if (idx >= kLogCategoryCount) {
            return kci::GlobalLoggerRegistry::null_logger();
        }
        // The registry hands back its null logger for unknown names; it
        // reports every level disabled, including off.
        auto logger = registry.get_logger(loggerNames[idx]);
        if (!logger->is_enabled(kci::log_level::off)) {
            return registry.get_default_logger();
        }
        return logger;
    }

    void write(LogLevel level, LogCategory cat, std::string_view msg,
               std::string_view suffix) const {
        std::string formatted;
        formatted.reserve(msg.size() + suffix.size() + 20);
        formatted += '[';
        formatted += logCategoryName(cat);
        formatted += "] ";
        formatted += msg;
        if (!suffix.empty()) {
            formatted += " {";
            formatted += suffix;
            formatted += '}';
        }
        // Logging must never fail an engine operation.
        (void)getLogger(cat)->log(mapLevel(level), formatted);
    }
};

// ── Construction / Destruction / Move ───────────────────────────────────────

GameLogger::GameLogger() : impl_(std::make_unique<Impl>()) {}

GameLogger::~GameLogger() = default;

GameLogger::GameLogger(GameLogger&&) noexcept = default;
GameLogger& GameLogger::operator=(GameLogger&&) noexcept = default;

// ── Logging ─────────────────────────────────────────────────────────────────

void GameLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->write(level, cat, msg, {});
}

void GameLogger::logWithContext(LogLevel level, LogCategory cat,
                                std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->write(level, cat, msg, formatContext(ctx));
}

// ── Category level control ──────────────────────────────────────────────────

void GameLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

void GameLogger::setAllLevels(LogLevel minLevel) {
    for (auto& level : impl_->categoryLevels) {
        level.store(minLevel, std::memory_order_release);
    }
}

LogLevel GameLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool GameLogger::isEnabled(LogLevel level, LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount || level == LogLevel::Off) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

GameResult<void> GameLogger::flush() {
    auto logger = kci::GlobalLoggerRegistry::instance().get_default_logger();
    if (logger->flush().is_err()) {
        return GameResult<void>::err(
            GameError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return GameResult<void>::ok();
}

GameLogger& GameLogger::instance() {
    static GameLogger inst;
    return inst;
}

} // namespace evolve::foundation
