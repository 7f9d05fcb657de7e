#pragma once

/// @file engine_config.hpp
/// @brief Engine tunables and their loading from ConfigManager keys.

#include <array>
#include <cstdint>
#include <optional>

#include "evolve/foundation/config_manager.hpp"
#include "evolve/foundation/game_logger.hpp"
#include "evolve/foundation/game_result.hpp"
#include "evolve/game/ai_types.hpp"
#include "evolve/game/combat_types.hpp"
#include "evolve/game/skill_types.hpp"
#include "evolve/game/stat_types.hpp"

namespace evolve::game {

/// Every tunable of the engine, with defaults.
///
/// Keys (all optional):
///   stats.<stat>.base | stats.<stat>.<attribute> | stats.<stat>.level
///   combat.defense_constant, combat.toughness_stun_duration,
///   combat.block_reduction, combat.low_health_threshold
///   skills.combo_window, skills.combo_bonus
///   ai.* (see AIConfig), ai.class_learning_rate.<class>
///   logging.level, logging.<category>
///   simulation.seed
struct EngineConfig {
    StatFormulas formulas;
    CombatTuning combat;
    SkillTuning skills;
    AIConfig ai;
    foundation::LogLevel logLevel = foundation::LogLevel::Info;
    std::array<std::optional<foundation::LogLevel>, foundation::kLogCategoryCount> categoryLevels{};
    uint64_t seed = 42;

    /// Read every known key from @p config; absent keys keep defaults.
    /// @return The config, ConfigTypeMismatch, UnknownStatKey or
    ///         InvalidArgument (unknown level or class name, bad range).
    [[nodiscard]] static foundation::GameResult<EngineConfig> fromConfig(
        const foundation::ConfigManager& config);

    /// Push the log levels into GameLogger::instance().
    void ApplyLogging() const;
};

} // namespace evolve::game
