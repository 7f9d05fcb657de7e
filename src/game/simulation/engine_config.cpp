/// @file engine_config.cpp
/// @brief EngineConfig::fromConfig: dotted keys to engine tunables.

#include "evolve/game/engine_config.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <utility>

namespace evolve::game {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogLevel;

namespace {

/// Overwrite @p out when @p key is present.
template <typename T>
GameResult<void> readKey(const ConfigManager& config, std::string_view key, T& out) {
    auto value = config.getOr<T>(key, out);
    if (!value) {
        return GameResult<void>::err(value.error());
    }
    out = value.value();
    return GameResult<void>::ok();
}

GameResult<void> requireRange(std::string_view key, double value, double lo, double hi) {
    if (value < lo || value > hi) {
        return GameResult<void>::err(GameError(
            ErrorCode::InvalidArgument,
            std::string(key) + " must lie in [" + std::to_string(lo) + ", " +
                std::to_string(hi) + "]"));
    }
    return GameResult<void>::ok();
}

GameResult<LogLevel> readLevel(const ConfigManager& config, const std::string& key,
                               LogLevel fallback) {
    auto name = config.getOr<std::string>(key, std::string(foundation::logLevelName(fallback)));
    if (!name) {
        return GameResult<LogLevel>::err(name.error());
    }
    auto level = foundation::parseLogLevel(name.value());
    if (!level) {
        return GameResult<LogLevel>::err(GameError(
            ErrorCode::InvalidArgument, "unknown log level '" + name.value() + "' at " + key));
    }
    return GameResult<LogLevel>::ok(*level);
}

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// ── Sections ────────────────────────────────────────────────────────────

/// stats.<stat>.<coefficient> where coefficient is base, level or an
/// attribute name.
GameResult<void> readFormulas(const ConfigManager& config, StatFormulas& formulas) {
    for (const auto& key : config.keysWithPrefix("stats")) {
        const std::string_view rest = std::string_view(key).substr(6);
        const auto dot = rest.find('.');
        if (dot == std::string_view::npos) {
            return GameResult<void>::err(GameError(
                ErrorCode::UnknownStatKey, "expected stats.<stat>.<coefficient>: " + key));
        }
        auto stat = parseDerivedStat(rest.substr(0, dot));
        if (!stat) {
            return GameResult<void>::err(stat.error());
        }
        const std::string_view coefficient = rest.substr(dot + 1);

        auto value = config.get<float>(key);
        if (!value) {
            return GameResult<void>::err(value.error());
        }

        StatFormula& formula = formulas[stat.value()];
        if (coefficient == "base") {
            formula.base = value.value();
        } else if (coefficient == "level") {
            formula.perLevel = value.value();
        } else {
            auto attr = parseAttribute(coefficient);
            if (!attr) {
                return GameResult<void>::err(attr.error());
            }
            formula.perAttribute[static_cast<std::size_t>(attr.value())] = value.value();
        }
    }
    return GameResult<void>::ok();
}

GameResult<void> readCombat(const ConfigManager& config, CombatTuning& combat) {
    for (auto r : {readKey(config, "combat.defense_constant", combat.defenseConstant),
                   readKey(config, "combat.toughness_stun_duration", combat.stunDuration),
                   readKey(config, "combat.block_reduction", combat.blockReduction),
                   readKey(config, "combat.low_health_threshold", combat.lowHealthThreshold)}) {
        if (!r) {
            return r;
        }
    }
    if (combat.defenseConstant <= 0.0f) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument, "combat.defense_constant must be positive"));
    }
    if (auto r = requireRange("combat.block_reduction", combat.blockReduction, 0.0, 1.0); !r) {
        return r;
    }
    if (auto r = requireRange("combat.low_health_threshold", combat.lowHealthThreshold, 0.0, 1.0);
        !r) {
        return r;
    }
    return requireRange("combat.toughness_stun_duration", combat.stunDuration, 0.0, 1e9);
}

GameResult<void> readSkills(const ConfigManager& config, SkillTuning& skills) {
    for (auto r : {readKey(config, "skills.combo_window", skills.comboWindow),
                   readKey(config, "skills.combo_bonus", skills.comboBonus)}) {
        if (!r) {
            return r;
        }
    }
    if (auto r = requireRange("skills.combo_window", skills.comboWindow, 0.0, 1e9); !r) {
        return r;
    }
    return requireRange("skills.combo_bonus", skills.comboBonus, 0.0, 1e9);
}

GameResult<void> readAI(const ConfigManager& config, AIConfig& ai) {
    for (auto r : {readKey(config, "ai.learning_rate", ai.learningRate),
                   readKey(config, "ai.discount", ai.discount),
                   readKey(config, "ai.exploration_rate", ai.explorationRate),
                   readKey(config, "ai.learning_rate_decay", ai.learningRateDecay),
                   readKey(config, "ai.exploration_decay", ai.explorationDecay),
                   readKey(config, "ai.min_learning_rate", ai.minLearningRate),
                   readKey(config, "ai.min_exploration_rate", ai.minExplorationRate),
                   readKey(config, "ai.default_value", ai.defaultValue),
                   readKey(config, "ai.decay_after_actions", ai.decayAfterActions),
                   readKey(config, "ai.decision_interval", ai.decisionInterval)}) {
        if (!r) {
            return r;
        }
    }

    for (const auto& key : config.keysWithPrefix("ai.class_learning_rate")) {
        auto cls = parseEntityClass(std::string_view(key).substr(23));
        if (!cls) {
            return GameResult<void>::err(cls.error());
        }
        auto& rate = ai.classLearningRate[static_cast<std::size_t>(cls.value())];
        if (auto r = readKey(config, key, rate); !r) {
            return r;
        }
        if (auto r = requireRange(key, rate, 0.0, 1.0); !r) {
            return r;
        }
    }

    const std::pair<std::string_view, double> unitRanged[] = {
        {"ai.learning_rate", ai.learningRate},
        {"ai.discount", ai.discount},
        {"ai.exploration_rate", ai.explorationRate},
        {"ai.learning_rate_decay", ai.learningRateDecay},
        {"ai.exploration_decay", ai.explorationDecay},
        {"ai.min_learning_rate", ai.minLearningRate},
        {"ai.min_exploration_rate", ai.minExplorationRate},
    };
    for (const auto& [key, value] : unitRanged) {
        if (auto r = requireRange(key, value, 0.0, 1.0); !r) {
            return r;
        }
    }
    return requireRange("ai.decision_interval", ai.decisionInterval, 0.0, 1e9);
}

GameResult<void> readLogging(const ConfigManager& config, EngineConfig& out) {
    auto level = readLevel(config, "logging.level", out.logLevel);
    if (!level) {
        return GameResult<void>::err(level.error());
    }
    out.logLevel = level.value();

    for (std::size_t i = 0; i < foundation::kLogCategoryCount; ++i) {
        const auto cat = static_cast<LogCategory>(i);
        const std::string key = "logging." + lowercase(foundation::logCategoryName(cat));
        if (!config.hasKey(key)) {
            continue;
        }
        auto categoryLevel = readLevel(config, key, out.logLevel);
        if (!categoryLevel) {
            return GameResult<void>::err(categoryLevel.error());
        }
        out.categoryLevels[i] = categoryLevel.value();
    }
    return GameResult<void>::ok();
}

} // namespace

GameResult<EngineConfig> EngineConfig::fromConfig(const ConfigManager& config) {
    EngineConfig out;
    for (auto r : {readFormulas(config, out.formulas),
                   readCombat(config, out.combat),
                   readSkills(config, out.skills),
                   readAI(config, out.ai),
                   readLogging(config, out),
                   readKey(config, "simulation.seed", out.seed)}) {
        if (!r) {
            return GameResult<EngineConfig>::err(r.error());
        }
    }
    return GameResult<EngineConfig>::ok(std::move(out));
}

void EngineConfig::ApplyLogging() const {
    auto& logger = foundation::GameLogger::instance();
    logger.setAllLevels(logLevel);
    for (std::size_t i = 0; i < categoryLevels.size(); ++i) {
        if (categoryLevels[i]) {
            logger.setCategoryLevel(static_cast<LogCategory>(i), *categoryLevels[i]);
        }
    }
}

} // namespace evolve::game
