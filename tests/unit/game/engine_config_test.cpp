#include <gtest/gtest.h>

#include <array>
#include <string>

#include "evolve/foundation/config_manager.hpp"
#include "evolve/foundation/game_logger.hpp"
#include "evolve/game/engine_config.hpp"
#include "evolve/game/simulation.hpp"

using namespace evolve::game;
using evolve::foundation::ConfigManager;
using evolve::foundation::ErrorCode;
using evolve::foundation::GameLogger;
using evolve::foundation::kLogCategoryCount;
using evolve::foundation::LogCategory;
using evolve::foundation::LogLevel;

namespace {

evolve::foundation::GameResult<EngineConfig> fromYaml(const std::string& yaml) {
    ConfigManager config;
    EXPECT_TRUE(config.loadFromString(yaml));
    return EngineConfig::fromConfig(config);
}

ErrorCode failureOf(const std::string& yaml) {
    auto result = fromYaml(yaml);
    EXPECT_FALSE(result);
    return result ? ErrorCode::Success : result.error().code();
}

} // namespace

TEST(EngineConfigTest, EmptyConfigKeepsDefaults) {
    ConfigManager config;
    auto engine = EngineConfig::fromConfig(config);
    ASSERT_TRUE(engine);

    const auto& cfg = engine.value();
    EXPECT_FLOAT_EQ(cfg.combat.defenseConstant, 100.0f);
    EXPECT_FLOAT_EQ(cfg.combat.stunDuration, 2.0f);
    EXPECT_FLOAT_EQ(cfg.skills.comboWindow, 3.0f);
    EXPECT_FLOAT_EQ(cfg.skills.comboBonus, 0.2f);
    EXPECT_DOUBLE_EQ(cfg.ai.explorationRate, 0.2);
    EXPECT_DOUBLE_EQ(cfg.ai.discount, 0.95);
    EXPECT_EQ(cfg.seed, 42u);
    EXPECT_EQ(cfg.logLevel, LogLevel::Info);
    EXPECT_FLOAT_EQ(cfg.formulas[DerivedStat::MaxHealth]
                        .perAttribute[static_cast<std::size_t>(Attribute::Constitution)],
                    10.0f);
}

TEST(EngineConfigTest, ReadsEverySection) {
    auto engine = fromYaml(R"(
stats:
  max_health:
    base: 20
    constitution: 12
    level: 4
combat:
  defense_constant: 50
  toughness_stun_duration: 1.5
skills:
  combo_window: 2.5
  combo_bonus: 0.1
ai:
  exploration_rate: 0.3
  decision_interval: 1.0
  decay_after_actions: 10
  class_learning_rate:
    boss: 0.2
logging:
  level: debug
  combat: trace
simulation:
  seed: 7
)");
    ASSERT_TRUE(engine);
    const auto& cfg = engine.value();

    const auto& health = cfg.formulas[DerivedStat::MaxHealth];
    EXPECT_FLOAT_EQ(health.base, 20.0f);
    EXPECT_FLOAT_EQ(health.perAttribute[static_cast<std::size_t>(Attribute::Constitution)], 12.0f);
    EXPECT_FLOAT_EQ(health.perLevel, 4.0f);

    EXPECT_FLOAT_EQ(cfg.combat.defenseConstant, 50.0f);
    EXPECT_FLOAT_EQ(cfg.combat.stunDuration, 1.5f);
    EXPECT_FLOAT_EQ(cfg.skills.comboWindow, 2.5f);
    EXPECT_FLOAT_EQ(cfg.skills.comboBonus, 0.1f);
    EXPECT_DOUBLE_EQ(cfg.ai.explorationRate, 0.3);
    EXPECT_FLOAT_EQ(cfg.ai.decisionInterval, 1.0f);
    EXPECT_EQ(cfg.ai.decayAfterActions, 10u);
    EXPECT_DOUBLE_EQ(cfg.ai.LearningRateFor(EntityClass::Boss), 0.2);
    EXPECT_DOUBLE_EQ(cfg.ai.LearningRateFor(EntityClass::Player), 1.0);
    EXPECT_EQ(cfg.logLevel, LogLevel::Debug);
    EXPECT_EQ(cfg.categoryLevels[static_cast<std::size_t>(LogCategory::Combat)], LogLevel::Trace);
    EXPECT_FALSE(cfg.categoryLevels[static_cast<std::size_t>(LogCategory::AI)].has_value());
    EXPECT_EQ(cfg.seed, 7u);
}

TEST(EngineConfigTest, RejectsUnknownStatKeys) {
    EXPECT_EQ(failureOf("stats:\n  fake_stat:\n    base: 1\n"), ErrorCode::UnknownStatKey);
    EXPECT_EQ(failureOf("stats:\n  max_health:\n    courage: 1\n"), ErrorCode::UnknownStatKey);
    EXPECT_EQ(failureOf("stats:\n  max_health: 5\n"), ErrorCode::UnknownStatKey);
}

TEST(EngineConfigTest, RejectsWrongTypes) {
    EXPECT_EQ(failureOf("combat:\n  defense_constant: lots\n"), ErrorCode::ConfigTypeMismatch);
    EXPECT_EQ(failureOf("stats:\n  defense:\n    base: high\n"), ErrorCode::ConfigTypeMismatch);
}

TEST(EngineConfigTest, RejectsOutOfRangeValues) {
    EXPECT_EQ(failureOf("ai:\n  discount: 1.5\n"), ErrorCode::InvalidArgument);
    EXPECT_EQ(failureOf("combat:\n  defense_constant: 0\n"), ErrorCode::InvalidArgument);
    EXPECT_EQ(failureOf("combat:\n  block_reduction: -0.1\n"), ErrorCode::InvalidArgument);
    EXPECT_EQ(failureOf("skills:\n  combo_bonus: -1\n"), ErrorCode::InvalidArgument);
    EXPECT_EQ(failureOf("ai:\n  class_learning_rate:\n    boss: 2\n"), ErrorCode::InvalidArgument);
}

TEST(EngineConfigTest, RejectsUnknownNames) {
    EXPECT_EQ(failureOf("logging:\n  level: loud\n"), ErrorCode::InvalidArgument);
    EXPECT_EQ(failureOf("logging:\n  skill: whisper\n"), ErrorCode::InvalidArgument);
    EXPECT_EQ(failureOf("ai:\n  class_learning_rate:\n    dragon: 0.5\n"),
              ErrorCode::InvalidArgument);
}

TEST(EngineConfigTest, ApplyLoggingSetsLoggerLevels) {
    auto& logger = GameLogger::instance();
    std::array<LogLevel, kLogCategoryCount> saved{};
    for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
        saved[i] = logger.getCategoryLevel(static_cast<LogCategory>(i));
    }

    EngineConfig cfg;
    cfg.logLevel = LogLevel::Warning;
    cfg.categoryLevels[static_cast<std::size_t>(LogCategory::Skill)] = LogLevel::Trace;
    cfg.ApplyLogging();

    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Core), LogLevel::Warning);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Skill), LogLevel::Trace);

    for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
        logger.setCategoryLevel(static_cast<LogCategory>(i), saved[i]);
    }
}

TEST(EngineConfigTest, SimulationUsesConfiguredFormulas) {
    auto engine = fromYaml(R"(
stats:
  max_health:
    base: 20
    constitution: 12
    level: 4
)");
    ASSERT_TRUE(engine);
    Simulation sim(engine.value());

    AttributeSet attrs;
    attrs.Set(Attribute::Constitution, 10.0f);
    SpawnParams params;
    params.attributes = attrs;
    auto hero = sim.Spawn(params);
    ASSERT_TRUE(hero);
    EXPECT_FLOAT_EQ(sim.VitalsOf(hero.value())->maxHealth, 20.0f + 120.0f + 4.0f);
}

TEST(EngineConfigTest, ShippedConfigLoads) {
    ConfigManager config;
    ASSERT_TRUE(config.load(std::string(EVOLVE_SOURCE_DIR) + "/config/engine.yaml"));

    auto engine = EngineConfig::fromConfig(config);
    ASSERT_TRUE(engine);

    const auto& cfg = engine.value();
    EXPECT_EQ(cfg.seed, 42u);
    EXPECT_FLOAT_EQ(cfg.formulas[DerivedStat::MaxMana].base, 50.0f);
    EXPECT_FLOAT_EQ(cfg.combat.blockReduction, 0.5f);
    EXPECT_FLOAT_EQ(cfg.ai.decisionInterval, 0.5f);
    EXPECT_DOUBLE_EQ(cfg.ai.LearningRateFor(EntityClass::Chimera), 0.02);
    EXPECT_DOUBLE_EQ(cfg.ai.LearningRateFor(EntityClass::Boss), 0.01);
}
