#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <vector>

#include "evolve/ecs/entity.hpp"
#include "evolve/game/stat_system.hpp"
#include "evolve/game/stat_types.hpp"
#include "evolve/game/world.hpp"

using namespace evolve::ecs;
using namespace evolve::game;
using evolve::foundation::ErrorCode;

namespace {

AttributeSet makeAttributes(float constitution, int32_t level = 1) {
    AttributeSet attrs;
    attrs.Set(Attribute::Constitution, constitution);
    attrs.level = level;
    return attrs;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Key parsing
// ═══════════════════════════════════════════════════════════════════════════

TEST(StatKeyTest, ParsesKnownNames) {
    auto attr = parseAttribute("constitution");
    ASSERT_TRUE(attr);
    EXPECT_EQ(attr.value(), Attribute::Constitution);

    auto stat = parseDerivedStat("crit_chance");
    ASSERT_TRUE(stat);
    EXPECT_EQ(stat.value(), DerivedStat::CritChance);
    EXPECT_EQ(derivedStatName(DerivedStat::ToughnessRecovery), "toughness_recovery");
}

TEST(StatKeyTest, RejectsUnknownNames) {
    auto attr = parseAttribute("stamina");
    ASSERT_FALSE(attr);
    EXPECT_EQ(attr.error().code(), ErrorCode::UnknownStatKey);

    auto stat = parseDerivedStat("Max_Health");
    ASSERT_FALSE(stat);
    EXPECT_EQ(stat.error().code(), ErrorCode::UnknownStatKey);
}

TEST(StatKeyTest, AttributeSetFromMap) {
    auto attrs = AttributeSet::fromMap({{"strength", 12.0f}, {"level", 7.0f}});
    ASSERT_TRUE(attrs);
    EXPECT_FLOAT_EQ(attrs.value().Get(Attribute::Strength), 12.0f);
    EXPECT_EQ(attrs.value().level, 7);

    auto bad = AttributeSet::fromMap({{"dexterity", 3.0f}});
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code(), ErrorCode::UnknownStatKey);
}

// ═══════════════════════════════════════════════════════════════════════════
// computeDerivedStats
// ═══════════════════════════════════════════════════════════════════════════

TEST(ComputeDerivedStatsTest, MaxHealthFromConstitutionAndLevel) {
    auto stats = computeDerivedStats(makeAttributes(10.0f), {});
    ASSERT_TRUE(stats);
    EXPECT_FLOAT_EQ(stats.value().Get(DerivedStat::MaxHealth), 105.0f);

    auto leveled = computeDerivedStats(makeAttributes(10.0f, 4), {});
    ASSERT_TRUE(leveled);
    EXPECT_FLOAT_EQ(leveled.value().Get(DerivedStat::MaxHealth), 120.0f);
}

TEST(ComputeDerivedStatsTest, BaseFormulasCombineAttributes) {
    AttributeSet attrs;
    attrs.Set(Attribute::Strength, 4.0f);
    attrs.Set(Attribute::Constitution, 10.0f);
    attrs.Set(Attribute::Intelligence, 5.0f);
    attrs.Set(Attribute::Wisdom, 5.0f);

    auto stats = computeDerivedStats(attrs, {});
    ASSERT_TRUE(stats);
    const auto& s = stats.value();
    EXPECT_FLOAT_EQ(s.Get(DerivedStat::Defense), 5.0f + 10.0f + 2.0f);
    EXPECT_FLOAT_EQ(s.Get(DerivedStat::MaxMana), 50.0f + 40.0f + 20.0f);
    EXPECT_NEAR(s.Get(DerivedStat::MagicResistance), 0.15f, 1e-6f);
    EXPECT_FLOAT_EQ(s.Get(DerivedStat::Toughness), 180.0f);
}

TEST(ComputeDerivedStatsTest, CharismaAffectsNoCombatStat) {
    AttributeSet plain = makeAttributes(10.0f);
    AttributeSet charming = plain;
    charming.Set(Attribute::Charisma, 50.0f);

    EXPECT_EQ(computeDerivedStats(plain, {}).value(), computeDerivedStats(charming, {}).value());
}

TEST(ComputeDerivedStatsTest, AttributeModifiersApplyBeforeFormulas) {
    std::vector<Modifier> mods{Modifier::attribute(Attribute::Constitution, 5.0f)};
    auto additive = computeDerivedStats(makeAttributes(10.0f), mods);
    ASSERT_TRUE(additive);
    EXPECT_FLOAT_EQ(additive.value().Get(DerivedStat::MaxHealth), 155.0f);

    std::vector<Modifier> pct{
        Modifier::attribute(Attribute::Constitution, 0.5f, ModifierOp::Multiplicative)};
    auto multiplied = computeDerivedStats(makeAttributes(10.0f), pct);
    ASSERT_TRUE(multiplied);
    EXPECT_FLOAT_EQ(multiplied.value().Get(DerivedStat::MaxHealth), 155.0f);
}

TEST(ComputeDerivedStatsTest, StatAdditiveBeforeMultiplicative) {
    std::vector<Modifier> mods{
        Modifier::stat(DerivedStat::MaxHealth, 0.1f, ModifierOp::Multiplicative),
        Modifier::stat(DerivedStat::MaxHealth, 20.0f),
    };
    auto stats = computeDerivedStats(makeAttributes(10.0f), mods);
    ASSERT_TRUE(stats);
    EXPECT_NEAR(stats.value().Get(DerivedStat::MaxHealth), 137.5f, 1e-4f);
}

TEST(ComputeDerivedStatsTest, PercentageStatsClampToUnitRange) {
    std::vector<Modifier> mods{
        Modifier::stat(DerivedStat::CritChance, 2.0f),
        Modifier::stat(DerivedStat::DodgeChance, -1.0f),
    };
    auto stats = computeDerivedStats(makeAttributes(10.0f), mods);
    ASSERT_TRUE(stats);
    EXPECT_FLOAT_EQ(stats.value().Get(DerivedStat::CritChance), 1.0f);
    EXPECT_FLOAT_EQ(stats.value().Get(DerivedStat::DodgeChance), 0.0f);
}

TEST(ComputeDerivedStatsTest, NegativeModifiersFloorAtZero) {
    std::vector<Modifier> mods{
        Modifier::attribute(Attribute::Constitution, -50.0f),
        Modifier::stat(DerivedStat::Defense, -100.0f),
    };
    auto stats = computeDerivedStats(makeAttributes(10.0f), mods);
    ASSERT_TRUE(stats);
    EXPECT_FLOAT_EQ(stats.value().Get(DerivedStat::MaxHealth), 5.0f);
    EXPECT_FLOAT_EQ(stats.value().Get(DerivedStat::Defense), 0.0f);
}

TEST(ComputeDerivedStatsTest, RejectsInvalidAttributes) {
    auto negative = computeDerivedStats(makeAttributes(-1.0f), {});
    ASSERT_FALSE(negative);
    EXPECT_EQ(negative.error().code(), ErrorCode::InvalidAttribute);

    auto nan = computeDerivedStats(makeAttributes(std::numeric_limits<float>::quiet_NaN()), {});
    ASSERT_FALSE(nan);
    EXPECT_EQ(nan.error().code(), ErrorCode::InvalidAttribute);

    auto level = computeDerivedStats(makeAttributes(10.0f, -2), {});
    ASSERT_FALSE(level);
    EXPECT_EQ(level.error().code(), ErrorCode::InvalidAttribute);
}

TEST(ComputeDerivedStatsTest, CustomFormulaTable) {
    StatFormulas formulas;
    formulas[DerivedStat::MaxHealth].base = 50.0f;
    formulas[DerivedStat::MaxHealth].perLevel = 0.0f;

    auto stats = computeDerivedStats(makeAttributes(10.0f), {}, formulas);
    ASSERT_TRUE(stats);
    EXPECT_FLOAT_EQ(stats.value().Get(DerivedStat::MaxHealth), 150.0f);
}

TEST(ComputeDerivedStatsTest, IdenticalInputsGiveIdenticalOutputs) {
    AttributeSet attrs = makeAttributes(12.0f, 3);
    attrs.Set(Attribute::Agility, 7.0f);
    attrs.Set(Attribute::Luck, 2.0f);
    std::vector<Modifier> mods{
        Modifier::attribute(Attribute::Agility, 0.2f, ModifierOp::Multiplicative),
        Modifier::stat(DerivedStat::AttackSpeed, 0.3f),
    };

    auto first = computeDerivedStats(attrs, mods);
    auto second = computeDerivedStats(attrs, mods);
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(first.value(), second.value());
}

// ═══════════════════════════════════════════════════════════════════════════
// StatCache
// ═══════════════════════════════════════════════════════════════════════════

class StatCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        world.Add(hero, makeAttributes(10.0f));
        world.attributesChanged.connect([this](Entity e) { cache.Invalidate(e); });
    }

    WorldState world;
    StatCache cache{world};
    Entity hero{0, 0};
};

TEST_F(StatCacheTest, ComputesOnceWhileValid) {
    auto first = cache.Get(hero);
    auto second = cache.Get(hero);
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(cache.ComputeCount(), 1u);
    EXPECT_TRUE(cache.IsValid(hero));
    EXPECT_FLOAT_EQ(cache.Cached(hero).Get(DerivedStat::MaxHealth), 105.0f);
}

TEST_F(StatCacheTest, AttributeChangeInvalidates) {
    ASSERT_TRUE(cache.Get(hero));
    ASSERT_TRUE(world.SetAttributes(hero, makeAttributes(20.0f)));
    EXPECT_FALSE(cache.IsValid(hero));

    auto stats = cache.Get(hero);
    ASSERT_TRUE(stats);
    EXPECT_FLOAT_EQ(stats.value().Get(DerivedStat::MaxHealth), 205.0f);
    EXPECT_EQ(cache.ComputeCount(), 2u);
}

TEST_F(StatCacheTest, EquipmentModifiersApply) {
    ASSERT_TRUE(world.SetEquipment(
        hero, {Modifier::stat(DerivedStat::Defense, 10.0f, ModifierOp::Additive, "shield")}));

    auto stats = cache.Get(hero);
    ASSERT_TRUE(stats);
    EXPECT_FLOAT_EQ(stats.value().Get(DerivedStat::Defense), 5.0f + 10.0f + 10.0f);
}

TEST_F(StatCacheTest, ModifierSourcesContribute) {
    float bonus = 0.0f;
    cache.AddModifierSource([&bonus](Entity, std::vector<Modifier>& out) {
        out.push_back(Modifier::stat(DerivedStat::MaxHealth, bonus));
    });

    bonus = 15.0f;
    EXPECT_FLOAT_EQ(cache.Get(hero).value().Get(DerivedStat::MaxHealth), 120.0f);

    bonus = 0.0f;
    EXPECT_FLOAT_EQ(cache.Get(hero).value().Get(DerivedStat::MaxHealth), 120.0f);
    cache.Invalidate(hero);
    EXPECT_FLOAT_EQ(cache.Get(hero).value().Get(DerivedStat::MaxHealth), 105.0f);
}

TEST_F(StatCacheTest, EffectiveAttributesIncludeModifiers) {
    ASSERT_TRUE(world.SetEquipment(hero, {Modifier::attribute(Attribute::Constitution, 3.0f)}));
    auto attrs = cache.EffectiveAttributes(hero);
    ASSERT_TRUE(attrs);
    EXPECT_FLOAT_EQ(attrs.value().Get(Attribute::Constitution), 13.0f);
}

TEST_F(StatCacheTest, UnknownEntityReportsNotFound) {
    auto stats = cache.Get(Entity(9, 0));
    ASSERT_FALSE(stats);
    EXPECT_EQ(stats.error().code(), ErrorCode::EntityNotFound);
}

TEST_F(StatCacheTest, ForgetDropsEntry) {
    ASSERT_TRUE(cache.Get(hero));
    cache.Forget(hero);
    EXPECT_FALSE(cache.IsValid(hero));
}
