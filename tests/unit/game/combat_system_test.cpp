#include <gtest/gtest.h>

#include <vector>

#include "evolve/ecs/component_storage.hpp"
#include "evolve/ecs/entity.hpp"
#include "evolve/game/combat_system.hpp"
#include "evolve/game/combat_types.hpp"
#include "evolve/game/game_events.hpp"
#include "evolve/game/stat_system.hpp"
#include "evolve/game/world.hpp"
#include "scripted_random.hpp"

using namespace evolve::ecs;
using namespace evolve::game;
using evolve::foundation::ErrorCode;
using evolve::testing::ScriptedRandom;

// ═══════════════════════════════════════════════════════════════════════════
// Vitals component
// ═══════════════════════════════════════════════════════════════════════════

TEST(VitalsTest, SettersClampToMaxima) {
    Vitals v;
    v.maxHealth = 100.0f;
    v.maxMana = 50.0f;
    v.SetHealth(150.0f);
    v.SetMana(-5.0f);
    EXPECT_FLOAT_EQ(v.health, 100.0f);
    EXPECT_FLOAT_EQ(v.mana, 0.0f);
    EXPECT_FLOAT_EQ(v.HealthRatio(), 1.0f);
    EXPECT_FLOAT_EQ(v.ManaRatio(), 0.0f);
}

TEST(VitalsTest, RefreshMaximaClampsCurrent) {
    DerivedStatSet stats;
    stats.Set(DerivedStat::MaxHealth, 100.0f);
    Vitals v = Vitals::Full(stats);
    EXPECT_FLOAT_EQ(v.health, 100.0f);

    stats.Set(DerivedStat::MaxHealth, 60.0f);
    v.RefreshMaxima(stats);
    EXPECT_FLOAT_EQ(v.health, 60.0f);
}

TEST(ImmunitiesTest, CoversSharedTag) {
    Immunities immune{{"fire", "poison"}};
    EXPECT_TRUE(immune.Covers({"burn", "fire"}));
    EXPECT_FALSE(immune.Covers({"frost"}));
    EXPECT_FALSE(immune.Covers({}));
}

// ═══════════════════════════════════════════════════════════════════════════
// CombatSystem
// ═══════════════════════════════════════════════════════════════════════════

class CombatSystemTest : public ::testing::Test {
protected:
    void SetUp() override {
        AttributeSet attackerAttrs;
        world.Add(attacker, attackerAttrs);
        spawnVitals(attacker);

        AttributeSet defenderAttrs;
        defenderAttrs.Set(Attribute::Constitution, 10.0f);
        defenderAttrs.Set(Attribute::Wisdom, 10.0f);
        world.Add(defender, defenderAttrs);
        spawnVitals(defender);

        events.damageDealt.connect([this](const DamageDealtEvent& e) { damageEvents.push_back(e); });
        events.entityDied.connect([this](const EntityDiedEvent& e) { deathEvents.push_back(e); });
        events.entityStunned.connect([this](const EntityStunnedEvent&) { ++stunEvents; });
    }

    void spawnVitals(Entity e) {
        vitals.Add(e, Vitals::Full(stats.Get(e).value()));
    }

    AttackRequest physical(float magnitude) {
        AttackRequest request;
        request.magnitude = magnitude;
        return request;
    }

    Entity attacker{0, 0};
    Entity defender{1, 0};

    ComponentStorage<Vitals> vitals;
    WorldState world;
    StatCache stats{world};
    ScriptedRandom random;
    GameEvents events;
    CombatSystem combat{vitals, stats, world, random, events};

    std::vector<DamageDealtEvent> damageEvents;
    std::vector<EntityDiedEvent> deathEvents;
    int stunEvents = 0;
};

TEST_F(CombatSystemTest, PhysicalDamageMitigatedByDefense) {
    // defense = 5 + con 10 = 15; mitigation = 15 / 115
    auto result = combat.ResolveAttack(attacker, defender, physical(100.0f));
    ASSERT_TRUE(result);

    const float expected = 100.0f * (1.0f - 15.0f / 115.0f);
    EXPECT_NEAR(result.value().finalDamage, expected, 1e-3f);
    EXPECT_NEAR(vitals.Get(defender).health, 105.0f - expected, 1e-3f);
    EXPECT_FALSE(result.value().isCrit);
    EXPECT_FALSE(result.value().isDodged);
    ASSERT_EQ(damageEvents.size(), 1u);
    EXPECT_EQ(damageEvents.front().defender, defender);
}

TEST_F(CombatSystemTest, MagicDamageUsesResistance) {
    // magic resistance = wisdom 10 x 0.02
    AttackRequest request = physical(50.0f);
    request.type = DamageType::Fire;
    auto result = combat.ResolveAttack(attacker, defender, request);
    ASSERT_TRUE(result);
    EXPECT_NEAR(result.value().finalDamage, 40.0f, 1e-4f);
    EXPECT_FALSE(result.value().isBlocked);
}

TEST_F(CombatSystemTest, IgnoreMitigationDealsFullDamage) {
    AttackRequest request = physical(30.0f);
    request.ignoreMitigation = true;
    auto result = combat.ResolveAttack(attacker, defender, request);
    ASSERT_TRUE(result);
    EXPECT_FLOAT_EQ(result.value().finalDamage, 30.0f);
}

TEST_F(CombatSystemTest, DodgeAvoidsAllDamage) {
    random.Queue({0.0f});
    auto result = combat.ResolveAttack(attacker, defender, physical(100.0f));
    ASSERT_TRUE(result);
    EXPECT_TRUE(result.value().isDodged);
    EXPECT_FLOAT_EQ(result.value().finalDamage, 0.0f);
    EXPECT_FLOAT_EQ(vitals.Get(defender).health, 105.0f);
}

TEST_F(CombatSystemTest, CritMultipliesRawDamage) {
    // dodge fails, crit succeeds; attacker crit multiplier is 1.5
    random.Queue({0.999f, 0.0f});
    auto result = combat.ResolveAttack(attacker, defender, physical(20.0f));
    ASSERT_TRUE(result);
    EXPECT_TRUE(result.value().isCrit);
    EXPECT_FLOAT_EQ(result.value().rawDamage, 30.0f);
}

TEST_F(CombatSystemTest, BlockHalvesPhysicalDamage) {
    random.Queue({0.999f, 0.999f, 0.0f});
    AttackRequest request = physical(40.0f);
    request.ignoreMitigation = true;
    auto result = combat.ResolveAttack(attacker, defender, request);
    ASSERT_TRUE(result);
    EXPECT_TRUE(result.value().isBlocked);
    EXPECT_FLOAT_EQ(result.value().finalDamage, 20.0f);
}

TEST_F(CombatSystemTest, EnvironmentalDamageNeverCrits) {
    random.Queue({0.999f, 0.0f});
    AttackRequest request = physical(10.0f);
    request.ignoreMitigation = true;
    auto result = combat.ResolveAttack(Entity::invalid(), defender, request);
    ASSERT_TRUE(result);
    EXPECT_FALSE(result.value().isCrit);
}

TEST_F(CombatSystemTest, StaggerBreakingToughnessStuns) {
    // toughness = 100 + con 10 x 8 = 180
    AttackRequest request = physical(90.0f);
    request.ignoreMitigation = true;
    request.staggerScale = 2.0f;
    auto result = combat.ResolveAttack(attacker, defender, request);
    ASSERT_TRUE(result);
    EXPECT_TRUE(result.value().isStunned);
    EXPECT_TRUE(vitals.Get(defender).IsStunned());
    EXPECT_FLOAT_EQ(vitals.Get(defender).stagger, 0.0f);
    EXPECT_EQ(stunEvents, 1);

    combat.Execute(1.5f);
    EXPECT_NEAR(vitals.Get(defender).stunRemaining, 0.5f, 1e-5f);
    combat.Execute(1.0f);
    EXPECT_FALSE(vitals.Get(defender).IsStunned());
}

TEST_F(CombatSystemTest, StaggerRecoversOverTime) {
    AttackRequest request = physical(50.0f);
    request.ignoreMitigation = true;
    ASSERT_TRUE(combat.ResolveAttack(attacker, defender, request));
    EXPECT_FLOAT_EQ(vitals.Get(defender).stagger, 50.0f);

    // toughness recovery = 10 + con 10 x 0.4 = 14 per second
    combat.Execute(1.0f);
    EXPECT_NEAR(vitals.Get(defender).stagger, 36.0f, 1e-4f);
}

TEST_F(CombatSystemTest, LethalDamageKillsOnce) {
    AttackRequest request = physical(1000.0f);
    request.ignoreMitigation = true;
    auto result = combat.ResolveAttack(attacker, defender, request);
    ASSERT_TRUE(result);
    EXPECT_TRUE(result.value().isKill);
    EXPECT_FLOAT_EQ(vitals.Get(defender).health, 0.0f);
    ASSERT_EQ(world.Deaths().size(), 1u);
    ASSERT_EQ(deathEvents.size(), 1u);
    EXPECT_EQ(deathEvents.front().killer, attacker);

    auto again = combat.ResolveAttack(attacker, defender, request);
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code(), ErrorCode::TargetAlreadyDead);
    EXPECT_EQ(world.Deaths().size(), 1u);
}

TEST_F(CombatSystemTest, HandlerGrowingStorageKeepsStaggerAndStun) {
    // Each handler call adds 64 vitals, forcing the dense array to move.
    uint32_t nextId = 10;
    events.damageDealt.connect([&](const DamageDealtEvent&) {
        for (int i = 0; i < 64; ++i) {
            vitals.Add(Entity{nextId++, 0}, Vitals{});
        }
    });

    AttackRequest request = physical(50.0f);
    request.ignoreMitigation = true;
    ASSERT_TRUE(combat.ResolveAttack(attacker, defender, request));
    EXPECT_FLOAT_EQ(vitals.Get(defender).health, 55.0f);
    EXPECT_FLOAT_EQ(vitals.Get(defender).stagger, 50.0f);

    request.magnitude = 50.0f;
    request.staggerScale = 3.0f;
    auto stunned = combat.ResolveAttack(attacker, defender, request);
    ASSERT_TRUE(stunned);
    EXPECT_TRUE(stunned.value().isStunned);
    EXPECT_TRUE(vitals.Get(defender).IsStunned());
    EXPECT_EQ(stunEvents, 1);
    EXPECT_EQ(vitals.Size(), 2u + 128u);
}

TEST_F(CombatSystemTest, HandlerGrowingStorageDuringKillStillReportsDeath) {
    uint32_t nextId = 10;
    events.damageDealt.connect([&](const DamageDealtEvent&) {
        for (int i = 0; i < 64; ++i) {
            vitals.Add(Entity{nextId++, 0}, Vitals{});
        }
    });

    auto result = combat.ApplyDirectDamage(attacker, defender, 1000.0f);
    ASSERT_TRUE(result);
    EXPECT_TRUE(result.value().isKill);
    EXPECT_FLOAT_EQ(vitals.Get(defender).health, 0.0f);
    EXPECT_FLOAT_EQ(vitals.Get(defender).stunRemaining, 0.0f);
    ASSERT_EQ(deathEvents.size(), 1u);
    EXPECT_EQ(world.Deaths().size(), 1u);
}

TEST_F(CombatSystemTest, DefenderRemovedByHandlerStopsPublishing) {
    events.damageDealt.connect([&](const DamageDealtEvent& e) { vitals.Remove(e.defender); });

    AttackRequest request = physical(1000.0f);
    request.ignoreMitigation = true;
    auto result = combat.ResolveAttack(attacker, defender, request);
    ASSERT_TRUE(result);
    EXPECT_TRUE(result.value().isKill);
    EXPECT_EQ(damageEvents.size(), 1u);
    EXPECT_TRUE(deathEvents.empty());
    EXPECT_TRUE(world.Deaths().empty());
}

TEST_F(CombatSystemTest, RejectsInvalidRequests) {
    auto negative = combat.ResolveAttack(attacker, defender, physical(-1.0f));
    ASSERT_FALSE(negative);
    EXPECT_EQ(negative.error().code(), ErrorCode::InvalidArgument);

    auto unknown = combat.ResolveAttack(attacker, Entity(7, 0), physical(1.0f));
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().code(), ErrorCode::EntityNotFound);

    Entity wall(5, 0);
    world.Add(wall, {});
    auto noVitals = combat.ResolveAttack(attacker, wall, physical(1.0f));
    ASSERT_FALSE(noVitals);
    EXPECT_EQ(noVitals.error().code(), ErrorCode::CapabilityMissing);
}

TEST_F(CombatSystemTest, DirectDamageSkipsRolls) {
    auto result = combat.ApplyDirectDamage(attacker, defender, 25.0f);
    ASSERT_TRUE(result);
    EXPECT_FLOAT_EQ(result.value().finalDamage, 25.0f);
    EXPECT_EQ(random.Draws(), 0u);
    EXPECT_FLOAT_EQ(vitals.Get(defender).stagger, 0.0f);

    auto typed = combat.ApplyDirectDamage(attacker, defender, 10.0f, DamageType::Shadow);
    ASSERT_TRUE(typed);
    EXPECT_NEAR(typed.value().finalDamage, 8.0f, 1e-5f);
}

TEST_F(CombatSystemTest, HealingClampsToMaximum) {
    ASSERT_TRUE(combat.ApplyDirectDamage(attacker, defender, 30.0f));
    auto healed = combat.ApplyHealing(attacker, defender, 100.0f);
    ASSERT_TRUE(healed);
    EXPECT_FLOAT_EQ(healed.value(), 30.0f);
    EXPECT_FLOAT_EQ(vitals.Get(defender).health, 105.0f);
}

TEST_F(CombatSystemTest, AdjustResourceReportsAppliedChange) {
    // max mana = 50 + wisdom 10 x 4
    auto drained = combat.AdjustResource(attacker, defender, ResourceKind::Mana, -30.0f);
    ASSERT_TRUE(drained);
    EXPECT_FLOAT_EQ(drained.value(), -30.0f);

    auto overdrawn = combat.AdjustResource(attacker, defender, ResourceKind::Mana, -500.0f);
    ASSERT_TRUE(overdrawn);
    EXPECT_FLOAT_EQ(overdrawn.value(), -60.0f);
    EXPECT_FLOAT_EQ(vitals.Get(defender).mana, 0.0f);

    auto health = combat.AdjustResource(attacker, defender, ResourceKind::Health, -5.0f);
    ASSERT_TRUE(health);
    EXPECT_FLOAT_EQ(health.value(), -5.0f);
}

TEST_F(CombatSystemTest, SyncVitalsFollowsStatChanges) {
    AttributeSet stronger;
    stronger.Set(Attribute::Constitution, 20.0f);
    ASSERT_TRUE(world.SetAttributes(defender, stronger));
    stats.Invalidate(defender);

    ASSERT_TRUE(combat.SyncVitals(defender));
    EXPECT_FLOAT_EQ(vitals.Get(defender).maxHealth, 205.0f);
    EXPECT_FLOAT_EQ(vitals.Get(defender).health, 105.0f);
}
