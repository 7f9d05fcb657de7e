#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "evolve/game/ai_system.hpp"
#include "evolve/game/simulation.hpp"
#include "scripted_random.hpp"

using namespace evolve::ecs;
using namespace evolve::game;
using evolve::foundation::ErrorCode;
using evolve::testing::ScriptedRandom;

class AIDecisionSystemTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto rng = std::make_unique<ScriptedRandom>();
        random = rng.get();
        sim = std::make_unique<Simulation>(EngineConfig{}, std::move(rng));

        agent = spawn(1, EntityClass::Player);
        enemy = spawn(2, std::nullopt, {"poison"});

        Effect hit;
        hit.name = "hit";
        hit.kind = EffectKind::Damage;
        hit.value = 10.0f;
        strike = sim->Effects().Register(hit).value();
    }

    Entity spawn(uint32_t team, std::optional<EntityClass> cls,
                 std::vector<std::string> immunities = {}) {
        AttributeSet attrs;
        attrs.Set(Attribute::Constitution, 10.0f);
        attrs.Set(Attribute::Intelligence, 5.0f);
        SpawnParams params;
        params.attributes = attrs;
        params.team = team;
        params.aiClass = cls;
        params.immunities = std::move(immunities);
        return sim->Spawn(params).value();
    }

    SkillId learn(std::string name, float priority, std::vector<EffectId> effects = {}) {
        Skill s;
        s.name = std::move(name);
        s.effects = effects.empty() ? std::vector<EffectId>{strike} : std::move(effects);
        s.ai.base = priority;
        auto id = sim->Skills().RegisterSkill(s).value();
        EXPECT_TRUE(sim->Skills().Learn(agent, id));
        return id;
    }

    AIDecisionSystem& ai() { return sim->AI(); }

    ScriptedRandom* random = nullptr;
    std::unique_ptr<Simulation> sim;
    Entity agent;
    Entity enemy;
    EffectId strike;
};

// ═══════════════════════════════════════════════════════════════════════════
// Registration
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(AIDecisionSystemTest, SpawnRegistersAgentAndMemory) {
    EXPECT_EQ(ai().AgentCount(), 1u);
    EXPECT_TRUE(sim->Memory().IsRegistered(agent));
    EXPECT_EQ(ai().GetState(agent).value(), AgentState::Idle);
    EXPECT_EQ(ai().Register(agent, EntityClass::Player).error().code(),
              ErrorCode::AlreadyExists);
}

TEST_F(AIDecisionSystemTest, UnknownAgentIsRejected) {
    EXPECT_EQ(ai().GetState(enemy).error().code(), ErrorCode::AgentNotRegistered);
    EXPECT_EQ(ai().SetTarget(enemy, agent).error().code(), ErrorCode::AgentNotRegistered);
    EXPECT_EQ(ai().Evaluate(enemy).error().code(), ErrorCode::AgentNotRegistered);
}

TEST_F(AIDecisionSystemTest, UnregisterKeepsMemory) {
    ai().Unregister(agent);
    EXPECT_EQ(ai().AgentCount(), 0u);
    EXPECT_TRUE(sim->Memory().IsRegistered(agent));
    EXPECT_TRUE(ai().Register(agent, EntityClass::Player));
}

// ═══════════════════════════════════════════════════════════════════════════
// State signature and context
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(AIDecisionSystemTest, StateSignatureBucketsVitals) {
    EXPECT_EQ(ai().StateSignature(agent), "h3m3s0t0");

    ASSERT_TRUE(ai().SetTarget(agent, enemy));
    EXPECT_EQ(ai().StateSignature(agent), "h3m3s0t1");

    // 30 / 105 health and 40 / 90 mana.
    ASSERT_TRUE(sim->Combat().ApplyDirectDamage(Entity::invalid(), agent, 75.0f));
    ASSERT_TRUE(sim->Combat().AdjustResource(agent, agent, ResourceKind::Mana, -50.0f));
    EXPECT_EQ(ai().StateSignature(agent), "h1m1s0t1");

    ASSERT_TRUE(sim->Combat().ApplyDirectDamage(Entity::invalid(), enemy, 500.0f));
    EXPECT_EQ(ai().StateSignature(agent), "h1m1s0t0");
}

TEST_F(AIDecisionSystemTest, ContextMultiplierFavoursRecovery) {
    Vitals low;
    low.maxHealth = 100.0f;
    low.health = 20.0f;
    low.maxMana = 100.0f;
    low.mana = 10.0f;

    Skill heal;
    heal.type = SkillType::Heal;
    EXPECT_DOUBLE_EQ(ai().ContextMultiplier(heal, low), 1.3);

    Skill dash;
    dash.type = SkillType::Movement;
    EXPECT_DOUBLE_EQ(ai().ContextMultiplier(dash, low), 1.2);

    Skill bolt;
    bolt.type = SkillType::Attack;
    bolt.cost.mana = 5.0f;
    EXPECT_DOUBLE_EQ(ai().ContextMultiplier(bolt, low), 0.8);

    Vitals healthy = low;
    healthy.health = 100.0f;
    healthy.mana = 100.0f;
    EXPECT_DOUBLE_EQ(ai().ContextMultiplier(heal, healthy), 1.0);
    EXPECT_DOUBLE_EQ(ai().ContextMultiplier(bolt, healthy), 1.0);
}

// ═══════════════════════════════════════════════════════════════════════════
// Evaluate
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(AIDecisionSystemTest, EvaluatePicksHighestScore) {
    learn("jab", 0.5f);
    auto smash = learn("smash", 0.8f);
    ASSERT_TRUE(ai().SetTarget(agent, enemy));

    auto decision = ai().Evaluate(agent);
    ASSERT_TRUE(decision);
    EXPECT_EQ(decision.value().skill, smash);
    EXPECT_EQ(decision.value().target, enemy);
    EXPECT_NEAR(decision.value().score, 0.8, 1e-6);
    EXPECT_FALSE(decision.value().explored);
    EXPECT_EQ(decision.value().state, "h3m3s0t1");
    EXPECT_EQ(ai().GetState(agent).value(), AgentState::Acting);
}

TEST_F(AIDecisionSystemTest, TiesKeepBookOrder) {
    auto first = learn("first", 0.5f);
    learn("second", 0.5f);
    ASSERT_TRUE(ai().SetTarget(agent, enemy));
    EXPECT_EQ(ai().Evaluate(agent).value().skill, first);
}

TEST_F(AIDecisionSystemTest, LearnedValueChangesChoice) {
    learn("first", 0.5f);
    auto second = learn("second", 0.5f);
    ASSERT_TRUE(ai().SetTarget(agent, enemy));

    const auto state = ai().StateSignature(agent);
    ASSERT_TRUE(sim->Memory().RecordOutcome(agent, state, second, 1.0, state));

    auto decision = ai().Evaluate(agent);
    EXPECT_EQ(decision.value().skill, second);
    EXPECT_NEAR(decision.value().score, 0.5 * 1.95, 1e-9);
}

TEST_F(AIDecisionSystemTest, ExplorationPicksRandomCandidate) {
    auto first = learn("first", 0.9f);
    auto second = learn("second", 0.1f);
    ASSERT_TRUE(ai().SetTarget(agent, enemy));

    random->Queue({0.0f});
    random->QueueIndex(1);
    auto decision = ai().Evaluate(agent);
    ASSERT_TRUE(decision);
    EXPECT_TRUE(decision.value().explored);
    EXPECT_EQ(decision.value().skill, second);
    EXPECT_NE(decision.value().skill, first);
}

TEST_F(AIDecisionSystemTest, NoLegalActionReturnsToIdle) {
    auto jab = learn("jab", 0.5f);

    // Single-target skill with no target.
    auto decision = ai().Evaluate(agent);
    ASSERT_FALSE(decision);
    EXPECT_EQ(decision.error().code(), ErrorCode::NoLegalAction);
    EXPECT_EQ(ai().GetState(agent).value(), AgentState::Idle);

    ASSERT_TRUE(ai().SetTarget(agent, enemy));
    ASSERT_TRUE(sim->Combat().AdjustResource(agent, agent, ResourceKind::Mana, -90.0f));
    Skill pricey;
    pricey.name = "pricey";
    pricey.effects = {strike};
    pricey.cost.mana = 10.0f;
    ASSERT_TRUE(sim->Skills().Forget(agent, jab));
    ASSERT_TRUE(sim->Skills().Learn(agent, sim->Skills().RegisterSkill(pricey).value()));
    EXPECT_EQ(ai().Evaluate(agent).error().code(), ErrorCode::NoLegalAction);
}

// ═══════════════════════════════════════════════════════════════════════════
// Act and observe
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(AIDecisionSystemTest, CycleEnforcesStateOrder) {
    learn("jab", 0.5f);
    ASSERT_TRUE(ai().SetTarget(agent, enemy));

    EXPECT_EQ(ai().Act(agent).error().code(), ErrorCode::InvalidAgentState);
    EXPECT_EQ(ai().Observe(agent).error().code(), ErrorCode::InvalidAgentState);

    ASSERT_TRUE(ai().Evaluate(agent));
    EXPECT_EQ(ai().Evaluate(agent).error().code(), ErrorCode::InvalidAgentState);
    EXPECT_EQ(ai().Observe(agent).error().code(), ErrorCode::InvalidAgentState);

    ASSERT_TRUE(ai().Act(agent));
    EXPECT_EQ(ai().GetState(agent).value(), AgentState::Observing);
    EXPECT_EQ(ai().Act(agent).error().code(), ErrorCode::InvalidAgentState);

    auto reward = ai().Observe(agent);
    ASSERT_TRUE(reward);
    EXPECT_NEAR(reward.value(), 0.2, 1e-9);
    EXPECT_EQ(ai().GetState(agent).value(), AgentState::Idle);
}

TEST_F(AIDecisionSystemTest, ObserveRecordsRewardAgainstDecisionState) {
    auto jab = learn("jab", 0.5f);
    ASSERT_TRUE(ai().SetTarget(agent, enemy));

    auto step = ai().Step(agent);
    ASSERT_TRUE(step);
    EXPECT_TRUE(step.value().succeeded);
    ASSERT_TRUE(step.value().outcome.has_value());

    const double reward = 0.2;
    EXPECT_NEAR(step.value().reward, reward, 1e-9);
    // Player agents learn at rate 1: value = reward + 0.95 * default.
    EXPECT_NEAR(sim->Memory().EntityValue(agent, "h3m3s0t1", jab).value(),
                reward + 0.95 * 1.0, 1e-9);
    EXPECT_EQ(sim->Memory().Stats(agent).value().successfulActions, 1u);
}

TEST_F(AIDecisionSystemTest, RejectedActionScoresFailure) {
    learn("jab", 0.5f);
    ASSERT_TRUE(ai().SetTarget(agent, enemy));
    ASSERT_TRUE(ai().Evaluate(agent));

    // The target dies between the decision and the action.
    ASSERT_TRUE(sim->Combat().ApplyDirectDamage(Entity::invalid(), enemy, 500.0f));
    auto acted = ai().Act(agent);
    ASSERT_FALSE(acted);
    EXPECT_EQ(acted.error().code(), ErrorCode::InvalidTarget);

    EXPECT_DOUBLE_EQ(ai().Observe(agent).value(), -1.0);
    EXPECT_EQ(sim->Memory().Stats(agent).value().failedActions, 1u);
}

TEST_F(AIDecisionSystemTest, WastedActionScoresPenalty) {
    Effect venom;
    venom.name = "venom";
    venom.kind = EffectKind::Damage;
    venom.value = 10.0f;
    venom.tags = {"poison"};
    learn("sting", 0.5f, {sim->Effects().Register(venom).value()});
    ASSERT_TRUE(ai().SetTarget(agent, enemy));

    auto step = ai().Step(agent);
    ASSERT_TRUE(step);
    EXPECT_TRUE(step.value().succeeded);
    EXPECT_DOUBLE_EQ(step.value().reward, -0.5);
}

// ═══════════════════════════════════════════════════════════════════════════
// Tick
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(AIDecisionSystemTest, DecisionsRunOnInterval) {
    learn("jab", 0.5f);
    ASSERT_TRUE(ai().SetTarget(agent, enemy));

    sim->Tick(0.25f);
    EXPECT_EQ(ai().LastTickDecisionCount(), 0u);
    EXPECT_FLOAT_EQ(sim->VitalsOf(enemy)->health, 105.0f);

    sim->Tick(0.25f);
    EXPECT_EQ(ai().LastTickDecisionCount(), 1u);
    EXPECT_FLOAT_EQ(sim->VitalsOf(enemy)->health, 95.0f);
    EXPECT_EQ(ai().GetState(agent).value(), AgentState::Idle);
}

TEST_F(AIDecisionSystemTest, IncapacitatedAgentsAreSkipped) {
    learn("jab", 0.5f);
    ASSERT_TRUE(ai().SetTarget(agent, enemy));
    ASSERT_TRUE(sim->Combat().ApplyDirectDamage(Entity::invalid(), agent, 500.0f));

    sim->Tick(0.5f);
    EXPECT_EQ(ai().LastTickDecisionCount(), 0u);
    EXPECT_EQ(sim->Memory().Stats(agent).value().totalActions, 0u);
}

TEST_F(AIDecisionSystemTest, AgentDespawnedMidTickDoesNotSkipOthers) {
    auto jab = learn("jab", 0.5f);
    Entity second = spawn(1, EntityClass::Player);
    Entity third = spawn(1, EntityClass::Player);
    for (auto e : {second, third}) {
        ASSERT_TRUE(sim->Skills().Learn(e, jab));
    }
    for (auto e : {agent, second, third}) {
        ASSERT_TRUE(ai().SetTarget(e, enemy));
    }

    // The first agent's own hit removes it while the roster is being walked.
    sim->Events().damageDealt.connect([this](const DamageDealtEvent& e) {
        if (e.attacker == agent) {
            sim->Despawn(agent);
        }
    });

    sim->Tick(0.5f);
    EXPECT_EQ(ai().AgentCount(), 2u);
    EXPECT_FLOAT_EQ(sim->VitalsOf(enemy)->health, 75.0f);
    EXPECT_EQ(sim->Memory().Stats(second).value().totalActions, 1u);
    EXPECT_EQ(sim->Memory().Stats(third).value().totalActions, 1u);
    EXPECT_EQ(ai().LastTickDecisionCount(), 2u);
}

TEST_F(AIDecisionSystemTest, AgentsSpawnedMidTickWaitForNextTick) {
    learn("jab", 0.5f);
    ASSERT_TRUE(ai().SetTarget(agent, enemy));

    std::vector<Entity> reinforcements;
    sim->Events().damageDealt.connect([&](const DamageDealtEvent&) {
        for (int i = 0; i < 16; ++i) {
            reinforcements.push_back(spawn(2, EntityClass::BasicEnemy));
        }
    });

    sim->Tick(0.5f);
    EXPECT_EQ(reinforcements.size(), 16u);
    EXPECT_EQ(ai().AgentCount(), 17u);
    EXPECT_EQ(ai().LastTickDecisionCount(), 1u);
    EXPECT_EQ(sim->Memory().Stats(agent).value().totalActions, 1u);
}
