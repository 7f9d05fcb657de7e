#pragma once

/// @file ai_system.hpp
/// @brief AIDecisionSystem: per-agent evaluate/act/observe cycle driving
///        skill use and value learning.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "evolve/ecs/component_storage.hpp"
#include "evolve/ecs/entity.hpp"
#include "evolve/ecs/system.hpp"
#include "evolve/foundation/game_result.hpp"
#include "evolve/game/ai_memory.hpp"
#include "evolve/game/ai_types.hpp"
#include "evolve/game/combat_types.hpp"
#include "evolve/game/random_source.hpp"
#include "evolve/game/sim_clock.hpp"
#include "evolve/game/skill_system.hpp"

namespace evolve::game {

/// The skill an agent chose during evaluation.
struct Decision {
    SkillId skill;
    ecs::Entity target;
    double score = 0.0;
    bool explored = false;  ///< Picked by the epsilon roll, not by score
    std::string state;      ///< State signature at evaluation time
    SimTime decidedAt = 0.0;
};

/// What one full Evaluate -> Act -> Observe cycle produced.
struct StepResult {
    Decision decision;
    bool succeeded = false;
    double reward = 0.0;
    std::optional<SkillOutcome> outcome;
};

/// Drives registered agents through Idle -> Evaluating -> Acting ->
/// Observing -> Idle.
///
/// Each Execute:
///   1. Accumulate deltaTime; below the decision interval nothing runs.
///   2. Step every living, non-stunned agent in registration order.
///
/// Rewards: a rejected action scores -1, an action that applied nothing
/// -0.5, otherwise 0.1 + 0.01 x (damage + healing) + 1 per kill.
class AIDecisionSystem final : public ecs::ISystem {
public:
    AIDecisionSystem(SkillSystem& skills,
                     AIMemoryStore& memory,
                     ecs::ComponentStorage<Vitals>& vitals,
                     IRandomSource& random,
                     const SimClock& clock,
                     AIConfig config = {});

    AIDecisionSystem(const AIDecisionSystem&) = delete;
    AIDecisionSystem& operator=(const AIDecisionSystem&) = delete;

    void Execute(float deltaTime) override;

    [[nodiscard]] ecs::SystemStage GetStage() const override {
        return ecs::SystemStage::PostUpdate;
    }

    [[nodiscard]] std::string_view GetName() const override {
        return "AIDecisionSystem";
    }

    /// Manage @p entity and create its memory.
    /// @return AlreadyExists or MemoryGroupNotFound.
    foundation::GameResult<void> Register(ecs::Entity entity, EntityClass cls,
                                          std::optional<MemoryGroupId> group = std::nullopt);

    /// Stop managing @p entity. Its memory stays in the store.
    void Unregister(ecs::Entity entity);

    /// Give fresh memory to managed agents the store no longer knows, as
    /// after restoring a snapshot taken before they spawned. An agent whose
    /// group is gone is re-created outside any group.
    /// @return Number of agents re-attached.
    std::size_t ReattachMemory();

    /// @return AgentNotRegistered.
    foundation::GameResult<void> SetTarget(ecs::Entity entity, ecs::Entity target);

    [[nodiscard]] foundation::GameResult<AgentState> GetState(ecs::Entity entity) const;

    /// Score every legal skill and pick one (epsilon-greedy).
    /// Leaves the agent in Acting on success, Idle on NoLegalAction.
    /// @return AgentNotRegistered, InvalidAgentState or NoLegalAction.
    foundation::GameResult<Decision> Evaluate(ecs::Entity entity);

    /// Use the decided skill. Leaves the agent in Observing.
    /// @return AgentNotRegistered or InvalidAgentState.
    foundation::GameResult<SkillOutcome> Act(ecs::Entity entity);

    /// Turn the last action's result into a reward and record it.
    /// Leaves the agent Idle.
    /// @return The reward, AgentNotRegistered or InvalidAgentState.
    foundation::GameResult<double> Observe(ecs::Entity entity);

    /// Evaluate, act and observe in one call.
    foundation::GameResult<StepResult> Step(ecs::Entity entity);

    /// State signature "h<0-3>m<0-3>s<0|1>t<0|1>" from health and mana
    /// buckets, stun flag and target presence.
    [[nodiscard]] std::string StateSignature(ecs::Entity entity) const;

    /// Contextual score multiplier for @p skill at the caster's current
    /// health and mana ratios.
    [[nodiscard]] double ContextMultiplier(const Skill& skill, const Vitals& vitals) const;

    [[nodiscard]] std::size_t AgentCount() const noexcept { return agents_.size(); }
    [[nodiscard]] uint32_t LastTickDecisionCount() const noexcept {
        return lastTickDecisionCount_;
    }

private:
    struct Agent {
        ecs::Entity entity;
        EntityClass cls = EntityClass::BasicEnemy;
        std::optional<MemoryGroupId> group;
        AgentState state = AgentState::Idle;
        ecs::Entity target;
        std::optional<Decision> decision;
        std::optional<foundation::GameResult<SkillOutcome>> lastResult;
    };

    [[nodiscard]] Agent* find(ecs::Entity entity);
    [[nodiscard]] const Agent* find(ecs::Entity entity) const;
    [[nodiscard]] ecs::Entity targetFor(const Agent& agent, const Skill& skill) const;
    [[nodiscard]] static double rewardFor(const foundation::GameResult<SkillOutcome>& result);

    SkillSystem& skills_;
    AIMemoryStore& memory_;
    ecs::ComponentStorage<Vitals>& vitals_;
    IRandomSource& random_;
    const SimClock& clock_;
    AIConfig config_;

    std::vector<Agent> agents_;
    float sinceLastDecision_ = 0.0f;
    uint32_t lastTickDecisionCount_ = 0;
};

} // namespace evolve::game
