/// @file ai_system.cpp
/// @brief AIDecisionSystem implementation.
///
/// Evaluate scores every legal skill in SkillBook order as
/// base priority x learned estimate x context multiplier. Act calls
/// SkillSystem::Use. Observe converts the outcome into a reward and
/// feeds it to the AIMemoryStore with the post-action state signature.

#include "evolve/game/ai_system.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

#include "evolve/foundation/game_logger.hpp"

namespace evolve::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

constexpr double kFailureReward = -1.0;
constexpr double kWastedReward = -0.5;
constexpr double kBaseSuccessReward = 0.1;
constexpr double kAmountRewardScale = 0.01;
constexpr double kKillReward = 1.0;
constexpr double kMultiplierFloor = 0.05;

int bucket(float ratio) {
    return std::clamp(static_cast<int>(std::floor(ratio * 4.0f)), 0, 3);
}

GameError notRegistered(ecs::Entity entity) {
    return GameError(ErrorCode::AgentNotRegistered,
                     "entity " + std::to_string(entity.id()) + " is not an AI agent");
}

GameError wrongState(ecs::Entity entity, AgentState state, std::string_view op) {
    return GameError(ErrorCode::InvalidAgentState,
                     std::string(op) + " called for entity " + std::to_string(entity.id()) +
                         " in state " + std::string(agentStateName(state)));
}

bool needsTarget(TargetSelection targeting) {
    return targeting == TargetSelection::SingleEnemy || targeting == TargetSelection::Area;
}

} // namespace

AIDecisionSystem::AIDecisionSystem(SkillSystem& skills,
                                   AIMemoryStore& memory,
                                   ecs::ComponentStorage<Vitals>& vitals,
                                   IRandomSource& random,
                                   const SimClock& clock,
                                   AIConfig config)
    : skills_(skills),
      memory_(memory),
      vitals_(vitals),
      random_(random),
      clock_(clock),
      config_(config) {}

// ── Registration ────────────────────────────────────────────────────────

GameResult<void> AIDecisionSystem::Register(ecs::Entity entity, EntityClass cls,
                                            std::optional<MemoryGroupId> group) {
    if (find(entity) != nullptr) {
        return GameResult<void>::err(GameError(
            ErrorCode::AlreadyExists,
            "entity " + std::to_string(entity.id()) + " is already an AI agent"));
    }
    if (!memory_.IsRegistered(entity)) {
        auto created = memory_.Register(entity, cls, group);
        if (!created) {
            return created;
        }
    }
    Agent agent;
    agent.entity = entity;
    agent.cls = cls;
    agent.group = group;
    agents_.push_back(std::move(agent));
    EVOLVE_LOG_DEBUG(LogCategory::AI, "agent " + std::to_string(entity.id()) + " registered as " +
                                          std::string(entityClassName(cls)));
    return GameResult<void>::ok();
}

void AIDecisionSystem::Unregister(ecs::Entity entity) {
    std::erase_if(agents_, [entity](const Agent& a) { return a.entity == entity; });
}

std::size_t AIDecisionSystem::ReattachMemory() {
    std::size_t reattached = 0;
    for (auto& agent : agents_) {
        if (memory_.IsRegistered(agent.entity)) {
            continue;
        }
        auto created = memory_.Register(agent.entity, agent.cls, agent.group);
        if (!created && created.error().code() == ErrorCode::MemoryGroupNotFound) {
            EVOLVE_LOG_WARN(LogCategory::AI, "agent " + std::to_string(agent.entity.id()) +
                                                 " lost its memory group");
            agent.group.reset();
            created = memory_.Register(agent.entity, agent.cls);
        }
        if (!created) {
            EVOLVE_LOG_FAILURE(LogCategory::AI,
                               "memory for agent " + std::to_string(agent.entity.id()),
                               created.error());
            continue;
        }
        agent.state = AgentState::Idle;
        agent.decision.reset();
        agent.lastResult.reset();
        ++reattached;
    }
    return reattached;
}

AIDecisionSystem::Agent* AIDecisionSystem::find(ecs::Entity entity) {
    auto it = std::find_if(agents_.begin(), agents_.end(),
                           [entity](const Agent& a) { return a.entity == entity; });
    return it != agents_.end() ? &*it : nullptr;
}

const AIDecisionSystem::Agent* AIDecisionSystem::find(ecs::Entity entity) const {
    auto it = std::find_if(agents_.begin(), agents_.end(),
                           [entity](const Agent& a) { return a.entity == entity; });
    return it != agents_.end() ? &*it : nullptr;
}

GameResult<void> AIDecisionSystem::SetTarget(ecs::Entity entity, ecs::Entity target) {
    auto* agent = find(entity);
    if (agent == nullptr) {
        return GameResult<void>::err(notRegistered(entity));
    }
    agent->target = target;
    return GameResult<void>::ok();
}

GameResult<AgentState> AIDecisionSystem::GetState(ecs::Entity entity) const {
    const auto* agent = find(entity);
    if (agent == nullptr) {
        return GameResult<AgentState>::err(notRegistered(entity));
    }
    return GameResult<AgentState>::ok(agent->state);
}

// ── Scoring ─────────────────────────────────────────────────────────────

std::string AIDecisionSystem::StateSignature(ecs::Entity entity) const {
    int health = 0;
    int mana = 0;
    int stunned = 0;
    if (const auto* vitals = vitals_.TryGet(entity)) {
        health = bucket(vitals->HealthRatio());
        mana = bucket(vitals->ManaRatio());
        stunned = vitals->IsStunned() ? 1 : 0;
    }
    int hasTarget = 0;
    if (const auto* agent = find(entity); agent != nullptr && agent->target.isValid()) {
        const auto* targetVitals = vitals_.TryGet(agent->target);
        hasTarget = (targetVitals != nullptr && targetVitals->IsAlive()) ? 1 : 0;
    }

    char buf[32];
    std::snprintf(buf, sizeof(buf), "h%dm%ds%dt%d", health, mana, stunned, hasTarget);
    return buf;
}

double AIDecisionSystem::ContextMultiplier(const Skill& skill, const Vitals& vitals) const {
    double multiplier = 1.0;
    if (vitals.HealthRatio() <= skill.ai.healthThreshold) {
        if (skill.type == SkillType::Heal || skill.type == SkillType::Buff) {
            multiplier += 0.3;
        } else if (skill.type == SkillType::Movement) {
            multiplier += 0.2;
        }
    }
    if (skill.cost.mana > 0.0f && vitals.ManaRatio() <= skill.ai.manaThreshold) {
        multiplier -= 0.2;
    }
    return std::max(multiplier, kMultiplierFloor);
}

ecs::Entity AIDecisionSystem::targetFor(const Agent& agent, const Skill& skill) const {
    switch (skill.targeting) {
        case TargetSelection::SingleEnemy:
        case TargetSelection::Area:
            return agent.target;
        case TargetSelection::SingleAlly:
            return agent.entity;
        case TargetSelection::Self:
        case TargetSelection::AllEnemies:
        case TargetSelection::AllAllies:
            break;
    }
    return ecs::Entity::invalid();
}

// ── Cycle ───────────────────────────────────────────────────────────────

GameResult<Decision> AIDecisionSystem::Evaluate(ecs::Entity entity) {
    auto* agent = find(entity);
    if (agent == nullptr) {
        return GameResult<Decision>::err(notRegistered(entity));
    }
    if (agent->state != AgentState::Idle) {
        return GameResult<Decision>::err(wrongState(entity, agent->state, "Evaluate"));
    }
    agent->state = AgentState::Evaluating;

    const auto* book = skills_.Book(entity);
    const auto* vitals = vitals_.TryGet(entity);
    const std::string state = StateSignature(entity);

    std::vector<Decision> candidates;
    if (book != nullptr && vitals != nullptr) {
        for (const auto& learned : book->skills) {
            const Skill* def = skills_.Skills().Find(learned.skill);
            if (def == nullptr) {
                continue;
            }
            ecs::Entity target = targetFor(*agent, *def);
            if (needsTarget(def->targeting) && !target.isValid()) {
                continue;
            }
            if (!skills_.CanUse(learned.skill, entity, target)) {
                continue;
            }
            Decision candidate;
            candidate.skill = learned.skill;
            candidate.target = target;
            candidate.state = state;
            candidate.decidedAt = clock_.Now();
            candidate.score = static_cast<double>(def->ai.base) *
                              memory_.Estimate(entity, state, learned.skill) *
                              ContextMultiplier(*def, *vitals);
            candidates.push_back(std::move(candidate));
        }
    }

    if (candidates.empty()) {
        agent->state = AgentState::Idle;
        return GameResult<Decision>::err(GameError(
            ErrorCode::NoLegalAction,
            "entity " + std::to_string(entity.id()) + " has no usable skill"));
    }

    double epsilon = 0.0;
    if (auto stats = memory_.Stats(entity)) {
        epsilon = stats.value().explorationRate;
    }

    Decision chosen;
    if (epsilon > 0.0 && random_.NextUnit() < epsilon) {
        chosen = candidates[random_.NextIndex(candidates.size())];
        chosen.explored = true;
    } else {
        // First maximum keeps ties in book order.
        auto best = std::max_element(
            candidates.begin(), candidates.end(),
            [](const Decision& a, const Decision& b) { return a.score < b.score; });
        chosen = *best;
    }

    agent->decision = chosen;
    agent->lastResult.reset();
    agent->state = AgentState::Acting;
    return GameResult<Decision>::ok(std::move(chosen));
}

GameResult<SkillOutcome> AIDecisionSystem::Act(ecs::Entity entity) {
    auto* agent = find(entity);
    if (agent == nullptr) {
        return GameResult<SkillOutcome>::err(notRegistered(entity));
    }
    if (agent->state != AgentState::Acting || !agent->decision) {
        return GameResult<SkillOutcome>::err(wrongState(entity, agent->state, "Act"));
    }

    std::vector<ecs::Entity> targets;
    if (agent->decision->target.isValid()) {
        targets.push_back(agent->decision->target);
    }
    auto result = skills_.Use(agent->decision->skill, entity, targets);

    // Handlers fired inside Use() may have grown or shrunk agents_.
    agent = find(entity);
    if (agent == nullptr) {
        return GameResult<SkillOutcome>::err(notRegistered(entity));
    }
    agent->lastResult = result;
    agent->state = AgentState::Observing;
    return result;
}

double AIDecisionSystem::rewardFor(const GameResult<SkillOutcome>& result) {
    if (!result) {
        return kFailureReward;
    }
    const auto& outcome = result.value();
    if (!outcome.AnyApplied()) {
        return kWastedReward;
    }
    return kBaseSuccessReward +
           kAmountRewardScale * static_cast<double>(outcome.totalDamage + outcome.totalHealing) +
           kKillReward * static_cast<double>(outcome.kills);
}

GameResult<double> AIDecisionSystem::Observe(ecs::Entity entity) {
    auto* agent = find(entity);
    if (agent == nullptr) {
        return GameResult<double>::err(notRegistered(entity));
    }
    if (agent->state != AgentState::Observing || !agent->decision || !agent->lastResult) {
        return GameResult<double>::err(wrongState(entity, agent->state, "Observe"));
    }

    const double reward = rewardFor(*agent->lastResult);
    const std::string next = StateSignature(entity);
    auto recorded = memory_.RecordOutcome(entity, agent->decision->state, agent->decision->skill,
                                          reward, next);
    agent->state = AgentState::Idle;
    if (!recorded) {
        return GameResult<double>::err(recorded.error());
    }
    EVOLVE_LOG_DEBUG(LogCategory::AI, "agent " + std::to_string(entity.id()) + " skill " +
                                          std::to_string(agent->decision->skill.value()) +
                                          " reward " + std::to_string(reward));
    return GameResult<double>::ok(reward);
}

GameResult<StepResult> AIDecisionSystem::Step(ecs::Entity entity) {
    auto decision = Evaluate(entity);
    if (!decision) {
        return GameResult<StepResult>::err(decision.error());
    }
    auto acted = Act(entity);
    auto reward = Observe(entity);
    if (!reward) {
        return GameResult<StepResult>::err(reward.error());
    }

    StepResult step;
    step.decision = std::move(decision).value();
    step.succeeded = acted.hasValue();
    step.reward = reward.value();
    if (acted) {
        step.outcome = std::move(acted).value();
    }
    return GameResult<StepResult>::ok(std::move(step));
}

void AIDecisionSystem::Execute(float deltaTime) {
    lastTickDecisionCount_ = 0;
    sinceLastDecision_ += deltaTime;
    if (sinceLastDecision_ + static_cast<float>(kTimeEpsilon) < config_.decisionInterval) {
        return;
    }
    sinceLastDecision_ = 0.0f;

    // Agents registered at the start of the tick decide; handlers fired
    // inside Use() may register or unregister agents meanwhile.
    std::vector<ecs::Entity> roster;
    roster.reserve(agents_.size());
    for (const auto& agent : agents_) {
        roster.push_back(agent.entity);
    }
    for (auto entity : roster) {
        if (find(entity) == nullptr) {
            continue;
        }
        const auto* vitals = vitals_.TryGet(entity);
        if (vitals == nullptr || !vitals->IsAlive() || vitals->IsStunned()) {
            continue;
        }
        auto step = Step(entity);
        if (!step) {
            EVOLVE_LOG_TRACE(LogCategory::AI, "agent " + std::to_string(entity.id()) + ": " +
                                                  std::string(step.error().message()));
            continue;
        }
        ++lastTickDecisionCount_;
    }
}

} // namespace evolve::game
