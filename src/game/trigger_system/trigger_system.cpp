/// @file trigger_system.cpp
/// @brief TriggerSystem implementation.

#include "evolve/game/trigger_system.hpp"

#include "evolve/foundation/game_logger.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace evolve::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

std::string_view triggerConditionName(TriggerCondition condition) {
    switch (condition) {
        case TriggerCondition::OnHit:         return "on_hit";
        case TriggerCondition::OnCast:        return "on_cast";
        case TriggerCondition::OnCrit:        return "on_crit";
        case TriggerCondition::OnKill:        return "on_kill";
        case TriggerCondition::OnDamageTaken: return "on_damage_taken";
        case TriggerCondition::OnHeal:        return "on_heal";
        case TriggerCondition::OnLowHealth:   return "on_low_health";
    }
    return "unknown";
}

namespace {

std::string gateMessage(ErrorCode code, const SpecialEffect& special) {
    switch (code) {
        case ErrorCode::ProcConditionFailed: return special.name + ": condition not met";
        case ErrorCode::ProcOnCooldown:      return special.name + ": on cooldown";
        case ErrorCode::ProcLimitReached:    return special.name + ": proc limit reached";
        case ErrorCode::ProcChanceFailed:    return special.name + ": chance roll failed";
        default:                             return special.name + ": gated";
    }
}

bool validDelay(float value) {
    return std::isfinite(value) && value >= 0.0f;
}

} // namespace

TriggerSystem::TriggerSystem(EffectSystem& effects, IRandomSource& random, const SimClock& clock)
    : effects_(effects), random_(random), clock_(clock) {}

// ── Registration ────────────────────────────────────────────────────────

GameResult<ProcId> TriggerSystem::RegisterProc(TriggerCondition condition,
                                               SpecialEffect special,
                                               ecs::Entity owner) {
    const auto& templates = effects_.Templates();
    auto known = [&templates](EffectId id) { return templates.Find(id) != nullptr; };

    if (!known(special.effect) ||
        !std::all_of(special.combination.begin(), special.combination.end(), known) ||
        !std::all_of(special.chain.begin(), special.chain.end(), known)) {
        return GameResult<ProcId>::err(GameError(
            ErrorCode::UnknownEffect, "proc '" + special.name + "' references an unknown effect"));
    }
    if (!std::isfinite(special.chance) || special.chance < 0.0f || special.chance > 1.0f) {
        return GameResult<ProcId>::err(GameError(
            ErrorCode::InvalidArgument, "proc '" + special.name + "': chance must be in [0,1]"));
    }
    if (!validDelay(special.cooldown) || !validDelay(special.delay) ||
        !validDelay(special.chainDelay) || special.maxProcs < 0) {
        return GameResult<ProcId>::err(GameError(
            ErrorCode::InvalidArgument,
            "proc '" + special.name + "': negative cooldown, delay or limit"));
    }

    ProcId id(nextProcId_++);
    EVOLVE_LOG_DEBUG(LogCategory::Trigger,
                     "registered proc " + special.name + " on " +
                         std::string(triggerConditionName(condition)));
    bindings_.push_back(Binding{id, condition, std::move(special), owner, 0});
    return GameResult<ProcId>::ok(id);
}

GameResult<void> TriggerSystem::UnregisterProc(ProcId id) {
    auto it = std::find_if(bindings_.begin(), bindings_.end(),
                           [id](const Binding& b) { return b.id == id; });
    if (it == bindings_.end()) {
        return GameResult<void>::err(GameError(
            ErrorCode::ProcNotFound, "no proc " + std::to_string(id.value())));
    }
    bindings_.erase(it);
    std::erase_if(states_, [id](const auto& entry) { return entry.first.first == id.value(); });
    std::erase_if(pending_, [id](const Scheduled& s) { return s.proc == id; });
    return GameResult<void>::ok();
}

void TriggerSystem::Forget(ecs::Entity entity) {
    std::vector<ProcId::value_type> owned;
    for (const auto& binding : bindings_) {
        if (binding.owner == entity) {
            owned.push_back(binding.id.value());
        }
    }
    std::erase_if(bindings_, [entity](const Binding& b) { return b.owner == entity; });
    std::erase_if(states_, [entity, &owned](const auto& entry) {
        return entry.first.second == entity.raw ||
               std::find(owned.begin(), owned.end(), entry.first.first) != owned.end();
    });
    std::erase_if(pending_, [entity, &owned](const Scheduled& s) {
        return s.target == entity ||
               std::find(owned.begin(), owned.end(), s.proc.value()) != owned.end();
    });
    if (!owned.empty()) {
        EVOLVE_LOG_DEBUG(LogCategory::Trigger,
                         "dropped " + std::to_string(owned.size()) + " procs owned by entity " +
                             std::to_string(entity.id()));
    }
}

// ── Firing ──────────────────────────────────────────────────────────────

std::optional<ErrorCode> TriggerSystem::gate(Binding& binding,
                                             ProcState& state,
                                             const TriggerContext& context,
                                             SimTime now) {
    const auto& special = binding.special;
    for (const auto& predicate : special.conditions) {
        if (predicate && !predicate(context)) {
            return ErrorCode::ProcConditionFailed;
        }
    }
    if (state.lastProcTime &&
        now - *state.lastProcTime + kTimeEpsilon < static_cast<SimTime>(special.cooldown)) {
        return ErrorCode::ProcOnCooldown;
    }
    if (special.maxProcs > 0 && state.procCount >= special.maxProcs) {
        return ErrorCode::ProcLimitReached;
    }
    if (special.chance < 1.0f) {
        if (special.chance <= 0.0f || random_.NextUnit() >= special.chance) {
            return ErrorCode::ProcChanceFailed;
        }
    }
    return std::nullopt;
}

std::vector<EffectApplicationResult> TriggerSystem::Fire(TriggerCondition condition,
                                                         ecs::Entity source,
                                                         ecs::Entity target,
                                                         const TriggerContext& context) {
    std::vector<EffectApplicationResult> results;
    ++stats_.fired;
    const SimTime now = clock_.Now();

    // Indexed: event subscribers may register procs while we apply.
    for (std::size_t i = 0; i < bindings_.size(); ++i) {
        if (bindings_[i].condition != condition) {
            continue;
        }
        if (bindings_[i].owner.isValid() && bindings_[i].owner != source) {
            continue;
        }

        auto& state = states_[StateKey{bindings_[i].id.value(), source.raw}];
        const auto& special = bindings_[i].special;
        const ecs::Entity recipient = special.applyTo == ProcTarget::Source ? source : target;

        if (auto failed = gate(bindings_[i], state, context, now)) {
            ++stats_.failed;
            EVOLVE_LOG_TRACE(LogCategory::Trigger, gateMessage(*failed, special));
            results.push_back(EffectApplicationResult{
                special.effect, recipient, bindings_[i].id,
                GameResult<ApplyOutcome>::err(GameError(*failed, gateMessage(*failed, special)))});
            continue;
        }

        state.lastProcTime = now;
        ++state.procCount;
        ++bindings_[i].triggerCount;
        ++stats_.procs;
        EVOLVE_LOG_DEBUG(LogCategory::Trigger,
                         special.name + " proc for entity " + std::to_string(source.id()));

        const ProcId procId = bindings_[i].id;
        const EffectId mainEffect = special.effect;
        const float delay = special.delay;
        const float chainDelay = special.chainDelay;
        const std::vector<EffectId> combination = special.combination;
        const std::vector<EffectId> chain = special.chain;

        // Combination effects travel with the main effect, delayed or not.
        if (delay > 0.0f) {
            schedule(now + delay, procId, mainEffect, source, recipient);
            for (auto extra : combination) {
                schedule(now + delay, procId, extra, source, recipient);
            }
        } else {
            results.push_back(EffectApplicationResult{
                mainEffect, recipient, procId, effects_.Apply(mainEffect, source, recipient)});
            for (auto extra : combination) {
                results.push_back(EffectApplicationResult{
                    extra, recipient, procId, effects_.Apply(extra, source, recipient)});
            }
        }

        for (std::size_t c = 0; c < chain.size(); ++c) {
            schedule(now + delay + chainDelay * static_cast<SimTime>(c + 1),
                     procId, chain[c], source, recipient);
        }
    }
    return results;
}

void TriggerSystem::schedule(SimTime due, ProcId proc, EffectId effect,
                             ecs::Entity source, ecs::Entity target) {
    pending_.push_back(Scheduled{due, nextSequence_++, proc, effect, source, target});
    ++stats_.scheduled;
}

// ── Tick ────────────────────────────────────────────────────────────────

void TriggerSystem::Execute(float /*deltaTime*/) {
    lastTick_.clear();
    const SimTime now = clock_.Now();

    std::vector<Scheduled> due;
    std::erase_if(pending_, [&due, now](const Scheduled& s) {
        if (s.due > now + kTimeEpsilon) {
            return false;
        }
        due.push_back(s);
        return true;
    });
    std::sort(due.begin(), due.end(), [](const Scheduled& a, const Scheduled& b) {
        return a.due != b.due ? a.due < b.due : a.sequence < b.sequence;
    });

    for (const auto& s : due) {
        lastTick_.push_back(EffectApplicationResult{
            s.effect, s.target, s.proc, effects_.Apply(s.effect, s.source, s.target)});
    }
}

// ── Queries ─────────────────────────────────────────────────────────────

int32_t TriggerSystem::TriggerCount(ProcId id) const {
    auto it = std::find_if(bindings_.begin(), bindings_.end(),
                           [id](const Binding& b) { return b.id == id; });
    return it != bindings_.end() ? it->triggerCount : 0;
}

std::optional<ProcState> TriggerSystem::State(ProcId id, ecs::Entity source) const {
    auto it = states_.find(StateKey{id.value(), source.raw});
    if (it == states_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace evolve::game
