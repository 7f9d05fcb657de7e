/// @file combat_system.cpp
/// @brief CombatSystem implementation.
///
/// Implements the per-tick combat update:
///   1. Resource maxima refresh from the stat cache
///   2. Stun timer countdown
///   3. Stagger recovery while not stunned
/// and the on-demand damage/heal pipeline.

#include "evolve/game/combat_system.hpp"

#include "evolve/foundation/game_logger.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace evolve::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

std::string_view damageTypeName(DamageType type) {
    switch (type) {
        case DamageType::Physical: return "physical";
        case DamageType::Magic:    return "magic";
        case DamageType::Fire:     return "fire";
        case DamageType::Frost:    return "frost";
        case DamageType::Nature:   return "nature";
        case DamageType::Shadow:   return "shadow";
        case DamageType::Holy:     return "holy";
    }
    return "unknown";
}

CombatSystem::CombatSystem(ecs::ComponentStorage<Vitals>& vitals,
                           StatCache& stats,
                           IWorldView& world,
                           IRandomSource& random,
                           GameEvents& events,
                           CombatTuning tuning)
    : vitals_(vitals),
      stats_(stats),
      world_(world),
      random_(random),
      events_(events),
      tuning_(tuning) {}

void CombatSystem::Execute(float deltaTime) {
    for (std::size_t i = 0; i < vitals_.Size(); ++i) {
        auto entity = vitals_.EntityAt(i);
        auto& vitals = vitals_.Get(entity);

        auto stats = stats_.Get(entity);
        if (!stats) {
            continue;
        }
        vitals.RefreshMaxima(stats.value());

        if (vitals.IsStunned()) {
            vitals.stunRemaining = std::max(vitals.stunRemaining - deltaTime, 0.0f);
            continue;
        }

        if (vitals.stagger > 0.0f) {
            float recovery = stats.value().Get(DerivedStat::ToughnessRecovery) * deltaTime;
            vitals.stagger = std::max(vitals.stagger - recovery, 0.0f);
        }
    }
}

float CombatSystem::Mitigation(const DerivedStatSet& stats, DamageType type) const noexcept {
    if (type == DamageType::Physical) {
        float defense = std::max(stats.Get(DerivedStat::Defense), 0.0f);
        float denom = defense + tuning_.defenseConstant;
        return denom > 0.0f ? defense / denom : 0.0f;
    }
    return std::clamp(stats.Get(DerivedStat::MagicResistance), 0.0f, 1.0f);
}

GameResult<Vitals*> CombatSystem::requireVitals(ecs::Entity entity) {
    if (auto attrs = world_.GetAttributes(entity); !attrs) {
        return GameResult<Vitals*>::err(attrs.error());
    }
    auto* vitals = vitals_.TryGet(entity);
    if (vitals == nullptr) {
        return GameResult<Vitals*>::err(GameError(
            ErrorCode::CapabilityMissing,
            "entity " + std::to_string(entity.id()) + " has no vitals"));
    }
    return GameResult<Vitals*>::ok(vitals);
}

// ── Damage pipeline ─────────────────────────────────────────────────────

GameResult<DamageResult> CombatSystem::ResolveAttack(ecs::Entity attacker,
                                                     ecs::Entity defender,
                                                     const AttackRequest& request) {
    auto vitals = requireVitals(defender);
    if (!vitals) {
        return GameResult<DamageResult>::err(vitals.error());
    }
    if (!vitals.value()->IsAlive()) {
        return GameResult<DamageResult>::err(GameError(
            ErrorCode::TargetAlreadyDead,
            "entity " + std::to_string(defender.id()) + " is already dead"));
    }
    if (!std::isfinite(request.magnitude) || request.magnitude < 0.0f) {
        return GameResult<DamageResult>::err(GameError(
            ErrorCode::InvalidArgument, "attack magnitude must be a non-negative number"));
    }

    auto defenderStats = stats_.Get(defender);
    if (!defenderStats) {
        return GameResult<DamageResult>::err(defenderStats.error());
    }
    std::optional<DerivedStatSet> attackerStats;
    if (attacker.isValid()) {
        auto s = stats_.Get(attacker);
        if (!s) {
            return GameResult<DamageResult>::err(s.error());
        }
        attackerStats = s.value();
    }
    const auto& def = defenderStats.value();

    DamageResult result;
    float damage = request.magnitude;

    float dodge = def.Get(DerivedStat::DodgeChance);
    if (request.allowDodge && dodge > 0.0f && random_.NextUnit() < dodge) {
        result.isDodged = true;
        result.rawDamage = damage;
        result.healthAfter = vitals.value()->health;
        EVOLVE_LOG_DEBUG(LogCategory::Combat,
                         "entity " + std::to_string(defender.id()) + " dodged");
        events_.damageDealt.emit(DamageDealtEvent{attacker, defender, request.type, result});
        return GameResult<DamageResult>::ok(result);
    }

    if (attackerStats && request.allowCrit) {
        float crit = attackerStats->Get(DerivedStat::CritChance);
        if (crit > 0.0f && random_.NextUnit() < crit) {
            result.isCrit = true;
            damage *= attackerStats->Get(DerivedStat::CritMultiplier);
        }
    }
    result.rawDamage = damage;

    float block = def.Get(DerivedStat::BlockChance);
    if (request.allowBlock && request.type == DamageType::Physical && block > 0.0f &&
        random_.NextUnit() < block) {
        result.isBlocked = true;
        damage *= (1.0f - tuning_.blockReduction);
    }

    if (!request.ignoreMitigation) {
        damage *= (1.0f - Mitigation(def, request.type));
    }
    result.finalDamage = std::max(damage, 0.0f);

    applyDamage(attacker, defender, request.type, result,
                def.Get(DerivedStat::Toughness), request.staggerScale);
    return GameResult<DamageResult>::ok(result);
}

GameResult<DamageResult> CombatSystem::ApplyDirectDamage(ecs::Entity source,
                                                         ecs::Entity target,
                                                         float amount,
                                                         std::optional<DamageType> type) {
    auto vitals = requireVitals(target);
    if (!vitals) {
        return GameResult<DamageResult>::err(vitals.error());
    }
    if (!vitals.value()->IsAlive()) {
        return GameResult<DamageResult>::err(GameError(
            ErrorCode::TargetAlreadyDead,
            "entity " + std::to_string(target.id()) + " is already dead"));
    }
    if (!std::isfinite(amount) || amount < 0.0f) {
        return GameResult<DamageResult>::err(GameError(
            ErrorCode::InvalidArgument, "damage amount must be a non-negative number"));
    }

    DamageResult result;
    result.rawDamage = amount;
    float damage = amount;
    if (type) {
        auto stats = stats_.Get(target);
        if (!stats) {
            return GameResult<DamageResult>::err(stats.error());
        }
        damage *= (1.0f - Mitigation(stats.value(), *type));
    }
    result.finalDamage = std::max(damage, 0.0f);

    applyDamage(source, target, type.value_or(DamageType::Physical), result);
    return GameResult<DamageResult>::ok(result);
}

// Every write to the defender happens before the first emit. Handlers may
// spawn or despawn entities, which moves or frees the vitals storage, so
// after each emit the defender is looked up again and publishing stops once
// it is gone.
void CombatSystem::applyDamage(ecs::Entity attacker, ecs::Entity defender, DamageType type,
                               DamageResult& result, float toughness, float staggerScale) {
    Vitals* vitals = vitals_.TryGet(defender);
    if (vitals == nullptr) {
        return;
    }
    vitals->SetHealth(vitals->health - result.finalDamage);
    result.healthAfter = vitals->health;
    result.isKill = !vitals->IsAlive();

    if (result.isKill) {
        vitals->stagger = 0.0f;
        vitals->stunRemaining = 0.0f;
    } else if (toughness > 0.0f && !vitals->IsStunned()) {
        vitals->stagger += result.finalDamage * staggerScale;
        if (vitals->stagger >= toughness) {
            vitals->stagger = 0.0f;
            vitals->stunRemaining = tuning_.stunDuration;
            result.isStunned = true;
        }
    }

    EVOLVE_LOG_DEBUG(LogCategory::Combat,
                     "entity " + std::to_string(defender.id()) + " took " +
                         std::to_string(result.finalDamage) + " " +
                         std::string(damageTypeName(type)) + " damage");
    events_.damageDealt.emit(DamageDealtEvent{attacker, defender, type, result});
    if (!vitals_.Has(defender)) {
        return;
    }

    if (result.isStunned) {
        EVOLVE_LOG_DEBUG(LogCategory::Combat,
                         "entity " + std::to_string(defender.id()) + " stunned");
        events_.entityStunned.emit(EntityStunnedEvent{defender, tuning_.stunDuration});
    }
    if (result.isKill && vitals_.Has(defender)) {
        world_.NotifyDeath(defender);
        EVOLVE_LOG_INFO(LogCategory::Combat,
                        "entity " + std::to_string(defender.id()) + " died");
        events_.entityDied.emit(EntityDiedEvent{defender, attacker});
    }
}

// ── Healing and resources ───────────────────────────────────────────────

GameResult<float> CombatSystem::ApplyHealing(ecs::Entity source, ecs::Entity target,
                                             float amount) {
    auto vitals = requireVitals(target);
    if (!vitals) {
        return GameResult<float>::err(vitals.error());
    }
    Vitals& v = *vitals.value();
    if (!v.IsAlive()) {
        return GameResult<float>::err(GameError(
            ErrorCode::TargetAlreadyDead,
            "entity " + std::to_string(target.id()) + " is already dead"));
    }
    if (!std::isfinite(amount) || amount < 0.0f) {
        return GameResult<float>::err(GameError(
            ErrorCode::InvalidArgument, "heal amount must be a non-negative number"));
    }

    float before = v.health;
    v.SetHealth(v.health + amount);
    float healed = v.health - before;
    events_.healApplied.emit(HealAppliedEvent{source, target, healed});
    return GameResult<float>::ok(healed);
}

GameResult<float> CombatSystem::AdjustResource(ecs::Entity source, ecs::Entity target,
                                               ResourceKind kind, float amount) {
    if (kind == ResourceKind::Health) {
        if (amount >= 0.0f) {
            return ApplyHealing(source, target, amount);
        }
        auto damage = ApplyDirectDamage(source, target, -amount);
        if (!damage) {
            return GameResult<float>::err(damage.error());
        }
        return GameResult<float>::ok(-damage.value().finalDamage);
    }

    auto vitals = requireVitals(target);
    if (!vitals) {
        return GameResult<float>::err(vitals.error());
    }
    Vitals& v = *vitals.value();
    if (!v.IsAlive()) {
        return GameResult<float>::err(GameError(
            ErrorCode::TargetAlreadyDead,
            "entity " + std::to_string(target.id()) + " is already dead"));
    }
    float before = v.Get(kind);
    v.Set(kind, before + amount);
    return GameResult<float>::ok(v.Get(kind) - before);
}

GameResult<void> CombatSystem::SyncVitals(ecs::Entity entity) {
    auto vitals = requireVitals(entity);
    if (!vitals) {
        return GameResult<void>::err(vitals.error());
    }
    auto stats = stats_.Get(entity);
    if (!stats) {
        return GameResult<void>::err(stats.error());
    }
    vitals.value()->RefreshMaxima(stats.value());
    return GameResult<void>::ok();
}

} // namespace evolve::game
