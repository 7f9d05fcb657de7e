/// @file effect_system.cpp
/// @brief EffectSystem implementation.
///
/// Per-tick update:
///   1. Snapshot live (target, id) pairs
///   2. Fire due periodic ticks (magnitude x stacks) up to min(now, expiry)
///   3. Expire instances past their expiry
///   4. Sweep finished instances and publish removals

#include "evolve/game/effect_system.hpp"

#include "evolve/foundation/game_logger.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace evolve::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

bool sharesTag(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    return std::any_of(a.begin(), a.end(), [&b](const std::string& tag) {
        return std::find(b.begin(), b.end(), tag) != b.end();
    });
}

bool isModifierKind(EffectKind kind) {
    return kind == EffectKind::Buff || kind == EffectKind::Debuff ||
           kind == EffectKind::Movement;
}

bool isVitalsKind(EffectKind kind) {
    return kind == EffectKind::Damage || kind == EffectKind::Heal ||
           kind == EffectKind::Resource;
}

GameError invalid(const Effect& effect, const std::string& what) {
    return GameError(ErrorCode::InvalidArgument, "effect '" + effect.name + "': " + what);
}

} // namespace

std::string_view effectCategoryName(EffectCategory category) {
    switch (category) {
        case EffectCategory::Instant:   return "instant";
        case EffectCategory::Duration:  return "duration";
        case EffectCategory::Permanent: return "permanent";
        case EffectCategory::Trigger:   return "trigger";
        case EffectCategory::Stacking:  return "stacking";
    }
    return "unknown";
}

std::string_view applyStatusName(ApplyStatus status) {
    switch (status) {
        case ApplyStatus::Applied:  return "applied";
        case ApplyStatus::Stacked:  return "stacked";
        case ApplyStatus::Replaced: return "replaced";
        case ApplyStatus::Merged:   return "merged";
        case ApplyStatus::Ignored:  return "ignored";
        case ApplyStatus::Resolved: return "resolved";
    }
    return "unknown";
}

EffectSystem::EffectSystem(EffectCatalog& catalog,
                           ecs::ComponentStorage<EffectHolder>& holders,
                           ecs::ComponentStorage<Vitals>& vitals,
                           ecs::ComponentStorage<Faction>& factions,
                           ecs::ComponentStorage<Immunities>& immunities,
                           StatCache& stats,
                           IWorldView& world,
                           CombatSystem& combat,
                           const SimClock& clock,
                           GameEvents& events)
    : catalog_(catalog),
      holders_(holders),
      vitals_(vitals),
      factions_(factions),
      immunities_(immunities),
      statCache_(stats),
      world_(world),
      combat_(combat),
      clock_(clock),
      events_(events) {
    statCache_.AddModifierSource([this](ecs::Entity entity, std::vector<Modifier>& out) {
        CollectModifiers(entity, out);
    });
}

// ── Registration ────────────────────────────────────────────────────────

GameResult<void> EffectSystem::validate(const Effect& effect) const {
    if (effect.name.empty()) {
        return GameResult<void>::err(invalid(effect, "name must not be empty"));
    }
    if (effect.maxStacks < 1) {
        return GameResult<void>::err(invalid(effect, "max stacks must be at least 1"));
    }
    if (!std::isfinite(effect.duration) || effect.duration < 0.0f ||
        !std::isfinite(effect.tickPeriod) || effect.tickPeriod < 0.0f) {
        return GameResult<void>::err(invalid(effect, "duration and tick period must be >= 0"));
    }
    if ((effect.category == EffectCategory::Duration ||
         effect.category == EffectCategory::Stacking) && effect.duration <= 0.0f) {
        return GameResult<void>::err(invalid(effect, "timed effect needs a positive duration"));
    }

    if (effect.kind == EffectKind::Combination) {
        if (effect.children.empty()) {
            return GameResult<void>::err(invalid(effect, "combination without children"));
        }
        for (auto child : effect.children) {
            if (catalog_.Find(child) == nullptr) {
                return GameResult<void>::err(GameError(
                    ErrorCode::UnknownEffect,
                    "effect '" + effect.name + "' references unknown child " +
                        std::to_string(child.value())));
            }
        }
        return GameResult<void>::ok();
    }

    if (isModifierKind(effect.kind)) {
        if (effect.IsScalar()) {
            return GameResult<void>::err(invalid(effect, "modifier effect needs a stat map"));
        }
        if (!effect.IsTracked()) {
            return GameResult<void>::err(invalid(effect, "stat map effect must be tracked"));
        }
    } else if (isVitalsKind(effect.kind)) {
        if (!effect.IsScalar()) {
            return GameResult<void>::err(invalid(effect, "resource effect needs a scalar"));
        }
        float v = effect.Scalar();
        if (!std::isfinite(v)) {
            return GameResult<void>::err(invalid(effect, "value must be finite"));
        }
        if (effect.kind != EffectKind::Resource && v < 0.0f) {
            return GameResult<void>::err(invalid(effect, "damage and heal values are non-negative"));
        }
    }
    return GameResult<void>::ok();
}

GameResult<EffectId> EffectSystem::Register(Effect effect) {
    if (auto valid = validate(effect); !valid) {
        return GameResult<EffectId>::err(valid.error());
    }
    auto id = catalog_.Add(std::move(effect));
    if (id) {
        EVOLVE_LOG_DEBUG(LogCategory::Effect,
                         "registered effect " + catalog_.Find(id.value())->name);
    }
    return id;
}

// ── Application ─────────────────────────────────────────────────────────

GameResult<ApplyOutcome> EffectSystem::Apply(EffectId id,
                                             ecs::Entity source,
                                             ecs::Entity target,
                                             const EffectContext& context) {
    auto result = applyImpl(id, source, target, context);
    if (!result) {
        ++stats_.rejected;
        EVOLVE_LOG_DEBUG(LogCategory::Effect,
                         "effect " + std::to_string(id.value()) + " rejected on entity " +
                             std::to_string(target.id()) + ": " +
                             std::string(result.error().message()));
    }
    return result;
}

GameResult<void> EffectSystem::checkTarget(const Effect& effect,
                                           ecs::Entity source,
                                           ecs::Entity target) const {
    if (!source.isValid() || effect.target == TargetType::Any) {
        return GameResult<void>::ok();
    }
    auto teamOf = [this](ecs::Entity e) {
        const auto* faction = factions_.TryGet(e);
        return faction != nullptr ? faction->team : 0u;
    };
    bool allied = teamOf(source) == teamOf(target);

    bool ok = true;
    switch (effect.target) {
        case TargetType::Self:  ok = source == target; break;
        case TargetType::Enemy: ok = source != target && !allied; break;
        case TargetType::Ally:  ok = allied; break;
        case TargetType::Any:   break;
    }
    if (!ok) {
        return GameResult<void>::err(GameError(
            ErrorCode::TargetTypeMismatch,
            "effect '" + effect.name + "' cannot target entity " +
                std::to_string(target.id())));
    }
    return GameResult<void>::ok();
}

GameResult<float> EffectSystem::computeMagnitude(const Effect& effect,
                                                 ecs::Entity source,
                                                 const EffectContext& context,
                                                 float& scale) {
    int32_t level = 1;
    float base = context.magnitudeOverride.value_or(effect.Scalar() + context.bonusMagnitude);

    if (source.isValid()) {
        auto attrs = statCache_.EffectiveAttributes(source);
        if (!attrs) {
            return GameResult<float>::err(attrs.error());
        }
        level = attrs.value().level;
        if (!context.magnitudeOverride && !effect.scaling.IsZero()) {
            auto stats = statCache_.Get(source);
            if (!stats) {
                return GameResult<float>::err(stats.error());
            }
            base += effect.scaling.Evaluate(attrs.value(), stats.value());
        }
    }

    scale = effect.balance.Multiplier(level, context.isPvp) * context.powerMultiplier;
    float magnitude = base * scale;
    if (effect.kind != EffectKind::Resource) {
        magnitude = std::max(magnitude, 0.0f);
    }
    return GameResult<float>::ok(magnitude);
}

GameResult<ApplyOutcome> EffectSystem::applyImpl(EffectId id,
                                                 ecs::Entity source,
                                                 ecs::Entity target,
                                                 const EffectContext& context) {
    const Effect* effect = catalog_.Find(id);
    if (effect == nullptr) {
        return GameResult<ApplyOutcome>::err(GameError(
            ErrorCode::UnknownEffect, "unknown effect " + std::to_string(id.value())));
    }
    if (auto attrs = world_.GetAttributes(target); !attrs) {
        return GameResult<ApplyOutcome>::err(attrs.error());
    }
    if (source.isValid()) {
        if (auto attrs = world_.GetAttributes(source); !attrs) {
            return GameResult<ApplyOutcome>::err(attrs.error());
        }
    }
    if (auto ok = checkTarget(*effect, source, target); !ok) {
        return GameResult<ApplyOutcome>::err(ok.error());
    }
    if (const auto* immune = immunities_.TryGet(target);
        immune != nullptr && immune->Covers(effect->tags)) {
        return GameResult<ApplyOutcome>::err(GameError(
            ErrorCode::TargetImmune,
            "entity " + std::to_string(target.id()) + " is immune to " + effect->name));
    }

    const auto* vitals = vitals_.TryGet(target);
    if (isVitalsKind(effect->kind) && vitals == nullptr) {
        return GameResult<ApplyOutcome>::err(GameError(
            ErrorCode::CapabilityMissing,
            "entity " + std::to_string(target.id()) + " has no vitals for " + effect->name));
    }
    if (vitals != nullptr && !vitals->IsAlive()) {
        return GameResult<ApplyOutcome>::err(GameError(
            ErrorCode::TargetAlreadyDead,
            "entity " + std::to_string(target.id()) + " is already dead"));
    }

    if (effect->kind == EffectKind::Combination) {
        return applyCombination(*effect, source, target, context);
    }

    float scale = 1.0f;
    auto magnitude = computeMagnitude(*effect, source, context, scale);
    if (!magnitude) {
        return GameResult<ApplyOutcome>::err(magnitude.error());
    }

    if (effect->IsTracked()) {
        return applyTracked(*effect, source, target, magnitude.value(), scale);
    }

    ApplyOutcome outcome;
    outcome.status = ApplyStatus::Resolved;
    outcome.magnitude = magnitude.value();
    if (auto resolved = resolveScalar(*effect, source, target, magnitude.value(), false, outcome);
        !resolved) {
        return GameResult<ApplyOutcome>::err(resolved.error());
    }
    ++stats_.applied;
    publishApplied(*effect, source, target, outcome);
    return GameResult<ApplyOutcome>::ok(outcome);
}

GameResult<ApplyOutcome> EffectSystem::applyCombination(const Effect& effect,
                                                        ecs::Entity source,
                                                        ecs::Entity target,
                                                        const EffectContext& context) {
    ApplyOutcome outcome;
    outcome.status = ApplyStatus::Resolved;
    for (auto child : effect.children) {
        auto result = Apply(child, source, target, context);
        if (!result) {
            continue;
        }
        outcome.amount += result.value().amount;
        if (result.value().damage) {
            outcome.damage = result.value().damage;
        }
    }
    ++stats_.applied;
    publishApplied(effect, source, target, outcome);
    return GameResult<ApplyOutcome>::ok(outcome);
}

GameResult<ApplyOutcome> EffectSystem::applyTracked(const Effect& effect,
                                                    ecs::Entity source,
                                                    ecs::Entity target,
                                                    float magnitude,
                                                    float scale) {
    auto& holder = holders_.GetOrAdd(target);
    const SimTime now = clock_.Now();
    const SimTime expiry = expiryFor(effect, now);

    ApplyOutcome outcome;
    outcome.magnitude = magnitude;

    auto latest = [&holder, &effect]() -> ActiveEffect* {
        ActiveEffect* found = nullptr;
        for (auto& active : holder.effects) {
            if (active.state == ActiveEffectState::Active && active.effect == effect.id &&
                (found == nullptr || active.sequence > found->sequence)) {
                found = &active;
            }
        }
        return found;
    };

    if (const ActiveEffect* current = latest();
        current != nullptr && current->stacks >= effect.maxStacks &&
        effect.conflict == ConflictPolicy::Stack) {
        return GameResult<ApplyOutcome>::err(GameError(
            ErrorCode::AlreadyAtMaxStacks,
            effect.name + " already at " + std::to_string(current->stacks) + " stacks"));
    }

    // Cancellation tags: the newest application wins unless it ignores.
    if (!effect.cancellationTags.empty()) {
        std::vector<ActiveEffect*> conflicts;
        for (auto& active : holder.effects) {
            if (active.state != ActiveEffectState::Active || active.effect == effect.id) {
                continue;
            }
            const Effect* other = catalog_.Find(active.effect);
            if (other != nullptr && sharesTag(other->cancellationTags, effect.cancellationTags)) {
                conflicts.push_back(&active);
            }
        }
        if (!conflicts.empty() && effect.conflict == ConflictPolicy::Ignore) {
            ++stats_.ignored;
            outcome.id = conflicts.front()->id;
            outcome.status = ApplyStatus::Ignored;
            outcome.stacks = conflicts.front()->stacks;
            publishApplied(effect, source, target, outcome);
            return GameResult<ApplyOutcome>::ok(outcome);
        }
        for (auto* active : conflicts) {
            evict(*active, ActiveEffectState::Replaced);
        }
    }

    ActiveEffect* existing = latest();

    if (existing == nullptr) {
        auto& installed = install(holder, effect, source, target, magnitude, scale);
        outcome.id = installed.id;
        outcome.status = ApplyStatus::Applied;
        outcome.stacks = installed.stacks;
        ++stats_.applied;
    } else if (existing->stacks < effect.maxStacks) {
        ++existing->stacks;
        existing->expiryTime = expiry;
        existing->magnitude = magnitude;
        existing->modifierScale = scale;
        existing->sequence = nextSequence_++;
        outcome.id = existing->id;
        outcome.status = ApplyStatus::Stacked;
        outcome.stacks = existing->stacks;
        ++stats_.stacked;
    } else {
        switch (effect.conflict) {
            case ConflictPolicy::Ignore:
                ++stats_.ignored;
                outcome.id = existing->id;
                outcome.status = ApplyStatus::Ignored;
                outcome.stacks = existing->stacks;
                sweep(target);
                publishApplied(effect, source, target, outcome);
                return GameResult<ApplyOutcome>::ok(outcome);

            case ConflictPolicy::Stack:
                // Rejected above before any mutation.
                break;

            case ConflictPolicy::Replace: {
                evict(*existing, ActiveEffectState::Replaced);
                auto& installed = install(holder, effect, source, target, magnitude, scale);
                outcome.id = installed.id;
                outcome.status = ApplyStatus::Replaced;
                outcome.stacks = installed.stacks;
                break;
            }

            case ConflictPolicy::Merge:
                existing->magnitude += magnitude;
                existing->modifierScale += scale;
                existing->expiryTime = std::max(existing->expiryTime, expiry);
                existing->sequence = nextSequence_++;
                outcome.id = existing->id;
                outcome.status = ApplyStatus::Merged;
                outcome.stacks = existing->stacks;
                ++stats_.merged;
                break;
        }
    }

    if (effect.IsScalar() && !effect.IsPeriodic()) {
        if (auto resolved = resolveScalar(effect, source, target, magnitude, false, outcome);
            !resolved) {
            EVOLVE_LOG_WARN(LogCategory::Effect,
                            effect.name + " installed but failed to resolve: " +
                                std::string(resolved.error().message()));
        }
    }
    if (!effect.IsScalar()) {
        modifiersChanged(target);
    }
    sweep(target);
    publishApplied(effect, source, target, outcome);
    return GameResult<ApplyOutcome>::ok(outcome);
}

GameResult<void> EffectSystem::resolveScalar(const Effect& effect,
                                             ecs::Entity source,
                                             ecs::Entity target,
                                             float magnitude,
                                             bool periodic,
                                             ApplyOutcome& outcome) {
    switch (effect.kind) {
        case EffectKind::Damage: {
            std::optional<DamageType> type;
            if (!effect.damageTypes.empty()) {
                type = effect.damageTypes.front();
            }
            AttackRequest request;
            request.magnitude = magnitude;
            request.type = type.value_or(DamageType::Physical);
            request.ignoreMitigation = !type.has_value();
            request.allowBlock = type.has_value();
            auto result = periodic
                              ? combat_.ApplyDirectDamage(source, target, magnitude, type)
                              : combat_.ResolveAttack(source, target, request);
            if (!result) {
                return GameResult<void>::err(result.error());
            }
            outcome.amount -= result.value().finalDamage;
            outcome.damage = result.value();
            return GameResult<void>::ok();
        }
        case EffectKind::Heal: {
            auto healed = combat_.ApplyHealing(source, target, magnitude);
            if (!healed) {
                return GameResult<void>::err(healed.error());
            }
            outcome.amount += healed.value();
            return GameResult<void>::ok();
        }
        case EffectKind::Resource: {
            auto delta = combat_.AdjustResource(source, target, effect.resource, magnitude);
            if (!delta) {
                return GameResult<void>::err(delta.error());
            }
            if (effect.resource == ResourceKind::Health) {
                outcome.amount += delta.value();
            }
            return GameResult<void>::ok();
        }
        case EffectKind::Buff:
        case EffectKind::Debuff:
        case EffectKind::Movement:
        case EffectKind::Combination:
            return GameResult<void>::ok();
    }
    return GameResult<void>::ok();
}

// ── Instance bookkeeping ────────────────────────────────────────────────

SimTime EffectSystem::expiryFor(const Effect& effect, SimTime now) const noexcept {
    if (effect.category == EffectCategory::Permanent) {
        return kNeverExpires;
    }
    return now + static_cast<SimTime>(effect.duration);
}

ActiveEffect& EffectSystem::install(EffectHolder& holder,
                                    const Effect& effect,
                                    ecs::Entity source,
                                    ecs::Entity target,
                                    float magnitude,
                                    float scale) {
    const SimTime now = clock_.Now();
    ActiveEffect active;
    active.id = ActiveEffectId(nextId_++);
    active.effect = effect.id;
    active.source = source;
    active.target = target;
    active.state = ActiveEffectState::Active;
    active.appliedTime = now;
    active.expiryTime = expiryFor(effect, now);
    active.nextTickTime = effect.IsPeriodic() ? now + effect.tickPeriod : kNeverExpires;
    active.magnitude = magnitude;
    active.modifierScale = scale;
    active.sequence = nextSequence_++;

    holder.effects.push_back(active);
    owners_[active.id] = target;
    return holder.effects.back();
}

void EffectSystem::evict(ActiveEffect& active, ActiveEffectState reason) {
    active.state = reason;
    if (reason == ActiveEffectState::Replaced) {
        ++stats_.replaced;
    }
}

void EffectSystem::sweep(ecs::Entity target) {
    auto* holder = holders_.TryGet(target);
    if (holder == nullptr) {
        return;
    }

    std::vector<ActiveEffect> finished;
    std::erase_if(holder->effects, [&finished](const ActiveEffect& active) {
        if (active.state == ActiveEffectState::Active) {
            return false;
        }
        finished.push_back(active);
        return true;
    });
    if (finished.empty()) {
        return;
    }

    bool modifiers = false;
    for (const auto& active : finished) {
        owners_.erase(active.id);
        if (active.state == ActiveEffectState::Expired) {
            ++stats_.expired;
        } else if (active.state == ActiveEffectState::Removed) {
            ++stats_.removed;
        }
        const Effect* effect = catalog_.Find(active.effect);
        if (effect != nullptr && !effect->IsScalar()) {
            modifiers = true;
        }
    }
    if (modifiers) {
        modifiersChanged(target);
    }

    for (const auto& active : finished) {
        events_.effectRemoved.emit(
            EffectRemovedEvent{active.id, active.effect, target, active.state});
    }
}

void EffectSystem::modifiersChanged(ecs::Entity target) {
    statCache_.Invalidate(target);
    if (!vitals_.Has(target)) {
        return;
    }
    if (auto synced = combat_.SyncVitals(target); !synced) {
        EVOLVE_LOG_DEBUG(LogCategory::Effect,
                         "vitals sync failed for entity " + std::to_string(target.id()) +
                             ": " + std::string(synced.error().message()));
    }
}

void EffectSystem::publishApplied(const Effect& effect,
                                  ecs::Entity source,
                                  ecs::Entity target,
                                  const ApplyOutcome& outcome) {
    EVOLVE_LOG_DEBUG(LogCategory::Effect,
                     effect.name + " " + std::string(applyStatusName(outcome.status)) +
                         " on entity " + std::to_string(target.id()));
    events_.effectApplied.emit(EffectAppliedEvent{
        outcome.id, effect.id, source, target, outcome.status, outcome.stacks});
}

ActiveEffect* EffectSystem::findLive(ecs::Entity target, ActiveEffectId id) {
    auto* holder = holders_.TryGet(target);
    if (holder == nullptr) {
        return nullptr;
    }
    auto it = std::find_if(holder->effects.begin(), holder->effects.end(),
                           [id](const ActiveEffect& a) {
                               return a.id == id && a.state == ActiveEffectState::Active;
                           });
    return it != holder->effects.end() ? &*it : nullptr;
}

// ── Tick ────────────────────────────────────────────────────────────────

void EffectSystem::Execute(float /*deltaTime*/) {
    const SimTime now = clock_.Now();

    std::vector<std::pair<ecs::Entity, ActiveEffectId>> live;
    std::vector<ecs::Entity> targets;
    for (std::size_t i = 0; i < holders_.Size(); ++i) {
        auto entity = holders_.EntityAt(i);
        const auto& holder = holders_.Get(entity);
        if (holder.effects.empty()) {
            continue;
        }
        targets.push_back(entity);
        for (const auto& active : holder.effects) {
            if (active.state == ActiveEffectState::Active) {
                live.emplace_back(entity, active.id);
            }
        }
    }

    for (const auto& [target, id] : live) {
        tickEffect(target, id, now);
    }
    for (auto target : targets) {
        sweep(target);
    }
}

void EffectSystem::tickEffect(ecs::Entity target, ActiveEffectId id, SimTime now) {
    ActiveEffect* active = findLive(target, id);
    if (active == nullptr) {
        return;
    }
    const Effect* effect = catalog_.Find(active->effect);
    if (effect == nullptr) {
        return;
    }

    if (effect->IsPeriodic() && effect->IsScalar()) {
        while ((active = findLive(target, id)) != nullptr) {
            const SimTime limit = std::min(now, active->expiryTime);
            if (active->nextTickTime > limit + kTimeEpsilon) {
                break;
            }
            active->nextTickTime += effect->tickPeriod;
            const float amount = active->magnitude * static_cast<float>(active->stacks);
            const ecs::Entity source = active->source;

            ApplyOutcome scratch;
            auto ticked = resolveScalar(*effect, source, target, amount, true, scratch);
            ++stats_.ticks;
            if (!ticked) {
                EVOLVE_LOG_DEBUG(LogCategory::Effect,
                                 effect->name + " tick failed, removing: " +
                                     std::string(ticked.error().message()));
                if (auto* still = findLive(target, id); still != nullptr) {
                    still->state = ActiveEffectState::Removed;
                }
                return;
            }
        }
    }

    active = findLive(target, id);
    if (active != nullptr && active->expiryTime < kNeverExpires &&
        now > active->expiryTime + kTimeEpsilon) {
        active->state = ActiveEffectState::Expired;
    }
}

// ── Removal and queries ─────────────────────────────────────────────────

GameResult<void> EffectSystem::Remove(ActiveEffectId id) {
    auto it = owners_.find(id);
    if (it == owners_.end()) {
        return GameResult<void>::err(GameError(
            ErrorCode::EffectNotFound, "no active effect " + std::to_string(id.value())));
    }
    const ecs::Entity target = it->second;
    ActiveEffect* active = findLive(target, id);
    if (active == nullptr) {
        owners_.erase(it);
        return GameResult<void>::err(GameError(
            ErrorCode::EffectNotFound, "no active effect " + std::to_string(id.value())));
    }
    active->state = ActiveEffectState::Removed;
    sweep(target);
    return GameResult<void>::ok();
}

std::size_t EffectSystem::RemoveAll(ecs::Entity target) {
    auto* holder = holders_.TryGet(target);
    if (holder == nullptr) {
        return 0;
    }
    std::size_t count = 0;
    for (auto& active : holder->effects) {
        if (active.state == ActiveEffectState::Active) {
            active.state = ActiveEffectState::Removed;
            ++count;
        }
    }
    sweep(target);
    return count;
}

std::size_t EffectSystem::Dispel(ecs::Entity target, std::string_view tag) {
    auto* holder = holders_.TryGet(target);
    if (holder == nullptr) {
        return 0;
    }
    std::size_t count = 0;
    for (auto& active : holder->effects) {
        const Effect* effect = catalog_.Find(active.effect);
        if (active.state != ActiveEffectState::Active || effect == nullptr) {
            continue;
        }
        if (std::find(effect->tags.begin(), effect->tags.end(), tag) != effect->tags.end()) {
            active.state = ActiveEffectState::Removed;
            ++count;
        }
    }
    sweep(target);
    return count;
}

std::vector<ActiveEffectView> EffectSystem::Query(ecs::Entity target) const {
    std::vector<ActiveEffectView> views;
    const auto* holder = holders_.TryGet(target);
    if (holder == nullptr) {
        return views;
    }
    const SimTime now = clock_.Now();
    for (const auto& active : holder->effects) {
        if (active.state != ActiveEffectState::Active) {
            continue;
        }
        ActiveEffectView view;
        view.id = active.id;
        view.effect = active.effect;
        if (const Effect* effect = catalog_.Find(active.effect); effect != nullptr) {
            view.name = effect->name;
        }
        view.source = active.source;
        view.state = active.state;
        view.stacks = active.stacks;
        view.magnitude = active.magnitude;
        view.remaining = active.expiryTime < kNeverExpires
                             ? std::max(active.expiryTime - now, 0.0)
                             : kNeverExpires;
        views.push_back(std::move(view));
    }
    return views;
}

const ActiveEffect* EffectSystem::Find(ActiveEffectId id) const {
    auto it = owners_.find(id);
    if (it == owners_.end()) {
        return nullptr;
    }
    const auto* holder = holders_.TryGet(it->second);
    if (holder == nullptr) {
        return nullptr;
    }
    for (const auto& active : holder->effects) {
        if (active.id == id && active.state == ActiveEffectState::Active) {
            return &active;
        }
    }
    return nullptr;
}

bool EffectSystem::HasEffect(ecs::Entity target, EffectId effect) const {
    const auto* holder = holders_.TryGet(target);
    if (holder == nullptr) {
        return false;
    }
    return std::any_of(holder->effects.begin(), holder->effects.end(),
                       [effect](const ActiveEffect& a) {
                           return a.effect == effect && a.state == ActiveEffectState::Active;
                       });
}

void EffectSystem::CollectModifiers(ecs::Entity target, std::vector<Modifier>& out) const {
    const auto* holder = holders_.TryGet(target);
    if (holder == nullptr) {
        return;
    }
    for (const auto& active : holder->effects) {
        if (active.state != ActiveEffectState::Active) {
            continue;
        }
        const Effect* effect = catalog_.Find(active.effect);
        if (effect == nullptr) {
            continue;
        }
        const auto* modifiers = std::get_if<std::vector<Modifier>>(&effect->value);
        if (modifiers == nullptr) {
            continue;
        }
        const float factor = active.modifierScale * static_cast<float>(active.stacks);
        for (const auto& mod : *modifiers) {
            Modifier scaled = mod;
            scaled.value *= factor;
            if (scaled.source.empty()) {
                scaled.source = effect->name;
            }
            out.push_back(std::move(scaled));
        }
    }
}

} // namespace evolve::game
