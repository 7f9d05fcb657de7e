#pragma once

/// @file game_events.hpp
/// @brief Semantic events emitted by the engine for presentation layers.

#include <cstdint>
#include <vector>

#include "evolve/ecs/entity.hpp"
#include "evolve/foundation/signal.hpp"
#include "evolve/foundation/types.hpp"
#include "evolve/game/combat_types.hpp"
#include "evolve/game/effect_types.hpp"

namespace evolve::game {

struct EffectAppliedEvent {
    foundation::ActiveEffectId id;  ///< Invalid for effects resolved immediately.
    foundation::EffectId effect;
    ecs::Entity source;
    ecs::Entity target;
    ApplyStatus status = ApplyStatus::Applied;
    int32_t stacks = 0;
};

struct EffectRemovedEvent {
    foundation::ActiveEffectId id;
    foundation::EffectId effect;
    ecs::Entity target;
    ActiveEffectState reason = ActiveEffectState::Removed;
};

struct SkillUsedEvent {
    foundation::SkillId skill;
    ecs::Entity caster;
    std::vector<ecs::Entity> targets;
    int32_t comboStep = 0;
};

struct DamageDealtEvent {
    ecs::Entity attacker;
    ecs::Entity defender;
    DamageType type = DamageType::Physical;
    DamageResult result;
};

struct HealAppliedEvent {
    ecs::Entity source;
    ecs::Entity target;
    float amount = 0.0f;
};

struct EntityStunnedEvent {
    ecs::Entity entity;
    float duration = 0.0f;
};

struct EntityDiedEvent {
    ecs::Entity victim;
    ecs::Entity killer;
};

/// Signals the core emits. Subscribers must not assume any particular
/// thread; the core emits synchronously from within the operation.
struct GameEvents {
    foundation::Signal<const EffectAppliedEvent&> effectApplied;
    foundation::Signal<const EffectRemovedEvent&> effectRemoved;
    foundation::Signal<const SkillUsedEvent&> skillUsed;
    foundation::Signal<const DamageDealtEvent&> damageDealt;
    foundation::Signal<const HealAppliedEvent&> healApplied;
    foundation::Signal<const EntityStunnedEvent&> entityStunned;
    foundation::Signal<const EntityDiedEvent&> entityDied;
};

} // namespace evolve::game
