#pragma once

/// @file trigger_types.hpp
/// @brief Trigger conditions and special-effect (proc) bindings.

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "evolve/ecs/entity.hpp"
#include "evolve/foundation/types.hpp"
#include "evolve/game/effect_types.hpp"
#include "evolve/game/sim_clock.hpp"

namespace evolve::game {

using foundation::SkillId;

/// Game events a proc can listen to.
enum class TriggerCondition : uint8_t {
    OnHit,
    OnCast,
    OnCrit,
    OnKill,
    OnDamageTaken,
    OnHeal,
    OnLowHealth
};

inline constexpr std::size_t kTriggerConditionCount = 7;

[[nodiscard]] std::string_view triggerConditionName(TriggerCondition condition);

/// Facts about the event that fired a trigger.
struct TriggerContext {
    float amount = 0.0f;  ///< Damage or healing involved
    bool isCrit = false;
    std::optional<SkillId> skill;
};

/// Extra gate evaluated before the cooldown and chance checks.
using ProcPredicate = std::function<bool(const TriggerContext&)>;

/// Which side of the event receives the proc effect.
enum class ProcTarget : uint8_t {
    Target,  ///< The event's target
    Source   ///< The entity that fired the trigger
};

/// An effect bound to a trigger with chance, cooldown and proc limit.
struct SpecialEffect {
    std::string name;
    EffectId effect;
    float chance = 1.0f;        ///< In [0,1]
    float cooldown = 0.0f;      ///< Seconds between procs per source
    int32_t maxProcs = 0;       ///< 0 = unlimited
    float delay = 0.0f;         ///< Main effect applied this long after the proc
    std::vector<ProcPredicate> conditions;
    std::vector<EffectId> combination;  ///< Applied after the main effect, in order
    std::vector<EffectId> chain;        ///< Scheduled every chainDelay seconds
    float chainDelay = 0.5f;
    ProcTarget applyTo = ProcTarget::Target;
};

/// Per (proc, source) gating state.
struct ProcState {
    std::optional<SimTime> lastProcTime;
    int32_t procCount = 0;
};

/// Trigger counters.
struct TriggerStats {
    uint64_t fired = 0;       ///< Fire() calls
    uint64_t procs = 0;       ///< Successful procs
    uint64_t failed = 0;      ///< Gated procs
    uint64_t scheduled = 0;   ///< Delayed and chained applications queued
};

} // namespace evolve::game
