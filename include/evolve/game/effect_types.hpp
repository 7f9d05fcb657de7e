#pragma once

/// @file effect_types.hpp
/// @brief Effect templates, live effect instances and application results.

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "evolve/ecs/entity.hpp"
#include "evolve/foundation/game_result.hpp"
#include "evolve/foundation/types.hpp"
#include "evolve/game/combat_types.hpp"
#include "evolve/game/sim_clock.hpp"
#include "evolve/game/stat_types.hpp"

namespace evolve::game {

using foundation::ActiveEffectId;
using foundation::EffectId;
using foundation::ProcId;

// ── Enumerations ────────────────────────────────────────────────────────

/// Lifetime category of an effect.
enum class EffectCategory : uint8_t {
    Instant,    ///< Resolves on application, never tracked.
    Duration,   ///< Tracked until appliedTime + duration.
    Permanent,  ///< Tracked until removed.
    Trigger,    ///< Proc payload; resolves on application like Instant.
    Stacking    ///< Duration effect expected to stack.
};

/// What the effect does to its target.
enum class EffectKind : uint8_t {
    Buff,        ///< Stat modifiers (map value)
    Debuff,      ///< Stat modifiers (map value)
    Damage,      ///< Health loss (scalar value)
    Heal,        ///< Health gain (scalar value)
    Movement,    ///< Movement stat modifiers (map value)
    Resource,    ///< Signed change to a resource pool (scalar value)
    Combination  ///< Applies child effects
};

/// Outcome policy when an application would exceed the stack limit or
/// collides on a cancellation tag.
enum class ConflictPolicy : uint8_t {
    Ignore,   ///< Keep the existing instance; the new application is a no-op.
    Replace,  ///< Evict the existing instance and install the new one.
    Stack,    ///< Refuse beyond the limit with AlreadyAtMaxStacks.
    Merge     ///< Sum magnitudes and keep the later expiry.
};

/// Who an effect may land on, relative to its source.
enum class TargetType : uint8_t {
    Self,
    Enemy,
    Ally,
    Any
};

/// Lifecycle of an active effect.
enum class ActiveEffectState : uint8_t {
    Pending,
    Active,
    Expired,
    Removed,
    Replaced
};

/// How an application was resolved.
enum class ApplyStatus : uint8_t {
    Applied,   ///< New instance installed.
    Stacked,   ///< Existing instance gained a stack.
    Replaced,  ///< Existing instance evicted and replaced.
    Merged,    ///< New magnitude merged into the existing instance.
    Ignored,   ///< No-op under the Ignore policy.
    Resolved   ///< Instant effect resolved; nothing tracked.
};

[[nodiscard]] std::string_view effectCategoryName(EffectCategory category);
[[nodiscard]] std::string_view applyStatusName(ApplyStatus status);

// ── Templates ───────────────────────────────────────────────────────────

/// Scalar magnitude or a set of stat modifiers.
using EffectValue = std::variant<float, std::vector<Modifier>>;

/// Balance knobs applied on top of the computed magnitude.
struct EffectBalance {
    float basePower = 1.0f;
    float levelScaling = 0.0f;    ///< Fraction added per source level above 1
    float pvpMultiplier = 1.0f;
    float pveMultiplier = 1.0f;

    [[nodiscard]] float Multiplier(int32_t level, bool isPvp) const noexcept {
        float levelFactor = 1.0f + levelScaling * static_cast<float>(level - 1);
        return basePower * levelFactor * (isPvp ? pvpMultiplier : pveMultiplier);
    }
};

/// Immutable effect template.
struct Effect {
    EffectId id;
    std::string name;
    EffectCategory category = EffectCategory::Instant;
    EffectKind kind = EffectKind::Damage;
    EffectValue value = 0.0f;
    ResourceKind resource = ResourceKind::Health;  ///< Pool touched by Resource effects
    float duration = 0.0f;
    float tickPeriod = 0.0f;                       ///< 0 = not periodic
    std::vector<DamageType> damageTypes;           ///< First entry drives mitigation
    Scaling scaling;
    TargetType target = TargetType::Any;
    std::vector<std::string> tags;
    std::vector<std::string> cancellationTags;
    ConflictPolicy conflict = ConflictPolicy::Replace;
    int32_t maxStacks = 1;
    EffectBalance balance;
    std::vector<EffectId> children;                ///< Combination payload

    [[nodiscard]] bool IsScalar() const noexcept {
        return std::holds_alternative<float>(value);
    }
    [[nodiscard]] bool IsPeriodic() const noexcept { return tickPeriod > 0.0f; }
    [[nodiscard]] bool IsTracked() const noexcept {
        return category == EffectCategory::Duration ||
               category == EffectCategory::Permanent ||
               category == EffectCategory::Stacking;
    }
    [[nodiscard]] float Scalar() const noexcept {
        const auto* v = std::get_if<float>(&value);
        return v != nullptr ? *v : 0.0f;
    }
};

// ── Live instances ──────────────────────────────────────────────────────

inline constexpr SimTime kNeverExpires = std::numeric_limits<SimTime>::infinity();

/// An effect template applied to a target.
struct ActiveEffect {
    ActiveEffectId id;
    EffectId effect;
    ecs::Entity source;
    ecs::Entity target;
    ActiveEffectState state = ActiveEffectState::Pending;
    SimTime appliedTime = 0.0;
    SimTime expiryTime = kNeverExpires;
    SimTime nextTickTime = kNeverExpires;
    int32_t stacks = 1;
    float magnitude = 0.0f;      ///< Scalar per stack
    float modifierScale = 1.0f;  ///< Factor on map modifiers per stack
    uint64_t sequence = 0;       ///< Application order on the engine
};

/// Component owning a target's active effects.
struct EffectHolder {
    std::vector<ActiveEffect> effects;
};

/// Read-only view returned by queries.
struct ActiveEffectView {
    ActiveEffectId id;
    EffectId effect;
    std::string name;
    ecs::Entity source;
    ActiveEffectState state = ActiveEffectState::Active;
    int32_t stacks = 0;
    float magnitude = 0.0f;
    SimTime remaining = kNeverExpires;
};

// ── Application ─────────────────────────────────────────────────────────

/// Per-application parameters.
struct EffectContext {
    bool isPvp = false;
    /// Replaces scalar + effect scaling + bonus when set.
    std::optional<float> magnitudeOverride;
    /// Added to the scalar value (e.g. skill scaling).
    float bonusMagnitude = 0.0f;
    /// Applied to scalar magnitude and to modifier values.
    float powerMultiplier = 1.0f;
};

/// Successful application.
struct ApplyOutcome {
    ActiveEffectId id;  ///< Invalid when nothing is tracked
    ApplyStatus status = ApplyStatus::Applied;
    int32_t stacks = 0;
    float magnitude = 0.0f;  ///< Computed magnitude of this application
    float amount = 0.0f;     ///< Health change resolved now (damage negative)
    std::optional<DamageResult> damage;
};

/// One application attempted on behalf of a proc or skill.
struct EffectApplicationResult {
    EffectId effect;
    ecs::Entity target;
    ProcId proc;
    foundation::GameResult<ApplyOutcome> result;
};

/// Engine counters.
struct EffectStats {
    uint64_t applied = 0;
    uint64_t stacked = 0;
    uint64_t replaced = 0;
    uint64_t merged = 0;
    uint64_t ignored = 0;
    uint64_t removed = 0;
    uint64_t expired = 0;
    uint64_t rejected = 0;
    uint64_t ticks = 0;
};

} // namespace evolve::game
