#pragma once

/// @file skill_types.hpp
/// @brief Skill and combo definitions plus per-caster runtime state.

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "evolve/ecs/entity.hpp"
#include "evolve/foundation/types.hpp"
#include "evolve/game/effect_types.hpp"
#include "evolve/game/sim_clock.hpp"
#include "evolve/game/stat_types.hpp"

namespace evolve::game {

using foundation::ComboId;
using foundation::SkillId;

// ── Definitions ─────────────────────────────────────────────────────────

enum class SkillType : uint8_t {
    Attack,
    Heal,
    Buff,
    Debuff,
    Utility,
    Movement,
    Summon
};

/// How Use() turns the requested targets into the affected set.
enum class TargetSelection : uint8_t {
    Self,         ///< The caster only
    SingleEnemy,  ///< Exactly one hostile target
    SingleAlly,   ///< Exactly one friendly target (the caster counts)
    AllEnemies,   ///< Every living hostile within max range
    AllAllies,    ///< Every living friendly within max range
    Area          ///< Hostiles within areaRadius of the first target
};

[[nodiscard]] std::string_view skillTypeName(SkillType type);

struct ResourceCost {
    float mana = 0.0f;
    float stamina = 0.0f;
    float health = 0.0f;
};

struct SkillRequirements {
    int32_t level = 0;
    std::vector<std::pair<Attribute, float>> attributes;  ///< Minimum effective values
    std::vector<EffectId> requiredEffects;                ///< Must be active on the caster
};

struct SkillRange {
    float min = 0.0f;
    float max = 0.0f;         ///< 0 = unlimited
    float areaRadius = 0.0f;  ///< Area targeting only
};

struct SkillCooldown {
    float cooldown = 0.0f;
    std::string gcdGroup;      ///< Empty = no global cooldown
    float gcd = 0.0f;
    int32_t maxCharges = 1;
    float chargeRegenTime = 0.0f;  ///< 0 = regenerate every cooldown

    [[nodiscard]] float RegenInterval() const noexcept {
        return chargeRegenTime > 0.0f ? chargeRegenTime : cooldown;
    }
};

/// Hints for the AI scorer.
struct AIPriority {
    float base = 0.5f;
    float healthThreshold = 0.3f;
    float manaThreshold = 0.2f;
    std::vector<std::string> tags;
};

/// Immutable skill definition.
struct Skill {
    SkillId id;
    std::string name;
    std::string description;
    SkillType type = SkillType::Attack;
    TargetSelection targeting = TargetSelection::SingleEnemy;
    std::vector<EffectId> effects;
    ResourceCost cost;
    SkillCooldown cooldown;
    SkillRange range;
    SkillRequirements requirements;
    Scaling scaling;
    AIPriority ai;
    bool weaponAttack = false;  ///< Fires on_hit per target
};

/// Ordered skill chain granting a growing bonus.
struct ComboDefinition {
    ComboId id;
    std::string name;
    std::vector<SkillId> chain;
    std::optional<float> window;  ///< Defaults to SkillTuning::comboWindow
    std::optional<float> bonus;   ///< Defaults to SkillTuning::comboBonus
};

struct SkillTuning {
    float comboWindow = 3.0f;
    float comboBonus = 0.2f;
};

// ── Runtime state ───────────────────────────────────────────────────────

/// A skill known by one caster.
///
/// `charges` is the count at `chargeRegenStart`; the available count at a
/// later time adds one charge per regen interval, capped at maxCharges.
struct LearnedSkill {
    SkillId skill;
    std::optional<SimTime> lastUsed;
    int32_t charges = 1;
    SimTime chargeRegenStart = 0.0;
};

struct ComboState {
    ComboId combo;
    int32_t step = 0;
    SimTime lastHit = 0.0;

    [[nodiscard]] bool Active() const noexcept { return step > 0; }
    void Reset() noexcept { *this = ComboState{}; }
};

/// Component holding a caster's skills, GCD timestamps and combo.
struct SkillBook {
    std::vector<LearnedSkill> skills;
    std::unordered_map<std::string, SimTime> gcdLastUse;
    ComboState combo;

    [[nodiscard]] LearnedSkill* Find(SkillId id) {
        auto it = std::find_if(skills.begin(), skills.end(),
                               [id](const LearnedSkill& s) { return s.skill == id; });
        return it != skills.end() ? &*it : nullptr;
    }
    [[nodiscard]] const LearnedSkill* Find(SkillId id) const {
        auto it = std::find_if(skills.begin(), skills.end(),
                               [id](const LearnedSkill& s) { return s.skill == id; });
        return it != skills.end() ? &*it : nullptr;
    }
};

// ── Use ─────────────────────────────────────────────────────────────────

/// Set by the caller to abandon a skill use before costs are paid.
class CancellationToken {
public:
    void Cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
    [[nodiscard]] bool IsCancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> cancelled_{false};
};

struct SkillContext {
    bool isPvp = false;
    const CancellationToken* cancel = nullptr;
};

/// Everything a successful Use() did.
struct SkillOutcome {
    SkillId skill;
    ecs::Entity caster;
    std::vector<ecs::Entity> targets;
    int32_t comboStep = 0;
    float multiplier = 1.0f;  ///< Combo multiplier applied to magnitudes
    std::vector<EffectApplicationResult> applications;
    std::vector<EffectApplicationResult> procs;
    float totalDamage = 0.0f;
    float totalHealing = 0.0f;
    int32_t kills = 0;
    int32_t crits = 0;

    [[nodiscard]] bool AnyApplied() const noexcept {
        return std::any_of(applications.begin(), applications.end(),
                           [](const EffectApplicationResult& r) { return r.result.hasValue(); });
    }
};

} // namespace evolve::game
