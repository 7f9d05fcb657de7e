#pragma once

/// @file combat_types.hpp
/// @brief Combat enumerations, components and damage pipeline types.

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "evolve/game/stat_types.hpp"

namespace evolve::game {

/// Damage type classification for mitigation.
enum class DamageType : uint8_t {
    Physical,  ///< Mitigated by defense, can be blocked.
    Magic,     ///< Mitigated by magic resistance.
    Fire,
    Frost,
    Nature,
    Shadow,
    Holy
};

inline constexpr std::size_t kDamageTypeCount = 7;

[[nodiscard]] std::string_view damageTypeName(DamageType type);

/// Resource pools a cost or an effect can touch.
enum class ResourceKind : uint8_t {
    Health,
    Mana,
    Stamina
};

// ── Components ──────────────────────────────────────────────────────────

/// Current resources and stagger state of a combatant.
///
/// Maxima mirror the derived stats; setters clamp to [0, max].
struct Vitals {
    float health = 0.0f;
    float maxHealth = 0.0f;
    float mana = 0.0f;
    float maxMana = 0.0f;
    float stamina = 0.0f;
    float maxStamina = 0.0f;
    float stagger = 0.0f;        ///< Accumulated stagger damage.
    float stunRemaining = 0.0f;  ///< Seconds of stun left.

    [[nodiscard]] bool IsAlive() const noexcept { return health > 0.0f; }
    [[nodiscard]] bool IsStunned() const noexcept { return stunRemaining > 0.0f; }

    void SetHealth(float value) noexcept { health = std::clamp(value, 0.0f, maxHealth); }
    void SetMana(float value) noexcept { mana = std::clamp(value, 0.0f, maxMana); }
    void SetStamina(float value) noexcept { stamina = std::clamp(value, 0.0f, maxStamina); }

    [[nodiscard]] float Get(ResourceKind kind) const noexcept {
        switch (kind) {
            case ResourceKind::Health:  return health;
            case ResourceKind::Mana:    return mana;
            case ResourceKind::Stamina: return stamina;
        }
        return 0.0f;
    }

    void Set(ResourceKind kind, float value) noexcept {
        switch (kind) {
            case ResourceKind::Health:  SetHealth(value); break;
            case ResourceKind::Mana:    SetMana(value); break;
            case ResourceKind::Stamina: SetStamina(value); break;
        }
    }

    [[nodiscard]] float HealthRatio() const noexcept {
        return maxHealth > 0.0f ? health / maxHealth : 0.0f;
    }
    [[nodiscard]] float ManaRatio() const noexcept {
        return maxMana > 0.0f ? mana / maxMana : 0.0f;
    }

    /// Adopt new maxima from derived stats; current values are clamped.
    void RefreshMaxima(const DerivedStatSet& stats) noexcept {
        maxHealth = stats.Get(DerivedStat::MaxHealth);
        maxMana = stats.Get(DerivedStat::MaxMana);
        maxStamina = stats.Get(DerivedStat::MaxStamina);
        SetHealth(health);
        SetMana(mana);
        SetStamina(stamina);
    }

    /// Vitals at full resources for the given stats.
    [[nodiscard]] static Vitals Full(const DerivedStatSet& stats) noexcept {
        Vitals v;
        v.maxHealth = v.health = stats.Get(DerivedStat::MaxHealth);
        v.maxMana = v.mana = stats.Get(DerivedStat::MaxMana);
        v.maxStamina = v.stamina = stats.Get(DerivedStat::MaxStamina);
        return v;
    }
};

/// Team membership. Entities on the same team are allies.
struct Faction {
    uint32_t team = 0;
};

/// Effect tags the entity ignores.
struct Immunities {
    std::vector<std::string> tags;

    [[nodiscard]] bool Covers(const std::vector<std::string>& effectTags) const {
        return std::any_of(effectTags.begin(), effectTags.end(), [this](const std::string& t) {
            return std::find(tags.begin(), tags.end(), t) != tags.end();
        });
    }
};

// ── Damage pipeline ─────────────────────────────────────────────────────

/// Tunables for damage resolution.
struct CombatTuning {
    float defenseConstant = 100.0f;     ///< mitigation = defense / (defense + constant)
    float stunDuration = 2.0f;          ///< Seconds stunned when stagger breaks toughness
    float blockReduction = 0.5f;        ///< Fraction removed by a block
    float lowHealthThreshold = 0.3f;    ///< Health ratio for on_low_health procs
};

/// One attack to resolve.
struct AttackRequest {
    float magnitude = 0.0f;
    DamageType type = DamageType::Physical;
    bool allowCrit = true;
    bool allowBlock = true;
    bool allowDodge = true;
    bool ignoreMitigation = false;  ///< Untyped damage bypasses defense and resistance
    float staggerScale = 1.0f;  ///< Stagger added per point of final damage
};

/// Outcome of a resolved attack.
struct DamageResult {
    float rawDamage = 0.0f;
    float finalDamage = 0.0f;
    float healthAfter = 0.0f;
    bool isCrit = false;
    bool isBlocked = false;
    bool isDodged = false;
    bool isStunned = false;  ///< This hit broke the defender's toughness.
    bool isKill = false;
};

} // namespace evolve::game
