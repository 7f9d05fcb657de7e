#pragma once

/// @file stat_types.hpp
/// @brief Attribute and derived-stat schema, modifiers, scaling and the
///        base formula table.

#include <array>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "evolve/foundation/game_result.hpp"

namespace evolve::game {

// ── Attributes ──────────────────────────────────────────────────────────

/// Base attributes carried by every combatant.
enum class Attribute : uint8_t {
    Strength,
    Agility,
    Intelligence,
    Constitution,
    Wisdom,
    Charisma,
    Luck
};

inline constexpr std::size_t kAttributeCount = 7;

// ── Derived stats ───────────────────────────────────────────────────────

/// Stats computed from attributes and modifiers.
enum class DerivedStat : uint8_t {
    MaxHealth,
    MaxMana,
    MaxStamina,
    PhysicalDamage,
    MagicalDamage,
    Defense,
    MagicResistance,   ///< Fraction in [0,1]
    AttackSpeed,
    CritChance,        ///< Fraction in [0,1]
    CritMultiplier,
    DodgeChance,       ///< Fraction in [0,1]
    BlockChance,       ///< Fraction in [0,1]
    HealthRegen,
    ManaRegen,
    StaminaRegen,
    MovementSpeed,
    Toughness,         ///< Stagger needed to stun
    ToughnessRecovery  ///< Stagger removed per second
};

inline constexpr std::size_t kDerivedStatCount = 18;

[[nodiscard]] std::string_view attributeName(Attribute attr);
[[nodiscard]] std::string_view derivedStatName(DerivedStat stat);

/// Parse a lowercase attribute key ("strength").
/// @return The attribute or UnknownStatKey.
[[nodiscard]] foundation::GameResult<Attribute> parseAttribute(std::string_view key);

/// Parse a lowercase derived stat key ("crit_chance").
/// @return The stat or UnknownStatKey.
[[nodiscard]] foundation::GameResult<DerivedStat> parseDerivedStat(std::string_view key);

/// True for stats clamped to [0,1].
[[nodiscard]] constexpr bool isPercentageStat(DerivedStat stat) noexcept {
    switch (stat) {
        case DerivedStat::MagicResistance:
        case DerivedStat::CritChance:
        case DerivedStat::DodgeChance:
        case DerivedStat::BlockChance:
            return true;
        default:
            return false;
    }
}

/// True for the resource maxima (health, mana, stamina).
[[nodiscard]] constexpr bool isResourceMaximum(DerivedStat stat) noexcept {
    return stat == DerivedStat::MaxHealth || stat == DerivedStat::MaxMana ||
           stat == DerivedStat::MaxStamina;
}

// ── Value sets ──────────────────────────────────────────────────────────

/// Base attribute values plus character level.
struct AttributeSet {
    std::array<float, kAttributeCount> values{};
    int32_t level = 1;

    [[nodiscard]] float Get(Attribute attr) const noexcept {
        return values[static_cast<std::size_t>(attr)];
    }

    void Set(Attribute attr, float value) noexcept {
        values[static_cast<std::size_t>(attr)] = value;
    }

    /// Build from named values. "level" sets the level; any other key must
    /// name an attribute.
    /// @return The set, or UnknownStatKey for an unrecognized key.
    [[nodiscard]] static foundation::GameResult<AttributeSet> fromMap(
        const std::map<std::string, float>& named);

    bool operator==(const AttributeSet&) const = default;
};

/// Computed derived stats.
struct DerivedStatSet {
    std::array<float, kDerivedStatCount> values{};

    [[nodiscard]] float Get(DerivedStat stat) const noexcept {
        return values[static_cast<std::size_t>(stat)];
    }

    void Set(DerivedStat stat, float value) noexcept {
        values[static_cast<std::size_t>(stat)] = value;
    }

    bool operator==(const DerivedStatSet&) const = default;
};

// ── Modifiers ───────────────────────────────────────────────────────────

enum class ModifierOp : uint8_t {
    Additive,       ///< Adds value.
    Multiplicative  ///< Adds value as a fraction: x * (1 + sum of values).
};

/// A change to one attribute or derived stat from equipment or an effect.
struct Modifier {
    std::variant<Attribute, DerivedStat> target = DerivedStat::MaxHealth;
    ModifierOp op = ModifierOp::Additive;
    float value = 0.0f;
    std::string source;

    [[nodiscard]] static Modifier attribute(Attribute attr, float value,
                                            ModifierOp op = ModifierOp::Additive,
                                            std::string source = {}) {
        return Modifier{attr, op, value, std::move(source)};
    }

    [[nodiscard]] static Modifier stat(DerivedStat stat, float value,
                                       ModifierOp op = ModifierOp::Additive,
                                       std::string source = {}) {
        return Modifier{stat, op, value, std::move(source)};
    }
};

// ── Scaling ─────────────────────────────────────────────────────────────

/// Linear coefficients over attributes and derived stats, used by skills
/// and effects to scale their magnitude with the caster.
struct Scaling {
    std::array<float, kAttributeCount> attribute{};
    std::array<float, kDerivedStatCount> stat{};

    Scaling& with(Attribute attr, float coefficient) {
        attribute[static_cast<std::size_t>(attr)] = coefficient;
        return *this;
    }

    Scaling& with(DerivedStat s, float coefficient) {
        stat[static_cast<std::size_t>(s)] = coefficient;
        return *this;
    }

    /// Sum of coefficient x value over every attribute and stat.
    [[nodiscard]] float Evaluate(const AttributeSet& attrs,
                                 const DerivedStatSet& stats) const noexcept;

    [[nodiscard]] bool IsZero() const noexcept;
};

// ── Formulas ────────────────────────────────────────────────────────────

/// One base formula: base + sum(perAttribute[a] * a) + perLevel * level.
struct StatFormula {
    float base = 0.0f;
    std::array<float, kAttributeCount> perAttribute{};
    float perLevel = 0.0f;
};

/// Base formula for every derived stat.
///
/// Defaults pin max_health = constitution x 10 + level x 5, so
/// constitution 10 at level 1 yields 105.
struct StatFormulas {
    std::array<StatFormula, kDerivedStatCount> formulas = defaults();

    [[nodiscard]] StatFormula& operator[](DerivedStat stat) noexcept {
        return formulas[static_cast<std::size_t>(stat)];
    }
    [[nodiscard]] const StatFormula& operator[](DerivedStat stat) const noexcept {
        return formulas[static_cast<std::size_t>(stat)];
    }

    [[nodiscard]] static std::array<StatFormula, kDerivedStatCount> defaults();
};

} // namespace evolve::game
