/// @file stat_types.cpp
/// @brief Stat names, key parsing, scaling and default formulas.

#include "evolve/game/stat_types.hpp"

#include <initializer_list>
#include <utility>

namespace evolve::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

namespace {

constexpr std::array<std::string_view, kAttributeCount> kAttributeNames = {
    "strength", "agility", "intelligence", "constitution", "wisdom", "charisma", "luck"
};

constexpr std::array<std::string_view, kDerivedStatCount> kDerivedStatNames = {
    "max_health",     "max_mana",        "max_stamina",   "physical_damage",
    "magical_damage", "defense",         "magic_resistance", "attack_speed",
    "crit_chance",    "crit_multiplier", "dodge_chance",  "block_chance",
    "health_regen",   "mana_regen",      "stamina_regen", "movement_speed",
    "toughness",      "toughness_recovery"
};

StatFormula formula(float base, std::initializer_list<std::pair<Attribute, float>> terms,
                    float perLevel = 0.0f) {
    StatFormula f;
    f.base = base;
    for (const auto& [attr, coefficient] : terms) {
        f.perAttribute[static_cast<std::size_t>(attr)] = coefficient;
    }
    f.perLevel = perLevel;
    return f;
}

} // namespace

std::string_view attributeName(Attribute attr) {
    auto idx = static_cast<std::size_t>(attr);
    return idx < kAttributeCount ? kAttributeNames[idx] : "unknown";
}

std::string_view derivedStatName(DerivedStat stat) {
    auto idx = static_cast<std::size_t>(stat);
    return idx < kDerivedStatCount ? kDerivedStatNames[idx] : "unknown";
}

GameResult<Attribute> parseAttribute(std::string_view key) {
    for (std::size_t i = 0; i < kAttributeCount; ++i) {
        if (kAttributeNames[i] == key) {
            return GameResult<Attribute>::ok(static_cast<Attribute>(i));
        }
    }
    return GameResult<Attribute>::err(
        GameError(ErrorCode::UnknownStatKey, "unknown attribute: " + std::string(key)));
}

GameResult<DerivedStat> parseDerivedStat(std::string_view key) {
    for (std::size_t i = 0; i < kDerivedStatCount; ++i) {
        if (kDerivedStatNames[i] == key) {
            return GameResult<DerivedStat>::ok(static_cast<DerivedStat>(i));
        }
    }
    return GameResult<DerivedStat>::err(
        GameError(ErrorCode::UnknownStatKey, "unknown derived stat: " + std::string(key)));
}

GameResult<AttributeSet> AttributeSet::fromMap(const std::map<std::string, float>& named) {
    AttributeSet set;
    for (const auto& [key, value] : named) {
        if (key == "level") {
            set.level = static_cast<int32_t>(value);
            continue;
        }
        auto attr = parseAttribute(key);
        if (!attr) {
            return GameResult<AttributeSet>::err(attr.error());
        }
        set.Set(attr.value(), value);
    }
    return GameResult<AttributeSet>::ok(set);
}

float Scaling::Evaluate(const AttributeSet& attrs, const DerivedStatSet& stats) const noexcept {
    float total = 0.0f;
    for (std::size_t i = 0; i < kAttributeCount; ++i) {
        total += attribute[i] * attrs.values[i];
    }
    for (std::size_t i = 0; i < kDerivedStatCount; ++i) {
        total += stat[i] * stats.values[i];
    }
    return total;
}

bool Scaling::IsZero() const noexcept {
    for (float c : attribute) {
        if (c != 0.0f) return false;
    }
    for (float c : stat) {
        if (c != 0.0f) return false;
    }
    return true;
}

std::array<StatFormula, kDerivedStatCount> StatFormulas::defaults() {
    using A = Attribute;
    std::array<StatFormula, kDerivedStatCount> f{};
    auto set = [&f](DerivedStat stat, StatFormula value) {
        f[static_cast<std::size_t>(stat)] = value;
    };

    set(DerivedStat::MaxHealth,         formula(0.0f, {{A::Constitution, 10.0f}}, 5.0f));
    set(DerivedStat::MaxMana,           formula(50.0f, {{A::Intelligence, 8.0f}, {A::Wisdom, 4.0f}}));
    set(DerivedStat::MaxStamina,        formula(100.0f, {{A::Constitution, 3.0f}, {A::Agility, 5.0f}}));
    set(DerivedStat::PhysicalDamage,    formula(10.0f, {{A::Strength, 2.0f}, {A::Agility, 1.0f}}));
    set(DerivedStat::MagicalDamage,     formula(5.0f, {{A::Intelligence, 3.0f}, {A::Wisdom, 1.0f}}));
    set(DerivedStat::Defense,           formula(5.0f, {{A::Constitution, 1.0f}, {A::Strength, 0.5f}}));
    set(DerivedStat::MagicResistance,   formula(0.0f, {{A::Wisdom, 0.02f}, {A::Intelligence, 0.01f}}));
    set(DerivedStat::AttackSpeed,       formula(1.0f, {{A::Agility, 0.05f}, {A::Strength, 0.02f}}));
    set(DerivedStat::CritChance,        formula(0.05f, {{A::Agility, 0.01f}, {A::Luck, 0.02f}}));
    set(DerivedStat::CritMultiplier,    formula(1.5f, {{A::Strength, 0.05f}, {A::Agility, 0.03f}}));
    set(DerivedStat::DodgeChance,       formula(0.05f, {{A::Agility, 0.015f}, {A::Luck, 0.01f}}));
    set(DerivedStat::BlockChance,       formula(0.05f, {{A::Strength, 0.01f}, {A::Constitution, 0.01f}}));
    set(DerivedStat::HealthRegen,       formula(1.0f, {{A::Constitution, 0.5f}}));
    set(DerivedStat::ManaRegen,         formula(2.0f, {{A::Intelligence, 0.4f}, {A::Wisdom, 0.3f}}));
    set(DerivedStat::StaminaRegen,      formula(3.0f, {{A::Constitution, 0.2f}, {A::Agility, 0.6f}}));
    set(DerivedStat::MovementSpeed,     formula(1.0f, {{A::Agility, 0.03f}}));
    set(DerivedStat::Toughness,         formula(100.0f, {{A::Constitution, 8.0f}}));
    set(DerivedStat::ToughnessRecovery, formula(10.0f, {{A::Constitution, 0.4f}}));
    return f;
}

} // namespace evolve::game
