/// @file stat_system.cpp
/// @brief computeDerivedStats and StatCache implementation.

#include "evolve/game/stat_system.hpp"

#include "evolve/foundation/game_logger.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>

namespace evolve::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

/// Sum additive and multiplicative modifier values per slot.
template <typename Key, std::size_t N>
void collect(std::span<const Modifier> modifiers,
             std::array<float, N>& additive,
             std::array<float, N>& multiplicative) {
    for (const auto& mod : modifiers) {
        const auto* key = std::get_if<Key>(&mod.target);
        if (key == nullptr) {
            continue;
        }
        auto idx = static_cast<std::size_t>(*key);
        if (mod.op == ModifierOp::Additive) {
            additive[idx] += mod.value;
        } else {
            multiplicative[idx] += mod.value;
        }
    }
}

} // namespace

AttributeSet applyAttributeModifiers(const AttributeSet& attributes,
                                     std::span<const Modifier> modifiers) {
    std::array<float, kAttributeCount> additive{};
    std::array<float, kAttributeCount> multiplicative{};
    collect<Attribute>(modifiers, additive, multiplicative);

    AttributeSet effective = attributes;
    for (std::size_t i = 0; i < kAttributeCount; ++i) {
        float value = (attributes.values[i] + additive[i]) * (1.0f + multiplicative[i]);
        effective.values[i] = std::max(value, 0.0f);
    }
    return effective;
}

GameResult<DerivedStatSet> computeDerivedStats(const AttributeSet& attributes,
                                               std::span<const Modifier> modifiers,
                                               const StatFormulas& formulas) {
    if (attributes.level < 0) {
        return GameResult<DerivedStatSet>::err(GameError(
            ErrorCode::InvalidAttribute, "level must be non-negative"));
    }
    for (std::size_t i = 0; i < kAttributeCount; ++i) {
        float value = attributes.values[i];
        if (!std::isfinite(value) || value < 0.0f) {
            return GameResult<DerivedStatSet>::err(GameError(
                ErrorCode::InvalidAttribute,
                std::string("attribute ") +
                    std::string(attributeName(static_cast<Attribute>(i))) +
                    " must be a non-negative number"));
        }
    }

    const AttributeSet effective = applyAttributeModifiers(attributes, modifiers);

    std::array<float, kDerivedStatCount> additive{};
    std::array<float, kDerivedStatCount> multiplicative{};
    collect<DerivedStat>(modifiers, additive, multiplicative);

    DerivedStatSet result;
    for (std::size_t s = 0; s < kDerivedStatCount; ++s) {
        const auto& f = formulas.formulas[s];
        float value = f.base + f.perLevel * static_cast<float>(effective.level);
        for (std::size_t a = 0; a < kAttributeCount; ++a) {
            value += f.perAttribute[a] * effective.values[a];
        }
        value = (value + additive[s]) * (1.0f + multiplicative[s]);

        const auto stat = static_cast<DerivedStat>(s);
        value = std::max(value, 0.0f);
        if (isPercentageStat(stat)) {
            value = std::min(value, 1.0f);
        }
        result.values[s] = value;
    }
    return GameResult<DerivedStatSet>::ok(result);
}

// ── StatCache ───────────────────────────────────────────────────────────

StatCache::StatCache(const IWorldView& world, StatFormulas formulas)
    : world_(world), formulas_(std::move(formulas)) {}

void StatCache::AddModifierSource(ModifierSource source) {
    sources_.push_back(std::move(source));
    InvalidateAll();
}

GameResult<StatCache::Entry*> StatCache::refresh(ecs::Entity entity) {
    auto it = entries_.find(entity);
    if (it != entries_.end() && it->second.valid) {
        return GameResult<Entry*>::ok(&it->second);
    }

    auto attributes = world_.GetAttributes(entity);
    if (!attributes) {
        return GameResult<Entry*>::err(attributes.error());
    }

    std::vector<Modifier> modifiers = world_.GetEquipmentModifiers(entity);
    for (const auto& source : sources_) {
        source(entity, modifiers);
    }

    auto stats = computeDerivedStats(attributes.value(), modifiers, formulas_);
    if (!stats) {
        EVOLVE_LOG_FAILURE(LogCategory::Stats,
                           "stats of entity " + std::to_string(entity.id()), stats.error());
        return GameResult<Entry*>::err(stats.error());
    }

    auto& entry = entries_[entity];
    entry.stats = stats.value();
    entry.effective = applyAttributeModifiers(attributes.value(), modifiers);
    entry.valid = true;
    ++computeCount_;
    return GameResult<Entry*>::ok(&entry);
}

GameResult<DerivedStatSet> StatCache::Get(ecs::Entity entity) {
    auto entry = refresh(entity);
    if (!entry) {
        return GameResult<DerivedStatSet>::err(entry.error());
    }
    return GameResult<DerivedStatSet>::ok(entry.value()->stats);
}

GameResult<AttributeSet> StatCache::EffectiveAttributes(ecs::Entity entity) {
    auto entry = refresh(entity);
    if (!entry) {
        return GameResult<AttributeSet>::err(entry.error());
    }
    return GameResult<AttributeSet>::ok(entry.value()->effective);
}

const DerivedStatSet& StatCache::Cached(ecs::Entity entity) const {
    auto it = entries_.find(entity);
    assert(it != entries_.end() && it->second.valid && "stat cache read before compute");
    return it->second.stats;
}

bool StatCache::IsValid(ecs::Entity entity) const {
    auto it = entries_.find(entity);
    return it != entries_.end() && it->second.valid;
}

void StatCache::Invalidate(ecs::Entity entity) {
    auto it = entries_.find(entity);
    if (it != entries_.end()) {
        it->second.valid = false;
    }
}

void StatCache::InvalidateAll() {
    for (auto& [entity, entry] : entries_) {
        entry.valid = false;
    }
}

void StatCache::Forget(ecs::Entity entity) {
    entries_.erase(entity);
}

} // namespace evolve::game
