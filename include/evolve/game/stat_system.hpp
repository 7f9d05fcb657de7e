#pragma once

/// @file stat_system.hpp
/// @brief Derived-stat computation and the per-entity stat cache.

#include <cstdint>
#include <functional>
#include <span>
#include <unordered_map>
#include <vector>

#include "evolve/ecs/entity.hpp"
#include "evolve/foundation/game_result.hpp"
#include "evolve/game/stat_types.hpp"
#include "evolve/game/world.hpp"

namespace evolve::game {

/// Compute derived stats from base attributes and modifiers.
///
/// Order: additive then multiplicative attribute modifiers, base formulas
/// over the modified attributes, additive then multiplicative stat
/// modifiers. Percentage stats are clamped to [0,1]; every other stat to
/// >= 0. Modified attributes are floored at 0.
///
/// Pure: identical inputs always produce identical outputs.
///
/// @return The stats, or InvalidAttribute when any base attribute or the
///         level is negative or not finite.
[[nodiscard]] foundation::GameResult<DerivedStatSet> computeDerivedStats(
    const AttributeSet& attributes,
    std::span<const Modifier> modifiers,
    const StatFormulas& formulas = {});

/// Attributes after attribute modifiers, as seen by the formulas.
[[nodiscard]] AttributeSet applyAttributeModifiers(const AttributeSet& attributes,
                                                   std::span<const Modifier> modifiers);

/// Per-entity cache of derived stats.
///
/// Modifiers come from the world's equipment plus any registered modifier
/// sources (active effects). Owners of those inputs call Invalidate() when
/// they change; Get() recomputes an invalid entry before returning it.
class StatCache {
public:
    /// Appends the modifiers a source contributes for an entity.
    using ModifierSource = std::function<void(ecs::Entity, std::vector<Modifier>&)>;

    explicit StatCache(const IWorldView& world, StatFormulas formulas = {});

    StatCache(const StatCache&) = delete;
    StatCache& operator=(const StatCache&) = delete;

    void AddModifierSource(ModifierSource source);

    /// Current stats, recomputed when the entry is missing or invalid.
    /// @return The stats, EntityNotFound, or InvalidAttribute.
    [[nodiscard]] foundation::GameResult<DerivedStatSet> Get(ecs::Entity entity);

    /// Current attributes with modifiers applied.
    [[nodiscard]] foundation::GameResult<AttributeSet> EffectiveAttributes(ecs::Entity entity);

    /// Cached stats without recomputation.
    /// @pre IsValid(entity). Reading an invalid entry is a programming error.
    [[nodiscard]] const DerivedStatSet& Cached(ecs::Entity entity) const;

    [[nodiscard]] bool IsValid(ecs::Entity entity) const;

    void Invalidate(ecs::Entity entity);
    void InvalidateAll();

    /// Drop the entry entirely (entity despawned).
    void Forget(ecs::Entity entity);

    /// Number of full recomputations performed.
    [[nodiscard]] uint64_t ComputeCount() const noexcept { return computeCount_; }

    [[nodiscard]] const StatFormulas& Formulas() const noexcept { return formulas_; }

private:
    struct Entry {
        DerivedStatSet stats;
        AttributeSet effective;
        bool valid = false;
    };

    foundation::GameResult<Entry*> refresh(ecs::Entity entity);

    const IWorldView& world_;
    StatFormulas formulas_;
    std::vector<ModifierSource> sources_;
    std::unordered_map<ecs::Entity, Entry> entries_;
    uint64_t computeCount_ = 0;
};

} // namespace evolve::game
