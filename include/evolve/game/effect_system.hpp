#pragma once

/// @file effect_system.hpp
/// @brief Effect application, conflict resolution, periodic ticks and
///        expiry.

#include <cstdint>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "evolve/ecs/component_storage.hpp"
#include "evolve/ecs/entity.hpp"
#include "evolve/ecs/system.hpp"
#include "evolve/foundation/game_result.hpp"
#include "evolve/game/catalog.hpp"
#include "evolve/game/combat_system.hpp"
#include "evolve/game/effect_types.hpp"
#include "evolve/game/game_events.hpp"
#include "evolve/game/sim_clock.hpp"
#include "evolve/game/stat_system.hpp"
#include "evolve/game/world.hpp"

namespace evolve::game {

using EffectCatalog = Catalog<Effect, EffectId>;

/// Applies effect templates to targets and advances live effects.
///
/// Application pipeline (Apply):
///   1. Validation: template and target exist, target type matches the
///      source's faction relation, target is not immune, target has the
///      capability the effect mutates and is alive.
///   2. Magnitude: scalar + effect scaling over the source + bonus, times
///      balance and power multipliers.
///   3. Instant and Trigger categories resolve at once (status Resolved).
///   4. Tracked categories resolve cancellation-tag conflicts, then stack,
///      or apply the template's conflict policy at the stack limit.
///
/// Stat-map effects feed the StatCache as a modifier source; any change to
/// them invalidates the target's cache entry.
class EffectSystem final : public ecs::ISystem {
public:
    EffectSystem(EffectCatalog& catalog,
                 ecs::ComponentStorage<EffectHolder>& holders,
                 ecs::ComponentStorage<Vitals>& vitals,
                 ecs::ComponentStorage<Faction>& factions,
                 ecs::ComponentStorage<Immunities>& immunities,
                 StatCache& stats,
                 IWorldView& world,
                 CombatSystem& combat,
                 const SimClock& clock,
                 GameEvents& events);

    EffectSystem(const EffectSystem&) = delete;
    EffectSystem& operator=(const EffectSystem&) = delete;

    /// Advance periodic ticks and expire effects.
    void Execute(float deltaTime) override;

    [[nodiscard]] ecs::SystemStage GetStage() const override {
        return ecs::SystemStage::PreUpdate;
    }

    [[nodiscard]] std::string_view GetName() const override {
        return "EffectSystem";
    }

    /// Validate and store a template.
    /// @return The id, InvalidArgument, UnknownEffect (missing child) or
    ///         AlreadyExists.
    foundation::GameResult<EffectId> Register(Effect effect);

    /// Apply effect @p id from @p source to @p target.
    ///
    /// @p source may be invalid for sourceless effects; faction checks and
    /// source scaling are then skipped.
    foundation::GameResult<ApplyOutcome> Apply(EffectId id,
                                               ecs::Entity source,
                                               ecs::Entity target,
                                               const EffectContext& context = {});

    /// @return EffectNotFound when no live instance has @p id.
    foundation::GameResult<void> Remove(ActiveEffectId id);

    /// Remove every effect on @p target. @return Number removed.
    std::size_t RemoveAll(ecs::Entity target);

    /// Remove effects on @p target whose template carries @p tag.
    std::size_t Dispel(ecs::Entity target, std::string_view tag);

    [[nodiscard]] std::vector<ActiveEffectView> Query(ecs::Entity target) const;
    [[nodiscard]] const ActiveEffect* Find(ActiveEffectId id) const;
    [[nodiscard]] bool HasEffect(ecs::Entity target, EffectId effect) const;

    /// Append the stat modifiers contributed by @p target's effects.
    void CollectModifiers(ecs::Entity target, std::vector<Modifier>& out) const;

    [[nodiscard]] const EffectCatalog& Templates() const noexcept { return catalog_; }
    [[nodiscard]] const EffectStats& Stats() const noexcept { return stats_; }

private:
    foundation::GameResult<ApplyOutcome> applyImpl(EffectId id, ecs::Entity source,
                                                   ecs::Entity target,
                                                   const EffectContext& context);
    foundation::GameResult<void> validate(const Effect& effect) const;
    foundation::GameResult<void> checkTarget(const Effect& effect, ecs::Entity source,
                                             ecs::Entity target) const;
    foundation::GameResult<float> computeMagnitude(const Effect& effect, ecs::Entity source,
                                                   const EffectContext& context, float& scale);

    foundation::GameResult<ApplyOutcome> applyCombination(const Effect& effect,
                                                          ecs::Entity source,
                                                          ecs::Entity target,
                                                          const EffectContext& context);
    foundation::GameResult<ApplyOutcome> applyTracked(const Effect& effect,
                                                      ecs::Entity source,
                                                      ecs::Entity target,
                                                      float magnitude, float scale);

    /// Resolve a scalar magnitude against the target's vitals now.
    /// @p periodic selects the tick path (no rolls, no stagger).
    foundation::GameResult<void> resolveScalar(const Effect& effect, ecs::Entity source,
                                               ecs::Entity target, float magnitude,
                                               bool periodic, ApplyOutcome& outcome);

    ActiveEffect& install(EffectHolder& holder, const Effect& effect, ecs::Entity source,
                          ecs::Entity target, float magnitude, float scale);
    void evict(ActiveEffect& active, ActiveEffectState reason);
    void sweep(ecs::Entity target);
    void modifiersChanged(ecs::Entity target);
    void tickEffect(ecs::Entity target, ActiveEffectId id, SimTime now);
    void publishApplied(const Effect& effect, ecs::Entity source, ecs::Entity target,
                        const ApplyOutcome& outcome);

    [[nodiscard]] ActiveEffect* findLive(ecs::Entity target, ActiveEffectId id);
    [[nodiscard]] SimTime expiryFor(const Effect& effect, SimTime now) const noexcept;

    EffectCatalog& catalog_;
    ecs::ComponentStorage<EffectHolder>& holders_;
    ecs::ComponentStorage<Vitals>& vitals_;
    ecs::ComponentStorage<Faction>& factions_;
    ecs::ComponentStorage<Immunities>& immunities_;
    StatCache& statCache_;
    IWorldView& world_;
    CombatSystem& combat_;
    const SimClock& clock_;
    GameEvents& events_;

    std::unordered_map<ActiveEffectId, ecs::Entity> owners_;
    uint64_t nextId_ = 1;
    uint64_t nextSequence_ = 1;
    EffectStats stats_;
};

} // namespace evolve::game
