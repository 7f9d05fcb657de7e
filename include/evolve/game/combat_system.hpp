#pragma once

/// @file combat_system.hpp
/// @brief Damage, healing and stagger resolution against entity vitals.

#include <optional>
#include <string_view>

#include "evolve/ecs/component_storage.hpp"
#include "evolve/ecs/entity.hpp"
#include "evolve/ecs/system.hpp"
#include "evolve/foundation/game_result.hpp"
#include "evolve/game/combat_types.hpp"
#include "evolve/game/game_events.hpp"
#include "evolve/game/random_source.hpp"
#include "evolve/game/stat_system.hpp"
#include "evolve/game/world.hpp"

namespace evolve::game {

/// Resolves attacks and direct resource changes, and runs stun timers and
/// stagger recovery each tick.
///
/// Damage pipeline for ResolveAttack():
///   dodge roll -> crit roll -> block roll (physical only) -> mitigation
///   -> health -> stagger/stun -> death.
/// Each roll draws one value from the random source and is skipped when
/// the relevant chance is zero or the request disallows it.
///
/// Mitigation: physical damage is reduced by defense / (defense + C);
/// every other type by the magic resistance fraction.
class CombatSystem final : public ecs::ISystem {
public:
    CombatSystem(ecs::ComponentStorage<Vitals>& vitals,
                 StatCache& stats,
                 IWorldView& world,
                 IRandomSource& random,
                 GameEvents& events,
                 CombatTuning tuning = {});

    void Execute(float deltaTime) override;

    [[nodiscard]] ecs::SystemStage GetStage() const override {
        return ecs::SystemStage::Update;
    }

    [[nodiscard]] std::string_view GetName() const override {
        return "CombatSystem";
    }

    /// Resolve one attack from @p attacker against @p defender.
    ///
    /// @p attacker may be invalid for environmental damage; it then never
    /// crits.
    /// @return The result, or EntityNotFound, CapabilityMissing (no
    ///         vitals), TargetAlreadyDead, InvalidArgument (negative
    ///         magnitude).
    [[nodiscard]] foundation::GameResult<DamageResult> ResolveAttack(
        ecs::Entity attacker, ecs::Entity defender, const AttackRequest& request);

    /// Apply damage without rolls or stagger (periodic effects).
    ///
    /// @p type selects the mitigation; nullopt deals unmitigated damage.
    [[nodiscard]] foundation::GameResult<DamageResult> ApplyDirectDamage(
        ecs::Entity source, ecs::Entity target, float amount,
        std::optional<DamageType> type = std::nullopt);

    /// Restore health, clamped to the maximum.
    /// @return Health actually restored.
    [[nodiscard]] foundation::GameResult<float> ApplyHealing(
        ecs::Entity source, ecs::Entity target, float amount);

    /// Add @p amount (negative drains) to a resource pool.
    /// Health routes through ApplyHealing / ApplyDirectDamage.
    /// @return Signed change actually applied.
    [[nodiscard]] foundation::GameResult<float> AdjustResource(
        ecs::Entity source, ecs::Entity target, ResourceKind kind, float amount);

    /// Re-read resource maxima from the stat cache.
    foundation::GameResult<void> SyncVitals(ecs::Entity entity);

    /// Damage fraction removed by @p stats for @p type.
    [[nodiscard]] float Mitigation(const DerivedStatSet& stats, DamageType type) const noexcept;

    [[nodiscard]] const CombatTuning& Tuning() const noexcept { return tuning_; }

private:
    foundation::GameResult<Vitals*> requireVitals(ecs::Entity entity);
    void applyDamage(ecs::Entity attacker, ecs::Entity defender, DamageType type,
                     DamageResult& result, float toughness = 0.0f,
                     float staggerScale = 0.0f);

    ecs::ComponentStorage<Vitals>& vitals_;
    StatCache& stats_;
    IWorldView& world_;
    IRandomSource& random_;
    GameEvents& events_;
    CombatTuning tuning_;
};

} // namespace evolve::game
