#pragma once

/// @file trigger_system.hpp
/// @brief Proc registry, gated firing and scheduled (delayed/chained)
///        proc effects.

#include <cstdint>
#include <map>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "evolve/ecs/entity.hpp"
#include "evolve/ecs/system.hpp"
#include "evolve/foundation/game_result.hpp"
#include "evolve/game/effect_system.hpp"
#include "evolve/game/random_source.hpp"
#include "evolve/game/sim_clock.hpp"
#include "evolve/game/trigger_types.hpp"

namespace evolve::game {

/// Maps trigger conditions to registered procs.
///
/// Fire() visits every proc bound to the condition in registration order
/// and gates each one: owner, extra conditions, cooldown since the last
/// proc for this source, proc limit, then the chance roll. Each gated proc
/// reports its failure code in the returned list; a failure never blocks
/// the procs after it.
///
/// Delayed main effects and chain effects are queued and applied by
/// Execute() once the clock reaches their due time.
class TriggerSystem final : public ecs::ISystem {
public:
    TriggerSystem(EffectSystem& effects, IRandomSource& random, const SimClock& clock);

    TriggerSystem(const TriggerSystem&) = delete;
    TriggerSystem& operator=(const TriggerSystem&) = delete;

    /// Apply scheduled proc effects that are due.
    void Execute(float deltaTime) override;

    [[nodiscard]] ecs::SystemStage GetStage() const override {
        return ecs::SystemStage::PreUpdate;
    }

    [[nodiscard]] std::string_view GetName() const override {
        return "TriggerSystem";
    }

    /// Bind @p special to @p condition.
    ///
    /// @param owner  When valid, the proc only fires for this source
    ///               (weapon or passive of one entity).
    /// @return The proc id, UnknownEffect or InvalidArgument.
    foundation::GameResult<ProcId> RegisterProc(TriggerCondition condition,
                                                SpecialEffect special,
                                                ecs::Entity owner = ecs::Entity::invalid());

    /// @return ProcNotFound for an unknown id.
    foundation::GameResult<void> UnregisterProc(ProcId id);

    /// Drop everything tied to a despawned entity: procs it owns, its
    /// per-source proc state, and scheduled effects aimed at it. Scheduled
    /// effects it cast on others still land.
    void Forget(ecs::Entity entity);

    /// Fire @p condition for @p source acting on @p target.
    [[nodiscard]] std::vector<EffectApplicationResult> Fire(TriggerCondition condition,
                                                            ecs::Entity source,
                                                            ecs::Entity target,
                                                            const TriggerContext& context = {});

    /// Applications made by the last Execute().
    [[nodiscard]] const std::vector<EffectApplicationResult>& LastTickResults() const noexcept {
        return lastTick_;
    }

    [[nodiscard]] std::size_t ProcCount() const noexcept { return bindings_.size(); }

    /// Successful procs of @p id across all sources.
    [[nodiscard]] int32_t TriggerCount(ProcId id) const;

    [[nodiscard]] std::optional<ProcState> State(ProcId id, ecs::Entity source) const;

    [[nodiscard]] std::size_t PendingCount() const noexcept { return pending_.size(); }

    [[nodiscard]] const TriggerStats& Stats() const noexcept { return stats_; }

private:
    struct Binding {
        ProcId id;
        TriggerCondition condition = TriggerCondition::OnHit;
        SpecialEffect special;
        ecs::Entity owner;
        int32_t triggerCount = 0;
    };

    struct Scheduled {
        SimTime due = 0.0;
        uint64_t sequence = 0;
        ProcId proc;
        EffectId effect;
        ecs::Entity source;
        ecs::Entity target;
    };

    using StateKey = std::pair<ProcId::value_type, uint32_t>;

    std::optional<foundation::ErrorCode> gate(Binding& binding, ProcState& state,
                                              const TriggerContext& context, SimTime now);
    void schedule(SimTime due, ProcId proc, EffectId effect, ecs::Entity source,
                  ecs::Entity target);

    EffectSystem& effects_;
    IRandomSource& random_;
    const SimClock& clock_;

    std::vector<Binding> bindings_;
    std::map<StateKey, ProcState> states_;
    std::vector<Scheduled> pending_;
    std::vector<EffectApplicationResult> lastTick_;
    uint32_t nextProcId_ = 1;
    uint64_t nextSequence_ = 1;
    TriggerStats stats_;
};

} // namespace evolve::game
