#pragma once

/// @file simulation.hpp
/// @brief Simulation: owns the entity registry, the engines and the clock,
///        and advances them in a fixed order each tick.

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "evolve/ecs/entity.hpp"
#include "evolve/ecs/entity_manager.hpp"
#include "evolve/foundation/game_result.hpp"
#include "evolve/foundation/snapshot_store.hpp"
#include "evolve/game/ai_memory.hpp"
#include "evolve/game/ai_system.hpp"
#include "evolve/game/combat_system.hpp"
#include "evolve/game/effect_system.hpp"
#include "evolve/game/engine_config.hpp"
#include "evolve/game/game_events.hpp"
#include "evolve/game/math_types.hpp"
#include "evolve/game/random_source.hpp"
#include "evolve/game/sim_clock.hpp"
#include "evolve/game/skill_system.hpp"
#include "evolve/game/stat_system.hpp"
#include "evolve/game/trigger_system.hpp"
#include "evolve/game/world.hpp"

namespace evolve::game {

/// Everything needed to bring a combatant into the simulation.
struct SpawnParams {
    AttributeSet attributes;
    Vector3 position;
    uint32_t team = 0;
    std::vector<std::string> immunities;
    /// Register as an AI agent of this class.
    std::optional<EntityClass> aiClass;
    std::optional<MemoryGroupId> memoryGroup;
};

/// The authoritative simulation.
///
/// Tick(dt):
///   1. Advance the clock.
///   2. EffectSystem: periodic ticks and expiry.
///   3. TriggerSystem: scheduled proc effects.
///   4. SkillSystem: charge regeneration and combo expiry.
///   5. CombatSystem: stun timers and stagger recovery.
///   6. AIDecisionSystem: agents in registration order.
///   7. Destroy entities queued during the tick.
///
/// @code
///   Simulation sim(config);
///   auto hero = sim.Spawn({.attributes = attrs, .team = 1});
///   sim.Skills().Learn(hero.value(), fireball);
///   sim.Tick(0.1f);
/// @endcode
class Simulation {
public:
    /// @param random Roll source; a SeededRandom over config.seed when null.
    explicit Simulation(EngineConfig config = {},
                        std::unique_ptr<IRandomSource> random = nullptr);
    ~Simulation();

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    /// Create an entity with full vitals computed from its attributes.
    /// @return The entity, InvalidAttribute, AlreadyExists or
    ///         MemoryGroupNotFound (AI registration).
    foundation::GameResult<ecs::Entity> Spawn(const SpawnParams& params);

    /// Remove @p entity, its effects, stat cache entry and AI agent.
    /// Learned AI memory is kept. No-op on a stale handle.
    void Despawn(ecs::Entity entity);

    /// Despawn at the end of the current tick. Safe from event handlers
    /// (e.g. GameEvents::entityDied) fired while systems are iterating.
    void DespawnDeferred(ecs::Entity entity);

    void Tick(float deltaTime);

    /// Serialize AI memory into @p store.
    /// @return SnapshotWriteFailed or the store's error.
    foundation::GameResult<void> SaveMemory(foundation::ISnapshotStore& store) const;

    /// Replace AI memory with the newest snapshot in @p store. On error the
    /// current memory is kept and the simulation continues.
    foundation::GameResult<void> LoadMemory(const foundation::ISnapshotStore& store);

    // ── Access ──────────────────────────────────────────────────────────

    [[nodiscard]] ecs::EntityManager& Entities();
    [[nodiscard]] WorldState& World();
    [[nodiscard]] StatCache& Stats();
    [[nodiscard]] CombatSystem& Combat();
    [[nodiscard]] EffectSystem& Effects();
    [[nodiscard]] TriggerSystem& Triggers();
    [[nodiscard]] SkillSystem& Skills();
    [[nodiscard]] AIDecisionSystem& AI();
    [[nodiscard]] AIMemoryStore& Memory();
    [[nodiscard]] GameEvents& Events();
    [[nodiscard]] const SimClock& Clock() const;
    [[nodiscard]] const EngineConfig& Config() const;

    /// Vitals of @p entity, or null.
    [[nodiscard]] const Vitals* VitalsOf(ecs::Entity entity) const;
    [[nodiscard]] const SkillBook* BookOf(ecs::Entity entity) const;

    [[nodiscard]] uint64_t TickCount() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace evolve::game
