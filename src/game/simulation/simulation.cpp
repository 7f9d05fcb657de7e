/// @file simulation.cpp
/// @brief Simulation implementation wiring storages, catalogs and engines.

#include "evolve/game/simulation.hpp"

#include "evolve/ecs/component_storage.hpp"
#include "evolve/foundation/game_logger.hpp"

namespace evolve::game {

using foundation::GameResult;
using foundation::LogCategory;

namespace {

std::unique_ptr<IRandomSource> orSeeded(std::unique_ptr<IRandomSource> random, uint64_t seed) {
    if (random) {
        return random;
    }
    return std::make_unique<SeededRandom>(seed);
}

} // namespace

// ── Impl ────────────────────────────────────────────────────────────────

struct Simulation::Impl {
    EngineConfig config;
    std::unique_ptr<IRandomSource> random;
    SimClock clock;
    GameEvents events;

    // ECS core
    ecs::EntityManager entities;
    ecs::ComponentStorage<Vitals> vitals;
    ecs::ComponentStorage<Faction> factions;
    ecs::ComponentStorage<Immunities> immunities;
    ecs::ComponentStorage<EffectHolder> holders;
    ecs::ComponentStorage<SkillBook> books;

    // Definitions
    EffectCatalog effectCatalog;
    SkillCatalog skillCatalog;
    ComboCatalog comboCatalog;

    // Engines, in construction-dependency order
    WorldState world;
    StatCache stats;
    CombatSystem combat;
    EffectSystem effects;
    TriggerSystem triggers;
    SkillSystem skills;
    AIMemoryStore memory;
    AIDecisionSystem ai;

    uint64_t tickCount = 0;

    Impl(EngineConfig cfg, std::unique_ptr<IRandomSource> rng)
        : config(std::move(cfg)),
          random(orSeeded(std::move(rng), config.seed)),
          stats(world, config.formulas),
          combat(vitals, stats, world, *random, events, config.combat),
          effects(effectCatalog, holders, vitals, factions, immunities, stats, world, combat,
                  clock, events),
          triggers(effects, *random, clock),
          skills(skillCatalog, comboCatalog, books, vitals, factions, stats, world, combat,
                 effects, triggers, clock, events, config.skills),
          memory(config.ai),
          ai(skills, memory, vitals, *random, clock, config.ai) {
        entities.RegisterStorage(&vitals);
        entities.RegisterStorage(&factions);
        entities.RegisterStorage(&immunities);
        entities.RegisterStorage(&holders);
        entities.RegisterStorage(&books);

        entities.destroying.connect([this](ecs::Entity entity) {
            effects.RemoveAll(entity);
            triggers.Forget(entity);
            ai.Unregister(entity);
            stats.Forget(entity);
            world.Remove(entity);
        });
        world.attributesChanged.connect([this](ecs::Entity entity) { stats.Invalidate(entity); });
    }
};

// ── Construction ────────────────────────────────────────────────────────

Simulation::Simulation(EngineConfig config, std::unique_ptr<IRandomSource> random)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(random))) {
    impl_->config.ApplyLogging();
    EVOLVE_LOG_INFO(LogCategory::Core,
                    "simulation started, seed " + std::to_string(impl_->config.seed));
}

Simulation::~Simulation() = default;

// ── Entities ────────────────────────────────────────────────────────────

GameResult<ecs::Entity> Simulation::Spawn(const SpawnParams& params) {
    auto& impl = *impl_;
    const ecs::Entity entity = impl.entities.Create();
    impl.world.Add(entity, params.attributes, params.position);

    auto derived = impl.stats.Get(entity);
    if (!derived) {
        impl.entities.Destroy(entity);
        return GameResult<ecs::Entity>::err(derived.error());
    }

    impl.vitals.Add(entity, Vitals::Full(derived.value()));
    impl.factions.Add(entity, Faction{params.team});
    impl.immunities.Add(entity, Immunities{params.immunities});
    impl.holders.Add(entity, EffectHolder{});
    impl.books.Add(entity, SkillBook{});

    if (params.aiClass) {
        auto registered = impl.ai.Register(entity, *params.aiClass, params.memoryGroup);
        if (!registered) {
            Despawn(entity);
            return GameResult<ecs::Entity>::err(registered.error());
        }
    }

    EVOLVE_LOG_DEBUG(LogCategory::Core, "spawned entity " + std::to_string(entity.id()) +
                                            " on team " + std::to_string(params.team));
    return GameResult<ecs::Entity>::ok(entity);
}

void Simulation::Despawn(ecs::Entity entity) {
    impl_->entities.Destroy(entity);
}

void Simulation::DespawnDeferred(ecs::Entity entity) {
    impl_->entities.DestroyDeferred(entity);
}

// ── Tick ────────────────────────────────────────────────────────────────

void Simulation::Tick(float deltaTime) {
    auto& impl = *impl_;
    if (deltaTime < 0.0f) {
        deltaTime = 0.0f;
    }
    impl.clock.Advance(deltaTime);

    impl.effects.Execute(deltaTime);
    impl.triggers.Execute(deltaTime);
    impl.skills.Execute(deltaTime);
    impl.combat.Execute(deltaTime);
    impl.ai.Execute(deltaTime);

    if (auto despawned = impl.entities.FlushDeferred(); despawned > 0) {
        EVOLVE_LOG_TRACE(LogCategory::Core,
                         "despawned " + std::to_string(despawned) + " entities at end of tick");
    }
    ++impl.tickCount;
}

// ── Persistence ─────────────────────────────────────────────────────────

GameResult<void> Simulation::SaveMemory(foundation::ISnapshotStore& store) const {
    const auto blob = impl_->memory.Snapshot();
    auto saved = store.save(blob);
    if (!saved) {
        EVOLVE_LOG_FAILURE(LogCategory::Persistence, "AI memory save", saved.error());
        return saved;
    }
    EVOLVE_LOG_INFO(LogCategory::Persistence,
                    "AI memory saved (" + std::to_string(blob.size()) + " bytes)");
    return GameResult<void>::ok();
}

GameResult<void> Simulation::LoadMemory(const foundation::ISnapshotStore& store) {
    auto blob = store.loadLatest();
    if (!blob) {
        EVOLVE_LOG_FAILURE(LogCategory::Persistence, "AI memory load", blob.error());
        return GameResult<void>::err(blob.error());
    }
    auto restored = impl_->memory.Restore(blob.value());
    if (!restored) {
        return restored;
    }
    if (auto fresh = impl_->ai.ReattachMemory(); fresh > 0) {
        EVOLVE_LOG_INFO(LogCategory::Persistence,
                        std::to_string(fresh) + " live agents absent from the snapshot start fresh");
    }
    return GameResult<void>::ok();
}

// ── Access ──────────────────────────────────────────────────────────────

ecs::EntityManager& Simulation::Entities() { return impl_->entities; }
WorldState& Simulation::World() { return impl_->world; }
StatCache& Simulation::Stats() { return impl_->stats; }
CombatSystem& Simulation::Combat() { return impl_->combat; }
EffectSystem& Simulation::Effects() { return impl_->effects; }
TriggerSystem& Simulation::Triggers() { return impl_->triggers; }
SkillSystem& Simulation::Skills() { return impl_->skills; }
AIDecisionSystem& Simulation::AI() { return impl_->ai; }
AIMemoryStore& Simulation::Memory() { return impl_->memory; }
GameEvents& Simulation::Events() { return impl_->events; }
const SimClock& Simulation::Clock() const { return impl_->clock; }
const EngineConfig& Simulation::Config() const { return impl_->config; }

const Vitals* Simulation::VitalsOf(ecs::Entity entity) const {
    return impl_->vitals.TryGet(entity);
}

const SkillBook* Simulation::BookOf(ecs::Entity entity) const {
    return impl_->books.TryGet(entity);
}

uint64_t Simulation::TickCount() const noexcept { return impl_->tickCount; }

} // namespace evolve::game
