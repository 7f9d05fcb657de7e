#pragma once

/// @file entity_manager.hpp
/// @brief Entity lifecycle: creation, versioned index recycling, and
///        component cleanup on destruction.

#include "evolve/ecs/component_storage.hpp"
#include "evolve/ecs/entity.hpp"
#include "evolve/foundation/signal.hpp"

#include <cassert>
#include <cstdint>
#include <deque>
#include <vector>

namespace evolve::ecs {

/// Owns the set of live entities.
///
/// Destroyed indices go on a FIFO free list and come back with an
/// incremented version. On every destruction, immediate or deferred,
/// `destroying` fires while the entity is still alive and its components
/// are still readable; registered storages are cleared afterwards.
///
/// Handlers connected to `destroying` may create, destroy or queue other
/// entities. A Destroy() of the entity already being torn down is a no-op,
/// and its index is not recycled until teardown finishes.
class EntityManager {
public:
    EntityManager() = default;

    EntityManager(const EntityManager&) = delete;
    EntityManager& operator=(const EntityManager&) = delete;

    /// Per-entity teardown hook (effects, procs, AI agent, stat cache).
    foundation::Signal<Entity> destroying;

    /// Create a new entity, recycling the oldest free index if any.
    [[nodiscard]] Entity Create();

    /// Destroy @p entity and remove its components. No-op when not alive
    /// or already tearing down.
    void Destroy(Entity entity);

    /// Queue @p entity for destruction at the next FlushDeferred().
    /// Queuing the same entity twice keeps one entry.
    void DestroyDeferred(Entity entity);

    /// Destroy every queued entity still alive, including entities queued
    /// by `destroying` handlers during the flush.
    /// @return Number of entities destroyed.
    std::size_t FlushDeferred();

    /// True from Create() until teardown of the entity completes.
    [[nodiscard]] bool IsAlive(Entity entity) const noexcept;

    /// True while @p entity waits in the deferred queue.
    [[nodiscard]] bool IsPendingDestroy(Entity entity) const noexcept;

    [[nodiscard]] std::size_t Count() const noexcept { return count_; }

    [[nodiscard]] std::size_t PendingCount() const noexcept { return pending_.size(); }

    /// Indices ever allocated, including those on the free list.
    [[nodiscard]] std::size_t Capacity() const noexcept { return slots_.size(); }

    /// Register a storage for cleanup on destroy. Not owned; it must
    /// outlive the manager.
    void RegisterStorage(IComponentStorage* storage);

private:
    enum class SlotState : uint8_t {
        Free,
        Alive,
        Queued,  ///< Alive, waiting for FlushDeferred()
        Dying    ///< `destroying` handlers running
    };

    struct Slot {
        uint8_t version = 0;
        SlotState state = SlotState::Free;
    };

    [[nodiscard]] const Slot* slotOf(Entity entity) const noexcept;
    void tearDown(Entity entity);

    std::vector<Slot> slots_;
    std::deque<uint32_t> freeList_;
    std::vector<Entity> pending_;
    std::vector<IComponentStorage*> storages_;
    std::size_t count_ = 0;
};

}  // namespace evolve::ecs
