/// @file entity_manager.cpp
/// @brief Entity lifecycle: slot recycling, teardown and the deferred queue.

#include "evolve/ecs/entity_manager.hpp"

namespace evolve::ecs {

Entity EntityManager::Create() {
    if (!freeList_.empty()) {
        const uint32_t index = freeList_.front();
        freeList_.pop_front();
        auto& slot = slots_[index];
        slot.state = SlotState::Alive;
        ++count_;
        return Entity(index, slot.version);
    }

    const auto index = static_cast<uint32_t>(slots_.size());
    assert(index <= Entity::kMaxId && "Entity index space exhausted");
    slots_.push_back(Slot{0, SlotState::Alive});
    ++count_;
    return Entity(index, 0);
}

const EntityManager::Slot* EntityManager::slotOf(Entity entity) const noexcept {
    if (!entity.isValid() || entity.id() >= slots_.size()) {
        return nullptr;
    }
    const Slot& slot = slots_[entity.id()];
    if (slot.state == SlotState::Free || slot.version != entity.version()) {
        return nullptr;
    }
    return &slot;
}

bool EntityManager::IsAlive(Entity entity) const noexcept {
    return slotOf(entity) != nullptr;
}

bool EntityManager::IsPendingDestroy(Entity entity) const noexcept {
    const Slot* slot = slotOf(entity);
    return slot != nullptr && slot->state == SlotState::Queued;
}

void EntityManager::Destroy(Entity entity) {
    const Slot* slot = slotOf(entity);
    if (slot == nullptr || slot->state == SlotState::Dying) {
        return;
    }
    // A queued entity destroyed now leaves a stale queue entry; the flush
    // skips it by version.
    tearDown(entity);
}

void EntityManager::DestroyDeferred(Entity entity) {
    const Slot* slot = slotOf(entity);
    if (slot == nullptr || slot->state != SlotState::Alive) {
        return;
    }
    slots_[entity.id()].state = SlotState::Queued;
    pending_.push_back(entity);
}

std::size_t EntityManager::FlushDeferred() {
    std::size_t destroyed = 0;
    while (!pending_.empty()) {
        auto batch = std::move(pending_);
        pending_.clear();
        for (auto entity : batch) {
            if (IsPendingDestroy(entity)) {
                tearDown(entity);
                ++destroyed;
            }
        }
    }
    return destroyed;
}

void EntityManager::RegisterStorage(IComponentStorage* storage) {
    assert(storage != nullptr && "Cannot register null storage");
    storages_.push_back(storage);
}

void EntityManager::tearDown(Entity entity) {
    const auto index = entity.id();
    slots_[index].state = SlotState::Dying;

    // Handlers may grow slots_; index again afterwards.
    destroying.emit(entity);
    for (auto* storage : storages_) {
        storage->Remove(entity);
    }

    auto& slot = slots_[index];
    slot.state = SlotState::Free;
    // Wraps 255 -> 0; ids never reach kIdMask so the sentinel stays unique.
    slot.version = static_cast<uint8_t>(slot.version + 1);
    freeList_.push_back(index);
    --count_;
}

} // namespace evolve::ecs
