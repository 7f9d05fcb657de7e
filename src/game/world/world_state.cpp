/// @file world_state.cpp
/// @brief In-memory IWorldView implementation.

#include "evolve/game/world.hpp"

namespace evolve::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

namespace {

GameError notFound(ecs::Entity entity) {
    return GameError(ErrorCode::EntityNotFound,
                     "entity " + std::to_string(entity.id()) + " is not in the world");
}

} // namespace

void WorldState::Add(ecs::Entity entity, AttributeSet attributes, Vector3 position) {
    records_[entity] = Record{attributes, position, {}};
    attributesChanged.emit(entity);
}

void WorldState::Remove(ecs::Entity entity) {
    records_.erase(entity);
}

bool WorldState::Has(ecs::Entity entity) const {
    return records_.count(entity) > 0;
}

GameResult<void> WorldState::SetAttributes(ecs::Entity entity, AttributeSet attributes) {
    auto it = records_.find(entity);
    if (it == records_.end()) {
        return GameResult<void>::err(notFound(entity));
    }
    it->second.attributes = attributes;
    attributesChanged.emit(entity);
    return GameResult<void>::ok();
}

GameResult<void> WorldState::SetPosition(ecs::Entity entity, Vector3 position) {
    auto it = records_.find(entity);
    if (it == records_.end()) {
        return GameResult<void>::err(notFound(entity));
    }
    it->second.position = position;
    return GameResult<void>::ok();
}

GameResult<void> WorldState::SetEquipment(ecs::Entity entity, std::vector<Modifier> modifiers) {
    auto it = records_.find(entity);
    if (it == records_.end()) {
        return GameResult<void>::err(notFound(entity));
    }
    it->second.equipment = std::move(modifiers);
    attributesChanged.emit(entity);
    return GameResult<void>::ok();
}

GameResult<AttributeSet> WorldState::GetAttributes(ecs::Entity entity) const {
    auto it = records_.find(entity);
    if (it == records_.end()) {
        return GameResult<AttributeSet>::err(notFound(entity));
    }
    return GameResult<AttributeSet>::ok(it->second.attributes);
}

GameResult<Vector3> WorldState::GetPosition(ecs::Entity entity) const {
    auto it = records_.find(entity);
    if (it == records_.end()) {
        return GameResult<Vector3>::err(notFound(entity));
    }
    return GameResult<Vector3>::ok(it->second.position);
}

std::vector<Modifier> WorldState::GetEquipmentModifiers(ecs::Entity entity) const {
    auto it = records_.find(entity);
    if (it == records_.end()) {
        return {};
    }
    return it->second.equipment;
}

void WorldState::NotifyDeath(ecs::Entity entity) {
    deaths_.push_back(entity);
    died.emit(entity);
}

} // namespace evolve::game
