#pragma once

/// @file world.hpp
/// @brief World collaborator interface and an in-memory implementation.

#include <unordered_map>
#include <vector>

#include "evolve/ecs/entity.hpp"
#include "evolve/foundation/game_result.hpp"
#include "evolve/foundation/signal.hpp"
#include "evolve/game/math_types.hpp"
#include "evolve/game/stat_types.hpp"

namespace evolve::game {

/// What the engine needs from the surrounding world: base attributes,
/// positions, equipment modifiers, and a death notification.
class IWorldView {
public:
    virtual ~IWorldView() = default;

    /// @return The attributes, or EntityNotFound.
    [[nodiscard]] virtual foundation::GameResult<AttributeSet> GetAttributes(
        ecs::Entity entity) const = 0;

    /// @return The position, or EntityNotFound.
    [[nodiscard]] virtual foundation::GameResult<Vector3> GetPosition(
        ecs::Entity entity) const = 0;

    /// Modifiers from equipped items. Empty when unknown.
    [[nodiscard]] virtual std::vector<Modifier> GetEquipmentModifiers(
        ecs::Entity entity) const = 0;

    /// Called once when combat reduces an entity's health to zero.
    virtual void NotifyDeath(ecs::Entity entity) = 0;
};

/// In-memory world used by the simulation and by tests.
///
/// attributesChanged fires after any attribute or equipment change so
/// derived-stat caches can invalidate.
class WorldState final : public IWorldView {
public:
    foundation::Signal<ecs::Entity> attributesChanged;
    foundation::Signal<ecs::Entity> died;

    void Add(ecs::Entity entity, AttributeSet attributes, Vector3 position = {});
    void Remove(ecs::Entity entity);
    [[nodiscard]] bool Has(ecs::Entity entity) const;

    foundation::GameResult<void> SetAttributes(ecs::Entity entity, AttributeSet attributes);
    foundation::GameResult<void> SetPosition(ecs::Entity entity, Vector3 position);
    foundation::GameResult<void> SetEquipment(ecs::Entity entity, std::vector<Modifier> modifiers);

    [[nodiscard]] foundation::GameResult<AttributeSet> GetAttributes(
        ecs::Entity entity) const override;
    [[nodiscard]] foundation::GameResult<Vector3> GetPosition(
        ecs::Entity entity) const override;
    [[nodiscard]] std::vector<Modifier> GetEquipmentModifiers(
        ecs::Entity entity) const override;
    void NotifyDeath(ecs::Entity entity) override;

    /// Entities reported dead, in order of death.
    [[nodiscard]] const std::vector<ecs::Entity>& Deaths() const noexcept { return deaths_; }

private:
    struct Record {
        AttributeSet attributes;
        Vector3 position;
        std::vector<Modifier> equipment;
    };

    std::unordered_map<ecs::Entity, Record> records_;
    std::vector<ecs::Entity> deaths_;
};

} // namespace evolve::game
