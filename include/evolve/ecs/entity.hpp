#pragma once

/// @file entity.hpp
/// @brief Entity handle for combatants and other simulated actors.
///
/// 24-bit index plus 8-bit version packed in 32 bits. The version changes
/// each time an index is recycled, so a handle to a destroyed actor never
/// aliases its successor.

#include <cstdint>
#include <functional>
#include <limits>

namespace evolve::ecs {

struct Entity {
    uint32_t raw = kInvalidRaw;

    static constexpr uint32_t kIdBits = 24;
    static constexpr uint32_t kVersionBits = 8;
    static constexpr uint32_t kIdMask = (1u << kIdBits) - 1;
    static constexpr uint32_t kVersionShift = kIdBits;
    static constexpr uint32_t kInvalidRaw = std::numeric_limits<uint32_t>::max();
    static constexpr uint32_t kMaxId = kIdMask - 1;

    constexpr Entity() = default;

    constexpr Entity(uint32_t id, uint8_t version)
        : raw((static_cast<uint32_t>(version) << kVersionShift) | (id & kIdMask)) {}

    [[nodiscard]] constexpr uint32_t id() const noexcept { return raw & kIdMask; }

    [[nodiscard]] constexpr uint8_t version() const noexcept {
        return static_cast<uint8_t>(raw >> kVersionShift);
    }

    [[nodiscard]] constexpr bool isValid() const noexcept { return raw != kInvalidRaw; }

    [[nodiscard]] static constexpr Entity invalid() noexcept { return Entity{}; }

    /// Rebuild a handle from its packed representation (snapshots, logs).
    [[nodiscard]] static constexpr Entity fromRaw(uint32_t value) noexcept {
        Entity e;
        e.raw = value;
        return e;
    }

    constexpr auto operator<=>(const Entity&) const = default;
};

static_assert(sizeof(Entity) == 4, "Entity must be exactly 32 bits");

} // namespace evolve::ecs

template <>
struct std::hash<evolve::ecs::Entity> {
    std::size_t operator()(const evolve::ecs::Entity& e) const noexcept {
        return std::hash<uint32_t>{}(e.raw);
    }
};
