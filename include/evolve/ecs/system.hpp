#pragma once

/// @file system.hpp
/// @brief ISystem interface for per-tick engine systems.

#include <cstdint>
#include <string_view>

namespace evolve::ecs {

/// Execution stage for a system. The simulation runs stages in order and
/// systems within a stage in a fixed registration order.
enum class SystemStage : uint8_t {
    PreUpdate,   ///< Time-based state (effects, scheduled procs, charges)
    Update,      ///< Combat state (stun timers, stagger recovery)
    PostUpdate   ///< Decision making (AI agents)
};

/// Abstract base class for engine systems.
class ISystem {
public:
    virtual ~ISystem() = default;

    /// Advance this system by one tick.
    ///
    /// @param deltaTime  Tick length in seconds.
    virtual void Execute(float deltaTime) = 0;

    [[nodiscard]] virtual SystemStage GetStage() const { return SystemStage::Update; }

    /// Human-readable name for diagnostics.
    [[nodiscard]] virtual std::string_view GetName() const = 0;
};

} // namespace evolve::ecs
