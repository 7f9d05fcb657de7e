#pragma once

/// @file sim_clock.hpp
/// @brief Tick-counted simulation time shared by every engine.

namespace evolve::game {

/// Simulation timestamp in seconds since session start.
using SimTime = double;

/// Tolerance for comparing accumulated timestamps.
inline constexpr SimTime kTimeEpsilon = 1e-6;

/// Monotonic simulation clock. Only the owner of the tick loop advances it;
/// cooldowns, durations and delayed procs all read Now().
class SimClock {
public:
    [[nodiscard]] SimTime Now() const noexcept { return now_; }

    /// Advance by @p dt seconds. Negative steps are ignored.
    void Advance(double dt) noexcept {
        if (dt > 0.0) {
            now_ += dt;
        }
    }

    void Reset() noexcept { now_ = 0.0; }

private:
    SimTime now_ = 0.0;
};

} // namespace evolve::game
