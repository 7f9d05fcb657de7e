#pragma once

/// @file scripted_random.hpp
/// @brief Deterministic IRandomSource for tests.

#include <cstddef>
#include <deque>
#include <vector>

#include "evolve/game/random_source.hpp"

namespace evolve::testing {

/// Returns queued values first, then a fixed fallback.
///
/// The default fallback 0.999 fails every chance roll below 1, so dodge,
/// crit, block and exploration never trigger unless a test queues a low
/// value.
class ScriptedRandom final : public game::IRandomSource {
public:
    explicit ScriptedRandom(float fallback = 0.999f) : fallback_(fallback) {}

    void Queue(std::vector<float> values) {
        units_.insert(units_.end(), values.begin(), values.end());
    }

    void QueueIndex(std::size_t index) { indices_.push_back(index); }

    void SetFallback(float value) { fallback_ = value; }

    float NextUnit() override {
        ++draws_;
        if (units_.empty()) {
            return fallback_;
        }
        float v = units_.front();
        units_.pop_front();
        return v;
    }

    std::size_t NextIndex(std::size_t n) override {
        if (indices_.empty()) {
            return 0;
        }
        std::size_t i = indices_.front();
        indices_.pop_front();
        return i < n ? i : n - 1;
    }

    [[nodiscard]] std::size_t Draws() const noexcept { return draws_; }

private:
    float fallback_;
    std::deque<float> units_;
    std::deque<std::size_t> indices_;
    std::size_t draws_ = 0;
};

} // namespace evolve::testing
