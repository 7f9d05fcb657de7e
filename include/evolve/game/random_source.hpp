#pragma once

/// @file random_source.hpp
/// @brief Injectable random source for crit, proc and exploration rolls.

#include <cstddef>
#include <cstdint>
#include <random>

namespace evolve::game {

/// Source of randomness. Every roll in the engine goes through one
/// instance so a fixed seed reproduces a session exactly.
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    /// Uniform value in [0, 1).
    virtual float NextUnit() = 0;

    /// Uniform index in [0, n). @p n must be non-zero.
    virtual std::size_t NextIndex(std::size_t n) = 0;
};

/// Mersenne-twister backed source.
class SeededRandom final : public IRandomSource {
public:
    explicit SeededRandom(uint64_t seed) : engine_(seed) {}

    float NextUnit() override {
        return std::uniform_real_distribution<float>(0.0f, 1.0f)(engine_);
    }

    std::size_t NextIndex(std::size_t n) override {
        return std::uniform_int_distribution<std::size_t>(0, n - 1)(engine_);
    }

    void Reseed(uint64_t seed) { engine_.seed(seed); }

private:
    std::mt19937_64 engine_;
};

} // namespace evolve::game
