#pragma once

/// @file types.hpp
/// @brief Strong ID types for engine definitions and live instances.

#include <compare>
#include <cstdint>
#include <functional>

namespace evolve::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// Prevents accidental mixing of different ID types (e.g. SkillId and
/// EffectId) at compile time while keeping the same representation.
///
/// @tparam Tag A unique tag type to distinguish different ID types.
/// @tparam T The underlying integral type.
template <typename Tag, typename T = uint32_t>
class StrongId {
public:
    using value_type = T;

    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct EffectIdTag {};
struct ActiveEffectIdTag {};
struct SkillIdTag {};
struct ComboIdTag {};
struct ProcIdTag {};
struct MemoryGroupIdTag {};

/// Identifier of a registered Effect template.
using EffectId = StrongId<EffectIdTag>;

/// Identifier of a live effect instance on a target.
using ActiveEffectId = StrongId<ActiveEffectIdTag, uint64_t>;

/// Identifier of a registered Skill definition.
using SkillId = StrongId<SkillIdTag>;

/// Identifier of a registered combo chain.
using ComboId = StrongId<ComboIdTag>;

/// Identifier of a registered proc binding.
using ProcId = StrongId<ProcIdTag>;

/// Identifier of an AI shared memory group.
using MemoryGroupId = StrongId<MemoryGroupIdTag>;

} // namespace evolve::foundation

// Hash support for use in unordered containers.
template <typename Tag, typename T>
struct std::hash<evolve::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const evolve::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
