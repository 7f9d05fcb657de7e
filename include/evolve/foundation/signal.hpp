#pragma once

/// @file signal.hpp
/// @brief Signal<Args...> used to publish engine events (effect applied,
///        skill used, entity died) to any number of observers.

#include <algorithm>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace evolve::foundation {

/// Observer list for one event type.
///
/// Owned and fired on the simulation thread. Slots run in connection
/// order; a slot connected or disconnected during emit() takes effect
/// from the next emit().
///
/// @code
///   Signal<ecs::Entity> died;
///   auto id = died.connect([](ecs::Entity e) { drop(e); });
///   died.emit(victim);
///   died.disconnect(id);
/// @endcode
template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using SlotId = uint64_t;

    Signal() = default;

    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    SlotId connect(Slot slot) {
        const SlotId id = nextId_++;
        slots_.emplace_back(id, std::move(slot));
        return id;
    }

    /// Unknown ids are ignored.
    void disconnect(SlotId id) {
        std::erase_if(slots_, [id](const auto& entry) { return entry.first == id; });
    }

    void disconnectAll() { slots_.clear(); }

    void emit(Args... args) const {
        const auto snapshot = slots_;
        for (const auto& [id, slot] : snapshot) {
            slot(args...);
        }
    }

    [[nodiscard]] std::size_t slotCount() const noexcept { return slots_.size(); }

    [[nodiscard]] bool empty() const noexcept { return slots_.empty(); }

private:
    std::vector<std::pair<SlotId, Slot>> slots_;
    SlotId nextId_ = 1;
};

} // namespace evolve::foundation
