#pragma once

/// @file catalog.hpp
/// @brief Id-assigning store of immutable definitions (effects, skills,
///        combos).

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

#include "evolve/foundation/game_result.hpp"

namespace evolve::game {

/// Owns definitions of type Def keyed by a StrongId.
///
/// Ids are assigned densely from 1 in insertion order; 0 stays invalid.
/// Def must expose `id` (IdT) and `name` (std::string) members. Stored
/// definitions never move, so pointers returned by Find() stay valid for
/// the catalog's lifetime.
template <typename Def, typename IdT>
class Catalog {
public:
    Catalog() = default;
    Catalog(const Catalog&) = delete;
    Catalog& operator=(const Catalog&) = delete;

    /// Store @p def and assign its id.
    /// @return The new id, or AlreadyExists when the name is taken.
    foundation::GameResult<IdT> Add(Def def) {
        if (byName_.contains(def.name)) {
            return foundation::GameResult<IdT>::err(foundation::GameError(
                foundation::ErrorCode::AlreadyExists,
                "duplicate definition name: " + def.name));
        }
        IdT id(static_cast<typename IdT::value_type>(items_.size() + 1));
        def.id = id;
        byName_.emplace(def.name, id);
        items_.push_back(std::move(def));
        return foundation::GameResult<IdT>::ok(id);
    }

    [[nodiscard]] const Def* Find(IdT id) const noexcept {
        if (!id.isValid() || id.value() > items_.size()) {
            return nullptr;
        }
        return &items_[id.value() - 1];
    }

    [[nodiscard]] IdT FindByName(std::string_view name) const {
        auto it = byName_.find(std::string(name));
        return it != byName_.end() ? it->second : IdT{};
    }

    [[nodiscard]] std::size_t Size() const noexcept { return items_.size(); }

    [[nodiscard]] auto begin() const noexcept { return items_.begin(); }
    [[nodiscard]] auto end() const noexcept { return items_.end(); }

private:
    std::deque<Def> items_;
    std::unordered_map<std::string, IdT> byName_;
};

} // namespace evolve::game
