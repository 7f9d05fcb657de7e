/// @file game_serializer.cpp
/// @brief Non-template parts of GameSerializer.

#include "evolve/foundation/game_serializer.hpp"

namespace evolve::foundation {

struct GameSerializer::Impl {};

GameSerializer::GameSerializer() : impl_(std::make_unique<Impl>()) {}

GameSerializer::~GameSerializer() = default;

GameSerializer::GameSerializer(GameSerializer&&) noexcept = default;

GameSerializer& GameSerializer::operator=(GameSerializer&&) noexcept = default;

GameSerializer& GameSerializer::instance() {
    static GameSerializer inst;
    return inst;
}

}  // namespace evolve::foundation
