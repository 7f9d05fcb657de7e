#pragma once

/// @file ai_types.hpp
/// @brief AI agent states, learning configuration and the persisted
///        memory schema.

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "evolve/ecs/entity.hpp"
#include "evolve/foundation/game_result.hpp"
#include "evolve/foundation/game_serializer.hpp"
#include "evolve/foundation/types.hpp"

namespace evolve::game {

using foundation::MemoryGroupId;

/// Per-agent decision cycle: Idle -> Evaluating -> Acting -> Observing -> Idle.
enum class AgentState : uint8_t {
    Idle,
    Evaluating,
    Acting,
    Observing
};

/// Entity archetype; selects the default learning rate.
enum class EntityClass : uint8_t {
    Player,
    BasicEnemy,
    Chimera,
    Boss
};

inline constexpr std::size_t kEntityClassCount = 4;

[[nodiscard]] std::string_view agentStateName(AgentState state);
[[nodiscard]] std::string_view entityClassName(EntityClass cls);

/// Parse "player", "basic_enemy", "chimera" or "boss".
[[nodiscard]] foundation::GameResult<EntityClass> parseEntityClass(std::string_view name);

/// Learning and decision tunables.
struct AIConfig {
    double learningRate = 0.1;        ///< Shared memory groups
    double discount = 0.95;           ///< Gamma
    double explorationRate = 0.2;     ///< Initial epsilon
    double learningRateDecay = 0.99;
    double explorationDecay = 0.999;
    double minLearningRate = 0.01;
    double minExplorationRate = 0.01;
    double defaultValue = 1.0;        ///< Estimate for unseen (state, action)
    uint64_t decayAfterActions = 50;
    float decisionInterval = 0.5f;    ///< Seconds between agent decisions
    /// Initial learning rate of individual agents, by EntityClass.
    std::array<double, kEntityClassCount> classLearningRate{1.0, 0.05, 0.02, 0.01};

    [[nodiscard]] double LearningRateFor(EntityClass cls) const noexcept {
        return classLearningRate[static_cast<std::size_t>(cls)];
    }
};

// ── Persisted memory schema ─────────────────────────────────────────────

inline constexpr uint32_t kMemorySchemaVersion = 2;

/// One learned (state, action) value.
struct ValueEntry {
    std::string state;
    uint32_t skill = 0;
    double value = 0.0;
    uint32_t visits = 0;
};

/// Aggregate learning counters for an agent or a group.
///
/// `experience` and `evolutionStage` were added in schema 2; older blobs
/// load them with defaults.
struct LearningStats {
    uint64_t totalActions = 0;
    uint64_t successfulActions = 0;
    uint64_t failedActions = 0;
    double totalReward = 0.0;
    double learningRate = 0.0;
    double explorationRate = 0.0;
    double experience = 0.0;
    int32_t evolutionStage = 1;

    [[nodiscard]] double AverageReward() const noexcept {
        return totalActions > 0 ? totalReward / static_cast<double>(totalActions) : 0.0;
    }
};

enum class MemoryOwner : uint8_t {
    Entity,
    Group
};

/// Value table and counters of one owner.
struct MemoryRecord {
    MemoryOwner ownerKind = MemoryOwner::Entity;
    uint32_t ownerId = 0;       ///< Raw entity handle or group id
    uint32_t groupId = 0;       ///< Entity records: group membership, 0 = none
    std::string name;           ///< Group records
    EntityClass entityClass = EntityClass::BasicEnemy;
    std::vector<ValueEntry> entries;
    LearningStats stats;
};

/// Whole-store snapshot: the opaque AI generation-memory blob.
struct MemorySnapshot {
    std::vector<MemoryRecord> records;
};

} // namespace evolve::game

EVOLVE_SERIALIZABLE(evolve::game::ValueEntry, 1,
    field("state", &evolve::game::ValueEntry::state),
    field("skill", &evolve::game::ValueEntry::skill),
    field("value", &evolve::game::ValueEntry::value),
    field("visits", &evolve::game::ValueEntry::visits)
);

EVOLVE_SERIALIZABLE(evolve::game::LearningStats, 2,
    field("total_actions", &evolve::game::LearningStats::totalActions),
    field("successful_actions", &evolve::game::LearningStats::successfulActions),
    field("failed_actions", &evolve::game::LearningStats::failedActions),
    field("total_reward", &evolve::game::LearningStats::totalReward),
    field("learning_rate", &evolve::game::LearningStats::learningRate),
    field("exploration_rate", &evolve::game::LearningStats::explorationRate),
    field("experience", &evolve::game::LearningStats::experience),
    field("evolution_stage", &evolve::game::LearningStats::evolutionStage)
);

EVOLVE_SERIALIZABLE(evolve::game::MemoryRecord, 2,
    field("owner_kind", &evolve::game::MemoryRecord::ownerKind),
    field("owner_id", &evolve::game::MemoryRecord::ownerId),
    field("group_id", &evolve::game::MemoryRecord::groupId),
    field("name", &evolve::game::MemoryRecord::name),
    field("entity_class", &evolve::game::MemoryRecord::entityClass),
    field("entries", &evolve::game::MemoryRecord::entries),
    field("stats", &evolve::game::MemoryRecord::stats)
);

EVOLVE_SERIALIZABLE(evolve::game::MemorySnapshot, evolve::game::kMemorySchemaVersion,
    field("records", &evolve::game::MemorySnapshot::records)
);
