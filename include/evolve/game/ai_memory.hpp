#pragma once

/// @file ai_memory.hpp
/// @brief Learned (state, action) values per agent and per shared memory
///        group, with snapshot/restore.

#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "evolve/ecs/entity.hpp"
#include "evolve/foundation/game_result.hpp"
#include "evolve/foundation/types.hpp"
#include "evolve/game/ai_types.hpp"

namespace evolve::game {

/// Value tables for AI agents.
///
/// Each registered agent owns a table; agents may also belong to a shared
/// memory group whose table is the visit-weighted average of every
/// member's writes. Estimates fall back from the agent's own value to the
/// group's, then to AIConfig::defaultValue.
///
/// Writers are serialized behind a shared mutex; readers see either the
/// state before or after a write, never a partial update.
class AIMemoryStore {
public:
    explicit AIMemoryStore(AIConfig config = {});

    AIMemoryStore(const AIMemoryStore&) = delete;
    AIMemoryStore& operator=(const AIMemoryStore&) = delete;

    foundation::GameResult<MemoryGroupId> CreateGroup(std::string name, EntityClass cls);
    [[nodiscard]] MemoryGroupId FindGroup(std::string_view name) const;

    /// Create the agent's memory.
    /// @return AlreadyExists or MemoryGroupNotFound.
    foundation::GameResult<void> Register(ecs::Entity entity, EntityClass cls,
                                          std::optional<MemoryGroupId> group = std::nullopt);
    void Unregister(ecs::Entity entity);
    [[nodiscard]] bool IsRegistered(ecs::Entity entity) const;

    /// Own value, else group value, else the default.
    [[nodiscard]] double Estimate(ecs::Entity entity, std::string_view state,
                                  foundation::SkillId skill) const;

    [[nodiscard]] std::optional<double> EntityValue(ecs::Entity entity, std::string_view state,
                                                    foundation::SkillId skill) const;
    [[nodiscard]] std::optional<double> GroupValue(MemoryGroupId group, std::string_view state,
                                                   foundation::SkillId skill) const;

    /// Q-learning update for one observed action.
    ///
    /// value <- value + lr * (reward + gamma * maxNext - value), where
    /// maxNext is the best known value in @p nextState (default when
    /// none). Also updates counters, experience, evolution stage and the
    /// decayed rates, and folds the new value into the agent's group.
    ///
    /// @return AgentNotRegistered for an unknown entity.
    foundation::GameResult<void> RecordOutcome(ecs::Entity entity,
                                               const std::string& state,
                                               foundation::SkillId skill,
                                               double reward,
                                               const std::string& nextState);

    [[nodiscard]] foundation::GameResult<LearningStats> Stats(ecs::Entity entity) const;
    [[nodiscard]] foundation::GameResult<LearningStats> GroupStats(MemoryGroupId group) const;

    /// Clear learned values and counters, keeping registration.
    foundation::GameResult<void> ResetEntity(ecs::Entity entity);
    foundation::GameResult<void> ResetGroup(MemoryGroupId group);

    /// Serialize every table and counter into a versioned blob.
    [[nodiscard]] std::vector<uint8_t> Snapshot() const;

    /// Replace the store with @p blob's contents. On error the current
    /// state is left untouched.
    /// @return InvalidBinaryData, UnsupportedSchemaVersion or InvalidArgument.
    foundation::GameResult<void> Restore(std::span<const uint8_t> blob);

    /// Debug rendering of the snapshot as JSON.
    [[nodiscard]] std::string ExportJson() const;

    [[nodiscard]] std::size_t AgentCount() const;
    [[nodiscard]] std::size_t GroupCount() const;
    [[nodiscard]] const AIConfig& Config() const noexcept { return config_; }

private:
    struct Cell {
        double value = 0.0;
        uint32_t visits = 0;
    };
    using Key = std::pair<std::string, uint32_t>;
    using Table = std::map<Key, Cell>;

    struct Memory {
        EntityClass cls = EntityClass::BasicEnemy;
        uint32_t group = 0;
        std::string name;
        Table values;
        LearningStats stats;
    };

    [[nodiscard]] static std::optional<double> lookup(const Table& table, std::string_view state,
                                                      uint32_t skill);
    [[nodiscard]] static std::optional<double> bestIn(const Table& table, std::string_view state);
    void advanceCounters(LearningStats& stats, double reward, int32_t stageCap,
                         double stageSpan) const;
    [[nodiscard]] Memory freshAgent(EntityClass cls, uint32_t group) const;
    [[nodiscard]] Memory freshGroup(std::string name, EntityClass cls) const;
    [[nodiscard]] MemorySnapshot buildSnapshot() const;

    AIConfig config_;
    mutable std::shared_mutex mutex_;
    std::map<uint32_t, Memory> agents_;
    std::map<uint32_t, Memory> groups_;
    uint32_t nextGroupId_ = 1;
};

} // namespace evolve::game
