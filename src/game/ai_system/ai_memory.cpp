/// @file ai_memory.cpp
/// @brief AIMemoryStore implementation.

#include "evolve/game/ai_memory.hpp"

#include "evolve/foundation/game_logger.hpp"
#include "evolve/foundation/game_serializer.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>

namespace evolve::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::GameSerializer;
using foundation::LogCategory;

namespace {

constexpr int32_t kAgentStageCap = 10;
constexpr double kAgentStageSpan = 100.0;
constexpr int32_t kGroupStageCap = 5;
constexpr double kGroupStageSpan = 500.0;

bool unitRate(double rate) {
    return std::isfinite(rate) && rate >= 0.0 && rate <= 1.0;
}

GameError notRegistered(ecs::Entity entity) {
    return GameError(ErrorCode::AgentNotRegistered,
                     "entity " + std::to_string(entity.id()) + " has no AI memory");
}

GameError noGroup(MemoryGroupId group) {
    return GameError(ErrorCode::MemoryGroupNotFound,
                     "memory group " + std::to_string(group.value()) + " not found");
}

} // namespace

std::string_view agentStateName(AgentState state) {
    switch (state) {
        case AgentState::Idle:       return "idle";
        case AgentState::Evaluating: return "evaluating";
        case AgentState::Acting:     return "acting";
        case AgentState::Observing:  return "observing";
    }
    return "unknown";
}

std::string_view entityClassName(EntityClass cls) {
    switch (cls) {
        case EntityClass::Player:     return "player";
        case EntityClass::BasicEnemy: return "basic_enemy";
        case EntityClass::Chimera:    return "chimera";
        case EntityClass::Boss:       return "boss";
    }
    return "unknown";
}

GameResult<EntityClass> parseEntityClass(std::string_view name) {
    for (std::size_t i = 0; i < kEntityClassCount; ++i) {
        auto cls = static_cast<EntityClass>(i);
        if (entityClassName(cls) == name) {
            return GameResult<EntityClass>::ok(cls);
        }
    }
    return GameResult<EntityClass>::err(GameError(
        ErrorCode::InvalidArgument, "unknown entity class: " + std::string(name)));
}

AIMemoryStore::AIMemoryStore(AIConfig config) : config_(config) {}

// ── Registration ────────────────────────────────────────────────────────

AIMemoryStore::Memory AIMemoryStore::freshAgent(EntityClass cls, uint32_t group) const {
    Memory memory;
    memory.cls = cls;
    memory.group = group;
    memory.stats.learningRate = std::clamp(config_.LearningRateFor(cls), 0.0, 1.0);
    memory.stats.explorationRate = std::clamp(config_.explorationRate, 0.0, 1.0);
    return memory;
}

AIMemoryStore::Memory AIMemoryStore::freshGroup(std::string name, EntityClass cls) const {
    Memory memory;
    memory.cls = cls;
    memory.name = std::move(name);
    memory.stats.learningRate = std::clamp(config_.learningRate, 0.0, 1.0);
    memory.stats.explorationRate = std::clamp(config_.explorationRate, 0.0, 1.0);
    return memory;
}

GameResult<MemoryGroupId> AIMemoryStore::CreateGroup(std::string name, EntityClass cls) {
    std::unique_lock lock(mutex_);
    for (const auto& [id, group] : groups_) {
        if (group.name == name) {
            return GameResult<MemoryGroupId>::err(GameError(
                ErrorCode::AlreadyExists, "memory group '" + name + "' already exists"));
        }
    }
    MemoryGroupId id(nextGroupId_++);
    groups_.emplace(id.value(), freshGroup(std::move(name), cls));
    return GameResult<MemoryGroupId>::ok(id);
}

MemoryGroupId AIMemoryStore::FindGroup(std::string_view name) const {
    std::shared_lock lock(mutex_);
    for (const auto& [id, group] : groups_) {
        if (group.name == name) {
            return MemoryGroupId(id);
        }
    }
    return MemoryGroupId{};
}

GameResult<void> AIMemoryStore::Register(ecs::Entity entity, EntityClass cls,
                                         std::optional<MemoryGroupId> group) {
    std::unique_lock lock(mutex_);
    if (agents_.contains(entity.raw)) {
        return GameResult<void>::err(GameError(
            ErrorCode::AlreadyExists,
            "entity " + std::to_string(entity.id()) + " already has AI memory"));
    }
    uint32_t groupId = 0;
    if (group) {
        if (!groups_.contains(group->value())) {
            return GameResult<void>::err(noGroup(*group));
        }
        groupId = group->value();
    }
    agents_.emplace(entity.raw, freshAgent(cls, groupId));
    return GameResult<void>::ok();
}

void AIMemoryStore::Unregister(ecs::Entity entity) {
    std::unique_lock lock(mutex_);
    agents_.erase(entity.raw);
}

bool AIMemoryStore::IsRegistered(ecs::Entity entity) const {
    std::shared_lock lock(mutex_);
    return agents_.contains(entity.raw);
}

std::size_t AIMemoryStore::AgentCount() const {
    std::shared_lock lock(mutex_);
    return agents_.size();
}

std::size_t AIMemoryStore::GroupCount() const {
    std::shared_lock lock(mutex_);
    return groups_.size();
}

// ── Estimates ───────────────────────────────────────────────────────────

std::optional<double> AIMemoryStore::lookup(const Table& table, std::string_view state,
                                            uint32_t skill) {
    auto it = table.find(Key{std::string(state), skill});
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->second.value;
}

std::optional<double> AIMemoryStore::bestIn(const Table& table, std::string_view state) {
    std::optional<double> best;
    for (auto it = table.lower_bound(Key{std::string(state), 0u});
         it != table.end() && it->first.first == state; ++it) {
        best = best ? std::max(*best, it->second.value) : it->second.value;
    }
    return best;
}

double AIMemoryStore::Estimate(ecs::Entity entity, std::string_view state,
                               foundation::SkillId skill) const {
    std::shared_lock lock(mutex_);
    auto agent = agents_.find(entity.raw);
    if (agent == agents_.end()) {
        return config_.defaultValue;
    }
    if (auto own = lookup(agent->second.values, state, skill.value())) {
        return *own;
    }
    if (auto group = groups_.find(agent->second.group); group != groups_.end()) {
        if (auto shared = lookup(group->second.values, state, skill.value())) {
            return *shared;
        }
    }
    return config_.defaultValue;
}

std::optional<double> AIMemoryStore::EntityValue(ecs::Entity entity, std::string_view state,
                                                 foundation::SkillId skill) const {
    std::shared_lock lock(mutex_);
    auto agent = agents_.find(entity.raw);
    if (agent == agents_.end()) {
        return std::nullopt;
    }
    return lookup(agent->second.values, state, skill.value());
}

std::optional<double> AIMemoryStore::GroupValue(MemoryGroupId group, std::string_view state,
                                                foundation::SkillId skill) const {
    std::shared_lock lock(mutex_);
    auto it = groups_.find(group.value());
    if (it == groups_.end()) {
        return std::nullopt;
    }
    return lookup(it->second.values, state, skill.value());
}

// ── Learning ────────────────────────────────────────────────────────────

void AIMemoryStore::advanceCounters(LearningStats& stats, double reward, int32_t stageCap,
                                    double stageSpan) const {
    ++stats.totalActions;
    if (reward > 0.0) {
        ++stats.successfulActions;
    } else {
        ++stats.failedActions;
    }
    stats.totalReward += reward;
    stats.experience += 1.0 + std::max(reward, 0.0);
    stats.evolutionStage = std::min(
        stageCap, 1 + static_cast<int32_t>(std::floor(stats.experience / stageSpan)));

    stats.explorationRate = std::clamp(
        std::max(config_.minExplorationRate, stats.explorationRate * config_.explorationDecay),
        0.0, 1.0);
    if (stats.totalActions >= config_.decayAfterActions) {
        stats.learningRate = std::clamp(
            std::max(config_.minLearningRate, stats.learningRate * config_.learningRateDecay),
            0.0, 1.0);
    }
}

GameResult<void> AIMemoryStore::RecordOutcome(ecs::Entity entity,
                                              const std::string& state,
                                              foundation::SkillId skill,
                                              double reward,
                                              const std::string& nextState) {
    if (!std::isfinite(reward)) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument, "reward must be finite"));
    }

    std::unique_lock lock(mutex_);
    auto agentIt = agents_.find(entity.raw);
    if (agentIt == agents_.end()) {
        return GameResult<void>::err(notRegistered(entity));
    }
    Memory& agent = agentIt->second;
    Memory* group = nullptr;
    if (auto it = groups_.find(agent.group); it != groups_.end()) {
        group = &it->second;
    }

    const uint32_t action = skill.value();
    double current = config_.defaultValue;
    if (auto own = lookup(agent.values, state, action)) {
        current = *own;
    } else if (group != nullptr) {
        current = lookup(group->values, state, action).value_or(config_.defaultValue);
    }

    std::optional<double> maxNext = bestIn(agent.values, nextState);
    if (group != nullptr) {
        if (auto shared = bestIn(group->values, nextState)) {
            maxNext = maxNext ? std::max(*maxNext, *shared) : *shared;
        }
    }

    const double target = reward + config_.discount * maxNext.value_or(config_.defaultValue);
    const double updated = current + agent.stats.learningRate * (target - current);

    auto& cell = agent.values[Key{state, action}];
    cell.value = updated;
    ++cell.visits;
    advanceCounters(agent.stats, reward, kAgentStageCap, kAgentStageSpan);

    if (group != nullptr) {
        auto& shared = group->values[Key{state, action}];
        const double weight = static_cast<double>(shared.visits);
        shared.value = (shared.value * weight + updated) / (weight + 1.0);
        ++shared.visits;
        advanceCounters(group->stats, reward, kGroupStageCap, kGroupStageSpan);
    }

    EVOLVE_LOG_TRACE(LogCategory::AI,
                     "entity " + std::to_string(entity.id()) + " " + state + "/" +
                         std::to_string(action) + " -> " + std::to_string(updated));
    return GameResult<void>::ok();
}

GameResult<LearningStats> AIMemoryStore::Stats(ecs::Entity entity) const {
    std::shared_lock lock(mutex_);
    auto it = agents_.find(entity.raw);
    if (it == agents_.end()) {
        return GameResult<LearningStats>::err(notRegistered(entity));
    }
    return GameResult<LearningStats>::ok(it->second.stats);
}

GameResult<LearningStats> AIMemoryStore::GroupStats(MemoryGroupId group) const {
    std::shared_lock lock(mutex_);
    auto it = groups_.find(group.value());
    if (it == groups_.end()) {
        return GameResult<LearningStats>::err(noGroup(group));
    }
    return GameResult<LearningStats>::ok(it->second.stats);
}

GameResult<void> AIMemoryStore::ResetEntity(ecs::Entity entity) {
    std::unique_lock lock(mutex_);
    auto it = agents_.find(entity.raw);
    if (it == agents_.end()) {
        return GameResult<void>::err(notRegistered(entity));
    }
    it->second = freshAgent(it->second.cls, it->second.group);
    return GameResult<void>::ok();
}

GameResult<void> AIMemoryStore::ResetGroup(MemoryGroupId group) {
    std::unique_lock lock(mutex_);
    auto it = groups_.find(group.value());
    if (it == groups_.end()) {
        return GameResult<void>::err(noGroup(group));
    }
    it->second = freshGroup(std::move(it->second.name), it->second.cls);
    EVOLVE_LOG_INFO(LogCategory::AI, "memory group " + it->second.name + " reset");
    return GameResult<void>::ok();
}

// ── Persistence ─────────────────────────────────────────────────────────

MemorySnapshot AIMemoryStore::buildSnapshot() const {
    auto toRecord = [](MemoryOwner kind, uint32_t id, const Memory& memory) {
        MemoryRecord record;
        record.ownerKind = kind;
        record.ownerId = id;
        record.groupId = memory.group;
        record.name = memory.name;
        record.entityClass = memory.cls;
        record.stats = memory.stats;
        record.entries.reserve(memory.values.size());
        for (const auto& [key, cell] : memory.values) {
            record.entries.push_back(ValueEntry{key.first, key.second, cell.value, cell.visits});
        }
        return record;
    };

    MemorySnapshot snapshot;
    for (const auto& [id, group] : groups_) {
        snapshot.records.push_back(toRecord(MemoryOwner::Group, id, group));
    }
    for (const auto& [raw, agent] : agents_) {
        snapshot.records.push_back(toRecord(MemoryOwner::Entity, raw, agent));
    }
    return snapshot;
}

std::vector<uint8_t> AIMemoryStore::Snapshot() const {
    std::shared_lock lock(mutex_);
    return GameSerializer::instance().serializeBinary(buildSnapshot());
}

std::string AIMemoryStore::ExportJson() const {
    std::shared_lock lock(mutex_);
    return GameSerializer::instance().serializeJson(buildSnapshot());
}

GameResult<void> AIMemoryStore::Restore(std::span<const uint8_t> blob) {
    auto decoded = GameSerializer::instance().deserializeBinary<MemorySnapshot>(blob);
    if (!decoded) {
        EVOLVE_LOG_FAILURE(LogCategory::Persistence, "AI memory restore", decoded.error());
        return GameResult<void>::err(decoded.error());
    }

    std::map<uint32_t, Memory> agents;
    std::map<uint32_t, Memory> groups;
    uint32_t maxGroup = 0;
    for (auto& record : decoded.value().records) {
        if (static_cast<std::size_t>(record.entityClass) >= kEntityClassCount ||
            (record.ownerKind != MemoryOwner::Entity && record.ownerKind != MemoryOwner::Group)) {
            return GameResult<void>::err(GameError(
                ErrorCode::InvalidArgument, "AI memory record has an unknown class or owner"));
        }
        if (!unitRate(record.stats.learningRate) || !unitRate(record.stats.explorationRate)) {
            return GameResult<void>::err(GameError(
                ErrorCode::InvalidArgument,
                "AI memory record " + std::to_string(record.ownerId) +
                    " has a learning or exploration rate outside [0,1]"));
        }
        Memory memory;
        memory.cls = record.entityClass;
        memory.group = record.groupId;
        memory.name = std::move(record.name);
        memory.stats = record.stats;
        for (auto& entry : record.entries) {
            memory.values[Key{std::move(entry.state), entry.skill}] =
                Cell{entry.value, entry.visits};
        }
        if (record.ownerKind == MemoryOwner::Group) {
            maxGroup = std::max(maxGroup, record.ownerId);
            groups[record.ownerId] = std::move(memory);
        } else {
            agents[record.ownerId] = std::move(memory);
        }
    }

    for (const auto& [raw, agent] : agents) {
        if (agent.group != 0 && !groups.contains(agent.group)) {
            return GameResult<void>::err(GameError(
                ErrorCode::InvalidArgument,
                "AI memory record " + std::to_string(raw) + " names missing group " +
                    std::to_string(agent.group)));
        }
    }

    std::unique_lock lock(mutex_);
    agents_ = std::move(agents);
    groups_ = std::move(groups);
    nextGroupId_ = maxGroup + 1;
    EVOLVE_LOG_INFO(LogCategory::Persistence,
                    "AI memory restored: " + std::to_string(agents_.size()) + " agents, " +
                        std::to_string(groups_.size()) + " groups");
    return GameResult<void>::ok();
}

} // namespace evolve::game
