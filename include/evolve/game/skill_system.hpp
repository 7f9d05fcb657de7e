#pragma once

/// @file skill_system.hpp
/// @brief Skill usability checks, skill use, cooldowns, charges and combos.

#include <string_view>
#include <vector>

#include "evolve/ecs/component_storage.hpp"
#include "evolve/ecs/entity.hpp"
#include "evolve/ecs/system.hpp"
#include "evolve/foundation/game_result.hpp"
#include "evolve/game/catalog.hpp"
#include "evolve/game/combat_system.hpp"
#include "evolve/game/effect_system.hpp"
#include "evolve/game/game_events.hpp"
#include "evolve/game/sim_clock.hpp"
#include "evolve/game/skill_types.hpp"
#include "evolve/game/stat_system.hpp"
#include "evolve/game/trigger_system.hpp"
#include "evolve/game/world.hpp"

namespace evolve::game {

using SkillCatalog = Catalog<Skill, SkillId>;
using ComboCatalog = Catalog<ComboDefinition, ComboId>;

/// Resolves skill use for casters holding a SkillBook.
///
/// CanUse() never mutates state. Use() runs CanUse(), resolves targets,
/// honours cancellation, then commits: costs, cooldown, charges, GCD and
/// combo step. Effects are applied target by target, each followed by the
/// triggers its outcome raises; on_cast fires once at the end.
class SkillSystem final : public ecs::ISystem {
public:
    SkillSystem(SkillCatalog& skills,
                ComboCatalog& combos,
                ecs::ComponentStorage<SkillBook>& books,
                ecs::ComponentStorage<Vitals>& vitals,
                ecs::ComponentStorage<Faction>& factions,
                StatCache& stats,
                IWorldView& world,
                CombatSystem& combat,
                EffectSystem& effects,
                TriggerSystem& triggers,
                const SimClock& clock,
                GameEvents& events,
                SkillTuning tuning = {});

    SkillSystem(const SkillSystem&) = delete;
    SkillSystem& operator=(const SkillSystem&) = delete;

    /// Regenerate charges and drop expired or interrupted combos.
    void Execute(float deltaTime) override;

    [[nodiscard]] ecs::SystemStage GetStage() const override {
        return ecs::SystemStage::PreUpdate;
    }

    [[nodiscard]] std::string_view GetName() const override {
        return "SkillSystem";
    }

    /// @return The id, InvalidArgument, UnknownEffect or AlreadyExists.
    foundation::GameResult<SkillId> RegisterSkill(Skill skill);

    /// @return The id, InvalidArgument, UnknownSkill or AlreadyExists.
    foundation::GameResult<ComboId> RegisterCombo(ComboDefinition combo);

    /// Teach @p skill to @p caster with full charges.
    foundation::GameResult<void> Learn(ecs::Entity caster, SkillId skill);
    foundation::GameResult<void> Forget(ecs::Entity caster, SkillId skill);

    /// Check whether @p caster could use @p skill on @p target now.
    ///
    /// Checks in order: skill known, caster exists and knows it, caster
    /// alive and not stunned, resources, own cooldown or charges, GCD
    /// group, requirements, then target relation and range when @p target
    /// is valid.
    [[nodiscard]] foundation::GameResult<void> CanUse(
        SkillId skill, ecs::Entity caster,
        ecs::Entity target = ecs::Entity::invalid()) const;

    foundation::GameResult<SkillOutcome> Use(SkillId skill,
                                             ecs::Entity caster,
                                             const std::vector<ecs::Entity>& targets,
                                             const SkillContext& context = {});

    /// Seconds until @p skill is off both its own cooldown and its GCD.
    [[nodiscard]] float CooldownRemaining(ecs::Entity caster, SkillId skill) const;

    /// Charges available now.
    [[nodiscard]] int32_t AvailableCharges(ecs::Entity caster, SkillId skill) const;

    [[nodiscard]] const SkillBook* Book(ecs::Entity caster) const {
        return books_.TryGet(caster);
    }

    [[nodiscard]] const SkillCatalog& Skills() const noexcept { return skills_; }
    [[nodiscard]] const ComboCatalog& Combos() const noexcept { return combos_; }
    [[nodiscard]] const SkillTuning& Tuning() const noexcept { return tuning_; }

private:
    [[nodiscard]] bool allied(ecs::Entity a, ecs::Entity b) const;
    [[nodiscard]] int32_t chargesAt(const LearnedSkill& learned, const Skill& def,
                                    SimTime now) const;
    void settleCharges(LearnedSkill& learned, const Skill& def, SimTime now) const;

    foundation::GameResult<void> checkTarget(const Skill& def, ecs::Entity caster,
                                             ecs::Entity target) const;
    foundation::GameResult<std::vector<ecs::Entity>> resolveTargets(
        const Skill& def, ecs::Entity caster, const std::vector<ecs::Entity>& targets) const;

    /// Advance or reset the caster's combo for @p skill.
    /// @return The combo multiplier for this use.
    float advanceCombo(SkillBook& book, SkillId skill, SimTime now, int32_t& step);
    [[nodiscard]] float comboWindow(ComboId id) const;

    void fireOutcomeTriggers(const Skill& def, ecs::Entity caster, ecs::Entity target,
                             const ApplyOutcome& outcome, SkillOutcome& result);

    SkillCatalog& skills_;
    ComboCatalog& combos_;
    ecs::ComponentStorage<SkillBook>& books_;
    ecs::ComponentStorage<Vitals>& vitals_;
    ecs::ComponentStorage<Faction>& factions_;
    StatCache& stats_;
    IWorldView& world_;
    CombatSystem& combat_;
    EffectSystem& effects_;
    TriggerSystem& triggers_;
    const SimClock& clock_;
    GameEvents& events_;
    SkillTuning tuning_;
};

} // namespace evolve::game
