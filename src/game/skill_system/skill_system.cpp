/// @file skill_system.cpp
/// @brief SkillSystem implementation.
///
/// Use() pipeline:
///   1. CanUse() (read-only)
///   2. Target resolution by TargetSelection
///   3. Cancellation check, the last point where nothing has changed
///   4. Commit costs, cooldown, charges, GCD and combo step
///   5. Apply effects per target, firing outcome triggers after each
///   6. on_cast, SkillUsed event

#include "evolve/game/skill_system.hpp"

#include "evolve/foundation/game_logger.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace evolve::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

bool nonNegative(float value) {
    return std::isfinite(value) && value >= 0.0f;
}

GameError skillError(ErrorCode code, const Skill& skill, const std::string& what) {
    return GameError(code, skill.name + ": " + what);
}

void append(std::vector<EffectApplicationResult>& into,
            std::vector<EffectApplicationResult>&& from) {
    into.insert(into.end(), std::make_move_iterator(from.begin()),
                std::make_move_iterator(from.end()));
}

} // namespace

std::string_view skillTypeName(SkillType type) {
    switch (type) {
        case SkillType::Attack:   return "attack";
        case SkillType::Heal:     return "heal";
        case SkillType::Buff:     return "buff";
        case SkillType::Debuff:   return "debuff";
        case SkillType::Utility:  return "utility";
        case SkillType::Movement: return "movement";
        case SkillType::Summon:   return "summon";
    }
    return "unknown";
}

SkillSystem::SkillSystem(SkillCatalog& skills,
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
                         SkillTuning tuning)
    : skills_(skills),
      combos_(combos),
      books_(books),
      vitals_(vitals),
      factions_(factions),
      stats_(stats),
      world_(world),
      combat_(combat),
      effects_(effects),
      triggers_(triggers),
      clock_(clock),
      events_(events),
      tuning_(tuning) {}

// ── Registration ────────────────────────────────────────────────────────

GameResult<SkillId> SkillSystem::RegisterSkill(Skill skill) {
    if (skill.name.empty()) {
        return GameResult<SkillId>::err(
            GameError(ErrorCode::InvalidArgument, "skill name must not be empty"));
    }
    for (auto effect : skill.effects) {
        if (effects_.Templates().Find(effect) == nullptr) {
            return GameResult<SkillId>::err(skillError(
                ErrorCode::UnknownEffect, skill,
                "unknown effect " + std::to_string(effect.value())));
        }
    }

    const auto& cost = skill.cost;
    const auto& cd = skill.cooldown;
    const auto& range = skill.range;
    if (!nonNegative(cost.mana) || !nonNegative(cost.stamina) || !nonNegative(cost.health)) {
        return GameResult<SkillId>::err(
            skillError(ErrorCode::InvalidArgument, skill, "costs must be >= 0"));
    }
    if (!nonNegative(cd.cooldown) || !nonNegative(cd.gcd) || !nonNegative(cd.chargeRegenTime) ||
        cd.maxCharges < 1 || (cd.maxCharges > 1 && cd.RegenInterval() <= 0.0f)) {
        return GameResult<SkillId>::err(
            skillError(ErrorCode::InvalidArgument, skill, "invalid cooldown or charges"));
    }
    if (!nonNegative(range.min) || !nonNegative(range.max) || !nonNegative(range.areaRadius) ||
        (range.max > 0.0f && range.min > range.max) ||
        (skill.targeting == TargetSelection::Area && range.areaRadius <= 0.0f)) {
        return GameResult<SkillId>::err(
            skillError(ErrorCode::InvalidArgument, skill, "invalid range"));
    }

    auto id = skills_.Add(std::move(skill));
    if (id) {
        EVOLVE_LOG_DEBUG(LogCategory::Skill,
                         "registered skill " + skills_.Find(id.value())->name);
    }
    return id;
}

GameResult<ComboId> SkillSystem::RegisterCombo(ComboDefinition combo) {
    if (combo.name.empty() || combo.chain.empty()) {
        return GameResult<ComboId>::err(GameError(
            ErrorCode::InvalidArgument, "combo needs a name and at least one skill"));
    }
    for (auto skill : combo.chain) {
        if (skills_.Find(skill) == nullptr) {
            return GameResult<ComboId>::err(GameError(
                ErrorCode::UnknownSkill,
                "combo '" + combo.name + "' references unknown skill " +
                    std::to_string(skill.value())));
        }
    }
    if ((combo.window && !nonNegative(*combo.window)) ||
        (combo.bonus && !nonNegative(*combo.bonus))) {
        return GameResult<ComboId>::err(GameError(
            ErrorCode::InvalidArgument, "combo '" + combo.name + "': negative window or bonus"));
    }
    return combos_.Add(std::move(combo));
}

GameResult<void> SkillSystem::Learn(ecs::Entity caster, SkillId skill) {
    const Skill* def = skills_.Find(skill);
    if (def == nullptr) {
        return GameResult<void>::err(GameError(
            ErrorCode::UnknownSkill, "unknown skill " + std::to_string(skill.value())));
    }
    if (auto attrs = world_.GetAttributes(caster); !attrs) {
        return GameResult<void>::err(attrs.error());
    }
    auto& book = books_.GetOrAdd(caster);
    if (book.Find(skill) != nullptr) {
        return GameResult<void>::err(
            skillError(ErrorCode::AlreadyExists, *def, "already learned"));
    }
    book.skills.push_back(LearnedSkill{skill, std::nullopt, def->cooldown.maxCharges,
                                       clock_.Now()});
    return GameResult<void>::ok();
}

GameResult<void> SkillSystem::Forget(ecs::Entity caster, SkillId skill) {
    auto* book = books_.TryGet(caster);
    if (book == nullptr || book->Find(skill) == nullptr) {
        return GameResult<void>::err(GameError(
            ErrorCode::SkillNotLearned, "skill " + std::to_string(skill.value()) + " not learned"));
    }
    std::erase_if(book->skills, [skill](const LearnedSkill& s) { return s.skill == skill; });
    return GameResult<void>::ok();
}

// ── Charges ─────────────────────────────────────────────────────────────

int32_t SkillSystem::chargesAt(const LearnedSkill& learned, const Skill& def,
                               SimTime now) const {
    const int32_t max = def.cooldown.maxCharges;
    if (learned.charges >= max) {
        return max;
    }
    const SimTime interval = def.cooldown.RegenInterval();
    if (interval <= 0.0) {
        return max;
    }
    auto gained = static_cast<int32_t>(
        std::floor((now - learned.chargeRegenStart + kTimeEpsilon) / interval));
    return std::min(max, learned.charges + std::max(gained, 0));
}

void SkillSystem::settleCharges(LearnedSkill& learned, const Skill& def, SimTime now) const {
    const int32_t max = def.cooldown.maxCharges;
    const SimTime interval = def.cooldown.RegenInterval();
    if (learned.charges >= max || interval <= 0.0) {
        learned.charges = max;
        learned.chargeRegenStart = now;
        return;
    }
    auto gained = static_cast<int32_t>(
        std::floor((now - learned.chargeRegenStart + kTimeEpsilon) / interval));
    if (gained <= 0) {
        return;
    }
    learned.charges = std::min(max, learned.charges + gained);
    learned.chargeRegenStart = learned.charges >= max
                                   ? now
                                   : learned.chargeRegenStart + gained * interval;
}

int32_t SkillSystem::AvailableCharges(ecs::Entity caster, SkillId skill) const {
    const auto* book = books_.TryGet(caster);
    const auto* learned = book != nullptr ? book->Find(skill) : nullptr;
    const Skill* def = skills_.Find(skill);
    if (learned == nullptr || def == nullptr) {
        return 0;
    }
    return chargesAt(*learned, *def, clock_.Now());
}

float SkillSystem::CooldownRemaining(ecs::Entity caster, SkillId skill) const {
    const auto* book = books_.TryGet(caster);
    const auto* learned = book != nullptr ? book->Find(skill) : nullptr;
    const Skill* def = skills_.Find(skill);
    if (learned == nullptr || def == nullptr) {
        return 0.0f;
    }
    const SimTime now = clock_.Now();

    SimTime own = 0.0;
    if (def->cooldown.maxCharges > 1) {
        if (chargesAt(*learned, *def, now) == 0) {
            own = learned->chargeRegenStart + def->cooldown.RegenInterval() - now;
        }
    } else if (learned->lastUsed) {
        own = *learned->lastUsed + def->cooldown.cooldown - now;
    }

    SimTime global = 0.0;
    if (!def->cooldown.gcdGroup.empty()) {
        if (auto it = book->gcdLastUse.find(def->cooldown.gcdGroup); it != book->gcdLastUse.end()) {
            global = it->second + def->cooldown.gcd - now;
        }
    }
    return static_cast<float>(std::max({own, global, 0.0}));
}

// ── Usability ───────────────────────────────────────────────────────────

bool SkillSystem::allied(ecs::Entity a, ecs::Entity b) const {
    const auto* fa = factions_.TryGet(a);
    const auto* fb = factions_.TryGet(b);
    return (fa != nullptr ? fa->team : 0u) == (fb != nullptr ? fb->team : 0u);
}

GameResult<void> SkillSystem::CanUse(SkillId skill, ecs::Entity caster, ecs::Entity target) const {
    const Skill* def = skills_.Find(skill);
    if (def == nullptr) {
        return GameResult<void>::err(GameError(
            ErrorCode::UnknownSkill, "unknown skill " + std::to_string(skill.value())));
    }
    if (auto attrs = world_.GetAttributes(caster); !attrs) {
        return GameResult<void>::err(attrs.error());
    }
    const auto* book = books_.TryGet(caster);
    const auto* learned = book != nullptr ? book->Find(skill) : nullptr;
    if (learned == nullptr) {
        return GameResult<void>::err(
            skillError(ErrorCode::SkillNotLearned, *def, "not learned"));
    }

    const auto* vitals = vitals_.TryGet(caster);
    if (vitals == nullptr || !vitals->IsAlive() || vitals->IsStunned()) {
        return GameResult<void>::err(
            skillError(ErrorCode::CasterIncapacitated, *def, "caster cannot act"));
    }

    const auto& cost = def->cost;
    if (vitals->mana < cost.mana || vitals->stamina < cost.stamina ||
        (cost.health > 0.0f && vitals->health <= cost.health)) {
        return GameResult<void>::err(
            skillError(ErrorCode::InsufficientResources, *def, "insufficient resources"));
    }

    const SimTime now = clock_.Now();
    if (def->cooldown.maxCharges > 1) {
        if (chargesAt(*learned, *def, now) <= 0) {
            return GameResult<void>::err(
                skillError(ErrorCode::OnCooldown, *def, "no charges left"));
        }
    } else if (learned->lastUsed &&
               now - *learned->lastUsed + kTimeEpsilon < def->cooldown.cooldown) {
        return GameResult<void>::err(skillError(ErrorCode::OnCooldown, *def, "on cooldown"));
    }

    if (!def->cooldown.gcdGroup.empty()) {
        auto it = book->gcdLastUse.find(def->cooldown.gcdGroup);
        if (it != book->gcdLastUse.end() && now - it->second + kTimeEpsilon < def->cooldown.gcd) {
            return GameResult<void>::err(
                skillError(ErrorCode::OnCooldown, *def, "global cooldown active"));
        }
    }

    const auto& req = def->requirements;
    if (req.level > 0 || !req.attributes.empty()) {
        auto attrs = stats_.EffectiveAttributes(caster);
        if (!attrs) {
            return GameResult<void>::err(attrs.error());
        }
        if (attrs.value().level < req.level) {
            return GameResult<void>::err(
                skillError(ErrorCode::RequirementsNotMet, *def, "level too low"));
        }
        for (const auto& [attr, minimum] : req.attributes) {
            if (attrs.value().Get(attr) < minimum) {
                return GameResult<void>::err(skillError(
                    ErrorCode::RequirementsNotMet, *def,
                    std::string(attributeName(attr)) + " too low"));
            }
        }
    }
    for (auto effect : req.requiredEffects) {
        if (!effects_.HasEffect(caster, effect)) {
            return GameResult<void>::err(
                skillError(ErrorCode::RequirementsNotMet, *def, "required effect missing"));
        }
    }

    if (target.isValid()) {
        return checkTarget(*def, caster, target);
    }
    return GameResult<void>::ok();
}

GameResult<void> SkillSystem::checkTarget(const Skill& def, ecs::Entity caster,
                                          ecs::Entity target) const {
    switch (def.targeting) {
        case TargetSelection::Self:
        case TargetSelection::AllEnemies:
        case TargetSelection::AllAllies:
            return GameResult<void>::ok();
        case TargetSelection::SingleEnemy:
        case TargetSelection::SingleAlly:
        case TargetSelection::Area:
            break;
    }

    if (auto attrs = world_.GetAttributes(target); !attrs) {
        return GameResult<void>::err(
            skillError(ErrorCode::InvalidTarget, def, "target does not exist"));
    }
    if (def.targeting != TargetSelection::Area) {
        const auto* v = vitals_.TryGet(target);
        if (v == nullptr || !v->IsAlive()) {
            return GameResult<void>::err(
                skillError(ErrorCode::InvalidTarget, def, "target is not a living combatant"));
        }
        bool friendly = allied(caster, target);
        if (def.targeting == TargetSelection::SingleEnemy && (target == caster || friendly)) {
            return GameResult<void>::err(
                skillError(ErrorCode::InvalidTarget, def, "target is not hostile"));
        }
        if (def.targeting == TargetSelection::SingleAlly && !friendly) {
            return GameResult<void>::err(
                skillError(ErrorCode::InvalidTarget, def, "target is not friendly"));
        }
    }

    if (def.range.max > 0.0f || def.range.min > 0.0f) {
        auto from = world_.GetPosition(caster);
        auto to = world_.GetPosition(target);
        if (!from || !to) {
            return GameResult<void>::err(
                skillError(ErrorCode::InvalidTarget, def, "position unknown"));
        }
        if (!WithinBand(from.value(), to.value(), def.range.min, def.range.max)) {
            return GameResult<void>::err(skillError(ErrorCode::OutOfRange, def, "out of range"));
        }
    }
    return GameResult<void>::ok();
}

GameResult<std::vector<ecs::Entity>> SkillSystem::resolveTargets(
    const Skill& def, ecs::Entity caster, const std::vector<ecs::Entity>& requested) const {
    using Targets = GameResult<std::vector<ecs::Entity>>;
    std::vector<ecs::Entity> resolved;

    switch (def.targeting) {
        case TargetSelection::Self:
            resolved.push_back(caster);
            break;

        case TargetSelection::SingleEnemy:
        case TargetSelection::SingleAlly: {
            if (requested.size() != 1) {
                return Targets::err(
                    skillError(ErrorCode::InvalidTarget, def, "exactly one target required"));
            }
            if (auto ok = checkTarget(def, caster, requested.front()); !ok) {
                return Targets::err(ok.error());
            }
            resolved.push_back(requested.front());
            break;
        }

        case TargetSelection::AllEnemies:
        case TargetSelection::AllAllies:
        case TargetSelection::Area: {
            ecs::Entity anchor = caster;
            float radius = def.range.max;
            const bool wantAllies = def.targeting == TargetSelection::AllAllies;
            if (def.targeting == TargetSelection::Area) {
                if (requested.empty()) {
                    return Targets::err(
                        skillError(ErrorCode::InvalidTarget, def, "area needs a center"));
                }
                if (auto ok = checkTarget(def, caster, requested.front()); !ok) {
                    return Targets::err(ok.error());
                }
                anchor = requested.front();
                radius = def.range.areaRadius;
            }
            auto center = world_.GetPosition(anchor);
            if (!center) {
                return Targets::err(
                    skillError(ErrorCode::InvalidTarget, def, "position unknown"));
            }

            for (std::size_t i = 0; i < vitals_.Size(); ++i) {
                auto entity = vitals_.EntityAt(i);
                if (!vitals_.Get(entity).IsAlive()) {
                    continue;
                }
                bool friendly = allied(caster, entity);
                if (wantAllies ? !friendly : (friendly || entity == caster)) {
                    continue;
                }
                if (radius > 0.0f) {
                    auto pos = world_.GetPosition(entity);
                    if (!pos || !WithinRadius(center.value(), pos.value(), radius)) {
                        continue;
                    }
                }
                resolved.push_back(entity);
            }
            std::sort(resolved.begin(), resolved.end());
            break;
        }
    }

    if (resolved.empty()) {
        return Targets::err(skillError(ErrorCode::InvalidTarget, def, "no valid targets"));
    }
    return Targets::ok(std::move(resolved));
}

// ── Combo ───────────────────────────────────────────────────────────────

float SkillSystem::comboWindow(ComboId id) const {
    const auto* combo = combos_.Find(id);
    return combo != nullptr ? combo->window.value_or(tuning_.comboWindow) : tuning_.comboWindow;
}

float SkillSystem::advanceCombo(SkillBook& book, SkillId skill, SimTime now, int32_t& step) {
    auto& state = book.combo;

    if (state.Active()) {
        const auto* combo = combos_.Find(state.combo);
        bool inWindow = combo != nullptr &&
                        now - state.lastHit <= comboWindow(state.combo) + kTimeEpsilon;
        auto next = static_cast<std::size_t>(state.step);
        if (inWindow && next < combo->chain.size() && combo->chain[next] == skill) {
            ++state.step;
            state.lastHit = now;
        } else {
            state.Reset();
        }
    }

    if (!state.Active()) {
        for (const auto& combo : combos_) {
            if (combo.chain.front() == skill) {
                state.combo = combo.id;
                state.step = 1;
                state.lastHit = now;
                break;
            }
        }
    }

    step = state.step;
    if (!state.Active()) {
        return 1.0f;
    }

    const auto* combo = combos_.Find(state.combo);
    const float bonus = combo->bonus.value_or(tuning_.comboBonus);
    const float multiplier = 1.0f + bonus * static_cast<float>(state.step - 1);
    if (static_cast<std::size_t>(state.step) >= combo->chain.size()) {
        EVOLVE_LOG_DEBUG(LogCategory::Skill, "combo " + combo->name + " completed");
        state.Reset();
    }
    return multiplier;
}

// ── Use ─────────────────────────────────────────────────────────────────

GameResult<SkillOutcome> SkillSystem::Use(SkillId skill,
                                          ecs::Entity caster,
                                          const std::vector<ecs::Entity>& targets,
                                          const SkillContext& context) {
    auto usable = CanUse(skill, caster,
                         targets.empty() ? ecs::Entity::invalid() : targets.front());
    if (!usable) {
        EVOLVE_LOG_FAILURE(LogCategory::Skill, "use of skill " + std::to_string(skill.value()),
                           usable.error());
        return GameResult<SkillOutcome>::err(usable.error());
    }
    const Skill& def = *skills_.Find(skill);

    auto resolved = resolveTargets(def, caster, targets);
    if (!resolved) {
        EVOLVE_LOG_FAILURE(LogCategory::Skill, def.name, resolved.error());
        return GameResult<SkillOutcome>::err(resolved.error());
    }
    if (context.cancel != nullptr && context.cancel->IsCancelled()) {
        return GameResult<SkillOutcome>::err(
            skillError(ErrorCode::ActionCancelled, def, "cancelled before commit"));
    }

    // Commit.
    const SimTime now = clock_.Now();
    auto& vitals = vitals_.Get(caster);
    vitals.SetMana(vitals.mana - def.cost.mana);
    vitals.SetStamina(vitals.stamina - def.cost.stamina);
    vitals.SetHealth(vitals.health - def.cost.health);

    auto& book = books_.Get(caster);
    auto* learned = book.Find(skill);
    settleCharges(*learned, def, now);
    --learned->charges;
    learned->lastUsed = now;
    if (!def.cooldown.gcdGroup.empty()) {
        book.gcdLastUse[def.cooldown.gcdGroup] = now;
    }

    SkillOutcome outcome;
    outcome.skill = skill;
    outcome.caster = caster;
    outcome.targets = resolved.value();
    outcome.multiplier = advanceCombo(book, skill, now, outcome.comboStep);

    EffectContext effectContext;
    effectContext.isPvp = context.isPvp;
    effectContext.powerMultiplier = outcome.multiplier;
    if (!def.scaling.IsZero()) {
        auto attrs = stats_.EffectiveAttributes(caster);
        auto stats = stats_.Get(caster);
        if (attrs && stats) {
            effectContext.bonusMagnitude = def.scaling.Evaluate(attrs.value(), stats.value());
        }
    }

    std::vector<EffectId> onTargets;
    std::vector<EffectId> onSelf;
    for (auto effect : def.effects) {
        const Effect* tmpl = effects_.Templates().Find(effect);
        (tmpl != nullptr && tmpl->target == TargetType::Self ? onSelf : onTargets).push_back(effect);
    }

    for (auto target : outcome.targets) {
        float dealt = 0.0f;
        bool crit = false;
        bool landed = false;
        for (auto effect : onTargets) {
            auto applied = effects_.Apply(effect, caster, target, effectContext);
            if (applied) {
                landed = true;
                const auto& damage = applied.value().damage;
                if (damage && !damage->isDodged) {
                    dealt += damage->finalDamage;
                    crit = crit || damage->isCrit;
                }
                fireOutcomeTriggers(def, caster, target, applied.value(), outcome);
            }
            outcome.applications.push_back(
                EffectApplicationResult{effect, target, ProcId{}, std::move(applied)});
        }
        if (def.weaponAttack && landed) {
            TriggerContext hit{dealt, crit, skill};
            append(outcome.procs, triggers_.Fire(TriggerCondition::OnHit, caster, target, hit));
        }
    }
    for (auto effect : onSelf) {
        auto applied = effects_.Apply(effect, caster, caster, effectContext);
        if (applied) {
            fireOutcomeTriggers(def, caster, caster, applied.value(), outcome);
        }
        outcome.applications.push_back(
            EffectApplicationResult{effect, caster, ProcId{}, std::move(applied)});
    }

    TriggerContext cast{0.0f, false, skill};
    append(outcome.procs,
           triggers_.Fire(TriggerCondition::OnCast, caster, outcome.targets.front(), cast));

    EVOLVE_LOG_DEBUG(LogCategory::Skill,
                     def.name + " used by entity " + std::to_string(caster.id()) +
                         " on " + std::to_string(outcome.targets.size()) + " target(s)");
    events_.skillUsed.emit(
        SkillUsedEvent{skill, caster, outcome.targets, outcome.comboStep});
    return GameResult<SkillOutcome>::ok(std::move(outcome));
}

void SkillSystem::fireOutcomeTriggers(const Skill& def,
                                      ecs::Entity caster,
                                      ecs::Entity target,
                                      const ApplyOutcome& applied,
                                      SkillOutcome& outcome) {
    if (applied.damage && !applied.damage->isDodged) {
        const auto& damage = *applied.damage;
        TriggerContext hit{damage.finalDamage, damage.isCrit, def.id};
        outcome.totalDamage += damage.finalDamage;

        if (damage.isCrit) {
            ++outcome.crits;
            append(outcome.procs, triggers_.Fire(TriggerCondition::OnCrit, caster, target, hit));
        }
        if (damage.finalDamage > 0.0f) {
            append(outcome.procs,
                   triggers_.Fire(TriggerCondition::OnDamageTaken, target, caster, hit));
        }
        if (damage.isKill) {
            ++outcome.kills;
            append(outcome.procs, triggers_.Fire(TriggerCondition::OnKill, caster, target, hit));
        } else if (const auto* v = vitals_.TryGet(target); v != nullptr && v->maxHealth > 0.0f) {
            const float threshold = combat_.Tuning().lowHealthThreshold;
            const float before = (damage.healthAfter + damage.finalDamage) / v->maxHealth;
            const float after = damage.healthAfter / v->maxHealth;
            if (before > threshold && after <= threshold) {
                append(outcome.procs,
                       triggers_.Fire(TriggerCondition::OnLowHealth, target, caster, hit));
            }
        }
    }

    if (applied.amount > 0.0f) {
        outcome.totalHealing += applied.amount;
        TriggerContext heal{applied.amount, false, def.id};
        append(outcome.procs, triggers_.Fire(TriggerCondition::OnHeal, caster, target, heal));
    }
}

// ── Tick ────────────────────────────────────────────────────────────────

void SkillSystem::Execute(float /*deltaTime*/) {
    const SimTime now = clock_.Now();
    for (std::size_t i = 0; i < books_.Size(); ++i) {
        auto caster = books_.EntityAt(i);
        auto& book = books_.Get(caster);

        for (auto& learned : book.skills) {
            if (const Skill* def = skills_.Find(learned.skill); def != nullptr) {
                settleCharges(learned, *def, now);
            }
        }

        if (!book.combo.Active()) {
            continue;
        }
        const auto* vitals = vitals_.TryGet(caster);
        bool interrupted = vitals != nullptr && (vitals->IsStunned() || !vitals->IsAlive());
        bool expired = now - book.combo.lastHit > comboWindow(book.combo.combo) + kTimeEpsilon;
        if (interrupted || expired) {
            EVOLVE_LOG_TRACE(LogCategory::Skill,
                             "combo reset for entity " + std::to_string(caster.id()));
            book.combo.Reset();
        }
    }
}

} // namespace evolve::game
