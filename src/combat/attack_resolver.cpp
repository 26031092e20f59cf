/// @file attack_resolver.cpp
/// @brief AttackResolver implementation.

#include "dcc/combat/attack_resolver.hpp"

#include <unordered_set>

#include "dcc/combat/condition_engine.hpp"

using dcc::foundation::EngineError;
using dcc::foundation::EngineResult;
using dcc::foundation::ErrorCode;

namespace dcc::combat {

AttackResolver::AttackResolver(ParticipantStore& store, uint32_t round, DiceSource& dice)
    : store_(store), round_(round), dice_(dice) {}

// ── Single target ───────────────────────────────────────────────────────

EngineResult<AttackResult> AttackResolver::ResolveAttack(const AttackRequest& request) {
    using Result = EngineResult<AttackResult>;

    if (request.damageRoll < 0) {
        return Result::err(EngineError(ErrorCode::NegativeAmount,
                                       "damage roll must be >= 0"));
    }
    if (request.isNatural20 && request.isNatural1) {
        return Result::err(EngineError(ErrorCode::InvalidArgument,
                                       "a roll cannot be both a natural 20 and a natural 1"));
    }

    auto attacker = store_.RequireActive(request.attacker);
    if (!attacker) {
        return Result::err(attacker.error());
    }
    auto target = store_.RequireActive(request.target);
    if (!target) {
        return Result::err(target.error());
    }
    if (attacker.value()->status.IsDead()) {
        return Result::err(EngineError(ErrorCode::ParticipantDead,
                                       attacker.value()->name + " is dead"));
    }
    if (target.value()->status.IsDead()) {
        return Result::err(EngineError(ErrorCode::ParticipantDead,
                                       target.value()->name + " is dead"));
    }

    ConditionEngine conditions(store_, round_);
    auto targetEffects = ConditionEngine::Collect(store_.ActiveConditions(request.target));

    AttackResult result;
    result.attacker = request.attacker;
    result.target = request.target;
    result.attackRollTotal = request.attackRollTotal;
    result.targetAC = request.targetAC.value_or(target.value()->stats.armorClass);
    result.rollMode = conditions.AttackRollMode(request.attacker, request.target, request.melee);
    result.targetGrantsCritical = request.melee && targetEffects.criticalWithinFiveFeet;

    if (request.isNatural20) {
        result.hit = true;
    } else if (request.isNatural1) {
        result.hit = false;
    } else {
        result.hit = request.attackRollTotal >= result.targetAC;
    }
    result.critical = result.hit &&
                      (request.isNatural20 || request.isCritical || result.targetGrantsCritical);

    if (!result.hit) {
        return Result::ok(std::move(result));
    }

    DamageRequest damage;
    damage.target = request.target;
    damage.amount = request.damageRoll;
    damage.type = request.damageType;
    damage.source = request.attacker;
    damage.description = request.description.empty()
                             ? "attack by " + attacker.value()->name
                             : request.description;
    damage.isCritical = result.critical;

    DamageResolver resolver(store_, round_);
    auto applied = resolver.ApplyDamage(damage);
    if (!applied) {
        return Result::err(applied.error());
    }
    result.damage = applied.value();
    return Result::ok(std::move(result));
}

// ── Area of effect ──────────────────────────────────────────────────────

EngineResult<AoeResult> AttackResolver::ResolveAoe(const AoeRequest& request) {
    using Result = EngineResult<AoeResult>;

    if (request.damageRoll < 0) {
        return Result::err(EngineError(ErrorCode::NegativeAmount,
                                       "damage roll must be >= 0"));
    }
    if (request.targets.empty()) {
        return Result::err(EngineError(ErrorCode::MissingField,
                                       "area attack requires at least one target"));
    }
    if (request.saveDC && *request.saveDC <= 0) {
        return Result::err(EngineError(ErrorCode::InvalidArgument,
                                       "saveDC must be positive"));
    }
    auto caster = store_.RequireActive(request.caster);
    if (!caster) {
        return Result::err(caster.error());
    }

    std::unordered_set<ParticipantId> seen;
    for (const auto& t : request.targets) {
        if (!seen.insert(t.id).second) {
            return Result::err(EngineError(
                ErrorCode::DuplicateTarget,
                "duplicate target " + foundation::toString(t.id, "participant")));
        }
        auto target = store_.RequireActive(t.id);
        if (!target) {
            return Result::err(target.error());
        }
        if (target.value()->status.IsDead()) {
            return Result::err(EngineError(ErrorCode::ParticipantDead,
                                           target.value()->name + " is dead"));
        }
    }

    AoeResult result;
    result.caster = request.caster;

    // Saves are settled for every target before any damage lands.
    for (const auto& t : request.targets) {
        AoeTargetResult entry;
        entry.target = t.id;

        if (request.saveDC) {
            entry.saveRoll = t.saveRoll;
            if (!entry.saveRoll) {
                auto rolled = dice_.D20();
                if (!rolled) {
                    return Result::err(rolled.error());
                }
                entry.saveRoll = rolled.value();
            }

            if (request.saveAbility) {
                if (auto kind = saveRollKind(*request.saveAbility)) {
                    auto effects = ConditionEngine::Collect(store_.ActiveConditions(t.id));
                    entry.autoFailed = effects.AutoFails(*kind);
                }
            }
            entry.saved = !entry.autoFailed && *entry.saveRoll >= *request.saveDC;
        }

        if (!entry.saved) {
            entry.rawDamage = request.damageRoll;
        } else if (request.onSave == OnSavePolicy::HalfDamage) {
            entry.rawDamage = request.damageRoll / 2;
        } else {
            entry.rawDamage = 0;
        }
        result.targets.push_back(std::move(entry));
    }

    DamageResolver resolver(store_, round_);
    for (auto& entry : result.targets) {
        DamageRequest damage;
        damage.target = entry.target;
        damage.amount = entry.rawDamage;
        damage.type = request.damageType;
        damage.source = request.caster;
        damage.description = request.description.empty()
                                 ? "area effect by " + caster.value()->name
                                 : request.description;

        auto applied = resolver.ApplyDamage(damage);
        if (!applied) {
            return Result::err(applied.error());
        }
        entry.damage = applied.value();
    }

    return Result::ok(std::move(result));
}

}  // namespace dcc::combat
