/// @file damage_resolver.cpp
/// @brief DamageResolver implementation.

#include "dcc/combat/damage_resolver.hpp"

#include <algorithm>
#include <limits>

#include "dcc/combat/condition_engine.hpp"

using dcc::foundation::EngineError;
using dcc::foundation::EngineResult;
using dcc::foundation::ErrorCode;

namespace dcc::combat {

DamageResolver::DamageResolver(ParticipantStore& store, uint32_t round)
    : store_(store), round_(round) {}

// ── Static damage calculation ───────────────────────────────────────────

int32_t DamageResolver::EffectiveDamage(int32_t amount,
                                        DamageType type,
                                        const DamageDefenses& defenses) {
    if (amount <= 0) {
        return 0;
    }
    if (defenses.immunities.count(type) > 0) {
        return 0;
    }
    if (defenses.vulnerabilities.count(type) > 0) {
        constexpr auto kMax = std::numeric_limits<int32_t>::max();
        return amount > kMax / 2 ? kMax : amount * 2;
    }
    if (defenses.resistAll || defenses.resistances.count(type) > 0) {
        return amount / 2;  // Integer division floors for non-negative amounts.
    }
    return amount;
}

DamageDefenses DamageResolver::DefensesFor(const Participant& participant) const {
    DamageDefenses defenses;
    defenses.resistances = participant.stats.resistances;
    defenses.vulnerabilities = participant.stats.vulnerabilities;
    defenses.immunities = participant.stats.immunities;

    auto effects = ConditionEngine::Collect(store_.ActiveConditions(participant.id));
    defenses.resistAll = effects.resistAllDamage;
    defenses.immunities.insert(effects.damageImmunities.begin(),
                               effects.damageImmunities.end());
    return defenses;
}

// ── Damage ──────────────────────────────────────────────────────────────

EngineResult<DamageResult> DamageResolver::ApplyDamage(const DamageRequest& request) {
    using Result = EngineResult<DamageResult>;

    if (request.amount < 0) {
        return Result::err(EngineError(ErrorCode::NegativeAmount,
                                       "damage amount must be >= 0"));
    }
    auto found = store_.RequireActive(request.target);
    if (!found) {
        return Result::err(found.error());
    }
    auto& target = *found.value();
    auto& status = target.status;
    if (status.IsDead()) {
        return Result::err(EngineError(ErrorCode::ParticipantDead,
                                       target.name + " is dead"));
    }

    DamageResult result;
    result.participantId = target.id;
    result.rawAmount = request.amount;
    result.vitalBefore = status.vital;
    result.effectiveAmount = EffectiveDamage(request.amount, request.type, DefensesFor(target));

    // Temporary hit points absorb first.
    result.absorbedByTempHp = std::min(status.tempHp, result.effectiveAmount);
    status.tempHp -= result.absorbedByTempHp;
    auto remaining = result.effectiveAmount - result.absorbedByTempHp;

    if (status.vital == VitalState::Conscious) {
        auto overflow = remaining - status.currentHp;
        status.currentHp = std::max(0, status.currentHp - remaining);
        if (status.currentHp == 0) {
            status.ResetDeathSaves();
            if (overflow >= status.maxHp) {
                status.vital = VitalState::Dead;
                result.instantDeath = true;
            } else {
                status.vital = VitalState::Dying;
            }
        }
    } else if (remaining > 0) {
        // Already at 0 HP: any damage costs death saves.
        if (remaining >= status.maxHp) {
            status.vital = VitalState::Dead;
            result.instantDeath = true;
        } else {
            if (status.vital == VitalState::Stable) {
                status.ResetDeathSaves();
                status.vital = VitalState::Dying;
            }
            result.deathSaveFailuresAdded = request.isCritical ? 2 : 1;
            status.deathSaveFailures = std::min(
                kDeathSaveLimit, status.deathSaveFailures + result.deathSaveFailuresAdded);
            if (status.deathSaveFailures >= kDeathSaveLimit) {
                status.vital = VitalState::Dead;
            }
        }
    }

    result.newCurrentHp = status.currentHp;
    result.newTempHp = status.tempHp;
    result.vitalAfter = status.vital;

    DamageLogEntry entry;
    entry.participantId = target.id;
    entry.amount = result.effectiveAmount;
    entry.rawAmount = request.amount;
    entry.damageType = request.type;
    entry.sourceParticipantId = request.source;
    entry.sourceDescription = request.description;
    entry.isCritical = request.isCritical;
    entry.round = round_;
    result.logEntryId = store_.AppendDamageLog(std::move(entry)).id;

    return Result::ok(result);
}

// ── Healing ─────────────────────────────────────────────────────────────

EngineResult<HealResult> DamageResolver::Heal(ParticipantId id, int32_t amount) {
    using Result = EngineResult<HealResult>;

    if (amount < 0) {
        return Result::err(EngineError(ErrorCode::NegativeAmount,
                                       "heal amount must be >= 0"));
    }
    auto found = store_.RequireActive(id);
    if (!found) {
        return Result::err(found.error());
    }
    auto& target = *found.value();
    auto& status = target.status;
    if (status.IsDead()) {
        return Result::err(EngineError(ErrorCode::ParticipantDead,
                                       target.name + " is dead and cannot be healed"));
    }

    HealResult result;
    result.participantId = id;
    result.amount = amount;

    status.currentHp += std::min(amount, status.maxHp - status.currentHp);
    if (amount > 0 && status.vital != VitalState::Conscious) {
        status.vital = VitalState::Conscious;
        status.ResetDeathSaves();
        result.regainedConsciousness = true;
    }
    result.newCurrentHp = status.currentHp;
    return Result::ok(result);
}

EngineResult<TempHpResult> DamageResolver::SetTempHp(ParticipantId id, int32_t amount) {
    using Result = EngineResult<TempHpResult>;

    if (amount < 0) {
        return Result::err(EngineError(ErrorCode::NegativeAmount,
                                       "temporary hit points must be >= 0"));
    }
    auto found = store_.RequireActive(id);
    if (!found) {
        return Result::err(found.error());
    }
    auto& target = *found.value();
    if (target.status.IsDead()) {
        return Result::err(EngineError(ErrorCode::ParticipantDead,
                                       target.name + " is dead"));
    }

    TempHpResult result;
    result.participantId = id;
    result.previousTempHp = target.status.tempHp;
    target.status.tempHp = std::max(target.status.tempHp, amount);
    result.newTempHp = target.status.tempHp;
    return Result::ok(result);
}

// ── Death saves ─────────────────────────────────────────────────────────

EngineResult<DeathSaveResult> DamageResolver::RollDeathSave(ParticipantId id, int32_t roll) {
    using Result = EngineResult<DeathSaveResult>;

    if (roll < kD20Min || roll > kD20Max) {
        return Result::err(EngineError(ErrorCode::RollOutOfRange,
                                       "death save roll must be 1..20"));
    }
    auto found = store_.RequireActive(id);
    if (!found) {
        return Result::err(found.error());
    }
    auto& target = *found.value();
    auto& status = target.status;
    if (status.IsDead()) {
        return Result::err(EngineError(ErrorCode::ParticipantDead,
                                       target.name + " is dead"));
    }
    if (status.vital != VitalState::Dying) {
        return Result::err(EngineError(ErrorCode::ParticipantNotDying,
                                       target.name + " is not making death saves"));
    }

    DeathSaveResult result;
    result.participantId = id;
    result.roll = roll;

    if (roll == kD20Max) {
        status.currentHp = 1;
        status.vital = VitalState::Conscious;
        status.ResetDeathSaves();
        result.outcome = DeathSaveOutcome::Revived;
    } else if (roll == kD20Min) {
        status.deathSaveFailures = std::min(kDeathSaveLimit, status.deathSaveFailures + 2);
        result.outcome = DeathSaveOutcome::CriticalFailure;
    } else if (roll < kDeathSaveDC) {
        status.deathSaveFailures = std::min(kDeathSaveLimit, status.deathSaveFailures + 1);
        result.outcome = DeathSaveOutcome::Failure;
    } else {
        status.deathSaveSuccesses = std::min(kDeathSaveLimit, status.deathSaveSuccesses + 1);
        result.outcome = DeathSaveOutcome::Success;
    }

    if (status.deathSaveFailures >= kDeathSaveLimit) {
        status.vital = VitalState::Dead;
        result.outcome = DeathSaveOutcome::Died;
    } else if (status.deathSaveSuccesses >= kDeathSaveLimit) {
        status.vital = VitalState::Stable;
        result.outcome = DeathSaveOutcome::Stabilized;
    }

    result.successes = status.deathSaveSuccesses;
    result.failures = status.deathSaveFailures;
    result.vital = status.vital;
    return Result::ok(result);
}

}  // namespace dcc::combat
