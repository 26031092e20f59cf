/// @file condition_engine.cpp
/// @brief ConditionEngine implementation.

#include "dcc/combat/condition_engine.hpp"

#include <algorithm>
#include <utility>

#include "dcc/foundation/engine_logger.hpp"

using dcc::foundation::EngineError;
using dcc::foundation::EngineResult;
using dcc::foundation::ErrorCode;
using dcc::foundation::LogCategory;

namespace dcc::combat {

namespace {

/// Upper bound on a timed duration, in rounds (about a week of game time).
constexpr int32_t kMaxDurationRounds = 100'800;

/// Ordering key for replace-if-longer: timed < UntilSave < Permanent,
/// timed conditions compared by expiry round.
std::pair<int, uint32_t> durationRank(const ActiveCondition& c) {
    if (c.expiresAtRound) {
        return {0, *c.expiresAtRound};
    }
    if (c.durationType == DurationType::UntilSave) {
        return {1, 0};
    }
    return {2, 0};
}

} // namespace

ConditionEngine::ConditionEngine(ParticipantStore& store, uint32_t round)
    : store_(store), round_(round) {}

// ── Apply ───────────────────────────────────────────────────────────────

EngineResult<ConditionApplyResult> ConditionEngine::Apply(const ConditionRequest& request) {
    using Result = EngineResult<ConditionApplyResult>;

    auto found = store_.Require(request.participantId);
    if (!found) {
        return Result::err(found.error());
    }
    auto* target = found.value();

    ActiveCondition candidate;
    candidate.participantId = request.participantId;
    candidate.name = request.name;
    candidate.durationType = request.durationType;
    candidate.sourceDescription = request.sourceDescription;
    candidate.appliedAtRound = round_;

    if (isTimed(request.durationType)) {
        if (!request.durationValue) {
            return Result::err(EngineError(
                ErrorCode::MissingField,
                std::string("durationValue is required for ") +
                    std::string(durationTypeName(request.durationType)) + " durations"));
        }
        auto value = *request.durationValue;
        auto perUnit = durationInRounds(request.durationType, 1);
        if (value <= 0 || value > kMaxDurationRounds / perUnit) {
            return Result::err(EngineError(ErrorCode::InvalidArgument,
                                           "durationValue out of range"));
        }
        auto rounds = durationInRounds(request.durationType, value);
        candidate.durationValue = value;
        candidate.expiresAtRound = round_ + static_cast<uint32_t>(rounds) - 1;
    } else if (request.durationType == DurationType::UntilSave) {
        if (!request.saveDC || !request.saveAbility) {
            return Result::err(EngineError(
                ErrorCode::MissingField,
                "saveDC and saveAbility are required for until_save durations"));
        }
        if (*request.saveDC <= 0) {
            return Result::err(EngineError(ErrorCode::InvalidArgument,
                                           "saveDC must be positive"));
        }
        candidate.saveDC = request.saveDC;
        candidate.saveAbility = request.saveAbility;
    }

    if (target->status.IsDead()) {
        return Result::err(EngineError(ErrorCode::ParticipantDead,
                                       target->name + " is dead"));
    }
    if (target->stats.conditionImmunities.count(request.name) > 0) {
        return Result::err(EngineError(
            ErrorCode::ConditionImmune,
            target->name + " is immune to " + std::string(conditionName(request.name))));
    }

    ConditionApplyResult result;

    // Hierarchy against the participant's other active conditions.
    for (auto& other : store_.Conditions()) {
        if (!other.isActive || other.participantId != request.participantId ||
            other.name == request.name) {
            continue;
        }
        if (conditionIncludes(request.name, other.name)) {
            other.isActive = false;
            result.superseded.push_back(other);
        } else if (conditionIncludes(other.name, request.name)) {
            result.warnings.push_back(std::string(conditionName(other.name)) +
                                      " already includes the effects of " +
                                      std::string(conditionName(request.name)));
        } else if (conditionsIncompatible(request.name, other.name)) {
            result.warnings.push_back(std::string(conditionName(request.name)) +
                                      " is incompatible with " +
                                      std::string(conditionName(other.name)));
        }
    }
    for (const auto& warning : result.warnings) {
        DCC_LOG_WARN(LogCategory::Condition, target->name + ": " + warning);
    }

    // Replace-if-longer against an existing instance of the same name.
    auto existing = std::find_if(store_.Conditions().begin(), store_.Conditions().end(),
                                 [&](const ActiveCondition& c) {
                                     return c.isActive &&
                                            c.participantId == request.participantId &&
                                            c.name == request.name;
                                 });
    if (existing != store_.Conditions().end()) {
        if (durationRank(candidate) > durationRank(*existing)) {
            existing->durationType = candidate.durationType;
            existing->durationValue = candidate.durationValue;
            existing->saveDC = candidate.saveDC;
            existing->saveAbility = candidate.saveAbility;
            existing->expiresAtRound = candidate.expiresAtRound;
            existing->appliedAtRound = candidate.appliedAtRound;
            existing->sourceDescription = candidate.sourceDescription;
            result.outcome = ApplyOutcome::Extended;
        } else {
            result.outcome = ApplyOutcome::Unchanged;
        }
        result.condition = *existing;
        return Result::ok(std::move(result));
    }

    result.condition = store_.AddCondition(std::move(candidate));
    result.outcome = ApplyOutcome::Applied;
    return Result::ok(std::move(result));
}

// ── Remove / save ───────────────────────────────────────────────────────

EngineResult<ActiveCondition> ConditionEngine::Remove(ConditionId id) {
    auto* condition = store_.FindCondition(id);
    if (condition == nullptr || !condition->isActive) {
        return EngineResult<ActiveCondition>::err(
            EngineError(ErrorCode::ConditionNotFound,
                        "no active condition " + foundation::toString(id, "condition")));
    }
    condition->isActive = false;
    return EngineResult<ActiveCondition>::ok(*condition);
}

EngineResult<SaveAttemptResult> ConditionEngine::AttemptSave(ConditionId id, int32_t total) {
    using Result = EngineResult<SaveAttemptResult>;

    auto* condition = store_.FindCondition(id);
    if (condition == nullptr || !condition->isActive) {
        return Result::err(
            EngineError(ErrorCode::ConditionNotFound,
                        "no active condition " + foundation::toString(id, "condition")));
    }
    if (condition->durationType != DurationType::UntilSave) {
        return Result::err(
            EngineError(ErrorCode::ConditionNotSaveable,
                        std::string(conditionName(condition->name)) +
                            " does not end on a save"));
    }

    SaveAttemptResult result;
    result.total = total;

    if (auto kind = saveRollKind(*condition->saveAbility)) {
        auto effects = Collect(store_.ActiveConditions(condition->participantId));
        result.autoFailed = effects.AutoFails(*kind);
    }

    result.success = !result.autoFailed && total >= *condition->saveDC;
    if (result.success) {
        condition->isActive = false;
    }
    result.condition = *condition;
    return Result::ok(std::move(result));
}

// ── Effects ─────────────────────────────────────────────────────────────

EngineResult<MechanicalEffects> ConditionEngine::EffectsFor(ParticipantId id) const {
    if (store_.Find(id) == nullptr) {
        return EngineResult<MechanicalEffects>::err(
            EngineError(ErrorCode::ParticipantNotFound,
                        "unknown participant " + foundation::toString(id, "participant")));
    }
    return EngineResult<MechanicalEffects>::ok(Collect(store_.ActiveConditions(id)));
}

RollMode ConditionEngine::AttackRollMode(ParticipantId attacker,
                                         ParticipantId target,
                                         bool melee) const {
    bool advantage = false;
    bool disadvantage = false;

    auto mark = [&](const RollModifier& mod) {
        if (mod.mode == RollMode::Advantage) {
            advantage = true;
        } else if (mod.mode == RollMode::Disadvantage) {
            disadvantage = true;
        }
    };

    for (const auto& c : store_.ActiveConditions(attacker)) {
        for (const auto& effect : conditionDefinition(c.name).effects) {
            if (const auto* mod = std::get_if<RollModifier>(&effect);
                mod != nullptr && mod->roll == RollKind::AttackRoll) {
                mark(*mod);
            }
        }
    }

    auto rangeKind = melee ? RollKind::AttacksAgainstMelee : RollKind::AttacksAgainstRanged;
    for (const auto& c : store_.ActiveConditions(target)) {
        for (const auto& effect : conditionDefinition(c.name).effects) {
            if (const auto* mod = std::get_if<RollModifier>(&effect);
                mod != nullptr &&
                (mod->roll == RollKind::AttacksAgainst || mod->roll == rangeKind)) {
                mark(*mod);
            }
        }
    }

    return combineRollModes(advantage, disadvantage);
}

std::vector<ActiveCondition> ConditionEngine::ExpireTimed(uint32_t round) {
    std::vector<ActiveCondition> expired;
    for (auto& c : store_.Conditions()) {
        if (c.isActive && c.expiresAtRound && round > *c.expiresAtRound) {
            c.isActive = false;
            expired.push_back(c);
        }
    }
    return expired;
}

MechanicalEffects ConditionEngine::Collect(const std::vector<ActiveCondition>& conditions) {
    MechanicalEffects fx;
    std::array<bool, kRollKindCount> advantage{};
    std::array<bool, kRollKindCount> disadvantage{};

    for (const auto& c : conditions) {
        if (!c.isActive) {
            continue;
        }
        for (const auto& effect : conditionDefinition(c.name).effects) {
            if (std::find(fx.descriptors.begin(), fx.descriptors.end(), effect) ==
                fx.descriptors.end()) {
                fx.descriptors.push_back(effect);
            }

            if (const auto* mod = std::get_if<RollModifier>(&effect)) {
                auto idx = static_cast<std::size_t>(mod->roll);
                if (mod->mode == RollMode::Advantage) {
                    advantage[idx] = true;
                } else if (mod->mode == RollMode::Disadvantage) {
                    disadvantage[idx] = true;
                }
            } else if (const auto* fail = std::get_if<AutoFail>(&effect)) {
                fx.autoFail.insert(fail->roll);
            } else if (const auto* move = std::get_if<MovementLimit>(&effect)) {
                fx.movement = std::max(fx.movement, move->movement);
            } else if (std::holds_alternative<Incapacitation>(effect)) {
                fx.incapacitated = true;
            } else if (std::holds_alternative<CriticalWithinFiveFeet>(effect)) {
                fx.criticalWithinFiveFeet = true;
            } else if (std::holds_alternative<ResistAllDamage>(effect)) {
                fx.resistAllDamage = true;
            } else if (const auto* immune = std::get_if<DamageImmunity>(&effect)) {
                fx.damageImmunities.insert(immune->type);
            } else if (std::holds_alternative<CannotTargetSource>(effect)) {
                fx.cannotTargetSource = true;
            }
        }
    }

    for (std::size_t i = 0; i < kRollKindCount; ++i) {
        fx.rollModes[i] = combineRollModes(advantage[i], disadvantage[i]);
    }
    return fx;
}

}  // namespace dcc::combat
