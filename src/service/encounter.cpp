/// @file encounter.cpp
/// @brief Encounter orchestrator implementation.

#include "dcc/service/encounter.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

#include "dcc/foundation/engine_logger.hpp"

using dcc::combat::EncounterStatus;
using dcc::foundation::EngineError;
using dcc::foundation::ErrorCode;
using dcc::foundation::LogCategory;
using dcc::foundation::LogContext;
using dcc::foundation::LogLevel;

namespace dcc::service {

namespace {

LogCategory categoryFor(OperationType op) {
    switch (op) {
        case OperationType::InitiativeRolled:
        case OperationType::Reordered:
        case OperationType::TurnAdvanced:
            return LogCategory::Initiative;
        case OperationType::Attack:
        case OperationType::AreaAttack:
            return LogCategory::Attack;
        case OperationType::Damage:
        case OperationType::Heal:
        case OperationType::TempHp:
        case OperationType::DeathSave:
            return LogCategory::Damage;
        case OperationType::ConditionApplied:
        case OperationType::ConditionRemoved:
        case OperationType::SaveAttempted:
            return LogCategory::Condition;
        default:
            return LogCategory::Encounter;
    }
}

template <typename T>
EngineResult<T> propagate(const EngineResult<void>& r) {
    return EngineResult<T>::err(r.error());
}

std::string nameOf(const EncounterState& state, ParticipantId id) {
    const auto* p = state.store.Find(id);
    return p != nullptr ? p->name : foundation::toString(id, "participant");
}

} // namespace

// ---------------------------------------------------------------------------
// Invariants
// ---------------------------------------------------------------------------

std::optional<std::string> findInvariantViolation(const EncounterState& state) {
    using combat::VitalState;

    for (const auto& p : state.store.Participants()) {
        const auto& s = p.status;
        if (s.maxHp <= 0 || s.currentHp < 0 || s.currentHp > s.maxHp) {
            return p.name + ": currentHp outside [0, maxHp]";
        }
        if (s.tempHp < 0) {
            return p.name + ": negative temporary hit points";
        }
        if (s.deathSaveSuccesses < 0 || s.deathSaveSuccesses > combat::kDeathSaveLimit ||
            s.deathSaveFailures < 0 || s.deathSaveFailures > combat::kDeathSaveLimit) {
            return p.name + ": death-save counters out of range";
        }
        if ((s.vital == VitalState::Conscious) != (s.currentHp > 0)) {
            return p.name + ": consciousness disagrees with hit points";
        }
    }

    for (const auto& c : state.store.Conditions()) {
        if (c.isActive && state.store.Find(c.participantId) == nullptr) {
            return "active condition on unknown participant";
        }
    }

    const auto& turns = state.turns;
    if (!turns.order.empty() && turns.turnIndex >= turns.order.size()) {
        return "turn index past the end of the turn order";
    }
    for (auto id : turns.order) {
        if (state.store.Find(id) == nullptr) {
            return "turn order references unknown participant";
        }
    }
    if ((state.status == EncounterStatus::Active || state.status == EncounterStatus::Paused) &&
        turns.order.empty()) {
        return "combat running without a turn order";
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Construction and mutation plumbing
// ---------------------------------------------------------------------------

Encounter::Encounter(EncounterId id,
                     SessionId sessionId,
                     EncounterOptions options,
                     std::unique_ptr<combat::DiceSource> dice,
                     EventDispatcher& dispatcher)
    : id_(id),
      sessionId_(sessionId),
      options_(options),
      dice_(std::move(dice)),
      dispatcher_(dispatcher) {
    state_.store = combat::ParticipantStore(id);
}

void Encounter::MutationContext::touch(ParticipantId id) {
    if (std::find(changed.begin(), changed.end(), id) == changed.end()) {
        changed.push_back(id);
    }
}

template <typename T, typename Fn>
EngineResult<T> Encounter::mutate(OperationType op, Fn&& fn) {
    std::unique_lock lock(mutex_);

    LogContext ctxLog;
    ctxLog.encounterId = id_;
    ctxLog.sessionId = sessionId_;
    ctxLog.round = state_.turns.round;

    if (halted_) {
        return foundation::fail<T>(ErrorCode::EncounterHalted,
                                   "encounter halted after an internal error");
    }

    EncounterState work = state_;
    MutationContext ctx;
    EngineResult<T> result = fn(work, ctx);
    if (!result) {
        ctxLog.extra["error"] = std::string(result.error().message());
        DCC_LOG_CTX(LogLevel::Debug, categoryFor(op),
                    std::string(operationName(op)) + " rejected", ctxLog);
        return result;
    }

    if (auto violation = findInvariantViolation(work)) {
        halted_ = true;
        ctxLog.extra["violation"] = *violation;
        DCC_LOG_CTX(LogLevel::Critical, LogCategory::Encounter,
                    std::string(operationName(op)) + " broke encounter invariants; halting",
                    ctxLog);
        MutationContext haltCtx;
        haltCtx.summary = "encounter halted: " + *violation;
        dispatcher_.enqueue(buildEvent(OperationType::Halted, state_, haltCtx));
        lock.unlock();
        dispatcher_.flush();
        return foundation::fail<T>(ErrorCode::EncounterHalted,
                                   "encounter halted: " + *violation);
    }

    state_ = std::move(work);
    auto event = buildEvent(op, state_, ctx);

    ctxLog.round = state_.turns.round;
    ctxLog.extra["seq"] = std::to_string(event.sequence);
    if (event.outOfTurn) {
        ctxLog.extra["out_of_turn"] = "true";
    }
    DCC_LOG_CTX(LogLevel::Debug, categoryFor(op), event.summary, ctxLog);

    dispatcher_.enqueue(std::move(event));
    lock.unlock();
    dispatcher_.flush();
    return result;
}

EngineResult<void> Encounter::requireStatus(const EncounterState& state,
                                            std::initializer_list<EncounterStatus> allowed,
                                            std::string_view operation) {
    if (std::find(allowed.begin(), allowed.end(), state.status) != allowed.end()) {
        return EngineResult<void>::ok();
    }
    if (state.status == EncounterStatus::Completed) {
        return EngineResult<void>::err(
            EngineError(ErrorCode::EncounterInvalidState, "encounter is completed"));
    }
    return EngineResult<void>::err(EngineError(
        ErrorCode::EncounterInvalidState,
        "cannot " + std::string(operation) + " while encounter is " +
            std::string(combat::encounterStatusName(state.status))));
}

EngineResult<void> Encounter::checkTurn(EncounterState& state, ParticipantId actor,
                                        MutationContext& ctx) const {
    combat::TurnOrderManager turns(state.store, state.turns, *dice_);
    auto current = turns.Current();
    if (current && *current == actor) {
        return EngineResult<void>::ok();
    }
    if (options_.strictTurnOrder) {
        return EngineResult<void>::err(EngineError(
            ErrorCode::OutOfTurn, "it is not " + nameOf(state, actor) + "'s turn"));
    }
    ctx.outOfTurn = true;
    DCC_LOG_WARN(LogCategory::Initiative,
                 nameOf(state, actor) + " acted outside their turn in " +
                     foundation::toString(id_, "encounter"));
    return EngineResult<void>::ok();
}

EngineResult<void> Encounter::autoRoll(EncounterState& state, MutationContext& ctx) {
    combat::TurnOrderManager turns(state.store, state.turns, *dice_);
    for (const auto& p : state.store.Participants()) {
        if (!p.isActive || p.initiative) {
            continue;
        }
        auto rolled = turns.RollInitiative(p.id, {});
        if (!rolled) {
            return EngineResult<void>::err(rolled.error());
        }
        ctx.touch(p.id);
    }
    return EngineResult<void>::ok();
}

ParticipantView Encounter::viewOf(const EncounterState& state,
                                  const combat::Participant& p) const {
    return ParticipantView{p, state.store.ActiveConditions(p.id)};
}

EncounterEvent Encounter::buildEvent(OperationType op, const EncounterState& state,
                                     MutationContext& ctx) {
    EncounterEvent event;
    event.encounterId = id_;
    event.sequence = nextSequence_++;
    event.operation = op;
    event.status = state.status;
    event.round = state.turns.round;
    event.turnIndex = state.turns.turnIndex;
    event.summary = std::move(ctx.summary);
    event.outOfTurn = ctx.outOfTurn;
    event.timestamp = std::chrono::system_clock::now();
    for (auto id : ctx.changed) {
        if (const auto* p = state.store.Find(id)) {
            event.changed.push_back(viewOf(state, *p));
        }
    }
    return event;
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

EngineResult<std::vector<ParticipantId>> Encounter::initialize(const EncounterSpec& spec) {
    using Ids = std::vector<ParticipantId>;
    return mutate<Ids>(OperationType::EncounterCreated,
                       [&](EncounterState& s, MutationContext& ctx) -> EngineResult<Ids> {
        if (spec.surpriseRound) {
            s.turns.round = 0;
        }
        Ids ids;
        for (const auto& participantSpec : spec.participants) {
            auto added = s.store.Add(participantSpec);
            if (!added) {
                return EngineResult<Ids>::err(added.error());
            }
            ids.push_back(added.value());
            ctx.touch(added.value());
        }
        if (options_.autoRollInitiative) {
            if (auto rolled = autoRoll(s, ctx); !rolled) {
                return propagate<Ids>(rolled);
            }
        }
        combat::TurnOrderManager turns(s.store, s.turns, *dice_);
        turns.Recompute(false);
        ctx.summary = "encounter created with " + std::to_string(ids.size()) + " participants";
        return EngineResult<Ids>::ok(std::move(ids));
    });
}

EngineResult<ParticipantId> Encounter::start() {
    return mutate<ParticipantId>(OperationType::EncounterStarted,
                                 [&](EncounterState& s, MutationContext& ctx)
                                     -> EngineResult<ParticipantId> {
        if (auto ok = requireStatus(s, {EncounterStatus::Setup}, "start"); !ok) {
            return propagate<ParticipantId>(ok);
        }
        if (s.store.ActiveCount() == 0) {
            return foundation::fail<ParticipantId>(ErrorCode::NoActiveParticipants,
                                                   "encounter has no active participants");
        }
        if (options_.autoRollInitiative) {
            if (auto rolled = autoRoll(s, ctx); !rolled) {
                return propagate<ParticipantId>(rolled);
            }
        }
        combat::TurnOrderManager turns(s.store, s.turns, *dice_);
        if (!turns.AllResolved()) {
            return foundation::fail<ParticipantId>(ErrorCode::InitiativeUnresolved,
                                                   "not every participant has rolled initiative");
        }
        turns.Recompute(false);
        auto first = turns.Begin();
        if (!first) {
            return first;
        }
        s.status = EncounterStatus::Active;
        ctx.touch(first.value());
        ctx.summary = "combat started in round " + std::to_string(s.turns.round) + ", " +
                      nameOf(s, first.value()) + " acts first";
        return first;
    });
}

EngineResult<void> Encounter::pause() {
    return mutate<void>(OperationType::Paused,
                        [&](EncounterState& s, MutationContext& ctx) -> EngineResult<void> {
        if (auto ok = requireStatus(s, {EncounterStatus::Active}, "pause"); !ok) {
            return ok;
        }
        s.status = EncounterStatus::Paused;
        ctx.summary = "encounter paused";
        return EngineResult<void>::ok();
    });
}

EngineResult<void> Encounter::resume() {
    return mutate<void>(OperationType::Resumed,
                        [&](EncounterState& s, MutationContext& ctx) -> EngineResult<void> {
        if (auto ok = requireStatus(s, {EncounterStatus::Paused}, "resume"); !ok) {
            return ok;
        }
        s.status = EncounterStatus::Active;
        ctx.summary = "encounter resumed";
        return EngineResult<void>::ok();
    });
}

EngineResult<void> Encounter::complete() {
    return mutate<void>(OperationType::Completed,
                        [&](EncounterState& s, MutationContext& ctx) -> EngineResult<void> {
        if (auto ok = requireStatus(s, {EncounterStatus::Active, EncounterStatus::Paused},
                                    "complete");
            !ok) {
            return ok;
        }
        s.status = EncounterStatus::Completed;
        ctx.summary = "encounter completed after round " + std::to_string(s.turns.round);
        return EngineResult<void>::ok();
    });
}

// ---------------------------------------------------------------------------
// Participants and turn order
// ---------------------------------------------------------------------------

EngineResult<ParticipantId> Encounter::addParticipant(combat::ParticipantSpec spec) {
    return mutate<ParticipantId>(OperationType::ParticipantAdded,
                                 [&](EncounterState& s, MutationContext& ctx)
                                     -> EngineResult<ParticipantId> {
        if (auto ok = requireStatus(
                s, {EncounterStatus::Setup, EncounterStatus::Active, EncounterStatus::Paused},
                "add a participant");
            !ok) {
            return propagate<ParticipantId>(ok);
        }
        auto added = s.store.Add(std::move(spec));
        if (!added) {
            return added;
        }
        ctx.touch(added.value());
        if (options_.autoRollInitiative) {
            if (auto rolled = autoRoll(s, ctx); !rolled) {
                return propagate<ParticipantId>(rolled);
            }
        }

        combat::TurnOrderManager turns(s.store, s.turns, *dice_);
        if (s.status == EncounterStatus::Setup) {
            if (!turns.Recompute(false)) {
                turns.Clear();
            }
        } else {
            turns.Recompute(true);
        }
        ctx.summary = nameOf(s, added.value()) + " joined the encounter";
        return added;
    });
}

EngineResult<void> Encounter::removeParticipant(ParticipantId id) {
    return mutate<void>(OperationType::ParticipantRemoved,
                        [&](EncounterState& s, MutationContext& ctx) -> EngineResult<void> {
        if (auto ok = requireStatus(
                s, {EncounterStatus::Setup, EncounterStatus::Active, EncounterStatus::Paused},
                "remove a participant");
            !ok) {
            return ok;
        }
        auto found = s.store.RequireActive(id);
        if (!found) {
            return EngineResult<void>::err(found.error());
        }
        found.value()->isActive = false;
        ctx.touch(id);

        if (s.status == EncounterStatus::Setup) {
            combat::TurnOrderManager turns(s.store, s.turns, *dice_);
            turns.Recompute(false);
        }
        ctx.summary = found.value()->name + " left the encounter";
        return EngineResult<void>::ok();
    });
}

EngineResult<combat::InitiativeResult> Encounter::rollInitiative(
    ParticipantId id, const combat::InitiativeRequest& request) {
    using R = combat::InitiativeResult;
    return mutate<R>(OperationType::InitiativeRolled,
                     [&](EncounterState& s, MutationContext& ctx) -> EngineResult<R> {
        if (auto ok = requireStatus(
                s, {EncounterStatus::Setup, EncounterStatus::Active, EncounterStatus::Paused},
                "roll initiative");
            !ok) {
            return propagate<R>(ok);
        }
        combat::TurnOrderManager turns(s.store, s.turns, *dice_);
        auto rolled = turns.RollInitiative(id, request);
        if (!rolled) {
            return rolled;
        }
        ctx.touch(id);
        ctx.summary = nameOf(s, id) + " rolled initiative " +
                      std::to_string(rolled.value().total);
        return rolled;
    });
}

EngineResult<std::vector<ParticipantId>> Encounter::reorder(ParticipantId id,
                                                           int32_t newInitiative) {
    using Ids = std::vector<ParticipantId>;
    return mutate<Ids>(OperationType::Reordered,
                       [&](EncounterState& s, MutationContext& ctx) -> EngineResult<Ids> {
        if (auto ok = requireStatus(s, {EncounterStatus::Setup, EncounterStatus::Paused},
                                    "reorder");
            !ok) {
            return propagate<Ids>(ok);
        }
        combat::TurnOrderManager turns(s.store, s.turns, *dice_);
        if (auto reordered = turns.Reorder(id, newInitiative); !reordered) {
            return propagate<Ids>(reordered);
        }
        ctx.touch(id);
        ctx.summary = nameOf(s, id) + " moved to initiative " + std::to_string(newInitiative);
        return EngineResult<Ids>::ok(s.turns.order);
    });
}

EngineResult<combat::TurnAdvance> Encounter::nextTurn() {
    using R = combat::TurnAdvance;
    return mutate<R>(OperationType::TurnAdvanced,
                     [&](EncounterState& s, MutationContext& ctx) -> EngineResult<R> {
        if (auto ok = requireStatus(s, {EncounterStatus::Active}, "advance the turn"); !ok) {
            return propagate<R>(ok);
        }
        combat::TurnOrderManager turns(s.store, s.turns, *dice_);
        auto advanced = turns.NextTurn();
        if (!advanced) {
            return advanced;
        }
        const auto& turn = advanced.value();
        if (turn.previous) {
            ctx.touch(*turn.previous);
        }
        ctx.touch(turn.current);
        for (const auto& c : turn.expiredConditions) {
            ctx.touch(c.participantId);
        }
        ctx.summary = "round " + std::to_string(turn.round) + ": " +
                      nameOf(s, turn.current) + "'s turn";
        if (!turn.expiredConditions.empty()) {
            ctx.summary += ", " + std::to_string(turn.expiredConditions.size()) +
                           " condition(s) expired";
        }
        return advanced;
    });
}

// ---------------------------------------------------------------------------
// Combat
// ---------------------------------------------------------------------------

EngineResult<combat::AttackResult> Encounter::resolveAttack(const combat::AttackRequest& request) {
    using R = combat::AttackResult;
    return mutate<R>(OperationType::Attack,
                     [&](EncounterState& s, MutationContext& ctx) -> EngineResult<R> {
        if (auto ok = requireStatus(s, {EncounterStatus::Active}, "attack"); !ok) {
            return propagate<R>(ok);
        }
        if (s.store.Find(request.attacker) != nullptr) {
            if (auto turn = checkTurn(s, request.attacker, ctx); !turn) {
                return propagate<R>(turn);
            }
        }
        combat::AttackResolver attacks(s.store, s.turns.round, *dice_);
        auto resolved = attacks.ResolveAttack(request);
        if (!resolved) {
            return resolved;
        }
        auto& attack = resolved.value();
        attack.outOfTurn = ctx.outOfTurn;
        ctx.touch(request.attacker);
        ctx.touch(request.target);

        ctx.summary = nameOf(s, request.attacker) + (attack.hit ? " hit " : " missed ") +
                      nameOf(s, request.target);
        if (attack.critical) {
            ctx.summary += " (critical)";
        }
        if (attack.damage) {
            ctx.summary += " for " + std::to_string(attack.damage->effectiveAmount) + " " +
                           std::string(combat::damageTypeName(request.damageType));
        }
        return resolved;
    });
}

EngineResult<combat::AoeResult> Encounter::resolveAoeAttack(const combat::AoeRequest& request) {
    using R = combat::AoeResult;
    return mutate<R>(OperationType::AreaAttack,
                     [&](EncounterState& s, MutationContext& ctx) -> EngineResult<R> {
        if (auto ok = requireStatus(s, {EncounterStatus::Active}, "attack"); !ok) {
            return propagate<R>(ok);
        }
        if (s.store.Find(request.caster) != nullptr) {
            if (auto turn = checkTurn(s, request.caster, ctx); !turn) {
                return propagate<R>(turn);
            }
        }
        combat::AttackResolver attacks(s.store, s.turns.round, *dice_);
        auto resolved = attacks.ResolveAoe(request);
        if (!resolved) {
            return resolved;
        }
        resolved.value().outOfTurn = ctx.outOfTurn;
        ctx.touch(request.caster);
        for (const auto& t : resolved.value().targets) {
            ctx.touch(t.target);
        }
        ctx.summary = nameOf(s, request.caster) + " hit " +
                      std::to_string(resolved.value().targets.size()) +
                      " target(s) with an area effect";
        return resolved;
    });
}

EngineResult<combat::DamageResult> Encounter::applyDamage(const combat::DamageRequest& request) {
    using R = combat::DamageResult;
    return mutate<R>(OperationType::Damage,
                     [&](EncounterState& s, MutationContext& ctx) -> EngineResult<R> {
        if (auto ok = requireStatus(s, {EncounterStatus::Setup, EncounterStatus::Active},
                                    "apply damage");
            !ok) {
            return propagate<R>(ok);
        }
        combat::DamageResolver damage(s.store, s.turns.round);
        auto applied = damage.ApplyDamage(request);
        if (!applied) {
            return applied;
        }
        ctx.touch(request.target);
        ctx.summary = nameOf(s, request.target) + " took " +
                      std::to_string(applied.value().effectiveAmount) + " " +
                      std::string(combat::damageTypeName(request.type)) + " damage";
        if (applied.value().vitalAfter != applied.value().vitalBefore) {
            ctx.summary += " and is now " +
                           std::string(combat::vitalStateName(applied.value().vitalAfter));
        }
        return applied;
    });
}

EngineResult<combat::HealResult> Encounter::heal(ParticipantId id, int32_t amount,
                                                 std::string source) {
    using R = combat::HealResult;
    return mutate<R>(OperationType::Heal,
                     [&](EncounterState& s, MutationContext& ctx) -> EngineResult<R> {
        if (auto ok = requireStatus(s, {EncounterStatus::Setup, EncounterStatus::Active},
                                    "heal");
            !ok) {
            return propagate<R>(ok);
        }
        combat::DamageResolver damage(s.store, s.turns.round);
        auto healed = damage.Heal(id, amount);
        if (!healed) {
            return healed;
        }
        ctx.touch(id);
        ctx.summary = nameOf(s, id) + " healed " + std::to_string(amount);
        if (!source.empty()) {
            ctx.summary += " by " + source;
        }
        return healed;
    });
}

EngineResult<combat::TempHpResult> Encounter::setTempHp(ParticipantId id, int32_t amount) {
    using R = combat::TempHpResult;
    return mutate<R>(OperationType::TempHp,
                     [&](EncounterState& s, MutationContext& ctx) -> EngineResult<R> {
        if (auto ok = requireStatus(s, {EncounterStatus::Setup, EncounterStatus::Active},
                                    "grant temporary hit points");
            !ok) {
            return propagate<R>(ok);
        }
        combat::DamageResolver damage(s.store, s.turns.round);
        auto granted = damage.SetTempHp(id, amount);
        if (!granted) {
            return granted;
        }
        ctx.touch(id);
        ctx.summary = nameOf(s, id) + " has " + std::to_string(granted.value().newTempHp) +
                      " temporary hit points";
        return granted;
    });
}

EngineResult<combat::DeathSaveResult> Encounter::rollDeathSave(ParticipantId id, int32_t roll) {
    using R = combat::DeathSaveResult;
    return mutate<R>(OperationType::DeathSave,
                     [&](EncounterState& s, MutationContext& ctx) -> EngineResult<R> {
        if (auto ok = requireStatus(s, {EncounterStatus::Active}, "roll a death save"); !ok) {
            return propagate<R>(ok);
        }
        if (s.store.Find(id) != nullptr) {
            if (auto turn = checkTurn(s, id, ctx); !turn) {
                return propagate<R>(turn);
            }
        }
        combat::DamageResolver damage(s.store, s.turns.round);
        auto saved = damage.RollDeathSave(id, roll);
        if (!saved) {
            return saved;
        }
        ctx.touch(id);
        ctx.summary = nameOf(s, id) + " death save " + std::to_string(roll) + ": " +
                      std::string(combat::deathSaveOutcomeName(saved.value().outcome));
        return saved;
    });
}

EngineResult<combat::ConditionApplyResult> Encounter::applyCondition(
    const combat::ConditionRequest& request) {
    using R = combat::ConditionApplyResult;
    return mutate<R>(OperationType::ConditionApplied,
                     [&](EncounterState& s, MutationContext& ctx) -> EngineResult<R> {
        if (auto ok = requireStatus(s, {EncounterStatus::Setup, EncounterStatus::Active},
                                    "apply a condition");
            !ok) {
            return propagate<R>(ok);
        }
        combat::ConditionEngine conditions(s.store, s.turns.round);
        auto applied = conditions.Apply(request);
        if (!applied) {
            return applied;
        }
        ctx.touch(request.participantId);
        ctx.summary = nameOf(s, request.participantId) + " is " +
                      std::string(combat::conditionName(request.name));
        switch (applied.value().outcome) {
            case combat::ApplyOutcome::Applied:
                break;
            case combat::ApplyOutcome::Extended:
                ctx.summary += " (duration extended)";
                break;
            case combat::ApplyOutcome::Unchanged:
                ctx.summary += " (already active)";
                break;
        }
        return applied;
    });
}

EngineResult<combat::ActiveCondition> Encounter::removeCondition(ConditionId id) {
    using R = combat::ActiveCondition;
    return mutate<R>(OperationType::ConditionRemoved,
                     [&](EncounterState& s, MutationContext& ctx) -> EngineResult<R> {
        if (auto ok = requireStatus(s, {EncounterStatus::Setup, EncounterStatus::Active},
                                    "remove a condition");
            !ok) {
            return propagate<R>(ok);
        }
        combat::ConditionEngine conditions(s.store, s.turns.round);
        auto removed = conditions.Remove(id);
        if (!removed) {
            return removed;
        }
        ctx.touch(removed.value().participantId);
        ctx.summary = nameOf(s, removed.value().participantId) + " is no longer " +
                      std::string(combat::conditionName(removed.value().name));
        return removed;
    });
}

EngineResult<combat::SaveAttemptResult> Encounter::attemptSave(ConditionId id, int32_t total) {
    using R = combat::SaveAttemptResult;
    return mutate<R>(OperationType::SaveAttempted,
                     [&](EncounterState& s, MutationContext& ctx) -> EngineResult<R> {
        if (auto ok = requireStatus(s, {EncounterStatus::Setup, EncounterStatus::Active},
                                    "attempt a save");
            !ok) {
            return propagate<R>(ok);
        }
        combat::ConditionEngine conditions(s.store, s.turns.round);
        auto attempt = conditions.AttemptSave(id, total);
        if (!attempt) {
            return attempt;
        }
        const auto& condition = attempt.value().condition;
        ctx.touch(condition.participantId);
        ctx.summary = nameOf(s, condition.participantId) +
                      (attempt.value().success ? " shook off " : " remains ") +
                      std::string(combat::conditionName(condition.name));
        return attempt;
    });
}

// ---------------------------------------------------------------------------
// Reads
// ---------------------------------------------------------------------------

EncounterSnapshot Encounter::snapshot() const {
    std::shared_lock lock(mutex_);

    EncounterSnapshot snap;
    snap.id = id_;
    snap.sessionId = sessionId_;
    snap.status = state_.status;
    snap.round = state_.turns.round;
    snap.turnIndex = state_.turns.turnIndex;
    snap.turnOrder = state_.turns.order;
    snap.halted = halted_;
    if (state_.status != EncounterStatus::Setup &&
        state_.turns.turnIndex < state_.turns.order.size()) {
        snap.currentParticipant = state_.turns.order[state_.turns.turnIndex];
    }
    for (const auto& p : state_.store.Participants()) {
        snap.participants.push_back(viewOf(state_, p));
    }
    return snap;
}

EngineResult<ParticipantView> Encounter::participant(ParticipantId id) const {
    std::shared_lock lock(mutex_);
    const auto* p = state_.store.Find(id);
    if (p == nullptr) {
        return foundation::fail<ParticipantView>(
            ErrorCode::ParticipantNotFound,
            "unknown participant " + foundation::toString(id, "participant"));
    }
    return EngineResult<ParticipantView>::ok(viewOf(state_, *p));
}

std::vector<combat::DamageLogEntry> Encounter::damageLog(
    const combat::DamageLogFilter& filter) const {
    std::shared_lock lock(mutex_);
    return state_.store.DamageLog(filter);
}

EngineResult<std::vector<combat::ActiveCondition>> Encounter::activeConditions(
    ParticipantId id) const {
    using R = std::vector<combat::ActiveCondition>;
    std::shared_lock lock(mutex_);
    if (state_.store.Find(id) == nullptr) {
        return foundation::fail<R>(
            ErrorCode::ParticipantNotFound,
            "unknown participant " + foundation::toString(id, "participant"));
    }
    return EngineResult<R>::ok(state_.store.ActiveConditions(id));
}

EngineResult<combat::MechanicalEffects> Encounter::mechanicalEffects(ParticipantId id) const {
    using R = combat::MechanicalEffects;
    std::shared_lock lock(mutex_);
    if (state_.store.Find(id) == nullptr) {
        return foundation::fail<R>(
            ErrorCode::ParticipantNotFound,
            "unknown participant " + foundation::toString(id, "participant"));
    }
    return EngineResult<R>::ok(
        combat::ConditionEngine::Collect(state_.store.ActiveConditions(id)));
}

EncounterStatus Encounter::status() const {
    std::shared_lock lock(mutex_);
    return state_.status;
}

bool Encounter::isHalted() const {
    std::shared_lock lock(mutex_);
    return halted_;
}

}  // namespace dcc::service
