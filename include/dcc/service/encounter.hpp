#pragma once

/// @file encounter.hpp
/// @brief Encounter: public facade over one combat encounter.
///
/// Owns the encounter state machine (Setup -> Active <-> Paused ->
/// Completed) and serializes every mutation behind an exclusive lock.
/// Each mutation runs against a working copy of the state; the copy is
/// committed only when the operation succeeds and the state invariants
/// hold, then exactly one EncounterEvent is queued for delivery.
/// Reads take a shared lock and see the last committed state.

#include <initializer_list>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "dcc/combat/attack_resolver.hpp"
#include "dcc/combat/condition_engine.hpp"
#include "dcc/combat/damage_resolver.hpp"
#include "dcc/combat/dice.hpp"
#include "dcc/combat/participant_store.hpp"
#include "dcc/combat/turn_order.hpp"
#include "dcc/foundation/engine_result.hpp"
#include "dcc/service/combat_events.hpp"
#include "dcc/service/event_dispatcher.hpp"

namespace dcc::service {

using foundation::ConditionId;
using foundation::EngineResult;

/// Rules switches that apply to one encounter.
struct EncounterOptions {
    /// Reject actions taken outside the actor's turn instead of flagging them.
    bool strictTurnOrder = false;

    /// Roll initiative for participants that join without one.
    bool autoRollInitiative = false;
};

/// Input for EncounterManager::createEncounter.
struct EncounterSpec {
    SessionId sessionId;
    std::vector<combat::ParticipantSpec> participants;
    bool surpriseRound = false;  ///< Start at round 0.
};

/// Committed state of an encounter. Plain value so it can be copied.
struct EncounterState {
    combat::EncounterStatus status = combat::EncounterStatus::Setup;
    combat::TurnState turns;
    combat::ParticipantStore store;
};

/// Check the structural invariants of an encounter state.
///
/// @return A description of the first violation, or nullopt.
std::optional<std::string> findInvariantViolation(const EncounterState& state);

class Encounter {
public:
    Encounter(EncounterId id,
              SessionId sessionId,
              EncounterOptions options,
              std::unique_ptr<combat::DiceSource> dice,
              EventDispatcher& dispatcher);

    Encounter(const Encounter&) = delete;
    Encounter& operator=(const Encounter&) = delete;

    /// Populate a freshly created encounter and emit EncounterCreated.
    /// Fails without side effects if any participant spec is invalid.
    [[nodiscard]] EngineResult<std::vector<ParticipantId>> initialize(const EncounterSpec& spec);

    // ── Lifecycle ───────────────────────────────────────────────────────

    /// Setup -> Active. Needs at least one active participant and every
    /// initiative resolved. @return The participant whose turn it is.
    [[nodiscard]] EngineResult<ParticipantId> start();

    [[nodiscard]] EngineResult<void> pause();
    [[nodiscard]] EngineResult<void> resume();

    /// Active|Paused -> Completed (terminal).
    [[nodiscard]] EngineResult<void> complete();

    // ── Participants and turn order ─────────────────────────────────────

    [[nodiscard]] EngineResult<ParticipantId> addParticipant(combat::ParticipantSpec spec);

    /// Mark a participant as gone (fled). Its turns are skipped.
    [[nodiscard]] EngineResult<void> removeParticipant(ParticipantId id);

    [[nodiscard]] EngineResult<combat::InitiativeResult> rollInitiative(
        ParticipantId id, const combat::InitiativeRequest& request = {});

    /// Manual initiative override, Setup or Paused only.
    /// @return The recomputed turn order.
    [[nodiscard]] EngineResult<std::vector<ParticipantId>> reorder(ParticipantId id,
                                                                  int32_t newInitiative);

    [[nodiscard]] EngineResult<combat::TurnAdvance> nextTurn();

    // ── Combat ──────────────────────────────────────────────────────────

    [[nodiscard]] EngineResult<combat::AttackResult> resolveAttack(
        const combat::AttackRequest& request);

    [[nodiscard]] EngineResult<combat::AoeResult> resolveAoeAttack(
        const combat::AoeRequest& request);

    [[nodiscard]] EngineResult<combat::DamageResult> applyDamage(
        const combat::DamageRequest& request);

    [[nodiscard]] EngineResult<combat::HealResult> heal(ParticipantId id, int32_t amount,
                                                        std::string source = {});

    [[nodiscard]] EngineResult<combat::TempHpResult> setTempHp(ParticipantId id, int32_t amount);

    [[nodiscard]] EngineResult<combat::DeathSaveResult> rollDeathSave(ParticipantId id,
                                                                      int32_t roll);

    [[nodiscard]] EngineResult<combat::ConditionApplyResult> applyCondition(
        const combat::ConditionRequest& request);

    [[nodiscard]] EngineResult<combat::ActiveCondition> removeCondition(ConditionId id);

    [[nodiscard]] EngineResult<combat::SaveAttemptResult> attemptSave(ConditionId id,
                                                                      int32_t total);

    // ── Reads (shared lock) ─────────────────────────────────────────────

    [[nodiscard]] EncounterSnapshot snapshot() const;

    [[nodiscard]] EngineResult<ParticipantView> participant(ParticipantId id) const;

    [[nodiscard]] std::vector<combat::DamageLogEntry> damageLog(
        const combat::DamageLogFilter& filter = {}) const;

    [[nodiscard]] EngineResult<std::vector<combat::ActiveCondition>> activeConditions(
        ParticipantId id) const;

    [[nodiscard]] EngineResult<combat::MechanicalEffects> mechanicalEffects(
        ParticipantId id) const;

    [[nodiscard]] EncounterId id() const noexcept { return id_; }
    [[nodiscard]] SessionId sessionId() const noexcept { return sessionId_; }
    [[nodiscard]] combat::EncounterStatus status() const;
    [[nodiscard]] bool isHalted() const;

private:
    friend class EncounterStateAccess;  // tests: reach the committed state

    /// Per-mutation bookkeeping that ends up in the event.
    struct MutationContext {
        std::vector<ParticipantId> changed;
        std::string summary;
        bool outOfTurn = false;

        void touch(ParticipantId id);
    };

    /// Run @p fn against a working copy and commit it on success.
    template <typename T, typename Fn>
    EngineResult<T> mutate(OperationType op, Fn&& fn);

    /// Fail unless the working status is one of @p allowed.
    static EngineResult<void> requireStatus(const EncounterState& state,
                                            std::initializer_list<combat::EncounterStatus> allowed,
                                            std::string_view operation);

    /// Flag or reject an action by @p actor outside its turn.
    EngineResult<void> checkTurn(EncounterState& state, ParticipantId actor,
                                 MutationContext& ctx) const;

    EngineResult<void> autoRoll(EncounterState& state, MutationContext& ctx);

    ParticipantView viewOf(const EncounterState& state, const combat::Participant& p) const;
    EncounterEvent buildEvent(OperationType op, const EncounterState& state,
                              MutationContext& ctx);

    const EncounterId id_;
    const SessionId sessionId_;
    const EncounterOptions options_;
    std::unique_ptr<combat::DiceSource> dice_;
    EventDispatcher& dispatcher_;

    mutable std::shared_mutex mutex_;
    EncounterState state_;
    bool halted_ = false;
    uint64_t nextSequence_ = 1;
};

}  // namespace dcc::service
