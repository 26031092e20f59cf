#pragma once

/// @file turn_order.hpp
/// @brief TurnOrderManager: initiative rolls, turn ordering and turn/round
///        advancement.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "dcc/combat/dice.hpp"
#include "dcc/combat/participant_store.hpp"
#include "dcc/foundation/engine_result.hpp"

namespace dcc::combat {

/// Turn-tracking state of an encounter.
///
/// The order keeps participants that left mid-combat so positions stay
/// stable; advancing skips them.
struct TurnState {
    std::vector<ParticipantId> order;
    std::size_t turnIndex = 0;
    uint32_t round = 1;
};

/// Input for an initiative roll. Missing d20s are rolled by the
/// encounter's dice source.
struct InitiativeRequest {
    std::optional<int32_t> roll;        ///< d20 face value (1..20).
    std::optional<int32_t> secondRoll;  ///< Second d20 for advantage/disadvantage.
    bool advantage = false;
    bool disadvantage = false;
};

struct InitiativeResult {
    ParticipantId participantId;
    std::vector<int32_t> rolls;  ///< d20 faces considered.
    RollMode mode = RollMode::Normal;
    int32_t chosen = 0;
    int32_t modifier = 0;
    int32_t total = 0;
    bool orderResolved = false;  ///< Every active participant has rolled.
};

struct TurnAdvance {
    std::optional<ParticipantId> previous;
    ParticipantId current;
    uint32_t round = 1;
    bool newRound = false;
    std::vector<ActiveCondition> expiredConditions;
    std::vector<ActiveCondition> savesDue;  ///< UntilSave conditions on the current participant.
};

/// Computes and advances turn order over a ParticipantStore.
class TurnOrderManager {
public:
    TurnOrderManager(ParticipantStore& store, TurnState& state, DiceSource& dice);

    /// Roll initiative and recompute the order once everyone has rolled.
    ///
    /// Errors: ParticipantNotFound, RollOutOfRange, dice failures.
    foundation::EngineResult<InitiativeResult> RollInitiative(ParticipantId id,
                                                              const InitiativeRequest& request);

    /// Override a participant's initiative and recompute the order.
    foundation::EngineResult<void> Reorder(ParticipantId id, int32_t newInitiative);

    /// True when at least one participant is active and all active
    /// participants have an initiative.
    [[nodiscard]] bool AllResolved() const;

    /// Sort by initiative desc, modifier desc, insertion order asc.
    ///
    /// When @p keepCurrent is set the participant whose turn it is stays
    /// current. Leaves the order untouched and returns false if not every
    /// active participant has rolled.
    bool Recompute(bool keepCurrent);

    /// Drop the computed order (new participant joined before combat).
    void Clear();

    /// Point at the first active participant in the order.
    foundation::EngineResult<ParticipantId> Begin();

    /// Advance to the next active participant, rolling the round over at
    /// the end of the order and expiring timed conditions.
    foundation::EngineResult<TurnAdvance> NextTurn();

    /// Participant whose turn it is, if the order is resolved.
    [[nodiscard]] std::optional<ParticipantId> Current() const;

private:
    foundation::EngineResult<int32_t> d20(std::optional<int32_t> supplied);

    ParticipantStore& store_;
    TurnState& state_;
    DiceSource& dice_;
};

}  // namespace dcc::combat
