#pragma once

/// @file combat_events.hpp
/// @brief State-change events and read snapshots of an encounter.

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "dcc/combat/participant.hpp"
#include "dcc/foundation/types.hpp"

namespace dcc::service {

using foundation::EncounterId;
using foundation::ParticipantId;
using foundation::SessionId;

/// Mutating operation that produced an event.
enum class OperationType : uint8_t {
    EncounterCreated,
    ParticipantAdded,
    ParticipantRemoved,
    InitiativeRolled,
    Reordered,
    EncounterStarted,
    TurnAdvanced,
    Attack,
    AreaAttack,
    Damage,
    Heal,
    TempHp,
    DeathSave,
    ConditionApplied,
    ConditionRemoved,
    SaveAttempted,
    Paused,
    Resumed,
    Completed,
    Halted
};

constexpr std::string_view operationName(OperationType op) {
    switch (op) {
        case OperationType::EncounterCreated:   return "encounter_created";
        case OperationType::ParticipantAdded:   return "participant_added";
        case OperationType::ParticipantRemoved: return "participant_removed";
        case OperationType::InitiativeRolled:   return "initiative_rolled";
        case OperationType::Reordered:          return "reordered";
        case OperationType::EncounterStarted:   return "encounter_started";
        case OperationType::TurnAdvanced:       return "turn_advanced";
        case OperationType::Attack:             return "attack";
        case OperationType::AreaAttack:         return "area_attack";
        case OperationType::Damage:             return "damage";
        case OperationType::Heal:               return "heal";
        case OperationType::TempHp:             return "temp_hp";
        case OperationType::DeathSave:          return "death_save";
        case OperationType::ConditionApplied:   return "condition_applied";
        case OperationType::ConditionRemoved:   return "condition_removed";
        case OperationType::SaveAttempted:      return "save_attempted";
        case OperationType::Paused:             return "paused";
        case OperationType::Resumed:            return "resumed";
        case OperationType::Completed:          return "completed";
        case OperationType::Halted:             return "halted";
    }
    return "unknown";
}

/// A participant together with its active conditions.
struct ParticipantView {
    combat::Participant participant;
    std::vector<combat::ActiveCondition> conditions;
};

/// Consistent, committed view of a whole encounter.
struct EncounterSnapshot {
    EncounterId id;
    SessionId sessionId;
    combat::EncounterStatus status = combat::EncounterStatus::Setup;
    uint32_t round = 1;
    std::size_t turnIndex = 0;
    std::optional<ParticipantId> currentParticipant;
    std::vector<ParticipantId> turnOrder;
    std::vector<ParticipantView> participants;
    bool halted = false;
};

/// One committed state change.
///
/// Sequence numbers start at 1 per encounter and follow commit order.
struct EncounterEvent {
    EncounterId encounterId;
    uint64_t sequence = 0;
    OperationType operation = OperationType::EncounterCreated;
    combat::EncounterStatus status = combat::EncounterStatus::Setup;
    uint32_t round = 1;
    std::size_t turnIndex = 0;
    std::vector<ParticipantView> changed;  ///< Participants touched by the operation.
    std::string summary;
    bool outOfTurn = false;
    std::chrono::system_clock::time_point timestamp;
};

}  // namespace dcc::service
