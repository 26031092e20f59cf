#pragma once

/// @file participant.hpp
/// @brief Per-encounter participant records: identity, vitals, stats,
///        active conditions and damage log entries.

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <variant>

#include "dcc/combat/combat_types.hpp"
#include "dcc/combat/conditions_library.hpp"
#include "dcc/foundation/types.hpp"

namespace dcc::combat {

using foundation::CharacterId;
using foundation::ConditionId;
using foundation::CreatureId;
using foundation::DamageLogId;
using foundation::EncounterId;
using foundation::ParticipantId;

// ── Identity ────────────────────────────────────────────────────────────

/// A player character owned by the character subsystem.
struct CharacterRef {
    CharacterId id;
    bool operator==(const CharacterRef&) const = default;
};

/// A stat-block creature owned by the bestiary.
struct CreatureRef {
    CreatureId id;
    bool operator==(const CreatureRef&) const = default;
};

/// A one-off combatant described only by name.
struct AdHocName {
    std::string name;
    bool operator==(const AdHocName&) const = default;
};

/// Exactly one identity per participant.
using IdentityRef = std::variant<CharacterRef, CreatureRef, AdHocName>;

/// "character#7", "creature#3" or the ad-hoc name.
std::string identityLabel(const IdentityRef& identity);

// ── Stats and status ────────────────────────────────────────────────────

/// Read-only combat stats supplied by the character/creature subsystem.
struct CreatureStats {
    int32_t armorClass = 10;
    std::set<DamageType> resistances;
    std::set<DamageType> vulnerabilities;
    std::set<DamageType> immunities;
    std::set<ConditionName> conditionImmunities;
};

/// Hit points and death-save counters.
///
/// currentHp stays within [0, maxHp]. Every non-Conscious state has
/// currentHp == 0.
struct ParticipantStatus {
    int32_t currentHp = 0;
    int32_t maxHp = 0;
    int32_t tempHp = 0;
    VitalState vital = VitalState::Conscious;
    int32_t deathSaveSuccesses = 0;
    int32_t deathSaveFailures = 0;

    [[nodiscard]] bool IsConscious() const noexcept { return vital == VitalState::Conscious; }
    [[nodiscard]] bool IsDead() const noexcept { return vital == VitalState::Dead; }

    void ResetDeathSaves() noexcept {
        deathSaveSuccesses = 0;
        deathSaveFailures = 0;
    }
};

/// A combatant within one encounter.
struct Participant {
    ParticipantId id;
    EncounterId encounterId;
    IdentityRef identity;
    std::string name;

    std::optional<int32_t> initiative;  ///< Unset until rolled.
    int32_t initiativeModifier = 0;
    std::optional<int32_t> turnOrder;   ///< Position once the order is resolved.
    uint32_t addOrder = 0;              ///< Insertion sequence (final tie-break).
    bool isActive = true;               ///< False once removed (fled).

    CreatureStats stats;
    ParticipantStatus status;
};

/// Input for adding a participant.
struct ParticipantSpec {
    IdentityRef identity;
    std::string name;                   ///< Defaults to identityLabel().
    int32_t maxHp = 0;
    std::optional<int32_t> currentHp;   ///< Defaults to maxHp.
    int32_t tempHp = 0;
    int32_t initiativeModifier = 0;
    std::optional<int32_t> initiative;  ///< Pre-rolled total, if known.
    CreatureStats stats;
};

// ── Conditions and damage log ───────────────────────────────────────────

/// A condition instance on a participant.
struct ActiveCondition {
    ConditionId id;
    ParticipantId participantId;
    ConditionName name = ConditionName::Blinded;
    DurationType durationType = DurationType::Permanent;
    std::optional<int32_t> durationValue;
    std::optional<int32_t> saveDC;
    std::optional<Ability> saveAbility;
    std::string sourceDescription;
    uint32_t appliedAtRound = 0;
    std::optional<uint32_t> expiresAtRound;  ///< Timed durations only.
    bool isActive = true;
};

/// One resolved damage application. Never mutated once appended.
struct DamageLogEntry {
    DamageLogId id;
    ParticipantId participantId;
    int32_t amount = 0;     ///< Effective damage after immunity/vulnerability/resistance.
    int32_t rawAmount = 0;  ///< Damage as submitted.
    DamageType damageType = DamageType::Bludgeoning;
    std::optional<ParticipantId> sourceParticipantId;
    std::string sourceDescription;
    bool isCritical = false;
    uint32_t round = 0;
    std::chrono::system_clock::time_point createdAt;
};

/// Damage log query. Unset fields match everything.
struct DamageLogFilter {
    std::optional<ParticipantId> participantId;
    std::optional<uint32_t> round;
};

}  // namespace dcc::combat
