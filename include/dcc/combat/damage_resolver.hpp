#pragma once

/// @file damage_resolver.hpp
/// @brief DamageResolver: damage, healing, temporary hit points and death
///        saves.
///
/// Damage pipeline:
///   1. immunity -> 0, else vulnerability -> x2, else resistance -> /2
///   2. temporary hit points absorb first
///   3. remaining damage reduces currentHp (clamped at 0)
///   4. dropping to 0 starts death saves, or kills outright when the
///      overflow reaches maxHp

#include <optional>
#include <set>
#include <string>

#include "dcc/combat/participant_store.hpp"
#include "dcc/foundation/engine_result.hpp"

namespace dcc::combat {

/// Damage defenses of a target: its stats plus condition effects.
struct DamageDefenses {
    std::set<DamageType> resistances;
    std::set<DamageType> vulnerabilities;
    std::set<DamageType> immunities;
    bool resistAll = false;  ///< e.g. Petrified.
};

struct DamageRequest {
    ParticipantId target;
    int32_t amount = 0;
    DamageType type = DamageType::Bludgeoning;
    std::optional<ParticipantId> source;
    std::string description;
    bool isCritical = false;
};

struct DamageResult {
    ParticipantId participantId;
    int32_t rawAmount = 0;
    int32_t effectiveAmount = 0;
    int32_t absorbedByTempHp = 0;
    int32_t newCurrentHp = 0;
    int32_t newTempHp = 0;
    VitalState vitalBefore = VitalState::Conscious;
    VitalState vitalAfter = VitalState::Conscious;
    bool instantDeath = false;           ///< Massive damage rule applied.
    int32_t deathSaveFailuresAdded = 0;  ///< Damage taken while at 0 HP.
    DamageLogId logEntryId;
};

struct HealResult {
    ParticipantId participantId;
    int32_t amount = 0;
    int32_t newCurrentHp = 0;
    bool regainedConsciousness = false;
};

struct TempHpResult {
    ParticipantId participantId;
    int32_t previousTempHp = 0;
    int32_t newTempHp = 0;
};

enum class DeathSaveOutcome : uint8_t {
    Success,
    Failure,
    CriticalFailure,  ///< Natural 1: two failures.
    Revived,          ///< Natural 20: back to 1 HP.
    Stabilized,       ///< Third success.
    Died              ///< Third failure.
};

struct DeathSaveResult {
    ParticipantId participantId;
    int32_t roll = 0;
    DeathSaveOutcome outcome = DeathSaveOutcome::Success;
    int32_t successes = 0;
    int32_t failures = 0;
    VitalState vital = VitalState::Dying;
};

/// Applies hit-point changes to participants of a ParticipantStore.
class DamageResolver {
public:
    DamageResolver(ParticipantStore& store, uint32_t round);

    /// Apply damage and append one log entry.
    ///
    /// Errors: NegativeAmount, ParticipantNotFound, ParticipantDead.
    foundation::EngineResult<DamageResult> ApplyDamage(const DamageRequest& request);

    /// Restore hit points up to maxHp. Any positive amount revives an
    /// unconscious participant.
    foundation::EngineResult<HealResult> Heal(ParticipantId id, int32_t amount);

    /// Temporary hit points do not stack: keeps the larger value.
    foundation::EngineResult<TempHpResult> SetTempHp(ParticipantId id, int32_t amount);

    /// Record a death saving throw (d20 face value, 1..20).
    ///
    /// Errors: RollOutOfRange, ParticipantDead, ParticipantNotDying.
    foundation::EngineResult<DeathSaveResult> RollDeathSave(ParticipantId id, int32_t roll);

    /// Defenses of a participant including active condition effects.
    [[nodiscard]] DamageDefenses DefensesFor(const Participant& participant) const;

    /// Effective damage after immunity, vulnerability and resistance.
    /// Doubling saturates at INT32_MAX.
    ///
    /// This is a pure function exposed for testability.
    [[nodiscard]] static int32_t EffectiveDamage(int32_t amount,
                                                 DamageType type,
                                                 const DamageDefenses& defenses);

private:
    ParticipantStore& store_;
    uint32_t round_;
};

constexpr std::string_view deathSaveOutcomeName(DeathSaveOutcome outcome) {
    switch (outcome) {
        case DeathSaveOutcome::Success:         return "success";
        case DeathSaveOutcome::Failure:         return "failure";
        case DeathSaveOutcome::CriticalFailure: return "critical_failure";
        case DeathSaveOutcome::Revived:         return "revived";
        case DeathSaveOutcome::Stabilized:      return "stabilized";
        case DeathSaveOutcome::Died:            return "died";
    }
    return "unknown";
}

}  // namespace dcc::combat
