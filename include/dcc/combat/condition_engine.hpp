#pragma once

/// @file condition_engine.hpp
/// @brief ConditionEngine: condition lifecycle and aggregation of their
///        mechanical effects.

#include <array>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "dcc/combat/participant_store.hpp"
#include "dcc/foundation/engine_result.hpp"

namespace dcc::combat {

/// Aggregated effects of every active condition on one participant.
///
/// Advantage and disadvantage on the same roll kind cancel to Normal.
struct MechanicalEffects {
    /// Union of descriptors from all active conditions, without duplicates.
    std::vector<EffectDescriptor> descriptors;

    /// Net mode per roll kind after cancellation.
    std::array<RollMode, kRollKindCount> rollModes{};

    std::set<RollKind> autoFail;
    Movement movement = Movement::Normal;  ///< Most restrictive limit.
    bool incapacitated = false;
    bool criticalWithinFiveFeet = false;
    bool resistAllDamage = false;
    bool cannotTargetSource = false;
    std::set<DamageType> damageImmunities;

    [[nodiscard]] RollMode Mode(RollKind kind) const {
        return rollModes[static_cast<std::size_t>(kind)];
    }

    [[nodiscard]] bool AutoFails(RollKind kind) const { return autoFail.count(kind) > 0; }
};

/// Input for ConditionEngine::Apply.
struct ConditionRequest {
    ParticipantId participantId;
    ConditionName name = ConditionName::Blinded;
    DurationType durationType = DurationType::Permanent;
    std::optional<int32_t> durationValue;  ///< Required for Rounds/Minutes/Hours.
    std::optional<int32_t> saveDC;         ///< Required for UntilSave.
    std::optional<Ability> saveAbility;    ///< Required for UntilSave.
    std::string sourceDescription;
};

enum class ApplyOutcome : uint8_t {
    Applied,   ///< New condition instance created.
    Extended,  ///< Existing instance given the longer duration.
    Unchanged  ///< Existing instance already lasts at least as long.
};

struct ConditionApplyResult {
    ActiveCondition condition;              ///< The instance now in effect.
    ApplyOutcome outcome = ApplyOutcome::Applied;
    std::vector<ActiveCondition> superseded;  ///< Included conditions deactivated.
    std::vector<std::string> warnings;
};

struct SaveAttemptResult {
    ActiveCondition condition;
    int32_t total = 0;
    bool success = false;
    bool autoFailed = false;  ///< A condition forced the save to fail.
};

/// Applies, removes and saves against conditions on a ParticipantStore.
///
/// Operates on whatever store it is given; the encounter hands it a
/// working copy so failures never leak partial changes.
class ConditionEngine {
public:
    ConditionEngine(ParticipantStore& store, uint32_t round);

    /// Apply a condition using the replace-if-longer rule.
    ///
    /// Errors: ParticipantNotFound, MissingField / InvalidArgument for
    /// incomplete durations, ParticipantDead, ConditionImmune.
    foundation::EngineResult<ConditionApplyResult> Apply(const ConditionRequest& request);

    /// Deactivate a condition. ConditionNotFound if unknown or inactive.
    foundation::EngineResult<ActiveCondition> Remove(ConditionId id);

    /// Resolve a save against an UntilSave condition.
    ///
    /// Success (total >= saveDC) deactivates it. Str/Dex saves that the
    /// participant's conditions auto-fail always fail.
    foundation::EngineResult<SaveAttemptResult> AttemptSave(ConditionId id, int32_t total);

    /// Aggregated effects for a participant.
    foundation::EngineResult<MechanicalEffects> EffectsFor(ParticipantId id) const;

    /// Net attack-roll mode for @p attacker against @p target.
    ///
    /// Combines the attacker's own attack-roll modifiers with the target's
    /// attacks-against modifiers (melee or ranged variant for Prone);
    /// any advantage plus any disadvantage cancels.
    [[nodiscard]] RollMode AttackRollMode(ParticipantId attacker,
                                          ParticipantId target,
                                          bool melee) const;

    /// Deactivate timed conditions whose expiry round has passed.
    /// @return The conditions that expired.
    std::vector<ActiveCondition> ExpireTimed(uint32_t round);

    /// Aggregate a set of active conditions.
    [[nodiscard]] static MechanicalEffects Collect(const std::vector<ActiveCondition>& conditions);

private:
    ParticipantStore& store_;
    uint32_t round_;
};

}  // namespace dcc::combat
