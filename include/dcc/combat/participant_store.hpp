#pragma once

/// @file participant_store.hpp
/// @brief ParticipantStore: the participants, conditions and damage log
///        of a single encounter.
///
/// The store is a plain value type. The encounter mutates a copy and
/// swaps it in on success, so a failed operation leaves nothing behind.

#include <cstdint>
#include <vector>

#include "dcc/combat/participant.hpp"
#include "dcc/foundation/engine_result.hpp"

namespace dcc::combat {

class ParticipantStore {
public:
    explicit ParticipantStore(EncounterId encounterId = EncounterId{});

    /// Validate and add a participant.
    ///
    /// Fails with InvalidParticipantSpec when maxHp <= 0, currentHp or
    /// tempHp is out of range, the armor class is negative, or an ad-hoc
    /// identity has an empty name.
    foundation::EngineResult<ParticipantId> Add(ParticipantSpec spec);

    [[nodiscard]] Participant* Find(ParticipantId id);
    [[nodiscard]] const Participant* Find(ParticipantId id) const;

    /// Find or fail with ParticipantNotFound.
    foundation::EngineResult<Participant*> Require(ParticipantId id);

    /// Require a participant that has not left the encounter.
    foundation::EngineResult<Participant*> RequireActive(ParticipantId id);

    /// Participants in insertion order.
    [[nodiscard]] const std::vector<Participant>& Participants() const noexcept {
        return participants_;
    }
    [[nodiscard]] std::vector<Participant>& Participants() noexcept { return participants_; }

    [[nodiscard]] std::size_t ActiveCount() const;

    // ── Conditions ──────────────────────────────────────────────────────

    /// Store a new condition instance and assign its id.
    ActiveCondition& AddCondition(ActiveCondition condition);

    [[nodiscard]] ActiveCondition* FindCondition(ConditionId id);
    [[nodiscard]] const ActiveCondition* FindCondition(ConditionId id) const;

    /// Active conditions on one participant, in application order.
    [[nodiscard]] std::vector<ActiveCondition> ActiveConditions(ParticipantId id) const;

    /// Every condition record ever applied, active or not.
    [[nodiscard]] std::vector<ActiveCondition>& Conditions() noexcept { return conditions_; }
    [[nodiscard]] const std::vector<ActiveCondition>& Conditions() const noexcept {
        return conditions_;
    }

    // ── Damage log ──────────────────────────────────────────────────────

    /// Append a log entry and assign its id and timestamp.
    const DamageLogEntry& AppendDamageLog(DamageLogEntry entry);

    [[nodiscard]] std::vector<DamageLogEntry> DamageLog(const DamageLogFilter& filter = {}) const;

    [[nodiscard]] std::size_t DamageLogSize() const noexcept { return damageLog_.size(); }

private:
    EncounterId encounterId_;
    uint64_t nextParticipantId_ = 1;
    uint64_t nextConditionId_ = 1;
    uint64_t nextLogId_ = 1;
    uint32_t nextAddOrder_ = 0;

    std::vector<Participant> participants_;
    std::vector<ActiveCondition> conditions_;
    std::vector<DamageLogEntry> damageLog_;
};

}  // namespace dcc::combat
