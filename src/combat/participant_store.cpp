/// @file participant_store.cpp
/// @brief ParticipantStore implementation.

#include "dcc/combat/participant_store.hpp"

#include <algorithm>
#include <type_traits>

using dcc::foundation::EngineError;
using dcc::foundation::EngineResult;
using dcc::foundation::ErrorCode;

namespace dcc::combat {

std::string identityLabel(const IdentityRef& identity) {
    return std::visit(
        [](const auto& ref) -> std::string {
            using T = std::decay_t<decltype(ref)>;
            if constexpr (std::is_same_v<T, CharacterRef>) {
                return foundation::toString(ref.id, "character");
            } else if constexpr (std::is_same_v<T, CreatureRef>) {
                return foundation::toString(ref.id, "creature");
            } else {
                return ref.name;
            }
        },
        identity);
}

ParticipantStore::ParticipantStore(EncounterId encounterId)
    : encounterId_(encounterId) {}

EngineResult<ParticipantId> ParticipantStore::Add(ParticipantSpec spec) {
    auto invalid = [](std::string msg) {
        return EngineResult<ParticipantId>::err(
            EngineError(ErrorCode::InvalidParticipantSpec, std::move(msg)));
    };

    if (const auto* adHoc = std::get_if<AdHocName>(&spec.identity);
        adHoc != nullptr && adHoc->name.empty()) {
        return invalid("ad-hoc participant requires a name");
    }
    if (spec.maxHp <= 0) {
        return invalid("maxHp must be positive");
    }
    auto currentHp = spec.currentHp.value_or(spec.maxHp);
    if (currentHp < 0 || currentHp > spec.maxHp) {
        return invalid("currentHp must be within [0, maxHp]");
    }
    if (spec.tempHp < 0) {
        return invalid("tempHp must be >= 0");
    }
    if (spec.stats.armorClass < 0) {
        return invalid("armorClass must be >= 0");
    }

    Participant p;
    p.id = ParticipantId(nextParticipantId_++);
    p.encounterId = encounterId_;
    p.name = spec.name.empty() ? identityLabel(spec.identity) : std::move(spec.name);
    p.identity = std::move(spec.identity);
    p.initiative = spec.initiative;
    p.initiativeModifier = spec.initiativeModifier;
    p.addOrder = nextAddOrder_++;
    p.stats = std::move(spec.stats);
    p.status.maxHp = spec.maxHp;
    p.status.currentHp = currentHp;
    p.status.tempHp = spec.tempHp;
    // A participant that enters at 0 HP is already making death saves.
    p.status.vital = currentHp > 0 ? VitalState::Conscious : VitalState::Dying;

    participants_.push_back(std::move(p));
    return EngineResult<ParticipantId>::ok(participants_.back().id);
}

Participant* ParticipantStore::Find(ParticipantId id) {
    auto it = std::find_if(participants_.begin(), participants_.end(),
                           [id](const Participant& p) { return p.id == id; });
    return it != participants_.end() ? &*it : nullptr;
}

const Participant* ParticipantStore::Find(ParticipantId id) const {
    auto it = std::find_if(participants_.begin(), participants_.end(),
                           [id](const Participant& p) { return p.id == id; });
    return it != participants_.end() ? &*it : nullptr;
}

EngineResult<Participant*> ParticipantStore::Require(ParticipantId id) {
    auto* p = Find(id);
    if (p == nullptr) {
        return EngineResult<Participant*>::err(
            EngineError(ErrorCode::ParticipantNotFound,
                        "unknown participant " + foundation::toString(id, "participant")));
    }
    return EngineResult<Participant*>::ok(p);
}

EngineResult<Participant*> ParticipantStore::RequireActive(ParticipantId id) {
    auto found = Require(id);
    if (!found) {
        return found;
    }
    if (!found.value()->isActive) {
        return EngineResult<Participant*>::err(
            EngineError(ErrorCode::EncounterInvalidState,
                        found.value()->name + " has left the encounter"));
    }
    return found;
}

std::size_t ParticipantStore::ActiveCount() const {
    return static_cast<std::size_t>(
        std::count_if(participants_.begin(), participants_.end(),
                      [](const Participant& p) { return p.isActive; }));
}

// ── Conditions ──────────────────────────────────────────────────────────

ActiveCondition& ParticipantStore::AddCondition(ActiveCondition condition) {
    condition.id = ConditionId(nextConditionId_++);
    conditions_.push_back(std::move(condition));
    return conditions_.back();
}

ActiveCondition* ParticipantStore::FindCondition(ConditionId id) {
    auto it = std::find_if(conditions_.begin(), conditions_.end(),
                           [id](const ActiveCondition& c) { return c.id == id; });
    return it != conditions_.end() ? &*it : nullptr;
}

const ActiveCondition* ParticipantStore::FindCondition(ConditionId id) const {
    auto it = std::find_if(conditions_.begin(), conditions_.end(),
                           [id](const ActiveCondition& c) { return c.id == id; });
    return it != conditions_.end() ? &*it : nullptr;
}

std::vector<ActiveCondition> ParticipantStore::ActiveConditions(ParticipantId id) const {
    std::vector<ActiveCondition> result;
    for (const auto& c : conditions_) {
        if (c.isActive && c.participantId == id) {
            result.push_back(c);
        }
    }
    return result;
}

// ── Damage log ──────────────────────────────────────────────────────────

const DamageLogEntry& ParticipantStore::AppendDamageLog(DamageLogEntry entry) {
    entry.id = DamageLogId(nextLogId_++);
    entry.createdAt = std::chrono::system_clock::now();
    damageLog_.push_back(std::move(entry));
    return damageLog_.back();
}

std::vector<DamageLogEntry> ParticipantStore::DamageLog(const DamageLogFilter& filter) const {
    std::vector<DamageLogEntry> result;
    for (const auto& entry : damageLog_) {
        if (filter.participantId && entry.participantId != *filter.participantId) {
            continue;
        }
        if (filter.round && entry.round != *filter.round) {
            continue;
        }
        result.push_back(entry);
    }
    return result;
}

}  // namespace dcc::combat
