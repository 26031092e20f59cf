/// @file turn_order.cpp
/// @brief TurnOrderManager implementation.

#include "dcc/combat/turn_order.hpp"

#include <algorithm>

#include "dcc/combat/condition_engine.hpp"

using dcc::foundation::EngineError;
using dcc::foundation::EngineResult;
using dcc::foundation::ErrorCode;

namespace dcc::combat {

namespace {

bool validD20(int32_t roll) {
    return roll >= kD20Min && roll <= kD20Max;
}

} // namespace

TurnOrderManager::TurnOrderManager(ParticipantStore& store, TurnState& state, DiceSource& dice)
    : store_(store), state_(state), dice_(dice) {}

EngineResult<int32_t> TurnOrderManager::d20(std::optional<int32_t> supplied) {
    if (supplied) {
        return EngineResult<int32_t>::ok(*supplied);
    }
    return dice_.D20();
}

// ── Initiative ──────────────────────────────────────────────────────────

EngineResult<InitiativeResult> TurnOrderManager::RollInitiative(
    ParticipantId id, const InitiativeRequest& request) {
    using Result = EngineResult<InitiativeResult>;

    auto found = store_.RequireActive(id);
    if (!found) {
        return Result::err(found.error());
    }
    auto& participant = *found.value();

    // Validate supplied faces before any die is generated.
    for (const auto& supplied : {request.roll, request.secondRoll}) {
        if (supplied && !validD20(*supplied)) {
            return Result::err(EngineError(ErrorCode::RollOutOfRange,
                                           "initiative roll must be 1..20"));
        }
    }

    InitiativeResult result;
    result.participantId = id;
    result.mode = combineRollModes(request.advantage, request.disadvantage);
    result.modifier = participant.initiativeModifier;

    auto first = d20(request.roll);
    if (!first) {
        return Result::err(first.error());
    }
    result.rolls.push_back(first.value());
    result.chosen = first.value();

    if (result.mode != RollMode::Normal) {
        auto second = d20(request.secondRoll);
        if (!second) {
            return Result::err(second.error());
        }
        result.rolls.push_back(second.value());
        result.chosen = result.mode == RollMode::Advantage
                            ? std::max(first.value(), second.value())
                            : std::min(first.value(), second.value());
    }

    result.total = result.chosen + result.modifier;
    participant.initiative = result.total;
    result.orderResolved = Recompute(true);
    return Result::ok(std::move(result));
}

EngineResult<void> TurnOrderManager::Reorder(ParticipantId id, int32_t newInitiative) {
    auto found = store_.RequireActive(id);
    if (!found) {
        return EngineResult<void>::err(found.error());
    }
    found.value()->initiative = newInitiative;
    Recompute(true);
    return EngineResult<void>::ok();
}

// ── Ordering ────────────────────────────────────────────────────────────

bool TurnOrderManager::AllResolved() const {
    const auto& participants = store_.Participants();
    bool anyActive = false;
    for (const auto& p : participants) {
        if (!p.isActive) {
            continue;
        }
        anyActive = true;
        if (!p.initiative) {
            return false;
        }
    }
    return anyActive;
}

bool TurnOrderManager::Recompute(bool keepCurrent) {
    if (!AllResolved()) {
        return false;
    }

    std::optional<ParticipantId> current;
    if (keepCurrent) {
        current = Current();
    }

    std::vector<Participant*> ranked;
    for (auto& p : store_.Participants()) {
        if (p.initiative) {
            ranked.push_back(&p);
        } else {
            p.turnOrder.reset();
        }
    }
    std::sort(ranked.begin(), ranked.end(), [](const Participant* a, const Participant* b) {
        if (*a->initiative != *b->initiative) {
            return *a->initiative > *b->initiative;
        }
        if (a->initiativeModifier != b->initiativeModifier) {
            return a->initiativeModifier > b->initiativeModifier;
        }
        return a->addOrder < b->addOrder;
    });

    state_.order.clear();
    state_.turnIndex = 0;
    for (std::size_t i = 0; i < ranked.size(); ++i) {
        ranked[i]->turnOrder = static_cast<int32_t>(i);
        state_.order.push_back(ranked[i]->id);
        if (current && ranked[i]->id == *current) {
            state_.turnIndex = i;
        }
    }
    return true;
}

void TurnOrderManager::Clear() {
    state_.order.clear();
    state_.turnIndex = 0;
    for (auto& p : store_.Participants()) {
        p.turnOrder.reset();
    }
}

std::optional<ParticipantId> TurnOrderManager::Current() const {
    if (state_.turnIndex >= state_.order.size()) {
        return std::nullopt;
    }
    return state_.order[state_.turnIndex];
}

// ── Turn advancement ────────────────────────────────────────────────────

EngineResult<ParticipantId> TurnOrderManager::Begin() {
    if (state_.order.empty()) {
        return EngineResult<ParticipantId>::err(
            EngineError(ErrorCode::InitiativeUnresolved, "turn order is not resolved"));
    }
    for (std::size_t i = 0; i < state_.order.size(); ++i) {
        const auto* p = store_.Find(state_.order[i]);
        if (p != nullptr && p->isActive) {
            state_.turnIndex = i;
            return EngineResult<ParticipantId>::ok(p->id);
        }
    }
    return EngineResult<ParticipantId>::err(
        EngineError(ErrorCode::NoActiveParticipants, "no active participants"));
}

EngineResult<TurnAdvance> TurnOrderManager::NextTurn() {
    using Result = EngineResult<TurnAdvance>;

    if (state_.order.empty()) {
        return Result::err(EngineError(ErrorCode::InitiativeUnresolved,
                                       "turn order is not resolved"));
    }
    auto isActive = [this](ParticipantId id) {
        const auto* p = store_.Find(id);
        return p != nullptr && p->isActive;
    };
    if (std::none_of(state_.order.begin(), state_.order.end(), isActive)) {
        return Result::err(EngineError(ErrorCode::NoActiveParticipants,
                                       "no active participants"));
    }

    TurnAdvance advance;
    advance.previous = Current();

    auto idx = state_.turnIndex;
    do {
        if (++idx >= state_.order.size()) {
            idx = 0;
            ++state_.round;
            advance.newRound = true;
            ConditionEngine conditions(store_, state_.round);
            auto expired = conditions.ExpireTimed(state_.round);
            advance.expiredConditions.insert(advance.expiredConditions.end(),
                                             expired.begin(), expired.end());
        }
    } while (!isActive(state_.order[idx]));

    state_.turnIndex = idx;
    advance.current = state_.order[idx];
    advance.round = state_.round;

    for (auto& c : store_.ActiveConditions(advance.current)) {
        if (c.durationType == DurationType::UntilSave) {
            advance.savesDue.push_back(std::move(c));
        }
    }
    return Result::ok(std::move(advance));
}

}  // namespace dcc::combat
