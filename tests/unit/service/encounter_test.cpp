/// @file encounter_test.cpp
/// @brief Unit tests for Encounter (state machine, turn enforcement,
///        atomic mutations, events and reads).

#include <gtest/gtest.h>

#include <limits>
#include <memory>
#include <vector>

#include "dcc/foundation/error_code.hpp"
#include "dcc/service/encounter.hpp"

using namespace dcc::service;
using dcc::combat::AdHocName;
using dcc::combat::ConditionName;
using dcc::combat::DamageType;
using dcc::combat::DurationType;
using dcc::combat::EncounterStatus;
using dcc::combat::ParticipantSpec;
using dcc::combat::ScriptedDice;
using dcc::combat::VitalState;
using dcc::foundation::ErrorCode;
using dcc::foundation::ErrorKind;

namespace {

ParticipantSpec makeSpec(const char* name, int32_t hp, std::optional<int32_t> initiative = {}) {
    ParticipantSpec spec;
    spec.identity = AdHocName{name};
    spec.maxHp = hp;
    spec.initiative = initiative;
    spec.stats.armorClass = 12;
    return spec;
}

} // namespace

namespace dcc::service {

class EncounterStateAccess {
public:
    static EncounterState& committed(Encounter& encounter) { return encounter.state_; }
};

}  // namespace dcc::service

class EncounterTest : public ::testing::Test {
protected:
    void SetUp() override {
        dispatcher_.subscribe([this](const EncounterEvent& e) { events_.push_back(e); });
    }

    /// Encounter with a fighter (initiative 18) and a goblin (initiative 9).
    std::unique_ptr<Encounter> makeEncounter(EncounterOptions options = {},
                                             std::vector<int32_t> rolls = {}) {
        auto encounter = std::make_unique<Encounter>(
            EncounterId(1), SessionId(10), options,
            std::make_unique<ScriptedDice>(std::move(rolls)), dispatcher_);
        EncounterSpec spec;
        spec.sessionId = SessionId(10);
        spec.participants = {makeSpec("Fighter", 30, 18), makeSpec("Goblin", 7, 9)};
        auto ids = encounter->initialize(spec);
        EXPECT_TRUE(ids.hasValue());
        if (ids.hasValue()) {
            fighter_ = ids.value()[0];
            goblin_ = ids.value()[1];
        }
        return encounter;
    }

    dcc::combat::AttackRequest attack(ParticipantId from, ParticipantId to, int32_t total,
                                      int32_t damage) {
        dcc::combat::AttackRequest req;
        req.attacker = from;
        req.target = to;
        req.attackRollTotal = total;
        req.damageRoll = damage;
        req.damageType = DamageType::Slashing;
        return req;
    }

    EventDispatcher dispatcher_{DispatchOptions{false, 1}};
    std::vector<EncounterEvent> events_;
    ParticipantId fighter_;
    ParticipantId goblin_;
};

// -- Lifecycle ----------------------------------------------------------------

TEST_F(EncounterTest, InitializeEmitsCreatedEventWithOrder) {
    auto enc = makeEncounter();
    ASSERT_EQ(events_.size(), 1u);
    EXPECT_EQ(events_[0].operation, OperationType::EncounterCreated);
    EXPECT_EQ(events_[0].sequence, 1u);
    EXPECT_EQ(events_[0].changed.size(), 2u);

    auto snap = enc->snapshot();
    EXPECT_EQ(snap.status, EncounterStatus::Setup);
    EXPECT_EQ(snap.round, 1u);
    std::vector<ParticipantId> expected{fighter_, goblin_};
    EXPECT_EQ(snap.turnOrder, expected);
    EXPECT_FALSE(snap.currentParticipant.has_value());
}

TEST_F(EncounterTest, InvalidSpecLeavesNothingBehind) {
    Encounter enc(EncounterId(2), SessionId(1), {}, std::make_unique<ScriptedDice>(),
                  dispatcher_);
    EncounterSpec spec;
    spec.participants = {makeSpec("Ok", 10), makeSpec("Broken", 0)};
    auto result = enc.initialize(spec);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidParticipantSpec);
    EXPECT_TRUE(enc.snapshot().participants.empty());
    EXPECT_TRUE(events_.empty());
}

TEST_F(EncounterTest, SurpriseRoundStartsAtZero) {
    Encounter enc(EncounterId(3), SessionId(1), {}, std::make_unique<ScriptedDice>(),
                  dispatcher_);
    EncounterSpec spec;
    spec.participants = {makeSpec("Assassin", 20, 15)};
    spec.surpriseRound = true;
    ASSERT_TRUE(enc.initialize(spec).hasValue());
    ASSERT_TRUE(enc.start().hasValue());
    EXPECT_EQ(enc.snapshot().round, 0u);
    auto next = enc.nextTurn();
    ASSERT_TRUE(next.hasValue());
    EXPECT_EQ(next.value().round, 1u);
}

TEST_F(EncounterTest, StartRequiresResolvedInitiative) {
    Encounter enc(EncounterId(4), SessionId(1), {}, std::make_unique<ScriptedDice>(),
                  dispatcher_);
    EncounterSpec spec;
    spec.participants = {makeSpec("A", 10, 12), makeSpec("B", 10)};
    ASSERT_TRUE(enc.initialize(spec).hasValue());

    auto early = enc.start();
    ASSERT_TRUE(early.hasError());
    EXPECT_EQ(early.error().code(), ErrorCode::InitiativeUnresolved);
    EXPECT_EQ(enc.status(), EncounterStatus::Setup);
}

TEST_F(EncounterTest, StartWithoutParticipantsFails) {
    Encounter enc(EncounterId(5), SessionId(1), {}, std::make_unique<ScriptedDice>(),
                  dispatcher_);
    ASSERT_TRUE(enc.initialize(EncounterSpec{}).hasValue());
    auto started = enc.start();
    ASSERT_TRUE(started.hasError());
    EXPECT_EQ(started.error().code(), ErrorCode::NoActiveParticipants);
}

TEST_F(EncounterTest, FullStateMachine) {
    auto enc = makeEncounter();

    auto first = enc->start();
    ASSERT_TRUE(first.hasValue());
    EXPECT_EQ(first.value(), fighter_);
    EXPECT_EQ(enc->snapshot().currentParticipant, fighter_);

    ASSERT_TRUE(enc->pause().hasValue());
    EXPECT_EQ(enc->status(), EncounterStatus::Paused);
    auto pausedTurn = enc->nextTurn();
    ASSERT_TRUE(pausedTurn.hasError());
    EXPECT_EQ(pausedTurn.error().kind(), ErrorKind::InvalidState);

    ASSERT_TRUE(enc->resume().hasValue());
    ASSERT_TRUE(enc->complete().hasValue());
    EXPECT_EQ(enc->status(), EncounterStatus::Completed);

    auto after = enc->heal(fighter_, 1);
    ASSERT_TRUE(after.hasError());
    EXPECT_EQ(after.error().code(), ErrorCode::EncounterInvalidState);
    EXPECT_EQ(after.error().message(), "encounter is completed");

    auto restart = enc->resume();
    ASSERT_TRUE(restart.hasError());
    EXPECT_EQ(restart.error().code(), ErrorCode::EncounterInvalidState);
}

TEST_F(EncounterTest, StatusGates) {
    auto enc = makeEncounter();

    auto pauseInSetup = enc->pause();
    ASSERT_TRUE(pauseInSetup.hasError());
    EXPECT_EQ(pauseInSetup.error().code(), ErrorCode::EncounterInvalidState);

    auto attackInSetup = enc->resolveAttack(attack(fighter_, goblin_, 15, 3));
    ASSERT_TRUE(attackInSetup.hasError());
    EXPECT_EQ(attackInSetup.error().code(), ErrorCode::EncounterInvalidState);

    auto completeInSetup = enc->complete();
    ASSERT_TRUE(completeInSetup.hasError());

    // Setup allows direct hit-point and condition changes.
    dcc::combat::DamageRequest dmg;
    dmg.target = goblin_;
    dmg.amount = 2;
    EXPECT_TRUE(enc->applyDamage(dmg).hasValue());

    ASSERT_TRUE(enc->start().hasValue());
    auto reorderActive = enc->reorder(goblin_, 20);
    ASSERT_TRUE(reorderActive.hasError());
    EXPECT_EQ(reorderActive.error().code(), ErrorCode::EncounterInvalidState);

    ASSERT_TRUE(enc->pause().hasValue());
    auto healPaused = enc->heal(goblin_, 1);
    ASSERT_TRUE(healPaused.hasError());
    EXPECT_EQ(healPaused.error().code(), ErrorCode::EncounterInvalidState);

    auto reordered = enc->reorder(goblin_, 20);
    ASSERT_TRUE(reordered.hasValue());
    std::vector<ParticipantId> expected{goblin_, fighter_};
    EXPECT_EQ(reordered.value(), expected);
    // The fighter keeps the turn across the reorder.
    EXPECT_EQ(enc->snapshot().currentParticipant, fighter_);
}

// -- Turn enforcement ---------------------------------------------------------

TEST_F(EncounterTest, OutOfTurnAttackIsFlagged) {
    auto enc = makeEncounter();
    ASSERT_TRUE(enc->start().hasValue());

    auto result = enc->resolveAttack(attack(goblin_, fighter_, 14, 4));
    ASSERT_TRUE(result.hasValue());
    EXPECT_TRUE(result.value().outOfTurn);
    EXPECT_TRUE(events_.back().outOfTurn);
    EXPECT_EQ(events_.back().operation, OperationType::Attack);
}

TEST_F(EncounterTest, StrictModeRejectsOutOfTurn) {
    EncounterOptions strict;
    strict.strictTurnOrder = true;
    auto enc = makeEncounter(strict);
    ASSERT_TRUE(enc->start().hasValue());
    auto before = events_.size();

    auto result = enc->resolveAttack(attack(goblin_, fighter_, 14, 4));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::OutOfTurn);
    EXPECT_EQ(events_.size(), before);
    EXPECT_EQ(enc->participant(fighter_).value().participant.status.currentHp, 30);

    auto inTurn = enc->resolveAttack(attack(fighter_, goblin_, 14, 4));
    ASSERT_TRUE(inTurn.hasValue());
    EXPECT_FALSE(inTurn.value().outOfTurn);
}

TEST_F(EncounterTest, AutoRollFillsMissingInitiative) {
    EncounterOptions autoRoll;
    autoRoll.autoRollInitiative = true;
    auto enc = makeEncounter(autoRoll, {4});

    auto added = enc->addParticipant(makeSpec("Wolf", 11));
    ASSERT_TRUE(added.hasValue());
    auto wolf = enc->participant(added.value()).value().participant;
    EXPECT_EQ(wolf.initiative, 4);
    EXPECT_EQ(enc->snapshot().turnOrder.size(), 3u);
}

TEST_F(EncounterTest, JoiningMidCombatKeepsCurrentTurn) {
    auto enc = makeEncounter();
    ASSERT_TRUE(enc->start().hasValue());
    ASSERT_TRUE(enc->nextTurn().hasValue());
    ASSERT_EQ(enc->snapshot().currentParticipant, goblin_);

    auto added = enc->addParticipant(makeSpec("Hawk", 5, 20));
    ASSERT_TRUE(added.hasValue());
    auto snap = enc->snapshot();
    EXPECT_EQ(snap.turnOrder.front(), added.value());
    EXPECT_EQ(snap.currentParticipant, goblin_);
}

TEST_F(EncounterTest, RemovedParticipantIsSkippedAndRejected) {
    auto enc = makeEncounter();
    ASSERT_TRUE(enc->addParticipant(makeSpec("Cleric", 20, 12)).hasValue());
    ASSERT_TRUE(enc->start().hasValue());

    ASSERT_TRUE(enc->removeParticipant(goblin_).hasValue());
    auto next = enc->nextTurn();
    ASSERT_TRUE(next.hasValue());
    EXPECT_NE(next.value().current, goblin_);

    auto heal = enc->heal(goblin_, 2);
    ASSERT_TRUE(heal.hasError());
    EXPECT_EQ(heal.error().code(), ErrorCode::EncounterInvalidState);

    auto again = enc->removeParticipant(goblin_);
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.error().code(), ErrorCode::EncounterInvalidState);
}

TEST_F(EncounterTest, DeathSaveChecksTurn) {
    EncounterOptions strict;
    strict.strictTurnOrder = true;
    auto enc = makeEncounter(strict);
    ASSERT_TRUE(enc->start().hasValue());
    ASSERT_TRUE(enc->resolveAttack(attack(fighter_, goblin_, 20, 7)).hasValue());
    ASSERT_EQ(enc->participant(goblin_).value().participant.status.vital, VitalState::Dying);

    auto early = enc->rollDeathSave(goblin_, 12);
    ASSERT_TRUE(early.hasError());
    EXPECT_EQ(early.error().code(), ErrorCode::OutOfTurn);

    ASSERT_TRUE(enc->nextTurn().hasValue());
    auto save = enc->rollDeathSave(goblin_, 12);
    ASSERT_TRUE(save.hasValue());
    EXPECT_EQ(save.value().successes, 1);
}

// -- Events and atomicity -----------------------------------------------------

TEST_F(EncounterTest, OneEventPerSuccessfulMutation) {
    auto enc = makeEncounter();
    ASSERT_TRUE(enc->start().hasValue());
    ASSERT_TRUE(enc->resolveAttack(attack(fighter_, goblin_, 5, 4)).hasValue());  // miss
    ASSERT_TRUE(enc->nextTurn().hasValue());
    auto bad = enc->heal(goblin_, -1);
    ASSERT_TRUE(bad.hasError());

    ASSERT_EQ(events_.size(), 4u);
    for (std::size_t i = 0; i < events_.size(); ++i) {
        EXPECT_EQ(events_[i].sequence, i + 1);
        EXPECT_EQ(events_[i].encounterId, EncounterId(1));
    }
    EXPECT_EQ(events_[1].operation, OperationType::EncounterStarted);
    EXPECT_EQ(events_[2].operation, OperationType::Attack);
    EXPECT_EQ(events_[3].operation, OperationType::TurnAdvanced);
}

TEST_F(EncounterTest, FailedAoeAppliesNoDamage) {
    auto enc = makeEncounter();
    ASSERT_TRUE(enc->start().hasValue());

    dcc::combat::AoeRequest req;
    req.caster = fighter_;
    req.targets = {{goblin_, 3}, {ParticipantId(99), 3}};
    req.damageRoll = 5;
    auto result = enc->resolveAoeAttack(req);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ParticipantNotFound);
    EXPECT_EQ(enc->participant(goblin_).value().participant.status.currentHp, 7);
    EXPECT_TRUE(enc->damageLog().empty());
}

TEST_F(EncounterTest, ExhaustedDiceFailsCleanly) {
    auto enc = makeEncounter();
    auto added = enc->addParticipant(makeSpec("Bat", 1));
    ASSERT_TRUE(added.hasValue());
    auto roll = enc->rollInitiative(added.value());
    ASSERT_TRUE(roll.hasError());
    EXPECT_EQ(roll.error().code(), ErrorCode::DiceSequenceExhausted);
    EXPECT_FALSE(enc->participant(added.value()).value().participant.initiative.has_value());
}

// -- Conditions through the facade --------------------------------------------

TEST_F(EncounterTest, ConditionLifecycleAndReads) {
    auto enc = makeEncounter();
    dcc::combat::ConditionRequest req;
    req.participantId = goblin_;
    req.name = ConditionName::Restrained;
    req.durationType = DurationType::UntilSave;
    req.saveDC = 12;
    req.saveAbility = dcc::combat::Ability::Strength;
    auto applied = enc->applyCondition(req);
    ASSERT_TRUE(applied.hasValue());

    auto conditions = enc->activeConditions(goblin_);
    ASSERT_TRUE(conditions.hasValue());
    ASSERT_EQ(conditions.value().size(), 1u);

    auto effects = enc->mechanicalEffects(goblin_);
    ASSERT_TRUE(effects.hasValue());
    EXPECT_EQ(effects.value().movement, dcc::combat::Movement::Immobile);

    auto save = enc->attemptSave(applied.value().condition.id, 14);
    ASSERT_TRUE(save.hasValue());
    EXPECT_TRUE(save.value().success);
    EXPECT_TRUE(enc->activeConditions(goblin_).value().empty());

    auto unknown = enc->activeConditions(ParticipantId(42));
    ASSERT_TRUE(unknown.hasError());
    EXPECT_EQ(unknown.error().code(), ErrorCode::ParticipantNotFound);
}

// -- Halting ------------------------------------------------------------------

TEST_F(EncounterTest, HealOfInt32MaxFillsToMaxWithoutHalting) {
    auto enc = makeEncounter();
    dcc::combat::DamageRequest burn;
    burn.target = fighter_;
    burn.amount = 25;
    burn.type = DamageType::Fire;
    ASSERT_TRUE(enc->applyDamage(burn).hasValue());

    auto healed = enc->heal(fighter_, std::numeric_limits<int32_t>::max());
    ASSERT_TRUE(healed.hasValue());
    EXPECT_EQ(healed.value().newCurrentHp, 30);
    EXPECT_EQ(enc->participant(fighter_).value().participant.status.currentHp, 30);
    EXPECT_FALSE(enc->isHalted());
}

TEST_F(EncounterTest, BrokenInvariantHaltsAndKeepsCommittedState) {
    auto enc = makeEncounter();
    EncounterStateAccess::committed(*enc).store.Find(goblin_)->status.deathSaveFailures = 5;
    auto eventsBefore = events_.size();

    auto temp = enc->setTempHp(fighter_, 5);
    ASSERT_TRUE(temp.hasError());
    EXPECT_EQ(temp.error().code(), ErrorCode::EncounterHalted);
    EXPECT_EQ(temp.error().kind(), ErrorKind::InvalidState);

    EXPECT_TRUE(enc->isHalted());
    EXPECT_TRUE(enc->snapshot().halted);
    ASSERT_EQ(events_.size(), eventsBefore + 1);
    EXPECT_EQ(events_.back().operation, OperationType::Halted);
    EXPECT_EQ(enc->participant(fighter_).value().participant.status.tempHp, 0);

    auto heal = enc->heal(fighter_, 1);
    ASSERT_TRUE(heal.hasError());
    EXPECT_EQ(heal.error().code(), ErrorCode::EncounterHalted);
    EXPECT_EQ(heal.error().kind(), ErrorKind::InvalidState);
    EXPECT_EQ(events_.size(), eventsBefore + 1);
}
