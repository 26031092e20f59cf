/// @file combat_round_test.cpp
/// @brief End-to-end combat through EncounterManager with scripted dice.

#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "dcc/combat/dice.hpp"
#include "dcc/foundation/error_code.hpp"
#include "dcc/service/encounter_manager.hpp"

using namespace dcc::service;
using namespace dcc::combat;
using dcc::foundation::ErrorCode;

class CombatRoundTest : public ::testing::Test {
protected:
    void SetUp() override {
        dispatcher_.subscribe([this](const EncounterEvent& e) { events_.push_back(e); });
        manager_.setDiceFactory([this](EncounterId) {
            return std::make_unique<ScriptedDice>(rolls_);
        });
    }

    static ParticipantSpec character(const char* name, int32_t hp, int32_t ac, int32_t mod) {
        ParticipantSpec spec;
        spec.identity = AdHocName{name};
        spec.maxHp = hp;
        spec.initiativeModifier = mod;
        spec.stats.armorClass = ac;
        return spec;
    }

    std::shared_ptr<Encounter> create(std::vector<ParticipantSpec> participants) {
        EncounterSpec spec;
        spec.sessionId = SessionId(1);
        spec.participants = std::move(participants);
        auto created = manager_.createEncounter(spec);
        EXPECT_TRUE(created.hasValue());
        ids_ = created.value().participantIds;
        return manager_.find(created.value().encounterId).value();
    }

    const Participant& get(const std::shared_ptr<Encounter>& enc, ParticipantId id) {
        views_.push_back(enc->participant(id).value());
        return views_.back().participant;
    }

    std::vector<int32_t> rolls_;
    EventDispatcher dispatcher_{DispatchOptions{false, 1}};
    EncounterManager manager_{EngineConfig{}, dispatcher_};
    std::vector<EncounterEvent> events_;
    std::vector<ParticipantId> ids_;
    std::vector<ParticipantView> views_;
};

TEST_F(CombatRoundTest, InitiativeTieBreaksAndRoundFlow) {
    // All three total 15; the higher modifier goes first.
    rolls_ = {13, 12, 15};
    auto enc = create({character("Bard", 20, 12, 2), character("Monk", 24, 15, 3),
                       character("Troll", 84, 15, 0)});
    auto bard = ids_[0];
    auto monk = ids_[1];
    auto troll = ids_[2];

    for (auto id : ids_) {
        ASSERT_TRUE(enc->rollInitiative(id).hasValue());
    }
    std::vector<ParticipantId> expected{monk, bard, troll};
    EXPECT_EQ(enc->snapshot().turnOrder, expected);

    auto first = enc->start();
    ASSERT_TRUE(first.hasValue());
    EXPECT_EQ(first.value(), monk);

    EXPECT_EQ(enc->nextTurn().value().current, bard);
    EXPECT_EQ(enc->nextTurn().value().current, troll);
    auto wrap = enc->nextTurn();
    ASSERT_TRUE(wrap.hasValue());
    EXPECT_TRUE(wrap.value().newRound);
    EXPECT_EQ(wrap.value().round, 2u);
    EXPECT_EQ(wrap.value().current, monk);
}

TEST_F(CombatRoundTest, DamageModifiersTempHpAndCriticals) {
    auto fireImmune = character("Salamander", 30, 15, 0);
    fireImmune.stats.immunities = {DamageType::Fire};
    fireImmune.stats.vulnerabilities = {DamageType::Cold};
    fireImmune.initiative = 5;
    auto knight = character("Knight", 40, 18, 0);
    knight.stats.resistances = {DamageType::Slashing};
    knight.initiative = 15;

    auto enc = create({knight, fireImmune});
    auto knightId = ids_[0];
    auto salamander = ids_[1];
    ASSERT_TRUE(enc->start().hasValue());

    // Immunity, then vulnerability.
    AttackRequest fire;
    fire.attacker = knightId;
    fire.target = salamander;
    fire.attackRollTotal = 17;
    fire.damageRoll = 12;
    fire.damageType = DamageType::Fire;
    auto immune = enc->resolveAttack(fire);
    ASSERT_TRUE(immune.hasValue());
    EXPECT_TRUE(immune.value().hit);
    EXPECT_EQ(immune.value().damage->effectiveAmount, 0);

    AttackRequest cold = fire;
    cold.damageType = DamageType::Cold;
    cold.damageRoll = 7;
    auto doubled = enc->resolveAttack(cold);
    ASSERT_TRUE(doubled.hasValue());
    EXPECT_EQ(doubled.value().damage->effectiveAmount, 14);
    EXPECT_EQ(get(enc, salamander).status.currentHp, 16);

    // Temporary hit points do not stack and absorb before resistance-halved damage.
    ASSERT_TRUE(enc->setTempHp(knightId, 6).hasValue());
    ASSERT_TRUE(enc->setTempHp(knightId, 4).hasValue());
    EXPECT_EQ(get(enc, knightId).status.tempHp, 6);

    ASSERT_TRUE(enc->nextTurn().hasValue());
    AttackRequest claw;
    claw.attacker = salamander;
    claw.target = knightId;
    claw.attackRollTotal = 3;
    claw.isNatural20 = true;
    claw.damageRoll = 17;  // Dice already doubled by the caller.
    claw.damageType = DamageType::Slashing;
    auto crit = enc->resolveAttack(claw);
    ASSERT_TRUE(crit.hasValue());
    EXPECT_TRUE(crit.value().critical);
    EXPECT_EQ(crit.value().damage->effectiveAmount, 8);
    EXPECT_EQ(crit.value().damage->absorbedByTempHp, 6);
    EXPECT_EQ(get(enc, knightId).status.currentHp, 38);
    EXPECT_EQ(get(enc, knightId).status.tempHp, 0);

    auto log = enc->damageLog();
    ASSERT_EQ(log.size(), 3u);
    EXPECT_TRUE(log[2].isCritical);
    EXPECT_EQ(log[2].rawAmount, 17);
    EXPECT_EQ(log[2].amount, 8);
}

TEST_F(CombatRoundTest, DeathSaveSequenceEndsInDeath) {
    auto hero = character("Hero", 12, 14, 0);
    hero.initiative = 10;
    auto ogre = character("Ogre", 59, 11, 0);
    ogre.initiative = 20;
    auto enc = create({hero, ogre});
    auto heroId = ids_[0];
    auto ogreId = ids_[1];
    ASSERT_TRUE(enc->start().hasValue());

    AttackRequest club;
    club.attacker = ogreId;
    club.target = heroId;
    club.attackRollTotal = 16;
    club.damageRoll = 13;
    auto down = enc->resolveAttack(club);
    ASSERT_TRUE(down.hasValue());
    EXPECT_EQ(down.value().damage->vitalAfter, VitalState::Dying);

    ASSERT_TRUE(enc->nextTurn().hasValue());
    auto success = enc->rollDeathSave(heroId, 14);
    ASSERT_TRUE(success.hasValue());
    EXPECT_EQ(success.value().successes, 1);

    auto nat1 = enc->rollDeathSave(heroId, 1);
    ASSERT_TRUE(nat1.hasValue());
    EXPECT_EQ(nat1.value().outcome, DeathSaveOutcome::CriticalFailure);
    EXPECT_EQ(nat1.value().failures, 2);

    auto ok = enc->rollDeathSave(heroId, 11);
    ASSERT_TRUE(ok.hasValue());
    EXPECT_EQ(ok.value().successes, 2);
    EXPECT_EQ(ok.value().failures, 2);

    // Damage at 0 HP costs a failure: third failure kills.
    ASSERT_TRUE(enc->nextTurn().hasValue());
    club.attackRollTotal = 15;
    club.damageRoll = 4;
    auto finish = enc->resolveAttack(club);
    ASSERT_TRUE(finish.hasValue());
    EXPECT_EQ(finish.value().damage->deathSaveFailuresAdded, 1);
    EXPECT_EQ(get(enc, heroId).status.vital, VitalState::Dead);

    auto afterDeath = enc->heal(heroId, 10);
    ASSERT_TRUE(afterDeath.hasError());
    EXPECT_EQ(afterDeath.error().code(), ErrorCode::ParticipantDead);

    // Dead participants keep their place in the order.
    auto next = enc->nextTurn();
    ASSERT_TRUE(next.hasValue());
    EXPECT_EQ(next.value().current, heroId);
}

TEST_F(CombatRoundTest, ConditionsExpireAtRoundBoundary) {
    auto mage = character("Mage", 18, 12, 0);
    mage.initiative = 16;
    auto brute = character("Brute", 30, 13, 0);
    brute.initiative = 8;
    auto enc = create({mage, brute});
    auto mageId = ids_[0];
    auto bruteId = ids_[1];
    ASSERT_TRUE(enc->start().hasValue());

    ConditionRequest web;
    web.participantId = bruteId;
    web.name = ConditionName::Restrained;
    web.durationType = DurationType::Rounds;
    web.durationValue = 1;
    web.sourceDescription = "web";
    auto applied = enc->applyCondition(web);
    ASSERT_TRUE(applied.hasValue());
    ASSERT_TRUE(applied.value().condition.expiresAtRound.has_value());
    EXPECT_EQ(*applied.value().condition.expiresAtRound, 1u);

    // Restrained: attacks against it have advantage.
    AttackRequest bolt;
    bolt.attacker = mageId;
    bolt.target = bruteId;
    bolt.attackRollTotal = 14;
    bolt.damageRoll = 5;
    bolt.melee = false;
    bolt.damageType = DamageType::Force;
    auto attack = enc->resolveAttack(bolt);
    ASSERT_TRUE(attack.hasValue());
    EXPECT_EQ(attack.value().rollMode, RollMode::Advantage);

    auto bruteTurn = enc->nextTurn();
    ASSERT_TRUE(bruteTurn.hasValue());
    EXPECT_TRUE(bruteTurn.value().expiredConditions.empty());
    EXPECT_EQ(enc->activeConditions(bruteId).value().size(), 1u);

    auto round2 = enc->nextTurn();
    ASSERT_TRUE(round2.hasValue());
    ASSERT_EQ(round2.value().expiredConditions.size(), 1u);
    EXPECT_EQ(round2.value().expiredConditions[0].name, ConditionName::Restrained);
    EXPECT_TRUE(enc->activeConditions(bruteId).value().empty());

    const auto& lastEvent = events_.back();
    EXPECT_EQ(lastEvent.operation, OperationType::TurnAdvanced);
    EXPECT_EQ(lastEvent.round, 2u);
}

TEST_F(CombatRoundTest, AreaAttackUsesScriptedSaves) {
    rolls_ = {4, 18};
    auto caster = character("Sorcerer", 22, 12, 0);
    caster.initiative = 19;
    auto enc = create(
        {caster, character("Bandit A", 11, 12, 1), character("Bandit B", 11, 12, 1)});
    for (std::size_t i = 1; i < ids_.size(); ++i) {
        ASSERT_TRUE(enc->rollInitiative(ids_[i], InitiativeRequest{10, {}, false, false})
                        .hasValue());
    }
    ASSERT_TRUE(enc->start().hasValue());

    AoeRequest fireball;
    fireball.caster = ids_[0];
    fireball.targets = {{ids_[1], std::nullopt}, {ids_[2], std::nullopt}};
    fireball.saveDC = 15;
    fireball.saveAbility = Ability::Dexterity;
    fireball.damageRoll = 21;
    fireball.damageType = DamageType::Fire;

    auto result = enc->resolveAoeAttack(fireball);
    ASSERT_TRUE(result.hasValue());
    EXPECT_FALSE(result.value().targets[0].saved);
    EXPECT_EQ(result.value().targets[0].damage.vitalAfter, VitalState::Dying);
    EXPECT_TRUE(result.value().targets[1].saved);
    EXPECT_EQ(result.value().targets[1].damage.effectiveAmount, 10);
    EXPECT_EQ(get(enc, ids_[2]).status.currentHp, 1);
    EXPECT_EQ(events_.back().changed.size(), 3u);
}
