/// @file damage_resolver_test.cpp
/// @brief Unit tests for DamageResolver (damage pipeline, healing,
///        temporary hit points, death saves).

#include <gtest/gtest.h>

#include <limits>

#include "dcc/combat/condition_engine.hpp"
#include "dcc/combat/damage_resolver.hpp"
#include "dcc/foundation/error_code.hpp"

using namespace dcc::combat;
using dcc::foundation::ErrorCode;

class DamageResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        ParticipantSpec spec;
        spec.identity = AdHocName{"Cleric"};
        spec.maxHp = 20;
        cleric_ = store_.Add(spec).value();

        spec.identity = AdHocName{"Skeleton"};
        spec.maxHp = 13;
        spec.stats.vulnerabilities = {DamageType::Bludgeoning};
        spec.stats.immunities = {DamageType::Poison};
        spec.stats.resistances = {DamageType::Piercing};
        skeleton_ = store_.Add(spec).value();
    }

    DamageResult hit(ParticipantId target, int32_t amount,
                     DamageType type = DamageType::Slashing, bool crit = false) {
        DamageRequest req;
        req.target = target;
        req.amount = amount;
        req.type = type;
        req.isCritical = crit;
        auto result = resolver_.ApplyDamage(req);
        EXPECT_TRUE(result.hasValue());
        return result.hasValue() ? result.value() : DamageResult{};
    }

    void dropToZero(ParticipantId id) {
        auto& status = store_.Find(id)->status;
        hit(id, status.currentHp);
        ASSERT_EQ(store_.Find(id)->status.vital, VitalState::Dying);
    }

    const ParticipantStatus& status(ParticipantId id) { return store_.Find(id)->status; }

    ParticipantStore store_{EncounterId(1)};
    DamageResolver resolver_{store_, 2};
    ParticipantId cleric_;
    ParticipantId skeleton_;
};

// -- Effective damage ---------------------------------------------------------

TEST(DamageResolverStaticTest, ImmunityBeatsVulnerabilityBeatsResistance) {
    DamageDefenses defenses;
    defenses.immunities = {DamageType::Fire};
    defenses.vulnerabilities = {DamageType::Fire, DamageType::Cold};
    defenses.resistances = {DamageType::Cold, DamageType::Acid};

    EXPECT_EQ(DamageResolver::EffectiveDamage(10, DamageType::Fire, defenses), 0);
    EXPECT_EQ(DamageResolver::EffectiveDamage(10, DamageType::Cold, defenses), 20);
    EXPECT_EQ(DamageResolver::EffectiveDamage(7, DamageType::Acid, defenses), 3);
    EXPECT_EQ(DamageResolver::EffectiveDamage(7, DamageType::Thunder, defenses), 7);
    EXPECT_EQ(DamageResolver::EffectiveDamage(0, DamageType::Cold, defenses), 0);
}

TEST(DamageResolverStaticTest, ResistAllHalvesEveryType) {
    DamageDefenses defenses;
    defenses.resistAll = true;
    EXPECT_EQ(DamageResolver::EffectiveDamage(9, DamageType::Force, defenses), 4);
}

TEST(DamageResolverStaticTest, VulnerabilitySaturatesInsteadOfWrapping) {
    DamageDefenses defenses;
    defenses.vulnerabilities = {DamageType::Fire};
    constexpr int32_t kMax = std::numeric_limits<int32_t>::max();
    EXPECT_EQ(DamageResolver::EffectiveDamage(1200000000, DamageType::Fire, defenses), kMax);
    EXPECT_EQ(DamageResolver::EffectiveDamage(kMax, DamageType::Fire, defenses), kMax);
    EXPECT_EQ(DamageResolver::EffectiveDamage(kMax / 2, DamageType::Fire, defenses), kMax - 1);
}

// -- ApplyDamage --------------------------------------------------------------

TEST_F(DamageResolverTest, DamageAppliesModifiersAndLogs) {
    auto crushed = hit(skeleton_, 5, DamageType::Bludgeoning);
    EXPECT_EQ(crushed.rawAmount, 5);
    EXPECT_EQ(crushed.effectiveAmount, 10);
    EXPECT_EQ(crushed.newCurrentHp, 3);

    auto poisoned = hit(skeleton_, 8, DamageType::Poison);
    EXPECT_EQ(poisoned.effectiveAmount, 0);
    EXPECT_EQ(status(skeleton_).currentHp, 3);

    auto log = store_.DamageLog();
    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log[0].amount, 10);
    EXPECT_EQ(log[0].rawAmount, 5);
    EXPECT_EQ(log[0].round, 2u);
    EXPECT_EQ(log[1].amount, 0);
    EXPECT_EQ(crushed.logEntryId, log[0].id);
}

TEST_F(DamageResolverTest, TempHpAbsorbsFirst) {
    ASSERT_TRUE(resolver_.SetTempHp(cleric_, 5).hasValue());
    auto result = hit(cleric_, 8);
    EXPECT_EQ(result.absorbedByTempHp, 5);
    EXPECT_EQ(result.newTempHp, 0);
    EXPECT_EQ(result.newCurrentHp, 17);
}

TEST_F(DamageResolverTest, HugeVulnerableHitKillsWithoutCorruptingHp) {
    ASSERT_TRUE(resolver_.SetTempHp(skeleton_, 4).hasValue());
    auto result = hit(skeleton_, 1200000000, DamageType::Bludgeoning);
    EXPECT_EQ(result.effectiveAmount, std::numeric_limits<int32_t>::max());
    EXPECT_EQ(result.absorbedByTempHp, 4);
    EXPECT_EQ(result.newTempHp, 0);
    EXPECT_EQ(result.newCurrentHp, 0);
    EXPECT_TRUE(result.instantDeath);
    EXPECT_EQ(result.vitalAfter, VitalState::Dead);
}

TEST_F(DamageResolverTest, DroppingToZeroStartsDying) {
    auto result = hit(cleric_, 25);
    EXPECT_EQ(result.newCurrentHp, 0);
    EXPECT_EQ(result.vitalBefore, VitalState::Conscious);
    EXPECT_EQ(result.vitalAfter, VitalState::Dying);
    EXPECT_FALSE(result.instantDeath);
}

TEST_F(DamageResolverTest, MassiveDamageKillsOutright) {
    auto result = hit(cleric_, 40);
    EXPECT_TRUE(result.instantDeath);
    EXPECT_EQ(result.vitalAfter, VitalState::Dead);
}

TEST_F(DamageResolverTest, DamageAtZeroAddsDeathSaveFailures) {
    dropToZero(cleric_);

    auto first = hit(cleric_, 3);
    EXPECT_EQ(first.deathSaveFailuresAdded, 1);
    EXPECT_EQ(status(cleric_).deathSaveFailures, 1);

    auto crit = hit(cleric_, 3, DamageType::Slashing, true);
    EXPECT_EQ(crit.deathSaveFailuresAdded, 2);
    EXPECT_EQ(status(cleric_).deathSaveFailures, 3);
    EXPECT_EQ(status(cleric_).vital, VitalState::Dead);
}

TEST_F(DamageResolverTest, DamageWhileStableResumesDying) {
    dropToZero(cleric_);
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(resolver_.RollDeathSave(cleric_, 12).hasValue());
    }
    ASSERT_EQ(status(cleric_).vital, VitalState::Stable);

    hit(cleric_, 2);
    EXPECT_EQ(status(cleric_).vital, VitalState::Dying);
    EXPECT_EQ(status(cleric_).deathSaveSuccesses, 0);
    EXPECT_EQ(status(cleric_).deathSaveFailures, 1);
}

TEST_F(DamageResolverTest, ApplyDamageRejectsBadInput) {
    DamageRequest negative;
    negative.target = cleric_;
    negative.amount = -1;
    auto neg = resolver_.ApplyDamage(negative);
    ASSERT_TRUE(neg.hasError());
    EXPECT_EQ(neg.error().code(), ErrorCode::NegativeAmount);

    DamageRequest unknown;
    unknown.target = ParticipantId(404);
    unknown.amount = 1;
    auto missing = resolver_.ApplyDamage(unknown);
    ASSERT_TRUE(missing.hasError());
    EXPECT_EQ(missing.error().code(), ErrorCode::ParticipantNotFound);

    hit(cleric_, 100);
    DamageRequest again;
    again.target = cleric_;
    again.amount = 1;
    auto dead = resolver_.ApplyDamage(again);
    ASSERT_TRUE(dead.hasError());
    EXPECT_EQ(dead.error().code(), ErrorCode::ParticipantDead);
    EXPECT_EQ(store_.DamageLogSize(), 1u);
}

TEST_F(DamageResolverTest, PetrifiedTargetResistsAndIgnoresPoison) {
    ConditionEngine conditions(store_, 2);
    ConditionRequest stone;
    stone.participantId = cleric_;
    stone.name = ConditionName::Petrified;
    ASSERT_TRUE(conditions.Apply(stone).hasValue());

    EXPECT_EQ(hit(cleric_, 9, DamageType::Fire).effectiveAmount, 4);
    EXPECT_EQ(hit(cleric_, 9, DamageType::Poison).effectiveAmount, 0);
}

// -- Healing and temporary hit points -----------------------------------------

TEST_F(DamageResolverTest, HealClampsToMax) {
    hit(cleric_, 6);
    auto healed = resolver_.Heal(cleric_, 50);
    ASSERT_TRUE(healed.hasValue());
    EXPECT_EQ(healed.value().newCurrentHp, 20);
    EXPECT_FALSE(healed.value().regainedConsciousness);
}

TEST_F(DamageResolverTest, HealOfInt32MaxStopsAtMax) {
    hit(cleric_, 15);
    auto healed = resolver_.Heal(cleric_, std::numeric_limits<int32_t>::max());
    ASSERT_TRUE(healed.hasValue());
    EXPECT_EQ(healed.value().newCurrentHp, 20);
    EXPECT_EQ(status(cleric_).currentHp, 20);
}

TEST_F(DamageResolverTest, HealRevivesDyingParticipant) {
    dropToZero(cleric_);
    hit(cleric_, 1);
    auto healed = resolver_.Heal(cleric_, 4);
    ASSERT_TRUE(healed.hasValue());
    EXPECT_TRUE(healed.value().regainedConsciousness);
    EXPECT_EQ(status(cleric_).currentHp, 4);
    EXPECT_EQ(status(cleric_).vital, VitalState::Conscious);
    EXPECT_EQ(status(cleric_).deathSaveFailures, 0);
}

TEST_F(DamageResolverTest, HealRejectsDeadAndNegative) {
    auto negative = resolver_.Heal(cleric_, -3);
    ASSERT_TRUE(negative.hasError());
    EXPECT_EQ(negative.error().code(), ErrorCode::NegativeAmount);

    hit(cleric_, 100);
    auto dead = resolver_.Heal(cleric_, 5);
    ASSERT_TRUE(dead.hasError());
    EXPECT_EQ(dead.error().code(), ErrorCode::ParticipantDead);
}

TEST_F(DamageResolverTest, TempHpDoesNotStack) {
    auto first = resolver_.SetTempHp(cleric_, 8);
    ASSERT_TRUE(first.hasValue());
    EXPECT_EQ(first.value().newTempHp, 8);

    auto lower = resolver_.SetTempHp(cleric_, 3);
    ASSERT_TRUE(lower.hasValue());
    EXPECT_EQ(lower.value().previousTempHp, 8);
    EXPECT_EQ(lower.value().newTempHp, 8);

    auto higher = resolver_.SetTempHp(cleric_, 10);
    ASSERT_TRUE(higher.hasValue());
    EXPECT_EQ(higher.value().newTempHp, 10);

    auto negative = resolver_.SetTempHp(cleric_, -1);
    ASSERT_TRUE(negative.hasError());
    EXPECT_EQ(negative.error().code(), ErrorCode::NegativeAmount);
}

// -- Death saves --------------------------------------------------------------

TEST_F(DamageResolverTest, DeathSaveSequence) {
    dropToZero(cleric_);

    auto success = resolver_.RollDeathSave(cleric_, 10);
    ASSERT_TRUE(success.hasValue());
    EXPECT_EQ(success.value().outcome, DeathSaveOutcome::Success);

    auto failure = resolver_.RollDeathSave(cleric_, 9);
    ASSERT_TRUE(failure.hasValue());
    EXPECT_EQ(failure.value().outcome, DeathSaveOutcome::Failure);

    auto critFail = resolver_.RollDeathSave(cleric_, 1);
    ASSERT_TRUE(critFail.hasValue());
    EXPECT_EQ(critFail.value().outcome, DeathSaveOutcome::Died);
    EXPECT_EQ(critFail.value().successes, 1);
    EXPECT_EQ(critFail.value().failures, 3);
    EXPECT_EQ(critFail.value().vital, VitalState::Dead);
}

TEST_F(DamageResolverTest, NaturalOneCountsTwice) {
    dropToZero(cleric_);
    auto result = resolver_.RollDeathSave(cleric_, 1);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().outcome, DeathSaveOutcome::CriticalFailure);
    EXPECT_EQ(result.value().failures, 2);
    EXPECT_EQ(result.value().vital, VitalState::Dying);
}

TEST_F(DamageResolverTest, NaturalTwentyRevives) {
    dropToZero(cleric_);
    ASSERT_TRUE(resolver_.RollDeathSave(cleric_, 5).hasValue());
    auto result = resolver_.RollDeathSave(cleric_, 20);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().outcome, DeathSaveOutcome::Revived);
    EXPECT_EQ(status(cleric_).currentHp, 1);
    EXPECT_EQ(status(cleric_).vital, VitalState::Conscious);
    EXPECT_EQ(status(cleric_).deathSaveFailures, 0);
}

TEST_F(DamageResolverTest, ThreeSuccessesStabilize) {
    dropToZero(cleric_);
    ASSERT_TRUE(resolver_.RollDeathSave(cleric_, 15).hasValue());
    ASSERT_TRUE(resolver_.RollDeathSave(cleric_, 11).hasValue());
    auto third = resolver_.RollDeathSave(cleric_, 19);
    ASSERT_TRUE(third.hasValue());
    EXPECT_EQ(third.value().outcome, DeathSaveOutcome::Stabilized);
    EXPECT_EQ(third.value().vital, VitalState::Stable);

    auto further = resolver_.RollDeathSave(cleric_, 12);
    ASSERT_TRUE(further.hasError());
    EXPECT_EQ(further.error().code(), ErrorCode::ParticipantNotDying);
}

TEST_F(DamageResolverTest, DeathSaveRejectsBadRollsAndConsciousTargets) {
    auto conscious = resolver_.RollDeathSave(cleric_, 10);
    ASSERT_TRUE(conscious.hasError());
    EXPECT_EQ(conscious.error().code(), ErrorCode::ParticipantNotDying);

    dropToZero(cleric_);
    for (int roll : {0, 21}) {
        auto bad = resolver_.RollDeathSave(cleric_, roll);
        ASSERT_TRUE(bad.hasError());
        EXPECT_EQ(bad.error().code(), ErrorCode::RollOutOfRange);
    }
}
