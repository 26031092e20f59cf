/// @file scenario_runner_test.cpp
/// @brief Replays YAML scenarios through ScenarioRunner.

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "dcc/foundation/error_code.hpp"
#include "dcc/service/scenario_runner.hpp"

using namespace dcc::service;
using dcc::combat::EncounterStatus;
using dcc::combat::VitalState;
using dcc::foundation::ErrorCode;

namespace {

const ParticipantView* findByName(const EncounterSnapshot& snapshot, const std::string& name) {
    for (const auto& view : snapshot.participants) {
        if (view.participant.name == name) {
            return &view;
        }
    }
    return nullptr;
}

constexpr const char* kDuel = R"(
name: duel
dice: [6]
participants:
  - key: hero
    name: Hero
    character: 1
    max_hp: 20
    armor_class: 15
    initiative: 18
  - key: bandit
    name: Bandit
    creature: 9
    max_hp: 11
    armor_class: 12
    initiative: 7
steps:
  - start
  - attack: { attacker: hero, target: bandit, attack_roll: 14, damage: "1d8+2", type: slashing }
  - next_turn
  - attack: { attacker: bandit, target: hero, attack_roll: 9, damage: 4 }
  - temp_hp: { target: hero, amount: 5 }
  - damage: { target: hero, amount: 7, type: fire }
)";

} // namespace

// ============================================================================
// Inline scenarios
// ============================================================================

TEST(ScenarioRunnerTest, DuelRunsToCompletion) {
    ScenarioRunner runner;
    auto report = runner.runString(kDuel);
    ASSERT_TRUE(report.hasValue());
    const auto& r = report.value();
    EXPECT_TRUE(r.succeeded());
    EXPECT_EQ(r.name, "duel");
    ASSERT_EQ(r.steps.size(), 6u);
    EXPECT_EQ(r.steps[1].message.rfind("hit", 0), 0u);

    const auto* bandit = findByName(r.finalSnapshot, "Bandit");
    ASSERT_NE(bandit, nullptr);
    EXPECT_EQ(bandit->participant.status.currentHp, 3);

    // 7 fire: 5 absorbed by temp HP, 2 from the hero.
    const auto* hero = findByName(r.finalSnapshot, "Hero");
    ASSERT_NE(hero, nullptr);
    EXPECT_EQ(hero->participant.status.currentHp, 18);
    EXPECT_EQ(hero->participant.status.tempHp, 0);

    // created, started, attack, turn, missed attack, temp hp, damage
    ASSERT_EQ(r.events.size(), 7u);
    EXPECT_EQ(r.events.back().operation, OperationType::Damage);
    EXPECT_EQ(r.events.back().sequence, 7u);
}

TEST(ScenarioRunnerTest, ExpectedErrorCountsAsSuccess) {
    ScenarioRunner runner;
    auto report = runner.runString(R"(
participants:
  - { key: a, name: A, character: 1, max_hp: 8, initiative: 10 }
steps:
  - death_save: { participant: a, roll: 10, expect_error: InvalidState }
  - start
  - pause
  - attack: { attacker: a, target: a, attack_roll: 10, damage: 1, expect_error: InvalidState }
  - resume
)");
    ASSERT_TRUE(report.hasValue());
    EXPECT_TRUE(report.value().succeeded());
    EXPECT_EQ(report.value().steps.size(), 5u);
    EXPECT_EQ(report.value().finalSnapshot.status, EncounterStatus::Active);
}

TEST(ScenarioRunnerTest, UnexpectedOutcomeStopsReplay) {
    ScenarioRunner runner;
    auto report = runner.runString(R"(
participants:
  - { key: a, name: A, character: 1, max_hp: 8, initiative: 10 }
steps:
  - start
  - heal: { target: a, amount: 1, expect_error: NotFound }
  - complete
)");
    ASSERT_TRUE(report.hasValue());
    EXPECT_FALSE(report.value().succeeded());
    ASSERT_EQ(report.value().steps.size(), 2u);
    EXPECT_FALSE(report.value().steps[1].ok);
    EXPECT_NE(report.value().failure->find("step 2"), std::string::npos);
    EXPECT_EQ(report.value().finalSnapshot.status, EncounterStatus::Active);
}

TEST(ScenarioRunnerTest, UnknownParticipantKeyFailsStep) {
    ScenarioRunner runner;
    auto report = runner.runString(R"(
participants:
  - { key: a, name: A, character: 1, max_hp: 8, initiative: 10 }
steps:
  - start
  - damage: { target: nobody, amount: 3 }
)");
    ASSERT_TRUE(report.hasValue());
    EXPECT_FALSE(report.value().succeeded());
    EXPECT_NE(report.value().steps.back().message.find("NotFound"), std::string::npos);
}

TEST(ScenarioRunnerTest, MalformedScenariosAreRejected) {
    ScenarioRunner runner;

    auto missing = runner.runString("name: empty\nsteps: [start]\n");
    ASSERT_TRUE(missing.hasError());
    EXPECT_EQ(missing.error().code(), ErrorCode::MissingField);

    auto notMap = runner.runString("- start\n");
    ASSERT_TRUE(notMap.hasError());
    EXPECT_EQ(notMap.error().code(), ErrorCode::InvalidArgument);

    auto duplicate = runner.runString(R"(
participants:
  - { key: a, character: 1, max_hp: 8 }
  - { key: a, character: 2, max_hp: 8 }
steps: []
)");
    ASSERT_TRUE(duplicate.hasError());
    EXPECT_EQ(duplicate.error().code(), ErrorCode::AlreadyExists);

    auto badYaml = runner.runString("participants: [\n");
    ASSERT_TRUE(badYaml.hasError());
    EXPECT_EQ(badYaml.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST(ScenarioRunnerTest, MissingFileIsConfigLoadFailure) {
    ScenarioRunner runner;
    auto report = runner.runFile("/nonexistent/scenario.yaml");
    ASSERT_TRUE(report.hasError());
    EXPECT_EQ(report.error().code(), ErrorCode::ConfigLoadFailed);
}

// ============================================================================
// Bundled scenario
// ============================================================================

TEST(ScenarioRunnerTest, GoblinAmbushReplaysDeterministically) {
    const auto path =
        std::filesystem::path(DCC_SOURCE_DIR) / "config" / "scenarios" / "goblin_ambush.yaml";
    ScenarioRunner runner;
    auto report = runner.runFile(path);
    ASSERT_TRUE(report.hasValue());
    const auto& r = report.value();
    ASSERT_TRUE(r.succeeded()) << *r.failure;
    EXPECT_EQ(r.name, "goblin ambush");
    EXPECT_EQ(r.finalSnapshot.sessionId, SessionId(7));
    EXPECT_EQ(r.finalSnapshot.status, EncounterStatus::Completed);

    const auto* snik = findByName(r.finalSnapshot, "Snik");
    const auto* grub = findByName(r.finalSnapshot, "Grub");
    const auto* aria = findByName(r.finalSnapshot, "Aria");
    ASSERT_NE(snik, nullptr);
    ASSERT_NE(grub, nullptr);
    ASSERT_NE(aria, nullptr);

    EXPECT_EQ(snik->participant.status.vital, VitalState::Dying);
    EXPECT_EQ(snik->participant.status.deathSaveFailures, 1);
    EXPECT_EQ(grub->participant.status.vital, VitalState::Dead);
    EXPECT_EQ(aria->conditions.size(), 1u);

    // The failed heal emits nothing.
    EXPECT_EQ(r.events.size(), 14u);
    EXPECT_EQ(r.events.back().operation, OperationType::Completed);
}
