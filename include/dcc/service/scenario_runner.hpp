#pragma once

/// @file scenario_runner.hpp
/// @brief ScenarioRunner: deterministic replay of a YAML-described encounter.
///
/// A scenario lists participants and a sequence of steps. The runner
/// creates a fresh encounter, feeds every generated roll from the
/// scenario's `dice` list (or a seeded RandomDice when absent) and
/// records the event stream and final snapshot.
///
/// Example:
/// @code
///   name: goblin ambush
///   session: 7
///   dice: [14, 6]
///   participants:
///     - key: aria
///       character: 1
///       name: Aria
///       max_hp: 30
///       armor_class: 16
///       initiative_modifier: 2
///     - key: goblin
///       creature: 3
///       max_hp: 7
///       armor_class: 13
///   steps:
///     - roll_initiative: { participant: aria, roll: 15 }
///     - roll_initiative: { participant: goblin }
///     - start
///     - attack: { attacker: aria, target: goblin, attack_roll: 17,
///                 damage: "1d8+3", type: slashing }
///     - next_turn
///     - heal: { target: goblin, amount: 3, expect_error: InvalidState }
/// @endcode

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "dcc/foundation/engine_result.hpp"
#include "dcc/service/combat_events.hpp"
#include "dcc/service/engine_config.hpp"

namespace dcc::service {

/// Outcome of one scenario step.
struct StepOutcome {
    std::size_t index = 0;  ///< 1-based position in the step list.
    std::string action;
    bool ok = false;        ///< Matched expectations (including expected errors).
    std::string message;
};

struct ScenarioReport {
    std::string name;
    EncounterId encounterId;
    std::vector<StepOutcome> steps;
    std::vector<EncounterEvent> events;
    EncounterSnapshot finalSnapshot;

    /// First step that did not behave as the scenario expected. Replay
    /// stops there.
    std::optional<std::string> failure;

    [[nodiscard]] bool succeeded() const noexcept { return !failure.has_value(); }
};

class ScenarioRunner {
public:
    /// @param config  Base settings. A scenario's `options` block overrides
    ///                strict_turn_order and auto_roll_initiative.
    explicit ScenarioRunner(EngineConfig config = {});

    /// Errors: ConfigLoadFailed if the file cannot be read or parsed,
    /// InvalidArgument / MissingField for a malformed scenario.
    [[nodiscard]] foundation::EngineResult<ScenarioReport> runFile(
        const std::filesystem::path& path) const;

    [[nodiscard]] foundation::EngineResult<ScenarioReport> runString(std::string_view yaml) const;

private:
    EngineConfig config_;
};

}  // namespace dcc::service
