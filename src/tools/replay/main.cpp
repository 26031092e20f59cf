/// @file main.cpp
/// @brief dcc_replay entry point.
///
/// Replays a YAML scenario against a fresh encounter and prints every
/// event followed by the final snapshot.
///
///   dcc_replay [--config dcc.yaml] scenario.yaml

#include <cstdlib>
#include <iostream>
#include <string_view>

#include "dcc/service/engine_config.hpp"
#include "dcc/service/scenario_runner.hpp"
#include "dcc/service/service_runner.hpp"

namespace {

/// First argument that is neither an option nor an option's value.
std::string_view scenarioArg(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg == "--config") {
            ++i;
            continue;
        }
        return arg;
    }
    return {};
}

void printEvent(const dcc::service::EncounterEvent& e) {
    std::cout << "#" << e.sequence << " [" << dcc::service::operationName(e.operation) << "] round "
              << e.round << " (" << dcc::combat::encounterStatusName(e.status) << ")";
    if (e.outOfTurn) {
        std::cout << " out-of-turn";
    }
    std::cout << ": " << e.summary << "\n";
}

void printSnapshot(const dcc::service::EncounterSnapshot& snap) {
    std::cout << "\nencounter " << snap.id.value() << " "
              << dcc::combat::encounterStatusName(snap.status) << ", round " << snap.round;
    if (snap.halted) {
        std::cout << " HALTED";
    }
    std::cout << "\n";
    for (const auto& view : snap.participants) {
        const auto& p = view.participant;
        std::cout << "  " << p.name << ": " << p.status.currentHp << "/" << p.status.maxHp << " hp";
        if (p.status.tempHp > 0) {
            std::cout << " +" << p.status.tempHp << " temp";
        }
        std::cout << ", " << dcc::combat::vitalStateName(p.status.vital);
        if (!p.isActive) {
            std::cout << ", left";
        }
        for (const auto& c : view.conditions) {
            std::cout << ", " << dcc::combat::conditionName(c.name);
        }
        std::cout << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    auto scenario = scenarioArg(argc, argv);
    if (scenario.empty()) {
        std::cerr << "usage: dcc_replay [--config <path>] <scenario.yaml>\n";
        return EXIT_FAILURE;
    }

    dcc::service::EngineConfig engineCfg;
    if (auto configPath = dcc::service::resolveConfigPath(argc, argv)) {
        auto built = dcc::service::loadEngineConfig(*configPath);
        if (!built) {
            std::cerr << "Failed to load config: " << built.error().message() << "\n";
            return EXIT_FAILURE;
        }
        engineCfg = built.value();
    }
    dcc::service::applyLogging(engineCfg);

    dcc::service::ScenarioRunner runner(engineCfg);
    auto report = runner.runFile(std::string(scenario));
    if (!report) {
        std::cerr << "Failed to run scenario: " << report.error().message() << "\n";
        return EXIT_FAILURE;
    }

    std::cout << "scenario: " << report.value().name << "\n\n";
    for (const auto& event : report.value().events) {
        printEvent(event);
    }
    printSnapshot(report.value().finalSnapshot);

    if (!report.value().succeeded()) {
        std::cerr << "\n" << *report.value().failure << "\n";
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
