#pragma once

/// @file encounter_manager.hpp
/// @brief EncounterManager: arena of encounters keyed by id.
///
/// The manager owns every encounter it creates; callers hold shared
/// handles obtained through find(). Encounters share no mutable state, so
/// operations on different encounters never contend beyond the brief
/// registry lookup.

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "dcc/combat/dice.hpp"
#include "dcc/foundation/engine_result.hpp"
#include "dcc/service/encounter.hpp"
#include "dcc/service/engine_config.hpp"
#include "dcc/service/event_dispatcher.hpp"

namespace dcc::service {

/// Result of createEncounter.
struct EncounterCreated {
    EncounterId encounterId;
    std::vector<ParticipantId> participantIds;  ///< In spec order.
    std::vector<ParticipantId> turnOrder;       ///< Empty until initiative is resolved.
};

/// Thread-safe: the registry is guarded by an internal mutex.
class EncounterManager {
public:
    /// Builds the dice source of a new encounter.
    using DiceFactory = std::function<std::unique_ptr<combat::DiceSource>(EncounterId)>;

    EncounterManager(EngineConfig config, EventDispatcher& dispatcher);

    EncounterManager(const EncounterManager&) = delete;
    EncounterManager& operator=(const EncounterManager&) = delete;

    /// Replace the default RandomDice factory (scripted replays, tests).
    void setDiceFactory(DiceFactory factory);

    /// Create and populate an encounter in Setup.
    ///
    /// Fails with EncounterLimitReached at capacity, or with the
    /// participant validation error; nothing is registered on failure.
    [[nodiscard]] EngineResult<EncounterCreated> createEncounter(const EncounterSpec& spec);

    [[nodiscard]] EngineResult<std::shared_ptr<Encounter>> find(EncounterId id) const;

    /// Most recently created encounter of @p session that is not Completed.
    [[nodiscard]] EngineResult<std::shared_ptr<Encounter>> findActiveBySession(
        SessionId session) const;

    /// Drop every encounter of a session that has ended.
    /// @return Number of encounters released.
    std::size_t releaseSession(SessionId session);

    [[nodiscard]] std::size_t encounterCount() const;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    std::unique_ptr<combat::DiceSource> makeDice(EncounterId id) const;

    const EngineConfig config_;
    EventDispatcher& dispatcher_;

    mutable std::mutex mutex_;
    DiceFactory diceFactory_;
    uint64_t nextEncounterId_ = 1;
    std::size_t pendingCreates_ = 0;
    std::unordered_map<EncounterId, std::shared_ptr<Encounter>> encounters_;
};

}  // namespace dcc::service
