/// @file encounter_manager.cpp
/// @brief EncounterManager implementation.

#include "dcc/service/encounter_manager.hpp"

#include <utility>

#include "dcc/foundation/engine_logger.hpp"

using dcc::foundation::ErrorCode;
using dcc::foundation::LogCategory;

namespace dcc::service {

EncounterManager::EncounterManager(EngineConfig config, EventDispatcher& dispatcher)
    : config_(config), dispatcher_(dispatcher) {}

void EncounterManager::setDiceFactory(DiceFactory factory) {
    std::lock_guard lock(mutex_);
    diceFactory_ = std::move(factory);
}

std::unique_ptr<combat::DiceSource> EncounterManager::makeDice(EncounterId id) const {
    if (diceFactory_) {
        return diceFactory_(id);
    }
    // Distinct but reproducible streams per encounter for a fixed base seed.
    uint64_t seed = config_.diceSeed != 0 ? config_.diceSeed + id.value() : 0;
    return std::make_unique<combat::RandomDice>(seed);
}

EngineResult<EncounterCreated> EncounterManager::createEncounter(const EncounterSpec& spec) {
    EncounterId id;
    std::unique_ptr<combat::DiceSource> dice;
    {
        std::lock_guard lock(mutex_);
        if (encounters_.size() + pendingCreates_ >= config_.maxEncounters) {
            DCC_LOG_WARN(LogCategory::Core, "encounter limit reached");
            return foundation::fail<EncounterCreated>(ErrorCode::EncounterLimitReached,
                                                      "maximum number of encounters reached");
        }
        id = EncounterId(nextEncounterId_++);
        dice = makeDice(id);
        ++pendingCreates_;
    }

    EncounterOptions options;
    options.strictTurnOrder = config_.strictTurnOrder;
    options.autoRollInitiative = config_.autoRollInitiative;

    // Initialize outside the registry lock: it delivers EncounterCreated,
    // and subscribers may call back into the manager.
    auto encounter = std::make_shared<Encounter>(id, spec.sessionId, options, std::move(dice),
                                                 dispatcher_);
    auto ids = encounter->initialize(spec);

    std::lock_guard lock(mutex_);
    --pendingCreates_;
    if (!ids) {
        return EngineResult<EncounterCreated>::err(ids.error());
    }
    encounters_.emplace(id, encounter);

    EncounterCreated created;
    created.encounterId = id;
    created.participantIds = std::move(ids).value();
    created.turnOrder = encounter->snapshot().turnOrder;

    DCC_LOG_INFO(LogCategory::Core, "created " + foundation::toString(id, "encounter") + " for " +
                                        foundation::toString(spec.sessionId, "session"));
    return EngineResult<EncounterCreated>::ok(std::move(created));
}

EngineResult<std::shared_ptr<Encounter>> EncounterManager::find(EncounterId id) const {
    std::lock_guard lock(mutex_);
    auto it = encounters_.find(id);
    if (it == encounters_.end()) {
        return foundation::fail<std::shared_ptr<Encounter>>(
            ErrorCode::EncounterNotFound, "unknown " + foundation::toString(id, "encounter"));
    }
    return EngineResult<std::shared_ptr<Encounter>>::ok(it->second);
}

EngineResult<std::shared_ptr<Encounter>> EncounterManager::findActiveBySession(
    SessionId session) const {
    std::lock_guard lock(mutex_);
    std::shared_ptr<Encounter> latest;
    for (const auto& [id, encounter] : encounters_) {
        if (encounter->sessionId() != session ||
            encounter->status() == combat::EncounterStatus::Completed) {
            continue;
        }
        if (!latest || latest->id() < id) {
            latest = encounter;
        }
    }
    if (!latest) {
        return foundation::fail<std::shared_ptr<Encounter>>(
            ErrorCode::EncounterNotFound,
            "no open encounter for " + foundation::toString(session, "session"));
    }
    return EngineResult<std::shared_ptr<Encounter>>::ok(std::move(latest));
}

std::size_t EncounterManager::releaseSession(SessionId session) {
    std::lock_guard lock(mutex_);
    auto released = std::erase_if(encounters_, [&](const auto& entry) {
        return entry.second->sessionId() == session;
    });
    if (released > 0) {
        DCC_LOG_INFO(LogCategory::Core, "released " + std::to_string(released) +
                                            " encounter(s) of " +
                                            foundation::toString(session, "session"));
    }
    return released;
}

std::size_t EncounterManager::encounterCount() const {
    std::lock_guard lock(mutex_);
    return encounters_.size();
}

}  // namespace dcc::service
