/// @file scenario_runner.cpp
/// @brief ScenarioRunner implementation.

#include "dcc/service/scenario_runner.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <memory>
#include <set>
#include <unordered_map>
#include <utility>

#include "dcc/combat/dice.hpp"
#include "dcc/foundation/engine_logger.hpp"
#include "dcc/service/encounter_manager.hpp"
#include "dcc/service/event_dispatcher.hpp"

using dcc::foundation::EngineError;
using dcc::foundation::EngineResult;
using dcc::foundation::ErrorCode;
using dcc::foundation::LogCategory;

namespace dcc::service {

namespace {

using StepResult = EngineResult<std::string>;

/// Lets every encounter roll from the runner's dice, so damage notation
/// and engine-generated rolls consume one shared sequence.
class BorrowedDice final : public combat::DiceSource {
public:
    explicit BorrowedDice(combat::DiceSource& inner) : inner_(inner) {}

    EngineResult<int32_t> Roll(int32_t sides) override { return inner_.Roll(sides); }

private:
    combat::DiceSource& inner_;
};

// ── Field access ────────────────────────────────────────────────────────

template <typename T>
std::optional<T> optionalField(const YAML::Node& params, const char* key) {
    const YAML::Node node = params[key];
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    return node.as<T>();
}

template <typename T>
EngineResult<T> requiredField(const YAML::Node& params, const char* key) {
    auto value = optionalField<T>(params, key);
    if (!value) {
        return foundation::fail<T>(ErrorCode::MissingField,
                                   std::string("missing field '") + key + "'");
    }
    return EngineResult<T>::ok(std::move(*value));
}

/// Parse an enum field with one of the combat name parsers.
template <typename T, typename Parser>
EngineResult<T> enumField(const YAML::Node& params, const char* key, Parser parse,
                          std::optional<T> fallback = std::nullopt) {
    auto text = optionalField<std::string>(params, key);
    if (!text) {
        if (fallback) {
            return EngineResult<T>::ok(*fallback);
        }
        return foundation::fail<T>(ErrorCode::MissingField,
                                   std::string("missing field '") + key + "'");
    }
    auto parsed = parse(*text);
    if (!parsed) {
        return foundation::fail<T>(ErrorCode::InvalidArgument,
                                   std::string("unknown ") + key + " '" + *text + "'");
    }
    return EngineResult<T>::ok(*parsed);
}

EngineResult<std::set<combat::DamageType>> damageTypeSet(const YAML::Node& node,
                                                         const char* key) {
    std::set<combat::DamageType> out;
    const YAML::Node list = node[key];
    if (!list || list.IsNull()) {
        return EngineResult<std::set<combat::DamageType>>::ok(out);
    }
    for (const auto& item : list) {
        auto name = item.as<std::string>();
        auto type = combat::parseDamageType(name);
        if (!type) {
            return foundation::fail<std::set<combat::DamageType>>(
                ErrorCode::InvalidArgument, "unknown damage type '" + name + "'");
        }
        out.insert(*type);
    }
    return EngineResult<std::set<combat::DamageType>>::ok(std::move(out));
}

/// Key and spec of one participant entry.
struct ParticipantEntry {
    std::string key;
    combat::ParticipantSpec spec;
};

EngineResult<ParticipantEntry> parseParticipant(const YAML::Node& node) {
    if (!node.IsMap()) {
        return foundation::fail<ParticipantEntry>(ErrorCode::InvalidArgument,
                                                  "participant entries must be mappings");
    }
    ParticipantEntry entry;
    auto key = requiredField<std::string>(node, "key");
    if (!key) {
        return EngineResult<ParticipantEntry>::err(key.error());
    }
    entry.key = key.value();

    auto& spec = entry.spec;
    spec.name = optionalField<std::string>(node, "name").value_or("");
    if (auto character = optionalField<uint64_t>(node, "character")) {
        spec.identity = combat::CharacterRef{foundation::CharacterId(*character)};
    } else if (auto creature = optionalField<uint64_t>(node, "creature")) {
        spec.identity = combat::CreatureRef{foundation::CreatureId(*creature)};
    } else {
        if (spec.name.empty()) {
            spec.name = entry.key;
        }
        spec.identity = combat::AdHocName{spec.name};
    }

    auto maxHp = requiredField<int32_t>(node, "max_hp");
    if (!maxHp) {
        return EngineResult<ParticipantEntry>::err(maxHp.error());
    }
    spec.maxHp = maxHp.value();
    spec.currentHp = optionalField<int32_t>(node, "current_hp");
    spec.tempHp = optionalField<int32_t>(node, "temp_hp").value_or(0);
    spec.initiativeModifier = optionalField<int32_t>(node, "initiative_modifier").value_or(0);
    spec.initiative = optionalField<int32_t>(node, "initiative");
    spec.stats.armorClass = optionalField<int32_t>(node, "armor_class").value_or(10);

    for (auto [field, target] : {std::pair{"resistances", &spec.stats.resistances},
                                 std::pair{"vulnerabilities", &spec.stats.vulnerabilities},
                                 std::pair{"immunities", &spec.stats.immunities}}) {
        auto types = damageTypeSet(node, field);
        if (!types) {
            return EngineResult<ParticipantEntry>::err(types.error());
        }
        *target = std::move(types).value();
    }

    const YAML::Node conditionImmunities = node["condition_immunities"];
    if (conditionImmunities && !conditionImmunities.IsNull()) {
        for (const auto& item : conditionImmunities) {
            auto name = item.as<std::string>();
            auto condition = combat::parseConditionName(name);
            if (!condition) {
                return foundation::fail<ParticipantEntry>(ErrorCode::UnknownCondition,
                                                          "unknown condition '" + name + "'");
            }
            spec.stats.conditionImmunities.insert(*condition);
        }
    }
    return EngineResult<ParticipantEntry>::ok(std::move(entry));
}

// ── Replay ──────────────────────────────────────────────────────────────

/// Executes steps against one encounter, resolving scenario keys and
/// condition labels to engine ids.
class Replay {
public:
    Replay(std::shared_ptr<Encounter> encounter, combat::DiceSource& dice)
        : encounter_(std::move(encounter)), dice_(dice) {}

    void bind(const std::string& key, ParticipantId id) { keys_[key] = id; }

    StepResult run(const std::string& action, const YAML::Node& params) {
        using Handler = StepResult (Replay::*)(const YAML::Node&);
        static const std::unordered_map<std::string, Handler> kHandlers = {
            {"roll_initiative", &Replay::rollInitiative},
            {"start", &Replay::start},
            {"next_turn", &Replay::nextTurn},
            {"attack", &Replay::attack},
            {"aoe", &Replay::aoe},
            {"damage", &Replay::damage},
            {"heal", &Replay::heal},
            {"temp_hp", &Replay::tempHp},
            {"death_save", &Replay::deathSave},
            {"apply_condition", &Replay::applyCondition},
            {"remove_condition", &Replay::removeCondition},
            {"attempt_save", &Replay::attemptSave},
            {"pause", &Replay::pause},
            {"resume", &Replay::resume},
            {"complete", &Replay::complete},
            {"reorder", &Replay::reorder},
            {"add_participant", &Replay::addParticipant},
            {"remove_participant", &Replay::removeParticipant},
        };

        auto it = kHandlers.find(action);
        if (it == kHandlers.end()) {
            return foundation::fail<std::string>(ErrorCode::InvalidArgument,
                                                 "unknown step '" + action + "'");
        }
        try {
            return (this->*(it->second))(params);
        } catch (const YAML::Exception& e) {
            return foundation::fail<std::string>(ErrorCode::InvalidArgument,
                                                 "malformed '" + action + "' step: " + e.what());
        }
    }

private:
    EngineResult<ParticipantId> lookup(const std::string& key) const {
        auto it = keys_.find(key);
        if (it == keys_.end()) {
            return foundation::fail<ParticipantId>(ErrorCode::ParticipantNotFound,
                                                   "unknown participant '" + key + "'");
        }
        return EngineResult<ParticipantId>::ok(it->second);
    }

    EngineResult<ParticipantId> participant(const YAML::Node& params, const char* field) const {
        auto key = requiredField<std::string>(params, field);
        if (!key) {
            return EngineResult<ParticipantId>::err(key.error());
        }
        return lookup(key.value());
    }

    EngineResult<ConditionId> condition(const YAML::Node& params) const {
        auto label = requiredField<std::string>(params, "condition");
        if (!label) {
            return EngineResult<ConditionId>::err(label.error());
        }
        auto it = labels_.find(label.value());
        if (it == labels_.end()) {
            return foundation::fail<ConditionId>(ErrorCode::ConditionNotFound,
                                                 "unknown condition label '" + label.value() + "'");
        }
        return EngineResult<ConditionId>::ok(it->second);
    }

    /// A flat number, or dice notation rolled from the scenario dice.
    EngineResult<int32_t> amount(const YAML::Node& params, const char* field, bool critical) {
        const YAML::Node node = params[field];
        if (!node || node.IsNull()) {
            return foundation::fail<int32_t>(ErrorCode::MissingField,
                                             std::string("missing field '") + field + "'");
        }
        int32_t flat = 0;
        if (YAML::convert<int32_t>::decode(node, flat)) {
            return EngineResult<int32_t>::ok(flat);
        }
        auto expr = combat::DiceExpression::Parse(node.as<std::string>());
        if (!expr) {
            return EngineResult<int32_t>::err(expr.error());
        }
        return expr.value().Roll(dice_, critical);
    }

    EngineResult<int32_t> rollOrSupplied(const YAML::Node& params, const char* field) {
        if (auto supplied = optionalField<int32_t>(params, field)) {
            return EngineResult<int32_t>::ok(*supplied);
        }
        return dice_.D20();
    }

    template <typename T>
    static StepResult propagate(const EngineResult<T>& r) {
        return StepResult::err(r.error());
    }

    // ── Steps ───────────────────────────────────────────────────────────

    StepResult rollInitiative(const YAML::Node& p) {
        auto id = participant(p, "participant");
        if (!id) return propagate(id);
        combat::InitiativeRequest request;
        request.roll = optionalField<int32_t>(p, "roll");
        request.secondRoll = optionalField<int32_t>(p, "second_roll");
        request.advantage = optionalField<bool>(p, "advantage").value_or(false);
        request.disadvantage = optionalField<bool>(p, "disadvantage").value_or(false);
        auto r = encounter_->rollInitiative(id.value(), request);
        if (!r) return propagate(r);
        return StepResult::ok("initiative " + std::to_string(r.value().total));
    }

    StepResult start(const YAML::Node&) {
        auto r = encounter_->start();
        if (!r) return propagate(r);
        return StepResult::ok("started, " + foundation::toString(r.value(), "participant") +
                              " acts first");
    }

    StepResult nextTurn(const YAML::Node&) {
        auto r = encounter_->nextTurn();
        if (!r) return propagate(r);
        return StepResult::ok("round " + std::to_string(r.value().round) + ", " +
                              foundation::toString(r.value().current, "participant") + "'s turn");
    }

    StepResult attack(const YAML::Node& p) {
        combat::AttackRequest request;
        auto attacker = participant(p, "attacker");
        if (!attacker) return propagate(attacker);
        auto target = participant(p, "target");
        if (!target) return propagate(target);
        auto total = requiredField<int32_t>(p, "attack_roll");
        if (!total) return propagate(total);
        auto type = enumField<combat::DamageType>(p, "type", combat::parseDamageType);
        if (!type) return propagate(type);

        request.attacker = attacker.value();
        request.target = target.value();
        request.attackRollTotal = total.value();
        request.targetAC = optionalField<int32_t>(p, "target_ac");
        request.damageType = type.value();
        request.isNatural20 = optionalField<bool>(p, "natural20").value_or(false);
        request.isNatural1 = optionalField<bool>(p, "natural1").value_or(false);
        request.isCritical = optionalField<bool>(p, "critical").value_or(false);
        request.melee = optionalField<bool>(p, "melee").value_or(true);
        request.description = optionalField<std::string>(p, "description").value_or("");

        auto dmg = amount(p, "damage", request.isNatural20 || request.isCritical);
        if (!dmg) return propagate(dmg);
        request.damageRoll = dmg.value();

        auto r = encounter_->resolveAttack(request);
        if (!r) return propagate(r);
        const auto& result = r.value();
        std::string message = result.hit ? "hit" : "miss";
        if (result.critical) {
            message += " (critical)";
        }
        if (result.damage) {
            message += ", " + std::to_string(result.damage->effectiveAmount) + " damage";
        }
        return StepResult::ok(std::move(message));
    }

    StepResult aoe(const YAML::Node& p) {
        combat::AoeRequest request;
        auto caster = participant(p, "caster");
        if (!caster) return propagate(caster);
        auto type = enumField<combat::DamageType>(p, "type", combat::parseDamageType);
        if (!type) return propagate(type);
        auto onSave = enumField<combat::OnSavePolicy>(p, "on_save", combat::parseOnSavePolicy,
                                                      combat::OnSavePolicy::HalfDamage);
        if (!onSave) return propagate(onSave);

        request.caster = caster.value();
        request.damageType = type.value();
        request.onSave = onSave.value();
        request.saveDC = optionalField<int32_t>(p, "dc");
        request.description = optionalField<std::string>(p, "description").value_or("");
        if (p["ability"]) {
            auto ability = enumField<combat::Ability>(p, "ability", combat::parseAbility);
            if (!ability) return propagate(ability);
            request.saveAbility = ability.value();
        }

        const YAML::Node targets = p["targets"];
        if (targets && targets.IsSequence()) {
            // Each target is a bare key or { participant: key, save: N }.
            for (const auto& t : targets) {
                combat::AoeTarget target;
                auto id = t.IsScalar() ? lookup(t.as<std::string>()) : participant(t, "participant");
                if (!id) return propagate(id);
                target.id = id.value();
                if (!t.IsScalar()) {
                    target.saveRoll = optionalField<int32_t>(t, "save");
                }
                request.targets.push_back(target);
            }
        }

        auto dmg = amount(p, "damage", false);
        if (!dmg) return propagate(dmg);
        request.damageRoll = dmg.value();

        auto r = encounter_->resolveAoeAttack(request);
        if (!r) return propagate(r);
        std::string message;
        for (const auto& t : r.value().targets) {
            if (!message.empty()) {
                message += ", ";
            }
            message += foundation::toString(t.target, "participant") + (t.saved ? " saved " : " ") +
                       std::to_string(t.damage.effectiveAmount);
        }
        return StepResult::ok(std::move(message));
    }

    StepResult damage(const YAML::Node& p) {
        combat::DamageRequest request;
        auto target = participant(p, "target");
        if (!target) return propagate(target);
        auto type = enumField<combat::DamageType>(p, "type", combat::parseDamageType);
        if (!type) return propagate(type);
        request.target = target.value();
        request.type = type.value();
        request.isCritical = optionalField<bool>(p, "critical").value_or(false);
        request.description = optionalField<std::string>(p, "description").value_or("");
        if (p["source"]) {
            auto source = participant(p, "source");
            if (!source) return propagate(source);
            request.source = source.value();
        }
        auto dmg = amount(p, "amount", request.isCritical);
        if (!dmg) return propagate(dmg);
        request.amount = dmg.value();

        auto r = encounter_->applyDamage(request);
        if (!r) return propagate(r);
        return StepResult::ok(std::to_string(r.value().effectiveAmount) + " damage, hp " +
                              std::to_string(r.value().newCurrentHp) + ", " +
                              std::string(combat::vitalStateName(r.value().vitalAfter)));
    }

    StepResult heal(const YAML::Node& p) {
        auto target = participant(p, "target");
        if (!target) return propagate(target);
        auto healed = amount(p, "amount", false);
        if (!healed) return propagate(healed);
        auto r = encounter_->heal(target.value(), healed.value(),
                                  optionalField<std::string>(p, "source").value_or(""));
        if (!r) return propagate(r);
        return StepResult::ok("hp " + std::to_string(r.value().newCurrentHp));
    }

    StepResult tempHp(const YAML::Node& p) {
        auto target = participant(p, "target");
        if (!target) return propagate(target);
        auto value = requiredField<int32_t>(p, "amount");
        if (!value) return propagate(value);
        auto r = encounter_->setTempHp(target.value(), value.value());
        if (!r) return propagate(r);
        return StepResult::ok("temp hp " + std::to_string(r.value().newTempHp));
    }

    StepResult deathSave(const YAML::Node& p) {
        auto id = participant(p, "participant");
        if (!id) return propagate(id);
        auto roll = rollOrSupplied(p, "roll");
        if (!roll) return propagate(roll);
        auto r = encounter_->rollDeathSave(id.value(), roll.value());
        if (!r) return propagate(r);
        return StepResult::ok(std::string(combat::deathSaveOutcomeName(r.value().outcome)) + " (" +
                              std::to_string(r.value().successes) + "/" +
                              std::to_string(r.value().failures) + ")");
    }

    StepResult applyCondition(const YAML::Node& p) {
        combat::ConditionRequest request;
        auto target = participant(p, "target");
        if (!target) return propagate(target);
        auto name = enumField<combat::ConditionName>(p, "condition", combat::parseConditionName);
        if (!name) return propagate(name);
        auto duration = enumField<combat::DurationType>(p, "duration", combat::parseDurationType,
                                                        combat::DurationType::Permanent);
        if (!duration) return propagate(duration);

        request.participantId = target.value();
        request.name = name.value();
        request.durationType = duration.value();
        request.durationValue = optionalField<int32_t>(p, "value");
        request.saveDC = optionalField<int32_t>(p, "dc");
        request.sourceDescription = optionalField<std::string>(p, "source").value_or("");
        if (p["ability"]) {
            auto ability = enumField<combat::Ability>(p, "ability", combat::parseAbility);
            if (!ability) return propagate(ability);
            request.saveAbility = ability.value();
        }

        auto r = encounter_->applyCondition(request);
        if (!r) return propagate(r);

        auto label = optionalField<std::string>(p, "label")
                         .value_or(p["target"].as<std::string>() + "." +
                                   p["condition"].as<std::string>());
        labels_[label] = r.value().condition.id;
        return StepResult::ok(label + " -> " +
                              foundation::toString(r.value().condition.id, "condition"));
    }

    StepResult removeCondition(const YAML::Node& p) {
        auto id = condition(p);
        if (!id) return propagate(id);
        auto r = encounter_->removeCondition(id.value());
        if (!r) return propagate(r);
        return StepResult::ok("removed " + std::string(combat::conditionName(r.value().name)));
    }

    StepResult attemptSave(const YAML::Node& p) {
        auto id = condition(p);
        if (!id) return propagate(id);
        auto total = rollOrSupplied(p, "total");
        if (!total) return propagate(total);
        auto r = encounter_->attemptSave(id.value(), total.value());
        if (!r) return propagate(r);
        return StepResult::ok(std::string(r.value().success ? "saved" : "failed") + " with " +
                              std::to_string(r.value().total));
    }

    StepResult pause(const YAML::Node&) {
        auto r = encounter_->pause();
        if (!r) return propagate(r);
        return StepResult::ok("paused");
    }

    StepResult resume(const YAML::Node&) {
        auto r = encounter_->resume();
        if (!r) return propagate(r);
        return StepResult::ok("resumed");
    }

    StepResult complete(const YAML::Node&) {
        auto r = encounter_->complete();
        if (!r) return propagate(r);
        return StepResult::ok("completed");
    }

    StepResult reorder(const YAML::Node& p) {
        auto id = participant(p, "participant");
        if (!id) return propagate(id);
        auto initiative = requiredField<int32_t>(p, "initiative");
        if (!initiative) return propagate(initiative);
        auto r = encounter_->reorder(id.value(), initiative.value());
        if (!r) return propagate(r);
        return StepResult::ok("order of " + std::to_string(r.value().size()));
    }

    StepResult addParticipant(const YAML::Node& p) {
        auto entry = parseParticipant(p);
        if (!entry) return propagate(entry);
        if (keys_.count(entry.value().key) > 0) {
            return foundation::fail<std::string>(ErrorCode::AlreadyExists,
                                                 "duplicate participant '" + entry.value().key + "'");
        }
        auto r = encounter_->addParticipant(entry.value().spec);
        if (!r) return propagate(r);
        bind(entry.value().key, r.value());
        return StepResult::ok(entry.value().key + " -> " +
                              foundation::toString(r.value(), "participant"));
    }

    StepResult removeParticipant(const YAML::Node& p) {
        auto id = participant(p, "participant");
        if (!id) return propagate(id);
        auto r = encounter_->removeParticipant(id.value());
        if (!r) return propagate(r);
        return StepResult::ok("removed");
    }

    std::shared_ptr<Encounter> encounter_;
    combat::DiceSource& dice_;
    std::unordered_map<std::string, ParticipantId> keys_;
    std::unordered_map<std::string, ConditionId> labels_;
};

/// Whether a failed step matches its `expect_error` value.
bool matchesExpectation(const std::string& expected, const EngineError& error) {
    return expected == "true" || expected == foundation::errorKindName(error.kind());
}

EngineResult<ScenarioReport> runScenario(const YAML::Node& root, EngineConfig config) {
    if (!root.IsMap()) {
        return foundation::fail<ScenarioReport>(ErrorCode::InvalidArgument,
                                                "scenario root must be a mapping");
    }

    ScenarioReport report;
    report.name = optionalField<std::string>(root, "name").value_or("scenario");

    const YAML::Node options = root["options"];
    if (options && options.IsMap()) {
        config.strictTurnOrder =
            optionalField<bool>(options, "strict_turn_order").value_or(config.strictTurnOrder);
        config.autoRollInitiative = optionalField<bool>(options, "auto_roll_initiative")
                                        .value_or(config.autoRollInitiative);
    }

    std::unique_ptr<combat::DiceSource> dice;
    if (auto rolls = optionalField<std::vector<int32_t>>(root, "dice")) {
        dice = std::make_unique<combat::ScriptedDice>(std::move(*rolls));
    } else {
        dice = std::make_unique<combat::RandomDice>(config.diceSeed);
    }

    EncounterSpec spec;
    spec.sessionId = SessionId(optionalField<uint64_t>(root, "session").value_or(1));
    spec.surpriseRound = optionalField<bool>(root, "surprise_round").value_or(false);

    std::vector<std::string> keys;
    const YAML::Node participants = root["participants"];
    if (!participants || !participants.IsSequence()) {
        return foundation::fail<ScenarioReport>(ErrorCode::MissingField,
                                                "scenario needs a participants list");
    }
    for (const auto& node : participants) {
        auto entry = parseParticipant(node);
        if (!entry) {
            return EngineResult<ScenarioReport>::err(entry.error());
        }
        if (std::find(keys.begin(), keys.end(), entry.value().key) != keys.end()) {
            return foundation::fail<ScenarioReport>(
                ErrorCode::AlreadyExists, "duplicate participant '" + entry.value().key + "'");
        }
        keys.push_back(entry.value().key);
        spec.participants.push_back(std::move(entry.value().spec));
    }

    // Replays deliver inline so the event list is complete after each step.
    EventDispatcher dispatcher(DispatchOptions{false, 1});
    dispatcher.subscribe([&report](const EncounterEvent& e) { report.events.push_back(e); });

    EncounterManager manager(config, dispatcher);
    combat::DiceSource& shared = *dice;
    manager.setDiceFactory(
        [&shared](EncounterId) { return std::make_unique<BorrowedDice>(shared); });

    auto created = manager.createEncounter(spec);
    if (!created) {
        return EngineResult<ScenarioReport>::err(created.error());
    }
    report.encounterId = created.value().encounterId;
    auto encounter = manager.find(report.encounterId);
    if (!encounter) {
        return EngineResult<ScenarioReport>::err(encounter.error());
    }

    Replay replay(encounter.value(), shared);
    for (std::size_t i = 0; i < keys.size(); ++i) {
        replay.bind(keys[i], created.value().participantIds[i]);
    }

    const YAML::Node steps = root["steps"];
    std::size_t index = 0;
    for (const auto& step : steps) {
        ++index;
        std::string action;
        YAML::Node body;
        if (step.IsScalar()) {
            action = step.as<std::string>();
        } else if (step.IsMap() && step.size() == 1) {
            action = step.begin()->first.as<std::string>();
            body = step.begin()->second;
        } else {
            return foundation::fail<ScenarioReport>(
                ErrorCode::InvalidArgument,
                "step " + std::to_string(index) + " must be an action or a single-key mapping");
        }

        const YAML::Node params = body.IsMap() ? body : YAML::Node(YAML::NodeType::Map);
        auto expected = optionalField<std::string>(params, "expect_error");
        auto result = replay.run(action, params);

        StepOutcome outcome;
        outcome.index = index;
        outcome.action = action;
        if (result) {
            outcome.ok = !expected.has_value();
            outcome.message = result.value();
            if (expected) {
                outcome.message = "expected " + *expected + " but succeeded: " + outcome.message;
            }
        } else {
            outcome.ok = expected && matchesExpectation(*expected, result.error());
            outcome.message = std::string(foundation::errorKindName(result.error().kind())) + ": " +
                              std::string(result.error().message());
        }
        report.steps.push_back(outcome);

        if (!outcome.ok) {
            report.failure = "step " + std::to_string(index) + " (" + action + "): " +
                             outcome.message;
            DCC_LOG_WARN(LogCategory::Core, report.name + " stopped at " + *report.failure);
            break;
        }
    }

    dispatcher.waitIdle();
    report.finalSnapshot = encounter.value()->snapshot();
    return EngineResult<ScenarioReport>::ok(std::move(report));
}

}  // namespace

ScenarioRunner::ScenarioRunner(EngineConfig config) : config_(config) {}

EngineResult<ScenarioReport> ScenarioRunner::runFile(const std::filesystem::path& path) const {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::BadFile&) {
        return foundation::fail<ScenarioReport>(ErrorCode::ConfigLoadFailed,
                                                "failed to open scenario file: " + path.string());
    } catch (const YAML::ParserException& e) {
        return foundation::fail<ScenarioReport>(ErrorCode::ConfigLoadFailed,
                                                std::string("YAML parse error: ") + e.what());
    }
    try {
        return runScenario(root, config_);
    } catch (const YAML::Exception& e) {
        return foundation::fail<ScenarioReport>(ErrorCode::InvalidArgument,
                                                std::string("malformed scenario: ") + e.what());
    }
}

EngineResult<ScenarioReport> ScenarioRunner::runString(std::string_view yaml) const {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml));
    } catch (const YAML::ParserException& e) {
        return foundation::fail<ScenarioReport>(ErrorCode::ConfigLoadFailed,
                                                std::string("YAML parse error: ") + e.what());
    }
    try {
        return runScenario(root, config_);
    } catch (const YAML::Exception& e) {
        return foundation::fail<ScenarioReport>(ErrorCode::InvalidArgument,
                                                std::string("malformed scenario: ") + e.what());
    }
}

}  // namespace dcc::service
