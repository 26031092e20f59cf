#pragma once

/// @file attack_resolver.hpp
/// @brief AttackResolver: to-hit and critical determination for single
///        target attacks, and save-based area attacks.
///
/// Damage rolls are caller input. On a critical hit the caller supplies
/// the already-doubled dice ("1d8+3" crits as 2d8+3); the resolver never
/// doubles or re-derives the amount.

#include <optional>
#include <string>
#include <vector>

#include "dcc/combat/damage_resolver.hpp"
#include "dcc/combat/dice.hpp"
#include "dcc/combat/participant_store.hpp"
#include "dcc/foundation/engine_result.hpp"

namespace dcc::combat {

struct AttackRequest {
    ParticipantId attacker;
    ParticipantId target;
    int32_t attackRollTotal = 0;
    std::optional<int32_t> targetAC;  ///< Defaults to the target's armor class.
    int32_t damageRoll = 0;
    DamageType damageType = DamageType::Bludgeoning;
    bool isNatural20 = false;
    bool isNatural1 = false;
    bool isCritical = false;  ///< Caller-determined critical (e.g. paralyzed target).
    bool melee = true;
    std::string description;
};

struct AttackResult {
    ParticipantId attacker;
    ParticipantId target;
    bool hit = false;
    bool critical = false;
    int32_t attackRollTotal = 0;
    int32_t targetAC = 0;
    RollMode rollMode = RollMode::Normal;      ///< Mode conditions impose on this attack.
    bool targetGrantsCritical = false;         ///< Target's conditions make close hits critical.
    bool outOfTurn = false;                    ///< Attacker acted outside its turn.
    std::optional<DamageResult> damage;        ///< Set on a hit.
};

struct AoeTarget {
    ParticipantId id;
    std::optional<int32_t> saveRoll;  ///< Save total; rolled as a plain d20 when absent.
};

struct AoeRequest {
    ParticipantId caster;
    std::vector<AoeTarget> targets;
    std::optional<int32_t> saveDC;       ///< No DC: every target takes full damage.
    std::optional<Ability> saveAbility;
    int32_t damageRoll = 0;
    DamageType damageType = DamageType::Bludgeoning;
    OnSavePolicy onSave = OnSavePolicy::HalfDamage;
    std::string description;
};

struct AoeTargetResult {
    ParticipantId target;
    std::optional<int32_t> saveRoll;
    bool saved = false;
    bool autoFailed = false;  ///< Conditions forced the save to fail.
    int32_t rawDamage = 0;    ///< Damage after the save, before resistances.
    DamageResult damage;
};

struct AoeResult {
    ParticipantId caster;
    bool outOfTurn = false;
    std::vector<AoeTargetResult> targets;
};

class AttackResolver {
public:
    AttackResolver(ParticipantStore& store, uint32_t round, DiceSource& dice);

    /// Resolve one attack: natural 20 always hits and is critical,
    /// natural 1 always misses, otherwise hit iff total >= AC. A melee hit
    /// on a Paralyzed or Unconscious target is critical too.
    ///
    /// A miss changes nothing and returns hit=false.
    foundation::EngineResult<AttackResult> ResolveAttack(const AttackRequest& request);

    /// Resolve an area attack against several targets.
    ///
    /// All targets are validated before any damage is applied: duplicate,
    /// unknown, departed or dead targets reject the whole attack.
    foundation::EngineResult<AoeResult> ResolveAoe(const AoeRequest& request);

private:
    ParticipantStore& store_;
    uint32_t round_;
    DiceSource& dice_;
};

}  // namespace dcc::combat
