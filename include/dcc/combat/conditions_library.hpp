#pragma once

/// @file conditions_library.hpp
/// @brief Static reference table of 5E conditions and their mechanical
///        effects, expressed as typed effect descriptors.

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <variant>

#include "dcc/combat/combat_types.hpp"

namespace dcc::combat {

/// The core 5E conditions.
enum class ConditionName : uint8_t {
    Blinded,
    Charmed,
    Deafened,
    Frightened,
    Grappled,
    Incapacitated,
    Invisible,
    Paralyzed,
    Petrified,
    Poisoned,
    Prone,
    Restrained,
    Stunned,
    Unconscious
};

constexpr std::size_t kConditionCount = 14;

/// Rolls a condition can modify or force to fail.
enum class RollKind : uint8_t {
    AttackRoll,            ///< Attacks made by the affected creature.
    AttacksAgainst,        ///< Any attack targeting the affected creature.
    AttacksAgainstMelee,   ///< Melee attacks targeting it (Prone).
    AttacksAgainstRanged,  ///< Ranged attacks targeting it (Prone).
    AbilityCheck,
    SightCheck,            ///< Ability checks that rely on sight.
    HearingCheck,          ///< Ability checks that rely on hearing.
    StrengthSave,
    DexteritySave
};

constexpr std::size_t kRollKindCount = 9;

/// Movement restrictions, ordered from least to most restrictive.
enum class Movement : uint8_t {
    Normal,
    CannotMoveCloser,  ///< Cannot approach the source of fear.
    CrawlOnly,
    Immobile           ///< Speed 0.
};

// ── Effect descriptors ──────────────────────────────────────────────────

/// Grants advantage or disadvantage on a roll kind.
struct RollModifier {
    RollKind roll;
    RollMode mode;
    bool operator==(const RollModifier&) const = default;
};

/// The roll fails without being made.
struct AutoFail {
    RollKind roll;
    bool operator==(const AutoFail&) const = default;
};

struct MovementLimit {
    Movement movement;
    bool operator==(const MovementLimit&) const = default;
};

/// No actions or reactions.
struct Incapacitation {
    bool operator==(const Incapacitation&) const = default;
};

/// Hits from attackers within 5 feet are critical.
struct CriticalWithinFiveFeet {
    bool operator==(const CriticalWithinFiveFeet&) const = default;
};

/// Resistance to every damage type.
struct ResistAllDamage {
    bool operator==(const ResistAllDamage&) const = default;
};

/// Immunity to one damage type granted by the condition.
struct DamageImmunity {
    DamageType type;
    bool operator==(const DamageImmunity&) const = default;
};

/// Cannot attack or target the source of the condition.
struct CannotTargetSource {
    bool operator==(const CannotTargetSource&) const = default;
};

using EffectDescriptor = std::variant<RollModifier,
                                      AutoFail,
                                      MovementLimit,
                                      Incapacitation,
                                      CriticalWithinFiveFeet,
                                      ResistAllDamage,
                                      DamageImmunity,
                                      CannotTargetSource>;

/// One row of the conditions table.
struct ConditionDefinition {
    ConditionName name;
    std::string_view displayName;
    std::string_view description;
    std::span<const EffectDescriptor> effects;
};

// ── Library lookups ─────────────────────────────────────────────────────

constexpr std::string_view conditionName(ConditionName name) {
    constexpr std::array<std::string_view, kConditionCount> names = {
        "Blinded", "Charmed", "Deafened", "Frightened", "Grappled",
        "Incapacitated", "Invisible", "Paralyzed", "Petrified", "Poisoned",
        "Prone", "Restrained", "Stunned", "Unconscious"
    };
    auto idx = static_cast<std::size_t>(name);
    return idx < kConditionCount ? names[idx] : "Unknown";
}

constexpr std::string_view rollKindName(RollKind kind) {
    constexpr std::array<std::string_view, kRollKindCount> names = {
        "attack_rolls", "attacks_against", "attacks_against_melee",
        "attacks_against_ranged", "ability_checks", "ability_checks_sight",
        "ability_checks_hearing", "saving_throws_str", "saving_throws_dex"
    };
    auto idx = static_cast<std::size_t>(kind);
    return idx < kRollKindCount ? names[idx] : "unknown";
}

constexpr std::string_view movementName(Movement movement) {
    switch (movement) {
        case Movement::Normal:           return "normal";
        case Movement::CannotMoveCloser: return "cannot_move_closer";
        case Movement::CrawlOnly:        return "crawl_only";
        case Movement::Immobile:         return "immobile";
    }
    return "unknown";
}

/// Case-insensitive lookup by name ("prone", "Prone").
std::optional<ConditionName> parseConditionName(std::string_view name);

/// The definition row for a condition.
const ConditionDefinition& conditionDefinition(ConditionName name);

/// The auto-fail roll kind for a saving throw of @p ability, if any
/// condition can force it (Strength and Dexterity only).
std::optional<RollKind> saveRollKind(Ability ability);

/// True if @p outer includes every effect of @p inner
/// (e.g. Unconscious includes Prone and Incapacitated).
bool conditionIncludes(ConditionName outer, ConditionName inner);

/// True if the two conditions contradict each other (Invisible/Blinded).
bool conditionsIncompatible(ConditionName a, ConditionName b);

}  // namespace dcc::combat
