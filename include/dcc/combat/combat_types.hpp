#pragma once

/// @file combat_types.hpp
/// @brief Enumerations and constants for 5E combat rules.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace dcc::combat {

/// Rounds represented by one minute / one hour of condition duration.
constexpr int32_t kRoundsPerMinute = 10;
constexpr int32_t kRoundsPerHour = 600;

/// Death-save counters freeze once either reaches this value.
constexpr int32_t kDeathSaveLimit = 3;

/// Death saves succeed on this total or higher.
constexpr int32_t kDeathSaveDC = 10;

constexpr int32_t kD20Min = 1;
constexpr int32_t kD20Max = 20;

/// Damage types recognised by resistances, vulnerabilities and immunities.
enum class DamageType : uint8_t {
    Acid,
    Bludgeoning,
    Cold,
    Fire,
    Force,
    Lightning,
    Necrotic,
    Piercing,
    Poison,
    Psychic,
    Radiant,
    Slashing,
    Thunder
};

/// Number of distinct damage types (for array sizing).
constexpr std::size_t kDamageTypeCount = 13;

/// The six ability scores (used for saving throws).
enum class Ability : uint8_t {
    Strength,
    Dexterity,
    Constitution,
    Intelligence,
    Wisdom,
    Charisma
};

/// How long an applied condition lasts.
enum class DurationType : uint8_t {
    Rounds,     ///< durationValue rounds.
    Minutes,    ///< durationValue x 10 rounds.
    Hours,      ///< durationValue x 600 rounds.
    UntilSave,  ///< Until a save against saveDC succeeds.
    Permanent   ///< Until explicitly removed.
};

/// Advantage state of a d20 roll.
enum class RollMode : uint8_t {
    Normal,
    Advantage,
    Disadvantage
};

/// Encounter state machine: Setup -> Active <-> Paused -> Completed.
enum class EncounterStatus : uint8_t {
    Setup,
    Active,
    Paused,
    Completed
};

/// Damage applied to a target that succeeds on an area save.
enum class OnSavePolicy : uint8_t {
    HalfDamage,
    NoDamage
};

/// Life state of a participant.
enum class VitalState : uint8_t {
    Conscious,  ///< currentHp > 0.
    Dying,      ///< 0 HP, rolling death saves.
    Stable,     ///< 0 HP after three successes, no further saves.
    Dead        ///< Terminal.
};

constexpr std::string_view damageTypeName(DamageType type) {
    switch (type) {
        case DamageType::Acid:        return "acid";
        case DamageType::Bludgeoning: return "bludgeoning";
        case DamageType::Cold:        return "cold";
        case DamageType::Fire:        return "fire";
        case DamageType::Force:       return "force";
        case DamageType::Lightning:   return "lightning";
        case DamageType::Necrotic:    return "necrotic";
        case DamageType::Piercing:    return "piercing";
        case DamageType::Poison:      return "poison";
        case DamageType::Psychic:     return "psychic";
        case DamageType::Radiant:     return "radiant";
        case DamageType::Slashing:    return "slashing";
        case DamageType::Thunder:     return "thunder";
    }
    return "unknown";
}

constexpr std::string_view abilityName(Ability ability) {
    switch (ability) {
        case Ability::Strength:     return "str";
        case Ability::Dexterity:    return "dex";
        case Ability::Constitution: return "con";
        case Ability::Intelligence: return "int";
        case Ability::Wisdom:       return "wis";
        case Ability::Charisma:     return "cha";
    }
    return "unknown";
}

constexpr std::string_view durationTypeName(DurationType type) {
    switch (type) {
        case DurationType::Rounds:    return "rounds";
        case DurationType::Minutes:   return "minutes";
        case DurationType::Hours:     return "hours";
        case DurationType::UntilSave: return "until_save";
        case DurationType::Permanent: return "permanent";
    }
    return "unknown";
}

constexpr std::string_view rollModeName(RollMode mode) {
    switch (mode) {
        case RollMode::Normal:       return "normal";
        case RollMode::Advantage:    return "advantage";
        case RollMode::Disadvantage: return "disadvantage";
    }
    return "unknown";
}

constexpr std::string_view encounterStatusName(EncounterStatus status) {
    switch (status) {
        case EncounterStatus::Setup:     return "setup";
        case EncounterStatus::Active:    return "active";
        case EncounterStatus::Paused:    return "paused";
        case EncounterStatus::Completed: return "completed";
    }
    return "unknown";
}

constexpr std::string_view vitalStateName(VitalState state) {
    switch (state) {
        case VitalState::Conscious: return "conscious";
        case VitalState::Dying:     return "dying";
        case VitalState::Stable:    return "stable";
        case VitalState::Dead:      return "dead";
    }
    return "unknown";
}

/// Case-insensitive parsers. Return nullopt for unrecognised names.
std::optional<DamageType> parseDamageType(std::string_view name);

/// Accepts short ("dex") and long ("dexterity") forms.
std::optional<Ability> parseAbility(std::string_view name);

std::optional<DurationType> parseDurationType(std::string_view name);

std::optional<OnSavePolicy> parseOnSavePolicy(std::string_view name);

/// True if a timed duration type (Rounds, Minutes, Hours).
constexpr bool isTimed(DurationType type) {
    return type == DurationType::Rounds || type == DurationType::Minutes ||
           type == DurationType::Hours;
}

/// Convert a timed duration to rounds. Returns 0 for untimed types.
constexpr int32_t durationInRounds(DurationType type, int32_t value) {
    switch (type) {
        case DurationType::Rounds:  return value;
        case DurationType::Minutes: return value * kRoundsPerMinute;
        case DurationType::Hours:   return value * kRoundsPerHour;
        default:                    return 0;
    }
}

/// Collapse advantage/disadvantage flags: both cancel to a flat roll.
constexpr RollMode combineRollModes(bool advantage, bool disadvantage) {
    if (advantage == disadvantage) {
        return RollMode::Normal;
    }
    return advantage ? RollMode::Advantage : RollMode::Disadvantage;
}

}  // namespace dcc::combat
