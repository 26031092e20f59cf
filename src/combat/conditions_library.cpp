/// @file conditions_library.cpp
/// @brief The 5E conditions table.

#include "dcc/combat/conditions_library.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

namespace dcc::combat {

namespace {

using M = RollMode;
using R = RollKind;

const EffectDescriptor kBlinded[] = {
    RollModifier{R::AttackRoll, M::Disadvantage},
    RollModifier{R::AttacksAgainst, M::Advantage},
    AutoFail{R::SightCheck},
};

const EffectDescriptor kCharmed[] = {
    CannotTargetSource{},
};

const EffectDescriptor kDeafened[] = {
    AutoFail{R::HearingCheck},
};

const EffectDescriptor kFrightened[] = {
    RollModifier{R::AttackRoll, M::Disadvantage},
    RollModifier{R::AbilityCheck, M::Disadvantage},
    MovementLimit{Movement::CannotMoveCloser},
};

const EffectDescriptor kGrappled[] = {
    MovementLimit{Movement::Immobile},
};

const EffectDescriptor kIncapacitated[] = {
    Incapacitation{},
};

const EffectDescriptor kInvisible[] = {
    RollModifier{R::AttackRoll, M::Advantage},
    RollModifier{R::AttacksAgainst, M::Disadvantage},
};

const EffectDescriptor kParalyzed[] = {
    Incapacitation{},
    MovementLimit{Movement::Immobile},
    AutoFail{R::StrengthSave},
    AutoFail{R::DexteritySave},
    RollModifier{R::AttacksAgainst, M::Advantage},
    CriticalWithinFiveFeet{},
};

const EffectDescriptor kPetrified[] = {
    Incapacitation{},
    MovementLimit{Movement::Immobile},
    AutoFail{R::StrengthSave},
    AutoFail{R::DexteritySave},
    RollModifier{R::AttacksAgainst, M::Advantage},
    ResistAllDamage{},
    DamageImmunity{DamageType::Poison},
};

const EffectDescriptor kPoisoned[] = {
    RollModifier{R::AttackRoll, M::Disadvantage},
    RollModifier{R::AbilityCheck, M::Disadvantage},
};

const EffectDescriptor kProne[] = {
    RollModifier{R::AttackRoll, M::Disadvantage},
    MovementLimit{Movement::CrawlOnly},
    RollModifier{R::AttacksAgainstMelee, M::Advantage},
    RollModifier{R::AttacksAgainstRanged, M::Disadvantage},
};

const EffectDescriptor kRestrained[] = {
    MovementLimit{Movement::Immobile},
    RollModifier{R::AttackRoll, M::Disadvantage},
    RollModifier{R::AttacksAgainst, M::Advantage},
    RollModifier{R::DexteritySave, M::Disadvantage},
};

const EffectDescriptor kStunned[] = {
    Incapacitation{},
    MovementLimit{Movement::Immobile},
    AutoFail{R::StrengthSave},
    AutoFail{R::DexteritySave},
    RollModifier{R::AttacksAgainst, M::Advantage},
};

const EffectDescriptor kUnconscious[] = {
    Incapacitation{},
    MovementLimit{Movement::Immobile},
    AutoFail{R::StrengthSave},
    AutoFail{R::DexteritySave},
    RollModifier{R::AttacksAgainst, M::Advantage},
    CriticalWithinFiveFeet{},
};

const std::array<ConditionDefinition, kConditionCount> kLibrary = {{
    {ConditionName::Blinded, "Blinded",
     "Can't see; attacks against have advantage, own attacks have disadvantage.",
     kBlinded},
    {ConditionName::Charmed, "Charmed",
     "Can't attack or target the charmer with harmful effects.",
     kCharmed},
    {ConditionName::Deafened, "Deafened",
     "Can't hear; fails checks that require hearing.",
     kDeafened},
    {ConditionName::Frightened, "Frightened",
     "Disadvantage on checks and attacks; can't move closer to the source.",
     kFrightened},
    {ConditionName::Grappled, "Grappled",
     "Speed becomes 0.",
     kGrappled},
    {ConditionName::Incapacitated, "Incapacitated",
     "Can't take actions or reactions.",
     kIncapacitated},
    {ConditionName::Invisible, "Invisible",
     "Attacks have advantage; attacks against have disadvantage.",
     kInvisible},
    {ConditionName::Paralyzed, "Paralyzed",
     "Incapacitated, can't move; fails Str/Dex saves; hits within 5 ft are critical.",
     kParalyzed},
    {ConditionName::Petrified, "Petrified",
     "Turned to stone; incapacitated, resistant to all damage, immune to poison.",
     kPetrified},
    {ConditionName::Poisoned, "Poisoned",
     "Disadvantage on attack rolls and ability checks.",
     kPoisoned},
    {ConditionName::Prone, "Prone",
     "Crawls; melee attacks against have advantage, ranged have disadvantage.",
     kProne},
    {ConditionName::Restrained, "Restrained",
     "Speed 0; attacks and Dex saves have disadvantage.",
     kRestrained},
    {ConditionName::Stunned, "Stunned",
     "Incapacitated, can't move; fails Str/Dex saves.",
     kStunned},
    {ConditionName::Unconscious, "Unconscious",
     "Incapacitated, prone, unaware; hits within 5 ft are critical.",
     kUnconscious},
}};

// Conditions whose effects include another condition entirely.
constexpr std::pair<ConditionName, ConditionName> kIncludes[] = {
    {ConditionName::Paralyzed, ConditionName::Incapacitated},
    {ConditionName::Petrified, ConditionName::Incapacitated},
    {ConditionName::Stunned, ConditionName::Incapacitated},
    {ConditionName::Unconscious, ConditionName::Incapacitated},
    {ConditionName::Unconscious, ConditionName::Prone},
};

constexpr std::pair<ConditionName, ConditionName> kIncompatible[] = {
    {ConditionName::Invisible, ConditionName::Blinded},
};

} // namespace

std::optional<ConditionName> parseConditionName(std::string_view name) {
    std::string key(name);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& def : kLibrary) {
        std::string candidate(def.displayName);
        std::transform(candidate.begin(), candidate.end(), candidate.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (candidate == key) {
            return def.name;
        }
    }
    return std::nullopt;
}

const ConditionDefinition& conditionDefinition(ConditionName name) {
    return kLibrary[static_cast<std::size_t>(name)];
}

std::optional<RollKind> saveRollKind(Ability ability) {
    switch (ability) {
        case Ability::Strength:  return RollKind::StrengthSave;
        case Ability::Dexterity: return RollKind::DexteritySave;
        default:                 return std::nullopt;
    }
}

bool conditionIncludes(ConditionName outer, ConditionName inner) {
    return std::any_of(std::begin(kIncludes), std::end(kIncludes),
                       [&](const auto& entry) {
                           return entry.first == outer && entry.second == inner;
                       });
}

bool conditionsIncompatible(ConditionName a, ConditionName b) {
    return std::any_of(std::begin(kIncompatible), std::end(kIncompatible),
                       [&](const auto& entry) {
                           return (entry.first == a && entry.second == b) ||
                                  (entry.first == b && entry.second == a);
                       });
}

}  // namespace dcc::combat
