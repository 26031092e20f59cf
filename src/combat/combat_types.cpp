/// @file combat_types.cpp
/// @brief Name parsing for combat enumerations.

#include "dcc/combat/combat_types.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <utility>

namespace dcc::combat {

namespace {

std::string lower(std::string_view name) {
    std::string out(name);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

std::optional<DamageType> parseDamageType(std::string_view name) {
    auto key = lower(name);
    for (std::size_t i = 0; i < kDamageTypeCount; ++i) {
        auto type = static_cast<DamageType>(i);
        if (damageTypeName(type) == key) {
            return type;
        }
    }
    return std::nullopt;
}

std::optional<Ability> parseAbility(std::string_view name) {
    static constexpr std::array<std::pair<std::string_view, Ability>, 6> kLongNames = {{
        {"strength", Ability::Strength},
        {"dexterity", Ability::Dexterity},
        {"constitution", Ability::Constitution},
        {"intelligence", Ability::Intelligence},
        {"wisdom", Ability::Wisdom},
        {"charisma", Ability::Charisma},
    }};

    auto key = lower(name);
    for (const auto& [longName, ability] : kLongNames) {
        if (key == longName || key == abilityName(ability)) {
            return ability;
        }
    }
    return std::nullopt;
}

std::optional<DurationType> parseDurationType(std::string_view name) {
    auto key = lower(name);
    for (auto type : {DurationType::Rounds, DurationType::Minutes, DurationType::Hours,
                      DurationType::UntilSave, DurationType::Permanent}) {
        if (durationTypeName(type) == key) {
            return type;
        }
    }
    return std::nullopt;
}

std::optional<OnSavePolicy> parseOnSavePolicy(std::string_view name) {
    auto key = lower(name);
    if (key == "half" || key == "half_damage") return OnSavePolicy::HalfDamage;
    if (key == "none" || key == "no_damage") return OnSavePolicy::NoDamage;
    return std::nullopt;
}

}  // namespace dcc::combat
