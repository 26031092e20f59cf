#pragma once

/// @file types.hpp
/// @brief Strong ID types for encounters, participants and their records.

#include <cstdint>
#include <functional>
#include <string>

namespace dcc::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// Keeps EncounterId, ParticipantId and friends from being mixed up at
/// compile time while sharing one integral representation. Zero is the
/// invalid value.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct EncounterIdTag {};
struct ParticipantIdTag {};
struct ConditionIdTag {};
struct DamageLogIdTag {};
struct SessionIdTag {};
struct CharacterIdTag {};
struct CreatureIdTag {};

using EncounterId = StrongId<EncounterIdTag>;
using ParticipantId = StrongId<ParticipantIdTag>;

/// Identifies one ActiveCondition instance (not the condition kind).
using ConditionId = StrongId<ConditionIdTag>;

using DamageLogId = StrongId<DamageLogIdTag>;

/// Opaque reference to the owning game session.
using SessionId = StrongId<SessionIdTag>;

/// References into the character/creature subsystem (read-only input).
using CharacterId = StrongId<CharacterIdTag>;
using CreatureId = StrongId<CreatureIdTag>;

/// Render an id as "<prefix>#<value>" for logs and event summaries.
template <typename Tag, typename T>
std::string toString(StrongId<Tag, T> id, const char* prefix) {
    return std::string(prefix) + "#" + std::to_string(id.value());
}

} // namespace dcc::foundation

template <typename Tag, typename T>
struct std::hash<dcc::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const dcc::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
