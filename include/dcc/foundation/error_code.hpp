#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes and the caller-facing error taxonomy.

#include <cstdint>
#include <string_view>

namespace dcc::foundation {

/// Error codes grouped by subsystem in 256-value ranges (0x100).
///
/// The subsystem can be recovered from the code value alone; the
/// caller-facing category (NotFound, InvalidState, ...) comes from
/// errorKind().
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    AlreadyExists = 0x0004,

    // Encounter (0x0100 - 0x01FF)
    EncounterNotFound = 0x0100,
    EncounterInvalidState = 0x0101,
    EncounterLimitReached = 0x0102,
    EncounterHalted = 0x0103,
    ParticipantNotFound = 0x0104,
    ParticipantDead = 0x0105,
    ParticipantNotDying = 0x0106,
    OutOfTurn = 0x0107,
    InitiativeUnresolved = 0x0108,
    NoActiveParticipants = 0x0109,
    ConcurrentModification = 0x010A,

    // Rules input validation (0x0200 - 0x02FF)
    NegativeAmount = 0x0200,
    RollOutOfRange = 0x0201,
    MissingField = 0x0202,
    DuplicateTarget = 0x0203,
    InvalidParticipantSpec = 0x0204,

    // Conditions (0x0300 - 0x03FF)
    ConditionNotFound = 0x0300,
    UnknownCondition = 0x0301,
    ConditionImmune = 0x0302,
    ConditionNotSaveable = 0x0303,

    // Dice (0x0400 - 0x04FF)
    InvalidDiceExpression = 0x0400,
    DiceSequenceExhausted = 0x0401,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Thread (0x0700 - 0x07FF)
    ThreadError = 0x0700,
    JobScheduleFailed = 0x0701,
    SchedulerStopped = 0x0702,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0801,

    // Event delivery (0x0900 - 0x09FF)
    EventDispatchFailed = 0x0900,
};

/// Caller-facing error categories.
enum class ErrorKind : uint8_t {
    None,          ///< Not an error.
    NotFound,      ///< Unknown encounter, participant or condition.
    InvalidState,  ///< Operation illegal in the current state.
    Validation,    ///< Bad input: negative amounts, missing fields, bad rolls.
    Conflict,      ///< Reserved for optimistic-concurrency use.
    Internal       ///< Infrastructure failure (config, threads, logging).
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    switch (value & 0xFF00) {
        case 0x0000: return "General";
        case 0x0100: return "Encounter";
        case 0x0200: return "Rules";
        case 0x0300: return "Condition";
        case 0x0400: return "Dice";
        case 0x0600: return "Config";
        case 0x0700: return "Thread";
        case 0x0800: return "Logger";
        case 0x0900: return "Event";
        default: return "Unknown";
    }
}

/// Map an error code onto the caller-facing taxonomy.
constexpr ErrorKind errorKind(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success:
            return ErrorKind::None;

        case ErrorCode::EncounterNotFound:
        case ErrorCode::ParticipantNotFound:
        case ErrorCode::ConditionNotFound:
        case ErrorCode::UnknownCondition:
            return ErrorKind::NotFound;

        case ErrorCode::EncounterInvalidState:
        case ErrorCode::EncounterLimitReached:
        case ErrorCode::EncounterHalted:
        case ErrorCode::ParticipantDead:
        case ErrorCode::ParticipantNotDying:
        case ErrorCode::OutOfTurn:
        case ErrorCode::InitiativeUnresolved:
        case ErrorCode::NoActiveParticipants:
        case ErrorCode::ConditionImmune:
        case ErrorCode::ConditionNotSaveable:
        case ErrorCode::DiceSequenceExhausted:
            return ErrorKind::InvalidState;

        case ErrorCode::InvalidArgument:
        case ErrorCode::AlreadyExists:
        case ErrorCode::NegativeAmount:
        case ErrorCode::RollOutOfRange:
        case ErrorCode::MissingField:
        case ErrorCode::DuplicateTarget:
        case ErrorCode::InvalidParticipantSpec:
        case ErrorCode::InvalidDiceExpression:
            return ErrorKind::Validation;

        case ErrorCode::ConcurrentModification:
            return ErrorKind::Conflict;

        default:
            return ErrorKind::Internal;
    }
}

/// Return the display name of an error kind.
constexpr std::string_view errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:         return "None";
        case ErrorKind::NotFound:     return "NotFound";
        case ErrorKind::InvalidState: return "InvalidState";
        case ErrorKind::Validation:   return "ValidationError";
        case ErrorKind::Conflict:     return "ConflictError";
        case ErrorKind::Internal:     return "InternalError";
    }
    return "Unknown";
}

} // namespace dcc::foundation
