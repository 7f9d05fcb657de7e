#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the combat/effect/skill/learning core.

#include <cstdint>
#include <string_view>

namespace evolve::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,
    EntityNotFound = 0x0005,

    // Stats (0x0100 - 0x01FF)
    InvalidAttribute = 0x0100,
    UnknownStatKey = 0x0101,

    // Effect (0x0200 - 0x02FF)
    UnknownEffect = 0x0200,
    EffectNotFound = 0x0201,
    TargetImmune = 0x0202,
    CapabilityMissing = 0x0203,
    AlreadyAtMaxStacks = 0x0204,
    TargetTypeMismatch = 0x0205,

    // Trigger (0x0300 - 0x03FF)
    ProcNotFound = 0x0300,
    ProcOnCooldown = 0x0301,
    ProcLimitReached = 0x0302,
    ProcChanceFailed = 0x0303,
    ProcConditionFailed = 0x0304,

    // Skill (0x0400 - 0x04FF)
    UnknownSkill = 0x0400,
    SkillNotLearned = 0x0401,
    InsufficientResources = 0x0402,
    OnCooldown = 0x0403,
    RequirementsNotMet = 0x0404,
    OutOfRange = 0x0405,
    InvalidTarget = 0x0406,
    CasterIncapacitated = 0x0407,
    ActionCancelled = 0x0408,

    // Combat (0x0500 - 0x05FF)
    TargetAlreadyDead = 0x0500,

    // AI (0x0600 - 0x06FF)
    AgentNotRegistered = 0x0600,
    NoLegalAction = 0x0601,
    InvalidAgentState = 0x0602,
    MemoryGroupNotFound = 0x0603,

    // Persistence (0x0700 - 0x07FF)
    InvalidBinaryData = 0x0700,
    InvalidJsonData = 0x0701,
    UnsupportedSchemaVersion = 0x0702,
    SnapshotWriteFailed = 0x0703,
    SnapshotReadFailed = 0x0704,

    // Config (0x0800 - 0x08FF)
    ConfigLoadFailed = 0x0800,
    ConfigKeyNotFound = 0x0801,
    ConfigTypeMismatch = 0x0802,

    // Logger (0x0900 - 0x09FF)
    LoggerError = 0x0900,
    LoggerFlushFailed = 0x0901,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Stats";
        case 0x0200: return "Effect";
        case 0x0300: return "Trigger";
        case 0x0400: return "Skill";
        case 0x0500: return "Combat";
        case 0x0600: return "AI";
        case 0x0700: return "Persistence";
        case 0x0800: return "Config";
        case 0x0900: return "Logger";
        default: return "Unknown";
    }
}

/// True for rejections the caller is expected to recover from (cooldowns,
/// immunity, missing resources).  Validation and I/O errors return false.
constexpr bool isPreconditionFailure(ErrorCode code) {
    switch (code) {
        case ErrorCode::TargetImmune:
        case ErrorCode::CapabilityMissing:
        case ErrorCode::AlreadyAtMaxStacks:
        case ErrorCode::TargetTypeMismatch:
        case ErrorCode::ProcOnCooldown:
        case ErrorCode::ProcLimitReached:
        case ErrorCode::ProcChanceFailed:
        case ErrorCode::ProcConditionFailed:
        case ErrorCode::InsufficientResources:
        case ErrorCode::OnCooldown:
        case ErrorCode::RequirementsNotMet:
        case ErrorCode::OutOfRange:
        case ErrorCode::InvalidTarget:
        case ErrorCode::CasterIncapacitated:
        case ErrorCode::ActionCancelled:
        case ErrorCode::TargetAlreadyDead:
        case ErrorCode::NoLegalAction:
            return true;
        default:
            return false;
    }
}

/// How a failure is expected to be handled.
enum class ErrorClass : uint8_t {
    None,          ///< Success
    Validation,    ///< Bad input, rejected without coercion
    Precondition,  ///< Recoverable rejection, see isPreconditionFailure()
    External,      ///< Snapshot or configuration I/O
    Internal       ///< Logger faults and unknown errors
};

constexpr ErrorClass classifyError(ErrorCode code) {
    if (code == ErrorCode::Success) {
        return ErrorClass::None;
    }
    if (code == ErrorCode::Unknown) {
        return ErrorClass::Internal;
    }
    if (isPreconditionFailure(code)) {
        return ErrorClass::Precondition;
    }
    switch (static_cast<uint32_t>(code) & 0xFF00) {
        case 0x0700:
            return ErrorClass::External;
        case 0x0800:
            return code == ErrorCode::ConfigLoadFailed ? ErrorClass::External
                                                       : ErrorClass::Validation;
        case 0x0900:
            return ErrorClass::Internal;
        default:
            return ErrorClass::Validation;
    }
}

} // namespace evolve::foundation
