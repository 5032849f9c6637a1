#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the interact addon.

#include <cstdint>
#include <string_view>

namespace interact::foundation {

/// Error codes grouped by subsystem using hex ranges.
///
/// Each subsystem owns a 256-value block (0x100), so the origin of an
/// error can be read from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,

    // World (0x0100 - 0x01FF)
    ObjectNotFound = 0x0100,
    InvalidObjectType = 0x0101,

    // Script (0x0200 - 0x02FF)
    ScriptUsage = 0x0200,
    FunctionRegistrationFailed = 0x0201,

    // Hook (0x0300 - 0x03FF)
    HookInitFailed = 0x0300,
    HookEnableFailed = 0x0301,
    HookAlreadyInstalled = 0x0302,

    // Config (0x0400 - 0x04FF)
    ConfigLoadFailed = 0x0400,
    ConfigKeyNotFound = 0x0401,
    ConfigTypeMismatch = 0x0402,

    // Logger (0x0500 - 0x05FF)
    LoggerFlushFailed = 0x0500,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "World";
        case 0x0200: return "Script";
        case 0x0300: return "Hook";
        case 0x0400: return "Config";
        case 0x0500: return "Logger";
        default: return "Unknown";
    }
}

} // namespace interact::foundation
