#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the Turtle Adventure runtime.

#include <cstdint>
#include <string_view>

namespace tadv::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), so the source of an
/// error can be read off the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,

    // Config (0x0100 - 0x01FF)
    ConfigLoadFailed = 0x0100,
    ConfigKeyNotFound = 0x0101,
    ConfigTypeMismatch = 0x0102,

    // Logger (0x0200 - 0x02FF)
    LoggerFlushFailed = 0x0201,
    LoggerLevelUnknown = 0x0202,

    // Game (0x0300 - 0x03FF)
    InvalidConfiguration = 0x0300,
    SessionFinished = 0x0301,

    // Host (0x0400 - 0x04FF)
    EventNotFound = 0x0400,
    HostNotStarted = 0x0401,
    HostAlreadyStarted = 0x0402,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Config";
        case 0x0200: return "Logger";
        case 0x0300: return "Game";
        case 0x0400: return "Host";
        default: return "Unknown";
    }
}

} // namespace tadv::foundation
