#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the quest engine.

#include <cstdint>
#include <string_view>

namespace qe::foundation {

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

    // Quest (0x0100 - 0x01FF)
    NotAvailable = 0x0100,
    AlreadyActive = 0x0101,
    NotActive = 0x0102,
    InstanceTerminal = 0x0103,
    CapacityExceeded = 0x0104,
    CorruptSnapshot = 0x0105,
    UnknownConditionKind = 0x0106,
    InvalidDefinition = 0x0107,

    // Dispatch (0x0200 - 0x02FF)
    DispatchError = 0x0200,
    EventQueueFull = 0x0201,
    NoEventHandler = 0x0202,

    // Config (0x0300 - 0x03FF)
    ConfigLoadFailed = 0x0300,
    ConfigKeyNotFound = 0x0301,
    ConfigTypeMismatch = 0x0302,
    ConfigInvalidValue = 0x0303,

    // Thread (0x0400 - 0x04FF)
    ThreadError = 0x0400,
    JobScheduleFailed = 0x0401,

    // Logger (0x0500 - 0x05FF)
    LoggerError = 0x0500,
    LoggerFlushFailed = 0x0501,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Quest";
        case 0x0200: return "Dispatch";
        case 0x0300: return "Config";
        case 0x0400: return "Thread";
        case 0x0500: return "Logger";
        default: return "Unknown";
    }
}

} // namespace qe::foundation
