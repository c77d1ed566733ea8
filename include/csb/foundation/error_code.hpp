#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the serialization bindings.

#include <cstdint>
#include <string_view>

namespace csb::foundation {

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

    // Protocol (0x0100 - 0x01FF): frame contract violations
    ProtocolError = 0x0100,
    FrameArityMismatch = 0x0101,
    FrameOrderViolation = 0x0102,
    DepthLimitExceeded = 0x0103,

    // Encode (0x0200 - 0x02FF)
    EncodeError = 0x0200,
    FrameTooLarge = 0x0201,
    UnsupportedMapKey = 0x0202,
    NonFiniteNumber = 0x0203,

    // Decode (0x0300 - 0x03FF)
    DecodeError = 0x0300,
    UnexpectedEnd = 0x0301,
    InvalidBinaryData = 0x0302,
    InvalidJsonData = 0x0303,
    LengthLimitExceeded = 0x0304,
    ValueOutOfRange = 0x0305,
    TrailingData = 0x0306,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerNotInitialized = 0x0801,
    LoggerFlushFailed = 0x0802,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Protocol";
        case 0x0200: return "Encode";
        case 0x0300: return "Decode";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

} // namespace csb::foundation
