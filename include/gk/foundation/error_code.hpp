#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the authentication service.

#include <cstdint>
#include <string_view>

namespace gk::foundation {

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
    NotImplemented = 0x0005,

    // Validation (0x0100 - 0x01FF)
    ValidationFailed = 0x0100,

    // Storage (0x0200 - 0x02FF)
    StorageError = 0x0200,
    RecordNotFound = 0x0201,
    UniqueConstraintViolation = 0x0202,

    // Session (0x0300 - 0x03FF)
    SessionNotFound = 0x0300,
    NotAuthenticated = 0x0301,
    AlreadyAuthenticated = 0x0302,

    // Token (0x0400 - 0x04FF)
    InvalidToken = 0x0400,
    TokenExpired = 0x0401,
    TokenPurposeMismatch = 0x0402,
    InvalidOrExpiredToken = 0x0403,

    // Auth (0x0500 - 0x05FF)
    IncorrectCredentials = 0x0501,
    AccountUnconfirmed = 0x0502,
    EmailNoLongerAvailable = 0x0503,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Crypto (0x0700 - 0x07FF)
    CryptoError = 0x0700,

    // Mail (0x0800 - 0x08FF)
    MailDeliveryFailed = 0x0800,

    // Logger (0x0900 - 0x09FF)
    LoggerError = 0x0900,
    LoggerNotInitialized = 0x0901,
    LoggerFlushFailed = 0x0902,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Validation";
        case 0x0200: return "Storage";
        case 0x0300: return "Session";
        case 0x0400: return "Token";
        case 0x0500: return "Auth";
        case 0x0600: return "Config";
        case 0x0700: return "Crypto";
        case 0x0800: return "Mail";
        case 0x0900: return "Logger";
        default: return "Unknown";
    }
}

} // namespace gk::foundation
