#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace ringsum {

// Error categories with distinct ranges
enum class ErrorCategory : uint16_t {
    None = 0,
    Configuration = 1000,
    Transport = 2000,
    Protocol = 3000,
    Crypto = 4000,
    System = 5000
};

// Structured error codes
enum class ErrorCode : uint32_t {
    // Success
    Success = 0,

    // Configuration errors (1000-1999)
    ConfigNotInRing = 1001,
    ConfigRingTooSmall = 1002,
    ConfigDuplicateMember = 1003,
    ConfigInvalidConfiguration = 1004,

    // Transport errors (2000-2999)
    TransportNotFound = 2001,
    TransportReadFailed = 2002,
    TransportWriteFailed = 2003,
    TransportPermissionDenied = 2004,
    TransportRingFetchFailed = 2005,

    // Protocol errors (3000-3999)
    ProtocolKeysNotReady = 3001,
    ProtocolMalformedArtifact = 3002,
    ProtocolFieldMismatch = 3003,

    // Crypto errors (4000-4999)
    CryptoInitializationFailed = 4001,

    // System errors (5000-5999)
    SystemStepLimitExceeded = 5001
};

// Result type for operations that can fail
template<typename T>
class Result {
public:
    Result(T value) noexcept : value_(std::move(value)), code_(ErrorCode::Success) {}
    Result(ErrorCode code) noexcept : code_(code) {}
    Result(ErrorCode code, std::string_view message)
        : code_(code), message_(message) {}

    bool isSuccess() const noexcept { return code_ == ErrorCode::Success; }
    bool isError() const noexcept { return code_ != ErrorCode::Success; }

    const T& value() const { return value_; }
    T& value() { return value_; }
    T&& moveValue() noexcept { return std::move(value_); }

    ErrorCode error() const noexcept { return code_; }
    std::string_view message() const noexcept { return message_; }

    operator bool() const noexcept { return isSuccess(); }

private:
    T value_;
    ErrorCode code_;
    std::string message_;
};

// Specialization for void results
template<>
class Result<void> {
public:
    Result() noexcept : code_(ErrorCode::Success) {}
    Result(ErrorCode code) noexcept : code_(code) {}
    Result(ErrorCode code, std::string_view message)
        : code_(code), message_(message) {}

    bool isSuccess() const noexcept { return code_ == ErrorCode::Success; }
    bool isError() const noexcept { return code_ != ErrorCode::Success; }

    ErrorCode error() const noexcept { return code_; }
    std::string_view message() const noexcept { return message_; }

    operator bool() const noexcept { return isSuccess(); }

private:
    ErrorCode code_;
    std::string message_;
};

// Helper function to get error category
inline ErrorCategory getErrorCategory(ErrorCode code) noexcept {
    uint32_t value = static_cast<uint32_t>(code);
    if (value == 0) return ErrorCategory::None;
    if (value >= 1000 && value < 2000) return ErrorCategory::Configuration;
    if (value >= 2000 && value < 3000) return ErrorCategory::Transport;
    if (value >= 3000 && value < 4000) return ErrorCategory::Protocol;
    if (value >= 4000 && value < 5000) return ErrorCategory::Crypto;
    if (value >= 5000 && value < 6000) return ErrorCategory::System;
    return ErrorCategory::None;
}

// Convert error code to string
inline std::string_view errorToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";

        // Configuration errors
        case ErrorCode::ConfigNotInRing: return "Participant not in ring";
        case ErrorCode::ConfigRingTooSmall: return "Ring has fewer than 3 members";
        case ErrorCode::ConfigDuplicateMember: return "Ring lists a member twice";
        case ErrorCode::ConfigInvalidConfiguration: return "Invalid configuration";

        // Transport errors
        case ErrorCode::TransportNotFound: return "Location not found";
        case ErrorCode::TransportReadFailed: return "Storage read failed";
        case ErrorCode::TransportWriteFailed: return "Storage write failed";
        case ErrorCode::TransportPermissionDenied: return "Permission denied";
        case ErrorCode::TransportRingFetchFailed: return "Failed to fetch ring";

        // Protocol errors
        case ErrorCode::ProtocolKeysNotReady: return "Masking keys not ready";
        case ErrorCode::ProtocolMalformedArtifact: return "Malformed artifact";
        case ErrorCode::ProtocolFieldMismatch: return "Record fields do not match";

        // Crypto errors
        case ErrorCode::CryptoInitializationFailed: return "Crypto initialization failed";

        // System errors
        case ErrorCode::SystemStepLimitExceeded: return "Invocation step limit exceeded";

        default: return "Unknown error";
    }
}

// "<description>: <message>" for log lines
template<typename T>
std::string describeError(const Result<T>& result) {
    std::string text(errorToString(result.error()));
    if (!result.message().empty()) {
        text += ": ";
        text += result.message();
    }
    return text;
}

} // namespace ringsum
