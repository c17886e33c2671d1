#pragma once

#include <string>

namespace voice_relay {

/**
 * @brief Error types for different failure modes
 *
 * The first five are surfaced to clients as typed `error` events; the rest
 * stay internal (configuration, adapters).
 */
enum class ErrorType {
    None,
    ProviderTimeout,   ///< STT/LLM/TTS call exceeded its deadline
    ProviderError,     ///< STT/LLM/TTS call failed or returned malformed output
    AudioOverflow,     ///< Utterance buffer exceeded its maximum duration
    ProtocolError,     ///< Malformed client message
    SessionCanceled,   ///< Disconnect or explicit cancel mid-turn
    IOError,
    ParseError,
    InvalidState,
    Unknown
};

/**
 * @brief Error information structure
 */
struct Error {
    ErrorType type = ErrorType::None;
    std::string message;

    Error() = default;
    Error(ErrorType t, const std::string& msg) : type(t), message(msg) {}

    bool is_error() const { return type != ErrorType::None; }
    operator bool() const { return is_error(); }
};

/**
 * @brief Wire name of an error type, as carried in the `code` field
 */
inline const char* error_code(ErrorType type) {
    switch (type) {
        case ErrorType::None: return "none";
        case ErrorType::ProviderTimeout: return "provider_timeout";
        case ErrorType::ProviderError: return "provider_error";
        case ErrorType::AudioOverflow: return "audio_overflow";
        case ErrorType::ProtocolError: return "protocol_error";
        case ErrorType::SessionCanceled: return "session_canceled";
        case ErrorType::IOError: return "io_error";
        case ErrorType::ParseError: return "parse_error";
        case ErrorType::InvalidState: return "invalid_state";
        case ErrorType::Unknown: return "unknown";
    }
    return "unknown";
}

/**
 * @brief Connection close codes owned by the authentication layer
 *
 * The orchestrator never decides these itself, but a channel can be closed
 * with any of them.
 */
enum class CloseCode : int {
    Normal = 1000,
    AuthRequired = 4001,
    InvalidCredential = 4002,
    RateLimited = 4003
};

inline const char* close_reason(CloseCode code) {
    switch (code) {
        case CloseCode::Normal: return "Normal closure";
        case CloseCode::AuthRequired: return "API key required";
        case CloseCode::InvalidCredential: return "Invalid API key";
        case CloseCode::RateLimited: return "Rate limit exceeded";
    }
    return "Unknown";
}

// Helper functions for creating errors
inline Error make_error(ErrorType type, const std::string& message) {
    return Error(type, message);
}

inline Error make_provider_error(const std::string& message) {
    return Error(ErrorType::ProviderError, message);
}

inline Error make_timeout_error(const std::string& message = "Operation timed out") {
    return Error(ErrorType::ProviderTimeout, message);
}

inline Error make_protocol_error(const std::string& message) {
    return Error(ErrorType::ProtocolError, message);
}

inline Error make_canceled_error(const std::string& message = "Turn canceled") {
    return Error(ErrorType::SessionCanceled, message);
}

} // namespace voice_relay
