#pragma once

/**
 * @file types.h
 * @brief Core type definitions for the voice relay
 *
 * This file contains all fundamental types used throughout the system.
 * Keeping types centralized ensures consistency and makes refactoring easier.
 */

#include "errors.h"
#include <cstdint>
#include <vector>
#include <string>
#include <chrono>
#include <memory>
#include <functional>
#include <optional>
#include <stdexcept>

namespace voice_relay {

// =============================================================================
// Audio Types
// =============================================================================

/// Inbound samples are float32 in [-1, 1]
using FloatSamples = std::vector<float>;

/// 16-bit signed PCM sample (synthesizer output, wire format)
using Sample = int16_t;

/// Variable-length PCM16 buffer
using Pcm16Buffer = std::vector<Sample>;

// =============================================================================
// Timing Types
// =============================================================================

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

/// Get milliseconds elapsed since a time point
inline int64_t ms_since(TimePoint start) {
    return std::chrono::duration_cast<Duration>(Clock::now() - start).count();
}

/// Get current timestamp in milliseconds (for logging)
inline int64_t now_ms() {
    return std::chrono::duration_cast<Duration>(
        Clock::now().time_since_epoch()).count();
}

// =============================================================================
// Audio Format Constants
// =============================================================================

namespace audio {
    constexpr int INPUT_SAMPLE_RATE = 16000;     // Hz, browser capture rate
    constexpr int FRAME_DURATION_MS = 20;        // ms per VAD frame
    constexpr int SAMPLES_PER_FRAME = (INPUT_SAMPLE_RATE * FRAME_DURATION_MS) / 1000; // 320

    /// Convert milliseconds to samples
    constexpr size_t ms_to_samples(int ms, int sample_rate = INPUT_SAMPLE_RATE) {
        return (static_cast<size_t>(ms) * static_cast<size_t>(sample_rate)) / 1000;
    }

    /// Convert samples to milliseconds
    constexpr int64_t samples_to_ms(size_t samples, int sample_rate = INPUT_SAMPLE_RATE) {
        return static_cast<int64_t>((samples * 1000) / static_cast<size_t>(sample_rate));
    }
}

// =============================================================================
// Result Types (for error handling without exceptions)
// =============================================================================

/// Generic result type for operations that can fail
template<typename T>
struct Result {
    std::optional<T> value;
    std::string error;
    ErrorType kind = ErrorType::None;

    bool ok() const { return value.has_value(); }
    bool failed() const { return !ok(); }

    static Result success(T val) { return {std::move(val), "", ErrorType::None}; }
    static Result failure(std::string err, ErrorType kind = ErrorType::Unknown) {
        return {std::nullopt, std::move(err), kind};
    }
    static Result failure(const Error& err) { return failure(err.message, err.type); }

    Error to_error() const { return Error(kind, error); }

    /// Get value or throw if failed
    T& unwrap() {
        if (!ok()) throw std::runtime_error(error);
        return *value;
    }

    /// Get value or return default
    T value_or(T default_val) const {
        return ok() ? *value : default_val;
    }
};

/// Void result for operations that don't return a value
struct VoidResult {
    bool success;
    std::string error;
    ErrorType kind = ErrorType::None;

    bool ok() const { return success; }
    bool failed() const { return !ok(); }

    static VoidResult ok_result() { return {true, "", ErrorType::None}; }
    static VoidResult failure(std::string err, ErrorType kind = ErrorType::Unknown) {
        return {false, std::move(err), kind};
    }
    static VoidResult failure(const Error& err) { return failure(err.message, err.type); }

    Error to_error() const { return Error(kind, error); }
};

// =============================================================================
// Speech/Transcript Types
// =============================================================================

/// Result of speech-to-text transcription
struct Transcript {
    std::string text;
    float confidence = 0.0f;
    bool is_final = true;
    int64_t processing_ms = 0;
    int64_t audio_duration_ms = 0;

    bool empty() const { return text.empty(); }
};

/// Conversation message roles
enum class MessageRole {
    System,
    User,
    Assistant
};

/// Single message in conversation history
struct Message {
    MessageRole role;
    std::string content;

    static Message system(const std::string& content) { return {MessageRole::System, content}; }
    static Message user(const std::string& content) { return {MessageRole::User, content}; }
    static Message assistant(const std::string& content) { return {MessageRole::Assistant, content}; }
};

inline const char* role_to_string(MessageRole role) {
    switch (role) {
        case MessageRole::System: return "system";
        case MessageRole::User: return "user";
        case MessageRole::Assistant: return "assistant";
    }
    return "user";
}

} // namespace voice_relay
