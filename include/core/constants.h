#pragma once

/**
 * @file constants.h
 * @brief System-wide constants and tuning parameters
 *
 * All magic numbers should be defined here with clear documentation.
 * This makes tuning the system behavior straightforward.
 */

#include <cstddef>

namespace voice_relay {
namespace constants {

// =============================================================================
// Audio Constants
// =============================================================================

namespace audio {
    /// Upper bound on one utterance; chunks beyond it are dropped (ms)
    constexpr int MAX_UTTERANCE_MS = 30000;

    /// Audio kept ahead of detected speech start (ms)
    constexpr int PRE_SPEECH_BUFFER_MS = 300;

    /// Default client-facing output rate (Hz)
    constexpr int OUTPUT_SAMPLE_RATE = 16000;
}

// =============================================================================
// VAD (Voice Activity Detection) Constants
// =============================================================================

namespace vad {
    /// Speech probability at or above which a frame counts as voiced
    constexpr float DEFAULT_PROBABILITY_THRESHOLD = 0.5f;

    /// Default RMS threshold for speech detection (normalized 0-1)
    constexpr float DEFAULT_ENERGY_THRESHOLD = 0.02f;

    /// Minimum voiced duration for an utterance to be transcribed (ms)
    constexpr int MIN_SPEECH_MS = 250;

    /// Consecutive silence that ends an utterance (ms)
    constexpr int SILENCE_MS = 900;

    /// Number of consecutive voiced frames required before speech start
    constexpr int DEBOUNCE_FRAMES = 2;

    /// Hysteresis ratio (end threshold = start threshold * this)
    constexpr float HYSTERESIS_RATIO = 0.5f;

    /// Adaptive threshold: multiplier above noise floor
    constexpr float ADAPTIVE_THRESHOLD_MULTIPLIER = 3.0f;

    /// Minimum threshold even in quiet environments
    constexpr float MIN_ADAPTIVE_THRESHOLD = 0.01f;

    /// Maximum threshold even in noisy environments
    constexpr float MAX_ADAPTIVE_THRESHOLD = 0.3f;

    /// Mean absolute level above which silent-looking audio still gets a
    /// batch transcription attempt
    constexpr float ENERGY_FALLBACK_THRESHOLD = 0.008f;

    /// Server-side VAD tuning sent to realtime providers
    constexpr float SERVER_VAD_THRESHOLD = 0.2f;
    constexpr int SERVER_VAD_PREFIX_PADDING_MS = 300;
}

// =============================================================================
// STT Constants
// =============================================================================

namespace stt {
    /// Batch transcription request timeout (ms)
    constexpr int DEFAULT_TIMEOUT_MS = 15000;

    /// Wait for a streaming session's final transcript (ms)
    constexpr int FINISH_TIMEOUT_MS = 3000;

    /// Whisper emits this for non-speech input
    constexpr const char* BLANK_SENTINEL = "[BLANK_AUDIO]";
}

// =============================================================================
// Agent (LLM) Constants
// =============================================================================

namespace agent {
    /// Default timeout for a whole chat completion (ms)
    constexpr int DEFAULT_TIMEOUT_MS = 60000;

    /// Connection timeout (ms)
    constexpr int CONNECT_TIMEOUT_MS = 1000;

    constexpr int DEFAULT_MAX_TOKENS = 500;
    constexpr float DEFAULT_TEMPERATURE = 0.7f;

    /// Conversation messages kept per session (system prompt excluded)
    constexpr size_t MAX_HISTORY_MESSAGES = 10;

    /// Spoken when the agent produced nothing usable
    constexpr const char* FALLBACK_REPLY = "Sorry, I had trouble processing that.";
}

// =============================================================================
// TTS (Text-to-Speech) Constants
// =============================================================================

namespace tts {
    /// Sample rate of OpenAI-compatible `pcm` speech output (Hz)
    constexpr int HTTP_PCM_SAMPLE_RATE = 24000;

    /// Piper voices default to this rate when the voice config is missing (Hz)
    constexpr int PIPER_DEFAULT_SAMPLE_RATE = 22050;

    /// Longest outbound audio frame (ms)
    constexpr int FRAME_MS = 100;

    constexpr int DEFAULT_TIMEOUT_MS = 30000;
}

// =============================================================================
// Session Constants
// =============================================================================

namespace session {
    /// Unit syntheses allowed to run at once
    constexpr size_t MAX_PARALLEL_SYNTHESIS = 2;

    /// Units allowed ahead of the unit currently being delivered
    constexpr size_t REORDER_WINDOW = 4;

    /// Longest response unit without a sentence boundary (bytes)
    constexpr size_t MAX_UNIT_CHARS = 200;
}

} // namespace constants
} // namespace voice_relay
