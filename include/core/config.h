#pragma once

/**
 * @file config.h
 * @brief Unified configuration system
 *
 * This file defines the configuration structure for the whole relay.
 * It supports:
 * - JSON file loading
 * - Environment variable overrides
 * - Default values
 * - Validation
 */

#include "types.h"
#include "constants.h"
#include <string>
#include <functional>

namespace voice_relay {
namespace config {

// =============================================================================
// Component Configurations
// =============================================================================

/**
 * @brief Audio format and buffering configuration
 */
struct AudioConfig {
    int input_sample_rate = audio::INPUT_SAMPLE_RATE;
    int output_sample_rate = constants::audio::OUTPUT_SAMPLE_RATE;
    int max_utterance_ms = constants::audio::MAX_UTTERANCE_MS;
    int pre_speech_buffer_ms = constants::audio::PRE_SPEECH_BUFFER_MS;
};

/**
 * @brief Turn detection configuration
 *
 * `mode` is "local" (frame VAD in process) or "provider" (speech events
 * from a streaming STT provider). The two never run together in a session.
 */
struct VADConfig {
    std::string mode = "local";
    float threshold = constants::vad::DEFAULT_PROBABILITY_THRESHOLD;
    float energy_threshold = constants::vad::DEFAULT_ENERGY_THRESHOLD;
    bool adaptive_threshold = true;
    int frame_ms = audio::FRAME_DURATION_MS;
    int start_frames = constants::vad::DEBOUNCE_FRAMES;
    int silence_ms = constants::vad::SILENCE_MS;
    int min_speech_ms = constants::vad::MIN_SPEECH_MS;
    int post_response_guard_ms = 0;
    float energy_fallback_threshold = constants::vad::ENERGY_FALLBACK_THRESHOLD;
    bool debug_log_frames = false;
};

/**
 * @brief STT (Speech-to-Text) configuration
 *
 * provider: "whisper" (local whisper.cpp), "openai" (OpenAI-compatible
 * transcription endpoint) or "realtime" (WebSocket with server VAD).
 */
struct STTConfig {
    std::string provider = "whisper";
    std::string language = "en";
    std::string blank_sentinel = constants::stt::BLANK_SENTINEL;

    // whisper
    std::string model_path;
    bool use_gpu = false;
    int n_threads = 4;

    // openai
    std::string endpoint = "https://api.openai.com/v1/audio/transcriptions";
    std::string model = "whisper-1";
    std::string api_key;
    int timeout_ms = constants::stt::DEFAULT_TIMEOUT_MS;

    // realtime
    std::string realtime_url = "wss://dashscope.aliyuncs.com/api-ws/v1/realtime";
    std::string realtime_model = "qwen3-asr-flash-realtime";
    std::string realtime_api_key;
    int finish_timeout_ms = constants::stt::FINISH_TIMEOUT_MS;
    float server_vad_threshold = constants::vad::SERVER_VAD_THRESHOLD;
    int prefix_padding_ms = constants::vad::SERVER_VAD_PREFIX_PADDING_MS;

    /// Batch provider used when a streaming session yields no text ("" = none)
    std::string fallback_provider = "openai";
};

/**
 * @brief Agent backend (OpenAI-compatible chat) configuration
 */
struct AgentConfig {
    std::string endpoint = "http://localhost:8000/v1/chat/completions";
    std::string model = "gpt-4o-mini";
    std::string api_key;
    std::string gateway_url;
    std::string gateway_token;
    int timeout_ms = constants::agent::DEFAULT_TIMEOUT_MS;
    int max_tokens = constants::agent::DEFAULT_MAX_TOKENS;
    float temperature = constants::agent::DEFAULT_TEMPERATURE;
    size_t max_history_messages = constants::agent::MAX_HISTORY_MESSAGES;
    std::string system_prompt =
        "You are a helpful AI assistant. "
        "This conversation is happening via real-time voice chat. "
        "Keep responses concise and conversational, a few sentences at most. "
        "No markdown, bullet points, code blocks, or special formatting.";
};

/**
 * @brief TTS configuration
 *
 * provider: "piper" (local subprocess) or "openai" (OpenAI-compatible
 * speech endpoint returning raw PCM).
 */
struct TTSConfig {
    std::string provider = "piper";

    // piper
    std::string voice_path;
    std::string piper_path;  // Empty = auto-detect
    std::string espeak_data_path;
    float output_gain = 1.0f;

    // openai
    std::string endpoint = "https://api.openai.com/v1/audio/speech";
    std::string model = "tts-1";
    std::string voice = "alloy";
    std::string api_key;
    int timeout_ms = constants::tts::DEFAULT_TIMEOUT_MS;

    int frame_ms = constants::tts::FRAME_MS;
};

/**
 * @brief Per-session turn handling
 */
struct SessionConfig {
    bool continuous = false;
    size_t max_parallel_synthesis = constants::session::MAX_PARALLEL_SYNTHESIS;
    size_t reorder_window = constants::session::REORDER_WINDOW;
    size_t max_unit_chars = constants::session::MAX_UNIT_CHARS;
};

struct LogConfig {
    std::string level = "info";
    std::string file;  // Empty = console only
};

// =============================================================================
// Main Configuration
// =============================================================================

/// getenv-compatible lookup, injectable for tests
using EnvLookup = std::function<const char*(const char*)>;

/**
 * @brief Complete relay configuration
 */
struct AppConfig {
    AudioConfig audio;
    VADConfig vad;
    STTConfig stt;
    AgentConfig agent;
    TTSConfig tts;
    SessionConfig session;
    LogConfig log;

    /**
     * @brief Load configuration from JSON file
     * @param path Path to JSON config file
     * @return Loaded config or error
     */
    static Result<AppConfig> load(const std::string& path);

    /**
     * @brief Parse configuration from a JSON document
     */
    static Result<AppConfig> parse(const std::string& json_text);

    /**
     * @brief Create with default values
     */
    static AppConfig defaults();

    /**
     * @brief Apply VOICE_RELAY_* and provider key environment variables
     *
     * A gateway URL plus token rewrites the agent endpoint to the gateway's
     * chat completions route.
     */
    void apply_env_overrides(const EnvLookup& lookup);

    /**
     * @brief Validate configuration
     * @return Error message if invalid, empty if valid
     */
    std::string validate() const;
};

} // namespace config

// Convenience alias
using Config = config::AppConfig;

} // namespace voice_relay
