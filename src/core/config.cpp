/**
 * @file config.cpp
 * @brief Configuration loading, environment overrides and validation
 */

#include "core/config.h"
#include "logger.h"
#include "utils.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace voice_relay {
namespace config {

// =============================================================================
// JSON Helpers
// =============================================================================

namespace {

template<typename T>
T get_or_default(const json& j, const std::string& key, const T& default_val) {
    if (j.contains(key) && !j[key].is_null()) {
        return j[key].get<T>();
    }
    return default_val;
}

AudioConfig parse_audio_config(const json& j) {
    AudioConfig config;
    if (!j.contains("audio")) return config;

    const auto& audio = j["audio"];
    config.input_sample_rate = get_or_default(audio, "input_sample_rate", config.input_sample_rate);
    config.output_sample_rate = get_or_default(audio, "output_sample_rate", config.output_sample_rate);
    config.max_utterance_ms = get_or_default(audio, "max_utterance_ms", config.max_utterance_ms);
    config.pre_speech_buffer_ms = get_or_default(audio, "pre_speech_buffer_ms", config.pre_speech_buffer_ms);
    return config;
}

VADConfig parse_vad_config(const json& j) {
    VADConfig config;
    if (!j.contains("vad")) return config;

    const auto& vad = j["vad"];
    config.mode = get_or_default(vad, "mode", config.mode);
    config.threshold = get_or_default(vad, "threshold", config.threshold);
    config.energy_threshold = get_or_default(vad, "energy_threshold", config.energy_threshold);
    config.adaptive_threshold = get_or_default(vad, "adaptive_threshold", config.adaptive_threshold);
    config.frame_ms = get_or_default(vad, "frame_ms", config.frame_ms);
    config.start_frames = get_or_default(vad, "start_frames", config.start_frames);
    config.silence_ms = get_or_default(vad, "silence_ms", config.silence_ms);
    config.min_speech_ms = get_or_default(vad, "min_speech_ms", config.min_speech_ms);
    config.post_response_guard_ms = get_or_default(vad, "post_response_guard_ms", config.post_response_guard_ms);
    config.energy_fallback_threshold = get_or_default(vad, "energy_fallback_threshold", config.energy_fallback_threshold);
    config.debug_log_frames = get_or_default(vad, "debug_log_frames", config.debug_log_frames);
    return config;
}

STTConfig parse_stt_config(const json& j) {
    STTConfig config;
    if (!j.contains("stt")) return config;

    const auto& stt = j["stt"];
    config.provider = get_or_default(stt, "provider", config.provider);
    config.language = get_or_default(stt, "language", config.language);
    config.blank_sentinel = get_or_default(stt, "blank_sentinel", config.blank_sentinel);
    config.model_path = get_or_default(stt, "model_path", config.model_path);
    config.use_gpu = get_or_default(stt, "use_gpu", config.use_gpu);
    config.n_threads = get_or_default(stt, "n_threads", config.n_threads);
    config.endpoint = get_or_default(stt, "endpoint", config.endpoint);
    config.model = get_or_default(stt, "model", config.model);
    config.api_key = get_or_default(stt, "api_key", config.api_key);
    config.timeout_ms = get_or_default(stt, "timeout_ms", config.timeout_ms);
    config.realtime_url = get_or_default(stt, "realtime_url", config.realtime_url);
    config.realtime_model = get_or_default(stt, "realtime_model", config.realtime_model);
    config.realtime_api_key = get_or_default(stt, "realtime_api_key", config.realtime_api_key);
    config.finish_timeout_ms = get_or_default(stt, "finish_timeout_ms", config.finish_timeout_ms);
    config.server_vad_threshold = get_or_default(stt, "server_vad_threshold", config.server_vad_threshold);
    config.prefix_padding_ms = get_or_default(stt, "prefix_padding_ms", config.prefix_padding_ms);
    config.fallback_provider = get_or_default(stt, "fallback_provider", config.fallback_provider);
    return config;
}

AgentConfig parse_agent_config(const json& j) {
    AgentConfig config;
    if (!j.contains("agent")) return config;

    const auto& agent = j["agent"];
    config.endpoint = get_or_default(agent, "endpoint", config.endpoint);
    config.model = get_or_default(agent, "model", config.model);
    config.api_key = get_or_default(agent, "api_key", config.api_key);
    config.gateway_url = get_or_default(agent, "gateway_url", config.gateway_url);
    config.gateway_token = get_or_default(agent, "gateway_token", config.gateway_token);
    config.timeout_ms = get_or_default(agent, "timeout_ms", config.timeout_ms);
    config.max_tokens = get_or_default(agent, "max_tokens", config.max_tokens);
    config.temperature = get_or_default(agent, "temperature", config.temperature);
    config.max_history_messages = get_or_default(agent, "max_history_messages", config.max_history_messages);
    config.system_prompt = get_or_default(agent, "system_prompt", config.system_prompt);
    return config;
}

TTSConfig parse_tts_config(const json& j) {
    TTSConfig config;
    if (!j.contains("tts")) return config;

    const auto& tts = j["tts"];
    config.provider = get_or_default(tts, "provider", config.provider);
    config.voice_path = get_or_default(tts, "voice_path", config.voice_path);
    config.piper_path = get_or_default(tts, "piper_path", config.piper_path);
    config.espeak_data_path = get_or_default(tts, "espeak_data_path", config.espeak_data_path);
    config.output_gain = get_or_default(tts, "output_gain", config.output_gain);
    config.endpoint = get_or_default(tts, "endpoint", config.endpoint);
    config.model = get_or_default(tts, "model", config.model);
    config.voice = get_or_default(tts, "voice", config.voice);
    config.api_key = get_or_default(tts, "api_key", config.api_key);
    config.timeout_ms = get_or_default(tts, "timeout_ms", config.timeout_ms);
    config.frame_ms = get_or_default(tts, "frame_ms", config.frame_ms);
    return config;
}

SessionConfig parse_session_config(const json& j) {
    SessionConfig config;
    if (!j.contains("session")) return config;

    const auto& session = j["session"];
    config.continuous = get_or_default(session, "continuous", config.continuous);
    config.max_parallel_synthesis = get_or_default(session, "max_parallel_synthesis", config.max_parallel_synthesis);
    config.reorder_window = get_or_default(session, "reorder_window", config.reorder_window);
    config.max_unit_chars = get_or_default(session, "max_unit_chars", config.max_unit_chars);
    return config;
}

LogConfig parse_log_config(const json& j) {
    LogConfig config;
    if (!j.contains("log")) return config;

    const auto& log = j["log"];
    config.level = get_or_default(log, "level", config.level);
    config.file = get_or_default(log, "file", config.file);
    return config;
}

/// Point the agent at an OpenAI-compatible gateway when both URL and token are known.
void resolve_gateway(AgentConfig& agent) {
    if (agent.gateway_url.empty() || agent.gateway_token.empty()) return;

    std::string base = agent.gateway_url;
    while (!base.empty() && base.back() == '/') base.pop_back();
    if (base.size() < 3 || base.compare(base.size() - 3, 3, "/v1") != 0) {
        base += "/v1";
    }
    agent.endpoint = base + "/chat/completions";
    agent.api_key = agent.gateway_token;
    agent.model = "main";
}

bool env_flag(const char* value) {
    std::string v = utils::normalize_copy(value);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

} // anonymous namespace

// =============================================================================
// AppConfig Implementation
// =============================================================================

Result<AppConfig> AppConfig::parse(const std::string& json_text) {
    try {
        json j = json::parse(json_text);
        if (!j.is_object()) {
            return Result<AppConfig>::failure("Config root must be an object", ErrorType::ParseError);
        }

        AppConfig config;
        config.audio = parse_audio_config(j);
        config.vad = parse_vad_config(j);
        config.stt = parse_stt_config(j);
        config.agent = parse_agent_config(j);
        config.tts = parse_tts_config(j);
        config.session = parse_session_config(j);
        config.log = parse_log_config(j);
        resolve_gateway(config.agent);

        return Result<AppConfig>::success(std::move(config));

    } catch (const json::exception& e) {
        return Result<AppConfig>::failure(std::string("JSON parse error: ") + e.what(), ErrorType::ParseError);
    }
}

Result<AppConfig> AppConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<AppConfig>::failure("Failed to open config file: " + path, ErrorType::IOError);
    }

    std::stringstream contents;
    contents << file.rdbuf();

    auto result = parse(contents.str());
    if (result.ok()) {
        Logger::info("Configuration loaded from: " + path);
    }
    return result;
}

AppConfig AppConfig::defaults() {
    return AppConfig{};  // All defaults are set in struct definitions
}

void AppConfig::apply_env_overrides(const EnvLookup& lookup) {
    auto set_string = [&](const char* name, std::string& target) {
        const char* value = lookup(name);
        if (value && *value) target = value;
    };

    set_string("VOICE_RELAY_VAD_MODE", vad.mode);
    set_string("VOICE_RELAY_STT_PROVIDER", stt.provider);
    set_string("VOICE_RELAY_STT_MODEL_PATH", stt.model_path);
    set_string("VOICE_RELAY_STT_LANGUAGE", stt.language);
    set_string("VOICE_RELAY_TTS_PROVIDER", tts.provider);
    set_string("VOICE_RELAY_TTS_VOICE_PATH", tts.voice_path);
    set_string("VOICE_RELAY_AGENT_ENDPOINT", agent.endpoint);
    set_string("VOICE_RELAY_AGENT_MODEL", agent.model);
    set_string("VOICE_RELAY_GATEWAY_URL", agent.gateway_url);
    set_string("VOICE_RELAY_GATEWAY_TOKEN", agent.gateway_token);
    set_string("VOICE_RELAY_LOG_LEVEL", log.level);
    set_string("VOICE_RELAY_LOG_FILE", log.file);
    set_string("DASHSCOPE_API_KEY", stt.realtime_api_key);

    if (const char* continuous = lookup("VOICE_RELAY_CONTINUOUS")) {
        session.continuous = env_flag(continuous);
    }

    // Shared OpenAI key fills whichever provider keys were left empty
    if (const char* key = lookup("OPENAI_API_KEY")) {
        if (*key) {
            if (agent.api_key.empty()) agent.api_key = key;
            if (stt.api_key.empty()) stt.api_key = key;
            if (tts.api_key.empty()) tts.api_key = key;
        }
    }

    resolve_gateway(agent);
}

std::string AppConfig::validate() const {
    std::ostringstream errors;

    // Audio
    if (audio.input_sample_rate <= 0 || audio.output_sample_rate <= 0) {
        errors << "audio sample rates must be positive; ";
    }
    if (audio.max_utterance_ms <= 0) {
        errors << "audio.max_utterance_ms must be positive; ";
    }

    // VAD
    if (vad.mode != "local" && vad.mode != "provider") {
        errors << "vad.mode must be \"local\" or \"provider\"; ";
    }
    if (vad.threshold <= 0 || vad.threshold > 1.0f) {
        errors << "vad.threshold must be between 0 and 1; ";
    }
    if (vad.frame_ms <= 0 || vad.silence_ms < vad.frame_ms) {
        errors << "vad.silence_ms must cover at least one frame; ";
    }
    if (vad.start_frames < 1) {
        errors << "vad.start_frames must be at least 1; ";
    }
    if (vad.mode == "provider" && stt.provider != "realtime") {
        errors << "vad.mode \"provider\" requires stt.provider \"realtime\"; ";
    }

    // STT
    if (stt.provider == "whisper") {
        if (stt.model_path.empty()) errors << "stt.model_path is required; ";
    } else if (stt.provider == "openai") {
        if (stt.endpoint.empty()) errors << "stt.endpoint is required; ";
    } else if (stt.provider == "realtime") {
        if (stt.realtime_url.empty()) errors << "stt.realtime_url is required; ";
    } else {
        errors << "unknown stt.provider \"" << stt.provider << "\"; ";
    }

    // Agent
    if (agent.endpoint.empty()) {
        errors << "agent.endpoint is required; ";
    }

    // TTS
    if (tts.provider == "piper") {
        if (tts.voice_path.empty()) errors << "tts.voice_path is required; ";
    } else if (tts.provider == "openai") {
        if (tts.endpoint.empty()) errors << "tts.endpoint is required; ";
    } else {
        errors << "unknown tts.provider \"" << tts.provider << "\"; ";
    }
    if (tts.frame_ms <= 0) {
        errors << "tts.frame_ms must be positive; ";
    }

    // Session
    if (session.max_parallel_synthesis < 1) {
        errors << "session.max_parallel_synthesis must be at least 1; ";
    }
    if (session.reorder_window < 1) {
        errors << "session.reorder_window must be at least 1; ";
    }
    if (session.max_unit_chars < 16) {
        errors << "session.max_unit_chars must be at least 16; ";
    }

    return errors.str();
}

} // namespace config
} // namespace voice_relay
