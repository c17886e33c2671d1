/**
 * Configuration parsing, environment overrides, gateway resolution and
 * validation.
 *
 * Run from build dir: ./test_config
 */

#include "core/config.h"
#include <iostream>
#include <map>
#include <string>

using namespace voice_relay;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static config::EnvLookup env_from(const std::map<std::string, std::string>& vars) {
    return [vars](const char* name) -> const char* {
        auto it = vars.find(name);
        return it == vars.end() ? nullptr : it->second.c_str();
    };
}

static Config valid_local_config() {
    Config config = Config::defaults();
    config.stt.model_path = "/models/ggml-base.en.bin";
    config.tts.voice_path = "/voices/en_US-amy.onnx";
    return config;
}

int main() {
    // --- Defaults ---
    {
        Config config = Config::defaults();
        ASSERT(config.vad.mode == "local");
        ASSERT(config.stt.provider == "whisper");
        ASSERT(!config.session.continuous);
        ASSERT(config.audio.input_sample_rate == 16000);
        // whisper and piper need model files
        ASSERT(!config.validate().empty());
        ASSERT(valid_local_config().validate().empty());
    }

    // --- Parse ---
    {
        auto r = Config::parse(R"({
            "vad": {"mode": "provider", "silence_ms": 900, "min_speech_ms": 300},
            "stt": {"provider": "realtime", "fallback_provider": ""},
            "agent": {"endpoint": "http://agent:9000/v1/chat/completions", "max_history_messages": 8},
            "tts": {"provider": "openai", "voice": "nova"},
            "session": {"continuous": true, "max_parallel_synthesis": 3},
            "log": {"level": "debug"}
        })");
        ASSERT(r.ok());
        if (r.ok()) {
            const Config& c = *r.value;
            ASSERT(c.vad.mode == "provider");
            ASSERT(c.vad.silence_ms == 900);
            ASSERT(c.vad.min_speech_ms == 300);
            ASSERT(c.stt.provider == "realtime");
            ASSERT(c.stt.fallback_provider.empty());
            ASSERT(c.agent.endpoint == "http://agent:9000/v1/chat/completions");
            ASSERT(c.agent.max_history_messages == 8);
            ASSERT(c.tts.voice == "nova");
            ASSERT(c.session.continuous);
            ASSERT(c.session.max_parallel_synthesis == 3);
            ASSERT(c.log.level == "debug");
            // untouched sections keep their defaults
            ASSERT(c.audio.output_sample_rate == Config::defaults().audio.output_sample_rate);
            ASSERT(c.validate().empty());
        }
    }

    // --- Parse errors ---
    {
        auto r = Config::parse("{not json");
        ASSERT(r.failed());
        ASSERT(r.kind == ErrorType::ParseError);

        r = Config::parse("[1, 2]");
        ASSERT(r.failed());

        r = Config::parse(R"({"vad": {"silence_ms": "long"}})");
        ASSERT(r.failed());
        ASSERT(r.kind == ErrorType::ParseError);

        auto missing = Config::load("/nonexistent/voice_relay.json");
        ASSERT(missing.failed());
        ASSERT(missing.kind == ErrorType::IOError);
    }

    // --- Environment overrides ---
    {
        Config config = valid_local_config();
        config.tts.api_key = "tts-specific";
        config.apply_env_overrides(env_from({
            {"VOICE_RELAY_STT_PROVIDER", "openai"},
            {"VOICE_RELAY_CONTINUOUS", "yes"},
            {"VOICE_RELAY_LOG_LEVEL", "warn"},
            {"OPENAI_API_KEY", "sk-shared"},
            {"DASHSCOPE_API_KEY", "ds-key"},
            {"VOICE_RELAY_AGENT_MODEL", ""},
        }));
        ASSERT(config.stt.provider == "openai");
        ASSERT(config.session.continuous);
        ASSERT(config.log.level == "warn");
        ASSERT(config.agent.api_key == "sk-shared");
        ASSERT(config.stt.api_key == "sk-shared");
        ASSERT(config.tts.api_key == "tts-specific");
        ASSERT(config.stt.realtime_api_key == "ds-key");
        ASSERT(config.agent.model == Config::defaults().agent.model);  // empty value ignored

        config.apply_env_overrides(env_from({{"VOICE_RELAY_CONTINUOUS", "0"}}));
        ASSERT(!config.session.continuous);
    }

    // --- Gateway rewrites the agent endpoint ---
    {
        Config config = valid_local_config();
        config.apply_env_overrides(env_from({
            {"VOICE_RELAY_GATEWAY_URL", "http://gateway:18789/"},
            {"VOICE_RELAY_GATEWAY_TOKEN", "gw-token"},
        }));
        ASSERT(config.agent.endpoint == "http://gateway:18789/v1/chat/completions");
        ASSERT(config.agent.api_key == "gw-token");

        Config url_only = valid_local_config();
        const std::string before = url_only.agent.endpoint;
        url_only.apply_env_overrides(env_from({{"VOICE_RELAY_GATEWAY_URL", "http://gateway:18789/v1"}}));
        ASSERT(url_only.agent.endpoint == before);

        auto parsed = Config::parse(R"({"agent": {"gateway_url": "http://gw/v1", "gateway_token": "t"}})");
        ASSERT(parsed.ok());
        if (parsed.ok()) ASSERT(parsed.value->agent.endpoint == "http://gw/v1/chat/completions");
    }

    // --- Validation ---
    {
        Config c = valid_local_config();
        c.vad.mode = "both";
        ASSERT(c.validate().find("vad.mode") != std::string::npos);

        c = valid_local_config();
        c.vad.mode = "provider";  // needs a streaming provider
        ASSERT(!c.validate().empty());
        c.stt.provider = "realtime";
        ASSERT(c.validate().empty());

        c = valid_local_config();
        c.stt.provider = "vosk";
        ASSERT(c.validate().find("stt.provider") != std::string::npos);

        c = valid_local_config();
        c.tts.voice_path.clear();
        ASSERT(c.validate().find("tts.voice_path") != std::string::npos);

        c = valid_local_config();
        c.session.max_unit_chars = 8;
        ASSERT(c.validate().find("max_unit_chars") != std::string::npos);

        c = valid_local_config();
        c.session.reorder_window = 0;
        ASSERT(!c.validate().empty());

        c = valid_local_config();
        c.vad.silence_ms = 10;  // shorter than a frame
        ASSERT(!c.validate().empty());
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All config tests passed.\n";
    return 0;
}
