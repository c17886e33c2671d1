#include "providers.h"
#include "llm_client.h"
#include "logger.h"
#include "stt/http_transcriber.h"
#include "stt/realtime_transcriber.h"
#include "stt/whisper_transcriber.h"
#include "tts/http_tts.h"
#include "tts/piper_tts.h"
#include "vad/energy_vad.h"

namespace voice_relay {

namespace {

Result<std::shared_ptr<stt::ITranscriber>> make_transcriber(const std::string& provider, const Config& config) {
    using TranscriberResult = Result<std::shared_ptr<stt::ITranscriber>>;
    std::shared_ptr<stt::ITranscriber> transcriber;

    if (provider == "whisper") {
        transcriber = std::make_shared<stt::WhisperTranscriber>(config.stt);
    } else if (provider == "openai") {
        transcriber = std::make_shared<stt::HttpTranscriber>(config.stt);
    } else if (provider == "realtime") {
        transcriber = std::make_shared<stt::RealtimeTranscriber>(config.stt, config.vad.silence_ms);
    } else {
        return TranscriberResult::failure("Unknown STT provider: " + provider, ErrorType::InvalidState);
    }

    if (!transcriber->is_ready()) {
        return TranscriberResult::failure("STT provider '" + provider + "' is not ready",
                                          ErrorType::ProviderError);
    }
    return TranscriberResult::success(std::move(transcriber));
}

Result<std::shared_ptr<tts::ISynthesizer>> make_synthesizer(const Config& config) {
    using SynthResult = Result<std::shared_ptr<tts::ISynthesizer>>;
    std::shared_ptr<tts::ISynthesizer> synthesizer;

    if (config.tts.provider == "piper") {
        synthesizer = std::make_shared<tts::PiperTTS>(config.tts);
    } else if (config.tts.provider == "openai") {
        synthesizer = std::make_shared<tts::HttpTTS>(config.tts);
    } else {
        return SynthResult::failure("Unknown TTS provider: " + config.tts.provider, ErrorType::InvalidState);
    }

    auto warm = synthesizer->warmup();
    if (warm.failed()) {
        return SynthResult::failure("TTS warmup failed: " + warm.error, warm.kind);
    }
    return SynthResult::success(std::move(synthesizer));
}

} // anonymous namespace

vad::VADFactory make_vad_factory(const config::VADConfig& config) {
    vad::EnergyVADConfig vad_config;
    vad_config.threshold = config.energy_threshold;
    vad_config.adaptive_threshold = config.adaptive_threshold;
    vad_config.debug_log_frames = config.debug_log_frames;
    return [vad_config]() -> std::unique_ptr<vad::IVAD> {
        return std::make_unique<vad::EnergyVAD>(vad_config);
    };
}

Result<Providers> build_providers(const Config& config) {
    Providers providers;

    auto transcriber = make_transcriber(config.stt.provider, config);
    if (transcriber.failed()) {
        return Result<Providers>::failure(transcriber.error, transcriber.kind);
    }
    providers.transcriber = *transcriber.value;
    LOG_STT("Using " + providers.transcriber->name());

    if (providers.transcriber->supports_streaming() && !config.stt.fallback_provider.empty() &&
        config.stt.fallback_provider != config.stt.provider) {
        auto fallback = make_transcriber(config.stt.fallback_provider, config);
        if (fallback.ok()) {
            providers.fallback_transcriber = *fallback.value;
            LOG_STT("Fallback " + providers.fallback_transcriber->name());
        } else {
            LOG_WARN("STT fallback unavailable: " + fallback.error);
        }
    }

    providers.agent = std::make_shared<LLMClient>(config.agent);
    LOG_LLM("Using " + providers.agent->name() + " at " + config.agent.endpoint);

    auto synthesizer = make_synthesizer(config);
    if (synthesizer.failed()) {
        return Result<Providers>::failure(synthesizer.error, synthesizer.kind);
    }
    providers.synthesizer = *synthesizer.value;
    LOG_TTS("Using " + providers.synthesizer->name() + " at " +
            std::to_string(providers.synthesizer->sample_rate()) + " Hz");

    providers.vad_factory = make_vad_factory(config.vad);
    return Result<Providers>::success(std::move(providers));
}

} // namespace voice_relay
