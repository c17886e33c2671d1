#include "stt/http_transcriber.h"
#include "audio/pcm.h"
#include "http_client.h"
#include "logger.h"
#include "utils.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace voice_relay {
namespace stt {

HttpTranscriber::HttpTranscriber(const config::STTConfig& config) : config_(config) {
    http::global_init();
    LOG_STT("HTTP transcription endpoint: " + config_.endpoint + ", model=" + config_.model);
}

Result<Transcript> HttpTranscriber::transcribe(const FloatSamples& samples,
                                               const CancelToken& cancel,
                                               const PartialCallback&) {
    if (samples.empty()) {
        return Result<Transcript>::success(Transcript{});
    }

    auto start = Clock::now();
    auto wav = pcm::encode_wav(pcm::float_to_pcm16(samples), audio::INPUT_SAMPLE_RATE);

    http::Request request;
    request.url = config_.endpoint;
    request.headers = {http::bearer_header(config_.api_key)};
    request.timeout_ms = config_.timeout_ms;
    request.form.push_back({"file", std::string(wav.begin(), wav.end()), "audio.wav", "audio/wav"});
    request.form.push_back({"model", config_.model, "", ""});
    request.form.push_back({"response_format", "json", "", ""});
    if (!config_.language.empty()) {
        request.form.push_back({"language", config_.language, "", ""});
    }

    auto response = http::perform(request, cancel);
    if (response.failed()) {
        return Result<Transcript>::failure(response.error, response.kind);
    }

    auto text = parse_response(response.value->body);
    if (text.failed()) {
        return Result<Transcript>::failure(text.error, text.kind);
    }

    Transcript result;
    result.text = *text.value;
    if (utils::is_blank_transcript(result.text, config_.blank_sentinel)) {
        result.text.clear();
    }
    result.confidence = 1.0f;
    result.processing_ms = ms_since(start);
    result.audio_duration_ms = audio::samples_to_ms(samples.size());

    LOG_STT("HTTP transcript in " + std::to_string(result.processing_ms) + "ms: \"" + result.text + "\"");
    return Result<Transcript>::success(result);
}

Result<std::string> HttpTranscriber::parse_response(const std::string& body) {
    try {
        json response = json::parse(body);
        if (!response.contains("text") || !response["text"].is_string()) {
            return Result<std::string>::failure("No text in transcription response", ErrorType::ProviderError);
        }
        return Result<std::string>::success(utils::trim_copy(response["text"].get<std::string>()));
    } catch (const json::exception& e) {
        return Result<std::string>::failure("JSON parse error: " + std::string(e.what()),
                                            ErrorType::ProviderError);
    }
}

} // namespace stt
} // namespace voice_relay
