#include "tts/http_tts.h"
#include "audio/pcm.h"
#include "http_client.h"
#include "logger.h"
#include <nlohmann/json.hpp>
#include <vector>

using json = nlohmann::json;

namespace voice_relay {
namespace tts {

HttpTTS::HttpTTS(const config::TTSConfig& config) : config_(config) {
    http::global_init();
    LOG_TTS("HTTP speech endpoint: " + config_.endpoint + ", model=" + config_.model + ", voice=" + config_.voice);
}

std::string HttpTTS::build_request(const std::string& text) const {
    json request;
    request["model"] = config_.model;
    request["voice"] = config_.voice;
    request["input"] = text;
    request["response_format"] = "pcm";
    return request.dump();
}

VoidResult HttpTTS::synthesize(const std::string& text, const FrameCallback& on_frame, const CancelToken& cancel) {
    auto start = Clock::now();

    http::Request request;
    request.url = config_.endpoint;
    request.headers = {"Content-Type: application/json", http::bearer_header(config_.api_key)};
    request.body = build_request(text);
    request.timeout_ms = config_.timeout_ms;

    std::vector<uint8_t> carry;
    size_t total_samples = 0;

    auto response = http::perform(request, cancel, [&](const char* data, size_t len) {
        carry.insert(carry.end(), data, data + len);
        const size_t usable = carry.size() & ~static_cast<size_t>(1);
        if (usable == 0) return true;

        Pcm16Buffer pcm = pcm::pcm16_from_le_bytes(carry.data(), usable);
        carry.erase(carry.begin(), carry.begin() + static_cast<std::ptrdiff_t>(usable));
        total_samples += pcm.size();
        if (on_frame) on_frame(std::move(pcm));
        return true;
    });

    if (response.failed()) {
        return VoidResult::failure(response.error, response.kind);
    }
    if (total_samples == 0) {
        return VoidResult::failure("Speech endpoint returned no audio", ErrorType::ProviderError);
    }

    LOG_TTS("Synthesized \"" + text + "\" (" + std::to_string(total_samples) + " samples) in " +
            std::to_string(ms_since(start)) + "ms");
    return VoidResult::ok_result();
}

} // namespace tts
} // namespace voice_relay
