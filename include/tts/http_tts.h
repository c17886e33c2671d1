#pragma once

#include "tts_interface.h"
#include "core/config.h"
#include <string>

namespace voice_relay {
namespace tts {

/**
 * @brief OpenAI-compatible `/audio/speech` client
 *
 * Requests `pcm` output (24 kHz mono PCM16) and forwards it as the body
 * streams in.
 */
class HttpTTS : public ISynthesizer {
public:
    explicit HttpTTS(const config::TTSConfig& config);

    VoidResult synthesize(const std::string& text,
                          const FrameCallback& on_frame,
                          const CancelToken& cancel) override;

    int sample_rate() const override { return constants::tts::HTTP_PCM_SAMPLE_RATE; }
    bool is_ready() const override { return !config_.endpoint.empty(); }
    std::string name() const override { return "openai-tts"; }

    std::string build_request(const std::string& text) const;

private:
    config::TTSConfig config_;
};

} // namespace tts
} // namespace voice_relay
