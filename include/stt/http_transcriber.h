#pragma once

#include "core/config.h"
#include "stt/transcriber_interface.h"
#include <string>

namespace voice_relay {
namespace stt {

/**
 * @brief OpenAI-compatible `/audio/transcriptions` client
 *
 * Uploads the utterance as a 16-bit WAV file and reads `text` from the
 * JSON response.
 */
class HttpTranscriber : public ITranscriber {
public:
    explicit HttpTranscriber(const config::STTConfig& config);

    Result<Transcript> transcribe(const FloatSamples& samples,
                                  const CancelToken& cancel,
                                  const PartialCallback& on_partial = nullptr) override;

    bool is_ready() const override { return !config_.endpoint.empty(); }
    std::string name() const override { return "openai-stt"; }

    /// Transcript text of a response body
    static Result<std::string> parse_response(const std::string& body);

private:
    config::STTConfig config_;
};

} // namespace stt
} // namespace voice_relay
