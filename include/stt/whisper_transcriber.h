#pragma once

#include "core/config.h"
#include "stt/transcriber_interface.h"
#include <memory>
#include <string>

namespace voice_relay {
namespace stt {

/**
 * @brief Local whisper.cpp transcription
 *
 * One model context shared by all sessions; calls are serialized. A set
 * cancel token aborts decoding through whisper's abort callback.
 */
class WhisperTranscriber : public ITranscriber {
public:
    explicit WhisperTranscriber(const config::STTConfig& config);
    ~WhisperTranscriber() override;

    // Non-copyable
    WhisperTranscriber(const WhisperTranscriber&) = delete;
    WhisperTranscriber& operator=(const WhisperTranscriber&) = delete;

    Result<Transcript> transcribe(const FloatSamples& samples,
                                  const CancelToken& cancel,
                                  const PartialCallback& on_partial = nullptr) override;

    bool is_ready() const override;
    std::string name() const override { return "whisper"; }

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace stt
} // namespace voice_relay
