#pragma once

/**
 * @file realtime_transcriber.h
 * @brief Realtime WebSocket ASR with server-side voice activity detection
 *
 * Each utterance gets its own connection. The provider reports
 * speech_started / speech_stopped, partial and final transcripts while
 * audio is appended as base64 PCM16.
 */

#include "core/config.h"
#include "stt/transcriber_interface.h"
#include <memory>
#include <string>

namespace voice_relay {
namespace stt {

/**
 * @brief Map one provider message to a stream event
 * @return nullopt for messages the session does not act on
 */
std::optional<StreamEvent> parse_realtime_event(const std::string& message);

/// session.update payload enabling server VAD transcription
std::string build_session_update(const config::STTConfig& config, int silence_ms);

/// input_audio_buffer.append payload for float samples
std::string build_append_message(const FloatSamples& samples);

class RealtimeTranscriber : public ITranscriber {
public:
    /**
     * @param silence_ms Server VAD silence that ends an utterance
     */
    RealtimeTranscriber(const config::STTConfig& config, int silence_ms);

    /**
     * @brief Stream the whole utterance through one session and commit it
     */
    Result<Transcript> transcribe(const FloatSamples& samples,
                                  const CancelToken& cancel,
                                  const PartialCallback& on_partial = nullptr) override;

    bool supports_streaming() const override { return true; }

    Result<std::shared_ptr<IStreamingSession>> open_stream() override;

    bool is_ready() const override { return !config_.realtime_api_key.empty(); }
    std::string name() const override { return "realtime"; }

private:
    config::STTConfig config_;
    int silence_ms_;
};

} // namespace stt
} // namespace voice_relay
