#pragma once

/**
 * @file transcriber_interface.h
 * @brief Speech-to-text capability
 *
 * Batch providers implement transcribe(). Providers with their own endpoint
 * detection also hand out streaming sessions that report speech boundaries
 * as the audio is appended.
 */

#include "core/types.h"
#include "core/cancel_token.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace voice_relay {
namespace stt {

/// Receives non-final transcripts while a call is in progress
using PartialCallback = std::function<void(const std::string& text)>;

enum class StreamEventType {
    SpeechStarted,
    SpeechStopped,
    Partial,
    Final,
    Closed
};

struct StreamEvent {
    StreamEventType type;
    std::string text;
};

/**
 * @brief One utterance's worth of streamed recognition
 *
 * append() and drain_events() are called from the session thread; finish()
 * is called once, from the transcription task, after the last append().
 */
class IStreamingSession {
public:
    virtual ~IStreamingSession() = default;

    /// Forward mono 16 kHz audio
    virtual VoidResult append(const FloatSamples& samples) = 0;

    /// Events received since the previous call, in arrival order
    virtual std::vector<StreamEvent> drain_events() = 0;

    /**
     * @brief Close the input side and wait for the final transcript
     * @return Final text, the last partial if no final arrived in time, or
     *         an empty transcript
     */
    virtual Result<Transcript> finish(int timeout_ms, const CancelToken& cancel) = 0;

    /// Abort without waiting for results
    virtual void cancel() = 0;

    /// Whether the provider ever reported speech
    virtual bool saw_speech() const = 0;
};

class ITranscriber {
public:
    virtual ~ITranscriber() = default;

    /**
     * @brief Transcribe one utterance
     * @param samples Mono float samples at 16 kHz
     * @param cancel Aborts the call when set
     * @param on_partial Optional sink for incremental results
     */
    virtual Result<Transcript> transcribe(const FloatSamples& samples,
                                          const CancelToken& cancel,
                                          const PartialCallback& on_partial = nullptr) = 0;

    /// Whether open_stream() is available
    virtual bool supports_streaming() const { return false; }

    /**
     * @brief Open a streaming session with provider-side endpointing
     */
    virtual Result<std::shared_ptr<IStreamingSession>> open_stream() {
        return Result<std::shared_ptr<IStreamingSession>>::failure(
            "streaming not supported", ErrorType::InvalidState);
    }

    virtual bool is_ready() const = 0;

    virtual std::string name() const = 0;
};

} // namespace stt
} // namespace voice_relay
