#pragma once

/**
 * @file turn_detector.h
 * @brief Utterance boundary detection
 *
 * Two strategies behind one interface. A session uses exactly one of them
 * per turn: local frame scoring, or speech events reported by a streaming
 * STT provider.
 */

#include "audio/audio_buffer.h"
#include "core/constants.h"
#include "stt/transcriber_interface.h"
#include "vad/vad_interface.h"
#include <memory>
#include <optional>
#include <string>

namespace voice_relay {

enum class TurnEvent {
    None,
    SpeechStarted,
    SpeechStopped
};

inline const char* turn_event_to_string(TurnEvent event) {
    switch (event) {
        case TurnEvent::None: return "none";
        case TurnEvent::SpeechStarted: return "speech_started";
        case TurnEvent::SpeechStopped: return "speech_stopped";
    }
    return "none";
}

/**
 * @brief Outcome of observing one chunk
 */
struct Observation {
    TurnEvent event = TurnEvent::None;
    bool speech_detected = false;
    std::optional<std::string> partial;  ///< provider partial transcript, if any
};

class ITurnDetector {
public:
    virtual ~ITurnDetector() = default;

    virtual Observation observe(const AudioChunk& chunk) = 0;

    /// Start a fresh utterance; adaptation state is kept
    virtual void reset() = 0;

    virtual bool in_speech() const = 0;

    /// Voiced duration attributed to the current utterance
    virtual int64_t speech_ms() const = 0;

    /// True when boundaries come from the STT provider
    virtual bool provider_driven() const = 0;
};

// =============================================================================
// Local VAD strategy
// =============================================================================

struct LocalTurnConfig {
    float threshold = constants::vad::DEFAULT_PROBABILITY_THRESHOLD;
    int frame_ms = audio::FRAME_DURATION_MS;
    int start_frames = constants::vad::DEBOUNCE_FRAMES;
    int silence_ms = constants::vad::SILENCE_MS;
    int sample_rate = audio::INPUT_SAMPLE_RATE;
};

/**
 * @brief Frame-scored detection with start debounce and silence hangover
 *
 * speech_started fires after `start_frames` consecutive voiced frames;
 * speech_stopped fires once `silence_ms` of consecutive unvoiced frames
 * follow speech. Chunk boundaries need not align with frames.
 */
class LocalTurnDetector : public ITurnDetector {
public:
    LocalTurnDetector(const LocalTurnConfig& config, std::unique_ptr<vad::IVAD> model);
    ~LocalTurnDetector() override;

    Observation observe(const AudioChunk& chunk) override;
    void reset() override;
    bool in_speech() const override;
    int64_t speech_ms() const override;
    bool provider_driven() const override { return false; }

    /**
     * @brief Treat the next `ms` of audio as silence (playback echo guard)
     */
    void suppress_for(int ms);

    vad::Stats model_stats() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// =============================================================================
// Provider VAD strategy
// =============================================================================

/**
 * @brief Forwards audio to a streaming STT session and relays its events
 *
 * When one drain yields both a start and a stop, the stop wins: the turn
 * ends on this chunk.
 */
class ProviderTurnDetector : public ITurnDetector {
public:
    explicit ProviderTurnDetector(std::shared_ptr<stt::IStreamingSession> stream,
                                  int sample_rate = audio::INPUT_SAMPLE_RATE);

    Observation observe(const AudioChunk& chunk) override;
    void reset() override;
    bool in_speech() const override { return in_speech_; }
    int64_t speech_ms() const override;
    bool provider_driven() const override { return true; }

    /// Append failures since construction
    size_t append_failures() const { return append_failures_; }
    const std::string& last_error() const { return last_error_; }

private:
    std::shared_ptr<stt::IStreamingSession> stream_;
    int sample_rate_;
    bool in_speech_ = false;
    size_t speech_samples_ = 0;
    size_t append_failures_ = 0;
    std::string last_error_;
};

} // namespace voice_relay
