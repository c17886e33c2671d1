#include "turn_detector.h"
#include "logger.h"
#include <algorithm>
#include <sstream>

namespace voice_relay {

// =============================================================================
// LocalTurnDetector
// =============================================================================

class LocalTurnDetector::Impl {
public:
    Impl(const LocalTurnConfig& config, std::unique_ptr<vad::IVAD> model)
        : config_(config)
        , model_(std::move(model))
        , frame_samples_(std::max<size_t>(1, audio::ms_to_samples(config.frame_ms, config.sample_rate)))
        , silence_samples_max_(audio::ms_to_samples(config.silence_ms, config.sample_rate)) {
        pending_.reserve(frame_samples_);

        std::ostringstream oss;
        oss << "Local turn detector: threshold=" << config.threshold
            << ", frame=" << config.frame_ms << "ms"
            << ", start_frames=" << config.start_frames
            << ", silence=" << config.silence_ms << "ms";
        LOG_VAD(oss.str());
    }

    Observation observe(const AudioChunk& chunk) {
        Observation obs;
        size_t pos = 0;
        const auto& samples = chunk.samples;

        while (pos < samples.size()) {
            const size_t take = std::min(frame_samples_ - pending_.size(), samples.size() - pos);
            pending_.insert(pending_.end(), samples.begin() + pos, samples.begin() + pos + take);
            pos += take;
            if (pending_.size() < frame_samples_) break;

            TurnEvent event = process_frame(pending_.data(), pending_.size());
            pending_.clear();

            if (event == TurnEvent::SpeechStarted) {
                obs.event = TurnEvent::SpeechStarted;
            } else if (event == TurnEvent::SpeechStopped) {
                // The turn ends here; the rest of the chunk belongs to no utterance
                obs.event = TurnEvent::SpeechStopped;
                break;
            }
        }

        obs.speech_detected = in_speech_;
        return obs;
    }

    void reset() {
        in_speech_ = false;
        consecutive_voiced_ = 0;
        speech_samples_ = 0;
        silence_samples_ = 0;
        pending_.clear();
    }

    bool in_speech() const { return in_speech_; }

    int64_t speech_ms() const {
        return audio::samples_to_ms(speech_samples_, config_.sample_rate);
    }

    void suppress_for(int ms) {
        guard_samples_ = audio::ms_to_samples(ms, config_.sample_rate);
    }

    vad::Stats model_stats() const { return model_->get_stats(); }

private:
    TurnEvent process_frame(const float* frame, size_t count) {
        bool voiced = false;
        if (guard_samples_ > 0) {
            guard_samples_ -= std::min(guard_samples_, count);
        } else {
            voiced = model_->speech_probability(frame, count) >= config_.threshold;
        }

        if (!in_speech_) {
            if (!voiced) {
                consecutive_voiced_ = 0;
                return TurnEvent::None;
            }
            consecutive_voiced_++;
            if (consecutive_voiced_ < config_.start_frames) {
                return TurnEvent::None;
            }
            in_speech_ = true;
            speech_samples_ += static_cast<size_t>(consecutive_voiced_) * count;
            silence_samples_ = 0;
            consecutive_voiced_ = 0;
            LOG_VAD("speech started");
            return TurnEvent::SpeechStarted;
        }

        if (voiced) {
            speech_samples_ += count;
            silence_samples_ = 0;
            return TurnEvent::None;
        }

        silence_samples_ += count;
        if (silence_samples_ >= silence_samples_max_) {
            in_speech_ = false;
            silence_samples_ = 0;
            LOG_VAD("speech stopped after " + std::to_string(speech_ms()) + "ms voiced");
            return TurnEvent::SpeechStopped;
        }
        return TurnEvent::None;
    }

    LocalTurnConfig config_;
    std::unique_ptr<vad::IVAD> model_;
    size_t frame_samples_;
    size_t silence_samples_max_;

    FloatSamples pending_;
    bool in_speech_ = false;
    int consecutive_voiced_ = 0;
    size_t speech_samples_ = 0;
    size_t silence_samples_ = 0;
    size_t guard_samples_ = 0;
};

LocalTurnDetector::LocalTurnDetector(const LocalTurnConfig& config, std::unique_ptr<vad::IVAD> model)
    : impl_(std::make_unique<Impl>(config, std::move(model))) {}

LocalTurnDetector::~LocalTurnDetector() = default;

Observation LocalTurnDetector::observe(const AudioChunk& chunk) {
    return impl_->observe(chunk);
}

void LocalTurnDetector::reset() {
    impl_->reset();
}

bool LocalTurnDetector::in_speech() const {
    return impl_->in_speech();
}

int64_t LocalTurnDetector::speech_ms() const {
    return impl_->speech_ms();
}

void LocalTurnDetector::suppress_for(int ms) {
    impl_->suppress_for(ms);
}

vad::Stats LocalTurnDetector::model_stats() const {
    return impl_->model_stats();
}

// =============================================================================
// ProviderTurnDetector
// =============================================================================

ProviderTurnDetector::ProviderTurnDetector(std::shared_ptr<stt::IStreamingSession> stream, int sample_rate)
    : stream_(std::move(stream)), sample_rate_(sample_rate) {}

Observation ProviderTurnDetector::observe(const AudioChunk& chunk) {
    Observation obs;
    const bool was_in_speech = in_speech_;

    auto appended = stream_->append(chunk.samples);
    if (appended.failed()) {
        append_failures_++;
        last_error_ = appended.error;
        Logger::warn("[VAD] provider append failed: " + appended.error);
    }

    for (const auto& ev : stream_->drain_events()) {
        switch (ev.type) {
            case stt::StreamEventType::SpeechStarted:
                if (!in_speech_ && obs.event != TurnEvent::SpeechStopped) {
                    in_speech_ = true;
                    obs.event = TurnEvent::SpeechStarted;
                }
                break;
            case stt::StreamEventType::SpeechStopped:
                if (in_speech_ || obs.event == TurnEvent::SpeechStarted) {
                    in_speech_ = false;
                    obs.event = TurnEvent::SpeechStopped;
                }
                break;
            case stt::StreamEventType::Partial:
                if (!ev.text.empty()) obs.partial = ev.text;
                break;
            case stt::StreamEventType::Final:
            case stt::StreamEventType::Closed:
                // Collected by finish()
                break;
        }
    }

    if (was_in_speech || obs.event != TurnEvent::None) {
        speech_samples_ += chunk.samples.size();
    }

    obs.speech_detected = in_speech_;
    return obs;
}

void ProviderTurnDetector::reset() {
    in_speech_ = false;
    speech_samples_ = 0;
}

int64_t ProviderTurnDetector::speech_ms() const {
    return audio::samples_to_ms(speech_samples_, sample_rate_);
}

} // namespace voice_relay
