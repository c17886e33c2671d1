/**
 * @file energy_vad.cpp
 * @brief Energy-based VAD implementation
 */

#include "vad/energy_vad.h"
#include "audio/pcm.h"
#include "logger.h"
#include <algorithm>
#include <sstream>

namespace voice_relay {
namespace vad {

class EnergyVAD::Impl {
public:
    explicit Impl(const EnergyVADConfig& config)
        : config_(config)
        , noise_floor_(config.threshold) {
        std::ostringstream oss;
        oss << "EnergyVAD initialized: threshold=" << config.threshold
            << ", adaptive=" << (config.adaptive_threshold ? "on" : "off");
        LOG_VAD(oss.str());
    }

    float speech_probability(const float* frame, size_t count) {
        current_rms_ = pcm::rms(frame, count);
        frames_++;

        const float threshold = get_effective_threshold();
        float probability = std::clamp(current_rms_ / (2.0f * threshold), 0.0f, 1.0f);

        // Voiced frames must not drag the floor upward
        if (config_.adaptive_threshold && probability < 0.5f) {
            update_noise_floor(current_rms_);
        }

        if (config_.debug_log_frames) {
            std::ostringstream oss;
            oss << "rms=" << current_rms_ << " thr=" << threshold
                << " noise=" << noise_floor_ << " p=" << probability;
            LOG_VAD(oss.str());
        }

        last_probability_ = probability;
        return probability;
    }

    void reset() {
        noise_floor_ = config_.threshold;
        current_rms_ = 0.0f;
        last_probability_ = 0.0f;
    }

    Stats get_stats() const {
        Stats stats;
        stats.current_rms = current_rms_;
        stats.noise_floor = noise_floor_;
        stats.threshold = get_effective_threshold();
        stats.last_probability = last_probability_;
        stats.frames = frames_;
        return stats;
    }

private:
    void update_noise_floor(float rms) {
        constexpr float NOISE_FLOOR_ALPHA = 0.01f;  // Slow adaptation

        // Only update if this looks like noise (not much higher than current floor)
        if (rms < noise_floor_ * 2.0f) {
            noise_floor_ = noise_floor_ * (1.0f - NOISE_FLOOR_ALPHA) + rms * NOISE_FLOOR_ALPHA;
            noise_floor_ = std::clamp(
                noise_floor_,
                constants::vad::MIN_ADAPTIVE_THRESHOLD / constants::vad::ADAPTIVE_THRESHOLD_MULTIPLIER,
                constants::vad::MAX_ADAPTIVE_THRESHOLD / constants::vad::ADAPTIVE_THRESHOLD_MULTIPLIER);
        }
    }

    float get_effective_threshold() const {
        if (!config_.adaptive_threshold) {
            return std::max(config_.threshold, 1e-6f);
        }

        float adaptive = noise_floor_ * constants::vad::ADAPTIVE_THRESHOLD_MULTIPLIER;
        return std::clamp(
            adaptive,
            constants::vad::MIN_ADAPTIVE_THRESHOLD,
            std::max(config_.threshold, constants::vad::MAX_ADAPTIVE_THRESHOLD));
    }

    EnergyVADConfig config_;
    float noise_floor_;
    float current_rms_ = 0.0f;
    float last_probability_ = 0.0f;
    uint64_t frames_ = 0;
};

// =============================================================================
// Public Interface Implementation
// =============================================================================

EnergyVAD::EnergyVAD(const EnergyVADConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

EnergyVAD::~EnergyVAD() = default;

float EnergyVAD::speech_probability(const float* frame, size_t count) {
    return impl_->speech_probability(frame, count);
}

void EnergyVAD::reset() {
    impl_->reset();
}

Stats EnergyVAD::get_stats() const {
    return impl_->get_stats();
}

} // namespace vad
} // namespace voice_relay
