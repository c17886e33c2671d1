#pragma once

/**
 * @file energy_vad.h
 * @brief Energy-based speech probability with an adaptive noise floor
 *
 * Probability is RMS relative to the effective threshold: a frame exactly
 * at the threshold scores 0.5, twice the threshold or more scores 1.
 */

#include "vad_interface.h"
#include "core/constants.h"
#include <memory>

namespace voice_relay {
namespace vad {

/**
 * @brief Configuration for energy-based VAD
 */
struct EnergyVADConfig {
    /// RMS threshold (used if adaptive disabled, or as upper clamp)
    float threshold = constants::vad::DEFAULT_ENERGY_THRESHOLD;

    /// Track the noise floor and scale the threshold from it
    bool adaptive_threshold = true;

    /// Log every frame
    bool debug_log_frames = false;
};

class EnergyVAD : public IVAD {
public:
    explicit EnergyVAD(const EnergyVADConfig& config = {});
    ~EnergyVAD() override;

    float speech_probability(const float* frame, size_t count) override;
    void reset() override;
    Stats get_stats() const override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vad
} // namespace voice_relay
