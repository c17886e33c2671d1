#pragma once

/**
 * @file vad_interface.h
 * @brief Frame-level speech probability model
 *
 * Defines the abstract interface for local VAD models. Turn boundaries
 * (debounce, hangover) are decided by the turn detector on top of the
 * per-frame scores, so models stay stateless apart from noise tracking.
 */

#include "core/types.h"
#include <memory>

namespace voice_relay {
namespace vad {

/**
 * @brief VAD statistics for debugging
 */
struct Stats {
    float current_rms = 0.0f;
    float noise_floor = 0.0f;
    float threshold = 0.0f;
    float last_probability = 0.0f;
    uint64_t frames = 0;
};

/**
 * @brief Abstract VAD interface
 */
class IVAD {
public:
    virtual ~IVAD() = default;

    /**
     * @brief Score one frame
     * @param frame Mono float samples
     * @param count Number of samples in the frame
     * @return Speech probability in [0, 1]
     */
    virtual float speech_probability(const float* frame, size_t count) = 0;

    /**
     * @brief Forget adaptation state
     */
    virtual void reset() = 0;

    virtual Stats get_stats() const = 0;
};

using VADFactory = std::function<std::unique_ptr<IVAD>()>;

} // namespace vad
} // namespace voice_relay
