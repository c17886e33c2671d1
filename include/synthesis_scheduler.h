#pragma once

/**
 * @file synthesis_scheduler.h
 * @brief Concurrent unit synthesis with in-order frame release
 *
 * Units are synthesized by a small worker pool, lowest sequence first.
 * Frames of the unit currently being delivered (the head) stream straight
 * to the sink; frames of later units wait in a reorder buffer until every
 * earlier unit has completed. Submission blocks while a unit would be more
 * than `reorder_window` units ahead of the head.
 *
 * If unit N fails, units before N still finish delivering, N and everything
 * after it are discarded, and no new unit is requested.
 */

#include "core/types.h"
#include "core/cancel_token.h"
#include "core/constants.h"
#include "tts/tts_interface.h"
#include <functional>
#include <memory>
#include <string>

namespace voice_relay {

/**
 * @brief One outbound audio frame, tagged with its response unit
 */
struct OutboundFrame {
    uint64_t unit_seq = 0;
    Pcm16Buffer pcm;
    int sample_rate = 0;
};

/// Called with the scheduler's lock held; must not call back into it
using FrameSink = std::function<void(OutboundFrame&& frame)>;

struct SchedulerConfig {
    size_t max_parallel = constants::session::MAX_PARALLEL_SYNTHESIS;
    size_t reorder_window = constants::session::REORDER_WINDOW;
    int output_sample_rate = constants::audio::OUTPUT_SAMPLE_RATE;  ///< <= 0 keeps the synthesizer rate
    int frame_ms = constants::tts::FRAME_MS;
};

class SynthesisScheduler {
public:
    SynthesisScheduler(std::shared_ptr<tts::ISynthesizer> synthesizer,
                       const SchedulerConfig& config,
                       CancelTokenPtr cancel,
                       FrameSink sink);
    ~SynthesisScheduler();

    SynthesisScheduler(const SynthesisScheduler&) = delete;
    SynthesisScheduler& operator=(const SynthesisScheduler&) = delete;

    /**
     * @brief Queue a unit; sequences must be consecutive from 0
     *
     * Empty text completes the unit without calling the synthesizer.
     * @return false once a unit has failed or the turn was canceled
     */
    bool submit(uint64_t sequence, std::string text);

    /**
     * @brief Declare the last unit submitted and wait for delivery
     * @return ok when every unit's frames reached the sink; otherwise the
     *         first failure, after the units before it were delivered
     */
    VoidResult finish();

    /// Stop requesting and releasing; wakes finish() and submit()
    void cancel();

    /// Synthesizer calls made so far
    size_t units_started() const;

    /// Frames handed to the sink so far
    size_t frames_released() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace voice_relay
