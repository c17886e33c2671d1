#pragma once

/**
 * @file tts_interface.h
 * @brief Text-to-Speech interface
 *
 * Defines the abstract interface for synthesis backends (Piper, cloud
 * speech endpoints). A backend streams PCM16 as it is produced.
 */

#include "core/types.h"
#include "core/cancel_token.h"
#include <functional>
#include <string>

namespace voice_relay {
namespace tts {

/// Receives mono PCM16 at sample_rate(); called on the synthesizing thread
using FrameCallback = std::function<void(Pcm16Buffer&& pcm)>;

/**
 * @brief Abstract TTS interface
 *
 * synthesize() may be called from several threads at once; implementations
 * must be safe for concurrent calls.
 */
class ISynthesizer {
public:
    virtual ~ISynthesizer() = default;

    /**
     * @brief Synthesize one text unit
     * @param text Sanitized, non-empty text
     * @param on_frame Receives audio in order; never called after return
     * @param cancel Aborts synthesis when set
     * @return ok once all audio was delivered
     */
    virtual VoidResult synthesize(const std::string& text,
                                  const FrameCallback& on_frame,
                                  const CancelToken& cancel) = 0;

    /// Rate of the PCM passed to on_frame
    virtual int sample_rate() const = 0;

    virtual bool is_ready() const = 0;

    virtual std::string name() const = 0;

    /**
     * @brief Warm up the engine (locate binaries, check models)
     */
    virtual VoidResult warmup() { return VoidResult::ok_result(); }
};

} // namespace tts
} // namespace voice_relay
