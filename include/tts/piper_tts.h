#pragma once

/**
 * @file piper_tts.h
 * @brief Piper TTS implementation
 *
 * Features:
 * - Path caching (find piper once)
 * - Raw PCM streamed from the child process as it is produced
 * - Child killed when the turn is canceled
 * - Configurable output gain
 */

#include "tts_interface.h"
#include "core/config.h"
#include <string>
#include <memory>

namespace voice_relay {
namespace tts {

/**
 * @brief Sample rate declared in a Piper voice's .onnx.json
 * @return The rate, or PIPER_DEFAULT_SAMPLE_RATE when unreadable
 */
int read_voice_sample_rate(const std::string& voice_path);

/**
 * @brief Piper TTS implementation
 */
class PiperTTS : public ISynthesizer {
public:
    explicit PiperTTS(const config::TTSConfig& config);
    ~PiperTTS() override;

    // Non-copyable
    PiperTTS(const PiperTTS&) = delete;
    PiperTTS& operator=(const PiperTTS&) = delete;

    VoidResult synthesize(const std::string& text,
                          const FrameCallback& on_frame,
                          const CancelToken& cancel) override;
    int sample_rate() const override;
    bool is_ready() const override;
    std::string name() const override { return "piper"; }
    VoidResult warmup() override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tts
} // namespace voice_relay
