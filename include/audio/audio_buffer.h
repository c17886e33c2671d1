#pragma once

/**
 * @file audio_buffer.h
 * @brief Per-turn accumulation of inbound audio chunks
 */

#include "core/types.h"
#include <deque>

namespace voice_relay {

/**
 * @brief One inbound `audio` message: mono float32 samples
 */
struct AudioChunk {
    FloatSamples samples;
    uint64_t sequence = 0;
    TimePoint arrival = Clock::now();
};

/**
 * @brief Contiguous audio submitted for transcription
 */
struct Utterance {
    FloatSamples samples;
    int sample_rate = audio::INPUT_SAMPLE_RATE;
    float mean_level = 0.0f;  ///< mean |x|

    bool empty() const { return samples.empty(); }
    int64_t duration_ms() const { return audio::samples_to_ms(samples.size(), sample_rate); }
};

/**
 * @brief Ordered chunk store with a hard duration cap
 *
 * Overflow policy: the incoming chunk is dropped and counted; audio already
 * buffered is kept, so the utterance stays a prefix of what was spoken.
 */
class AudioBuffer {
public:
    explicit AudioBuffer(int max_duration_ms, int sample_rate = audio::INPUT_SAMPLE_RATE);

    /**
     * @brief Store a chunk in arrival order
     * @return false if the chunk was dropped for exceeding the cap
     */
    bool append(AudioChunk chunk);

    /**
     * @brief Concatenate and clear everything buffered
     */
    Utterance drain();

    /**
     * @brief Discard buffered audio without transcription
     *
     * Also clears the dropped-chunk counter.
     */
    void reset();

    /**
     * @brief Drop whole chunks from the front, keeping at least `ms` of the
     * most recent audio
     */
    void trim_to_recent(int ms);

    int64_t duration_ms() const;
    size_t sample_count() const { return total_samples_; }
    size_t chunk_count() const { return chunks_.size(); }
    bool empty() const { return chunks_.empty(); }

    /// Mean |x| over everything buffered
    float mean_level() const;

    /// Chunks refused since the last reset()
    size_t dropped_chunks() const { return dropped_chunks_; }

private:
    struct StoredChunk {
        AudioChunk chunk;
        double abs_sum = 0.0;
    };

    std::deque<StoredChunk> chunks_;
    size_t max_samples_;
    int sample_rate_;
    size_t total_samples_ = 0;
    double total_abs_ = 0.0;
    size_t dropped_chunks_ = 0;
};

} // namespace voice_relay
