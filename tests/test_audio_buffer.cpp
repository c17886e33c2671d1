/**
 * AudioBuffer: ordering, overflow policy, pre-speech trimming, level.
 *
 * Run from build dir: ./test_audio_buffer
 */

#include "audio/audio_buffer.h"
#include "audio/pcm.h"
#include <cmath>
#include <iostream>

using namespace voice_relay;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static AudioChunk chunk_of(size_t samples, float value, uint64_t seq) {
    AudioChunk chunk;
    chunk.samples.assign(samples, value);
    chunk.sequence = seq;
    return chunk;
}

int main() {
    // --- Arrival order is kept ---
    {
        AudioBuffer buffer(1000);
        ASSERT(buffer.empty());
        ASSERT(buffer.append(chunk_of(1600, 0.1f, 0)));
        ASSERT(buffer.append(chunk_of(1600, 0.2f, 1)));
        ASSERT(buffer.append(chunk_of(1600, 0.3f, 2)));
        ASSERT(buffer.chunk_count() == 3);
        ASSERT(buffer.duration_ms() == 300);

        Utterance u = buffer.drain();
        ASSERT(u.samples.size() == 4800);
        ASSERT(u.samples[0] == 0.1f);
        ASSERT(u.samples[1600] == 0.2f);
        ASSERT(u.samples[4799] == 0.3f);
        ASSERT(u.duration_ms() == 300);
        ASSERT(std::fabs(u.mean_level - 0.2f) < 1e-4f);
        ASSERT(buffer.empty());
        ASSERT(buffer.duration_ms() == 0);
    }

    // --- Overflow drops the newest chunk and keeps the prefix ---
    {
        AudioBuffer buffer(250);
        ASSERT(buffer.append(chunk_of(1600, 0.1f, 0)));
        ASSERT(buffer.append(chunk_of(1600, 0.1f, 1)));
        ASSERT(!buffer.append(chunk_of(1600, 0.9f, 2)));
        ASSERT(!buffer.append(chunk_of(1600, 0.9f, 3)));
        ASSERT(buffer.dropped_chunks() == 2);
        ASSERT(buffer.duration_ms() == 200);
        // A smaller chunk still fits
        ASSERT(buffer.append(chunk_of(800, 0.1f, 4)));
        ASSERT(buffer.duration_ms() == 250);

        Utterance u = buffer.drain();
        for (float s : u.samples) ASSERT(s == 0.1f);

        buffer.reset();
        ASSERT(buffer.dropped_chunks() == 0);
    }

    // --- trim_to_recent keeps at least the requested tail ---
    {
        AudioBuffer buffer(30000);
        for (uint64_t i = 0; i < 10; i++) buffer.append(chunk_of(1600, 0.0f, i));
        buffer.append(chunk_of(1600, 0.5f, 10));
        buffer.trim_to_recent(300);
        ASSERT(buffer.duration_ms() == 300);
        ASSERT(buffer.chunk_count() == 3);

        // Dropping another whole chunk would leave less than 250 ms
        buffer.trim_to_recent(250);
        ASSERT(buffer.chunk_count() == 3);

        buffer.trim_to_recent(200);
        ASSERT(buffer.duration_ms() == 200);
        ASSERT(buffer.chunk_count() == 2);

        Utterance u = buffer.drain();
        ASSERT(u.samples.back() == 0.5f);
    }

    // --- Level of silence is zero ---
    {
        AudioBuffer buffer(1000);
        ASSERT(buffer.mean_level() == 0.0f);
        buffer.append(chunk_of(320, 0.0f, 0));
        ASSERT(buffer.mean_level() == 0.0f);
        buffer.append(chunk_of(320, -0.5f, 1));
        ASSERT(std::fabs(buffer.mean_level() - 0.25f) < 1e-4f);
    }

    // --- PCM helpers used on the same samples ---
    {
        FloatSamples s = {0.0f, 1.0f, -1.0f, 2.0f};
        Pcm16Buffer pcm = pcm::float_to_pcm16(s);
        ASSERT(pcm.size() == 4);
        ASSERT(pcm[0] == 0);
        ASSERT(pcm[1] == 32767);
        ASSERT(pcm[2] <= -32767);
        ASSERT(pcm[3] == 32767);  // clipped

        Pcm16Buffer tone(2400, 1000);
        Pcm16Buffer down = pcm::resample(tone, 24000, 16000);
        ASSERT(down.size() == 1600);
        ASSERT(down[800] == 1000);
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All audio buffer tests passed.\n";
    return 0;
}
