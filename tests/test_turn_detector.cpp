/**
 * Local and provider-driven turn detection, plus the energy model.
 *
 * Run from build dir: ./test_turn_detector
 */

#include "fakes.h"
#include "turn_detector.h"
#include "vad/energy_vad.h"
#include <iostream>

using namespace voice_relay;
using namespace voice_relay::testing;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static AudioChunk make_chunk(FloatSamples samples) {
    AudioChunk chunk;
    chunk.samples = std::move(samples);
    return chunk;
}

static LocalTurnDetector make_local(int silence_ms = 300, int start_frames = 2) {
    LocalTurnConfig config;
    config.threshold = 0.5f;
    config.frame_ms = 20;
    config.start_frames = start_frames;
    config.silence_ms = silence_ms;
    return LocalTurnDetector(config, std::unique_ptr<vad::IVAD>(new ThresholdVAD()));
}

int main() {
    // --- Start after debounce, stop after the silence hangover ---
    {
        auto detector = make_local();
        Observation obs = detector.observe(make_chunk(silence_chunk(100)));
        ASSERT(obs.event == TurnEvent::None);
        ASSERT(!obs.speech_detected);

        obs = detector.observe(make_chunk(speech_chunk(100)));
        ASSERT(obs.event == TurnEvent::SpeechStarted);
        ASSERT(obs.speech_detected);
        ASSERT(detector.speech_ms() == 100);

        obs = detector.observe(make_chunk(silence_chunk(200)));
        ASSERT(obs.event == TurnEvent::None);
        ASSERT(detector.in_speech());

        obs = detector.observe(make_chunk(silence_chunk(100)));
        ASSERT(obs.event == TurnEvent::SpeechStopped);
        ASSERT(!obs.speech_detected);
        ASSERT(detector.speech_ms() == 100);

        detector.reset();
        ASSERT(detector.speech_ms() == 0);
        ASSERT(!detector.provider_driven());
    }

    // --- Chunks that do not line up with frames ---
    {
        auto detector = make_local();
        // 30 ms: one full frame plus 10 ms pending
        Observation obs = detector.observe(make_chunk(speech_chunk(30)));
        ASSERT(obs.event == TurnEvent::None);
        obs = detector.observe(make_chunk(speech_chunk(10)));
        ASSERT(obs.event == TurnEvent::SpeechStarted);
        ASSERT(detector.speech_ms() == 40);
    }

    // --- A single voiced frame is not speech ---
    {
        auto detector = make_local();
        FloatSamples blip = speech_chunk(20);
        FloatSamples quiet = silence_chunk(80);
        blip.insert(blip.end(), quiet.begin(), quiet.end());
        for (int i = 0; i < 10; i++) {
            Observation obs = detector.observe(make_chunk(blip));
            ASSERT(obs.event == TurnEvent::None);
        }
        ASSERT(detector.speech_ms() == 0);
    }

    // --- Speech shorter than the hangover in between stays one utterance ---
    {
        auto detector = make_local(300);
        detector.observe(make_chunk(speech_chunk(200)));
        Observation obs = detector.observe(make_chunk(silence_chunk(200)));
        ASSERT(obs.event == TurnEvent::None);
        detector.observe(make_chunk(speech_chunk(200)));
        obs = detector.observe(make_chunk(silence_chunk(300)));
        ASSERT(obs.event == TurnEvent::SpeechStopped);
        ASSERT(detector.speech_ms() == 400);
    }

    // --- Post-response guard treats audio as silence ---
    {
        auto detector = make_local();
        detector.suppress_for(200);
        Observation obs = detector.observe(make_chunk(speech_chunk(200)));
        ASSERT(obs.event == TurnEvent::None);
        ASSERT(!detector.in_speech());
        obs = detector.observe(make_chunk(speech_chunk(100)));
        ASSERT(obs.event == TurnEvent::SpeechStarted);
    }

    // --- Provider events are relayed; stop wins within one drain ---
    {
        auto stream = std::make_shared<ScriptedStream>();
        ProviderTurnDetector detector(stream);
        ASSERT(detector.provider_driven());

        Observation obs = detector.observe(make_chunk(speech_chunk(100)));
        ASSERT(obs.event == TurnEvent::None);
        ASSERT(detector.speech_ms() == 0);

        stream->push(stt::StreamEventType::SpeechStarted);
        stream->push(stt::StreamEventType::Partial, "hel");
        obs = detector.observe(make_chunk(speech_chunk(100)));
        ASSERT(obs.event == TurnEvent::SpeechStarted);
        ASSERT(obs.speech_detected);
        ASSERT(obs.partial && *obs.partial == "hel");

        obs = detector.observe(make_chunk(silence_chunk(100)));
        ASSERT(obs.event == TurnEvent::None);
        ASSERT(obs.speech_detected);

        stream->push(stt::StreamEventType::SpeechStopped);
        obs = detector.observe(make_chunk(silence_chunk(100)));
        ASSERT(obs.event == TurnEvent::SpeechStopped);
        ASSERT(detector.speech_ms() == 300);

        detector.reset();
        stream->push(stt::StreamEventType::SpeechStarted);
        stream->push(stt::StreamEventType::SpeechStopped);
        obs = detector.observe(make_chunk(speech_chunk(100)));
        ASSERT(obs.event == TurnEvent::SpeechStopped);
        ASSERT(!obs.speech_detected);
    }

    // --- Energy model ---
    {
        vad::EnergyVADConfig config;
        config.threshold = 0.02f;
        config.adaptive_threshold = false;
        vad::EnergyVAD model(config);

        FloatSamples quiet = silence_chunk(20);
        FloatSamples loud = speech_chunk(20, 0.3f);
        ASSERT(model.speech_probability(quiet.data(), quiet.size()) == 0.0f);
        ASSERT(model.speech_probability(loud.data(), loud.size()) == 1.0f);

        FloatSamples edge = speech_chunk(20, 0.02f);
        float p = model.speech_probability(edge.data(), edge.size());
        ASSERT(p > 0.45f && p < 0.55f);
        ASSERT(model.get_stats().frames == 3);
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All turn detector tests passed.\n";
    return 0;
}
