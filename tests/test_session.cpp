/**
 * End-to-end turns through one Session with scripted providers.
 * Covers: idle command handling, silence-only and too-short speech,
 * speech + stop_listening, TTS failure mid-response, continuous re-arm,
 * cancel, protocol errors, overflow, provider-driven turn detection and
 * a provider stream lost mid-turn.
 *
 * Run from build dir: ./test_session
 */

#include "fakes.h"
#include "session.h"
#include "session_registry.h"
#include <iostream>
#include <memory>
#include <string>

using namespace voice_relay;
using namespace voice_relay::testing;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

struct Harness {
    std::shared_ptr<ScriptedTranscriber> transcriber;
    std::shared_ptr<ScriptedAgent> agent;
    std::shared_ptr<FakeSynthesizer> synthesizer;
    std::shared_ptr<RecordingChannel> channel = std::make_shared<RecordingChannel>();
    std::unique_ptr<Session> session;

    void start(const Config& config) {
        Providers providers;
        providers.transcriber = transcriber;
        providers.agent = agent;
        providers.synthesizer = synthesizer;
        providers.vad_factory = threshold_vad_factory();
        session = std::make_unique<Session>("test", config, providers, channel);
        session->start();
    }

    void send(const std::string& frame) { session->post_client_frame(frame); }

    void speech(int chunks) {
        for (int i = 0; i < chunks; i++) send(audio_frame(speech_chunk()));
    }

    void silence(int chunks) {
        for (int i = 0; i < chunks; i++) send(audio_frame(silence_chunk()));
    }

    bool state_is(State state, int timeout_ms = 3000) {
        return eventually([&] { return session->state() == state; }, timeout_ms);
    }
};

Config test_config() {
    Config config = Config::defaults();
    config.vad.silence_ms = 300;
    config.vad.min_speech_ms = 250;
    config.vad.start_frames = 2;
    config.vad.threshold = 0.5f;
    config.audio.pre_speech_buffer_ms = 300;
    config.audio.output_sample_rate = 16000;
    config.tts.frame_ms = 100;
    config.agent.system_prompt = "Be brief.";
    return config;
}

Harness make_harness(const std::string& transcript, std::vector<std::string> reply) {
    Harness h;
    h.transcriber = std::make_shared<ScriptedTranscriber>(transcript);
    h.agent = std::make_shared<ScriptedAgent>(std::move(reply));
    h.synthesizer = std::make_shared<FakeSynthesizer>(16000, 2);
    return h;
}

/// Index of the first frame of `type`, or -1
int first_index(const std::vector<std::string>& types, const std::string& type) {
    for (size_t i = 0; i < types.size(); i++) {
        if (types[i] == type) return static_cast<int>(i);
    }
    return -1;
}

int last_index(const std::vector<std::string>& types, const std::string& type) {
    for (size_t i = types.size(); i > 0; i--) {
        if (types[i - 1] == type) return static_cast<int>(i - 1);
    }
    return -1;
}

void test_idle_ignores_everything_but_start() {
    auto h = make_harness("hello", {"Hi."});
    h.start(test_config());

    h.speech(3);
    h.send(type_frame("stop_listening"));
    h.send(type_frame("cancel"));
    h.send(type_frame("ping"));
    ASSERT(h.channel->wait_for("pong"));

    ASSERT(h.session->state() == State::Idle);
    ASSERT(h.channel->types().size() == 1);
    ASSERT(h.session->stats().chunks_ignored == 3);
    ASSERT(h.transcriber->calls() == 0);

    h.send(type_frame("start_listening"));
    ASSERT(h.channel->wait_for("listening_started"));
    ASSERT(h.session->state() == State::Listening);
}

void test_silence_only_never_transcribes() {
    auto h = make_harness("hello", {"Hi."});
    h.start(test_config());

    h.send(type_frame("start_listening"));
    h.silence(20);
    ASSERT(h.channel->wait_for("vad_status", 20));
    ASSERT(h.session->state() == State::Listening);
    for (const auto& frame : h.channel->frames()) {
        if (frame["type"] == "vad_status") ASSERT(frame["speech_detected"] == false);
    }

    h.send(type_frame("stop_listening"));
    ASSERT(h.channel->wait_for("response_complete"));
    ASSERT(h.state_is(State::Idle));
    ASSERT(h.transcriber->calls() == 0);
    ASSERT(h.agent->calls() == 0);

    auto frames = h.channel->frames();
    ASSERT(frames.back()["type"] == "response_complete");
    ASSERT(frames.back()["text"] == "");
}

void test_short_speech_is_discarded() {
    auto h = make_harness("hello", {"Hi."});
    h.start(test_config());

    h.send(type_frame("start_listening"));
    h.speech(2);   // 200 ms, below the 250 ms minimum
    h.silence(5);
    ASSERT(eventually([&] { return h.session->stats().turns_discarded == 1; }));
    ASSERT(h.session->state() == State::Listening);

    h.send(type_frame("stop_listening"));
    ASSERT(h.channel->wait_for("response_complete"));
    ASSERT(h.state_is(State::Idle));
    ASSERT(h.transcriber->calls() == 0);
    ASSERT(h.channel->count("transcript") == 0);
}

void test_speech_then_stop_runs_full_turn() {
    auto h = make_harness("hello there", {"Hi there! ", "How can ", "I help?"});
    h.start(test_config());

    h.send(type_frame("start_listening"));
    h.speech(15);
    h.send(type_frame("stop_listening"));

    ASSERT(h.channel->wait_for("response_complete"));
    ASSERT(h.state_is(State::Idle));
    ASSERT(h.transcriber->calls() == 1);

    auto frames = h.channel->frames();
    auto types = h.channel->types();

    const int transcript = first_index(types, "transcript");
    ASSERT(transcript >= 0);
    ASSERT(frames[transcript]["text"] == "hello there");
    ASSERT(frames[transcript]["final"] == true);
    ASSERT(first_index(types, "listening_stopped") < transcript);

    std::string streamed;
    for (const auto& f : frames) {
        if (f["type"] == "response_chunk") streamed += f["text"].get<std::string>();
    }
    ASSERT(streamed == "Hi there! How can I help?");
    ASSERT(h.channel->count("response_chunk") == 2);

    // Two units, two 100 ms frames each
    ASSERT(h.channel->count("audio_chunk") == 4);
    ASSERT(transcript < first_index(types, "response_chunk"));
    ASSERT(first_index(types, "response_chunk") < first_index(types, "audio_chunk"));
    ASSERT(last_index(types, "audio_chunk") < last_index(types, "response_complete"));
    ASSERT(types.back() == "response_complete");
    ASSERT(frames.back()["text"] == "Hi there! How can I help?");
    ASSERT(frames[first_index(types, "audio_chunk")]["sample_rate"] == 16000);

    auto messages = h.agent->last_messages();
    ASSERT(messages.size() == 2);
    ASSERT(messages[0].role == MessageRole::System);
    ASSERT(messages[1].role == MessageRole::User);
    ASSERT(messages[1].content == "hello there");

    // Sanitized unit text reaches the synthesizer
    auto spoken = h.synthesizer->texts();
    ASSERT(spoken.size() == 2);
    ASSERT(spoken[0] == "Hi there!");
}

void test_tts_failure_after_first_unit() {
    auto h = make_harness("tell me three things", {"One. ", "Two. ", "Three."});
    h.synthesizer->fail_on("Two.");
    Config config = test_config();
    config.session.max_parallel_synthesis = 1;
    h.start(config);

    h.send(type_frame("start_listening"));
    h.speech(10);
    h.send(type_frame("stop_listening"));

    ASSERT(h.channel->wait_for("error"));
    ASSERT(h.state_is(State::Idle));

    auto frames = h.channel->frames();
    json error;
    for (const auto& f : frames) {
        if (f["type"] == "error") error = f;
    }
    ASSERT(error["code"] == "provider_error");
    ASSERT(error["recoverable"] == false);

    // Unit 1 was delivered in full; nothing of units 2 and 3
    ASSERT(h.channel->count("audio_chunk") == 2);
    ASSERT(h.channel->count("response_complete") == 0);
    auto spoken = h.synthesizer->texts();
    ASSERT(spoken.size() == 2);
}

void test_continuous_mode_rearms() {
    auto h = make_harness("first question", {"Sure. ", "Done."});
    h.start(test_config());

    h.send(start_frame(true));
    ASSERT(h.channel->wait_for("listening_started"));
    ASSERT(h.session->continuous());

    h.speech(10);
    h.silence(4);
    ASSERT(h.channel->wait_for("response_complete"));
    ASSERT(h.channel->wait_for("listening_started", 2));
    ASSERT(h.state_is(State::Listening));

    // A second turn sees the first exchange in its history
    h.speech(10);
    h.silence(4);
    ASSERT(h.channel->wait_for("response_complete", 2));
    ASSERT(h.channel->wait_for("listening_started", 3));
    auto messages = h.agent->last_messages();
    ASSERT(messages.size() == 4);
    ASSERT(messages[2].role == MessageRole::Assistant);
    ASSERT(messages[2].content == "Sure. Done.");
    ASSERT(h.session->stats().responses_completed == 2);
}

void test_cancel_during_response() {
    auto h = make_harness("long answer please", {"Part one. ", "Part two. ", "Part three."});
    h.agent->set_delay(150);
    h.start(test_config());

    h.send(type_frame("start_listening"));
    h.speech(10);
    h.send(type_frame("stop_listening"));
    ASSERT(h.state_is(State::Responding));

    h.send(type_frame("cancel"));
    ASSERT(h.channel->wait_for("error"));
    ASSERT(h.state_is(State::Idle));

    auto frames = h.channel->frames();
    ASSERT(frames.back()["type"] == "error");
    ASSERT(frames.back()["code"] == "session_canceled");

    // Late provider results of the canceled turn are dropped
    std::this_thread::sleep_for(std::chrono::milliseconds(600));
    ASSERT(h.channel->count("response_complete") == 0);
    ASSERT(h.session->state() == State::Idle);

    h.send(type_frame("cancel"));
    h.send(type_frame("ping"));
    ASSERT(h.channel->wait_for("pong"));
    ASSERT(h.channel->count("error") == 1);

    // The canceled question is not left in history
    h.send(type_frame("start_listening"));
    h.speech(10);
    h.send(type_frame("stop_listening"));
    ASSERT(h.channel->wait_for("response_complete"));
    auto messages = h.agent->last_messages();
    ASSERT(messages.size() == 2);
    ASSERT(messages[0].role == MessageRole::System);
    ASSERT(messages[1].role == MessageRole::User);
}

void test_protocol_errors_keep_session() {
    auto h = make_harness("hello", {"Hi."});
    h.start(test_config());

    h.send("not json");
    h.send("{\"type\":\"dance\"}");
    h.send("{\"type\":\"audio\",\"data\":\"@@@\"}");
    h.send("{\"type\":\"start_listening\",\"continuous\":\"yes\"}");
    ASSERT(h.channel->wait_for("error", 4));

    for (const auto& f : h.channel->frames()) {
        ASSERT(f["code"] == "protocol_error");
        ASSERT(f["recoverable"] == true);
    }
    ASSERT(h.session->stats().protocol_errors == 4);
    ASSERT(h.session->state() == State::Idle);

    h.send(type_frame("ping"));
    ASSERT(h.channel->wait_for("pong"));
}

void test_overflow_reported_once() {
    auto h = make_harness("hello", {"Hi."});
    Config config = test_config();
    config.audio.max_utterance_ms = 1000;
    h.start(config);

    h.send(type_frame("start_listening"));
    h.speech(15);
    ASSERT(h.channel->wait_for("vad_status", 15));
    ASSERT(h.channel->count("error") == 1);
    ASSERT(h.session->state() == State::Listening);
    ASSERT(h.session->stats().chunks_overflowed >= 4);

    for (const auto& f : h.channel->frames()) {
        if (f["type"] == "error") {
            ASSERT(f["code"] == "audio_overflow");
            ASSERT(f["recoverable"] == true);
        }
    }

    // The buffered prefix is still transcribed
    h.send(type_frame("stop_listening"));
    ASSERT(h.channel->wait_for("response_complete"));
    ASSERT(h.transcriber->calls() == 1);
    ASSERT(h.transcriber->last_samples() <= audio::ms_to_samples(1000));
}

void test_transcription_failure_returns_to_listening() {
    auto h = make_harness("hello", {"Hi."});
    h.transcriber->fail_with("upstream 503");
    h.start(test_config());

    h.send(type_frame("start_listening"));
    h.speech(10);
    h.send(type_frame("stop_listening"));

    ASSERT(h.channel->wait_for("error"));
    ASSERT(h.channel->wait_for("listening_started", 2));
    ASSERT(h.state_is(State::Listening));
    ASSERT(h.agent->calls() == 0);
}

void test_blank_transcript_returns_to_listening() {
    auto h = make_harness("[BLANK_AUDIO]", {"Hi."});
    h.start(test_config());

    h.send(type_frame("start_listening"));
    h.speech(10);
    h.send(type_frame("stop_listening"));

    ASSERT(h.channel->wait_for("listening_started", 2));
    ASSERT(h.state_is(State::Listening));
    ASSERT(h.channel->count("transcript") == 0);
    ASSERT(h.channel->count("error") == 0);
    ASSERT(h.agent->calls() == 0);
}

void test_provider_turn_detection() {
    Harness h;
    auto streaming = std::make_shared<StreamingTranscriber>();
    h.transcriber = streaming;
    h.agent = std::make_shared<ScriptedAgent>(std::vector<std::string>{"Okay."});
    h.synthesizer = std::make_shared<FakeSynthesizer>(16000, 1);
    Config config = test_config();
    config.vad.mode = "provider";
    h.start(config);

    h.send(type_frame("start_listening"));
    ASSERT(h.channel->wait_for("listening_started"));
    auto stream = streaming->latest();
    ASSERT(stream != nullptr);
    if (!stream) return;

    // Nothing from the provider yet: no vad_status at all
    h.speech(2);
    stream->push(stt::StreamEventType::SpeechStarted);
    h.speech(1);
    ASSERT(h.channel->wait_for("vad_status"));
    auto frames = h.channel->frames();
    ASSERT(frames.back()["event"] == "speech_started");

    stream->push(stt::StreamEventType::Partial, "from str");
    h.speech(3);
    ASSERT(h.channel->wait_for("transcript"));

    stream->set_final("from stream");
    stream->push(stt::StreamEventType::SpeechStopped);
    h.speech(1);

    ASSERT(h.channel->wait_for("response_complete"));
    ASSERT(streaming->calls() == 0);

    std::string final_text;
    for (const auto& f : h.channel->frames()) {
        if (f["type"] == "transcript" && f["final"] == true) final_text = f["text"];
    }
    ASSERT(final_text == "from stream");
}

void test_provider_stream_lost_mid_turn() {
    Harness h;
    auto streaming = std::make_shared<StreamingTranscriber>();
    h.transcriber = streaming;
    h.agent = std::make_shared<ScriptedAgent>(std::vector<std::string>{"Okay."});
    h.synthesizer = std::make_shared<FakeSynthesizer>(16000, 1);
    Config config = test_config();
    config.vad.mode = "provider";
    h.start(config);

    h.send(type_frame("start_listening"));
    ASSERT(h.channel->wait_for("listening_started"));
    auto stream = streaming->latest();
    ASSERT(stream != nullptr);
    if (!stream) return;

    stream->fail_appends("connection reset");
    h.speech(10);
    h.silence(4);

    // Reported once, then the turn ends on local detection
    ASSERT(h.channel->wait_for("response_complete"));
    ASSERT(h.channel->count("error") == 1);
    ASSERT(h.channel->count("listening_stopped") == 1);
    ASSERT(stream->canceled());
    ASSERT(streaming->calls() == 1);

    json error;
    std::string final_text;
    for (const auto& f : h.channel->frames()) {
        if (f["type"] == "error") error = f;
        if (f["type"] == "transcript" && f["final"] == true) final_text = f["text"];
    }
    ASSERT(error["code"] == "provider_error");
    ASSERT(error["recoverable"] == true);
    ASSERT(final_text == "batch text");
    ASSERT(h.state_is(State::Idle));
}

void test_close_and_registry() {
    SessionRegistry registry;
    auto channel = std::make_shared<RecordingChannel>();
    Providers providers;
    providers.transcriber = std::make_shared<ScriptedTranscriber>("x");
    providers.agent = std::make_shared<ScriptedAgent>(std::vector<std::string>{"y"});
    providers.synthesizer = std::make_shared<FakeSynthesizer>();
    providers.vad_factory = threshold_vad_factory();

    auto session = std::make_shared<Session>("s-1", test_config(), providers, channel);
    ASSERT(registry.insert(session));
    ASSERT(!registry.insert(session));
    ASSERT(registry.size() == 1);
    ASSERT(registry.find("s-1") == session);
    ASSERT(registry.find("nope") == nullptr);

    session->set_principal("user@example.com");
    ASSERT(session->principal() == "user@example.com");

    session->start();
    session->post_client_frame(type_frame("start_listening"));
    ASSERT(channel->wait_for("listening_started"));
    session->close(CloseCode::RateLimited);
    session->wait();
    ASSERT(!session->running());
    ASSERT(channel->closed_code() == 4003);
    ASSERT(session->state() == State::Idle);
    ASSERT(!session->post_client_frame(type_frame("ping")));

    ASSERT(registry.remove("s-1") == session);
    ASSERT(registry.size() == 0);
    registry.shutdown();
}

} // anonymous namespace

int main() {
    test_idle_ignores_everything_but_start();
    test_silence_only_never_transcribes();
    test_short_speech_is_discarded();
    test_speech_then_stop_runs_full_turn();
    test_tts_failure_after_first_unit();
    test_continuous_mode_rearms();
    test_cancel_during_response();
    test_protocol_errors_keep_session();
    test_overflow_reported_once();
    test_transcription_failure_returns_to_listening();
    test_blank_transcript_returns_to_listening();
    test_provider_turn_detection();
    test_provider_stream_lost_mid_turn();
    test_close_and_registry();

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All session tests passed.\n";
    return 0;
}
