#include "session.h"
#include "audio/audio_buffer.h"
#include "core/blocking_queue.h"
#include "core/cancel_token.h"
#include "logger.h"
#include "memory/conversation_memory.h"
#include "protocol.h"
#include "response_pipeline.h"
#include "turn_detector.h"
#include "utils.h"
#include "vad/energy_vad.h"
#include <atomic>
#include <list>
#include <mutex>
#include <thread>
#include <variant>

namespace voice_relay {

namespace {

// Actor inbox. Everything carrying a turn id is dropped once that turn ended.
struct ClientFrame {
    std::string raw;
};

struct PartialTranscript {
    uint64_t turn;
    std::string text;
};

struct TranscriptReady {
    uint64_t turn;
    Result<Transcript> result;
};

struct ResponseText {
    uint64_t turn;
    std::string text;
};

struct AudioOut {
    uint64_t turn;
    OutboundFrame frame;
};

struct ResponseFinished {
    uint64_t turn;
    std::string text;
    VoidResult status;
};

struct Disconnect {
    bool close_channel;
    CloseCode code;
};

using SessionEvent = std::variant<ClientFrame, PartialTranscript, TranscriptReady,
                                  ResponseText, AudioOut, ResponseFinished, Disconnect>;

/// Errors the client protocol knows about; anything else is a provider fault
ErrorType client_error_type(ErrorType type) {
    switch (type) {
        case ErrorType::ProviderTimeout:
        case ErrorType::ProviderError:
        case ErrorType::AudioOverflow:
        case ErrorType::ProtocolError:
        case ErrorType::SessionCanceled:
            return type;
        default:
            return ErrorType::ProviderError;
    }
}

} // anonymous namespace

class Session::Impl {
public:
    Impl(std::string id, const Config& config, Providers providers, std::shared_ptr<IClientChannel> channel)
        : id_(std::move(id)),
          config_(config),
          providers_(std::move(providers)),
          channel_(std::move(channel)),
          history_(memory::ConversationConfig{config.agent.max_history_messages, config.agent.system_prompt}),
          buffer_(config.audio.max_utterance_ms, config.audio.input_sample_rate),
          continuous_(config.session.continuous),
          last_activity_(now_ms()) {
        std::unique_ptr<vad::IVAD> model = providers_.vad_factory ? providers_.vad_factory() : nullptr;
        if (!model) {
            vad::EnergyVADConfig vad_config;
            vad_config.threshold = config_.vad.energy_threshold;
            vad_config.adaptive_threshold = config_.vad.adaptive_threshold;
            vad_config.debug_log_frames = config_.vad.debug_log_frames;
            model = std::make_unique<vad::EnergyVAD>(vad_config);
        }

        LocalTurnConfig turn_config;
        turn_config.threshold = config_.vad.threshold;
        turn_config.frame_ms = config_.vad.frame_ms;
        turn_config.start_frames = config_.vad.start_frames;
        turn_config.silence_ms = config_.vad.silence_ms;
        turn_config.sample_rate = config_.audio.input_sample_rate;
        local_detector_ = std::make_unique<LocalTurnDetector>(turn_config, std::move(model));

        pipeline_config_.max_unit_chars = config_.session.max_unit_chars;
        pipeline_config_.scheduler.max_parallel = config_.session.max_parallel_synthesis;
        pipeline_config_.scheduler.reorder_window = config_.session.reorder_window;
        pipeline_config_.scheduler.output_sample_rate = config_.audio.output_sample_rate;
        pipeline_config_.scheduler.frame_ms = config_.tts.frame_ms;

        if (config_.vad.mode == "provider" &&
            !(providers_.transcriber && providers_.transcriber->supports_streaming())) {
            LOG_WARN("[session " + id_ + "] provider turn detection requested but the transcriber "
                     "cannot stream; using local detection");
        }
    }

    ~Impl() {
        queue_.close();
        if (actor_.joinable()) actor_.join();
        if (turn_cancel_) turn_cancel_->cancel();
        if (stream_) stream_->cancel();
        reap_tasks(true);
    }

    void start() {
        if (actor_.joinable()) return;
        running_ = true;
        actor_ = std::thread([this] { run(); });
    }

    bool post(SessionEvent event) {
        return queue_.push(std::move(event));
    }

    void wait() {
        if (actor_.joinable() && actor_.get_id() != std::this_thread::get_id()) {
            actor_.join();
        }
    }

    const std::string& id() const { return id_; }
    State state() const { return state_.load(); }
    bool continuous() const { return continuous_.load(); }
    bool running() const { return running_.load(); }
    int64_t last_activity_ms() const { return last_activity_.load(); }

    void set_principal(const std::string& principal) {
        std::lock_guard<std::mutex> lock(info_mutex_);
        principal_ = principal;
    }

    std::string principal() const {
        std::lock_guard<std::mutex> lock(info_mutex_);
        return principal_;
    }

    SessionStats stats() const {
        std::lock_guard<std::mutex> lock(info_mutex_);
        return stats_;
    }

private:
    // =========================================================================
    // Actor loop
    // =========================================================================

    void run() {
        Logger::set_thread_name(id_);
        LOG_SESSION(id_, "started");
        while (auto event = queue_.pop()) {
            std::visit([this](auto& e) { handle(e); }, *event);
            reap_tasks(false);
            if (stopping_) break;
        }
        queue_.close();
        running_ = false;
        LOG_SESSION(id_, "stopped");
    }

    void handle(ClientFrame& frame) {
        last_activity_ = now_ms();
        count(&SessionStats::frames_received);

        auto parsed = protocol::parse_client_message(frame.raw);
        if (parsed.failed()) {
            count(&SessionStats::protocol_errors);
            LOG_PROTO("[session " + id_ + "] " + parsed.error);
            send(protocol::error(ErrorType::ProtocolError, parsed.error, true));
            return;
        }

        auto& msg = *parsed.value;
        switch (msg.type) {
            case protocol::ClientMessageType::StartListening:
                on_start_listening(msg.continuous);
                break;
            case protocol::ClientMessageType::Audio:
                on_audio(std::move(msg.samples));
                break;
            case protocol::ClientMessageType::StopListening:
                on_stop_listening();
                break;
            case protocol::ClientMessageType::Cancel:
                on_cancel();
                break;
            case protocol::ClientMessageType::Ping:
                send(protocol::pong());
                break;
        }
    }

    void handle(PartialTranscript& ev) {
        if (ev.turn != turn_id_ || sm_.get_state() != State::Transcribing) return;
        if (!ev.text.empty()) send(protocol::transcript(ev.text, false));
    }

    void handle(TranscriptReady& ev) {
        if (ev.turn != turn_id_ || sm_.get_state() != State::Transcribing) {
            LOG_DEBUG("[session " + id_ + "] dropping transcript of turn " + std::to_string(ev.turn));
            return;
        }

        if (ev.result.failed()) {
            LOG_ERROR("[session " + id_ + "] transcription failed: " + ev.result.error);
            send(protocol::error(client_error_type(ev.result.kind),
                                 "Transcription failed: " + ev.result.error, true));
            sm_.on_transcription_failed();
            resume_listening();
            return;
        }

        const Transcript& transcript = *ev.result.value;
        std::string text = utils::trim_copy(transcript.text);
        if (utils::is_blank_transcript(text, config_.stt.blank_sentinel)) {
            LOG_SESSION(id_, "empty transcript, listening again");
            sm_.on_transcript(true);
            resume_listening();
            return;
        }

        LOG_SESSION(id_, "transcript (" + std::to_string(transcript.processing_ms) + "ms): \"" + text + "\"");
        send(protocol::transcript(text, true));
        sm_.on_transcript(false);
        sync_state();
        start_response(text);
    }

    void handle(ResponseText& ev) {
        if (ev.turn != turn_id_ || sm_.get_state() != State::Responding) return;
        send(protocol::response_chunk(ev.text));
    }

    void handle(AudioOut& ev) {
        if (ev.turn != turn_id_ || sm_.get_state() != State::Responding) return;
        send(protocol::audio_chunk(ev.frame.pcm, ev.frame.sample_rate));
    }

    void handle(ResponseFinished& ev) {
        if (ev.turn != turn_id_ || sm_.get_state() != State::Responding) return;

        if (ev.status.failed()) {
            LOG_ERROR("[session " + id_ + "] response failed: " + ev.status.error);
            send(protocol::error(client_error_type(ev.status.kind), ev.status.error, false));
            history_.discard_unanswered();
            sm_.on_response_failed();
            sync_state();
            return;
        }

        history_.add_assistant_message(ev.text);
        count(&SessionStats::responses_completed);
        send(protocol::response_complete(ev.text));

        if (continuous_) {
            sm_.on_response_complete(true);
            arm_listening();
            if (config_.vad.post_response_guard_ms > 0 && !detector_->provider_driven()) {
                local_detector_->suppress_for(config_.vad.post_response_guard_ms);
            }
            send(protocol::listening_started());
        } else {
            sm_.on_response_complete(false);
            sync_state();
        }
    }

    void handle(Disconnect& ev) {
        LOG_SESSION(id_, std::string("disconnect in state ") + state_to_string(sm_.get_state()));
        cancel_turn();
        if (ev.close_channel) {
            channel_->close(ev.code, close_reason(ev.code));
        }
        stopping_ = true;
    }

    // =========================================================================
    // Client commands
    // =========================================================================

    void on_start_listening(const std::optional<bool>& continuous) {
        State state = sm_.get_state();
        if (state != State::Idle && state != State::Listening) {
            LOG_DEBUG("[session " + id_ + "] start_listening ignored while " + state_to_string(state));
            return;
        }
        if (continuous) continuous_ = *continuous;

        if (state == State::Idle) {
            sm_.on_start_listening();
            arm_listening();
            LOG_SESSION(id_, std::string("listening") + (continuous_ ? " (continuous)" : ""));
        }
        send(protocol::listening_started());
    }

    void on_audio(FloatSamples&& samples) {
        count(&SessionStats::audio_chunks);
        if (sm_.get_state() != State::Listening || !detector_) {
            count(&SessionStats::chunks_ignored);
            return;
        }

        AudioChunk chunk;
        chunk.samples = std::move(samples);
        chunk.sequence = chunk_sequence_++;
        chunk.arrival = Clock::now();

        Observation obs = detector_->observe(chunk);
        if (provider_detector_ && provider_detector_->append_failures() > 0) {
            obs = fall_back_to_local(chunk);
        }
        const bool provider = detector_->provider_driven();

        if (!buffer_.append(std::move(chunk))) {
            count(&SessionStats::chunks_overflowed);
            if (!overflow_reported_) {
                overflow_reported_ = true;
                LOG_WARN("[session " + id_ + "] utterance reached " +
                         std::to_string(config_.audio.max_utterance_ms) + "ms, dropping audio");
                send(protocol::error(ErrorType::AudioOverflow,
                                     "Utterance longer than " + std::to_string(config_.audio.max_utterance_ms) +
                                     "ms; further audio dropped", true));
            }
        } else if (!provider && obs.event == TurnEvent::None && !detector_->in_speech()) {
            buffer_.trim_to_recent(config_.audio.pre_speech_buffer_ms);
        }

        if (!provider || obs.event != TurnEvent::None) {
            send(protocol::vad_status(obs.speech_detected, obs.event));
        }
        if (obs.partial && !obs.partial->empty()) {
            send(protocol::transcript(*obs.partial, false));
        }

        if (obs.event == TurnEvent::SpeechStopped) {
            on_speech_stopped();
        }
    }

    /// Streaming STT dropped mid-turn: keep the buffered audio, detect locally
    Observation fall_back_to_local(const AudioChunk& chunk) {
        const std::string reason = provider_detector_->last_error();
        LOG_WARN("[session " + id_ + "] streaming STT lost (" + reason +
                 "); using local detection for this turn");
        send(protocol::error(ErrorType::ProviderError, "Streaming transcription lost: " + reason, true));
        stream_lost_ = true;
        close_stream();
        local_detector_->reset();
        detector_ = local_detector_.get();
        return detector_->observe(chunk);
    }

    void on_speech_stopped() {
        const int64_t voiced_ms = detector_->speech_ms();
        if (voiced_ms < config_.vad.min_speech_ms) {
            count(&SessionStats::turns_discarded);
            LOG_SESSION(id_, "ignoring " + std::to_string(voiced_ms) + "ms of speech");
            buffer_.reset();
            detector_->reset();
            return;
        }
        send(protocol::listening_stopped());
        end_turn();
    }

    void on_stop_listening() {
        if (sm_.get_state() != State::Listening) return;

        send(protocol::listening_stopped());
        if (!has_qualifying_speech()) {
            count(&SessionStats::turns_discarded);
            LOG_SESSION(id_, "stopped without speech");
            close_stream();
            buffer_.reset();
            detector_ = nullptr;
            sm_.on_turn_discarded();
            sync_state();
            send(protocol::response_complete(""));
            return;
        }
        end_turn();
    }

    void on_cancel() {
        State state = sm_.get_state();
        if (state == State::Idle) return;

        LOG_SESSION(id_, std::string("canceled while ") + state_to_string(state));
        cancel_turn();
        if (state == State::Listening) {
            send(protocol::listening_stopped());
        } else {
            send(protocol::error(ErrorType::SessionCanceled, "Turn canceled", false));
        }
    }

    // =========================================================================
    // Turn handling
    // =========================================================================

    /// New turn on entering Listening: fresh buffer, token and detector
    void arm_listening() {
        sync_state();
        turn_id_++;
        turn_cancel_ = std::make_shared<CancelToken>();
        buffer_.reset();
        overflow_reported_ = false;
        stream_lost_ = false;
        close_stream();
        detector_ = nullptr;

        if (config_.vad.mode == "provider" && providers_.transcriber &&
            providers_.transcriber->supports_streaming()) {
            auto opened = providers_.transcriber->open_stream();
            if (opened.ok()) {
                stream_ = *opened.value;
                provider_detector_ = std::make_unique<ProviderTurnDetector>(
                    stream_, config_.audio.input_sample_rate);
                detector_ = provider_detector_.get();
            } else {
                LOG_WARN("[session " + id_ + "] streaming STT unavailable (" + opened.error +
                         "); using local detection for this turn");
            }
        }

        if (!detector_) {
            local_detector_->reset();
            detector_ = local_detector_.get();
        }
    }

    void resume_listening() {
        arm_listening();
        send(protocol::listening_started());
    }

    bool has_qualifying_speech() const {
        if (buffer_.empty() || buffer_.duration_ms() < config_.vad.min_speech_ms) return false;
        bool speech_seen = detector_ && (detector_->in_speech() || detector_->speech_ms() > 0);
        if (stream_ && stream_->saw_speech()) speech_seen = true;
        return speech_seen || buffer_.mean_level() > config_.vad.energy_fallback_threshold;
    }

    void end_turn() {
        sm_.on_turn_end();
        sync_state();

        Utterance utterance = buffer_.drain();
        std::shared_ptr<stt::IStreamingSession> stream = std::move(stream_);
        stream_.reset();
        provider_detector_.reset();
        detector_ = nullptr;

        const uint64_t turn = turn_id_;
        CancelTokenPtr cancel = turn_cancel_;
        const bool stream_lost = stream_lost_;
        LOG_SESSION(id_, "utterance of " + std::to_string(utterance.duration_ms()) + "ms, transcribing");

        spawn("stt", [this, turn, cancel, stream, stream_lost, utterance = std::move(utterance)]() {
            auto result = transcribe(utterance, stream, stream_lost, *cancel, turn);
            post(TranscriptReady{turn, std::move(result)});
        });
    }

    /// Runs on a task thread
    Result<Transcript> transcribe(const Utterance& utterance,
                                  const std::shared_ptr<stt::IStreamingSession>& stream,
                                  bool stream_lost,
                                  const CancelToken& cancel,
                                  uint64_t turn) {
        stt::PartialCallback on_partial = [this, turn](const std::string& text) {
            post(PartialTranscript{turn, text});
        };

        if (!stream) {
            if (stream_lost && providers_.fallback_transcriber) {
                return providers_.fallback_transcriber->transcribe(utterance.samples, cancel, on_partial);
            }
            return providers_.transcriber->transcribe(utterance.samples, cancel, on_partial);
        }

        auto result = stream->finish(config_.stt.finish_timeout_ms, cancel);
        if (result.failed() || !utils::is_blank_transcript(result.value->text, config_.stt.blank_sentinel)) {
            return result;
        }

        const bool worth_retry = stream->saw_speech() ||
                                 utterance.mean_level > config_.vad.energy_fallback_threshold;
        if (!worth_retry || !providers_.fallback_transcriber || cancel.is_canceled()) {
            return result;
        }
        LOG_STT("stream produced no text, retrying with " + providers_.fallback_transcriber->name());
        return providers_.fallback_transcriber->transcribe(utterance.samples, cancel, on_partial);
    }

    void start_response(const std::string& user_text) {
        history_.add_user_message(user_text);
        std::vector<Message> messages = history_.get_messages();

        const uint64_t turn = turn_id_;
        CancelTokenPtr cancel = turn_cancel_;

        spawn("response", [this, turn, cancel, messages = std::move(messages)]() {
            ResponsePipeline pipeline(providers_.agent, providers_.synthesizer, pipeline_config_);
            auto outcome = pipeline.run(
                messages, cancel,
                [this, turn](const ResponseUnit& unit) { post(ResponseText{turn, unit.text}); },
                [this, turn](OutboundFrame&& frame) { post(AudioOut{turn, std::move(frame)}); });
            post(ResponseFinished{turn, std::move(outcome.text), std::move(outcome.status)});
        });
    }

    /// Abort the current turn; late results of it are ignored afterwards
    void cancel_turn() {
        if (sm_.get_state() == State::Responding) {
            history_.discard_unanswered();
        }
        if (turn_cancel_) turn_cancel_->cancel();
        close_stream();
        buffer_.reset();
        detector_ = nullptr;
        turn_id_++;
        sm_.on_cancel();
        sync_state();
    }

    void close_stream() {
        provider_detector_.reset();
        if (stream_) {
            stream_->cancel();
            stream_.reset();
        }
    }

    // =========================================================================
    // Helpers
    // =========================================================================

    void send(const std::string& frame) {
        channel_->send(frame);
    }

    void sync_state() {
        state_ = sm_.get_state();
    }

    void count(uint64_t SessionStats::*field) {
        std::lock_guard<std::mutex> lock(info_mutex_);
        ++(stats_.*field);
    }

    void spawn(const char* role, std::function<void()> fn) {
        auto done = std::make_shared<std::atomic<bool>>(false);
        std::string name = id_ + "/" + role + "-" + std::to_string(turn_id_);
        std::thread thread([fn = std::move(fn), done, name = std::move(name)] {
            Logger::set_thread_name(name);
            fn();
            done->store(true);
        });
        tasks_.push_back(Task{std::move(thread), done});
    }

    void reap_tasks(bool all) {
        for (auto it = tasks_.begin(); it != tasks_.end();) {
            if (all || it->done->load()) {
                if (it->thread.joinable()) it->thread.join();
                it = tasks_.erase(it);
            } else {
                ++it;
            }
        }
    }

    struct Task {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    std::string id_;
    Config config_;
    Providers providers_;
    std::shared_ptr<IClientChannel> channel_;
    PipelineConfig pipeline_config_;
    memory::ConversationMemory history_;

    // Actor-thread state
    StateMachine sm_;
    AudioBuffer buffer_;
    std::unique_ptr<LocalTurnDetector> local_detector_;
    std::unique_ptr<ProviderTurnDetector> provider_detector_;
    std::shared_ptr<stt::IStreamingSession> stream_;
    ITurnDetector* detector_ = nullptr;
    uint64_t turn_id_ = 0;
    uint64_t chunk_sequence_ = 0;
    CancelTokenPtr turn_cancel_;
    bool overflow_reported_ = false;
    bool stream_lost_ = false;  ///< provider stream dropped during this turn
    bool stopping_ = false;
    std::list<Task> tasks_;

    // Readable from any thread
    std::atomic<State> state_{State::Idle};
    std::atomic<bool> continuous_;
    std::atomic<bool> running_{false};
    std::atomic<int64_t> last_activity_;
    mutable std::mutex info_mutex_;
    std::string principal_;
    SessionStats stats_;

    BlockingQueue<SessionEvent> queue_;
    std::thread actor_;
};

Session::Session(std::string id, const Config& config, Providers providers,
                 std::shared_ptr<IClientChannel> channel)
    : impl_(std::make_unique<Impl>(std::move(id), config, std::move(providers), std::move(channel))) {}

Session::~Session() {
    disconnect();
    wait();
}

void Session::start() {
    impl_->start();
}

bool Session::post_client_frame(std::string raw) {
    return impl_->post(ClientFrame{std::move(raw)});
}

void Session::disconnect() {
    impl_->post(Disconnect{false, CloseCode::Normal});
}

void Session::wait() {
    impl_->wait();
}

void Session::close(CloseCode code) {
    impl_->post(Disconnect{true, code});
}

const std::string& Session::id() const {
    return impl_->id();
}

State Session::state() const {
    return impl_->state();
}

bool Session::continuous() const {
    return impl_->continuous();
}

bool Session::running() const {
    return impl_->running();
}

void Session::set_principal(const std::string& principal) {
    impl_->set_principal(principal);
}

std::string Session::principal() const {
    return impl_->principal();
}

int64_t Session::last_activity_ms() const {
    return impl_->last_activity_ms();
}

SessionStats Session::stats() const {
    return impl_->stats();
}

} // namespace voice_relay
