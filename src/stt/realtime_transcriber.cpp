#include "stt/realtime_transcriber.h"
#include "audio/pcm.h"
#include "http_client.h"
#include "logger.h"
#include "utils.h"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

using json = nlohmann::json;

namespace voice_relay {
namespace stt {

namespace {

constexpr auto RECV_IDLE_SLEEP = std::chrono::milliseconds(10);
constexpr auto SEND_RETRY_SLEEP = std::chrono::milliseconds(1);
constexpr int CONNECT_TIMEOUT_MS = 5000;
constexpr size_t RECV_CHUNK_BYTES = 16384;

std::atomic<uint64_t> g_event_counter{0};

std::string next_event_id() {
    return "event_" + std::to_string(++g_event_counter);
}

} // anonymous namespace

std::optional<StreamEvent> parse_realtime_event(const std::string& message) {
    json msg;
    try {
        msg = json::parse(message);
    } catch (const json::exception& e) {
        LOG_STT(std::string("Ignoring malformed realtime message: ") + e.what());
        return std::nullopt;
    }
    if (!msg.is_object()) return std::nullopt;

    const std::string type = msg.value("type", "");
    auto text_field = [&msg](const char* primary, const char* secondary) {
        for (const char* key : {primary, secondary}) {
            if (msg.contains(key) && msg[key].is_string()) {
                std::string value = msg[key].get<std::string>();
                if (!value.empty()) return value;
            }
        }
        return std::string();
    };

    if (type == "input_audio_buffer.speech_started") {
        return StreamEvent{StreamEventType::SpeechStarted, ""};
    }
    if (type == "input_audio_buffer.speech_stopped") {
        return StreamEvent{StreamEventType::SpeechStopped, ""};
    }
    if (type == "conversation.item.input_audio_transcription.text") {
        std::string partial = text_field("text", "stash");
        if (partial.empty()) return std::nullopt;
        return StreamEvent{StreamEventType::Partial, utils::trim_copy(partial)};
    }
    if (type == "conversation.item.input_audio_transcription.completed") {
        return StreamEvent{StreamEventType::Final, utils::trim_copy(text_field("transcript", "text"))};
    }
    if (type == "session.finished") {
        return StreamEvent{StreamEventType::Closed, ""};
    }
    if (type == "error") {
        Logger::warn("[STT] realtime provider error: " + message);
    }
    return std::nullopt;
}

std::string build_session_update(const config::STTConfig& config, int silence_ms) {
    json update;
    update["event_id"] = next_event_id();
    update["type"] = "session.update";
    update["session"] = {
        {"modalities", json::array({"text"})},
        {"input_audio_format", "pcm"},
        {"sample_rate", audio::INPUT_SAMPLE_RATE},
        {"input_audio_transcription", {{"language", config.language}}},
        {"turn_detection", {
            {"type", "server_vad"},
            {"threshold", config.server_vad_threshold},
            {"prefix_padding_ms", config.prefix_padding_ms},
            {"silence_duration_ms", silence_ms}
        }}
    };
    return update.dump();
}

std::string build_append_message(const FloatSamples& samples) {
    auto bytes = pcm::pcm16_to_le_bytes(pcm::float_to_pcm16(samples));
    json append;
    append["event_id"] = next_event_id();
    append["type"] = "input_audio_buffer.append";
    append["audio"] = utils::base64_encode(bytes.data(), bytes.size());
    return append.dump();
}

// =============================================================================
// Streaming session
// =============================================================================

class RealtimeStreamSession : public IStreamingSession {
public:
    RealtimeStreamSession() = default;

    ~RealtimeStreamSession() override {
        shutdown();
    }

    VoidResult connect(const config::STTConfig& config, int silence_ms) {
        http::global_init();

        curl_ = curl_easy_init();
        if (!curl_) {
            return VoidResult::failure("Failed to initialize CURL", ErrorType::ProviderError);
        }

        std::string url = config.realtime_url + "?model=" + config.realtime_model;
        headers_ = curl_slist_append(headers_, http::bearer_header(config.realtime_api_key).c_str());

        curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers_);
        curl_easy_setopt(curl_, CURLOPT_CONNECT_ONLY, 2L);  // WebSocket
        curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(CONNECT_TIMEOUT_MS));
        curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

        CURLcode res = curl_easy_perform(curl_);
        if (res != CURLE_OK) {
            std::string error = std::string("Realtime connect failed: ") + curl_easy_strerror(res);
            return VoidResult::failure(res == CURLE_OPERATION_TIMEDOUT
                                       ? make_timeout_error(error)
                                       : make_provider_error(error));
        }

        auto sent = send_text(build_session_update(config, silence_ms));
        if (sent.failed()) return sent;

        connected_ = true;
        reader_ = std::thread([this] { reader_loop(); });
        LOG_STT("Realtime session opened: " + config.realtime_model);
        return VoidResult::ok_result();
    }

    VoidResult append(const FloatSamples& samples) override {
        if (samples.empty()) return VoidResult::ok_result();
        if (!connected_ || closed_) {
            return VoidResult::failure("Realtime session closed", ErrorType::ProviderError);
        }
        return send_text(build_append_message(samples));
    }

    std::vector<StreamEvent> drain_events() override {
        std::lock_guard<std::mutex> lock(events_mutex_);
        std::vector<StreamEvent> out;
        out.swap(pending_events_);
        return out;
    }

    Result<Transcript> finish(int timeout_ms, const CancelToken& cancel) override {
        auto start = Clock::now();
        if (connected_ && !closed_) {
            json finish;
            finish["event_id"] = next_event_id();
            finish["type"] = "session.finish";
            auto sent = send_text(finish.dump());
            if (sent.failed()) {
                Logger::warn("[STT] realtime finish warning: " + sent.error);
            }
        }

        {
            std::unique_lock<std::mutex> lock(events_mutex_);
            auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
            while (!have_final_ && !closed_ && !cancel.is_canceled() && Clock::now() < deadline) {
                events_cv_.wait_for(lock, std::chrono::milliseconds(50));
            }
        }

        shutdown();
        if (cancel.is_canceled()) {
            return Result<Transcript>::failure(make_canceled_error());
        }

        Transcript result;
        {
            std::lock_guard<std::mutex> lock(events_mutex_);
            result.text = !final_text_.empty() ? final_text_ : partial_text_;
            result.is_final = have_final_;
        }
        result.confidence = result.is_final ? 1.0f : 0.5f;
        result.processing_ms = ms_since(start);
        LOG_STT("Realtime transcript (" + std::string(result.is_final ? "final" : "partial") +
                "): \"" + result.text + "\"");
        return Result<Transcript>::success(result);
    }

    void cancel() override {
        shutdown();
    }

    bool saw_speech() const override {
        return saw_speech_;
    }

private:
    VoidResult send_text(const std::string& payload) {
        std::lock_guard<std::mutex> lock(curl_mutex_);
        if (!curl_) return VoidResult::failure("Realtime session closed", ErrorType::ProviderError);

        size_t offset = 0;
        while (offset < payload.size()) {
            size_t sent = 0;
            CURLcode res = curl_ws_send(curl_, payload.data() + offset, payload.size() - offset,
                                        &sent, 0, CURLWS_TEXT);
            if (res == CURLE_AGAIN) {
                std::this_thread::sleep_for(SEND_RETRY_SLEEP);
                continue;
            }
            if (res != CURLE_OK) {
                return VoidResult::failure(std::string("Realtime send failed: ") + curl_easy_strerror(res),
                                           ErrorType::ProviderError);
            }
            offset += sent;
        }
        return VoidResult::ok_result();
    }

    void reader_loop() {
        std::string message;
        char buffer[RECV_CHUNK_BYTES];

        while (!stopping_) {
            size_t received = 0;
            const struct curl_ws_frame* meta = nullptr;
            CURLcode res;
            {
                std::lock_guard<std::mutex> lock(curl_mutex_);
                if (!curl_) break;
                res = curl_ws_recv(curl_, buffer, sizeof(buffer), &received, &meta);
            }

            if (res == CURLE_AGAIN) {
                std::this_thread::sleep_for(RECV_IDLE_SLEEP);
                continue;
            }
            if (res != CURLE_OK) {
                if (!stopping_) {
                    Logger::warn(std::string("[STT] realtime receive failed: ") + curl_easy_strerror(res));
                }
                mark_closed();
                break;
            }
            if (meta && (meta->flags & CURLWS_CLOSE)) {
                mark_closed();
                break;
            }

            message.append(buffer, received);
            if (meta && (meta->bytesleft > 0 || (meta->flags & CURLWS_CONT))) {
                continue;
            }

            if (auto event = parse_realtime_event(message)) {
                record(*event);
            }
            message.clear();
        }
    }

    void record(const StreamEvent& event) {
        {
            std::lock_guard<std::mutex> lock(events_mutex_);
            switch (event.type) {
                case StreamEventType::SpeechStarted:
                    saw_speech_ = true;
                    break;
                case StreamEventType::Partial:
                    partial_text_ = event.text;
                    break;
                case StreamEventType::Final:
                    final_text_ = event.text;
                    have_final_ = true;
                    break;
                case StreamEventType::Closed:
                    closed_ = true;
                    break;
                case StreamEventType::SpeechStopped:
                    break;
            }
            pending_events_.push_back(event);
        }
        events_cv_.notify_all();
    }

    void mark_closed() {
        record(StreamEvent{StreamEventType::Closed, ""});
    }

    void shutdown() {
        stopping_ = true;
        if (reader_.joinable()) reader_.join();

        std::lock_guard<std::mutex> lock(curl_mutex_);
        if (curl_) {
            size_t sent = 0;
            curl_ws_send(curl_, "", 0, &sent, 0, CURLWS_CLOSE);
            curl_easy_cleanup(curl_);
            curl_ = nullptr;
        }
        if (headers_) {
            curl_slist_free_all(headers_);
            headers_ = nullptr;
        }
        closed_ = true;
    }

    CURL* curl_ = nullptr;
    struct curl_slist* headers_ = nullptr;
    std::mutex curl_mutex_;
    std::thread reader_;
    std::atomic<bool> stopping_{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> closed_{false};
    std::atomic<bool> saw_speech_{false};

    std::mutex events_mutex_;
    std::condition_variable events_cv_;
    std::vector<StreamEvent> pending_events_;
    std::string partial_text_;
    std::string final_text_;
    bool have_final_ = false;
};

// =============================================================================
// RealtimeTranscriber
// =============================================================================

RealtimeTranscriber::RealtimeTranscriber(const config::STTConfig& config, int silence_ms)
    : config_(config), silence_ms_(silence_ms) {}

Result<std::shared_ptr<IStreamingSession>> RealtimeTranscriber::open_stream() {
    auto session = std::make_shared<RealtimeStreamSession>();
    auto connected = session->connect(config_, silence_ms_);
    if (connected.failed()) {
        return Result<std::shared_ptr<IStreamingSession>>::failure(connected.error, connected.kind);
    }
    return Result<std::shared_ptr<IStreamingSession>>::success(session);
}

Result<Transcript> RealtimeTranscriber::transcribe(const FloatSamples& samples,
                                                   const CancelToken& cancel,
                                                   const PartialCallback& on_partial) {
    if (samples.empty()) {
        return Result<Transcript>::success(Transcript{});
    }

    auto stream = open_stream();
    if (stream.failed()) {
        return Result<Transcript>::failure(stream.error, stream.kind);
    }
    auto session = *stream.value;

    const size_t step = audio::ms_to_samples(100);
    for (size_t pos = 0; pos < samples.size(); pos += step) {
        if (cancel.is_canceled()) {
            session->cancel();
            return Result<Transcript>::failure(make_canceled_error());
        }
        FloatSamples piece(samples.begin() + pos, samples.begin() + std::min(samples.size(), pos + step));
        auto appended = session->append(piece);
        if (appended.failed()) {
            session->cancel();
            return Result<Transcript>::failure(appended.error, appended.kind);
        }
        if (on_partial) {
            for (const auto& ev : session->drain_events()) {
                if (ev.type == StreamEventType::Partial) on_partial(ev.text);
            }
        }
    }

    auto result = session->finish(config_.finish_timeout_ms, cancel);
    if (result.ok()) {
        result.value->audio_duration_ms = audio::samples_to_ms(samples.size());
    }
    return result;
}

} // namespace stt
} // namespace voice_relay
