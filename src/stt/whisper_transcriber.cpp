#include "stt/whisper_transcriber.h"
#include "logger.h"
#include "utils.h"
#include <whisper.h>
#include <mutex>
#include <sstream>

namespace voice_relay {
namespace stt {

namespace {

struct DecodeContext {
    const CancelToken* cancel = nullptr;
    const PartialCallback* on_partial = nullptr;
    std::string text_so_far;
};

bool abort_callback(void* user_data) {
    auto* ctx = static_cast<DecodeContext*>(user_data);
    return ctx->cancel->is_canceled();
}

void new_segment_callback(whisper_context*, whisper_state* state, int n_new, void* user_data) {
    auto* ctx = static_cast<DecodeContext*>(user_data);
    const int n_segments = whisper_full_n_segments_from_state(state);
    for (int i = n_segments - n_new; i < n_segments; i++) {
        ctx->text_so_far += whisper_full_get_segment_text_from_state(state, i);
    }
    if (ctx->on_partial && *ctx->on_partial) {
        (*ctx->on_partial)(utils::trim_copy(ctx->text_so_far));
    }
}

} // anonymous namespace

class WhisperTranscriber::Impl {
public:
    explicit Impl(const config::STTConfig& config) : config_(config) {
        if (config_.model_path.empty()) {
            LOG_STT("No model path specified");
            return;
        }

        struct whisper_context_params cparams = whisper_context_default_params();
        cparams.use_gpu = config_.use_gpu;

        ctx_ = whisper_init_from_file_with_params(config_.model_path.c_str(), cparams);
        if (!ctx_) {
            Logger::error("Failed to load whisper model: " + config_.model_path);
            return;
        }

        LOG_STT("Model loaded successfully: " + config_.model_path);
    }

    ~Impl() {
        if (ctx_) {
            whisper_free(ctx_);
        }
    }

    Result<Transcript> transcribe(const FloatSamples& samples,
                                  const CancelToken& cancel,
                                  const PartialCallback& on_partial) {
        if (!ctx_) {
            return Result<Transcript>::failure("Whisper model not loaded", ErrorType::ProviderError);
        }
        if (samples.empty()) {
            return Result<Transcript>::success(Transcript{});
        }

        // One decode at a time per context
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancel.is_canceled()) {
            return Result<Transcript>::failure(make_canceled_error());
        }

        auto start = Clock::now();

        DecodeContext decode;
        decode.cancel = &cancel;
        decode.on_partial = &on_partial;

        struct whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
        params.print_progress = false;
        params.print_special = false;
        params.print_realtime = false;
        params.translate = false;
        params.language = config_.language.c_str();
        params.n_threads = config_.n_threads;
        params.offset_ms = 0;
        params.no_context = true;
        params.single_segment = false;
        params.abort_callback = abort_callback;
        params.abort_callback_user_data = &decode;
        if (on_partial) {
            params.new_segment_callback = new_segment_callback;
            params.new_segment_callback_user_data = &decode;
        }

        int ret = whisper_full(ctx_, params, samples.data(), static_cast<int>(samples.size()));
        if (cancel.is_canceled()) {
            return Result<Transcript>::failure(make_canceled_error());
        }
        if (ret != 0) {
            std::ostringstream oss;
            oss << "whisper_full failed: " << ret;
            LOG_STT(oss.str());
            return Result<Transcript>::failure(oss.str(), ErrorType::ProviderError);
        }

        Transcript result;
        int n_segments = whisper_full_n_segments(ctx_);
        int total_tokens = 0;
        float total_prob = 0.0f;
        std::string text;
        for (int i = 0; i < n_segments; i++) {
            text += whisper_full_get_segment_text(ctx_, i);

            int n_tokens = whisper_full_n_tokens(ctx_, i);
            total_tokens += n_tokens;
            for (int j = 0; j < n_tokens; j++) {
                total_prob += whisper_full_get_token_p(ctx_, i, j);
            }
        }

        result.text = utils::trim_copy(text);
        if (utils::is_blank_transcript(result.text, config_.blank_sentinel)) {
            result.text.clear();
        }
        result.confidence = total_tokens > 0 ? (total_prob / total_tokens) : 0.0f;
        result.processing_ms = ms_since(start);
        result.audio_duration_ms = audio::samples_to_ms(samples.size());

        std::ostringstream oss;
        oss << "Transcribed " << result.audio_duration_ms << "ms of audio in "
            << result.processing_ms << "ms: \"" << result.text << "\"";
        LOG_STT(oss.str());

        return Result<Transcript>::success(result);
    }

    bool is_ready() const {
        return ctx_ != nullptr;
    }

private:
    config::STTConfig config_;
    whisper_context* ctx_ = nullptr;
    std::mutex mutex_;
};

WhisperTranscriber::WhisperTranscriber(const config::STTConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

WhisperTranscriber::~WhisperTranscriber() = default;

Result<Transcript> WhisperTranscriber::transcribe(const FloatSamples& samples,
                                                  const CancelToken& cancel,
                                                  const PartialCallback& on_partial) {
    return pimpl_->transcribe(samples, cancel, on_partial);
}

bool WhisperTranscriber::is_ready() const {
    return pimpl_->is_ready();
}

} // namespace stt
} // namespace voice_relay
