#include "synthesis_scheduler.h"
#include "audio/pcm.h"
#include "logger.h"
#include <algorithm>
#include <condition_variable>
#include <deque>
#include <limits>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace voice_relay {

namespace {

/// Wake interval for waits that must also notice token cancellation
constexpr auto CANCEL_POLL = std::chrono::milliseconds(20);

constexpr uint64_t NO_FAILURE = std::numeric_limits<uint64_t>::max();

} // anonymous namespace

class SynthesisScheduler::Impl {
public:
    Impl(std::shared_ptr<tts::ISynthesizer> synthesizer,
         const SchedulerConfig& config,
         CancelTokenPtr cancel,
         FrameSink sink)
        : synthesizer_(std::move(synthesizer))
        , config_(config)
        , cancel_(cancel ? std::move(cancel) : std::make_shared<CancelToken>())
        , sink_(std::move(sink)) {
        config_.max_parallel = std::max<size_t>(1, config_.max_parallel);
        config_.reorder_window = std::max<size_t>(1, config_.reorder_window);
        for (size_t i = 0; i < config_.max_parallel; i++) {
            workers_.emplace_back([this] { worker_loop(); });
        }
    }

    ~Impl() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        cv_.notify_all();
        for (auto& worker : workers_) {
            if (worker.joinable()) worker.join();
        }
    }

    bool submit(uint64_t sequence, std::string text) {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!halted() && sequence >= head_ + config_.reorder_window) {
            cv_.wait_for(lock, CANCEL_POLL);
        }
        if (halted()) return false;

        Unit unit;
        unit.text = std::move(text);
        units_.emplace(sequence, std::move(unit));
        cv_.notify_all();
        return true;
    }

    VoidResult finish() {
        std::unique_lock<std::mutex> lock(mutex_);
        for (;;) {
            if (canceled_ || cancel_->is_canceled()) {
                return VoidResult::failure(make_canceled_error());
            }
            if (failed_seq_ != NO_FAILURE) {
                // Units ahead of the failed one are still owed to the client
                if (head_ >= failed_seq_) return VoidResult::failure(failure_);
            } else if (units_.empty()) {
                return VoidResult::ok_result();
            }
            cv_.wait_for(lock, CANCEL_POLL);
        }
    }

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            canceled_ = true;
            for (auto& entry : units_) entry.second.held.clear();
        }
        cv_.notify_all();
    }

    size_t units_started() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return units_started_;
    }

    size_t frames_released() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return frames_released_;
    }

private:
    struct Unit {
        std::string text;
        bool started = false;
        bool done = false;
        std::deque<OutboundFrame> held;
    };

    bool halted() const {
        return stopping_ || canceled_ || cancel_->is_canceled() || failed_seq_ != NO_FAILURE;
    }

    void worker_loop() {
        std::unique_lock<std::mutex> lock(mutex_);
        for (;;) {
            if (stopping_) return;

            auto next = halted() ? units_.end() : next_unstarted();
            if (next == units_.end()) {
                cv_.wait_for(lock, CANCEL_POLL);
                continue;
            }

            const uint64_t seq = next->first;
            next->second.started = true;
            const std::string text = next->second.text;
            if (!text.empty()) units_started_++;

            lock.unlock();
            VoidResult result = run_unit(seq, text);
            lock.lock();

            complete_unit(seq, result);
            cv_.notify_all();
        }
    }

    std::map<uint64_t, Unit>::iterator next_unstarted() {
        for (auto it = units_.begin(); it != units_.end(); ++it) {
            if (!it->second.started) return it;
        }
        return units_.end();
    }

    VoidResult run_unit(uint64_t seq, const std::string& text) {
        if (text.empty()) return VoidResult::ok_result();

        const int native_rate = synthesizer_->sample_rate();
        auto result = synthesizer_->synthesize(
            text,
            [this, seq, native_rate](Pcm16Buffer&& pcm) { on_pcm(seq, native_rate, std::move(pcm)); },
            *cancel_);

        if (result.failed()) {
            LOG_TTS("Unit " + std::to_string(seq) + " synthesis failed: " + result.error);
        }
        return result;
    }

    void on_pcm(uint64_t seq, int native_rate, Pcm16Buffer&& pcm) {
        if (pcm.empty()) return;

        const int out_rate = config_.output_sample_rate > 0 ? config_.output_sample_rate : native_rate;
        Pcm16Buffer converted = (out_rate == native_rate)
            ? std::move(pcm)
            : pcm::resample(pcm, native_rate, out_rate);

        const size_t frame_samples = std::max<size_t>(1, audio::ms_to_samples(config_.frame_ms, out_rate));

        std::lock_guard<std::mutex> lock(mutex_);
        if (canceled_ || seq >= failed_seq_) return;

        auto it = units_.find(seq);
        if (it == units_.end()) return;

        for (size_t pos = 0; pos < converted.size(); pos += frame_samples) {
            const size_t end = std::min(converted.size(), pos + frame_samples);
            OutboundFrame frame;
            frame.unit_seq = seq;
            frame.pcm.assign(converted.begin() + pos, converted.begin() + end);
            frame.sample_rate = out_rate;

            if (seq == head_) {
                release(std::move(frame));
            } else {
                it->second.held.push_back(std::move(frame));
            }
        }
    }

    /// Caller holds mutex_
    void complete_unit(uint64_t seq, const VoidResult& result) {
        auto it = units_.find(seq);
        if (it == units_.end()) return;

        if (result.failed()) {
            if (seq < failed_seq_) {
                failed_seq_ = seq;
                failure_ = result.to_error();
                if (failure_.type == ErrorType::None || failure_.type == ErrorType::Unknown) {
                    failure_.type = ErrorType::ProviderError;
                }
            }
            // Nothing at or after the failed unit will be delivered
            for (auto later = units_.lower_bound(failed_seq_); later != units_.end(); ++later) {
                later->second.held.clear();
            }
            return;
        }

        it->second.done = true;
        advance_head();
    }

    /// Caller holds mutex_
    void advance_head() {
        for (;;) {
            auto head = units_.find(head_);
            if (head == units_.end() || !head->second.done) break;
            units_.erase(head);
            head_++;

            auto next = units_.find(head_);
            if (next == units_.end() || head_ >= failed_seq_) break;
            while (!next->second.held.empty()) {
                release(std::move(next->second.held.front()));
                next->second.held.pop_front();
            }
        }
    }

    /// Caller holds mutex_
    void release(OutboundFrame&& frame) {
        frames_released_++;
        if (sink_) sink_(std::move(frame));
    }

    std::shared_ptr<tts::ISynthesizer> synthesizer_;
    SchedulerConfig config_;
    CancelTokenPtr cancel_;
    FrameSink sink_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::thread> workers_;

    std::map<uint64_t, Unit> units_;
    uint64_t head_ = 0;
    uint64_t failed_seq_ = NO_FAILURE;
    Error failure_;
    bool canceled_ = false;
    bool stopping_ = false;
    size_t units_started_ = 0;
    size_t frames_released_ = 0;
};

SynthesisScheduler::SynthesisScheduler(std::shared_ptr<tts::ISynthesizer> synthesizer,
                                       const SchedulerConfig& config,
                                       CancelTokenPtr cancel,
                                       FrameSink sink)
    : impl_(std::make_unique<Impl>(std::move(synthesizer), config, std::move(cancel), std::move(sink))) {}

SynthesisScheduler::~SynthesisScheduler() = default;

bool SynthesisScheduler::submit(uint64_t sequence, std::string text) {
    return impl_->submit(sequence, std::move(text));
}

VoidResult SynthesisScheduler::finish() {
    return impl_->finish();
}

void SynthesisScheduler::cancel() {
    impl_->cancel();
}

size_t SynthesisScheduler::units_started() const {
    return impl_->units_started();
}

size_t SynthesisScheduler::frames_released() const {
    return impl_->frames_released();
}

} // namespace voice_relay
