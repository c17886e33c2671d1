/**
 * SynthesisScheduler: frames leave in unit order whatever the synthesis
 * latency, the reorder window bounds how far ahead work runs, and a failed
 * unit cuts the response after the units before it.
 *
 * Run from build dir: ./test_synthesis_scheduler
 */

#include "synthesis_scheduler.h"
#include "fakes.h"
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

using namespace voice_relay;
using namespace voice_relay::testing;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

struct Delivered {
    uint64_t unit_seq;
    int marker;
    size_t samples;
};

class FrameLog {
public:
    FrameSink sink() {
        return [this](OutboundFrame&& frame) {
            std::lock_guard<std::mutex> lock(mutex_);
            frames_.push_back({frame.unit_seq, frame.pcm.empty() ? 0 : frame.pcm[0], frame.pcm.size()});
        };
    }

    std::vector<Delivered> frames() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return frames_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Delivered> frames_;
};

/// Holds every call until open() or cancellation
class GateSynthesizer : public tts::ISynthesizer {
public:
    VoidResult synthesize(const std::string&, const tts::FrameCallback& on_frame,
                          const CancelToken& cancel) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            active_++;
        }
        while (!is_open()) {
            if (cancel.wait_for(std::chrono::milliseconds(5))) {
                std::lock_guard<std::mutex> lock(mutex_);
                active_--;
                return VoidResult::failure(make_canceled_error());
            }
        }
        on_frame(Pcm16Buffer(1600, 1));
        std::lock_guard<std::mutex> lock(mutex_);
        active_--;
        return VoidResult::ok_result();
    }

    int sample_rate() const override { return 16000; }
    bool is_ready() const override { return true; }
    std::string name() const override { return "gate"; }

    void open() {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = true;
    }

    int active() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return active_;
    }

private:
    bool is_open() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_;
    }

    mutable std::mutex mutex_;
    bool open_ = false;
    int active_ = 0;
};

SchedulerConfig scheduler_config(size_t parallel, size_t window) {
    SchedulerConfig config;
    config.max_parallel = parallel;
    config.reorder_window = window;
    config.output_sample_rate = 16000;
    config.frame_ms = 100;
    return config;
}

std::string unit_text(size_t i) {
    return "u" + std::to_string(i);
}

} // anonymous namespace

int main() {
    // --- Random latency never reorders frames ---
    for (unsigned seed = 1; seed <= 5; seed++) {
        auto synth = std::make_shared<FakeSynthesizer>(16000, 3);
        synth->set_random_latency(30, seed);
        FrameLog log;
        SynthesisScheduler scheduler(synth, scheduler_config(3, 4), std::make_shared<CancelToken>(), log.sink());

        const size_t units = 10;
        for (size_t i = 0; i < units; i++) {
            ASSERT(scheduler.submit(i, unit_text(i)));
        }
        auto result = scheduler.finish();
        ASSERT(result.ok());

        auto frames = log.frames();
        ASSERT(frames.size() == units * 3);
        for (size_t i = 0; i < frames.size(); i++) {
            ASSERT(frames[i].unit_seq == i / 3);
            ASSERT(frames[i].marker == static_cast<int>(frames[i].unit_seq) + 1);
            ASSERT(frames[i].samples == 1600);
        }
        ASSERT(scheduler.units_started() == units);
        ASSERT(scheduler.frames_released() == units * 3);
    }

    // --- Output is re-framed and resampled ---
    {
        auto synth = std::make_shared<FakeSynthesizer>(12000, 1);
        FrameLog log;
        auto config = scheduler_config(1, 4);
        config.output_sample_rate = 24000;
        config.frame_ms = 20;
        SynthesisScheduler scheduler(synth, config, std::make_shared<CancelToken>(), log.sink());
        ASSERT(scheduler.submit(0, "u0"));
        ASSERT(scheduler.finish().ok());

        // 1200 samples at 12 kHz is 100 ms: 2400 samples at 24 kHz in 480-sample frames
        auto frames = log.frames();
        ASSERT(frames.size() == 5);
        size_t total = 0;
        for (const auto& f : frames) {
            ASSERT(f.samples <= 480);
            total += f.samples;
        }
        ASSERT(total == 2400);
    }

    // --- Reorder window bounds submission ---
    {
        auto gate = std::make_shared<GateSynthesizer>();
        FrameLog log;
        SynthesisScheduler scheduler(gate, scheduler_config(4, 2), std::make_shared<CancelToken>(), log.sink());

        std::atomic<size_t> submitted{0};
        std::thread producer([&] {
            for (size_t i = 0; i < 6; i++) {
                if (!scheduler.submit(i, unit_text(i))) break;
                submitted++;
            }
        });

        ASSERT(eventually([&] { return gate->active() == 2; }));
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        ASSERT(submitted.load() == 2);
        ASSERT(gate->active() == 2);
        ASSERT(log.frames().empty());

        gate->open();
        producer.join();
        ASSERT(submitted.load() == 6);
        ASSERT(scheduler.finish().ok());
        ASSERT(log.frames().size() == 6);
    }

    // --- Empty units complete without a synthesizer call ---
    {
        auto synth = std::make_shared<FakeSynthesizer>(16000, 2);
        FrameLog log;
        SynthesisScheduler scheduler(synth, scheduler_config(2, 4), std::make_shared<CancelToken>(), log.sink());
        ASSERT(scheduler.submit(0, ""));
        ASSERT(scheduler.submit(1, "u1"));
        ASSERT(scheduler.submit(2, ""));
        ASSERT(scheduler.finish().ok());
        ASSERT(synth->texts().size() == 1);
        ASSERT(log.frames().size() == 2);
        ASSERT(scheduler.units_started() == 1);
    }

    // --- A failed unit ends the response after earlier units ---
    {
        auto synth = std::make_shared<FakeSynthesizer>(16000, 2);
        synth->fail_on("u2");
        synth->set_random_latency(20, 7);
        FrameLog log;
        SynthesisScheduler scheduler(synth, scheduler_config(2, 8), std::make_shared<CancelToken>(), log.sink());

        for (size_t i = 0; i < 5; i++) {
            scheduler.submit(i, unit_text(i));
        }
        auto result = scheduler.finish();
        ASSERT(result.failed());
        ASSERT(result.kind == ErrorType::ProviderError);
        ASSERT(result.error.find("u2") != std::string::npos);

        auto frames = log.frames();
        ASSERT(frames.size() == 4);
        for (const auto& f : frames) {
            ASSERT(f.unit_seq < 2);
        }
        ASSERT(!scheduler.submit(5, unit_text(5)));
    }

    // --- Cancellation wakes finish() and releases nothing more ---
    {
        auto gate = std::make_shared<GateSynthesizer>();
        auto token = std::make_shared<CancelToken>();
        FrameLog log;
        SynthesisScheduler scheduler(gate, scheduler_config(2, 4), token, log.sink());
        ASSERT(scheduler.submit(0, "u0"));
        ASSERT(scheduler.submit(1, "u1"));
        ASSERT(eventually([&] { return gate->active() == 2; }));

        VoidResult result = VoidResult::ok_result();
        std::thread waiter([&] { result = scheduler.finish(); });
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        token->cancel();
        scheduler.cancel();
        waiter.join();

        ASSERT(result.failed());
        ASSERT(result.kind == ErrorType::SessionCanceled);
        ASSERT(log.frames().empty());
        ASSERT(!scheduler.submit(2, "u2"));
        ASSERT(eventually([&] { return gate->active() == 0; }));
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All synthesis scheduler tests passed.\n";
    return 0;
}
