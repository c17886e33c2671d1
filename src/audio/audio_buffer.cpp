#include "audio/audio_buffer.h"
#include "logger.h"
#include <cmath>

namespace voice_relay {

AudioBuffer::AudioBuffer(int max_duration_ms, int sample_rate)
    : max_samples_(audio::ms_to_samples(max_duration_ms, sample_rate))
    , sample_rate_(sample_rate) {}

bool AudioBuffer::append(AudioChunk chunk) {
    if (total_samples_ + chunk.samples.size() > max_samples_) {
        dropped_chunks_++;
        LOG_AUDIO("Buffer full, dropped chunk " + std::to_string(chunk.sequence) +
                  " (dropped=" + std::to_string(dropped_chunks_) + ")");
        return false;
    }

    double abs_sum = 0.0;
    for (float s : chunk.samples) abs_sum += std::fabs(s);

    total_samples_ += chunk.samples.size();
    total_abs_ += abs_sum;
    chunks_.push_back(StoredChunk{std::move(chunk), abs_sum});
    return true;
}

Utterance AudioBuffer::drain() {
    Utterance utterance;
    utterance.sample_rate = sample_rate_;
    utterance.mean_level = mean_level();
    utterance.samples.reserve(total_samples_);
    for (auto& stored : chunks_) {
        utterance.samples.insert(utterance.samples.end(),
                                 stored.chunk.samples.begin(), stored.chunk.samples.end());
    }

    chunks_.clear();
    total_samples_ = 0;
    total_abs_ = 0.0;
    return utterance;
}

void AudioBuffer::reset() {
    chunks_.clear();
    total_samples_ = 0;
    total_abs_ = 0.0;
    dropped_chunks_ = 0;
}

void AudioBuffer::trim_to_recent(int ms) {
    const size_t keep = audio::ms_to_samples(ms, sample_rate_);
    while (!chunks_.empty() && total_samples_ - chunks_.front().chunk.samples.size() >= keep) {
        total_samples_ -= chunks_.front().chunk.samples.size();
        total_abs_ -= chunks_.front().abs_sum;
        chunks_.pop_front();
    }
    if (chunks_.empty()) {
        total_abs_ = 0.0;
    }
}

int64_t AudioBuffer::duration_ms() const {
    return audio::samples_to_ms(total_samples_, sample_rate_);
}

float AudioBuffer::mean_level() const {
    if (total_samples_ == 0) return 0.0f;
    return static_cast<float>(total_abs_ / static_cast<double>(total_samples_));
}

} // namespace voice_relay
