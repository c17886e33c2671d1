#include "audio/pcm.h"
#include <algorithm>
#include <cmath>
#include <cstring>

namespace voice_relay {
namespace pcm {

Pcm16Buffer float_to_pcm16(const FloatSamples& samples) {
    Pcm16Buffer out(samples.size());
    for (size_t i = 0; i < samples.size(); i++) {
        float s = std::clamp(samples[i], -1.0f, 1.0f);
        out[i] = static_cast<Sample>(std::lround(s * 32767.0f));
    }
    return out;
}

FloatSamples pcm16_to_float(const Pcm16Buffer& samples) {
    FloatSamples out(samples.size());
    for (size_t i = 0; i < samples.size(); i++) {
        out[i] = static_cast<float>(samples[i]) / 32768.0f;
    }
    return out;
}

std::optional<FloatSamples> floats_from_le_bytes(const std::vector<uint8_t>& bytes) {
    if (bytes.size() % 4 != 0) {
        return std::nullopt;
    }
    FloatSamples out(bytes.size() / 4);
    for (size_t i = 0; i < out.size(); i++) {
        uint32_t bits = uint32_t(bytes[i * 4]) |
                        (uint32_t(bytes[i * 4 + 1]) << 8) |
                        (uint32_t(bytes[i * 4 + 2]) << 16) |
                        (uint32_t(bytes[i * 4 + 3]) << 24);
        float value;
        std::memcpy(&value, &bits, sizeof(value));
        out[i] = std::isfinite(value) ? value : 0.0f;
    }
    return out;
}

std::vector<uint8_t> pcm16_to_le_bytes(const Pcm16Buffer& samples) {
    std::vector<uint8_t> out(samples.size() * 2);
    for (size_t i = 0; i < samples.size(); i++) {
        uint16_t v = static_cast<uint16_t>(samples[i]);
        out[i * 2] = static_cast<uint8_t>(v & 0xFF);
        out[i * 2 + 1] = static_cast<uint8_t>(v >> 8);
    }
    return out;
}

Pcm16Buffer pcm16_from_le_bytes(const uint8_t* data, size_t len) {
    Pcm16Buffer out(len / 2);
    for (size_t i = 0; i < out.size(); i++) {
        uint16_t v = static_cast<uint16_t>(data[i * 2]) |
                     static_cast<uint16_t>(data[i * 2 + 1] << 8);
        out[i] = static_cast<Sample>(v);
    }
    return out;
}

Pcm16Buffer resample(const Pcm16Buffer& input, int from_rate, int to_rate) {
    if (from_rate == to_rate || input.empty() || from_rate <= 0 || to_rate <= 0) {
        return input;
    }

    const double ratio = static_cast<double>(from_rate) / static_cast<double>(to_rate);
    const size_t output_samples = static_cast<size_t>(static_cast<double>(input.size()) / ratio);

    Pcm16Buffer output;
    output.reserve(output_samples);

    for (size_t i = 0; i < output_samples; i++) {
        double input_pos = static_cast<double>(i) * ratio;
        size_t idx0 = static_cast<size_t>(input_pos);
        if (idx0 >= input.size()) break;
        size_t idx1 = std::min(idx0 + 1, input.size() - 1);

        double t = input_pos - static_cast<double>(idx0);
        double interpolated = input[idx0] * (1.0 - t) + input[idx1] * t;
        output.push_back(static_cast<Sample>(std::lround(interpolated)));
    }

    return output;
}

void apply_gain(Pcm16Buffer& samples, float gain) {
    if (std::abs(gain - 1.0f) < 0.001f) return;

    for (auto& sample : samples) {
        float scaled = static_cast<float>(sample) * gain;
        sample = static_cast<Sample>(std::clamp(scaled, -32768.0f, 32767.0f));
    }
}

float mean_abs(const FloatSamples& samples) {
    if (samples.empty()) return 0.0f;
    double sum = 0.0;
    for (float s : samples) sum += std::fabs(s);
    return static_cast<float>(sum / static_cast<double>(samples.size()));
}

float rms(const float* samples, size_t count) {
    if (count == 0) return 0.0f;
    double sum_sq = 0.0;
    for (size_t i = 0; i < count; i++) {
        sum_sq += static_cast<double>(samples[i]) * samples[i];
    }
    return static_cast<float>(std::sqrt(sum_sq / static_cast<double>(count)));
}

std::vector<uint8_t> encode_wav(const Pcm16Buffer& samples, int sample_rate) {
    const uint32_t data_size = static_cast<uint32_t>(samples.size() * 2);
    std::vector<uint8_t> out;
    out.reserve(44 + data_size);

    auto put_u32 = [&](uint32_t v) {
        for (int i = 0; i < 4; i++) out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
    };
    auto put_u16 = [&](uint16_t v) {
        out.push_back(static_cast<uint8_t>(v & 0xFF));
        out.push_back(static_cast<uint8_t>(v >> 8));
    };
    auto put_tag = [&](const char* tag) { out.insert(out.end(), tag, tag + 4); };

    put_tag("RIFF");
    put_u32(36 + data_size);
    put_tag("WAVE");
    put_tag("fmt ");
    put_u32(16);                                   // PCM fmt chunk size
    put_u16(1);                                    // PCM
    put_u16(1);                                    // mono
    put_u32(static_cast<uint32_t>(sample_rate));
    put_u32(static_cast<uint32_t>(sample_rate) * 2);
    put_u16(2);                                    // block align
    put_u16(16);                                   // bits per sample
    put_tag("data");
    put_u32(data_size);

    auto bytes = pcm16_to_le_bytes(samples);
    out.insert(out.end(), bytes.begin(), bytes.end());
    return out;
}

} // namespace pcm
} // namespace voice_relay
