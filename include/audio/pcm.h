#pragma once

/**
 * @file pcm.h
 * @brief Sample format conversion, resampling and WAV encoding
 */

#include "core/types.h"
#include <cstdint>
#include <string>
#include <vector>

namespace voice_relay {
namespace pcm {

/// Clamp to [-1, 1] and scale to int16
Pcm16Buffer float_to_pcm16(const FloatSamples& samples);

FloatSamples pcm16_to_float(const Pcm16Buffer& samples);

/**
 * @brief Interpret little-endian float32 bytes
 * @return nullopt if the byte count is not a multiple of 4
 */
std::optional<FloatSamples> floats_from_le_bytes(const std::vector<uint8_t>& bytes);

std::vector<uint8_t> pcm16_to_le_bytes(const Pcm16Buffer& samples);

/**
 * @brief Interpret little-endian int16 bytes; a trailing odd byte is ignored
 */
Pcm16Buffer pcm16_from_le_bytes(const uint8_t* data, size_t len);

/**
 * @brief Linear-interpolation resampler
 */
Pcm16Buffer resample(const Pcm16Buffer& input, int from_rate, int to_rate);

/// Scale samples by `gain`, saturating at the int16 range
void apply_gain(Pcm16Buffer& samples, float gain);

/// Mean absolute amplitude (0 for empty input)
float mean_abs(const FloatSamples& samples);

/// Root-mean-square amplitude of samples[begin, end)
float rms(const float* samples, size_t count);

/// 16-bit mono RIFF/WAVE file image
std::vector<uint8_t> encode_wav(const Pcm16Buffer& samples, int sample_rate);

} // namespace pcm
} // namespace voice_relay
