#pragma once

/**
 * @file providers.h
 * @brief Builds the configured STT, agent and TTS providers
 */

#include "core/config.h"
#include "session.h"

namespace voice_relay {

/**
 * @brief Local frame VAD built from the [vad] section
 */
vad::VADFactory make_vad_factory(const config::VADConfig& config);

/**
 * @brief Instantiate and warm up every provider named in the config
 *
 * Fails if a provider is unknown or cannot be made ready (missing model,
 * missing piper binary).
 */
Result<Providers> build_providers(const Config& config);

} // namespace voice_relay
