#pragma once

/**
 * @file protocol.h
 * @brief JSON frames exchanged with the browser client
 *
 * Client audio arrives as base64 float32 little-endian mono 16 kHz;
 * outbound audio leaves as base64 PCM16 little-endian with its rate.
 */

#include "core/types.h"
#include "turn_detector.h"
#include <optional>
#include <string>

namespace voice_relay {
namespace protocol {

enum class ClientMessageType {
    StartListening,
    Audio,
    StopListening,
    Cancel,
    Ping
};

const char* client_message_type_to_string(ClientMessageType type);

struct ClientMessage {
    ClientMessageType type = ClientMessageType::Ping;
    std::optional<bool> continuous;  ///< start_listening only
    FloatSamples samples;            ///< audio only
};

/**
 * @brief Parse one client frame
 *
 * Fails with ProtocolError for invalid JSON, a missing or unknown `type`,
 * a non-boolean `continuous`, or audio `data` that is not base64 of whole
 * float32 samples.
 */
Result<ClientMessage> parse_client_message(const std::string& raw);

// Server -> client frames
std::string transcript(const std::string& text, bool is_final);
std::string response_chunk(const std::string& text);
std::string audio_chunk(const Pcm16Buffer& pcm, int sample_rate);
std::string response_complete(const std::string& text);
std::string vad_status(bool speech_detected, TurnEvent event = TurnEvent::None);
std::string listening_started();
std::string listening_stopped();
std::string error(ErrorType type, const std::string& message, bool recoverable);
std::string pong();

} // namespace protocol
} // namespace voice_relay
