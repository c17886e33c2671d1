#include "protocol.h"
#include "audio/pcm.h"
#include "utils.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace voice_relay {
namespace protocol {

namespace {

Result<ClientMessage> protocol_failure(const std::string& message) {
    return Result<ClientMessage>::failure(make_protocol_error(message));
}

/// Invalid UTF-8 from a provider is replaced rather than thrown on
std::string serialize(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string frame(const char* type) {
    json j;
    j["type"] = type;
    return serialize(j);
}

} // anonymous namespace

const char* client_message_type_to_string(ClientMessageType type) {
    switch (type) {
        case ClientMessageType::StartListening: return "start_listening";
        case ClientMessageType::Audio: return "audio";
        case ClientMessageType::StopListening: return "stop_listening";
        case ClientMessageType::Cancel: return "cancel";
        case ClientMessageType::Ping: return "ping";
    }
    return "ping";
}

Result<ClientMessage> parse_client_message(const std::string& raw) {
    json msg;
    try {
        msg = json::parse(raw);
    } catch (const json::parse_error& e) {
        return protocol_failure(std::string("Invalid JSON: ") + e.what());
    }

    if (!msg.is_object()) {
        return protocol_failure("Frame is not a JSON object");
    }
    if (!msg.contains("type") || !msg["type"].is_string()) {
        return protocol_failure("Missing message type");
    }

    const std::string type = msg["type"].get<std::string>();
    ClientMessage out;

    if (type == "start_listening") {
        out.type = ClientMessageType::StartListening;
        if (msg.contains("continuous") && !msg["continuous"].is_null()) {
            if (!msg["continuous"].is_boolean()) {
                return protocol_failure("'continuous' must be a boolean");
            }
            out.continuous = msg["continuous"].get<bool>();
        }
    } else if (type == "audio") {
        out.type = ClientMessageType::Audio;
        if (!msg.contains("data") || !msg["data"].is_string()) {
            return protocol_failure("Audio frame without string 'data'");
        }
        auto bytes = utils::base64_decode(msg["data"].get<std::string>());
        if (!bytes) {
            return protocol_failure("Audio 'data' is not valid base64");
        }
        auto samples = pcm::floats_from_le_bytes(*bytes);
        if (!samples) {
            return protocol_failure("Audio payload is not whole float32 samples (" +
                                    std::to_string(bytes->size()) + " bytes)");
        }
        out.samples = std::move(*samples);
    } else if (type == "stop_listening") {
        out.type = ClientMessageType::StopListening;
    } else if (type == "cancel") {
        out.type = ClientMessageType::Cancel;
    } else if (type == "ping") {
        out.type = ClientMessageType::Ping;
    } else {
        return protocol_failure("Unknown message type: " + type);
    }

    return Result<ClientMessage>::success(std::move(out));
}

std::string transcript(const std::string& text, bool is_final) {
    json j;
    j["type"] = "transcript";
    j["text"] = text;
    j["final"] = is_final;
    return serialize(j);
}

std::string response_chunk(const std::string& text) {
    json j;
    j["type"] = "response_chunk";
    j["text"] = text;
    return serialize(j);
}

std::string audio_chunk(const Pcm16Buffer& pcm, int sample_rate) {
    auto bytes = pcm::pcm16_to_le_bytes(pcm);
    json j;
    j["type"] = "audio_chunk";
    j["data"] = utils::base64_encode(bytes.data(), bytes.size());
    j["sample_rate"] = sample_rate;
    return serialize(j);
}

std::string response_complete(const std::string& text) {
    json j;
    j["type"] = "response_complete";
    j["text"] = text;
    return serialize(j);
}

std::string vad_status(bool speech_detected, TurnEvent event) {
    json j;
    j["type"] = "vad_status";
    j["speech_detected"] = speech_detected;
    if (event != TurnEvent::None) {
        j["event"] = turn_event_to_string(event);
    }
    return serialize(j);
}

std::string listening_started() {
    return frame("listening_started");
}

std::string listening_stopped() {
    return frame("listening_stopped");
}

std::string error(ErrorType type, const std::string& message, bool recoverable) {
    json j;
    j["type"] = "error";
    j["code"] = error_code(type);
    j["message"] = message;
    j["recoverable"] = recoverable;
    return serialize(j);
}

std::string pong() {
    return frame("pong");
}

} // namespace protocol
} // namespace voice_relay
