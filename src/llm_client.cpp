#include "llm_client.h"
#include "http_client.h"
#include "logger.h"
#include "utils.h"
#include <nlohmann/json.hpp>
#include <sstream>
#include <utility>

using json = nlohmann::json;

namespace voice_relay {

class LLMClient::Impl {
public:
    Impl(const config::AgentConfig& config, http::Transport transport)
        : config_(config), transport_(std::move(transport)) {
        http::global_init();
        std::ostringstream oss;
        oss << "Agent endpoint: " << config_.endpoint << ", model=" << config_.model;
        LOG_LLM(oss.str());
    }

    Result<std::string> stream_chat(const std::vector<Message>& messages,
                                    const llm::DeltaCallback& on_delta,
                                    const CancelToken& cancel) {
        auto start = Clock::now();
        std::string full_response;
        std::string line_buffer;
        bool stopped_by_caller = false;

        auto handle_line = [&](std::string line) -> bool {
            utils::trim(line);
            if (line.rfind("data:", 0) != 0) return true;  // comments, event names, blank lines
            std::string payload = utils::trim_copy(line.substr(5));
            auto delta = LLMClient::parse_stream_event(payload);
            if (!delta) return true;  // [DONE]
            if (delta->empty()) return true;
            full_response += *delta;
            if (on_delta && !on_delta(*delta)) {
                stopped_by_caller = true;
                return false;
            }
            return true;
        };

        http::Request request = make_request(messages, true);
        auto streamed = transport_(request, cancel, [&](const char* data, size_t len) {
            line_buffer.append(data, len);
            size_t newline;
            while ((newline = line_buffer.find('\n')) != std::string::npos) {
                std::string line = line_buffer.substr(0, newline);
                line_buffer.erase(0, newline + 1);
                if (!handle_line(std::move(line))) return false;
            }
            return true;
        });

        if (stopped_by_caller || cancel.is_canceled()) {
            return Result<std::string>::failure(make_canceled_error("Agent stream stopped"));
        }
        if (streamed.ok() && !line_buffer.empty()) {
            handle_line(line_buffer);
        }

        if (!utils::is_empty_or_whitespace(full_response)) {
            if (streamed.failed()) {
                // No retry once text was forwarded
                Logger::error("[LLM] Stream failed after " + std::to_string(full_response.size()) +
                              " chars: " + streamed.error);
                return Result<std::string>::failure(streamed.error, streamed.kind);
            }
            LOG_LLM("Streamed " + std::to_string(full_response.size()) + " chars in " +
                    std::to_string(ms_since(start)) + "ms");
            return Result<std::string>::success(full_response);
        }

        if (streamed.failed()) {
            Logger::warn("[LLM] Stream failed (" + streamed.error + "), retrying without streaming");
        } else {
            Logger::warn("[LLM] Stream returned no content, retrying without streaming");
        }

        auto once = complete_once(messages, cancel);
        if (once.failed()) {
            return once;
        }

        std::string text = *once.value;
        if (utils::is_empty_or_whitespace(text)) {
            text = constants::agent::FALLBACK_REPLY;
        }
        if (on_delta && !on_delta(text)) {
            return Result<std::string>::failure(make_canceled_error("Agent stream stopped"));
        }
        return Result<std::string>::success(text);
    }

    std::string build_request(const std::vector<Message>& messages, bool stream) const {
        json request;
        request["model"] = config_.model;
        request["messages"] = json::array();
        for (const auto& msg : messages) {
            request["messages"].push_back({{"role", role_to_string(msg.role)}, {"content", msg.content}});
        }
        request["max_tokens"] = config_.max_tokens;
        request["temperature"] = config_.temperature;
        request["stream"] = stream;
        return request.dump();
    }

private:
    http::Request make_request(const std::vector<Message>& messages, bool stream) const {
        http::Request request;
        request.url = config_.endpoint;
        request.headers = {"Content-Type: application/json", http::bearer_header(config_.api_key)};
        if (stream) request.headers.push_back("Accept: text/event-stream");
        request.body = build_request(messages, stream);
        request.timeout_ms = config_.timeout_ms;
        request.connect_timeout_ms = constants::agent::CONNECT_TIMEOUT_MS;
        return request;
    }

    Result<std::string> complete_once(const std::vector<Message>& messages, const CancelToken& cancel) {
        auto response = transport_(make_request(messages, false), cancel, nullptr);
        if (response.failed()) {
            LOG_LLM("Non-stream request failed: " + response.error);
            return Result<std::string>::failure(response.error, response.kind);
        }
        return LLMClient::parse_completion(response.value->body);
    }

    config::AgentConfig config_;
    http::Transport transport_;
};

LLMClient::LLMClient(const config::AgentConfig& config)
    : LLMClient(config, http::perform) {}

LLMClient::LLMClient(const config::AgentConfig& config, http::Transport transport)
    : pimpl_(std::make_unique<Impl>(config, std::move(transport))) {}

LLMClient::~LLMClient() = default;

Result<std::string> LLMClient::stream_chat(const std::vector<Message>& messages,
                                           const llm::DeltaCallback& on_delta,
                                           const CancelToken& cancel) {
    return pimpl_->stream_chat(messages, on_delta, cancel);
}

std::string LLMClient::build_request(const std::vector<Message>& messages, bool stream) const {
    return pimpl_->build_request(messages, stream);
}

std::optional<std::string> LLMClient::parse_stream_event(const std::string& payload) {
    if (payload == "[DONE]") return std::nullopt;
    try {
        json event = json::parse(payload);
        if (!event.contains("choices") || !event["choices"].is_array() || event["choices"].empty()) {
            return std::string();
        }
        const json& choice = event["choices"][0];
        if (choice.contains("delta") && choice["delta"].contains("content") &&
            choice["delta"]["content"].is_string()) {
            return choice["delta"]["content"].get<std::string>();
        }
    } catch (const json::exception& e) {
        LOG_LLM(std::string("Skipping malformed stream event: ") + e.what());
    }
    return std::string();
}

Result<std::string> LLMClient::parse_completion(const std::string& body) {
    try {
        json response = json::parse(body);
        if (!response.contains("choices") || !response["choices"].is_array() || response["choices"].empty()) {
            return Result<std::string>::failure("No choices in completion", ErrorType::ProviderError);
        }
        const json& message = response["choices"][0].value("message", json::object());
        if (message.contains("content") && message["content"].is_string()) {
            return Result<std::string>::success(utils::trim_copy(message["content"].get<std::string>()));
        }
        return Result<std::string>::success("");
    } catch (const json::exception& e) {
        return Result<std::string>::failure("JSON parse error: " + std::string(e.what()),
                                            ErrorType::ProviderError);
    }
}

} // namespace voice_relay
