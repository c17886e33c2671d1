#pragma once

#include "core/config.h"
#include "http_client.h"
#include "llm/agent_backend.h"
#include <memory>
#include <string>
#include <vector>

namespace voice_relay {

/**
 * @brief OpenAI-compatible chat completions client
 *
 * Streams with server-sent events. When the stream fails or ends before
 * any content was forwarded, the same messages are retried once without
 * streaming. A stream that fails after forwarding text is an error.
 */
class LLMClient : public llm::IAgentBackend {
public:
    explicit LLMClient(const config::AgentConfig& config);
    LLMClient(const config::AgentConfig& config, http::Transport transport);
    ~LLMClient() override;

    // Non-copyable
    LLMClient(const LLMClient&) = delete;
    LLMClient& operator=(const LLMClient&) = delete;

    Result<std::string> stream_chat(const std::vector<Message>& messages,
                                    const llm::DeltaCallback& on_delta,
                                    const CancelToken& cancel) override;

    std::string name() const override { return "openai-chat"; }

    /**
     * @brief Request body for `messages`
     */
    std::string build_request(const std::vector<Message>& messages, bool stream) const;

    /**
     * @brief Content of one SSE `data:` payload
     * @return Delta text (possibly empty), or nullopt for the [DONE] marker
     */
    static std::optional<std::string> parse_stream_event(const std::string& payload);

    /**
     * @brief Assistant content of a non-streamed completion
     */
    static Result<std::string> parse_completion(const std::string& body);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace voice_relay
