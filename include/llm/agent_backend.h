#pragma once

/**
 * @file agent_backend.h
 * @brief Agent (chat completion) capability consumed by the response pipeline
 */

#include "core/types.h"
#include "core/cancel_token.h"
#include <functional>
#include <string>
#include <vector>

namespace voice_relay {
namespace llm {

/// Receives each text fragment as it arrives; returning false stops the stream
using DeltaCallback = std::function<bool(const std::string& delta)>;

class IAgentBackend {
public:
    virtual ~IAgentBackend() = default;

    /**
     * @brief Stream a reply to `messages`
     * @return The full reply text (the concatenation of all deltas)
     */
    virtual Result<std::string> stream_chat(const std::vector<Message>& messages,
                                            const DeltaCallback& on_delta,
                                            const CancelToken& cancel) = 0;

    virtual std::string name() const = 0;
};

} // namespace llm
} // namespace voice_relay
