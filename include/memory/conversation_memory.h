#pragma once

/**
 * @file conversation_memory.h
 * @brief Per-session conversation history
 *
 * Bounded to the most recent `max_messages` user/assistant messages. The
 * system prompt is not counted and is always sent first.
 */

#include "core/types.h"
#include "core/constants.h"
#include <deque>
#include <string>
#include <vector>

namespace voice_relay {
namespace memory {

struct ConversationConfig {
    /// Maximum messages to keep in history
    size_t max_messages = constants::agent::MAX_HISTORY_MESSAGES;

    /// System prompt (empty = none)
    std::string system_prompt;
};

class ConversationMemory {
public:
    explicit ConversationMemory(const ConversationConfig& config = {});

    void add_user_message(const std::string& content);
    void add_assistant_message(const std::string& content);

    /**
     * @brief Drop a trailing user message that never got a reply
     * @return true if one was removed
     */
    bool discard_unanswered();

    /// Clear all messages (except system prompt)
    void clear();

    /// System prompt followed by the retained history
    std::vector<Message> get_messages() const;

    /// Message count (excluding system prompt)
    size_t message_count() const { return messages_.size(); }

    bool is_empty() const { return messages_.empty(); }

    const std::string& system_prompt() const { return config_.system_prompt; }

private:
    void add_message(Message message);

    ConversationConfig config_;
    std::deque<Message> messages_;
};

} // namespace memory
} // namespace voice_relay
