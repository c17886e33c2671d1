/**
 * @file conversation_memory.cpp
 * @brief Conversation memory implementation
 */

#include "memory/conversation_memory.h"
#include "logger.h"

namespace voice_relay {
namespace memory {

ConversationMemory::ConversationMemory(const ConversationConfig& config)
    : config_(config) {}

void ConversationMemory::add_user_message(const std::string& content) {
    add_message(Message::user(content));
}

void ConversationMemory::add_assistant_message(const std::string& content) {
    add_message(Message::assistant(content));
}

bool ConversationMemory::discard_unanswered() {
    if (messages_.empty() || messages_.back().role != MessageRole::User) return false;
    messages_.pop_back();
    return true;
}

void ConversationMemory::clear() {
    messages_.clear();
    LOG_LLM("Conversation history cleared");
}

std::vector<Message> ConversationMemory::get_messages() const {
    std::vector<Message> result;
    result.reserve(messages_.size() + 1);
    if (!config_.system_prompt.empty()) {
        result.push_back(Message::system(config_.system_prompt));
    }
    result.insert(result.end(), messages_.begin(), messages_.end());
    return result;
}

void ConversationMemory::add_message(Message message) {
    messages_.push_back(std::move(message));
    while (messages_.size() > config_.max_messages) {
        messages_.pop_front();
    }
}

} // namespace memory
} // namespace voice_relay
