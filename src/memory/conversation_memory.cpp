#include "memory/conversation_memory.h"
#include "logger.h"
#include <algorithm>

namespace carebridge {
namespace memory {

const char* role_name(MessageRole role) {
    return role == MessageRole::Assistant ? "assistant" : "user";
}

ConversationMessage ConversationMessage::user(const std::string& content, int turn) {
    ConversationMessage msg;
    msg.role = MessageRole::User;
    msg.content = content;
    msg.turn = turn;
    return msg;
}

ConversationMessage ConversationMessage::assistant(const std::string& content, int turn) {
    ConversationMessage msg;
    msg.role = MessageRole::Assistant;
    msg.content = content;
    msg.turn = turn;
    return msg;
}

ConversationMemory::ConversationMemory(const ConversationConfig& config) : config_(config) {
    if (config_.max_messages == 0) config_.max_messages = 1;
}

void ConversationMemory::add_user_message(const std::string& sanitized) {
    push(ConversationMessage::user(sanitized, ++turn_));
}

void ConversationMemory::add_assistant_message(const std::string& content) {
    push(ConversationMessage::assistant(content, turn_));
}

void ConversationMemory::clear() {
    messages_.clear();
    total_chars_ = 0;
    turn_ = 0;
}

std::vector<ConversationMessage> ConversationMemory::get_recent_messages(size_t n) const {
    const size_t from = messages_.size() > n ? messages_.size() - n : 0;
    return std::vector<ConversationMessage>(messages_.begin() + static_cast<std::ptrdiff_t>(from), messages_.end());
}

std::vector<std::string> ConversationMemory::recent_user_turns(size_t n) const {
    std::vector<std::string> turns;
    for (auto it = messages_.rbegin(); it != messages_.rend() && turns.size() < n; ++it) {
        if (it->role == MessageRole::User) turns.push_back(it->content);
    }
    std::reverse(turns.begin(), turns.end());
    return turns;
}

void ConversationMemory::push(ConversationMessage message) {
    total_chars_ += message.content.size();
    messages_.push_back(std::move(message));

    size_t dropped = 0;
    // The newest message always stays, even alone over budget
    while (messages_.size() > 1 &&
           (messages_.size() > config_.max_messages || total_chars_ > config_.max_chars)) {
        total_chars_ -= messages_.front().content.size();
        messages_.pop_front();
        dropped++;
    }
    if (dropped > 0) {
        LOG_DEBUG("Transcript window dropped " + std::to_string(dropped) + " message(s), turn " +
                  std::to_string(turn_));
    }
}

} // namespace memory
} // namespace carebridge
