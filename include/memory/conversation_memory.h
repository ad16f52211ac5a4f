#pragma once

/**
 * @file conversation_memory.h
 * @brief Sanitized per-session transcript window
 *
 * Holds redacted user turns and the replies sent back, bounded by message
 * count and total characters. Feeds the risk monitor's recent-turn context
 * and the generator's chat context. Rebuilt from the event stream on
 * restore, never persisted on its own.
 *
 * Not thread-safe; the owning session's lock guards it.
 */

#include "core/constants.h"
#include <cstdint>
#include <deque>
#include <string>
#include <vector>

namespace carebridge {
namespace memory {

enum class MessageRole {
    User,
    Assistant
};

const char* role_name(MessageRole role);

struct ConversationConfig {
    size_t max_messages = constants::memory::MAX_HISTORY_MESSAGES;
    size_t max_chars = constants::memory::MAX_HISTORY_CHARS;
};

struct ConversationMessage {
    MessageRole role = MessageRole::User;
    std::string content;  ///< Sanitized
    int turn = 0;         ///< Session turn this message belongs to (0 = unknown)

    static ConversationMessage user(const std::string& content, int turn = 0);
    static ConversationMessage assistant(const std::string& content, int turn = 0);
};

class ConversationMemory {
public:
    explicit ConversationMemory(const ConversationConfig& config = {});

    /// Starts a new turn
    void add_user_message(const std::string& sanitized);

    /// Reply to the current turn
    void add_assistant_message(const std::string& content);

    void clear();

    /// Last n messages, oldest first
    std::vector<ConversationMessage> get_recent_messages(size_t n) const;

    /// Content of the last n user messages, oldest first
    std::vector<std::string> recent_user_turns(size_t n) const;

    size_t size() const { return messages_.size(); }
    size_t total_chars() const { return total_chars_; }
    int current_turn() const { return turn_; }

private:
    void push(ConversationMessage message);

    ConversationConfig config_;
    std::deque<ConversationMessage> messages_;
    size_t total_chars_ = 0;
    int turn_ = 0;
};

} // namespace memory
} // namespace carebridge
