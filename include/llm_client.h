#pragma once

#include "common.h"
#include "config.h"
#include "collaborators/response_generator.h"
#include <memory>
#include <string>
#include <vector>

namespace carebridge {

/**
 * @brief Tool call structure from LLM response
 */
struct ToolCall {
    std::string id;           // Tool call ID from LLM
    std::string name;         // Tool name
    std::string arguments;    // JSON string of arguments
};

/**
 * @brief LLM response that may contain text or tool calls
 */
struct LLMResponse {
    std::string content;
    std::vector<ToolCall> tool_calls;
    bool has_tool_calls() const { return !tool_calls.empty(); }
    bool has_content() const { return !content.empty(); }
};

/**
 * @brief Response generator backed by an Ollama or llama.cpp server
 *
 * Endpoints containing "/api/chat" use the Ollama chat API with an
 * offer_resources tool; anything else is treated as a llama.cpp
 * /completion endpoint with a flattened prompt. The call blocks for at most
 * generation.timeout_ms; callers add their own bound on top.
 */
class LLMClient : public IResponseGenerator {
public:
    explicit LLMClient(const GenerationConfig& config);
    ~LLMClient() override;

    // Non-copyable
    LLMClient(const LLMClient&) = delete;
    LLMClient& operator=(const LLMClient&) = delete;

    Result<GeneratedResponse> generate(Phase phase,
                                       const std::vector<memory::ConversationMessage>& sanitized_context) override;

    std::string name() const override { return "llm"; }

    /// Phase-specific instruction appended to the system prompt
    static std::string phase_instruction(Phase phase);

    /// Trim, collapse whitespace, cap length
    static std::string clean_response(const std::string& response);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace carebridge
