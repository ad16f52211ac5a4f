#pragma once

/**
 * @file response_generator.h
 * @brief Language-generation collaborator interface
 *
 * Produces the outbound message for non-escalation phases. The state
 * machine bounds every call and substitutes the configured fallback phrase
 * on failure, so a generator never blocks phase progression.
 */

#include "common.h"
#include "errors.h"
#include "memory/conversation_memory.h"
#include <string>
#include <vector>

namespace carebridge {

struct GeneratedResponse {
    std::string text;
    bool resource_need = false;       ///< Generator asked for resources to be offered
    std::string resource_category;    ///< Optional hint ("crisis", "abuse", ...)
};

class IResponseGenerator {
public:
    virtual ~IResponseGenerator() = default;

    /**
     * @param phase Phase the reply is for (Triage, SupportLoop, Resources)
     * @param sanitized_context Redacted history, system prompt first, newest last
     */
    virtual Result<GeneratedResponse> generate(Phase phase,
                                               const std::vector<memory::ConversationMessage>& sanitized_context) = 0;

    virtual std::string name() const = 0;
};

} // namespace carebridge
