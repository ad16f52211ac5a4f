#pragma once

#include <optional>
#include <memory>
#include <string>
#include <vector>

namespace carebridge {

/**
 * @brief What a turn asks for, as far as phase guards are concerned
 */
struct TurnIntent {
    std::optional<bool> consent;   ///< true = grant, false = deny, empty = no clear answer
    bool wants_resources = false;
    bool wants_exit = false;
    bool revokes_consent = false;  ///< Explicit withdrawal, e.g. "I withdraw my consent"
    std::string matched;           ///< Phrase that decided the intent (fixed vocabulary, never user text)
};

/**
 * @brief Keyword router for phase guards
 *
 * Whole-word phrase matching over sanitized text. Consent is only read when
 * exactly one of grant/deny matches; anything else is no answer, so the
 * consent guard fails closed. Exit requires the whole turn to be an exit
 * command.
 */
class IntentRouter {
public:
    IntentRouter();
    ~IntentRouter();

    TurnIntent decide(const std::string& sanitized_text) const;

    /**
     * @brief Add a phrase for one of "consent_grant", "consent_deny", "revoke", "resources", "exit"
     * @return false for an unknown intent name
     */
    bool add_phrase(const std::string& intent, const std::string& phrase);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace carebridge
