#include "router.h"
#include "utils.h"
#include <algorithm>

namespace carebridge {

class IntentRouter::Impl {
public:
    Impl() {
        for (const char* p : {"yes", "yeah", "yep", "i consent", "i agree", "agreed", "okay", "ok", "sure",
                              "proceed", "continue", "go ahead", "ready", "let's start", "start", "begin"}) {
            append(consent_grant_, p);
        }
        for (const char* p : {"no", "nope", "i decline", "decline", "i don't consent", "don't consent",
                              "do not consent", "i disagree", "not now", "later", "maybe later", "no thanks",
                              "not ready", "don't want to", "do not want to"}) {
            append(consent_deny_, p);
        }
        for (const char* p : {"revoke consent", "revoke my consent", "withdraw consent", "withdraw my consent",
                              "i no longer consent", "i don't consent", "i do not consent"}) {
            append(revoke_, p);
        }
        for (const char* p : {"resources", "resource", "hotline", "helpline", "crisis line", "support line",
                              "who can i call", "who can i talk to", "phone number", "referral", "therapist",
                              "counselor", "counsellor", "professional help", "support group"}) {
            append(resources_, p);
        }
        for (const char* p : {"exit", "quit", "end session", "end the session", "stop session", "close session"}) {
            append(exit_, p);
        }
    }

    TurnIntent decide(const std::string& sanitized_text) const {
        TurnIntent intent;
        const std::string text = utils::fold_for_matching(sanitized_text);
        if (text.empty()) {
            return intent;
        }

        // Exit only when the whole turn is the command
        if (std::find(exit_.begin(), exit_.end(), text) != exit_.end()) {
            intent.wants_exit = true;
            intent.matched = text;
            return intent;
        }

        std::string grant = utils::first_phrase_match(text, consent_grant_);
        std::string deny = utils::first_phrase_match(text, consent_deny_);
        // A negated consent phrase wins over any grant vocabulary in the same turn
        if (!deny.empty() && deny.find("consent") != std::string::npos) {
            grant.clear();
        }
        if (!grant.empty() && deny.empty()) {
            intent.consent = true;
            intent.matched = grant;
        } else if (grant.empty() && !deny.empty()) {
            intent.consent = false;
            intent.matched = deny;
        }

        std::string revoke = utils::first_phrase_match(text, revoke_);
        if (!revoke.empty()) {
            intent.revokes_consent = true;
            intent.consent = false;
            intent.matched = revoke;
        }

        std::string resource = utils::first_phrase_match(text, resources_);
        if (!resource.empty()) {
            intent.wants_resources = true;
            if (intent.matched.empty()) intent.matched = resource;
        }
        return intent;
    }

    bool add_phrase(const std::string& intent, const std::string& phrase) {
        if (intent == "consent_grant") append(consent_grant_, phrase);
        else if (intent == "consent_deny") append(consent_deny_, phrase);
        else if (intent == "revoke") append(revoke_, phrase);
        else if (intent == "resources") append(resources_, phrase);
        else if (intent == "exit") append(exit_, phrase);
        else return false;
        return true;
    }

private:
    static void append(std::vector<std::string>& list, const std::string& phrase) {
        std::string normalized = utils::fold_for_matching(phrase);
        if (!normalized.empty()) {
            list.push_back(normalized);
        }
    }

    std::vector<std::string> consent_grant_;
    std::vector<std::string> consent_deny_;
    std::vector<std::string> revoke_;
    std::vector<std::string> resources_;
    std::vector<std::string> exit_;
};

IntentRouter::IntentRouter() : pimpl_(std::make_unique<Impl>()) {}
IntentRouter::~IntentRouter() = default;

TurnIntent IntentRouter::decide(const std::string& sanitized_text) const {
    return pimpl_->decide(sanitized_text);
}

bool IntentRouter::add_phrase(const std::string& intent, const std::string& phrase) {
    return pimpl_->add_phrase(intent, phrase);
}

} // namespace carebridge
