/**
 * Intent router for phase guards.
 * Asserts:
 * - Clear grants and denials are read; mixed or missing answers are not.
 * - Negated consent wins over grant words.
 * - Revocation, resource requests and exit commands are recognized.
 */

#include "router.h"
#include <iostream>
#include <string>

using namespace carebridge;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

int main() {
    IntentRouter router;

    // --- Consent ---
    {
        TurnIntent yes = router.decide("Yes, I consent.");
        ASSERT(yes.consent.has_value());
        ASSERT(*yes.consent);
        ASSERT(!yes.wants_exit);

        TurnIntent ok = router.decide("ok let's start");
        ASSERT(ok.consent.has_value() && *ok.consent);

        TurnIntent no = router.decide("No thanks");
        ASSERT(no.consent.has_value());
        ASSERT(!*no.consent);

        TurnIntent negated = router.decide("I do not consent, continue without me");
        ASSERT(negated.consent.has_value());
        ASSERT(!*negated.consent);

        // Grant and deny in one turn is no answer
        TurnIntent mixed = router.decide("yes... actually no");
        ASSERT(!mixed.consent.has_value());

        TurnIntent missing = router.decide("what is this?");
        ASSERT(!missing.consent.has_value());
        ASSERT(missing.matched.empty());

        ASSERT(!router.decide("").consent.has_value());

        // Whole words only
        ASSERT(!router.decide("yesterday was hard").consent.has_value());
    }

    // --- Revocation ---
    {
        TurnIntent revoke = router.decide("I want to withdraw my consent");
        ASSERT(revoke.revokes_consent);
        ASSERT(revoke.consent.has_value() && !*revoke.consent);

        ASSERT(!router.decide("no, that's not what I meant").revokes_consent);
    }

    // --- Resources ---
    {
        ASSERT(router.decide("Is there a hotline I could call?").wants_resources);
        ASSERT(router.decide("who can I talk to").wants_resources);
        ASSERT(!router.decide("I talked to my sister").wants_resources);
    }

    // --- Exit ---
    {
        ASSERT(router.decide("exit").wants_exit);
        ASSERT(router.decide("/exit").wants_exit);
        ASSERT(router.decide("  End Session ").wants_exit);
        // Only when the whole turn is the command
        ASSERT(!router.decide("I want to exit this relationship").wants_exit);
    }

    // --- Custom phrases ---
    {
        IntentRouter custom;
        ASSERT(!custom.decide("si").consent.has_value());
        ASSERT(custom.add_phrase("consent_grant", "si"));
        ASSERT(custom.decide("si").consent.has_value() && *custom.decide("si").consent);
        ASSERT(custom.add_phrase("exit", "adios"));
        ASSERT(custom.decide("adios").wants_exit);
        ASSERT(!custom.add_phrase("bogus", "x"));
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All router tests passed.\n";
    return 0;
}
