/**
 * Risk monitor.
 * Asserts:
 * - Keyword path severities, including immediacy and plan modifiers.
 * - Classifier results combine with the keyword path (max severity wins).
 * - A failed or slow classifier floors the verdict at MEDIUM and marks it degraded.
 * - Sustained MEDIUM verdicts raise to HIGH, but floored verdicts never count.
 */

#include "risk_monitor.h"
#include "test_fakes.h"
#include <chrono>
#include <iostream>
#include <string>

using namespace carebridge;
using namespace carebridge::testing;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static bool has_signal(const RiskVerdict& v, const std::string& prefix) {
    for (const auto& s : v.signals) {
        if (s.rfind(prefix, 0) == 0) return true;
    }
    return false;
}

static RiskVerdict medium_verdict(bool floored = false) {
    RiskVerdict v;
    v.severity = Severity::Medium;
    v.floored = floored;
    v.degraded = floored;
    return v;
}

int main() {
    RiskConfig config;
    config.classifier_timeout_ms = 200;

    // --- Keyword path ---
    {
        RiskMonitor monitor(config);
        ASSERT(!monitor.has_classifier());

        RiskVerdict none = monitor.assess("Work has been stressful but I'm managing.", {});
        ASSERT(none.severity == Severity::None);
        ASSERT(!none.degraded);
        ASSERT(none.source == "keyword");

        RiskVerdict self_harm = monitor.assess("I've been cutting myself again", {});
        ASSERT(self_harm.severity == Severity::Medium);
        ASSERT(has_signal(self_harm, "self_harm:"));

        RiskVerdict high = monitor.assess("Sometimes I want to die", {});
        ASSERT(high.severity == Severity::High);
        ASSERT(has_signal(high, "suicide:"));

        RiskVerdict critical = monitor.assess("Tonight I am going to kill myself", {});
        ASSERT(critical.severity == Severity::Critical);
        ASSERT(has_signal(critical, "pattern:immediate_risk"));

        // Typographic apostrophe and punctuation do not hide a phrase
        RiskVerdict curly = monitor.assess("I can\xE2\x80\x99t go on...", {});
        ASSERT(curly.severity == Severity::Medium);
        ASSERT(has_signal(curly, "crisis:"));

        // Ambiguity lowers confidence, not severity
        RiskVerdict plain = monitor.assess("I want to die", {});
        RiskVerdict joking = monitor.assess("I want to die, just kidding", {});
        ASSERT(joking.severity == plain.severity);
        ASSERT(joking.confidence < plain.confidence);
    }

    // --- Keyword overrides replace a category's phrases ---
    {
        RiskConfig custom = config;
        custom.keyword_overrides["abuse"] = {"locked me in"};
        RiskMonitor monitor(custom);
        ASSERT(monitor.assess("he locked me in the room", {}).severity == Severity::Medium);
        ASSERT(monitor.assess("he abused me", {}).severity == Severity::None);
    }

    // --- Classifier combination ---
    {
        auto classifier = std::make_shared<FakeClassifier>();
        classifier->severity = Severity::High;
        classifier->labels = {"hopelessness"};
        RiskMonitor monitor(config, classifier);
        ASSERT(monitor.has_classifier());

        RiskVerdict v = monitor.assess("nothing matters anymore", {});
        ASSERT(v.severity == Severity::High);
        ASSERT(v.source == "classifier");
        ASSERT(has_signal(v, "classifier:hopelessness"));
        ASSERT(!v.degraded);

        // Keyword path can still raise above the classifier
        classifier->severity = Severity::Low;
        RiskVerdict k = monitor.assess("Tonight I am going to kill myself", {});
        ASSERT(k.severity == Severity::Critical);
        ASSERT(classifier->calls == 2);
    }

    // --- Degraded classifier floors at MEDIUM ---
    {
        auto classifier = std::make_shared<FakeClassifier>();
        classifier->fail = true;
        RiskMonitor monitor(config, classifier);
        RiskVerdict v = monitor.assess("just a normal day", {});
        ASSERT(v.degraded);
        ASSERT(v.floored);
        ASSERT(v.severity == Severity::Medium);
        ASSERT(has_signal(v, "classifier_unavailable"));

        // Keyword HIGH survives a degraded classifier unchanged
        RiskVerdict high = monitor.assess("I want to die", {});
        ASSERT(high.degraded);
        ASSERT(!high.floored);
        ASSERT(high.severity == Severity::High);
    }
    {
        auto classifier = std::make_shared<FakeClassifier>();
        classifier->delay_ms = 1000;
        RiskMonitor monitor(config, classifier);
        auto start = std::chrono::steady_clock::now();
        RiskVerdict v = monitor.assess("just a normal day", {});
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        ASSERT(v.degraded);
        ASSERT(v.severity == Severity::Medium);
        ASSERT(elapsed < 900);
    }

    // --- Sustained risk ---
    {
        RiskMonitor monitor(config);
        RiskContext context;
        context.recent_verdicts = {medium_verdict(), medium_verdict()};
        RiskVerdict v = monitor.assess("I've been cutting myself again", context);
        ASSERT(v.severity == Severity::High);
        ASSERT(has_signal(v, "sustained_risk"));

        // One prior MEDIUM is not enough with a window of 3
        RiskContext short_context;
        short_context.recent_verdicts = {medium_verdict()};
        ASSERT(monitor.assess("I've been cutting myself again", short_context).severity == Severity::Medium);

        // Floors from degraded turns do not count as sustained risk
        RiskContext floored_context;
        floored_context.recent_verdicts = {medium_verdict(true), medium_verdict(true)};
        ASSERT(monitor.assess("I've been cutting myself again", floored_context).severity == Severity::Medium);

        RiskConfig disabled = config;
        disabled.sustained_window = 0;
        RiskMonitor no_sustain(disabled);
        ASSERT(no_sustain.assess("I've been cutting myself again", context).severity == Severity::Medium);
    }

    // --- Uninspectable content ---
    {
        RiskMonitor monitor(config);
        RiskVerdict v = monitor.uninspectable_verdict("input exceeds limit");
        ASSERT(v.severity == Severity::Medium);
        ASSERT(v.degraded);
        ASSERT(v.floored);
        ASSERT(has_signal(v, "content_uninspectable"));
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All risk monitor tests passed.\n";
    return 0;
}
