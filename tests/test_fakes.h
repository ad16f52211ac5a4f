#pragma once

/**
 * Scriptable collaborators shared by the session tests.
 * No network, no LLM; every fake counts its calls.
 */

#include "config.h"
#include "escalation_coordinator.h"
#include "event_ledger.h"
#include "redaction_gate.h"
#include "risk_monitor.h"
#include "router.h"
#include "state_machine.h"
#include "collaborators/handoff_service.h"
#include "collaborators/resource_directory.h"
#include "collaborators/response_generator.h"
#include "collaborators/risk_classifier.h"
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace carebridge {
namespace testing {

class FakeGenerator : public IResponseGenerator {
public:
    std::string reply = "I hear you. Tell me more.";
    bool fail = false;
    int delay_ms = 0;
    bool resource_need = false;
    std::string resource_category;
    std::atomic<int> calls{0};

    Result<GeneratedResponse> generate(Phase, const std::vector<memory::ConversationMessage>& context) override {
        calls++;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_context_ = context;
        }
        if (delay_ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        if (fail) return make_collaborator_error("generator offline");
        GeneratedResponse r;
        r.text = reply;
        r.resource_need = resource_need;
        r.resource_category = resource_category;
        return r;
    }

    std::string name() const override { return "fake_generator"; }

    std::vector<memory::ConversationMessage> last_context() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_context_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<memory::ConversationMessage> last_context_;
};

class FakeClassifier : public IRiskClassifier {
public:
    Severity severity = Severity::None;
    float confidence = 0.9f;
    std::vector<std::string> labels;
    bool fail = false;
    int delay_ms = 0;
    std::atomic<int> calls{0};

    Result<ClassifierVerdict> classify(const std::string&, const std::vector<std::string>&) override {
        calls++;
        if (delay_ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        if (fail) return make_collaborator_error("classifier offline");
        ClassifierVerdict v;
        v.severity = severity;
        v.confidence = confidence;
        v.labels = labels;
        return v;
    }

    std::string name() const override { return "fake_classifier"; }
};

/// Replays scripted outcomes in order; the last one repeats
class FakeHandoff : public IHandoffService {
public:
    struct Step {
        bool error = false;
        int delay_ms = 0;
        TransferStatus status = TransferStatus::Connected;
    };

    std::vector<Step> script = {Step{}};
    std::atomic<int> calls{0};

    Result<TransferOutcome> initiate(const std::string&) override {
        int n = calls++;
        Step step = script[std::min<size_t>(static_cast<size_t>(n), script.size() - 1)];
        if (step.delay_ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(step.delay_ms));
        if (step.error) return make_network_error("hand-off service unreachable");
        TransferOutcome out;
        out.status = step.status;
        out.reference = "xfer-" + std::to_string(n + 1);
        return out;
    }

    std::string name() const override { return "fake_handoff"; }
};

/// Fails the first `failures` calls, then delegates to a real coordinator
class FlakyCoordinator : public IEscalationCoordinator {
public:
    FlakyCoordinator(int failures, std::shared_ptr<IEscalationCoordinator> inner)
        : failures_(failures), inner_(std::move(inner)) {}

    Result<EscalationPlan> escalate(const std::string& session_id, Severity severity,
                                    const std::string& context_summary, const std::string& locale) override {
        int n = calls++;
        if (n < failures_ || !inner_) return make_collaborator_error("coordinator offline");
        return inner_->escalate(session_id, severity, context_summary, locale);
    }

    std::atomic<int> calls{0};

private:
    int failures_;
    std::shared_ptr<IEscalationCoordinator> inner_;
};

/// Fast timeouts so failure paths finish quickly
inline Config test_config() {
    Config config;
    config.generation.timeout_ms = 300;
    config.risk.classifier_timeout_ms = 200;
    config.escalation.attempt_timeout_ms = 200;
    config.escalation.max_attempts = 3;
    config.escalation.retry_interval_ms = 1000;
    config.escalation.retry_limit = 2;
    config.store.enabled = false;
    return config;
}

struct TestRig {
    Config config;
    SessionServices services;
    std::shared_ptr<FakeGenerator> generator;
    std::shared_ptr<FakeHandoff> handoff;
    std::shared_ptr<FakeClassifier> classifier;
};

/**
 * Real gate, monitor, router, ledger, directory and coordinator around fakes.
 * Pass with_generator=false for canned replies, with_handoff=false for directive-only escalation.
 */
inline TestRig make_rig(Config config = test_config(), bool with_generator = true, bool with_handoff = true,
                        bool with_classifier = false) {
    TestRig rig;
    rig.config = config;
    auto gate = std::make_shared<RedactionGate>(config.redaction.max_input_chars);
    rig.services.gate = gate;
    rig.services.ledger = std::make_shared<EventLedger>(gate);
    rig.services.router = std::make_shared<IntentRouter>();
    if (with_classifier) rig.classifier = std::make_shared<FakeClassifier>();
    rig.services.risk = std::make_shared<RiskMonitor>(config.risk, rig.classifier);
    auto directory = std::make_shared<StaticResourceDirectory>();
    rig.services.directory = directory;
    if (with_handoff) rig.handoff = std::make_shared<FakeHandoff>();
    rig.services.escalation = std::make_shared<EscalationCoordinator>(
        config.escalation, config.risk.emergency_threshold, rig.services.ledger, rig.handoff, directory);
    if (with_generator) {
        rig.generator = std::make_shared<FakeGenerator>();
        rig.services.generator = rig.generator;
    }
    return rig;
}

inline Session new_session(const std::string& id, const std::string& locale = "US") {
    Session s;
    s.id = id;
    s.metadata["locale"] = locale;
    s.created_at_ms = wall_clock_ms();
    s.last_activity_ms = s.created_at_ms;
    s.created_at = Clock::now();
    s.last_activity = s.created_at;
    s.phase_entered_at = s.created_at;
    return s;
}

inline TurnRequest turn(const std::string& text) {
    TurnRequest r;
    r.text = text;
    return r;
}

inline size_t count_kind(const std::vector<Event>& events, EventKind kind) {
    size_t n = 0;
    for (const auto& e : events) {
        if (e.kind == kind) n++;
    }
    return n;
}

/// Index of the first event of a kind, or -1
inline int index_of(const std::vector<Event>& events, EventKind kind, size_t from = 0) {
    for (size_t i = from; i < events.size(); ++i) {
        if (events[i].kind == kind) return static_cast<int>(i);
    }
    return -1;
}

} // namespace testing
} // namespace carebridge
