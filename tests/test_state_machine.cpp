/**
 * Session state machine.
 * Asserts:
 * - Consent gates everything; a denial keeps the session in INIT.
 * - Triage hands over to the support loop, degraded when the generator fails.
 * - HIGH/CRITICAL verdicts fast-path to ESCALATE from any phase, ahead of exit and message cap.
 * - Exit, consent revocation and the message cap close the session, exit and revocation also during an unresolved escalation.
 * - Consent, triage and escalation-retry timers fire from on_tick().
 * - Replay rebuilds state and rejects tampered streams.
 */

#include "state_machine.h"
#include "test_fakes.h"
#include <iostream>
#include <memory>
#include <string>

using namespace carebridge;
using namespace carebridge::testing;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static std::unique_ptr<SessionStateMachine> make_machine(const TestRig& rig, const std::string& id,
                                                         const std::string& locale = "US") {
    auto machine = std::make_unique<SessionStateMachine>(new_session(id, locale), rig.config, rig.services);
    machine->start();
    return machine;
}

static bool consent(SessionStateMachine& machine) {
    auto r = machine.handle_turn(turn("yes"));
    return r.is_ok() && r.value().phase == Phase::Triage;
}

/// Consent plus one triage turn, leaving the session in the support loop
static bool to_support(SessionStateMachine& machine) {
    if (!consent(machine)) return false;
    auto r = machine.handle_turn(turn("Work has been a lot lately."));
    return r.is_ok() && r.value().phase == Phase::SupportLoop;
}

static TimePoint later(int ms) {
    return Clock::now() + std::chrono::milliseconds(ms);
}

int main() {
    // --- Transition table ---
    {
        ASSERT(SessionStateMachine::is_legal_transition(Phase::Init, Phase::Consented));
        ASSERT(SessionStateMachine::is_legal_transition(Phase::Init, Phase::Escalate));
        ASSERT(SessionStateMachine::is_legal_transition(Phase::SupportLoop, Phase::Resources));
        ASSERT(SessionStateMachine::is_legal_transition(Phase::Resources, Phase::SupportLoop));
        ASSERT(SessionStateMachine::is_legal_transition(Phase::Escalate, Phase::Close));
        ASSERT(!SessionStateMachine::is_legal_transition(Phase::Init, Phase::SupportLoop));
        ASSERT(!SessionStateMachine::is_legal_transition(Phase::Escalate, Phase::SupportLoop));
        ASSERT(!SessionStateMachine::is_legal_transition(Phase::Close, Phase::Init));
        ASSERT(!SessionStateMachine::is_legal_transition(Phase::Triage, Phase::Consented));
    }

    // --- Consent denied or missing keeps INIT ---
    {
        TestRig rig = make_rig();
        auto m = make_machine(rig, "deny");

        auto missing = m->handle_turn(turn("what is this?"));
        ASSERT(missing.is_ok());
        ASSERT(missing.value().phase == Phase::Init);
        ASSERT(!missing.value().response.empty());

        auto denied = m->handle_turn(turn("no"));
        ASSERT(denied.is_ok());
        ASSERT(denied.value().phase == Phase::Init);
        ASSERT(!m->session().consented);

        auto events = rig.services.ledger->replay("deny");
        ASSERT(count_kind(events, EventKind::GuardViolation) == 2);
        ASSERT(count_kind(events, EventKind::PhaseTransition) == 0);
        int last_guard = -1;
        for (size_t i = 0; i < events.size(); ++i) {
            if (events[i].kind == EventKind::GuardViolation) last_guard = static_cast<int>(i);
        }
        ASSERT(last_guard >= 0 && events[last_guard].payload["reason"] == "consent_denied");
        ASSERT(rig.generator->calls == 0);
    }

    // --- Consent, triage, support ---
    {
        TestRig rig = make_rig();
        auto m = make_machine(rig, "happy");
        ASSERT(consent(*m));
        ASSERT(m->session().consented);

        auto triage = m->handle_turn(turn("I've been having trouble sleeping since the move"));
        ASSERT(triage.is_ok());
        ASSERT(triage.value().phase == Phase::SupportLoop);
        ASSERT(triage.value().response == rig.generator->reply);
        ASSERT(!m->session().triage_summary.empty());
        ASSERT(!m->session().triage_degraded);

        auto support = m->handle_turn(turn("It's mostly the noise at night"));
        ASSERT(support.is_ok());
        ASSERT(support.value().phase == Phase::SupportLoop);
        ASSERT(support.value().turn == 3);
        ASSERT(support.value().first_sequence <= support.value().last_sequence);
        ASSERT(rig.generator->calls == 2);

        // Generation sees sanitized history only
        bool saw_turn = false;
        for (const auto& msg : rig.generator->last_context()) {
            if (msg.content.find("noise at night") != std::string::npos) saw_turn = true;
        }
        ASSERT(saw_turn);

        auto events = rig.services.ledger->replay("happy");
        ASSERT(events.front().kind == EventKind::SessionCreated);
        // Every support-loop turn carries the risk check marker
        int assessed = -1;
        for (size_t i = 0; i < events.size(); ++i) {
            if (events[i].kind == EventKind::RiskAssessed && events[i].payload.contains("check")) {
                assessed = static_cast<int>(i);
            }
        }
        ASSERT(assessed >= 0);
        ASSERT(events[assessed].payload["check"] == "RISK_CHECK");

        // Per-turn order: turn.received, then risk, then the reply
        int received = index_of(events, EventKind::TurnReceived, events.size() - 4);
        ASSERT(received >= 0);
        ASSERT(events[received + 1].kind == EventKind::RiskAssessed);
        ASSERT(events.back().kind == EventKind::ResponseGenerated);
    }

    // --- Raw identifiers never reach the ledger ---
    {
        TestRig rig = make_rig();
        auto m = make_machine(rig, "pii");
        ASSERT(consent(*m));
        auto r = m->handle_turn(turn("My name is Dana Whitfield, email dana@example.com"));
        ASSERT(r.is_ok());
        ASSERT(r.value().sanitized_text.find("dana@example.com") == std::string::npos);
        for (const auto& e : rig.services.ledger->replay("pii")) {
            ASSERT(e.payload.dump().find("dana@example.com") == std::string::npos);
            ASSERT(e.payload.dump().find("Whitfield") == std::string::npos);
        }
    }

    // --- Generator failure falls back and degrades triage ---
    {
        TestRig rig = make_rig();
        rig.generator->fail = true;
        auto m = make_machine(rig, "nogen");
        ASSERT(consent(*m));
        auto r = m->handle_turn(turn("things are rough"));
        ASSERT(r.is_ok());
        ASSERT(r.value().phase == Phase::SupportLoop);
        ASSERT(r.value().response == rig.config.generation.fallback_phrase);
        ASSERT(m->session().triage_degraded);

        auto slow = m->handle_turn(turn("still rough"));
        ASSERT(slow.is_ok());
        ASSERT(slow.value().response == rig.config.generation.fallback_phrase);

        auto events = rig.services.ledger->replay("nogen");
        ASSERT(count_kind(events, EventKind::CollaboratorDegraded) == 2);
        bool triage_degraded = false;
        for (const auto& e : events) {
            if (e.kind == EventKind::PhaseTransition && e.payload.value("reason", "") == "triage_degraded") {
                triage_degraded = true;
            }
        }
        ASSERT(triage_degraded);
    }
    {
        TestRig rig = make_rig();
        rig.generator->delay_ms = 800;
        auto m = make_machine(rig, "slowgen");
        ASSERT(consent(*m));
        auto start = Clock::now();
        auto r = m->handle_turn(turn("hello"));
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
        ASSERT(r.is_ok());
        ASSERT(r.value().response == rig.config.generation.fallback_phrase);
        ASSERT(elapsed < 700);
    }

    // --- Fast-path from INIT: directive before the first hand-off attempt ---
    {
        TestRig rig = make_rig();
        auto m = make_machine(rig, "crit");
        auto r = m->handle_turn(turn("Tonight I am going to kill myself"));
        ASSERT(r.is_ok());
        ASSERT(r.value().escalated);
        ASSERT(r.value().verdict.severity == Severity::Critical);
        ASSERT(r.value().escalation.has_value());
        ASSERT(r.value().response.find("911") != std::string::npos);
        ASSERT(r.value().closed);
        ASSERT(r.value().close_reason == "escalation_completed");
        ASSERT(rig.generator->calls == 0);

        auto events = rig.services.ledger->replay("crit");
        int to_escalate = -1;
        for (size_t i = 0; i < events.size(); ++i) {
            if (events[i].kind == EventKind::PhaseTransition && events[i].payload["to"] == "ESCALATE") {
                to_escalate = static_cast<int>(i);
                break;
            }
        }
        int risk = index_of(events, EventKind::RiskAssessed);
        int directive = index_of(events, EventKind::EscalationDirective);
        int attempt = index_of(events, EventKind::EscalationAttempt);
        ASSERT(risk >= 0 && to_escalate == risk + 1);
        ASSERT(directive > to_escalate);
        ASSERT(attempt > directive);
        ASSERT(events.back().kind == EventKind::SessionClosed);
        ASSERT(rig.services.ledger->is_archived("crit"));
    }

    // --- Fast-path from the support loop ---
    {
        TestRig rig = make_rig();
        auto m = make_machine(rig, "crit-loop");
        ASSERT(to_support(*m));
        const size_t before = rig.services.ledger->replay("crit-loop").size();
        auto r = m->handle_turn(turn("Tonight I am going to kill myself"));
        ASSERT(r.is_ok());
        ASSERT(r.value().escalated);
        ASSERT(r.value().verdict.severity == Severity::Critical);
        ASSERT(r.value().response.find("911") != std::string::npos);
        ASSERT(r.value().close_reason == "escalation_completed");

        auto events = rig.services.ledger->replay("crit-loop");
        int risk = index_of(events, EventKind::RiskAssessed, before);
        ASSERT(risk >= 0);
        ASSERT(events[risk].payload["check"] == "RISK_CHECK");
        ASSERT(static_cast<size_t>(risk + 1) < events.size());
        ASSERT(events[risk + 1].kind == EventKind::PhaseTransition);
        ASSERT(events[risk + 1].payload["from"] == "SUPPORT_LOOP");
        ASSERT(events[risk + 1].payload["to"] == "ESCALATE");
        int directive = index_of(events, EventKind::EscalationDirective, before);
        int attempt = index_of(events, EventKind::EscalationAttempt, before);
        ASSERT(directive > risk + 1);
        ASSERT(attempt > directive);
    }

    // --- Classifier timeout degrades the verdict, the loop carries on ---
    {
        TestRig rig = make_rig(test_config(), true, true, true);
        auto m = make_machine(rig, "slow-classifier");
        ASSERT(to_support(*m));
        rig.classifier->delay_ms = 1000;
        const size_t before = rig.services.ledger->replay("slow-classifier").size();

        auto start = Clock::now();
        auto r = m->handle_turn(turn("just an ordinary afternoon"));
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
        ASSERT(r.is_ok());
        ASSERT(elapsed < 700);
        ASSERT(r.value().phase == Phase::SupportLoop);
        ASSERT(!r.value().escalated);
        ASSERT(r.value().verdict.degraded);
        ASSERT(r.value().verdict.severity == Severity::Medium);
        ASSERT(r.value().response == rig.generator->reply);

        auto events = rig.services.ledger->replay("slow-classifier");
        int degraded = index_of(events, EventKind::RiskDegraded, before);
        ASSERT(degraded >= 0);
        ASSERT(events[degraded].payload["verdict"]["severity"] == "medium");
        ASSERT(index_of(events, EventKind::PhaseTransition, before) < 0);
    }

    // --- Fast-path beats exit and message cap ---
    {
        Config config = test_config();
        config.session.max_messages = 2;
        TestRig rig = make_rig(config);
        auto m = make_machine(rig, "beats");
        ASSERT(consent(*m));
        TurnRequest req = turn("I want to die");
        req.request_exit = true;
        auto r = m->handle_turn(req);
        ASSERT(r.is_ok());
        ASSERT(r.value().escalated);
        ASSERT(r.value().close_reason != "user_exit");
        ASSERT(r.value().close_reason != "message_cap");
        ASSERT(rig.handoff->calls >= 1);
    }

    // --- Sustained MEDIUM escalates ---
    {
        TestRig rig = make_rig();
        auto m = make_machine(rig, "sustained");
        ASSERT(consent(*m));
        auto a = m->handle_turn(turn("I've been cutting myself again"));
        auto b = m->handle_turn(turn("I've been cutting myself again"));
        ASSERT(a.is_ok() && !a.value().escalated);
        ASSERT(b.is_ok() && !b.value().escalated);
        auto c = m->handle_turn(turn("I've been cutting myself again"));
        ASSERT(c.is_ok());
        ASSERT(c.value().verdict.severity == Severity::High);
        ASSERT(c.value().escalated);
    }

    // --- Exit and revocation ---
    {
        TestRig rig = make_rig();
        auto m = make_machine(rig, "bye");
        ASSERT(to_support(*m));
        auto r = m->handle_turn(turn("exit"));
        ASSERT(r.is_ok());
        ASSERT(r.value().closed);
        ASSERT(r.value().close_reason == "user_exit");
        ASSERT(m->is_closed());

        auto after = m->handle_turn(turn("hello?"));
        ASSERT(after.is_error());
        ASSERT(after.error().type == ErrorType::SessionClosed);
        ASSERT(m->session().message_count == 3);
        ASSERT(m->force_close("again").is_error());
    }
    {
        Config config = test_config();
        config.redaction.reversible_tokens = true;
        TestRig rig = make_rig(config);
        auto m = make_machine(rig, "revoke");
        ASSERT(to_support(*m));
        auto mail = m->handle_turn(turn("you can reach me at jo@example.com"));
        ASSERT(mail.is_ok());
        ASSERT(m->vault().size() == 1);
        auto r = m->handle_turn(turn("I want to withdraw my consent"));
        ASSERT(r.is_ok());
        ASSERT(r.value().close_reason == "consent_revoked");
        ASSERT(m->vault().size() == 0);
        ASSERT(m->session().consented);
    }

    // --- Message cap ---
    {
        Config config = test_config();
        config.session.max_messages = 3;
        TestRig rig = make_rig(config);
        auto m = make_machine(rig, "cap");
        ASSERT(to_support(*m));
        auto r = m->handle_turn(turn("one more thing"));
        ASSERT(r.is_ok());
        ASSERT(r.value().closed);
        ASSERT(r.value().close_reason == "message_cap");
        auto events = rig.services.ledger->replay("cap");
        ASSERT(events.back().kind == EventKind::SessionClosed);
        ASSERT(events.back().payload["message_count"] == 3);
    }

    // --- Resources ---
    {
        TestRig rig = make_rig();
        auto m = make_machine(rig, "res");
        ASSERT(to_support(*m));
        TurnRequest req = turn("ok");
        req.request_resources = true;
        auto r = m->handle_turn(req);
        ASSERT(r.is_ok());
        ASSERT(r.value().phase == Phase::SupportLoop);
        ASSERT(r.value().resources.has_value());
        ASSERT(!r.value().resources->empty());
        ASSERT(r.value().response.find("988") != std::string::npos);

        auto events = rig.services.ledger->replay("res");
        int delivered = index_of(events, EventKind::ResourceDelivered);
        ASSERT(delivered >= 0);
        ASSERT(events[delivered].payload["count"].get<int>() > 0);
        ASSERT(events[delivered - 1].kind == EventKind::PhaseTransition);
        ASSERT(events[delivered - 1].payload["to"] == "RESOURCES");
        ASSERT(events[delivered + 1].payload["to"] == "SUPPORT_LOOP");
    }
    {
        // Generator asks for resources alongside its reply
        TestRig rig = make_rig();
        auto m = make_machine(rig, "resgen");
        ASSERT(to_support(*m));
        rig.generator->resource_need = true;
        rig.generator->resource_category = "abuse";
        auto r = m->handle_turn(turn("he keeps yelling at me"));
        ASSERT(r.is_ok());
        ASSERT(r.value().resources.has_value());
        ASSERT(r.value().resources->category == "abuse");
        ASSERT(r.value().response.rfind(rig.generator->reply, 0) == 0);
    }

    // --- Consent timeout ---
    {
        Config config = test_config();
        config.session.consent_timeout_ms = 1000;
        TestRig rig = make_rig(config);
        auto m = make_machine(rig, "silent");
        ASSERT(!m->on_tick(Clock::now()));
        ASSERT(m->on_tick(later(2000)));
        ASSERT(m->is_closed());
        ASSERT(m->session().close_reason == "consent_timeout");
        ASSERT(!m->on_tick(later(4000)));
    }

    // --- Triage timeout ---
    {
        Config config = test_config();
        config.session.triage_timeout_ms = 1000;
        TestRig rig = make_rig(config);
        auto m = make_machine(rig, "slowtriage");
        ASSERT(consent(*m));
        ASSERT(m->on_tick(later(2000)));
        ASSERT(m->phase() == Phase::SupportLoop);
        ASSERT(m->session().triage_degraded);
    }

    // --- Unresolved escalation is retried on schedule ---
    {
        TestRig rig = make_rig();
        auto coordinator = std::make_shared<FlakyCoordinator>(1, rig.services.escalation);
        rig.services.escalation = coordinator;
        auto m = make_machine(rig, "retry");
        auto r = m->handle_turn(turn("Tonight I am going to kill myself"));
        ASSERT(r.is_ok());
        ASSERT(r.value().phase == Phase::Escalate);
        ASSERT(!r.value().closed);
        ASSERT(m->session().escalation_unresolved);
        ASSERT(r.value().escalation.has_value());
        ASSERT(r.value().response.find("911") != std::string::npos);

        // Turns during ESCALATE are assessed but trigger nothing
        auto during = m->handle_turn(turn("hello?"));
        ASSERT(during.is_ok());
        ASSERT(during.value().phase == Phase::Escalate);
        ASSERT(!during.value().escalated);

        ASSERT(!m->on_tick(Clock::now()));
        ASSERT(m->on_tick(later(1500)));
        ASSERT(coordinator->calls == 2);
        ASSERT(m->is_closed());
        ASSERT(m->session().close_reason == "escalation_completed");
        ASSERT(m->session().escalation->retry_rounds == 1);

        auto events = rig.services.ledger->replay("retry");
        ASSERT(count_kind(events, EventKind::EscalationUnresolved) == 1);
        int recorded_only = -1;
        for (size_t i = 0; i < events.size(); ++i) {
            if (events[i].kind == EventKind::RiskAssessed && events[i].payload.value("recorded_only", false)) {
                recorded_only = static_cast<int>(i);
            }
        }
        ASSERT(recorded_only >= 0);
    }
    {
        TestRig rig = make_rig();
        rig.services.escalation = std::make_shared<FlakyCoordinator>(100, nullptr);
        auto m = make_machine(rig, "exhaust");
        auto r = m->handle_turn(turn("Tonight I am going to kill myself"));
        ASSERT(r.is_ok());
        ASSERT(m->on_tick(later(1500)));
        ASSERT(!m->is_closed());
        ASSERT(m->on_tick(later(3000)));
        ASSERT(m->is_closed());
        ASSERT(m->session().close_reason == "escalation_failed");
        ASSERT(m->session().escalation->status == PlanStatus::Failed);

        auto events = rig.services.ledger->replay("exhaust");
        ASSERT(count_kind(events, EventKind::EscalationUnresolved) == 2);
        int resolved = index_of(events, EventKind::EscalationResolved);
        ASSERT(resolved >= 0);
        ASSERT(events[resolved].payload["error"] == "escalation_exhausted");
    }
    {
        // Closing with an unresolved escalation records the failure
        TestRig rig = make_rig();
        rig.services.escalation = std::make_shared<FlakyCoordinator>(100, nullptr);
        auto m = make_machine(rig, "abandon");
        ASSERT(m->handle_turn(turn("Tonight I am going to kill myself")).is_ok());
        ASSERT(m->force_close("hard_timeout").is_ok());
        auto events = rig.services.ledger->replay("abandon");
        int resolved = index_of(events, EventKind::EscalationResolved);
        ASSERT(resolved >= 0);
        ASSERT(events[resolved].payload["reason"] == "session_closed");
        ASSERT(events.back().kind == EventKind::SessionClosed);
    }

    {
        // Revocation during an unresolved escalation closes and empties the vault
        Config config = test_config();
        config.redaction.reversible_tokens = true;
        TestRig rig = make_rig(config);
        rig.services.escalation = std::make_shared<FlakyCoordinator>(100, nullptr);
        auto m = make_machine(rig, "revoke-esc");
        ASSERT(to_support(*m));
        ASSERT(m->handle_turn(turn("reach me at jo@example.com")).is_ok());
        ASSERT(m->vault().size() == 1);
        auto crisis = m->handle_turn(turn("Tonight I am going to kill myself"));
        ASSERT(crisis.is_ok());
        ASSERT(crisis.value().phase == Phase::Escalate);
        ASSERT(m->session().escalation_unresolved);

        auto r = m->handle_turn(turn("I want to withdraw my consent"));
        ASSERT(r.is_ok());
        ASSERT(r.value().closed);
        ASSERT(r.value().close_reason == "consent_revoked");
        ASSERT(r.value().response.find("911") != std::string::npos);
        ASSERT(m->vault().size() == 0);
        ASSERT(!m->vault().consent());

        auto late = m->handle_turn(turn("my other address is jo2@example.com"));
        ASSERT(late.is_error());
        ASSERT(late.error().type == ErrorType::SessionClosed);
        ASSERT(m->vault().size() == 0);

        auto events = rig.services.ledger->replay("revoke-esc");
        int resolved = index_of(events, EventKind::EscalationResolved);
        ASSERT(resolved >= 0);
        ASSERT(events[resolved].payload["reason"] == "session_closed");
    }
    {
        // Exit during an unresolved escalation closes too
        TestRig rig = make_rig();
        rig.services.escalation = std::make_shared<FlakyCoordinator>(100, nullptr);
        auto m = make_machine(rig, "exit-esc");
        ASSERT(m->handle_turn(turn("Tonight I am going to kill myself")).is_ok());
        ASSERT(m->phase() == Phase::Escalate);
        auto r = m->handle_turn(turn("exit"));
        ASSERT(r.is_ok());
        ASSERT(r.value().closed);
        ASSERT(r.value().close_reason == "user_exit");
        ASSERT(m->is_closed());
    }

    // --- Replay and restore ---
    {
        TestRig rig = make_rig();
        auto m = make_machine(rig, "audit");
        ASSERT(to_support(*m));
        ASSERT(m->handle_turn(turn("I've been cutting myself again")).is_ok());
        auto events = rig.services.ledger->replay("audit");

        auto replayed = SessionStateMachine::replay(events);
        ASSERT(replayed.is_ok());
        const auto& st = replayed.value();
        ASSERT(st.phase == Phase::SupportLoop);
        ASSERT(st.consented);
        ASSERT(st.message_count == 3);
        ASSERT(st.risk_history.size() == 3);
        ASSERT(st.risk_history.back().severity == Severity::Medium);
        ASSERT(st.trajectory.size() == 4);
        ASSERT(st.metadata.at("locale") == "US");

        TestRig other = make_rig();
        SessionStateMachine restored(new_session("audit"), other.config, other.services);
        ASSERT(restored.load_from_events(events).is_ok());
        ASSERT(restored.phase() == Phase::SupportLoop);
        ASSERT(restored.session().message_count == 3);
        ASSERT(restored.session().triage_summary == m->session().triage_summary);
        ASSERT(restored.memory().recent_user_turns(10) == m->memory().recent_user_turns(10));
        ASSERT(other.services.ledger->last_sequence("audit") == 0);

        // Tampered: first transition skips consent
        std::vector<Event> skipped = events;
        for (auto& e : skipped) {
            if (e.kind == EventKind::PhaseTransition) {
                e.payload["to"] = "SUPPORT_LOOP";
                break;
            }
        }
        auto bad = SessionStateMachine::replay(skipped);
        ASSERT(bad.is_error());
        ASSERT(bad.error().type == ErrorType::GuardViolation);

        // Tampered: an event removed
        std::vector<Event> gap = events;
        gap.erase(gap.begin() + 2);
        auto gapped = SessionStateMachine::replay(gap);
        ASSERT(gapped.is_error());
        ASSERT(gapped.error().type == ErrorType::InvalidInput);

        ASSERT(restored.load_from_events(skipped).is_error());
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All state machine tests passed.\n";
    return 0;
}
