/**
 * Escalation coordinator.
 * Asserts:
 * - CRITICAL: the emergency directive is recorded before the first hand-off attempt.
 * - HIGH: hand-off attempts come first, the crisis-line directive follows.
 * - Errors and timeouts are retried up to max_attempts, then the plan FAILS.
 * - A rejected transfer ends the attempts; no hand-off service means FAILED after the directive.
 */

#include "escalation_coordinator.h"
#include "test_fakes.h"
#include <chrono>
#include <iostream>
#include <string>

using namespace carebridge;
using namespace carebridge::testing;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

struct CoordinatorRig {
    std::shared_ptr<EventLedger> ledger;
    std::shared_ptr<FakeHandoff> handoff;
    std::shared_ptr<EscalationCoordinator> coordinator;
};

static CoordinatorRig make_coordinator(bool with_handoff = true) {
    Config config = test_config();
    CoordinatorRig rig;
    auto gate = std::make_shared<RedactionGate>();
    rig.ledger = std::make_shared<EventLedger>(gate);
    if (with_handoff) rig.handoff = std::make_shared<FakeHandoff>();
    rig.coordinator = std::make_shared<EscalationCoordinator>(
        config.escalation, config.risk.emergency_threshold, rig.ledger, rig.handoff,
        std::make_shared<StaticResourceDirectory>());
    return rig;
}

int main() {
    // --- Directive text ---
    {
        std::string emergency = build_directive(true, "911", "988");
        ASSERT(emergency.find("call 911 now") != std::string::npos);
        ASSERT(emergency.find("988") != std::string::npos);
        ASSERT(emergency.find("911") < emergency.find("988"));

        std::string crisis = build_directive(false, "911", "988");
        ASSERT(crisis.find("911") == std::string::npos);
        ASSERT(crisis.find("988") != std::string::npos);
    }

    // --- CRITICAL: directive before any attempt ---
    {
        auto rig = make_coordinator();
        auto result = rig.coordinator->escalate("crit", Severity::Critical, "summary", "US");
        ASSERT(result.is_ok());
        const EscalationPlan& plan = result.value();
        ASSERT(plan.status == PlanStatus::Completed);
        ASSERT(plan.channel == "emergency_services");
        ASSERT(plan.priority == 0);
        ASSERT(plan.emergency_number == "911");
        ASSERT(!plan.crisis_line.empty());
        ASSERT(plan.directive.find("911") != std::string::npos);
        ASSERT(plan.attempts.size() == 1);
        ASSERT(plan.transfer_reference == "xfer-1");

        auto events = rig.ledger->replay("crit");
        int directive = index_of(events, EventKind::EscalationDirective);
        int attempt = index_of(events, EventKind::EscalationAttempt);
        int resolved = index_of(events, EventKind::EscalationResolved);
        ASSERT(directive >= 0 && attempt >= 0 && resolved >= 0);
        ASSERT(directive < attempt);
        ASSERT(attempt < resolved);
        ASSERT(events[resolved].payload["status"] == "COMPLETED");
    }

    // --- HIGH: attempts, then crisis-line directive ---
    {
        auto rig = make_coordinator();
        auto result = rig.coordinator->escalate("high", Severity::High, "summary", "US");
        ASSERT(result.is_ok());
        ASSERT(result.value().channel == "warm_transfer");
        ASSERT(result.value().status == PlanStatus::Completed);
        ASSERT(result.value().directive.find("immediate danger") == std::string::npos);

        auto events = rig.ledger->replay("high");
        int attempt = index_of(events, EventKind::EscalationAttempt);
        int directive = index_of(events, EventKind::EscalationDirective);
        ASSERT(attempt >= 0 && directive > attempt);
    }

    // --- Errors and timeouts are retried, then exhausted ---
    {
        auto rig = make_coordinator();
        FakeHandoff::Step error_step;
        error_step.error = true;
        FakeHandoff::Step slow_step;
        slow_step.delay_ms = 600;
        rig.handoff->script = {error_step, slow_step, error_step};

        auto start = std::chrono::steady_clock::now();
        auto result = rig.coordinator->escalate("flaky", Severity::Critical, "summary", "US");
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();

        ASSERT(result.is_ok());
        const EscalationPlan& plan = result.value();
        ASSERT(plan.status == PlanStatus::Failed);
        ASSERT(plan.failure_reason == "attempts_exhausted");
        ASSERT(plan.attempts.size() == 3);
        if (plan.attempts.size() == 3) {
            ASSERT(plan.attempts[0].outcome == "error");
            ASSERT(plan.attempts[1].outcome == "timeout");
            ASSERT(plan.attempts[2].outcome == "error");
        }
        // The slow attempt is cut off at its timeout
        ASSERT(elapsed < 550);

        auto events = rig.ledger->replay("flaky");
        ASSERT(count_kind(events, EventKind::EscalationAttempt) == 3);
        int resolved = index_of(events, EventKind::EscalationResolved);
        ASSERT(resolved >= 0);
        ASSERT(events[resolved].payload["status"] == "FAILED");
        ASSERT(events[resolved].payload["error"] == "escalation_exhausted");
        // The directive still went out first
        ASSERT(index_of(events, EventKind::EscalationDirective) == 0);
    }

    // --- Unavailable then connected ---
    {
        auto rig = make_coordinator();
        FakeHandoff::Step busy;
        busy.status = TransferStatus::Unavailable;
        FakeHandoff::Step queued;
        queued.status = TransferStatus::Queued;
        rig.handoff->script = {busy, queued};
        auto result = rig.coordinator->escalate("queue", Severity::High, "summary", "US");
        ASSERT(result.is_ok());
        ASSERT(result.value().status == PlanStatus::Completed);
        ASSERT(result.value().attempts.size() == 2);
        ASSERT(result.value().transfer_reference == "xfer-2");
    }

    // --- Rejected transfer stops attempts ---
    {
        auto rig = make_coordinator();
        FakeHandoff::Step rejected;
        rejected.status = TransferStatus::Rejected;
        rig.handoff->script = {rejected};
        auto result = rig.coordinator->escalate("nope", Severity::High, "summary", "US");
        ASSERT(result.is_ok());
        ASSERT(result.value().status == PlanStatus::Failed);
        ASSERT(result.value().failure_reason == "handoff_rejected");
        ASSERT(rig.handoff->calls == 1);
    }

    // --- No hand-off service ---
    {
        auto rig = make_coordinator(false);
        auto result = rig.coordinator->escalate("alone", Severity::Critical, "summary", "UK");
        ASSERT(result.is_ok());
        ASSERT(result.value().status == PlanStatus::Failed);
        ASSERT(result.value().failure_reason == "no_handoff_service");
        ASSERT(result.value().emergency_number == "999");
        auto events = rig.ledger->replay("alone");
        ASSERT(count_kind(events, EventKind::EscalationDirective) == 1);
        ASSERT(count_kind(events, EventKind::EscalationAttempt) == 0);
        ASSERT(count_kind(events, EventKind::EscalationResolved) == 1);
    }

    // --- Plan JSON ---
    {
        auto rig = make_coordinator();
        auto result = rig.coordinator->escalate("json", Severity::Critical, "summary", "US");
        ASSERT(result.is_ok());
        auto back = EscalationPlan::from_json(result.value().to_json());
        ASSERT(back.is_ok());
        ASSERT(back.value().plan_id == result.value().plan_id);
        ASSERT(back.value().status == PlanStatus::Completed);
        ASSERT(back.value().attempts.size() == 1);
        ASSERT(EscalationPlan::from_json(nlohmann::json{{"plan_id", "x"}, {"status", "LOST"}}).is_error());
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All escalation tests passed.\n";
    return 0;
}
