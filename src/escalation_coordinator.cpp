#include "escalation_coordinator.h"
#include "core/bounded_call.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <atomic>

using json = nlohmann::json;

namespace carebridge {

const char* plan_status_name(PlanStatus status) {
    switch (status) {
        case PlanStatus::Pending:    return "PENDING";
        case PlanStatus::InProgress: return "IN_PROGRESS";
        case PlanStatus::Completed:  return "COMPLETED";
        case PlanStatus::Failed:     return "FAILED";
    }
    return "PENDING";
}

bool parse_plan_status(const std::string& name, PlanStatus& out) {
    if (name == "PENDING") out = PlanStatus::Pending;
    else if (name == "IN_PROGRESS") out = PlanStatus::InProgress;
    else if (name == "COMPLETED") out = PlanStatus::Completed;
    else if (name == "FAILED") out = PlanStatus::Failed;
    else return false;
    return true;
}

json EscalationPlan::to_json() const {
    json j;
    j["plan_id"] = plan_id;
    j["session_id"] = session_id;
    j["severity"] = severity_name(severity);
    j["channel"] = channel;
    j["priority"] = priority;
    j["status"] = plan_status_name(status);
    j["directive"] = directive;
    j["emergency_number"] = emergency_number;
    j["crisis_line"] = crisis_line;
    j["attempts"] = json::array();
    for (const auto& a : attempts) {
        j["attempts"].push_back({{"number", a.number}, {"outcome", a.outcome},
                                 {"detail", a.detail}, {"timestamp_ms", a.timestamp_ms}});
    }
    j["transfer_reference"] = transfer_reference;
    j["failure_reason"] = failure_reason;
    j["retry_rounds"] = retry_rounds;
    return j;
}

Result<EscalationPlan> EscalationPlan::from_json(const json& j) {
    try {
        EscalationPlan plan;
        plan.plan_id = j.at("plan_id").get<std::string>();
        plan.session_id = j.value("session_id", "");
        if (!parse_severity(j.value("severity", "high"), plan.severity)) {
            return make_parse_error("escalation plan has unknown severity");
        }
        plan.channel = j.value("channel", "");
        plan.priority = j.value("priority", 1);
        if (!parse_plan_status(j.value("status", "PENDING"), plan.status)) {
            return make_parse_error("escalation plan has unknown status");
        }
        plan.directive = j.value("directive", "");
        plan.emergency_number = j.value("emergency_number", "");
        plan.crisis_line = j.value("crisis_line", "");
        if (j.contains("attempts") && j["attempts"].is_array()) {
            for (const auto& a : j["attempts"]) {
                HandoffAttempt attempt;
                attempt.number = a.value("number", 0);
                attempt.outcome = a.value("outcome", "");
                attempt.detail = a.value("detail", "");
                attempt.timestamp_ms = a.value("timestamp_ms", static_cast<int64_t>(0));
                plan.attempts.push_back(attempt);
            }
        }
        plan.transfer_reference = j.value("transfer_reference", "");
        plan.failure_reason = j.value("failure_reason", "");
        plan.retry_rounds = j.value("retry_rounds", 0);
        return plan;
    } catch (const json::exception& e) {
        return make_parse_error(std::string("escalation plan: ") + e.what());
    }
}

std::string build_directive(bool emergency, const std::string& emergency_number, const std::string& crisis_line) {
    if (emergency) {
        return "If you are in immediate danger, call " + emergency_number +
               " now. You can also call or text " + crisis_line + " any time, day or night.";
    }
    return "You can call or text " + crisis_line +
           " any time, day or night, to talk with a trained counselor.";
}

class EscalationCoordinator::Impl {
public:
    Impl(const EscalationConfig& config, Severity emergency_threshold,
         std::shared_ptr<EventLedger> ledger, std::shared_ptr<IHandoffService> handoff,
         std::shared_ptr<IResourceDirectory> directory)
        : config_(config), emergency_threshold_(emergency_threshold), ledger_(std::move(ledger)),
          handoff_(std::move(handoff)), directory_(std::move(directory)) {}

    Result<EscalationPlan> escalate(const std::string& session_id, Severity severity,
                                    const std::string& context_summary, const std::string& locale) {
        if (!ledger_) {
            return make_collaborator_error("escalation coordinator has no ledger");
        }

        const bool emergency = at_least(severity, emergency_threshold_);
        EscalationPlan plan;
        plan.plan_id = next_plan_id(session_id);
        plan.session_id = session_id;
        plan.severity = severity;
        plan.channel = emergency ? "emergency_services" : "warm_transfer";
        plan.priority = emergency ? 0 : 1;
        plan.status = PlanStatus::InProgress;
        resolve_numbers(plan, locale);

        LOG_ESCALATION(session_id + " plan " + plan.plan_id + " severity=" + severity_name(severity) +
                       " channel=" + plan.channel);

        if (emergency) {
            // Directive first, before any hand-off attempt
            auto recorded = record_directive(plan, true);
            if (recorded.is_error()) return recorded.error();
        }

        auto attempted = run_attempts(plan, context_summary);
        if (attempted.is_error()) return attempted.error();

        if (!emergency) {
            auto recorded = record_directive(plan, false);
            if (recorded.is_error()) return recorded.error();
        }

        json resolved;
        resolved["plan_id"] = plan.plan_id;
        resolved["status"] = plan_status_name(plan.status);
        resolved["attempts"] = plan.attempts.size();
        if (!plan.transfer_reference.empty()) resolved["reference"] = plan.transfer_reference;
        if (plan.status == PlanStatus::Failed) {
            resolved["reason"] = plan.failure_reason;
            resolved["error"] = error_type_name(ErrorType::EscalationExhausted);
            LOG_ESCALATION(session_id + " plan " + plan.plan_id + " FAILED: " + plan.failure_reason);
        }
        auto appended = ledger_->append(session_id, EventKind::EscalationResolved, resolved);
        if (appended.is_error()) return appended.error();
        return plan;
    }

private:
    std::string next_plan_id(const std::string& session_id) {
        uint64_t n = counter_.fetch_add(1);
        return "esc-" + utils::to_hex32(utils::fnv1a_32(session_id + "#" + std::to_string(n) + "#" +
                                                        std::to_string(wall_clock_ms())));
    }

    void resolve_numbers(EscalationPlan& plan, const std::string& locale) {
        plan.crisis_line = config_.crisis_line;
        plan.emergency_number = "911";
        if (!directory_) return;
        plan.emergency_number = directory_->emergency_number(locale);
        auto bundle = directory_->lookup(locale, "crisis");
        if (bundle.is_ok() && !bundle.value().empty()) {
            const Resource& first = bundle.value().resources.front();
            if (!first.phone.empty()) plan.crisis_line = first.phone;
        } else if (bundle.is_error()) {
            LOG_WARN("Crisis line lookup failed, using configured line: " + bundle.error().message);
        }
    }

    VoidResult record_directive(EscalationPlan& plan, bool emergency) {
        plan.directive = build_directive(emergency, plan.emergency_number, plan.crisis_line);
        json payload;
        payload["plan_id"] = plan.plan_id;
        payload["severity"] = severity_name(plan.severity);
        payload["channel"] = plan.channel;
        payload["emergency_number"] = plan.emergency_number;
        payload["crisis_line"] = plan.crisis_line;
        payload["directive"] = plan.directive;
        auto appended = ledger_->append(plan.session_id, EventKind::EscalationDirective, payload,
                                        {"emergency_number", "crisis_line", "directive"});
        if (appended.is_error()) return appended.error();
        return {};
    }

    VoidResult run_attempts(EscalationPlan& plan, const std::string& context_summary) {
        if (!handoff_) {
            plan.status = PlanStatus::Failed;
            plan.failure_reason = "no_handoff_service";
            return {};
        }

        const int max_attempts = std::max(1, config_.max_attempts);
        for (int n = 1; n <= max_attempts; ++n) {
            std::shared_ptr<IHandoffService> service = handoff_;
            auto result = call_with_timeout<TransferOutcome>(
                [service, context_summary]() { return service->initiate(context_summary); },
                config_.attempt_timeout_ms, "hand-off (" + service->name() + ")");

            HandoffAttempt attempt;
            attempt.number = n;
            attempt.timestamp_ms = wall_clock_ms();
            bool stop = false;
            if (result.is_ok()) {
                attempt.outcome = transfer_status_name(result.value().status);
                attempt.detail = result.value().detail;
                if (transfer_accepted(result.value().status)) {
                    plan.status = PlanStatus::Completed;
                    plan.transfer_reference = result.value().reference;
                    stop = true;
                } else if (result.value().status == TransferStatus::Rejected) {
                    plan.status = PlanStatus::Failed;
                    plan.failure_reason = "handoff_rejected";
                    stop = true;
                }
            } else {
                attempt.outcome = result.error().type == ErrorType::CollaboratorTimeout ? "timeout" : "error";
                attempt.detail = result.error().message;
            }
            plan.attempts.push_back(attempt);

            json payload;
            payload["plan_id"] = plan.plan_id;
            payload["attempt"] = n;
            payload["max_attempts"] = max_attempts;
            payload["outcome"] = attempt.outcome;
            if (!attempt.detail.empty()) payload["detail"] = attempt.detail;
            auto appended = ledger_->append(plan.session_id, EventKind::EscalationAttempt, payload);
            if (appended.is_error()) return appended.error();

            LOG_ESCALATION(plan.session_id + " hand-off attempt " + std::to_string(n) + "/" +
                           std::to_string(max_attempts) + ": " + attempt.outcome);
            if (stop) return {};
        }

        plan.status = PlanStatus::Failed;
        plan.failure_reason = "attempts_exhausted";
        return {};
    }

    EscalationConfig config_;
    Severity emergency_threshold_;
    std::shared_ptr<EventLedger> ledger_;
    std::shared_ptr<IHandoffService> handoff_;
    std::shared_ptr<IResourceDirectory> directory_;
    std::atomic<uint64_t> counter_{0};
};

EscalationCoordinator::EscalationCoordinator(const EscalationConfig& config, Severity emergency_threshold,
                                             std::shared_ptr<EventLedger> ledger,
                                             std::shared_ptr<IHandoffService> handoff,
                                             std::shared_ptr<IResourceDirectory> directory)
    : pimpl_(std::make_unique<Impl>(config, emergency_threshold, std::move(ledger),
                                    std::move(handoff), std::move(directory))) {}

EscalationCoordinator::~EscalationCoordinator() = default;

Result<EscalationPlan> EscalationCoordinator::escalate(const std::string& session_id, Severity severity,
                                                       const std::string& context_summary,
                                                       const std::string& locale) {
    return pimpl_->escalate(session_id, severity, context_summary, locale);
}

} // namespace carebridge
