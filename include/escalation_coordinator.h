#pragma once

/**
 * @file escalation_coordinator.h
 * @brief Terminal-phase escalation: emergency directive and bounded hand-off attempts
 */

#include "common.h"
#include "config.h"
#include "errors.h"
#include "event_ledger.h"
#include "collaborators/handoff_service.h"
#include "collaborators/resource_directory.h"
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace carebridge {

enum class PlanStatus {
    Pending,
    InProgress,
    Completed,
    Failed
};

const char* plan_status_name(PlanStatus status);
bool parse_plan_status(const std::string& name, PlanStatus& out);

struct HandoffAttempt {
    int number = 0;
    std::string outcome;  ///< Transfer status name, "timeout" or "error"
    std::string detail;
    int64_t timestamp_ms = 0;
};

struct EscalationPlan {
    std::string plan_id;
    std::string session_id;
    Severity severity = Severity::High;
    std::string channel;            ///< "emergency_services" or "warm_transfer"
    int priority = 1;               ///< 0 = highest
    PlanStatus status = PlanStatus::Pending;
    std::string directive;          ///< Instruction surfaced to the user
    std::string emergency_number;
    std::string crisis_line;
    std::vector<HandoffAttempt> attempts;
    std::string transfer_reference;
    std::string failure_reason;
    int retry_rounds = 0;

    bool is_terminal() const { return status == PlanStatus::Completed || status == PlanStatus::Failed; }

    nlohmann::json to_json() const;
    static Result<EscalationPlan> from_json(const nlohmann::json& j);
};

/**
 * @brief User-facing instruction; emergency directives lead with the emergency number
 */
std::string build_directive(bool emergency, const std::string& emergency_number, const std::string& crisis_line);

/**
 * @brief Escalation seam used by the state machine
 *
 * An error result means the coordinator itself could not act; the caller
 * records the escalation as unresolved and retries on a bounded schedule.
 */
class IEscalationCoordinator {
public:
    virtual ~IEscalationCoordinator() = default;

    virtual Result<EscalationPlan> escalate(const std::string& session_id, Severity severity,
                                            const std::string& context_summary,
                                            const std::string& locale) = 0;
};

/**
 * @brief Records every step in the session's ledger stream
 *
 * At or above the emergency threshold the directive (emergency number plus
 * crisis line) is recorded before any hand-off attempt. Below it, hand-off
 * attempts come first and the crisis-line directive follows. Attempts are
 * bounded in count and in time; running out resolves the plan to FAILED.
 * Without a hand-off service the plan fails after its directive.
 */
class EscalationCoordinator : public IEscalationCoordinator {
public:
    EscalationCoordinator(const EscalationConfig& config, Severity emergency_threshold,
                          std::shared_ptr<EventLedger> ledger,
                          std::shared_ptr<IHandoffService> handoff,
                          std::shared_ptr<IResourceDirectory> directory);
    ~EscalationCoordinator() override;

    EscalationCoordinator(const EscalationCoordinator&) = delete;
    EscalationCoordinator& operator=(const EscalationCoordinator&) = delete;

    Result<EscalationPlan> escalate(const std::string& session_id, Severity severity,
                                    const std::string& context_summary,
                                    const std::string& locale) override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace carebridge
