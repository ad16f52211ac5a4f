#pragma once

#include "common.h"
#include "config.h"
#include "errors.h"
#include "event_ledger.h"
#include "escalation_coordinator.h"
#include "redaction_gate.h"
#include "risk_monitor.h"
#include "router.h"
#include "session.h"
#include "collaborators/resource_directory.h"
#include "collaborators/response_generator.h"
#include "memory/conversation_memory.h"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace carebridge {

/**
 * @brief Shared, stateless-per-session collaborators of every state machine
 *
 * gate, risk, router and ledger are required. generator may be null (canned
 * replies); escalation may be null (every escalation is unresolved and
 * retried); directory may be null (no resource delivery, configured crisis
 * line only).
 */
struct SessionServices {
    std::shared_ptr<const RedactionGate> gate;
    std::shared_ptr<const RiskMonitor> risk;
    std::shared_ptr<const IntentRouter> router;
    std::shared_ptr<EventLedger> ledger;
    std::shared_ptr<IEscalationCoordinator> escalation;
    std::shared_ptr<IResponseGenerator> generator;
    std::shared_ptr<IResourceDirectory> directory;
};

/**
 * @brief Phases and guards of one session
 *
 * INIT -> CONSENTED -> TRIAGE -> SUPPORT_LOOP <-> RESOURCES, with ESCALATE
 * reachable from every non-terminal phase and CLOSE absorbing.
 * RISK_CHECK is never a resting phase: every SUPPORT_LOOP turn is
 * risk-evaluated and the verdict event carries "check": "RISK_CHECK".
 *
 * Per-turn event order is turn.received, then risk.assessed (or
 * risk.degraded), then the ESCALATE transition if the verdict reaches the
 * escalation threshold, then phase-local events. The fast-path beats every
 * other eligible transition, exit and message cap included. Once in
 * ESCALATE or CLOSE, verdicts are recorded but trigger nothing.
 *
 * Not thread-safe: the registry serializes all calls per session.
 */
class SessionStateMachine {
public:
    SessionStateMachine(Session session, const Config& config, SessionServices services);
    ~SessionStateMachine();

    SessionStateMachine(const SessionStateMachine&) = delete;
    SessionStateMachine& operator=(const SessionStateMachine&) = delete;

    /// Append session.created for a brand-new session
    void start();

    /**
     * @brief Process one admitted turn
     * @return The outcome, or SessionClosed (no mutation) when already in CLOSE
     */
    Result<TurnOutcome> handle_turn(const TurnRequest& request);

    /**
     * @brief Close from outside a turn (exit, idle or hard timeout)
     * @return SessionClosed if already closed
     */
    VoidResult force_close(const std::string& reason);

    /**
     * @brief Time-driven guards: consent timeout, triage timeout, escalation retry
     * @return true if anything changed
     */
    bool on_tick(TimePoint now);

    const Session& session() const;
    Phase phase() const;
    bool is_closed() const;

    /// Consent-gated token store for this session (empty unless reversible tokens are enabled)
    const TokenVault& vault() const;

    /// Sanitized history used for risk context and generation
    const memory::ConversationMemory& memory() const;

    /**
     * @brief Seed state from a persisted stream (restore); no events are written
     */
    VoidResult load_from_events(const std::vector<Event>& events);

    // =========================================================================
    // Audit
    // =========================================================================

    struct ReplayState {
        Phase phase = Phase::Init;
        bool consented = false;
        int message_count = 0;
        std::vector<RiskVerdict> risk_history;
        std::vector<Phase> trajectory;  ///< Every phase entered, starting with INIT
        std::string close_reason;
        std::string triage_summary;
        bool triage_degraded = false;
        bool escalation_unresolved = false;
        int escalation_retry_rounds = 0;
        std::map<std::string, std::string> metadata;
        int64_t created_at_ms = 0;
        int64_t last_activity_ms = 0;
        std::optional<EscalationPlan> escalation;
        std::vector<memory::ConversationMessage> history;  ///< Sanitized user turns and replies, in order
    };

    /**
     * @brief Rebuild a session's state from its event stream
     *
     * Every phase.transition is validated against the transition table and
     * the current phase; an illegal edge or a sequence gap is a
     * GuardViolation / InvalidInput error.
     */
    static Result<ReplayState> replay(const std::vector<Event>& events);

    static bool is_legal_transition(Phase from, Phase to);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace carebridge
