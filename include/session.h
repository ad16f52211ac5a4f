#pragma once

/**
 * @file session.h
 * @brief Session record, turn request and turn outcome
 */

#include "common.h"
#include "errors.h"
#include "escalation_coordinator.h"
#include "risk_monitor.h"
#include "collaborators/resource_directory.h"
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace carebridge {

/**
 * @brief One support session
 *
 * Phase and risk history are written only by the session's state machine.
 * Consent never goes back to false once granted; revocation closes the
 * session instead.
 */
struct Session {
    std::string id;
    Phase phase = Phase::Init;
    bool consented = false;
    int message_count = 0;

    int64_t created_at_ms = 0;       ///< Wall clock
    int64_t last_activity_ms = 0;    ///< Wall clock
    TimePoint created_at;            ///< Steady clock, drives timeouts
    TimePoint last_activity;
    TimePoint phase_entered_at;

    std::vector<RiskVerdict> risk_history;
    std::map<std::string, std::string> metadata;  ///< Caller-owned
    std::string close_reason;

    std::string triage_summary;
    bool triage_degraded = false;

    std::optional<EscalationPlan> escalation;
    bool escalation_unresolved = false;  ///< Coordinator could not act; retried on schedule
    int escalation_retry_rounds = 0;
    TimePoint next_escalation_retry;

    std::string locale(const std::string& fallback = "US") const;

    /// Durable record (no raw text, no steady-clock values)
    nlohmann::json to_record() const;
};

nlohmann::json verdict_to_json(const RiskVerdict& verdict);
Result<RiskVerdict> verdict_from_json(const nlohmann::json& j);

/**
 * @brief One inbound user turn
 */
struct TurnRequest {
    std::string text;                 ///< Raw; never stored or logged
    std::optional<bool> consent;      ///< Explicit consent signal from the caller's UI
    bool request_resources = false;
    bool request_exit = false;
};

/**
 * @brief What the caller gets back for an admitted turn
 */
struct TurnOutcome {
    std::string session_id;
    int turn = 0;                     ///< 1-based index within the session
    Phase phase = Phase::Init;        ///< Phase after processing
    std::string response;             ///< Outbound message
    std::string sanitized_text;
    RiskVerdict verdict;
    bool escalated = false;           ///< Fast-path fired on this turn
    bool closed = false;
    std::string close_reason;
    std::optional<EscalationPlan> escalation;
    std::optional<ResourceBundle> resources;
    uint64_t first_sequence = 0;      ///< Ledger range written by this turn
    uint64_t last_sequence = 0;
};

} // namespace carebridge
