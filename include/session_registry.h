#pragma once

/**
 * @file session_registry.h
 * @brief Owns all live sessions, serializes work per session, runs the sweeps
 */

#include "common.h"
#include "config.h"
#include "errors.h"
#include "observability_sink.h"
#include "session.h"
#include "session_recorder.h"
#include "state_machine.h"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace carebridge {

/**
 * @brief Point-in-time view of one session (no text content)
 */
struct SessionSnapshot {
    std::string session_id;
    Phase phase = Phase::Init;
    bool consented = false;
    int message_count = 0;
    Severity peak_severity = Severity::None;
    Severity last_severity = Severity::None;
    int64_t created_at_ms = 0;
    int64_t last_activity_ms = 0;
    std::string close_reason;
    bool escalation_unresolved = false;
    std::optional<EscalationPlan> escalation;
    uint64_t last_sequence = 0;

    nlohmann::json to_json() const;
};

struct RegistryStats {
    size_t active = 0;           ///< Open sessions
    size_t retained_closed = 0;  ///< Closed sessions still answering SessionClosed
    uint64_t created = 0;
    uint64_t restored = 0;
    uint64_t closed = 0;
    uint64_t turns = 0;
    uint64_t escalations = 0;
    uint64_t idle_closed = 0;
    uint64_t hard_closed = 0;
    uint64_t observability_dropped = 0;
};

/**
 * @brief Build the production collaborator set from configuration
 *
 * HTTP classifier, LLM generator and hand-off service are created only when
 * their endpoints are set. The resource directory always exists, with the
 * configured file merged over the built-in data.
 */
SessionServices make_services(const Config& config);

/**
 * @brief Session registry and scheduler
 *
 * Each session has its own mutex; turns, closes and sweeps for the same
 * session never interleave while different sessions proceed in parallel.
 * Closed sessions stay addressable for session.closed_retention_ms so late
 * submissions get SessionClosed rather than NotFound.
 *
 * Every ledger event is mirrored to the durable store (when one is given)
 * and published to the observability sink (when one is given).
 */
class SessionRegistry {
public:
    /// Production wiring: services from make_services(), store and sink from config
    explicit SessionRegistry(const Config& config);

    SessionRegistry(const Config& config, SessionServices services,
                    std::shared_ptr<SessionRecorder> recorder = nullptr,
                    std::shared_ptr<ObservabilitySink> observability = nullptr);
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    /// Start the idle and hard-timeout sweepers (and the observability worker)
    void start();
    void stop();

    /**
     * @brief Open a session in INIT
     * @param metadata Caller-owned tags; "locale" selects resources and emergency numbers
     * @return The new session id ("sess-" + 16 hex digits)
     */
    Result<std::string> create_session(const std::map<std::string, std::string>& metadata = {});

    /**
     * @brief Run one turn through the session's state machine
     * @return NotFound for an unknown id, SessionClosed for a closed one
     */
    Result<TurnOutcome> submit_turn(const std::string& session_id, const TurnRequest& request);

    VoidResult close_session(const std::string& session_id, const std::string& reason = "user_exit");

    Result<SessionSnapshot> snapshot(const std::string& session_id) const;

    /// Ids of open sessions, sorted
    std::vector<std::string> active_sessions() const;

    /**
     * @brief Rebuild a session from the durable store
     *
     * The persisted stream is replayed through the transition table; an
     * inconsistent stream is rejected. An open session gets a
     * session.restored event and continues with fresh phase timers.
     */
    VoidResult restore_session(const std::string& session_id);

    /**
     * @brief Close sessions idle longer than session.idle_timeout_ms and run time-driven guards
     *
     * Sessions waiting on an unresolved escalation are never idle-closed.
     * @return Number of sessions closed
     */
    size_t sweep_idle(TimePoint now);

    /**
     * @brief Close sessions older than session.hard_timeout_ms and evict expired tombstones
     * @return Number of sessions closed
     */
    size_t sweep_hard(TimePoint now);

    RegistryStats stats() const;

    std::shared_ptr<EventLedger> ledger() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace carebridge
