#pragma once

/**
 * @file event_ledger.h
 * @brief Append-only, per-session ordered event log
 *
 * Sequence numbers start at 1 and are gapless per session; they are
 * assigned atomically at append time. Every string in a payload passes
 * through the Redaction Gate before it is stored.
 */

#include "errors.h"
#include "redaction_gate.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace carebridge {

enum class EventKind {
    SessionCreated,
    TurnReceived,
    RiskAssessed,
    RiskDegraded,
    PhaseTransition,
    GuardViolation,
    ResponseGenerated,
    ResourceDelivered,
    EscalationDirective,
    EscalationAttempt,
    EscalationResolved,
    EscalationUnresolved,
    CollaboratorDegraded,
    SessionClosed,
    SessionRestored,
    ObservabilityDropped  ///< Meta-event produced by the observability sink, never stored in a stream
};

/// Dotted wire name, e.g. "risk.assessed"
const char* event_kind_name(EventKind kind);
bool parse_event_kind(const std::string& name, EventKind& out);

struct Event {
    std::string session_id;
    uint64_t sequence = 0;
    EventKind kind = EventKind::SessionCreated;
    int64_t timestamp_ms = 0;  ///< Wall clock; cross-session ordering is best-effort only
    nlohmann::json payload = nlohmann::json::object();

    nlohmann::json to_json() const;
    static Result<Event> from_json(const nlohmann::json& j);
};

class EventLedger {
public:
    using SubscriberId = uint64_t;
    using Callback = std::function<void(const Event&)>;

    explicit EventLedger(std::shared_ptr<const RedactionGate> gate);
    ~EventLedger();

    EventLedger(const EventLedger&) = delete;
    EventLedger& operator=(const EventLedger&) = delete;

    /**
     * @brief Redact payload, assign the next sequence number, store, fan out
     *
     * Sinks run before append returns, in sequence order. Subscribers are
     * notified after the stream lock is released, still in sequence order.
     * Neither may append to the same session from inside the callback.
     *
     * Top-level keys named in verbatim_fields are stored as given. They are
     * for text the system wrote itself (directives, hotline numbers,
     * resource listings); user-derived text must never be listed.
     *
     * @return The stored event, or InvalidInput if the stream is archived
     */
    Result<Event> append(const std::string& session_id, EventKind kind,
                         nlohmann::json payload = nlohmann::json::object(),
                         const std::vector<std::string>& verbatim_fields = {});

    /**
     * @brief Events with sequence >= from_sequence, in order
     */
    std::vector<Event> replay(const std::string& session_id, uint64_t from_sequence = 1) const;

    /// Live feed of new events for one session
    SubscriberId subscribe(const std::string& session_id, Callback callback);
    bool unsubscribe(SubscriberId id);

    /// Called for every appended event of every session (persistence, observability)
    void add_sink(Callback sink);

    /// Mark a stream read-only
    void archive(const std::string& session_id);
    bool is_archived(const std::string& session_id) const;

    /**
     * @brief Load previously persisted events into an empty stream (no sinks, no subscribers)
     *
     * Fails with InvalidInput if the stream already exists or the events
     * are not a gapless sequence starting at 1.
     */
    VoidResult seed(const std::string& session_id, const std::vector<Event>& events);

    /// Drop an archived stream from memory (its durable copy is untouched)
    bool release(const std::string& session_id);

    uint64_t last_sequence(const std::string& session_id) const;
    bool has_stream(const std::string& session_id) const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace carebridge
