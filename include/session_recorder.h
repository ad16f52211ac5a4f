#pragma once

#include "errors.h"
#include "event_ledger.h"
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace carebridge {

/**
 * @brief Durable per-session store
 *
 * Layout under the store directory:
 *   <session_id>/events.jsonl   one ledger event per line, in sequence order
 *   <session_id>/session.json   latest session record, replaced atomically
 *
 * Events arrive already redacted from the ledger, so nothing written here
 * contains raw user text. Safe to call from several sessions at once.
 */
class SessionRecorder {
public:
    explicit SessionRecorder(const std::string& store_dir);
    ~SessionRecorder();

    SessionRecorder(const SessionRecorder&) = delete;
    SessionRecorder& operator=(const SessionRecorder&) = delete;

    // Append one event to its session's event log
    VoidResult append_event(const Event& event);

    // Replace the session record (write to a temp file, then rename)
    VoidResult write_record(const std::string& session_id, const nlohmann::json& record);

    Result<nlohmann::json> load_record(const std::string& session_id) const;

    /**
     * @brief Read a session's event log
     *
     * A torn final line (crash during append) is dropped with a warning; any
     * other malformed line is a ParseError.
     */
    Result<std::vector<Event>> load_events(const std::string& session_id) const;

    // Session ids with an event log, sorted
    std::vector<std::string> list_sessions() const;

    bool has_session(const std::string& session_id) const;

    const std::string& store_dir() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace carebridge
