#pragma once

#include "common.h"
#include "core/constants.h"
#include <string>
#include <cstdint>
#include <map>
#include <vector>

namespace carebridge {

/// Session lifecycle: timeouts, message cap, sweep cadence
struct SessionConfig {
    int consent_timeout_ms = constants::session::CONSENT_TIMEOUT_MS;
    int triage_timeout_ms = constants::session::TRIAGE_TIMEOUT_MS;
    int idle_timeout_ms = constants::session::IDLE_TIMEOUT_MS;
    int hard_timeout_ms = constants::session::HARD_TIMEOUT_MS;
    int max_messages = constants::session::MAX_MESSAGES;
    int sweep_interval_ms = constants::session::SWEEP_INTERVAL_MS;
    int closed_retention_ms = constants::session::CLOSED_RETENTION_MS;
    std::string default_locale = "US";
};

struct RiskConfig {
    Severity escalation_threshold = Severity::High;   ///< Fast-path to ESCALATE at or above this
    Severity emergency_threshold = Severity::Critical; ///< Emergency directive before any hand-off
    std::string classifier_endpoint;                   ///< Empty = keyword path only
    int classifier_timeout_ms = constants::risk::CLASSIFIER_TIMEOUT_MS;
    size_t context_turns = constants::risk::CONTEXT_TURNS;
    size_t sustained_window = constants::risk::SUSTAINED_WINDOW;  ///< 0 disables the sustained-risk rule
    /// Per-category phrase lists replacing the built-in ones (category -> phrases)
    std::map<std::string, std::vector<std::string>> keyword_overrides;
};

struct RedactionConfig {
    size_t max_input_chars = 16384;  ///< Longer turns are fully masked
    bool reversible_tokens = false;  ///< Keep token -> value per session while consent holds
};

struct EscalationConfig {
    int max_attempts = constants::escalation::MAX_ATTEMPTS;
    int attempt_timeout_ms = constants::escalation::ATTEMPT_TIMEOUT_MS;
    int retry_interval_ms = constants::escalation::RETRY_INTERVAL_MS;
    int retry_limit = constants::escalation::RETRY_LIMIT;
    std::string handoff_endpoint;  ///< Empty = no hand-off service; directives only
    std::string crisis_line = constants::escalation::CRISIS_LINE;
};

/// Generation collaborator (LLM)
struct GenerationConfig {
    std::string endpoint;  ///< Ollama /api/chat or llama.cpp /completion; empty = canned phase responses
    std::string model_name = "llama3";
    int timeout_ms = constants::generation::DEFAULT_TIMEOUT_MS;
    float temperature = constants::generation::DEFAULT_TEMPERATURE;
    int context_max_turns = constants::generation::CONTEXT_MAX_TURNS;
    std::string fallback_phrase = "I'm here with you. Could you tell me a little more about what's going on?";
    std::string system_prompt = "You are a supportive, non-clinical listener. "
                                "Be warm and brief. Never diagnose. "
                                "Call offer_resources when the person would benefit from support contacts.";
};

struct ResourcesConfig {
    std::string directory_file;  ///< Optional JSON resource directory; empty = built-in data
};

/// Durable session records
struct StoreConfig {
    bool enabled = true;
    std::string dir = "sessions";
};

struct ObservabilityConfig {
    size_t queue_capacity = constants::observability::QUEUE_CAPACITY;
    std::string feed_url;   ///< Optional: POST each event as JSON (e.g. "http://localhost:5050/api/feed/notify")
    bool log_events = false; ///< Also write each event to the log at DEBUG
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
};

struct Config {
    SessionConfig session;
    RiskConfig risk;
    RedactionConfig redaction;
    EscalationConfig escalation;
    GenerationConfig generation;
    ResourcesConfig resources;
    StoreConfig store;
    ObservabilityConfig observability;
    LoggingConfig logging;

    /// Missing or unparsable file yields defaults (logged)
    static Config load_from_file(const std::string& path);
    bool save_to_file(const std::string& path) const;
};

} // namespace carebridge
