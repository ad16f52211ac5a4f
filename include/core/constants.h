#pragma once

/**
 * @file constants.h
 * @brief System-wide defaults and tuning parameters
 *
 * Config structs take their defaults from here, so tuning the system
 * behavior means changing one place.
 */

#include <cstddef>

namespace carebridge {
namespace constants {

// =============================================================================
// Session Lifecycle
// =============================================================================

namespace session {
    /// Time allowed in INIT without consent before closing (ms)
    constexpr int CONSENT_TIMEOUT_MS = 5 * 60 * 1000;

    /// Time allowed in TRIAGE without a turn before proceeding degraded (ms)
    constexpr int TRIAGE_TIMEOUT_MS = 10 * 60 * 1000;

    /// Inactivity before the idle sweep closes a session (ms)
    constexpr int IDLE_TIMEOUT_MS = 30 * 60 * 1000;

    /// Absolute session lifetime (ms)
    constexpr int HARD_TIMEOUT_MS = 2 * 60 * 60 * 1000;

    /// Turns accepted before the session closes
    constexpr int MAX_MESSAGES = 50;

    /// Interval between sweeps (ms)
    constexpr int SWEEP_INTERVAL_MS = 1000;

    /// How long a closed session answers SessionClosed before eviction (ms)
    constexpr int CLOSED_RETENTION_MS = 10 * 60 * 1000;
}

// =============================================================================
// Risk Monitoring
// =============================================================================

namespace risk {
    /// Classifier call bound (ms)
    constexpr int CLASSIFIER_TIMEOUT_MS = 1500;

    /// Prior verdicts passed to the classifier as context
    constexpr size_t CONTEXT_TURNS = 3;

    /// Consecutive >= MEDIUM verdicts that raise severity to HIGH
    constexpr size_t SUSTAINED_WINDOW = 3;

    /// Keyword path confidence model
    constexpr float BASE_CONFIDENCE = 0.6f;
    constexpr float PER_KEYWORD_CONFIDENCE = 0.1f;
    constexpr float MAX_KEYWORD_BONUS = 0.3f;
    constexpr float SPECIFIC_KEYWORD_BONUS = 0.2f;
    constexpr float AMBIGUITY_PENALTY = 0.2f;

    /// Confidence assigned to a degraded verdict
    constexpr float DEGRADED_CONFIDENCE = 0.5f;
}

// =============================================================================
// Escalation
// =============================================================================

namespace escalation {
    /// Hand-off attempts per escalation
    constexpr int MAX_ATTEMPTS = 3;

    /// Bound on a single hand-off attempt (ms)
    constexpr int ATTEMPT_TIMEOUT_MS = 5000;

    /// Interval between retries of an unresolved escalation (ms)
    constexpr int RETRY_INTERVAL_MS = 30000;

    /// Retry rounds before an unresolved escalation is marked FAILED
    constexpr int RETRY_LIMIT = 3;

    /// National crisis line (US/CA)
    constexpr const char* CRISIS_LINE = "988";
}

// =============================================================================
// Generation
// =============================================================================

namespace generation {
    constexpr int DEFAULT_TIMEOUT_MS = 8000;
    constexpr int CONNECT_TIMEOUT_MS = 1000;
    constexpr float DEFAULT_TEMPERATURE = 0.3f;
    constexpr int CONTEXT_MAX_TURNS = 6;
}

// =============================================================================
// Conversation Memory
// =============================================================================

namespace memory {
    /// Sanitized messages kept per session for risk context and generation
    constexpr size_t MAX_HISTORY_MESSAGES = 20;

    /// Character budget across kept messages; oldest go first
    constexpr size_t MAX_HISTORY_CHARS = 8000;
}

// =============================================================================
// Observability
// =============================================================================

namespace observability {
    /// Pending events held before drop-oldest kicks in
    constexpr size_t QUEUE_CAPACITY = 1024;

    /// Feed POST bound (ms)
    constexpr long FEED_TIMEOUT_MS = 500;
}

} // namespace constants
} // namespace carebridge
