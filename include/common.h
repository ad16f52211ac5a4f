#pragma once

#include <cstdint>
#include <string>
#include <chrono>

namespace carebridge {

// Timing
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

inline int64_t ms_since(TimePoint start) {
    auto now = Clock::now();
    return std::chrono::duration_cast<Duration>(now - start).count();
}

inline int64_t ms_between(TimePoint start, TimePoint end) {
    return std::chrono::duration_cast<Duration>(end - start).count();
}

/// Wall-clock milliseconds since epoch (event timestamps, persisted records)
inline int64_t wall_clock_ms() {
    return std::chrono::duration_cast<Duration>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

/**
 * @brief Conversation phase of a session
 *
 * RiskCheck is transient: it annotates the risk evaluation of a support turn
 * and is never a resting phase.
 */
enum class Phase {
    Init,
    Consented,
    Triage,
    SupportLoop,
    RiskCheck,
    Resources,
    Escalate,
    Close
};

/**
 * @brief Risk severity, totally ordered
 */
enum class Severity {
    None = 0,
    Low = 1,
    Medium = 2,
    High = 3,
    Critical = 4
};

const char* phase_name(Phase phase);
bool parse_phase(const std::string& name, Phase& out);

const char* severity_name(Severity severity);
bool parse_severity(const std::string& name, Severity& out);

inline bool is_terminal(Phase phase) { return phase == Phase::Close; }

inline Severity max_severity(Severity a, Severity b) {
    return static_cast<int>(a) >= static_cast<int>(b) ? a : b;
}

inline bool at_least(Severity s, Severity threshold) {
    return static_cast<int>(s) >= static_cast<int>(threshold);
}

/// One level up, saturating at Critical
inline Severity raise_one(Severity s) {
    return s == Severity::Critical ? s : static_cast<Severity>(static_cast<int>(s) + 1);
}

} // namespace carebridge
