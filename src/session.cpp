#include "session.h"

using json = nlohmann::json;

namespace carebridge {

std::string Session::locale(const std::string& fallback) const {
    auto it = metadata.find("locale");
    return it != metadata.end() && !it->second.empty() ? it->second : fallback;
}

json Session::to_record() const {
    json j;
    j["session_id"] = id;
    j["phase"] = phase_name(phase);
    j["consented"] = consented;
    j["message_count"] = message_count;
    j["created_at_ms"] = created_at_ms;
    j["last_activity_ms"] = last_activity_ms;
    j["metadata"] = metadata;
    j["close_reason"] = close_reason;
    j["triage_degraded"] = triage_degraded;
    j["risk_history"] = json::array();
    for (const auto& v : risk_history) {
        j["risk_history"].push_back(verdict_to_json(v));
    }
    if (escalation) {
        j["escalation"] = escalation->to_json();
    }
    j["escalation_unresolved"] = escalation_unresolved;
    return j;
}

json verdict_to_json(const RiskVerdict& verdict) {
    json j;
    j["severity"] = severity_name(verdict.severity);
    j["confidence"] = verdict.confidence;
    j["signals"] = verdict.signals;
    j["degraded"] = verdict.degraded;
    j["floored"] = verdict.floored;
    j["source"] = verdict.source;
    if (!verdict.degraded_reason.empty()) j["degraded_reason"] = verdict.degraded_reason;
    j["timestamp_ms"] = verdict.timestamp_ms;
    return j;
}

Result<RiskVerdict> verdict_from_json(const json& j) {
    try {
        RiskVerdict v;
        std::string severity = j.at("severity").get<std::string>();
        if (!parse_severity(severity, v.severity)) {
            return make_parse_error("unknown severity: " + severity);
        }
        v.confidence = j.value("confidence", 0.0f);
        if (j.contains("signals")) v.signals = j["signals"].get<std::vector<std::string>>();
        v.degraded = j.value("degraded", false);
        v.floored = j.value("floored", false);
        v.source = j.value("source", "keyword");
        v.degraded_reason = j.value("degraded_reason", "");
        v.timestamp_ms = j.value("timestamp_ms", static_cast<int64_t>(0));
        return v;
    } catch (const json::exception& e) {
        return make_parse_error(std::string("malformed verdict: ") + e.what());
    }
}

} // namespace carebridge
