#include "common.h"
#include "utils.h"

namespace carebridge {

const char* phase_name(Phase phase) {
    switch (phase) {
        case Phase::Init:        return "INIT";
        case Phase::Consented:   return "CONSENTED";
        case Phase::Triage:      return "TRIAGE";
        case Phase::SupportLoop: return "SUPPORT_LOOP";
        case Phase::RiskCheck:   return "RISK_CHECK";
        case Phase::Resources:   return "RESOURCES";
        case Phase::Escalate:    return "ESCALATE";
        case Phase::Close:       return "CLOSE";
    }
    return "UNKNOWN";
}

bool parse_phase(const std::string& name, Phase& out) {
    static const Phase all[] = {
        Phase::Init, Phase::Consented, Phase::Triage, Phase::SupportLoop,
        Phase::RiskCheck, Phase::Resources, Phase::Escalate, Phase::Close
    };
    for (Phase p : all) {
        if (name == phase_name(p)) {
            out = p;
            return true;
        }
    }
    return false;
}

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::None:     return "none";
        case Severity::Low:      return "low";
        case Severity::Medium:   return "medium";
        case Severity::High:     return "high";
        case Severity::Critical: return "critical";
    }
    return "unknown";
}

bool parse_severity(const std::string& name, Severity& out) {
    std::string n = utils::normalize_copy(utils::trim_copy(name));
    static const Severity all[] = {
        Severity::None, Severity::Low, Severity::Medium, Severity::High, Severity::Critical
    };
    for (Severity s : all) {
        if (n == severity_name(s)) {
            out = s;
            return true;
        }
    }
    return false;
}

} // namespace carebridge
