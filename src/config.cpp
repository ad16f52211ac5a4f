#include "config.h"
#include "logger.h"
#include "path_utils.h"
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

using carebridge::Logger;

void read_severity(const json& section, const char* key, carebridge::Severity& out) {
    if (!section.contains(key) || !section[key].is_string()) return;
    carebridge::Severity parsed;
    std::string name = section[key].get<std::string>();
    if (carebridge::parse_severity(name, parsed)) {
        out = parsed;
    } else {
        Logger::warn(std::string("Config: unknown severity \"") + name + "\" for risk." + key + "; keeping default.");
    }
}

/// Apply full JSON config (all sections) into cfg
void apply_json_to_config(carebridge::Config& cfg, const json& j) {
    // Session lifecycle
    if (j.contains("session") && j["session"].is_object()) {
        const auto& s = j["session"];
        if (s.contains("consent_timeout_ms")) cfg.session.consent_timeout_ms = s["consent_timeout_ms"];
        if (s.contains("triage_timeout_ms")) cfg.session.triage_timeout_ms = s["triage_timeout_ms"];
        if (s.contains("idle_timeout_ms")) cfg.session.idle_timeout_ms = s["idle_timeout_ms"];
        if (s.contains("hard_timeout_ms")) cfg.session.hard_timeout_ms = s["hard_timeout_ms"];
        if (s.contains("max_messages")) cfg.session.max_messages = s["max_messages"];
        if (s.contains("sweep_interval_ms")) cfg.session.sweep_interval_ms = s["sweep_interval_ms"];
        if (s.contains("closed_retention_ms")) cfg.session.closed_retention_ms = s["closed_retention_ms"];
        if (s.contains("default_locale") && s["default_locale"].is_string())
            cfg.session.default_locale = s["default_locale"].get<std::string>();
    }

    // Risk monitor
    if (j.contains("risk") && j["risk"].is_object()) {
        const auto& r = j["risk"];
        read_severity(r, "escalation_threshold", cfg.risk.escalation_threshold);
        read_severity(r, "emergency_threshold", cfg.risk.emergency_threshold);
        if (r.contains("classifier_endpoint") && r["classifier_endpoint"].is_string())
            cfg.risk.classifier_endpoint = r["classifier_endpoint"].get<std::string>();
        if (r.contains("classifier_timeout_ms")) cfg.risk.classifier_timeout_ms = r["classifier_timeout_ms"];
        if (r.contains("context_turns")) cfg.risk.context_turns = r["context_turns"];
        if (r.contains("sustained_window")) cfg.risk.sustained_window = r["sustained_window"];
        if (r.contains("keywords") && r["keywords"].is_object()) {
            cfg.risk.keyword_overrides.clear();
            for (auto it = r["keywords"].begin(); it != r["keywords"].end(); ++it) {
                if (!it.value().is_array()) continue;
                std::vector<std::string> phrases;
                for (const auto& phrase : it.value()) {
                    if (phrase.is_string()) phrases.push_back(phrase.get<std::string>());
                }
                cfg.risk.keyword_overrides[it.key()] = phrases;
            }
        }
    }
    if (static_cast<int>(cfg.risk.emergency_threshold) < static_cast<int>(cfg.risk.escalation_threshold)) {
        Logger::warn("Config: risk.emergency_threshold below escalation_threshold; raising it to match.");
        cfg.risk.emergency_threshold = cfg.risk.escalation_threshold;
    }

    if (j.contains("redaction") && j["redaction"].is_object()) {
        const auto& r = j["redaction"];
        if (r.contains("max_input_chars")) cfg.redaction.max_input_chars = r["max_input_chars"];
        if (r.contains("reversible_tokens")) cfg.redaction.reversible_tokens = r["reversible_tokens"];
    }

    // Escalation
    if (j.contains("escalation") && j["escalation"].is_object()) {
        const auto& e = j["escalation"];
        if (e.contains("max_attempts")) cfg.escalation.max_attempts = e["max_attempts"];
        if (e.contains("attempt_timeout_ms")) cfg.escalation.attempt_timeout_ms = e["attempt_timeout_ms"];
        if (e.contains("retry_interval_ms")) cfg.escalation.retry_interval_ms = e["retry_interval_ms"];
        if (e.contains("retry_limit")) cfg.escalation.retry_limit = e["retry_limit"];
        if (e.contains("handoff_endpoint") && e["handoff_endpoint"].is_string())
            cfg.escalation.handoff_endpoint = e["handoff_endpoint"].get<std::string>();
        if (e.contains("crisis_line") && e["crisis_line"].is_string())
            cfg.escalation.crisis_line = e["crisis_line"].get<std::string>();
    }
    if (cfg.escalation.max_attempts < 1) {
        Logger::warn("Config: escalation.max_attempts must be at least 1; using 1.");
        cfg.escalation.max_attempts = 1;
    }

    // Generation (LLM)
    if (j.contains("generation") && j["generation"].is_object()) {
        const auto& g = j["generation"];
        if (g.contains("endpoint") && g["endpoint"].is_string()) cfg.generation.endpoint = g["endpoint"];
        if (g.contains("model_name") && g["model_name"].is_string()) cfg.generation.model_name = g["model_name"];
        if (g.contains("timeout_ms")) cfg.generation.timeout_ms = g["timeout_ms"];
        if (g.contains("temperature")) cfg.generation.temperature = g["temperature"];
        if (g.contains("context_max_turns")) cfg.generation.context_max_turns = g["context_max_turns"];
        if (g.contains("fallback_phrase") && g["fallback_phrase"].is_string())
            cfg.generation.fallback_phrase = g["fallback_phrase"];
        if (g.contains("system_prompt") && g["system_prompt"].is_string())
            cfg.generation.system_prompt = g["system_prompt"];
    }

    if (j.contains("resources") && j["resources"].is_object()) {
        const auto& r = j["resources"];
        if (r.contains("directory_file") && r["directory_file"].is_string())
            cfg.resources.directory_file = r["directory_file"];
    }

    if (j.contains("store") && j["store"].is_object()) {
        const auto& s = j["store"];
        if (s.contains("enabled")) cfg.store.enabled = s["enabled"];
        if (s.contains("dir") && s["dir"].is_string()) cfg.store.dir = s["dir"];
    }

    if (j.contains("observability") && j["observability"].is_object()) {
        const auto& o = j["observability"];
        if (o.contains("queue_capacity")) cfg.observability.queue_capacity = o["queue_capacity"];
        if (o.contains("feed_url") && o["feed_url"].is_string()) cfg.observability.feed_url = o["feed_url"];
        if (o.contains("log_events")) cfg.observability.log_events = o["log_events"];
    }
    if (cfg.observability.queue_capacity == 0) {
        cfg.observability.queue_capacity = 1;
    }

    if (j.contains("logging") && j["logging"].is_object()) {
        const auto& l = j["logging"];
        if (l.contains("level") && l["level"].is_string()) cfg.logging.level = l["level"];
        if (l.contains("file") && l["file"].is_string()) cfg.logging.file = l["file"];
    }
}

} // anonymous namespace

namespace carebridge {

Config Config::load_from_file(const std::string& path) {
    Config cfg;

    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::warn("Could not open config file: " + path + ". Using defaults.");
        return cfg;
    }
    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        Logger::error("Error parsing config JSON: " + std::string(e.what()));
        return cfg;
    }

    try {
        apply_json_to_config(cfg, j);
    } catch (const json::exception& e) {
        // Wrong value type for a known key
        Logger::error("Invalid config value in " + path + ": " + std::string(e.what()) + ". Using defaults.");
        return Config{};
    }

    if (!cfg.resources.directory_file.empty())
        cfg.resources.directory_file = resolve_config_relative(path, cfg.resources.directory_file);
    if (!cfg.store.dir.empty()) cfg.store.dir = expand_path(cfg.store.dir);
    if (!cfg.logging.file.empty()) cfg.logging.file = expand_path(cfg.logging.file);

    return cfg;
}

bool Config::save_to_file(const std::string& path) const {
    json j;

    j["session"]["consent_timeout_ms"] = session.consent_timeout_ms;
    j["session"]["triage_timeout_ms"] = session.triage_timeout_ms;
    j["session"]["idle_timeout_ms"] = session.idle_timeout_ms;
    j["session"]["hard_timeout_ms"] = session.hard_timeout_ms;
    j["session"]["max_messages"] = session.max_messages;
    j["session"]["sweep_interval_ms"] = session.sweep_interval_ms;
    j["session"]["closed_retention_ms"] = session.closed_retention_ms;
    j["session"]["default_locale"] = session.default_locale;

    j["risk"]["escalation_threshold"] = severity_name(risk.escalation_threshold);
    j["risk"]["emergency_threshold"] = severity_name(risk.emergency_threshold);
    j["risk"]["classifier_endpoint"] = risk.classifier_endpoint;
    j["risk"]["classifier_timeout_ms"] = risk.classifier_timeout_ms;
    j["risk"]["context_turns"] = risk.context_turns;
    j["risk"]["sustained_window"] = risk.sustained_window;
    if (!risk.keyword_overrides.empty()) {
        j["risk"]["keywords"] = risk.keyword_overrides;
    }

    j["redaction"]["max_input_chars"] = redaction.max_input_chars;
    j["redaction"]["reversible_tokens"] = redaction.reversible_tokens;

    j["escalation"]["max_attempts"] = escalation.max_attempts;
    j["escalation"]["attempt_timeout_ms"] = escalation.attempt_timeout_ms;
    j["escalation"]["retry_interval_ms"] = escalation.retry_interval_ms;
    j["escalation"]["retry_limit"] = escalation.retry_limit;
    j["escalation"]["handoff_endpoint"] = escalation.handoff_endpoint;
    j["escalation"]["crisis_line"] = escalation.crisis_line;

    j["generation"]["endpoint"] = generation.endpoint;
    j["generation"]["model_name"] = generation.model_name;
    j["generation"]["timeout_ms"] = generation.timeout_ms;
    j["generation"]["temperature"] = generation.temperature;
    j["generation"]["context_max_turns"] = generation.context_max_turns;
    j["generation"]["fallback_phrase"] = generation.fallback_phrase;
    j["generation"]["system_prompt"] = generation.system_prompt;

    j["resources"]["directory_file"] = resources.directory_file;

    j["store"]["enabled"] = store.enabled;
    j["store"]["dir"] = store.dir;

    j["observability"]["queue_capacity"] = observability.queue_capacity;
    j["observability"]["feed_url"] = observability.feed_url;
    j["observability"]["log_events"] = observability.log_events;

    j["logging"]["level"] = logging.level;
    j["logging"]["file"] = logging.file;

    std::ofstream file(path);
    if (!file.is_open()) {
        Logger::error("Could not write config file: " + path);
        return false;
    }
    file << j.dump(2);
    return true;
}

} // namespace carebridge
