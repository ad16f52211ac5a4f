/**
 * Configuration and resource directory files.
 * Asserts:
 * - A missing or malformed file yields defaults.
 * - Values survive save/load; inconsistent thresholds are corrected.
 * - A directory file replaces a locale's resources and adds locales.
 */

#include "config.h"
#include "collaborators/resource_directory.h"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

using namespace carebridge;
namespace fs = std::filesystem;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static void write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

int main() {
    fs::path dir = fs::temp_directory_path() / ("carebridge_config_" + std::to_string(wall_clock_ms()));
    fs::create_directories(dir);

    // --- Defaults ---
    {
        Config defaults = Config::load_from_file((dir / "missing.json").string());
        ASSERT(defaults.session.max_messages == 50);
        ASSERT(defaults.risk.escalation_threshold == Severity::High);
        ASSERT(defaults.risk.emergency_threshold == Severity::Critical);
        ASSERT(defaults.generation.endpoint.empty());
        ASSERT(defaults.escalation.handoff_endpoint.empty());

        write_file(dir / "broken.json", "{ \"session\": ");
        Config broken = Config::load_from_file((dir / "broken.json").string());
        ASSERT(broken.session.max_messages == 50);

        // Wrong type for a known key falls back to defaults entirely
        write_file(dir / "typed.json", R"({"session": {"max_messages": "lots"}})");
        Config typed = Config::load_from_file((dir / "typed.json").string());
        ASSERT(typed.session.max_messages == 50);
    }

    // --- Partial file and corrections ---
    {
        write_file(dir / "partial.json", R"({
            "session": {"max_messages": 12, "default_locale": "UK"},
            "risk": {"escalation_threshold": "critical", "emergency_threshold": "medium",
                     "keywords": {"abuse": ["locked me in"]}},
            "escalation": {"max_attempts": 0},
            "observability": {"queue_capacity": 0},
            "resources": {"directory_file": "resources.json"}
        })");
        Config cfg = Config::load_from_file((dir / "partial.json").string());
        ASSERT(cfg.session.max_messages == 12);
        ASSERT(cfg.session.default_locale == "UK");
        ASSERT(cfg.session.idle_timeout_ms == Config().session.idle_timeout_ms);
        ASSERT(cfg.risk.escalation_threshold == Severity::Critical);
        ASSERT(cfg.risk.emergency_threshold == Severity::Critical);
        ASSERT(cfg.risk.keyword_overrides.at("abuse").size() == 1);
        ASSERT(cfg.escalation.max_attempts == 1);
        ASSERT(cfg.observability.queue_capacity == 1);
        ASSERT(fs::path(cfg.resources.directory_file) == dir / "resources.json");

        write_file(dir / "unknown.json", R"({"risk": {"escalation_threshold": "extreme"}})");
        ASSERT(Config::load_from_file((dir / "unknown.json").string()).risk.escalation_threshold == Severity::High);
    }

    // --- Save and load ---
    {
        Config cfg;
        cfg.session.consent_timeout_ms = 1234;
        cfg.risk.classifier_endpoint = "http://localhost:9000/classify";
        cfg.risk.sustained_window = 4;
        cfg.redaction.reversible_tokens = true;
        cfg.escalation.retry_limit = 7;
        cfg.escalation.crisis_line = "555-0100";
        cfg.generation.model_name = "mistral";
        cfg.store.enabled = false;
        cfg.observability.feed_url = "http://localhost:8088/events";
        cfg.logging.level = "debug";
        const fs::path path = dir / "saved.json";
        ASSERT(cfg.save_to_file(path.string()));

        Config back = Config::load_from_file(path.string());
        ASSERT(back.session.consent_timeout_ms == 1234);
        ASSERT(back.risk.classifier_endpoint == cfg.risk.classifier_endpoint);
        ASSERT(back.risk.sustained_window == 4);
        ASSERT(back.redaction.reversible_tokens);
        ASSERT(back.escalation.retry_limit == 7);
        ASSERT(back.escalation.crisis_line == "555-0100");
        ASSERT(back.generation.model_name == "mistral");
        ASSERT(!back.store.enabled);
        ASSERT(back.observability.feed_url == cfg.observability.feed_url);
        ASSERT(back.logging.level == "debug");
    }

    // --- Resource directory file ---
    {
        StaticResourceDirectory directory;
        ASSERT(directory.emergency_number("US") == "911");
        ASSERT(directory.emergency_number("gb") == "999");
        ASSERT(directory.emergency_number("ZZ") == "911");
        auto fallback = directory.lookup("ZZ", "crisis");
        ASSERT(fallback.is_ok());
        ASSERT(fallback.value().locale == "US");
        ASSERT(!fallback.value().empty());

        write_file(dir / "resources.json", R"({
            "emergency_numbers": {"NZ": "111"},
            "resources": {"NZ": [
                {"id": "nz_1737", "name": "Need to Talk? 1737", "type": "crisis_line",
                 "phone": "1737", "text_number": "1737", "categories": ["crisis", "general"]},
                {"id": "nz_women", "name": "Women's Refuge", "type": "hotline",
                 "phone": "0800 733 843", "categories": ["abuse"]}
            ]}
        })");
        ASSERT(directory.load_file((dir / "resources.json").string()).is_ok());
        ASSERT(directory.emergency_number("NZ") == "111");

        auto abuse = directory.lookup("nz", "abuse");
        ASSERT(abuse.is_ok());
        ASSERT(abuse.value().locale == "NZ");
        ASSERT(abuse.value().resources.size() == 1);
        ASSERT(abuse.value().resources[0].id == "nz_women");
        ASSERT(abuse.value().render().find("0800 733 843") != std::string::npos);

        // No specific entry: general resources
        auto other = directory.lookup("NZ", "harm_to_others");
        ASSERT(other.is_ok());
        ASSERT(other.value().resources.size() == 1);
        ASSERT(other.value().resources[0].id == "nz_1737");

        ASSERT(directory.load_file((dir / "nope.json").string()).is_error());
        write_file(dir / "bad_resources.json", "[1, 2");
        ASSERT(directory.load_file((dir / "bad_resources.json").string()).is_error());
    }

    fs::remove_all(dir);

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All config tests passed.\n";
    return 0;
}
