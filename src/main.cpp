#include "config.h"
#include "logger.h"
#include "session_registry.h"
#include "utils.h"
#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <map>
#include <string>
#include <unistd.h>

namespace carebridge {

static std::atomic<bool> g_stop{false};

void signal_handler(int) {
    g_stop = true;
}

namespace {

void print_usage() {
    std::cout << "Usage: carebridge [config.json] [--restore <session_id>] [--locale <CC>]\n"
              << "Commands during a session:\n"
              << "  :yes / :no     explicit consent answer (:consent = :yes)\n"
              << "  :resources     ask for support resources\n"
              << "  :revoke        withdraw consent (closes the session)\n"
              << "  :status        show the session snapshot\n"
              << "  :events        dump the session's event stream\n"
              << "  :exit          end the session\n";
}

void print_outcome(const TurnOutcome& outcome) {
    std::cout << "\n" << outcome.response << "\n";
    std::cout << "  [" << phase_name(outcome.phase) << " | risk " << severity_name(outcome.verdict.severity)
              << (outcome.verdict.degraded ? " (degraded)" : "") << "]\n";
    if (outcome.closed) {
        std::cout << "  [session closed: " << outcome.close_reason << "]\n";
    }
}

/// Default config next to the executable (build/../config/carebridge.json), else none
std::string default_config_path() {
    char buf[1024];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len == -1) return "";
    buf[len] = '\0';
    std::string exe_dir(buf);
    size_t pos = exe_dir.find_last_of('/');
    if (pos == std::string::npos) return "";
    std::string candidate = exe_dir.substr(0, pos) + "/../config/carebridge.json";
    std::ifstream test(candidate);
    return test.good() ? candidate : "";
}

} // namespace

} // namespace carebridge

int main(int argc, char* argv[]) {
    using namespace carebridge;

    Logger::initialize(LogLevel::INFO);

    std::string config_path;
    std::string restore_id;
    std::string locale;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage();
            Logger::shutdown();
            return 0;
        } else if (arg == "--restore" && i + 1 < argc) {
            restore_id = argv[++i];
        } else if (arg == "--locale" && i + 1 < argc) {
            locale = argv[++i];
        } else {
            config_path = arg;
        }
    }
    if (config_path.empty()) {
        config_path = default_config_path();
    }

    Config config = config_path.empty() ? Config() : Config::load_from_file(config_path);
    Logger::shutdown();
    Logger::initialize(Logger::parse_level(config.logging.level), config.logging.file);

    SessionRegistry registry(config);
    registry.start();

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::string session_id;
    if (!restore_id.empty()) {
        auto restored = registry.restore_session(restore_id);
        if (restored.is_error()) {
            std::cerr << "Cannot restore " << restore_id << ": " << restored.error().message << "\n";
            registry.stop();
            Logger::shutdown();
            return 1;
        }
        session_id = restore_id;
    } else {
        std::map<std::string, std::string> metadata;
        metadata["locale"] = locale.empty() ? config.session.default_locale : locale;
        metadata["channel"] = "cli";
        auto created = registry.create_session(metadata);
        if (created.is_error()) {
            std::cerr << "Cannot create session: " << created.error().message << "\n";
            registry.stop();
            Logger::shutdown();
            return 1;
        }
        session_id = created.value();
        std::cout << "Session " << session_id << "\n"
                  << "Hi, I'm a peer-support companion. I'm not a therapist or an emergency service.\n"
                  << "Do you consent to continue? (yes/no)\n";
    }

    int exit_code = 0;
    std::string line;
    while (!g_stop) {
        std::cout << "\n> " << std::flush;
        if (!std::getline(std::cin, line)) {
            auto closed = registry.close_session(session_id, "user_exit");
            if (closed.is_error() && closed.error().type != ErrorType::SessionClosed) {
                LOG_WARN("Close at end of input failed: " + closed.error().message);
            }
            break;
        }
        if (utils::is_empty_or_whitespace(line)) continue;

        TurnRequest request;
        if (line == ":status") {
            auto snap = registry.snapshot(session_id);
            if (snap.is_ok()) std::cout << snap.value().to_json().dump(2) << "\n";
            else std::cout << snap.error().message << "\n";
            continue;
        } else if (line == ":events") {
            for (const auto& event : registry.ledger()->replay(session_id)) {
                std::cout << event.to_json().dump() << "\n";
            }
            continue;
        } else if (line == ":yes" || line == ":consent") {
            request.consent = true;
            request.text = "yes";
        } else if (line == ":no") {
            request.consent = false;
            request.text = "no";
        } else if (line == ":resources") {
            request.request_resources = true;
            request.text = "resources";
        } else if (line == ":revoke") {
            request.consent = false;
            request.text = "I withdraw my consent";
        } else if (line == ":exit") {
            request.request_exit = true;
            request.text = "exit";
        } else {
            request.text = line;
        }

        auto outcome = registry.submit_turn(session_id, request);
        if (outcome.is_error()) {
            std::cout << "[" << error_type_name(outcome.error().type) << "] " << outcome.error().message << "\n";
            if (outcome.error().type == ErrorType::SessionClosed || outcome.error().type == ErrorType::NotFound) {
                break;
            }
            exit_code = 1;
            continue;
        }
        print_outcome(outcome.value());
        if (outcome.value().closed) break;
    }

    if (g_stop) {
        auto closed = registry.close_session(session_id, "shutdown");
        if (closed.is_error() && closed.error().type != ErrorType::SessionClosed) {
            LOG_WARN("Close on shutdown failed: " + closed.error().message);
        }
    }

    RegistryStats stats = registry.stats();
    Logger::info("Turns: " + std::to_string(stats.turns) + ", escalations: " + std::to_string(stats.escalations) +
                 ", observability drops: " + std::to_string(stats.observability_dropped));

    registry.stop();
    Logger::shutdown();
    return exit_code;
}
