#pragma once

#include <string>
#include <memory>
#include <functional>

namespace carebridge {

/**
 * @brief Log levels for filtering output
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * @brief Lightweight, thread-safe logging system
 *
 * Provides leveled logging to the console, an optional file, and an optional
 * capture sink. Thread-safe for concurrent use from session workers, sweepers
 * and the observability worker.
 *
 * Log lines must never contain raw user text. Components log sanitized text,
 * session ids, phases and severities only.
 */
class Logger {
public:
    /// Receives every formatted line that passes the level filter
    using Sink = std::function<void(LogLevel level, const std::string& line)>;

    /**
     * @brief Initialize logger with minimum log level
     * @param min_level Minimum level to output (default: INFO)
     * @param output_file Optional file path for log output (empty = console only)
     * @param console When false, lines go only to the file and sink
     */
    static void initialize(LogLevel min_level = LogLevel::INFO,
                           const std::string& output_file = "",
                           bool console = true);

    /**
     * @brief Shutdown logger and close file handles
     */
    static void shutdown();

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    /**
     * @brief Set minimum log level (filters output)
     */
    static void set_level(LogLevel level);

    static LogLevel get_level();

    /**
     * @brief Install a capture sink (empty function removes it). The sink must not log.
     */
    static void set_sink(Sink sink);

    /**
     * @brief Parse a level name ("debug", "info", "warn", "error"); unknown names give INFO
     */
    static LogLevel parse_level(const std::string& name);

private:
    class Impl;
    static Impl& instance();

    static void log(LogLevel level, const std::string& message);
    static const char* level_string(LogLevel level);
};

// Convenience macros for component-specific logging
#define LOG_DEBUG(msg) carebridge::Logger::debug("[" + std::string(__FILE__) + ":" + std::to_string(__LINE__) + "] " + msg)
#define LOG_INFO(msg) carebridge::Logger::info(msg)
#define LOG_WARN(msg) carebridge::Logger::warn(msg)
#define LOG_ERROR(msg) carebridge::Logger::error(msg)

// Component-specific logging macros
#define LOG_SESSION(msg) carebridge::Logger::info(std::string("[Session] ") + (msg))
#define LOG_RISK(msg) carebridge::Logger::info(std::string("[Risk] ") + (msg))
#define LOG_REDACT(msg) carebridge::Logger::debug(std::string("[Redact] ") + (msg))
#define LOG_LEDGER(msg) carebridge::Logger::debug(std::string("[Ledger] ") + (msg))
#define LOG_ESCALATION(msg) carebridge::Logger::warn(std::string("[Escalation] ") + (msg))
#define LOG_REGISTRY(msg) carebridge::Logger::info(std::string("[Registry] ") + (msg))
#define LOG_LLM(msg) carebridge::Logger::info(std::string("[LLM] ") + (msg))
#define LOG_TRACE(session_id, stage, data) carebridge::Logger::debug(std::string("[trace] session_id=") + (session_id) + " stage=" + (stage) + " " + (data))

} // namespace carebridge
