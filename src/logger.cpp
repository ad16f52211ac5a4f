#include "logger.h"
#include <iostream>
#include <fstream>
#include <mutex>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <ctime>

namespace carebridge {

class Logger::Impl {
public:
    Impl() = default;

    void configure(LogLevel min_level, const std::string& output_file, bool console) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = min_level;
        console_ = console;
        file_stream_.reset();
        if (!output_file.empty()) {
            file_stream_ = std::make_unique<std::ofstream>(output_file, std::ios::app);
            if (!file_stream_->is_open()) {
                std::cerr << "Warning: Failed to open log file: " << output_file << std::endl;
                file_stream_.reset();
            }
        }
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (file_stream_ && file_stream_->is_open()) {
            file_stream_->close();
        }
        file_stream_.reset();
        min_level_ = LogLevel::INFO;
        console_ = true;
    }

    void log(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < min_level_) {
            return;
        }

        // Format: [LEVEL] timestamp: message
        auto now = std::chrono::system_clock::now();
        std::time_t time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;
        std::tm local_tm{};
        localtime_r(&time_t, &local_tm);

        std::ostringstream oss;
        oss << "[" << Logger::level_string(level) << "] "
            << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
            << "." << std::setfill('0') << std::setw(3) << ms.count()
            << ": " << message;

        std::string formatted = oss.str();

        if (console_) {
            // stderr for WARN/ERROR, stdout for INFO/DEBUG
            if (level >= LogLevel::WARN) {
                std::cerr << formatted << std::endl;
            } else {
                std::cout << formatted << std::endl;
            }
        }

        if (file_stream_ && file_stream_->is_open()) {
            *file_stream_ << formatted << std::endl;
            file_stream_->flush();
        }

        if (sink_) {
            sink_(level, formatted);
        }
    }

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    LogLevel get_level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return min_level_;
    }

    void set_sink(Sink sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = std::move(sink);
    }

private:
    mutable std::mutex mutex_;
    LogLevel min_level_ = LogLevel::INFO;
    bool console_ = true;
    std::unique_ptr<std::ofstream> file_stream_;
    Sink sink_;
};

// Function-local static: usable from any thread before or after initialize()
Logger::Impl& Logger::instance() {
    static Impl impl;
    return impl;
}

void Logger::initialize(LogLevel min_level, const std::string& output_file, bool console) {
    instance().configure(min_level, output_file, console);
}

void Logger::shutdown() {
    instance().close();
}

void Logger::log(LogLevel level, const std::string& message) {
    instance().log(level, message);
}

const char* Logger::level_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warn(const std::string& message) {
    log(LogLevel::WARN, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void Logger::set_level(LogLevel level) {
    instance().set_level(level);
}

LogLevel Logger::get_level() {
    return instance().get_level();
}

void Logger::set_sink(Sink sink) {
    instance().set_sink(std::move(sink));
}

LogLevel Logger::parse_level(const std::string& name) {
    if (name == "debug" || name == "DEBUG") return LogLevel::DEBUG;
    if (name == "warn" || name == "WARN" || name == "warning") return LogLevel::WARN;
    if (name == "error" || name == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

} // namespace carebridge
