#pragma once

#include <string>
#include <variant>
#include <optional>
#include <stdexcept>

namespace carebridge {

/**
 * @brief Error types for different failure modes
 *
 * Only SessionClosed and NotFound cross the registry boundary; the rest are
 * handled where they occur and recorded in the session ledger.
 */
enum class ErrorType {
    None,
    GuardViolation,       ///< Transition attempted without its guard satisfied
    SessionClosed,        ///< Turn submitted to a closed session
    NotFound,             ///< Unknown session id
    CollaboratorTimeout,  ///< Classifier, generator or hand-off exceeded its bound
    CollaboratorError,    ///< Collaborator failed outright
    RedactionFailure,     ///< Redaction could not complete; content was fully masked
    EscalationExhausted,  ///< Hand-off attempts used up
    InvalidInput,
    IOError,
    ParseError,
    NetworkError
};

inline const char* error_type_name(ErrorType type) {
    switch (type) {
        case ErrorType::None:                return "none";
        case ErrorType::GuardViolation:      return "guard_violation";
        case ErrorType::SessionClosed:       return "session_closed";
        case ErrorType::NotFound:            return "not_found";
        case ErrorType::CollaboratorTimeout: return "collaborator_timeout";
        case ErrorType::CollaboratorError:   return "collaborator_error";
        case ErrorType::RedactionFailure:    return "redaction_failure";
        case ErrorType::EscalationExhausted: return "escalation_exhausted";
        case ErrorType::InvalidInput:        return "invalid_input";
        case ErrorType::IOError:             return "io_error";
        case ErrorType::ParseError:          return "parse_error";
        case ErrorType::NetworkError:        return "network_error";
    }
    return "unknown";
}

/**
 * @brief Error information structure
 */
struct Error {
    ErrorType type = ErrorType::None;
    std::string message;

    Error() = default;
    Error(ErrorType t, const std::string& msg) : type(t), message(msg) {}

    bool is_error() const { return type != ErrorType::None; }
    operator bool() const { return is_error(); }
};

/**
 * @brief Result type for operations that can fail
 *
 * Holds either a value of type T or an Error.
 */
template<typename T>
class Result {
public:
    // Construct from value (success)
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}

    // Construct from error
    Result(const Error& error) : data_(error) {}
    Result(Error&& error) : data_(std::move(error)) {}

    bool is_ok() const {
        return std::holds_alternative<T>(data_);
    }

    bool is_error() const {
        return std::holds_alternative<Error>(data_);
    }

    // Get value (throws if error)
    const T& value() const {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value");
        }
        return std::get<T>(data_);
    }

    T& value() {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value");
        }
        return std::get<T>(data_);
    }

    // Get error (throws if success)
    const Error& error() const {
        if (is_ok()) {
            throw std::runtime_error("Result is success, cannot get error");
        }
        return std::get<Error>(data_);
    }

    explicit operator bool() const {
        return is_ok();
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void (success/failure only)
template<>
class Result<void> {
public:
    Result() : is_ok_(true) {}
    Result(const Error& error) : is_ok_(false), error_(error) {}
    Result(Error&& error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok() const { return is_ok_; }
    bool is_error() const { return !is_ok_; }
    const Error& error() const { return error_; }

    explicit operator bool() const { return is_ok_; }

private:
    bool is_ok_;
    Error error_;
};

using VoidResult = Result<void>;

// Helper functions for creating errors
inline Error make_error(ErrorType type, const std::string& message) {
    return Error(type, message);
}

inline Error make_guard_violation(const std::string& message) {
    return Error(ErrorType::GuardViolation, message);
}

inline Error make_session_closed_error(const std::string& session_id) {
    return Error(ErrorType::SessionClosed, "Session " + session_id + " is closed");
}

inline Error make_not_found_error(const std::string& session_id) {
    return Error(ErrorType::NotFound, "Unknown session " + session_id);
}

inline Error make_timeout_error(const std::string& message = "Collaborator timed out") {
    return Error(ErrorType::CollaboratorTimeout, message);
}

inline Error make_collaborator_error(const std::string& message) {
    return Error(ErrorType::CollaboratorError, message);
}

inline Error make_io_error(const std::string& message) {
    return Error(ErrorType::IOError, message);
}

inline Error make_network_error(const std::string& message) {
    return Error(ErrorType::NetworkError, message);
}

inline Error make_parse_error(const std::string& message) {
    return Error(ErrorType::ParseError, message);
}

} // namespace carebridge
