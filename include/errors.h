#pragma once

#include <stdexcept>
#include <string>
#include <variant>

namespace viva {

/**
 * @brief Error types for the interview failure taxonomy
 *
 * InvalidPlan is the only failure surfaced at start(). SpeechTimeout and
 * ScoringFailure are recovered inside the owning component. BudgetExhausted
 * and DeadlineExceeded are conditions, not failures. Aborted is terminal.
 */
enum class ErrorType {
    None,
    InvalidPlan,
    SpeechTimeout,
    ScoringFailure,
    BudgetExhausted,
    DeadlineExceeded,
    Aborted,
    Cancelled,
    IOError,
    NetworkError,
    ParseError,
    InvalidState,
    Unknown
};

const char* error_type_name(ErrorType type);

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

    std::string to_string() const {
        return std::string(error_type_name(type)) + ": " + message;
    }
};

/**
 * @brief Result type for operations that can fail
 *
 * Holds either a value of type T or an Error.
 */
template<typename T>
class Result {
public:
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}

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

    T value_or(const T& default_value) const {
        return is_ok() ? std::get<T>(data_) : default_value;
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

inline Error make_invalid_plan_error(const std::string& message) {
    return Error(ErrorType::InvalidPlan, message);
}

inline Error make_speech_timeout_error(const std::string& message = "Speech call timed out") {
    return Error(ErrorType::SpeechTimeout, message);
}

inline Error make_scoring_error(const std::string& message) {
    return Error(ErrorType::ScoringFailure, message);
}

inline Error make_cancelled_error(const std::string& message = "Operation cancelled") {
    return Error(ErrorType::Cancelled, message);
}

inline Error make_invalid_state_error(const std::string& message) {
    return Error(ErrorType::InvalidState, message);
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

} // namespace viva
