#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace wpsgate {

/**
 * @brief Error categories for the compliance pipeline
 */
enum class ErrorCategory {
    NONE,
    FORMAT_ERROR,
    VALIDATION_BLOCKED,
    CONNECTION_NOT_ACTIVE,
    TRANSMISSION_ERROR,
    RETRY_EXHAUSTED,
    STATE_ERROR,
    CONFIG_ERROR,
    NOT_FOUND,
    INTERNAL_ERROR
};

inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                  return "none";
        case ErrorCategory::FORMAT_ERROR:          return "format_error";
        case ErrorCategory::VALIDATION_BLOCKED:    return "validation_blocked";
        case ErrorCategory::CONNECTION_NOT_ACTIVE: return "connection_not_active";
        case ErrorCategory::TRANSMISSION_ERROR:    return "transmission_error";
        case ErrorCategory::RETRY_EXHAUSTED:       return "retry_exhausted";
        case ErrorCategory::STATE_ERROR:           return "state_error";
        case ErrorCategory::CONFIG_ERROR:          return "config_error";
        case ErrorCategory::NOT_FOUND:             return "not_found";
        case ErrorCategory::INTERNAL_ERROR:        return "internal_error";
    }
    return "internal_error";
}

/**
 * @brief Result type for operations that can fail without throwing
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

// ============================================================================
// Exception taxonomy
// ============================================================================

class WpsError : public std::runtime_error {
public:
    WpsError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    [[nodiscard]] ErrorCategory category() const { return category_; }

private:
    ErrorCategory category_;
};

/// Encoding constraint violated (width overflow, non-integral subunits,
/// missing required header field). Never retried.
class FormatError : public WpsError {
public:
    explicit FormatError(const std::string& message)
        : WpsError(ErrorCategory::FORMAT_ERROR, message) {}
};

/// Target bank connection is not in the active state.
class ConnectionNotActiveError : public WpsError {
public:
    explicit ConnectionNotActiveError(const std::string& message)
        : WpsError(ErrorCategory::CONNECTION_NOT_ACTIVE, message) {}
};

/// Connector-level I/O or protocol failure. Recovered locally up to the
/// retry budget.
class TransmissionError : public WpsError {
public:
    explicit TransmissionError(const std::string& message)
        : WpsError(ErrorCategory::TRANSMISSION_ERROR, message) {}
};

/// Illegal lifecycle transition on a batch, connection or submission.
class StateError : public WpsError {
public:
    explicit StateError(const std::string& message)
        : WpsError(ErrorCategory::STATE_ERROR, message) {}
};

class ConfigError : public WpsError {
public:
    explicit ConfigError(const std::string& message)
        : WpsError(ErrorCategory::CONFIG_ERROR, message) {}
};

class NotFoundError : public WpsError {
public:
    explicit NotFoundError(const std::string& message)
        : WpsError(ErrorCategory::NOT_FOUND, message) {}
};

// ValidationBlocked and RetryExhausted carry domain payloads and are
// declared next to those types (validation/validation_types.hpp,
// submission/submission.hpp).

} // namespace wpsgate
