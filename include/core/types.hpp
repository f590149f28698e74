#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <chrono>
#include <cstdint>

namespace wpsgate {

// ============================================================================
// Basic Enums
// ============================================================================

enum class FileType {
    SIF,
    NON_SIF
};

enum class BatchState {
    DRAFT,
    GENERATED,
    SUBMITTED,
    PROCESSED,
    REJECTED,
    CANCELLED
};

enum class Severity {
    ERROR,      // Blocks submission
    WARNING,    // Allows override
    INFO        // Notification only
};

enum class RuleType {
    FORMAT,
    RANGE,
    REQUIRED,
    UNIQUE,
    REFERENCE,
    CALCULATION,
    BUSINESS,
    COMPLIANCE
};

enum class RuleScope {
    FILE,
    LINE,
    EMPLOYEE,
    BANK_ACCOUNT
};

enum class ValidationStatus {
    VALID,
    INVALID,
    WARNING
};

enum class Protocol {
    REST,
    SOAP,
    SFTP,
    MANUAL
};

enum class AuthMethod {
    API_KEY,
    OAUTH2,
    CERTIFICATE,
    BASIC
};

enum class ConnectionState {
    DRAFT,
    TESTING,
    ACTIVE,
    SUSPENDED
};

enum class SubmissionType {
    NEW,
    CORRECTION,
    CANCELLATION
};

enum class SubmissionState {
    DRAFT,
    SUBMITTED,
    PROCESSING,
    SUCCESS,
    FAILED,
    CANCELLED
};

enum class ComplianceStatus {
    COMPLIANT,
    PARTIAL,
    NON_COMPLIANT
};

// ============================================================================
// Salary Period
// ============================================================================

struct SalaryPeriod {
    unsigned month = 0;     // 1-12
    int year = 0;           // 4-digit

    SalaryPeriod() = default;
    SalaryPeriod(unsigned m, int y) : month(m), year(y) {}

    [[nodiscard]] bool valid() const {
        return month >= 1 && month <= 12 && year >= 1000 && year <= 9999;
    }

    // WPS filing deadline: 15th of the following month
    [[nodiscard]] std::chrono::year_month_day deadline() const {
        const auto next = std::chrono::year_month{std::chrono::year{year}, std::chrono::month{month}}
                        + std::chrono::months{1};
        return std::chrono::year_month_day{next.year(), next.month(), std::chrono::day{15}};
    }

    bool operator==(const SalaryPeriod&) const = default;
};

// ============================================================================
// Enum <-> string
// ============================================================================

inline const char* file_type_to_string(FileType type) {
    switch (type) {
        case FileType::SIF:     return "sif";
        case FileType::NON_SIF: return "non_sif";
    }
    return "sif";
}

inline const char* batch_state_to_string(BatchState state) {
    switch (state) {
        case BatchState::DRAFT:     return "draft";
        case BatchState::GENERATED: return "generated";
        case BatchState::SUBMITTED: return "submitted";
        case BatchState::PROCESSED: return "processed";
        case BatchState::REJECTED:  return "rejected";
        case BatchState::CANCELLED: return "cancelled";
    }
    return "unknown";
}

inline const char* severity_to_string(Severity severity) {
    switch (severity) {
        case Severity::ERROR:   return "error";
        case Severity::WARNING: return "warning";
        case Severity::INFO:    return "info";
    }
    return "error";
}

inline const char* rule_type_to_string(RuleType type) {
    switch (type) {
        case RuleType::FORMAT:      return "format";
        case RuleType::RANGE:       return "range";
        case RuleType::REQUIRED:    return "required";
        case RuleType::UNIQUE:      return "unique";
        case RuleType::REFERENCE:   return "reference";
        case RuleType::CALCULATION: return "calculation";
        case RuleType::BUSINESS:    return "business";
        case RuleType::COMPLIANCE:  return "compliance";
    }
    return "unknown";
}

inline const char* rule_scope_to_string(RuleScope scope) {
    switch (scope) {
        case RuleScope::FILE:         return "file";
        case RuleScope::LINE:         return "line";
        case RuleScope::EMPLOYEE:     return "employee";
        case RuleScope::BANK_ACCOUNT: return "bank";
    }
    return "line";
}

inline const char* validation_status_to_string(ValidationStatus status) {
    switch (status) {
        case ValidationStatus::VALID:   return "valid";
        case ValidationStatus::INVALID: return "invalid";
        case ValidationStatus::WARNING: return "warning";
    }
    return "invalid";
}

inline const char* protocol_to_string(Protocol protocol) {
    switch (protocol) {
        case Protocol::REST:   return "rest";
        case Protocol::SOAP:   return "soap";
        case Protocol::SFTP:   return "sftp";
        case Protocol::MANUAL: return "manual";
    }
    return "manual";
}

inline const char* auth_method_to_string(AuthMethod method) {
    switch (method) {
        case AuthMethod::API_KEY:     return "api_key";
        case AuthMethod::OAUTH2:      return "oauth2";
        case AuthMethod::CERTIFICATE: return "certificate";
        case AuthMethod::BASIC:       return "basic";
    }
    return "api_key";
}

inline const char* connection_state_to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::DRAFT:     return "draft";
        case ConnectionState::TESTING:   return "testing";
        case ConnectionState::ACTIVE:    return "active";
        case ConnectionState::SUSPENDED: return "suspended";
    }
    return "draft";
}

inline const char* submission_type_to_string(SubmissionType type) {
    switch (type) {
        case SubmissionType::NEW:          return "new";
        case SubmissionType::CORRECTION:   return "correction";
        case SubmissionType::CANCELLATION: return "cancellation";
    }
    return "new";
}

inline const char* submission_state_to_string(SubmissionState state) {
    switch (state) {
        case SubmissionState::DRAFT:      return "draft";
        case SubmissionState::SUBMITTED:  return "submitted";
        case SubmissionState::PROCESSING: return "processing";
        case SubmissionState::SUCCESS:    return "success";
        case SubmissionState::FAILED:     return "failed";
        case SubmissionState::CANCELLED:  return "cancelled";
    }
    return "draft";
}

inline const char* compliance_status_to_string(ComplianceStatus status) {
    switch (status) {
        case ComplianceStatus::COMPLIANT:     return "compliant";
        case ComplianceStatus::PARTIAL:       return "partial";
        case ComplianceStatus::NON_COMPLIANT: return "non_compliant";
    }
    return "non_compliant";
}

// Parsers return nullopt on unknown input (case-sensitive, lower-case keys)
std::optional<Severity> parse_severity(std::string_view s);
std::optional<RuleType> parse_rule_type(std::string_view s);
std::optional<RuleScope> parse_rule_scope(std::string_view s);
std::optional<Protocol> parse_protocol(std::string_view s);
std::optional<AuthMethod> parse_auth_method(std::string_view s);
std::optional<ConnectionState> parse_connection_state(std::string_view s);
std::optional<SubmissionType> parse_submission_type(std::string_view s);
std::optional<FileType> parse_file_type(std::string_view s);
std::optional<BatchState> parse_batch_state(std::string_view s);

} // namespace wpsgate
