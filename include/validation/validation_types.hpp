#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <variant>
#include <vector>

namespace wpsgate {

// ============================================================================
// Rule parameters - one alternative per rule family
// ============================================================================

/// Field must be non-empty (text) or non-zero (numeric)
struct RequiredCheck {};

/// Field, stringified, must match a pattern and/or belong to an allowed set
struct FormatCheck {
    std::string pattern;
    std::shared_ptr<const std::regex> regex;    // compiled once at load time
    std::vector<std::string> allowed_values;
};

/// Numeric field must lie within [min, max]
struct RangeCheck {
    double min = 0.0;
    double max = 0.0;
};

/// No other record in the collection may share the value. Without a named
/// collection the collection is the batch's own lines.
struct UniqueCheck {
    std::optional<std::string> collection;
};

/// Value must resolve in a named reference collection
struct ReferenceCheck {
    std::string collection;
};

/// Calculation / business / compliance extension point
struct DerivedCheck {
    std::string name;
    std::map<std::string, std::string> args;
};

using RuleCheck = std::variant<RequiredCheck, FormatCheck, RangeCheck,
                               UniqueCheck, ReferenceCheck, DerivedCheck>;

/**
 * @brief Declarative validation rule
 *
 * Evaluation is a pure function of (record, context). Severity belongs to
 * the rule's configuration, never to the failure.
 */
struct ValidationRule {
    std::string code;
    std::string name;
    RuleType type = RuleType::REQUIRED;
    RuleScope scope = RuleScope::LINE;
    std::string field;
    RuleCheck check;
    Severity severity = Severity::ERROR;
    std::string message;
    std::string help_text;
    int sequence = 10;
    bool active = true;

    [[nodiscard]] bool is_file_scoped() const { return scope == RuleScope::FILE; }
};

// ============================================================================
// Results
// ============================================================================

struct ValidationResultLine {
    std::string rule_code;
    std::string rule_name;
    RuleType rule_type = RuleType::REQUIRED;
    std::string field;
    bool passed = true;
    Severity severity = Severity::ERROR;
    std::string message;
    std::string help_text;
    std::string detail;                 // observed value / derived-check explanation

    // Record reference: nullopt for file-scoped rules
    std::optional<size_t> line_index;
    std::string record_name;

    bool operator==(const ValidationResultLine&) const = default;
};

/**
 * @brief Outcome of evaluating the active rule set against one batch
 *
 * File-scoped rules record both passes and failures; line-scoped rules
 * record failures only. Counts cover every rule evaluation.
 */
struct ValidationResult {
    std::string batch_reference;
    std::vector<ValidationResultLine> lines;

    size_t total_checks = 0;
    size_t passed = 0;
    size_t failed = 0;      // error-severity failures
    size_t warnings = 0;    // warning-severity failures
    size_t infos = 0;       // info-severity failures

    ValidationStatus status = ValidationStatus::VALID;
    bool can_submit = true;

    /// Recompute counts, status and admissibility from lines + total_checks
    void finalize();

    [[nodiscard]] std::vector<const ValidationResultLine*> failures() const;

    bool operator==(const ValidationResult&) const = default;
};

/// Batch has error-severity rule failures; refused before encoding
class ValidationBlocked : public WpsError {
public:
    explicit ValidationBlocked(ValidationResult result);

    [[nodiscard]] const ValidationResult& result() const { return result_; }

private:
    ValidationResult result_;
};

/// One validation run retained for audit; stamps live outside the result
struct ValidationRun {
    ValidationResult result;
    std::string actor;
    std::chrono::system_clock::time_point validated_at;
};

} // namespace wpsgate
