#include "validation/validation_types.hpp"

#include <format>

namespace wpsgate {

void ValidationResult::finalize() {
    size_t failures = 0;
    failed = warnings = infos = 0;
    for (const auto& line : lines) {
        if (line.passed) continue;
        ++failures;
        switch (line.severity) {
            case Severity::ERROR:   ++failed; break;
            case Severity::WARNING: ++warnings; break;
            case Severity::INFO:    ++infos; break;
        }
    }
    passed = total_checks >= failures ? total_checks - failures : 0;

    if (failed > 0) {
        status = ValidationStatus::INVALID;
    } else if (warnings > 0) {
        status = ValidationStatus::WARNING;
    } else {
        status = ValidationStatus::VALID;
    }
    can_submit = failed == 0;
}

std::vector<const ValidationResultLine*> ValidationResult::failures() const {
    std::vector<const ValidationResultLine*> out;
    for (const auto& line : lines) {
        if (!line.passed) out.push_back(&line);
    }
    return out;
}

ValidationBlocked::ValidationBlocked(ValidationResult result)
    : WpsError(ErrorCategory::VALIDATION_BLOCKED,
               std::format("batch {} has {} error-severity validation failure(s)",
                           result.batch_reference, result.failed)),
      result_(std::move(result)) {}

} // namespace wpsgate
