#pragma once

#include "validation/derived_checks.hpp"
#include "validation/reference_data.hpp"
#include "validation/rule_evaluator.hpp"
#include "validation/rule_repository.hpp"
#include "validation/validation_types.hpp"

#include <memory>
#include <vector>

namespace wpsgate {

struct ValidationEngineConfig {
    bool parallel = true;
    size_t max_threads = 4;
    size_t parallel_threshold = 256;    // lines; below this, evaluate inline
};

/**
 * @brief Validation Engine - admissibility gate before encoding
 *
 * 1. File-scoped rules run once, sequentially, against the header and
 *    record both passes and failures.
 * 2. Line-scoped rules (line / employee / bank-account) run once per line
 *    and record failures only. Lines are independent, so large batches are
 *    partitioned across workers; results are merged by line index.
 * 3. Status: INVALID if any error-severity rule failed, else WARNING if any
 *    warning-severity rule failed, else VALID. can_submit iff no
 *    error-severity failure.
 *
 * Deterministic: the same batch and rule set yield an identical result.
 */
class ValidationEngine {
public:
    ValidationEngine(std::shared_ptr<IRuleRepository> rules,
                     std::shared_ptr<const DerivedCheckRegistry> checks,
                     std::shared_ptr<const IReferenceData> reference,
                     ValidationEngineConfig config = {});

    /// Evaluate against the repository's active rules (one snapshot)
    [[nodiscard]] ValidationResult evaluate(const WpsBatch& batch) const;

    /// Evaluate against an explicit rule set (inactive rules are skipped)
    [[nodiscard]] ValidationResult evaluate(const WpsBatch& batch,
                                            const std::vector<ValidationRule>& rules) const;

    [[nodiscard]] const ValidationEngineConfig& config() const { return config_; }

private:
    ValidationResultLine make_line(const ValidationRule& rule, const CheckOutcome& outcome) const;

    std::shared_ptr<IRuleRepository> rules_;
    std::shared_ptr<const IReferenceData> reference_;
    RuleEvaluator evaluator_;
    ValidationEngineConfig config_;
};

} // namespace wpsgate
