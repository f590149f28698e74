#pragma once

#include "validation/derived_checks.hpp"
#include "validation/validation_types.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace wpsgate {

/**
 * @brief Per-field value counts over a batch's lines
 *
 * Built once per run before line rules execute so that unique rules can be
 * evaluated per line (and in parallel) without rescanning siblings.
 */
class SiblingIndex {
public:
    SiblingIndex(const std::vector<WpsLine>& lines, const std::vector<std::string>& field_names);

    /// Number of lines whose field stringifies to value
    [[nodiscard]] size_t count(std::string_view field, const std::string& value) const;

private:
    std::unordered_map<std::string, std::unordered_map<std::string, size_t>> counts_;
};

/**
 * @brief Interprets one ValidationRule against one record
 *
 * Dispatches on the rule's check alternative. Pure: no clock, no mutation,
 * no severity decisions.
 */
class RuleEvaluator {
public:
    explicit RuleEvaluator(std::shared_ptr<const DerivedCheckRegistry> checks);

    [[nodiscard]] CheckOutcome evaluate_line(const ValidationRule& rule,
                                             const WpsLine& line,
                                             const ValidationContext& ctx) const;

    [[nodiscard]] CheckOutcome evaluate_file(const ValidationRule& rule,
                                             const WpsBatch& batch,
                                             const ValidationContext& ctx) const;

private:
    std::shared_ptr<const DerivedCheckRegistry> checks_;
};

} // namespace wpsgate
