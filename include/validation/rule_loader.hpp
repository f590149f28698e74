#pragma once

#include "validation/derived_checks.hpp"
#include "validation/validation_types.hpp"

#include <toml.hpp>

#include <string>
#include <vector>

namespace wpsgate {

/**
 * @brief Validation rule loader from TOML
 *
 * Reads [[rules]] entries. Validates:
 * - code present and unique
 * - known type, scope and severity
 * - field known for the rule's scope (required for non-derived rules)
 * - format: pattern compiles and/or allowed_values given
 * - range: min and max given, min <= max
 * - reference: collection given
 * - calculation/business/compliance: registered check of matching scope
 *   with valid args
 *
 * The whole set is rejected on the first invalid rule.
 */
class RuleLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        std::vector<ValidationRule> rules;

        static LoadResult ok(std::vector<ValidationRule> rules_vec) {
            LoadResult result;
            result.success = true;
            result.rules = std::move(rules_vec);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    [[nodiscard]] static LoadResult load_from_file(const std::string& path,
                                                   const DerivedCheckRegistry& checks);

    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content,
                                                     const DerivedCheckRegistry& checks);

    /// Parse [[rules]] from an already-parsed document (absent array = no rules)
    [[nodiscard]] static LoadResult load_from_table(const toml::table& root,
                                                    const DerivedCheckRegistry& checks);

private:
    static bool parse_rule(const toml::table& tbl, const DerivedCheckRegistry& checks,
                           ValidationRule& rule, std::string& error_msg);
};

} // namespace wpsgate
