#pragma once

#include "config/config_types.hpp"
#include "validation/derived_checks.hpp"

#include <toml.hpp>

#include <optional>
#include <string>
#include <vector>

namespace wpsgate {

/**
 * @brief Loads wpsgate.toml
 *
 * Supports `include = "x.toml"` (or an array), deep-merged with the main
 * file winning, and ${ENV_VAR} expansion in every string value. Rules come
 * from inline [[rules]] and from [validation] rules_file; they are checked
 * against the derived-check registry.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        AppConfig config;

        static LoadResult ok(AppConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path,
                                                   const DerivedCheckRegistry& checks);

    /// rules_file is resolved against the current directory
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content,
                                                     const DerivedCheckRegistry& checks);

    /// All problems found, empty when valid
    [[nodiscard]] static std::vector<std::string> validate_config(const AppConfig& config);

private:
    static LoggingConfig extract_logging(const toml::table& root);
    static EmployerConfig extract_employer(const toml::table& root);
    static ValidationConfig extract_validation(const toml::table& root);
    static SubmissionConfig extract_submission(const toml::table& root);
    static AuditConfig extract_audit(const toml::table& root);
    static std::vector<BankInfo> extract_banks(const toml::table& root);
    static std::vector<BankConnection> extract_connections(const toml::table& root);
    static std::vector<ValidationRule> extract_rules(const toml::table& root,
                                                     const ValidationConfig& validation,
                                                     const std::string& base_dir,
                                                     const DerivedCheckRegistry& checks);

    static AppConfig extract_all_sections(const toml::table& root, const std::string& base_dir,
                                          const DerivedCheckRegistry& checks);
    static LoadResult validate_and_return(AppConfig config);
};

} // namespace wpsgate
