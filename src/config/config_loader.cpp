#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "validation/rule_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <algorithm>
#include <unordered_set>

namespace wpsgate {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 * Unset variables expand to the empty string.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw ConfigError(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

/**
 * @brief Deep-merge two tables. Overlay wins for scalars, arrays concatenate.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else if (val.is_array() && base.contains(key) && base[key].is_array()) {
            auto& base_arr = *base[key].as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > 10) {
        throw ConfigError("Config include depth exceeds 10, possible circular include");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw ConfigError(std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Included file is the base, the including file overlays it
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::string toml_string(const toml::table& tbl, std::string_view key, std::string fallback = {}) {
    if (const auto* v = tbl[key].as_string()) {
        return std::string(v->get());
    }
    return fallback;
}

std::optional<std::chrono::milliseconds> toml_optional_ms(const toml::table& tbl, std::string_view key) {
    if (const auto* v = tbl[key].as_integer()) {
        return std::chrono::milliseconds(v->get());
    }
    return std::nullopt;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* log = root["logging"].as_table();
    if (!log) return cfg;

    cfg.level = toml_string(*log, "level", cfg.level);
    cfg.file = toml_string(*log, "file");
    return cfg;
}

EmployerConfig ConfigLoader::extract_employer(const toml::table& root) {
    EmployerConfig cfg;
    const auto* emp = root["employer"].as_table();
    if (!emp) return cfg;

    cfg.employer_id = toml_string(*emp, "id");
    cfg.name = toml_string(*emp, "name");
    cfg.company_id = toml_string(*emp, "company_id");
    cfg.bank_routing_code = toml_string(*emp, "bank_routing_code");
    cfg.account = toml_string(*emp, "account");
    return cfg;
}

ValidationConfig ConfigLoader::extract_validation(const toml::table& root) {
    ValidationConfig cfg;
    const auto* val = root["validation"].as_table();
    if (!val) return cfg;

    cfg.engine.parallel = (*val)["parallel"].value_or(cfg.engine.parallel);
    cfg.engine.max_threads = static_cast<size_t>(
        (*val)["max_threads"].value_or(static_cast<int64_t>(cfg.engine.max_threads)));
    cfg.engine.parallel_threshold = static_cast<size_t>(
        (*val)["parallel_threshold"].value_or(static_cast<int64_t>(cfg.engine.parallel_threshold)));
    cfg.rules_file = toml_string(*val, "rules_file");
    if (const auto wage = (*val)["minimum_wage"].value<double>()) {
        cfg.minimum_wage = *wage;
    }
    return cfg;
}

SubmissionConfig ConfigLoader::extract_submission(const toml::table& root) {
    SubmissionConfig cfg;
    const auto* sub = root["submission"].as_table();
    if (!sub) return cfg;

    cfg.max_retries = static_cast<int>((*sub)["max_retries"].value_or(int64_t{cfg.max_retries}));
    cfg.attempt_timeout = toml_optional_ms(*sub, "attempt_timeout_ms").value_or(cfg.attempt_timeout);
    cfg.auto_retry = (*sub)["auto_retry"].value_or(cfg.auto_retry);
    cfg.retry_backoff = toml_optional_ms(*sub, "retry_backoff_ms").value_or(cfg.retry_backoff);
    cfg.spool_dir = toml_string(*sub, "spool_dir");
    cfg.drain_timeout = toml_optional_ms(*sub, "drain_timeout_ms").value_or(cfg.drain_timeout);
    return cfg;
}

AuditConfig ConfigLoader::extract_audit(const toml::table& root) {
    AuditConfig cfg;
    const auto* audit = root["audit"].as_table();
    if (!audit) return cfg;

    cfg.enabled = (*audit)["enabled"].value_or(cfg.enabled);
    cfg.output_file = toml_string(*audit, "output_file");
    cfg.integrity_enabled = (*audit)["integrity"].value_or(cfg.integrity_enabled);

    if (const auto* rotation = (*audit)["rotation"].as_table()) {
        cfg.max_file_size_mb = static_cast<size_t>(
            (*rotation)["max_file_size_mb"].value_or(static_cast<int64_t>(cfg.max_file_size_mb)));
        cfg.max_files = static_cast<int>((*rotation)["max_files"].value_or(int64_t{cfg.max_files}));
    }
    return cfg;
}

std::vector<BankInfo> ConfigLoader::extract_banks(const toml::table& root) {
    std::vector<BankInfo> banks;
    const auto* arr = root["banks"].as_array();
    if (!arr) return banks;

    size_t index = 0;
    for (const auto& elem : *arr) {
        const auto* tbl = elem.as_table();
        if (!tbl) throw ConfigError(std::format("banks[{}] is not a table", index));

        BankInfo bank;
        bank.name = toml_string(*tbl, "name");
        bank.code = toml_string(*tbl, "code");
        bank.routing_code = toml_string(*tbl, "routing_code");
        bank.swift_code = toml_string(*tbl, "swift_code");
        bank.wps_enabled = (*tbl)["wps_enabled"].value_or(true);

        const auto type_name = toml_string(*tbl, "type", "local");
        const auto type = parse_bank_type(type_name);
        if (!type) {
            throw ConfigError(std::format("banks[{}] '{}': unknown type '{}'", index, bank.code, type_name));
        }
        bank.type = *type;

        banks.push_back(std::move(bank));
        ++index;
    }
    return banks;
}

std::vector<BankConnection> ConfigLoader::extract_connections(const toml::table& root) {
    std::vector<BankConnection> connections;
    const auto* arr = root["connections"].as_array();
    if (!arr) return connections;

    size_t index = 0;
    for (const auto& elem : *arr) {
        const auto* tbl = elem.as_table();
        if (!tbl) throw ConfigError(std::format("connections[{}] is not a table", index));

        BankConnection conn;
        conn.name = toml_string(*tbl, "name");
        conn.bank_code = toml_string(*tbl, "bank_code");

        const auto protocol_name = toml_string(*tbl, "protocol", "rest");
        const auto protocol = parse_protocol(protocol_name);
        if (!protocol) {
            throw ConfigError(std::format("connections[{}] '{}': unknown protocol '{}'",
                                          index, conn.name, protocol_name));
        }
        conn.protocol = *protocol;

        const auto auth_name = toml_string(*tbl, "auth_method", "api_key");
        const auto auth = parse_auth_method(auth_name);
        if (!auth) {
            throw ConfigError(std::format("connections[{}] '{}': unknown auth_method '{}'",
                                          index, conn.name, auth_name));
        }
        conn.auth_method = *auth;

        conn.api_url = toml_string(*tbl, "api_url");
        conn.api_version = toml_string(*tbl, "api_version", conn.api_version);
        conn.api_key = toml_string(*tbl, "api_key");
        conn.api_secret = toml_string(*tbl, "api_secret");
        conn.client_id = toml_string(*tbl, "client_id");
        conn.client_secret = toml_string(*tbl, "client_secret");
        conn.token_path = toml_string(*tbl, "token_path", conn.token_path);
        conn.username = toml_string(*tbl, "username");
        conn.password = toml_string(*tbl, "password");
        conn.certificate_file = toml_string(*tbl, "certificate_file");
        conn.certificate_key_file = toml_string(*tbl, "certificate_key_file");

        conn.sftp_host = toml_string(*tbl, "sftp_host");
        conn.sftp_port = static_cast<int>((*tbl)["sftp_port"].value_or(int64_t{conn.sftp_port}));
        conn.sftp_username = toml_string(*tbl, "sftp_username");
        conn.sftp_key_file = toml_string(*tbl, "sftp_key_file");
        conn.sftp_upload_path = toml_string(*tbl, "sftp_upload_path", conn.sftp_upload_path);
        conn.sftp_download_path = toml_string(*tbl, "sftp_download_path", conn.sftp_download_path);

        conn.portal_url = toml_string(*tbl, "portal_url");
        conn.employer_id = toml_string(*tbl, "employer_id");
        conn.routing_code = toml_string(*tbl, "routing_code");
        conn.attempt_timeout = toml_optional_ms(*tbl, "attempt_timeout_ms");

        const auto state_name = toml_string(*tbl, "state", "draft");
        const auto state = parse_connection_state(state_name);
        if (!state) {
            throw ConfigError(std::format("connections[{}] '{}': unknown state '{}'",
                                          index, conn.name, state_name));
        }
        try {
            conn.restore_state(*state);
        } catch (const StateError& e) {
            throw ConfigError(std::format("connections[{}] '{}': {}", index, conn.name, e.what()));
        }

        connections.push_back(std::move(conn));
        ++index;
    }
    return connections;
}

std::vector<ValidationRule> ConfigLoader::extract_rules(const toml::table& root,
                                                        const ValidationConfig& validation,
                                                        const std::string& base_dir,
                                                        const DerivedCheckRegistry& checks) {
    auto inline_rules = RuleLoader::load_from_table(root, checks);
    if (!inline_rules.success) {
        throw ConfigError(inline_rules.error_message);
    }
    auto rules = std::move(inline_rules.rules);

    if (!validation.rules_file.empty()) {
        namespace fs = std::filesystem;
        fs::path path(validation.rules_file);
        if (path.is_relative() && !base_dir.empty()) path = fs::path(base_dir) / path;

        auto file_rules = RuleLoader::load_from_file(path.string(), checks);
        if (!file_rules.success) {
            throw ConfigError(std::format("{}: {}", path.string(), file_rules.error_message));
        }
        for (auto& rule : file_rules.rules) {
            rules.push_back(std::move(rule));
        }
    }

    if (validation.minimum_wage) {
        const bool defined = std::any_of(rules.begin(), rules.end(),
            [](const ValidationRule& r) { return r.code == "MINIMUM_WAGE"; });
        if (!defined) {
            ValidationRule rule;
            rule.code = "MINIMUM_WAGE";
            rule.name = "Basic salary at or above the configured minimum";
            rule.type = RuleType::COMPLIANCE;
            rule.scope = RuleScope::LINE;
            rule.check = DerivedCheck{"minimum_wage",
                                      {{"amount", std::format("{:.2f}", *validation.minimum_wage)}}};
            rule.severity = Severity::WARNING;
            rule.message = "Basic salary is below the minimum wage";
            rule.sequence = 90;
            rules.push_back(std::move(rule));
        }
    }
    return rules;
}

// ---- Shared extraction + validation ----------------------------------------

AppConfig ConfigLoader::extract_all_sections(const toml::table& root, const std::string& base_dir,
                                             const DerivedCheckRegistry& checks) {
    AppConfig config;
    config.logging = extract_logging(root);
    config.employer = extract_employer(root);
    config.validation = extract_validation(root);
    config.submission = extract_submission(root);
    config.audit = extract_audit(root);
    config.banks = extract_banks(root);
    config.connections = extract_connections(root);
    config.rules = extract_rules(root, config.validation, base_dir, checks);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(AppConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path,
                                                      const DerivedCheckRegistry& checks) {
    try {
        const auto tbl = parse_toml_file(config_path);
        const auto base_dir = std::filesystem::path(config_path).parent_path().string();
        return validate_and_return(extract_all_sections(tbl, base_dir, checks));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content,
                                                        const DerivedCheckRegistry& checks) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl, "", checks));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const AppConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be debug, info, warn or error, got '{}'",
                                     config.logging.level));
    }

    // SIF header widths
    if (config.employer.employer_id.size() > 15) {
        errors.push_back(std::format("employer.id exceeds 15 characters: '{}'",
                                     config.employer.employer_id));
    }
    if (config.employer.bank_routing_code.size() > 9) {
        errors.push_back(std::format("employer.bank_routing_code exceeds 9 characters: '{}'",
                                     config.employer.bank_routing_code));
    }
    if (config.employer.account.size() > 34) {
        errors.push_back("employer.account exceeds 34 characters");
    }

    if (config.validation.engine.max_threads == 0) {
        errors.push_back("validation.max_threads must be > 0");
    }
    if (config.validation.minimum_wage && *config.validation.minimum_wage < 0.0) {
        errors.push_back("validation.minimum_wage must not be negative");
    }

    if (config.submission.max_retries < 1) {
        errors.push_back(std::format("submission.max_retries must be >= 1, got {}",
                                     config.submission.max_retries));
    }
    if (config.submission.attempt_timeout.count() <= 0) {
        errors.push_back("submission.attempt_timeout_ms must be > 0");
    }
    if (config.submission.retry_backoff.count() < 0) {
        errors.push_back("submission.retry_backoff_ms must not be negative");
    }
    if (config.submission.drain_timeout.count() < 0) {
        errors.push_back("submission.drain_timeout_ms must not be negative");
    }

    if (config.audit.max_files < 1) {
        errors.push_back("audit.rotation.max_files must be >= 1");
    }

    BankRegistry registry;
    for (size_t i = 0; i < config.banks.size(); ++i) {
        const auto& bank = config.banks[i];
        if (bank.code.empty() || bank.routing_code.empty()) {
            errors.push_back(std::format("banks[{}] requires code and routing_code", i));
        } else if (!registry.add(bank)) {
            errors.push_back(std::format("banks[{}] '{}': duplicate code or routing code", i, bank.code));
        }
    }

    std::unordered_set<std::string> names;
    for (size_t i = 0; i < config.connections.size(); ++i) {
        const auto& conn = config.connections[i];
        if (conn.name.empty()) {
            errors.push_back(std::format("connections[{}].name must not be empty", i));
        } else if (!names.insert(conn.name).second) {
            errors.push_back(std::format("connections[{}]: duplicate name '{}'", i, conn.name));
        }
        if (conn.sftp_port < 1 || conn.sftp_port > 65535) {
            errors.push_back(std::format("connections[{}].sftp_port must be 1-65535, got {}",
                                         i, conn.sftp_port));
        }
        if (conn.attempt_timeout && conn.attempt_timeout->count() <= 0) {
            errors.push_back(std::format("connections[{}].attempt_timeout_ms must be > 0", i));
        }
    }

    std::unordered_set<std::string> codes;
    for (const auto& rule : config.rules) {
        if (!codes.insert(rule.code).second) {
            errors.push_back(std::format("rule '{}' is defined more than once", rule.code));
        }
    }

    return errors;
}

} // namespace wpsgate
