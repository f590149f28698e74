#pragma once

#include "audit/audit_trail.hpp"
#include "model/bank_registry.hpp"
#include "submission/bank_connection.hpp"
#include "submission/submission_orchestrator.hpp"
#include "validation/validation_engine.hpp"
#include "validation/validation_types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace wpsgate {

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
    std::string file;
};

// ============================================================================
// Employer Config (SIF header defaults)
// ============================================================================

struct EmployerConfig {
    std::string employer_id;
    std::string name;
    std::string company_id;
    std::string bank_routing_code;
    std::string account;
};

// ============================================================================
// Validation Config
// ============================================================================

struct ValidationConfig {
    ValidationEngineConfig engine;
    std::string rules_file;                 // resolved against the config file's directory
    std::optional<double> minimum_wage;     // adds a MINIMUM_WAGE warning rule
};

// ============================================================================
// Top-level
// ============================================================================

struct AppConfig {
    LoggingConfig logging;
    EmployerConfig employer;
    ValidationConfig validation;
    SubmissionConfig submission;
    AuditConfig audit;

    std::vector<BankInfo> banks;
    std::vector<BankConnection> connections;
    std::vector<ValidationRule> rules;      // inline [[rules]] + rules_file, in load order
};

} // namespace wpsgate
