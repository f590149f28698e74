#include "core/types.hpp"
#include "core/utils.hpp"

#include <unordered_map>

namespace wpsgate {

namespace {

template<typename E>
std::optional<E> lookup(const std::unordered_map<std::string, E>& table, std::string_view s) {
    const auto it = table.find(utils::to_lower(std::string(s)));
    return (it != table.end()) ? std::make_optional(it->second) : std::nullopt;
}

} // anonymous namespace

std::optional<Severity> parse_severity(std::string_view s) {
    static const std::unordered_map<std::string, Severity> table = {
        {"error",   Severity::ERROR},
        {"warning", Severity::WARNING},
        {"info",    Severity::INFO},
    };
    return lookup(table, s);
}

std::optional<RuleType> parse_rule_type(std::string_view s) {
    static const std::unordered_map<std::string, RuleType> table = {
        {"format",      RuleType::FORMAT},
        {"range",       RuleType::RANGE},
        {"required",    RuleType::REQUIRED},
        {"unique",      RuleType::UNIQUE},
        {"reference",   RuleType::REFERENCE},
        {"calculation", RuleType::CALCULATION},
        {"business",    RuleType::BUSINESS},
        {"compliance",  RuleType::COMPLIANCE},
    };
    return lookup(table, s);
}

std::optional<RuleScope> parse_rule_scope(std::string_view s) {
    static const std::unordered_map<std::string, RuleScope> table = {
        {"file",         RuleScope::FILE},
        {"line",         RuleScope::LINE},
        {"employee",     RuleScope::EMPLOYEE},
        {"bank",         RuleScope::BANK_ACCOUNT},
        {"bank_account", RuleScope::BANK_ACCOUNT},
    };
    return lookup(table, s);
}

std::optional<Protocol> parse_protocol(std::string_view s) {
    static const std::unordered_map<std::string, Protocol> table = {
        {"rest",   Protocol::REST},
        {"soap",   Protocol::SOAP},
        {"sftp",   Protocol::SFTP},
        {"manual", Protocol::MANUAL},
        {"direct", Protocol::MANUAL},
    };
    return lookup(table, s);
}

std::optional<AuthMethod> parse_auth_method(std::string_view s) {
    static const std::unordered_map<std::string, AuthMethod> table = {
        {"api_key",     AuthMethod::API_KEY},
        {"oauth2",      AuthMethod::OAUTH2},
        {"certificate", AuthMethod::CERTIFICATE},
        {"basic",       AuthMethod::BASIC},
    };
    return lookup(table, s);
}

std::optional<ConnectionState> parse_connection_state(std::string_view s) {
    static const std::unordered_map<std::string, ConnectionState> table = {
        {"draft",     ConnectionState::DRAFT},
        {"testing",   ConnectionState::TESTING},
        {"active",    ConnectionState::ACTIVE},
        {"suspended", ConnectionState::SUSPENDED},
    };
    return lookup(table, s);
}

std::optional<SubmissionType> parse_submission_type(std::string_view s) {
    static const std::unordered_map<std::string, SubmissionType> table = {
        {"new",          SubmissionType::NEW},
        {"correction",   SubmissionType::CORRECTION},
        {"cancellation", SubmissionType::CANCELLATION},
    };
    return lookup(table, s);
}

std::optional<FileType> parse_file_type(std::string_view s) {
    static const std::unordered_map<std::string, FileType> table = {
        {"sif",     FileType::SIF},
        {"non_sif", FileType::NON_SIF},
    };
    return lookup(table, s);
}

std::optional<BatchState> parse_batch_state(std::string_view s) {
    static const std::unordered_map<std::string, BatchState> table = {
        {"draft",     BatchState::DRAFT},
        {"generated", BatchState::GENERATED},
        {"submitted", BatchState::SUBMITTED},
        {"processed", BatchState::PROCESSED},
        {"rejected",  BatchState::REJECTED},
        {"cancelled", BatchState::CANCELLED},
    };
    return lookup(table, s);
}

} // namespace wpsgate
