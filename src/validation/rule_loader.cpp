#include "validation/rule_loader.hpp"
#include "validation/field_access.hpp"
#include "core/utils.hpp"

#include <format>
#include <fstream>
#include <regex>
#include <unordered_set>

using namespace std::string_literals;

namespace wpsgate {

static constexpr std::string_view kRules   = "rules";
static constexpr std::string_view kArgs    = "args";
static constexpr std::string_view kMin     = "min";
static constexpr std::string_view kMax     = "max";

namespace {

std::optional<double> toml_number(const toml::table& tbl, std::string_view key) {
    if (const auto v = tbl[key].value<double>()) return *v;
    if (const auto v = tbl[key].value<int64_t>()) return static_cast<double>(*v);
    return std::nullopt;
}

// Scalar args are kept as text; derived checks parse what they need
std::optional<std::string> toml_scalar_text(const toml::node& node) {
    if (const auto* s = node.as_string()) return std::string(s->get());
    if (const auto* i = node.as_integer()) return std::format("{}", i->get());
    if (const auto* f = node.as_floating_point()) return std::format("{}", f->get());
    if (const auto* b = node.as_boolean()) return std::string(utils::booltostr(b->get()));
    if (const auto* d = node.as_date()) {
        const auto& date = d->get();
        return std::format("{:04d}-{:02d}-{:02d}", date.year, date.month, date.day);
    }
    return std::nullopt;
}

} // anonymous namespace

RuleLoader::LoadResult RuleLoader::load_from_file(const std::string& path,
                                                  const DerivedCheckRegistry& checks) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return LoadResult::error(std::format("Cannot open rules file: {}", path));
    }
    std::string buffer((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
    return load_from_string(buffer, checks);
}

RuleLoader::LoadResult RuleLoader::load_from_string(const std::string& toml_content,
                                                    const DerivedCheckRegistry& checks) {
    try {
        const auto root = toml::parse(toml_content);
        return load_from_table(root, checks);
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("TOML parse error: {}", e.what()));
    }
}

RuleLoader::LoadResult RuleLoader::load_from_table(const toml::table& root,
                                                   const DerivedCheckRegistry& checks) {
    std::vector<ValidationRule> rules;
    const auto* rules_array = root[kRules].as_array();
    if (!rules_array) return LoadResult::ok(std::move(rules));

    std::unordered_set<std::string> codes;
    size_t index = 0;
    for (const auto& elem : *rules_array) {
        const auto* tbl = elem.as_table();
        if (!tbl) {
            return LoadResult::error(std::format("rules[{}] is not a table", index));
        }

        ValidationRule rule;
        std::string error_msg;
        if (!parse_rule(*tbl, checks, rule, error_msg)) {
            const auto label = rule.code.empty() ? std::format("rules[{}]", index)
                                                 : std::format("Rule '{}'", rule.code);
            return LoadResult::error(std::format("{}: {}", label, error_msg));
        }
        if (!codes.insert(rule.code).second) {
            return LoadResult::error(std::format("Rule '{}': duplicate rule code", rule.code));
        }
        rules.emplace_back(std::move(rule));
        ++index;
    }

    utils::log::debug(std::format("Loaded {} validation rules", rules.size()));
    return LoadResult::ok(std::move(rules));
}

bool RuleLoader::parse_rule(const toml::table& tbl, const DerivedCheckRegistry& checks,
                            ValidationRule& rule, std::string& error_msg) {
    rule.code = tbl["code"].value_or(""s);
    if (rule.code.empty()) {
        error_msg = "rule must have a code";
        return false;
    }
    rule.name = tbl["name"].value_or(rule.code);
    rule.field = tbl["field"].value_or(""s);
    rule.message = tbl["message"].value_or(""s);
    rule.help_text = tbl["help"].value_or(""s);
    rule.sequence = tbl["sequence"].value_or(10);
    rule.active = tbl["active"].value_or(true);

    const std::string type_str = tbl["type"].value_or(""s);
    const auto type = parse_rule_type(type_str);
    if (!type) {
        error_msg = std::format("invalid rule type '{}'", type_str);
        return false;
    }
    rule.type = *type;

    const std::string scope_str = tbl["scope"].value_or("line"s);
    const auto scope = parse_rule_scope(scope_str);
    if (!scope) {
        error_msg = std::format("invalid scope '{}'", scope_str);
        return false;
    }
    rule.scope = *scope;

    const std::string severity_str = tbl["severity"].value_or("error"s);
    const auto severity = parse_severity(severity_str);
    if (!severity) {
        error_msg = std::format("invalid severity '{}'", severity_str);
        return false;
    }
    rule.severity = *severity;

    const bool derived = rule.type == RuleType::CALCULATION ||
                         rule.type == RuleType::BUSINESS ||
                         rule.type == RuleType::COMPLIANCE;

    if (!derived || !rule.field.empty()) {
        const bool known = rule.is_file_scoped() ? fields::is_header_field(rule.field)
                                                 : fields::is_line_field(rule.field);
        if (!known) {
            error_msg = std::format("unknown {} field '{}'",
                                    rule.is_file_scoped() ? "header" : "line", rule.field);
            return false;
        }
    }

    switch (rule.type) {
        case RuleType::REQUIRED:
            rule.check = RequiredCheck{};
            break;

        case RuleType::FORMAT: {
            FormatCheck check;
            check.pattern = tbl["pattern"].value_or(""s);
            if (const auto* arr = tbl["allowed_values"].as_array()) {
                for (const auto& v : *arr) {
                    if (auto text = toml_scalar_text(v)) check.allowed_values.push_back(std::move(*text));
                }
            }
            if (check.pattern.empty() && check.allowed_values.empty()) {
                error_msg = "format rule needs a pattern or allowed_values";
                return false;
            }
            if (!check.pattern.empty()) {
                try {
                    check.regex = std::make_shared<const std::regex>(check.pattern);
                } catch (const std::regex_error& e) {
                    error_msg = std::format("invalid pattern '{}': {}", check.pattern, e.what());
                    return false;
                }
            }
            rule.check = std::move(check);
            break;
        }

        case RuleType::RANGE: {
            const auto min = toml_number(tbl, kMin);
            const auto max = toml_number(tbl, kMax);
            if (!min || !max) {
                error_msg = "range rule needs both min and max";
                return false;
            }
            if (*min > *max) {
                error_msg = std::format("min {} exceeds max {}", *min, *max);
                return false;
            }
            rule.check = RangeCheck{*min, *max};
            break;
        }

        case RuleType::UNIQUE: {
            UniqueCheck check;
            if (auto c = tbl["collection"].value<std::string>()) check.collection = *c;
            if (rule.is_file_scoped() && !check.collection) {
                error_msg = "file-scoped unique rule needs a collection";
                return false;
            }
            rule.check = std::move(check);
            break;
        }

        case RuleType::REFERENCE: {
            const std::string collection = tbl["collection"].value_or(""s);
            if (collection.empty()) {
                error_msg = "reference rule needs a collection";
                return false;
            }
            rule.check = ReferenceCheck{collection};
            break;
        }

        case RuleType::CALCULATION:
        case RuleType::BUSINESS:
        case RuleType::COMPLIANCE: {
            DerivedCheck check;
            check.name = tbl["check"].value_or(""s);
            if (check.name.empty()) {
                error_msg = std::format("{} rule needs a check name", rule_type_to_string(rule.type));
                return false;
            }
            const bool registered = rule.is_file_scoped() ? checks.find_file_check(check.name) != nullptr
                                                          : checks.find_line_check(check.name) != nullptr;
            if (!registered) {
                error_msg = std::format("unknown {} check '{}'",
                                        rule.is_file_scoped() ? "file" : "line", check.name);
                return false;
            }
            if (const auto* args = tbl[kArgs].as_table()) {
                for (const auto& [key, val] : *args) {
                    const auto text = toml_scalar_text(val);
                    if (!text) {
                        error_msg = std::format("argument '{}' must be a scalar", key.str());
                        return false;
                    }
                    check.args.emplace(std::string(key.str()), *text);
                }
            }
            if (auto err = checks.validate_args(check.name, check.args)) {
                error_msg = std::format("check '{}': {}", check.name, *err);
                return false;
            }
            rule.check = std::move(check);
            break;
        }
    }
    return true;
}

} // namespace wpsgate
