#include "validation/rule_evaluator.hpp"
#include "validation/field_access.hpp"

#include <algorithm>
#include <format>
#include <regex>

namespace wpsgate {

SiblingIndex::SiblingIndex(const std::vector<WpsLine>& lines,
                           const std::vector<std::string>& field_names) {
    for (const auto& field : field_names) {
        auto& counts = counts_[field];
        for (const auto& line : lines) {
            const auto value = fields::line_field(line, field);
            if (!value || fields::is_empty(*value)) continue;
            ++counts[fields::to_string(*value)];
        }
    }
}

size_t SiblingIndex::count(std::string_view field, const std::string& value) const {
    const auto it = counts_.find(std::string(field));
    if (it == counts_.end()) return 0;
    const auto vit = it->second.find(value);
    return vit == it->second.end() ? 0 : vit->second;
}

namespace {

// Checks shared by both scopes once the field value has been resolved
struct ValueChecks {
    const ValidationRule& rule;
    const ValidationContext& ctx;
    const FieldValue& value;
    bool line_scoped;

    CheckOutcome operator()(const RequiredCheck&) const {
        if (!fields::is_empty(value)) return CheckOutcome::ok();
        return CheckOutcome::fail(std::format("{} is empty", rule.field));
    }

    CheckOutcome operator()(const FormatCheck& check) const {
        if (fields::is_empty(value)) return CheckOutcome::ok();
        const auto text = fields::to_string(value);
        if (!check.allowed_values.empty() &&
            std::find(check.allowed_values.begin(), check.allowed_values.end(), text) ==
                check.allowed_values.end()) {
            return CheckOutcome::fail(std::format("'{}' is not an allowed value", text));
        }
        if (check.regex && !std::regex_match(text, *check.regex)) {
            return CheckOutcome::fail(std::format("'{}' does not match {}", text, check.pattern));
        }
        return CheckOutcome::ok();
    }

    CheckOutcome operator()(const RangeCheck& check) const {
        if (!fields::is_numeric(value)) {
            return CheckOutcome::fail(std::format("{} is not numeric", rule.field));
        }
        const double v = fields::as_number(value);
        if (v >= check.min && v <= check.max) return CheckOutcome::ok();
        return CheckOutcome::fail(std::format("{} outside [{}, {}]",
                                              fields::to_string(value), check.min, check.max));
    }

    CheckOutcome operator()(const UniqueCheck& check) const {
        if (fields::is_empty(value)) return CheckOutcome::ok();
        const auto text = fields::to_string(value);
        if (check.collection) {
            if (ctx.reference && ctx.reference->contains(*check.collection, text)) {
                return CheckOutcome::fail(std::format("'{}' already exists in {}", text, *check.collection));
            }
            return CheckOutcome::ok();
        }
        if (line_scoped && ctx.siblings && ctx.siblings->count(rule.field, text) > 1) {
            return CheckOutcome::fail(std::format("'{}' is shared by {} lines",
                                                  text, ctx.siblings->count(rule.field, text)));
        }
        return CheckOutcome::ok();
    }

    CheckOutcome operator()(const ReferenceCheck& check) const {
        if (fields::is_empty(value)) return CheckOutcome::ok();
        const auto text = fields::to_string(value);
        if (!ctx.reference || !ctx.reference->has_collection(check.collection)) {
            return CheckOutcome::fail(std::format("reference collection {} unavailable", check.collection));
        }
        if (ctx.reference->contains(check.collection, text)) return CheckOutcome::ok();
        return CheckOutcome::fail(std::format("'{}' not found in {}", text, check.collection));
    }

    CheckOutcome operator()(const DerivedCheck&) const {
        // Dispatched before field resolution
        return CheckOutcome::ok();
    }
};

} // anonymous namespace

RuleEvaluator::RuleEvaluator(std::shared_ptr<const DerivedCheckRegistry> checks)
    : checks_(std::move(checks)) {}

CheckOutcome RuleEvaluator::evaluate_line(const ValidationRule& rule,
                                          const WpsLine& line,
                                          const ValidationContext& ctx) const {
    if (const auto* derived = std::get_if<DerivedCheck>(&rule.check)) {
        const auto* fn = checks_ ? checks_->find_line_check(derived->name) : nullptr;
        if (!fn) return CheckOutcome::fail(std::format("unknown line check '{}'", derived->name));
        return (*fn)(line, ctx, derived->args);
    }

    const auto value = fields::line_field(line, rule.field);
    if (!value) return CheckOutcome::fail(std::format("unknown line field '{}'", rule.field));
    return std::visit(ValueChecks{rule, ctx, *value, true}, rule.check);
}

CheckOutcome RuleEvaluator::evaluate_file(const ValidationRule& rule,
                                          const WpsBatch& batch,
                                          const ValidationContext& ctx) const {
    if (const auto* derived = std::get_if<DerivedCheck>(&rule.check)) {
        const auto* fn = checks_ ? checks_->find_file_check(derived->name) : nullptr;
        if (!fn) return CheckOutcome::fail(std::format("unknown file check '{}'", derived->name));
        return (*fn)(batch, ctx, derived->args);
    }

    const auto value = fields::header_field(batch, rule.field);
    if (!value) return CheckOutcome::fail(std::format("unknown header field '{}'", rule.field));
    return std::visit(ValueChecks{rule, ctx, *value, false}, rule.check);
}

} // namespace wpsgate
