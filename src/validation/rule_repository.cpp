#include "validation/rule_repository.hpp"

#include <algorithm>

namespace wpsgate {

namespace {

bool scope_matches(const ValidationRule& rule, RuleScope scope) {
    // Employee and bank-account rules are per-line rules over line fields
    if (scope == RuleScope::LINE) return !rule.is_file_scoped();
    return rule.scope == scope;
}

} // anonymous namespace

InMemoryRuleRepository::InMemoryRuleRepository()
    : rules_(std::make_shared<const RuleSet>()) {}

InMemoryRuleRepository::InMemoryRuleRepository(std::vector<ValidationRule> rules)
    : rules_(sorted(std::move(rules))) {}

std::shared_ptr<const InMemoryRuleRepository::RuleSet> InMemoryRuleRepository::sorted(RuleSet rules) {
    std::stable_sort(rules.begin(), rules.end(), [](const auto& a, const auto& b) {
        if (a.sequence != b.sequence) return a.sequence < b.sequence;
        return a.code < b.code;
    });
    return std::make_shared<const RuleSet>(std::move(rules));
}

std::vector<ValidationRule> InMemoryRuleRepository::list_active_rules(RuleScope scope) const {
    const auto snapshot = rules_.load(std::memory_order_acquire);
    std::vector<ValidationRule> out;
    for (const auto& rule : *snapshot) {
        if (rule.active && scope_matches(rule, scope)) out.push_back(rule);
    }
    return out;
}

std::vector<ValidationRule> InMemoryRuleRepository::list_active_rules() const {
    const auto snapshot = rules_.load(std::memory_order_acquire);
    std::vector<ValidationRule> out;
    for (const auto& rule : *snapshot) {
        if (rule.active) out.push_back(rule);
    }
    return out;
}

void InMemoryRuleRepository::reload(std::vector<ValidationRule> rules) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    rules_.store(sorted(std::move(rules)), std::memory_order_release);
}

void InMemoryRuleRepository::upsert(ValidationRule rule) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto copy = *rules_.load(std::memory_order_acquire);
    const auto it = std::find_if(copy.begin(), copy.end(),
                                 [&](const auto& r) { return r.code == rule.code; });
    if (it != copy.end()) {
        *it = std::move(rule);
    } else {
        copy.push_back(std::move(rule));
    }
    rules_.store(sorted(std::move(copy)), std::memory_order_release);
}

bool InMemoryRuleRepository::set_active(const std::string& code, bool active) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto copy = *rules_.load(std::memory_order_acquire);
    const auto it = std::find_if(copy.begin(), copy.end(),
                                 [&](const auto& r) { return r.code == code; });
    if (it == copy.end()) return false;
    it->active = active;
    rules_.store(sorted(std::move(copy)), std::memory_order_release);
    return true;
}

std::vector<ValidationRule> InMemoryRuleRepository::all_rules() const {
    return *rules_.load(std::memory_order_acquire);
}

size_t InMemoryRuleRepository::rule_count() const {
    return rules_.load(std::memory_order_acquire)->size();
}

void InMemoryRuleRepository::record_statistics(const std::string& rule_code,
                                               uint64_t checks, uint64_t failures) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    auto& s = stats_[rule_code];
    ++s.runs;
    s.total_checks += checks;
    s.failed_checks += failures;
}

RuleStatistics InMemoryRuleRepository::statistics(const std::string& rule_code) const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    const auto it = stats_.find(rule_code);
    return it == stats_.end() ? RuleStatistics{} : it->second;
}

} // namespace wpsgate
