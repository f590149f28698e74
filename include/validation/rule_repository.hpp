#pragma once

#include "validation/validation_types.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace wpsgate {

struct RuleStatistics {
    uint64_t runs = 0;
    uint64_t total_checks = 0;
    uint64_t failed_checks = 0;
};

/**
 * @brief The single way rules enter the engine
 *
 * Results are ordered by (sequence, code). Edits take effect on the next
 * listing, never during an evaluation already holding a listing.
 */
class IRuleRepository {
public:
    virtual ~IRuleRepository() = default;

    [[nodiscard]] virtual std::vector<ValidationRule> list_active_rules(RuleScope scope) const = 0;

    /// All active rules from one consistent snapshot
    [[nodiscard]] virtual std::vector<ValidationRule> list_active_rules() const = 0;

    virtual void record_statistics(const std::string& /*rule_code*/,
                                   uint64_t /*checks*/, uint64_t /*failures*/) {}
};

/**
 * @brief In-memory rule store with hot reload
 *
 * Thread-safety: readers load the rule set via atomic shared_ptr; writers
 * copy, modify and swap under a single-writer mutex.
 */
class InMemoryRuleRepository : public IRuleRepository {
public:
    InMemoryRuleRepository();
    explicit InMemoryRuleRepository(std::vector<ValidationRule> rules);

    [[nodiscard]] std::vector<ValidationRule> list_active_rules(RuleScope scope) const override;
    [[nodiscard]] std::vector<ValidationRule> list_active_rules() const override;

    /// Replace the whole rule set (RCU swap)
    void reload(std::vector<ValidationRule> rules);

    /// Insert or replace a rule by code
    void upsert(ValidationRule rule);

    /// @return false if no rule has this code
    bool set_active(const std::string& code, bool active);

    [[nodiscard]] std::vector<ValidationRule> all_rules() const;
    [[nodiscard]] size_t rule_count() const;

    void record_statistics(const std::string& rule_code, uint64_t checks, uint64_t failures) override;
    [[nodiscard]] RuleStatistics statistics(const std::string& rule_code) const;

private:
    using RuleSet = std::vector<ValidationRule>;

    static std::shared_ptr<const RuleSet> sorted(RuleSet rules);

    std::atomic<std::shared_ptr<const RuleSet>> rules_;
    mutable std::mutex write_mutex_;

    std::unordered_map<std::string, RuleStatistics> stats_;
    mutable std::mutex stats_mutex_;
};

} // namespace wpsgate
