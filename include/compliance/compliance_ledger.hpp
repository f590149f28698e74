#pragma once

#include "core/types.hpp"
#include "model/wps_batch.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace wpsgate {

/**
 * @brief WPS compliance position of one employer for one salary period
 *
 * Rate = paid / (total - exempt) x 100, 100 when nobody is eligible.
 * Status: COMPLIANT at 100%, PARTIAL from 80%, NON_COMPLIANT below.
 */
struct ComplianceRecord {
    std::string employer_id;
    SalaryPeriod period;
    std::vector<std::string> batch_references;

    size_t total_employees = 0;
    size_t employees_paid_wps = 0;
    size_t employees_not_paid = 0;
    size_t employees_exempt = 0;

    int64_t total_salary_due = 0;       // subunits
    int64_t total_salary_paid = 0;      // subunits

    [[nodiscard]] int64_t salary_variance() const { return total_salary_due - total_salary_paid; }
    [[nodiscard]] double compliance_rate() const;
    [[nodiscard]] ComplianceStatus status() const;
    [[nodiscard]] bool is_compliant() const { return status() == ComplianceStatus::COMPLIANT; }

    [[nodiscard]] std::chrono::year_month_day submission_deadline() const { return period.deadline(); }
    [[nodiscard]] bool is_overdue(const std::chrono::year_month_day& as_of) const;
};

/**
 * @brief Compliance records keyed by (employer, period)
 */
class ComplianceLedger {
public:
    /**
     * @brief Record a processed batch (create or update)
     *
     * Paid headcount and amounts accumulate across batches of the same
     * employer and period; the headcount due is the largest eligible count
     * seen. Recording the same batch twice has no further effect.
     */
    ComplianceRecord record_processed(const WpsBatch& batch);

    /// Mark employees exempt from WPS for a period (e.g. unpaid leave)
    void set_exempt(const std::string& employer_id, const SalaryPeriod& period, size_t exempt);

    [[nodiscard]] std::optional<ComplianceRecord> find(const std::string& employer_id,
                                                       const SalaryPeriod& period) const;
    [[nodiscard]] std::vector<ComplianceRecord> all() const;

private:
    using Key = std::tuple<std::string, int, unsigned>;

    static Key key_of(const std::string& employer_id, const SalaryPeriod& period) {
        return {employer_id, period.year, period.month};
    }

    std::map<Key, ComplianceRecord> records_;
    mutable std::mutex mutex_;
};

} // namespace wpsgate
