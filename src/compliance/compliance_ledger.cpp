#include "compliance/compliance_ledger.hpp"
#include "core/money.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace wpsgate {

double ComplianceRecord::compliance_rate() const {
    const auto eligible = total_employees > employees_exempt ? total_employees - employees_exempt : 0;
    if (eligible == 0) return 100.0;
    return static_cast<double>(employees_paid_wps) / static_cast<double>(eligible) * 100.0;
}

ComplianceStatus ComplianceRecord::status() const {
    const double rate = compliance_rate();
    if (rate >= 100.0) return ComplianceStatus::COMPLIANT;
    if (rate >= 80.0) return ComplianceStatus::PARTIAL;
    return ComplianceStatus::NON_COMPLIANT;
}

bool ComplianceRecord::is_overdue(const std::chrono::year_month_day& as_of) const {
    return std::chrono::sys_days{as_of} > std::chrono::sys_days{submission_deadline()};
}

ComplianceRecord ComplianceLedger::record_processed(const WpsBatch& batch) {
    const auto totals = batch.totals();
    const auto paid_amount = money::round_to_subunits(totals.net);
    const auto paid_count = totals.employee_count;
    const auto due_count = std::max(batch.eligible_employee_count(), paid_count);

    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, created] = records_.try_emplace(key_of(batch.employer_id(), batch.period()));
    auto& record = it->second;
    if (created) {
        record.employer_id = batch.employer_id();
        record.period = batch.period();
    }

    const auto& refs = record.batch_references;
    if (std::find(refs.begin(), refs.end(), batch.reference()) != refs.end()) {
        return record;
    }

    record.batch_references.push_back(batch.reference());
    record.total_employees = std::max(record.total_employees, due_count);
    record.employees_paid_wps += paid_count;
    record.employees_not_paid = record.total_employees > record.employees_paid_wps
        ? record.total_employees - record.employees_paid_wps : 0;
    record.total_salary_due += paid_amount;
    record.total_salary_paid += paid_amount;

    utils::log::info(std::format("Compliance {} {:02d}/{}: {} of {} paid via WPS ({:.1f}%, {})",
        record.employer_id, record.period.month, record.period.year,
        record.employees_paid_wps, record.total_employees, record.compliance_rate(),
        compliance_status_to_string(record.status())));
    return record;
}

void ComplianceLedger::set_exempt(const std::string& employer_id, const SalaryPeriod& period,
                                  size_t exempt) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, created] = records_.try_emplace(key_of(employer_id, period));
    if (created) {
        it->second.employer_id = employer_id;
        it->second.period = period;
    }
    it->second.employees_exempt = exempt;
}

std::optional<ComplianceRecord> ComplianceLedger::find(const std::string& employer_id,
                                                       const SalaryPeriod& period) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = records_.find(key_of(employer_id, period));
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

std::vector<ComplianceRecord> ComplianceLedger::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ComplianceRecord> out;
    out.reserve(records_.size());
    for (const auto& [_, record] : records_) out.push_back(record);
    return out;
}

} // namespace wpsgate
