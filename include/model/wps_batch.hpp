#pragma once

#include "core/types.hpp"
#include "model/wps_line.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace wpsgate {

/**
 * @brief Totals derived from the lines of a batch; never stored
 */
struct BatchTotals {
    size_t employee_count = 0;
    double basic = 0.0;
    double housing = 0.0;
    double transport = 0.0;
    double other = 0.0;
    double overtime = 0.0;
    double leave = 0.0;
    double deductions = 0.0;
    double net = 0.0;
};

/**
 * @brief One monthly WPS submission for one employer
 *
 * Owns its lines. Lifecycle:
 *   DRAFT -> GENERATED -> SUBMITTED -> PROCESSED
 *                                   -> REJECTED -> (reset) DRAFT
 *   any non-processed state -> CANCELLED -> (reset) DRAFT
 *
 * A PROCESSED batch is frozen: lines, header and generation are immutable.
 */
class WpsBatch {
public:
    WpsBatch() = default;

    // Header. Setters throw StateError once the batch is processed or cancelled.
    [[nodiscard]] const std::string& reference() const { return reference_; }
    [[nodiscard]] const std::string& company_id() const { return company_id_; }
    [[nodiscard]] const std::string& employer_id() const { return employer_id_; }
    [[nodiscard]] const std::string& employer_name() const { return employer_name_; }
    [[nodiscard]] const std::string& employer_bank_code() const { return employer_bank_code_; }
    [[nodiscard]] const std::string& employer_account() const { return employer_account_; }
    [[nodiscard]] const SalaryPeriod& period() const { return period_; }
    [[nodiscard]] const std::optional<std::chrono::year_month_day>& salary_date() const { return salary_date_; }
    [[nodiscard]] FileType file_type() const { return file_type_; }
    [[nodiscard]] const std::optional<double>& declared_total_net() const { return declared_total_net_; }
    [[nodiscard]] size_t eligible_employee_count() const { return eligible_employee_count_; }

    void set_reference(std::string reference);
    void set_company_id(std::string company_id);
    void set_employer_id(std::string employer_id);
    void set_employer_name(std::string employer_name);
    void set_employer_bank_code(std::string bank_code);
    void set_employer_account(std::string account);
    void set_period(SalaryPeriod period);
    void set_salary_date(std::optional<std::chrono::year_month_day> date);
    void set_file_type(FileType type);
    void set_declared_total_net(std::optional<double> total);
    void set_eligible_employee_count(size_t count);

    [[nodiscard]] const std::vector<WpsLine>& lines() const { return lines_; }

    /// Replace all lines (assembly is rebuild, not incremental)
    /// @throws StateError if the batch is processed or cancelled
    void replace_lines(std::vector<WpsLine> lines);

    /// Append a single line (manual entry)
    /// @throws StateError if the batch is frozen
    void add_line(WpsLine line);

    [[nodiscard]] BatchTotals totals() const;

    /// WPS_<employer_id>_<YYYY><MM>.SIF
    [[nodiscard]] std::string file_name() const;

    [[nodiscard]] BatchState state() const { return state_; }
    [[nodiscard]] bool is_frozen() const { return state_ == BatchState::PROCESSED; }

    void mark_generated();
    void mark_submitted();
    void mark_processed();
    void mark_rejected();
    void cancel();
    void reset_to_draft();

    /// Restore a persisted state (JSON load); no transition checks
    void restore_state(BatchState state) { state_ = state; }

private:
    void ensure_mutable(const char* operation) const;

    std::string reference_;             // WPS/<YYYY>/<MM>/<NNNN>
    std::string company_id_;
    std::string employer_id_;           // MOL establishment / employer EID
    std::string employer_name_;
    std::string employer_bank_code_;    // routing code
    std::string employer_account_;      // account or IBAN
    SalaryPeriod period_;
    std::optional<std::chrono::year_month_day> salary_date_;
    FileType file_type_ = FileType::SIF;

    // Control total from the payroll run, cross-checked at encode time
    std::optional<double> declared_total_net_;

    // Headcount of eligible employees at assembly (compliance denominator)
    size_t eligible_employee_count_ = 0;

    std::vector<WpsLine> lines_;
    BatchState state_ = BatchState::DRAFT;
};

} // namespace wpsgate
