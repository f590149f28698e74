#pragma once

#include <string>

namespace wpsgate {

// ============================================================================
// WpsLine - one employee's salary entry in a batch
// ============================================================================

struct WpsLine {
    // Payroll identity (not encoded, carried for reports)
    std::string employee_ref;
    std::string employee_name;
    std::string department;
    std::string payslip_ref;

    // Regulator identification
    std::string emirates_id;            // 15 digits, 784YYYYNNNNNNNC
    std::string labour_card_no;
    std::string mol_id;

    // Banking (empty when the employee has no resolvable account)
    std::string bank_code;              // WPS routing code
    std::string account_number;
    std::string iban;

    int days_worked = 30;

    // Salary components, resolved at assembly time (absent = 0)
    double basic_salary = 0.0;
    double housing_allowance = 0.0;
    double transport_allowance = 0.0;
    double other_allowance = 0.0;
    double overtime = 0.0;
    double leave_salary = 0.0;
    double deductions = 0.0;

    // As supplied; reconciliation against components is a validation
    // concern, never silently corrected
    double net_salary = 0.0;

    /// Emirates ID, falling back to the labour card number
    [[nodiscard]] const std::string& employee_id() const {
        return emirates_id.empty() ? labour_card_no : emirates_id;
    }

    /// Account number, falling back to the IBAN
    [[nodiscard]] const std::string& account() const {
        return account_number.empty() ? iban : account_number;
    }

    [[nodiscard]] double gross_salary() const {
        return basic_salary + housing_allowance + transport_allowance +
               other_allowance + overtime + leave_salary;
    }

    [[nodiscard]] double computed_net_salary() const {
        return gross_salary() - deductions;
    }

    /// SDR "other allowance" column: transport + other + overtime + leave
    [[nodiscard]] double sdr_other_allowance() const {
        return transport_allowance + other_allowance + overtime + leave_salary;
    }

    /// Label used in validation reports
    [[nodiscard]] std::string display_name() const {
        if (!employee_name.empty()) return employee_name;
        if (!employee_ref.empty()) return employee_ref;
        return employee_id();
    }
};

} // namespace wpsgate
