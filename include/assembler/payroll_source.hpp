#pragma once

#include <optional>
#include <string>
#include <vector>

namespace wpsgate {

/**
 * @brief Employee bank account as held in the HR master data
 */
struct BankAccountRecord {
    std::string account_number;
    std::string iban;
    std::string swift_code;         // BIC of the holding bank
};

/**
 * @brief One employee with contract and payroll figures, already resolved
 *
 * Allowance and adjustment fields are optional because not every contract
 * carries them; the assembler resolves absence to 0 exactly once.
 */
struct EmployeeRecord {
    std::string employee_ref;
    std::string name;
    std::string department;
    std::string company_id;
    std::string emirates_id;
    std::string labour_card_no;
    std::string mol_id;
    std::string payslip_ref;

    bool contract_active = false;
    std::optional<BankAccountRecord> bank_account;

    double wage = 0.0;
    std::optional<double> housing_allowance;
    std::optional<double> transport_allowance;
    std::optional<double> other_allowance;
    std::optional<double> overtime;
    std::optional<double> leave_salary;
    std::optional<double> deductions;
    std::optional<int> days_worked;
};

/**
 * @brief Which employees a batch covers
 */
struct EmployerScope {
    std::string company_id;
    std::string employer_id;
    std::optional<std::string> department;          // restrict to one department
    std::vector<std::string> employee_refs;         // explicit selection (empty = all)
};

/**
 * @brief Capability interface over employee/contract/payroll master data
 *
 * Injected into the LineAssembler; the data lives in an external system.
 */
class IPayrollSource {
public:
    virtual ~IPayrollSource() = default;

    /// Employees of the scope's company, in stable payroll order
    [[nodiscard]] virtual std::vector<EmployeeRecord> list_employees(
        const EmployerScope& scope) const = 0;

    /// Source label for logs (e.g. "json:/data/payroll-2026-09.json")
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace wpsgate
