#include "assembler/line_assembler.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace wpsgate {

LineAssembler::LineAssembler(std::shared_ptr<const IPayrollSource> source,
                             std::shared_ptr<const BankRegistry> banks)
    : source_(std::move(source)), banks_(std::move(banks)) {}

bool LineAssembler::in_scope(const EmployeeRecord& employee, const EmployerScope& scope) const {
    if (!employee.contract_active) return false;
    if (!scope.company_id.empty() && employee.company_id != scope.company_id) return false;
    if (scope.department.has_value() && employee.department != *scope.department) return false;
    if (!scope.employee_refs.empty() &&
        std::find(scope.employee_refs.begin(), scope.employee_refs.end(),
                  employee.employee_ref) == scope.employee_refs.end()) {
        return false;
    }
    return true;
}

WpsLine LineAssembler::build_line(const EmployeeRecord& employee) const {
    WpsLine line;
    line.employee_ref = employee.employee_ref;
    line.employee_name = employee.name;
    line.department = employee.department;
    line.payslip_ref = employee.payslip_ref;
    line.emirates_id = employee.emirates_id;
    line.labour_card_no = employee.labour_card_no;
    line.mol_id = employee.mol_id;

    if (employee.bank_account.has_value()) {
        const auto& account = *employee.bank_account;
        line.account_number = account.account_number;
        line.iban = account.iban;

        if (!account.swift_code.empty()) {
            const auto bank = banks_ ? banks_->find_by_swift(account.swift_code) : std::nullopt;
            line.bank_code = bank ? bank->routing_code : account.swift_code;
        }
    }

    line.days_worked = employee.days_worked.value_or(30);
    line.basic_salary = employee.wage;
    line.housing_allowance = employee.housing_allowance.value_or(0.0);
    line.transport_allowance = employee.transport_allowance.value_or(0.0);
    line.other_allowance = employee.other_allowance.value_or(0.0);
    line.overtime = employee.overtime.value_or(0.0);
    line.leave_salary = employee.leave_salary.value_or(0.0);
    line.deductions = employee.deductions.value_or(0.0);
    line.net_salary = line.computed_net_salary();
    return line;
}

std::vector<WpsLine> LineAssembler::assemble(const EmployerScope& scope) const {
    const auto employees = source_->list_employees(scope);

    std::vector<WpsLine> lines;
    size_t without_account = 0;
    for (const auto& employee : employees) {
        if (!in_scope(employee, scope)) continue;
        lines.push_back(build_line(employee));
        if (lines.back().account().empty()) ++without_account;
    }

    if (lines.empty()) {
        throw StateError(std::format("no employees with active contracts found for company '{}'",
                                     scope.company_id));
    }

    utils::log::info(std::format("Assembled {} WPS lines from {} ({} without bank account)",
                                 lines.size(), source_->name(), without_account));
    return lines;
}

size_t LineAssembler::rebuild(WpsBatch& batch, const EmployerScope& scope) const {
    if (batch.is_frozen()) {
        throw StateError(std::format("batch {} is processed; lines are frozen", batch.reference()));
    }

    auto lines = assemble(scope);
    const size_t count = lines.size();
    batch.replace_lines(std::move(lines));
    batch.set_eligible_employee_count(count);
    return count;
}

} // namespace wpsgate
