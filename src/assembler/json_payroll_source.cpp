#include "assembler/json_payroll_source.hpp"
#include "core/error.hpp"

#include <format>
#include <fstream>
#include <iterator>

namespace wpsgate {

namespace {

std::optional<double> optional_amount(const nlohmann::json& node, const char* key) {
    const auto it = node.find(key);
    if (it == node.end() || it->is_null()) return std::nullopt;
    return it->get<double>();
}

} // anonymous namespace

JsonPayrollSource JsonPayrollSource::from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError(std::format("Cannot open payroll file: {}", path));
    }
    std::string buffer((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
    return from_string(buffer, "json:" + path);
}

JsonPayrollSource JsonPayrollSource::from_string(const std::string& json_text, std::string label) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        throw FormatError(std::format("Malformed payroll JSON: {}", e.what()));
    }

    const auto it = root.find("employees");
    if (it == root.end() || !it->is_array()) {
        throw FormatError("Payroll JSON has no \"employees\" array");
    }

    std::vector<EmployeeRecord> employees;
    employees.reserve(it->size());
    try {
        for (const auto& node : *it) {
            employees.push_back(parse_employee(node));
        }
    } catch (const nlohmann::json::exception& e) {
        throw FormatError(std::format("Invalid employee record: {}", e.what()));
    }
    return JsonPayrollSource(std::move(employees), std::move(label));
}

EmployeeRecord JsonPayrollSource::parse_employee(const nlohmann::json& node) {
    EmployeeRecord e;
    e.employee_ref = node.value("employee_ref", std::string{});
    e.name = node.value("name", std::string{});
    e.department = node.value("department", std::string{});
    e.company_id = node.value("company_id", std::string{});
    e.emirates_id = node.value("emirates_id", std::string{});
    e.labour_card_no = node.value("labour_card_no", std::string{});
    e.mol_id = node.value("mol_id", std::string{});
    e.payslip_ref = node.value("payslip_ref", std::string{});
    e.contract_active = node.value("contract_active", false);
    e.wage = node.value("wage", 0.0);

    if (const auto acc = node.find("bank_account"); acc != node.end() && acc->is_object()) {
        BankAccountRecord account;
        account.account_number = acc->value("account_number", std::string{});
        account.iban = acc->value("iban", std::string{});
        account.swift_code = acc->value("swift_code", std::string{});
        e.bank_account = std::move(account);
    }

    e.housing_allowance = optional_amount(node, "housing_allowance");
    e.transport_allowance = optional_amount(node, "transport_allowance");
    e.other_allowance = optional_amount(node, "other_allowance");
    e.overtime = optional_amount(node, "overtime");
    e.leave_salary = optional_amount(node, "leave_salary");
    e.deductions = optional_amount(node, "deductions");
    if (const auto days = node.find("days_worked"); days != node.end() && !days->is_null()) {
        e.days_worked = days->get<int>();
    }
    return e;
}

std::vector<EmployeeRecord> JsonPayrollSource::list_employees(const EmployerScope& scope) const {
    std::vector<EmployeeRecord> result;
    for (const auto& e : employees_) {
        if (scope.company_id.empty() || e.company_id == scope.company_id) {
            result.push_back(e);
        }
    }
    return result;
}

} // namespace wpsgate
