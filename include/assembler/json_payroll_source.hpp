#pragma once

#include "assembler/payroll_source.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace wpsgate {

/**
 * @brief Payroll source backed by a JSON export of the HR system
 *
 * Expected shape:
 *   { "employees": [ { "employee_ref": "E001", "name": "...",
 *       "company_id": "...", "department": "...", "emirates_id": "...",
 *       "labour_card_no": "...", "mol_id": "...", "contract_active": true,
 *       "bank_account": { "account_number": "...", "iban": "...",
 *                         "swift_code": "..." },
 *       "wage": 5000.0, "housing_allowance": 1250.0, ... } ] }
 *
 * Absent optional figures stay absent (resolved to 0 by the assembler).
 */
class JsonPayrollSource : public IPayrollSource {
public:
    /// @throws ConfigError on an unreadable file, FormatError on malformed JSON
    static JsonPayrollSource from_file(const std::string& path);

    /// @throws FormatError on malformed JSON
    static JsonPayrollSource from_string(const std::string& json_text,
                                         std::string label = "json:inline");

    [[nodiscard]] std::vector<EmployeeRecord> list_employees(
        const EmployerScope& scope) const override;

    [[nodiscard]] std::string name() const override { return label_; }

private:
    JsonPayrollSource(std::vector<EmployeeRecord> employees, std::string label)
        : employees_(std::move(employees)), label_(std::move(label)) {}

    static EmployeeRecord parse_employee(const nlohmann::json& node);

    std::vector<EmployeeRecord> employees_;
    std::string label_;
};

} // namespace wpsgate
