#include "model/batch_json.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>
#include <fstream>

namespace wpsgate {

namespace {

nlohmann::json line_to_json(const WpsLine& line) {
    return {
        {"employee_ref", line.employee_ref},
        {"employee_name", line.employee_name},
        {"department", line.department},
        {"payslip_ref", line.payslip_ref},
        {"emirates_id", line.emirates_id},
        {"labour_card_no", line.labour_card_no},
        {"mol_id", line.mol_id},
        {"bank_code", line.bank_code},
        {"account_number", line.account_number},
        {"iban", line.iban},
        {"days_worked", line.days_worked},
        {"basic_salary", line.basic_salary},
        {"housing_allowance", line.housing_allowance},
        {"transport_allowance", line.transport_allowance},
        {"other_allowance", line.other_allowance},
        {"overtime", line.overtime},
        {"leave_salary", line.leave_salary},
        {"deductions", line.deductions},
        {"net_salary", line.net_salary},
    };
}

WpsLine line_from_json(const nlohmann::json& node) {
    WpsLine line;
    line.employee_ref = node.value("employee_ref", std::string{});
    line.employee_name = node.value("employee_name", std::string{});
    line.department = node.value("department", std::string{});
    line.payslip_ref = node.value("payslip_ref", std::string{});
    line.emirates_id = node.value("emirates_id", std::string{});
    line.labour_card_no = node.value("labour_card_no", std::string{});
    line.mol_id = node.value("mol_id", std::string{});
    line.bank_code = node.value("bank_code", std::string{});
    line.account_number = node.value("account_number", std::string{});
    line.iban = node.value("iban", std::string{});
    line.days_worked = node.value("days_worked", 30);
    line.basic_salary = node.value("basic_salary", 0.0);
    line.housing_allowance = node.value("housing_allowance", 0.0);
    line.transport_allowance = node.value("transport_allowance", 0.0);
    line.other_allowance = node.value("other_allowance", 0.0);
    line.overtime = node.value("overtime", 0.0);
    line.leave_salary = node.value("leave_salary", 0.0);
    line.deductions = node.value("deductions", 0.0);
    // Absent net defaults to the component formula; a supplied net is kept as-is
    line.net_salary = node.contains("net_salary")
        ? node.at("net_salary").get<double>()
        : line.computed_net_salary();
    return line;
}

} // anonymous namespace

nlohmann::json batch_to_json(const WpsBatch& batch) {
    nlohmann::json root = {
        {"reference", batch.reference()},
        {"company_id", batch.company_id()},
        {"employer_id", batch.employer_id()},
        {"employer_name", batch.employer_name()},
        {"employer_bank_code", batch.employer_bank_code()},
        {"employer_account", batch.employer_account()},
        {"period_month", batch.period().month},
        {"period_year", batch.period().year},
        {"file_type", file_type_to_string(batch.file_type())},
        {"state", batch_state_to_string(batch.state())},
        {"eligible_employee_count", batch.eligible_employee_count()},
    };
    if (batch.salary_date().has_value()) {
        root["salary_date"] = utils::format_date(*batch.salary_date());
    }
    if (batch.declared_total_net().has_value()) {
        root["declared_total_net"] = *batch.declared_total_net();
    }

    auto lines = nlohmann::json::array();
    for (const auto& line : batch.lines()) {
        lines.push_back(line_to_json(line));
    }
    root["lines"] = std::move(lines);
    return root;
}

WpsBatch batch_from_json(const nlohmann::json& root) {
    if (!root.is_object()) {
        throw FormatError("Batch document must be a JSON object");
    }

    WpsBatch batch;
    try {
        batch.set_reference(root.value("reference", std::string{}));
        batch.set_company_id(root.value("company_id", std::string{}));
        batch.set_employer_id(root.value("employer_id", std::string{}));
        batch.set_employer_name(root.value("employer_name", std::string{}));
        batch.set_employer_bank_code(root.value("employer_bank_code", std::string{}));
        batch.set_employer_account(root.value("employer_account", std::string{}));
        batch.set_period(SalaryPeriod(root.value("period_month", 0u), root.value("period_year", 0)));
        batch.set_eligible_employee_count(root.value("eligible_employee_count", size_t{0}));

        if (const auto it = root.find("salary_date"); it != root.end() && it->is_string()) {
            const auto date = utils::parse_date(it->get<std::string>());
            if (!date) {
                throw FormatError(std::format("Invalid salary_date '{}'", it->get<std::string>()));
            }
            batch.set_salary_date(*date);
        }
        if (const auto it = root.find("declared_total_net"); it != root.end() && it->is_number()) {
            batch.set_declared_total_net(it->get<double>());
        }
        const auto file_type = root.value("file_type", std::string{"sif"});
        const auto type = parse_file_type(file_type);
        if (!type) {
            throw FormatError(std::format("Unknown file_type '{}'", file_type));
        }
        batch.set_file_type(*type);

        std::vector<WpsLine> lines;
        if (const auto it = root.find("lines"); it != root.end() && it->is_array()) {
            lines.reserve(it->size());
            for (const auto& node : *it) {
                lines.push_back(line_from_json(node));
            }
        }
        batch.replace_lines(std::move(lines));

        const auto state_name = root.value("state", std::string{"draft"});
        const auto state = parse_batch_state(state_name);
        if (!state) {
            throw FormatError(std::format("Unknown batch state '{}'", state_name));
        }
        batch.restore_state(*state);
    } catch (const nlohmann::json::exception& e) {
        throw FormatError(std::format("Invalid batch document: {}", e.what()));
    }
    return batch;
}

WpsBatch load_batch_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError(std::format("Cannot open batch file: {}", path));
    }
    try {
        return batch_from_json(nlohmann::json::parse(file));
    } catch (const nlohmann::json::parse_error& e) {
        throw FormatError(std::format("Malformed batch JSON in {}: {}", path, e.what()));
    }
}

void save_batch_file(const WpsBatch& batch, const std::string& path) {
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        throw ConfigError(std::format("Cannot write batch file: {}", path));
    }
    file << batch_to_json(batch).dump(2) << '\n';
    if (!file.good()) {
        throw ConfigError(std::format("Failed writing batch file: {}", path));
    }
}

} // namespace wpsgate
