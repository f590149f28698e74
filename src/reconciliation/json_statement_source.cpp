#include "reconciliation/json_statement_source.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>
#include <fstream>
#include <iterator>

namespace wpsgate {

JsonStatementSource JsonStatementSource::from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError(std::format("Cannot open statement file: {}", path));
    }
    std::string buffer((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
    return from_string(buffer, "json:" + path);
}

JsonStatementSource JsonStatementSource::from_string(const std::string& json_text, std::string label) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        throw FormatError(std::format("Malformed statement JSON: {}", e.what()));
    }

    const auto it = root.find("lines");
    if (it == root.end() || !it->is_array()) {
        throw FormatError("Statement JSON has no \"lines\" array");
    }

    std::vector<StatementLine> lines;
    lines.reserve(it->size());
    try {
        for (const auto& node : *it) {
            lines.push_back(parse_line(node));
        }
    } catch (const nlohmann::json::exception& e) {
        throw FormatError(std::format("Invalid statement line: {}", e.what()));
    }
    return JsonStatementSource(std::move(lines), std::move(label));
}

StatementLine JsonStatementSource::parse_line(const nlohmann::json& node) {
    StatementLine line;
    line.id = node.value("id", std::string{});
    line.amount = node.value("amount", 0.0);
    line.reference = node.value("reference", std::string{});
    if (const auto date = node.find("date"); date != node.end() && !date->is_null()) {
        const auto text = date->get<std::string>();
        line.date = utils::parse_date(text);
        if (!line.date) {
            throw FormatError(std::format("Statement line '{}': invalid date '{}'", line.id, text));
        }
    }
    return line;
}

std::vector<StatementLine> JsonStatementSource::statement_lines(
        const std::chrono::year_month_day& from,
        const std::chrono::year_month_day& to) const {
    std::vector<StatementLine> result;
    for (const auto& line : lines_) {
        if (!line.date || (*line.date >= from && *line.date <= to)) {
            result.push_back(line);
        }
    }
    return result;
}

} // namespace wpsgate
