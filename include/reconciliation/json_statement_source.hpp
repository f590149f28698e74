#pragma once

#include "reconciliation/statement_source.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace wpsgate {

/**
 * @brief Statement source backed by a JSON export of the bank statement
 *
 * Expected shape:
 *   { "lines": [ { "id": "TX-1", "amount": -6750.00,
 *                  "reference": "SALARY 09/2026 AE07...", "date": "2026-09-28" } ] }
 */
class JsonStatementSource : public IBankStatementSource {
public:
    /// @throws ConfigError on an unreadable file, FormatError on malformed JSON
    static JsonStatementSource from_file(const std::string& path);

    /// @throws FormatError on malformed JSON or an invalid date
    static JsonStatementSource from_string(const std::string& json_text,
                                           std::string label = "json:inline");

    [[nodiscard]] std::vector<StatementLine> statement_lines(
        const std::chrono::year_month_day& from,
        const std::chrono::year_month_day& to) const override;

    [[nodiscard]] std::string name() const override { return label_; }

private:
    JsonStatementSource(std::vector<StatementLine> lines, std::string label)
        : lines_(std::move(lines)), label_(std::move(label)) {}

    static StatementLine parse_line(const nlohmann::json& node);

    std::vector<StatementLine> lines_;
    std::string label_;
};

} // namespace wpsgate
