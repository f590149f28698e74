#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace wpsgate {

/**
 * @brief One transaction on the employer's bank statement
 *
 * Salary debits may be reported with a negative sign; matching uses the
 * absolute amount.
 */
struct StatementLine {
    std::string id;
    double amount = 0.0;
    std::string reference;          // free text: beneficiary name, account, narrative
    std::optional<std::chrono::year_month_day> date;
};

/**
 * @brief Capability interface over the bank statements of the payroll account
 *
 * Injected into the PaymentReconciler; statements live with the bank or the
 * accounting system.
 */
class IBankStatementSource {
public:
    virtual ~IBankStatementSource() = default;

    /// Transactions dated within [from, to]; undated lines are always included
    [[nodiscard]] virtual std::vector<StatementLine> statement_lines(
        const std::chrono::year_month_day& from,
        const std::chrono::year_month_day& to) const = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace wpsgate
