#pragma once

#include "assembler/payroll_source.hpp"
#include "model/bank_registry.hpp"
#include "model/wps_batch.hpp"

#include <memory>
#include <vector>

namespace wpsgate {

/**
 * @brief Line Assembler - builds one WpsLine per eligible employee
 *
 * Eligibility: active contract, inside the employer scope (company,
 * optional department, optional explicit employee list).
 *
 * Employees without a resolvable bank account still get a line with empty
 * bank fields, so validation reports exactly who is missing data.
 *
 * Routing code resolution: the account's SWIFT/BIC is looked up in the
 * bank registry; unknown BICs fall through verbatim.
 */
class LineAssembler {
public:
    LineAssembler(std::shared_ptr<const IPayrollSource> source,
                  std::shared_ptr<const BankRegistry> banks);

    /**
     * @brief Build lines for a scope
     * @throws StateError if no employee in scope has an active contract
     */
    [[nodiscard]] std::vector<WpsLine> assemble(const EmployerScope& scope) const;

    /**
     * @brief Discard and rebuild all lines of a batch (idempotent)
     * @return Number of lines written
     * @throws StateError if the batch is processed/cancelled or scope is empty
     */
    size_t rebuild(WpsBatch& batch, const EmployerScope& scope) const;

private:
    [[nodiscard]] bool in_scope(const EmployeeRecord& employee, const EmployerScope& scope) const;
    [[nodiscard]] WpsLine build_line(const EmployeeRecord& employee) const;

    std::shared_ptr<const IPayrollSource> source_;
    std::shared_ptr<const BankRegistry> banks_;
};

} // namespace wpsgate
