#pragma once

#include "submission/bank_connection.hpp"
#include "submission/connector.hpp"

namespace wpsgate {

/**
 * @brief Records intent for a human upload through the bank's portal
 *
 * Nothing leaves the process. Status stays pending until an operator
 * records the outcome on the submission.
 */
class ManualConnector : public IBankConnector {
public:
    explicit ManualConnector(BankConnection connection);

    [[nodiscard]] TransmitResult transmit(const TransmitRequest& request) override;
    [[nodiscard]] StatusResult check_status(const std::string& bank_reference) override;
    [[nodiscard]] const char* name() const override { return "manual"; }

private:
    const BankConnection connection_;
};

} // namespace wpsgate
