#pragma once

#include "submission/bank_connection.hpp"
#include "submission/connector.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace wpsgate {

/**
 * @brief Bank SOAP web-service connector
 *
 * SubmitSalaryFile / GetSubmissionStatus operations in a SOAP 1.1 envelope.
 * ResponseCode "0" is an acceptance; a SOAP Fault or any other code is a
 * bank rejection.
 */
class SoapConnector : public IBankConnector {
public:
    SoapConnector(BankConnection connection, std::chrono::milliseconds timeout);

    [[nodiscard]] TransmitResult transmit(const TransmitRequest& request) override;
    [[nodiscard]] StatusResult check_status(const std::string& bank_reference) override;
    [[nodiscard]] const char* name() const override { return "soap"; }

    [[nodiscard]] static std::string build_submit_envelope(const BankConnection& connection,
                                                           const TransmitRequest& request);
    [[nodiscard]] static std::string build_status_envelope(const BankConnection& connection,
                                                           const std::string& bank_reference);

    /// Text of the first element with this local name (namespace prefix ignored)
    [[nodiscard]] static std::optional<std::string> element_text(std::string_view xml,
                                                                 std::string_view local_name);

private:
    [[nodiscard]] std::string post(const std::string& action, const std::string& envelope);

    const BankConnection connection_;
    const std::chrono::milliseconds timeout_;
};

} // namespace wpsgate
