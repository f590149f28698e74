#pragma once

#include "submission/bank_connection.hpp"
#include "submission/connector.hpp"

#include <chrono>

namespace wpsgate {

/**
 * @brief Bank REST API connector
 *
 * POST {api_url}/{api_version}/wps/submissions with a JSON body carrying the
 * SIF file base64-encoded plus its SHA-256. Status is polled with
 * GET {api_url}/{api_version}/wps/submissions/{bank_reference}.
 *
 * HTTP 2xx with "accepted" (default true) is an acceptance; any other HTTP
 * status is a bank rejection with the response body kept verbatim.
 */
class RestConnector : public IBankConnector {
public:
    RestConnector(BankConnection connection, std::chrono::milliseconds timeout);

    [[nodiscard]] TransmitResult transmit(const TransmitRequest& request) override;
    [[nodiscard]] StatusResult check_status(const std::string& bank_reference) override;
    [[nodiscard]] const char* name() const override { return "rest"; }

private:
    [[nodiscard]] std::string submissions_path() const;

    const BankConnection connection_;
    const std::chrono::milliseconds timeout_;
};

} // namespace wpsgate
