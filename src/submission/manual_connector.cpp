#include "submission/manual_connector.hpp"

#include <format>

namespace wpsgate {

ManualConnector::ManualConnector(BankConnection connection)
    : connection_(std::move(connection)) {}

TransmitResult ManualConnector::transmit(const TransmitRequest& request) {
    TransmitResult result;
    result.accepted = true;
    result.bank_reference = std::format("MANUAL-{}", request.submission_reference);
    result.response_code = "PENDING";
    result.response_message = std::format("Marked for manual submission via {}", connection_.portal_url);
    return result;
}

StatusResult ManualConnector::check_status(const std::string& /*bank_reference*/) {
    return StatusResult{BankStatus::PENDING, "PENDING", "awaiting manual confirmation"};
}

} // namespace wpsgate
