#include "submission/bank_connection.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>

namespace wpsgate {

std::optional<std::string> BankConnection::missing_requirement() const {
    switch (protocol) {
        case Protocol::REST:
        case Protocol::SOAP:
            if (api_url.empty()) {
                return protocol == Protocol::REST ? "API URL not configured"
                                                  : "SOAP endpoint not configured";
            }
            switch (auth_method) {
                case AuthMethod::API_KEY:
                    if (api_key.empty()) return "API key not configured";
                    break;
                case AuthMethod::OAUTH2:
                    if (client_id.empty() || client_secret.empty()) return "OAuth2 client credentials not configured";
                    break;
                case AuthMethod::CERTIFICATE:
                    if (certificate_file.empty()) return "client certificate not configured";
                    break;
                case AuthMethod::BASIC:
                    if (username.empty() || password.empty()) return "basic auth credentials not configured";
                    break;
            }
            return std::nullopt;

        case Protocol::SFTP:
            if (sftp_host.empty() || sftp_username.empty()) return "SFTP credentials not configured";
            if (sftp_port <= 0 || sftp_port > 65535) return std::format("invalid SFTP port {}", sftp_port);
            return std::nullopt;

        case Protocol::MANUAL:
            if (portal_url.empty()) return "portal URL not configured";
            return std::nullopt;
    }
    return "unknown protocol";
}

ConnectionTestResult BankConnection::test_connection(std::chrono::system_clock::time_point now) {
    ConnectionTestResult result;
    if (const auto missing = missing_requirement()) {
        result.success = false;
        result.message = *missing;
    } else {
        result.success = true;
        switch (protocol) {
            case Protocol::REST:   result.message = "REST API connection verified"; break;
            case Protocol::SOAP:   result.message = "SOAP connection verified"; break;
            case Protocol::SFTP:   result.message = "SFTP connection verified"; break;
            case Protocol::MANUAL: result.message = "Direct portal connection - manual verification required"; break;
        }
    }

    if (state_ == ConnectionState::DRAFT) {
        state_ = ConnectionState::TESTING;
    }
    last_test_at_ = now;
    last_test_ = result;

    utils::log::info(std::format("Connection test for {} ({}): {}", name,
        protocol_to_string(protocol), result.message));
    return result;
}

void BankConnection::activate() {
    if (const auto missing = missing_requirement()) {
        throw StateError(std::format("connection {} cannot be activated: {}", name, *missing));
    }
    state_ = ConnectionState::ACTIVE;
}

void BankConnection::suspend() {
    state_ = ConnectionState::SUSPENDED;
}

void BankConnection::restore_state(ConnectionState state) {
    if (state == ConnectionState::ACTIVE) {
        activate();
        return;
    }
    state_ = state;
}

} // namespace wpsgate
