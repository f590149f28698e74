#pragma once

#include "core/types.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace wpsgate {

struct ConnectionTestResult {
    bool success = false;
    std::string message;
};

/**
 * @brief How to reach one bank's WPS submission channel
 *
 * Lifecycle: DRAFT -> TESTING -> ACTIVE <-> SUSPENDED. A connection may
 * only become ACTIVE once its protocol endpoint and credentials are
 * present. Connectors receive a copy and never mutate it.
 */
class BankConnection {
public:
    std::string name;                   // unique key
    std::string bank_code;
    Protocol protocol = Protocol::REST;

    // REST / SOAP
    std::string api_url;
    std::string api_version = "v1";
    AuthMethod auth_method = AuthMethod::API_KEY;
    std::string api_key;
    std::string api_secret;
    std::string client_id;              // oauth2
    std::string client_secret;          // oauth2
    std::string token_path = "/oauth/token";
    std::string username;               // basic
    std::string password;               // basic
    std::string certificate_file;       // certificate (PEM)
    std::string certificate_key_file;

    // SFTP
    std::string sftp_host;
    int sftp_port = 22;
    std::string sftp_username;
    std::string sftp_key_file;
    std::string sftp_upload_path = "/upload";
    std::string sftp_download_path = "/download";

    // Manual portal
    std::string portal_url;

    // Employer routing identifiers at this bank
    std::string employer_id;
    std::string routing_code;

    // Per-connection override of the orchestrator's attempt timeout
    std::optional<std::chrono::milliseconds> attempt_timeout;

    [[nodiscard]] ConnectionState state() const { return state_; }
    [[nodiscard]] bool is_active() const { return state_ == ConnectionState::ACTIVE; }

    /// First missing endpoint/credential for this protocol, nullopt when usable
    [[nodiscard]] std::optional<std::string> missing_requirement() const;

    /// Configuration check per protocol; DRAFT moves to TESTING.
    /// Records the outcome as the last test.
    ConnectionTestResult test_connection(std::chrono::system_clock::time_point now);

    /// @throws StateError if endpoint/credentials are missing
    void activate();
    void suspend();

    /// Restore a persisted state (config load); ACTIVE still requires credentials
    void restore_state(ConnectionState state);

    [[nodiscard]] const std::optional<std::chrono::system_clock::time_point>& last_test_at() const {
        return last_test_at_;
    }
    [[nodiscard]] const std::optional<ConnectionTestResult>& last_test() const { return last_test_; }

private:
    ConnectionState state_ = ConnectionState::DRAFT;
    std::optional<std::chrono::system_clock::time_point> last_test_at_;
    std::optional<ConnectionTestResult> last_test_;
};

} // namespace wpsgate
