#pragma once

#include "submission/bank_connection.hpp"

#include <httplib.h>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace wpsgate::http {

inline constexpr std::string_view kBearerPrefix = "Bearer ";
// std::string because cpp-httplib APIs require const std::string&
inline const std::string kAuthorizationHeader = "Authorization";
inline const std::string kApiKeyHeader = "X-API-Key";
inline constexpr const char* kJsonContentType = "application/json";
inline constexpr const char* kSoapContentType = "text/xml; charset=utf-8";
inline constexpr const char* kFormContentType = "application/x-www-form-urlencoded";

/**
 * @brief Base URL split for httplib (scheme://host:port + path prefix)
 */
struct Endpoint {
    std::string scheme_host_port;
    std::string base_path;      // no trailing slash, "" for root

    [[nodiscard]] std::string path(std::string_view suffix) const;
};

/// @throws TransmissionError if the URL has no http(s) scheme or host
[[nodiscard]] Endpoint parse_endpoint(const std::string& url);

/// Client with timeouts applied and, for certificate auth, the client cert
[[nodiscard]] std::unique_ptr<httplib::Client> make_client(const BankConnection& connection,
                                                           const Endpoint& endpoint,
                                                           std::chrono::milliseconds timeout);

/**
 * @brief Authentication headers for the connection's auth method
 *
 * OAuth2 performs a client-credentials token request first.
 * @throws TransmissionError if the token cannot be obtained
 */
[[nodiscard]] httplib::Headers auth_headers(const BankConnection& connection,
                                            httplib::Client& client,
                                            const Endpoint& endpoint);

/// Human-readable httplib error for a failed request
[[nodiscard]] std::string describe_error(httplib::Error error);

} // namespace wpsgate::http
