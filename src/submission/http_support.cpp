#include "submission/http_support.hpp"
#include "core/base64.hpp"
#include "core/error.hpp"

#include <nlohmann/json.hpp>

#include <format>

namespace wpsgate::http {

std::string Endpoint::path(std::string_view suffix) const {
    std::string out = base_path;
    if (!suffix.starts_with('/')) out += '/';
    out += suffix;
    return out;
}

Endpoint parse_endpoint(const std::string& url) {
    std::string rest;
    std::string scheme;
    if (url.starts_with("https://")) {
        scheme = "https://";
        rest = url.substr(8);
    } else if (url.starts_with("http://")) {
        scheme = "http://";
        rest = url.substr(7);
    } else {
        throw TransmissionError(std::format("unsupported endpoint URL '{}'", url));
    }

    Endpoint endpoint;
    const auto path_pos = rest.find('/');
    const std::string host = path_pos == std::string::npos ? rest : rest.substr(0, path_pos);
    if (host.empty()) {
        throw TransmissionError(std::format("endpoint URL '{}' has no host", url));
    }
    endpoint.scheme_host_port = scheme + host;
    if (path_pos != std::string::npos) {
        endpoint.base_path = rest.substr(path_pos);
        while (endpoint.base_path.ends_with('/')) endpoint.base_path.pop_back();
    }
    return endpoint;
}

std::unique_ptr<httplib::Client> make_client(const BankConnection& connection,
                                             const Endpoint& endpoint,
                                             std::chrono::milliseconds timeout) {
    std::unique_ptr<httplib::Client> client;
    if (connection.auth_method == AuthMethod::CERTIFICATE) {
        client = std::make_unique<httplib::Client>(endpoint.scheme_host_port,
                                                   connection.certificate_file,
                                                   connection.certificate_key_file);
    } else {
        client = std::make_unique<httplib::Client>(endpoint.scheme_host_port);
    }
    client->set_connection_timeout(timeout);
    client->set_read_timeout(timeout);
    client->set_write_timeout(timeout);
    return client;
}

httplib::Headers auth_headers(const BankConnection& connection,
                              httplib::Client& client,
                              const Endpoint& endpoint) {
    httplib::Headers headers;
    switch (connection.auth_method) {
        case AuthMethod::API_KEY:
            headers.emplace(kApiKeyHeader, connection.api_key);
            break;

        case AuthMethod::BASIC:
            headers.emplace(kAuthorizationHeader, "Basic " +
                base64::encode(connection.username + ":" + connection.password));
            break;

        case AuthMethod::CERTIFICATE:
            // Mutual TLS; identity is the client certificate
            break;

        case AuthMethod::OAUTH2: {
            const httplib::Params params = {
                {"grant_type", "client_credentials"},
                {"client_id", connection.client_id},
                {"client_secret", connection.client_secret},
            };
            const auto res = client.Post(endpoint.path(connection.token_path), params);
            if (!res) {
                throw TransmissionError(std::format("OAuth2 token request failed: {}",
                                                    describe_error(res.error())));
            }
            if (res->status < 200 || res->status >= 300) {
                throw TransmissionError(std::format("OAuth2 token request returned HTTP {}: {}",
                                                    res->status, res->body));
            }
            const auto body = nlohmann::json::parse(res->body, nullptr, false);
            if (body.is_discarded() || !body.contains("access_token") || !body["access_token"].is_string()) {
                throw TransmissionError("OAuth2 token response has no access_token");
            }
            headers.emplace(kAuthorizationHeader,
                std::string(kBearerPrefix) + body["access_token"].get<std::string>());
            break;
        }
    }
    return headers;
}

std::string describe_error(httplib::Error error) {
    return httplib::to_string(error);
}

} // namespace wpsgate::http
