#include "submission/rest_connector.hpp"
#include "submission/http_support.hpp"
#include "core/base64.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <format>

namespace wpsgate {

namespace {

std::string json_string(const nlohmann::json& j, const char* key) {
    if (!j.contains(key)) return {};
    const auto& v = j[key];
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_integer()) return std::to_string(v.get<int64_t>());
    return v.dump();
}

BankStatus parse_bank_status(const std::string& status) {
    const auto lower = utils::to_lower(status);
    if (lower == "success" || lower == "processed" || lower == "completed" || lower == "paid") {
        return BankStatus::SUCCESS;
    }
    if (lower == "failed" || lower == "rejected" || lower == "error") {
        return BankStatus::FAILED;
    }
    return BankStatus::PENDING;
}

} // anonymous namespace

RestConnector::RestConnector(BankConnection connection, std::chrono::milliseconds timeout)
    : connection_(std::move(connection)), timeout_(timeout) {}

std::string RestConnector::submissions_path() const {
    if (connection_.api_version.empty()) return "/wps/submissions";
    return std::format("/{}/wps/submissions", connection_.api_version);
}

TransmitResult RestConnector::transmit(const TransmitRequest& request) {
    const auto endpoint = http::parse_endpoint(connection_.api_url);
    auto client = http::make_client(connection_, endpoint, timeout_);
    const auto headers = http::auth_headers(connection_, *client, endpoint);

    nlohmann::json body;
    body["submission_reference"] = request.submission_reference;
    body["submission_type"] = submission_type_to_string(request.type);
    body["employer_id"] = request.employer_id;
    body["routing_code"] = request.routing_code;
    body["file_name"] = request.file_name;
    body["file_content"] = base64::encode(request.payload);
    body["file_hash"] = request.payload_hash;
    body["file_size"] = request.payload.size();

    const auto res = client->Post(endpoint.path(submissions_path()), headers,
                                  body.dump(), http::kJsonContentType);
    if (!res) {
        throw TransmissionError(std::format("REST submission to {} failed: {}",
                                            connection_.api_url, http::describe_error(res.error())));
    }

    TransmitResult result;
    result.response_code = std::to_string(res->status);
    if (res->status < 200 || res->status >= 300) {
        result.accepted = false;
        result.response_message = res->body;
        return result;
    }

    const auto reply = nlohmann::json::parse(res->body, nullptr, false);
    if (reply.is_discarded() || !reply.is_object()) {
        throw TransmissionError(std::format("REST submission returned a non-JSON body: {}", res->body));
    }
    result.accepted = reply.value("accepted", true);
    result.bank_reference = json_string(reply, "reference");
    if (const auto code = json_string(reply, "code"); !code.empty()) result.response_code = code;
    result.response_message = json_string(reply, "message");

    if (result.accepted && result.bank_reference.empty()) {
        throw TransmissionError("REST submission accepted without a bank reference");
    }
    return result;
}

StatusResult RestConnector::check_status(const std::string& bank_reference) {
    const auto endpoint = http::parse_endpoint(connection_.api_url);
    auto client = http::make_client(connection_, endpoint, timeout_);
    const auto headers = http::auth_headers(connection_, *client, endpoint);

    const auto path = endpoint.path(std::format("{}/{}", submissions_path(), bank_reference));
    const auto res = client->Get(path, headers);
    if (!res) {
        throw TransmissionError(std::format("REST status check failed: {}",
                                            http::describe_error(res.error())));
    }
    if (res->status < 200 || res->status >= 300) {
        throw TransmissionError(std::format("REST status check returned HTTP {}: {}",
                                            res->status, res->body));
    }

    const auto reply = nlohmann::json::parse(res->body, nullptr, false);
    if (reply.is_discarded() || !reply.is_object()) {
        throw TransmissionError(std::format("REST status returned a non-JSON body: {}", res->body));
    }

    StatusResult status;
    status.status = parse_bank_status(json_string(reply, "status"));
    status.response_code = json_string(reply, "code");
    status.message = json_string(reply, "message");
    return status;
}

} // namespace wpsgate
