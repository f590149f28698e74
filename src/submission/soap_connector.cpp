#include "submission/soap_connector.hpp"
#include "submission/http_support.hpp"
#include "core/base64.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>

namespace wpsgate {

namespace {

constexpr std::string_view kSoapNs = "http://schemas.xmlsoap.org/soap/envelope/";
constexpr std::string_view kWpsNs = "urn:uae:wps:submission";
constexpr std::string_view kAccepted = "0";

std::string xml_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (const char c : text) {
        switch (c) {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default:   out += c; break;
        }
    }
    return out;
}

std::string xml_unescape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '&') {
            out += text[i];
            continue;
        }
        const auto semi = text.find(';', i);
        if (semi == std::string_view::npos) {
            out += text.substr(i);
            break;
        }
        const auto entity = text.substr(i + 1, semi - i - 1);
        if (entity == "amp") out += '&';
        else if (entity == "lt") out += '<';
        else if (entity == "gt") out += '>';
        else if (entity == "quot") out += '"';
        else if (entity == "apos") out += '\'';
        else out += text.substr(i, semi - i + 1);
        i = semi;
    }
    return out;
}

std::string security_header(const BankConnection& connection) {
    switch (connection.auth_method) {
        case AuthMethod::API_KEY:
            return std::format("<wps:ApiKey>{}</wps:ApiKey>", xml_escape(connection.api_key));
        case AuthMethod::BASIC:
            return std::format("<wps:Username>{}</wps:Username><wps:Password>{}</wps:Password>",
                               xml_escape(connection.username), xml_escape(connection.password));
        case AuthMethod::OAUTH2:
        case AuthMethod::CERTIFICATE:
            // Carried at the transport level
            return {};
    }
    return {};
}

std::string envelope(const BankConnection& connection, const std::string& body) {
    return std::format(
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
        "<soapenv:Envelope xmlns:soapenv=\"{}\" xmlns:wps=\"{}\">"
        "<soapenv:Header><wps:Security>{}</wps:Security></soapenv:Header>"
        "<soapenv:Body>{}</soapenv:Body>"
        "</soapenv:Envelope>",
        kSoapNs, kWpsNs, security_header(connection), body);
}

BankStatus parse_bank_status(const std::string& status) {
    const auto lower = utils::to_lower(status);
    if (lower == "success" || lower == "processed" || lower == "completed") return BankStatus::SUCCESS;
    if (lower == "failed" || lower == "rejected") return BankStatus::FAILED;
    return BankStatus::PENDING;
}

} // anonymous namespace

SoapConnector::SoapConnector(BankConnection connection, std::chrono::milliseconds timeout)
    : connection_(std::move(connection)), timeout_(timeout) {}

std::string SoapConnector::build_submit_envelope(const BankConnection& connection,
                                                 const TransmitRequest& request) {
    const auto body = std::format(
        "<wps:SubmitSalaryFile>"
        "<wps:SubmissionReference>{}</wps:SubmissionReference>"
        "<wps:SubmissionType>{}</wps:SubmissionType>"
        "<wps:EmployerId>{}</wps:EmployerId>"
        "<wps:RoutingCode>{}</wps:RoutingCode>"
        "<wps:FileName>{}</wps:FileName>"
        "<wps:FileContent>{}</wps:FileContent>"
        "<wps:FileHash>{}</wps:FileHash>"
        "</wps:SubmitSalaryFile>",
        xml_escape(request.submission_reference),
        submission_type_to_string(request.type),
        xml_escape(request.employer_id),
        xml_escape(request.routing_code),
        xml_escape(request.file_name),
        base64::encode(request.payload),
        request.payload_hash);
    return envelope(connection, body);
}

std::string SoapConnector::build_status_envelope(const BankConnection& connection,
                                                 const std::string& bank_reference) {
    return envelope(connection, std::format(
        "<wps:GetSubmissionStatus><wps:Reference>{}</wps:Reference></wps:GetSubmissionStatus>",
        xml_escape(bank_reference)));
}

std::optional<std::string> SoapConnector::element_text(std::string_view xml,
                                                       std::string_view local_name) {
    size_t pos = 0;
    while ((pos = xml.find('<', pos)) != std::string_view::npos) {
        const auto close = xml.find('>', pos);
        if (close == std::string_view::npos) return std::nullopt;

        auto tag = xml.substr(pos + 1, close - pos - 1);
        if (tag.empty() || tag.front() == '/' || tag.front() == '?' || tag.front() == '!') {
            pos = close + 1;
            continue;
        }
        const auto space = tag.find_first_of(" \t\r\n/");
        const bool self_closing = tag.ends_with('/');
        auto qualified = tag.substr(0, space);
        const auto colon = qualified.find(':');
        const auto local = colon == std::string_view::npos ? qualified : qualified.substr(colon + 1);

        if (local == local_name) {
            if (self_closing) return std::string{};
            const auto end = xml.find("</", close + 1);
            if (end == std::string_view::npos) return std::nullopt;
            return xml_unescape(xml.substr(close + 1, end - close - 1));
        }
        pos = close + 1;
    }
    return std::nullopt;
}

std::string SoapConnector::post(const std::string& action, const std::string& body) {
    const auto endpoint = http::parse_endpoint(connection_.api_url);
    auto client = http::make_client(connection_, endpoint, timeout_);
    auto headers = http::auth_headers(connection_, *client, endpoint);
    headers.emplace("SOAPAction", std::format("\"{}#{}\"", kWpsNs, action));

    const auto res = client->Post(endpoint.path("/"), headers, body, http::kSoapContentType);
    if (!res) {
        throw TransmissionError(std::format("SOAP {} to {} failed: {}", action,
                                            connection_.api_url, http::describe_error(res.error())));
    }
    // SOAP faults arrive as HTTP 500 with a Fault body
    if ((res->status < 200 || res->status >= 300) && !element_text(res->body, "Fault")) {
        throw TransmissionError(std::format("SOAP {} returned HTTP {}: {}", action,
                                            res->status, res->body));
    }
    return res->body;
}

TransmitResult SoapConnector::transmit(const TransmitRequest& request) {
    const auto reply = post("SubmitSalaryFile", build_submit_envelope(connection_, request));

    TransmitResult result;
    if (element_text(reply, "Fault")) {
        result.accepted = false;
        result.response_code = element_text(reply, "faultcode").value_or("Fault");
        result.response_message = element_text(reply, "faultstring").value_or(reply);
        return result;
    }

    const auto code = element_text(reply, "ResponseCode");
    if (!code) {
        throw TransmissionError(std::format("SOAP response has no ResponseCode: {}", reply));
    }
    result.response_code = *code;
    result.accepted = *code == kAccepted;
    result.bank_reference = element_text(reply, "Reference").value_or("");
    result.response_message = element_text(reply, "Message").value_or("");
    return result;
}

StatusResult SoapConnector::check_status(const std::string& bank_reference) {
    const auto reply = post("GetSubmissionStatus", build_status_envelope(connection_, bank_reference));
    if (element_text(reply, "Fault")) {
        throw TransmissionError(std::format("SOAP status fault: {}",
                                            element_text(reply, "faultstring").value_or(reply)));
    }

    StatusResult status;
    status.status = parse_bank_status(element_text(reply, "Status").value_or(""));
    status.response_code = element_text(reply, "ResponseCode").value_or("");
    status.message = element_text(reply, "Message").value_or("");
    return status;
}

} // namespace wpsgate
