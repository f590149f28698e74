#pragma once

#include "core/types.hpp"

#include <string>

namespace wpsgate {

/**
 * @brief What a connector is asked to deliver
 */
struct TransmitRequest {
    std::string submission_reference;
    SubmissionType type = SubmissionType::NEW;
    std::string file_name;
    std::string payload;
    std::string payload_hash;
    std::string employer_id;
    std::string routing_code;
};

struct TransmitResult {
    bool accepted = false;
    std::string bank_reference;
    std::string response_code;
    std::string response_message;
};

enum class BankStatus {
    PENDING,
    SUCCESS,
    FAILED
};

inline const char* bank_status_to_string(BankStatus status) {
    switch (status) {
        case BankStatus::PENDING: return "pending";
        case BankStatus::SUCCESS: return "success";
        case BankStatus::FAILED:  return "failed";
    }
    return "pending";
}

struct StatusResult {
    BankStatus status = BankStatus::PENDING;
    std::string response_code;
    std::string message;
};

/**
 * @brief Protocol-specific bank adapter
 *
 * transmit() reports a bank-side rejection as accepted=false and throws
 * TransmissionError for I/O or protocol failures. check_status() is
 * idempotent and safe to poll; it throws TransmissionError when the bank
 * cannot be reached.
 */
class IBankConnector {
public:
    virtual ~IBankConnector() = default;

    [[nodiscard]] virtual TransmitResult transmit(const TransmitRequest& request) = 0;
    [[nodiscard]] virtual StatusResult check_status(const std::string& bank_reference) = 0;
    [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace wpsgate
