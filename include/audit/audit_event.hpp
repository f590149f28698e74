#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace wpsgate {

/**
 * @brief One audit trail entry
 *
 * `event` names what happened ("batch.assembled", "validation.run",
 * "submission.attempt", ...). `message` carries raw text (bank responses,
 * connector errors) verbatim.
 */
struct AuditEvent {
    // Assigned by AuditTrail
    uint64_t sequence_num = 0;
    std::chrono::system_clock::time_point timestamp;

    std::string event;
    std::string actor;
    std::string batch_reference;
    std::string submission_reference;
    std::string connection_name;
    std::string outcome;
    std::string message;
    std::map<std::string, std::string> details;

    // Hash chain (populated when integrity is enabled)
    std::string previous_hash;
    std::string record_hash;
};

} // namespace wpsgate
