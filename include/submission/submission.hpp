#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace wpsgate {

// ============================================================================
// Submission state machine
// ============================================================================

namespace submission_sm {

// SUCCESS and CANCELLED are always final; FAILED is final once the retry
// budget is spent (see Submission::is_terminal).
[[nodiscard]] constexpr bool is_final(SubmissionState s) noexcept {
    return s == SubmissionState::SUCCESS || s == SubmissionState::CANCELLED;
}

[[nodiscard]] constexpr bool can_transition(SubmissionState from, SubmissionState to) noexcept {
    using S = SubmissionState;
    if (is_final(from)) return false;
    if (to == S::CANCELLED) return true;
    switch (from) {
        case S::DRAFT:      return to == S::SUBMITTED;
        case S::SUBMITTED:  return to == S::PROCESSING || to == S::DRAFT || to == S::FAILED;
        case S::PROCESSING: return to == S::SUCCESS || to == S::FAILED;
        case S::FAILED:     return to == S::DRAFT;
        default:            return false;
    }
}

} // namespace submission_sm

/**
 * @brief One transmission attempt; the raw connector error is kept verbatim
 */
struct SubmissionAttempt {
    int number = 0;
    std::chrono::system_clock::time_point started;
    std::chrono::system_clock::time_point finished;
    bool accepted = false;
    bool timed_out = false;
    std::string response_code;
    std::string error;
};

/**
 * @brief Tracks one encoded batch sent to one bank connection
 *
 * References (never owns) its batch and connection by key. Lifecycle:
 *   DRAFT -> SUBMITTED -> PROCESSING -> SUCCESS | FAILED
 *   SUBMITTED -> DRAFT        failed attempt, retries left
 *   SUBMITTED -> FAILED       failed attempt, retries exhausted
 *   FAILED -> DRAFT           only while retry_count < max_retries
 *   any non-terminal -> CANCELLED
 */
class Submission {
public:
    std::string reference;
    std::string batch_reference;
    std::string connection_name;
    SubmissionType type = SubmissionType::NEW;
    std::string submitted_by;

    // Encoded payload (tamper evidence: SHA-256 + byte length)
    std::string file_name;
    std::string payload;
    std::string payload_hash;
    size_t payload_size = 0;

    // Bank response
    std::string bank_reference;
    std::string response_code;
    std::string response_message;

    int retry_count = 0;
    int max_retries = 3;
    std::string last_error;

    std::chrono::system_clock::time_point created_at;
    std::optional<std::chrono::system_clock::time_point> processing_start;
    std::optional<std::chrono::system_clock::time_point> processing_end;

    std::vector<SubmissionAttempt> attempts;

    [[nodiscard]] SubmissionState state() const { return state_; }

    /// SUCCESS, CANCELLED, or FAILED with no retries left
    [[nodiscard]] bool is_terminal() const;

    [[nodiscard]] bool can_retry() const {
        return state_ == SubmissionState::DRAFT ||
               (state_ == SubmissionState::FAILED && retry_count < max_retries);
    }

    /// @throws StateError on an illegal transition
    void transition(SubmissionState to);

    [[nodiscard]] std::optional<std::chrono::milliseconds> processing_duration() const;

private:
    SubmissionState state_ = SubmissionState::DRAFT;
};

/// Submission permanently failed after max attempts; carries the final record
class RetryExhausted : public WpsError {
public:
    explicit RetryExhausted(Submission submission);

    [[nodiscard]] const Submission& submission() const { return submission_; }

private:
    Submission submission_;
};

} // namespace wpsgate
