#include "submission/submission.hpp"

#include <format>

namespace wpsgate {

bool Submission::is_terminal() const {
    if (submission_sm::is_final(state_)) return true;
    return state_ == SubmissionState::FAILED && retry_count >= max_retries;
}

void Submission::transition(SubmissionState to) {
    if (!submission_sm::can_transition(state_, to)) {
        throw StateError(std::format("submission {}: illegal transition {} -> {}",
            reference, submission_state_to_string(state_), submission_state_to_string(to)));
    }
    if (state_ == SubmissionState::FAILED && to == SubmissionState::CANCELLED &&
        retry_count >= max_retries) {
        throw StateError(std::format("submission {} has failed permanently", reference));
    }
    if (state_ == SubmissionState::FAILED && to == SubmissionState::DRAFT &&
        retry_count >= max_retries) {
        throw StateError(std::format("submission {} has exhausted its {} retries",
                                     reference, max_retries));
    }
    state_ = to;
}

std::optional<std::chrono::milliseconds> Submission::processing_duration() const {
    if (!processing_start || !processing_end) return std::nullopt;
    return std::chrono::duration_cast<std::chrono::milliseconds>(*processing_end - *processing_start);
}

RetryExhausted::RetryExhausted(Submission submission)
    : WpsError(ErrorCategory::RETRY_EXHAUSTED,
               std::format("submission {} failed after {} attempt(s): {}",
                           submission.reference, submission.retry_count, submission.last_error)),
      submission_(std::move(submission)) {}

} // namespace wpsgate
