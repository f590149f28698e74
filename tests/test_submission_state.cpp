#include <catch2/catch_test_macros.hpp>
#include "submission/submission.hpp"

using namespace wpsgate;
using S = SubmissionState;

TEST_CASE("SubmissionStateMachine: legal transitions", "[submission][state]") {
    CHECK(submission_sm::can_transition(S::DRAFT, S::SUBMITTED));
    CHECK(submission_sm::can_transition(S::SUBMITTED, S::PROCESSING));
    CHECK(submission_sm::can_transition(S::SUBMITTED, S::DRAFT));
    CHECK(submission_sm::can_transition(S::SUBMITTED, S::FAILED));
    CHECK(submission_sm::can_transition(S::PROCESSING, S::SUCCESS));
    CHECK(submission_sm::can_transition(S::PROCESSING, S::FAILED));
    CHECK(submission_sm::can_transition(S::FAILED, S::DRAFT));
    CHECK(submission_sm::can_transition(S::PROCESSING, S::CANCELLED));
}

TEST_CASE("SubmissionStateMachine: illegal transitions", "[submission][state]") {
    CHECK_FALSE(submission_sm::can_transition(S::DRAFT, S::PROCESSING));
    CHECK_FALSE(submission_sm::can_transition(S::DRAFT, S::SUCCESS));
    CHECK_FALSE(submission_sm::can_transition(S::PROCESSING, S::DRAFT));
    CHECK_FALSE(submission_sm::can_transition(S::SUCCESS, S::CANCELLED));
    CHECK_FALSE(submission_sm::can_transition(S::CANCELLED, S::DRAFT));
    CHECK_FALSE(submission_sm::can_transition(S::FAILED, S::SUCCESS));
}

TEST_CASE("Submission: transition guards", "[submission][state]") {
    Submission s;
    s.reference = "SUB/2026/0001";
    CHECK_THROWS_AS(s.transition(S::SUCCESS), StateError);

    s.transition(S::SUBMITTED);
    s.transition(S::PROCESSING);
    s.transition(S::SUCCESS);
    CHECK(s.is_terminal());
    CHECK_THROWS_AS(s.transition(S::CANCELLED), StateError);
}

TEST_CASE("Submission: retry budget bounds FAILED -> DRAFT", "[submission][state]") {
    Submission s;
    s.max_retries = 2;
    s.transition(S::SUBMITTED);
    s.transition(S::FAILED);

    s.retry_count = 1;
    CHECK_FALSE(s.is_terminal());
    CHECK(s.can_retry());
    s.transition(S::DRAFT);
    s.transition(S::SUBMITTED);
    s.transition(S::FAILED);

    s.retry_count = 2;
    CHECK(s.is_terminal());
    CHECK_FALSE(s.can_retry());
    CHECK_THROWS_AS(s.transition(S::DRAFT), StateError);
    CHECK_THROWS_AS(s.transition(S::CANCELLED), StateError);
}

TEST_CASE("Submission: processing duration needs both stamps", "[submission][state]") {
    Submission s;
    CHECK_FALSE(s.processing_duration().has_value());

    const auto start = std::chrono::system_clock::now();
    s.processing_start = start;
    s.processing_end = start + std::chrono::milliseconds(1500);
    CHECK(s.processing_duration() == std::chrono::milliseconds(1500));
}

TEST_CASE("RetryExhausted: carries the final submission", "[submission][state]") {
    Submission s;
    s.reference = "SUB/2026/0007";
    s.retry_count = 3;
    s.last_error = "E102: duplicate salary file";

    RetryExhausted error(s);
    CHECK(error.category() == ErrorCategory::RETRY_EXHAUSTED);
    CHECK(error.submission().reference == "SUB/2026/0007");
    CHECK(std::string(error.what()) ==
          "submission SUB/2026/0007 failed after 3 attempt(s): E102: duplicate salary file");
}
