#pragma once

#include "audit/audit_trail.hpp"
#include "compliance/compliance_ledger.hpp"
#include "store/repositories.hpp"
#include "submission/connector_factory.hpp"
#include "submission/submission.hpp"
#include "validation/validation_engine.hpp"
#include "validation/validation_report.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace wpsgate {

struct SubmissionConfig {
    int max_retries = 3;
    std::chrono::milliseconds attempt_timeout{30000};
    bool auto_retry = false;                        // re-attempt drafts left by a failure
    std::chrono::milliseconds retry_backoff{1000};  // x attempt number
    std::string spool_dir;                          // copy of every encoded file, if set
    std::chrono::milliseconds drain_timeout{5000};  // wait for running connector calls on destruction
};

/**
 * @brief Everything the orchestrator reads or writes
 *
 * compliance, audit and history are optional.
 */
struct SubmissionServices {
    std::shared_ptr<BatchRepository> batches;
    std::shared_ptr<ConnectionRepository> connections;
    std::shared_ptr<SubmissionRepository> submissions;
    std::shared_ptr<const ValidationEngine> validation;
    std::shared_ptr<const ConnectorFactory> connectors;
    std::shared_ptr<ComplianceLedger> compliance;
    std::shared_ptr<AuditTrail> audit;
    std::shared_ptr<ValidationHistory> history;
};

/**
 * @brief Drives a batch from validation to bank acknowledgement
 *
 * submit(): active connection -> validation gate -> SIF encode -> SHA-256
 * -> transmit (bounded by a timeout) -> processing | draft | failed.
 *
 * At most one submission per (batch, connection) is in flight; attempts for
 * the same pair are serialized, different connections run independently.
 * Cancellation is cooperative: a connector call already in progress is
 * allowed to finish and its result is discarded.
 *
 * A batch shared by several connections is rejected only when none of its
 * other submissions is in flight or successful.
 */
class SubmissionOrchestrator {
public:
    struct OutstandingCalls;

    SubmissionOrchestrator(SubmissionServices services, SubmissionConfig config);

    /// Waits up to drain_timeout for connector calls that outlived their timeout
    ~SubmissionOrchestrator();

    SubmissionOrchestrator(const SubmissionOrchestrator&) = delete;
    SubmissionOrchestrator& operator=(const SubmissionOrchestrator&) = delete;

    /**
     * @throws NotFoundError unknown batch or connection
     * @throws ConnectionNotActiveError connection is not active
     * @throws ValidationBlocked error-severity rule failures (no record created)
     * @throws FormatError batch cannot be encoded (no record created)
     * @throws StateError batch frozen/cancelled or already in flight on this connection
     * @throws RetryExhausted the last permitted attempt failed
     */
    Submission submit(const std::string& batch_reference,
                      const std::string& connection_name,
                      const std::string& actor,
                      SubmissionType type = SubmissionType::NEW);

    /**
     * Submit and re-attempt until the bank accepts or the retry budget is
     * spent, then poll up to `polls` times while the bank is processing.
     * An exhausted budget comes back as the FAILED record instead of RetryExhausted.
     */
    Submission submit_and_follow(const std::string& batch_reference,
                                 const std::string& connection_name,
                                 const std::string& actor,
                                 int polls,
                                 std::chrono::milliseconds poll_interval);

    /// Re-attempt a draft (or a failed record with retries left); reuses the stored payload
    /// @throws StateError if the batch no longer encodes to that payload
    Submission retry(const std::string& submission_reference, const std::string& actor);

    /// Poll the bank. Unreachable bank: record stays in processing.
    Submission check_status(const std::string& submission_reference, const std::string& actor);

    /// @throws StateError if the submission is terminal
    Submission cancel(const std::string& submission_reference, const std::string& actor);

    /// Settle a manual-portal submission
    /// @throws StateError if it is not a manual submission awaiting an outcome
    Submission record_manual_outcome(const std::string& submission_reference,
                                     bool success,
                                     const std::string& bank_reference,
                                     const std::string& message,
                                     const std::string& actor);

    /// Wait for connector calls still running after a timeout
    /// @return false if some are still running when `timeout` elapses
    bool drain(std::chrono::milliseconds timeout);

    [[nodiscard]] size_t outstanding() const;

    [[nodiscard]] const SubmissionConfig& config() const { return config_; }

private:
    enum class AttemptOutcome { ACCEPTED, RETRYABLE, FAILED, CANCELLED };

    Submission run_attempts(const std::string& submission_reference,
                            const BankConnection& connection,
                            const std::string& actor);
    AttemptOutcome attempt(const std::string& submission_reference,
                           const BankConnection& connection,
                           const std::string& actor);

    /// Apply a final bank verdict to a processing submission and its batch
    Submission settle(const std::string& submission_reference, bool success,
                      const std::string& response_code, const std::string& message,
                      const std::string& bank_reference, const std::string& actor);

    /// Mark the batch rejected unless a sibling submission may still deliver it
    void reject_batch(const std::string& batch_reference, const std::string& failed_reference);

    [[nodiscard]] std::chrono::milliseconds timeout_for(const BankConnection& connection) const;
    [[nodiscard]] std::shared_ptr<std::mutex> pair_lock(const std::string& batch_reference,
                                                        const std::string& connection_name);
    void ensure_not_in_flight(const std::string& batch_reference,
                              const std::string& connection_name,
                              const std::string& except_reference) const;
    void spool(const std::string& file_name, const std::string& content) const;
    void audit(AuditEvent event) const;

    SubmissionServices services_;
    SubmissionConfig config_;

    std::map<std::pair<std::string, std::string>, std::shared_ptr<std::mutex>> pair_locks_;
    std::mutex pair_locks_mutex_;

    std::shared_ptr<OutstandingCalls> outstanding_;
};

} // namespace wpsgate
