#include "submission/submission_orchestrator.hpp"
#include "core/digest.hpp"
#include "core/utils.hpp"
#include "sif/sif_codec.hpp"

#include <atomic>
#include <condition_variable>
#include <exception>
#include <filesystem>
#include <format>
#include <fstream>
#include <future>
#include <optional>
#include <thread>

namespace wpsgate {

namespace {

template<typename T>
struct PendingCall {
    std::promise<T> promise;
    std::atomic<bool> abandoned{false};
};

} // anonymous namespace

/// Connector calls still running on their own threads
struct SubmissionOrchestrator::OutstandingCalls {
    std::mutex mutex;
    std::condition_variable done;
    size_t running = 0;
};

namespace {

/**
 * Run a blocking connector call on its own thread and wait at most
 * `timeout`. Returns nullopt on timeout; the call keeps running and its
 * late result is dropped. Connector exceptions are rethrown here.
 * The thread is counted in `calls` until it finishes.
 */
template<typename T, typename Fn>
std::optional<T> call_with_timeout(Fn fn, std::chrono::milliseconds timeout, std::string label,
                                   std::shared_ptr<SubmissionOrchestrator::OutstandingCalls> calls) {
    auto call = std::make_shared<PendingCall<T>>();
    auto future = call->promise.get_future();

    {
        std::lock_guard<std::mutex> lock(calls->mutex);
        ++calls->running;
    }
    std::thread([call, calls, fn = std::move(fn), label = std::move(label)]() mutable {
        try {
            call->promise.set_value(fn());
        } catch (...) {
            call->promise.set_exception(std::current_exception());
        }
        if (call->abandoned.load(std::memory_order_acquire)) {
            utils::log::warn(std::format("{}: late result after timeout discarded", label));
        }
        std::lock_guard<std::mutex> lock(calls->mutex);
        --calls->running;
        calls->done.notify_all();
    }).detach();

    if (future.wait_for(timeout) != std::future_status::ready) {
        call->abandoned.store(true, std::memory_order_release);
        return std::nullopt;
    }
    return future.get();
}

bool in_flight(SubmissionState state) {
    return state == SubmissionState::SUBMITTED || state == SubmissionState::PROCESSING;
}

} // anonymous namespace

SubmissionOrchestrator::SubmissionOrchestrator(SubmissionServices services, SubmissionConfig config)
    : services_(std::move(services)), config_(std::move(config)),
      outstanding_(std::make_shared<OutstandingCalls>()) {
    if (!services_.batches || !services_.connections || !services_.submissions ||
        !services_.validation || !services_.connectors) {
        throw ConfigError("submission orchestrator requires batch, connection and submission "
                          "stores, a validation engine and a connector factory");
    }
    if (config_.max_retries < 1) {
        throw ConfigError(std::format("max_retries must be at least 1 (got {})", config_.max_retries));
    }
}

SubmissionOrchestrator::~SubmissionOrchestrator() {
    if (!drain(config_.drain_timeout)) {
        utils::log::warn(std::format("{} connector call(s) still running at shutdown", outstanding()));
    }
}

bool SubmissionOrchestrator::drain(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(outstanding_->mutex);
    return outstanding_->done.wait_for(lock, timeout, [this] { return outstanding_->running == 0; });
}

size_t SubmissionOrchestrator::outstanding() const {
    std::lock_guard<std::mutex> lock(outstanding_->mutex);
    return outstanding_->running;
}

// ============================================================================
// submit / retry
// ============================================================================

Submission SubmissionOrchestrator::submit(const std::string& batch_reference,
                                          const std::string& connection_name,
                                          const std::string& actor,
                                          SubmissionType type) {
    const auto connection = services_.connections->get(connection_name);
    if (!connection.is_active()) {
        throw ConnectionNotActiveError(std::format(
            "connection '{}' is {}; only active connections accept submissions",
            connection_name, connection_state_to_string(connection.state())));
    }

    const auto batch = services_.batches->get(batch_reference);
    if (batch.state() == BatchState::PROCESSED || batch.state() == BatchState::CANCELLED) {
        throw StateError(std::format("batch {} is {} and cannot be submitted",
                                     batch_reference, batch_state_to_string(batch.state())));
    }

    const auto lock = pair_lock(batch_reference, connection_name);
    std::lock_guard<std::mutex> guard(*lock);
    ensure_not_in_flight(batch_reference, connection_name, "");

    // Validation gate: nothing is encoded or recorded for a blocked batch
    const auto result = services_.validation->evaluate(batch);
    if (services_.history) {
        services_.history->record(result, actor, utils::now());
    }
    audit(AuditEvent{
        .event = "validation.run",
        .actor = actor,
        .batch_reference = batch_reference,
        .connection_name = connection_name,
        .outcome = validation_status_to_string(result.status),
        .details = {{"total_checks", std::to_string(result.total_checks)},
                    {"failed", std::to_string(result.failed)},
                    {"warnings", std::to_string(result.warnings)}},
    });
    if (!result.can_submit) {
        utils::log::warn(std::format("Submission of {} to {} blocked: {} error-severity failure(s)",
                                     batch_reference, connection_name, result.failed));
        throw ValidationBlocked(result);
    }

    const auto encoded = SifCodec::encode(batch);
    services_.batches->update(batch_reference, [](WpsBatch& b) { b.mark_generated(); });
    spool(encoded.file_name, encoded.content);

    Submission submission;
    submission.reference = services_.submissions->next_reference(
        static_cast<int>(utils::today().year()));
    submission.batch_reference = batch_reference;
    submission.connection_name = connection_name;
    submission.type = type;
    submission.submitted_by = actor;
    submission.file_name = encoded.file_name;
    submission.payload = encoded.content;
    submission.payload_hash = digest::sha256_hex(encoded.content);
    submission.payload_size = encoded.content.size();
    submission.max_retries = config_.max_retries;
    submission.created_at = utils::now();
    services_.submissions->add(submission);

    utils::log::info(std::format("Submission {} created: batch {} -> {} ({} records, {} bytes, sha256 {})",
        submission.reference, batch_reference, connection_name, encoded.record_count,
        submission.payload_size, submission.payload_hash));
    audit(AuditEvent{
        .event = "submission.created",
        .actor = actor,
        .batch_reference = batch_reference,
        .submission_reference = submission.reference,
        .connection_name = connection_name,
        .details = {{"file_name", submission.file_name},
                    {"payload_hash", submission.payload_hash},
                    {"payload_size", std::to_string(submission.payload_size)},
                    {"type", submission_type_to_string(type)}},
    });

    return run_attempts(submission.reference, connection, actor);
}

Submission SubmissionOrchestrator::retry(const std::string& submission_reference,
                                         const std::string& actor) {
    const auto current = services_.submissions->get(submission_reference);
    const auto connection = services_.connections->get(current.connection_name);
    if (!connection.is_active()) {
        throw ConnectionNotActiveError(std::format(
            "connection '{}' is {}; only active connections accept submissions",
            connection.name, connection_state_to_string(connection.state())));
    }

    const auto lock = pair_lock(current.batch_reference, current.connection_name);
    std::lock_guard<std::mutex> guard(*lock);
    ensure_not_in_flight(current.batch_reference, current.connection_name, submission_reference);

    services_.submissions->update(submission_reference, [](Submission& s) {
        if (s.state() == SubmissionState::FAILED) {
            s.transition(SubmissionState::DRAFT);
        } else if (s.state() != SubmissionState::DRAFT) {
            throw StateError(std::format("submission {} is {}; only draft or failed submissions can be retried",
                                         s.reference, submission_state_to_string(s.state())));
        }
    });

    audit(AuditEvent{
        .event = "submission.retry",
        .actor = actor,
        .batch_reference = current.batch_reference,
        .submission_reference = submission_reference,
        .connection_name = current.connection_name,
        .details = {{"retry_count", std::to_string(current.retry_count)}},
    });
    return run_attempts(submission_reference, connection, actor);
}

Submission SubmissionOrchestrator::submit_and_follow(const std::string& batch_reference,
                                                     const std::string& connection_name,
                                                     const std::string& actor,
                                                     int polls,
                                                     std::chrono::milliseconds poll_interval) {
    Submission submission;
    try {
        submission = submit(batch_reference, connection_name, actor);
        while (submission.state() == SubmissionState::DRAFT) {
            std::this_thread::sleep_for(config_.retry_backoff * submission.retry_count);
            submission = retry(submission.reference, actor);
        }
    } catch (const RetryExhausted& e) {
        return e.submission();
    }

    for (int i = 0; i < polls && submission.state() == SubmissionState::PROCESSING; ++i) {
        std::this_thread::sleep_for(poll_interval);
        submission = check_status(submission.reference, actor);
    }
    return submission;
}

Submission SubmissionOrchestrator::run_attempts(const std::string& submission_reference,
                                                const BankConnection& connection,
                                                const std::string& actor) {
    for (;;) {
        const auto outcome = attempt(submission_reference, connection, actor);
        auto current = services_.submissions->get(submission_reference);

        switch (outcome) {
            case AttemptOutcome::ACCEPTED:
            case AttemptOutcome::CANCELLED:
                return current;
            case AttemptOutcome::FAILED:
                throw RetryExhausted(std::move(current));
            case AttemptOutcome::RETRYABLE:
                if (!config_.auto_retry) return current;
                break;
        }

        const auto delay = config_.retry_backoff * current.retry_count;
        utils::log::info(std::format("Submission {}: retrying in {} ms ({}/{} attempts used)",
            submission_reference, delay.count(), current.retry_count, current.max_retries));
        std::this_thread::sleep_for(delay);
    }
}

SubmissionOrchestrator::AttemptOutcome SubmissionOrchestrator::attempt(
        const std::string& submission_reference,
        const BankConnection& connection,
        const std::string& actor) {
    const auto current = services_.submissions->get(submission_reference);
    if (current.state() == SubmissionState::CANCELLED) {
        return AttemptOutcome::CANCELLED;
    }

    const auto timeout = timeout_for(connection);
    std::shared_ptr<IBankConnector> connector = services_.connectors->create(connection, timeout);

    TransmitRequest request;
    services_.batches->update(current.batch_reference, [&](WpsBatch& b) {
        // A stored payload is only resent while the batch still encodes to it
        if (digest::sha256_hex(SifCodec::encode(b).content) != current.payload_hash) {
            throw StateError(std::format("batch {} changed after submission {} was encoded; "
                                         "submit it again", b.reference(), submission_reference));
        }
        b.mark_submitted();
        request.employer_id = connection.employer_id.empty() ? b.employer_id() : connection.employer_id;
        request.routing_code = connection.routing_code.empty() ? b.employer_bank_code()
                                                               : connection.routing_code;
    });

    const bool proceed = services_.submissions->update(submission_reference, [&](Submission& s) {
        if (s.state() == SubmissionState::CANCELLED) return false;
        s.transition(SubmissionState::SUBMITTED);
        request.submission_reference = s.reference;
        request.type = s.type;
        request.file_name = s.file_name;
        request.payload = s.payload;
        request.payload_hash = s.payload_hash;
        return true;
    });
    if (!proceed) return AttemptOutcome::CANCELLED;

    const int number = static_cast<int>(current.attempts.size()) + 1;
    const auto started = utils::now();
    const auto label = std::format("{} attempt {} via {}", submission_reference, number, connector->name());

    std::optional<TransmitResult> result;
    std::string error;
    bool timed_out = false;
    try {
        result = call_with_timeout<TransmitResult>(
            [connector, request] { return connector->transmit(request); }, timeout, label,
            outstanding_);
        if (!result) {
            timed_out = true;
            error = std::format("attempt timed out after {} ms", timeout.count());
        } else if (!result->accepted) {
            error = result->response_message.empty()
                ? std::format("rejected by bank (code {})", result->response_code)
                : result->response_message;
        }
    } catch (const std::exception& e) {
        error = e.what();
    }

    const auto finished = utils::now();
    const bool accepted = result && result->accepted;

    const auto outcome = services_.submissions->update(submission_reference,
            [&](Submission& s) -> AttemptOutcome {
        if (s.state() == SubmissionState::CANCELLED) return AttemptOutcome::CANCELLED;

        s.attempts.push_back(SubmissionAttempt{
            .number = number,
            .started = started,
            .finished = finished,
            .accepted = accepted,
            .timed_out = timed_out,
            .response_code = result ? result->response_code : std::string{},
            .error = error,
        });
        if (result) {
            s.response_code = result->response_code;
            s.response_message = result->response_message;
        }

        if (accepted) {
            s.transition(SubmissionState::PROCESSING);
            s.bank_reference = result->bank_reference;
            s.processing_start = started;
            return AttemptOutcome::ACCEPTED;
        }

        ++s.retry_count;
        s.last_error = error;
        if (s.retry_count < s.max_retries) {
            s.transition(SubmissionState::DRAFT);
            return AttemptOutcome::RETRYABLE;
        }
        s.transition(SubmissionState::FAILED);
        s.processing_end = finished;
        return AttemptOutcome::FAILED;
    });

    AuditEvent event{
        .event = "submission.attempt",
        .actor = actor,
        .batch_reference = current.batch_reference,
        .submission_reference = submission_reference,
        .connection_name = connection.name,
        .message = error,
        .details = {{"attempt", std::to_string(number)},
                    {"timed_out", utils::booltostr(timed_out)}},
    };

    switch (outcome) {
        case AttemptOutcome::ACCEPTED:
            utils::log::info(std::format("{}: accepted, bank reference {}",
                                         label, result->bank_reference));
            event.outcome = "accepted";
            event.details["bank_reference"] = result->bank_reference;
            break;
        case AttemptOutcome::RETRYABLE:
            utils::log::warn(std::format("{} failed: {}", label, error));
            event.outcome = "retryable";
            break;
        case AttemptOutcome::FAILED:
            utils::log::error(std::format("{} failed, retries exhausted: {}", label, error));
            event.outcome = "failed";
            reject_batch(current.batch_reference, submission_reference);
            break;
        case AttemptOutcome::CANCELLED:
            utils::log::warn(std::format("{}: submission was cancelled mid-flight; result discarded "
                                         "(accepted={}, error='{}')", label, utils::booltostr(accepted), error));
            event.outcome = "discarded";
            break;
    }
    if (result) event.details["response_code"] = result->response_code;
    audit(std::move(event));
    return outcome;
}

// ============================================================================
// Status polling / settlement
// ============================================================================

Submission SubmissionOrchestrator::check_status(const std::string& submission_reference,
                                                const std::string& actor) {
    auto current = services_.submissions->get(submission_reference);
    if (current.state() != SubmissionState::PROCESSING) {
        utils::log::debug(std::format("Submission {} is {}; nothing to poll", submission_reference,
                                      submission_state_to_string(current.state())));
        return current;
    }

    const auto connection = services_.connections->get(current.connection_name);
    const auto timeout = timeout_for(connection);

    std::optional<StatusResult> status;
    std::string error;
    try {
        std::shared_ptr<IBankConnector> connector = services_.connectors->create(connection, timeout);
        const auto bank_reference = current.bank_reference;
        status = call_with_timeout<StatusResult>(
            [connector, bank_reference] { return connector->check_status(bank_reference); },
            timeout, std::format("{} status poll", submission_reference), outstanding_);
        if (!status) error = std::format("status poll timed out after {} ms", timeout.count());
    } catch (const std::exception& e) {
        error = e.what();
    }

    if (!status) {
        // Transient: stays in processing, next poll tries again
        utils::log::warn(std::format("Status of {} unavailable: {}", submission_reference, error));
        audit(AuditEvent{
            .event = "submission.status",
            .actor = actor,
            .batch_reference = current.batch_reference,
            .submission_reference = submission_reference,
            .connection_name = current.connection_name,
            .outcome = "unreachable",
            .message = error,
        });
        return current;
    }

    audit(AuditEvent{
        .event = "submission.status",
        .actor = actor,
        .batch_reference = current.batch_reference,
        .submission_reference = submission_reference,
        .connection_name = current.connection_name,
        .outcome = bank_status_to_string(status->status),
        .message = status->message,
        .details = {{"response_code", status->response_code}},
    });

    switch (status->status) {
        case BankStatus::PENDING:
            return services_.submissions->get(submission_reference);
        case BankStatus::SUCCESS:
            return settle(submission_reference, true, status->response_code, status->message, "", actor);
        case BankStatus::FAILED:
            return settle(submission_reference, false, status->response_code, status->message, "", actor);
    }
    return services_.submissions->get(submission_reference);
}

Submission SubmissionOrchestrator::record_manual_outcome(const std::string& submission_reference,
                                                         bool success,
                                                         const std::string& bank_reference,
                                                         const std::string& message,
                                                         const std::string& actor) {
    const auto current = services_.submissions->get(submission_reference);
    const auto connection = services_.connections->get(current.connection_name);
    if (connection.protocol != Protocol::MANUAL) {
        throw StateError(std::format("submission {} went through {} connection '{}'; "
                                     "only manual submissions take a recorded outcome",
                                     submission_reference, protocol_to_string(connection.protocol),
                                     connection.name));
    }
    if (current.state() != SubmissionState::PROCESSING) {
        throw StateError(std::format("submission {} is {}; no outcome is pending",
                                     submission_reference, submission_state_to_string(current.state())));
    }
    return settle(submission_reference, success, success ? "MANUAL_OK" : "MANUAL_REJECTED",
                  message, bank_reference, actor);
}

Submission SubmissionOrchestrator::settle(const std::string& submission_reference, bool success,
                                          const std::string& response_code,
                                          const std::string& message,
                                          const std::string& bank_reference,
                                          const std::string& actor) {
    bool applied = false;
    auto settled = services_.submissions->update(submission_reference, [&](Submission& s) {
        if (s.state() == SubmissionState::PROCESSING) {
            s.transition(success ? SubmissionState::SUCCESS : SubmissionState::FAILED);
            s.processing_end = utils::now();
            s.response_code = response_code;
            s.response_message = message;
            if (!bank_reference.empty()) s.bank_reference = bank_reference;
            if (!success) s.last_error = message;
            applied = true;
        }
        return s;
    });
    if (!applied) return settled;

    std::optional<WpsBatch> batch;
    if (success) {
        services_.batches->update(settled.batch_reference, [&](WpsBatch& b) {
            if (b.state() != BatchState::SUBMITTED) {
                utils::log::warn(std::format("Batch {} is {}; bank outcome of {} not applied to it",
                    b.reference(), batch_state_to_string(b.state()), submission_reference));
                return;
            }
            b.mark_processed();
            batch = b;
        });
    } else {
        reject_batch(settled.batch_reference, submission_reference);
    }

    if (success) {
        utils::log::info(std::format("Submission {} succeeded ({} ms processing)", submission_reference,
            settled.processing_duration().value_or(std::chrono::milliseconds{0}).count()));
        if (batch && services_.compliance) {
            const auto record = services_.compliance->record_processed(*batch);
            audit(AuditEvent{
                .event = "compliance.recorded",
                .actor = actor,
                .batch_reference = settled.batch_reference,
                .outcome = compliance_status_to_string(record.status()),
                .details = {{"compliance_rate", std::format("{:.2f}", record.compliance_rate())},
                            {"employees_paid_wps", std::to_string(record.employees_paid_wps)},
                            {"total_employees", std::to_string(record.total_employees)}},
            });
        }
    } else {
        utils::log::error(std::format("Submission {} rejected by bank: {}", submission_reference, message));
    }

    audit(AuditEvent{
        .event = "submission.settled",
        .actor = actor,
        .batch_reference = settled.batch_reference,
        .submission_reference = submission_reference,
        .connection_name = settled.connection_name,
        .outcome = submission_state_to_string(settled.state()),
        .message = message,
        .details = {{"response_code", response_code}},
    });
    return settled;
}

Submission SubmissionOrchestrator::cancel(const std::string& submission_reference,
                                          const std::string& actor) {
    const auto cancelled = services_.submissions->update(submission_reference, [](Submission& s) {
        if (s.is_terminal()) {
            throw StateError(std::format("submission {} is {} and cannot be cancelled",
                                         s.reference, submission_state_to_string(s.state())));
        }
        s.transition(SubmissionState::CANCELLED);
        s.processing_end = utils::now();
        return s;
    });

    utils::log::info(std::format("Submission {} cancelled by {}", submission_reference, actor));
    audit(AuditEvent{
        .event = "submission.cancelled",
        .actor = actor,
        .batch_reference = cancelled.batch_reference,
        .submission_reference = submission_reference,
        .connection_name = cancelled.connection_name,
        .outcome = "cancelled",
    });
    return cancelled;
}

// ============================================================================
// Helpers
// ============================================================================

std::chrono::milliseconds SubmissionOrchestrator::timeout_for(const BankConnection& connection) const {
    return connection.attempt_timeout.value_or(config_.attempt_timeout);
}

std::shared_ptr<std::mutex> SubmissionOrchestrator::pair_lock(const std::string& batch_reference,
                                                              const std::string& connection_name) {
    std::lock_guard<std::mutex> lock(pair_locks_mutex_);
    auto& slot = pair_locks_[{batch_reference, connection_name}];
    if (!slot) slot = std::make_shared<std::mutex>();
    return slot;
}

void SubmissionOrchestrator::ensure_not_in_flight(const std::string& batch_reference,
                                                  const std::string& connection_name,
                                                  const std::string& except_reference) const {
    for (const auto& s : services_.submissions->by_batch(batch_reference)) {
        if (s.connection_name == connection_name && s.reference != except_reference &&
            in_flight(s.state())) {
            throw StateError(std::format("batch {} already has submission {} in flight on '{}' ({})",
                batch_reference, s.reference, connection_name, submission_state_to_string(s.state())));
        }
    }
}

void SubmissionOrchestrator::reject_batch(const std::string& batch_reference,
                                          const std::string& failed_reference) {
    services_.batches->update(batch_reference, [&](WpsBatch& b) {
        if (b.state() != BatchState::SUBMITTED) return;
        // Another connection may still deliver this batch
        for (const auto& s : services_.submissions->by_batch(batch_reference)) {
            if (s.reference == failed_reference) continue;
            if (in_flight(s.state()) || s.state() == SubmissionState::SUCCESS) {
                utils::log::info(std::format("Batch {} stays submitted: {} on '{}' is {}",
                    batch_reference, s.reference, s.connection_name, submission_state_to_string(s.state())));
                return;
            }
        }
        b.mark_rejected();
    });
}

void SubmissionOrchestrator::spool(const std::string& file_name, const std::string& content) const {
    if (config_.spool_dir.empty()) return;

    std::error_code ec;
    std::filesystem::create_directories(config_.spool_dir, ec);
    const auto path = std::filesystem::path(config_.spool_dir) / file_name;

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
    if (!out) {
        utils::log::warn(std::format("Could not write spool copy {}", path.string()));
        return;
    }
    utils::log::debug(std::format("Spooled {} ({} bytes)", path.string(), content.size()));
}

void SubmissionOrchestrator::audit(AuditEvent event) const {
    if (services_.audit) services_.audit->record(std::move(event));
}

} // namespace wpsgate
