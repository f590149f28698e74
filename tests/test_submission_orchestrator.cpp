#include <catch2/catch_test_macros.hpp>
#include "audit/memory_sink.hpp"
#include "core/digest.hpp"
#include "sif/sif_codec.hpp"
#include "submission/submission_orchestrator.hpp"
#include "mocks/batch_fixtures.hpp"
#include "mocks/mock_connector.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <future>
#include <sstream>
#include <thread>

using namespace wpsgate;
using wpsgate::testing::MockConnector;
using wpsgate::testing::make_batch;
using wpsgate::testing::make_line;

namespace {

using Step = MockConnector::Step;

std::vector<ValidationRule> gate_rules() {
    return {
        testing::derived_rule("EDR_NOT_EMPTY", "non_empty_batch", Severity::ERROR, RuleScope::FILE),
        testing::derived_rule("SDR_NET_RECONCILES", "net_salary_reconciliation"),
        testing::derived_rule("SDR_EMIRATES_ID", "emirates_id_checksum", Severity::WARNING),
    };
}

BankConnection rest_connection(const std::string& name) {
    BankConnection c;
    c.name = name;
    c.bank_code = "ENBD";
    c.protocol = Protocol::REST;
    c.api_url = "https://wps.example-bank.ae/api";
    c.api_key = "test-key";
    c.activate();
    return c;
}

/// In-memory stores, a scripted REST connector and an audit trail in memory
struct Harness {
    std::shared_ptr<BatchRepository> batches = std::make_shared<BatchRepository>();
    std::shared_ptr<ConnectionRepository> connections = std::make_shared<ConnectionRepository>();
    std::shared_ptr<SubmissionRepository> submissions = std::make_shared<SubmissionRepository>();
    std::shared_ptr<InMemoryRuleRepository> rules;
    std::shared_ptr<ComplianceLedger> ledger = std::make_shared<ComplianceLedger>();
    std::shared_ptr<ValidationHistory> history = std::make_shared<ValidationHistory>();
    std::shared_ptr<AuditTrail> audit = std::make_shared<AuditTrail>(AuditConfig{});
    std::shared_ptr<MemorySink> audit_lines = std::make_shared<MemorySink>();
    std::shared_ptr<MockConnector::Script> script = std::make_shared<MockConnector::Script>();
    std::shared_ptr<ConnectorFactory> factory = std::make_shared<ConnectorFactory>();
    std::string batch_ref;

    explicit Harness(std::vector<ValidationRule> rule_set = gate_rules(),
                     WpsBatch batch = make_batch())
        : rules(std::make_shared<InMemoryRuleRepository>(std::move(rule_set))) {
        audit->add_sink(audit_lines);
        factory->register_creator(Protocol::REST,
            [script = script](const BankConnection&, std::chrono::milliseconds) {
                return std::make_unique<MockConnector>(script);
            });

        connections->add(rest_connection("enbd-rest"));

        BankConnection draft;
        draft.name = "fab-sftp";
        draft.protocol = Protocol::SFTP;
        connections->add(draft);

        BankConnection manual;
        manual.name = "mohre-portal";
        manual.protocol = Protocol::MANUAL;
        manual.portal_url = "https://portal.mohre.gov.ae";
        manual.activate();
        connections->add(manual);

        batch_ref = batches->add(std::move(batch));
    }

    SubmissionOrchestrator orchestrator(SubmissionConfig config = {}) {
        if (config.attempt_timeout == std::chrono::milliseconds{30000}) {
            config.attempt_timeout = std::chrono::milliseconds{2000};
        }
        SubmissionServices services;
        services.batches = batches;
        services.connections = connections;
        services.submissions = submissions;
        services.validation = std::make_shared<const ValidationEngine>(
            rules, DerivedCheckRegistry::with_builtins(), std::make_shared<InMemoryReferenceData>());
        services.connectors = factory;
        services.compliance = ledger;
        services.audit = audit;
        services.history = history;
        return SubmissionOrchestrator(std::move(services), config);
    }

    void script_steps(std::initializer_list<Step> steps) { script->steps = steps; }

    std::vector<std::string> audit_events() const {
        std::vector<std::string> events;
        for (const auto& line : audit_lines->lines()) {
            events.push_back(nlohmann::json::parse(line)["event"].get<std::string>());
        }
        return events;
    }

    bool audited(const std::string& event, const std::string& outcome) const {
        for (const auto& line : audit_lines->lines()) {
            const auto j = nlohmann::json::parse(line);
            if (j["event"] == event && j.value("outcome", "") == outcome) return true;
        }
        return false;
    }
};

} // namespace

// ============================================================================
// Gatekeeping
// ============================================================================

TEST_CASE("Orchestrator: inactive connection is refused before anything is recorded", "[orchestrator]") {
    Harness h;
    auto orchestrator = h.orchestrator();

    CHECK_THROWS_AS(orchestrator.submit(h.batch_ref, "fab-sftp", "alice"), ConnectionNotActiveError);
    CHECK(h.submissions->size() == 0);
    CHECK(h.script->transmit_calls == 0);
    CHECK(h.batches->get(h.batch_ref).state() == BatchState::DRAFT);
}

TEST_CASE("Orchestrator: unknown batch or connection", "[orchestrator]") {
    Harness h;
    auto orchestrator = h.orchestrator();
    CHECK_THROWS_AS(orchestrator.submit("WPS/2026/09/9999", "enbd-rest", "alice"), NotFoundError);
    CHECK_THROWS_AS(orchestrator.submit(h.batch_ref, "nope", "alice"), NotFoundError);
}

TEST_CASE("Orchestrator: error-severity failure blocks submission", "[orchestrator]") {
    auto line = make_line();
    line.net_salary = 6000.0;
    Harness h(gate_rules(), make_batch({line}));
    auto orchestrator = h.orchestrator();

    try {
        (void)orchestrator.submit(h.batch_ref, "enbd-rest", "alice");
        FAIL("expected ValidationBlocked");
    } catch (const ValidationBlocked& e) {
        CHECK(e.result().failed == 1);
        CHECK_FALSE(e.result().can_submit);
    }
    CHECK(h.submissions->size() == 0);
    CHECK(h.script->transmit_calls == 0);
    CHECK(h.batches->get(h.batch_ref).state() == BatchState::DRAFT);

    REQUIRE(h.history->latest(h.batch_ref).has_value());
    CHECK(h.history->latest(h.batch_ref)->actor == "alice");
    CHECK(h.audited("validation.run", "invalid"));
}

TEST_CASE("Orchestrator: warning-only failures still submit", "[orchestrator]") {
    Harness h(gate_rules(), make_batch({make_line("784199012345677")}));
    auto orchestrator = h.orchestrator();

    auto submission = orchestrator.submit(h.batch_ref, "enbd-rest", "alice");
    CHECK(submission.state() == SubmissionState::PROCESSING);
    CHECK(h.audited("validation.run", "warning"));
}

TEST_CASE("Orchestrator: encoding failure creates no record", "[orchestrator]") {
    auto line = make_line();
    line.net_salary = 6750.005;
    Harness h({testing::derived_rule("EDR_NOT_EMPTY", "non_empty_batch", Severity::ERROR, RuleScope::FILE)},
              make_batch({line}));
    auto orchestrator = h.orchestrator();

    CHECK_THROWS_AS(orchestrator.submit(h.batch_ref, "enbd-rest", "alice"), FormatError);
    CHECK(h.submissions->size() == 0);
    CHECK(h.script->transmit_calls == 0);
}

TEST_CASE("Orchestrator: frozen or cancelled batch cannot be submitted", "[orchestrator]") {
    Harness h;
    h.batches->update(h.batch_ref, [](WpsBatch& b) { b.cancel(); });
    auto orchestrator = h.orchestrator();
    CHECK_THROWS_AS(orchestrator.submit(h.batch_ref, "enbd-rest", "alice"), StateError);
}

// ============================================================================
// Transmission
// ============================================================================

TEST_CASE("Orchestrator: accepted transmission moves to processing", "[orchestrator]") {
    Harness h;
    auto orchestrator = h.orchestrator();

    auto submission = orchestrator.submit(h.batch_ref, "enbd-rest", "alice");

    CHECK(submission.state() == SubmissionState::PROCESSING);
    CHECK(submission.bank_reference == "BANK-1");
    CHECK(submission.submitted_by == "alice");
    CHECK(submission.processing_start.has_value());
    REQUIRE(submission.attempts.size() == 1);
    CHECK(submission.attempts[0].accepted);
    CHECK(submission.retry_count == 0);

    const auto encoded = SifCodec::encode(h.batches->get(h.batch_ref));
    CHECK(submission.payload == encoded.content);
    CHECK(submission.payload_hash == digest::sha256_hex(encoded.content));
    CHECK(submission.payload_size == encoded.content.size());
    CHECK(submission.file_name == "WPS_201234567890123_202609.SIF");

    REQUIRE(h.script->requests.size() == 1);
    CHECK(h.script->requests[0].employer_id == "201234567890123");
    CHECK(h.script->requests[0].routing_code == "600310101");
    CHECK(h.script->requests[0].payload_hash == submission.payload_hash);

    CHECK(h.batches->get(h.batch_ref).state() == BatchState::SUBMITTED);
    CHECK(h.audit_events() == std::vector<std::string>{
        "validation.run", "submission.created", "submission.attempt"});
}

TEST_CASE("Orchestrator: connection identifiers override the batch header", "[orchestrator]") {
    Harness h;
    h.connections->update("enbd-rest", [](BankConnection& c) {
        c.employer_id = "EMP-AT-BANK";
        c.routing_code = "302620122";
    });
    auto orchestrator = h.orchestrator();
    (void)orchestrator.submit(h.batch_ref, "enbd-rest", "alice");

    REQUIRE(h.script->requests.size() == 1);
    CHECK(h.script->requests[0].employer_id == "EMP-AT-BANK");
    CHECK(h.script->requests[0].routing_code == "302620122");
}

TEST_CASE("Orchestrator: one in-flight submission per batch and connection", "[orchestrator]") {
    Harness h;
    h.connections->add(rest_connection("enbd-rest-backup"));
    auto orchestrator = h.orchestrator();

    (void)orchestrator.submit(h.batch_ref, "enbd-rest", "alice");
    CHECK_THROWS_AS(orchestrator.submit(h.batch_ref, "enbd-rest", "alice"), StateError);
    CHECK(h.submissions->size() == 1);

    auto other = orchestrator.submit(h.batch_ref, "enbd-rest-backup", "alice");
    CHECK(other.state() == SubmissionState::PROCESSING);
    CHECK(h.submissions->size() == 2);
}

TEST_CASE("Orchestrator: concurrent submits of one pair transmit once", "[orchestrator]") {
    Harness h;
    h.script_steps({Step::HANG});
    h.script->hang_for = std::chrono::milliseconds{200};
    auto orchestrator = h.orchestrator();

    auto submit = [&] { return orchestrator.submit(h.batch_ref, "enbd-rest", "alice"); };
    auto first = std::async(std::launch::async, submit);
    auto second = std::async(std::launch::async, submit);

    int processing = 0;
    int refused = 0;
    for (auto* pending : {&first, &second}) {
        try {
            if (pending->get().state() == SubmissionState::PROCESSING) ++processing;
        } catch (const StateError&) {
            ++refused;
        }
    }
    CHECK(processing == 1);
    CHECK(refused == 1);
    CHECK(h.submissions->size() == 1);
    CHECK(h.script->transmit_calls == 1);
}

TEST_CASE("Orchestrator: exhausted connection leaves a shared batch to its sibling", "[orchestrator]") {
    Harness h;
    h.connections->add(rest_connection("enbd-rest-backup"));
    h.script_steps({Step::ACCEPT, Step::REJECT});
    auto orchestrator = h.orchestrator({.max_retries = 1});

    auto primary = orchestrator.submit(h.batch_ref, "enbd-rest", "alice");
    CHECK(primary.state() == SubmissionState::PROCESSING);
    CHECK_THROWS_AS(orchestrator.submit(h.batch_ref, "enbd-rest-backup", "alice"), RetryExhausted);
    CHECK(h.batches->get(h.batch_ref).state() == BatchState::SUBMITTED);

    h.script->status = BankStatus::SUCCESS;
    primary = orchestrator.check_status(primary.reference, "scheduler");
    CHECK(primary.state() == SubmissionState::SUCCESS);
    CHECK(h.batches->get(h.batch_ref).state() == BatchState::PROCESSED);

    const auto record = h.ledger->find("201234567890123", SalaryPeriod(9, 2026));
    REQUIRE(record.has_value());
    CHECK(record->batch_references == std::vector<std::string>{h.batch_ref});
    CHECK(h.audited("compliance.recorded", "compliant"));
}

TEST_CASE("Orchestrator: bank failure on one connection waits for the other", "[orchestrator]") {
    Harness h;
    h.connections->add(rest_connection("enbd-rest-backup"));
    auto orchestrator = h.orchestrator();

    auto primary = orchestrator.submit(h.batch_ref, "enbd-rest", "alice");
    auto backup = orchestrator.submit(h.batch_ref, "enbd-rest-backup", "alice");

    h.script->status = BankStatus::FAILED;
    backup = orchestrator.check_status(backup.reference, "scheduler");
    CHECK(backup.state() == SubmissionState::FAILED);
    CHECK(h.batches->get(h.batch_ref).state() == BatchState::SUBMITTED);

    h.script->status = BankStatus::SUCCESS;
    (void)orchestrator.check_status(primary.reference, "scheduler");
    CHECK(h.batches->get(h.batch_ref).state() == BatchState::PROCESSED);
    CHECK(h.ledger->find("201234567890123", SalaryPeriod(9, 2026)).has_value());
}

TEST_CASE("Orchestrator: last failing connection rejects the batch", "[orchestrator]") {
    Harness h;
    h.connections->add(rest_connection("enbd-rest-backup"));
    h.script->status = BankStatus::FAILED;
    auto orchestrator = h.orchestrator();

    auto primary = orchestrator.submit(h.batch_ref, "enbd-rest", "alice");
    auto backup = orchestrator.submit(h.batch_ref, "enbd-rest-backup", "alice");

    (void)orchestrator.check_status(primary.reference, "scheduler");
    CHECK(h.batches->get(h.batch_ref).state() == BatchState::SUBMITTED);
    (void)orchestrator.check_status(backup.reference, "scheduler");
    CHECK(h.batches->get(h.batch_ref).state() == BatchState::REJECTED);
}

TEST_CASE("Orchestrator: retry refuses a batch edited since encoding", "[orchestrator]") {
    Harness h;
    h.script_steps({Step::REJECT, Step::ACCEPT});
    auto orchestrator = h.orchestrator({.max_retries = 3});

    auto submission = orchestrator.submit(h.batch_ref, "enbd-rest", "alice");
    CHECK(submission.state() == SubmissionState::DRAFT);

    h.batches->update(h.batch_ref, [](WpsBatch& b) { b.add_line(make_line(testing::kEmiratesIdB, "Late")); });
    CHECK_THROWS_AS(orchestrator.retry(submission.reference, "alice"), StateError);
    CHECK(h.script->transmit_calls == 1);
    CHECK(h.submissions->get(submission.reference).attempts.size() == 1);

    // A fresh submission of the edited batch goes through
    (void)orchestrator.cancel(submission.reference, "alice");
    auto again = orchestrator.submit(h.batch_ref, "enbd-rest", "alice");
    CHECK(again.state() == SubmissionState::PROCESSING);
    CHECK(again.payload_hash != submission.payload_hash);
}

TEST_CASE("Orchestrator: retry budget is bounded", "[orchestrator]") {
    Harness h;
    h.script_steps({Step::REJECT});
    auto orchestrator = h.orchestrator({.max_retries = 3});

    auto submission = orchestrator.submit(h.batch_ref, "enbd-rest", "alice");
    CHECK(submission.state() == SubmissionState::DRAFT);
    CHECK(submission.retry_count == 1);
    CHECK(submission.last_error == "E102: duplicate salary file");

    submission = orchestrator.retry(submission.reference, "alice");
    CHECK(submission.state() == SubmissionState::DRAFT);
    CHECK(submission.retry_count == 2);

    try {
        (void)orchestrator.retry(submission.reference, "alice");
        FAIL("expected RetryExhausted");
    } catch (const RetryExhausted& e) {
        CHECK(e.submission().state() == SubmissionState::FAILED);
        CHECK(e.submission().retry_count == 3);
        CHECK(e.submission().attempts.size() == 3);
        CHECK(e.submission().is_terminal());
    }

    CHECK(h.script->transmit_calls == 3);
    CHECK_THROWS_AS(orchestrator.retry(submission.reference, "alice"), StateError);
    CHECK(h.script->transmit_calls == 3);
    CHECK(h.batches->get(h.batch_ref).state() == BatchState::REJECTED);
    CHECK(h.audited("submission.attempt", "failed"));
}

TEST_CASE("Orchestrator: automatic retry keeps raw connector errors", "[orchestrator]") {
    Harness h;
    h.script_steps({Step::THROW, Step::THROW, Step::ACCEPT});
    auto orchestrator = h.orchestrator({.max_retries = 3, .auto_retry = true,
                                        .retry_backoff = std::chrono::milliseconds{1}});

    auto submission = orchestrator.submit(h.batch_ref, "enbd-rest", "alice");
    CHECK(submission.state() == SubmissionState::PROCESSING);
    CHECK(submission.retry_count == 2);
    REQUIRE(submission.attempts.size() == 3);
    CHECK(submission.attempts[0].error == "connection reset by peer");
    CHECK_FALSE(submission.attempts[1].accepted);
    CHECK(submission.attempts[2].accepted);
    CHECK(submission.bank_reference == "BANK-3");
}

TEST_CASE("Orchestrator: automatic retry ends in RetryExhausted", "[orchestrator]") {
    Harness h;
    h.script_steps({Step::THROW});
    auto orchestrator = h.orchestrator({.max_retries = 2, .auto_retry = true,
                                        .retry_backoff = std::chrono::milliseconds{1}});

    try {
        (void)orchestrator.submit(h.batch_ref, "enbd-rest", "alice");
        FAIL("expected RetryExhausted");
    } catch (const RetryExhausted& e) {
        CHECK(e.submission().state() == SubmissionState::FAILED);
        CHECK(e.submission().last_error == "connection reset by peer");
        CHECK(e.submission().processing_end.has_value());
    }
    CHECK(h.script->transmit_calls == 2);
}

TEST_CASE("Orchestrator: follow-through re-attempts without auto retry", "[orchestrator]") {
    Harness h;
    h.script_steps({Step::REJECT, Step::THROW, Step::ACCEPT});
    h.script->status = BankStatus::SUCCESS;
    auto orchestrator = h.orchestrator({.max_retries = 3, .auto_retry = false,
                                        .retry_backoff = std::chrono::milliseconds{1}});

    const auto submission = orchestrator.submit_and_follow(h.batch_ref, "enbd-rest", "cli", 2,
                                                           std::chrono::milliseconds{1});
    CHECK(submission.state() == SubmissionState::SUCCESS);
    CHECK(submission.attempts.size() == 3);
    CHECK(h.script->transmit_calls == 3);
    CHECK(h.script->status_calls == 1);
    CHECK(h.batches->get(h.batch_ref).state() == BatchState::PROCESSED);
}

TEST_CASE("Orchestrator: follow-through returns an exhausted record", "[orchestrator]") {
    Harness h;
    h.script_steps({Step::REJECT});
    auto orchestrator = h.orchestrator({.max_retries = 2,
                                        .retry_backoff = std::chrono::milliseconds{1}});

    const auto submission = orchestrator.submit_and_follow(h.batch_ref, "enbd-rest", "cli", 3,
                                                           std::chrono::milliseconds{1});
    CHECK(submission.state() == SubmissionState::FAILED);
    CHECK(submission.retry_count == 2);
    CHECK(h.script->transmit_calls == 2);
    CHECK(h.script->status_calls == 0);
    CHECK(h.batches->get(h.batch_ref).state() == BatchState::REJECTED);
}

TEST_CASE("Orchestrator: slow bank call is cut off by the attempt timeout", "[orchestrator]") {
    Harness h;
    h.script_steps({Step::HANG});
    h.script->hang_for = std::chrono::milliseconds{300};
    h.connections->update("enbd-rest", [](BankConnection& c) {
        c.attempt_timeout = std::chrono::milliseconds{50};
    });
    auto orchestrator = h.orchestrator();

    auto submission = orchestrator.submit(h.batch_ref, "enbd-rest", "alice");
    CHECK(submission.state() == SubmissionState::DRAFT);
    CHECK(submission.retry_count == 1);
    REQUIRE(submission.attempts.size() == 1);
    CHECK(submission.attempts[0].timed_out);
    CHECK(submission.last_error == "attempt timed out after 50 ms");

    CHECK(orchestrator.outstanding() == 1);
    CHECK(orchestrator.drain(std::chrono::milliseconds{2000}));
    CHECK(orchestrator.outstanding() == 0);
    CHECK(h.submissions->get(submission.reference).state() == SubmissionState::DRAFT);
}

TEST_CASE("Orchestrator: drain gives up on a call that is still running", "[orchestrator]") {
    Harness h;
    h.script_steps({Step::HANG});
    h.script->hang_for = std::chrono::milliseconds{500};
    h.connections->update("enbd-rest", [](BankConnection& c) {
        c.attempt_timeout = std::chrono::milliseconds{20};
    });
    auto orchestrator = h.orchestrator({.drain_timeout = std::chrono::milliseconds{2000}});

    (void)orchestrator.submit(h.batch_ref, "enbd-rest", "alice");
    CHECK_FALSE(orchestrator.drain(std::chrono::milliseconds{10}));
    CHECK(orchestrator.outstanding() == 1);
}

TEST_CASE("Orchestrator: cancellation during a bank call discards its result", "[orchestrator]") {
    Harness h;
    h.script_steps({Step::HANG});
    h.script->hang_for = std::chrono::milliseconds{200};
    auto orchestrator = h.orchestrator();

    auto pending = std::async(std::launch::async, [&] {
        return orchestrator.submit(h.batch_ref, "enbd-rest", "alice");
    });
    while (h.script->transmit_calls == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds{5});
    }
    const auto reference = h.submissions->by_batch(h.batch_ref).front().reference;
    auto cancelled = orchestrator.cancel(reference, "bob");
    CHECK(cancelled.state() == SubmissionState::CANCELLED);

    auto result = pending.get();
    CHECK(result.state() == SubmissionState::CANCELLED);
    CHECK(result.attempts.empty());
    CHECK(result.bank_reference.empty());
    CHECK(h.audited("submission.attempt", "discarded"));
}

// ============================================================================
// Status, settlement, cancellation
// ============================================================================

TEST_CASE("Orchestrator: bank success settles batch and compliance", "[orchestrator]") {
    Harness h;
    h.script->status = BankStatus::SUCCESS;
    auto orchestrator = h.orchestrator();

    auto submission = orchestrator.submit(h.batch_ref, "enbd-rest", "alice");
    submission = orchestrator.check_status(submission.reference, "scheduler");

    CHECK(submission.state() == SubmissionState::SUCCESS);
    CHECK(submission.processing_end.has_value());
    CHECK(submission.processing_duration().has_value());
    CHECK(h.batches->get(h.batch_ref).state() == BatchState::PROCESSED);

    auto record = h.ledger->find("201234567890123", SalaryPeriod(9, 2026));
    REQUIRE(record.has_value());
    CHECK(record->employees_paid_wps == 1);
    CHECK(record->total_salary_paid == 675000);
    CHECK(record->status() == ComplianceStatus::COMPLIANT);
    CHECK(h.audited("compliance.recorded", "compliant"));
    CHECK(h.audited("submission.settled", "success"));

    CHECK(h.submissions->connection_statistics("enbd-rest").successful_submissions == 1);
}

TEST_CASE("Orchestrator: pending status leaves the submission processing", "[orchestrator]") {
    Harness h;
    auto orchestrator = h.orchestrator();
    auto submission = orchestrator.submit(h.batch_ref, "enbd-rest", "alice");
    submission = orchestrator.check_status(submission.reference, "scheduler");
    CHECK(submission.state() == SubmissionState::PROCESSING);
    CHECK(h.script->status_calls == 1);
}

TEST_CASE("Orchestrator: bank failure after acceptance rejects the batch", "[orchestrator]") {
    Harness h;
    h.script->status = BankStatus::FAILED;
    auto orchestrator = h.orchestrator();

    auto submission = orchestrator.submit(h.batch_ref, "enbd-rest", "alice");
    submission = orchestrator.check_status(submission.reference, "scheduler");

    CHECK(submission.state() == SubmissionState::FAILED);
    CHECK(submission.last_error == "account closed");
    CHECK(submission.response_code == "E500");
    CHECK(h.batches->get(h.batch_ref).state() == BatchState::REJECTED);
    CHECK_FALSE(h.ledger->find("201234567890123", SalaryPeriod(9, 2026)).has_value());
}

TEST_CASE("Orchestrator: bank failure after acceptance can be retried or cancelled", "[orchestrator]") {
    Harness h;
    h.script->status = BankStatus::FAILED;
    auto orchestrator = h.orchestrator();

    auto failed = orchestrator.submit(h.batch_ref, "enbd-rest", "alice");
    failed = orchestrator.check_status(failed.reference, "scheduler");
    REQUIRE(failed.state() == SubmissionState::FAILED);
    CHECK(failed.retry_count == 0);
    CHECK(failed.can_retry());
    CHECK_FALSE(failed.is_terminal());

    auto retried = orchestrator.retry(failed.reference, "alice");
    CHECK(retried.state() == SubmissionState::PROCESSING);
    CHECK(h.script->transmit_calls == 2);
    CHECK(h.batches->get(h.batch_ref).state() == BatchState::SUBMITTED);

    h.script->status = BankStatus::SUCCESS;
    retried = orchestrator.check_status(retried.reference, "scheduler");
    CHECK(retried.state() == SubmissionState::SUCCESS);
    CHECK(h.batches->get(h.batch_ref).state() == BatchState::PROCESSED);

    Harness other;
    other.script->status = BankStatus::FAILED;
    auto second = other.orchestrator();
    auto rejected = second.submit(other.batch_ref, "enbd-rest", "alice");
    rejected = second.check_status(rejected.reference, "scheduler");
    CHECK(second.cancel(rejected.reference, "bob").state() == SubmissionState::CANCELLED);
}

TEST_CASE("Orchestrator: unreachable bank keeps the submission processing", "[orchestrator]") {
    Harness h;
    h.script->status_throws = true;
    auto orchestrator = h.orchestrator();

    auto submission = orchestrator.submit(h.batch_ref, "enbd-rest", "alice");
    submission = orchestrator.check_status(submission.reference, "scheduler");

    CHECK(submission.state() == SubmissionState::PROCESSING);
    CHECK(h.audited("submission.status", "unreachable"));
    CHECK(h.batches->get(h.batch_ref).state() == BatchState::SUBMITTED);
}

TEST_CASE("Orchestrator: polling a non-processing submission is a no-op", "[orchestrator]") {
    Harness h;
    h.script_steps({Step::REJECT});
    auto orchestrator = h.orchestrator();

    auto submission = orchestrator.submit(h.batch_ref, "enbd-rest", "alice");
    submission = orchestrator.check_status(submission.reference, "scheduler");
    CHECK(submission.state() == SubmissionState::DRAFT);
    CHECK(h.script->status_calls == 0);
}

TEST_CASE("Orchestrator: cancel and its limits", "[orchestrator]") {
    Harness h;
    h.script_steps({Step::REJECT});
    auto orchestrator = h.orchestrator();

    auto submission = orchestrator.submit(h.batch_ref, "enbd-rest", "alice");
    auto cancelled = orchestrator.cancel(submission.reference, "bob");
    CHECK(cancelled.state() == SubmissionState::CANCELLED);
    CHECK(cancelled.processing_end.has_value());
    CHECK(h.audited("submission.cancelled", "cancelled"));

    CHECK_THROWS_AS(orchestrator.cancel(submission.reference, "bob"), StateError);
    CHECK_THROWS_AS(orchestrator.retry(submission.reference, "bob"), StateError);

    // Cancelled records no longer count as in flight
    h.script_steps({Step::ACCEPT});
    auto again = orchestrator.submit(h.batch_ref, "enbd-rest", "alice");
    CHECK(again.state() == SubmissionState::PROCESSING);
    CHECK(again.reference != submission.reference);
}

TEST_CASE("Orchestrator: manual portal outcome is recorded by an operator", "[orchestrator]") {
    Harness h;
    auto orchestrator = h.orchestrator();

    auto submission = orchestrator.submit(h.batch_ref, "mohre-portal", "alice");
    CHECK(submission.state() == SubmissionState::PROCESSING);
    CHECK(submission.bank_reference == "MANUAL-" + submission.reference);

    submission = orchestrator.check_status(submission.reference, "scheduler");
    CHECK(submission.state() == SubmissionState::PROCESSING);

    submission = orchestrator.record_manual_outcome(submission.reference, true, "MOHRE-5521",
                                                    "uploaded via portal", "bob");
    CHECK(submission.state() == SubmissionState::SUCCESS);
    CHECK(submission.bank_reference == "MOHRE-5521");
    CHECK(submission.response_code == "MANUAL_OK");
    CHECK(h.batches->get(h.batch_ref).state() == BatchState::PROCESSED);
    CHECK(h.ledger->find("201234567890123", SalaryPeriod(9, 2026)).has_value());

    CHECK_THROWS_AS(orchestrator.record_manual_outcome(submission.reference, false, "", "late", "bob"),
                    StateError);
}

TEST_CASE("Orchestrator: only manual submissions take a recorded outcome", "[orchestrator]") {
    Harness h;
    auto orchestrator = h.orchestrator();
    auto submission = orchestrator.submit(h.batch_ref, "enbd-rest", "alice");
    CHECK_THROWS_AS(orchestrator.record_manual_outcome(submission.reference, true, "X", "", "bob"),
                    StateError);
}

// ============================================================================
// Ambient behaviour
// ============================================================================

TEST_CASE("Orchestrator: audit trail of a full run verifies", "[orchestrator][audit]") {
    Harness h;
    h.script->status = BankStatus::SUCCESS;
    auto orchestrator = h.orchestrator();

    auto submission = orchestrator.submit(h.batch_ref, "enbd-rest", "alice");
    (void)orchestrator.check_status(submission.reference, "scheduler");

    const auto verify = AuditTrail::verify_chain(h.audit_lines->lines());
    CHECK(verify.intact);
    CHECK(verify.records == h.audit_lines->lines().size());
    CHECK(h.audit->stats().write_failures == 0);
}

TEST_CASE("Orchestrator: encoded files are spooled", "[orchestrator]") {
    const auto dir = std::filesystem::temp_directory_path() / "wpsgate_test_spool";
    std::filesystem::remove_all(dir);

    Harness h;
    auto orchestrator = h.orchestrator({.spool_dir = dir.string()});
    auto submission = orchestrator.submit(h.batch_ref, "enbd-rest", "alice");

    std::ifstream in(dir / submission.file_name, std::ios::binary);
    REQUIRE(in.is_open());
    std::stringstream content;
    content << in.rdbuf();
    CHECK(content.str() == submission.payload);

    std::filesystem::remove_all(dir);
}

TEST_CASE("Orchestrator: construction checks", "[orchestrator]") {
    Harness h;
    CHECK_THROWS_AS(h.orchestrator({.max_retries = 0}), ConfigError);
    CHECK_THROWS_AS(SubmissionOrchestrator(SubmissionServices{}, SubmissionConfig{}), ConfigError);
}
