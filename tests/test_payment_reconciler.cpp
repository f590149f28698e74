#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "audit/memory_sink.hpp"
#include "core/error.hpp"
#include "mocks/batch_fixtures.hpp"
#include "reconciliation/json_statement_source.hpp"
#include "reconciliation/payment_reconciler.hpp"

#include <nlohmann/json.hpp>

#include <memory>

using namespace wpsgate;
using namespace wpsgate::testing;
using namespace std::chrono;
using Catch::Matchers::WithinAbs;

namespace {

constexpr year_month_day kFrom{year{2026}, month{9}, day{1}};
constexpr year_month_day kTo{year{2026}, month{9}, day{30}};

class FakeStatement : public IBankStatementSource {
public:
    std::vector<StatementLine> lines;

    std::vector<StatementLine> statement_lines(const year_month_day&, const year_month_day&) const override {
        return lines;
    }
    std::string name() const override { return "fake"; }
};

StatementLine tx(const std::string& id, double amount, const std::string& reference) {
    return StatementLine{.id = id, .amount = amount, .reference = reference,
                         .date = year_month_day{year{2026}, month{9}, day{28}}};
}

WpsLine paid_line(const std::string& emirates_id, const std::string& name,
                  const std::string& account, double net) {
    auto line = make_line(emirates_id, name);
    line.account_number = account;
    line.net_salary = net;
    return line;
}

/// Three employees, processed by the bank
WpsBatch processed_batch() {
    auto batch = make_batch({
        paid_line(kEmiratesIdA, "Aisha Rahman", "AE070331234567890123456", 6750.00),
        paid_line(kEmiratesIdB, "Omar Haddad", "AE460260001015555555555", 5200.00),
        paid_line(kEmiratesIdC, "Priya Nair", "AE980350000000123456789", 4100.00),
    });
    batch.mark_generated();
    batch.mark_submitted();
    batch.mark_processed();
    return batch;
}

struct Fixture {
    std::shared_ptr<FakeStatement> statement = std::make_shared<FakeStatement>();
    std::shared_ptr<AuditTrail> audit = std::make_shared<AuditTrail>(AuditConfig{});
    std::shared_ptr<MemorySink> audit_lines = std::make_shared<MemorySink>();
    PaymentReconciler reconciler;

    Fixture() : reconciler(statement, ReconcilerConfig{}, audit) { audit->add_sink(audit_lines); }

    bool audited(const std::string& event) const {
        for (const auto& line : audit_lines->lines()) {
            if (nlohmann::json::parse(line)["event"] == event) return true;
        }
        return false;
    }
};

} // anonymous namespace

TEST_CASE("Reconciler: matching amount and name or account reconciles", "[reconciliation]") {
    Fixture f;
    f.statement->lines = {
        tx("TX-1", -6750.00, "SALARY SEP AISHA RAHMAN"),
        tx("TX-2", -5200.00, "WPS AE460260001015555555555"),
        tx("TX-3", -4100.00, "salary priya nair"),
    };

    auto rec = f.reconciler.start({processed_batch()}, kFrom, kTo, "finance");
    CHECK(rec.reference == "REC/2026/0001");
    CHECK(rec.state == ReconciliationState::RECONCILED);
    REQUIRE(rec.lines.size() == 3);
    CHECK(rec.lines[0].statement_line_id == "TX-1");
    CHECK(rec.lines[0].bank_amount == 6750.00);
    CHECK(rec.lines[1].state == MatchState::MATCHED);
    CHECK(rec.lines[2].bank_reference == "salary priya nair");

    const auto summary = rec.summary();
    CHECK(summary.matched_employees == 3);
    CHECK(summary.difference_subunits() == 0);
    CHECK_THAT(summary.match_percentage(), WithinAbs(100.0, 1e-9));
    CHECK(f.audited("reconciliation.matched"));
}

TEST_CASE("Reconciler: amount within tolerance is a partial match", "[reconciliation]") {
    Fixture f;
    f.statement->lines = {
        tx("TX-1", -6750.00, "AISHA RAHMAN"),
        tx("TX-2", -5160.00, "BULK TRANSFER 0926"),     // 40 off, under 1%
        tx("TX-3", -4100.00, "PRIYA NAIR"),
    };

    auto rec = f.reconciler.start({processed_batch()}, kFrom, kTo, "finance");
    CHECK(rec.state == ReconciliationState::PARTIAL);
    CHECK(rec.lines[1].state == MatchState::PARTIAL);
    CHECK(rec.lines[1].difference_reason == "Amount mismatch within tolerance");
    CHECK_THAT(rec.lines[1].difference(), WithinAbs(40.0, 1e-9));

    const auto summary = rec.summary();
    CHECK(summary.matched_employees == 2);
    CHECK(summary.unmatched_employees == 1);
    CHECK(summary.difference_subunits() == 4000);

    // Partial lines do not block completion
    f.reconciler.complete(rec, "finance");
    CHECK(rec.state == ReconciliationState::RECONCILED);
    CHECK(rec.completed_by == "finance");
    CHECK(f.audited("reconciliation.completed"));
}

TEST_CASE("Reconciler: a transaction pays one line only", "[reconciliation]") {
    Fixture f;
    auto batch = make_batch({
        paid_line(kEmiratesIdA, "Sam Lee", "AE070331234567890123456", 3000.00),
        paid_line(kEmiratesIdB, "Sam Lee", "AE070331234567890123456", 3000.00),
    });
    batch.mark_generated();
    batch.mark_submitted();
    batch.mark_processed();
    f.statement->lines = {tx("TX-1", 3000.00, "SAM LEE")};

    auto rec = f.reconciler.start({batch}, kFrom, kTo, "finance");
    CHECK(rec.lines[0].state == MatchState::MATCHED);
    CHECK(rec.lines[1].state == MatchState::UNMATCHED);
    CHECK_FALSE(rec.lines[1].statement_line_id.has_value());
    CHECK(rec.state == ReconciliationState::PARTIAL);
}

TEST_CASE("Reconciler: unmatched lines block completion until resolved", "[reconciliation]") {
    Fixture f;
    f.statement->lines = {tx("TX-9", -999.00, "UNRELATED")};

    auto rec = f.reconciler.start({processed_batch()}, kFrom, kTo, "finance");
    CHECK(rec.state == ReconciliationState::DISCREPANCY);
    CHECK(rec.summary().matched_employees == 0);
    CHECK_THROWS_AS(f.reconciler.complete(rec, "finance"), StateError);

    f.reconciler.manual_match(rec, 0, "controller", "paid by cheque");
    CHECK(rec.lines[0].state == MatchState::MANUAL);
    CHECK(rec.lines[0].matched_by == "controller");
    CHECK(rec.state == ReconciliationState::PARTIAL);
    CHECK(f.audited("reconciliation.manual_match"));

    f.reconciler.mark_discrepancy(rec, 1, "bank returned funds");
    CHECK_THROWS_AS(f.reconciler.complete(rec, "finance"), StateError);

    f.reconciler.mark_discrepancy(rec, 2, "account closed");
    f.reconciler.complete(rec, "finance");
    CHECK(rec.state == ReconciliationState::RECONCILED);

    CHECK_THROWS_AS(f.reconciler.manual_match(rec, 7, "controller"), NotFoundError);
}

TEST_CASE("Reconciler: only processed batches are reconciled", "[reconciliation]") {
    Fixture f;
    auto submitted = make_batch();
    submitted.mark_generated();
    submitted.mark_submitted();

    CHECK_THROWS_AS(f.reconciler.start({submitted}, kFrom, kTo, "finance"), StateError);
    CHECK_THROWS_AS(f.reconciler.start({processed_batch()}, kTo, kFrom, "finance"), StateError);

    const auto empty = f.reconciler.start({}, kFrom, kTo, "finance");
    CHECK(empty.state == ReconciliationState::DRAFT);
    CHECK_THAT(empty.summary().match_percentage(), WithinAbs(0.0, 1e-9));
}

TEST_CASE("Reconciler: tolerance outside [0, 1) is a configuration error", "[reconciliation]") {
    auto statement = std::make_shared<FakeStatement>();
    CHECK_THROWS_AS(PaymentReconciler(statement, ReconcilerConfig{.amount_tolerance = -0.1}), ConfigError);
    CHECK_THROWS_AS(PaymentReconciler(statement, ReconcilerConfig{.amount_tolerance = 1.0}), ConfigError);
    CHECK_THROWS_AS(PaymentReconciler(nullptr), ConfigError);
}

TEST_CASE("JsonStatementSource: lines are filtered by date", "[reconciliation][json]") {
    const auto source = JsonStatementSource::from_string(R"({"lines": [
        {"id": "TX-1", "amount": -6750.0, "reference": "AISHA RAHMAN", "date": "2026-09-28"},
        {"id": "TX-2", "amount": -5200.0, "reference": "OMAR HADDAD", "date": "2026-10-02"},
        {"id": "TX-3", "amount": -4100.0, "reference": "PRIYA NAIR"}
    ]})");

    const auto lines = source.statement_lines(kFrom, kTo);
    REQUIRE(lines.size() == 2);
    CHECK(lines[0].id == "TX-1");
    CHECK(lines[0].amount == -6750.0);
    CHECK(lines[1].id == "TX-3");
    CHECK_FALSE(lines[1].date.has_value());
    CHECK(source.name() == "json:inline");
}

TEST_CASE("JsonStatementSource: malformed statements are format errors", "[reconciliation][json]") {
    CHECK_THROWS_AS(JsonStatementSource::from_string("[1, 2"), FormatError);
    CHECK_THROWS_AS(JsonStatementSource::from_string(R"({"transactions": []})"), FormatError);
    CHECK_THROWS_AS(JsonStatementSource::from_string(R"({"lines": [{"amount": "ten"}]})"), FormatError);
    CHECK_THROWS_AS(JsonStatementSource::from_string(R"({"lines": [{"date": "2026-13-01"}]})"), FormatError);
    CHECK_THROWS_AS(JsonStatementSource::from_file("/nonexistent/statement.json"), ConfigError);
}
