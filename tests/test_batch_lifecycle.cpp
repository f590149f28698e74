#include <catch2/catch_test_macros.hpp>
#include "core/error.hpp"
#include "mocks/batch_fixtures.hpp"
#include "store/repositories.hpp"

using namespace wpsgate;
using wpsgate::testing::make_batch;
using wpsgate::testing::make_line;

TEST_CASE("WpsBatch: happy path through the lifecycle", "[batch]") {
    auto batch = make_batch();
    CHECK(batch.state() == BatchState::DRAFT);

    batch.mark_generated();
    CHECK(batch.state() == BatchState::GENERATED);
    batch.mark_submitted();
    CHECK(batch.state() == BatchState::SUBMITTED);
    batch.mark_processed();
    CHECK(batch.state() == BatchState::PROCESSED);
    CHECK(batch.is_frozen());
}

TEST_CASE("WpsBatch: draft batch cannot be submitted", "[batch]") {
    auto batch = make_batch();
    CHECK_THROWS_AS(batch.mark_submitted(), StateError);
}

TEST_CASE("WpsBatch: processed batch is frozen", "[batch]") {
    auto batch = make_batch();
    batch.mark_generated();
    batch.mark_submitted();
    batch.mark_processed();

    CHECK_THROWS_AS(batch.add_line(make_line()), StateError);
    CHECK_THROWS_AS(batch.replace_lines({}), StateError);
    CHECK_THROWS_AS(batch.mark_generated(), StateError);
    CHECK_THROWS_AS(batch.cancel(), StateError);
    CHECK_THROWS_AS(batch.reset_to_draft(), StateError);
}

TEST_CASE("WpsBatch: processed batch header is frozen", "[batch]") {
    auto batch = make_batch();
    batch.mark_generated();
    batch.mark_submitted();
    batch.mark_processed();

    CHECK_THROWS_AS(batch.set_employer_id("209999999999999"), StateError);
    CHECK_THROWS_AS(batch.set_employer_account("AE000000000000000000000"), StateError);
    CHECK_THROWS_AS(batch.set_period(SalaryPeriod(10, 2026)), StateError);
    CHECK_THROWS_AS(batch.set_salary_date(std::nullopt), StateError);
    CHECK_THROWS_AS(batch.set_declared_total_net(1.0), StateError);
    CHECK_THROWS_AS(batch.set_eligible_employee_count(9), StateError);
    CHECK_THROWS_AS(batch.set_reference("WPS/2026/09/0099"), StateError);

    CHECK(batch.employer_id() == "201234567890123");
    CHECK(batch.period() == SalaryPeriod(9, 2026));
    CHECK(batch.salary_date().has_value());
}

TEST_CASE("WpsBatch: header is editable until processed", "[batch]") {
    auto batch = make_batch();
    batch.mark_generated();
    batch.mark_submitted();
    batch.mark_rejected();

    batch.set_employer_account("AE110331234567890123456");
    CHECK(batch.employer_account() == "AE110331234567890123456");

    batch.cancel();
    CHECK_THROWS_AS(batch.set_employer_name("Other LLC"), StateError);
}

TEST_CASE("BatchRepository: processed batch cannot be overwritten", "[batch][store]") {
    BatchRepository repository;
    const auto reference = repository.add(make_batch());

    auto draft = repository.get(reference);
    draft.set_employer_name("Renamed Trading LLC");
    repository.save(draft);
    CHECK(repository.get(reference).employer_name() == "Renamed Trading LLC");

    repository.update(reference, [](WpsBatch& b) {
        b.mark_generated();
        b.mark_submitted();
        b.mark_processed();
    });

    auto replacement = make_batch({make_line(), make_line(testing::kEmiratesIdB, "B")}, reference);
    CHECK_THROWS_AS(repository.save(replacement), StateError);

    const auto stored = repository.get(reference);
    CHECK(stored.state() == BatchState::PROCESSED);
    CHECK(stored.lines().size() == 1);
    CHECK(stored.employer_name() == "Renamed Trading LLC");
}

TEST_CASE("WpsBatch: rejected batch can be regenerated or reset", "[batch]") {
    auto batch = make_batch();
    batch.mark_generated();
    batch.mark_submitted();
    batch.mark_rejected();
    CHECK(batch.state() == BatchState::REJECTED);

    batch.mark_generated();
    CHECK(batch.state() == BatchState::GENERATED);

    batch.mark_submitted();
    batch.mark_rejected();
    batch.reset_to_draft();
    CHECK(batch.state() == BatchState::DRAFT);
}

TEST_CASE("WpsBatch: cancelled batch only resets to draft", "[batch]") {
    auto batch = make_batch();
    batch.cancel();
    CHECK(batch.state() == BatchState::CANCELLED);
    CHECK_THROWS_AS(batch.add_line(make_line()), StateError);
    CHECK_THROWS_AS(batch.mark_processed(), StateError);

    batch.reset_to_draft();
    CHECK(batch.state() == BatchState::DRAFT);
    CHECK_THROWS_AS(batch.reset_to_draft(), StateError);
}

TEST_CASE("WpsBatch: totals are derived from lines", "[batch]") {
    auto second = make_line(testing::kEmiratesIdB, "B");
    second.deductions = 750.0;
    second.net_salary = 6000.0;
    auto batch = make_batch({make_line(), second});

    auto totals = batch.totals();
    CHECK(totals.employee_count == 2);
    CHECK(totals.basic == 10000.0);
    CHECK(totals.deductions == 750.0);
    CHECK(totals.net == 12750.0);

    batch.add_line(make_line(testing::kEmiratesIdC, "C"));
    CHECK(batch.totals().employee_count == 3);
}

TEST_CASE("WpsBatch: file name embeds employer and period", "[batch]") {
    auto batch = make_batch();
    CHECK(batch.file_name() == "WPS_201234567890123_202609.SIF");
}

TEST_CASE("SalaryPeriod: deadline is the 15th of the following month", "[batch]") {
    using namespace std::chrono;
    CHECK(SalaryPeriod(9, 2026).deadline() == year_month_day{year{2026}, month{10}, day{15}});
    CHECK(SalaryPeriod(12, 2026).deadline() == year_month_day{year{2027}, month{1}, day{15}});
    CHECK_FALSE(SalaryPeriod(13, 2026).valid());
    CHECK_FALSE(SalaryPeriod(0, 2026).valid());
}
