#include <catch2/catch_test_macros.hpp>
#include "validation/derived_checks.hpp"
#include "mocks/batch_fixtures.hpp"

using namespace wpsgate;

namespace {

struct Fixture {
    std::shared_ptr<DerivedCheckRegistry> registry = DerivedCheckRegistry::with_builtins();
    WpsBatch batch = testing::make_batch();
    ValidationContext ctx{batch, nullptr, nullptr};

    CheckOutcome line(const std::string& name, const WpsLine& l, const CheckArgs& args = {}) {
        const auto* fn = registry->find_line_check(name);
        REQUIRE(fn != nullptr);
        return (*fn)(l, ctx, args);
    }

    CheckOutcome file(const std::string& name, const WpsBatch& b, const CheckArgs& args = {}) {
        const auto* fn = registry->find_file_check(name);
        REQUIRE(fn != nullptr);
        return (*fn)(b, ctx, args);
    }
};

} // namespace

TEST_CASE("DerivedChecks: Emirates ID checksum", "[validation][derived]") {
    CHECK(checks::is_valid_emirates_id("784199012345676"));
    CHECK(checks::is_valid_emirates_id("784-1990-1234567-6"));
    CHECK(checks::is_valid_emirates_id("784198511111118"));
    CHECK_FALSE(checks::is_valid_emirates_id("784199012345677"));
    CHECK_FALSE(checks::is_valid_emirates_id("123199012345676"));
    CHECK_FALSE(checks::is_valid_emirates_id("78419901234567"));
    CHECK_FALSE(checks::is_valid_emirates_id("784A99012345676"));
}

TEST_CASE("DerivedChecks: net salary reconciliation", "[validation][derived]") {
    Fixture f;
    auto line = testing::make_line();
    CHECK(f.line("net_salary_reconciliation", line).passed);

    line.net_salary = 6700.0;
    auto outcome = f.line("net_salary_reconciliation", line);
    CHECK_FALSE(outcome.passed);
    CHECK(outcome.detail == "net 6700.00 != computed 6750.00");
}

TEST_CASE("DerivedChecks: positive net salary", "[validation][derived]") {
    Fixture f;
    auto line = testing::make_line();
    line.net_salary = 0.0;
    CHECK_FALSE(f.line("positive_net_salary", line).passed);
    CHECK(f.line("positive_net_salary", line, {{"allow_zero", "true"}}).passed);
}

TEST_CASE("DerivedChecks: minimum wage on a chosen field", "[validation][derived]") {
    Fixture f;
    auto line = testing::make_line();
    CHECK(f.line("minimum_wage", line, {{"amount", "5000"}}).passed);
    CHECK_FALSE(f.line("minimum_wage", line, {{"amount", "5000.01"}}).passed);
    CHECK(f.line("minimum_wage", line, {{"amount", "6000"}, {"field", "net_salary"}}).passed);

    CHECK(f.registry->validate_args("minimum_wage", {}).has_value());
    CHECK(f.registry->validate_args("minimum_wage", {{"amount", "x"}}).has_value());
    CHECK(f.registry->validate_args("minimum_wage", {{"amount", "1"}, {"field", "nope"}}).has_value());
    CHECK_FALSE(f.registry->validate_args("minimum_wage", {{"amount", "1"}}).has_value());
}

TEST_CASE("DerivedChecks: days worked range", "[validation][derived]") {
    Fixture f;
    auto line = testing::make_line();
    line.days_worked = 32;
    CHECK_FALSE(f.line("days_worked_range", line, {{"min", "0"}, {"max", "31"}}).passed);
    CHECK(f.registry->validate_args("days_worked_range", {{"min", "5"}, {"max", "1"}}).has_value());
}

TEST_CASE("DerivedChecks: identifier and account presence", "[validation][derived]") {
    Fixture f;
    auto line = testing::make_line("");
    CHECK_FALSE(f.line("employee_identifier_present", line).passed);
    line.labour_card_no = "LC1";
    CHECK(f.line("employee_identifier_present", line).passed);

    line.account_number.clear();
    line.iban.clear();
    CHECK_FALSE(f.line("bank_account_present", line).passed);
    line.iban = "AE070331234567890123456";
    CHECK(f.line("bank_account_present", line).passed);
}

TEST_CASE("DerivedChecks: empty Emirates ID is left to the presence check", "[validation][derived]") {
    Fixture f;
    CHECK(f.line("emirates_id_checksum", testing::make_line("")).passed);
    CHECK_FALSE(f.line("emirates_id_checksum", testing::make_line("784199012345677")).passed);
}

TEST_CASE("DerivedChecks: salary date within the period window", "[validation][derived]") {
    using namespace std::chrono;
    Fixture f;
    auto batch = testing::make_batch();
    CHECK(f.file("salary_date_in_period", batch).passed);

    batch.set_salary_date(year_month_day{year{2026}, month{10}, day{15}});
    CHECK(f.file("salary_date_in_period", batch).passed);

    batch.set_salary_date(year_month_day{year{2026}, month{10}, day{16}});
    CHECK_FALSE(f.file("salary_date_in_period", batch).passed);

    batch.set_salary_date(year_month_day{year{2026}, month{8}, day{31}});
    CHECK_FALSE(f.file("salary_date_in_period", batch).passed);
}

TEST_CASE("DerivedChecks: submission deadline takes an explicit reference date", "[validation][derived]") {
    Fixture f;
    auto batch = testing::make_batch();
    CHECK(f.file("submission_deadline", batch, {{"reference_date", "2026-10-15"}}).passed);
    CHECK_FALSE(f.file("submission_deadline", batch, {{"reference_date", "2026-10-16"}}).passed);
    CHECK(f.registry->validate_args("submission_deadline", {}).has_value());
}

TEST_CASE("DerivedChecks: non-empty batch", "[validation][derived]") {
    Fixture f;
    CHECK(f.file("non_empty_batch", testing::make_batch()).passed);
    CHECK_FALSE(f.file("non_empty_batch", testing::make_batch({})).passed);
}

TEST_CASE("DerivedChecks: custom checks are a registration", "[validation][derived]") {
    DerivedCheckRegistry registry;
    registry.register_line_check("always_fails",
        [](const WpsLine&, const ValidationContext&, const CheckArgs&) {
            return CheckOutcome::fail("nope");
        });
    CHECK(registry.find_line_check("always_fails") != nullptr);
    CHECK(registry.find_file_check("always_fails") == nullptr);
    CHECK(registry.line_check_names() == std::vector<std::string>{"always_fails"});
}
