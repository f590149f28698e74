#include <catch2/catch_test_macros.hpp>
#include "validation/field_access.hpp"
#include "mocks/batch_fixtures.hpp"

#include <algorithm>

using namespace wpsgate;

TEST_CASE("FieldAccess: line fields resolve by name", "[validation][fields]") {
    auto line = testing::make_line();

    auto id = fields::line_field(line, "employee_id");
    REQUIRE(id.has_value());
    CHECK(std::get<std::string>(*id) == "784199012345676");

    auto days = fields::line_field(line, "days_worked");
    REQUIRE(days.has_value());
    CHECK(std::get<int64_t>(*days) == 30);

    auto gross = fields::line_field(line, "gross_salary");
    REQUIRE(gross.has_value());
    CHECK(fields::as_number(*gross) == 6750.0);

    CHECK_FALSE(fields::line_field(line, "shoe_size").has_value());
}

TEST_CASE("FieldAccess: header fields resolve by name", "[validation][fields]") {
    auto batch = testing::make_batch();

    CHECK(std::get<std::string>(*fields::header_field(batch, "salary_date")) == "2026-09-28");
    CHECK(std::get<int64_t>(*fields::header_field(batch, "period_month")) == 9);
    CHECK(std::get<int64_t>(*fields::header_field(batch, "employee_count")) == 1);
    CHECK(std::get<std::string>(*fields::header_field(batch, "file_type")) == "sif");

    batch.set_salary_date(std::nullopt);
    CHECK(fields::is_empty(*fields::header_field(batch, "salary_date")));
}

TEST_CASE("FieldAccess: emptiness and rendering", "[validation][fields]") {
    CHECK(fields::is_empty(FieldValue{std::string("   ")}));
    CHECK(fields::is_empty(FieldValue{0.0}));
    CHECK(fields::is_empty(FieldValue{int64_t{0}}));
    CHECK_FALSE(fields::is_empty(FieldValue{std::string("x")}));

    CHECK(fields::to_string(FieldValue{6750.0}) == "6750.00");
    CHECK(fields::to_string(FieldValue{int64_t{30}}) == "30");
    CHECK(fields::is_numeric(FieldValue{1.5}));
    CHECK_FALSE(fields::is_numeric(FieldValue{std::string("1.5")}));
}

TEST_CASE("FieldAccess: field name catalogues", "[validation][fields]") {
    auto names = fields::line_field_names();
    CHECK(std::is_sorted(names.begin(), names.end()));
    CHECK(fields::is_line_field("net_salary"));
    CHECK_FALSE(fields::is_line_field("employer_id"));
    CHECK(fields::is_header_field("employer_id"));
}
