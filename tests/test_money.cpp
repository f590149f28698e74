#include <catch2/catch_test_macros.hpp>
#include "core/money.hpp"

using namespace wpsgate;

TEST_CASE("Money: whole and two-decimal amounts convert exactly", "[money]") {
    CHECK(money::to_subunits(6750.0).value() == 675000);
    CHECK(money::to_subunits(1234.56).value() == 123456);
    CHECK(money::to_subunits(0.0).value() == 0);
    CHECK(money::to_subunits(-12.5).value() == -1250);
}

TEST_CASE("Money: binary float noise is tolerated", "[money]") {
    auto r = money::to_subunits(0.1 + 0.2);
    REQUIRE(r.is_ok());
    CHECK(r.value() == 30);

    r = money::to_subunits(5000.0 + 1250.0 + 500.0 - 0.01 + 0.01);
    REQUIRE(r.is_ok());
    CHECK(r.value() == 675000);
}

TEST_CASE("Money: fractional fils are rejected", "[money]") {
    auto r = money::to_subunits(6750.005);
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::FORMAT_ERROR);

    CHECK(money::to_subunits(0.001).is_error());
}

TEST_CASE("Money: non-finite and oversized amounts are rejected", "[money]") {
    CHECK(money::to_subunits(std::numeric_limits<double>::infinity()).is_error());
    CHECK(money::to_subunits(std::numeric_limits<double>::quiet_NaN()).is_error());
    CHECK(money::to_subunits(1.0e15).is_error());
}

TEST_CASE("Money: formatting", "[money]") {
    CHECK(money::format_amount(675000) == "6750.00");
    CHECK(money::format_amount(5) == "0.05");
    CHECK(money::format_amount(-1250) == "-12.50");
    CHECK(money::round_to_subunits(10.004) == 1000);
    CHECK(money::from_subunits(123456) == 1234.56);
}
