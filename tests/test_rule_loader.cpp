#include <catch2/catch_test_macros.hpp>
#include "validation/rule_loader.hpp"

using namespace wpsgate;

namespace {

RuleLoader::LoadResult load(const std::string& toml) {
    static const auto checks = DerivedCheckRegistry::with_builtins();
    return RuleLoader::load_from_string(toml, *checks);
}

} // namespace

TEST_CASE("RuleLoader: loads every rule family", "[validation][loader]") {
    auto result = load(R"(
[[rules]]
code = "SDR_ROUTING"
type = "required"
field = "bank_routing_code"
message = "Routing code missing"

[[rules]]
code = "SDR_ROUTING_FORMAT"
type = "format"
field = "bank_routing_code"
pattern = "[0-9]{9}"
severity = "warning"

[[rules]]
code = "SDR_DAYS"
type = "range"
field = "days_worked"
min = 0
max = 31.0

[[rules]]
code = "SDR_UNIQUE"
type = "unique"
field = "employee_id"

[[rules]]
code = "SDR_BANK"
type = "reference"
field = "bank_routing_code"
collection = "banks.routing_code"
severity = "info"

[[rules]]
code = "SDR_MIN_WAGE"
type = "compliance"
check = "minimum_wage"
sequence = 90
args = { amount = 1000, field = "basic_salary" }

[[rules]]
code = "EDR_DEADLINE"
type = "business"
scope = "file"
check = "submission_deadline"
active = false
args = { reference_date = 2026-10-15 }
)");
    REQUIRE(result.success);
    REQUIRE(result.rules.size() == 7);

    CHECK(result.rules[0].message == "Routing code missing");
    CHECK(result.rules[0].name == "SDR_ROUTING");
    CHECK(std::holds_alternative<RequiredCheck>(result.rules[0].check));

    const auto& format = std::get<FormatCheck>(result.rules[1].check);
    CHECK(format.regex != nullptr);
    CHECK(result.rules[1].severity == Severity::WARNING);

    const auto& range = std::get<RangeCheck>(result.rules[2].check);
    CHECK(range.min == 0.0);
    CHECK(range.max == 31.0);

    CHECK_FALSE(std::get<UniqueCheck>(result.rules[3].check).collection.has_value());
    CHECK(std::get<ReferenceCheck>(result.rules[4].check).collection == "banks.routing_code");

    const auto& wage = std::get<DerivedCheck>(result.rules[5].check);
    CHECK(wage.name == "minimum_wage");
    CHECK(wage.args.at("amount") == "1000");
    CHECK(result.rules[5].sequence == 90);

    const auto& deadline = std::get<DerivedCheck>(result.rules[6].check);
    CHECK(deadline.args.at("reference_date") == "2026-10-15");
    CHECK(result.rules[6].scope == RuleScope::FILE);
    CHECK_FALSE(result.rules[6].active);
}

TEST_CASE("RuleLoader: absent rules array is an empty set", "[validation][loader]") {
    auto result = load("[logging]\nlevel = \"info\"\n");
    REQUIRE(result.success);
    CHECK(result.rules.empty());
}

TEST_CASE("RuleLoader: invalid rules reject the whole set", "[validation][loader]") {
    SECTION("missing code") {
        auto r = load("[[rules]]\ntype = \"required\"\nfield = \"employee_id\"\n");
        REQUIRE_FALSE(r.success);
        CHECK(r.error_message.find("code") != std::string::npos);
    }
    SECTION("duplicate code") {
        auto r = load(R"(
[[rules]]
code = "A"
type = "required"
field = "employee_id"
[[rules]]
code = "A"
type = "required"
field = "account"
)");
        REQUIRE_FALSE(r.success);
        CHECK(r.error_message.find("duplicate") != std::string::npos);
    }
    SECTION("unknown type") {
        CHECK_FALSE(load("[[rules]]\ncode = \"A\"\ntype = \"magic\"\nfield = \"employee_id\"\n").success);
    }
    SECTION("unknown severity") {
        CHECK_FALSE(load("[[rules]]\ncode = \"A\"\ntype = \"required\"\nfield = \"employee_id\"\nseverity = \"fatal\"\n").success);
    }
    SECTION("field unknown for scope") {
        auto r = load("[[rules]]\ncode = \"A\"\ntype = \"required\"\nscope = \"file\"\nfield = \"net_salary\"\n");
        REQUIRE_FALSE(r.success);
        CHECK(r.error_message == "Rule 'A': unknown header field 'net_salary'");
    }
    SECTION("format without pattern") {
        CHECK_FALSE(load("[[rules]]\ncode = \"A\"\ntype = \"format\"\nfield = \"iban\"\n").success);
    }
    SECTION("pattern does not compile") {
        CHECK_FALSE(load("[[rules]]\ncode = \"A\"\ntype = \"format\"\nfield = \"iban\"\npattern = \"[0-9\"\n").success);
    }
    SECTION("range bounds inverted") {
        CHECK_FALSE(load("[[rules]]\ncode = \"A\"\ntype = \"range\"\nfield = \"days_worked\"\nmin = 31\nmax = 0\n").success);
    }
    SECTION("range bound missing") {
        CHECK_FALSE(load("[[rules]]\ncode = \"A\"\ntype = \"range\"\nfield = \"days_worked\"\nmin = 1\n").success);
    }
    SECTION("reference without collection") {
        CHECK_FALSE(load("[[rules]]\ncode = \"A\"\ntype = \"reference\"\nfield = \"bank_routing_code\"\n").success);
    }
    SECTION("file-scoped unique without collection") {
        CHECK_FALSE(load("[[rules]]\ncode = \"A\"\ntype = \"unique\"\nscope = \"file\"\nfield = \"employer_id\"\n").success);
    }
    SECTION("unregistered check") {
        CHECK_FALSE(load("[[rules]]\ncode = \"A\"\ntype = \"calculation\"\ncheck = \"astrology\"\n").success);
    }
    SECTION("check registered for the other scope") {
        CHECK_FALSE(load("[[rules]]\ncode = \"A\"\ntype = \"business\"\ncheck = \"non_empty_batch\"\n").success);
    }
    SECTION("check arguments rejected") {
        auto r = load("[[rules]]\ncode = \"A\"\ntype = \"compliance\"\ncheck = \"minimum_wage\"\n");
        REQUIRE_FALSE(r.success);
        CHECK(r.error_message == "Rule 'A': check 'minimum_wage': missing argument 'amount'");
    }
    SECTION("malformed TOML") {
        auto r = load("[[rules]\ncode = ");
        REQUIRE_FALSE(r.success);
        CHECK(r.error_message.starts_with("TOML parse error"));
    }
}

TEST_CASE("RuleLoader: missing file", "[validation][loader]") {
    auto checks = DerivedCheckRegistry::with_builtins();
    auto r = RuleLoader::load_from_file("/nonexistent/rules.toml", *checks);
    REQUIRE_FALSE(r.success);
    CHECK(r.error_message == "Cannot open rules file: /nonexistent/rules.toml");
}
