#include <catch2/catch_test_macros.hpp>
#include "assembler/json_payroll_source.hpp"
#include "assembler/line_assembler.hpp"
#include "core/error.hpp"
#include "mocks/batch_fixtures.hpp"

#include <memory>

using namespace wpsgate;

namespace {

constexpr const char* kPayroll = R"({
  "employees": [
    { "employee_ref": "E001", "name": "Aisha", "company_id": "1", "department": "Ops",
      "emirates_id": "784199012345676", "contract_active": true,
      "bank_account": { "account_number": "1011223344", "swift_code": "EBILAEADXXX" },
      "wage": 5000.0, "housing_allowance": 1250.0, "transport_allowance": 500.0 },
    { "employee_ref": "E002", "name": "Omar", "company_id": "1", "department": "Sales",
      "emirates_id": "784198511111118", "contract_active": true,
      "wage": 4000.0, "deductions": 250.0, "days_worked": 20 },
    { "employee_ref": "E003", "name": "Former", "company_id": "1", "department": "Ops",
      "contract_active": false, "wage": 3000.0 },
    { "employee_ref": "E004", "name": "Other Co", "company_id": "2", "department": "Ops",
      "contract_active": true, "wage": 3000.0,
      "bank_account": { "iban": "AE070331234567890123456", "swift_code": "ZZZZAEAD" } }
  ]
})";

std::shared_ptr<const BankRegistry> banks() {
    return std::make_shared<const BankRegistry>(std::vector<BankInfo>{
        {"Emirates NBD", "ENBD", "302620122", "EBILAEAD", BankType::LOCAL, true},
    });
}

LineAssembler make_assembler() {
    auto source = std::make_shared<const JsonPayrollSource>(JsonPayrollSource::from_string(kPayroll));
    return LineAssembler(source, banks());
}

} // namespace

TEST_CASE("LineAssembler: one line per active employee in scope", "[assembler]") {
    auto lines = make_assembler().assemble(EmployerScope{.company_id = "1"});
    REQUIRE(lines.size() == 2);
    CHECK(lines[0].employee_ref == "E001");
    CHECK(lines[1].employee_ref == "E002");
}

TEST_CASE("LineAssembler: absent components resolve to zero and net is computed", "[assembler]") {
    auto lines = make_assembler().assemble(EmployerScope{.company_id = "1"});
    REQUIRE(lines.size() == 2);

    CHECK(lines[0].net_salary == 6750.0);
    CHECK(lines[0].days_worked == 30);
    CHECK(lines[0].other_allowance == 0.0);

    CHECK(lines[1].net_salary == 3750.0);
    CHECK(lines[1].days_worked == 20);
}

TEST_CASE("LineAssembler: routing code comes from the bank registry", "[assembler]") {
    auto lines = make_assembler().assemble(EmployerScope{.company_id = "1"});
    CHECK(lines[0].bank_code == "302620122");
    CHECK(lines[0].account() == "1011223344");
}

TEST_CASE("LineAssembler: employee without account still gets a line", "[assembler]") {
    auto lines = make_assembler().assemble(EmployerScope{.company_id = "1"});
    CHECK(lines[1].account().empty());
    CHECK(lines[1].bank_code.empty());
}

TEST_CASE("LineAssembler: unknown BIC falls through verbatim", "[assembler]") {
    auto lines = make_assembler().assemble(EmployerScope{.company_id = "2"});
    REQUIRE(lines.size() == 1);
    CHECK(lines[0].bank_code == "ZZZZAEAD");
    CHECK(lines[0].account() == "AE070331234567890123456");
}

TEST_CASE("LineAssembler: department and explicit employee filters", "[assembler]") {
    auto assembler = make_assembler();

    auto ops = assembler.assemble(EmployerScope{.company_id = "1", .department = "Ops"});
    REQUIRE(ops.size() == 1);
    CHECK(ops[0].employee_ref == "E001");

    auto picked = assembler.assemble(EmployerScope{.company_id = "1", .employee_refs = {"E002"}});
    REQUIRE(picked.size() == 1);
    CHECK(picked[0].employee_ref == "E002");
}

TEST_CASE("LineAssembler: empty scope is an error", "[assembler]") {
    CHECK_THROWS_AS(make_assembler().assemble(EmployerScope{.company_id = "9"}), StateError);
}

TEST_CASE("LineAssembler: rebuild replaces lines and is idempotent", "[assembler]") {
    auto assembler = make_assembler();
    auto batch = testing::make_batch({testing::make_line(), testing::make_line(), testing::make_line()});

    CHECK(assembler.rebuild(batch, EmployerScope{.company_id = "1"}) == 2);
    CHECK(batch.lines().size() == 2);
    CHECK(batch.eligible_employee_count() == 2);

    CHECK(assembler.rebuild(batch, EmployerScope{.company_id = "1"}) == 2);
    CHECK(batch.lines().size() == 2);
}

TEST_CASE("LineAssembler: processed batch cannot be rebuilt", "[assembler]") {
    auto batch = testing::make_batch();
    batch.restore_state(BatchState::PROCESSED);
    CHECK_THROWS_AS(make_assembler().rebuild(batch, EmployerScope{.company_id = "1"}), StateError);
}

TEST_CASE("JsonPayrollSource: malformed input is rejected", "[assembler]") {
    CHECK_THROWS_AS(JsonPayrollSource::from_string("{ not json"), FormatError);
    CHECK_THROWS_AS(JsonPayrollSource::from_string(R"({"staff": []})"), FormatError);
}
