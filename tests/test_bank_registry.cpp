#include <catch2/catch_test_macros.hpp>
#include "model/bank_registry.hpp"

using namespace wpsgate;

namespace {

BankRegistry sample_registry() {
    return BankRegistry({
        {"Emirates NBD", "ENBD", "302620122", "EBILAEAD", BankType::LOCAL, true},
        {"First Abu Dhabi Bank", "FAB", "303510101", "NBADAEAA", BankType::LOCAL, true},
        {"Al Ansari Exchange", "AAE", "740110101", "", BankType::EXCHANGE_HOUSE, false},
    });
}

} // namespace

TEST_CASE("BankRegistry: lookup by code, routing code and SWIFT", "[bank]") {
    auto registry = sample_registry();
    REQUIRE(registry.size() == 3);

    auto by_code = registry.find_by_code("FAB");
    REQUIRE(by_code.has_value());
    CHECK(by_code->routing_code == "303510101");

    auto by_routing = registry.find_by_routing_code("302620122");
    REQUIRE(by_routing.has_value());
    CHECK(by_routing->code == "ENBD");

    CHECK_FALSE(registry.find_by_code("XXX").has_value());
}

TEST_CASE("BankRegistry: branch BIC resolves to the bank", "[bank]") {
    auto registry = sample_registry();
    auto bank = registry.find_by_swift("EBILAEADXXX");
    REQUIRE(bank.has_value());
    CHECK(bank->code == "ENBD");
    CHECK_FALSE(registry.find_by_swift("EBIL").has_value());
}

TEST_CASE("BankRegistry: duplicate code or routing code is refused", "[bank]") {
    auto registry = sample_registry();
    CHECK_FALSE(registry.add({"Other", "FAB", "999999999", "", BankType::LOCAL, true}));
    CHECK_FALSE(registry.add({"Other", "OTH", "302620122", "", BankType::LOCAL, true}));
    CHECK(registry.add({"Dubai Islamic Bank", "DIB", "302410101", "DUIBAEAD", BankType::ISLAMIC, true}));
    CHECK(registry.size() == 4);
}

TEST_CASE("BankRegistry: routing codes list only WPS-enabled banks", "[bank]") {
    auto codes = sample_registry().routing_codes();
    REQUIRE(codes.size() == 2);
    CHECK(codes[0] == "302620122");
    CHECK(codes[1] == "303510101");
}

TEST_CASE("BankRegistry: bank type names", "[bank]") {
    CHECK(parse_bank_type("Islamic") == BankType::ISLAMIC);
    CHECK(parse_bank_type("exchange") == BankType::EXCHANGE_HOUSE);
    CHECK(parse_bank_type("exchange_house") == BankType::EXCHANGE_HOUSE);
    CHECK_FALSE(parse_bank_type("credit_union").has_value());
}
