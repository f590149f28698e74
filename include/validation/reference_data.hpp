#pragma once

#include "model/bank_registry.hpp"

#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace wpsgate {

/**
 * @brief Named collections that reference and unique rules resolve against
 *
 * Collection names are "<entity>.<field>", e.g. "banks.routing_code".
 * Read-only during an evaluation run.
 */
class IReferenceData {
public:
    virtual ~IReferenceData() = default;

    [[nodiscard]] virtual bool has_collection(std::string_view collection) const = 0;
    [[nodiscard]] virtual bool contains(std::string_view collection, std::string_view value) const = 0;
};

class InMemoryReferenceData : public IReferenceData {
public:
    InMemoryReferenceData() = default;

    void add(const std::string& collection, const std::string& value);
    void add_collection(const std::string& collection);

    /// Registers "banks.routing_code", "banks.code" and "banks.swift_code"
    /// from the WPS-enabled banks of a registry
    void add_banks(const BankRegistry& registry);

    [[nodiscard]] bool has_collection(std::string_view collection) const override;
    [[nodiscard]] bool contains(std::string_view collection, std::string_view value) const override;

private:
    std::unordered_map<std::string, std::unordered_set<std::string>> collections_;
};

} // namespace wpsgate
