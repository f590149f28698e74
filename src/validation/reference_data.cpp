#include "validation/reference_data.hpp"

namespace wpsgate {

void InMemoryReferenceData::add(const std::string& collection, const std::string& value) {
    collections_[collection].insert(value);
}

void InMemoryReferenceData::add_collection(const std::string& collection) {
    collections_.try_emplace(collection);
}

void InMemoryReferenceData::add_banks(const BankRegistry& registry) {
    add_collection("banks.routing_code");
    add_collection("banks.code");
    add_collection("banks.swift_code");
    for (const auto& bank : registry.banks()) {
        if (!bank.wps_enabled) continue;
        add("banks.routing_code", bank.routing_code);
        add("banks.code", bank.code);
        if (!bank.swift_code.empty()) add("banks.swift_code", bank.swift_code);
    }
}

bool InMemoryReferenceData::has_collection(std::string_view collection) const {
    return collections_.contains(std::string(collection));
}

bool InMemoryReferenceData::contains(std::string_view collection, std::string_view value) const {
    const auto it = collections_.find(std::string(collection));
    if (it == collections_.end()) return false;
    return it->second.contains(std::string(value));
}

} // namespace wpsgate
