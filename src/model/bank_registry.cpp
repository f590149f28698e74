#include "model/bank_registry.hpp"
#include "core/utils.hpp"

#include <format>
#include <mutex>

namespace wpsgate {

std::optional<BankType> parse_bank_type(std::string_view name) {
    const std::string lower = utils::to_lower(std::string(name));
    if (lower == "local") return BankType::LOCAL;
    if (lower == "foreign") return BankType::FOREIGN;
    if (lower == "islamic") return BankType::ISLAMIC;
    if (lower == "exchange" || lower == "exchange_house") return BankType::EXCHANGE_HOUSE;
    return std::nullopt;
}

BankRegistry::BankRegistry(const std::vector<BankInfo>& banks) {
    for (const auto& bank : banks) {
        if (!add(bank)) {
            utils::log::warn(std::format("Duplicate bank registration ignored: {} ({})",
                                         bank.name, bank.code));
        }
    }
}

bool BankRegistry::add(const BankInfo& bank) {
    std::unique_lock lock(mutex_);
    if (by_code_.contains(bank.code) || by_routing_.contains(bank.routing_code)) {
        return false;
    }

    const size_t idx = banks_.size();
    banks_.push_back(bank);
    by_code_.emplace(bank.code, idx);
    by_routing_.emplace(bank.routing_code, idx);
    if (!bank.swift_code.empty()) {
        // 8-char BIC and its 11-char branch form resolve to the same bank
        by_swift_.emplace(bank.swift_code.substr(0, 8), idx);
    }
    return true;
}

std::optional<BankInfo> BankRegistry::find_by_code(const std::string& code) const {
    std::shared_lock lock(mutex_);
    const auto it = by_code_.find(code);
    if (it == by_code_.end()) return std::nullopt;
    return banks_[it->second];
}

std::optional<BankInfo> BankRegistry::find_by_routing_code(const std::string& routing_code) const {
    std::shared_lock lock(mutex_);
    const auto it = by_routing_.find(routing_code);
    if (it == by_routing_.end()) return std::nullopt;
    return banks_[it->second];
}

std::optional<BankInfo> BankRegistry::find_by_swift(const std::string& swift_code) const {
    if (swift_code.size() < 8) return std::nullopt;
    std::shared_lock lock(mutex_);
    const auto it = by_swift_.find(swift_code.substr(0, 8));
    if (it == by_swift_.end()) return std::nullopt;
    return banks_[it->second];
}

std::vector<std::string> BankRegistry::routing_codes() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> codes;
    codes.reserve(banks_.size());
    for (const auto& bank : banks_) {
        if (bank.wps_enabled) {
            codes.push_back(bank.routing_code);
        }
    }
    return codes;
}

std::vector<BankInfo> BankRegistry::banks() const {
    std::shared_lock lock(mutex_);
    return banks_;
}

size_t BankRegistry::size() const {
    std::shared_lock lock(mutex_);
    return banks_.size();
}

} // namespace wpsgate
