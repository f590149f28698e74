#pragma once

#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace wpsgate {

enum class BankType {
    LOCAL,
    FOREIGN,
    ISLAMIC,
    EXCHANGE_HOUSE
};

struct BankInfo {
    std::string name;
    std::string code;               // 3-letter bank code
    std::string routing_code;       // WPS routing code (9 chars)
    std::string swift_code;         // SWIFT/BIC
    BankType type = BankType::LOCAL;
    bool wps_enabled = true;
};

[[nodiscard]] std::optional<BankType> parse_bank_type(std::string_view name);

/**
 * @brief UAE WPS bank registry
 *
 * Lookup by bank code, routing code or SWIFT/BIC. Codes and routing codes
 * are unique; a duplicate registration is rejected.
 *
 * Thread-safety: shared_mutex (lookups are concurrent, registration exclusive)
 */
class BankRegistry {
public:
    BankRegistry() = default;
    explicit BankRegistry(const std::vector<BankInfo>& banks);

    /// @return false if the code or routing code is already registered
    bool add(const BankInfo& bank);

    [[nodiscard]] std::optional<BankInfo> find_by_code(const std::string& code) const;
    [[nodiscard]] std::optional<BankInfo> find_by_routing_code(const std::string& routing_code) const;
    [[nodiscard]] std::optional<BankInfo> find_by_swift(const std::string& swift_code) const;

    /// Routing codes of WPS-enabled banks (reference collection for rules)
    [[nodiscard]] std::vector<std::string> routing_codes() const;

    /// Snapshot of all registered banks in registration order
    [[nodiscard]] std::vector<BankInfo> banks() const;

    [[nodiscard]] size_t size() const;

private:
    std::vector<BankInfo> banks_;
    std::unordered_map<std::string, size_t> by_code_;
    std::unordered_map<std::string, size_t> by_routing_;
    std::unordered_map<std::string, size_t> by_swift_;
    mutable std::shared_mutex mutex_;
};

} // namespace wpsgate
