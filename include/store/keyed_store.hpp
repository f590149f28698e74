#pragma once

#include "core/error.hpp"

#include <format>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace wpsgate {

/**
 * @brief Thread-safe in-memory record store keyed by reference
 *
 * Readers get copies; writers mutate in place under the store lock so that
 * a record is never observed half-updated. Iteration is in key order.
 */
template<typename T>
class KeyedStore {
public:
    explicit KeyedStore(std::string kind) : kind_(std::move(kind)) {}

    /// @return false if the key already exists
    bool insert(const std::string& key, T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.emplace(key, std::move(value)).second;
    }

    void upsert(const std::string& key, T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.insert_or_assign(key, std::move(value));
    }

    /// Replace or insert; check(existing) runs under the lock and throws to refuse
    template<typename Check>
    void upsert(const std::string& key, T value, Check&& check) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (const auto it = records_.find(key); it != records_.end()) {
            std::forward<Check>(check)(it->second);
        }
        records_.insert_or_assign(key, std::move(value));
    }

    [[nodiscard]] std::optional<T> find(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = records_.find(key);
        if (it == records_.end()) return std::nullopt;
        return it->second;
    }

    /// @throws NotFoundError
    [[nodiscard]] T get(const std::string& key) const {
        auto record = find(key);
        if (!record) throw NotFoundError(std::format("{} '{}' not found", kind_, key));
        return std::move(*record);
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.contains(key);
    }

    /// Apply fn to the stored record under the lock and return its result
    /// @throws NotFoundError
    template<typename Fn>
    decltype(auto) update(const std::string& key, Fn&& fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = records_.find(key);
        if (it == records_.end()) throw NotFoundError(std::format("{} '{}' not found", kind_, key));
        return std::forward<Fn>(fn)(it->second);
    }

    bool erase(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.erase(key) > 0;
    }

    [[nodiscard]] std::vector<T> values() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> out;
        out.reserve(records_.size());
        for (const auto& [_, record] : records_) out.push_back(record);
        return out;
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.size();
    }

private:
    std::string kind_;
    std::map<std::string, T> records_;
    mutable std::mutex mutex_;
};

} // namespace wpsgate
