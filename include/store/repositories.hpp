#pragma once

#include "model/wps_batch.hpp"
#include "store/keyed_store.hpp"
#include "submission/bank_connection.hpp"
#include "submission/submission.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace wpsgate {

/**
 * @brief Batches keyed by reference, with the WPS/<YYYY>/<MM>/<NNNN> sequence
 */
class BatchRepository {
public:
    BatchRepository() : store_("batch") {}

    /// Next reference for the period; sequence is per (year, month)
    [[nodiscard]] std::string next_reference(const SalaryPeriod& period);

    /// Assigns a reference if the batch has none
    /// @throws StateError if the reference is already taken
    std::string add(WpsBatch batch);

    /// Insert or overwrite by reference
    /// @throws StateError if the stored batch is processed
    void save(const WpsBatch& batch);

    [[nodiscard]] WpsBatch get(const std::string& reference) const { return store_.get(reference); }
    [[nodiscard]] std::optional<WpsBatch> find(const std::string& reference) const { return store_.find(reference); }

    template<typename Fn>
    decltype(auto) update(const std::string& reference, Fn&& fn) {
        return store_.update(reference, std::forward<Fn>(fn));
    }

    [[nodiscard]] std::vector<WpsBatch> all() const { return store_.values(); }

private:
    KeyedStore<WpsBatch> store_;
    std::map<std::pair<int, unsigned>, unsigned> sequences_;
    std::mutex sequence_mutex_;
};

class ConnectionRepository {
public:
    ConnectionRepository() : store_("connection") {}

    /// @throws StateError on a duplicate name
    void add(BankConnection connection);

    [[nodiscard]] BankConnection get(const std::string& name) const { return store_.get(name); }
    [[nodiscard]] std::optional<BankConnection> find(const std::string& name) const { return store_.find(name); }

    template<typename Fn>
    decltype(auto) update(const std::string& name, Fn&& fn) {
        return store_.update(name, std::forward<Fn>(fn));
    }

    [[nodiscard]] std::vector<BankConnection> all() const { return store_.values(); }

private:
    KeyedStore<BankConnection> store_;
};

struct ConnectionStatistics {
    size_t total_submissions = 0;
    size_t successful_submissions = 0;
    size_t failed_submissions = 0;
};

/**
 * @brief Submissions keyed by reference (SUB/<YYYY>/<NNNNN>)
 */
class SubmissionRepository {
public:
    SubmissionRepository() : store_("submission") {}

    [[nodiscard]] std::string next_reference(int year);

    void add(const Submission& submission);

    [[nodiscard]] Submission get(const std::string& reference) const { return store_.get(reference); }
    [[nodiscard]] std::optional<Submission> find(const std::string& reference) const { return store_.find(reference); }

    template<typename Fn>
    decltype(auto) update(const std::string& reference, Fn&& fn) {
        return store_.update(reference, std::forward<Fn>(fn));
    }

    [[nodiscard]] std::vector<Submission> by_batch(const std::string& batch_reference) const;
    [[nodiscard]] ConnectionStatistics connection_statistics(const std::string& connection_name) const;
    [[nodiscard]] size_t size() const { return store_.size(); }

private:
    KeyedStore<Submission> store_;
    std::atomic<unsigned> sequence_{0};
};

} // namespace wpsgate
