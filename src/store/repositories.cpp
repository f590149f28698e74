#include "store/repositories.hpp"

#include <format>

namespace wpsgate {

std::string BatchRepository::next_reference(const SalaryPeriod& period) {
    std::lock_guard<std::mutex> lock(sequence_mutex_);
    auto& seq = sequences_[{period.year, period.month}];
    std::string reference;
    do {
        reference = std::format("WPS/{:04d}/{:02d}/{:04d}", period.year, period.month, ++seq);
    } while (store_.contains(reference));
    return reference;
}

std::string BatchRepository::add(WpsBatch batch) {
    if (batch.reference().empty()) {
        batch.set_reference(next_reference(batch.period()));
    }
    const auto reference = batch.reference();
    if (!store_.insert(reference, std::move(batch))) {
        throw StateError(std::format("batch {} already exists", reference));
    }
    return reference;
}

void BatchRepository::save(const WpsBatch& batch) {
    store_.upsert(batch.reference(), batch, [](const WpsBatch& stored) {
        if (stored.is_frozen()) {
            throw StateError(std::format("batch {} is processed and cannot be overwritten",
                stored.reference()));
        }
    });
}

void ConnectionRepository::add(BankConnection connection) {
    const auto name = connection.name;
    if (!store_.insert(name, std::move(connection))) {
        throw StateError(std::format("connection {} already exists", name));
    }
}

std::string SubmissionRepository::next_reference(int year) {
    return std::format("SUB/{:04d}/{:05d}", year, ++sequence_);
}

void SubmissionRepository::add(const Submission& submission) {
    if (!store_.insert(submission.reference, submission)) {
        throw StateError(std::format("submission {} already exists", submission.reference));
    }
}

std::vector<Submission> SubmissionRepository::by_batch(const std::string& batch_reference) const {
    std::vector<Submission> out;
    for (auto& s : store_.values()) {
        if (s.batch_reference == batch_reference) out.push_back(std::move(s));
    }
    return out;
}

ConnectionStatistics SubmissionRepository::connection_statistics(const std::string& connection_name) const {
    ConnectionStatistics stats;
    for (const auto& s : store_.values()) {
        if (s.connection_name != connection_name) continue;
        ++stats.total_submissions;
        if (s.state() == SubmissionState::SUCCESS) ++stats.successful_submissions;
        if (s.state() == SubmissionState::FAILED) ++stats.failed_submissions;
    }
    return stats;
}

} // namespace wpsgate
