#pragma once

#include "audit/audit_event.hpp"
#include "audit/audit_sink.hpp"

#include <nlohmann/json_fwd.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace wpsgate {

struct AuditConfig {
    bool enabled = true;
    std::string output_file;            // empty: no file sink
    bool integrity_enabled = true;      // SHA-256 hash chain
    size_t max_file_size_mb = 50;
    int max_files = 10;
};

/**
 * @brief Append-only audit trail
 *
 * Events are numbered, timestamped, optionally hash-chained and written
 * synchronously to every sink as one JSON line. Sink failures are logged
 * and counted, never propagated to the operation being audited.
 *
 * Chain: record_hash = SHA-256(<event JSON without hash fields> "|" previous_hash)
 */
class AuditTrail {
public:
    struct Stats {
        uint64_t total_recorded = 0;
        uint64_t write_failures = 0;
    };

    struct VerifyResult {
        bool intact = true;
        size_t records = 0;
        std::optional<uint64_t> first_broken_sequence;
        std::string error;
    };

    explicit AuditTrail(const AuditConfig& config = {});
    ~AuditTrail();

    AuditTrail(const AuditTrail&) = delete;
    AuditTrail& operator=(const AuditTrail&) = delete;

    void add_sink(std::shared_ptr<IAuditSink> sink);

    /// Stamp, chain and write an event (no-op when disabled)
    void record(AuditEvent event);

    void flush();
    void shutdown();

    [[nodiscard]] Stats stats() const;
    [[nodiscard]] std::string last_hash() const;
    [[nodiscard]] bool enabled() const { return enabled_; }

    [[nodiscard]] static nlohmann::json to_json(const AuditEvent& event);
    [[nodiscard]] static std::string compute_record_hash(const AuditEvent& event,
                                                         const std::string& prev_hash);

    /// Recompute the chain over serialized audit lines (in file order)
    [[nodiscard]] static VerifyResult verify_chain(const std::vector<std::string>& json_lines);

private:
    const bool enabled_;
    const bool integrity_enabled_;

    std::vector<std::shared_ptr<IAuditSink>> sinks_;
    uint64_t next_sequence_ = 1;
    std::string previous_hash_;
    mutable std::mutex mutex_;

    std::atomic<uint64_t> total_recorded_{0};
    std::atomic<uint64_t> write_failures_{0};
};

} // namespace wpsgate
