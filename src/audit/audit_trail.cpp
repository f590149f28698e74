#include "audit/audit_trail.hpp"
#include "audit/file_sink.hpp"
#include "core/digest.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <format>

namespace wpsgate {

namespace {

constexpr const char* kRecordHashKey = "record_hash";
constexpr const char* kPreviousHashKey = "previous_hash";

// Invalid UTF-8 in bank responses is replaced, never thrown on
std::string dump_line(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string chain_hash(const nlohmann::json& body, const std::string& prev_hash) {
    return digest::sha256_hex(dump_line(body) + "|" + prev_hash);
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

AuditTrail::AuditTrail(const AuditConfig& config)
    : enabled_(config.enabled),
      integrity_enabled_(config.integrity_enabled) {
    if (enabled_ && !config.output_file.empty()) {
        FileSink::Config file_cfg;
        file_cfg.output_file = config.output_file;
        file_cfg.max_file_size_bytes = config.max_file_size_mb * 1024ULL * 1024;
        file_cfg.max_files = config.max_files;
        sinks_.push_back(std::make_shared<FileSink>(file_cfg));
        utils::log::info(std::format("Audit trail writing to {}", sinks_.back()->name()));
    }
}

AuditTrail::~AuditTrail() {
    shutdown();
}

void AuditTrail::add_sink(std::shared_ptr<IAuditSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

// ============================================================================
// Recording
// ============================================================================

void AuditTrail::record(AuditEvent event) {
    if (!enabled_) return;

    std::lock_guard<std::mutex> lock(mutex_);
    event.sequence_num = next_sequence_++;
    event.timestamp = utils::now();

    auto j = to_json(event);
    if (integrity_enabled_) {
        event.previous_hash = previous_hash_;
        event.record_hash = chain_hash(j, previous_hash_);
        previous_hash_ = event.record_hash;
        j[kPreviousHashKey] = event.previous_hash;
        j[kRecordHashKey] = event.record_hash;
    }

    const auto line = dump_line(j);
    for (const auto& sink : sinks_) {
        if (!sink->write(line)) {
            write_failures_.fetch_add(1, std::memory_order_relaxed);
            utils::log::error(std::format("Audit sink {} failed to write event #{} ({})",
                                          sink->name(), event.sequence_num, event.event));
        }
    }
    total_recorded_.fetch_add(1, std::memory_order_relaxed);
}

void AuditTrail::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) sink->flush();
}

void AuditTrail::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) sink->shutdown();
}

AuditTrail::Stats AuditTrail::stats() const {
    return Stats{
        .total_recorded = total_recorded_.load(std::memory_order_relaxed),
        .write_failures = write_failures_.load(std::memory_order_relaxed),
    };
}

std::string AuditTrail::last_hash() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return previous_hash_;
}

// ============================================================================
// Serialization / integrity
// ============================================================================

nlohmann::json AuditTrail::to_json(const AuditEvent& event) {
    nlohmann::json j;
    j["seq"] = event.sequence_num;
    j["timestamp"] = utils::format_timestamp(event.timestamp);
    j["event"] = event.event;
    if (!event.actor.empty()) j["actor"] = event.actor;
    if (!event.batch_reference.empty()) j["batch"] = event.batch_reference;
    if (!event.submission_reference.empty()) j["submission"] = event.submission_reference;
    if (!event.connection_name.empty()) j["connection"] = event.connection_name;
    if (!event.outcome.empty()) j["outcome"] = event.outcome;
    if (!event.message.empty()) j["message"] = event.message;
    if (!event.details.empty()) j["details"] = event.details;
    return j;
}

std::string AuditTrail::compute_record_hash(const AuditEvent& event,
                                            const std::string& prev_hash) {
    return chain_hash(to_json(event), prev_hash);
}

AuditTrail::VerifyResult AuditTrail::verify_chain(const std::vector<std::string>& json_lines) {
    VerifyResult result;
    // The first line anchors the chain (rotated files start mid-chain)
    std::optional<std::string> expected_prev;

    for (const auto& line : json_lines) {
        if (utils::trim(line).empty()) continue;

        auto j = nlohmann::json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            result.intact = false;
            result.error = std::format("line {} is not a JSON object", result.records + 1);
            return result;
        }

        const auto seq = j.value("seq", uint64_t{0});
        const auto record_hash = j.value(kRecordHashKey, std::string{});
        const auto previous_hash = j.value(kPreviousHashKey, std::string{});
        j.erase(kRecordHashKey);
        j.erase(kPreviousHashKey);

        ++result.records;
        if (record_hash.empty()) {
            result.intact = false;
            result.first_broken_sequence = seq;
            result.error = std::format("event #{} carries no hash", seq);
            return result;
        }
        if (expected_prev && previous_hash != *expected_prev) {
            result.intact = false;
            result.first_broken_sequence = seq;
            result.error = std::format("event #{} does not link to its predecessor", seq);
            return result;
        }
        if (chain_hash(j, previous_hash) != record_hash) {
            result.intact = false;
            result.first_broken_sequence = seq;
            result.error = std::format("event #{} content does not match its hash", seq);
            return result;
        }
        expected_prev = record_hash;
    }
    return result;
}

} // namespace wpsgate
