#include "validation/validation_report.hpp"

#include <format>

namespace wpsgate {

nlohmann::json validation_result_to_json(const ValidationResult& result) {
    nlohmann::json j;
    j["batch_reference"] = result.batch_reference;
    j["status"] = validation_status_to_string(result.status);
    j["can_submit"] = result.can_submit;
    j["total_checks"] = result.total_checks;
    j["passed"] = result.passed;
    j["failed"] = result.failed;
    j["warnings"] = result.warnings;
    j["infos"] = result.infos;

    auto lines = nlohmann::json::array();
    for (const auto& line : result.lines) {
        nlohmann::json entry;
        entry["rule_code"] = line.rule_code;
        entry["rule_name"] = line.rule_name;
        entry["rule_type"] = rule_type_to_string(line.rule_type);
        entry["field"] = line.field;
        entry["passed"] = line.passed;
        entry["severity"] = severity_to_string(line.severity);
        entry["message"] = line.message;
        if (!line.help_text.empty()) entry["help"] = line.help_text;
        if (!line.detail.empty()) entry["detail"] = line.detail;
        if (line.line_index) {
            entry["line"] = *line.line_index + 1;
            entry["record"] = line.record_name;
        }
        lines.push_back(std::move(entry));
    }
    j["results"] = std::move(lines);
    return j;
}

std::string format_validation_summary(const ValidationResult& result) {
    std::string out = std::format("Batch {}: {} ({} checks, {} passed, {} errors, {} warnings)\n",
        result.batch_reference, validation_status_to_string(result.status),
        result.total_checks, result.passed, result.failed, result.warnings);

    for (const auto* line : result.failures()) {
        const auto where = line->line_index
            ? std::format("line {} ({})", *line->line_index + 1, line->record_name)
            : std::string("file");
        out += std::format("  [{}] {} {}: {}", severity_to_string(line->severity),
                           line->rule_code, where, line->message);
        if (!line->detail.empty()) out += std::format(" ({})", line->detail);
        out += '\n';
    }
    out += result.can_submit ? "Submission allowed\n" : "Submission blocked\n";
    return out;
}

void ValidationHistory::record(const ValidationResult& result, const std::string& actor,
                               std::chrono::system_clock::time_point at) {
    std::lock_guard<std::mutex> lock(mutex_);
    runs_[result.batch_reference].push_back(ValidationRun{result, actor, at});
}

std::vector<ValidationRun> ValidationHistory::runs(const std::string& batch_reference) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = runs_.find(batch_reference);
    return it == runs_.end() ? std::vector<ValidationRun>{} : it->second;
}

std::optional<ValidationRun> ValidationHistory::latest(const std::string& batch_reference) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = runs_.find(batch_reference);
    if (it == runs_.end() || it->second.empty()) return std::nullopt;
    return it->second.back();
}

} // namespace wpsgate
