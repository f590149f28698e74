#pragma once

#include "validation/validation_types.hpp"

#include <nlohmann/json.hpp>

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace wpsgate {

[[nodiscard]] nlohmann::json validation_result_to_json(const ValidationResult& result);

/// Human-readable summary for the CLI (one failure per line)
[[nodiscard]] std::string format_validation_summary(const ValidationResult& result);

/**
 * @brief Prior validation runs per batch, newest last
 *
 * Actor and time are stamped on the run, never inside the result, so the
 * result content stays comparable across runs.
 */
class ValidationHistory {
public:
    void record(const ValidationResult& result, const std::string& actor,
                std::chrono::system_clock::time_point at);

    [[nodiscard]] std::vector<ValidationRun> runs(const std::string& batch_reference) const;
    [[nodiscard]] std::optional<ValidationRun> latest(const std::string& batch_reference) const;

private:
    std::unordered_map<std::string, std::vector<ValidationRun>> runs_;
    mutable std::mutex mutex_;
};

} // namespace wpsgate
