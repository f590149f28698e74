#include "validation/validation_engine.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <future>
#include <map>
#include <thread>

namespace wpsgate {

ValidationEngine::ValidationEngine(std::shared_ptr<IRuleRepository> rules,
                                   std::shared_ptr<const DerivedCheckRegistry> checks,
                                   std::shared_ptr<const IReferenceData> reference,
                                   ValidationEngineConfig config)
    : rules_(std::move(rules)),
      reference_(std::move(reference)),
      evaluator_(std::move(checks)),
      config_(config) {}

ValidationResultLine ValidationEngine::make_line(const ValidationRule& rule,
                                                 const CheckOutcome& outcome) const {
    ValidationResultLine line;
    line.rule_code = rule.code;
    line.rule_name = rule.name;
    line.rule_type = rule.type;
    line.field = rule.field;
    line.passed = outcome.passed;
    line.severity = rule.severity;
    line.message = rule.message.empty() ? rule.name : rule.message;
    line.help_text = rule.help_text;
    line.detail = outcome.detail;
    return line;
}

ValidationResult ValidationEngine::evaluate(const WpsBatch& batch) const {
    if (!rules_) {
        throw StateError("validation engine has no rule repository");
    }

    // One snapshot for the whole run; later edits apply to the next run
    const auto rules = rules_->list_active_rules();
    auto result = evaluate(batch, rules);

    std::map<std::string, uint64_t> failures;
    for (const auto& line : result.lines) {
        if (!line.passed) ++failures[line.rule_code];
    }
    const uint64_t line_count = batch.lines().size();
    for (const auto& rule : rules) {
        const uint64_t checks = rule.is_file_scoped() ? 1 : line_count;
        const auto it = failures.find(rule.code);
        rules_->record_statistics(rule.code, checks, it == failures.end() ? 0 : it->second);
    }
    return result;
}

ValidationResult ValidationEngine::evaluate(const WpsBatch& batch,
                                            const std::vector<ValidationRule>& rules) const {
    utils::Timer timer;

    std::vector<const ValidationRule*> file_rules;
    std::vector<const ValidationRule*> line_rules;
    std::vector<std::string> unique_fields;
    for (const auto& rule : rules) {
        if (!rule.active) continue;
        if (rule.is_file_scoped()) {
            file_rules.push_back(&rule);
            continue;
        }
        line_rules.push_back(&rule);
        const auto* unique = std::get_if<UniqueCheck>(&rule.check);
        if (unique && !unique->collection &&
            std::find(unique_fields.begin(), unique_fields.end(), rule.field) == unique_fields.end()) {
            unique_fields.push_back(rule.field);
        }
    }

    const auto& lines = batch.lines();
    const SiblingIndex siblings(lines, unique_fields);
    const ValidationContext ctx{batch, reference_.get(), &siblings};

    ValidationResult result;
    result.batch_reference = batch.reference();

    // File rules: once, sequentially, passes and failures recorded
    for (const auto* rule : file_rules) {
        result.lines.push_back(make_line(*rule, evaluator_.evaluate_file(*rule, batch, ctx)));
    }

    // Line rules: failures only, merged by line index
    std::vector<std::vector<ValidationResultLine>> per_line(lines.size());

    auto check_range = [&](size_t start, size_t end) {
        for (size_t i = start; i < end; ++i) {
            for (const auto* rule : line_rules) {
                const auto outcome = evaluator_.evaluate_line(*rule, lines[i], ctx);
                if (outcome.passed) continue;
                auto entry = make_line(*rule, outcome);
                entry.line_index = i;
                entry.record_name = lines[i].display_name();
                per_line[i].push_back(std::move(entry));
            }
        }
    };

    const size_t num_lines = lines.size();
    const unsigned hw_threads = std::thread::hardware_concurrency();

    if (config_.parallel && !line_rules.empty() && num_lines >= config_.parallel_threshold &&
        hw_threads > 1 && config_.max_threads > 1) {
        const size_t num_workers = std::min<size_t>(hw_threads, config_.max_threads);
        const size_t chunk = (num_lines + num_workers - 1) / num_workers;

        std::vector<std::future<void>> futures;
        futures.reserve(num_workers);
        for (size_t w = 0; w < num_workers; ++w) {
            const size_t start = w * chunk;
            const size_t end = std::min(start + chunk, num_lines);
            if (start >= end) break;
            futures.push_back(std::async(std::launch::async, check_range, start, end));
        }
        for (auto& f : futures) f.get();
    } else {
        check_range(0, num_lines);
    }

    for (auto& entries : per_line) {
        for (auto& entry : entries) result.lines.push_back(std::move(entry));
    }

    result.total_checks = file_rules.size() + num_lines * line_rules.size();
    result.finalize();

    utils::log::info(std::format(
        "Validated batch {}: {} checks, {} errors, {} warnings -> {} ({} us)",
        batch.reference(), result.total_checks, result.failed, result.warnings,
        validation_status_to_string(result.status), timer.elapsed().count()));
    return result;
}

} // namespace wpsgate
