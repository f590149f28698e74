#pragma once

#include "audit/audit_trail.hpp"
#include "model/wps_batch.hpp"
#include "reconciliation/statement_source.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wpsgate {

enum class ReconciliationState {
    DRAFT,          // nothing to reconcile yet
    IN_PROGRESS,
    RECONCILED,     // every line matched
    PARTIAL,        // some lines matched
    DISCREPANCY,    // no line matched
};

enum class MatchState {
    UNMATCHED,
    MATCHED,        // same amount, reference names the employee or account
    PARTIAL,        // amount within tolerance only
    DISCREPANCY,    // flagged by an operator
    MANUAL,         // matched by an operator
};

inline const char* reconciliation_state_to_string(ReconciliationState state) {
    switch (state) {
        case ReconciliationState::DRAFT:       return "draft";
        case ReconciliationState::IN_PROGRESS: return "in_progress";
        case ReconciliationState::RECONCILED:  return "reconciled";
        case ReconciliationState::PARTIAL:     return "partial";
        case ReconciliationState::DISCREPANCY: return "discrepancy";
    }
    return "unknown";
}

inline const char* match_state_to_string(MatchState state) {
    switch (state) {
        case MatchState::UNMATCHED:   return "unmatched";
        case MatchState::MATCHED:     return "matched";
        case MatchState::PARTIAL:     return "partial";
        case MatchState::DISCREPANCY: return "discrepancy";
        case MatchState::MANUAL:      return "manual";
    }
    return "unknown";
}

/**
 * @brief One paid WPS line and the statement transaction found for it
 */
struct ReconciliationLine {
    std::string batch_reference;
    std::string employee_ref;
    std::string employee_name;
    std::string account;            // IBAN or account number paid into
    double wps_amount = 0.0;

    std::optional<std::string> statement_line_id;
    double bank_amount = 0.0;
    std::string bank_reference;
    std::optional<std::chrono::year_month_day> bank_date;

    MatchState state = MatchState::UNMATCHED;
    std::string difference_reason;
    std::string matched_by;         // operator, for manual matches
    std::string notes;

    [[nodiscard]] double difference() const { return wps_amount - bank_amount; }
    [[nodiscard]] bool is_matched() const {
        return state == MatchState::MATCHED || state == MatchState::MANUAL;
    }
};

struct ReconciliationSummary {
    int64_t total_wps_subunits = 0;
    int64_t total_bank_subunits = 0;
    size_t total_employees = 0;
    size_t matched_employees = 0;
    size_t unmatched_employees = 0;     // every line not matched, partial ones included

    [[nodiscard]] int64_t difference_subunits() const { return total_wps_subunits - total_bank_subunits; }
    [[nodiscard]] double match_percentage() const {
        if (total_employees == 0) return 0.0;
        return static_cast<double>(matched_employees) * 100.0 / static_cast<double>(total_employees);
    }
};

/**
 * @brief Payments of one or more processed batches checked against the bank statement
 */
struct Reconciliation {
    std::string reference;          // REC/<YYYY>/<NNNN>
    std::chrono::year_month_day period_from;
    std::chrono::year_month_day period_to;
    std::vector<std::string> batch_references;
    std::string statement_source;
    ReconciliationState state = ReconciliationState::DRAFT;
    std::vector<ReconciliationLine> lines;
    std::string completed_by;

    [[nodiscard]] ReconciliationSummary summary() const;
};

struct ReconcilerConfig {
    double amount_tolerance = 0.01;     // fraction of the WPS amount for partial matches
};

/**
 * @brief Matches WPS salary lines to bank statement transactions
 *
 * Exact match: same absolute amount (to the fils) and a statement reference
 * containing the employee name or the account paid into. Failing that, the
 * first transaction within the amount tolerance is a partial match. A
 * statement transaction is matched to at most one line.
 */
class PaymentReconciler {
public:
    PaymentReconciler(std::shared_ptr<const IBankStatementSource> statements,
                      ReconcilerConfig config = {},
                      std::shared_ptr<AuditTrail> audit = nullptr);

    /**
     * Build lines from the batches and auto-match them.
     * @throws StateError if a batch is not processed or the period is inverted
     */
    Reconciliation start(const std::vector<WpsBatch>& batches,
                         const std::chrono::year_month_day& from,
                         const std::chrono::year_month_day& to,
                         const std::string& actor);

    /// @throws NotFoundError if the line index is out of range
    void manual_match(Reconciliation& reconciliation, size_t line_index,
                      const std::string& actor, const std::string& notes = {}) const;

    /// @throws NotFoundError if the line index is out of range
    void mark_discrepancy(Reconciliation& reconciliation, size_t line_index,
                          const std::string& reason) const;

    /// @throws StateError while any line is still unmatched
    void complete(Reconciliation& reconciliation, const std::string& actor) const;

    [[nodiscard]] const ReconcilerConfig& config() const { return config_; }

private:
    void auto_match(Reconciliation& reconciliation, std::vector<StatementLine> statement) const;
    static ReconciliationState derive_state(const Reconciliation& reconciliation);
    void audit(AuditEvent event) const;

    std::shared_ptr<const IBankStatementSource> statements_;
    ReconcilerConfig config_;
    std::shared_ptr<AuditTrail> audit_;
    std::atomic<unsigned> sequence_{0};
};

} // namespace wpsgate
