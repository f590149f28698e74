#include "reconciliation/payment_reconciler.hpp"
#include "core/error.hpp"
#include "core/money.hpp"
#include "core/utils.hpp"

#include <cmath>
#include <cstdlib>
#include <format>

namespace wpsgate {

namespace {

bool reference_names(const std::string& reference, const ReconciliationLine& line) {
    const auto haystack = utils::to_lower(reference);
    if (!line.employee_name.empty() && haystack.find(utils::to_lower(line.employee_name)) != std::string::npos) {
        return true;
    }
    return !line.account.empty() && haystack.find(utils::to_lower(line.account)) != std::string::npos;
}

void take(ReconciliationLine& line, const StatementLine& tx, MatchState state) {
    line.statement_line_id = tx.id;
    line.bank_amount = std::abs(tx.amount);
    line.bank_reference = tx.reference;
    line.bank_date = tx.date;
    line.state = state;
}

ReconciliationLine& line_at(Reconciliation& reconciliation, size_t line_index) {
    if (line_index >= reconciliation.lines.size()) {
        throw NotFoundError(std::format("reconciliation {} has no line {}",
                                        reconciliation.reference, line_index));
    }
    return reconciliation.lines[line_index];
}

} // anonymous namespace

ReconciliationSummary Reconciliation::summary() const {
    ReconciliationSummary s;
    s.total_employees = lines.size();
    for (const auto& line : lines) {
        s.total_wps_subunits += money::round_to_subunits(line.wps_amount);
        s.total_bank_subunits += money::round_to_subunits(line.bank_amount);
        if (line.is_matched()) ++s.matched_employees;
    }
    s.unmatched_employees = s.total_employees - s.matched_employees;
    return s;
}

PaymentReconciler::PaymentReconciler(std::shared_ptr<const IBankStatementSource> statements,
                                     ReconcilerConfig config,
                                     std::shared_ptr<AuditTrail> audit)
    : statements_(std::move(statements)), config_(config), audit_(std::move(audit)) {
    if (!statements_) {
        throw ConfigError("payment reconciler requires a bank statement source");
    }
    if (config_.amount_tolerance < 0.0 || config_.amount_tolerance >= 1.0) {
        throw ConfigError(std::format("amount tolerance must be in [0, 1) (got {})",
                                      config_.amount_tolerance));
    }
}

Reconciliation PaymentReconciler::start(const std::vector<WpsBatch>& batches,
                                        const std::chrono::year_month_day& from,
                                        const std::chrono::year_month_day& to,
                                        const std::string& actor) {
    if (std::chrono::sys_days{from} > std::chrono::sys_days{to}) {
        throw StateError(std::format("reconciliation period {} .. {} is inverted",
                                     utils::format_date(from), utils::format_date(to)));
    }

    Reconciliation rec;
    rec.reference = std::format("REC/{:04d}/{:04d}", static_cast<int>(to.year()), ++sequence_);
    rec.period_from = from;
    rec.period_to = to;
    rec.statement_source = statements_->name();

    for (const auto& batch : batches) {
        if (batch.state() != BatchState::PROCESSED) {
            throw StateError(std::format("batch {} is {}; only processed batches are reconciled",
                                         batch.reference(), batch_state_to_string(batch.state())));
        }
        rec.batch_references.push_back(batch.reference());
        for (const auto& wps_line : batch.lines()) {
            ReconciliationLine line;
            line.batch_reference = batch.reference();
            line.employee_ref = wps_line.employee_ref;
            line.employee_name = wps_line.employee_name;
            line.account = wps_line.account();
            line.wps_amount = wps_line.net_salary;
            rec.lines.push_back(std::move(line));
        }
    }

    if (rec.lines.empty()) {
        utils::log::warn(std::format("Reconciliation {}: no salary lines to reconcile", rec.reference));
        return rec;
    }

    rec.state = ReconciliationState::IN_PROGRESS;
    auto statement = statements_->statement_lines(from, to);
    utils::log::info(std::format("Reconciliation {}: {} lines from {} batch(es) against {} transactions ({})",
        rec.reference, rec.lines.size(), batches.size(), statement.size(), rec.statement_source));

    auto_match(rec, std::move(statement));
    rec.state = derive_state(rec);

    const auto summary = rec.summary();
    audit(AuditEvent{
        .event = "reconciliation.matched",
        .actor = actor,
        .outcome = reconciliation_state_to_string(rec.state),
        .details = {{"reconciliation", rec.reference},
                    {"matched", std::to_string(summary.matched_employees)},
                    {"unmatched", std::to_string(summary.unmatched_employees)},
                    {"difference", money::format_amount(summary.difference_subunits())}},
    });
    return rec;
}

void PaymentReconciler::auto_match(Reconciliation& reconciliation,
                                   std::vector<StatementLine> statement) const {
    std::vector<bool> used(statement.size(), false);

    for (auto& line : reconciliation.lines) {
        const auto wps = money::round_to_subunits(line.wps_amount);
        bool matched = false;

        for (size_t i = 0; i < statement.size() && !matched; ++i) {
            if (used[i]) continue;
            if (money::round_to_subunits(std::abs(statement[i].amount)) == wps &&
                reference_names(statement[i].reference, line)) {
                take(line, statement[i], MatchState::MATCHED);
                used[i] = true;
                matched = true;
            }
        }
        if (matched) continue;

        const auto tolerance = std::llround(static_cast<double>(wps) * config_.amount_tolerance);
        for (size_t i = 0; i < statement.size(); ++i) {
            if (used[i]) continue;
            const auto bank = money::round_to_subunits(std::abs(statement[i].amount));
            if (std::llabs(bank - wps) <= tolerance) {
                take(line, statement[i], MatchState::PARTIAL);
                line.difference_reason = "Amount mismatch within tolerance";
                used[i] = true;
                break;
            }
        }

        if (line.state == MatchState::UNMATCHED) {
            utils::log::debug(std::format("Reconciliation {}: no transaction for {} ({})",
                reconciliation.reference, line.employee_ref, money::format_amount(wps)));
        }
    }
}

ReconciliationState PaymentReconciler::derive_state(const Reconciliation& reconciliation) {
    const auto& lines = reconciliation.lines;
    if (lines.empty()) return ReconciliationState::DRAFT;

    size_t matched = 0;
    for (const auto& line : lines) {
        if (line.is_matched()) ++matched;
    }
    if (matched == lines.size()) return ReconciliationState::RECONCILED;
    if (matched > 0) return ReconciliationState::PARTIAL;
    return ReconciliationState::DISCREPANCY;
}

void PaymentReconciler::manual_match(Reconciliation& reconciliation, size_t line_index,
                                     const std::string& actor, const std::string& notes) const {
    auto& line = line_at(reconciliation, line_index);
    line.state = MatchState::MANUAL;
    line.matched_by = actor;
    line.notes = notes;
    reconciliation.state = derive_state(reconciliation);

    utils::log::info(std::format("Reconciliation {}: {} matched manually by {}",
                                 reconciliation.reference, line.employee_ref, actor));
    audit(AuditEvent{
        .event = "reconciliation.manual_match",
        .actor = actor,
        .batch_reference = line.batch_reference,
        .outcome = match_state_to_string(line.state),
        .message = notes,
        .details = {{"reconciliation", reconciliation.reference},
                    {"employee_ref", line.employee_ref}},
    });
}

void PaymentReconciler::mark_discrepancy(Reconciliation& reconciliation, size_t line_index,
                                         const std::string& reason) const {
    auto& line = line_at(reconciliation, line_index);
    line.state = MatchState::DISCREPANCY;
    line.difference_reason = reason;
    reconciliation.state = derive_state(reconciliation);
}

void PaymentReconciler::complete(Reconciliation& reconciliation, const std::string& actor) const {
    size_t unmatched = 0;
    for (const auto& line : reconciliation.lines) {
        if (line.state == MatchState::UNMATCHED) ++unmatched;
    }
    if (unmatched > 0) {
        throw StateError(std::format("reconciliation {}: {} employee(s) have unmatched payments",
                                     reconciliation.reference, unmatched));
    }

    reconciliation.state = ReconciliationState::RECONCILED;
    reconciliation.completed_by = actor;

    const auto summary = reconciliation.summary();
    utils::log::info(std::format("Reconciliation {} completed by {}: {:.1f}% matched, difference {}",
        reconciliation.reference, actor, summary.match_percentage(),
        money::format_amount(summary.difference_subunits())));
    audit(AuditEvent{
        .event = "reconciliation.completed",
        .actor = actor,
        .outcome = reconciliation_state_to_string(reconciliation.state),
        .details = {{"reconciliation", reconciliation.reference},
                    {"match_percentage", std::format("{:.2f}", summary.match_percentage())}},
    });
}

void PaymentReconciler::audit(AuditEvent event) const {
    if (audit_) audit_->record(std::move(event));
}

} // namespace wpsgate
