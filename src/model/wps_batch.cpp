#include "model/wps_batch.hpp"
#include "core/error.hpp"

#include <format>
#include <utility>

namespace wpsgate {

void WpsBatch::ensure_mutable(const char* operation) const {
    if (state_ == BatchState::PROCESSED || state_ == BatchState::CANCELLED) {
        throw StateError(std::format("cannot {} batch {} in state {}",
            operation, reference_, batch_state_to_string(state_)));
    }
}

void WpsBatch::set_reference(std::string reference) {
    ensure_mutable("rename");
    reference_ = std::move(reference);
}

void WpsBatch::set_company_id(std::string company_id) {
    ensure_mutable("edit the header of");
    company_id_ = std::move(company_id);
}

void WpsBatch::set_employer_id(std::string employer_id) {
    ensure_mutable("edit the header of");
    employer_id_ = std::move(employer_id);
}

void WpsBatch::set_employer_name(std::string employer_name) {
    ensure_mutable("edit the header of");
    employer_name_ = std::move(employer_name);
}

void WpsBatch::set_employer_bank_code(std::string bank_code) {
    ensure_mutable("edit the header of");
    employer_bank_code_ = std::move(bank_code);
}

void WpsBatch::set_employer_account(std::string account) {
    ensure_mutable("edit the header of");
    employer_account_ = std::move(account);
}

void WpsBatch::set_period(SalaryPeriod period) {
    ensure_mutable("edit the header of");
    period_ = period;
}

void WpsBatch::set_salary_date(std::optional<std::chrono::year_month_day> date) {
    ensure_mutable("edit the header of");
    salary_date_ = date;
}

void WpsBatch::set_file_type(FileType type) {
    ensure_mutable("edit the header of");
    file_type_ = type;
}

void WpsBatch::set_declared_total_net(std::optional<double> total) {
    ensure_mutable("edit the header of");
    declared_total_net_ = total;
}

void WpsBatch::set_eligible_employee_count(size_t count) {
    ensure_mutable("edit the header of");
    eligible_employee_count_ = count;
}

void WpsBatch::replace_lines(std::vector<WpsLine> lines) {
    ensure_mutable("rebuild lines of");
    lines_ = std::move(lines);
}

void WpsBatch::add_line(WpsLine line) {
    ensure_mutable("add a line to");
    lines_.push_back(std::move(line));
}

BatchTotals WpsBatch::totals() const {
    BatchTotals t;
    t.employee_count = lines_.size();
    for (const auto& line : lines_) {
        t.basic += line.basic_salary;
        t.housing += line.housing_allowance;
        t.transport += line.transport_allowance;
        t.other += line.other_allowance;
        t.overtime += line.overtime;
        t.leave += line.leave_salary;
        t.deductions += line.deductions;
        t.net += line.net_salary;
    }
    return t;
}

std::string WpsBatch::file_name() const {
    return std::format("WPS_{}_{:04d}{:02d}.SIF", employer_id_, period_.year, period_.month);
}

void WpsBatch::mark_generated() {
    ensure_mutable("generate");
    if (state_ == BatchState::DRAFT || state_ == BatchState::REJECTED) {
        state_ = BatchState::GENERATED;
    }
}

void WpsBatch::mark_submitted() {
    ensure_mutable("submit");
    if (state_ == BatchState::DRAFT) {
        throw StateError(std::format("batch {} must be generated before submission", reference_));
    }
    state_ = BatchState::SUBMITTED;
}

void WpsBatch::mark_processed() {
    if (state_ != BatchState::SUBMITTED) {
        throw StateError(std::format("only submitted batches can be processed (batch {} is {})",
            reference_, batch_state_to_string(state_)));
    }
    state_ = BatchState::PROCESSED;
}

void WpsBatch::mark_rejected() {
    if (state_ != BatchState::SUBMITTED) {
        throw StateError(std::format("only submitted batches can be rejected (batch {} is {})",
            reference_, batch_state_to_string(state_)));
    }
    state_ = BatchState::REJECTED;
}

void WpsBatch::cancel() {
    if (state_ == BatchState::PROCESSED) {
        throw StateError(std::format("processed batch {} cannot be cancelled", reference_));
    }
    state_ = BatchState::CANCELLED;
}

void WpsBatch::reset_to_draft() {
    if (state_ != BatchState::CANCELLED && state_ != BatchState::REJECTED) {
        throw StateError(std::format("only cancelled or rejected batches can be reset (batch {} is {})",
            reference_, batch_state_to_string(state_)));
    }
    state_ = BatchState::DRAFT;
}

} // namespace wpsgate
