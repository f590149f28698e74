#include "validation/derived_checks.hpp"
#include "validation/field_access.hpp"
#include "core/money.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <charconv>
#include <format>

namespace wpsgate {

namespace {

[[nodiscard]] std::optional<double> parse_number(std::string_view text) {
    double value = 0.0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

[[nodiscard]] std::optional<double> number_arg(const CheckArgs& args, const std::string& key) {
    const auto it = args.find(key);
    if (it == args.end()) return std::nullopt;
    return parse_number(it->second);
}

// Validators

ArgsValidator require_numbers(std::vector<std::string> keys) {
    return [keys = std::move(keys)](const CheckArgs& args) -> std::optional<std::string> {
        for (const auto& key : keys) {
            const auto it = args.find(key);
            if (it == args.end()) return std::format("missing argument '{}'", key);
            if (!parse_number(it->second)) {
                return std::format("argument '{}' is not a number: '{}'", key, it->second);
            }
        }
        return std::nullopt;
    };
}

std::optional<std::string> validate_min_max(const CheckArgs& args) {
    if (auto err = require_numbers({"min", "max"})(args)) return err;
    if (*number_arg(args, "min") > *number_arg(args, "max")) return "min must not exceed max";
    return std::nullopt;
}

std::optional<std::string> validate_minimum_wage(const CheckArgs& args) {
    if (auto err = require_numbers({"amount"})(args)) return err;
    const auto field = args.find("field");
    if (field != args.end() && !fields::is_line_field(field->second)) {
        return std::format("unknown line field '{}'", field->second);
    }
    return std::nullopt;
}

std::optional<std::string> validate_reference_date(const CheckArgs& args) {
    const auto it = args.find("reference_date");
    if (it == args.end()) return "missing argument 'reference_date'";
    if (!utils::parse_date(it->second)) {
        return std::format("argument 'reference_date' is not a date: '{}'", it->second);
    }
    return std::nullopt;
}

// Line checks

CheckOutcome net_salary_reconciliation(const WpsLine& line, const ValidationContext&, const CheckArgs&) {
    const auto stated = money::round_to_subunits(line.net_salary);
    const auto computed = money::round_to_subunits(line.computed_net_salary());
    if (stated == computed) return CheckOutcome::ok();
    return CheckOutcome::fail(std::format("net {} != computed {}",
        money::format_amount(stated), money::format_amount(computed)));
}

CheckOutcome positive_net_salary(const WpsLine& line, const ValidationContext&, const CheckArgs& args) {
    const auto it = args.find("allow_zero");
    const bool allow_zero = it != args.end() && utils::to_lower(it->second) == "true";
    const auto net = money::round_to_subunits(line.net_salary);
    if (net > 0 || (allow_zero && net == 0)) return CheckOutcome::ok();
    return CheckOutcome::fail(std::format("net salary {}", money::format_amount(net)));
}

CheckOutcome minimum_wage(const WpsLine& line, const ValidationContext&, const CheckArgs& args) {
    const auto floor = number_arg(args, "amount").value_or(0.0);
    const auto field_it = args.find("field");
    const std::string field = field_it != args.end() ? field_it->second : "basic_salary";
    const auto value = fields::line_field(line, field);
    if (!value) return CheckOutcome::fail(std::format("unknown field '{}'", field));

    const double amount = fields::as_number(*value);
    if (money::round_to_subunits(amount) >= money::round_to_subunits(floor)) return CheckOutcome::ok();
    return CheckOutcome::fail(std::format("{} {:.2f} below minimum {:.2f}", field, amount, floor));
}

CheckOutcome days_worked_range(const WpsLine& line, const ValidationContext&, const CheckArgs& args) {
    const auto min = number_arg(args, "min").value_or(0.0);
    const auto max = number_arg(args, "max").value_or(31.0);
    const auto days = static_cast<double>(line.days_worked);
    if (days >= min && days <= max) return CheckOutcome::ok();
    return CheckOutcome::fail(std::format("days worked {} outside [{}, {}]", line.days_worked, min, max));
}

CheckOutcome employee_identifier_present(const WpsLine& line, const ValidationContext&, const CheckArgs&) {
    if (!utils::trim(line.employee_id()).empty()) return CheckOutcome::ok();
    return CheckOutcome::fail("no Emirates ID or labour card number");
}

CheckOutcome bank_account_present(const WpsLine& line, const ValidationContext&, const CheckArgs&) {
    if (!utils::trim(line.account()).empty()) return CheckOutcome::ok();
    return CheckOutcome::fail("no account number or IBAN");
}

CheckOutcome emirates_id_checksum(const WpsLine& line, const ValidationContext&, const CheckArgs&) {
    if (line.emirates_id.empty()) return CheckOutcome::ok();
    if (checks::is_valid_emirates_id(line.emirates_id)) return CheckOutcome::ok();
    return CheckOutcome::fail(std::format("'{}' is not a valid Emirates ID", line.emirates_id));
}

// File checks

CheckOutcome salary_date_in_period(const WpsBatch& batch, const ValidationContext&, const CheckArgs&) {
    if (!batch.salary_date()) return CheckOutcome::fail("salary date missing");
    if (!batch.period().valid()) return CheckOutcome::fail("salary period invalid");

    using namespace std::chrono;
    const year_month_day start{year{batch.period().year}, month{batch.period().month}, day{1}};
    const auto deadline = batch.period().deadline();
    const auto date = sys_days{*batch.salary_date()};
    if (date >= sys_days{start} && date <= sys_days{deadline}) return CheckOutcome::ok();
    return CheckOutcome::fail(std::format("salary date {} outside {} .. {}",
        utils::format_date(*batch.salary_date()), utils::format_date(start), utils::format_date(deadline)));
}

CheckOutcome submission_deadline(const WpsBatch& batch, const ValidationContext&, const CheckArgs& args) {
    if (!batch.period().valid()) return CheckOutcome::fail("salary period invalid");
    const auto it = args.find("reference_date");
    const auto reference = it != args.end() ? utils::parse_date(it->second) : std::nullopt;
    if (!reference) return CheckOutcome::fail("reference date missing");

    const auto deadline = batch.period().deadline();
    if (std::chrono::sys_days{*reference} <= std::chrono::sys_days{deadline}) return CheckOutcome::ok();
    return CheckOutcome::fail(std::format("deadline {} passed as of {}",
        utils::format_date(deadline), utils::format_date(*reference)));
}

CheckOutcome non_empty_batch(const WpsBatch& batch, const ValidationContext&, const CheckArgs&) {
    if (!batch.lines().empty()) return CheckOutcome::ok();
    return CheckOutcome::fail("batch has no lines");
}

template<typename Map>
std::vector<std::string> sorted_names(const Map& map) {
    std::vector<std::string> names;
    for (const auto& [name, _] : map) names.push_back(name);
    std::sort(names.begin(), names.end());
    return names;
}

} // anonymous namespace

namespace checks {

bool is_valid_emirates_id(std::string_view emirates_id) {
    std::string digits;
    for (const char c : emirates_id) {
        if (c == '-' || c == ' ') continue;
        if (c < '0' || c > '9') return false;
        digits += c;
    }
    if (digits.size() != 15 || !digits.starts_with("784")) return false;

    // Luhn: double every second digit from the right
    int sum = 0;
    bool double_it = false;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        int d = *it - '0';
        if (double_it) {
            d *= 2;
            if (d > 9) d -= 9;
        }
        sum += d;
        double_it = !double_it;
    }
    return sum % 10 == 0;
}

} // namespace checks

std::shared_ptr<DerivedCheckRegistry> DerivedCheckRegistry::with_builtins() {
    auto registry = std::make_shared<DerivedCheckRegistry>();
    registry->register_line_check("net_salary_reconciliation", net_salary_reconciliation);
    registry->register_line_check("positive_net_salary", positive_net_salary);
    registry->register_line_check("minimum_wage", minimum_wage, validate_minimum_wage);
    registry->register_line_check("days_worked_range", days_worked_range, validate_min_max);
    registry->register_line_check("employee_identifier_present", employee_identifier_present);
    registry->register_line_check("bank_account_present", bank_account_present);
    registry->register_line_check("emirates_id_checksum", emirates_id_checksum);

    registry->register_file_check("salary_date_in_period", salary_date_in_period);
    registry->register_file_check("submission_deadline", submission_deadline, validate_reference_date);
    registry->register_file_check("non_empty_batch", non_empty_batch);
    return registry;
}

void DerivedCheckRegistry::register_line_check(const std::string& name, LineCheckFn fn,
                                               ArgsValidator validator) {
    line_checks_[name] = LineEntry{std::move(fn), std::move(validator)};
}

void DerivedCheckRegistry::register_file_check(const std::string& name, FileCheckFn fn,
                                               ArgsValidator validator) {
    file_checks_[name] = FileEntry{std::move(fn), std::move(validator)};
}

const LineCheckFn* DerivedCheckRegistry::find_line_check(std::string_view name) const {
    const auto it = line_checks_.find(std::string(name));
    return it == line_checks_.end() ? nullptr : &it->second.fn;
}

const FileCheckFn* DerivedCheckRegistry::find_file_check(std::string_view name) const {
    const auto it = file_checks_.find(std::string(name));
    return it == file_checks_.end() ? nullptr : &it->second.fn;
}

std::optional<std::string> DerivedCheckRegistry::validate_args(std::string_view name,
                                                               const CheckArgs& args) const {
    const std::string key(name);
    if (const auto it = line_checks_.find(key); it != line_checks_.end()) {
        return it->second.validator ? it->second.validator(args) : std::nullopt;
    }
    if (const auto it = file_checks_.find(key); it != file_checks_.end()) {
        return it->second.validator ? it->second.validator(args) : std::nullopt;
    }
    return std::format("unknown derived check '{}'", name);
}

std::vector<std::string> DerivedCheckRegistry::line_check_names() const {
    return sorted_names(line_checks_);
}

std::vector<std::string> DerivedCheckRegistry::file_check_names() const {
    return sorted_names(file_checks_);
}

} // namespace wpsgate
