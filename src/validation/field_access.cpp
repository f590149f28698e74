#include "validation/field_access.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <functional>
#include <type_traits>
#include <unordered_map>

namespace wpsgate::fields {

namespace {

using LineGetter = std::function<FieldValue(const WpsLine&)>;
using HeaderGetter = std::function<FieldValue(const WpsBatch&)>;

const std::unordered_map<std::string_view, LineGetter>& line_getters() {
    static const std::unordered_map<std::string_view, LineGetter> kGetters = {
        {"employee_id",         [](const WpsLine& l) -> FieldValue { return l.employee_id(); }},
        {"employee_ref",        [](const WpsLine& l) -> FieldValue { return l.employee_ref; }},
        {"employee_name",       [](const WpsLine& l) -> FieldValue { return l.employee_name; }},
        {"emirates_id",         [](const WpsLine& l) -> FieldValue { return l.emirates_id; }},
        {"labour_card_no",      [](const WpsLine& l) -> FieldValue { return l.labour_card_no; }},
        {"mol_id",              [](const WpsLine& l) -> FieldValue { return l.mol_id; }},
        {"bank_routing_code",   [](const WpsLine& l) -> FieldValue { return l.bank_code; }},
        {"account_number",      [](const WpsLine& l) -> FieldValue { return l.account_number; }},
        {"iban",                [](const WpsLine& l) -> FieldValue { return l.iban; }},
        {"account",             [](const WpsLine& l) -> FieldValue { return l.account(); }},
        {"days_worked",         [](const WpsLine& l) -> FieldValue { return static_cast<int64_t>(l.days_worked); }},
        {"basic_salary",        [](const WpsLine& l) -> FieldValue { return l.basic_salary; }},
        {"housing_allowance",   [](const WpsLine& l) -> FieldValue { return l.housing_allowance; }},
        {"transport_allowance", [](const WpsLine& l) -> FieldValue { return l.transport_allowance; }},
        {"other_allowance",     [](const WpsLine& l) -> FieldValue { return l.other_allowance; }},
        {"overtime",            [](const WpsLine& l) -> FieldValue { return l.overtime; }},
        {"leave_salary",        [](const WpsLine& l) -> FieldValue { return l.leave_salary; }},
        {"deductions",          [](const WpsLine& l) -> FieldValue { return l.deductions; }},
        {"gross_salary",        [](const WpsLine& l) -> FieldValue { return l.gross_salary(); }},
        {"net_salary",          [](const WpsLine& l) -> FieldValue { return l.net_salary; }},
    };
    return kGetters;
}

const std::unordered_map<std::string_view, HeaderGetter>& header_getters() {
    static const std::unordered_map<std::string_view, HeaderGetter> kGetters = {
        {"employer_id",                 [](const WpsBatch& b) -> FieldValue { return b.employer_id(); }},
        {"employer_name",               [](const WpsBatch& b) -> FieldValue { return b.employer_name(); }},
        {"employer_bank_routing_code",  [](const WpsBatch& b) -> FieldValue { return b.employer_bank_code(); }},
        {"employer_account",            [](const WpsBatch& b) -> FieldValue { return b.employer_account(); }},
        {"period_month",                [](const WpsBatch& b) -> FieldValue { return static_cast<int64_t>(b.period().month); }},
        {"period_year",                 [](const WpsBatch& b) -> FieldValue { return static_cast<int64_t>(b.period().year); }},
        {"salary_date",                 [](const WpsBatch& b) -> FieldValue {
            return b.salary_date() ? utils::format_date(*b.salary_date()) : std::string{};
        }},
        {"file_type",                   [](const WpsBatch& b) -> FieldValue { return std::string(file_type_to_string(b.file_type())); }},
        {"employee_count",              [](const WpsBatch& b) -> FieldValue { return static_cast<int64_t>(b.lines().size()); }},
        {"total_net",                   [](const WpsBatch& b) -> FieldValue { return b.totals().net; }},
    };
    return kGetters;
}

template<typename Map>
std::vector<std::string> sorted_keys(const Map& map) {
    std::vector<std::string> names;
    names.reserve(map.size());
    for (const auto& [name, _] : map) names.emplace_back(name);
    std::sort(names.begin(), names.end());
    return names;
}

} // anonymous namespace

std::optional<FieldValue> line_field(const WpsLine& line, std::string_view name) {
    const auto& getters = line_getters();
    const auto it = getters.find(name);
    if (it == getters.end()) return std::nullopt;
    return it->second(line);
}

std::optional<FieldValue> header_field(const WpsBatch& batch, std::string_view name) {
    const auto& getters = header_getters();
    const auto it = getters.find(name);
    if (it == getters.end()) return std::nullopt;
    return it->second(batch);
}

bool is_line_field(std::string_view name) {
    return line_getters().contains(name);
}

bool is_header_field(std::string_view name) {
    return header_getters().contains(name);
}

std::vector<std::string> line_field_names() {
    return sorted_keys(line_getters());
}

std::vector<std::string> header_field_names() {
    return sorted_keys(header_getters());
}

bool is_empty(const FieldValue& value) {
    return std::visit([](const auto& v) -> bool {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return utils::trim(v).empty();
        } else {
            return v == 0;
        }
    }, value);
}

bool is_numeric(const FieldValue& value) {
    return !std::holds_alternative<std::string>(value);
}

double as_number(const FieldValue& value) {
    if (const auto* i = std::get_if<int64_t>(&value)) return static_cast<double>(*i);
    if (const auto* d = std::get_if<double>(&value)) return *d;
    return 0.0;
}

std::string to_string(const FieldValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, double>) {
            return std::format("{:.2f}", v);
        } else {
            return std::format("{}", v);
        }
    }, value);
}

} // namespace wpsgate::fields
