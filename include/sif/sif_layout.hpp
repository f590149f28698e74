#pragma once

#include <array>
#include <cstddef>
#include <string_view>

namespace wpsgate {

// UAE WPS Salary Information File record layout
namespace sif {

constexpr std::string_view kEmployerRecordType = "EDR";
constexpr std::string_view kSalaryRecordType = "SDR";
constexpr std::string_view kCurrency = "AED";
constexpr char kMonthlyFrequency = 'M';
constexpr char kRecordTerminator = '\n';

enum class FieldKind {
    LITERAL,        // fixed text (record type, currency, frequency)
    TEXT,           // left-justified, space-padded, truncated on overflow
    NUMBER,         // right-justified, zero-padded, overflow is an error
    AMOUNT,         // integer subunits, zero-padded, overflow is an error
    DATE            // YYYYMMDD
};

struct FieldSpec {
    std::string_view name;
    size_t width;
    FieldKind kind;
};

// EDR - Employer Detail Record (91 bytes)
constexpr std::array<FieldSpec, 9> kEdrLayout = {{
    {"record_type",         3,  FieldKind::LITERAL},
    {"employer_id",         15, FieldKind::TEXT},
    {"bank_routing_code",   9,  FieldKind::TEXT},
    {"account",             34, FieldKind::TEXT},
    {"salary_month",        2,  FieldKind::NUMBER},
    {"salary_year",         4,  FieldKind::NUMBER},
    {"total_records",       6,  FieldKind::NUMBER},
    {"total_net_salary",    15, FieldKind::AMOUNT},
    {"currency",            3,  FieldKind::LITERAL},
}};

// SDR - Salary Detail Record (150 bytes)
constexpr std::array<FieldSpec, 13> kSdrLayout = {{
    {"record_type",         3,  FieldKind::LITERAL},
    {"employee_id",         15, FieldKind::TEXT},
    {"bank_routing_code",   9,  FieldKind::TEXT},
    {"account",             34, FieldKind::TEXT},
    {"salary_date",         8,  FieldKind::DATE},
    {"salary_frequency",    1,  FieldKind::LITERAL},
    {"days_worked",         2,  FieldKind::NUMBER},
    {"net_salary",          15, FieldKind::AMOUNT},
    {"basic_salary",        15, FieldKind::AMOUNT},
    {"housing_allowance",   15, FieldKind::AMOUNT},
    {"other_allowance",     15, FieldKind::AMOUNT},
    {"deductions",          15, FieldKind::AMOUNT},
    {"currency",            3,  FieldKind::LITERAL},
}};

template<size_t N>
constexpr size_t record_width(const std::array<FieldSpec, N>& layout) {
    size_t total = 0;
    for (const auto& field : layout) total += field.width;
    return total;
}

constexpr size_t kEdrWidth = record_width(kEdrLayout);
constexpr size_t kSdrWidth = record_width(kSdrLayout);

static_assert(kEdrWidth == 91, "EDR must be 91 bytes");
static_assert(kSdrWidth == 150, "SDR must be 150 bytes");

// Column offset of a field by position in its layout
template<size_t N>
constexpr size_t field_offset(const std::array<FieldSpec, N>& layout, size_t index) {
    size_t offset = 0;
    for (size_t i = 0; i < index; ++i) offset += layout[i].width;
    return offset;
}

} // namespace sif

} // namespace wpsgate
