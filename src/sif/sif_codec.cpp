#include "sif/sif_codec.hpp"
#include "core/error.hpp"
#include "core/money.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace wpsgate {

namespace {

[[nodiscard]] int64_t max_for_width(size_t width) {
    int64_t max = 1;
    for (size_t i = 0; i < width; ++i) max *= 10;
    return max - 1;
}

/**
 * @brief Sequential fixed-width record builder driven by a layout table
 *
 * Each put_* consumes the next field of the layout; widths are never
 * repeated at call sites.
 */
template<size_t N>
class RecordWriter {
public:
    RecordWriter(const std::array<sif::FieldSpec, N>& layout, std::string context)
        : layout_(layout), context_(std::move(context)) {
        buf_.reserve(sif::record_width(layout) + 1);
    }

    void put_literal(std::string_view value) {
        const auto& field = next(sif::FieldKind::LITERAL);
        if (value.size() != field.width) {
            throw std::logic_error(std::format("literal for {} must be {} bytes",
                                               field.name, field.width));
        }
        buf_ += value;
    }

    void put_literal(char value) { put_literal(std::string_view(&value, 1)); }

    void put_text(std::string_view value) {
        const auto& field = next(sif::FieldKind::TEXT);
        for (const char c : value) {
            const auto uc = static_cast<unsigned char>(c);
            if (uc < 0x20 || uc >= 0x7F) {
                throw FormatError(std::format("{}: field {} contains a non-printable or "
                                              "non-ASCII character", context_, field.name));
            }
        }
        if (value.size() > field.width) {
            utils::log::debug(std::format("{}: field {} truncated from {} to {} characters",
                                          context_, field.name, value.size(), field.width));
            value = value.substr(0, field.width);
        }
        buf_ += value;
        buf_.append(field.width - value.size(), ' ');
    }

    void put_number(int64_t value) {
        put_digits(next(sif::FieldKind::NUMBER), value);
    }

    void put_amount(double value) {
        const auto& field = next(sif::FieldKind::AMOUNT);
        const auto subunits = money::to_subunits(value);
        if (subunits.is_error()) {
            throw FormatError(std::format("{}: field {}: {}", context_, field.name,
                                          subunits.error_message()));
        }
        put_digits(field, subunits.value());
    }

    void put_subunits(int64_t subunits) {
        put_digits(next(sif::FieldKind::AMOUNT), subunits);
    }

    void put_date(const std::chrono::year_month_day& date) {
        const auto& field = next(sif::FieldKind::DATE);
        if (!date.ok()) {
            throw FormatError(std::format("{}: field {} is not a valid date", context_, field.name));
        }
        buf_ += utils::format_date_compact(date);
    }

    [[nodiscard]] std::string finish() {
        if (index_ != N || buf_.size() != sif::record_width(layout_)) {
            throw std::logic_error(std::format("{}: record incomplete ({} of {} fields)",
                                               context_, index_, N));
        }
        buf_ += sif::kRecordTerminator;
        return std::move(buf_);
    }

private:
    const sif::FieldSpec& next(sif::FieldKind expected) {
        if (index_ >= N || layout_[index_].kind != expected) {
            throw std::logic_error(std::format("{}: field {} written out of layout order",
                                               context_, index_));
        }
        return layout_[index_++];
    }

    void put_digits(const sif::FieldSpec& field, int64_t value) {
        if (value < 0) {
            throw FormatError(std::format("{}: field {} is negative ({})",
                                          context_, field.name, value));
        }
        if (value > max_for_width(field.width)) {
            throw FormatError(std::format("{}: field {} value {} exceeds {} digits",
                                          context_, field.name, value, field.width));
        }
        buf_ += std::format("{:0{}}", value, field.width);
    }

    const std::array<sif::FieldSpec, N>& layout_;
    std::string context_;
    std::string buf_;
    size_t index_ = 0;
};

/**
 * @brief Sequential fixed-width record reader, inverse of RecordWriter
 */
template<size_t N>
class RecordReader {
public:
    RecordReader(const std::array<sif::FieldSpec, N>& layout, std::string_view record,
                 std::string context)
        : layout_(layout), record_(record), context_(std::move(context)) {
        if (record_.size() != sif::record_width(layout_)) {
            throw FormatError(std::format("{}: record length {} does not match layout width {}",
                                          context_, record_.size(), sif::record_width(layout_)));
        }
    }

    void expect_literal(std::string_view expected) {
        const auto [field, raw] = next(sif::FieldKind::LITERAL);
        if (raw != expected) {
            throw FormatError(std::format("{}: field {} is '{}', expected '{}'",
                                          context_, field.name, raw, expected));
        }
    }

    void expect_literal(char expected) { expect_literal(std::string_view(&expected, 1)); }

    [[nodiscard]] std::string text() {
        const auto [field, raw] = next(sif::FieldKind::TEXT);
        const auto end = raw.find_last_not_of(' ');
        return end == std::string_view::npos ? std::string{} : std::string(raw.substr(0, end + 1));
    }

    [[nodiscard]] int64_t number() {
        const auto [field, raw] = next(sif::FieldKind::NUMBER);
        return digits(field, raw);
    }

    [[nodiscard]] int64_t amount() {
        const auto [field, raw] = next(sif::FieldKind::AMOUNT);
        return digits(field, raw);
    }

    [[nodiscard]] std::chrono::year_month_day date() {
        const auto [field, raw] = next(sif::FieldKind::DATE);
        digits(field, raw);
        const auto parsed = utils::parse_date(raw);
        if (!parsed) {
            throw FormatError(std::format("{}: field {} '{}' is not a valid date",
                                          context_, field.name, raw));
        }
        return *parsed;
    }

private:
    struct Slice {
        const sif::FieldSpec& field;
        std::string_view raw;
    };

    Slice next(sif::FieldKind expected) {
        if (index_ >= N || layout_[index_].kind != expected) {
            throw std::logic_error(std::format("{}: field {} read out of layout order",
                                               context_, index_));
        }
        const auto& field = layout_[index_++];
        const auto raw = record_.substr(offset_, field.width);
        offset_ += field.width;
        return {field, raw};
    }

    int64_t digits(const sif::FieldSpec& field, std::string_view raw) const {
        for (const char c : raw) {
            if (c < '0' || c > '9') {
                throw FormatError(std::format("{}: field {} '{}' is not numeric",
                                              context_, field.name, raw));
            }
        }
        return utils::parse_int<int64_t>(raw);
    }

    const std::array<sif::FieldSpec, N>& layout_;
    std::string_view record_;
    std::string context_;
    size_t index_ = 0;
    size_t offset_ = 0;
};

// Net column of an emitted SDR, re-read for the header cross-check
[[nodiscard]] int64_t sdr_net_column(std::string_view record) {
    constexpr size_t kNetIndex = 7;
    static_assert(sif::kSdrLayout[kNetIndex].name == "net_salary");
    constexpr size_t offset = sif::field_offset(sif::kSdrLayout, kNetIndex);
    return utils::parse_int<int64_t>(record.substr(offset, sif::kSdrLayout[kNetIndex].width));
}

} // anonymous namespace

// ============================================================================
// Encoding
// ============================================================================

std::string SifCodec::encode_header(const WpsBatch& batch, size_t record_count,
                                    int64_t total_net_subunits) {
    if (batch.employer_id().empty()) {
        throw FormatError("EDR: employer ID is required");
    }
    if (batch.employer_account().empty()) {
        throw FormatError("EDR: employer bank account/IBAN is required");
    }
    if (!batch.period().valid()) {
        throw FormatError(std::format("EDR: invalid salary period {:02d}/{}",
                                      batch.period().month, batch.period().year));
    }

    RecordWriter writer(sif::kEdrLayout, "EDR");
    writer.put_literal(sif::kEmployerRecordType);
    writer.put_text(batch.employer_id());
    writer.put_text(batch.employer_bank_code());
    writer.put_text(batch.employer_account());
    writer.put_number(batch.period().month);
    writer.put_number(batch.period().year);
    writer.put_number(static_cast<int64_t>(record_count));
    writer.put_subunits(total_net_subunits);
    writer.put_literal(sif::kCurrency);
    return writer.finish();
}

std::string SifCodec::encode_line(const WpsLine& line,
                                  const std::chrono::year_month_day& salary_date,
                                  size_t line_index) {
    RecordWriter writer(sif::kSdrLayout,
        std::format("SDR line {} ({})", line_index + 1, line.display_name()));
    writer.put_literal(sif::kSalaryRecordType);
    writer.put_text(line.employee_id());
    writer.put_text(line.bank_code);
    writer.put_text(line.account());
    writer.put_date(salary_date);
    writer.put_literal(sif::kMonthlyFrequency);
    writer.put_number(line.days_worked);
    writer.put_amount(line.net_salary);
    writer.put_amount(line.basic_salary);
    writer.put_amount(line.housing_allowance);
    writer.put_amount(line.sdr_other_allowance());
    writer.put_amount(line.deductions);
    writer.put_literal(sif::kCurrency);
    return writer.finish();
}

EncodedSif SifCodec::encode(const WpsBatch& batch) {
    if (!batch.salary_date().has_value()) {
        throw FormatError("EDR: salary date is required");
    }

    const auto& lines = batch.lines();
    std::vector<std::string> details;
    details.reserve(lines.size());

    int64_t total_net = 0;
    for (size_t i = 0; i < lines.size(); ++i) {
        details.push_back(encode_line(lines[i], *batch.salary_date(), i));
        total_net += sdr_net_column(details.back());
    }

    // Header totals are re-derived from the emitted detail records and
    // must agree with the batch's own view of its lines
    const auto totals = batch.totals();
    if (totals.employee_count != details.size()) {
        throw FormatError(std::format("EDR: record count {} disagrees with {} lines",
                                      details.size(), totals.employee_count));
    }
    if (money::round_to_subunits(totals.net) != total_net) {
        throw FormatError(std::format("EDR: total net {} disagrees with line sum {}",
                                      money::format_amount(total_net),
                                      money::format_amount(money::round_to_subunits(totals.net))));
    }
    if (batch.declared_total_net().has_value()) {
        const auto declared = money::to_subunits(*batch.declared_total_net());
        if (declared.is_error()) {
            throw FormatError("EDR: declared total net: " + declared.error_message());
        }
        if (declared.value() != total_net) {
            throw FormatError(std::format("EDR: declared total net {} does not match line sum {}",
                                          money::format_amount(declared.value()),
                                          money::format_amount(total_net)));
        }
    }

    EncodedSif out;
    out.file_name = batch.file_name();
    out.record_count = details.size();
    out.total_net_subunits = total_net;
    out.content = encode_header(batch, details.size(), total_net);
    out.content.reserve(out.content.size() + details.size() * (sif::kSdrWidth + 1));
    for (const auto& record : details) {
        out.content += record;
    }
    return out;
}

// ============================================================================
// Decoding
// ============================================================================

EdrRecord SifCodec::decode_header(std::string_view record) {
    RecordReader reader(sif::kEdrLayout, record, "EDR");
    EdrRecord edr;
    reader.expect_literal(sif::kEmployerRecordType);
    edr.employer_id = reader.text();
    edr.bank_routing_code = reader.text();
    edr.account = reader.text();
    edr.salary_month = static_cast<unsigned>(reader.number());
    edr.salary_year = static_cast<int>(reader.number());
    edr.total_records = static_cast<size_t>(reader.number());
    edr.total_net_subunits = reader.amount();
    reader.expect_literal(sif::kCurrency);
    edr.currency = std::string(sif::kCurrency);

    if (!SalaryPeriod(edr.salary_month, edr.salary_year).valid()) {
        throw FormatError(std::format("EDR: invalid salary period {:02d}/{}",
                                      edr.salary_month, edr.salary_year));
    }
    return edr;
}

SdrRecord SifCodec::decode_line(std::string_view record) {
    RecordReader reader(sif::kSdrLayout, record, "SDR");
    SdrRecord sdr;
    reader.expect_literal(sif::kSalaryRecordType);
    sdr.employee_id = reader.text();
    sdr.bank_routing_code = reader.text();
    sdr.account = reader.text();
    sdr.salary_date = reader.date();
    reader.expect_literal(sif::kMonthlyFrequency);
    sdr.frequency = sif::kMonthlyFrequency;
    sdr.days_worked = static_cast<int>(reader.number());
    sdr.net_subunits = reader.amount();
    sdr.basic_subunits = reader.amount();
    sdr.housing_subunits = reader.amount();
    sdr.other_subunits = reader.amount();
    sdr.deductions_subunits = reader.amount();
    reader.expect_literal(sif::kCurrency);
    sdr.currency = std::string(sif::kCurrency);
    return sdr;
}

SifFile SifCodec::decode(std::string_view content) {
    std::vector<std::string_view> records;
    size_t pos = 0;
    while (pos < content.size()) {
        auto end = content.find(sif::kRecordTerminator, pos);
        if (end == std::string_view::npos) end = content.size();
        auto record = content.substr(pos, end - pos);
        if (!record.empty() && record.back() == '\r') record.remove_suffix(1);
        records.push_back(record);
        pos = end + 1;
    }

    if (records.empty()) {
        throw FormatError("SIF: file is empty");
    }

    SifFile file;
    file.header = decode_header(records.front());
    file.details.reserve(records.size() - 1);

    int64_t total_net = 0;
    for (size_t i = 1; i < records.size(); ++i) {
        try {
            file.details.push_back(decode_line(records[i]));
        } catch (const FormatError& e) {
            throw FormatError(std::format("record {}: {}", i + 1, e.what()));
        }
        total_net += file.details.back().net_subunits;
    }

    if (file.header.total_records != file.details.size()) {
        throw FormatError(std::format("EDR declares {} detail records, file has {}",
                                      file.header.total_records, file.details.size()));
    }
    if (file.header.total_net_subunits != total_net) {
        throw FormatError(std::format("EDR total net {} does not match detail sum {}",
                                      money::format_amount(file.header.total_net_subunits),
                                      money::format_amount(total_net)));
    }
    return file;
}

} // namespace wpsgate
