#pragma once

#include "model/wps_batch.hpp"
#include "sif/sif_layout.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace wpsgate {

// ============================================================================
// Decoded records (bank acknowledgement / round-trip)
// ============================================================================

struct EdrRecord {
    std::string employer_id;
    std::string bank_routing_code;
    std::string account;
    unsigned salary_month = 0;
    int salary_year = 0;
    size_t total_records = 0;
    int64_t total_net_subunits = 0;
    std::string currency;
};

struct SdrRecord {
    std::string employee_id;
    std::string bank_routing_code;
    std::string account;
    std::chrono::year_month_day salary_date{};
    char frequency = sif::kMonthlyFrequency;
    int days_worked = 0;
    int64_t net_subunits = 0;
    int64_t basic_subunits = 0;
    int64_t housing_subunits = 0;
    int64_t other_subunits = 0;
    int64_t deductions_subunits = 0;
    std::string currency;
};

struct SifFile {
    EdrRecord header;
    std::vector<SdrRecord> details;
};

/**
 * @brief Output of one encoding pass
 */
struct EncodedSif {
    std::string file_name;
    std::string content;
    size_t record_count = 0;
    int64_t total_net_subunits = 0;
};

/**
 * @brief Fixed-width WPS Salary Information File encoder/decoder
 *
 * Pure and deterministic: no I/O, no clock. Encoding emits one EDR followed
 * by one SDR per line in line order, each terminated by '\n'.
 *
 * Text fields are left-justified and space-padded, overflow is truncated.
 * Numeric and amount fields are zero-padded; overflow, negative values and
 * non-integral fils raise FormatError.
 */
class SifCodec {
public:
    /// @throws FormatError on any header or line constraint violation
    [[nodiscard]] static EncodedSif encode(const WpsBatch& batch);

    /// Slice records per the layout tables.
    /// @throws FormatError on wrong record length, type, non-digit numerics,
    ///         or header totals that disagree with the detail records
    [[nodiscard]] static SifFile decode(std::string_view content);

    /// Encode a single EDR (exposed for tests and acknowledgement matching)
    [[nodiscard]] static std::string encode_header(const WpsBatch& batch,
                                                   size_t record_count,
                                                   int64_t total_net_subunits);

    /// Encode a single SDR
    [[nodiscard]] static std::string encode_line(const WpsLine& line,
                                                 const std::chrono::year_month_day& salary_date,
                                                 size_t line_index);

    [[nodiscard]] static EdrRecord decode_header(std::string_view record);
    [[nodiscard]] static SdrRecord decode_line(std::string_view record);
};

} // namespace wpsgate
