#pragma once

#include "model/wps_batch.hpp"
#include "model/wps_line.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace wpsgate {

/**
 * @brief Value of a named record field as seen by rules
 *
 * Amounts are doubles, counts and days are integers, identifiers and dates
 * are text (dates as YYYY-MM-DD).
 */
using FieldValue = std::variant<std::string, int64_t, double>;

namespace fields {

/// Line-scoped field by name; nullopt if the name is unknown
[[nodiscard]] std::optional<FieldValue> line_field(const WpsLine& line, std::string_view name);

/// File-scoped (header) field by name; nullopt if the name is unknown
[[nodiscard]] std::optional<FieldValue> header_field(const WpsBatch& batch, std::string_view name);

[[nodiscard]] bool is_line_field(std::string_view name);
[[nodiscard]] bool is_header_field(std::string_view name);

[[nodiscard]] std::vector<std::string> line_field_names();
[[nodiscard]] std::vector<std::string> header_field_names();

/// Empty text or zero number
[[nodiscard]] bool is_empty(const FieldValue& value);

[[nodiscard]] bool is_numeric(const FieldValue& value);
[[nodiscard]] double as_number(const FieldValue& value);

/// Amounts render with two decimals, integers plainly, text as-is
[[nodiscard]] std::string to_string(const FieldValue& value);

} // namespace fields

} // namespace wpsgate
