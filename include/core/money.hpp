#pragma once

#include "core/error.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <format>
#include <limits>
#include <string>

namespace wpsgate::money {

// 1 AED = 100 fils
inline constexpr int64_t kSubunitsPerUnit = 100;

/**
 * @brief Convert a currency amount to integer subunits (amount x 100)
 *
 * Float noise from binary representation (e.g. 0.1 + 0.2) is tolerated;
 * any genuine fractional fils component is rejected, never rounded away.
 * Tolerance scales with magnitude: a few ULPs of the scaled value, with
 * an absolute floor of 1e-6 fils.
 */
[[nodiscard]] inline Result<int64_t> to_subunits(double amount) {
    if (!std::isfinite(amount)) {
        return Result<int64_t>::error(ErrorCategory::FORMAT_ERROR,
            "amount is not a finite number");
    }

    const double scaled = amount * static_cast<double>(kSubunitsPerUnit);
    const double rounded = std::round(scaled);
    const double tolerance = std::max(1e-6,
        std::abs(scaled) * 8.0 * std::numeric_limits<double>::epsilon());

    if (std::abs(scaled - rounded) > tolerance) {
        return Result<int64_t>::error(ErrorCategory::FORMAT_ERROR,
            std::format("amount {:.6f} has a fractional subunit component", amount));
    }
    if (std::abs(rounded) > 9.0e15) {
        return Result<int64_t>::error(ErrorCategory::FORMAT_ERROR,
            std::format("amount {:.2f} is out of range", amount));
    }
    return Result<int64_t>::ok(static_cast<int64_t>(rounded));
}

[[nodiscard]] inline double from_subunits(int64_t subunits) {
    return static_cast<double>(subunits) / static_cast<double>(kSubunitsPerUnit);
}

// Nearest-fils comparison for derived checks (reconciliation tolerances)
[[nodiscard]] inline int64_t round_to_subunits(double amount) {
    return static_cast<int64_t>(std::llround(amount * static_cast<double>(kSubunitsPerUnit)));
}

[[nodiscard]] inline std::string format_amount(int64_t subunits) {
    const int64_t abs_value = subunits < 0 ? -subunits : subunits;
    return std::format("{}{}.{:02d}", subunits < 0 ? "-" : "",
        abs_value / kSubunitsPerUnit, static_cast<int>(abs_value % kSubunitsPerUnit));
}

} // namespace wpsgate::money
