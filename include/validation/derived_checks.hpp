#pragma once

#include "model/wps_batch.hpp"
#include "validation/reference_data.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace wpsgate {

using CheckArgs = std::map<std::string, std::string>;

class SiblingIndex;

/**
 * @brief Read-only view handed to every rule of one evaluation run
 */
struct ValidationContext {
    const WpsBatch& batch;
    const IReferenceData* reference = nullptr;
    const SiblingIndex* siblings = nullptr;     // value counts across the batch's lines
};

struct CheckOutcome {
    bool passed = true;
    std::string detail;

    static CheckOutcome ok() { return {true, {}}; }
    static CheckOutcome fail(std::string detail) { return {false, std::move(detail)}; }
};

using LineCheckFn = std::function<CheckOutcome(const WpsLine&, const ValidationContext&, const CheckArgs&)>;
using FileCheckFn = std::function<CheckOutcome(const WpsBatch&, const ValidationContext&, const CheckArgs&)>;

/// Returns an error message for unusable arguments, nullopt when fine
using ArgsValidator = std::function<std::optional<std::string>(const CheckArgs&)>;

/**
 * @brief Named calculation / business / compliance checks
 *
 * Rules of the derived families refer to a check by name; adding a check
 * is a registration, not a change to the evaluator. Checks must be pure:
 * anything time-dependent takes its reference date as an argument.
 */
class DerivedCheckRegistry {
public:
    DerivedCheckRegistry() = default;

    /// Registry preloaded with the built-in WPS checks
    [[nodiscard]] static std::shared_ptr<DerivedCheckRegistry> with_builtins();

    void register_line_check(const std::string& name, LineCheckFn fn, ArgsValidator validator = {});
    void register_file_check(const std::string& name, FileCheckFn fn, ArgsValidator validator = {});

    [[nodiscard]] const LineCheckFn* find_line_check(std::string_view name) const;
    [[nodiscard]] const FileCheckFn* find_file_check(std::string_view name) const;

    /// Validate arguments for a registered check
    [[nodiscard]] std::optional<std::string> validate_args(std::string_view name,
                                                           const CheckArgs& args) const;

    [[nodiscard]] std::vector<std::string> line_check_names() const;
    [[nodiscard]] std::vector<std::string> file_check_names() const;

private:
    struct LineEntry {
        LineCheckFn fn;
        ArgsValidator validator;
    };
    struct FileEntry {
        FileCheckFn fn;
        ArgsValidator validator;
    };

    std::unordered_map<std::string, LineEntry> line_checks_;
    std::unordered_map<std::string, FileEntry> file_checks_;
};

namespace checks {

/// UAE Emirates ID: 15 digits (dashes ignored), 784 prefix, Luhn check digit
[[nodiscard]] bool is_valid_emirates_id(std::string_view emirates_id);

} // namespace checks

} // namespace wpsgate
