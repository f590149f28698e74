#pragma once

#include "model/wps_batch.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace wpsgate {

// Batch documents exchanged with the CLI (assemble -> validate/encode/submit)

[[nodiscard]] nlohmann::json batch_to_json(const WpsBatch& batch);

/// @throws FormatError on ill-typed fields or an unknown state or file type
[[nodiscard]] WpsBatch batch_from_json(const nlohmann::json& root);

/// @throws ConfigError if the file cannot be opened, FormatError on bad content
[[nodiscard]] WpsBatch load_batch_file(const std::string& path);

/// @throws ConfigError on I/O failure
void save_batch_file(const WpsBatch& batch, const std::string& path);

} // namespace wpsgate
