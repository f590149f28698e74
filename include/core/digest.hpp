#pragma once

#include <string>
#include <string_view>

namespace wpsgate::digest {

/**
 * @brief SHA-256 of the given bytes as lower-case hex (64 chars)
 * @throws std::runtime_error if the OpenSSL digest context cannot be created
 */
[[nodiscard]] std::string sha256_hex(std::string_view data);

} // namespace wpsgate::digest
