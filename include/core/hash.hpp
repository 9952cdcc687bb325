#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace llmshield {

/**
 * @brief One-way hashing and randomness helpers (OpenSSL)
 *
 * Audit records and manifest pins store these digests instead of raw text.
 */
namespace hash {

/// Lowercase hex SHA-256 of the input bytes (64 chars)
[[nodiscard]] std::string sha256_hex(std::string_view data);

/// Cryptographically random bytes, hex-encoded (2 * byte_count chars)
[[nodiscard]] std::string random_hex(size_t byte_count);

} // namespace hash

} // namespace llmshield
