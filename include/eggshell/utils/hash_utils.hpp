/**
 * @file hash_utils.hpp
 * @brief Random identifiers and content digests for sandbox runs
 *
 * Every run needs names that cannot collide with concurrent or earlier runs
 * (image tags, container names, security-profile filenames) and a stable
 * fingerprint of what was submitted to the engine. Both come from OpenSSL:
 * RAND_bytes for identifiers and EVP SHA-256 for digests.
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace eggshell {
namespace utils {

/**
 * @class HashUtils
 * @brief Static helpers for identifiers and digests
 *
 * All methods are static and thread-safe.
 *
 * **Usage Example**:
 * @code
 * std::string tag = HashUtils::RandomHex(16);        // 32 hex chars
 * std::string profile = HashUtils::RandomHex(8) + ".json";
 * spdlog::debug("context sha256={}", HashUtils::SHA256(archive));
 * @endcode
 */
class HashUtils {
public:
    /**
     * @brief Generate a lowercase hex string from cryptographically secure bytes
     * @param num_bytes Number of random bytes (output has twice as many chars)
     * @return Hex-encoded random bytes
     *
     * @throws eggshell::core::Error if the OpenSSL generator fails
     */
    static std::string RandomHex(std::size_t num_bytes);

    /**
     * @brief Compute the SHA-256 digest of a byte string
     * @param data Bytes to hash
     * @return 64-character lowercase hex digest
     *
     * @throws eggshell::core::Error if the digest cannot be computed
     */
    static std::string SHA256(const std::string& data);

    /**
     * @brief Convert bytes to lowercase hex
     * @param data Byte buffer
     * @param size Buffer length
     * @return Hex string of length 2 * size
     */
    static std::string BytesToHex(const uint8_t* data, std::size_t size);
};

} // namespace utils
} // namespace eggshell
