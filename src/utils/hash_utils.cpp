/**
 * @file hash_utils.cpp
 * @brief OpenSSL-backed random identifiers and digests
 *
 * Identifiers use RAND_bytes, which draws from the OpenSSL DRBG seeded by the
 * operating system. With 16 bytes per identifier the collision probability
 * between concurrent runs is negligible.
 *
 * @date 2025
 */

#include "eggshell/utils/hash_utils.hpp"
#include "eggshell/core/errors.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <iomanip>
#include <limits>
#include <memory>
#include <sstream>
#include <vector>

namespace eggshell {
namespace utils {

namespace {

struct EvpContextDeleter {
    void operator()(EVP_MD_CTX* context) const { EVP_MD_CTX_free(context); }
};

using EvpContextPtr = std::unique_ptr<EVP_MD_CTX, EvpContextDeleter>;

} // anonymous namespace

std::string HashUtils::RandomHex(std::size_t num_bytes) {
    if (num_bytes > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw core::Error("random identifier too long");
    }

    std::vector<uint8_t> bytes(num_bytes);
    if (num_bytes > 0 && RAND_bytes(bytes.data(), static_cast<int>(num_bytes)) != 1) {
        throw core::Error("failed to generate random bytes");
    }
    return BytesToHex(bytes.data(), bytes.size());
}

std::string HashUtils::SHA256(const std::string& data) {
    EvpContextPtr context(EVP_MD_CTX_new());
    if (!context) {
        throw core::Error("failed to allocate digest context");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_length = 0;

    if (EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(context.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(context.get(), digest, &digest_length) != 1) {
        throw core::Error("failed to compute SHA-256 digest");
    }

    return BytesToHex(digest, digest_length);
}

// Convert bytes to hex
std::string HashUtils::BytesToHex(const uint8_t* data, std::size_t size) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < size; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

} // namespace utils
} // namespace eggshell
