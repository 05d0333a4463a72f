#ifndef TOKENVAULT_UTIL_HASHING_HPP
#define TOKENVAULT_UTIL_HASHING_HPP

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <openssl/evp.h>
#include <openssl/sha.h>

/**
 * @file hashing.hpp
 * @brief SHA-256 helpers used to refer to sensitive values without revealing them.
 *
 * REQUIREMENTS:
 *   - Links against OpenSSL (libcrypto).
 *
 * DESIGN:
 *   - sha256() returns the lowercase hex digest of a byte string.
 *   - fingerprint() keeps the first 12 hex characters. Log lines and error
 *     messages use it in place of the real value.
 *
 * USAGE:
 *   @code
 *   using namespace tokenvault::util::hashing;
 *   logger::debug("Registry: new value " + fingerprint(value));
 *   @endcode
 */

namespace tokenvault {
namespace util {
namespace hashing {

/**
 * @brief Compute a SHA-256 hash of the input, return as lowercase hex.
 * @throw std::runtime_error if OpenSSL fails.
 */
inline std::string sha256(const std::string &input)
{
    unsigned char hash[SHA256_DIGEST_LENGTH];
    unsigned int hashLen = 0;

    EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
    if (mdctx == nullptr) {
        throw std::runtime_error("hashing::sha256: Failed to create EVP_MD_CTX.");
    }
    if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(mdctx, input.data(), input.size()) != 1 ||
        EVP_DigestFinal_ex(mdctx, hash, &hashLen) != 1)
    {
        EVP_MD_CTX_free(mdctx);
        throw std::runtime_error("hashing::sha256: SHA-256 computation failed.");
    }
    EVP_MD_CTX_free(mdctx);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < hashLen; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(hash[i]);
    }
    return oss.str();
}

/**
 * @brief Short, log-safe identifier of a sensitive value.
 */
inline std::string fingerprint(const std::string &value)
{
    return "#" + sha256(value).substr(0, 12);
}

} // namespace hashing
} // namespace util
} // namespace tokenvault

#endif // TOKENVAULT_UTIL_HASHING_HPP
