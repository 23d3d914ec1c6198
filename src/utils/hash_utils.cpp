/**
 * @file hash_utils.cpp
 * @brief Implementation of content digest helpers
 *
 * Uses the OpenSSL EVP interface so the same code path works on OpenSSL 1.1
 * and 3.x without the deprecated one-shot SHA256() helpers.
 *
 * @date 2026
 */

#include "sandkit/utils/hash_utils.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace sandkit {
namespace utils {

std::string HashUtils::ComputeSHA256(const std::string& data) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> context(EVP_MD_CTX_new(),
                                                                     &EVP_MD_CTX_free);
    if (!context) {
        throw std::runtime_error("Failed to allocate digest context");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_length = 0;

    if (EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(context.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(context.get(), digest, &digest_length) != 1) {
        throw std::runtime_error("SHA-256 computation failed");
    }

    return BytesToHex(digest, digest_length);
}

std::string HashUtils::BytesToHex(const std::uint8_t* data, std::size_t size) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < size; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

} // namespace utils
} // namespace sandkit
