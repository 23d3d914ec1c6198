/**
 * @file hash_utils.hpp
 * @brief Content digests for data crossing the isolation boundary
 *
 * File contents written into a sandbox are reported back to the caller with
 * a SHA-256 digest so that a collaborator can verify what actually landed
 * inside the isolated environment without reading it back.
 *
 * @date 2026
 */

#pragma once

#include <string>
#include <cstddef>
#include <cstdint>

namespace sandkit {
namespace utils {

/**
 * @class HashUtils
 * @brief Cryptographic digest helpers (OpenSSL EVP)
 *
 * **Usage**:
 * @code
 * std::string digest = HashUtils::ComputeSHA256(content);
 * // "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9"
 * @endcode
 */
class HashUtils {
public:
    /**
     * @brief Compute SHA-256 of a byte string
     * @param data Arbitrary bytes
     * @return Lowercase hex digest (64 characters)
     * @throws std::runtime_error if the digest context cannot be created
     */
    static std::string ComputeSHA256(const std::string& data);

    /**
     * @brief Convert raw bytes to lowercase hex
     * @param data Byte buffer
     * @param size Buffer length
     * @return Hex string (2 * size characters)
     */
    static std::string BytesToHex(const std::uint8_t* data, std::size_t size);
};

} // namespace utils
} // namespace sandkit
