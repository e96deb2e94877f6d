/**
 * @file hash_utils.hpp
 * @brief SHA-256 digests for content-derived image tags
 *
 * Thin wrapper over OpenSSL's EVP interface. Used to derive deterministic
 * image tags from package lists and short unique suffixes for throwaway
 * instance names.
 *
 * @date 2025
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace flashvm {
namespace utils {

/**
 * @class HashUtils
 * @brief Static hashing helpers
 *
 * **Usage Example**:
 * @code
 * auto digest = HashUtils::ComputeSHA256("numpy\npandas");
 * // 64 lowercase hex characters
 * @endcode
 */
class HashUtils {
public:
    /**
     * @brief SHA-256 of a byte string as lowercase hex
     * @throws std::runtime_error if the OpenSSL digest context fails
     */
    static std::string ComputeSHA256(const std::string& data);

    /**
     * @brief Lowercase hex encoding of raw bytes
     */
    static std::string BinaryToHex(const unsigned char* data, std::size_t length);

    /**
     * @brief Random lowercase hex string of @p length characters
     *
     * Drawn from OpenSSL's CSPRNG; used for unique VM and image names.
     */
    static std::string RandomHex(std::size_t length);
};

} // namespace utils
} // namespace flashvm
