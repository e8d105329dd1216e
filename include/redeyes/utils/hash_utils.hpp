/**
 * @file hash_utils.hpp
 * @brief SHA-256 digests for content-addressed artifact names
 *
 * Command output files are named after a digest of the command text so that
 * the same command always maps to the same file and distinct commands never
 * collide in practice.
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <string>

namespace redeyes {
namespace utils {

/**
 * @class HashUtils
 * @brief OpenSSL-backed hashing helpers
 *
 * **Usage Example**:
 * @code
 * auto name = "osint_" + HashUtils::ShortDigest(command) + ".txt";
 * @endcode
 */
class HashUtils {
public:
    /**
     * @brief Compute SHA-256 of an in-memory string
     * @param data Input bytes
     * @return Lowercase hex digest (64 characters)
     */
    static std::string ComputeSHA256(const std::string& data);

    /**
     * @brief Leading characters of the SHA-256 hex digest
     * @param data Input bytes
     * @param length Number of hex characters to keep (default: 12)
     */
    static std::string ShortDigest(const std::string& data, std::size_t length = 12);
};

} // namespace utils
} // namespace redeyes
