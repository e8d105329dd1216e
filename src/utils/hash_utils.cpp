/**
 * @file hash_utils.cpp
 * @brief Implementation of SHA-256 helpers on top of OpenSSL
 *
 * @date 2025
 */

#include "redeyes/utils/hash_utils.hpp"

#include <openssl/sha.h>

#include <iomanip>
#include <sstream>

namespace redeyes {
namespace utils {

namespace {

std::string BinaryToHex(const unsigned char* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

} // anonymous namespace

std::string HashUtils::ComputeSHA256(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return BinaryToHex(hash, SHA256_DIGEST_LENGTH);
}

std::string HashUtils::ShortDigest(const std::string& data, std::size_t length) {
    return ComputeSHA256(data).substr(0, length);
}

} // namespace utils
} // namespace redeyes
