/**
 * @file hash_utils.hpp
 * @brief Token and identifier generation backed by OpenSSL
 *
 * Sandbox bearer tokens and instance identifiers are handed to untrusted
 * callers, so they are drawn from the OpenSSL CSPRNG rather than a
 * std::mt19937 seeded from the clock.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace sandpool {
namespace utils {

/**
 * @class HashUtils
 * @brief Cryptographic helpers
 *
 * All methods are static and thread-safe (OpenSSL 1.1+ RAND is thread-safe).
 *
 * **Usage Example**:
 * @code
 * std::string token = HashUtils::RandomHex(16);     // 32 hex chars
 * std::string id = HashUtils::RandomId(25);         // base36 instance id
 * bool ok = HashUtils::ConstantTimeEquals(token, presented);
 * @endcode
 */
class HashUtils {
public:
    /**
     * @brief Draw random bytes from the OpenSSL CSPRNG
     * @param count Number of bytes
     * @return Random bytes
     * @throws std::runtime_error if RAND_bytes fails
     */
    static std::vector<uint8_t> RandomBytes(std::size_t count);

    /**
     * @brief Random lowercase hex string
     * @param byte_count Number of random bytes (output is twice as long)
     * @return Hex string
     */
    static std::string RandomHex(std::size_t byte_count);

    /**
     * @brief Random identifier over [0-9a-z]
     *
     * Rejection sampling keeps the alphabet uniform.
     *
     * @param length Identifier length
     * @return Identifier
     */
    static std::string RandomId(std::size_t length);

    /**
     * @brief Compare secrets without leaking timing
     * @return true if equal
     */
    static bool ConstantTimeEquals(const std::string& a, const std::string& b);

    /**
     * @brief Convert binary data to hexadecimal string
     * @param data Bytes
     * @param length Number of bytes
     * @return Lowercase hex
     */
    static std::string BinaryToHex(const unsigned char* data, std::size_t length);
};

} // namespace utils
} // namespace sandpool
