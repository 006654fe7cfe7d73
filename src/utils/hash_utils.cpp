/**
 * @file hash_utils.cpp
 * @brief OpenSSL-backed token helpers
 *
 * **Error Handling**:
 * - RAND_bytes failure: Logs and throws std::runtime_error
 *
 * @date 2025
 */

#include "sandpool/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <openssl/crypto.h>
#include <openssl/rand.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace sandpool {
namespace utils {

namespace {

constexpr char kIdAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
constexpr std::size_t kIdAlphabetSize = sizeof(kIdAlphabet) - 1;

} // anonymous namespace

std::vector<uint8_t> HashUtils::RandomBytes(std::size_t count) {
    std::vector<uint8_t> buffer(count);
    if (count == 0) {
        return buffer;
    }

    if (RAND_bytes(buffer.data(), static_cast<int>(count)) != 1) {
        spdlog::error("RAND_bytes failed to produce {} bytes", count);
        throw std::runtime_error("OpenSSL random generator failure");
    }
    return buffer;
}

std::string HashUtils::RandomHex(std::size_t byte_count) {
    auto bytes = RandomBytes(byte_count);
    return BinaryToHex(bytes.data(), bytes.size());
}

std::string HashUtils::RandomId(std::size_t length) {
    // Largest multiple of the alphabet size that fits in a byte
    constexpr unsigned limit = 256 - (256 % kIdAlphabetSize);

    std::string id;
    id.reserve(length);

    while (id.size() < length) {
        auto bytes = RandomBytes(length * 2);
        for (uint8_t b : bytes) {
            if (b >= limit) {
                continue;
            }
            id.push_back(kIdAlphabet[b % kIdAlphabetSize]);
            if (id.size() == length) {
                break;
            }
        }
    }

    return id;
}

bool HashUtils::ConstantTimeEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string HashUtils::BinaryToHex(const unsigned char* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

} // namespace utils
} // namespace sandpool
