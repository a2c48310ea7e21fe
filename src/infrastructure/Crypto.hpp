/**
 * @file Crypto.hpp
 * @brief Thin wrappers over OpenSSL for hashing and constant-time comparison.
 */

#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "domain/Digest.hpp"

namespace medoracle::infrastructure {

class Crypto {
public:
    /** @brief SHA-256 of the given bytes. */
    static domain::Digest Sha256(const std::string& data);

    /** @brief HMAC-SHA256 of data under key. */
    static domain::Signature HmacSha256(const std::string& key, const std::uint8_t* data, std::size_t size);

    /** @brief Compares two byte ranges without early exit on the first difference. */
    static bool ConstantTimeEquals(const std::uint8_t* a, std::size_t aSize, const std::uint8_t* b, std::size_t bSize);
};

} // namespace medoracle::infrastructure
