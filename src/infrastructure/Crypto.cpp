/**
 * @file Crypto.cpp
 * @brief Implementation of Crypto.
 */

#include "infrastructure/Crypto.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <stdexcept>

namespace medoracle::infrastructure {

domain::Digest Crypto::Sha256(const std::string& data) {
    domain::Digest digest{};
    unsigned int length = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &length, EVP_sha256(), nullptr) != 1 ||
        length != digest.size()) {
        throw std::runtime_error("[Crypto] SHA-256 computation failed.");
    }
    return digest;
}

domain::Signature Crypto::HmacSha256(const std::string& key, const std::uint8_t* data, std::size_t size) {
    domain::Signature mac(EVP_MAX_MD_SIZE);
    unsigned int length = 0;
    if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), data, size, mac.data(), &length) == nullptr) {
        throw std::runtime_error("[Crypto] HMAC-SHA256 computation failed.");
    }
    mac.resize(length);
    return mac;
}

bool Crypto::ConstantTimeEquals(const std::uint8_t* a, std::size_t aSize, const std::uint8_t* b, std::size_t bSize) {
    if (aSize != bSize) return false;
    if (aSize == 0) return true;
    return CRYPTO_memcmp(a, b, aSize) == 0;
}

} // namespace medoracle::infrastructure
