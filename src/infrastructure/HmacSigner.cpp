/**
 * @file HmacSigner.cpp
 * @brief Implementation of HmacSigner.
 */

#include "infrastructure/HmacSigner.hpp"
#include "infrastructure/Crypto.hpp"

namespace medoracle::infrastructure {

HmacSigner::HmacSigner(std::map<std::string, std::string> keyring)
    : m_keyring(std::move(keyring)) {}

void HmacSigner::registerNode(const std::string& nodeId, const std::string& secret) {
    m_keyring[nodeId] = secret;
}

domain::Signature HmacSigner::Sign(const domain::Digest& digest, const std::string& key) const {
    return Crypto::HmacSha256(key, digest.data(), digest.size());
}

bool HmacSigner::Verify(const domain::Digest& digest, const domain::Signature& signature, const std::string& publicId) const {
    auto it = m_keyring.find(publicId);
    if (it == m_keyring.end()) {
        return false;
    }
    domain::Signature expected = Sign(digest, it->second);
    return Crypto::ConstantTimeEquals(expected.data(), expected.size(), signature.data(), signature.size());
}

} // namespace medoracle::infrastructure
